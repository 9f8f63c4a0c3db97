#pragma once

#include "audio/audio_toolkit.hpp"

#include <cstdint>
#include <string>
#include <string_view>

struct FfmpegOptions {
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    uint32_t probe_timeout_s = 10;
    uint32_t decode_timeout_s = 120;
};

class FfmpegToolkit : public AudioToolkit {
public:
    explicit FfmpegToolkit(FfmpegOptions opts);

    std::expected<double, Error> probe_duration(const std::filesystem::path& path) override;
    std::expected<AudioBuffer, Error> decode(const std::filesystem::path& path) override;
    std::expected<AudioBuffer, Error> load_pcm(const std::filesystem::path& path) override;
    std::expected<void, Error> extract_window(const std::filesystem::path& src,
                                              double start_s, double length_s,
                                              const std::filesystem::path& dest) override;

private:
    FfmpegOptions opts_;
};

namespace ffprobe {

// Duration from `ffprobe -print_format json -show_format -show_streams`
// output: format.duration, else the first stream carrying one.
std::expected<double, Error> parse_duration(std::string_view json_text);

} // namespace ffprobe
