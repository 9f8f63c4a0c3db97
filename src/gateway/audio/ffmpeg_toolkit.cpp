#include "audio/ffmpeg_toolkit.hpp"

#include "audio/subprocess.hpp"
#include "audio/wav.hpp"
#include "logging.hpp"
#include "scoped_file.hpp"

#include <atomic>
#include <charconv>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<double> as_seconds(const json& v) {
    if (v.is_number()) return v.get<double>();
    if (!v.is_string()) return std::nullopt;

    const auto& s = v.get_ref<const std::string&>();
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc() || ptr == s.data()) return std::nullopt;
    return out;
}

std::string first_line(const std::string& s) {
    auto end = s.find('\n');
    return s.substr(0, end);
}

fs::path decode_target(const fs::path& src) {
    static std::atomic<uint64_t> counter{0};
    auto name = std::format("{}_decoded_{}.wav", src.stem().string(), counter++);
    return src.parent_path() / name;
}

std::expected<AudioBuffer, Error> read_engine_wav(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorKind::Transcription, "Decoded audio missing: " + path.string()});
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    auto decoded = wav::decode(bytes);
    if (!decoded) {
        return std::unexpected(Error{ErrorKind::Transcription,
            "Failed to parse decoded audio: " + decoded.error()});
    }
    if (decoded->sample_rate != kEngineSampleRate) {
        return std::unexpected(Error{ErrorKind::Transcription,
            std::format("Unexpected sample rate {} in {} (want {})", decoded->sample_rate,
                        path.string(), kEngineSampleRate)});
    }

    AudioBuffer buf;
    buf.samples = std::move(decoded->samples);
    buf.sample_rate = decoded->sample_rate;
    return buf;
}

} // namespace

namespace ffprobe {

std::expected<double, Error> parse_duration(std::string_view json_text) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::DurationProbe, std::move(msg)});
    };

    if (json_text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return fail("ffprobe returned empty output");
    }

    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return fail(std::string("Failed to parse ffprobe output: ") + e.what());
    }

    if (j.contains("format") && j["format"].contains("duration")) {
        if (auto d = as_seconds(j["format"]["duration"])) return *d;
        return fail("Invalid duration in ffprobe format section");
    }

    if (j.contains("streams") && j["streams"].is_array()) {
        for (const auto& stream : j["streams"]) {
            if (!stream.contains("duration")) continue;
            if (auto d = as_seconds(stream["duration"])) return *d;
        }
    }

    return fail("Could not determine audio duration from ffprobe output");
}

} // namespace ffprobe

FfmpegToolkit::FfmpegToolkit(FfmpegOptions opts)
    : opts_(std::move(opts)) {}

std::expected<double, Error> FfmpegToolkit::probe_duration(const fs::path& path) {
    auto res = subprocess::run(
        {opts_.ffprobe, "-v", "error", "-print_format", "json",
         "-show_format", "-show_streams", "-i", path.string()},
        std::chrono::seconds(opts_.probe_timeout_s));
    if (!res) {
        return std::unexpected(Error{ErrorKind::DurationProbe, "ffprobe: " + res.error()});
    }
    if (res->timed_out) {
        return std::unexpected(Error{ErrorKind::DurationProbe,
            std::format("ffprobe timed out after {}s", opts_.probe_timeout_s)});
    }
    if (res->exit_code != 0) {
        return std::unexpected(Error{ErrorKind::DurationProbe,
            std::format("ffprobe failed (exit {}): {}", res->exit_code, first_line(res->err))});
    }

    auto duration = ffprobe::parse_duration(res->out);
    if (duration) logging::debug("Probed duration of {}: {:.2f}s", path.string(), *duration);
    return duration;
}

std::expected<AudioBuffer, Error> FfmpegToolkit::decode(const fs::path& path) {
    ScopedFile tmp(decode_target(path));

    auto res = subprocess::run(
        {opts_.ffmpeg, "-nostdin", "-y", "-loglevel", "error", "-i", path.string(),
         "-ar", std::to_string(kEngineSampleRate), "-ac", "1", "-c:a", "pcm_s16le",
         tmp.path().string()},
        std::chrono::seconds(opts_.decode_timeout_s));
    if (!res) {
        return std::unexpected(Error{ErrorKind::Transcription, "ffmpeg: " + res.error()});
    }
    if (res->timed_out) {
        return std::unexpected(Error{ErrorKind::Transcription,
            std::format("ffmpeg decode timed out after {}s", opts_.decode_timeout_s)});
    }
    if (res->exit_code != 0) {
        return std::unexpected(Error{ErrorKind::Transcription,
            std::format("Failed to decode audio (exit {}): {}", res->exit_code, first_line(res->err))});
    }

    auto buf = read_engine_wav(tmp.path());
    if (buf) {
        logging::debug("Decoded {} ({} samples, {:.2f}s)", path.string(), buf->samples.size(),
                       buf->duration_s());
    }
    return buf;
}

std::expected<AudioBuffer, Error> FfmpegToolkit::load_pcm(const fs::path& path) {
    return read_engine_wav(path);
}

std::expected<void, Error> FfmpegToolkit::extract_window(const fs::path& src, double start_s,
                                                         double length_s, const fs::path& dest) {
    auto res = subprocess::run(
        {opts_.ffmpeg, "-nostdin", "-y", "-loglevel", "error", "-i", src.string(),
         "-ss", std::format("{:.3f}", start_s), "-t", std::format("{:.3f}", length_s),
         "-ar", std::to_string(kEngineSampleRate), "-ac", "1", "-c:a", "pcm_s16le",
         dest.string()},
        std::chrono::seconds(opts_.decode_timeout_s));
    if (!res) {
        return std::unexpected(Error{ErrorKind::Transcription, "ffmpeg: " + res.error()});
    }
    if (res->timed_out || res->exit_code != 0) {
        std::error_code ec;
        fs::remove(dest, ec);
        return std::unexpected(Error{ErrorKind::Transcription,
            std::format("Failed to extract window at {:.1f}s: {}", start_s,
                        res->timed_out ? std::string("timed out") : first_line(res->err))});
    }
    return {};
}
