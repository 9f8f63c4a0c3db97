#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"

#include <expected>
#include <filesystem>

// External demuxer/decoder used by the adapter.
class AudioToolkit {
public:
    virtual ~AudioToolkit() = default;

    // Duration in seconds. Fails with DurationProbe.
    virtual std::expected<double, Error> probe_duration(const std::filesystem::path& path) = 0;

    // Whole file resampled to 16 kHz mono. Fails with Transcription.
    virtual std::expected<AudioBuffer, Error> decode(const std::filesystem::path& path) = 0;

    // Reads a file extract_window wrote, without re-decoding. Fails with
    // Transcription when it is not a 16 kHz mono 16-bit WAV.
    virtual std::expected<AudioBuffer, Error> load_pcm(const std::filesystem::path& path) = 0;

    // Writes [start_s, start_s + length_s) of src as a 16 kHz mono WAV at dest.
    virtual std::expected<void, Error> extract_window(const std::filesystem::path& src,
                                                      double start_s, double length_s,
                                                      const std::filesystem::path& dest) = 0;
};
