#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Reader for 16-bit PCM mono WAV, the format ffmpeg is asked to produce for
// the engine.
namespace wav {

struct Decoded {
    std::vector<float> samples;
    uint32_t sample_rate = 0;
};

// Parses PCM 16-bit mono. Chunks other than "fmt " and "data" are skipped.
// Samples are scaled by 1/32768.
inline std::expected<Decoded, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };

    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Decoded out;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* id = bytes.data() + pos;
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        if (body + size > bytes.size()) {
            // ffmpeg writing to a pipe leaves the data size unset; take the rest.
            if (std::memcmp(id, "data", 4) != 0) return std::unexpected("truncated chunk");
            size = static_cast<uint32_t>(bytes.size() - body);
        }

        if (std::memcmp(id, "fmt ", 4) == 0) {
            if (size < 16) return std::unexpected("fmt chunk too small");
            uint16_t format = r16(body);
            uint16_t channels = r16(body + 2);
            out.sample_rate = r32(body + 4);
            uint16_t bits = r16(body + 14);
            if (format != 1 || bits != 16) return std::unexpected("expected 16-bit PCM");
            if (channels != 1) return std::unexpected("expected mono audio");
            have_fmt = true;
        } else if (std::memcmp(id, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            size_t n = size / 2;
            out.samples.resize(n);
            for (size_t i = 0; i < n; ++i) {
                out.samples[i] = static_cast<int16_t>(r16(body + i * 2)) / 32768.0f;
            }
            return out;
        }

        pos = body + size + (size & 1);
    }
    return std::unexpected("no data chunk");
}

} // namespace wav
