#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "audio/ffmpeg_toolkit.hpp"
#include "audio/wav.hpp"
#include "fakes.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;

namespace {

void write_u16(uint8_t* p, uint16_t v) { std::memcpy(p, &v, 2); }
void write_u32(uint8_t* p, uint32_t v) { std::memcpy(p, &v, 4); }

// Inserts a LIST chunk between fmt and data, as ffmpeg does for metadata.
std::vector<uint8_t> with_list_chunk(std::vector<uint8_t> wav) {
    std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 5, 0, 0, 0, 'I', 'N', 'F', 'O', 'x', 0};
    wav.insert(wav.begin() + 36, list.begin(), list.end());
    return wav;
}

} // namespace

TEST_CASE("wav::decode", "[wav]") {
    std::vector<int16_t> samples = {0, 16384, -16384, 32767, -32768};
    auto bytes = make_wav(samples, 16000);

    SECTION("ScalesToUnitRange") {
        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->sample_rate == 16000);
        REQUIRE(d->samples.size() == samples.size());
        REQUIRE(d->samples[0] == 0.0f);
        REQUIRE(d->samples[1] == 0.5f);
        REQUIRE(d->samples[2] == -0.5f);
        REQUIRE(d->samples[4] == -1.0f);
    }

    SECTION("SkipsUnknownChunks") {
        auto d = wav::decode(with_list_chunk(bytes));
        REQUIRE(d.has_value());
        REQUIRE(d->samples.size() == samples.size());
        REQUIRE(d->samples[1] == 0.5f);
    }

    SECTION("UnsetDataSizeTakesRemainder") {
        write_u32(bytes.data() + 40, 0xFFFFFFFFu);
        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->samples.size() == samples.size());
    }

    SECTION("RejectsNonWav") {
        std::vector<uint8_t> junk = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        auto d = wav::decode(junk);
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error() == "not a RIFF/WAVE file");
    }

    SECTION("RejectsStereo") {
        write_u16(bytes.data() + 22, 2);
        auto d = wav::decode(bytes);
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error() == "expected mono audio");
    }

    SECTION("RejectsFloatFormat") {
        write_u16(bytes.data() + 20, 3);
        auto d = wav::decode(bytes);
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error() == "expected 16-bit PCM");
    }

    SECTION("MissingDataChunk") {
        bytes.resize(36);
        auto d = wav::decode(bytes);
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error() == "no data chunk");
    }
}

TEST_CASE("FfmpegToolkit::load_pcm", "[wav]") {
    TmpDir dir("load_pcm");
    FfmpegToolkit toolkit(FfmpegOptions{.ffmpeg = "/nonexistent/ffmpeg"});
    std::vector<int16_t> samples = {0, 16384, -16384, 8192};

    SECTION("ReadsWindowWithoutFfmpeg") {
        auto path = dir.path / "clip_chunk_0.wav";
        write_wav(path, samples, 16000);

        auto buf = toolkit.load_pcm(path);
        REQUIRE(buf.has_value());
        REQUIRE(buf->sample_rate == 16000);
        REQUIRE(buf->samples.size() == samples.size());
        REQUIRE(buf->samples[1] == 0.5f);
        REQUIRE(buf->samples[3] == 0.25f);
    }

    SECTION("RejectsOtherSampleRates") {
        auto path = dir.path / "clip_8k.wav";
        write_wav(path, samples, 8000);

        auto buf = toolkit.load_pcm(path);
        REQUIRE_FALSE(buf.has_value());
        REQUIRE(buf.error().kind == ErrorKind::Transcription);
        REQUIRE_THAT(buf.error().message, ContainsSubstring("sample rate 8000"));
    }

    SECTION("RejectsNonWav") {
        auto path = dir.touch("clip.mp3");
        auto buf = toolkit.load_pcm(path);
        REQUIRE_FALSE(buf.has_value());
        REQUIRE_THAT(buf.error().message, ContainsSubstring("not a RIFF/WAVE file"));
    }

    SECTION("MissingFile") {
        auto buf = toolkit.load_pcm(dir.path / "gone.wav");
        REQUIRE_FALSE(buf.has_value());
        REQUIRE(buf.error().kind == ErrorKind::Transcription);
    }
}
