#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "engine/params_layout.hpp"

#include <whisper.h>

using Catch::Matchers::ContainsSubstring;

namespace {

// Greedy defaults as whisper.h documents them, filled in by hand.
whisper_full_params documented_defaults() {
    whisper_full_params p{};
    p.strategy = WHISPER_SAMPLING_GREEDY;
    p.n_max_text_ctx = 16384;
    p.thold_pt = 0.01f;
    p.language = "en";
    p.temperature_inc = 0.2f;
    p.entropy_thold = 2.4f;
    p.no_speech_thold = 0.6f;
    p.greedy.best_of = 5;
    p.vad = false;
    p.vad_params.threshold = 0.5f;
    p.vad_params.speech_pad_ms = 30;
    return p;
}

} // namespace

TEST_CASE("check_default_params", "[engine]") {
    auto p = documented_defaults();

    SECTION("MatchingBlockAccepted") {
        REQUIRE(check_default_params(p).has_value());
    }

    SECTION("ShiftedTailDetected") {
        p.vad_params.speech_pad_ms = 0;
        auto r = check_default_params(p);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("vad_params.speech_pad_ms"));
    }

    SECTION("WrongStrategy") {
        p.strategy = WHISPER_SAMPLING_BEAM_SEARCH;
        REQUIRE_FALSE(check_default_params(p).has_value());
    }

    SECTION("MissingLanguage") {
        p.language = nullptr;
        auto r = check_default_params(p);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("language"));
    }

    SECTION("ThresholdDrift") {
        p.entropy_thold = 2.5f;
        auto r = check_default_params(p);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("entropy_thold"));
    }
}
