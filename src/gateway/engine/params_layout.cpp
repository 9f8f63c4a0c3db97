#include "engine/params_layout.hpp"

#include <whisper.h>

#include <cmath>
#include <cstring>
#include <format>
#include <type_traits>

static_assert(std::is_trivially_copyable_v<whisper_full_params>,
              "whisper_full_params is passed by value across the C ABI");
static_assert(std::is_standard_layout_v<whisper_full_params>,
              "whisper_full_params must have C layout");
static_assert(std::is_same_v<decltype(&whisper_full),
                             int (*)(whisper_context*, whisper_full_params, const float*, int)>,
              "whisper_full takes the parameter block by value");

namespace {

bool same(float a, float b) {
    return std::fabs(a - b) < 1e-6f;
}

} // namespace

std::expected<void, std::string> check_default_params(const whisper_full_params& p) {
    auto mismatch = [](const char* field, auto got, auto want) {
        return std::unexpected(std::format(
            "parameter layout mismatch: {} = {} (expected {})", field, got, want));
    };

    if (p.strategy != WHISPER_SAMPLING_GREEDY)
        return mismatch("strategy", static_cast<int>(p.strategy), 0);
    if (p.n_max_text_ctx != 16384)
        return mismatch("n_max_text_ctx", p.n_max_text_ctx, 16384);
    if (!same(p.thold_pt, 0.01f))
        return mismatch("thold_pt", p.thold_pt, 0.01f);
    if (p.language == nullptr || std::strcmp(p.language, "en") != 0)
        return std::unexpected(std::string("parameter layout mismatch: language is not \"en\""));
    if (!same(p.temperature_inc, 0.2f))
        return mismatch("temperature_inc", p.temperature_inc, 0.2f);
    if (!same(p.entropy_thold, 2.4f))
        return mismatch("entropy_thold", p.entropy_thold, 2.4f);
    if (!same(p.no_speech_thold, 0.6f))
        return mismatch("no_speech_thold", p.no_speech_thold, 0.6f);
    if (p.greedy.best_of != 5)
        return mismatch("greedy.best_of", p.greedy.best_of, 5);
    if (p.vad)
        return mismatch("vad", p.vad, false);
    if (!same(p.vad_params.threshold, 0.5f))
        return mismatch("vad_params.threshold", p.vad_params.threshold, 0.5f);
    if (p.vad_params.speech_pad_ms != 30)
        return mismatch("vad_params.speech_pad_ms", p.vad_params.speech_pad_ms, 30);

    return {};
}
