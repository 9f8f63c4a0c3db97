#pragma once

#include <cstddef>
#include <span>
#include <string>

struct AudioStats {
    float peak = 0.0f;
    float mean_abs = 0.0f;
    float stddev = 0.0f;
    size_t samples = 0;
};

struct PreflightResult {
    bool valid = false;
    std::string reason; // empty when valid
};

struct PreflightThresholds {
    float silence = 0.01f;
    float noise = 0.001f;
};

namespace preflight {

AudioStats stats(std::span<const float> samples);

// Empty, silent (peak below silence threshold) and constant (stddev below
// noise threshold) audio is rejected, in that order.
PreflightResult validate(std::span<const float> samples, const PreflightThresholds& thresholds = {});

// Scales samples into [-1, 1] when the peak exceeds 1.0. Returns true if scaled.
bool normalize(std::span<float> samples);

} // namespace preflight
