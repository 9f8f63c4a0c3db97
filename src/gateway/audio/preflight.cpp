#include "audio/preflight.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace preflight {

AudioStats stats(std::span<const float> samples) {
    AudioStats s;
    s.samples = samples.size();
    if (samples.empty()) return s;

    double sum = 0.0;
    double sum_abs = 0.0;
    for (float v : samples) {
        float a = std::fabs(v);
        if (a > s.peak) s.peak = a;
        sum += v;
        sum_abs += a;
    }
    double n = static_cast<double>(samples.size());
    double mean = sum / n;

    double var = 0.0;
    for (float v : samples) {
        double d = v - mean;
        var += d * d;
    }

    s.mean_abs = static_cast<float>(sum_abs / n);
    s.stddev = static_cast<float>(std::sqrt(var / n));
    return s;
}

PreflightResult validate(std::span<const float> samples, const PreflightThresholds& thresholds) {
    if (samples.empty()) {
        return {false, "Audio is empty (0 samples)"};
    }

    auto s = stats(samples);
    logging::info("Audio stats: max={:.4f}, mean={:.4f}, std={:.4f}, samples={}",
                  s.peak, s.mean_abs, s.stddev, s.samples);

    if (s.peak < thresholds.silence) {
        return {false, std::format("Audio is silent or too quiet (max amplitude: {:.6f})", s.peak)};
    }
    if (s.stddev < thresholds.noise) {
        return {false, std::format("Audio appears to be constant noise (std: {:.6f})", s.stddev)};
    }
    return {true, {}};
}

bool normalize(std::span<float> samples) {
    float peak = 0.0f;
    for (float v : samples) peak = std::max(peak, std::fabs(v));
    if (peak <= 1.0f) return false;

    logging::warn("Audio not normalized (max={:.2f}), normalizing...", peak);
    for (float& v : samples) v /= peak;
    return true;
}

} // namespace preflight
