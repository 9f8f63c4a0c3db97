#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

constexpr uint32_t kEngineSampleRate = 16000;

// Decoded mono float samples at kEngineSampleRate.
struct AudioBuffer {
    std::vector<float> samples;
    uint32_t sample_rate = kEngineSampleRate;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
    bool empty() const { return samples.empty(); }
};
