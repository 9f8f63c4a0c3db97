#include "engine/model_config.hpp"

#include <algorithm>
#include <array>

namespace {

const std::array<ModelConfig, 3> kModels = {{
    {"base", "whisper_base_xeon", "ggml-base-q5_1.bin", 1000},
    {"small", "whisper_small_xeon", "ggml-small-q5_1.bin", 500},
    {"medium", "whisper_medium_xeon", "ggml-medium-q5_1.bin", 2000},
}};

} // namespace

std::span<const ModelConfig> model_table() {
    return kModels;
}

std::expected<ModelConfig, Error> find_model_config(const std::string& model_size) {
    auto it = std::ranges::find_if(kModels, [&](const ModelConfig& m) {
        return m.model_size == model_size;
    });
    if (it != kModels.end()) return *it;

    std::string valid;
    for (auto& m : kModels) {
        if (!valid.empty()) valid += ", ";
        valid += m.model_size;
    }
    return std::unexpected(Error{ErrorKind::InvalidConfig,
        "Unsupported model size: " + model_size + ". Must be one of [" + valid + "]"});
}
