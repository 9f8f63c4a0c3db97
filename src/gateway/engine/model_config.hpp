#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

struct ModelConfig {
    std::string model_size;
    std::string library_directory; // relative to the artifacts dir
    std::string model_filename;
    uint32_t expected_ram_mb = 0;

    std::filesystem::path library_path(const std::filesystem::path& artifacts_dir) const {
        return artifacts_dir / library_directory;
    }

    std::filesystem::path model_path(const std::filesystem::path& artifacts_dir) const {
        return library_path(artifacts_dir) / model_filename;
    }
};

std::span<const ModelConfig> model_table();

std::expected<ModelConfig, Error> find_model_config(const std::string& model_size);
