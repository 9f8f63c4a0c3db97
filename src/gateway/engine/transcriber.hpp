#pragma once

#include "errors.hpp"

#include <expected>
#include <filesystem>
#include <string>

// What the services need from the speech engine.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Empty language selects the configured default. Silent or otherwise
    // unusable audio yields an empty string, not an error.
    virtual std::expected<std::string, Error>
        transcribe(const std::filesystem::path& audio_path, const std::string& language) = 0;

    virtual std::expected<double, Error>
        probe_duration(const std::filesystem::path& audio_path) = 0;

    virtual bool ready() const = 0;
};
