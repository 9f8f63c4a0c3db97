#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

class AudioDownloader {
public:
    virtual ~AudioDownloader() = default;

    // Fetches url into dest and returns the size in MB. A partial file is
    // removed on failure.
    virtual std::expected<double, Error> download(const std::string& url,
                                                  const std::filesystem::path& dest) = 0;

    virtual uint32_t max_size_mb() const = 0;
};
