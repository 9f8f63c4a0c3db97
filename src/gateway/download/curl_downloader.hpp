#pragma once

#include "download/audio_downloader.hpp"

#include <cstdint>
#include <string>
#include <string_view>

struct MinioCredentials {
    std::string endpoint;
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
};

// http(s):// and minio://bucket/key downloads. minio requests are signed
// with AWS SigV4 against the configured endpoint.
class CurlDownloader : public AudioDownloader {
public:
    CurlDownloader(uint32_t max_size_mb, MinioCredentials minio);
    ~CurlDownloader() override;

    CurlDownloader(const CurlDownloader&) = delete;
    CurlDownloader& operator=(const CurlDownloader&) = delete;

    std::expected<double, Error> download(const std::string& url,
                                          const std::filesystem::path& dest) override;

    uint32_t max_size_mb() const override { return max_size_mb_; }

private:
    uint32_t max_size_mb_;
    MinioCredentials minio_;
};

namespace download {

// Maps minio://bucket/key to <endpoint>/bucket/key. Empty when the url has
// no bucket or key.
std::string minio_object_url(std::string_view url, std::string_view endpoint);

} // namespace download
