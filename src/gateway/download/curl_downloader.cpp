#include "download/curl_downloader.hpp"

#include "logging.hpp"

#include <chrono>
#include <cstdio>
#include <curl/curl.h>
#include <format>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kMinioScheme = "minio://";

struct Sink {
    std::FILE* file = nullptr;
    uint64_t written = 0;
    uint64_t limit = 0;
    bool too_large = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<Sink*>(userdata);
    size_t n = size * nmemb;
    if (sink->written + n > sink->limit) {
        sink->too_large = true;
        return 0; // aborts the transfer
    }
    size_t w = std::fwrite(ptr, 1, n, sink->file);
    sink->written += w;
    return w;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

namespace download {

std::string minio_object_url(std::string_view url, std::string_view endpoint) {
    if (!starts_with(url, kMinioScheme)) return {};
    auto rest = url.substr(kMinioScheme.size());
    auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 >= rest.size()) return {};

    std::string base(endpoint);
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + std::string(rest);
}

} // namespace download

CurlDownloader::CurlDownloader(uint32_t max_size_mb, MinioCredentials minio)
    : max_size_mb_(max_size_mb), minio_(std::move(minio)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlDownloader::~CurlDownloader() {
    curl_global_cleanup();
}

std::expected<double, Error> CurlDownloader::download(const std::string& url, const fs::path& dest) {
    auto fail = [&dest](ErrorKind kind, std::string msg) {
        std::error_code ec;
        fs::remove(dest, ec);
        return std::unexpected(Error{kind, std::move(msg)});
    };

    bool is_minio = starts_with(url, kMinioScheme);
    std::string target;
    if (is_minio) {
        target = download::minio_object_url(url, minio_.endpoint);
        if (target.empty()) {
            return std::unexpected(Error{ErrorKind::InvalidRequest,
                "Invalid MinIO URL (expected minio://bucket/key): " + url});
        }
    } else if (starts_with(url, "http://") || starts_with(url, "https://")) {
        target = url;
    } else {
        return std::unexpected(Error{ErrorKind::InvalidRequest, "Unsupported URL scheme: " + url});
    }

    uint64_t limit = static_cast<uint64_t>(max_size_mb_) * 1024 * 1024;

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    std::FILE* file = std::fopen(dest.c_str(), "wb");
    if (!file) {
        return std::unexpected(Error{ErrorKind::Download, "Cannot create " + dest.string()});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(file);
        return fail(ErrorKind::Download, "curl_easy_init failed");
    }

    Sink sink{.file = file, .limit = limit};
    std::string userpwd = minio_.access_key + ":" + minio_.secret_key;
    std::string sigv4 = "aws:amz:" + minio_.region + ":s3";

    curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    // Read timeout: abort when under 1 byte/s for 60 s.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(limit));
    if (is_minio) {
        curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, sigv4.c_str());
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
    }

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    std::fclose(file);

    if (sink.too_large || res == CURLE_FILESIZE_EXCEEDED) {
        return fail(ErrorKind::FileTooLarge,
                    std::format("File too large (max {} MB)", max_size_mb_));
    }
    if (res != CURLE_OK) {
        return fail(ErrorKind::Download,
                    std::string("Failed to download file: ") + curl_easy_strerror(res));
    }
    if (status != 200) {
        return fail(ErrorKind::Download, std::format("Failed to download file: HTTP {}", status));
    }

    double mb = static_cast<double>(sink.written) / (1024.0 * 1024.0);
    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logging::info("Downloaded {} ({:.2f} MB in {:.2f}s)", url, mb, secs);
    return mb;
}
