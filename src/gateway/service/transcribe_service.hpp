#pragma once

#include "download/audio_downloader.hpp"
#include "engine/transcriber.hpp"
#include "service/worker_pool.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

struct TranscribeResult {
    std::string text;
    double processing_s = 0.0;
    double download_s = 0.0;
    double file_size_mb = 0.0;
    std::string model;
    std::string language;
    double audio_duration_s = 0.0;
};

struct TranscribeOptions {
    std::filesystem::path temp_dir = "/tmp/stt_processing";
    std::string model;
    std::string default_language = "vi";
    uint32_t timeout_s = 30;
    double timeout_factor = 1.5;
};

// Download, then transcribe on the shared worker pool. The pool task owns
// the downloaded file, so a caller that gave up waiting never deletes audio
// the engine is still reading.
class TranscribeService {
public:
    TranscribeService(Transcriber& transcriber, AudioDownloader& downloader,
                      WorkerPool& pool, TranscribeOptions opts);

    // With use_timeout the wait is bounded by adaptive_timeout(); expiry is
    // a Timeout error while the native call runs to completion in the pool.
    std::expected<TranscribeResult, Error>
        transcribe_from_url(const std::string& url, const std::string& language,
                            bool use_timeout = true);

    uint32_t adaptive_timeout(double audio_duration_s) const;

    const TranscribeOptions& options() const { return opts_; }

private:
    std::filesystem::path temp_path_for(const std::string& url) const;

    Transcriber& transcriber_;
    AudioDownloader& downloader_;
    WorkerPool& pool_;
    TranscribeOptions opts_;
};

// Extension of the URL path (query and fragment ignored), ".tmp" if none.
std::string url_extension(const std::string& url);

// Random RFC 4122 version 4 identifier.
std::string make_uuid();
