#include "service/transcribe_service.hpp"

#include "logging.hpp"
#include "scoped_file.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <memory>
#include <random>

namespace fs = std::filesystem;

std::string url_extension(const std::string& url) {
    auto path = url.substr(0, url.find_first_of("?#"));
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }

    auto ext = fs::path(path).extension().string();
    return ext.empty() ? ".tmp" : ext;
}

std::string make_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffULL);
}

TranscribeService::TranscribeService(Transcriber& transcriber, AudioDownloader& downloader,
                                     WorkerPool& pool, TranscribeOptions opts)
    : transcriber_(transcriber), downloader_(downloader), pool_(pool), opts_(std::move(opts)) {
    std::error_code ec;
    fs::create_directories(opts_.temp_dir, ec);
    if (ec) logging::warn("Cannot create temp dir {}: {}", opts_.temp_dir.string(), ec.message());
}

uint32_t TranscribeService::adaptive_timeout(double audio_duration_s) const {
    if (audio_duration_s <= 0.0) return opts_.timeout_s;
    auto scaled = static_cast<uint32_t>(audio_duration_s * opts_.timeout_factor);
    return std::max(opts_.timeout_s, scaled);
}

fs::path TranscribeService::temp_path_for(const std::string& url) const {
    return opts_.temp_dir / (make_uuid() + url_extension(url));
}

std::expected<TranscribeResult, Error>
TranscribeService::transcribe_from_url(const std::string& url, const std::string& language,
                                       bool use_timeout) {
    using clock = std::chrono::steady_clock;
    auto file = std::make_shared<ScopedFile>(temp_path_for(url));
    logging::info("Processing transcription request for URL: {}", url);

    auto start_download = clock::now();
    auto size_mb = downloader_.download(url, file->path());
    if (!size_mb) {
        logging::error("Transcription failed: {}", size_mb.error().message);
        return std::unexpected(std::move(size_mb.error()));
    }
    double download_s = std::chrono::duration<double>(clock::now() - start_download).count();
    logging::info("Downloaded {:.2f}MB in {:.2f}s", *size_mb, download_s);

    double audio_duration = 0.0;
    if (auto d = transcriber_.probe_duration(file->path())) {
        audio_duration = *d;
        logging::info("Detected audio duration: {:.2f}s", audio_duration);
    } else {
        logging::warn("Failed to detect audio duration: {}", d.error().message);
    }

    uint32_t timeout = adaptive_timeout(audio_duration);
    std::string lang = language.empty() ? opts_.default_language : language;
    logging::info("Starting transcription (language={}, {})", lang,
                  use_timeout ? std::format("timeout={}s", timeout) : std::string("no timeout"));

    auto start = clock::now();
    auto fut = pool_.submit([this, file, lang]() {
        return transcriber_.transcribe(file->path(), lang);
    });
    // The task holds its own reference; the file goes when the engine is done.
    file.reset();

    if (use_timeout && fut.wait_for(std::chrono::seconds(timeout)) == std::future_status::timeout) {
        logging::error("Transcription timeout after {}s", timeout);
        return std::unexpected(Error{ErrorKind::Timeout,
            std::format("Transcription timeout after {}s", timeout)});
    }

    std::expected<std::string, Error> text;
    try {
        text = fut.get();
    } catch (const std::exception& e) {
        text = std::unexpected(Error{ErrorKind::Transcription,
            std::string("Transcription failed: ") + e.what()});
    }
    if (!text) {
        logging::error("Transcription failed: {}", text.error().message);
        return std::unexpected(std::move(text.error()));
    }

    double processing_s = std::chrono::duration<double>(clock::now() - start).count();
    logging::info("Transcribed in {:.2f}s", processing_s);

    return TranscribeResult{
        .text = std::move(*text),
        .processing_s = processing_s,
        .download_s = download_s,
        .file_size_mb = *size_mb,
        .model = opts_.model,
        .language = std::move(lang),
        .audio_duration_s = audio_duration,
    };
}
