#include "config.hpp"
#include "download/curl_downloader.hpp"
#include "engine/whisper_adapter.hpp"
#include "http/http_server.hpp"
#include "http/router.hpp"
#include "logging.hpp"
#include "service/job_service.hpp"
#include "service/transcribe_service.hpp"
#include "service/worker_pool.hpp"
#include "storage/job_store.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: stt-gateway [options]");
            std::println("Options:");
            std::println("  -c, --config PATH   Config file path (JSON)");
            std::println("  -v, --verbose       Debug logging");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config{} : Config::load(config_path);
    config.apply_env();
    if (verbose) config.log.level = "debug";

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "[stt-gateway] invalid configuration: {}", valid.error().message);
        return 1;
    }

    logging::configure(*logging::parse_level(config.log.level),
                       *logging::parse_format(config.log.format));
    logging::info("Starting {} v{} (model: {})", config.server.app_name, config.server.version,
                  config.whisper.model_size);

    auto adapter = WhisperAdapter::create(config);
    if (!adapter) {
        logging::error("Failed to initialize Whisper ({}): {}",
                       error_kind_name(adapter.error().kind), adapter.error().message);
        return 1;
    }
    double ready_at = unix_now();

    JobStore store;
    if (auto opened = store.open(config.jobs.db_path); !opened) {
        logging::error("{}", opened.error().message);
        return 1;
    }
    if (int purged = store.purge_expired(); purged > 0) {
        logging::info("Removed {} expired jobs", purged);
    }

    CurlDownloader downloader(config.storage.max_upload_mb, MinioCredentials{
        .endpoint = config.minio.endpoint,
        .access_key = config.minio.access_key,
        .secret_key = config.minio.secret_key,
        .region = config.minio.region,
    });

    WorkerPool transcribe_pool(config.transcribe.workers);
    WorkerPool job_runners(config.jobs.runners);

    TranscribeService transcribe(**adapter, downloader, transcribe_pool, TranscribeOptions{
        .temp_dir = config.storage.temp_dir,
        .model = config.whisper.model_size,
        .default_language = config.whisper.language,
        .timeout_s = config.transcribe.timeout_s,
        .timeout_factor = config.transcribe.timeout_factor,
    });
    JobService jobs(transcribe, store, job_runners, config.jobs.ttl_s, config.whisper.language);

    Router router(ServiceInfo{
        .app_name = config.server.app_name,
        .version = config.server.version,
        .api_key = config.server.api_key,
        .model = (*adapter)->model(),
        .started_at = ready_at,
    }, **adapter, transcribe, jobs, store);

    HttpServer server(router, ServerOptions{
        .host = config.server.host,
        .port = config.server.port,
        .io_threads = config.server.io_threads,
    });
    if (auto started = server.start(); !started) {
        logging::error("{}", started.error().message);
        return 1;
    }

    server.run();

    // Job runners wait on the transcription pool, so they drain first.
    logging::info("Waiting for running jobs to finish");
    job_runners.shutdown();
    transcribe_pool.shutdown();
    logging::info("Shut down cleanly");
    return 0;
}
