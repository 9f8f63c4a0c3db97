#include "config.hpp"

#include "logging.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

template <typename T>
bool parse_number(const char* s, T& out) {
    std::string_view sv(s);
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc() && ptr == sv.data() + sv.size();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            read_key(s, "host", cfg.server.host);
            read_key(s, "port", cfg.server.port);
            read_key(s, "io_threads", cfg.server.io_threads);
            read_key(s, "api_key", cfg.server.api_key);
            read_key(s, "app_name", cfg.server.app_name);
            read_key(s, "version", cfg.server.version);
        }

        if (j.contains("whisper")) {
            auto& w = j["whisper"];
            read_key(w, "model_size", cfg.whisper.model_size);
            read_key(w, "artifacts_dir", cfg.whisper.artifacts_dir);
            read_key(w, "language", cfg.whisper.language);
            read_key(w, "n_threads", cfg.whisper.n_threads);
        }

        if (j.contains("chunking")) {
            auto& c = j["chunking"];
            read_key(c, "enabled", cfg.chunking.enabled);
            read_key(c, "duration_s", cfg.chunking.duration_s);
            read_key(c, "overlap_s", cfg.chunking.overlap_s);
            read_key(c, "min_chunk_s", cfg.chunking.min_chunk_s);
            read_key(c, "max_chunks", cfg.chunking.max_chunks);
            read_key(c, "merge_window_words", cfg.chunking.merge_window_words);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "silence_threshold", cfg.audio.silence_threshold);
            read_key(a, "noise_threshold", cfg.audio.noise_threshold);
            read_key(a, "ffmpeg", cfg.audio.ffmpeg);
            read_key(a, "ffprobe", cfg.audio.ffprobe);
            read_key(a, "probe_timeout_s", cfg.audio.probe_timeout_s);
            read_key(a, "decode_timeout_s", cfg.audio.decode_timeout_s);
        }

        if (j.contains("transcribe")) {
            auto& t = j["transcribe"];
            read_key(t, "timeout_s", cfg.transcribe.timeout_s);
            read_key(t, "timeout_factor", cfg.transcribe.timeout_factor);
            read_key(t, "workers", cfg.transcribe.workers);
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            read_key(s, "temp_dir", cfg.storage.temp_dir);
            read_key(s, "max_upload_mb", cfg.storage.max_upload_mb);
        }

        if (j.contains("minio")) {
            auto& m = j["minio"];
            read_key(m, "endpoint", cfg.minio.endpoint);
            read_key(m, "access_key", cfg.minio.access_key);
            read_key(m, "secret_key", cfg.minio.secret_key);
            read_key(m, "region", cfg.minio.region);
        }

        if (j.contains("jobs")) {
            auto& jb = j["jobs"];
            read_key(jb, "db_path", cfg.jobs.db_path);
            read_key(jb, "ttl_s", cfg.jobs.ttl_s);
            read_key(jb, "runners", cfg.jobs.runners);
        }

        if (j.contains("log")) {
            auto& l = j["log"];
            read_key(l, "level", cfg.log.level);
            read_key(l, "format", cfg.log.format);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

void Config::apply_env() {
    if (auto v = env("STT_MODEL_SIZE")) whisper.model_size = v;
    if (auto v = env("STT_ARTIFACTS_DIR")) whisper.artifacts_dir = v;
    if (auto v = env("STT_LANGUAGE")) whisper.language = v;
    if (auto v = env("STT_API_KEY")) server.api_key = v;
    if (auto v = env("STT_LOG_LEVEL")) log.level = v;

    if (auto v = env("STT_N_THREADS")) {
        if (!parse_number(v, whisper.n_threads)) {
            std::println(stderr, "config: ignoring invalid STT_N_THREADS={}", v);
        }
    }
    if (auto v = env("STT_PORT")) {
        if (!parse_number(v, server.port)) {
            std::println(stderr, "config: ignoring invalid STT_PORT={}", v);
        }
    }
}

std::expected<void, Error> Config::validate() const {
    auto invalid = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::InvalidConfig, std::move(msg)});
    };

    if (chunking.duration_s <= 0.0) {
        return invalid(std::format("chunking.duration_s must be positive (got {})",
                                   chunking.duration_s));
    }
    if (chunking.overlap_s < 0.0) {
        return invalid(std::format("chunking.overlap_s must not be negative (got {})",
                                   chunking.overlap_s));
    }
    double max_overlap = chunking.duration_s / 2.0;
    if (chunking.overlap_s >= max_overlap) {
        return invalid(std::format(
            "chunking.overlap_s ({}s) must be less than half of chunking.duration_s "
            "({}s / 2 = {}s)", chunking.overlap_s, chunking.duration_s, max_overlap));
    }
    if (chunking.min_chunk_s < 0.0) {
        return invalid("chunking.min_chunk_s must not be negative");
    }
    if (chunking.max_chunks == 0) {
        return invalid("chunking.max_chunks must be positive");
    }
    if (chunking.merge_window_words == 0) {
        return invalid("chunking.merge_window_words must be positive");
    }
    if (transcribe.workers == 0) {
        return invalid("transcribe.workers must be positive");
    }
    if (transcribe.timeout_factor <= 0.0) {
        return invalid("transcribe.timeout_factor must be positive");
    }
    if (jobs.runners == 0) {
        return invalid("jobs.runners must be positive");
    }
    if (server.io_threads == 0) {
        return invalid("server.io_threads must be positive");
    }
    if (whisper.n_threads < 0) {
        return invalid("whisper.n_threads must not be negative");
    }
    if (!logging::parse_level(log.level)) {
        return invalid("log.level must be one of debug, info, warn, error");
    }
    if (!logging::parse_format(log.format)) {
        return invalid("log.format must be console or json");
    }
    return {};
}
