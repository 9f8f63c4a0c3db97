#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "stt_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for the lifetime of the object.
struct ScopedEnv {
    std::string name;

    ScopedEnv(std::string n, const char* value) : name(std::move(n)) {
        ::setenv(name.c_str(), value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.port == 8000);
        REQUIRE(cfg.server.api_key == "stt-internal-key-changeme");
        REQUIRE(cfg.whisper.model_size == "small");
        REQUIRE(cfg.whisper.language == "vi");
        REQUIRE(cfg.whisper.n_threads == 0);
        REQUIRE(cfg.chunking.enabled);
        REQUIRE(cfg.chunking.duration_s == 30.0);
        REQUIRE(cfg.chunking.overlap_s == 3.0);
        REQUIRE(cfg.chunking.min_chunk_s == 2.0);
        REQUIRE(cfg.chunking.max_chunks == 1000);
        REQUIRE(cfg.chunking.merge_window_words == 5);
        REQUIRE(cfg.audio.silence_threshold == 0.01f);
        REQUIRE(cfg.audio.noise_threshold == 0.001f);
        REQUIRE(cfg.transcribe.timeout_s == 30);
        REQUIRE(cfg.transcribe.workers == 2);
        REQUIRE(cfg.jobs.ttl_s == 3600);
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": { "host": "127.0.0.1", "port": 9000, "api_key": "secret" },
            "whisper": { "model_size": "medium", "artifacts_dir": "/opt/models",
                         "language": "en", "n_threads": 4 },
            "chunking": { "enabled": false, "duration_s": 20, "overlap_s": 2,
                          "min_chunk_s": 1.5, "merge_window_words": 3 },
            "audio": { "silence_threshold": 0.02, "ffmpeg": "/usr/bin/ffmpeg" },
            "transcribe": { "timeout_s": 60, "timeout_factor": 2.0, "workers": 1 },
            "jobs": { "db_path": "/var/lib/stt/jobs.db", "ttl_s": 600 },
            "log": { "level": "debug", "format": "json" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.host == "127.0.0.1");
        REQUIRE(cfg.server.port == 9000);
        REQUIRE(cfg.server.api_key == "secret");
        REQUIRE(cfg.whisper.model_size == "medium");
        REQUIRE(cfg.whisper.artifacts_dir == "/opt/models");
        REQUIRE(cfg.whisper.language == "en");
        REQUIRE(cfg.whisper.n_threads == 4);
        REQUIRE_FALSE(cfg.chunking.enabled);
        REQUIRE(cfg.chunking.duration_s == 20.0);
        REQUIRE(cfg.chunking.overlap_s == 2.0);
        REQUIRE(cfg.chunking.min_chunk_s == 1.5);
        REQUIRE(cfg.chunking.merge_window_words == 3);
        REQUIRE(cfg.audio.silence_threshold == 0.02f);
        REQUIRE(cfg.audio.ffmpeg == "/usr/bin/ffmpeg");
        REQUIRE(cfg.transcribe.timeout_s == 60);
        REQUIRE(cfg.transcribe.timeout_factor == 2.0);
        REQUIRE(cfg.transcribe.workers == 1);
        REQUIRE(cfg.jobs.db_path == "/var/lib/stt/jobs.db");
        REQUIRE(cfg.jobs.ttl_s == 600);
        REQUIRE(cfg.log.level == "debug");
        REQUIRE(cfg.log.format == "json");
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "whisper": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.whisper.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.whisper.model_size == "small");
        REQUIRE(cfg.server.port == 8000);
        REQUIRE(cfg.chunking.duration_s == 30.0);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.whisper.model_size == "small");
        REQUIRE(cfg.server.port == 8000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/stt_test_nonexistent_config_file.json");
        REQUIRE(cfg.whisper.model_size == "small");
        REQUIRE(cfg.server.port == 8000);
    }
}

TEST_CASE("Config environment overrides", "[config]") {
    Config cfg;

    SECTION("StringAndNumberOverrides") {
        ScopedEnv size("STT_MODEL_SIZE", "base");
        ScopedEnv lang("STT_LANGUAGE", "en");
        ScopedEnv threads("STT_N_THREADS", "6");
        ScopedEnv port("STT_PORT", "8081");

        cfg.apply_env();
        REQUIRE(cfg.whisper.model_size == "base");
        REQUIRE(cfg.whisper.language == "en");
        REQUIRE(cfg.whisper.n_threads == 6);
        REQUIRE(cfg.server.port == 8081);
    }

    SECTION("InvalidNumberIgnored") {
        ScopedEnv port("STT_PORT", "eighty");
        cfg.apply_env();
        REQUIRE(cfg.server.port == 8000);
    }

    SECTION("EmptyValueIgnored") {
        ScopedEnv key("STT_API_KEY", "");
        cfg.apply_env();
        REQUIRE(cfg.server.api_key == "stt-internal-key-changeme");
    }
}

TEST_CASE("Config validation", "[config]") {
    Config cfg;

    SECTION("OverlapBelowHalfAccepted") {
        cfg.chunking.duration_s = 30.0;
        cfg.chunking.overlap_s = 14.9;
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("OverlapOfExactlyHalfRejected") {
        cfg.chunking.duration_s = 30.0;
        cfg.chunking.overlap_s = 15.0;
        auto res = cfg.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::InvalidConfig);
        REQUIRE(res.error().message.find("less than half") != std::string::npos);
    }

    SECTION("OverlapAboveHalfRejected") {
        cfg.chunking.overlap_s = 20.0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("NonPositiveDurationRejected") {
        cfg.chunking.duration_s = 0.0;
        cfg.chunking.overlap_s = 0.0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("NegativeOverlapRejected") {
        cfg.chunking.overlap_s = -1.0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("ZeroWorkersRejected") {
        cfg.transcribe.workers = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("UnknownLogLevelRejected") {
        cfg.log.level = "verbose";
        REQUIRE_FALSE(cfg.validate().has_value());
    }
}
