#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 8000;
        uint32_t io_threads = 4;
        std::string api_key = "stt-internal-key-changeme";
        std::string app_name = "Speech-to-Text API";
        std::string version = "1.0.0";
    } server;

    struct Whisper {
        std::string model_size = "small";
        std::string artifacts_dir = "models";
        std::string language = "vi";
        int n_threads = 0; // 0 = auto-detect
    } whisper;

    struct Chunking {
        bool enabled = true;
        double duration_s = 30.0;
        double overlap_s = 3.0;
        double min_chunk_s = 2.0;
        uint32_t max_chunks = 1000;
        uint32_t merge_window_words = 5;
    } chunking;

    struct Audio {
        float silence_threshold = 0.01f;
        float noise_threshold = 0.001f;
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
        uint32_t probe_timeout_s = 10;
        uint32_t decode_timeout_s = 120;
    } audio;

    struct Transcribe {
        uint32_t timeout_s = 30;
        double timeout_factor = 1.5;
        uint32_t workers = 2;
    } transcribe;

    struct Storage {
        std::string temp_dir = "/tmp/stt_processing";
        uint32_t max_upload_mb = 500;
    } storage;

    struct Minio {
        std::string endpoint = "http://localhost:9000";
        std::string access_key;
        std::string secret_key;
        std::string region = "us-east-1";
    } minio;

    struct Jobs {
        std::string db_path = "/tmp/stt_processing/jobs.db";
        uint32_t ttl_s = 3600;
        uint32_t runners = 2;
    } jobs;

    struct Log {
        std::string level = "info";
        std::string format = "console";
    } log;

    // Overlap must stay below half the window or boundaries stop advancing.
    std::expected<void, Error> validate() const;

    // Applies STT_* environment overrides on top of the loaded values.
    void apply_env();

    static Config load(const std::string& path);
};
