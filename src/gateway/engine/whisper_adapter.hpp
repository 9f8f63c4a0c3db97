#pragma once

#include "audio/audio_toolkit.hpp"
#include "audio/preflight.hpp"
#include "chunking/chunk_plan.hpp"
#include "chunking/text_merge.hpp"
#include "engine/context_guard.hpp"
#include "engine/engine_binding.hpp"
#include "engine/model_config.hpp"
#include "engine/transcriber.hpp"

#include <memory>

struct Config;

struct AdapterOptions {
    std::string language = "vi";
    int n_threads = 1;
    bool chunking_enabled = true;
    ChunkOptions chunk;
    size_t merge_window_words = 5;
    PreflightThresholds thresholds;
};

// Transcription façade over one model context. Long audio is split into
// overlapping windows; everything else is decoded and sent in one call.
class WhisperAdapter : public Transcriber {
public:
    // Loads the native libraries for the configured model size and opens the
    // context. Any failure here means the process must not serve.
    static std::expected<std::unique_ptr<WhisperAdapter>, Error> create(const Config& cfg);

    WhisperAdapter(std::unique_ptr<EngineBinding> engine, std::unique_ptr<AudioToolkit> toolkit,
                   ModelConfig model, std::string model_path, AdapterOptions opts);

    std::expected<void, Error> open();

    std::expected<std::string, Error>
        transcribe(const std::filesystem::path& audio_path, const std::string& language) override;

    std::expected<double, Error>
        probe_duration(const std::filesystem::path& audio_path) override;

    bool ready() const override;

    const ModelConfig& model() const { return model_; }
    const AdapterOptions& options() const { return opts_; }
    ContextGuard& guard() { return guard_; }

private:
    std::expected<std::string, Error>
        transcribe_direct(const std::filesystem::path& audio_path, const std::string& language);
    // Preflight, normalise and run one inference. Invalid audio yields "".
    std::expected<std::string, Error>
        transcribe_samples(AudioBuffer audio, const std::string& language);
    std::expected<std::string, Error>
        transcribe_chunked(const std::filesystem::path& audio_path, const std::string& language,
                           double duration_s);

    std::unique_ptr<EngineBinding> engine_;
    std::unique_ptr<AudioToolkit> toolkit_;
    ModelConfig model_;
    AdapterOptions opts_;
    ContextGuard guard_;
};

// 0 means one thread per hardware thread, capped at 8.
int resolve_thread_count(int configured);
