#pragma once

#include "engine/engine_binding.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

// Binding to whisper.cpp shared libraries loaded with dlopen. Types and
// function signatures come from whisper.h; nothing is linked at build time.
class WhisperLibrary : public EngineBinding {
public:
    // Loads libggml-base, libggml-cpu, libggml (global symbols, in that order)
    // and then libwhisper from library_dir. Fails with LibraryLoad.
    static std::expected<std::unique_ptr<WhisperLibrary>, Error>
        load(const std::filesystem::path& library_dir);

    ~WhisperLibrary() override;

    WhisperLibrary(const WhisperLibrary&) = delete;
    WhisperLibrary& operator=(const WhisperLibrary&) = delete;

    bool loaded() const override;

    std::expected<whisper_context*, Error>
        init_context(const std::string& model_path) override;

    void free_context(whisper_context* ctx) override;

    std::expected<InferenceResult, Error>
        run_inference(whisper_context* ctx, const InferenceOptions& opts,
                      std::span<const float> samples) override;

    std::string system_info() const;

private:
    struct Api;

    explicit WhisperLibrary(std::unique_ptr<Api> api);

    std::unique_ptr<Api> api_;
};
