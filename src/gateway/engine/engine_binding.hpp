#pragma once

#include "errors.hpp"

#include <expected>
#include <span>
#include <string>
#include <vector>

struct whisper_context;

struct Segment {
    double start_s = 0.0;
    double end_s = 0.0;
    std::string text;
};

struct InferenceResult {
    std::vector<Segment> segments;
    std::string text;
    double inference_s = 0.0;
};

struct InferenceOptions {
    std::string language;
    int n_threads = 1;
};

// Raw operations on the native engine. None of these are safe to call
// concurrently on one context; ContextGuard serialises them.
class EngineBinding {
public:
    virtual ~EngineBinding() = default;

    virtual bool loaded() const = 0;

    // Returns ModelInit when the file is missing or the initializer yields null.
    virtual std::expected<whisper_context*, Error>
        init_context(const std::string& model_path) = 0;

    virtual void free_context(whisper_context* ctx) = 0;

    virtual std::expected<InferenceResult, Error>
        run_inference(whisper_context* ctx, const InferenceOptions& opts,
                      std::span<const float> samples) = 0;
};
