#pragma once

#include "engine/engine_binding.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <type_traits>

// Owns the single model context and serialises every native call on it.
// An unhealthy context (null handle or unloaded library) is freed and
// re-initialised from the same model file before the next call runs.
class ContextGuard {
public:
    ContextGuard(EngineBinding& engine, std::string model_path);
    ~ContextGuard();

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

    // First initialisation. Failure is ModelInit and construction-fatal.
    std::expected<void, Error> open();

    // Runs fn(whisper_context*) with exclusive access. fn must return
    // std::expected<T, Error>. The lock is held for the whole call and
    // released on every path, by the thread that made the native call.
    template <typename Fn>
    auto with_context(Fn&& fn) -> std::invoke_result_t<Fn, whisper_context*> {
        using Result = std::invoke_result_t<Fn, whisper_context*>;
        std::lock_guard lock(mutex_);
        if (!healthy_locked()) {
            auto recovered = recover_locked();
            if (!recovered) return Result(std::unexpect, std::move(recovered.error()));
        }
        return fn(ctx_);
    }

    // Frees the context and leaves the handle null. The next with_context
    // call recovers.
    void release();

    // Lock-free; never waits for a native call in progress.
    bool healthy() const;
    uint64_t recoveries() const { return recoveries_.load(); }
    const std::string& model_path() const { return model_path_; }

private:
    bool healthy_locked() const;
    std::expected<void, Error> recover_locked();

    EngineBinding& engine_;
    std::string model_path_;
    mutable std::mutex mutex_;
    whisper_context* ctx_ = nullptr;
    std::atomic<bool> has_context_{false}; // mirrors ctx_ != nullptr
    std::atomic<uint64_t> recoveries_{0};
};
