#include "engine/context_guard.hpp"

#include "logging.hpp"

#include <exception>

ContextGuard::ContextGuard(EngineBinding& engine, std::string model_path)
    : engine_(engine), model_path_(std::move(model_path)) {}

ContextGuard::~ContextGuard() {
    release();
}

std::expected<void, Error> ContextGuard::open() {
    std::lock_guard lock(mutex_);
    if (ctx_) return {};

    auto ctx = engine_.init_context(model_path_);
    if (!ctx) return std::unexpected(std::move(ctx.error()));

    ctx_ = *ctx;
    has_context_ = true;
    logging::info("Whisper context initialized from {}", model_path_);
    return {};
}

void ContextGuard::release() {
    std::lock_guard lock(mutex_);
    has_context_ = false;
    if (ctx_) {
        engine_.free_context(ctx_);
        ctx_ = nullptr;
    }
}

bool ContextGuard::healthy() const {
    return has_context_.load() && engine_.loaded();
}

bool ContextGuard::healthy_locked() const {
    return engine_.loaded() && ctx_ != nullptr;
}

std::expected<void, Error> ContextGuard::recover_locked() {
    ++recoveries_;
    logging::warn("Whisper context unhealthy, reinitializing (attempt {})", recoveries_.load());

    if (ctx_) {
        // The handle is already suspect; a failing free must not block re-init.
        try {
            engine_.free_context(ctx_);
        } catch (const std::exception& e) {
            logging::warn("Failed to free old context: {}", e.what());
        }
        ctx_ = nullptr;
    }
    has_context_ = false;

    if (!engine_.loaded()) {
        return std::unexpected(Error{ErrorKind::ContextRecovery,
            "Context recovery failed: native library is not loaded"});
    }

    auto ctx = engine_.init_context(model_path_);
    if (!ctx) {
        logging::error("Context recovery failed: {}", ctx.error().message);
        return std::unexpected(Error{ErrorKind::ContextRecovery,
            "Context recovery failed: " + ctx.error().message});
    }

    ctx_ = *ctx;
    has_context_ = true;
    logging::info("Whisper context reinitialized");
    return {};
}
