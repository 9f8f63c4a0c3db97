#include "logging.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <print>

namespace logging {

namespace {

std::atomic<Level> g_min_level{Level::Info};
std::atomic<Format> g_format{Format::Console};
std::mutex g_write_mutex;

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

std::string now_utc() {
    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", now);
}

} // namespace

void configure(Level min_level, Format format) {
    g_min_level.store(min_level, std::memory_order_relaxed);
    g_format.store(format, std::memory_order_relaxed);
}

bool enabled(Level level) {
    return level >= g_min_level.load(std::memory_order_relaxed);
}

void write(Level level, std::string_view msg) {
    auto line = format_line(level, msg, g_format.load(std::memory_order_relaxed), now_utc());
    std::lock_guard lock(g_write_mutex);
    std::println(stderr, "{}", line);
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

std::optional<Format> parse_format(std::string_view name) {
    if (name == "console") return Format::Console;
    if (name == "json") return Format::Json;
    return std::nullopt;
}

std::string format_line(Level level, std::string_view msg, Format format,
                        std::string_view timestamp) {
    if (format == Format::Json) {
        nlohmann::json j = {
            {"ts", timestamp},
            {"level", level_name(level)},
            {"service", "stt-gateway"},
            {"msg", msg},
        };
        // Native engine output is not guaranteed to be valid UTF-8.
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return std::format("{} [stt-gateway] {:<5} {}", timestamp, level_name(level), msg);
}

} // namespace logging
