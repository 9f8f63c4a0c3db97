#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Process-wide stderr logger. Lines are serialised so worker threads and the
// native engine callback never interleave.
namespace logging {

enum class Level { Debug, Info, Warn, Error };
enum class Format { Console, Json };

void configure(Level min_level, Format format);
bool enabled(Level level);
void write(Level level, std::string_view msg);

std::optional<Level> parse_level(std::string_view name);
std::optional<Format> parse_format(std::string_view name);

// Renders one line without the trailing newline. Exposed for tests.
std::string format_line(Level level, std::string_view msg, Format format,
                         std::string_view timestamp);

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
