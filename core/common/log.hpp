#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <string>
#include <utility>

namespace adabench {
namespace log {

enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3 };

/// Messages below this level are dropped. Defaults to Info.
void setLevel(Level level);
Level level();

/// Destination stream. Defaults to stderr.
void setSink(std::FILE* sink);

void write(Level level, const std::string& message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (level() <= Level::Debug) write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (level() <= Level::Info) write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args&&... args) {
    if (level() <= Level::Warning) write(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace log
} // namespace adabench
