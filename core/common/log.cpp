#include "common/log.hpp"

namespace adabench {
namespace log {

namespace {

Level g_level = Level::Info;
std::FILE* g_sink = nullptr;

const char* levelTag(Level level) {
    switch (level) {
        case Level::Debug:   return "debug";
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
    }
    return "info";
}

} // namespace

void setLevel(Level level) { g_level = level; }

Level level() { return g_level; }

void setSink(std::FILE* sink) { g_sink = sink; }

void write(Level level, const std::string& message) {
    if (level < g_level) return;
    std::FILE* out = g_sink ? g_sink : stderr;
    fmt::print(out, "[{}] {}\n", levelTag(level), message);
    std::fflush(out);
}

} // namespace log
} // namespace adabench
