#include "core/log.hpp"

namespace cirrus {
namespace log {

namespace {
Level g_level = Level::Info;

const char* levelName(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warning";
        case Level::Error: return "error";
        case Level::Off: break;
    }
    return "";
}
}

void setLevel(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

bool enabled(Level level) {
    return level != Level::Off && level >= g_level;
}

void write(Level level, const char* tag, const std::string& message) {
    if (!enabled(level)) return;

    if (level >= Level::Warn) {
        std::cerr << "[" << tag << "] " << levelName(level) << ": " << message << std::endl;
    } else {
        std::cout << "[" << tag << "] " << message << "\n";
    }
}

} // namespace log
} // namespace cirrus
