#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace cirrus {
namespace log {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

void setLevel(Level level);
Level level();
bool enabled(Level level);

// Writes "[tag] message". Debug/Info go to stdout, Warn/Error to stderr.
void write(Level level, const char* tag, const std::string& message);

template<typename... Args>
void print(Level lvl, const char* tag, const Args&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream out;
    (out << ... << args);
    write(lvl, tag, out.str());
}

template<typename... Args>
void debug(const char* tag, const Args&... args) { print(Level::Debug, tag, args...); }

template<typename... Args>
void info(const char* tag, const Args&... args) { print(Level::Info, tag, args...); }

template<typename... Args>
void warn(const char* tag, const Args&... args) { print(Level::Warn, tag, args...); }

template<typename... Args>
void error(const char* tag, const Args&... args) { print(Level::Error, tag, args...); }

} // namespace log
} // namespace cirrus
