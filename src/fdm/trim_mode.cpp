#include "fdm/trim_mode.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace cirrus {

namespace {
constexpr std::array<std::pair<TrimMode, const char*>, 7> kTrimModeNames = {{
    {TrimMode::Longitudinal, "longitudinal"},
    {TrimMode::Full, "full"},
    {TrimMode::Ground, "ground"},
    {TrimMode::Pullup, "pullup"},
    {TrimMode::Custom, "custom"},
    {TrimMode::Turn, "turn"},
    {TrimMode::None, "none"},
}};
}

const char* trimModeName(TrimMode mode) {
    for (const auto& entry : kTrimModeNames) {
        if (entry.first == mode) return entry.second;
    }
    return "unknown";
}

std::optional<TrimMode> trimModeFromName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : kTrimModeNames) {
        if (lower == entry.second) return entry.first;
    }
    return std::nullopt;
}

std::optional<TrimMode> trimModeFromCode(int code) {
    if (code < static_cast<int>(TrimMode::Longitudinal) || code > static_cast<int>(TrimMode::None)) {
        return std::nullopt;
    }
    return static_cast<TrimMode>(code);
}

} // namespace cirrus
