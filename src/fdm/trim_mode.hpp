#pragma once

#include <optional>
#include <string>

namespace cirrus {

// Values match JSBSim's TrimMode codes (FGTrim.h) so they can be passed through.
enum class TrimMode : int {
    Longitudinal = 0,
    Full = 1,
    Ground = 2,
    Pullup = 3,
    Custom = 4,
    Turn = 5,
    None = 6
};

const char* trimModeName(TrimMode mode);
std::optional<TrimMode> trimModeFromName(const std::string& name);
std::optional<TrimMode> trimModeFromCode(int code);

} // namespace cirrus
