#pragma once

#include "fdm/fdm_config.hpp"
#include "fdm/trim_mode.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace cirrus {

/**
 * @brief Parameters for building a simulator.
 *
 * JSON layout (every key optional):
 * {
 *   "simulation": { "dataPath", "model", "dt", "trimMode", "startPaused" },
 *   "initialConditions": { "latitude", "longitude", "altitude", "airspeed", "heading" }
 * }
 */
struct SimulatorConfig {
    FdmConfig fdm;
    TrimMode trimMode = TrimMode::Full;
    bool startPaused = false;

    // Throws ConfigError on invalid values.
    static SimulatorConfig fromJson(const nlohmann::json& root);
    // Throws ConfigError if the file cannot be read or parsed.
    static SimulatorConfig load(const std::string& path);
};

namespace ConfigKeys {
    inline constexpr char SIMULATION[] = "simulation";
    inline constexpr char DATA_PATH[] = "dataPath";
    inline constexpr char MODEL[] = "model";
    inline constexpr char DT[] = "dt";
    inline constexpr char TRIM_MODE[] = "trimMode";
    inline constexpr char START_PAUSED[] = "startPaused";

    inline constexpr char INITIAL_CONDITIONS[] = "initialConditions";
    inline constexpr char LATITUDE[] = "latitude";
    inline constexpr char LONGITUDE[] = "longitude";
    inline constexpr char ALTITUDE[] = "altitude";
    inline constexpr char AIRSPEED[] = "airspeed";
    inline constexpr char HEADING[] = "heading";
}

} // namespace cirrus
