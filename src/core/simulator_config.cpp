#include "core/simulator_config.hpp"
#include "core/errors.hpp"
#include "utils/config_loader.hpp"

namespace cirrus {

namespace {

TrimMode parseTrimMode(const json& value) {
    std::optional<TrimMode> mode;
    if (value.is_string()) {
        mode = trimModeFromName(value.get<std::string>());
    } else if (value.is_number_integer()) {
        mode = trimModeFromCode(value.get<int>());
    }
    if (!mode) {
        throw ConfigError("Unknown trim mode: " + value.dump());
    }
    return *mode;
}

}

SimulatorConfig SimulatorConfig::fromJson(const json& root) {
    SimulatorConfig config;
    FdmConfig& fdm = config.fdm;

    try {
        if (root.contains(ConfigKeys::SIMULATION)) {
            const auto& sim = root[ConfigKeys::SIMULATION];
            fdm.rootPath = sim.value(ConfigKeys::DATA_PATH, fdm.rootPath);
            fdm.modelName = sim.value(ConfigKeys::MODEL, fdm.modelName);
            fdm.dt = sim.value(ConfigKeys::DT, fdm.dt);
            config.startPaused = sim.value(ConfigKeys::START_PAUSED, config.startPaused);
            if (sim.contains(ConfigKeys::TRIM_MODE)) {
                config.trimMode = parseTrimMode(sim[ConfigKeys::TRIM_MODE]);
            }
        }

        if (root.contains(ConfigKeys::INITIAL_CONDITIONS)) {
            const auto& ic = root[ConfigKeys::INITIAL_CONDITIONS];
            fdm.latitudeDeg = ic.value(ConfigKeys::LATITUDE, fdm.latitudeDeg);
            fdm.longitudeDeg = ic.value(ConfigKeys::LONGITUDE, fdm.longitudeDeg);
            fdm.altitudeMeters = ic.value(ConfigKeys::ALTITUDE, fdm.altitudeMeters);
            fdm.airspeedKnots = ic.value(ConfigKeys::AIRSPEED, fdm.airspeedKnots);
            fdm.headingDeg = ic.value(ConfigKeys::HEADING, fdm.headingDeg);
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid simulator configuration: ") + e.what());
    }

    if (fdm.dt <= 0.0) {
        throw ConfigError("Simulation dt must be positive, got " + std::to_string(fdm.dt));
    }

    return config;
}

SimulatorConfig SimulatorConfig::load(const std::string& path) {
    auto jsonOpt = loadJsonConfig(path);
    if (!jsonOpt) {
        throw ConfigError("Failed to load simulator config: " + path);
    }
    return fromJson(*jsonOpt);
}

} // namespace cirrus
