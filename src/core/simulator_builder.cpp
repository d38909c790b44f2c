#include "core/simulator_builder.hpp"
#include "aircraft/aircraft.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

namespace cirrus {

namespace {
constexpr char kTag[] = "SimulatorBuilder";
}

SimulatorBuilder::SimulatorBuilder(SimulatorConfig config, ModelFactory factory)
    : m_config(std::move(config)), m_factory(std::move(factory))
{
}

std::unique_ptr<Simulator> SimulatorBuilder::createSimulator() const {
    if (!m_factory) {
        throw ConfigError("No flight model factory configured");
    }

    std::shared_ptr<FlightDynamicsModel> model = m_factory(m_config.fdm);
    if (!model) {
        throw ConfigError("Flight model factory returned no model for '" + m_config.fdm.modelName + "'");
    }

    Aircraft aircraft(model);
    aircraft.startEngines();

    log::debug(kTag, "trimming the aircraft at mode ", trimModeName(m_config.trimMode));
    if (!aircraft.trim(m_config.trimMode)) {
        log::warn(kTag, "failed to trim the aircraft");
        // trim may leave the surfaces deflected; start from neutral instead
        aircraft.zeroControls();
    }

    auto simulator = std::make_unique<Simulator>(model);
    simulator->setTrimMode(m_config.trimMode);
    simulator->setStartPaused(m_config.startPaused);

    if (!simulator->step()) {
        log::error(kTag, "failed to execute the initial simulator run");
        return nullptr;
    }

    if (m_config.startPaused) {
        simulator->pause();
    }

    return simulator;
}

} // namespace cirrus
