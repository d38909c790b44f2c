#pragma once

#include "core/simulator.hpp"
#include "core/simulator_config.hpp"
#include "fdm/flight_dynamics_model.hpp"
#include <functional>
#include <memory>

namespace cirrus {

/**
 * @brief Builds a ready-to-run Simulator.
 *
 * Creates the model, starts the engines, trims, and runs one validation
 * step. A builder can be reused; each call produces an independent model.
 */
class SimulatorBuilder {
public:
    using ModelFactory = std::function<std::shared_ptr<FlightDynamicsModel>(const FdmConfig&)>;

    SimulatorBuilder(SimulatorConfig config, ModelFactory factory);

    SimulatorConfig& config() { return m_config; }
    const SimulatorConfig& config() const { return m_config; }

    /**
     * @return the simulator, or nullptr if the validation step failed.
     * @throws ConfigError if the model cannot be created.
     */
    std::unique_ptr<Simulator> createSimulator() const;

private:
    SimulatorConfig m_config;
    ModelFactory m_factory;
};

} // namespace cirrus
