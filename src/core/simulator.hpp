#pragma once

#include "aircraft/aircraft.hpp"
#include "fdm/flight_dynamics_model.hpp"
#include "fdm/trim_mode.hpp"
#include <memory>
#include <ostream>

namespace cirrus {

enum class SimulatorState {
    Running,
    Paused,
    Crashed
};

const char* simulatorStateName(SimulatorState state);

/**
 * @brief Drives a flight model through stepping, pausing, crash detection and reset.
 *
 * The paused state is always read back from the model's hold flag; the only
 * state kept here is the crash latch. Not thread safe: one control thread
 * per instance.
 */
class Simulator {
public:
    explicit Simulator(std::shared_ptr<FlightDynamicsModel> model);

    // A copy would drive the same model from two state machines.
    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    void pause();
    void resume();
    bool isPaused() const;

    /**
     * @brief Advances the model by one tick.
     *
     * Checks for a crash first. A paused simulator is resumed for exactly
     * one tick and paused again afterwards.
     *
     * @return false if the model failed to run; true otherwise, including
     *         when the aircraft has crashed.
     * @throws SimulationError if the model faults during the tick.
     */
    bool step();

    // Steps until the simulation time passes now + seconds. Negative or non-finite durations are rejected.
    bool runFor(double seconds);

    // Single step for frame-driven callers; does nothing while paused.
    bool run();

    /**
     * @brief Puts the model back to its initial conditions and trims again.
     *
     * A trim failure only neutralizes the controls. Fails if the initial
     * conditions cannot be run or the validation step fails.
     */
    bool reset();

    void setAircraftControls(double aileron, double elevator, double rudder, double throttle);

    bool crashed() const { return m_crashed; }
    SimulatorState state() const;

    double dt() const { return m_model->getDeltaT(); }
    double simulationTime() const { return m_model->getSimTime(); }

    TrimMode trimMode() const { return m_trimMode; }
    void setTrimMode(TrimMode mode) { m_trimMode = mode; }

    bool startPaused() const { return m_startPaused; }
    void setStartPaused(bool startPaused) { m_startPaused = startPaused; }

    Aircraft& aircraft() { return m_aircraft; }
    const Aircraft& aircraft() const { return m_aircraft; }

    FlightDynamicsModel& model() { return *m_model; }

    void printState(std::ostream& out) const;

private:
    void latchCrash();

    std::shared_ptr<FlightDynamicsModel> m_model;
    Aircraft m_aircraft;
    TrimMode m_trimMode = TrimMode::Full;
    bool m_startPaused = false;
    bool m_crashed = false;
};

} // namespace cirrus
