#include "core/simulator.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <cmath>
#include <exception>

namespace cirrus {

namespace {
constexpr char kTag[] = "Simulator";
}

const char* simulatorStateName(SimulatorState state) {
    switch (state) {
        case SimulatorState::Running: return "running";
        case SimulatorState::Paused: return "paused";
        case SimulatorState::Crashed: return "crashed";
    }
    return "unknown";
}

Simulator::Simulator(std::shared_ptr<FlightDynamicsModel> model)
    : m_model(std::move(model)), m_aircraft(m_model)
{
}

void Simulator::pause() {
    m_model->hold();
}

void Simulator::resume() {
    if (m_crashed) {
        log::debug(kTag, "not resuming because the aircraft has crashed");
        return;
    }

    FreezeState freeze = m_model->freezeState();
    if (freeze.integrationSuspended) {
        m_model->resumeIntegration();
    }
    m_model->resume();
}

bool Simulator::isPaused() const {
    return m_model->isHolding();
}

SimulatorState Simulator::state() const {
    if (m_crashed) return SimulatorState::Crashed;
    return isPaused() ? SimulatorState::Paused : SimulatorState::Running;
}

void Simulator::latchCrash() {
    log::info(kTag, "aircraft has crashed at t=", simulationTime(), "s, pausing");
    pause();
    m_crashed = true;
}

bool Simulator::step() {
    // Crash detection runs before anything else on every call.
    if (!m_crashed && m_model->getAltitude() < 0.0) {
        latchCrash();
        return true;
    }

    if (m_crashed) {
        return true;
    }

    bool wasPaused = isPaused();
    if (wasPaused) {
        resume();
    }

    bool ran = false;
    try {
        m_model->processPendingMessages();
        m_model->checkIncrementalHold();
        ran = m_model->runOneStep();
    } catch (const std::exception& e) {
        std::throw_with_nested(SimulationError(std::string("Flight model fault during step: ") + e.what()));
    } catch (...) {
        std::throw_with_nested(SimulationError("Flight model fault during step"));
    }

    if (wasPaused) {
        pause();
    }

    if (!ran) {
        log::error(kTag, "the flight model failed to run at t=", simulationTime(), "s");
        return false;
    }
    return true;
}

bool Simulator::runFor(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        log::error(kTag, "invalid simulator run time length ", seconds);
        return false;
    }

    double clock = simulationTime();
    const double endTime = clock + seconds;
    // JSBSim reports dt = 0 while integration is suspended
    const double startDt = dt();

    while (clock <= endTime) {
        if (!step()) {
            return false;
        }
        if (!m_crashed) {
            clock = simulationTime();
            continue;
        }

        // A crashed model is held and its time stands still; the remaining
        // budget is spent one dt per no-op step.
        double spent = dt();
        if (!(spent > 0.0)) spent = startDt;
        if (!(spent > 0.0)) {
            log::debug(kTag, "no usable time step after crash, ending run early");
            break;
        }
        clock += spent;
    }
    return true;
}

bool Simulator::run() {
    if (!m_model->isHolding()) {
        return step();
    }
    return true;
}

bool Simulator::reset() {
    log::debug(kTag, "resetting the aircraft");
    m_crashed = false;

    pause();
    m_aircraft.zeroControls();

    m_model->resetToInitialConditions(0);
    if (!m_model->runInitialConditions()) {
        log::error(kTag, "failed to run initial conditions");
        return false;
    }

    log::debug(kTag, "starting the aircraft's engines");
    m_aircraft.startEngines();

    if (!m_aircraft.trim(m_trimMode)) {
        log::warn(kTag, "failed to trim the aircraft at mode ", trimModeName(m_trimMode));
        // the trim routine may leave the surfaces deflected
        m_aircraft.zeroControls();
    }

    if (!step()) {
        log::error(kTag, "failed to execute initial run after reset");
        return false;
    }

    log::debug(kTag, "engine thrust after reset ", m_aircraft.engineThrust(), " lbs");

    if (!m_startPaused) {
        resume();
    }
    return true;
}

void Simulator::setAircraftControls(double aileron, double elevator, double rudder, double throttle) {
    Aircraft::Controls& controls = m_aircraft.controls();
    controls.setAileron(aileron);
    controls.setElevator(elevator);
    controls.setRudder(rudder);
    controls.setThrottle(throttle);
}

void Simulator::printState(std::ostream& out) const {
    out << "Simulation state\n";
    out << "================\n";
    out << "Time: " << simulationTime() << " seconds\n";
    out << "DT: " << dt() << " seconds\n";
    out << "Running: " << (isPaused() ? "false" : "true") << "\n";
    out << "Crashed: " << (m_crashed ? "true" : "false") << "\n";
    out << "\n";
}

} // namespace cirrus
