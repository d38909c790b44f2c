#pragma once

#include "fdm/trim_mode.hpp"
#include <string>

namespace cirrus {

/**
 * @brief The two independent "frozen" bits of a flight model.
 *
 * A model can be held (the executive skips its run loop) and, separately,
 * have integration suspended (models run but time does not advance).
 * Both must be cleared before the model actually moves again.
 */
struct FreezeState {
    bool holding = false;
    bool integrationSuspended = false;

    bool frozen() const { return holding || integrationSuspended; }
};

/**
 * @brief Contract the simulator requires from a flight dynamics engine.
 *
 * Owns simulation time, integration state and the vehicle's position. The
 * JSBSim-backed implementation lives in fdm/jsbsim_model.hpp.
 */
class FlightDynamicsModel {
public:
    virtual ~FlightDynamicsModel() = default;

    virtual double getDeltaT() const = 0;
    virtual double getSimTime() const = 0;

    virtual void hold() = 0;
    virtual void resume() = 0;
    virtual bool isHolding() const = 0;

    virtual bool isIntegrationSuspended() const = 0;
    virtual void resumeIntegration() = 0;

    FreezeState freezeState() const {
        FreezeState state;
        state.holding = isHolding();
        state.integrationSuspended = isIntegrationSuspended();
        return state;
    }

    virtual void resetToInitialConditions(int mode) = 0;
    virtual bool runInitialConditions() = 0;

    virtual void processPendingMessages() = 0;
    virtual void checkIncrementalHold() = 0;

    // May throw; callers must not swallow it.
    virtual bool runOneStep() = 0;

    // Meters above sea level.
    virtual double getAltitude() const = 0;

    virtual double getProperty(const std::string& name) const = 0;
    virtual void setProperty(const std::string& name, double value) = 0;

    // Returns false when the trim solver did not converge.
    virtual bool trim(TrimMode mode) = 0;
};

} // namespace cirrus
