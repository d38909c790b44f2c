#pragma once

#include "fdm/flight_dynamics_model.hpp"
#include "fdm/trim_mode.hpp"
#include <memory>

namespace cirrus {

/**
 * @brief Control and engine façade over a flight model's property surface.
 *
 * Holds no state of its own; every setpoint is read from and written to
 * the model, so it can never disagree with what the model will fly.
 */
class Aircraft {
public:
    class Controls {
    public:
        explicit Controls(FlightDynamicsModel& model) : m_model(&model) {}

        double aileron() const;
        double elevator() const;
        double rudder() const;
        double throttle() const;

        // No range enforcement here; the model clamps or rejects as it sees fit.
        void setAileron(double value);
        void setElevator(double value);
        void setRudder(double value);
        void setThrottle(double value);

    private:
        FlightDynamicsModel* m_model;
    };

    explicit Aircraft(std::shared_ptr<FlightDynamicsModel> model);

    Controls& controls() { return m_controls; }
    const Controls& controls() const { return m_controls; }

    void startEngines();
    bool trim(TrimMode mode);
    void zeroControls();

    double engineThrust() const;

private:
    std::shared_ptr<FlightDynamicsModel> m_model;
    Controls m_controls;
};

} // namespace cirrus
