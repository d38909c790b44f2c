#pragma once

#include "fdm/fdm_config.hpp"
#include "fdm/flight_dynamics_model.hpp"
#include <FGFDMExec.h>
#include <functional>
#include <memory>
#include <string>

namespace cirrus {

class JsbsimModel : public FlightDynamicsModel {
public:
    using Factory = std::function<std::shared_ptr<FlightDynamicsModel>(const FdmConfig&)>;

    // Loads the aircraft and runs the initial conditions. Throws ConfigError on failure.
    static std::shared_ptr<JsbsimModel> create(const FdmConfig& config);
    static Factory factory();

    explicit JsbsimModel(std::unique_ptr<JSBSim::FGFDMExec> fdm);

    double getDeltaT() const override;
    double getSimTime() const override;

    void hold() override;
    void resume() override;
    bool isHolding() const override;

    bool isIntegrationSuspended() const override;
    void resumeIntegration() override;

    void resetToInitialConditions(int mode) override;
    bool runInitialConditions() override;

    void processPendingMessages() override;
    void checkIncrementalHold() override;
    bool runOneStep() override;

    double getAltitude() const override;

    double getProperty(const std::string& name) const override;
    void setProperty(const std::string& name, double value) override;

    bool trim(TrimMode mode) override;

    JSBSim::FGFDMExec& exec() { return *m_fdm; }

private:
    std::unique_ptr<JSBSim::FGFDMExec> m_fdm;
};

} // namespace cirrus
