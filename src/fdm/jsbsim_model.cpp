#include "fdm/jsbsim_model.hpp"
#include "aircraft/property_paths.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <FGFDMExec.h>
#include <FGJSBBase.h>
#include <simgear/misc/sg_path.hxx>

namespace cirrus {

namespace {
constexpr double kFtToM = 0.3048;
constexpr double kMToFt = 1.0 / kFtToM;
constexpr char kTag[] = "JSBSim";
}

std::shared_ptr<JsbsimModel> JsbsimModel::create(const FdmConfig& config) {
    if (config.dt <= 0.0) {
        throw ConfigError("Invalid simulation time step: " + std::to_string(config.dt));
    }

    auto fdm = std::make_unique<JSBSim::FGFDMExec>();
    fdm->SetRootDir(SGPath(config.rootPath));
    fdm->SetAircraftPath(SGPath("aircraft"));
    fdm->SetEnginePath(SGPath("engine"));
    fdm->SetSystemsPath(SGPath("systems"));
    fdm->Setdt(config.dt);

    bool loaded = false;
    try {
        loaded = fdm->LoadModel(config.modelName);
    } catch (const JSBSim::BaseException& e) {
        throw ConfigError("Failed to load flight model '" + config.modelName +
                          "' from " + config.rootPath + ": " + e.what());
    }
    if (!loaded) {
        throw ConfigError("Failed to load flight model '" + config.modelName +
                          "' from " + config.rootPath);
    }

    fdm->SetPropertyValue(Properties::InitialConditions::LATITUDE_DEG, config.latitudeDeg);
    fdm->SetPropertyValue(Properties::InitialConditions::LONGITUDE_DEG, config.longitudeDeg);
    fdm->SetPropertyValue(Properties::InitialConditions::ALTITUDE_FT, config.altitudeMeters * kMToFt);
    fdm->SetPropertyValue(Properties::InitialConditions::AIRSPEED_KTS, config.airspeedKnots);
    fdm->SetPropertyValue(Properties::InitialConditions::HEADING_DEG, config.headingDeg);

    if (!fdm->RunIC()) {
        throw ConfigError("Failed to run initial conditions for '" + config.modelName + "'");
    }

    log::debug(kTag, "loaded ", config.modelName, " dt=", config.dt,
               " lat=", config.latitudeDeg, " lon=", config.longitudeDeg,
               " alt=", config.altitudeMeters, "m");

    return std::make_shared<JsbsimModel>(std::move(fdm));
}

JsbsimModel::Factory JsbsimModel::factory() {
    return [](const FdmConfig& config) -> std::shared_ptr<FlightDynamicsModel> {
        return create(config);
    };
}

JsbsimModel::JsbsimModel(std::unique_ptr<JSBSim::FGFDMExec> fdm)
    : m_fdm(std::move(fdm))
{
}

double JsbsimModel::getDeltaT() const {
    return m_fdm->GetDeltaT();
}

double JsbsimModel::getSimTime() const {
    return m_fdm->GetSimTime();
}

void JsbsimModel::hold() {
    m_fdm->Hold();
}

void JsbsimModel::resume() {
    m_fdm->Resume();
}

bool JsbsimModel::isHolding() const {
    return m_fdm->Holding();
}

bool JsbsimModel::isIntegrationSuspended() const {
    return m_fdm->IntegrationSuspended();
}

void JsbsimModel::resumeIntegration() {
    m_fdm->ResumeIntegration();
}

void JsbsimModel::resetToInitialConditions(int mode) {
    m_fdm->ResetToInitialConditions(mode);
}

bool JsbsimModel::runInitialConditions() {
    return m_fdm->RunIC();
}

void JsbsimModel::processPendingMessages() {
    m_fdm->ProcessMessage();
}

void JsbsimModel::checkIncrementalHold() {
    m_fdm->CheckIncrementalHold();
}

bool JsbsimModel::runOneStep() {
    return m_fdm->Run();
}

double JsbsimModel::getAltitude() const {
    return m_fdm->GetPropertyValue(Properties::Position::ALTITUDE_M);
}

double JsbsimModel::getProperty(const std::string& name) const {
    return m_fdm->GetPropertyValue(name);
}

void JsbsimModel::setProperty(const std::string& name, double value) {
    m_fdm->SetPropertyValue(name, value);
}

bool JsbsimModel::trim(TrimMode mode) {
    try {
        m_fdm->DoTrim(static_cast<int>(mode));
    } catch (const JSBSim::BaseException& e) {
        // TrimFailureException derives from BaseException; both mean no convergence.
        log::debug(kTag, "trim mode ", trimModeName(mode), " failed: ", e.what());
        return false;
    }
    return true;
}

} // namespace cirrus
