#include "aircraft/aircraft.hpp"
#include "aircraft/property_paths.hpp"
#include "core/log.hpp"

namespace cirrus {

double Aircraft::Controls::aileron() const {
    return m_model->getProperty(Properties::Controls::AILERON);
}

double Aircraft::Controls::elevator() const {
    return m_model->getProperty(Properties::Controls::ELEVATOR);
}

double Aircraft::Controls::rudder() const {
    return m_model->getProperty(Properties::Controls::RUDDER);
}

double Aircraft::Controls::throttle() const {
    return m_model->getProperty(Properties::Controls::THROTTLE);
}

void Aircraft::Controls::setAileron(double value) {
    m_model->setProperty(Properties::Controls::AILERON, value);
}

void Aircraft::Controls::setElevator(double value) {
    m_model->setProperty(Properties::Controls::ELEVATOR, value);
}

void Aircraft::Controls::setRudder(double value) {
    m_model->setProperty(Properties::Controls::RUDDER, value);
}

void Aircraft::Controls::setThrottle(double value) {
    m_model->setProperty(Properties::Controls::THROTTLE, value);
}

Aircraft::Aircraft(std::shared_ptr<FlightDynamicsModel> model)
    : m_model(std::move(model)), m_controls(*m_model)
{
}

void Aircraft::startEngines() {
    // -1 starts every engine on the model
    m_model->setProperty(Properties::Engine::SET_RUNNING, -1.0);
}

bool Aircraft::trim(TrimMode mode) {
    log::debug("Aircraft", "trimming at mode ", trimModeName(mode));
    return m_model->trim(mode);
}

void Aircraft::zeroControls() {
    m_controls.setAileron(0.0);
    m_controls.setElevator(0.0);
    m_controls.setRudder(0.0);
    m_controls.setThrottle(0.0);
}

double Aircraft::engineThrust() const {
    return m_model->getProperty(Properties::Engine::THRUST_LBS);
}

} // namespace cirrus
