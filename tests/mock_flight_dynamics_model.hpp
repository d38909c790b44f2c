#pragma once

#include "fdm/flight_dynamics_model.hpp"
#include <gmock/gmock.h>
#include <string>

namespace cirrus {
namespace test {

class MockFlightDynamicsModel : public FlightDynamicsModel {
public:
    MOCK_METHOD(double, getDeltaT, (), (const, override));
    MOCK_METHOD(double, getSimTime, (), (const, override));
    MOCK_METHOD(void, hold, (), (override));
    MOCK_METHOD(void, resume, (), (override));
    MOCK_METHOD(bool, isHolding, (), (const, override));
    MOCK_METHOD(bool, isIntegrationSuspended, (), (const, override));
    MOCK_METHOD(void, resumeIntegration, (), (override));
    MOCK_METHOD(void, resetToInitialConditions, (int mode), (override));
    MOCK_METHOD(bool, runInitialConditions, (), (override));
    MOCK_METHOD(void, processPendingMessages, (), (override));
    MOCK_METHOD(void, checkIncrementalHold, (), (override));
    MOCK_METHOD(bool, runOneStep, (), (override));
    MOCK_METHOD(double, getAltitude, (), (const, override));
    MOCK_METHOD(double, getProperty, (const std::string& name), (const, override));
    MOCK_METHOD(void, setProperty, (const std::string& name, double value), (override));
    MOCK_METHOD(bool, trim, (TrimMode mode), (override));
};

} // namespace test
} // namespace cirrus
