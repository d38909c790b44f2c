#include "aircraft/aircraft.hpp"
#include "aircraft/property_paths.hpp"
#include "fake_flight_dynamics_model.hpp"
#include "mock_flight_dynamics_model.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>

using namespace cirrus;
using cirrus::test::FakeFlightDynamicsModel;
using cirrus::test::MockFlightDynamicsModel;
using ::testing::Return;
using ::testing::StrEq;

class AircraftTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeFlightDynamicsModel> model = std::make_shared<FakeFlightDynamicsModel>();
    Aircraft aircraft{model};
};

TEST_F(AircraftTest, ControlsWriteThroughToModel) {
    Aircraft::Controls& controls = aircraft.controls();
    controls.setAileron(0.1);
    controls.setElevator(-0.2);
    controls.setRudder(0.3);
    controls.setThrottle(0.9);

    EXPECT_DOUBLE_EQ(model->properties[Properties::Controls::AILERON], 0.1);
    EXPECT_DOUBLE_EQ(model->properties[Properties::Controls::ELEVATOR], -0.2);
    EXPECT_DOUBLE_EQ(model->properties[Properties::Controls::RUDDER], 0.3);
    EXPECT_DOUBLE_EQ(model->properties[Properties::Controls::THROTTLE], 0.9);
}

TEST_F(AircraftTest, ControlsReadTheModelsValues) {
    model->properties[Properties::Controls::ELEVATOR] = -0.4;

    EXPECT_DOUBLE_EQ(aircraft.controls().elevator(), -0.4);
}

TEST_F(AircraftTest, ControlsAreNotRangeChecked) {
    aircraft.controls().setThrottle(3.0);
    aircraft.controls().setRudder(-8.0);

    EXPECT_DOUBLE_EQ(aircraft.controls().throttle(), 3.0);
    EXPECT_DOUBLE_EQ(aircraft.controls().rudder(), -8.0);
}

TEST_F(AircraftTest, ZeroControlsNeutralizesAllFour) {
    model->trim(TrimMode::Full);

    aircraft.zeroControls();

    EXPECT_DOUBLE_EQ(aircraft.controls().aileron(), 0.0);
    EXPECT_DOUBLE_EQ(aircraft.controls().elevator(), 0.0);
    EXPECT_DOUBLE_EQ(aircraft.controls().rudder(), 0.0);
    EXPECT_DOUBLE_EQ(aircraft.controls().throttle(), 0.0);
}

TEST_F(AircraftTest, StartEnginesStartsAllEngines) {
    aircraft.startEngines();
    EXPECT_DOUBLE_EQ(model->properties[Properties::Engine::SET_RUNNING], -1.0);
}

TEST_F(AircraftTest, EngineThrustReadsModel) {
    model->properties[Properties::Engine::THRUST_LBS] = 12.5;
    EXPECT_DOUBLE_EQ(aircraft.engineThrust(), 12.5);
}

TEST(AircraftTrimTest, TrimDelegatesToModel) {
    auto model = std::make_shared<MockFlightDynamicsModel>();
    Aircraft aircraft(model);

    EXPECT_CALL(*model, trim(TrimMode::Pullup)).WillOnce(Return(false));
    EXPECT_CALL(*model, trim(TrimMode::Full)).WillOnce(Return(true));

    EXPECT_FALSE(aircraft.trim(TrimMode::Pullup));
    EXPECT_TRUE(aircraft.trim(TrimMode::Full));
}

TEST(AircraftTrimTest, UsesJsbsimControlProperties) {
    auto model = std::make_shared<MockFlightDynamicsModel>();
    Aircraft aircraft(model);

    EXPECT_CALL(*model, setProperty(StrEq("fcs/aileron-cmd-norm"), 0.25));
    EXPECT_CALL(*model, getProperty(StrEq("fcs/throttle-cmd-norm"))).WillOnce(Return(0.75));

    aircraft.controls().setAileron(0.25);
    EXPECT_DOUBLE_EQ(aircraft.controls().throttle(), 0.75);
}
