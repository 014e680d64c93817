#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <string>
#include <vector>

#include "pinsim/devices/PlungerDevice.hpp"
#include "pinsim/physics/PlungerPhysics.hpp"

using namespace pinsim;
using devices::PlungerDevice;
using physics::PlungerStroke;

namespace
{
constexpr float kStep = 0.001F;

scene::PlungerData MakePlungerData()
{
    scene::PlungerData data;
    data.name = "Plunger";
    data.center = glm::vec2{0.0F, 100.0F};
    data.stroke = 80.0F;
    data.parkPosition = 0.25F;
    data.speedPull = 80.0F;
    data.doRetract = false;
    return data;
}

class PlungerDeviceTest : public ::testing::Test
{
protected:
    PlungerDeviceTest()
        : rng(5)
        , context{balls, config, rng}
    {
    }

    // Runs until a limit event or the given number of steps has run, checking the stroke bounds.
    void RunSteps(PlungerDevice& plunger, int steps)
    {
        for (int i = 0; i < steps; ++i)
        {
            plunger.Update(kStep);
            ASSERT_GE(plunger.Position(), plunger.StaticData().frameEnd);
            ASSERT_LE(plunger.Position(), plunger.StaticData().frameStart);
        }
    }

    physics::BallManager balls;
    core::SimulationConfig config;
    std::mt19937 rng;
    devices::DeviceContext context;
};
} // namespace

TEST(PlungerPhysicsTest, StrokeRatioAtFrameLimits)
{
    physics::PlungerStaticData staticData;
    staticData.frameStart = 100.0F;
    staticData.frameEnd = 20.0F;

    physics::PlungerMovementData movement;
    movement.position = 20.0F;
    EXPECT_FLOAT_EQ(physics::StrokeRatio(movement, staticData), 0.0F);

    movement.position = 100.0F;
    EXPECT_FLOAT_EQ(physics::StrokeRatio(movement, staticData), 1.0F);

    for (float position = 20.0F; position <= 100.0F; position += 3.7F)
    {
        movement.position = position;
        const float ratio = physics::StrokeRatio(movement, staticData);
        EXPECT_GE(ratio, 0.0F);
        EXPECT_LE(ratio, 1.0F);
    }
}

TEST(PlungerPhysicsTest, FireClampsRatio)
{
    const auto staticData = physics::PlungerStaticData::FromData(MakePlungerData());

    physics::PlungerMovementData movement;
    EXPECT_FLOAT_EQ(physics::PlungerCommands::Fire(3.0F, movement, staticData), 1.0F);
    EXPECT_FLOAT_EQ(movement.position, staticData.frameStart);

    physics::PlungerMovementData other;
    EXPECT_FLOAT_EQ(physics::PlungerCommands::Fire(-1.0F, other, staticData), 0.0F);
    EXPECT_FLOAT_EQ(other.position, staticData.frameEnd);
}

TEST(PlungerPhysicsTest, MovingFacePushesBall)
{
    const auto staticData = physics::PlungerStaticData::FromData(MakePlungerData());
    physics::PlungerMovementData movement;
    movement.stroke = PlungerStroke::Fired;
    movement.speed = -100.0F;

    physics::BallState ball;
    physics::ContactEvent contact;
    physics::ColliderMaterial material;
    material.elasticity = 0.0F;
    core::SimulationConfig config;
    std::mt19937 rng(1);

    EXPECT_TRUE(physics::CollidePlunger(ball, contact, movement, staticData, material, config, rng));
    EXPECT_FLOAT_EQ(ball.velocity.y, -100.0F);
    EXPECT_FLOAT_EQ(ball.velocity.x, 0.0F);
    EXPECT_TRUE(contact.isContact);
}

TEST(PlungerPhysicsTest, RestingFaceStopsBall)
{
    const auto staticData = physics::PlungerStaticData::FromData(MakePlungerData());
    physics::PlungerMovementData movement;

    physics::BallState ball;
    ball.velocity = glm::vec3{0.0F, 5.0F, 0.0F};
    physics::ContactEvent contact;
    physics::ColliderMaterial material;
    material.elasticity = 0.0F;
    core::SimulationConfig config;
    std::mt19937 rng(1);

    EXPECT_TRUE(physics::CollidePlunger(ball, contact, movement, staticData, material, config, rng));
    EXPECT_FLOAT_EQ(ball.velocity.y, 0.0F);

    // moving away from the face
    ball.velocity = glm::vec3{0.0F, -5.0F, 0.0F};
    EXPECT_FALSE(physics::CollidePlunger(ball, contact, movement, staticData, material, config, rng));
    EXPECT_FLOAT_EQ(ball.velocity.y, -5.0F);
}

TEST(PlungerPhysicsTest, ScatterVelocityOnlyWhileFired)
{
    scene::PlungerData data = MakePlungerData();
    data.scatterVelocity = 10.0F;
    const auto staticData = physics::PlungerStaticData::FromData(data);

    physics::ColliderMaterial material;
    material.elasticity = 0.0F;
    core::SimulationConfig config;
    config.globalDifficulty = 1.0F;
    std::mt19937 rng(3);

    physics::PlungerMovementData movement;
    movement.stroke = PlungerStroke::Fired;
    movement.speed = -50.0F;

    physics::BallState ball;
    physics::ContactEvent contact;
    physics::CollidePlunger(ball, contact, movement, staticData, material, config, rng);
    EXPECT_LE(std::abs(ball.velocity.x), 10.0F);
    EXPECT_NE(ball.velocity.x, 0.0F);

    movement.stroke = PlungerStroke::Resting;
    physics::BallState quiet;
    physics::CollidePlunger(quiet, contact, movement, staticData, material, config, rng);
    EXPECT_FLOAT_EQ(quiet.velocity.x, 0.0F);
}

TEST_F(PlungerDeviceTest, StartsAtRest)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    EXPECT_FLOAT_EQ(plunger.Position(), 40.0F);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Resting);
    EXPECT_FLOAT_EQ(plunger.StrokeRatio(), 0.25F);
}

TEST_F(PlungerDeviceTest, PullHoldsAtRetractedLimit)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    std::vector<float> eos;
    plunger.LimitEosEvent().Subscribe([&eos](const devices::StrokeEventArgs& args) { eos.push_back(args.speed); });

    plunger.PullBack();
    RunSteps(plunger, 2000);

    ASSERT_EQ(eos.size(), 1U);
    EXPECT_FLOAT_EQ(eos[0], 80.0F);
    EXPECT_FLOAT_EQ(plunger.Position(), 100.0F);
    EXPECT_FLOAT_EQ(plunger.StrokeRatio(), 1.0F);
}

TEST_F(PlungerDeviceTest, ManualFireUsesPulledRatioAndReturnsToRest)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    std::vector<float> bos;
    plunger.LimitBosEvent().Subscribe([&bos](const devices::StrokeEventArgs& args) { bos.push_back(args.speed); });

    plunger.PullBack();
    RunSteps(plunger, 2000);

    EXPECT_FLOAT_EQ(plunger.Fire(), 1.0F);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Fired);
    RunSteps(plunger, 500);

    ASSERT_EQ(bos.size(), 1U);
    EXPECT_GT(bos[0], 0.0F);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Resting);
    EXPECT_FLOAT_EQ(plunger.Position(), 40.0F);
}

TEST_F(PlungerDeviceTest, ManualFireFromRestUsesParkRatio)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    EXPECT_FLOAT_EQ(plunger.Fire(), 0.25F);
}

TEST_F(PlungerDeviceTest, AutoPlungerAlwaysFiresFull)
{
    scene::PlungerData data = MakePlungerData();
    data.isAutoPlunger = true;
    PlungerDevice plunger(1, data, context);

    EXPECT_FLOAT_EQ(plunger.Fire(), 1.0F);
}

TEST_F(PlungerDeviceTest, FireWhileFiredIsNoOp)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    plunger.PullBack();
    RunSteps(plunger, 300);

    const float ratio = plunger.Fire();
    RunSteps(plunger, 5);
    const float position = plunger.Position();

    EXPECT_FLOAT_EQ(plunger.Fire(), ratio);
    EXPECT_FLOAT_EQ(plunger.Position(), position);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Fired);
}

TEST_F(PlungerDeviceTest, RetractModeDriftsAndPullsAgain)
{
    scene::PlungerData data = MakePlungerData();
    data.doRetract = true;
    data.retractDistance = 8.0F;
    data.retractWaitSeconds = 0.05F;
    PlungerDevice plunger(1, data, context);
    EXPECT_TRUE(plunger.DoRetract());

    int eosCount = 0;
    plunger.LimitEosEvent().Subscribe([&eosCount](const devices::StrokeEventArgs&) { ++eosCount; });

    plunger.PullBack();
    // (100 - 40) / 80 = 0.75 s to the limit
    RunSteps(plunger, 760);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::RetractHold);
    EXPECT_FLOAT_EQ(plunger.Position(), 92.0F);

    RunSteps(plunger, 60);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Retracting);

    RunSteps(plunger, 500);
    EXPECT_EQ(eosCount, 1);
}

TEST_F(PlungerDeviceTest, PullCoilFiresOnRelease)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    wiring::IWireDest* pull = plunger.Coil("Pull");
    ASSERT_NE(pull, nullptr);

    pull->OnChange(true);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Retracting);
    RunSteps(plunger, 100);

    pull->OnChange(false);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Fired);
}

TEST_F(PlungerDeviceTest, FireCoilFiresOnEnable)
{
    PlungerDevice plunger(1, MakePlungerData(), context);
    wiring::IWireDest* fire = plunger.Wire("Fire");
    ASSERT_NE(fire, nullptr);

    fire->OnChange(true);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Fired);
    fire->OnChange(false);
    EXPECT_EQ(plunger.Stroke(), PlungerStroke::Fired);
}

TEST_F(PlungerDeviceTest, UnknownCoilNamesPullAndFire)
{
    PlungerDevice plunger(1, MakePlungerData(), context);

    wiring::InvalidReference error;
    EXPECT_EQ(plunger.Coil("Foo", &error), nullptr);
    EXPECT_EQ(error.validNames, (std::vector<std::string>{"Pull", "Fire"}));
    EXPECT_EQ(error.Message(), "Unknown coil \"Foo\". Valid names are [ \"Pull\", \"Fire\" ].");
}

TEST_F(PlungerDeviceTest, MechPlungerFollowsAnalogInput)
{
    scene::PlungerData data = MakePlungerData();
    data.isMechPlunger = true;
    PlungerDevice plunger(1, data, context);

    int eosCount = 0;
    plunger.LimitEosEvent().Subscribe([&eosCount](const devices::StrokeEventArgs&) { ++eosCount; });

    plunger.SetAnalogPosition(0.5F);
    plunger.Update(kStep);
    EXPECT_FLOAT_EQ(plunger.Position(), 70.0F);

    // out of range values are kept but saturate the stroke
    plunger.SetAnalogPosition(1.7F);
    EXPECT_FLOAT_EQ(plunger.AnalogPosition(), 1.7F);
    plunger.Update(kStep);
    plunger.Update(kStep);
    EXPECT_FLOAT_EQ(plunger.Position(), 100.0F);
    EXPECT_EQ(eosCount, 1);

    plunger.SetAnalogPosition(0.0F);
    plunger.Update(kStep);
    EXPECT_FLOAT_EQ(plunger.Position(), 40.0F);
}

TEST_F(PlungerDeviceTest, GeneratesOnePlungerCollider)
{
    PlungerDevice plunger(7, MakePlungerData(), context);
    std::vector<physics::Collider> colliders;
    plunger.GenerateColliders(0.01F, colliders);

    ASSERT_EQ(colliders.size(), 1U);
    EXPECT_EQ(colliders[0].Kind(), physics::ColliderKind::Plunger);
    EXPECT_EQ(colliders[0].Owner(), 7U);
}
