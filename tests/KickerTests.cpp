#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <vector>

#include <glm/gtc/constants.hpp>
#include <glm/trigonometric.hpp>

#include "pinsim/devices/KickerDevice.hpp"
#include "pinsim/physics/KickerPhysics.hpp"

using namespace pinsim;
using devices::KickerDevice;

namespace
{
scene::KickerData MakeKickerData(bool legacy = false, bool fallThrough = false)
{
    scene::KickerData data;
    data.name = "Saucer";
    data.center = glm::vec2{100.0F, 200.0F};
    data.radius = 25.0F;
    data.legacyMode = legacy;
    data.fallThrough = fallThrough;
    data.coils = {scene::KickerCoilData{"Eject", 0.0F, 10.0F, 0.0F}, scene::KickerCoilData{"Up", 90.0F, 5.0F, 0.0F}};
    return data;
}

class KickerDeviceTest : public ::testing::Test
{
protected:
    KickerDeviceTest()
        : rng(42)
        , context{balls, config, rng}
    {
        config.globalDifficulty = 0.0F;
    }

    physics::BallManager balls;
    core::SimulationConfig config;
    std::mt19937 rng;
    devices::DeviceContext context;
};
} // namespace

TEST(KickerPhysicsTest, StraightKickGoesAlongNegativeY)
{
    physics::BallState ball;
    physics::ContactEvent contact;
    contact.hitFlag = true;
    contact.hitTime = 0.5F;
    ball.angularMomentum = glm::vec3{1.0F, 2.0F, 3.0F};
    ball.frozen = true;
    std::mt19937 rng(1);

    physics::KickBall(ball, contact, physics::KickParams{0.0F, 10.0F, 0.0F, glm::vec3{0.0F}}, 0.0F, rng);

    EXPECT_FLOAT_EQ(ball.velocity.x, 0.0F);
    EXPECT_FLOAT_EQ(ball.velocity.y, -10.0F);
    EXPECT_FLOAT_EQ(ball.velocity.z, 0.0F);
    EXPECT_EQ(ball.angularMomentum, glm::vec3{0.0F});
    EXPECT_FALSE(ball.frozen);
    EXPECT_FALSE(contact.hitFlag);
    EXPECT_FLOAT_EQ(contact.hitTime, -1.0F);
}

TEST(KickerPhysicsTest, AngleRotatesClockwiseFromNegativeY)
{
    physics::BallState ball;
    physics::ContactEvent contact;
    std::mt19937 rng(1);

    physics::KickBall(ball, contact, physics::KickParams{90.0F, 10.0F, 0.0F, glm::vec3{0.0F}}, 0.0F, rng);

    EXPECT_NEAR(ball.velocity.x, 10.0F, 1e-4F);
    EXPECT_NEAR(ball.velocity.y, 0.0F, 1e-4F);
}

TEST(KickerPhysicsTest, UpwardInclinationSplitsSpeed)
{
    physics::BallState ball;
    physics::ContactEvent contact;
    std::mt19937 rng(1);

    // 30 is above pi/2 and therefore read as degrees
    physics::KickBall(ball, contact, physics::KickParams{0.0F, 10.0F, 30.0F, glm::vec3{0.0F}}, 0.0F, rng);

    EXPECT_NEAR(ball.velocity.z, 5.0F, 1e-4F);
    EXPECT_NEAR(std::hypot(ball.velocity.x, ball.velocity.y), 10.0F * std::cos(glm::radians(30.0F)), 1e-4F);
}

TEST(KickerPhysicsTest, RadianInclinationIsUsedAsIs)
{
    physics::BallState ball;
    physics::ContactEvent contact;
    std::mt19937 rng(1);

    physics::KickBall(ball, contact, physics::KickParams{0.0F, 10.0F, 0.5F, glm::vec3{0.0F}}, 0.0F, rng);

    EXPECT_NEAR(ball.velocity.z, 10.0F * std::sin(0.5F), 1e-4F);
    EXPECT_NEAR(-ball.velocity.y, 10.0F * std::cos(0.5F), 1e-4F);
}

TEST(KickerPhysicsTest, DownwardInclinationKeepsHorizontalSpeed)
{
    physics::BallState ball;
    physics::ContactEvent contact;
    std::mt19937 rng(1);

    physics::KickBall(ball, contact, physics::KickParams{0.0F, 10.0F, -0.5F, glm::vec3{0.0F}}, 0.0F, rng);

    EXPECT_LT(ball.velocity.z, 0.0F);
    EXPECT_FLOAT_EQ(ball.velocity.y, -10.0F);
}

TEST(KickerPhysicsTest, TinyScatterDoesNotTouchTheGenerator)
{
    physics::BallState ball;
    physics::ContactEvent contact;
    std::mt19937 rng(7);
    const std::mt19937 before = rng;

    const float yaw = physics::KickBall(ball, contact, physics::KickParams{30.0F, 10.0F, 0.0F, glm::vec3{0.0F}}, 1.0e-6F, rng);

    EXPECT_FLOAT_EQ(yaw, glm::radians(30.0F));
    EXPECT_EQ(rng, before);
}

TEST(KickerPhysicsTest, ScatterStaysWithinScatterAngle)
{
    const float scatter = glm::radians(10.0F);
    std::mt19937 rng(123);

    for (int i = 0; i < 500; ++i)
    {
        physics::BallState ball;
        physics::ContactEvent contact;
        const float yaw = physics::KickBall(ball, contact, physics::KickParams{0.0F, 10.0F, 0.0F, glm::vec3{0.0F}}, scatter, rng);
        EXPECT_LE(std::abs(yaw), scatter * 1.0001F);
    }

    // peak of u * (1 - u^2) is at u = 1 / sqrt(3)
    EXPECT_NEAR(physics::ShapeScatter(1.0F / std::sqrt(3.0F), 1.0F), 1.0F, 1e-4F);
    EXPECT_FLOAT_EQ(physics::ShapeScatter(1.0F, 1.0F), 0.0F);
}

TEST(KickerPhysicsTest, EffectiveScatterUsesGlobalWhenNegative)
{
    core::SimulationConfig config;
    config.globalScatter = 20.0F;
    config.globalDifficulty = 0.5F;

    EXPECT_FLOAT_EQ(physics::EffectiveScatterAngle(-1.0F, config), glm::radians(20.0F) * 0.5F);
    EXPECT_FLOAT_EQ(physics::EffectiveScatterAngle(4.0F, config), glm::radians(4.0F) * 0.5F);

    config.globalDifficulty = 3.0F;
    EXPECT_FLOAT_EQ(physics::EffectiveScatterAngle(4.0F, config), glm::radians(4.0F));
}

TEST(KickerPhysicsTest, InclinationHeuristic)
{
    EXPECT_FLOAT_EQ(physics::NormalizeInclination(1.0F), 1.0F);
    EXPECT_FLOAT_EQ(physics::NormalizeInclination(45.0F), glm::radians(45.0F));
    EXPECT_FLOAT_EQ(physics::NormalizeInclination(-45.0F), glm::radians(-45.0F));
}

TEST_F(KickerDeviceTest, KickReleasesResidentBall)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateBall();
    ASSERT_NE(ball, scene::kNoBall);
    ASSERT_TRUE(kicker.HasBall());
    EXPECT_EQ(kicker.BallId(), ball);

    kicker.Kick(0.0F, 10.0F, 0.0F);

    const physics::BallRecord* record = balls.Find(ball);
    ASSERT_NE(record, nullptr);
    EXPECT_FLOAT_EQ(record->state.velocity.x, 0.0F);
    EXPECT_FLOAT_EQ(record->state.velocity.y, -10.0F);
    EXPECT_FLOAT_EQ(record->state.velocity.z, 0.0F);
    EXPECT_EQ(record->state.angularMomentum, glm::vec3{0.0F});
    EXPECT_FALSE(record->state.frozen);
    EXPECT_FALSE(kicker.HasBall());
    EXPECT_EQ(kicker.GetBallData(), nullptr);
}

TEST_F(KickerDeviceTest, SecondKickIsNoOp)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateBall();
    kicker.Kick(0.0F, 10.0F, 0.0F);

    physics::BallRecord* record = balls.Find(ball);
    ASSERT_NE(record, nullptr);
    record->state.velocity = glm::vec3{1.0F, 2.0F, 3.0F};

    kicker.Kick(90.0F, 50.0F, 0.0F);
    EXPECT_EQ(record->state.velocity, glm::vec3(1.0F, 2.0F, 3.0F));
}

TEST_F(KickerDeviceTest, KickXYZOffsetsBall)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateSizedBall(20.0F);
    const glm::vec3 start = balls.Find(ball)->state.position;

    kicker.KickXYZ(0.0F, 5.0F, 0.0F, 1.0F, -2.0F, 3.0F);

    EXPECT_EQ(balls.Find(ball)->state.position, start + glm::vec3(1.0F, -2.0F, 3.0F));
    EXPECT_FLOAT_EQ(balls.Find(ball)->state.radius, 20.0F);
}

TEST_F(KickerDeviceTest, CreateBallRefusesWhenOccupied)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateSizedBallWithMass(25.0F, 2.0F);
    EXPECT_FLOAT_EQ(balls.Find(ball)->state.mass, 2.0F);

    EXPECT_EQ(kicker.CreateBall(), scene::kNoBall);
    EXPECT_EQ(balls.BallCount(), 1U);
}

TEST_F(KickerDeviceTest, LegacyCaptureSnapsToCenter)
{
    KickerDevice kicker(1, MakeKickerData(true, false), context);
    const scene::BallId ball = balls.CreateBall(0, glm::vec3{110.0F, 190.0F, 25.0F}, 25.0F, 1.0F);
    balls.Find(ball)->state.velocity = glm::vec3{3.0F, 4.0F, 0.0F};

    ASSERT_TRUE(kicker.Capture(ball));

    const physics::BallState* state = kicker.GetBallData();
    ASSERT_NE(state, nullptr);
    EXPECT_FLOAT_EQ(state->position.x, 100.0F);
    EXPECT_FLOAT_EQ(state->position.y, 200.0F);
    EXPECT_EQ(state->velocity, glm::vec3{0.0F});
    EXPECT_TRUE(state->frozen);
}

TEST_F(KickerDeviceTest, FallThroughCaptureDoesNotFreeze)
{
    KickerDevice kicker(1, MakeKickerData(true, true), context);
    const scene::BallId ball = balls.CreateBall(0, glm::vec3{100.0F, 200.0F, 25.0F}, 25.0F, 1.0F);

    ASSERT_TRUE(kicker.Capture(ball));
    EXPECT_FALSE(balls.Find(ball)->state.frozen);

    // ball drops out of the bottom
    kicker.OnHit(ball, true);
    EXPECT_FALSE(kicker.HasBall());
}

TEST_F(KickerDeviceTest, SecondBallIsNotCaptured)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId first = kicker.CreateBall();
    const scene::BallId second = balls.CreateBall(0, glm::vec3{100.0F, 200.0F, 25.0F}, 25.0F, 1.0F);

    EXPECT_FALSE(kicker.Capture(second));
    EXPECT_EQ(kicker.BallId(), first);
}

TEST_F(KickerDeviceTest, KickedBallIsNotRecapturedBeforeLeaving)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateBall();
    kicker.Kick(0.0F, 10.0F, 0.0F);

    EXPECT_FALSE(kicker.Capture(ball));

    kicker.OnHit(ball, true);
    EXPECT_TRUE(kicker.Capture(ball));
}

TEST_F(KickerDeviceTest, DestroyClearsOccupancyAtDrain)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateBall();

    std::vector<bool> switches;
    kicker.SwitchEvent().Subscribe([&switches](const devices::SwitchEventArgs& args) { switches.push_back(args.isEnabled); });

    EXPECT_TRUE(kicker.DestroyBall());
    EXPECT_FALSE(kicker.DestroyBall());
    EXPECT_TRUE(kicker.HasBall());

    // a kick on a ball that is going away does nothing
    kicker.Kick(0.0F, 10.0F, 0.0F);
    EXPECT_TRUE(kicker.HasBall());

    balls.DrainPendingDestruction();
    EXPECT_FALSE(kicker.HasBall());
    EXPECT_EQ(kicker.GetBallData(), nullptr);
    EXPECT_EQ(switches, std::vector<bool>{false});
}

TEST_F(KickerDeviceTest, ClearingBallsEmptiesKicker)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    kicker.CreateBall();
    ASSERT_TRUE(kicker.HasBall());

    std::vector<bool> switches;
    kicker.SwitchEvent().Subscribe([&switches](const devices::SwitchEventArgs& args) { switches.push_back(args.isEnabled); });

    balls.Clear();

    EXPECT_FALSE(kicker.HasBall());
    EXPECT_EQ(kicker.GetBallData(), nullptr);
    EXPECT_FALSE(kicker.SwitchState().IsEnabled());
    EXPECT_EQ(switches, std::vector<bool>{false});
}

TEST_F(KickerDeviceTest, KickOnEmptyKickerIsNoOp)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    kicker.Kick(0.0F, 10.0F, 0.0F);
    EXPECT_FALSE(kicker.HasBall());
    EXPECT_FALSE(kicker.DestroyBall());
}

TEST_F(KickerDeviceTest, HitRaisesEventsAndSwitch)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    int hits = 0;
    int unHits = 0;
    std::vector<bool> switches;
    kicker.HitEvent().Subscribe([&hits](const devices::HitEventArgs&) { ++hits; });
    kicker.UnHitEvent().Subscribe([&unHits](const devices::HitEventArgs&) { ++unHits; });
    kicker.SwitchEvent().Subscribe([&switches](const devices::SwitchEventArgs& args) { switches.push_back(args.isEnabled); });

    const scene::BallId ball = kicker.CreateBall();
    EXPECT_TRUE(kicker.SwitchState().IsEnabled());
    kicker.Kick(0.0F, 10.0F, 0.0F);
    kicker.OnHit(ball, true);

    EXPECT_EQ(hits, 1);
    EXPECT_EQ(unHits, 1);
    EXPECT_EQ(switches, (std::vector<bool>{true, false}));
    EXPECT_FALSE(kicker.SwitchState().IsEnabled());
}

TEST_F(KickerDeviceTest, CoilEnableKicksWithAuthoredParameters)
{
    KickerDevice kicker(1, MakeKickerData(), context);
    const scene::BallId ball = kicker.CreateBall();

    wiring::IWireDest* up = kicker.Coil("Up");
    ASSERT_NE(up, nullptr);
    up->OnChange(true);

    EXPECT_FALSE(kicker.HasBall());
    EXPECT_NEAR(balls.Find(ball)->state.velocity.x, 5.0F, 1e-4F);
}

TEST_F(KickerDeviceTest, UnknownCoilListsValidNames)
{
    KickerDevice kicker(1, MakeKickerData(), context);

    wiring::InvalidReference error;
    EXPECT_EQ(kicker.Coil("Foo", &error), nullptr);
    EXPECT_EQ(error.kind, "coil");
    EXPECT_EQ(error.requested, "Foo");
    EXPECT_EQ(error.validNames, (std::vector<std::string>{"Eject", "Up"}));
}

TEST_F(KickerDeviceTest, DefaultCoilWhenNoneAuthored)
{
    scene::KickerData data = MakeKickerData();
    data.coils.clear();
    KickerDevice kicker(1, data, context);

    EXPECT_EQ(kicker.CoilNames(), std::vector<std::string>{"Coil"});
}

TEST_F(KickerDeviceTest, SwitchLookup)
{
    KickerDevice kicker(1, MakeKickerData(), context);

    EXPECT_NE(kicker.Switch("Switch"), nullptr);
    EXPECT_NE(kicker.Switch(""), nullptr);

    wiring::InvalidReference error;
    EXPECT_EQ(kicker.Switch("Other", &error), nullptr);
    EXPECT_EQ(error.validNames, std::vector<std::string>{"Switch"});
}

TEST_F(KickerDeviceTest, SameSeedGivesSameScatter)
{
    config.globalDifficulty = 1.0F;
    scene::KickerData data = MakeKickerData();
    data.scatter = 15.0F;

    auto kickOnce = [&](std::uint32_t seed) {
        physics::BallManager localBalls;
        std::mt19937 localRng(seed);
        KickerDevice kicker(1, data, devices::DeviceContext{localBalls, config, localRng});
        const scene::BallId ball = kicker.CreateBall();
        kicker.Kick(0.0F, 10.0F, 0.0F);
        return localBalls.Find(ball)->state.velocity;
    };

    EXPECT_EQ(kickOnce(99), kickOnce(99));
    EXPECT_NE(kickOnce(99), kickOnce(100));
}
