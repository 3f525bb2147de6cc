#include "PlantFixtures.hpp"
#include "sim/EnvironmentModel.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace plantsim;
using plantsim::test::default_bank;
using plantsim::test::get;
using plantsim::test::put;

namespace
{
    using P = model::PressurizedLoop;
    using B = model::BasicLoop;
}

TEST(EnvironmentModelTest, PressurizedNominalStep)
{
    sim::EnvironmentModel env(P{}, 1.0, 0.0);
    auto bank{ default_bank(P{}) };

    auto changes{ env.step(bank) };
    ASSERT_TRUE(changes);
    EXPECT_EQ(changes->size(), 3u);

    EXPECT_EQ(get(bank, P::throughput), 250);
    EXPECT_EQ(get(bank, P::pressure), 924);
    EXPECT_EQ(get(bank, P::temperature), 59);
}

TEST(EnvironmentModelTest, AggressivenessScalesTheTick)
{
    sim::EnvironmentModel calm(P{}, 0.5, 0.0);
    auto bank{ default_bank(P{}) };
    ASSERT_TRUE(calm.step(bank));

    // throughput 250 * 0.5, pressure and temperature terms halved
    EXPECT_EQ(get(bank, P::throughput), 125);
    EXPECT_LT(get(bank, P::pressure), 924);
    EXPECT_LT(get(bank, P::temperature), 59);
}

TEST(EnvironmentModelTest, ReliefValveBleedsPressure)
{
    sim::EnvironmentModel env(P{}, 1.0, 0.0);

    auto closed{ default_bank(P{}) };
    put(closed, P::pressure, 1350);
    auto open{ closed };
    put(open, P::relief_valve, 1);

    ASSERT_TRUE(env.step(closed));
    ASSERT_TRUE(env.step(open));

    EXPECT_EQ(get(closed, P::pressure) - get(open, P::pressure), 15);
    EXPECT_GE(get(open, P::pressure), 600);
    EXPECT_LE(get(open, P::pressure), 1400);
}

TEST(EnvironmentModelTest, ReliefValveBelowThresholdDoesNothing)
{
    sim::EnvironmentModel env(P{}, 1.0, 0.0);

    auto closed{ default_bank(P{}) };
    auto open{ closed };
    put(open, P::relief_valve, 1);

    ASSERT_TRUE(env.step(closed));
    ASSERT_TRUE(env.step(open));
    EXPECT_EQ(get(closed, P::pressure), get(open, P::pressure));
}

TEST(EnvironmentModelTest, PressurizedStaysWithinPhysicalBounds)
{
    sim::EnvironmentModel env(P{}, 1.0, 1.0, 7u);
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> voltage(0, 1000);
    std::uniform_int_distribution<int> temperature(0, 200);
    std::uniform_int_distribution<int> pressure(0, 2000);
    std::uniform_int_distribution<int> bit(0, 1);

    for (int i = 0; i < 500; ++i) {
        auto bank{ default_bank(P{}) };
        put(bank, P::pump_voltage, static_cast<uint16_t>(voltage(rng)));
        put(bank, P::temperature, static_cast<uint16_t>(temperature(rng)));
        put(bank, P::pressure, static_cast<uint16_t>(pressure(rng)));
        put(bank, P::throughput, static_cast<uint16_t>(voltage(rng)));
        put(bank, P::fan_level, static_cast<uint16_t>(voltage(rng)));
        put(bank, P::heater_power, static_cast<uint16_t>(voltage(rng) % 300));
        put(bank, P::fan, static_cast<uint16_t>(bit(rng)));
        put(bank, P::heating, static_cast<uint16_t>(bit(rng)));
        put(bank, P::relief_valve, static_cast<uint16_t>(bit(rng)));

        ASSERT_TRUE(env.step(bank));
        EXPECT_GE(get(bank, P::temperature), 30);
        EXPECT_LE(get(bank, P::temperature), 150);
        EXPECT_GE(get(bank, P::pressure), 600);
        EXPECT_LE(get(bank, P::pressure), 1400);
        EXPECT_GE(get(bank, P::throughput), 20);
        EXPECT_LE(get(bank, P::throughput), 1000);
    }
}

TEST(EnvironmentModelTest, SameSeedSameTrajectory)
{
    sim::EnvironmentModel first(P{}, 1.0, 1.0, 42u);
    sim::EnvironmentModel second(P{}, 1.0, 1.0, 42u);
    auto a{ default_bank(P{}) };
    auto b{ default_bank(P{}) };

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(first.step(a));
        ASSERT_TRUE(second.step(b));
    }
    EXPECT_EQ(a, b);
}

TEST(EnvironmentModelTest, OnlyMeasuredRegistersMove)
{
    sim::EnvironmentModel env(P{}, 1.0, 1.0, 3u);
    auto bank{ default_bank(P{}) };
    auto changes{ env.step(bank) };
    ASSERT_TRUE(changes);

    for (const auto& change : *changes) {
        EXPECT_EQ(change.space, reglink::RegisterSpace::InputRegisters);
        EXPECT_TRUE(change.address >= 1 && change.address <= 3) << change.label;
    }
}

TEST(EnvironmentModelTest, BasicPumpAndFanOn)
{
    sim::EnvironmentModel env(B{}, 1.0, 0.0);
    auto bank{ default_bank(B{}) };

    auto changes{ env.step(bank) };
    ASSERT_TRUE(changes);
    EXPECT_EQ(changes->size(), 2u);

    EXPECT_EQ(get(bank, B::throughput), 100);
    EXPECT_EQ(get(bank, B::pressure), 907);
    EXPECT_EQ(get(bank, B::temperature), 52);
}

TEST(EnvironmentModelTest, BasicPumpAndFanOff)
{
    sim::EnvironmentModel env(B{}, 1.0, 0.0);
    auto bank{ default_bank(B{}) };
    put(bank, B::pump, 0);
    put(bank, B::fan, 0);

    ASSERT_TRUE(env.step(bank));
    EXPECT_EQ(get(bank, B::pressure), 895);
    EXPECT_EQ(get(bank, B::temperature), 57);
}

TEST(EnvironmentModelTest, BasicLimits)
{
    sim::EnvironmentModel env(B{}, 1.0, 0.0);

    auto hot{ default_bank(B{}) };
    put(hot, B::pump_voltage, 0);
    put(hot, B::pressure, 201);
    put(hot, B::temperature, 130);
    put(hot, B::fan, 0);
    ASSERT_TRUE(env.step(hot));
    EXPECT_EQ(get(hot, B::throughput), 5);
    EXPECT_EQ(get(hot, B::pressure), 200);
    EXPECT_EQ(get(hot, B::temperature), 130);

    auto full{ default_bank(B{}) };
    put(full, B::pump_voltage, 1000);
    put(full, B::pressure, 1590);
    put(full, B::temperature, 11);
    put(full, B::fan_level, 1000);
    ASSERT_TRUE(env.step(full));
    EXPECT_EQ(get(full, B::throughput), 200);
    EXPECT_EQ(get(full, B::pressure), 1600);
    EXPECT_EQ(get(full, B::temperature), 10);
}
