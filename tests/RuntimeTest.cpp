#include "PlantFixtures.hpp"
#include "TestUtil.hpp"
#include "sim/FieldRuntime.hpp"
#include "sim/PlcRuntime.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <thread>

using namespace plantsim;
using plantsim::test::TempDir;

namespace
{
    using P = model::PressurizedLoop;
    using B = model::BasicLoop;

    config::PlantConfig config_in(const TempDir& dir)
    {
        config::PlantConfig cfg;
        cfg.tmp_file = dir.file("sensors.tmp");
        cfg.json_file = dir.file("sensors.json");
        cfg.aggressiveness = 1.0;
        cfg.noise_amplitude = 0.0;
        return cfg;
    }

    uint16_t bank_value(reglink::LocalGateway& gateway, const reglink::Slot& slot)
    {
        return gateway.withBank([&](const reglink::RegisterBank& bank) { return test::get(bank, slot); });
    }
}

TEST(PlcRuntimeTest, DiffersComparesOnlyProjectedSlots)
{
    reglink::Snapshot projected;
    projected.set(reglink::RegisterSpace::Coils, 0, 1);

    reglink::Snapshot loaded{ projected };
    loaded.set(reglink::RegisterSpace::HoldingRegisters, 4, 1);
    EXPECT_FALSE(sim::PlcRuntime::differs(projected, loaded));

    loaded.set(reglink::RegisterSpace::Coils, 0, 0);
    EXPECT_TRUE(sim::PlcRuntime::differs(projected, loaded));

    EXPECT_TRUE(sim::PlcRuntime::differs(projected, reglink::Snapshot{}));
}

TEST(PlcRuntimeTest, CyclePublishesProjectionOnce)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.save(model::default_snapshot(cfg.map)));

    std::atomic<bool> running{ true };
    sim::PlcRuntime plc(cfg, running);
    ASSERT_TRUE(plc.seed_bank());

    plc.run_iteration(1);
    EXPECT_EQ(bank_value(plc.gateway(), P::pump_voltage), sim::VOLTAGE_FLOOR);

    auto published{ store.load() };
    ASSERT_TRUE(published);
    EXPECT_EQ(published->get(P::pump_voltage), sim::VOLTAGE_FLOOR);
    EXPECT_EQ(published->get(P::fan), 0);
    EXPECT_FALSE(published->get(P::mode).has_value());
    EXPECT_EQ(published->size(), model::plc_projection(cfg.map).size());

    // steady state: nothing changes, the file is left alone
    const auto written{ std::filesystem::last_write_time(cfg.tmp_file) };
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    plc.run_iteration(2);
    EXPECT_EQ(std::filesystem::last_write_time(cfg.tmp_file), written);
}

TEST(PlcRuntimeTest, OnlyFieldSlotsComeFromTheSnapshot)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.save(model::default_snapshot(cfg.map)));

    std::atomic<bool> running{ true };
    sim::PlcRuntime plc(cfg, running);
    ASSERT_TRUE(plc.seed_bank());
    plc.run_iteration(1);

    auto snapshot{ store.load().value() };
    snapshot.set(P::pressure.space, P::pressure.address, 1000);
    snapshot.set(P::target_temp.space, P::target_temp.address, 70);
    ASSERT_TRUE(store.save(snapshot));

    plc.run_iteration(2);
    EXPECT_EQ(bank_value(plc.gateway(), P::pressure), 1000);
    EXPECT_EQ(bank_value(plc.gateway(), P::target_temp), 55);

    // the device republishes its own holding registers
    EXPECT_EQ(store.load()->get(P::target_temp), 55);
}

TEST(PlcRuntimeTest, LoopMultiplierSkipsControlCycles)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    cfg.plc_loop_multiplier = 2;
    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.save(model::default_snapshot(cfg.map)));

    std::atomic<bool> running{ true };
    sim::PlcRuntime plc(cfg, running);
    ASSERT_TRUE(plc.seed_bank());

    plc.run_iteration(1);
    EXPECT_EQ(bank_value(plc.gateway(), P::pump_voltage), 250);
    plc.run_iteration(2);
    EXPECT_EQ(bank_value(plc.gateway(), P::pump_voltage), sim::VOLTAGE_FLOOR);
}

TEST(PlcRuntimeTest, UnreadableSnapshotSkipsOnlyTheUpdate)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.save(model::default_snapshot(cfg.map)));

    std::atomic<bool> running{ true };
    sim::PlcRuntime plc(cfg, running);
    ASSERT_TRUE(plc.seed_bank());

    dir.write("sensors.tmp", "{ broken");
    plc.run_iteration(1);
    EXPECT_EQ(bank_value(plc.gateway(), P::pump_voltage), sim::VOLTAGE_FLOOR);
    EXPECT_TRUE(store.load());
}

TEST(FieldRuntimeTest, TickAdvancesAndSavesThePlant)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.seed(cfg.json_file, model::default_snapshot(cfg.map)));

    std::atomic<bool> running{ true };
    sim::FieldRuntime field(cfg, running, 1u);
    auto changes{ field.tick() };
    EXPECT_EQ(changes.size(), 3u);

    auto saved{ store.load() };
    ASSERT_TRUE(saved);
    EXPECT_EQ(saved->get(P::throughput), 250);
    EXPECT_EQ(saved->get(P::pressure), 924);
    EXPECT_EQ(saved->get(P::temperature), 59);
    EXPECT_EQ(saved->get(P::mode), 1);
    EXPECT_EQ(saved->size(), model::default_snapshot(cfg.map).size());
}

TEST(FieldRuntimeTest, SteadyPlantLeavesTheSnapshotAlone)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    cfg.map = model::BasicLoop{};

    // pump off and every measurement at its floor: one step maps the plant onto itself
    auto steady{ model::default_snapshot(cfg.map) };
    steady.set(B::pump.space, B::pump.address, 0);
    steady.set(B::pump_voltage.space, B::pump_voltage.address, 0);
    steady.set(B::pressure.space, B::pressure.address, 200);
    steady.set(B::temperature.space, B::temperature.address, 10);
    steady.set(B::throughput.space, B::throughput.address, 5);

    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.save(steady));
    const auto written{ std::filesystem::last_write_time(cfg.tmp_file) };
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::atomic<bool> running{ true };
    sim::FieldRuntime field(cfg, running, 1u);
    EXPECT_TRUE(field.tick().empty());
    EXPECT_TRUE(field.tick().empty());

    EXPECT_EQ(std::filesystem::last_write_time(cfg.tmp_file), written);
    EXPECT_EQ(store.load().value(), steady);
}

TEST(FieldRuntimeTest, MissingSnapshotSkipsTheTick)
{
    TempDir dir;
    auto cfg{ config_in(dir) };

    std::atomic<bool> running{ true };
    sim::FieldRuntime field(cfg, running);
    EXPECT_TRUE(field.tick().empty());
    EXPECT_FALSE(std::filesystem::exists(cfg.tmp_file));
}

TEST(FieldRuntimeTest, SeedFileIsUsedForTheFirstSnapshot)
{
    TempDir dir;
    auto cfg{ config_in(dir) };
    dir.write("sensors.json", "# seed\n{ \"input_registers\": { \"1\": 70 } }\n");

    reglink::SnapshotStore store(cfg.tmp_file);
    ASSERT_TRUE(store.seed(cfg.json_file, model::default_snapshot(cfg.map)));
    EXPECT_EQ(store.load()->get(P::temperature), 70);
    EXPECT_FALSE(store.load()->get(P::pump_voltage).has_value());
}
