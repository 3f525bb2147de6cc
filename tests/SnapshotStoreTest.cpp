#include "TestUtil.hpp"
#include "reglink/snapshot/JsonText.hpp"
#include "reglink/snapshot/SnapshotStore.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <thread>

using namespace reglink;
using plantsim::test::TempDir;

namespace
{
    const Projection PROJECTION{
        { RegisterSpace::Coils, 0, "Pump" },
        { RegisterSpace::Coils, 4, "Emergency Stop" },
        { RegisterSpace::DiscreteInputs, 1, "Safety OK" },
        { RegisterSpace::InputRegisters, 1, "Temperature" },
        { RegisterSpace::InputRegisters, 2, "Pressure" },
        { RegisterSpace::HoldingRegisters, 5, "Pump Delta" },
    };

    RegisterBank sample_bank()
    {
        RegisterBank bank;
        EXPECT_TRUE(bank.writeBit(RegisterSpace::Coils, 0, true));
        EXPECT_TRUE(bank.writeBit(RegisterSpace::DiscreteInputs, 1, true));
        EXPECT_TRUE(bank.writeRegister(RegisterSpace::InputRegisters, 1, 61));
        EXPECT_TRUE(bank.writeRegister(RegisterSpace::InputRegisters, 2, 1350));
        EXPECT_TRUE(bank.writeRegister(RegisterSpace::HoldingRegisters, 5, fromSigned16(-40)));
        return bank;
    }
}

TEST(JsonTextTest, StripsFullLineAndTrailingComments)
{
    auto text{ stripComments("# header\n{ \"a\": 1, # trailing\n  # indented\n\"b\": 2 }\n") };
    auto root{ parseJson(text) };
    ASSERT_TRUE(root);
    EXPECT_EQ((*root)["a"].asInt(), 1);
    EXPECT_EQ((*root)["b"].asInt(), 2);
    EXPECT_EQ(text.find('#'), std::string::npos);
}

TEST(JsonTextTest, MalformedTextIsParseError)
{
    auto root{ parseJson("{ \"coils\": { \"0\": 1 ") };
    ASSERT_FALSE(root);
    EXPECT_EQ(root.error(), Errc::ParseError);
}

TEST(SnapshotStoreTest, SaveThenLoadReproducesProjection)
{
    TempDir dir;
    SnapshotStore store(dir.file("sensors.tmp"));
    auto bank{ sample_bank() };

    ASSERT_TRUE(store.save(bank, PROJECTION));
    auto loaded{ store.load() };
    ASSERT_TRUE(loaded);

    EXPECT_EQ(loaded->size(), PROJECTION.size());
    for (const auto& slot : PROJECTION) {
        EXPECT_EQ(loaded->get(slot), bank.value(slot.space, slot.address).value()) << slot.label;
    }
    EXPECT_EQ(toSigned16(*loaded->get(RegisterSpace::HoldingRegisters, 5)), -40);
}

TEST(SnapshotStoreTest, LoadAcceptsCommentsBooleansAndMissingSpaces)
{
    TempDir dir;
    auto path{ dir.write("sensors.json",
                         "# seed\n"
                         "{\n"
                         "  \"coils\": { \"0\": true, \"2\": false },  # pump and fan\n"
                         "  \"input_registers\": { \"1\": 55, \"2\": 70000, \"3\": -4, \"x\": 9 }\n"
                         "}\n") };

    auto loaded{ SnapshotStore(path).load() };
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->get(RegisterSpace::Coils, 0), 1);
    EXPECT_EQ(loaded->get(RegisterSpace::Coils, 2), 0);
    EXPECT_EQ(loaded->get(RegisterSpace::InputRegisters, 1), 55);
    EXPECT_EQ(loaded->get(RegisterSpace::InputRegisters, 2), 65535);
    EXPECT_EQ(loaded->get(RegisterSpace::InputRegisters, 3), 0);
    EXPECT_TRUE(loaded->values(RegisterSpace::HoldingRegisters).empty());
    EXPECT_EQ(loaded->size(), 5u);
}

TEST(SnapshotStoreTest, MissingFileIsNotFound)
{
    TempDir dir;
    SnapshotStore store(dir.file("absent.tmp"));
    EXPECT_FALSE(store.exists());

    auto loaded{ store.load() };
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error(), Errc::NotFound);
}

TEST(SnapshotStoreTest, CorruptFileIsParseError)
{
    TempDir dir;
    auto path{ dir.write("broken.tmp", "{ \"coils\": ") };
    auto loaded{ SnapshotStore(path).load() };
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error(), Errc::ParseError);
}

TEST(SnapshotStoreTest, SaveLeavesNoTemporaryFiles)
{
    TempDir dir;
    SnapshotStore store(dir.file("sensors.tmp"));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.save(sample_bank(), PROJECTION));
    }

    auto entries{ 0 };
    for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::path(store.path()).parent_path())) {
        ++entries;
        EXPECT_EQ(entry.path().filename().string(), "sensors.tmp");
    }
    EXPECT_EQ(entries, 1);
}

TEST(SnapshotStoreTest, SaveIntoMissingDirectoryIsIOError)
{
    TempDir dir;
    SnapshotStore store(dir.file("absent/sensors.tmp"));

    auto saved{ store.save(sample_bank(), PROJECTION) };
    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error(), Errc::IOError);
    EXPECT_FALSE(std::filesystem::exists(store.path()));
}

TEST(SnapshotStoreTest, SavedFileHoldsTheWholeEncoding)
{
    TempDir dir;
    SnapshotStore store(dir.file("sensors.tmp"));
    auto snapshot{ Snapshot::capture(sample_bank(), PROJECTION) };
    ASSERT_TRUE(snapshot);
    ASSERT_TRUE(store.save(*snapshot));

    EXPECT_EQ(std::filesystem::file_size(store.path()), encodeSnapshot(*snapshot).size());
}

TEST(SnapshotStoreTest, EncodingIsStable)
{
    auto bank{ sample_bank() };
    auto first{ Snapshot::capture(bank, PROJECTION) };
    ASSERT_TRUE(first);

    auto decoded{ decodeSnapshot(encodeSnapshot(*first)) };
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, *first);
    EXPECT_EQ(encodeSnapshot(*decoded), encodeSnapshot(*first));
}

TEST(SnapshotStoreTest, SeedPrefersExistingFileThenSeedThenDefaults)
{
    TempDir dir;
    Snapshot defaults;
    defaults.set(RegisterSpace::InputRegisters, 1, 55);

    SnapshotStore from_defaults(dir.file("a.tmp"));
    ASSERT_TRUE(from_defaults.seed(dir.file("no-seed.json"), defaults));
    EXPECT_EQ(from_defaults.load().value(), defaults);

    auto seed{ dir.write("seed.json", "{ \"input_registers\": { \"1\": 80 } }") };
    SnapshotStore from_seed(dir.file("b.tmp"));
    ASSERT_TRUE(from_seed.seed(seed, defaults));
    EXPECT_EQ(from_seed.load()->get(RegisterSpace::InputRegisters, 1), 80);

    // an existing snapshot is never overwritten
    ASSERT_TRUE(from_defaults.seed(seed, Snapshot{}));
    EXPECT_EQ(from_defaults.load()->get(RegisterSpace::InputRegisters, 1), 55);
}

TEST(SnapshotStoreTest, ApplySkipsSlotsOutsideTheBank)
{
    Snapshot snapshot;
    snapshot.set(RegisterSpace::HoldingRegisters, 2, 7);
    snapshot.set(RegisterSpace::HoldingRegisters, 500, 9);
    snapshot.set(RegisterSpace::Coils, 1, 1);

    RegisterBank bank(BankLayout::uniform(10));
    EXPECT_EQ(snapshot.apply(bank), 2u);
    EXPECT_EQ(bank.value(RegisterSpace::HoldingRegisters, 2), 7);

    const std::array only_registers{ RegisterSpace::HoldingRegisters };
    RegisterBank other(BankLayout::uniform(10));
    EXPECT_EQ(snapshot.apply(other, only_registers), 1u);
    EXPECT_EQ(other.value(RegisterSpace::Coils, 1), 0);
}

TEST(SnapshotStoreTest, ConcurrentSaveAndLoadNeverSeeATornFile)
{
    TempDir dir;
    const auto path{ dir.file("sensors.tmp") };
    SnapshotStore writer(path);
    ASSERT_TRUE(writer.save(sample_bank(), PROJECTION));

    std::atomic<bool> done{ false };
    std::atomic<int> failures{ 0 };
    std::atomic<int> loads{ 0 };

    std::vector<std::jthread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&] {
            SnapshotStore reader(path);
            while (!done) {
                auto loaded{ reader.load() };
                if (!loaded || loaded->size() != PROJECTION.size()) {
                    ++failures;
                }
                ++loads;
            }
        });
    }

    std::jthread second_writer([&] {
        SnapshotStore other(path);
        auto bank{ sample_bank() };
        for (uint16_t i = 0; i < 200; ++i) {
            EXPECT_TRUE(bank.writeRegister(RegisterSpace::InputRegisters, 2, static_cast<uint16_t>(600 + i)));
            EXPECT_TRUE(other.save(bank, PROJECTION));
        }
    });

    auto bank{ sample_bank() };
    for (uint16_t i = 0; i < 200; ++i) {
        EXPECT_TRUE(bank.writeRegister(RegisterSpace::InputRegisters, 1, static_cast<uint16_t>(i)));
        EXPECT_TRUE(writer.save(bank, PROJECTION));
    }
    second_writer.join();
    done = true;
    readers.clear();

    EXPECT_GT(loads.load(), 0);
    EXPECT_EQ(failures.load(), 0);
}
