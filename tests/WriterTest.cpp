#include "PlantFixtures.hpp"
#include "app/AdversarialWriter.hpp"
#include "reglink/coroutine/coroutine.hpp"
#include "reglink/gateway/LocalGateway.hpp"

#include <gtest/gtest.h>

#include <array>

using namespace plantsim;
using reglink::RegisterSpace;
using reglink::coro::syncWait;

TEST(WriterTargetTest, ParsesWritableKinds)
{
    auto coil{ app::parse_target("coil[4]") };
    ASSERT_TRUE(coil);
    EXPECT_EQ(coil->space, RegisterSpace::Coils);
    EXPECT_EQ(coil->address, 4);

    auto hr{ app::parse_target(" Holding_Registers[7] ") };
    ASSERT_TRUE(hr);
    EXPECT_EQ(hr->space, RegisterSpace::HoldingRegisters);
    EXPECT_EQ(hr->address, 7);

    EXPECT_EQ(app::parse_target("coils[0]")->space, RegisterSpace::Coils);
    EXPECT_EQ(app::parse_target("holding[1]")->space, RegisterSpace::HoldingRegisters);
}

TEST(WriterTargetTest, ReadOnlyKindsAreRemappedToWritableSpaces)
{
    for (auto text : { "di[2]", "discrete[2]", "discrete_input[2]", "discrete_inputs[2]" }) {
        auto target{ app::parse_target(text) };
        ASSERT_TRUE(target) << text;
        EXPECT_EQ(target->space, RegisterSpace::Coils) << text;
        EXPECT_EQ(target->address, 2) << text;
    }
    for (auto text : { "ir[3]", "input[3]", "if[3]", "in[3]", "it[3]", "input_register[3]", "input_registers[3]" }) {
        auto target{ app::parse_target(text) };
        ASSERT_TRUE(target) << text;
        EXPECT_EQ(target->space, RegisterSpace::HoldingRegisters) << text;
    }
}

TEST(WriterTargetTest, RejectsMalformedTargets)
{
    for (auto text : { "", "coil", "coil[]", "[3]", "coil[x]", "coil[-1]", "coil[70000]", "valve[1]", "hr[1", "h r[1]" }) {
        auto target{ app::parse_target(text) };
        ASSERT_FALSE(target) << text;
        EXPECT_EQ(target.error(), reglink::Errc::InvalidArgument) << text;
    }
}

TEST(WriterValueTest, CoilValues)
{
    for (auto text : { "1", "true", "ON", "yes", "5", "whatever" }) {
        EXPECT_TRUE(app::parse_coil_value(text)) << text;
    }
    for (auto text : { "0", "false", "Off", "no" }) {
        EXPECT_FALSE(app::parse_coil_value(text)) << text;
    }
}

TEST(WriterValueTest, RegisterValues)
{
    EXPECT_EQ(app::parse_register_value("1234"), 1234);
    EXPECT_EQ(app::parse_register_value("-20"), 65516);
    EXPECT_EQ(app::parse_register_value("-32768"), 0x8000);
    EXPECT_EQ(app::parse_register_value("-40000"), 0);
    EXPECT_EQ(app::parse_register_value("70000"), 65535);
    EXPECT_EQ(app::parse_register_value("1.5"), 100);
    EXPECT_EQ(app::parse_register_value("abc"), 100);
}

TEST(WriterOptionsTest, ParsesEveryOption)
{
    const std::array<std::string_view, 13> args{ "--target", "hr[5]", "-v",     "-20",       "--num",  "3",   "-w",
                                                 "250",      "--toggle", "--random", "-H", "10.0.0.2", "--port" };
    auto missing_port{ app::parse_writer_options(args) };
    EXPECT_FALSE(missing_port);

    const std::array<std::string_view, 14> full{ "--target", "hr[5]",    "-v",       "-20", "--num",    "3",      "-w",
                                                 "250",      "--toggle", "--random", "-H",  "10.0.0.2", "--port", "4841" };
    auto options{ app::parse_writer_options(full) };
    ASSERT_TRUE(options);
    EXPECT_EQ(options->target, "hr[5]");
    EXPECT_EQ(options->value, "-20");
    EXPECT_EQ(options->num, 3u);
    EXPECT_EQ(options->wait, std::chrono::milliseconds(250));
    EXPECT_TRUE(options->toggle);
    EXPECT_TRUE(options->random);
    EXPECT_EQ(options->host, "10.0.0.2");
    EXPECT_EQ(options->port, 4841);
}

TEST(WriterOptionsTest, TargetIsRequired)
{
    const std::array<std::string_view, 2> args{ "--num", "2" };
    EXPECT_FALSE(app::parse_writer_options(args));

    const std::array<std::string_view, 3> unknown{ "--target", "coil[1]", "--bogus" };
    EXPECT_FALSE(app::parse_writer_options(unknown));
}

namespace
{
    app::WriterOptions options_for(std::string target, std::optional<std::string> value, uint32_t num)
    {
        app::WriterOptions options;
        options.target = std::move(target);
        options.value = std::move(value);
        options.num = num;
        return options;
    }
}

TEST(AdversarialWriterTest, DefaultValues)
{
    reglink::LocalGateway gateway;
    app::AdversarialWriter coil(gateway, { RegisterSpace::Coils, 1 }, options_for("coil[1]", std::nullopt, 1), std::chrono::milliseconds(100));
    EXPECT_EQ(coil.value_for(0), 1);

    app::AdversarialWriter hr(gateway, { RegisterSpace::HoldingRegisters, 1 }, options_for("hr[1]", std::nullopt, 1), std::chrono::milliseconds(100));
    EXPECT_EQ(hr.value_for(0), 100);
}

TEST(AdversarialWriterTest, ToggleAlternatesFromTheGivenValue)
{
    reglink::LocalGateway gateway;
    auto options{ options_for("coil[1]", "off", 4) };
    options.toggle = true;
    app::AdversarialWriter writer(gateway, { RegisterSpace::Coils, 1 }, options, std::chrono::milliseconds(100));

    EXPECT_EQ(writer.value_for(0), 0);
    EXPECT_EQ(writer.value_for(1), 1);
    EXPECT_EQ(writer.value_for(2), 0);
    EXPECT_EQ(writer.value_for(3), 1);
}

TEST(AdversarialWriterTest, RandomRegisterValuesStayPositive)
{
    reglink::LocalGateway gateway;
    auto options{ options_for("hr[2]", std::nullopt, 1) };
    options.random = true;
    app::AdversarialWriter writer(gateway, { RegisterSpace::HoldingRegisters, 2 }, options, std::chrono::milliseconds(100), 5u);

    for (uint32_t i = 0; i < 200; ++i) {
        EXPECT_LE(writer.value_for(i), 32767);
    }
}

TEST(AdversarialWriterTest, WritesReachTheDevice)
{
    reglink::LocalGateway gateway(test::default_bank(model::PressurizedLoop{}));
    auto target{ app::parse_target("hr[4]") };
    ASSERT_TRUE(target);

    std::atomic<bool> running{ true };
    app::AdversarialWriter writer(gateway, *target, options_for("hr[4]", "0", 3), std::chrono::milliseconds(100));
    auto report{ syncWait(writer.run(running)) };

    EXPECT_EQ(report.successes, 3u);
    EXPECT_EQ(report.total, 3u);
    EXPECT_EQ(syncWait(gateway.getValue(RegisterSpace::HoldingRegisters, 4)), 0);
}

TEST(AdversarialWriterTest, OutOfRangeWritesAreCountedAsFailures)
{
    reglink::LocalGateway gateway(reglink::BankLayout::uniform(10));
    std::atomic<bool> running{ true };
    app::AdversarialWriter writer(gateway, { RegisterSpace::Coils, 50 }, options_for("coil[50]", "1", 2), std::chrono::milliseconds(100));

    auto report{ syncWait(writer.run(running)) };
    EXPECT_EQ(report.successes, 0u);
    EXPECT_EQ(report.total, 2u);
    EXPECT_EQ(writer.failed_writes(), 2u);
}

TEST(AdversarialWriterTest, StopsWhenNotRunning)
{
    reglink::LocalGateway gateway;
    std::atomic<bool> running{ false };
    app::AdversarialWriter writer(gateway, { RegisterSpace::Coils, 0 }, options_for("coil[0]", std::nullopt, 5), std::chrono::milliseconds(100));

    auto report{ syncWait(writer.run(running)) };
    EXPECT_EQ(report.total, 0u);
}
