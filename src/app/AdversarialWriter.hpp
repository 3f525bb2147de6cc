#pragma once

#include "../sim/Pacing.hpp"
#include "reglink/Result.hpp"
#include "reglink/bank/RegisterBank.hpp"
#include "reglink/gateway/RemoteRegisters.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <random>
#include <span>
#include <string>
#include <string_view>

namespace plantsim::app
{
    struct WriterTarget
    {
        reglink::RegisterSpace space;
        uint16_t address;
    };

    /**
     * "coil[1]", "hr[5]", "di[2]", "ir[3]". Read-only spaces are remapped to
     * the writable space of the same kind: di -> coil, ir -> hr.
     */
    inline reglink::Result<WriterTarget> parse_target(std::string_view text)
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }

        auto open{ text.find('[') };
        if (open == std::string_view::npos || open == 0 || !text.ends_with(']')) {
            return reglink::fail(reglink::Errc::InvalidArgument);
        }

        std::string kind(text.substr(0, open));
        if (!std::ranges::all_of(kind, [](unsigned char c) { return std::isalpha(c) || c == '_'; })) {
            return reglink::fail(reglink::Errc::InvalidArgument);
        }
        std::ranges::transform(kind, kind.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto digits{ text.substr(open + 1, text.size() - open - 2) };
        uint16_t address{};
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), address);
        if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
            return reglink::fail(reglink::Errc::InvalidArgument);
        }

        constexpr std::array coil_kinds{ "coil", "coils", "di", "discrete", "discrete_input", "discrete_inputs" };
        constexpr std::array register_kinds{ "hr",    "holding", "holding_register", "holding_registers", "ir", "input",
                                             "if",    "in",      "it",               "input_register",    "input_registers" };

        if (std::ranges::find(coil_kinds, kind) != coil_kinds.end()) {
            return WriterTarget{ reglink::RegisterSpace::Coils, address };
        }
        if (std::ranges::find(register_kinds, kind) != register_kinds.end()) {
            return WriterTarget{ reglink::RegisterSpace::HoldingRegisters, address };
        }
        return reglink::fail(reglink::Errc::InvalidArgument);
    }

    // "1/true/on/yes" and "0/false/off/no"; other numbers by their truth value, anything else sets the coil
    inline bool parse_coil_value(std::string_view text)
    {
        std::string lower(text);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
            return true;
        }
        if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
            return false;
        }
        long long number{};
        auto [ptr, ec] = std::from_chars(lower.data(), lower.data() + lower.size(), number);
        if (ec == std::errc() && ptr == lower.data() + lower.size()) {
            return number != 0;
        }
        return true;
    }

    inline constexpr uint16_t DEFAULT_REGISTER_VALUE{ 100 };

    // negative values down to -32768 are sent in two's complement, others are clamped to 16 bits
    inline uint16_t parse_register_value(std::string_view text)
    {
        long long number{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
        if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
            return DEFAULT_REGISTER_VALUE;
        }
        if (number < 0 && number >= -32768) {
            return reglink::fromSigned16(static_cast<int32_t>(number));
        }
        return reglink::clampRegister(number);
    }

    struct WriterOptions
    {
        std::string target{};
        std::optional<std::string> host{};
        std::optional<uint16_t> port{};
        std::optional<std::string> value{};
        uint32_t num{ 1 };
        std::chrono::milliseconds wait{ 0 };
        bool toggle{ false };
        bool random{ false };
    };

    inline reglink::Result<WriterOptions> parse_writer_options(std::span<const std::string_view> args)
    {
        WriterOptions options;

        auto unsigned_arg = [](std::string_view text, uint64_t max) -> std::optional<uint64_t> {
            uint64_t number{};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
            if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || number > max) {
                return std::nullopt;
            }
            return number;
        };

        for (auto i{ 0uz }; i < args.size(); ++i) {
            const auto arg{ args[i] };
            const bool has_next{ i + 1 < args.size() };

            if (arg == "--toggle") {
                options.toggle = true;
            }
            else if (arg == "--random") {
                options.random = true;
            }
            else if (!has_next) {
                return reglink::fail(reglink::Errc::InvalidArgument);
            }
            else if (arg == "--target" || arg == "-t") {
                options.target = args[++i];
            }
            else if (arg == "--host" || arg == "-H") {
                options.host = std::string(args[++i]);
            }
            else if (arg == "--value" || arg == "-v") {
                options.value = std::string(args[++i]);
            }
            else if (arg == "--port" || arg == "-P") {
                auto port{ unsigned_arg(args[++i], 65535) };
                if (!port) {
                    return reglink::fail(reglink::Errc::InvalidArgument);
                }
                options.port = static_cast<uint16_t>(*port);
            }
            else if (arg == "--num" || arg == "-n") {
                auto num{ unsigned_arg(args[++i], UINT32_MAX) };
                if (!num) {
                    return reglink::fail(reglink::Errc::InvalidArgument);
                }
                options.num = static_cast<uint32_t>(*num);
            }
            else if (arg == "--wait" || arg == "-w") {
                auto wait{ unsigned_arg(args[++i], 86400000) };
                if (!wait) {
                    return reglink::fail(reglink::Errc::InvalidArgument);
                }
                options.wait = std::chrono::milliseconds(*wait);
            }
            else {
                return reglink::fail(reglink::Errc::InvalidArgument);
            }
        }

        if (options.target.empty()) {
            return reglink::fail(reglink::Errc::InvalidArgument);
        }
        return options;
    }

    struct WriterReport
    {
        uint32_t successes;
        uint32_t total;
    };

    /**
     * Sends `num` direct writes to one target, paced by `wait`. Coils can
     * toggle, registers can take random values in [0, 32767].
     */
    class AdversarialWriter
    {
    public:
        AdversarialWriter(reglink::IGateway& gateway,
                          WriterTarget target,
                          WriterOptions options,
                          std::chrono::milliseconds timeout,
                          std::optional<uint32_t> seed = std::nullopt)
            : m_remote(gateway, timeout)
            , m_target(target)
            , m_options(std::move(options))
            , m_rng(seed ? *seed : std::random_device{}())
        {
        }

        // value of the i-th request
        uint16_t value_for(uint32_t i)
        {
            if (m_target.space == reglink::RegisterSpace::Coils) {
                const bool initial{ m_options.value ? parse_coil_value(*m_options.value) : true };
                if (m_options.toggle) {
                    return (i % 2 == 0) == initial ? 1 : 0;
                }
                return initial ? 1 : 0;
            }

            if (m_options.random) {
                std::uniform_int_distribution<uint16_t> dist(0, 32767);
                return dist(m_rng);
            }
            return m_options.value ? parse_register_value(*m_options.value) : DEFAULT_REGISTER_VALUE;
        }

        reglink::coro::Task<WriterReport> run(const std::atomic<bool>& running)
        {
            WriterReport report{ 0, 0 };
            const auto label{ std::format("{}[{}]", reglink::shortName(m_target.space), m_target.address) };

            for (uint32_t i{ 0 }; i < m_options.num && running; ++i) {
                const auto value{ value_for(i) };
                auto res{ co_await m_remote.write(m_target.space, m_target.address, value) };
                ++report.total;

                if (res) {
                    ++report.successes;
                    std::println("#{}/{} WRITE OK -> {} <= {}", i + 1, m_options.num, label, value);
                }
                else {
                    std::println(stderr, "#{}/{} WRITE FAIL -> {} <= {} ({})", i + 1, m_options.num, label, value, res.error().message());
                }

                if (i + 1 != m_options.num && m_options.wait.count() > 0) {
                    sim::pause_while_running(m_options.wait, running);
                }
            }

            std::println("successes: {}/{}", report.successes, report.total);
            co_return report;
        }

        uint64_t failed_writes() const { return m_remote.failedWrites(); }

    private:
        reglink::RemoteRegisters m_remote;
        WriterTarget m_target;
        WriterOptions m_options;
        std::mt19937 m_rng;
    };
}
