#pragma once

#include "../model/RegisterMap.hpp"
#include "../sim/Pacing.hpp"
#include "StatusView.hpp"
#include "reglink/gateway/RemoteRegisters.hpp"
#include "reglink/log/Logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <format>
#include <print>
#include <string>
#include <utility>

namespace plantsim::app
{
    inline constexpr int DELTA_STEP{ 20 };

    /**
     * Line input from a descriptor with a timeout. Reads the descriptor
     * directly; complete lines already received are returned before it is
     * polled again.
     */
    class LineReader
    {
    public:
        enum class Status
        {
            Line,
            Timeout,
            Closed
        };

        explicit LineReader(int fd = STDIN_FILENO)
            : m_fd(fd)
        {
        }

        Status next(std::string& line, std::chrono::milliseconds timeout)
        {
            while (true) {
                if (const auto end = m_buffer.find('\n'); end != std::string::npos) {
                    line = m_buffer.substr(0, end);
                    m_buffer.erase(0, end + 1);
                    if (!line.empty() && line.back() == '\r') {
                        line.pop_back();
                    }
                    return Status::Line;
                }
                if (m_closed) {
                    if (m_buffer.empty()) {
                        return Status::Closed;
                    }
                    // unterminated last line
                    line = std::exchange(m_buffer, {});
                    return Status::Line;
                }

                pollfd input{ m_fd, POLLIN, 0 };
                const int ready = ::poll(&input, 1, static_cast<int>(timeout.count()));
                if (ready == 0 || (ready < 0 && errno == EINTR)) {
                    return Status::Timeout;
                }
                if (ready < 0) {
                    m_closed = true;
                    continue;
                }

                char chunk[256];
                const auto count{ ::read(m_fd, chunk, sizeof(chunk)) };
                if (count < 0 && errno == EINTR) {
                    continue;
                }
                if (count <= 0) {
                    m_closed = true;
                    continue;
                }
                m_buffer.append(chunk, static_cast<size_t>(count));
            }
        }

    private:
        int m_fd;
        std::string m_buffer;
        bool m_closed{ false };
    };

    /**
     * Operator HMI. Sees the device only through the gateway: polls the first
     * registers of every space for display and writes mode, pump delta and
     * emergency stop on command.
     */
    class OperatorConsole
    {
    public:
        OperatorConsole(model::RegisterMap map, reglink::IGateway& gateway, std::chrono::milliseconds timeout)
            : m_map(std::move(map))
            , m_remote(gateway, timeout)
        {
        }

        reglink::coro::Task<StatusFrame> poll()
        {
            StatusFrame frame;
            for (auto space : reglink::ALL_SPACES) {
                if (reglink::isBitSpace(space)) {
                    frame.values[reglink::index(space)] = co_await m_remote.readBits(space, 0, VIEW_SPAN);
                }
                else {
                    frame.values[reglink::index(space)] = co_await m_remote.readRegisters(space, 0, VIEW_SPAN);
                }
            }
            co_return frame;
        }

        /**
         * Applies one command line and returns the feedback to show, empty when
         * there is nothing to report. `mode` is the last mode read from the device.
         */
        reglink::coro::Task<std::string> handle_command(std::string command, reglink::Reading mode)
        {
            std::erase_if(command, [](unsigned char c) { return std::isspace(c); });
            std::ranges::transform(command, command.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (command.empty()) {
                co_return std::string{};
            }
            if (command == "+") {
                m_pending_delta += DELTA_STEP;
                co_return std::string{};
            }
            if (command == "-") {
                m_pending_delta -= DELTA_STEP;
                co_return std::string{};
            }
            if (command == "m") {
                co_return co_await toggle_mode(mode);
            }
            if (command == "s") {
                co_return co_await send_delta();
            }
            if (command == "e") {
                co_return co_await toggle_emergency_stop();
            }
            co_return std::string{ "Unknown or unsupported command." };
        }

        reglink::coro::Task<void> run(const std::atomic<bool>& running, std::chrono::milliseconds poll_interval, std::string endpoint)
        {
            std::println("Connecting to {} ...", endpoint);
            while (running) {
                if (co_await m_remote.gateway().connect()) {
                    break;
                }
                std::println("Waiting...");
                sim::pause_while_running(std::chrono::seconds(1), running);
            }
            reglink::log::info("HMI connected to {}", endpoint);

            while (running) {
                auto frame{ co_await poll() };
                const auto mode_at{ model::mode_slot(m_map) };
                const auto mode{ frame.at(mode_at.space, mode_at.address) };

                std::print("{}", render_status(m_map, frame, std::format("HMI STATUS - {}", endpoint), m_pending_delta));
                std::print("Commands: [m = toggle mode] [+/- = adjust pump delta] [s = send delta] "
                           "[e = toggle emergency stop] [ENTER = refresh]\nCommand > ");
                std::fflush(stdout);

                std::string line;
                const auto status{ m_input.next(line, poll_interval) };
                if (status == LineReader::Status::Timeout) {
                    continue;
                }
                if (status == LineReader::Status::Closed) {
                    break;
                }
                if (auto feedback = co_await handle_command(line, mode); !feedback.empty()) {
                    std::println("\n{}", feedback);
                    sim::pause_while_running(std::chrono::milliseconds(800), running);
                }
            }
            if (auto res = co_await m_remote.gateway().disconnect(); !res) {
                reglink::log::warning("HMI: disconnect failed: {}", res.error().message());
            }
        }

        int pending_delta() const { return m_pending_delta; }
        uint64_t failed_writes() const { return m_remote.failedWrites(); }

    private:
        reglink::coro::Task<std::string> toggle_mode(reglink::Reading mode)
        {
            if (!mode) {
                co_return std::string{ "Mode unknown, not toggled." };
            }
            const uint16_t next = *mode == static_cast<uint16_t>(model::Mode::Auto) ? static_cast<uint16_t>(model::Mode::Manual)
                                                                                    : static_cast<uint16_t>(model::Mode::Auto);
            const auto slot{ model::mode_slot(m_map) };
            if (auto res = co_await m_remote.writeRegister(slot.address, next); !res) {
                co_return std::format("Mode write failed: {}", res.error().message());
            }
            reglink::log::info("HMI: mode set to {}", next);
            co_return std::string{};
        }

        reglink::coro::Task<std::string> send_delta()
        {
            const auto slot{ model::pump_delta_slot(m_map) };
            if (!slot) {
                co_return std::string{ "This register map has no pump delta." };
            }

            const int delta{ m_pending_delta };
            if (auto res = co_await m_remote.writeRegister(slot->address, reglink::fromSigned16(delta)); !res) {
                co_return std::format("Sending delta failed: {}", res.error().message());
            }
            m_pending_delta = 0;
            reglink::log::info("HMI: sent delta {} to hr[{}]", delta, slot->address);
            co_return std::format("Sent delta {} to hr[{}].", delta, slot->address);
        }

        reglink::coro::Task<std::string> toggle_emergency_stop()
        {
            const auto slot{ model::emergency_stop_slot(m_map) };
            auto current{ co_await m_remote.read(slot.space, slot.address) };
            if (!current) {
                co_return std::string{ "Emergency stop state unknown, not toggled." };
            }
            const bool engage{ *current == 0 };
            if (auto res = co_await m_remote.writeBit(slot.address, engage); !res) {
                co_return std::format("Emergency stop write failed: {}", res.error().message());
            }
            reglink::log::warning("HMI: emergency stop {}", engage ? "engaged" : "released");
            co_return std::format("Emergency stop {}.", engage ? "engaged" : "released");
        }

        model::RegisterMap m_map;
        reglink::RemoteRegisters m_remote;
        LineReader m_input;
        int m_pending_delta{ 0 };
    };
}
