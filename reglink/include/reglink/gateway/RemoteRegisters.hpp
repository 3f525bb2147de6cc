#pragma once

#include "reglink/gateway/Gateway.hpp"

#include <atomic>
#include <chrono>
#include <vector>

namespace reglink
{
    /**
     * Caller-side wrapper around a gateway: failed reads degrade to unknown
     * readings, failed writes are logged and counted. Nothing here throws or
     * blocks longer than the configured timeout.
     */
    class RemoteRegisters
    {
      public:
        explicit RemoteRegisters(IGateway& gateway, std::chrono::milliseconds timeout = NO_TIMEOUT);

        auto readBits(RegisterSpace space, uint16_t start, uint16_t count) -> coro::Task<std::vector<Reading>>;
        auto readRegisters(RegisterSpace space, uint16_t start, uint16_t count) -> coro::Task<std::vector<Reading>>;
        auto read(RegisterSpace space, uint16_t address) -> coro::Task<Reading>;

        auto writeBit(uint16_t address, bool value) -> coro::Task<Result<void>>;
        auto writeRegister(uint16_t address, uint16_t value) -> coro::Task<Result<void>>;
        auto write(RegisterSpace space, uint16_t address, uint16_t value) -> coro::Task<Result<void>>;

        inline auto failedWrites() const -> uint64_t { return m_failedWrites; }
        inline auto gateway() -> IGateway& { return m_gateway; }

      private:
        auto readValues(RegisterSpace space, uint16_t start, uint16_t count) -> coro::Task<std::vector<Reading>>;

        IGateway& m_gateway;
        std::chrono::milliseconds m_timeout;
        std::atomic<uint64_t> m_failedWrites{ 0 };
    };
} // namespace reglink
