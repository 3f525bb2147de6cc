#pragma once

#include "reglink/Result.hpp"
#include "reglink/bank/RegisterSpace.hpp"
#include "reglink/coroutine/Task.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace reglink
{
    static constexpr std::chrono::milliseconds NO_TIMEOUT{ std::chrono::milliseconds(0) };

    /**
     * Remote view of one device bank. Bit spaces travel as 0/1 values.
     */
    class IGateway
    {
      public:
        virtual ~IGateway() = default;

        // clang-format off
        virtual auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;
        virtual auto disconnect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;

        virtual auto getValues(RegisterSpace space,
                               uint16_t address,
                               uint16_t count,
                               std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<std::vector<uint16_t>>> = 0;

        virtual auto setValues(RegisterSpace space,
                               uint16_t address,
                               std::vector<uint16_t> values,
                               std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;
        // clang-format on

        auto getValue(RegisterSpace space, uint16_t address, std::chrono::milliseconds timeout = NO_TIMEOUT)
          -> coro::Task<Result<uint16_t>>
        {
            auto values{ co_await getValues(space, address, 1, timeout) };
            if (!values) {
                co_return std::unexpected(values.error());
            }
            if (values->empty()) {
                co_return fail(Errc::OutOfRange);
            }
            co_return values->front();
        }

        auto setValue(RegisterSpace space,
                      uint16_t address,
                      uint16_t value,
                      std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>>
        {
            co_return co_await setValues(space, address, { value }, timeout);
        }

        auto writeBit(uint16_t address, bool value, std::chrono::milliseconds timeout = NO_TIMEOUT)
          -> coro::Task<Result<void>>
        {
            co_return co_await setValues(RegisterSpace::Coils, address, { value ? uint16_t{ 1 } : uint16_t{ 0 } }, timeout);
        }
    };
} // namespace reglink
