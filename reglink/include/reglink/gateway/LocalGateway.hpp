#pragma once

#include "reglink/bank/RegisterBank.hpp"
#include "reglink/gateway/Gateway.hpp"

#include <functional>
#include <mutex>
#include <span>

namespace reglink
{
    /**
     * In-process gateway owning the live bank of a device. The server thread
     * and the control cycle share it through one mutex.
     */
    class LocalGateway : public IGateway
    {
      public:
        explicit LocalGateway(BankLayout layout = {});
        explicit LocalGateway(RegisterBank bank);

        // clang-format off
        auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        auto disconnect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;

        auto getValues(RegisterSpace space,
                       uint16_t address,
                       uint16_t count,
                       std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<std::vector<uint16_t>>> override;
        auto setValues(RegisterSpace space,
                       uint16_t address,
                       std::vector<uint16_t> values,
                       std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        // clang-format on

        auto getValuesSync(RegisterSpace space, uint16_t address, uint16_t count) const
          -> Result<std::vector<uint16_t>>;

        // remote write path: discrete inputs and input registers are rejected
        auto setValuesSync(RegisterSpace space, uint16_t address, std::span<const uint16_t> values) -> Result<void>;

        template<typename Fn>
        auto withBank(Fn&& fn) -> decltype(auto)
        {
            std::lock_guard lock(m_mutex);
            return std::invoke(std::forward<Fn>(fn), m_bank);
        }

        template<typename Fn>
        auto withBank(Fn&& fn) const -> decltype(auto)
        {
            std::lock_guard lock(m_mutex);
            return std::invoke(std::forward<Fn>(fn), std::as_const(m_bank));
        }

        auto layout() const -> BankLayout;

      private:
        mutable std::mutex m_mutex;
        RegisterBank m_bank;
    };
} // namespace reglink
