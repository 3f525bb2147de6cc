#include "reglink/gateway/LocalGateway.hpp"

namespace reglink
{
    LocalGateway::LocalGateway(BankLayout layout)
      : m_bank(layout)
    {
    }

    LocalGateway::LocalGateway(RegisterBank bank)
      : m_bank(std::move(bank))
    {
    }

    auto LocalGateway::connect(std::chrono::milliseconds) -> coro::Task<Result<void>>
    {
        co_return success();
    }

    auto LocalGateway::disconnect(std::chrono::milliseconds) -> coro::Task<Result<void>>
    {
        co_return success();
    }

    auto LocalGateway::getValues(RegisterSpace space,
                                 uint16_t address,
                                 uint16_t count,
                                 std::chrono::milliseconds) -> coro::Task<Result<std::vector<uint16_t>>>
    {
        co_return getValuesSync(space, address, count);
    }

    auto LocalGateway::setValues(RegisterSpace space,
                                 uint16_t address,
                                 std::vector<uint16_t> values,
                                 std::chrono::milliseconds) -> coro::Task<Result<void>>
    {
        co_return setValuesSync(space, address, values);
    }

    auto LocalGateway::getValuesSync(RegisterSpace space, uint16_t address, uint16_t count) const
      -> Result<std::vector<uint16_t>>
    {
        std::lock_guard lock(m_mutex);
        return m_bank.getValues(space, address, count);
    }

    auto LocalGateway::setValuesSync(RegisterSpace space, uint16_t address, std::span<const uint16_t> values)
      -> Result<void>
    {
        if (!isRemotelyWritable(space)) {
            return fail(Errc::NotWritable);
        }

        std::lock_guard lock(m_mutex);
        return m_bank.setValues(space, address, values);
    }

    auto LocalGateway::layout() const -> BankLayout
    {
        std::lock_guard lock(m_mutex);
        BankLayout layout;
        for (auto space : ALL_SPACES) {
            layout.sizes[index(space)] = m_bank.size(space);
        }
        return layout;
    }
} // namespace reglink
