#include "reglink/gateway/RemoteRegisters.hpp"
#include "reglink/log/Logger.hpp"

namespace reglink
{
    RemoteRegisters::RemoteRegisters(IGateway& gateway, std::chrono::milliseconds timeout)
      : m_gateway(gateway)
      , m_timeout(timeout)
    {
    }

    auto RemoteRegisters::readValues(RegisterSpace space, uint16_t start, uint16_t count)
      -> coro::Task<std::vector<Reading>>
    {
        std::vector<Reading> readings(count);

        auto values{ co_await m_gateway.getValues(space, start, count, m_timeout) };
        if (!values) {
            log::debug("read {}[{}..+{}] failed: {}", shortName(space), start, count, values.error().message());
            co_return readings;
        }

        for (auto i{ 0uz }; i < readings.size() && i < values->size(); ++i) {
            readings[i] = (*values)[i];
        }
        co_return readings;
    }

    auto RemoteRegisters::readBits(RegisterSpace space, uint16_t start, uint16_t count)
      -> coro::Task<std::vector<Reading>>
    {
        if (!isBitSpace(space)) {
            co_return std::vector<Reading>(count);
        }
        co_return co_await readValues(space, start, count);
    }

    auto RemoteRegisters::readRegisters(RegisterSpace space, uint16_t start, uint16_t count)
      -> coro::Task<std::vector<Reading>>
    {
        if (isBitSpace(space)) {
            co_return std::vector<Reading>(count);
        }
        co_return co_await readValues(space, start, count);
    }

    auto RemoteRegisters::read(RegisterSpace space, uint16_t address) -> coro::Task<Reading>
    {
        auto readings{ co_await readValues(space, address, 1) };
        co_return readings.front();
    }

    auto RemoteRegisters::writeBit(uint16_t address, bool value) -> coro::Task<Result<void>>
    {
        co_return co_await write(RegisterSpace::Coils, address, value ? 1 : 0);
    }

    auto RemoteRegisters::writeRegister(uint16_t address, uint16_t value) -> coro::Task<Result<void>>
    {
        co_return co_await write(RegisterSpace::HoldingRegisters, address, value);
    }

    auto RemoteRegisters::write(RegisterSpace space, uint16_t address, uint16_t value) -> coro::Task<Result<void>>
    {
        auto result{ co_await m_gateway.setValues(space, address, { value }, m_timeout) };
        if (!result) {
            ++m_failedWrites;
            log::warning("write {}[{}] = {} failed: {}", shortName(space), address, value, result.error().message());
        }
        co_return result;
    }
} // namespace reglink
