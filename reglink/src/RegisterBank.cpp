#include "reglink/bank/RegisterBank.hpp"

namespace reglink
{
    RegisterBank::RegisterBank(BankLayout layout)
    {
        for (auto space : ALL_SPACES) {
            m_spaces[index(space)].assign(layout.sizes[index(space)], 0);
        }
    }

    auto RegisterBank::size(RegisterSpace space) const noexcept -> uint16_t
    {
        return static_cast<uint16_t>(m_spaces[index(space)].size());
    }

    auto RegisterBank::contains(RegisterSpace space, uint16_t address) const noexcept -> bool
    {
        return address < m_spaces[index(space)].size();
    }

    auto RegisterBank::checkRange(RegisterSpace space, uint16_t start, size_t count) const -> Result<void>
    {
        if (static_cast<size_t>(start) + count > m_spaces[index(space)].size()) {
            return fail(Errc::OutOfRange);
        }
        return success();
    }

    auto RegisterBank::readBits(RegisterSpace space, uint16_t start, uint16_t count) const
      -> Result<std::vector<bool>>
    {
        if (!isBitSpace(space)) {
            return fail(Errc::WrongSpaceType);
        }
        if (auto res = checkRange(space, start, count); !res) {
            return std::unexpected(res.error());
        }

        const auto& data{ m_spaces[index(space)] };
        std::vector<bool> out;
        out.reserve(count);
        for (auto i{ 0uz }; i < count; ++i) {
            out.push_back(data[start + i] != 0);
        }
        return out;
    }

    auto RegisterBank::readRegisters(RegisterSpace space, uint16_t start, uint16_t count) const
      -> Result<std::vector<uint16_t>>
    {
        if (isBitSpace(space)) {
            return fail(Errc::WrongSpaceType);
        }
        return getValues(space, start, count);
    }

    auto RegisterBank::writeBit(RegisterSpace space, uint16_t address, bool value) -> Result<void>
    {
        if (!isBitSpace(space)) {
            return fail(Errc::WrongSpaceType);
        }
        return setValue(space, address, value ? 1 : 0);
    }

    auto RegisterBank::writeRegister(RegisterSpace space, uint16_t address, uint16_t value) -> Result<void>
    {
        if (isBitSpace(space)) {
            return fail(Errc::WrongSpaceType);
        }
        return setValue(space, address, value);
    }

    auto RegisterBank::getValues(RegisterSpace space, uint16_t start, uint16_t count) const
      -> Result<std::vector<uint16_t>>
    {
        if (auto res = checkRange(space, start, count); !res) {
            return std::unexpected(res.error());
        }

        const auto& data{ m_spaces[index(space)] };
        return std::vector<uint16_t>(data.begin() + start, data.begin() + start + count);
    }

    auto RegisterBank::setValues(RegisterSpace space, uint16_t start, std::span<const uint16_t> values)
      -> Result<void>
    {
        // all or nothing: a partially applied multi-write would be observable remotely
        if (auto res = checkRange(space, start, values.size()); !res) {
            return res;
        }

        auto& data{ m_spaces[index(space)] };
        for (auto i{ 0uz }; i < values.size(); ++i) {
            data[start + i] = isBitSpace(space) ? (values[i] != 0 ? 1 : 0) : values[i];
        }
        return success();
    }

    auto RegisterBank::value(RegisterSpace space, uint16_t address) const -> Result<uint16_t>
    {
        if (!contains(space, address)) {
            return fail(Errc::OutOfRange);
        }
        return m_spaces[index(space)][address];
    }

    auto RegisterBank::setValue(RegisterSpace space, uint16_t address, uint16_t value) -> Result<void>
    {
        return setValues(space, address, std::span<const uint16_t>(&value, 1));
    }
} // namespace reglink
