#pragma once

#include "reglink/Result.hpp"
#include "reglink/bank/RegisterSpace.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

namespace reglink
{
    inline constexpr uint16_t DEFAULT_SPACE_SIZE{ 100 };

    struct BankLayout
    {
        std::array<uint16_t, 4> sizes{ DEFAULT_SPACE_SIZE, DEFAULT_SPACE_SIZE, DEFAULT_SPACE_SIZE, DEFAULT_SPACE_SIZE };

        static constexpr auto uniform(uint16_t size) -> BankLayout { return { { size, size, size, size } }; }
    };

    /**
     * In-memory image of one device: four fixed-length spaces addressed from zero.
     * Bit spaces store 0/1, register spaces any 16-bit value. The bank checks
     * addresses only; callers clamp values before writing.
     */
    class RegisterBank
    {
      public:
        explicit RegisterBank(BankLayout layout = {});

        auto size(RegisterSpace space) const noexcept -> uint16_t;
        auto contains(RegisterSpace space, uint16_t address) const noexcept -> bool;

        auto readBits(RegisterSpace space, uint16_t start, uint16_t count) const -> Result<std::vector<bool>>;
        auto readRegisters(RegisterSpace space, uint16_t start, uint16_t count) const
          -> Result<std::vector<uint16_t>>;

        auto writeBit(RegisterSpace space, uint16_t address, bool value) -> Result<void>;
        auto writeRegister(RegisterSpace space, uint16_t address, uint16_t value) -> Result<void>;

        // untyped access used by the gateway contract: bits travel as 0/1
        auto getValues(RegisterSpace space, uint16_t start, uint16_t count) const -> Result<std::vector<uint16_t>>;
        auto setValues(RegisterSpace space, uint16_t start, std::span<const uint16_t> values) -> Result<void>;

        auto value(RegisterSpace space, uint16_t address) const -> Result<uint16_t>;
        auto setValue(RegisterSpace space, uint16_t address, uint16_t value) -> Result<void>;

        auto operator==(const RegisterBank&) const -> bool = default;

      private:
        auto checkRange(RegisterSpace space, uint16_t start, size_t count) const -> Result<void>;

        std::array<std::vector<uint16_t>, 4> m_spaces;
    };

    // two's-complement view of a register slot
    constexpr auto toSigned16(uint16_t value) noexcept -> int16_t
    {
        return static_cast<int16_t>(value >= 0x8000 ? static_cast<int32_t>(value) - 0x10000 : value);
    }

    constexpr auto fromSigned16(int32_t value) noexcept -> uint16_t { return static_cast<uint16_t>(value & 0xFFFF); }

    template<std::integral T>
    constexpr auto clampRegister(T value) noexcept -> uint16_t
    {
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                return 0;
            }
        }
        if (static_cast<uint64_t>(value) > std::numeric_limits<uint16_t>::max()) {
            return std::numeric_limits<uint16_t>::max();
        }
        return static_cast<uint16_t>(value);
    }

    // truncates toward zero first, like every real-to-register conversion of the plant model
    inline auto clampRegister(double value) noexcept -> uint16_t
    {
        if (std::isnan(value)) {
            return 0;
        }
        return static_cast<uint16_t>(std::clamp(std::trunc(value), 0.0, 65535.0));
    }
} // namespace reglink
