#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace reglink
{
    enum class RegisterSpace : uint8_t
    {
        Coils,
        DiscreteInputs,
        InputRegisters,
        HoldingRegisters
    };

    inline constexpr std::array ALL_SPACES{ RegisterSpace::Coils,
                                            RegisterSpace::DiscreteInputs,
                                            RegisterSpace::InputRegisters,
                                            RegisterSpace::HoldingRegisters };

    /**
     * Value of a remote read: empty when the target could not be resolved
     * (connection down, timeout, rejected request).
     */
    using Reading = std::optional<uint16_t>;

    constexpr auto index(RegisterSpace space) -> size_t { return static_cast<size_t>(space); }

    constexpr auto isBitSpace(RegisterSpace space) -> bool
    {
        return space == RegisterSpace::Coils || space == RegisterSpace::DiscreteInputs;
    }

    // discrete inputs and input registers are sensor-side: only the device itself writes them
    constexpr auto isRemotelyWritable(RegisterSpace space) -> bool
    {
        return space == RegisterSpace::Coils || space == RegisterSpace::HoldingRegisters;
    }

    // key of the space inside a snapshot file
    constexpr auto snapshotKey(RegisterSpace space) -> std::string_view
    {
        switch (space) {
            case RegisterSpace::Coils:
                return "coils";
            case RegisterSpace::DiscreteInputs:
                return "discrete_inputs";
            case RegisterSpace::InputRegisters:
                return "input_registers";
            case RegisterSpace::HoldingRegisters:
                return "holding_registers";
        }
        return {};
    }

    // short tag used for gateway node ids and writer targets, e.g. "hr" in "hr[5]"
    constexpr auto shortName(RegisterSpace space) -> std::string_view
    {
        switch (space) {
            case RegisterSpace::Coils:
                return "coil";
            case RegisterSpace::DiscreteInputs:
                return "di";
            case RegisterSpace::InputRegisters:
                return "ir";
            case RegisterSpace::HoldingRegisters:
                return "hr";
        }
        return {};
    }
} // namespace reglink
