#pragma once

#include "reglink/bank/RegisterSpace.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace reglink
{
    /**
     * Names one register of a device map, e.g. { HoldingRegisters, 4, "Mode" }.
     */
    struct Slot
    {
        RegisterSpace space;
        uint16_t address;
        std::string_view label;

        auto operator==(const Slot&) const -> bool = default;
    };

    // slots a writer serializes into a snapshot
    using Projection = std::vector<Slot>;
} // namespace reglink
