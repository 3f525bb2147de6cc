#pragma once

#include "reglink/bank/RegisterBank.hpp"
#include "reglink/bank/Slot.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace reglink
{
    struct Change
    {
        RegisterSpace space;
        uint16_t address;
        std::string_view label;
        uint16_t oldValue;
        uint16_t newValue;
    };

    using ChangeSet = std::vector<Change>;

    /**
     * Write-through view of a bank for one cycle. A write only reaches the bank
     * when the value differs from the stored one, and every such write is
     * recorded. The first failed access is kept and reported by finish(); later
     * accesses still run so a cycle never stops half way.
     */
    class ChangeTracker
    {
      public:
        explicit ChangeTracker(RegisterBank& bank);

        auto get(const Slot& slot) -> uint16_t;
        auto getBit(const Slot& slot) -> bool { return get(slot) != 0; }

        auto set(const Slot& slot, uint16_t value) -> void;
        auto setBit(const Slot& slot, bool value) -> void { set(slot, value ? 1 : 0); }

        inline auto changes() const -> const ChangeSet& { return m_changes; }
        inline auto bank() -> RegisterBank& { return m_bank; }

        auto finish() -> Result<ChangeSet>;

      private:
        RegisterBank& m_bank;
        ChangeSet m_changes;
        std::error_code m_error;
    };
} // namespace reglink
