#pragma once

#include "reglink/Result.hpp"
#include "reglink/bank/RegisterBank.hpp"
#include "reglink/bank/Slot.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>

namespace reglink
{
    /**
     * Projection of some bank slots as it travels through the shared file.
     * Addresses need not fit any particular bank; apply() skips the ones
     * that do not.
     */
    class Snapshot
    {
      public:
        using Values = std::map<uint16_t, uint16_t>;

        static auto capture(const RegisterBank& bank, const Projection& projection) -> Result<Snapshot>;

        auto get(RegisterSpace space, uint16_t address) const -> std::optional<uint16_t>;
        auto get(const Slot& slot) const -> std::optional<uint16_t> { return get(slot.space, slot.address); }
        auto set(RegisterSpace space, uint16_t address, uint16_t value) -> void;

        inline auto values(RegisterSpace space) const -> const Values& { return m_values[index(space)]; }
        auto empty() const -> bool;
        auto size() const -> size_t;

        // every entry of `other` overrides the one of this snapshot
        auto merge(const Snapshot& other) -> void;

        // returns the number of slots written into the bank
        auto apply(RegisterBank& bank, std::span<const RegisterSpace> spaces = ALL_SPACES) const -> size_t;
        auto apply(RegisterBank& bank, const Projection& slots) const -> size_t;

        auto operator==(const Snapshot&) const -> bool = default;

      private:
        std::array<Values, 4> m_values{};
    };
} // namespace reglink
