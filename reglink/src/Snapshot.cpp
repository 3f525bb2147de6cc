#include "reglink/snapshot/Snapshot.hpp"

#include <algorithm>

namespace reglink
{
    auto Snapshot::capture(const RegisterBank& bank, const Projection& projection) -> Result<Snapshot>
    {
        Snapshot snapshot;
        for (const auto& slot : projection) {
            auto value{ bank.value(slot.space, slot.address) };
            if (!value) {
                return std::unexpected(value.error());
            }
            snapshot.set(slot.space, slot.address, *value);
        }
        return snapshot;
    }

    auto Snapshot::get(RegisterSpace space, uint16_t address) const -> std::optional<uint16_t>
    {
        const auto& values{ m_values[index(space)] };
        if (auto it = values.find(address); it != values.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    auto Snapshot::set(RegisterSpace space, uint16_t address, uint16_t value) -> void
    {
        m_values[index(space)][address] = isBitSpace(space) ? (value != 0 ? 1 : 0) : value;
    }

    auto Snapshot::empty() const -> bool
    {
        return std::ranges::all_of(m_values, [](const auto& v) { return v.empty(); });
    }

    auto Snapshot::size() const -> size_t
    {
        auto total{ 0uz };
        for (const auto& values : m_values) {
            total += values.size();
        }
        return total;
    }

    auto Snapshot::merge(const Snapshot& other) -> void
    {
        for (auto space : ALL_SPACES) {
            for (const auto& [address, value] : other.values(space)) {
                m_values[index(space)][address] = value;
            }
        }
    }

    auto Snapshot::apply(RegisterBank& bank, std::span<const RegisterSpace> spaces) const -> size_t
    {
        auto written{ 0uz };
        for (auto space : spaces) {
            for (const auto& [address, value] : m_values[index(space)]) {
                if (bank.setValue(space, address, value)) {
                    ++written;
                }
            }
        }
        return written;
    }

    auto Snapshot::apply(RegisterBank& bank, const Projection& slots) const -> size_t
    {
        auto written{ 0uz };
        for (const auto& slot : slots) {
            if (auto value = get(slot); value && bank.setValue(slot.space, slot.address, *value)) {
                ++written;
            }
        }
        return written;
    }
} // namespace reglink
