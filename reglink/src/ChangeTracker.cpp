#include "reglink/bank/ChangeTracker.hpp"

namespace reglink
{
    ChangeTracker::ChangeTracker(RegisterBank& bank)
      : m_bank(bank)
    {
    }

    auto ChangeTracker::get(const Slot& slot) -> uint16_t
    {
        auto value{ m_bank.value(slot.space, slot.address) };
        if (!value) {
            if (!m_error) {
                m_error = value.error();
            }
            return 0;
        }
        return *value;
    }

    auto ChangeTracker::set(const Slot& slot, uint16_t value) -> void
    {
        if (isBitSpace(slot.space)) {
            value = value != 0 ? 1 : 0;
        }

        auto old{ m_bank.value(slot.space, slot.address) };
        if (!old) {
            if (!m_error) {
                m_error = old.error();
            }
            return;
        }
        if (*old == value) {
            return;
        }

        if (auto res = m_bank.setValue(slot.space, slot.address, value); !res) {
            if (!m_error) {
                m_error = res.error();
            }
            return;
        }
        m_changes.push_back({ slot.space, slot.address, slot.label, *old, value });
    }

    auto ChangeTracker::finish() -> Result<ChangeSet>
    {
        if (m_error) {
            return std::unexpected(m_error);
        }
        return std::move(m_changes);
    }
} // namespace reglink
