#pragma once

#include "model/RegisterMap.hpp"
#include "reglink/bank/RegisterBank.hpp"

#include <gtest/gtest.h>

namespace plantsim::test
{
    // bank holding the default values of a map
    inline reglink::RegisterBank default_bank(const model::RegisterMap& map)
    {
        reglink::RegisterBank bank;
        model::default_snapshot(map).apply(bank);
        return bank;
    }

    inline void put(reglink::RegisterBank& bank, const reglink::Slot& slot, uint16_t value)
    {
        ASSERT_TRUE(bank.setValue(slot.space, slot.address, value)) << slot.label;
    }

    inline uint16_t get(const reglink::RegisterBank& bank, const reglink::Slot& slot)
    {
        return bank.value(slot.space, slot.address).value();
    }
}
