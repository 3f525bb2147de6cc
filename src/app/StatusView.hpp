#pragma once

#include "../model/RegisterMap.hpp"
#include "reglink/bank/RegisterBank.hpp"
#include "reglink/log/format.hpp"

#include <array>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plantsim::app
{
    inline constexpr uint16_t VIEW_SPAN{ 10 };

    // first registers of every space as one display sees them; empty readings are unreachable
    struct StatusFrame
    {
        std::array<std::vector<reglink::Reading>, 4> values;

        reglink::Reading at(reglink::RegisterSpace space, uint16_t address) const
        {
            const auto& values_of_space{ values[reglink::index(space)] };
            return address < values_of_space.size() ? values_of_space[address] : reglink::Reading{};
        }

        static StatusFrame from_bank(const reglink::RegisterBank& bank, uint16_t span = VIEW_SPAN)
        {
            StatusFrame frame;
            for (auto space : reglink::ALL_SPACES) {
                auto& out{ frame.values[reglink::index(space)] };
                for (uint16_t address{ 0 }; address < span; ++address) {
                    auto value{ bank.value(space, address) };
                    out.push_back(value ? reglink::Reading{ *value } : reglink::Reading{});
                }
            }
            return frame;
        }
    };

    inline std::string_view space_title(reglink::RegisterSpace space)
    {
        switch (space) {
            case reglink::RegisterSpace::Coils:
                return "COILS";
            case reglink::RegisterSpace::DiscreteInputs:
                return "DISCRETE INPUTS";
            case reglink::RegisterSpace::InputRegisters:
                return "INPUT REGISTERS";
            case reglink::RegisterSpace::HoldingRegisters:
                return "HOLDING REGISTERS";
        }
        return {};
    }

    inline std::string format_bit(reglink::Reading value)
    {
        if (!value) {
            return "unknown";
        }
        return *value != 0 ? "ON" : "OFF";
    }

    inline std::string mode_name(reglink::Reading raw)
    {
        if (!raw) {
            return "unknown";
        }
        switch (model::to_mode(*raw).value_or(model::Mode::Idle)) {
            case model::Mode::Auto:
                return "AUTO";
            case model::Mode::Manual:
                return "MANUAL";
            case model::Mode::Idle:
                break;
        }
        return "IDLE";
    }

    /**
     * Plain-text rendering of the labelled slots of a map. The pump delta slot
     * is shown signed, and `pending_delta` replaces it while an operator is
     * still composing a delta.
     */
    inline std::string render_status(const model::RegisterMap& map,
                                     const StatusFrame& frame,
                                     std::string_view title,
                                     std::optional<int> pending_delta = std::nullopt)
    {
        std::string out{ "\033[H\033[J" };
        out += std::format("======== {} ========\n", title);

        const auto mode{ model::mode_slot(map) };
        out += std::format("MODE: {} (hr[{}] = {})\n", mode_name(frame.at(mode.space, mode.address)), mode.address, frame.at(mode.space, mode.address));

        const auto delta_slot{ model::pump_delta_slot(map) };
        const auto slots{ model::labelled_slots(map) };
        for (auto space : reglink::ALL_SPACES) {
            out += std::format("\n{}:\n", space_title(space));
            for (const auto& slot : slots) {
                if (slot.space != space) {
                    continue;
                }

                auto value{ frame.at(slot.space, slot.address) };
                std::string shown;
                if (reglink::isBitSpace(space)) {
                    shown = format_bit(value);
                }
                else if (delta_slot && slot == *delta_slot) {
                    if (pending_delta && *pending_delta != 0) {
                        shown = std::format("{} (pending)", *pending_delta);
                    }
                    else {
                        shown = value ? std::to_string(reglink::toSigned16(*value)) : "unknown";
                    }
                }
                else {
                    shown = value ? std::to_string(*value) : "unknown";
                }
                out += std::format("  - {:<30}: {}\n", slot.label, shown);
            }
        }
        out += std::string(60, '=');
        out += '\n';
        return out;
    }
}
