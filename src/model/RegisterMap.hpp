#pragma once

#include "reglink/bank/RegisterSpace.hpp"
#include "reglink/bank/Slot.hpp"
#include "reglink/snapshot/Snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace plantsim::model
{
    using reglink::RegisterSpace;
    using reglink::Slot;

    enum class Mode : uint16_t
    {
        Idle = 0,
        Auto = 1,
        Manual = 2
    };

    // any value outside the three known modes means the controller stays idle
    inline std::optional<Mode> to_mode(uint16_t raw)
    {
        switch (raw) {
            case 0:
                return Mode::Idle;
            case 1:
                return Mode::Auto;
            case 2:
                return Mode::Manual;
            default:
                return std::nullopt;
        }
    }

    struct SlotDefault
    {
        Slot slot;
        uint16_t value;
    };

    /**
     * Older cell: pump and fan voltage regulated by error bands,
     * no heater, relief valve or operator pump delta.
     */
    struct BasicLoop
    {
        static constexpr std::string_view name{ "basic" };

        static constexpr Slot pump{ RegisterSpace::Coils, 0, "Pump" };
        static constexpr Slot alarm{ RegisterSpace::Coils, 1, "Alarm" };
        static constexpr Slot fan{ RegisterSpace::Coils, 2, "Fan" };
        static constexpr Slot emergency_stop{ RegisterSpace::Coils, 3, "Emergency Stop" };

        static constexpr Slot door_closed{ RegisterSpace::DiscreteInputs, 0, "Door Closed" };
        static constexpr Slot safety_ok{ RegisterSpace::DiscreteInputs, 1, "Safety OK" };
        static constexpr Slot fan_active{ RegisterSpace::DiscreteInputs, 2, "Fan Active" };

        static constexpr Slot pump_voltage{ RegisterSpace::InputRegisters, 0, "Pump Voltage" };
        static constexpr Slot temperature{ RegisterSpace::InputRegisters, 1, "Temperature" };
        static constexpr Slot pressure{ RegisterSpace::InputRegisters, 2, "Pressure" };
        static constexpr Slot throughput{ RegisterSpace::InputRegisters, 3, "Throughput" };
        static constexpr Slot fan_level{ RegisterSpace::InputRegisters, 4, "Fan Voltage" };

        static constexpr Slot fan_power{ RegisterSpace::HoldingRegisters, 0, "Fan Power" };
        static constexpr Slot target_temp{ RegisterSpace::HoldingRegisters, 1, "Target Temperature" };
        static constexpr Slot target_pressure{ RegisterSpace::HoldingRegisters, 2, "Target Pressure" };
        static constexpr Slot alarm_temp{ RegisterSpace::HoldingRegisters, 3, "Alarm Temp Threshold" };
        static constexpr Slot alarm_pressure{ RegisterSpace::HoldingRegisters, 4, "Alarm Pressure Threshold" };
        static constexpr Slot mode{ RegisterSpace::HoldingRegisters, 5, "Mode" };

        static constexpr std::array defaults{
            SlotDefault{ pump, 1 },           SlotDefault{ alarm, 0 },           SlotDefault{ fan, 1 },
            SlotDefault{ emergency_stop, 0 }, SlotDefault{ door_closed, 1 },     SlotDefault{ safety_ok, 1 },
            SlotDefault{ fan_active, 1 },     SlotDefault{ pump_voltage, 250 },  SlotDefault{ temperature, 55 },
            SlotDefault{ pressure, 900 },     SlotDefault{ throughput, 100 },    SlotDefault{ fan_level, 250 },
            SlotDefault{ fan_power, 250 },    SlotDefault{ target_temp, 55 },    SlotDefault{ target_pressure, 900 },
            SlotDefault{ alarm_temp, 75 },    SlotDefault{ alarm_pressure, 1100 }, SlotDefault{ mode, 1 },
        };
    };

    /**
     * Pressurized cell: throughput-driven pump setpoint, fan RPM, heater with
     * hysteresis, pressure relief valve and a single-shot operator pump delta.
     */
    struct PressurizedLoop
    {
        static constexpr std::string_view name{ "pressurized" };

        static constexpr Slot pump{ RegisterSpace::Coils, 0, "Pump" };
        static constexpr Slot alarm{ RegisterSpace::Coils, 1, "Alarm" };
        static constexpr Slot fan{ RegisterSpace::Coils, 2, "Fan" };
        static constexpr Slot heating{ RegisterSpace::Coils, 3, "Heating" };
        static constexpr Slot emergency_stop{ RegisterSpace::Coils, 4, "Emergency Stop" };
        static constexpr Slot relief_valve{ RegisterSpace::Coils, 5, "Pressure Relief Valve" };

        static constexpr Slot door_closed{ RegisterSpace::DiscreteInputs, 0, "Door Closed" };
        static constexpr Slot safety_ok{ RegisterSpace::DiscreteInputs, 1, "Safety OK" };
        static constexpr Slot fan_active{ RegisterSpace::DiscreteInputs, 2, "Fan Active" };
        static constexpr Slot heating_active{ RegisterSpace::DiscreteInputs, 3, "Heating Active" };

        static constexpr Slot pump_voltage{ RegisterSpace::InputRegisters, 0, "Pump Voltage" };
        static constexpr Slot temperature{ RegisterSpace::InputRegisters, 1, "Temperature" };
        static constexpr Slot pressure{ RegisterSpace::InputRegisters, 2, "Pressure" };
        static constexpr Slot throughput{ RegisterSpace::InputRegisters, 3, "Throughput" };
        static constexpr Slot fan_level{ RegisterSpace::InputRegisters, 4, "Fan RPM" };
        static constexpr Slot heater_power{ RegisterSpace::InputRegisters, 5, "Heater Power" };

        static constexpr Slot target_temp{ RegisterSpace::HoldingRegisters, 0, "Target Temp" };
        static constexpr Slot target_pressure{ RegisterSpace::HoldingRegisters, 1, "Target Pressure" };
        static constexpr Slot alarm_temp{ RegisterSpace::HoldingRegisters, 2, "Alarm Temp" };
        static constexpr Slot alarm_pressure{ RegisterSpace::HoldingRegisters, 3, "Alarm Pressure" };
        static constexpr Slot mode{ RegisterSpace::HoldingRegisters, 4, "Mode" };
        static constexpr Slot pump_delta{ RegisterSpace::HoldingRegisters, 5, "Pump Delta" };
        static constexpr Slot relief_threshold{ RegisterSpace::HoldingRegisters, 6, "Relief Threshold" };
        static constexpr Slot bleed_rate{ RegisterSpace::HoldingRegisters, 7, "Bleed Rate" };

        static constexpr std::array defaults{
            SlotDefault{ pump, 1 },
            SlotDefault{ alarm, 0 },
            SlotDefault{ fan, 1 },
            SlotDefault{ heating, 0 },
            SlotDefault{ emergency_stop, 0 },
            SlotDefault{ relief_valve, 0 },
            SlotDefault{ door_closed, 1 },
            SlotDefault{ safety_ok, 1 },
            SlotDefault{ fan_active, 0 },
            SlotDefault{ heating_active, 0 },
            SlotDefault{ pump_voltage, 250 },
            SlotDefault{ temperature, 55 },
            SlotDefault{ pressure, 900 },
            SlotDefault{ throughput, 100 },
            SlotDefault{ fan_level, 0 },
            SlotDefault{ heater_power, 0 },
            SlotDefault{ target_temp, 55 },
            SlotDefault{ target_pressure, 900 },
            SlotDefault{ alarm_temp, 75 },
            SlotDefault{ alarm_pressure, 1100 },
            SlotDefault{ mode, 1 },
            SlotDefault{ pump_delta, 0 },
            SlotDefault{ relief_threshold, 1300 },
            SlotDefault{ bleed_rate, 15 },
        };
    };

    using RegisterMap = std::variant<PressurizedLoop, BasicLoop>;

    inline std::optional<RegisterMap> make_register_map(std::string_view scenario)
    {
        std::string lower(scenario);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == PressurizedLoop::name) {
            return PressurizedLoop{};
        }
        if (lower == BasicLoop::name) {
            return BasicLoop{};
        }
        return std::nullopt;
    }

    inline std::string_view map_name(const RegisterMap& map)
    {
        return std::visit([](const auto& loop) { return loop.name; }, map);
    }

    // every labelled slot, in map order
    inline reglink::Projection labelled_slots(const RegisterMap& map)
    {
        return std::visit(
          [](const auto& loop) {
              reglink::Projection slots;
              slots.reserve(loop.defaults.size());
              for (const auto& entry : loop.defaults) {
                  slots.push_back(entry.slot);
              }
              return slots;
          },
          map);
    }

    inline reglink::Snapshot default_snapshot(const RegisterMap& map)
    {
        return std::visit(
          [](const auto& loop) {
              reglink::Snapshot snapshot;
              for (const auto& entry : loop.defaults) {
                  snapshot.set(entry.slot.space, entry.slot.address, entry.value);
              }
              return snapshot;
          },
          map);
    }

    // what the controller publishes: everything it knows except the mode, which stays inside the device
    inline reglink::Projection plc_projection(const RegisterMap& map)
    {
        auto slots{ labelled_slots(map) };
        auto mode{ std::visit([](const auto& loop) { return loop.mode; }, map) };
        std::erase(slots, mode);
        return slots;
    }

    // slots owned by the plant side: discrete inputs and the measured sensor registers
    inline reglink::Projection environment_slots(const RegisterMap& map)
    {
        return std::visit(
          [](const auto& loop) {
              reglink::Projection slots;
              for (const auto& entry : loop.defaults) {
                  if (entry.slot.space == RegisterSpace::DiscreteInputs) {
                      slots.push_back(entry.slot);
                  }
              }
              slots.push_back(loop.temperature);
              slots.push_back(loop.pressure);
              slots.push_back(loop.throughput);
              return slots;
          },
          map);
    }

    inline Slot mode_slot(const RegisterMap& map)
    {
        return std::visit([](const auto& loop) { return loop.mode; }, map);
    }

    inline Slot emergency_stop_slot(const RegisterMap& map)
    {
        return std::visit([](const auto& loop) { return loop.emergency_stop; }, map);
    }

    inline std::optional<Slot> pump_delta_slot(const RegisterMap& map)
    {
        if (const auto* loop = std::get_if<PressurizedLoop>(&map)) {
            return loop->pump_delta;
        }
        return std::nullopt;
    }
}
