#pragma once

#include "../model/RegisterMap.hpp"
#include "reglink/bank/ChangeTracker.hpp"
#include "reglink/log/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace plantsim::sim
{
    inline constexpr int MAX_PUMP_VOLTAGE{ 1000 };
    inline constexpr int TARGET_THROUGHPUT{ 100 };
    inline constexpr int VOLTAGE_FLOOR{ 200 };
    inline constexpr int LOW_THROUGHPUT_VOLTAGE{ 250 };
    inline constexpr int MAX_FAN_STEP{ 80 };
    inline constexpr double FAN_GAIN{ 2.5 };
    inline constexpr double HEATER_GAIN{ 4.0 };
    inline constexpr int MAX_HEATER_POWER{ 300 };
    inline constexpr int MAX_RELIEF_PRESSURE{ 1500 };

    /**
     * Control policy of the PLC. The emergency stop coil overrides everything,
     * otherwise the mode register selects Idle, Auto or Manual. The mode seen
     * on the previous cycle lives in the instance, so two controllers never
     * share history.
     */
    class Controller
    {
    public:
        explicit Controller(model::RegisterMap map)
            : m_map(std::move(map))
        {
        }

        reglink::Result<reglink::ChangeSet> cycle(reglink::RegisterBank& bank)
        {
            reglink::ChangeTracker tracker(bank);
            std::visit([&](const auto& loop) { run(loop, tracker); }, m_map);

            auto changes{ tracker.finish() };
            if (!changes) {
                reglink::log::warning("controller cycle aborted: {}", changes.error().message());
                return changes;
            }
            for (const auto& change : *changes) {
                reglink::log::info("PLC: {} changed from {} to {}", change.label, change.oldValue, change.newValue);
            }
            return changes;
        }

        std::optional<uint16_t> last_mode() const { return m_last_mode; }
        const model::RegisterMap& map() const { return m_map; }

    private:
        void note_mode(uint16_t raw)
        {
            if (m_last_mode == raw) {
                return;
            }
            if (model::to_mode(raw)) {
                reglink::log::info("PLC: mode changed from {} to {}", m_last_mode, raw);
            }
            else {
                reglink::log::warning("PLC: unknown mode {}, treated as idle", raw);
            }
            m_last_mode = raw;
        }

        void run(const model::PressurizedLoop& l, reglink::ChangeTracker& t)
        {
            const int pump_voltage = t.get(l.pump_voltage);
            const int temperature = t.get(l.temperature);
            const int pressure = t.get(l.pressure);
            const int throughput = t.get(l.throughput);
            const int fan_rpm = t.get(l.fan_level);

            const int target_temp = t.get(l.target_temp);
            const int alarm_temp = t.get(l.alarm_temp);
            const int alarm_pressure = t.get(l.alarm_pressure);
            const int relief_threshold = t.get(l.relief_threshold);
            const int bleed_rate = t.get(l.bleed_rate);

            const auto raw_mode{ t.get(l.mode) };
            note_mode(raw_mode);

            if (t.getBit(l.emergency_stop)) {
                t.set(l.pump_voltage, 0);
                t.set(l.fan_level, 0);
                t.set(l.heater_power, 0);
                reglink::log::warning("PLC: emergency stop, pump, fan and heater off");
                return;
            }

            const auto mode{ model::to_mode(raw_mode).value_or(model::Mode::Idle) };
            if (mode == model::Mode::Idle) {
                return;
            }

            if (mode == model::Mode::Manual) {
                const int delta = reglink::toSigned16(t.get(l.pump_delta));
                if (delta != 0) {
                    t.set(l.pump_voltage, static_cast<uint16_t>(std::clamp(pump_voltage + delta, 0, MAX_PUMP_VOLTAGE)));
                    t.set(l.pump_delta, 0);
                }
            }
            else {
                t.set(l.pump_voltage, static_cast<uint16_t>(pump_setpoint(temperature, throughput)));

                const int drpm = std::clamp(static_cast<int>((temperature - target_temp) * FAN_GAIN), -MAX_FAN_STEP, MAX_FAN_STEP);
                t.set(l.fan_level, static_cast<uint16_t>(std::clamp(fan_rpm + drpm, 0, MAX_PUMP_VOLTAGE)));

                // hysteresis band [target - 1, target + 2] keeps the heater state
                if (temperature < target_temp - 1) {
                    const int power = std::clamp(static_cast<int>((target_temp - temperature) * HEATER_GAIN), 0, MAX_HEATER_POWER);
                    t.setBit(l.heating, true);
                    t.set(l.heater_power, static_cast<uint16_t>(power));
                }
                else if (temperature > target_temp + 2) {
                    t.setBit(l.heating, false);
                    t.set(l.heater_power, 0);
                }

                if (pressure > relief_threshold) {
                    t.setBit(l.relief_valve, true);
                    t.set(l.pressure, static_cast<uint16_t>(std::clamp(pressure - bleed_rate, 0, MAX_RELIEF_PRESSURE)));
                }
                else {
                    t.setBit(l.relief_valve, false);
                }
            }

            finish_cycle(l, t, temperature > alarm_temp || pressure > alarm_pressure);
        }

        void run(const model::BasicLoop& l, reglink::ChangeTracker& t)
        {
            const int pump_voltage = t.get(l.pump_voltage);
            const int temperature = t.get(l.temperature);
            const int pressure = t.get(l.pressure);
            const int fan_voltage = t.get(l.fan_level);

            const int target_temp = t.get(l.target_temp);
            const int target_pressure = t.get(l.target_pressure);
            const int alarm_temp = t.get(l.alarm_temp);
            const int alarm_pressure = t.get(l.alarm_pressure);

            const auto raw_mode{ t.get(l.mode) };
            note_mode(raw_mode);

            if (t.getBit(l.emergency_stop)) {
                t.set(l.pump_voltage, 0);
                t.set(l.fan_level, 0);
                reglink::log::warning("PLC: emergency stop, pump and fan off");
                return;
            }

            const auto mode{ model::to_mode(raw_mode).value_or(model::Mode::Idle) };
            if (mode == model::Mode::Idle) {
                return;
            }

            // manual mode on this map only keeps the common outputs alive
            if (mode == model::Mode::Auto) {
                int new_pump = pump_voltage;
                if (pressure > target_pressure + 10) {
                    new_pump = pump_voltage - 28;
                }
                else if (pressure > target_pressure + 5) {
                    new_pump = pump_voltage - 8;
                }
                else if (pressure < target_pressure - 10) {
                    new_pump = pump_voltage + 28;
                }
                else if (pressure < target_pressure - 5) {
                    new_pump = pump_voltage + 8;
                }
                t.set(l.pump_voltage, static_cast<uint16_t>(std::clamp(new_pump, 0, MAX_PUMP_VOLTAGE)));

                int new_fan = fan_voltage;
                if (temperature > target_temp + 3) {
                    new_fan = fan_voltage + 10;
                }
                else if (temperature > target_temp + 1) {
                    new_fan = fan_voltage + 5;
                }
                else if (temperature < target_temp - 3) {
                    new_fan = fan_voltage - 10;
                }
                else if (temperature < target_temp - 1) {
                    new_fan = fan_voltage - 5;
                }
                t.set(l.fan_level, static_cast<uint16_t>(std::clamp(new_fan, 0, MAX_PUMP_VOLTAGE)));
            }

            finish_cycle(l, t, temperature > alarm_temp || pressure > alarm_pressure);
        }

        template<typename Loop>
        void finish_cycle(const Loop& l, reglink::ChangeTracker& t, bool alarm)
        {
            t.setBit(l.pump, true);
            t.setBit(l.alarm, alarm);
            t.setBit(l.fan, t.get(l.fan_level) > 0);
        }

        // inverse of the temperature penalty of the plant, so throughput stays near its target
        static int pump_setpoint(int temperature, int throughput)
        {
            int required{ LOW_THROUGHPUT_VOLTAGE };
            if (throughput >= 20) {
                const double penalty = std::max(0.0, (temperature - 70) / 100.0);
                const double denominator = 1.0 - penalty;
                required = denominator <= 0.0
                               ? MAX_PUMP_VOLTAGE
                               : static_cast<int>(std::min(std::trunc(TARGET_THROUGHPUT / denominator),
                                                           static_cast<double>(MAX_PUMP_VOLTAGE)));
            }
            return std::clamp(required, VOLTAGE_FLOOR, MAX_PUMP_VOLTAGE);
        }

        model::RegisterMap m_map;
        std::optional<uint16_t> m_last_mode;
    };
}
