#pragma once

#include "../model/RegisterMap.hpp"
#include "reglink/bank/ChangeTracker.hpp"
#include "reglink/log/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <random>

namespace plantsim::sim
{
    inline constexpr double DEFAULT_AGGRESSIVENESS{ 0.6 };
    inline constexpr double DEFAULT_NOISE_AMPLITUDE{ 1.0 };

    /**
     * Plant physics. One step reads the actuators of the bank and moves the
     * measured registers (temperature, pressure, throughput) by one tick.
     * Aggressiveness scales every transfer term: 1.0 is nominal, lower is
     * calmer, higher more volatile.
     */
    class EnvironmentModel
    {
    public:
        explicit EnvironmentModel(model::RegisterMap map,
                                  double aggressiveness = DEFAULT_AGGRESSIVENESS,
                                  double noise_amplitude = DEFAULT_NOISE_AMPLITUDE,
                                  std::optional<uint32_t> seed = std::nullopt)
            : m_map(std::move(map))
            , m_aggressiveness(aggressiveness)
            , m_noise_amplitude(std::abs(noise_amplitude))
            , m_rng(seed ? *seed : std::random_device{}())
        {
        }

        reglink::Result<reglink::ChangeSet> step(reglink::RegisterBank& bank)
        {
            return step(bank, m_aggressiveness);
        }

        reglink::Result<reglink::ChangeSet> step(reglink::RegisterBank& bank, double aggressiveness)
        {
            reglink::ChangeTracker tracker(bank);
            std::visit([&](const auto& loop) { advance(loop, tracker, aggressiveness); }, m_map);
            return tracker.finish();
        }

        const model::RegisterMap& map() const { return m_map; }
        double aggressiveness() const { return m_aggressiveness; }

    private:
        void advance(const model::PressurizedLoop& l, reglink::ChangeTracker& t, double aggr)
        {
            const double pump_voltage = t.get(l.pump_voltage);
            const double temperature = t.get(l.temperature);
            const double pressure = t.get(l.pressure);
            const double throughput = t.get(l.throughput);
            const double fan_rpm = t.get(l.fan_level);
            const double heater_power = t.get(l.heater_power);

            const bool fan_on = t.getBit(l.fan);
            const bool heater_on = t.getBit(l.heating);
            const bool valve_open = t.getBit(l.relief_valve);
            const double relief_threshold = t.get(l.relief_threshold);
            const double bleed_rate = t.get(l.bleed_rate);

            // throughput
            const double temp_penalty = std::max(0.0, (temperature - 70.0) / 100.0);
            const double raw_throughput = std::clamp(pump_voltage, 0.0, 1000.0) * (1.0 - temp_penalty);
            const double limited = std::clamp(std::trunc(std::max(raw_throughput, 20.0)), 20.0, 1000.0);
            const double new_throughput = std::trunc(limited * aggr);

            // pressure
            const double pressure_input = std::pow(new_throughput / 100.0, 1.2) * 10.0;
            const double pressure_loss = std::pow(throughput / 120.0, 1.1) * 7.0;
            double new_pressure = pressure + (pressure_input - pressure_loss) * aggr;

            if (valve_open && pressure > relief_threshold) {
                new_pressure -= bleed_rate;
                reglink::log::info("relief valve open: bleeding {} (pressure {} -> {})",
                                   bleed_rate,
                                   static_cast<int>(pressure),
                                   static_cast<int>(new_pressure));
            }
            new_pressure = std::clamp(std::trunc(new_pressure), 600.0, 1400.0);

            // temperature
            const double heat_from_pump = std::pow(pump_voltage / 1000.0, 1.5) * 25.0;
            const double heat_from_pressure =
                pressure > 800.0 ? std::pow((pressure - 800.0) / 400.0, 2.0) * 20.0 : 0.0;
            const double heat_from_heater = heater_on ? std::pow(heater_power / 200.0, 1.2) * 40.0 : 0.0;
            const double cooling_from_fan = fan_on ? std::pow(fan_rpm / 300.0, 1.4) * 60.0 : 0.0;

            const double temp_delta =
                (heat_from_pump + heat_from_pressure + heat_from_heater - cooling_from_fan) * aggr;
            const double new_temperature = std::clamp(std::trunc(temperature + temp_delta + noise()), 30.0, 150.0);

            t.set(l.throughput, reglink::clampRegister(new_throughput));
            t.set(l.pressure, reglink::clampRegister(new_pressure));
            t.set(l.temperature, reglink::clampRegister(new_temperature));
        }

        void advance(const model::BasicLoop& l, reglink::ChangeTracker& t, double aggr)
        {
            const int pump_voltage = t.get(l.pump_voltage);
            const int fan_voltage = t.get(l.fan_level);
            const int temperature = t.get(l.temperature);
            const int pressure = t.get(l.pressure);
            const bool pump_on = t.getBit(l.pump);
            const bool fan_on = t.getBit(l.fan);

            const int new_throughput = std::clamp(static_cast<int>(0.4 * pump_voltage), 5, 200);

            int new_pressure{};
            if (pump_on && pump_voltage > 0) {
                new_pressure = std::min(1600, pressure + static_cast<int>(0.03 * pump_voltage * aggr));
            }
            else {
                new_pressure = std::max(200, pressure - static_cast<int>(5.0 * aggr));
            }

            int new_temperature{};
            if (fan_on) {
                const int cooling = fan_voltage / (new_throughput + 5) + 1;
                new_temperature = std::max(10, temperature - cooling);
            }
            else {
                const int heating = new_pressure / 500 + 1;
                new_temperature = std::min(130, temperature + heating);
            }

            t.set(l.throughput, reglink::clampRegister(new_throughput));
            t.set(l.pressure, reglink::clampRegister(new_pressure));
            t.set(l.temperature, reglink::clampRegister(new_temperature));
        }

        double noise()
        {
            if (m_noise_amplitude == 0.0) {
                return 0.0;
            }
            std::uniform_real_distribution<double> dist(-m_noise_amplitude, m_noise_amplitude);
            return dist(m_rng);
        }

        model::RegisterMap m_map;
        double m_aggressiveness;
        double m_noise_amplitude;
        std::mt19937 m_rng;
    };
}
