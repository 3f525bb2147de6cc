#pragma once

#include "../model/RegisterMap.hpp"
#include "../sim/EnvironmentModel.hpp"
#include "reglink/Result.hpp"
#include "reglink/log/Logger.hpp"
#include "reglink/snapshot/JsonText.hpp"

#include <magic_enum/magic_enum.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace plantsim::config
{
    inline constexpr std::string_view DEFAULT_CONFIG_FILE{ "OTdemo.conf" };
    inline constexpr std::string_view DEFAULT_SECTION{ "modbus-plc1" };

    /**
     * Startup settings of every role, read once from one section of the
     * configuration file. Missing keys keep these defaults.
     */
    struct PlantConfig
    {
        std::string section{ DEFAULT_SECTION };
        model::RegisterMap map{ model::PressurizedLoop{} };

        std::string json_file{ "sensors.json" };
        std::string tmp_file{ "sensors.tmp" };
        std::string plc_log_file{};
        std::string reality_log_file{};
        std::string hmi_log_file{};

        std::string plc_server_ip{ "127.0.0.1" };
        uint16_t plc_server_port{ 4840 };

        std::chrono::milliseconds print_status_cycle{ 1000 };
        uint32_t plc_loop_multiplier{ 1 };
        bool memory_view{ false };
        std::chrono::milliseconds reality_cycle{ 1000 };
        std::chrono::milliseconds hmi_poll_interval{ 1000 };
        std::chrono::milliseconds gateway_timeout{ 1000 };

        double aggressiveness{ sim::DEFAULT_AGGRESSIVENESS };
        double noise_amplitude{ sim::DEFAULT_NOISE_AMPLITUDE };
        reglink::log::Level log_level{ reglink::log::Level::Info };

        std::string endpoint_url() const { return std::format("opc.tcp://{}:{}", plc_server_ip, plc_server_port); }
    };

    namespace detail
    {
        // numbers may be written as JSON numbers or as numeric strings
        inline reglink::Result<double> to_number(const Json::Value& value)
        {
            if (value.isNumeric() && !value.isBool()) {
                return value.asDouble();
            }
            if (value.isString()) {
                auto text{ value.asString() };
                double number{};
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
                if (ec == std::errc() && ptr == text.data() + text.size()) {
                    return number;
                }
            }
            return reglink::fail(reglink::Errc::InvalidConfig);
        }

        inline reglink::Result<bool> to_bool(const Json::Value& value)
        {
            if (value.isBool()) {
                return value.asBool();
            }
            if (value.isString()) {
                auto text{ value.asString() };
                if (text == "true" || text == "True" || text == "1") {
                    return true;
                }
                if (text == "false" || text == "False" || text == "0") {
                    return false;
                }
            }
            if (value.isNumeric()) {
                return value.asDouble() != 0.0;
            }
            return reglink::fail(reglink::Errc::InvalidConfig);
        }

        class SectionReader
        {
        public:
            explicit SectionReader(const Json::Value& section)
                : m_section(section)
            {
            }

            void string(const char* key, std::string& out)
            {
                if (!m_section.isMember(key)) {
                    return;
                }
                const auto& value{ m_section[key] };
                if (!value.isString()) {
                    invalid(key);
                    return;
                }
                out = value.asString();
            }

            void number(const char* key, double& out, double min, double max)
            {
                if (!m_section.isMember(key)) {
                    return;
                }
                auto number{ to_number(m_section[key]) };
                if (!number || *number < min || *number > max) {
                    invalid(key);
                    return;
                }
                out = *number;
            }

            template<typename Int>
            void integer(const char* key, Int& out, Int min, Int max)
            {
                double value{ static_cast<double>(out) };
                number(key, value, static_cast<double>(min), static_cast<double>(max));
                out = static_cast<Int>(value);
            }

            void seconds(const char* key, std::chrono::milliseconds& out)
            {
                double value{ out.count() / 1000.0 };
                number(key, value, 0.0, 86400.0);
                out = std::chrono::milliseconds(static_cast<int64_t>(value * 1000.0));
            }

            void millis(const char* key, std::chrono::milliseconds& out)
            {
                double value{ static_cast<double>(out.count()) };
                number(key, value, 0.0, 3600000.0);
                out = std::chrono::milliseconds(static_cast<int64_t>(value));
            }

            void boolean(const char* key, bool& out)
            {
                if (!m_section.isMember(key)) {
                    return;
                }
                auto flag{ to_bool(m_section[key]) };
                if (!flag) {
                    invalid(key);
                    return;
                }
                out = *flag;
            }

            void invalid(const char* key)
            {
                reglink::log::error("config: key {} has an invalid value", key);
                m_valid = false;
            }

            bool valid() const { return m_valid; }

        private:
            const Json::Value& m_section;
            bool m_valid{ true };
        };
    }

    inline reglink::Result<PlantConfig> parse_config(const Json::Value& root, const std::string& section)
    {
        if (!root.isObject() || !root.isMember(section) || !root[section].isObject()) {
            reglink::log::error("config: section {} not found", section);
            return reglink::fail(reglink::Errc::NotFound);
        }

        PlantConfig config;
        config.section = section;
        detail::SectionReader reader(root[section]);

        std::string scenario{ model::map_name(config.map) };
        reader.string("SCENARIO", scenario);
        if (auto map = model::make_register_map(scenario)) {
            config.map = *map;
        }
        else {
            reader.invalid("SCENARIO");
        }

        reader.string("JSON_FILE", config.json_file);
        reader.string("TMP_FILE", config.tmp_file);
        reader.string("PLC_LOG_FILE", config.plc_log_file);
        reader.string("REALITY_LOG_FILE", config.reality_log_file);
        reader.string("HMI_LOG_FILE", config.hmi_log_file);
        reader.string("PLC_SERVER_IP", config.plc_server_ip);
        reader.integer<uint16_t>("PLC_SERVER_PORT", config.plc_server_port, 1, 65535);

        reader.seconds("PRINT_STATUS_CYCLE", config.print_status_cycle);
        reader.integer<uint32_t>("PLC_LOOP_MULTIPLIER", config.plc_loop_multiplier, 1, 1000000);
        reader.boolean("MEMORY_VIEW", config.memory_view);
        reader.seconds("REALITY_CYCLE", config.reality_cycle);
        reader.seconds("HMI_POLL_INTERVAL", config.hmi_poll_interval);
        reader.millis("GATEWAY_TIMEOUT_MS", config.gateway_timeout);

        reader.number("AGGRESSIVENESS", config.aggressiveness, 0.0, 100.0);
        reader.number("NOISE_AMPLITUDE", config.noise_amplitude, 0.0, 1000.0);

        std::string level{ magic_enum::enum_name(config.log_level) };
        reader.string("LOG_LEVEL", level);
        if (auto parsed = magic_enum::enum_cast<reglink::log::Level>(level, magic_enum::case_insensitive)) {
            config.log_level = *parsed;
        }
        else {
            reader.invalid("LOG_LEVEL");
        }

        if (!reader.valid()) {
            return reglink::fail(reglink::Errc::InvalidConfig);
        }
        return config;
    }

    inline reglink::Result<PlantConfig> load_config(const std::string& path, const std::string& section)
    {
        auto root{ reglink::readJsonFile(path) };
        if (!root) {
            reglink::log::error("config: cannot read {}: {}", path, root.error().message());
            return std::unexpected(root.error());
        }
        return parse_config(*root, section);
    }
}
