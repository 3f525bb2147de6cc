#include "app/AdversarialWriter.hpp"
#include "app/OperatorConsole.hpp"
#include "config/PlantConfig.hpp"
#include "reglink/coroutine/coroutine.hpp"
#include "reglink/drivers/UaGateway.hpp"
#include "reglink/log/Logger.hpp"
#include "sim/FieldRuntime.hpp"
#include "sim/PlcRuntime.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    std::atomic<bool> g_running{ true };

    void on_signal(int)
    {
        g_running = false;
    }

    void usage()
    {
        std::println(stderr, "usage: plantsim <plc|field|console|writer> [--config <file>] [--section <name>] [writer options]");
        std::println(stderr, "writer options: --target <kind>[<index>] [--value v] [--num n] [--wait ms] [--toggle] [--random]");
        std::println(stderr, "                [--host ip] [--port p]");
    }

    void configure_logging(const plantsim::config::PlantConfig& config, const std::string& file, bool to_console)
    {
        reglink::log::LoggerConfig log_config;
        log_config.minLevel = config.log_level;
        log_config.filePath = file;
        log_config.toConsole = to_console || file.empty();
        reglink::log::Logger::instance().setConfig(std::move(log_config));
    }

    auto run_plc(const plantsim::config::PlantConfig& config) -> int
    {
        configure_logging(config, config.plc_log_file, !config.memory_view);
        plantsim::sim::PlcRuntime plc(config, g_running);
        return plc.run() ? 0 : 1;
    }

    auto run_field(const plantsim::config::PlantConfig& config) -> int
    {
        configure_logging(config, config.reality_log_file, true);
        plantsim::sim::FieldRuntime field(config, g_running);
        return field.run() ? 0 : 1;
    }

    auto run_console(const plantsim::config::PlantConfig& config) -> int
    {
        // the console owns the terminal
        configure_logging(config, config.hmi_log_file, false);

        reglink::drivers::UaGateway gateway(config.endpoint_url());
        plantsim::app::OperatorConsole console(config.map, gateway, config.gateway_timeout);
        reglink::coro::syncWait(console.run(g_running, config.hmi_poll_interval, config.endpoint_url()));
        return 0;
    }

    auto run_writer(plantsim::config::PlantConfig config, std::span<const std::string_view> args) -> int
    {
        configure_logging(config, config.hmi_log_file, true);

        auto options{ plantsim::app::parse_writer_options(args) };
        if (!options) {
            usage();
            return 2;
        }
        auto target{ plantsim::app::parse_target(options->target) };
        if (!target) {
            std::println(stderr, "invalid target: {}", options->target);
            return 2;
        }

        if (options->host) {
            config.plc_server_ip = *options->host;
        }
        if (options->port) {
            config.plc_server_port = *options->port;
        }

        reglink::drivers::UaGateway gateway(config.endpoint_url());
        if (auto res = reglink::coro::syncWait(gateway.connect(config.gateway_timeout)); !res) {
            reglink::log::error("writer: cannot connect to {}: {}", config.endpoint_url(), res.error().message());
            return 1;
        }

        plantsim::app::AdversarialWriter writer(gateway, *target, std::move(*options), config.gateway_timeout);
        auto report{ reglink::coro::syncWait(writer.run(g_running)) };

        if (auto res = reglink::coro::syncWait(gateway.disconnect()); !res) {
            reglink::log::warning("writer: disconnect failed: {}", res.error().message());
        }
        return report.successes == report.total ? 0 : 1;
    }
}

auto main(int argc, char** argv) -> int
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    if (args.empty()) {
        usage();
        return 2;
    }

    const auto role{ args.front() };
    std::string config_file{ plantsim::config::DEFAULT_CONFIG_FILE };
    std::string section{ plantsim::config::DEFAULT_SECTION };
    std::vector<std::string_view> rest;

    for (auto i{ 1uz }; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_file = args[++i];
        }
        else if (args[i] == "--section" && i + 1 < args.size()) {
            section = args[++i];
        }
        else {
            rest.push_back(args[i]);
        }
    }

    if (role != "writer" && !rest.empty()) {
        usage();
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    int status{ 1 };
    try {
        auto config{ plantsim::config::load_config(config_file, section) };
        if (!config) {
            std::println(stderr, "cannot load section {} of {}: {}", section, config_file, config.error().message());
            reglink::log::Logger::instance().flush();
            return 1;
        }

        if (role == "plc") {
            status = run_plc(*config);
        }
        else if (role == "field") {
            status = run_field(*config);
        }
        else if (role == "console") {
            status = run_console(*config);
        }
        else if (role == "writer") {
            status = run_writer(*config, rest);
        }
        else {
            usage();
            status = 2;
        }
    } catch (const std::exception& e) {
        reglink::log::error("fatal: {}", e.what());
    }

    reglink::log::Logger::instance().flush();
    return status;
}
