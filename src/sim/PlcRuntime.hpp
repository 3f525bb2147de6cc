#pragma once

#include "../app/StatusView.hpp"
#include "../config/PlantConfig.hpp"
#include "Controller.hpp"
#include "Pacing.hpp"
#include "reglink/drivers/UaGatewayServer.hpp"
#include "reglink/gateway/LocalGateway.hpp"
#include "reglink/log/Logger.hpp"
#include "reglink/snapshot/SnapshotStore.hpp"

#include <atomic>
#include <print>

namespace plantsim::sim
{
    /**
     * The PLC role: live bank behind a LocalGateway, published over OPC UA,
     * fed with field values from the shared snapshot and driven by the
     * Controller every PLC_LOOP_MULTIPLIER iterations.
     */
    class PlcRuntime
    {
    public:
        PlcRuntime(config::PlantConfig config, const std::atomic<bool>& running)
            : m_config(std::move(config))
            , m_running(running)
            , m_store(m_config.tmp_file)
            , m_controller(m_config.map)
            , m_server(m_gateway, m_config.plc_server_port)
        {
        }

        reglink::Result<void> run()
        {
            reglink::log::info("PLC waiting for {}", m_store.path());
            while (!m_store.exists()) {
                if (!pause_while_running(std::chrono::seconds(1), m_running)) {
                    return reglink::success();
                }
            }

            if (!seed_bank()) {
                return reglink::success();
            }

            if (auto res = m_server.start(); !res) {
                reglink::log::error("PLC: gateway server failed to start: {}", res.error().message());
                return res;
            }

            uint64_t iteration{ 0 };
            while (m_running) {
                ++iteration;
                run_iteration(iteration);

                if (m_config.memory_view) {
                    auto frame{ m_gateway.withBank([](const reglink::RegisterBank& bank) {
                        return app::StatusFrame::from_bank(bank);
                    }) };
                    std::print("{}", app::render_status(m_config.map, frame, std::format("MEMORY VIEW - PLC STATUS ITERATION: {}", iteration)));
                    std::fflush(stdout);
                }

                pause_while_running(m_config.print_status_cycle, m_running);
            }

            m_server.stop();
            reglink::log::info("PLC stopped after {} iterations", iteration);
            return reglink::success();
        }

        // one pass of the loop body, without the pacing
        void run_iteration(uint64_t iteration)
        {
            auto loaded{ m_store.load() };
            if (loaded) {
                m_gateway.withBank([&](reglink::RegisterBank& bank) {
                    loaded->apply(bank, model::environment_slots(m_config.map));
                });
            }
            else {
                reglink::log::warning("PLC: memory update skipped: {}", loaded.error().message());
            }

            if (iteration % m_config.plc_loop_multiplier != 0) {
                return;
            }

            auto projected{ m_gateway.withBank([&](reglink::RegisterBank& bank) -> reglink::Result<reglink::Snapshot> {
                if (auto changes = m_controller.cycle(bank); !changes) {
                    return std::unexpected(changes.error());
                }
                return reglink::Snapshot::capture(bank, model::plc_projection(m_config.map));
            }) };
            if (!projected) {
                reglink::log::warning("PLC: loop error: {}", projected.error().message());
                return;
            }

            if (loaded && !differs(*projected, *loaded)) {
                return;
            }
            if (auto res = m_store.save(*projected); !res) {
                reglink::log::warning("PLC: snapshot save failed: {}", res.error().message());
            }
        }

        reglink::LocalGateway& gateway() { return m_gateway; }

        // true when at least one slot of `projected` is missing from or different in `loaded`
        static bool differs(const reglink::Snapshot& projected, const reglink::Snapshot& loaded)
        {
            for (auto space : reglink::ALL_SPACES) {
                for (const auto& [address, value] : projected.values(space)) {
                    if (loaded.get(space, address) != value) {
                        return true;
                    }
                }
            }
            return false;
        }

        // starts the live bank from the map defaults overlaid with the whole snapshot
        bool seed_bank()
        {
            while (m_running) {
                auto snapshot{ m_store.load() };
                if (snapshot) {
                    m_gateway.withBank([&](reglink::RegisterBank& bank) {
                        model::default_snapshot(m_config.map).apply(bank);
                        snapshot->apply(bank);
                    });
                    return true;
                }
                reglink::log::warning("PLC: initial snapshot unreadable: {}", snapshot.error().message());
                pause_while_running(std::chrono::seconds(1), m_running);
            }
            return false;
        }

    private:
        config::PlantConfig m_config;
        const std::atomic<bool>& m_running;

        reglink::SnapshotStore m_store;
        reglink::LocalGateway m_gateway;
        Controller m_controller;
        reglink::drivers::UaGatewayServer m_server;
    };
}
