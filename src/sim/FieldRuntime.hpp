#pragma once

#include "../config/PlantConfig.hpp"
#include "EnvironmentModel.hpp"
#include "Pacing.hpp"
#include "reglink/log/Logger.hpp"
#include "reglink/snapshot/SnapshotStore.hpp"

#include <atomic>

namespace plantsim::sim
{
    /**
     * The plant role. Works on the snapshot file only: load, step the
     * EnvironmentModel on a scratch bank, write back what moved.
     */
    class FieldRuntime
    {
    public:
        FieldRuntime(config::PlantConfig config, const std::atomic<bool>& running, std::optional<uint32_t> seed = std::nullopt)
            : m_config(std::move(config))
            , m_running(running)
            , m_store(m_config.tmp_file)
            , m_model(m_config.map, m_config.aggressiveness, m_config.noise_amplitude, seed)
        {
        }

        reglink::Result<void> run()
        {
            if (auto res = m_store.seed(m_config.json_file, model::default_snapshot(m_config.map)); !res) {
                reglink::log::error("field: cannot create {}: {}", m_store.path(), res.error().message());
                return res;
            }

            reglink::log::info("field loop: src={}, dst={}, interval={}", m_config.json_file, m_store.path(), m_config.reality_cycle);
            while (m_running) {
                tick();
                pause_while_running(m_config.reality_cycle, m_running);
            }
            reglink::log::info("field loop exiting");
            return reglink::success();
        }

        // one cycle; returns what changed (empty when nothing moved or the tick was skipped)
        reglink::ChangeSet tick()
        {
            auto snapshot{ m_store.load() };
            if (!snapshot) {
                reglink::log::warning("field: could not read {}: {}", m_store.path(), snapshot.error().message());
                return {};
            }

            reglink::RegisterBank bank;
            model::default_snapshot(m_config.map).apply(bank);
            snapshot->apply(bank);

            auto changes{ m_model.step(bank) };
            if (!changes) {
                reglink::log::warning("field: step failed: {}", changes.error().message());
                return {};
            }
            if (changes->empty()) {
                return {};
            }

            for (const auto& change : *changes) {
                snapshot->set(change.space, change.address, change.newValue);
            }
            if (auto res = m_store.save(*snapshot); !res) {
                reglink::log::warning("field: save failed: {}", res.error().message());
                return {};
            }

            for (const auto& change : *changes) {
                reglink::log::info("{} changed from {} to {}", change.label, change.oldValue, change.newValue);
            }
            return std::move(*changes);
        }


    private:
        config::PlantConfig m_config;
        const std::atomic<bool>& m_running;

        reglink::SnapshotStore m_store;
        EnvironmentModel m_model;
    };
}
