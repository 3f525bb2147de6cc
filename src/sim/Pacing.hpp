#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace plantsim::sim
{
    // sleeps in short slices so a stop request ends the wait early; returns false once stopped
    inline bool pause_while_running(std::chrono::milliseconds duration, const std::atomic<bool>& running)
    {
        constexpr std::chrono::milliseconds slice{ 50 };
        auto deadline{ std::chrono::steady_clock::now() + duration };

        while (running) {
            auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
        }
        return running;
    }
}
