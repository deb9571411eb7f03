#pragma once

#include "MarketDataProvider.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace jungle {

    // Background timer that polls a provider and parks the newest snapshot
    // until the owner collects it between ticks.
    class MarketRefresher {
    public:
        MarketRefresher(const MarketDataProvider& provider, std::chrono::milliseconds interval);
        ~MarketRefresher();

        MarketRefresher(const MarketRefresher&) = delete;
        MarketRefresher& operator=(const MarketRefresher&) = delete;

        void start();

        // Best effort: no further polls are issued once this returns
        void stop();

        bool isRunning() const { return running_.load(); }

        // Poll once on the calling thread
        void refreshNow();

        // Newest unconsumed snapshot, if any
        std::optional<MarketState> takePending();

        uint64_t getRefreshCount() const { return refreshCount_.load(); }

    private:
        const MarketDataProvider& provider_;
        std::chrono::milliseconds interval_;

        std::atomic<bool> running_{ false };
        std::atomic<uint64_t> refreshCount_{ 0 };
        std::thread thread_;

        std::mutex mutex_;
        std::condition_variable wake_;
        std::optional<MarketState> pending_;

        void runLoop();
    };

} // namespace jungle
