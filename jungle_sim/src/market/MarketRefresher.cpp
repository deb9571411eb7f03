#include "MarketRefresher.hpp"
#include "utils/Logger.hpp"

namespace jungle {

    MarketRefresher::MarketRefresher(const MarketDataProvider& provider, std::chrono::milliseconds interval)
        : provider_(provider)
        , interval_(interval)
    {
    }

    MarketRefresher::~MarketRefresher() {
        stop();
    }

    void MarketRefresher::start() {
        if (running_.load()) {
            Logger::warn("Market refresher already running");
            return;
        }

        running_ = true;
        thread_ = std::thread(&MarketRefresher::runLoop, this);

        Logger::info("Market refresher started (interval: {}ms)", interval_.count());
    }

    void MarketRefresher::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.load() && !thread_.joinable()) return;
            running_ = false;
        }
        wake_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }

        Logger::info("Market refresher stopped after {} refreshes", refreshCount_.load());
    }

    void MarketRefresher::refreshNow() {
        try {
            MarketState state = provider_.getMarketState();
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = std::move(state);
            refreshCount_++;
        }
        catch (const std::exception& e) {
            // Keep serving the previous snapshot
            Logger::warn("Market refresh failed: {}", e.what());
        }
    }

    std::optional<MarketState> MarketRefresher::takePending() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<MarketState> state = std::move(pending_);
        pending_.reset();
        return state;
    }

    void MarketRefresher::runLoop() {
        while (running_.load()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
            }
            if (!running_.load()) break;

            refreshNow();
        }
    }

} // namespace jungle
