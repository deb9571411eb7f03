#pragma once

#include "GameEngine.hpp"
#include "SaveManager.hpp"
#include "core/RuntimeConfig.hpp"
#include "market/MarketRefresher.hpp"
#include "market/StaticMarketData.hpp"
#include "profiles/ProfileManager.hpp"
#include "utils/Random.hpp"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <thread>
#include <nlohmann/json.hpp>

namespace jungle {

    // Host for one episode: owns the collaborators, builds the GameEngine and
    // drives it either step by step or from a run-loop thread.
    class Simulation {
    public:
        Simulation();
        ~Simulation();

        // Load configuration (merge-patch over the defaults)
        void loadConfig(const std::string& configPath);
        void loadConfig(const nlohmann::json& config);

        // Slingshot catalog and market fallbacks in portfolio.json layout
        void loadPortfolio(const std::string& portfolioPath);

        // Build random source, profiles, market data and engine from the
        // current RuntimeConfig. Throws std::invalid_argument on an empty
        // strike universe.
        void initialize();

        // Control
        void start();
        void pause();
        void resume();
        void stop();
        void reset();

        // Step mode
        void step(int count = 1);

        // Status
        bool isInitialized() const { return engine_ != nullptr; }
        bool isRunning() const { return running_.load(); }
        bool isPaused() const { return paused_.load(); }
        uint64_t getCurrentTick() const { return currentTick_.load(); }

        RuntimeConfig& getRuntimeConfig() { return rtConfig_; }
        const RuntimeConfig& getRuntimeConfig() const { return rtConfig_; }

        // Valid after initialize()
        GameEngine& getEngine() { return *engine_; }
        const GameEngine& getEngine() const { return *engine_; }
        ProfileManager& getProfiles() { return *profiles_; }
        StaticMarketData& getMarketData() { return *marketData_; }
        MarketRefresher& getRefresher() { return *refresher_; }

        // Thread-safe lock access for callers outside the run loop
        std::shared_mutex& getEngineMutex() { return engineMutex_; }

        nlohmann::json getStateJson() const;

        // Snapshot the episode under <baseDir>/<stamp>; empty on failure
        std::string save(const std::string& baseDir, const std::string& stamp = "") const;

        // Save under `baseDir` every game.saveIntervalFrames frames. Empty disables.
        void enableAutosave(std::string baseDir) { autosaveDir_ = std::move(baseDir); }

    private:
        RuntimeConfig rtConfig_;
        std::unique_ptr<Random> rng_;
        std::unique_ptr<ProfileManager> profiles_;
        std::unique_ptr<StaticMarketData> marketData_;
        std::unique_ptr<MarketRefresher> refresher_;
        std::unique_ptr<GameEngine> engine_;
        mutable std::shared_mutex engineMutex_;  // protects all engine state

        std::atomic<bool> running_{ false };
        std::atomic<bool> paused_{ false };
        std::atomic<uint64_t> currentTick_{ 0 };

        std::thread simThread_;

        std::string autosaveDir_;
        int lastSaveFrame_ = 0;

        void runLoop();

        // One engine frame; caller holds the unique lock
        void tickLocked();
        void autosaveLocked();
    };

} // namespace jungle
