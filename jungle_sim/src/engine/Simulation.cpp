#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include <chrono>
#include <fstream>

namespace jungle {

    Simulation::Simulation() {}

    Simulation::~Simulation() {
        stop();
    }

    void Simulation::loadConfig(const std::string& configPath) {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", configPath);
            return;
        }

        try {
            loadConfig(nlohmann::json::parse(file));
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse config: {}", e.what());
        }
    }

    void Simulation::loadConfig(const nlohmann::json& config) {
        rtConfig_.fromJson(config);

        // Logging settings (not in RuntimeConfig - keeps Logger decoupled)
        if (config.contains("logging")) {
            auto& log = config["logging"];
            Logger::init(
                log.value("file", "jungle_sim.log"),
                log.value("level", "info"),
                log.value("console", true)
            );
        }

        Logger::info("Configuration loaded (RuntimeConfig populated)");
    }

    void Simulation::loadPortfolio(const std::string& portfolioPath) {
        std::ifstream file(portfolioPath);
        if (!file.is_open()) {
            Logger::warn("Could not open portfolio file: {}, using built-in slingshots", portfolioPath);
            return;
        }

        try {
            rtConfig_.fromPortfolioJson(nlohmann::json::parse(file));
            Logger::info("Loaded {} slingshots from {}", rtConfig_.equipment.slingshots.size(), portfolioPath);
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse portfolio file: {}", e.what());
        }
    }

    void Simulation::initialize() {
        Logger::info("Initializing simulation...");
        stop();

        rng_ = std::make_unique<Random>(Random::fromSeed(rtConfig_.game.seed));

        profiles_ = std::make_unique<ProfileManager>(
            rtConfig_.profiles.activeRetail, rtConfig_.profiles.activeMonkey);
        profiles_->loadDirectory(rtConfig_.profiles.directory);

        marketData_ = std::make_unique<StaticMarketData>(rtConfig_);
        if (!rtConfig_.market.snapshotPath.empty()) {
            marketData_->loadSnapshot(rtConfig_.market.snapshotPath);
        }

        refresher_ = std::make_unique<MarketRefresher>(*marketData_,
            std::chrono::milliseconds(rtConfig_.market.refreshIntervalMs));

        std::unique_lock<std::shared_mutex> lock(engineMutex_);
        engine_ = std::make_unique<GameEngine>(rtConfig_, marketData_->getMarketState(),
            *rng_, profiles_.get(), marketData_.get());
        currentTick_ = 0;
        lastSaveFrame_ = 0;

        Logger::info("Simulation initialized: {} trials, {} fps, seed {}",
            rtConfig_.game.trials, rtConfig_.game.fps, rtConfig_.game.seed);
    }

    void Simulation::start() {
        if (!engine_) {
            Logger::error("Simulation not initialized");
            return;
        }
        if (running_.load()) {
            Logger::warn("Simulation already running");
            return;
        }

        running_ = true;
        paused_ = false;

        refresher_->start();
        simThread_ = std::thread(&Simulation::runLoop, this);

        Logger::info("Simulation started (tick rate: {}ms)", rtConfig_.game.tickRateMs);
    }

    void Simulation::pause() {
        paused_ = true;
        Logger::info("Simulation paused at tick {}", currentTick_.load());
    }

    void Simulation::resume() {
        paused_ = false;
        Logger::info("Simulation resumed");
    }

    void Simulation::stop() {
        running_ = false;

        if (simThread_.joinable()) {
            simThread_.join();
            Logger::info("Simulation stopped at tick {}", currentTick_.load());
        }

        if (refresher_) {
            refresher_->stop();
        }
    }

    void Simulation::reset() {
        stop();
        if (engine_) {
            std::unique_lock<std::shared_mutex> lock(engineMutex_);
            engine_->reset();
        }
        currentTick_ = 0;
        lastSaveFrame_ = 0;
        Logger::info("Simulation reset");
    }

    void Simulation::step(int count) {
        if (!engine_) return;

        std::unique_lock<std::shared_mutex> lock(engineMutex_);
        for (int i = 0; i < count; ++i) {
            tickLocked();
            currentTick_++;
        }
    }

    void Simulation::tickLocked() {
        // Market refreshes land between frames, never inside one
        if (auto market = refresher_->takePending()) {
            engine_->applyMarketState(*market);
        }
        engine_->update();
        autosaveLocked();
    }

    void Simulation::autosaveLocked() {
        int interval = rtConfig_.game.saveIntervalFrames;
        if (autosaveDir_.empty() || interval <= 0) return;

        // The frame stops advancing once every launch is out; save it once
        int frame = engine_->getFrame();
        if (frame == 0 || frame % interval != 0 || frame == lastSaveFrame_) return;

        std::string stamp = fmt::format("{}_frame{:06d}", SaveManager::makeStamp(), frame);
        if (SaveManager(autosaveDir_).saveGameState(*engine_, stamp).empty()) {
            Logger::warn("Autosave at frame {} failed", frame);
        }
        lastSaveFrame_ = frame;
    }

    void Simulation::runLoop() {
        while (running_.load()) {
            if (!paused_.load()) {
                bool complete = false;
                {
                    std::unique_lock<std::shared_mutex> lock(engineMutex_);
                    tickLocked();
                    complete = engine_->isEpisodeComplete();
                }
                currentTick_++;

                int maxTicks = rtConfig_.game.maxTicks;
                if (maxTicks > 0 && currentTick_.load() >= static_cast<uint64_t>(maxTicks)) {
                    Logger::info("Reached max ticks ({}), stopping", maxTicks);
                    running_ = false;
                    break;
                }
                if (complete) {
                    Logger::info("Episode complete after {} ticks, stopping", currentTick_.load());
                    running_ = false;
                    break;
                }
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(rtConfig_.game.tickRateMs));
        }
    }

    nlohmann::json Simulation::getStateJson() const {
        std::shared_lock<std::shared_mutex> lock(engineMutex_);
        nlohmann::json state;
        if (engine_) {
            state = SaveManager::stateJson(*engine_);
            state["episode_complete"] = engine_->isEpisodeComplete();
            state["resolved"] = engine_->getResolvedCount();
        }
        state["tick"] = currentTick_.load();
        state["running"] = running_.load();
        state["tickRateMs"] = rtConfig_.game.tickRateMs;
        return state;
    }

    std::string Simulation::save(const std::string& baseDir, const std::string& stamp) const {
        if (!engine_) return "";

        std::shared_lock<std::shared_mutex> lock(engineMutex_);
        return SaveManager(baseDir).saveGameState(*engine_, stamp);
    }

} // namespace jungle
