#include "engine/Simulation.hpp"
#include "utils/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace jungle;

static Simulation* g_sim = nullptr;
static std::atomic<bool> g_interrupted{ false };

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;

    g_interrupted = true;
    if (g_sim) {
        g_sim->pause();
    }
}

static void logStatistics(const GameEngine& engine) {
    Logger::info("Frame {}/{}, {} coconuts resolved, {} in flight",
        engine.getFrame(), engine.getTrials(), engine.getResolvedCount(), engine.getCoconuts().size());

    for (Strike s : engine.getUniverse().strikes()) {
        int hits = engine.getTreeHits().at(s);
        if (hits == 0) continue;
        Logger::info("  strike {}: {} hits, retail {:.2f}, mm {:.2f}, gamma {:.3f}",
            s, hits, engine.getRetailJuice().at(s), engine.getMmJuice().at(s), engine.gammaAt(s));
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath;
    std::string portfolioPath = "data/portfolio.json";
    std::string profilesDir;
    std::string saveDir;
    std::string logLevel = "info";
    int64_t seed = -1;
    bool seedGiven = false;
    long ticks = 0;
    bool realtime = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--portfolio" && i + 1 < argc) {
                portfolioPath = argv[++i];
            }
            else if (arg == "--profiles" && i + 1 < argc) {
                profilesDir = argv[++i];
            }
            else if (arg == "--ticks" && i + 1 < argc) {
                ticks = std::stol(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoll(argv[++i]);
                seedGiven = true;
            }
            else if (arg == "--save" && i + 1 < argc) {
                saveDir = argv[++i];
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                logLevel = argv[++i];
            }
            else if (arg == "--realtime") {
                realtime = true;
            }
            else if (arg == "--help") {
                std::cout << "Flying Coconuts options-market game (headless)\n"
                    << "Usage: jungle_sim [options]\n"
                    << "Options:\n"
                    << "  --config <path>         RuntimeConfig JSON (merge-patched over defaults)\n"
                    << "  --portfolio <path>      Slingshot catalog (default: data/portfolio.json)\n"
                    << "  --profiles <dir>        Behavioral profile directory\n"
                    << "  --ticks <n>             Frames to run (default: until every launch resolves)\n"
                    << "  --seed <n>              Random seed for a reproducible episode\n"
                    << "  --save <dir>            Autosave and final save of game state, statistics and memories\n"
                    << "  --log-level <level>     trace|debug|info|warn|error|off (default: info)\n"
                    << "  --realtime              Run at the configured tick rate on a worker thread\n"
                    << "  --help                  Show this help\n";
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (see --help)\n";
                return 2;
            }
        }

        Logger::init("jungle_sim.log", logLevel, true);

        Logger::info("=== Flying Coconuts ===");

        Simulation sim;
        g_sim = &sim;

        sim.loadPortfolio(portfolioPath);
        if (!configPath.empty()) {
            sim.loadConfig(configPath);
        }

        auto& cfg = sim.getRuntimeConfig();
        if (!profilesDir.empty()) cfg.profiles.directory = profilesDir;
        if (seedGiven) cfg.game.seed = seed;
        if (ticks > 0) cfg.game.maxTicks = static_cast<int>(ticks);

        sim.initialize();
        if (!saveDir.empty()) {
            sim.enableAutosave(saveDir);
        }

        if (realtime) {
            sim.start();
            while (sim.isRunning() && !g_interrupted.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            sim.stop();
        }
        else {
            long done = 0;
            while (!g_interrupted.load()) {
                if (ticks > 0 && done >= ticks) break;
                if (ticks <= 0 && sim.getEngine().isEpisodeComplete()) break;
                sim.step(1);
                done++;
            }
        }

        const auto& engine = sim.getEngine();
        logStatistics(engine);
        Logger::info("{}", engine.getMemorySummary(AgentRole::RETAIL));
        Logger::info("{}", engine.getMemorySummary(AgentRole::MONKEY));

        if (!saveDir.empty()) {
            std::string written = sim.save(saveDir);
            if (written.empty()) {
                Logger::error("Could not save game state to {}", saveDir);
            }
        }

        g_sim = nullptr;
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Shutdown complete");
    return 0;
}
