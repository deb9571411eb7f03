#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace jungle {

    class GameEngine;

    // Writes session folders under a base directory:
    //   <base>/<stamp>/game_state.json
    //   <base>/<stamp>/statistics.csv
    //   <base>/<stamp>/retail_memories.json, monkey_memories.json
    class SaveManager {
    public:
        explicit SaveManager(std::string baseDir = "output");

        // Returns the session directory, or an empty string when nothing
        // could be written. An empty stamp uses the current local time.
        std::string saveGameState(const GameEngine& engine, std::string stamp = "") const;

        // game_state.json plus a "statistics" array read back from the CSV
        std::optional<nlohmann::json> loadGameState(const std::string& stamp) const;

        // One summary per session folder holding a game_state.json
        std::vector<nlohmann::json> listSavedGames() const;

        const std::string& getBaseDir() const { return baseDir_; }

        static nlohmann::json stateJson(const GameEngine& engine);
        static std::string statisticsCsv(const GameEngine& engine);
        static std::string makeStamp();

    private:
        std::string baseDir_;
    };

} // namespace jungle
