#include "SaveManager.hpp"
#include "GameEngine.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace jungle {

    namespace fs = std::filesystem;

    namespace {

        template<typename T>
        nlohmann::json strikeMap(const std::map<Strike, T>& values) {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& [strike, value] : values) {
                j[std::to_string(strike)] = value;
            }
            return j;
        }

        bool writeFile(const fs::path& path, const std::string& content) {
            std::ofstream file(path);
            if (!file.is_open()) {
                Logger::warn("Could not open {} for writing", path.string());
                return false;
            }
            file << content;
            return static_cast<bool>(file);
        }

        std::vector<std::string> splitCsvLine(const std::string& line) {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, ',')) {
                fields.push_back(field);
            }
            return fields;
        }

    } // namespace

    SaveManager::SaveManager(std::string baseDir)
        : baseDir_(std::move(baseDir))
    {
    }

    std::string SaveManager::makeStamp() {
        std::time_t t = std::time(nullptr);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream out;
        out << std::put_time(&tm, "%Y%m%d_%H%M%S");
        return out.str();
    }

    nlohmann::json SaveManager::stateJson(const GameEngine& engine) {
        nlohmann::json j;
        j["spot_price"] = engine.getSpotPrice();
        j["implied_vol"] = engine.getImpliedVol();
        j["frame"] = engine.getFrame();
        j["trials"] = engine.getTrials();
        j["strikes"] = engine.getUniverse().strikes();
        j["tree_hits"] = strikeMap(engine.getTreeHits());
        j["retail_juice"] = strikeMap(engine.getRetailJuice());
        j["mm_juice"] = strikeMap(engine.getMmJuice());
        j["gamma_profile"] = strikeMap(engine.getGamma());
        j["ai_enabled"] = {
            {"retail", engine.isAiEnabled(AgentRole::RETAIL)},
            {"monkey", engine.isAiEnabled(AgentRole::MONKEY)}
        };
        j["paused"] = engine.isPaused();
        j["live_coconuts"] = engine.getCoconuts().size();
        j["current_slingshot"] = equipmentToJson(engine.getCurrentEquipment());
        return j;
    }

    std::string SaveManager::statisticsCsv(const GameEngine& engine) {
        std::ostringstream out;
        out << "strike,hits,retail_juice,mm_juice,gamma\n";
        for (Strike s : engine.getUniverse().strikes()) {
            out << s << ','
                << engine.getTreeHits().at(s) << ','
                << engine.getRetailJuice().at(s) << ','
                << engine.getMmJuice().at(s) << ','
                << engine.gammaAt(s) << '\n';
        }
        return out.str();
    }

    std::string SaveManager::saveGameState(const GameEngine& engine, std::string stamp) const {
        if (stamp.empty()) stamp = makeStamp();

        fs::path sessionDir = fs::path(baseDir_) / stamp;

        try {
            fs::create_directories(sessionDir);

            nlohmann::json state = stateJson(engine);
            state["timestamp"] = stamp;

            bool ok = writeFile(sessionDir / "game_state.json", state.dump(2));
            ok = writeFile(sessionDir / "retail_memories.json",
                engine.getRetailAgent().getMemory().toJson().dump(2)) && ok;
            ok = writeFile(sessionDir / "monkey_memories.json",
                engine.getMonkeyAgent().getMemory().toJson().dump(2)) && ok;
            ok = writeFile(sessionDir / "statistics.csv", statisticsCsv(engine)) && ok;

            if (!ok) {
                Logger::warn("Game state only partially saved to {}", sessionDir.string());
            }
            else {
                Logger::info("Game state saved to {}", sessionDir.string());
            }
            return sessionDir.string();
        }
        catch (const std::exception& e) {
            Logger::error("Error saving game state: {}", e.what());
            return "";
        }
    }

    std::optional<nlohmann::json> SaveManager::loadGameState(const std::string& stamp) const {
        fs::path sessionDir = fs::path(baseDir_) / stamp;
        fs::path stateFile = sessionDir / "game_state.json";

        std::error_code ec;
        if (!fs::exists(stateFile, ec)) {
            Logger::warn("No saved game found for {}", stamp);
            return std::nullopt;
        }

        try {
            std::ifstream file(stateFile);
            nlohmann::json state = nlohmann::json::parse(file);

            std::ifstream csv(sessionDir / "statistics.csv");
            if (csv.is_open()) {
                nlohmann::json rows = nlohmann::json::array();
                std::string line;
                std::getline(csv, line);
                auto header = splitCsvLine(line);

                while (std::getline(csv, line)) {
                    if (line.empty()) continue;
                    auto fields = splitCsvLine(line);
                    nlohmann::json row;
                    for (size_t i = 0; i < header.size() && i < fields.size(); ++i) {
                        row[header[i]] = std::stod(fields[i]);
                    }
                    rows.push_back(row);
                }
                state["statistics"] = rows;
            }
            return state;
        }
        catch (const std::exception& e) {
            Logger::error("Error loading saved game {}: {}", stamp, e.what());
            return std::nullopt;
        }
    }

    std::vector<nlohmann::json> SaveManager::listSavedGames() const {
        std::vector<nlohmann::json> games;

        std::error_code ec;
        if (!fs::is_directory(baseDir_, ec)) return games;

        for (const auto& entry : fs::directory_iterator(baseDir_, ec)) {
            if (!entry.is_directory()) continue;
            fs::path stateFile = entry.path() / "game_state.json";
            if (!fs::exists(stateFile)) continue;

            try {
                std::ifstream file(stateFile);
                auto state = nlohmann::json::parse(file);
                games.push_back({
                    {"timestamp", state.value("timestamp", entry.path().filename().string())},
                    {"spot_price", state.value("spot_price", 0.0)},
                    {"frame", state.value("frame", 0)}
                });
            }
            catch (const std::exception& e) {
                Logger::warn("Skipping unreadable save {}: {}", stateFile.string(), e.what());
            }
        }

        std::sort(games.begin(), games.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
            return a["timestamp"].get<std::string>() < b["timestamp"].get<std::string>();
        });
        return games;
    }

} // namespace jungle
