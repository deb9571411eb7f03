#pragma once

#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <type_traits>

namespace jungle {

    inline nlohmann::json equipmentToJson(const Equipment& e) {
        return {
            {"name",        e.name},
            {"power",       e.power},
            {"accuracy",    e.accuracy},
            {"dte",         e.dte},
            {"option_type", toString(e.optionType)},
            {"color",       e.color},
            {"size",        e.size},
            {"strike_bias", e.strikeBias}
        };
    }

    inline Equipment equipmentFromJson(const nlohmann::json& j) {
        Equipment e;
        e.name = j.at("name").get<std::string>();
        e.power = j.value("power", e.power);
        e.accuracy = j.value("accuracy", e.accuracy);
        e.dte = j.value("dte", e.dte);
        if (auto type = parseOptionType(j.value("option_type", std::string("call")))) {
            e.optionType = *type;
        }
        if (j.contains("color") && j["color"].is_array() && j["color"].size() == 3) {
            e.color = j["color"].get<std::array<int, 3>>();
        }
        e.size = j.value("size", e.size);
        e.strikeBias = j.value("strike_bias", e.strikeBias);
        return e;
    }

    inline std::vector<Equipment> defaultSlingshots() {
        Equipment basic;
        basic.name = "Basic Call";
        basic.power = 1.0;
        basic.accuracy = 0.8;
        basic.dte = 5;
        basic.optionType = OptionType::CALL;
        basic.color = { 139, 69, 19 };
        basic.size = 10;
        basic.strikeBias = 5;

        Equipment power;
        power.name = "Power Put";
        power.power = 1.5;
        power.accuracy = 0.6;
        power.dte = 3;
        power.optionType = OptionType::PUT;
        power.color = { 178, 34, 34 };
        power.size = 14;
        power.strikeBias = -5;

        Equipment sniper;
        sniper.name = "Sniper Call";
        sniper.power = 0.8;
        sniper.accuracy = 0.95;
        sniper.dte = 10;
        sniper.optionType = OptionType::CALL;
        sniper.color = { 34, 139, 34 };
        sniper.size = 8;
        sniper.strikeBias = 2;

        return { basic, power, sniper };
    }

    /// Central, JSON-serialisable configuration for every tunable knob in the
    /// game. Every sub-struct carries defaults so the engine works
    /// out-of-the-box; a config file only needs the keys it changes.

    struct RuntimeConfig {

        // ---- Episode / frame cadence ---------------------------------------------
        struct GameParams {
            int     width = 1280;
            int     height = 720;
            int     fps = 60;            // frames per simulated DTE day
            int     trials = 1000;       // launch cap per episode
            int     tickRateMs = 16;
            int     maxTicks = 0;        // 0 = unlimited
            int64_t seed = -1;           // < 0 = seed from the OS
            int     saveIntervalFrames = 100;  // autosave cadence, 0 = off
        } game;

        // ---- Hit probability model -----------------------------------------------
        struct HitModelParams {
            double defenseFactor = 0.5;          // multiplier on a defended strike
            double mmShare = 0.7;                // juice split on a hit
            double hitImportance = 0.7;
            double missImportance = 0.5;
            double defenseSuccessImportance = 0.8;
            double defenseFailureImportance = 0.6;
        } hitModel;

        // ---- Coconut flight ------------------------------------------------------
        struct CoconutParams {
            double minSpeed = 0.01;
            double maxSpeed = 0.03;
            double arcHeightPerPower = 100.0;
            double targetOffsetX = 10.0;
            double maxTreeSpacing = 30.0;
            double treeInsetY = 120.0;
        } coconut;

        // ---- Agent decision units ------------------------------------------------
        struct AgentParams {
            int    historyWindow = 10;       // rolling outcome / target history
            int    recentWindow = 5;         // slice used for rates & repeat bonus
            int    defenseTopN = 3;
            int    repeatLookback = 3;       // monkey: recent defenses boosted
            double distanceScale = 5.0;
            double fomoBoost = 1.5;
            double reflexivityBoost = 1.3;
            double repeatDefenseBoost = 1.2;
        } agents;

        // ---- Episodic memory -----------------------------------------------------
        struct MemoryParams {
            int         maxMemories = 100;
            std::string logsDir = "logs";
            bool        persist = true;
        } memory;

        // ---- Market snapshot fallback --------------------------------------------
        struct MarketParams {
            double      fallbackPrice = 628.86;
            double      fallbackVol = 13.7;
            int         strikeMin = 610;
            int         strikeMax = 646;
            std::string snapshotPath;              // optional JSON snapshot
            bool        useSlingshotTargets = false;
            double      minAttractiveness = 0.3;
            int         refreshIntervalMs = 300000;
        } market;

        // ---- Behavioral profiles -------------------------------------------------
        struct ProfileParams {
            std::string directory = "data/profiles";
            std::string activeRetail = "retail_profile.json";
            std::string activeMonkey = "monkey_profile.json";
        } profiles;

        // ---- Slingshot catalog ---------------------------------------------------
        struct EquipmentParams {
            std::vector<Equipment> slingshots = defaultSlingshots();
            std::string defaultSlingshot = "Basic Call";
        } equipment;

        const Equipment* findSlingshot(const std::string& name) const {
            for (const auto& s : equipment.slingshots) {
                if (s.name == name) return &s;
            }
            return nullptr;
        }

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["game"] = {
                {"width",      game.width},
                {"height",     game.height},
                {"fps",        game.fps},
                {"trials",     game.trials},
                {"tickRateMs", game.tickRateMs},
                {"maxTicks",   game.maxTicks},
                {"seed",       game.seed},
                {"saveIntervalFrames", game.saveIntervalFrames}
            };

            j["hitModel"] = {
                {"defenseFactor",            hitModel.defenseFactor},
                {"mmShare",                  hitModel.mmShare},
                {"hitImportance",            hitModel.hitImportance},
                {"missImportance",           hitModel.missImportance},
                {"defenseSuccessImportance", hitModel.defenseSuccessImportance},
                {"defenseFailureImportance", hitModel.defenseFailureImportance}
            };

            j["coconut"] = {
                {"minSpeed",          coconut.minSpeed},
                {"maxSpeed",          coconut.maxSpeed},
                {"arcHeightPerPower", coconut.arcHeightPerPower},
                {"targetOffsetX",     coconut.targetOffsetX},
                {"maxTreeSpacing",    coconut.maxTreeSpacing},
                {"treeInsetY",        coconut.treeInsetY}
            };

            j["agents"] = {
                {"historyWindow",      agents.historyWindow},
                {"recentWindow",       agents.recentWindow},
                {"defenseTopN",        agents.defenseTopN},
                {"repeatLookback",     agents.repeatLookback},
                {"distanceScale",      agents.distanceScale},
                {"fomoBoost",          agents.fomoBoost},
                {"reflexivityBoost",   agents.reflexivityBoost},
                {"repeatDefenseBoost", agents.repeatDefenseBoost}
            };

            j["memory"] = {
                {"maxMemories", memory.maxMemories},
                {"logsDir",     memory.logsDir},
                {"persist",     memory.persist}
            };

            j["market"] = {
                {"fallbackPrice",       market.fallbackPrice},
                {"fallbackVol",         market.fallbackVol},
                {"strikeMin",           market.strikeMin},
                {"strikeMax",           market.strikeMax},
                {"snapshotPath",        market.snapshotPath},
                {"useSlingshotTargets", market.useSlingshotTargets},
                {"minAttractiveness",   market.minAttractiveness},
                {"refreshIntervalMs",   market.refreshIntervalMs}
            };

            j["profiles"] = {
                {"directory",    profiles.directory},
                {"activeRetail", profiles.activeRetail},
                {"activeMonkey", profiles.activeMonkey}
            };

            nlohmann::json slingshots = nlohmann::json::array();
            for (const auto& s : equipment.slingshots) {
                slingshots.push_back(equipmentToJson(s));
            }
            j["equipment"] = {
                {"slingshots",       slingshots},
                {"defaultSlingshot", equipment.defaultSlingshot}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("game")) {
                auto& g = j["game"];
                get(g, "width", game.width);
                get(g, "height", game.height);
                get(g, "fps", game.fps);
                get(g, "trials", game.trials);
                get(g, "tickRateMs", game.tickRateMs);
                get(g, "maxTicks", game.maxTicks);
                get(g, "seed", game.seed);
                get(g, "saveIntervalFrames", game.saveIntervalFrames);
            }

            if (j.contains("hitModel")) {
                auto& h = j["hitModel"];
                get(h, "defenseFactor", hitModel.defenseFactor);
                get(h, "mmShare", hitModel.mmShare);
                get(h, "hitImportance", hitModel.hitImportance);
                get(h, "missImportance", hitModel.missImportance);
                get(h, "defenseSuccessImportance", hitModel.defenseSuccessImportance);
                get(h, "defenseFailureImportance", hitModel.defenseFailureImportance);
            }

            if (j.contains("coconut")) {
                auto& c = j["coconut"];
                get(c, "minSpeed", coconut.minSpeed);
                get(c, "maxSpeed", coconut.maxSpeed);
                get(c, "arcHeightPerPower", coconut.arcHeightPerPower);
                get(c, "targetOffsetX", coconut.targetOffsetX);
                get(c, "maxTreeSpacing", coconut.maxTreeSpacing);
                get(c, "treeInsetY", coconut.treeInsetY);
            }

            if (j.contains("agents")) {
                auto& a = j["agents"];
                get(a, "historyWindow", agents.historyWindow);
                get(a, "recentWindow", agents.recentWindow);
                get(a, "defenseTopN", agents.defenseTopN);
                get(a, "repeatLookback", agents.repeatLookback);
                get(a, "distanceScale", agents.distanceScale);
                get(a, "fomoBoost", agents.fomoBoost);
                get(a, "reflexivityBoost", agents.reflexivityBoost);
                get(a, "repeatDefenseBoost", agents.repeatDefenseBoost);
            }

            if (j.contains("memory")) {
                auto& m = j["memory"];
                get(m, "maxMemories", memory.maxMemories);
                get(m, "logsDir", memory.logsDir);
                get(m, "persist", memory.persist);
            }

            if (j.contains("market")) {
                auto& m = j["market"];
                get(m, "fallbackPrice", market.fallbackPrice);
                get(m, "fallbackVol", market.fallbackVol);
                get(m, "strikeMin", market.strikeMin);
                get(m, "strikeMax", market.strikeMax);
                get(m, "snapshotPath", market.snapshotPath);
                get(m, "useSlingshotTargets", market.useSlingshotTargets);
                get(m, "minAttractiveness", market.minAttractiveness);
                get(m, "refreshIntervalMs", market.refreshIntervalMs);
            }

            if (j.contains("profiles")) {
                auto& p = j["profiles"];
                get(p, "directory", profiles.directory);
                get(p, "activeRetail", profiles.activeRetail);
                get(p, "activeMonkey", profiles.activeMonkey);
            }

            if (j.contains("equipment")) {
                auto& e = j["equipment"];
                if (e.contains("slingshots")) {
                    equipment.slingshots.clear();
                    for (const auto& s : e["slingshots"]) {
                        equipment.slingshots.push_back(equipmentFromJson(s));
                    }
                }
                get(e, "defaultSlingshot", equipment.defaultSlingshot);
            }
        }

        /// Populate from the portfolio.json layout (slingshot catalog + market
        /// fallbacks)
        void fromPortfolioJson(const nlohmann::json& portfolio) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (portfolio.contains("data_settings")) {
                auto& d = portfolio["data_settings"];
                get(d, "fallback_price", market.fallbackPrice);
                get(d, "fallback_vol", market.fallbackVol);
            }

            int defaultDte = 0;
            if (portfolio.contains("market_settings")) {
                auto& m = portfolio["market_settings"];
                get(m, "default_dte", defaultDte);
                if (m.contains("strike_range") && m["strike_range"].size() == 2) {
                    int base = static_cast<int>(market.fallbackPrice + 0.5);
                    market.strikeMin = base + m["strike_range"][0].get<int>();
                    market.strikeMax = base + m["strike_range"][1].get<int>();
                }
            }

            if (portfolio.contains("slingshots")) {
                equipment.slingshots.clear();
                for (const auto& s : portfolio["slingshots"]) {
                    Equipment e = equipmentFromJson(s);
                    if (!s.contains("dte") && defaultDte > 0) e.dte = defaultDte;
                    equipment.slingshots.push_back(e);
                }
            }
            get(portfolio, "default_slingshot", equipment.defaultSlingshot);
        }
    };

} // namespace jungle
