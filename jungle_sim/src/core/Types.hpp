#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <vector>
#include <map>
#include <array>

namespace jungle {

    using Strike = int;
    using Timestamp = uint64_t;   // epoch milliseconds

    enum class OptionType {
        CALL,
        PUT
    };

    enum class AgentRole {
        RETAIL,
        MONKEY
    };

    inline std::string toString(OptionType type) {
        return type == OptionType::CALL ? "call" : "put";
    }

    inline std::optional<OptionType> parseOptionType(const std::string& s) {
        if (s == "call") return OptionType::CALL;
        if (s == "put") return OptionType::PUT;
        return std::nullopt;
    }

    inline std::string toString(AgentRole role) {
        return role == AgentRole::RETAIL ? "retail" : "monkey";
    }

    inline std::optional<AgentRole> parseAgentRole(const std::string& s) {
        if (s == "retail") return AgentRole::RETAIL;
        if (s == "monkey") return AgentRole::MONKEY;
        return std::nullopt;
    }

    // A slingshot: the stat bundle that parameterizes a launch
    struct Equipment {
        std::string name;
        double power = 1.0;
        double accuracy = 0.8;
        int dte = 5;                       // days to expiry
        OptionType optionType = OptionType::CALL;
        std::array<int, 3> color{ 139, 69, 19 };
        int size = 10;
        int strikeBias = 0;                // preferred offset from spot
    };

    // Snapshot supplied by the market data provider, immutable for a tick
    struct MarketState {
        double price = 0.0;
        double impliedVol = 0.0;
        std::vector<Strike> strikes;
        std::map<Strike, double> gammaProfile;
        Timestamp timestamp = 0;
    };

    // Fast-path target served by the market data provider
    struct SlingshotTarget {
        Strike strike;
        double attractiveness;
        OptionType optionType;
        int dte;
    };

    // Typed per-tick view of the game handed to agents and collaborators.
    // crowdSize / retailClustering are derived by the engine when the
    // snapshot is built.
    struct GameStateSnapshot {
        double spotPrice = 0.0;
        std::vector<Strike> strikes;
        std::map<Strike, int> treeHits;
        std::map<Strike, double> retailJuice;
        std::map<Strike, double> mmJuice;
        int frame = 0;
        std::string currentEquipmentName;
        OptionType optionType = OptionType::CALL;

        std::map<Strike, int> crowdSize;
        std::map<Strike, double> retailClustering;
    };

    struct TargetSelection {
        Strike strike;
        double confidence;
    };

    struct DefensePrediction {
        Strike strike;
        double probability;
    };

    inline Timestamp now() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

} // namespace jungle
