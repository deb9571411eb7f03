#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace jungle {

    using BehaviorWeights = std::map<std::string, double>;

    // A named behavioral profile. Immutable once loaded.
    struct AgentProfile {
        std::string name;
        std::string goal;
        std::map<std::string, double> traits;     // JSON booleans stored as 1.0 / 0.0
        std::vector<std::string> strategies;
        std::map<std::string, double> biases;
        BehaviorWeights behaviorWeights;

        double trait(const std::string& key, double fallback = 0.0) const {
            auto it = traits.find(key);
            return it != traits.end() ? it->second : fallback;
        }

        bool flag(const std::string& key) const {
            return trait(key, 0.0) != 0.0;
        }

        double bias(const std::string& key) const {
            auto it = biases.find(key);
            return it != biases.end() ? it->second : 0.0;
        }

        static AgentProfile fromJson(const nlohmann::json& j) {
            AgentProfile p;
            p.name = j.at("name").get<std::string>();
            p.goal = j.value("goal", "");

            if (j.contains("traits")) {
                for (auto& [key, value] : j["traits"].items()) {
                    if (value.is_boolean()) p.traits[key] = value.get<bool>() ? 1.0 : 0.0;
                    else if (value.is_number()) p.traits[key] = value.get<double>();
                }
            }
            if (j.contains("strategies")) {
                p.strategies = j["strategies"].get<std::vector<std::string>>();
            }
            if (j.contains("biases")) {
                p.biases = j["biases"].get<std::map<std::string, double>>();
            }
            if (j.contains("behavior_weights")) {
                p.behaviorWeights = j["behavior_weights"].get<BehaviorWeights>();
            }
            return p;
        }

        nlohmann::json toJson() const {
            return {
                {"name", name},
                {"goal", goal},
                {"traits", traits},
                {"strategies", strategies},
                {"biases", biases},
                {"behavior_weights", behaviorWeights}
            };
        }
    };

} // namespace jungle
