#include "MonkeyAgent.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <algorithm>

namespace jungle {

    MonkeyAgent::MonkeyAgent(const RuntimeConfig& config, const ProfileProvider* profiles,
        Random& rng, std::string name)
        : Agent(std::move(name), AgentRole::MONKEY, config, profiles, rng)
    {
    }

    PsychMetrics MonkeyAgent::measure(const GameStateSnapshot& state) const {
        PsychMetrics metrics;
        metrics.recentLossRate = recentRate(false);
        for (const auto& [_, clustering] : state.retailClustering) {
            metrics.retailClustering = std::max(metrics.retailClustering, clustering);
        }
        return metrics;
    }

    std::vector<DefensePrediction> MonkeyAgent::predictDefended(const GameStateSnapshot& state) {
        if (state.strikes.empty()) {
            Logger::warn("[{}] no strikes to defend", name_);
            return {};
        }

        PsychMetrics metrics = measure(state);
        BehaviorWeights weights = scoring_.resolveWeights(metrics);

        auto clusteringAt = [&state](Strike s) {
            auto it = state.retailClustering.find(s);
            return it != state.retailClustering.end() ? it->second : 0.01;
        };

        std::vector<double> scores;
        scores.reserve(state.strikes.size());
        for (Strike strike : state.strikes) {
            auto hitIt = state.treeHits.find(strike);
            auto juiceIt = state.retailJuice.find(strike);
            double hits = hitIt != state.treeHits.end() ? hitIt->second : 0.0;
            double juice = juiceIt != state.retailJuice.end() ? juiceIt->second : 0.0;

            FactorScores factors;
            factors["spot_distance"] = ScoringEngine::distanceScore(strike, state.spotPrice, params_.distanceScale);
            factors["hit_history"] = std::min(1.0, hits / 10.0);
            factors["juice_collection"] = std::min(1.0, juice);
            factors["retail_clustering"] = clusteringAt(strike);
            scores.push_back(ScoringEngine::weightedSum(weights, factors));
        }

        if (auto profile = scoring_.activeProfile()) {
            // Risk aversion: double down on recently defended strikes while losing
            if (metrics.recentLossRate > profile->trait("risk_aversion")) {
                for (size_t i = 0; i < state.strikes.size(); ++i) {
                    if (inRecentHistory(state.strikes[i], params_.repeatLookback)) {
                        scores[i] *= params_.repeatDefenseBoost;
                    }
                }
            }

            if (profile->flag("reflexivity_awareness")) {
                size_t clustered = 0;
                for (size_t i = 1; i < state.strikes.size(); ++i) {
                    if (clusteringAt(state.strikes[i]) > clusteringAt(state.strikes[clustered])) {
                        clustered = i;
                    }
                }
                scores[clustered] *= params_.reflexivityBoost;
            }
        }

        auto predictions = ScoringEngine::topDistribution(state.strikes, scores,
            static_cast<size_t>(std::max(1, params_.defenseTopN)), state.spotPrice);

        if (!predictions.empty()) {
            pushHistory(predictions.front().strike);
            Logger::debug("[{}] defending {} (p={:.2f})", name_,
                predictions.front().strike, predictions.front().probability);
        }
        return predictions;
    }

} // namespace jungle
