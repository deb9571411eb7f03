#include "RetailAgent.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cmath>

namespace jungle {

    RetailAgent::RetailAgent(const RuntimeConfig& config, const ProfileProvider* profiles,
        Random& rng, std::string name)
        : Agent(std::move(name), AgentRole::RETAIL, config, profiles, rng)
    {
    }

    PsychMetrics RetailAgent::measure(const GameStateSnapshot& state) const {
        PsychMetrics metrics;
        metrics.recentSuccessRate = recentRate(true);
        for (const auto& [_, crowd] : state.crowdSize) {
            metrics.crowdSize = std::max(metrics.crowdSize, crowd);
        }
        return metrics;
    }

    TargetSelection RetailAgent::selectTarget(const GameStateSnapshot& state) {
        if (state.strikes.empty()) {
            Logger::warn("[{}] no strikes to score, falling back to spot", name_);
            return { static_cast<Strike>(std::lround(state.spotPrice)), 0.5 };
        }

        BehaviorWeights weights = scoring_.resolveWeights(measure(state));

        auto lookup = [](const auto& m, Strike s) {
            auto it = m.find(s);
            return it != m.end() ? static_cast<double>(it->second) : 0.0;
        };

        std::vector<double> scores;
        scores.reserve(state.strikes.size());
        for (Strike strike : state.strikes) {
            FactorScores factors;
            factors["spot_distance"] = ScoringEngine::distanceScore(strike, state.spotPrice, params_.distanceScale);
            factors["success_history"] = inRecentHistory(strike, params_.recentWindow) ? 1.0 : 0.0;
            factors["mm_defense"] = std::clamp(1.0 - lookup(state.mmJuice, strike), 0.0, 1.0);
            factors["crowd_following"] = std::min(1.0, lookup(state.crowdSize, strike) / 5.0);
            scores.push_back(ScoringEngine::weightedSum(weights, factors));
        }

        // FOMO: sometimes pile onto the most crowded strike
        auto profile = scoring_.activeProfile();
        if (profile && rng_.chance() < profile->trait("fomo_threshold")) {
            size_t crowded = 0;
            for (size_t i = 1; i < state.strikes.size(); ++i) {
                if (lookup(state.crowdSize, state.strikes[i]) > lookup(state.crowdSize, state.strikes[crowded])) {
                    crowded = i;
                }
            }
            scores[crowded] *= params_.fomoBoost;
        }

        size_t best = ScoringEngine::selectBest(scores);
        TargetSelection selection{ state.strikes[best], std::min(scores[best], 1.0) };

        pushHistory(selection.strike);

        Logger::debug("[{}] target {} (score {:.3f})", name_, selection.strike, scores[best]);
        return selection;
    }

} // namespace jungle
