#pragma once

#include "core/Types.hpp"
#include "profiles/ProfileProvider.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jungle {

    // Named factor scores for one strike, each in [0, 1]
    using FactorScores = std::map<std::string, double>;

    // Role-agnostic scoring kernel shared by the retail and monkey decision
    // units: weight resolution, weighted factor sums and selection.
    class ScoringEngine {
    public:
        ScoringEngine(AgentRole role, const ProfileProvider* profiles);

        AgentRole getRole() const { return role_; }

        // Four fixed factors per role, used when no profile supplies weights
        static BehaviorWeights defaultWeights(AgentRole role);

        // Scale so the weights sum to 1; left untouched when the total is 0
        static void normalizeWeights(BehaviorWeights& weights);

        // weights[key] *= (1 + bias) when key is present
        static void boostWeight(BehaviorWeights& weights, const std::string& key, double bias);

        // Profile base weights with conditional bias boosts, renormalized
        static BehaviorWeights adjustWeights(const AgentProfile& profile, AgentRole role,
            const PsychMetrics& metrics);

        // Provider weights for the active profile, or the role defaults
        BehaviorWeights resolveWeights(const PsychMetrics& metrics) const;

        std::optional<AgentProfile> activeProfile() const;

        // Sum of factor * weight; factors without a weight contribute nothing
        static double weightedSum(const BehaviorWeights& weights, const FactorScores& factors);

        // Index of the highest score; the first one wins ties
        static size_t selectBest(const std::vector<double>& scores);

        // Top `n` strikes by score normalized to a distribution. If their
        // total is 0 the `n` strikes nearest `spot` get 1/n each.
        static std::vector<DefensePrediction> topDistribution(const std::vector<Strike>& strikes,
            const std::vector<double>& scores, size_t n, double spot);

        // distance factor: 1 / (1 + |strike - spot| / scale)
        static double distanceScore(Strike strike, double spot, double scale);

    private:
        AgentRole role_;
        const ProfileProvider* profiles_;
    };

} // namespace jungle
