#include "ScoringEngine.hpp"
#include "core/StrikeUniverse.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace jungle {

    ScoringEngine::ScoringEngine(AgentRole role, const ProfileProvider* profiles)
        : role_(role)
        , profiles_(profiles)
    {
    }

    BehaviorWeights ScoringEngine::defaultWeights(AgentRole role) {
        if (role == AgentRole::RETAIL) {
            return {
                {"spot_distance",   0.3},
                {"success_history", 0.2},
                {"mm_defense",      0.3},
                {"crowd_following", 0.2}
            };
        }
        return {
            {"spot_distance",     0.3},
            {"hit_history",       0.2},
            {"juice_collection",  0.3},
            {"retail_clustering", 0.2}
        };
    }

    void ScoringEngine::normalizeWeights(BehaviorWeights& weights) {
        double total = 0.0;
        for (const auto& [_, w] : weights) total += w;
        if (total <= 0.0) return;

        for (auto& [_, w] : weights) w /= total;
    }

    void ScoringEngine::boostWeight(BehaviorWeights& weights, const std::string& key, double bias) {
        auto it = weights.find(key);
        if (it != weights.end()) {
            it->second *= (1.0 + bias);
        }
    }

    BehaviorWeights ScoringEngine::adjustWeights(const AgentProfile& profile, AgentRole role,
        const PsychMetrics& metrics) {
        BehaviorWeights weights = profile.behaviorWeights;

        if (role == AgentRole::RETAIL) {
            // Overconfidence when doing well, herding when strikes get crowded
            if (metrics.recentSuccessRate > 0.5) {
                boostWeight(weights, "spot_distance", profile.bias("overconfidence"));
            }
            if (metrics.crowdSize > 3) {
                boostWeight(weights, "crowd_following", profile.bias("herd_mentality"));
            }
        }
        else {
            if (metrics.recentLossRate > 0.3) {
                boostWeight(weights, "spot_distance", profile.bias("loss_aversion"));
            }
            if (metrics.retailClustering > 0.5) {
                boostWeight(weights, "retail_clustering", profile.bias("recency"));
            }
        }

        normalizeWeights(weights);
        return weights;
    }

    BehaviorWeights ScoringEngine::resolveWeights(const PsychMetrics& metrics) const {
        BehaviorWeights weights;
        if (profiles_) {
            weights = profiles_->weightsFor(role_, metrics);
        }
        if (weights.empty()) {
            weights = defaultWeights(role_);
        }
        return weights;
    }

    std::optional<AgentProfile> ScoringEngine::activeProfile() const {
        if (!profiles_) return std::nullopt;
        return profiles_->getActiveProfile(role_);
    }

    double ScoringEngine::weightedSum(const BehaviorWeights& weights, const FactorScores& factors) {
        double score = 0.0;
        for (const auto& [name, value] : factors) {
            auto it = weights.find(name);
            if (it != weights.end()) {
                score += value * it->second;
            }
        }
        return score;
    }

    size_t ScoringEngine::selectBest(const std::vector<double>& scores) {
        size_t best = 0;
        for (size_t i = 1; i < scores.size(); ++i) {
            if (scores[i] > scores[best]) best = i;
        }
        return best;
    }

    std::vector<DefensePrediction> ScoringEngine::topDistribution(const std::vector<Strike>& strikes,
        const std::vector<double>& scores, size_t n, double spot) {
        std::vector<DefensePrediction> predictions;
        if (strikes.empty() || n == 0) return predictions;

        std::vector<size_t> order(strikes.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
            [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });

        size_t take = std::min(n, order.size());
        double total = 0.0;
        for (size_t i = 0; i < take; ++i) total += scores[order[i]];

        if (total > 0.0) {
            for (size_t i = 0; i < take; ++i) {
                predictions.push_back({ strikes[order[i]], scores[order[i]] / total });
            }
            return predictions;
        }

        // Nothing stands out: guard the strikes around spot equally
        auto nearby = StrikeUniverse(strikes).nearest(spot, n);
        for (Strike s : nearby) {
            predictions.push_back({ s, 1.0 / static_cast<double>(nearby.size()) });
        }
        return predictions;
    }

    double ScoringEngine::distanceScore(Strike strike, double spot, double scale) {
        double distance = std::abs(strike - spot);
        return 1.0 / (1.0 + distance / scale);
    }

} // namespace jungle
