#pragma once

#include "Agent.hpp"

namespace jungle {

    // Aggressive targeter: picks the strike to launch at.
    //
    // Factors per strike:
    //   spot_distance    1 / (1 + |strike - spot| / 5)
    //   success_history  1 if the strike was among the last 5 targets
    //   mm_defense       1 - mm_juice, clamped to [0, 1]
    //   crowd_following  min(1, crowd / 5)
    class RetailAgent : public Agent {
    public:
        RetailAgent(const RuntimeConfig& config, const ProfileProvider* profiles, Random& rng,
            std::string name = "RetailAgent");

        // Highest scoring strike and min(score, 1). With no strikes at all
        // the rounded spot is returned with confidence 0.5.
        TargetSelection selectTarget(const GameStateSnapshot& state);

        PsychMetrics measure(const GameStateSnapshot& state) const;

        std::string getType() const override { return "Retail"; }
    };

} // namespace jungle
