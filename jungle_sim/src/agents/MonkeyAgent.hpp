#pragma once

#include "Agent.hpp"
#include <vector>

namespace jungle {

    // Defensive market maker: predicts which strikes retail will hit next.
    class MonkeyAgent : public Agent {
    public:
        MonkeyAgent(const RuntimeConfig& config, const ProfileProvider* profiles, Random& rng,
            std::string name = "MonkeyAgent");

        // Top defenseTopN strikes with probabilities summing to 1.
        // Empty only when the snapshot has no strikes.
        std::vector<DefensePrediction> predictDefended(const GameStateSnapshot& state);

        // Success means the defense held
        void recordDefenseResult(bool success) { recordOutcome(success); }

        PsychMetrics measure(const GameStateSnapshot& state) const;

        std::string getType() const override { return "Monkey"; }
    };

} // namespace jungle
