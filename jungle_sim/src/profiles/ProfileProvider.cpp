#include "ProfileProvider.hpp"
#include "agents/ScoringEngine.hpp"

namespace jungle {

    BehaviorWeights ProfileProvider::weightsFor(AgentRole role, const PsychMetrics& metrics) const {
        auto profile = getActiveProfile(role);
        if (!profile) return {};
        return ScoringEngine::adjustWeights(*profile, role, metrics);
    }

} // namespace jungle
