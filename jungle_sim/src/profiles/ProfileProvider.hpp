#pragma once

#include "AgentProfile.hpp"
#include "core/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace jungle {

    // Psychological readings an agent derives before scoring
    struct PsychMetrics {
        double recentSuccessRate = 0.0;    // retail
        int    crowdSize = 0;              // retail: max over strikes
        double recentLossRate = 0.0;       // monkey
        double retailClustering = 0.0;     // monkey: max over strikes
    };

    // Source of behavioral profiles per agent role
    class ProfileProvider {
    public:
        virtual ~ProfileProvider() = default;

        virtual std::optional<AgentProfile> getActiveProfile(AgentRole role) const = 0;
        virtual std::vector<std::string> listProfiles(AgentRole role) const = 0;
        virtual bool switchProfile(AgentRole role, const std::string& name) = 0;

        // Active profile's weights with its biases applied and renormalized.
        // Empty when no profile is active for the role.
        BehaviorWeights weightsFor(AgentRole role, const PsychMetrics& metrics) const;
    };

} // namespace jungle
