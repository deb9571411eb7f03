#pragma once

#include "ScoringEngine.hpp"
#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include "memory/MemoryStore.hpp"
#include <deque>
#include <string>

namespace jungle {

    class Random;

    // A decision unit: scoring kernel + episodic memory + rolling history.
    class Agent {
    public:
        Agent(std::string name, AgentRole role, const RuntimeConfig& config,
            const ProfileProvider* profiles, Random& rng);
        virtual ~Agent() = default;

        virtual std::string getType() const = 0;

        // Feedback signal for later scoring; keeps the last historyWindow outcomes
        void recordOutcome(bool success);

        // Share of the last recentWindow outcomes equal to `outcome` (0 when empty)
        double recentRate(bool outcome) const;

        std::vector<Memory> recall(const RecallContext& context, size_t limit = 5);

        const std::string& getName() const { return name_; }
        AgentRole getRole() const { return role_; }
        MemoryStore& getMemory() { return memory_; }
        const MemoryStore& getMemory() const { return memory_; }
        const ScoringEngine& getScoring() const { return scoring_; }
        const std::deque<bool>& getOutcomes() const { return outcomes_; }
        const std::deque<Strike>& getHistory() const { return history_; }

    protected:
        std::string name_;
        AgentRole role_;
        RuntimeConfig::AgentParams params_;
        Random& rng_;
        ScoringEngine scoring_;
        MemoryStore memory_;

        std::deque<bool> outcomes_;
        std::deque<Strike> history_;      // chosen targets / top defenses

        void pushHistory(Strike strike);

        // Was `strike` among the last `lookback` history entries
        bool inRecentHistory(Strike strike, size_t lookback) const;
    };

} // namespace jungle
