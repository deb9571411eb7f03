#include "Agent.hpp"
#include "utils/Random.hpp"
#include <algorithm>

namespace jungle {

    Agent::Agent(std::string name, AgentRole role, const RuntimeConfig& config,
        const ProfileProvider* profiles, Random& rng)
        : name_(std::move(name))
        , role_(role)
        , params_(config.agents)
        , rng_(rng)
        , scoring_(role, profiles)
        , memory_(toString(role), rng,
            static_cast<size_t>(std::max(1, config.memory.maxMemories)),
            config.memory.persist ? config.memory.logsDir : "")
    {
        // Windows come straight from JSON; keep them usable as sizes
        params_.historyWindow = std::max(1, params_.historyWindow);
        params_.recentWindow = std::max(1, params_.recentWindow);
        params_.repeatLookback = std::max(0, params_.repeatLookback);
    }

    void Agent::recordOutcome(bool success) {
        outcomes_.push_back(success);
        while (outcomes_.size() > static_cast<size_t>(params_.historyWindow)) {
            outcomes_.pop_front();
        }
    }

    double Agent::recentRate(bool outcome) const {
        if (outcomes_.empty()) return 0.0;

        size_t window = std::min(outcomes_.size(), static_cast<size_t>(params_.recentWindow));
        if (window == 0) return 0.0;

        auto count = std::count(outcomes_.end() - window, outcomes_.end(), outcome);
        return static_cast<double>(count) / static_cast<double>(window);
    }

    std::vector<Memory> Agent::recall(const RecallContext& context, size_t limit) {
        return memory_.retrieve(context, limit);
    }

    void Agent::pushHistory(Strike strike) {
        history_.push_back(strike);
        while (history_.size() > static_cast<size_t>(params_.historyWindow)) {
            history_.pop_front();
        }
    }

    bool Agent::inRecentHistory(Strike strike, size_t lookback) const {
        size_t window = std::min(history_.size(), lookback);
        return std::find(history_.end() - window, history_.end(), strike) != history_.end();
    }

} // namespace jungle
