#pragma once

#include "core/Types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jungle {

    class Random;

    struct Memory {
        std::string content;
        double importance = 0.0;     // [0, 1]
        Timestamp timestamp = 0;
        int references = 0;          // how often retrieval has scored this memory

        nlohmann::json toJson() const;
        static Memory fromJson(const nlohmann::json& j);
    };

    // What the caller is currently thinking about when recalling memories
    struct RecallContext {
        std::optional<Strike> strikePrice;
        std::optional<double> spotPrice;
        bool recentSuccess = false;
    };

    // Bounded episodic log for one agent. Once the capacity is exceeded the
    // lowest scoring memories are evicted, where
    //   score = importance * (1 + references / 10) * 1 / (1 + age_seconds / 86400)
    class MemoryStore {
    public:
        using Clock = std::function<Timestamp()>;

        // An empty `logsDir` keeps the store in memory only
        MemoryStore(std::string agentName, Random& rng, size_t maxMemories = 100,
            std::string logsDir = "", Clock clock = now);

        void add(const std::string& content, double importance);

        // Ranks memories by relevance to `context` and returns the best `limit`.
        // Every memory that scores above zero gets its reference counter bumped,
        // returned or not.
        std::vector<Memory> retrieve(const RecallContext& context, size_t limit = 5);

        void curate();

        std::string summarize() const;

        const std::vector<Memory>& getMemories() const { return memories_; }
        const std::string& getAgentName() const { return agentName_; }
        size_t size() const { return memories_.size(); }
        size_t capacity() const { return maxMemories_; }
        void clear() { memories_.clear(); }

        // Persistence; failures are logged and reported as false
        std::string filePath() const;
        bool save() const;
        bool load();
        nlohmann::json toJson() const;

        static double curationScore(const Memory& memory, Timestamp at);

        // Canonical text for a price so memory content and recall agree
        static std::string priceToken(double price);

    private:
        std::string agentName_;
        Random& rng_;
        size_t maxMemories_;
        std::string logsDir_;
        Clock clock_;
        std::vector<Memory> memories_;
    };

} // namespace jungle
