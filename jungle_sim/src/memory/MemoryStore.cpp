#include "MemoryStore.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace jungle {

    namespace {

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace

    nlohmann::json Memory::toJson() const {
        return {
            {"content", content},
            {"importance", importance},
            {"timestamp", timestamp},
            {"references", references}
        };
    }

    Memory Memory::fromJson(const nlohmann::json& j) {
        Memory m;
        m.content = j.at("content").get<std::string>();
        m.importance = j.at("importance").get<double>();
        m.timestamp = j.value("timestamp", Timestamp(0));
        m.references = j.value("references", 0);
        return m;
    }

    MemoryStore::MemoryStore(std::string agentName, Random& rng, size_t maxMemories,
        std::string logsDir, Clock clock)
        : agentName_(std::move(agentName))
        , rng_(rng)
        , maxMemories_(maxMemories)
        , logsDir_(std::move(logsDir))
        , clock_(std::move(clock))
    {
        if (!logsDir_.empty()) {
            load();
        }
    }

    std::string MemoryStore::priceToken(double price) {
        return fmt::format("{}", price);
    }

    void MemoryStore::add(const std::string& content, double importance) {
        Memory memory;
        memory.content = content;
        memory.importance = std::clamp(importance, 0.0, 1.0);
        memory.timestamp = clock_();
        memories_.push_back(std::move(memory));

        if (memories_.size() > maxMemories_) {
            curate();
        }

        save();
    }

    double MemoryStore::curationScore(const Memory& memory, Timestamp at) {
        double ageSeconds = at > memory.timestamp
            ? static_cast<double>(at - memory.timestamp) / 1000.0
            : 0.0;
        double ageFactor = 1.0 / (1.0 + ageSeconds / 86400.0);  // decays over days
        return memory.importance * (1.0 + memory.references / 10.0) * ageFactor;
    }

    void MemoryStore::curate() {
        Timestamp at = clock_();

        std::vector<std::pair<Memory, double>> scored;
        scored.reserve(memories_.size());
        for (auto& memory : memories_) {
            double score = curationScore(memory, at);
            scored.emplace_back(std::move(memory), score);
        }

        std::stable_sort(scored.begin(), scored.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });

        if (scored.size() > maxMemories_) {
            Logger::debug("[{}] curating {} memories down to {}",
                agentName_, scored.size(), maxMemories_);
            scored.resize(maxMemories_);
        }

        memories_.clear();
        for (auto& [memory, _] : scored) {
            memories_.push_back(std::move(memory));
        }
    }

    std::vector<Memory> MemoryStore::retrieve(const RecallContext& context, size_t limit) {
        std::string strikeToken = context.strikePrice ? std::to_string(*context.strikePrice) : "";
        std::string spotToken = context.spotPrice ? priceToken(*context.spotPrice) : "";

        std::vector<std::pair<size_t, double>> relevant;

        for (size_t i = 0; i < memories_.size(); ++i) {
            Memory& memory = memories_[i];
            double relevance = 0.0;

            if (!strikeToken.empty() && memory.content.find(strikeToken) != std::string::npos) {
                relevance += 0.3;
            }
            if (!spotToken.empty() && memory.content.find(spotToken) != std::string::npos) {
                relevance += 0.2;
            }

            std::string lowered = toLower(memory.content);
            if (context.recentSuccess && lowered.find("success") != std::string::npos) {
                relevance += 0.2;
            }
            else if (!context.recentSuccess && lowered.find("fail") != std::string::npos) {
                relevance += 0.2;
            }

            // Exploration term
            relevance += rng_.chance() * 0.1;

            if (relevance > 0) {
                relevant.emplace_back(i, relevance);
                memory.references++;
            }
        }

        std::stable_sort(relevant.begin(), relevant.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });

        std::vector<Memory> selected;
        for (size_t i = 0; i < relevant.size() && i < limit; ++i) {
            selected.push_back(memories_[relevant[i].first]);
        }

        save();
        return selected;
    }

    std::string MemoryStore::summarize() const {
        if (memories_.empty()) {
            return "No memories collected yet.";
        }

        std::vector<const Memory*> high;
        std::vector<const Memory*> medium;

        for (const auto& memory : memories_) {
            if (memory.importance >= 0.8) high.push_back(&memory);
            else if (memory.importance >= 0.5) medium.push_back(&memory);
        }

        auto byReferences = [](const Memory* a, const Memory* b) {
            return a->references > b->references;
        };
        std::stable_sort(high.begin(), high.end(), byReferences);
        std::stable_sort(medium.begin(), medium.end(), byReferences);

        std::ostringstream out;
        out << "Agent " << agentName_ << " Insights:";

        if (!high.empty()) {
            out << "\n\nKey Learnings:";
            for (size_t i = 0; i < high.size() && i < 3; ++i) {
                out << "\n- " << high[i]->content
                    << " (referenced " << high[i]->references << " times)";
            }
        }

        if (!medium.empty()) {
            out << "\n\nUseful Patterns:";
            for (size_t i = 0; i < medium.size() && i < 3; ++i) {
                out << "\n- " << medium[i]->content;
            }
        }

        return out.str();
    }

    std::string MemoryStore::filePath() const {
        if (logsDir_.empty()) return "";
        return (std::filesystem::path(logsDir_) / (agentName_ + "_memories.json")).string();
    }

    nlohmann::json MemoryStore::toJson() const {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& memory : memories_) {
            arr.push_back(memory.toJson());
        }
        return arr;
    }

    bool MemoryStore::save() const {
        if (logsDir_.empty()) return true;

        try {
            std::filesystem::create_directories(logsDir_);
            std::ofstream file(filePath());
            if (!file.is_open()) {
                Logger::warn("Could not open memory file {} for writing", filePath());
                return false;
            }
            file << toJson().dump(2);
            return true;
        }
        catch (const std::exception& e) {
            Logger::warn("Error saving memories for {}: {}", agentName_, e.what());
            return false;
        }
    }

    bool MemoryStore::load() {
        std::string path = filePath();
        if (path.empty() || !std::filesystem::exists(path)) return false;

        try {
            std::ifstream file(path);
            auto data = nlohmann::json::parse(file);

            std::vector<Memory> loaded;
            for (const auto& entry : data) {
                loaded.push_back(Memory::fromJson(entry));
            }
            memories_ = std::move(loaded);

            if (memories_.size() > maxMemories_) {
                curate();
            }

            Logger::info("Loaded {} memories for {}", memories_.size(), agentName_);
            return true;
        }
        catch (const std::exception& e) {
            Logger::warn("Error loading memories for {}: {}", agentName_, e.what());
            return false;
        }
    }

} // namespace jungle
