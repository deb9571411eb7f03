#pragma once

#include "HitModel.hpp"
#include "core/Types.hpp"
#include "core/Coconut.hpp"
#include "core/RuntimeConfig.hpp"
#include "core/StrikeUniverse.hpp"
#include "agents/RetailAgent.hpp"
#include "agents/MonkeyAgent.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace jungle {

    class Random;
    class ProfileProvider;
    class MarketDataProvider;

    // Single owner of the episode state. Everything mutates inside update();
    // collaborators only ever see copies via getGameState().
    class GameEngine {
    public:
        // Throws std::invalid_argument when `market.strikes` is empty.
        // `profiles` and `marketData` may be null.
        GameEngine(const RuntimeConfig& config, const MarketState& market, Random& rng,
            ProfileProvider* profiles = nullptr, const MarketDataProvider* marketData = nullptr);

        // One frame: launch (while frame < trials), then advance and drain
        // the live coconuts
        void update();

        void togglePause();
        bool isPaused() const { return paused_; }

        void toggleAi(AgentRole role);
        bool isAiEnabled(AgentRole role) const { return aiEnabled_.at(role); }

        // Clears aggregates, live coconuts and the frame counter.
        // Agent histories and memories survive.
        void reset();

        bool switchEquipment(const std::string& name);

        // Index into the provider's sorted profile list for the role
        bool switchProfile(AgentRole role, size_t index);

        // Takes the new spot and volatility; strikes and gamma stay fixed
        void applyMarketState(const MarketState& market);

        GameStateSnapshot getGameState() const;

        // Nearest valid strike; logs when the input was outside the universe
        Strike snapStrike(double strike) const;

        std::string getMemorySummary(AgentRole role) const;
        std::vector<Memory> recallMemories(AgentRole role, const RecallContext& context, size_t limit = 5);

        // Episode status
        int getFrame() const { return frame_; }
        int getTrials() const { return config_.game.trials; }
        bool isLaunchComplete() const { return frame_ >= config_.game.trials; }
        bool isEpisodeComplete() const { return isLaunchComplete() && coconuts_.empty(); }
        uint64_t getResolvedCount() const { return resolvedCount_; }

        // State access
        double getSpotPrice() const { return spot_; }
        double getImpliedVol() const { return impliedVol_; }
        const StrikeUniverse& getUniverse() const { return universe_; }
        const std::map<Strike, double>& getGamma() const { return gamma_; }
        double gammaAt(Strike strike) const;
        const std::map<Strike, int>& getTreeHits() const { return treeHits_; }
        const std::map<Strike, double>& getRetailJuice() const { return retailJuice_; }
        const std::map<Strike, double>& getMmJuice() const { return mmJuice_; }
        const std::vector<Coconut>& getCoconuts() const { return coconuts_; }
        const Equipment& getCurrentEquipment() const { return currentEquipment_; }
        Point getTreePosition(Strike strike) const;

        RetailAgent& getRetailAgent() { return retail_; }
        const RetailAgent& getRetailAgent() const { return retail_; }
        MonkeyAgent& getMonkeyAgent() { return monkey_; }
        const MonkeyAgent& getMonkeyAgent() const { return monkey_; }
        const HitModel& getHitModel() const { return hitModel_; }

        using LaunchCallback = std::function<void(const HitOutcome&)>;
        using ResolveCallback = std::function<void(const Coconut&)>;

        void setLaunchCallback(LaunchCallback cb) { launchCallback_ = cb; }
        void setResolveCallback(ResolveCallback cb) { resolveCallback_ = cb; }

    private:
        RuntimeConfig config_;
        Random& rng_;
        ProfileProvider* profiles_;
        const MarketDataProvider* marketData_;

        StrikeUniverse universe_;
        double spot_;
        double impliedVol_;
        std::map<Strike, double> gamma_;

        std::map<Strike, int> treeHits_;
        std::map<Strike, double> retailJuice_;
        std::map<Strike, double> mmJuice_;

        std::map<Strike, double> treeX_;
        double treeY_ = 0.0;

        std::vector<Coconut> coconuts_;
        int frame_ = 0;
        bool paused_ = false;
        std::map<AgentRole, bool> aiEnabled_;
        uint64_t resolvedCount_ = 0;

        Equipment currentEquipment_;

        RetailAgent retail_;
        MonkeyAgent monkey_;
        HitModel hitModel_;

        LaunchCallback launchCallback_;
        ResolveCallback resolveCallback_;

        void initializeGamma(const std::map<Strike, double>& profile);
        void layoutTrees();
        void clearAggregates();

        void launch();
        void recordOutcome(const HitOutcome& outcome);
        void advanceCoconuts();
        void fold(const Coconut& coconut);
    };

} // namespace jungle
