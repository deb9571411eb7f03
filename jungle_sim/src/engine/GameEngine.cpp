#include "GameEngine.hpp"
#include "market/MarketDataProvider.hpp"
#include "profiles/ProfileProvider.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cmath>

namespace jungle {

    GameEngine::GameEngine(const RuntimeConfig& config, const MarketState& market, Random& rng,
        ProfileProvider* profiles, const MarketDataProvider* marketData)
        : config_(config)
        , rng_(rng)
        , profiles_(profiles)
        , marketData_(marketData)
        , universe_(market.strikes)
        , spot_(market.price)
        , impliedVol_(market.impliedVol)
        , retail_(config, profiles, rng)
        , monkey_(config, profiles, rng)
        , hitModel_(config.hitModel)
    {
        aiEnabled_[AgentRole::RETAIL] = true;
        aiEnabled_[AgentRole::MONKEY] = true;

        if (const Equipment* e = config_.findSlingshot(config_.equipment.defaultSlingshot)) {
            currentEquipment_ = *e;
        }
        else if (!config_.equipment.slingshots.empty()) {
            Logger::warn("Default slingshot {} not in catalog, using {}",
                config_.equipment.defaultSlingshot, config_.equipment.slingshots.front().name);
            currentEquipment_ = config_.equipment.slingshots.front();
        }
        else {
            Logger::warn("Empty slingshot catalog, using built-in equipment");
            currentEquipment_ = defaultSlingshots().front();
        }

        clearAggregates();
        initializeGamma(market.gammaProfile);
        layoutTrees();

        Logger::info("Game engine ready: {} strikes [{}..{}], spot {:.2f}, slingshot {}",
            universe_.size(), universe_.front(), universe_.back(), spot_, currentEquipment_.name);
    }

    void GameEngine::initializeGamma(const std::map<Strike, double>& profile) {
        gamma_.clear();

        double maxGamma = 0.0;
        for (const auto& [_, g] : profile) maxGamma = std::max(maxGamma, g);

        if (maxGamma > 0.0) {
            for (Strike s : universe_.strikes()) {
                auto it = profile.find(s);
                gamma_[s] = it != profile.end() ? it->second / maxGamma : 0.0;
            }
            Logger::debug("Using supplied gamma profile ({} strikes)", profile.size());
            return;
        }

        // Synthetic profile peaking at spot, decaying 10% per point
        for (Strike s : universe_.strikes()) {
            gamma_[s] = std::pow(0.9, std::abs(s - spot_));
        }
        Logger::warn("No gamma profile supplied, using synthetic profile around {:.2f}", spot_);
    }

    void GameEngine::layoutTrees() {
        const auto& c = config_.coconut;
        double spacing = std::min(c.maxTreeSpacing,
            (config_.game.width - 100.0) / static_cast<double>(universe_.size() + 1));

        const auto& strikes = universe_.strikes();
        for (size_t i = 0; i < strikes.size(); ++i) {
            treeX_[strikes[i]] = 50.0 + static_cast<double>(i) * spacing;
        }
        treeY_ = config_.game.height - c.treeInsetY;
    }

    void GameEngine::clearAggregates() {
        treeHits_.clear();
        retailJuice_.clear();
        mmJuice_.clear();
        for (Strike s : universe_.strikes()) {
            treeHits_[s] = 0;
            retailJuice_[s] = 0.0;
            mmJuice_[s] = 0.0;
        }
    }

    Strike GameEngine::snapStrike(double strike) const {
        Strike snapped = universe_.snap(strike);
        if (static_cast<double>(snapped) != strike) {
            Logger::warn("Strike {} outside valid strikes, snapped to {}", strike, snapped);
        }
        return snapped;
    }

    double GameEngine::gammaAt(Strike strike) const {
        auto it = gamma_.find(strike);
        return it != gamma_.end() ? it->second : 0.0;
    }

    Point GameEngine::getTreePosition(Strike strike) const {
        return { treeX_.at(universe_.snap(strike)), treeY_ };
    }

    GameStateSnapshot GameEngine::getGameState() const {
        GameStateSnapshot state;
        state.spotPrice = spot_;
        state.strikes = universe_.strikes();
        state.treeHits = treeHits_;
        state.retailJuice = retailJuice_;
        state.mmJuice = mmJuice_;
        state.frame = frame_;
        state.currentEquipmentName = currentEquipment_.name;
        state.optionType = currentEquipment_.optionType;

        int totalHits = 0;
        double totalJuice = 0.0;
        for (Strike s : universe_.strikes()) {
            totalHits += treeHits_.at(s);
            totalJuice += retailJuice_.at(s);
        }

        for (Strike s : universe_.strikes()) {
            int hits = treeHits_.at(s);
            double juice = retailJuice_.at(s);

            state.crowdSize[s] = static_cast<int>((hits + juice * 10.0) / 2.0);

            double clustering = 0.01;
            if (totalHits > 0 || totalJuice > 0.0) {
                double hitsRatio = hits / (totalHits + 1.0);
                double juiceRatio = juice / (totalJuice + 1.0);
                clustering = std::max(0.01, (hitsRatio + juiceRatio) / 2.0);
            }
            state.retailClustering[s] = clustering;
        }

        return state;
    }

    void GameEngine::update() {
        if (paused_) return;

        if (frame_ < config_.game.trials) {
            launch();
        }

        advanceCoconuts();
    }

    void GameEngine::launch() {
        GameStateSnapshot state = getGameState();

        double target = 0.0;
        std::string source;

        if (aiEnabled_[AgentRole::RETAIL]) {
            source = "retail";

            std::vector<SlingshotTarget> targets;
            if (marketData_) {
                targets = marketData_->getSlingshotTargets(currentEquipment_.name, spot_);
            }

            if (!targets.empty()) {
                target = targets.front().strike;
            }
            else {
                target = retail_.selectTarget(state).strike;
            }
        }
        else {
            source = "random";
            target = rng_.pick(universe_.strikes());
        }

        Strike strike = snapStrike(target);

        std::vector<DefensePrediction> defense;
        if (aiEnabled_[AgentRole::MONKEY]) {
            defense = monkey_.predictDefended(state);
        }

        HitOutcome outcome = hitModel_.resolve(spot_, strike, impliedVol_, gammaAt(strike),
            currentEquipment_, defense, rng_);
        recordOutcome(outcome);

        const auto& c = config_.coconut;
        Point launchPoint{ config_.game.width / 2.0, 0.0 };
        Point treePoint = getTreePosition(strike);
        Point targetPoint{ treePoint.x + c.targetOffsetX, treePoint.y };

        coconuts_.emplace_back(strike, launchPoint, targetPoint, currentEquipment_,
            rng_.uniform(c.minSpeed, c.maxSpeed), outcome.hit,
            outcome.retailShare, outcome.mmShare, source,
            config_.game.fps, c.arcHeightPerPower);

        frame_++;

        if (launchCallback_) launchCallback_(outcome);
    }

    void GameEngine::recordOutcome(const HitOutcome& outcome) {
        const auto& h = config_.hitModel;
        std::string option = toString(currentEquipment_.optionType);

        if (outcome.defenseSuccess) {
            bool held = *outcome.defenseSuccess;
            monkey_.recordDefenseResult(held);
            if (held) {
                monkey_.getMemory().add(
                    fmt::format("Successfully defended {} strike {}", option, outcome.strike),
                    h.defenseSuccessImportance);
            }
            else {
                monkey_.getMemory().add(
                    fmt::format("Failed to defend {} strike {}", option, outcome.strike),
                    h.defenseFailureImportance);
            }
        }

        retail_.recordOutcome(outcome.hit);
        if (outcome.hit) {
            retail_.getMemory().add(
                fmt::format("Hit {} strike {} at spot {}", option, outcome.strike,
                    MemoryStore::priceToken(spot_)),
                h.hitImportance);
        }
        else {
            retail_.getMemory().add(
                fmt::format("Missed {} strike {}", option, outcome.strike),
                h.missImportance);
        }

        Logger::debug("Frame {}: {} strike {} p={:.4f} -> {}", frame_, option, outcome.strike,
            outcome.probability, outcome.hit ? "hit" : "miss");
    }

    void GameEngine::advanceCoconuts() {
        for (auto& coconut : coconuts_) {
            coconut.update(rng_);
        }

        // Fold terminal coconuts exactly once, then compact the live list
        for (const auto& coconut : coconuts_) {
            if (!coconut.isAlive()) fold(coconut);
        }

        coconuts_.erase(std::remove_if(coconuts_.begin(), coconuts_.end(),
            [](const Coconut& c) { return !c.isAlive(); }), coconuts_.end());
    }

    void GameEngine::fold(const Coconut& coconut) {
        Strike strike = snapStrike(coconut.getStrike());
        if (coconut.isHit()) {
            treeHits_[strike] += 1;
            retailJuice_[strike] += coconut.getRetailJuice();
            mmJuice_[strike] += coconut.getMmJuice();
        }
        resolvedCount_++;

        if (resolveCallback_) resolveCallback_(coconut);
    }

    void GameEngine::togglePause() {
        paused_ = !paused_;
        Logger::info("Game {} at frame {}", paused_ ? "paused" : "resumed", frame_);
    }

    void GameEngine::toggleAi(AgentRole role) {
        aiEnabled_[role] = !aiEnabled_[role];
        Logger::info("{} AI {}", toString(role), aiEnabled_[role] ? "enabled" : "disabled");
    }

    void GameEngine::reset() {
        clearAggregates();
        coconuts_.clear();
        frame_ = 0;
        resolvedCount_ = 0;
        Logger::info("Game reset");
    }

    bool GameEngine::switchEquipment(const std::string& name) {
        const Equipment* e = config_.findSlingshot(name);
        if (!e) {
            Logger::warn("Unknown slingshot: {}", name);
            return false;
        }

        currentEquipment_ = *e;
        Logger::info("Switched to slingshot {} ({}, dte {})",
            e->name, toString(e->optionType), e->dte);
        return true;
    }

    bool GameEngine::switchProfile(AgentRole role, size_t index) {
        if (!profiles_) return false;

        auto names = profiles_->listProfiles(role);
        if (index >= names.size()) return false;

        return profiles_->switchProfile(role, names[index]);
    }

    void GameEngine::applyMarketState(const MarketState& market) {
        spot_ = market.price;
        impliedVol_ = market.impliedVol;
        Logger::debug("Market refreshed: spot {:.2f}, vol {:.2f}", spot_, impliedVol_);
    }

    std::string GameEngine::getMemorySummary(AgentRole role) const {
        return role == AgentRole::RETAIL
            ? retail_.getMemory().summarize()
            : monkey_.getMemory().summarize();
    }

    std::vector<Memory> GameEngine::recallMemories(AgentRole role, const RecallContext& context, size_t limit) {
        return role == AgentRole::RETAIL
            ? retail_.recall(context, limit)
            : monkey_.recall(context, limit);
    }

} // namespace jungle
