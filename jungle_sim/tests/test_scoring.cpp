#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "agents/ScoringEngine.hpp"
#include "agents/RetailAgent.hpp"
#include "agents/MonkeyAgent.hpp"
#include "profiles/ProfileManager.hpp"
#include "utils/Random.hpp"

using namespace jungle;
using Catch::Approx;

namespace {
    RuntimeConfig testConfig() {
        RuntimeConfig cfg;
        cfg.memory.persist = false;
        return cfg;
    }

    GameStateSnapshot threeStrikes(double spot = 628.0) {
        GameStateSnapshot state;
        state.spotPrice = spot;
        state.strikes = { 625, 630, 635 };
        for (Strike s : state.strikes) {
            state.treeHits[s] = 0;
            state.retailJuice[s] = 0.0;
            state.mmJuice[s] = 0.0;
            state.crowdSize[s] = 0;
            state.retailClustering[s] = 0.01;
        }
        return state;
    }

    AgentProfile retailProfile(double fomo) {
        AgentProfile p;
        p.name = "test retail";
        p.traits["fomo_threshold"] = fomo;
        p.biases["overconfidence"] = 0.0;
        p.biases["herd_mentality"] = 0.0;
        p.behaviorWeights = ScoringEngine::defaultWeights(AgentRole::RETAIL);
        return p;
    }

    double sum(const BehaviorWeights& w) {
        double total = 0.0;
        for (const auto& [_, v] : w) total += v;
        return total;
    }
}

// ---- weight handling --------------------------------------------------------

TEST_CASE("ScoringEngine: Boost then renormalize", "[scoring]") {
    BehaviorWeights w = { {"a", 2.0}, {"b", 2.0} };

    ScoringEngine::boostWeight(w, "a", 0.5);
    ScoringEngine::normalizeWeights(w);

    REQUIRE(sum(w) == Approx(1.0));
    REQUIRE(w["a"] > w["b"]);
    REQUIRE(w["a"] == Approx(0.6));
}

TEST_CASE("ScoringEngine: Zero total skips normalization", "[scoring]") {
    BehaviorWeights w = { {"a", 0.0}, {"b", 0.0} };
    ScoringEngine::normalizeWeights(w);

    REQUIRE(w["a"] == 0.0);
    REQUIRE(w["b"] == 0.0);
}

TEST_CASE("ScoringEngine: Boosting an absent weight adds nothing", "[scoring]") {
    BehaviorWeights w = { {"a", 1.0} };
    ScoringEngine::boostWeight(w, "missing", 2.0);

    REQUIRE(w.size() == 1);
    REQUIRE(w.count("missing") == 0);
}

TEST_CASE("ScoringEngine: Retail overconfidence boosts distance", "[scoring]") {
    AgentProfile p;
    p.behaviorWeights = { {"spot_distance", 2.0}, {"crowd_following", 2.0} };
    p.biases["overconfidence"] = 0.5;

    PsychMetrics metrics;
    metrics.recentSuccessRate = 0.8;

    auto w = ScoringEngine::adjustWeights(p, AgentRole::RETAIL, metrics);
    REQUIRE(sum(w) == Approx(1.0));
    REQUIRE(w["spot_distance"] == Approx(0.6));
    REQUIRE(w["crowd_following"] == Approx(0.4));

    // Below the threshold nothing is boosted
    metrics.recentSuccessRate = 0.5;
    w = ScoringEngine::adjustWeights(p, AgentRole::RETAIL, metrics);
    REQUIRE(w["spot_distance"] == Approx(0.5));
}

TEST_CASE("ScoringEngine: Retail herding boosts crowd following", "[scoring]") {
    AgentProfile p;
    p.behaviorWeights = { {"spot_distance", 2.0}, {"crowd_following", 2.0} };
    p.biases["herd_mentality"] = 0.5;

    PsychMetrics metrics;
    metrics.crowdSize = 4;

    auto w = ScoringEngine::adjustWeights(p, AgentRole::RETAIL, metrics);
    REQUIRE(sum(w) == Approx(1.0));
    REQUIRE(w["crowd_following"] == Approx(0.6));
    REQUIRE(w["spot_distance"] == Approx(0.4));

    // A crowd of three is not enough
    metrics.crowdSize = 3;
    w = ScoringEngine::adjustWeights(p, AgentRole::RETAIL, metrics);
    REQUIRE(w["crowd_following"] == Approx(0.5));
}

TEST_CASE("ScoringEngine: Monkey biases follow losses and clustering", "[scoring]") {
    AgentProfile p;
    p.behaviorWeights = ScoringEngine::defaultWeights(AgentRole::MONKEY);
    p.biases["loss_aversion"] = 1.0;
    p.biases["recency"] = 1.0;

    PsychMetrics metrics;
    metrics.recentLossRate = 0.4;
    metrics.retailClustering = 0.6;

    auto w = ScoringEngine::adjustWeights(p, AgentRole::MONKEY, metrics);
    // 0.6, 0.2, 0.3, 0.4 before normalization
    REQUIRE(sum(w) == Approx(1.0));
    REQUIRE(w["spot_distance"] == Approx(0.6 / 1.5));
    REQUIRE(w["retail_clustering"] == Approx(0.4 / 1.5));
}

TEST_CASE("ScoringEngine: Defaults without a provider", "[scoring]") {
    ScoringEngine engine(AgentRole::RETAIL, nullptr);
    auto w = engine.resolveWeights(PsychMetrics{});

    REQUIRE(w == ScoringEngine::defaultWeights(AgentRole::RETAIL));
    REQUIRE_FALSE(engine.activeProfile().has_value());
}

TEST_CASE("ScoringEngine: Defaults when no profile is active", "[scoring]") {
    ProfileManager profiles;   // nothing loaded
    ScoringEngine engine(AgentRole::MONKEY, &profiles);

    REQUIRE(engine.resolveWeights(PsychMetrics{}) == ScoringEngine::defaultWeights(AgentRole::MONKEY));
}

TEST_CASE("ScoringEngine: Ties go to the first strike", "[scoring]") {
    REQUIRE(ScoringEngine::selectBest({ 0.5, 0.7, 0.7, 0.1 }) == 1);
    REQUIRE(ScoringEngine::selectBest({ 0.3, 0.3, 0.3 }) == 0);
}

TEST_CASE("ScoringEngine: Top three become a distribution", "[scoring]") {
    auto predictions = ScoringEngine::topDistribution({ 1, 2, 3, 4 }, { 0.1, 0.5, 0.3, 0.2 }, 3, 0.0);

    REQUIRE(predictions.size() == 3);
    REQUIRE(predictions[0].strike == 2);
    REQUIRE(predictions[1].strike == 3);
    REQUIRE(predictions[2].strike == 4);
    REQUIRE(predictions[0].probability == Approx(0.5));
    REQUIRE(predictions[0].probability + predictions[1].probability + predictions[2].probability == Approx(1.0));
}

TEST_CASE("ScoringEngine: Zero scores fall back to strikes near spot", "[scoring]") {
    auto predictions = ScoringEngine::topDistribution({ 1, 2, 3, 4 }, { 0.0, 0.0, 0.0, 0.0 }, 3, 2.2);

    REQUIRE(predictions.size() == 3);
    REQUIRE(predictions[0].strike == 2);
    REQUIRE(predictions[1].strike == 3);
    REQUIRE(predictions[2].strike == 1);
    for (const auto& p : predictions) {
        REQUIRE(p.probability == Approx(1.0 / 3.0));
    }
}

// ---- retail -----------------------------------------------------------------

TEST_CASE("RetailAgent: Picks the closest undefended strike", "[agents][retail]") {
    Random rng(1);
    RetailAgent agent(testConfig(), nullptr, rng);

    auto selection = agent.selectTarget(threeStrikes());

    // 0.3 / (1 + 2/5) + 0.3 * (1 - 0)
    REQUIRE(selection.strike == 630);
    REQUIRE(selection.confidence == Approx(0.3 / 1.4 + 0.3));
    REQUIRE(agent.getHistory().back() == 630);
}

TEST_CASE("RetailAgent: Equal scores pick the lower strike", "[agents][retail]") {
    Random rng(1);
    RetailAgent agent(testConfig(), nullptr, rng);

    GameStateSnapshot state = threeStrikes(630.0);
    state.strikes = { 625, 635 };

    REQUIRE(agent.selectTarget(state).strike == 625);
}

TEST_CASE("RetailAgent: No strikes falls back to spot", "[agents][retail]") {
    Random rng(1);
    RetailAgent agent(testConfig(), nullptr, rng);

    GameStateSnapshot state;
    state.spotPrice = 628.4;

    auto selection = agent.selectTarget(state);
    REQUIRE(selection.strike == 628);
    REQUIRE(selection.confidence == Approx(0.5));
}

TEST_CASE("RetailAgent: Repeat targets earn the history bonus", "[agents][retail]") {
    Random rng(1);
    RetailAgent agent(testConfig(), nullptr, rng);

    auto first = agent.selectTarget(threeStrikes());
    auto second = agent.selectTarget(threeStrikes());

    REQUIRE(second.strike == first.strike);
    REQUIRE(second.confidence == Approx(first.confidence + 0.2));
}

TEST_CASE("RetailAgent: FOMO jumps to the crowded strike", "[agents][retail]") {
    GameStateSnapshot state = threeStrikes();
    state.crowdSize[635] = 2;   // crowd factor 0.4, not enough on its own

    SECTION("never triggers") {
        ProfileManager profiles;
        profiles.addProfile(AgentRole::RETAIL, "retail_profile.json", retailProfile(0.0));
        Random rng(1);
        RetailAgent agent(testConfig(), &profiles, rng);

        REQUIRE(agent.selectTarget(state).strike == 630);
    }

    SECTION("always triggers") {
        ProfileManager profiles;
        profiles.addProfile(AgentRole::RETAIL, "retail_profile.json", retailProfile(1.0));
        Random rng(1);
        RetailAgent agent(testConfig(), &profiles, rng);

        REQUIRE(agent.selectTarget(state).strike == 635);
    }
}

TEST_CASE("RetailAgent: Success rate over the recent window", "[agents][retail]") {
    Random rng(1);
    RetailAgent agent(testConfig(), nullptr, rng);

    REQUIRE(agent.recentRate(true) == 0.0);

    for (bool hit : { false, false, false, true, true, false, true }) {
        agent.recordOutcome(hit);
    }
    // last five: false, true, true, false, true
    REQUIRE(agent.recentRate(true) == Approx(0.6));
    REQUIRE(agent.measure(threeStrikes()).recentSuccessRate == Approx(0.6));

    for (int i = 0; i < 20; ++i) agent.recordOutcome(true);
    REQUIRE(agent.getOutcomes().size() == 10);
}

TEST_CASE("RetailAgent: Seeded selections are reproducible", "[agents][retail]") {
    ProfileManager profiles;
    profiles.addProfile(AgentRole::RETAIL, "retail_profile.json", retailProfile(0.5));

    GameStateSnapshot state = threeStrikes();
    state.crowdSize[625] = 3;

    Random rngA(77), rngB(77);
    RetailAgent a(testConfig(), &profiles, rngA);
    RetailAgent b(testConfig(), &profiles, rngB);

    for (int i = 0; i < 25; ++i) {
        auto sa = a.selectTarget(state);
        auto sb = b.selectTarget(state);
        REQUIRE(sa.strike == sb.strike);
        REQUIRE(sa.confidence == sb.confidence);
    }
}

// ---- monkey -----------------------------------------------------------------

TEST_CASE("MonkeyAgent: Defends the strikes nearest spot first", "[agents][monkey]") {
    Random rng(1);
    MonkeyAgent agent(testConfig(), nullptr, rng);

    auto predictions = agent.predictDefended(threeStrikes());

    REQUIRE(predictions.size() == 3);
    REQUIRE(predictions[0].strike == 630);
    REQUIRE(predictions[1].strike == 625);
    REQUIRE(predictions[2].strike == 635);

    double total = 0.0;
    for (const auto& p : predictions) total += p.probability;
    REQUIRE(total == Approx(1.0));
    REQUIRE(agent.getHistory().back() == 630);
}

TEST_CASE("MonkeyAgent: Only the top three are predicted", "[agents][monkey]") {
    Random rng(1);
    MonkeyAgent agent(testConfig(), nullptr, rng);

    GameStateSnapshot state = threeStrikes();
    state.strikes = { 620, 625, 630, 635, 640 };

    auto predictions = agent.predictDefended(state);
    REQUIRE(predictions.size() == 3);
}

TEST_CASE("MonkeyAgent: Zero weights fall back to equal odds", "[agents][monkey]") {
    AgentProfile p;
    p.name = "asleep";
    p.traits["risk_aversion"] = 1.0;
    p.behaviorWeights = {
        {"spot_distance", 0.0}, {"hit_history", 0.0},
        {"juice_collection", 0.0}, {"retail_clustering", 0.0}
    };

    ProfileManager profiles;
    profiles.addProfile(AgentRole::MONKEY, "monkey_profile.json", p);

    Random rng(1);
    MonkeyAgent agent(testConfig(), &profiles, rng);
    auto predictions = agent.predictDefended(threeStrikes());

    REQUIRE(predictions.size() == 3);
    REQUIRE(predictions[0].strike == 630);
    for (const auto& d : predictions) {
        REQUIRE(d.probability == Approx(1.0 / 3.0));
    }
}

TEST_CASE("MonkeyAgent: Reflexivity favours the clustered strike", "[agents][monkey]") {
    GameStateSnapshot state = threeStrikes();
    state.retailClustering[635] = 0.4;

    auto probabilityOf635 = [&state](bool reflexive) {
        AgentProfile p;
        p.traits["risk_aversion"] = 1.0;
        p.traits["reflexivity_awareness"] = reflexive ? 1.0 : 0.0;
        p.behaviorWeights = ScoringEngine::defaultWeights(AgentRole::MONKEY);

        ProfileManager profiles;
        profiles.addProfile(AgentRole::MONKEY, "monkey_profile.json", p);
        Random rng(1);
        RuntimeConfig cfg;
        cfg.memory.persist = false;
        MonkeyAgent agent(cfg, &profiles, rng);

        for (const auto& d : agent.predictDefended(state)) {
            if (d.strike == 635) return d.probability;
        }
        return 0.0;
    };

    REQUIRE(probabilityOf635(true) > probabilityOf635(false));
}

TEST_CASE("MonkeyAgent: Losses make it repeat the last defense", "[agents][monkey]") {
    AgentProfile p;
    p.name = "nervous";
    p.traits["risk_aversion"] = 0.0;
    p.behaviorWeights = ScoringEngine::defaultWeights(AgentRole::MONKEY);

    ProfileManager profiles;
    profiles.addProfile(AgentRole::MONKEY, "monkey_profile.json", p);

    GameStateSnapshot state = threeStrikes(630.0);
    state.strikes = { 620, 625, 630, 635, 640 };
    for (Strike s : state.strikes) state.retailClustering[s] = 0.01;

    auto probabilityOf = [](const std::vector<DefensePrediction>& predictions, Strike strike) {
        for (const auto& d : predictions) {
            if (d.strike == strike) return d.probability;
        }
        return 0.0;
    };

    Random rng(1);
    MonkeyAgent agent(testConfig(), &profiles, rng);

    double before = probabilityOf(agent.predictDefended(state), 630);
    REQUIRE(agent.getHistory().back() == 630);

    // Without losses the repeat boost stays off
    REQUIRE(probabilityOf(agent.predictDefended(state), 630) == Approx(before));

    agent.recordDefenseResult(false);
    double after = probabilityOf(agent.predictDefended(state), 630);

    REQUIRE(after > before);
}

TEST_CASE("MonkeyAgent: Loss rate tracks failed defenses", "[agents][monkey]") {
    Random rng(1);
    MonkeyAgent agent(testConfig(), nullptr, rng);

    agent.recordDefenseResult(true);
    agent.recordDefenseResult(false);
    agent.recordDefenseResult(false);
    agent.recordDefenseResult(false);

    REQUIRE(agent.measure(threeStrikes()).recentLossRate == Approx(0.75));
}

TEST_CASE("MonkeyAgent: No strikes means no predictions", "[agents][monkey]") {
    Random rng(1);
    MonkeyAgent agent(testConfig(), nullptr, rng);

    GameStateSnapshot state;
    state.spotPrice = 628.0;
    REQUIRE(agent.predictDefended(state).empty());
}

TEST_CASE("Agent: Negative windows still bound the history", "[agents]") {
    RuntimeConfig cfg = testConfig();
    cfg.agents.historyWindow = -1;
    cfg.agents.recentWindow = -3;

    Random rng(1);
    MonkeyAgent agent(cfg, nullptr, rng);

    for (int i = 0; i < 50; ++i) agent.recordDefenseResult(i % 2 == 0);
    REQUIRE(agent.getOutcomes().size() == 1);
    REQUIRE(agent.measure(threeStrikes()).recentLossRate == Approx(1.0));

    agent.predictDefended(threeStrikes());
    agent.predictDefended(threeStrikes());
    REQUIRE(agent.getHistory().size() == 1);
}
