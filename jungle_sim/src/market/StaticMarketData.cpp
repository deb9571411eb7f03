#include "StaticMarketData.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace jungle {

    StaticMarketData::StaticMarketData(const RuntimeConfig& config)
        : slingshots_(config.equipment.slingshots)
        , useSlingshotTargets_(config.market.useSlingshotTargets)
        , minAttractiveness_(config.market.minAttractiveness)
    {
        state_.price = config.market.fallbackPrice;
        state_.impliedVol = config.market.fallbackVol;
        for (int s = config.market.strikeMin; s <= config.market.strikeMax; ++s) {
            state_.strikes.push_back(s);
        }
        state_.timestamp = now();
    }

    bool StaticMarketData::loadSnapshot(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::warn("Could not open market snapshot: {}, using fallback prices", path);
            return false;
        }

        try {
            applySnapshot(nlohmann::json::parse(file));
            Logger::info("Loaded market snapshot from {}", path);
            return true;
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse market snapshot {}: {}", path, e.what());
            return false;
        }
    }

    void StaticMarketData::applySnapshot(const nlohmann::json& snapshot) {
        MarketState state = getMarketState();

        state.price = snapshot.value("price", state.price);
        state.impliedVol = snapshot.value("implied_vol", state.impliedVol);

        if (snapshot.contains("strikes")) {
            state.strikes = snapshot["strikes"].get<std::vector<Strike>>();
        }
        if (snapshot.contains("gamma_profile")) {
            state.gammaProfile.clear();
            for (auto& [key, value] : snapshot["gamma_profile"].items()) {
                state.gammaProfile[std::stoi(key)] = value.get<double>();
            }
        }
        state.timestamp = now();

        setState(std::move(state));
    }

    void StaticMarketData::setState(MarketState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = std::move(state);
    }

    void StaticMarketData::setQuote(double price, double impliedVol) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.price = price;
        state_.impliedVol = impliedVol;
        state_.timestamp = now();
    }

    MarketState StaticMarketData::getMarketState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::vector<SlingshotTarget> StaticMarketData::getSlingshotTargets(const std::string& equipmentName,
        double spot) const {
        std::vector<SlingshotTarget> targets;
        if (!useSlingshotTargets_) return targets;

        auto it = std::find_if(slingshots_.begin(), slingshots_.end(),
            [&equipmentName](const Equipment& e) { return e.name == equipmentName; });
        if (it == slingshots_.end()) return targets;

        MarketState state = getMarketState();
        long base = std::lround(spot);

        for (Strike strike : state.strikes) {
            double attractiveness = 1.0 / (1.0 + std::abs(static_cast<double>(strike - (base + it->strikeBias))));

            auto gammaIt = state.gammaProfile.find(strike);
            double gamma = gammaIt != state.gammaProfile.end() ? gammaIt->second : 0.1;
            attractiveness *= (1.0 + gamma);

            if (attractiveness > minAttractiveness_) {
                targets.push_back({ strike, attractiveness, it->optionType, it->dte });
            }
        }

        std::stable_sort(targets.begin(), targets.end(),
            [](const SlingshotTarget& a, const SlingshotTarget& b) {
                return a.attractiveness > b.attractiveness;
            });
        return targets;
    }

} // namespace jungle
