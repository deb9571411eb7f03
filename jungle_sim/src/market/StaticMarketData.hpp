#pragma once

#include "MarketDataProvider.hpp"
#include "core/RuntimeConfig.hpp"
#include <mutex>

namespace jungle {

    // Serves a fixed snapshot built from the config fallbacks, optionally
    // replaced by a JSON snapshot file:
    //   { "price": 628.86, "implied_vol": 13.7, "strikes": [610, ...],
    //     "gamma_profile": { "628": 0.42, ... } }
    class StaticMarketData : public MarketDataProvider {
    public:
        explicit StaticMarketData(const RuntimeConfig& config);

        // Returns false (and keeps the current snapshot) when the file is
        // missing or malformed
        bool loadSnapshot(const std::string& path);
        void applySnapshot(const nlohmann::json& snapshot);

        void setState(MarketState state);

        // Only moves spot and implied volatility
        void setQuote(double price, double impliedVol);

        MarketState getMarketState() const override;

        // attractiveness = 1 / (1 + |strike - (round(spot) + strike_bias)|) * (1 + gamma)
        // with gamma defaulting to 0.1; kept above minAttractiveness
        std::vector<SlingshotTarget> getSlingshotTargets(const std::string& equipmentName,
            double spot) const override;

    private:
        MarketState state_;
        std::vector<Equipment> slingshots_;
        bool useSlingshotTargets_;
        double minAttractiveness_;
        mutable std::mutex mutex_;
    };

} // namespace jungle
