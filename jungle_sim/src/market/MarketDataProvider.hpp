#pragma once

#include "core/Types.hpp"
#include <string>
#include <vector>

namespace jungle {

    // Source of market snapshots. Implementations must tolerate being polled
    // from the refresher thread.
    class MarketDataProvider {
    public:
        virtual ~MarketDataProvider() = default;

        virtual MarketState getMarketState() const = 0;

        // Optional fast-path targets for a slingshot, most attractive first
        virtual std::vector<SlingshotTarget> getSlingshotTargets(const std::string& equipmentName,
            double spot) const {
            (void)equipmentName;
            (void)spot;
            return {};
        }
    };

} // namespace jungle
