#include "StrikeUniverse.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace jungle {

    StrikeUniverse::StrikeUniverse(std::vector<Strike> strikes)
        : strikes_(std::move(strikes))
    {
        std::sort(strikes_.begin(), strikes_.end());
        strikes_.erase(std::unique(strikes_.begin(), strikes_.end()), strikes_.end());

        if (strikes_.empty()) {
            throw std::invalid_argument("strike universe must not be empty");
        }
    }

    bool StrikeUniverse::contains(Strike strike) const {
        return std::binary_search(strikes_.begin(), strikes_.end(), strike);
    }

    int StrikeUniverse::indexOf(Strike strike) const {
        auto it = std::lower_bound(strikes_.begin(), strikes_.end(), strike);
        if (it == strikes_.end() || *it != strike) return -1;
        return static_cast<int>(it - strikes_.begin());
    }

    Strike StrikeUniverse::snap(double price) const {
        Strike best = strikes_.front();
        double bestDist = std::abs(price - best);

        for (Strike s : strikes_) {
            double dist = std::abs(price - s);
            if (dist < bestDist) {
                best = s;
                bestDist = dist;
            }
        }
        return best;
    }

    std::vector<Strike> StrikeUniverse::nearest(double spot, size_t n) const {
        std::vector<Strike> ordered = strikes_;
        std::stable_sort(ordered.begin(), ordered.end(), [spot](Strike a, Strike b) {
            return std::abs(a - spot) < std::abs(b - spot);
        });
        if (ordered.size() > n) ordered.resize(n);
        return ordered;
    }

} // namespace jungle
