#pragma once

#include "Types.hpp"
#include <vector>

namespace jungle {

    // The finite, sorted, de-duplicated set of strikes fixed for an episode.
    // Every strike-keyed aggregate is defined on exactly this set.
    class StrikeUniverse {
    public:
        // Throws std::invalid_argument when `strikes` is empty
        explicit StrikeUniverse(std::vector<Strike> strikes);

        const std::vector<Strike>& strikes() const { return strikes_; }
        size_t size() const { return strikes_.size(); }
        Strike front() const { return strikes_.front(); }
        Strike back() const { return strikes_.back(); }

        bool contains(Strike strike) const;

        // Nearest valid strike by absolute distance. Ties go to the lower strike.
        Strike snap(double price) const;

        // Index of a member strike, or -1
        int indexOf(Strike strike) const;

        // The n strikes closest to `spot`, closest first (ties keep strike order)
        std::vector<Strike> nearest(double spot, size_t n) const;

    private:
        std::vector<Strike> strikes_;
    };

} // namespace jungle
