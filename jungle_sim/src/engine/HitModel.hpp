#pragma once

#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include <optional>
#include <vector>

namespace jungle {

    class Random;

    struct HitOutcome {
        Strike strike = 0;
        double probability = 0.0;
        bool hit = false;
        double retailShare = 0.0;
        double mmShare = 0.0;
        bool defended = false;                  // strike was among the monkey's predictions
        std::optional<bool> defenseSuccess;     // set only when defended
    };

    // Maps a launch to a hit probability and draws the outcome.
    //
    //   base = 1 / (1 + |spot - strike|), halved when defended
    //   p = base * (1 - vol/100) * (1 - gamma/10) / max(0.1, dte/30)
    //            * (1 + accuracy*0.2) * (1 + power*0.1) * optionModifier
    //   clamped to [0, 1]
    class HitModel {
    public:
        explicit HitModel(const RuntimeConfig::HitModelParams& params);

        static double baseChance(double spot, Strike strike);

        // 1.1 when the option is in the money direction (call below spot,
        // put above spot), 0.9 otherwise
        static double optionModifier(OptionType type, double spot, Strike strike);

        double probability(double spot, Strike strike, double impliedVol, double gamma,
            const Equipment& equipment, bool defended) const;

        // Draws the defense roll (only when defended) and then the hit roll.
        // On a hit the shares are mmShare / 1 - mmShare, on a miss both 0.
        HitOutcome resolve(double spot, Strike strike, double impliedVol, double gamma,
            const Equipment& equipment, const std::vector<DefensePrediction>& defense,
            Random& rng) const;

        const RuntimeConfig::HitModelParams& getParams() const { return params_; }

    private:
        RuntimeConfig::HitModelParams params_;
    };

} // namespace jungle
