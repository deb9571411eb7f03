#include "HitModel.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cmath>

namespace jungle {

    HitModel::HitModel(const RuntimeConfig::HitModelParams& params)
        : params_(params)
    {
    }

    double HitModel::baseChance(double spot, Strike strike) {
        return 1.0 / (1.0 + std::abs(spot - strike));
    }

    double HitModel::optionModifier(OptionType type, double spot, Strike strike) {
        if (type == OptionType::CALL) {
            return spot > strike ? 1.1 : 0.9;
        }
        return spot < strike ? 1.1 : 0.9;
    }

    double HitModel::probability(double spot, Strike strike, double impliedVol, double gamma,
        const Equipment& equipment, bool defended) const {
        double chance = baseChance(spot, strike);
        if (defended) chance *= params_.defenseFactor;

        double windPenalty = impliedVol / 100.0;
        double gammaPenalty = gamma / 10.0;
        double decayPenalty = std::max(0.1, equipment.dte / 30.0);
        double accuracyBonus = equipment.accuracy * 0.2;
        double powerFactor = equipment.power * 0.1;

        double p = chance
            * (1.0 - windPenalty)
            * (1.0 - gammaPenalty)
            * (1.0 / decayPenalty)
            * (1.0 + accuracyBonus)
            * (1.0 + powerFactor)
            * optionModifier(equipment.optionType, spot, strike);

        if (std::isnan(p)) return 0.0;
        return std::clamp(p, 0.0, 1.0);
    }

    HitOutcome HitModel::resolve(double spot, Strike strike, double impliedVol, double gamma,
        const Equipment& equipment, const std::vector<DefensePrediction>& defense,
        Random& rng) const {
        HitOutcome outcome;
        outcome.strike = strike;
        outcome.defended = std::any_of(defense.begin(), defense.end(),
            [strike](const DefensePrediction& d) { return d.strike == strike; });

        if (outcome.defended) {
            double defendedChance = baseChance(spot, strike) * params_.defenseFactor;
            outcome.defenseSuccess = rng.chance() > defendedChance;
        }

        outcome.probability = probability(spot, strike, impliedVol, gamma, equipment, outcome.defended);
        outcome.hit = rng.chance() < outcome.probability;

        if (outcome.hit) {
            outcome.mmShare = params_.mmShare;
            outcome.retailShare = 1.0 - params_.mmShare;
        }
        return outcome;
    }

} // namespace jungle
