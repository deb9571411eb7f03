#include "Coconut.hpp"
#include "utils/Random.hpp"

namespace jungle {

    Coconut::Coconut(Strike strike, Point launch, Point target, const Equipment& equipment,
        double speed, bool hit, double retailJuice, double mmJuice,
        std::string sourceAgent, int framesPerDay, double arcHeightPerPower)
        : strike_(strike)
        , position_(launch)
        , target_(target)
        , equipment_(equipment)
        , speed_(speed)
        , hit_(hit)
        , retailJuice_(retailJuice)
        , mmJuice_(mmJuice)
        , sourceAgent_(std::move(sourceAgent))
        , framesRemaining_(equipment.dte * framesPerDay)
        , arcHeightPerPower_(arcHeightPerPower)
    {
    }

    void Coconut::update(Random& rng) {
        if (!isAlive()) return;

        framesRemaining_--;
        if (framesRemaining_ <= 0) {
            state_ = CoconutState::EXPIRED;
            return;
        }

        t_ += speed_ * equipment_.power;
        if (t_ >= 1.0) {
            state_ = CoconutState::ARRIVED;
            return;
        }

        // Accuracy jitter in [accuracy, 2 - accuracy] scales the x interpolation
        double spread = 1.0 - equipment_.accuracy;
        double accuracyFactor = rng.uniform(1.0 - spread, 1.0 + spread);

        double baseX = (1.0 - t_) * position_.x + t_ * target_.x;
        double baseY = (1.0 - t_) * position_.y + t_ * target_.y;

        double arcHeight = arcHeightPerPower_ * equipment_.power;
        double arcOffset = arcHeight * t_ * (1.0 - t_);

        position_.x = baseX * accuracyFactor;
        position_.y = baseY - arcOffset;
    }

} // namespace jungle
