#pragma once

#include "Types.hpp"
#include <string>

namespace jungle {

    class Random;

    enum class CoconutState {
        IN_FLIGHT,
        EXPIRED,     // ran out of frames before arriving
        ARRIVED      // trajectory parameter reached 1
    };

    struct Point {
        double x = 0.0;
        double y = 0.0;
    };

    // A single in-flight projectile. The hit outcome and juice split are
    // decided at launch; the flight only animates toward the tree.
    class Coconut {
    public:
        Coconut(Strike strike, Point launch, Point target, const Equipment& equipment,
            double speed, bool hit, double retailJuice, double mmJuice,
            std::string sourceAgent, int framesPerDay, double arcHeightPerPower = 100.0);

        // Advance one frame. No-op once the coconut is terminal.
        void update(Random& rng);

        bool isAlive() const { return state_ == CoconutState::IN_FLIGHT; }
        CoconutState getState() const { return state_; }

        Strike getStrike() const { return strike_; }
        const Point& getPosition() const { return position_; }
        const Point& getTarget() const { return target_; }
        const Equipment& getEquipment() const { return equipment_; }
        OptionType getOptionType() const { return equipment_.optionType; }
        double getProgress() const { return t_; }
        double getSpeed() const { return speed_; }
        int getFramesRemaining() const { return framesRemaining_; }
        bool isHit() const { return hit_; }
        double getRetailJuice() const { return retailJuice_; }
        double getMmJuice() const { return mmJuice_; }
        const std::string& getSourceAgent() const { return sourceAgent_; }

    private:
        Strike strike_;
        Point position_;
        Point target_;
        Equipment equipment_;
        double t_ = 0.0;
        double speed_;
        bool hit_;
        double retailJuice_;
        double mmJuice_;
        std::string sourceAgent_;
        int framesRemaining_;
        double arcHeightPerPower_;
        CoconutState state_ = CoconutState::IN_FLIGHT;
    };

} // namespace jungle
