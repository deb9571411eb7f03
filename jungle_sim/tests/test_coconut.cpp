#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Coconut.hpp"
#include "utils/Random.hpp"

using namespace jungle;
using Catch::Approx;

namespace {
    Equipment makeEquipment(int dte, double power = 1.0, double accuracy = 0.8) {
        Equipment e;
        e.name = "Test";
        e.dte = dte;
        e.power = power;
        e.accuracy = accuracy;
        return e;
    }
}

TEST_CASE("Coconut: Frame budget is dte times fps", "[coconut]") {
    Coconut c(630, { 640, 0 }, { 300, 600 }, makeEquipment(5), 0.02, true, 0.3, 0.7, "retail", 60);

    REQUIRE(c.isAlive());
    REQUIRE(c.getState() == CoconutState::IN_FLIGHT);
    REQUIRE(c.getFramesRemaining() == 300);
    REQUIRE(c.getProgress() == 0.0);
}

TEST_CASE("Coconut: Expires when frames run out", "[coconut]") {
    Random rng(1);
    Coconut c(630, { 640, 0 }, { 300, 600 }, makeEquipment(1), 0.01, false, 0.0, 0.0, "retail", 1);

    c.update(rng);

    REQUIRE_FALSE(c.isAlive());
    REQUIRE(c.getState() == CoconutState::EXPIRED);
    REQUIRE(c.getFramesRemaining() == 0);
}

TEST_CASE("Coconut: Arrives when progress reaches one", "[coconut]") {
    Random rng(1);
    Coconut c(630, { 640, 0 }, { 300, 600 }, makeEquipment(5, 2.0), 0.5, true, 0.3, 0.7, "retail", 60);

    c.update(rng);

    REQUIRE(c.getState() == CoconutState::ARRIVED);
    REQUIRE(c.getProgress() >= 1.0);
}

TEST_CASE("Coconut: Frames strictly decrease and death is final", "[coconut]") {
    Random rng(3);
    Coconut c(630, { 640, 0 }, { 300, 600 }, makeEquipment(2), 0.01, true, 0.3, 0.7, "retail", 10);

    int previous = c.getFramesRemaining();
    int updates = 0;
    while (c.isAlive()) {
        c.update(rng);
        REQUIRE(c.getFramesRemaining() < previous);
        previous = c.getFramesRemaining();
        updates++;
        REQUIRE(updates <= 20);
    }

    auto state = c.getState();
    int frames = c.getFramesRemaining();
    auto position = c.getPosition();

    c.update(rng);
    REQUIRE(c.getState() == state);
    REQUIRE(c.getFramesRemaining() == frames);
    REQUIRE(c.getPosition().x == position.x);
}

TEST_CASE("Coconut: Arc subtracts height from the straight path", "[coconut]") {
    Random rng(5);
    // Perfect accuracy removes the x jitter
    Coconut c(630, { 0, 0 }, { 100, 100 }, makeEquipment(5, 1.0, 1.0), 0.25, true, 0.3, 0.7, "retail", 60);

    c.update(rng);

    REQUIRE(c.getProgress() == Approx(0.25));
    REQUIRE(c.getPosition().x == Approx(25.0));
    REQUIRE(c.getPosition().y == Approx(25.0 - 100.0 * 0.25 * 0.75));
}

TEST_CASE("Coconut: Outcome is fixed at launch", "[coconut]") {
    Random rng(9);
    Coconut c(625, { 0, 0 }, { 100, 100 }, makeEquipment(1), 0.01, true, 0.3, 0.7, "random", 1);
    c.update(rng);

    REQUIRE(c.isHit());
    REQUIRE(c.getRetailJuice() == Approx(0.3));
    REQUIRE(c.getMmJuice() == Approx(0.7));
    REQUIRE(c.getSourceAgent() == "random");
    REQUIRE(c.getStrike() == 625);
}
