#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "memory/MemoryStore.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace jungle;
using Catch::Approx;
namespace fs = std::filesystem;

namespace {
    constexpr Timestamp kDayMs = 86400ULL * 1000ULL;

    std::vector<std::string> contents(const MemoryStore& store) {
        std::vector<std::string> out;
        for (const auto& m : store.getMemories()) out.push_back(m.content);
        std::sort(out.begin(), out.end());
        return out;
    }
}

class MemoryStoreFixture {
public:
    MemoryStoreFixture() : rng_(42) {
        testDir_ = fs::temp_directory_path() / "jungle_memory_test";
        fs::remove_all(testDir_);
        fs::create_directories(testDir_);
    }

    ~MemoryStoreFixture() {
        fs::remove_all(testDir_);
    }

    fs::path testDir_;
    Random rng_;
    Timestamp clock_ = 1700000000000ULL;

    MemoryStore::Clock clock() {
        return [this] { return clock_; };
    }
};

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Add records content and importance", "[memory]") {
    MemoryStore store("retail", rng_, 100, "", clock());
    store.add("Hit call strike 630 at spot 628", 0.7);

    REQUIRE(store.size() == 1);
    const auto& m = store.getMemories().front();
    REQUIRE(m.content == "Hit call strike 630 at spot 628");
    REQUIRE(m.importance == Approx(0.7));
    REQUIRE(m.timestamp == clock_);
    REQUIRE(m.references == 0);
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Importance is clamped", "[memory]") {
    MemoryStore store("retail", rng_, 100, "", clock());
    store.add("too important", 1.5);
    store.add("negative", -0.5);

    REQUIRE(store.getMemories()[0].importance == Approx(1.0));
    REQUIRE(store.getMemories()[1].importance == Approx(0.0));
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Never exceeds capacity and keeps the best", "[memory]") {
    MemoryStore store("retail", rng_, 3, "", clock());

    const std::vector<std::pair<std::string, double>> adds = {
        {"m1", 0.1}, {"m2", 0.9}, {"m3", 0.5}, {"m4", 0.7}, {"m5", 0.3}
    };
    for (const auto& [content, importance] : adds) {
        store.add(content, importance);
        REQUIRE(store.size() <= 3);
    }

    REQUIRE(contents(store) == std::vector<std::string>{ "m2", "m3", "m4" });
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Old memories decay out", "[memory]") {
    MemoryStore store("monkey", rng_, 3, "", clock());
    store.add("ancient but important", 0.9);

    clock_ += 10 * kDayMs;   // score 0.9 / 11 < 0.3
    store.add("fresh a", 0.3);
    store.add("fresh b", 0.4);
    store.add("fresh c", 0.5);

    REQUIRE(contents(store) == std::vector<std::string>{ "fresh a", "fresh b", "fresh c" });
}

TEST_CASE("MemoryStore: Curation score formula", "[memory]") {
    Memory m;
    m.importance = 0.8;
    m.references = 5;
    m.timestamp = 0;

    REQUIRE(MemoryStore::curationScore(m, 0) == Approx(0.8 * 1.5));
    REQUIRE(MemoryStore::curationScore(m, kDayMs) == Approx(0.8 * 1.5 * 0.5));
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Curation is idempotent", "[memory]") {
    MemoryStore store("retail", rng_, 3, "", clock());
    for (int i = 0; i < 6; ++i) {
        store.add("m" + std::to_string(i), 0.1 * (i + 1));
    }

    auto before = contents(store);
    store.curate();
    store.curate();
    REQUIRE(contents(store) == before);
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Retrieval ranks by context", "[memory]") {
    MemoryStore store("retail", rng_, 100, "", clock());
    store.add("Missed call strike 625", 0.5);
    store.add("Hit call strike 630 at spot " + MemoryStore::priceToken(628.0), 0.7);
    store.add("Missed put strike 635", 0.5);

    RecallContext ctx;
    ctx.strikePrice = 630;
    ctx.spotPrice = 628.0;
    ctx.recentSuccess = true;

    auto recalled = store.retrieve(ctx, 1);
    REQUIRE(recalled.size() == 1);
    REQUIRE(recalled.front().content.find("strike 630") != std::string::npos);
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Retrieval bumps every considered memory", "[memory]") {
    MemoryStore store("monkey", rng_, 100, "", clock());
    store.add("Successfully defended call strike 630", 0.8);
    store.add("Failed to defend call strike 625", 0.6);
    store.add("Failed to defend put strike 635", 0.6);

    RecallContext ctx;
    ctx.strikePrice = 630;
    ctx.recentSuccess = false;

    auto recalled = store.retrieve(ctx, 1);
    REQUIRE(recalled.size() == 1);

    // Only one returned, but all three were scored
    for (const auto& m : store.getMemories()) {
        REQUIRE(m.references == 1);
    }
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Failure keyword matches when not succeeding", "[memory]") {
    MemoryStore store("monkey", rng_, 100, "", clock());
    store.add("Successfully defended call strike 640", 0.8);
    store.add("Failed to defend call strike 641", 0.6);

    RecallContext ctx;
    ctx.recentSuccess = false;

    auto recalled = store.retrieve(ctx, 2);
    REQUIRE(recalled.size() == 2);
    REQUIRE(recalled.front().content == "Failed to defend call strike 641");
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Summary buckets", "[memory]") {
    MemoryStore empty("retail", rng_, 100, "", clock());
    REQUIRE(empty.summarize() == "No memories collected yet.");

    MemoryStore store("retail", rng_, 100, "", clock());
    store.add("big lesson", 0.9);
    store.add("useful pattern", 0.6);
    store.add("noise", 0.2);

    std::string summary = store.summarize();
    REQUIRE(summary.rfind("Agent retail Insights:", 0) == 0);
    REQUIRE(summary.find("Key Learnings:\n- big lesson (referenced 0 times)") != std::string::npos);
    REQUIRE(summary.find("Useful Patterns:\n- useful pattern") != std::string::npos);
    REQUIRE(summary.find("noise") == std::string::npos);
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Summary lists at most three per bucket", "[memory]") {
    MemoryStore store("retail", rng_, 100, "", clock());
    for (int i = 0; i < 5; ++i) {
        store.add("lesson " + std::to_string(i), 0.9);
    }

    std::string summary = store.summarize();
    size_t bullets = 0;
    for (size_t pos = summary.find("\n- "); pos != std::string::npos; pos = summary.find("\n- ", pos + 1)) {
        bullets++;
    }
    REQUIRE(bullets == 3);
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Persists and reloads", "[memory]") {
    {
        MemoryStore store("retail", rng_, 100, testDir_.string(), clock());
        store.add("Hit call strike 630 at spot 628", 0.7);
        store.add("Missed call strike 625", 0.5);
    }

    REQUIRE(fs::exists(testDir_ / "retail_memories.json"));

    MemoryStore reloaded("retail", rng_, 100, testDir_.string(), clock());
    REQUIRE(reloaded.size() == 2);
    REQUIRE(reloaded.getMemories()[0].content == "Hit call strike 630 at spot 628");
    REQUIRE(reloaded.getMemories()[0].importance == Approx(0.7));
    REQUIRE(reloaded.getMemories()[0].timestamp == clock_);
}

TEST_CASE_METHOD(MemoryStoreFixture, "MemoryStore: Corrupt file starts empty", "[memory]") {
    {
        std::ofstream out(testDir_ / "monkey_memories.json");
        out << "{ not json";
    }

    MemoryStore store("monkey", rng_, 100, testDir_.string(), clock());
    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.load());
}
