/**
 * @file TestConnectedFreqCache.cpp
 * @brief Unit tests for the per-network connected frequency cache.
 */

#include <catch2/catch_test_macros.hpp>

#include "aphal/wifi/ConnectedFreqCache.hpp"

#include <atomic>

using namespace aphal;
using aphal::wifi::ConnectedFreqCache;

namespace {

class ManualClock final : public wifi::IClock
{
public:
    core::i64 nowMillis() const override { return now.load(); }

    void advance(core::i64 ms) { now.fetch_add(ms); }

    std::atomic<core::i64> now{1'000'000};
};

struct Fixture
{
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    ConnectedFreqCache           cache{clock, 3};
};

using Freqs = std::vector<core::i32>;

} // namespace

TEST_CASE_METHOD(Fixture, "Recorded frequencies come back in ascending order", "[wifi][freq]")
{
    cache.record("home", 5180);
    cache.record("home", 2412);
    cache.record("home", 2437);

    REQUIRE(cache.frequenciesSeenWithin("home", 1000) == Freqs{2412, 2437, 5180});
    REQUIRE(cache.networkCount() == 1);
}

TEST_CASE_METHOD(Fixture, "Unknown networks yield nothing", "[wifi][freq]")
{
    REQUIRE_FALSE(cache.frequenciesSeenWithin("nowhere", 1000).has_value());
}

TEST_CASE_METHOD(Fixture, "Empty network ids are ignored", "[wifi][freq]")
{
    cache.record("", 2412);
    REQUIRE(cache.networkCount() == 0);
    cache.forget("");
}

TEST_CASE_METHOD(Fixture, "Stale entries are pruned on query", "[wifi][freq]")
{
    cache.record("home", 2412);
    clock->advance(500);
    cache.record("home", 5180);
    clock->advance(500);

    // 2412 is exactly 1000 ms old and is kept.
    REQUIRE(cache.frequenciesSeenWithin("home", 1000) == Freqs{2412, 5180});

    clock->advance(1);
    REQUIRE(cache.frequenciesSeenWithin("home", 1000) == Freqs{5180});
    // Pruning is permanent.
    REQUIRE(cache.frequenciesSeenWithin("home", 10'000) == Freqs{5180});

    clock->advance(10'000);
    auto empty = cache.frequenciesSeenWithin("home", 1000);
    REQUIRE(empty.has_value());
    REQUIRE(empty->empty());
}

TEST_CASE_METHOD(Fixture, "Recording again refreshes the timestamp", "[wifi][freq]")
{
    cache.record("home", 2412);
    clock->advance(900);
    cache.record("home", 2412);
    clock->advance(900);

    REQUIRE(cache.frequenciesSeenWithin("home", 1000) == Freqs{2412});
}

TEST_CASE_METHOD(Fixture, "The oldest frequency is evicted past the bound", "[wifi][freq]")
{
    cache.record("home", 5180);
    clock->advance(1);
    cache.record("home", 2412);
    clock->advance(1);
    cache.record("home", 2437);
    clock->advance(1);
    cache.record("home", 5745);

    REQUIRE(cache.frequenciesSeenWithin("home", 1000) == Freqs{2412, 2437, 5745});
}

TEST_CASE_METHOD(Fixture, "Eviction ties go to the lowest frequency", "[wifi][freq]")
{
    cache.record("home", 5180);
    cache.record("home", 2437);
    cache.record("home", 2412);
    cache.record("home", 5745);

    REQUIRE(cache.frequenciesSeenWithin("home", 1000) == Freqs{2437, 5180, 5745});
}

TEST_CASE_METHOD(Fixture, "Networks are tracked independently", "[wifi][freq]")
{
    cache.record("home", 2412);
    cache.record("work", 5180);

    cache.forget("home");
    REQUIRE_FALSE(cache.frequenciesSeenWithin("home", 1000).has_value());
    REQUIRE(cache.frequenciesSeenWithin("work", 1000) == Freqs{5180});
}

TEST_CASE_METHOD(Fixture, "Snapshots restore into a fresh cache", "[wifi][freq]")
{
    cache.record("home", 2412);
    cache.record("work", 5180);
    const auto saved = cache.snapshot();
    REQUIRE(saved.size() == 2);

    ConnectedFreqCache restored{clock, 3};
    restored.restore(saved);
    REQUIRE(restored.frequenciesSeenWithin("home", 1000) == Freqs{2412});
    REQUIRE(restored.frequenciesSeenWithin("work", 1000) == Freqs{5180});
}

TEST_CASE_METHOD(Fixture, "Restore trims oversized networks and skips empty ids", "[wifi][freq]")
{
    ConnectedFreqCache::Snapshot data;
    data["home"] = {{2412, 10}, {2437, 20}, {2462, 30}, {5180, 40}, {5745, 50}};
    data[""]     = {{2412, 10}};

    cache.restore(data);

    REQUIRE(cache.networkCount() == 1);
    const auto saved = cache.snapshot();
    REQUIRE(saved.at("home").size() == 3);
    REQUIRE(saved.at("home").contains(2462));
    REQUIRE_FALSE(saved.at("home").contains(2412));
}

TEST_CASE("A null clock falls back to the system clock", "[wifi][freq]")
{
    ConnectedFreqCache cache{nullptr, 2};
    REQUIRE(cache.maxChannelsPerNetwork() == 2);

    cache.record("home", 2412);
    REQUIRE(cache.frequenciesSeenWithin("home", 60'000) == Freqs{2412});
}
