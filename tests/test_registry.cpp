#include <doctest/doctest.h>
#include <chrono>
#include "bacgate/device_registry.hpp"
#include "fakes.hpp"
using namespace bacgate;
using bacgate::test::addr;
using std::chrono::seconds;

TEST_CASE("upsert adds once and refreshes afterwards") {
    DeviceRegistry reg;
    const auto t0 = DeviceRegistry::Clock::now();

    CHECK(reg.upsert(7, addr(10, 0, 0, 7), 260, t0));
    CHECK_FALSE(reg.upsert(7, addr(10, 0, 0, 7), 261, t0 + seconds(1)));
    CHECK(reg.size() == 1);

    const auto rec = reg.find(7, t0 + seconds(1));
    REQUIRE(rec);
    CHECK(rec->vendor_id == 261);
    CHECK(rec->last_seen == t0 + seconds(1));
    CHECK_FALSE(rec->stale);
}

TEST_CASE("A device that moves is only reachable at its new address") {
    DeviceRegistry reg;
    const auto t0 = DeviceRegistry::Clock::now();
    reg.upsert(7, addr(10, 0, 0, 7), 1, t0);
    reg.upsert(7, addr(10, 0, 0, 8), 1, t0);

    CHECK(reg.resolve_address_to_instance(addr(10, 0, 0, 7)).kind == Resolution::Kind::Unknown);
    const Resolution r = reg.resolve_address_to_instance(addr(10, 0, 0, 8));
    CHECK(r.kind == Resolution::Kind::Resolved);
    CHECK(r.instance == 7);
}

TEST_CASE("Two devices behind one address make the address ambiguous") {
    DeviceRegistry reg;
    const auto t0 = DeviceRegistry::Clock::now();
    reg.upsert(1, addr(10, 0, 0, 1), 1, t0);
    reg.upsert(2, addr(10, 0, 0, 1), 1, t0);

    const Resolution r = reg.resolve_address_to_instance(addr(10, 0, 0, 1));
    CHECK(r.kind == Resolution::Kind::Ambiguous);
    CHECK(r.candidates == std::vector<uint32_t>{1, 2});
}

TEST_CASE("Staleness is computed from last_seen at snapshot time") {
    DeviceRegistry reg(seconds(180));
    const auto t0 = DeviceRegistry::Clock::now();
    reg.upsert(1, addr(10, 0, 0, 1), 1, t0);
    reg.upsert(2, addr(10, 0, 0, 2), 1, t0 + seconds(100));

    auto snap = reg.snapshot(t0 + seconds(181));
    REQUIRE(snap.size() == 2);
    CHECK(snap[0].instance == 1);
    CHECK(snap[0].stale);
    CHECK(snap[1].instance == 2);
    CHECK_FALSE(snap[1].stale);

    CHECK(reg.touch(1, t0 + seconds(181)));
    CHECK_FALSE(reg.find(1, t0 + seconds(200))->stale);
    CHECK_FALSE(reg.touch(99, t0));
}

TEST_CASE("Eviction drops silent devices and their address links") {
    DeviceRegistry reg;
    const auto t0 = DeviceRegistry::Clock::now();
    reg.upsert(1, addr(10, 0, 0, 1), 1, t0);
    reg.upsert(2, addr(10, 0, 0, 2), 1, t0 + seconds(60));

    CHECK(reg.evict_older_than(t0 + seconds(30)) == 1);
    CHECK(reg.size() == 1);
    CHECK_FALSE(reg.find(1, t0));
    CHECK(reg.resolve_address_to_instance(addr(10, 0, 0, 1)).kind == Resolution::Kind::Unknown);
    CHECK(reg.resolve_address_to_instance(addr(10, 0, 0, 2)).kind == Resolution::Kind::Resolved);
}
