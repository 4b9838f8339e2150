#include <doctest/doctest.h>
#include <chrono>
#include <set>
#include <thread>
#include "bacgate/poller.hpp"
#include "fakes.hpp"
using namespace bacgate;
using namespace bacgate::test;
using std::chrono::seconds;

static size_t broadcasts(const FakeDatalink& link) {
    size_t n = 0;
    for (const auto& f : link.sent) n += f.broadcast ? 1 : 0;
    return n;
}

TEST_CASE("Each tick reads every live device with its own invoke id") {
    FakeDatalink link;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg;
    const auto t0 = Poller::Clock::now();
    reg.upsert(1, addr(10, 0, 0, 1), 1, t0);
    reg.upsert(2, addr(10, 0, 0, 2), 1, t0);
    reg.upsert(3, addr(10, 0, 0, 3), 1, t0);

    Poller poller(engine, reg, Poller::Options{});
    CHECK(poller.tick(t0 + seconds(10)) == 3);
    REQUIRE(link.sent.size() == 3);

    std::set<uint8_t> ids;
    std::set<BipAddress> targets;
    for (const auto& f : link.sent) {
        CHECK_FALSE(f.broadcast);
        ids.insert(invoke_of(f));
        targets.insert(f.dest);
    }
    CHECK(ids.size() == 3);
    CHECK(targets.size() == 3);
    CHECK(engine.pending_count() == 3);
}

TEST_CASE("Every Nth tick also rediscovers") {
    FakeDatalink link;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg;

    Poller::Options opts;
    opts.rediscover_every = 3;
    Poller poller(engine, reg, opts);
    const auto t0 = Poller::Clock::now();
    for (int i = 0; i < 7; ++i) poller.tick(t0);
    CHECK(poller.ticks() == 7);
    CHECK(broadcasts(link) == 2);

    Poller::Options never;
    never.rediscover_every = 0;
    Poller quiet(engine, reg, never);
    for (int i = 0; i < 10; ++i) quiet.tick(t0);
    CHECK(broadcasts(link) == 2);
}

TEST_CASE("Stale devices are skipped, evicted ones are forgotten") {
    FakeDatalink link;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg(seconds(180));
    const auto t0 = Poller::Clock::now();
    reg.upsert(1, addr(10, 0, 0, 1), 1, t0);
    reg.upsert(2, addr(10, 0, 0, 2), 1, t0 + seconds(200));

    Poller::Options opts;
    opts.rediscover_every = 0;
    Poller poller(engine, reg, opts);
    CHECK(poller.tick(t0 + seconds(250)) == 1);
    REQUIRE(link.sent.size() == 1);
    CHECK(link.sent[0].dest == addr(10, 0, 0, 2));
    CHECK(reg.size() == 2);

    Poller::Options evicting = opts;
    evicting.evict_after = seconds(240);
    Poller sweeper(engine, reg, evicting);
    CHECK(sweeper.tick(t0 + seconds(250)) == 1);
    CHECK(reg.size() == 1);
    CHECK_FALSE(reg.find(1, t0));
}

TEST_CASE("A send failure does not stop the rest of the cycle") {
    FakeDatalink link;
    link.send_result = TransportError::Send;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg;
    const auto t0 = Poller::Clock::now();
    reg.upsert(1, addr(10, 0, 0, 1), 1, t0);
    reg.upsert(2, addr(10, 0, 0, 2), 1, t0);

    Poller poller(engine, reg, Poller::Options{});
    CHECK(poller.tick(t0) == 0);
    CHECK(engine.pending_count() == 0);
}

TEST_CASE("run ticks on the interval until cancelled") {
    FakeDatalink link;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg;

    Poller::Options opts;
    opts.interval = std::chrono::milliseconds(10);
    opts.rediscover_every = 1;
    Poller poller(engine, reg, opts);

    CancelToken cancel;
    std::thread t([&] { poller.run(cancel); });
    while (link.sent_count() < 2) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    cancel.request_stop();
    t.join();
    CHECK(poller.ticks() >= 2);
}

TEST_CASE("run polls at once instead of waiting a full interval") {
    FakeDatalink link;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg;
    reg.upsert(7, addr(10, 0, 0, 7), 1, Poller::Clock::now());

    Poller::Options opts;
    opts.interval = std::chrono::hours(1);
    opts.rediscover_every = 0;
    Poller poller(engine, reg, opts);

    CancelToken cancel;
    std::thread t([&] { poller.run(cancel); });
    const auto deadline = Poller::Clock::now() + seconds(5);
    while (link.sent_count() < 1 && Poller::Clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    cancel.request_stop();
    t.join();

    CHECK(poller.ticks() == 1);
    REQUIRE(link.sent_count() == 1);
    CHECK(link.sent[0].dest == addr(10, 0, 0, 7));
}

TEST_CASE("run does nothing once cancelled") {
    FakeDatalink link;
    EventChannel ch;
    Engine engine(link, ch);
    DeviceRegistry reg;
    Poller poller(engine, reg, Poller::Options{});

    CancelToken cancel;
    cancel.request_stop();
    poller.run(cancel);
    CHECK(poller.ticks() == 0);
}
