#include <gtest/gtest.h>

#include <beacon/core/timestamp.h>
#include <beacon/registry/heartbeat_scheduler.h>
#include <beacon/registry/registry_store.h>

#include "common/test_helpers.h"

#include <algorithm>
#include <chrono>

using beacon::Timestamp;
using beacon::registry::HeartbeatScheduler;
using beacon::registry::InstanceEntry;
using beacon::registry::InstanceProfile;
using beacon::registry::RegistryStore;
using beacon::tests::TempDir;
using beacon::tests::write_file;
using namespace std::chrono_literals;

namespace {
InstanceProfile makeProfile(std::string identity = "/work/game") {
    InstanceProfile p;
    p.identity = std::move(identity);
    p.displayName = "game";
    p.channelId = "unityvision-abcdef01";
    p.legacyPort = 7890;
    p.processId = 321;
    p.versionTag = "2022.3";
    return p;
}

size_t countIdentity(const std::vector<InstanceEntry>& entries, const std::string& identity) {
    return static_cast<size_t>(std::count_if(
        entries.begin(), entries.end(), [&](const auto& e) { return e.identity == identity; }));
}

// Manually advanced monotonic clock
struct FakeClock {
    HeartbeatScheduler::Clock::time_point now{};
    HeartbeatScheduler::ClockFn fn() {
        return [this] { return now; };
    }
};
} // namespace

class HeartbeatSchedulerTest : public ::testing::Test {
protected:
    TempDir tmp_{"beacon_heartbeat_"};
    RegistryStore store_{tmp_.path() / "projects.json"};
};

TEST_F(HeartbeatSchedulerTest, RegisterWritesActiveEntry) {
    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());

    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    const auto& e = entries[0];
    EXPECT_EQ(e.identity, "/work/game");
    EXPECT_EQ(e.displayName, "game");
    EXPECT_EQ(e.channelId, "unityvision-abcdef01");
    ASSERT_TRUE(e.legacyPort.has_value());
    EXPECT_EQ(*e.legacyPort, 7890);
    EXPECT_EQ(e.processId, 321);
    EXPECT_TRUE(e.active);
    EXPECT_TRUE(Timestamp::parse(e.lastSeen).has_value());
    ASSERT_TRUE(hb.currentEntry().has_value());
    EXPECT_EQ(hb.currentEntry()->identity, "/work/game");
}

TEST_F(HeartbeatSchedulerTest, RegistrationIsIdempotent) {
    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());
    ASSERT_TRUE(hb.registerOrUpdate());
    ASSERT_TRUE(hb.refreshHeartbeat());
    ASSERT_TRUE(hb.registerOrUpdate());

    auto entries = store_.load();
    EXPECT_EQ(entries.size(), 1u);
    EXPECT_EQ(countIdentity(entries, "/work/game"), 1u);
}

TEST_F(HeartbeatSchedulerTest, RegisterPreservesOtherInstances) {
    HeartbeatScheduler a(store_, makeProfile("/a"));
    HeartbeatScheduler b(store_, makeProfile("/b"));
    ASSERT_TRUE(a.registerOrUpdate());
    ASSERT_TRUE(b.registerOrUpdate());
    ASSERT_TRUE(a.registerOrUpdate());

    auto entries = store_.load();
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(countIdentity(entries, "/a"), 1u);
    EXPECT_EQ(countIdentity(entries, "/b"), 1u);
}

TEST_F(HeartbeatSchedulerTest, RegisterOverwritesMutableFields) {
    InstanceEntry stale;
    stale.identity = "/work/game";
    stale.displayName = "old";
    stale.channelId = "old-pipe";
    stale.processId = 1;
    stale.lastSeen = "2000-01-01T00:00:00.000Z";
    stale.active = false;
    ASSERT_TRUE(store_.save({stale}));

    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());

    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].displayName, "game");
    EXPECT_EQ(entries[0].channelId, "unityvision-abcdef01");
    EXPECT_EQ(entries[0].processId, 321);
    EXPECT_TRUE(entries[0].active);
    EXPECT_NE(entries[0].lastSeen, "2000-01-01T00:00:00.000Z");
}

TEST_F(HeartbeatSchedulerTest, RefreshReactivatesAndUpdatesPort) {
    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());
    ASSERT_TRUE(hb.deactivate());

    hb.setLegacyPort(9000);
    ASSERT_TRUE(hb.refreshHeartbeat());

    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].active);
    ASSERT_TRUE(entries[0].legacyPort.has_value());
    EXPECT_EQ(*entries[0].legacyPort, 9000);
    EXPECT_EQ(hb.heartbeatCount(), 1u);
}

TEST_F(HeartbeatSchedulerTest, RefreshSelfHealsMissingEntry) {
    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());
    ASSERT_TRUE(store_.save({}));

    ASSERT_TRUE(hb.refreshHeartbeat());
    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].identity, "/work/game");
    EXPECT_TRUE(entries[0].active);
}

TEST_F(HeartbeatSchedulerTest, DeactivateKeepsRowInactive) {
    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());
    ASSERT_TRUE(hb.deactivate());

    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_FALSE(entries[0].active);
    EXPECT_TRUE(Timestamp::parse(entries[0].lastSeen).has_value());
}

TEST_F(HeartbeatSchedulerTest, DeactivateWithoutRowIsNoOp) {
    HeartbeatScheduler hb(store_, makeProfile());
    EXPECT_FALSE(hb.deactivate());
    EXPECT_TRUE(store_.load().empty());
}

TEST_F(HeartbeatSchedulerTest, TransientSuspendKeepsActiveFlag) {
    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());
    ASSERT_TRUE(hb.onTransientSuspend());

    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].active);

    ASSERT_TRUE(hb.onResume());
    entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].active);
}

TEST_F(HeartbeatSchedulerTest, TickIsRateLimitedOnMonotonicClock) {
    FakeClock clock;
    HeartbeatScheduler hb(store_, makeProfile(), 5000ms, clock.fn());
    ASSERT_TRUE(hb.registerOrUpdate());

    EXPECT_TRUE(hb.tick()); // first tick always runs
    EXPECT_EQ(hb.heartbeatCount(), 1u);

    clock.now += 1s;
    EXPECT_FALSE(hb.tick());
    clock.now += 3999ms;
    EXPECT_FALSE(hb.tick());
    EXPECT_EQ(hb.heartbeatCount(), 1u);

    clock.now += 1ms;
    EXPECT_TRUE(hb.tick());
    EXPECT_EQ(hb.heartbeatCount(), 2u);
}

TEST_F(HeartbeatSchedulerTest, CorruptRegistryIsHealedByRegistration) {
    write_file(store_.path(), "[[[ definitely not json");
    EXPECT_TRUE(store_.load().empty());

    HeartbeatScheduler hb(store_, makeProfile());
    ASSERT_TRUE(hb.registerOrUpdate());

    auto entries = store_.load();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].identity, "/work/game");
}

TEST(HeartbeatSchedulerFaultTest, UnwritableRegistryDoesNotThrow) {
    TempDir tmp{"beacon_heartbeat_fault_"};
    write_file(tmp.path() / "blocker", "x");
    RegistryStore store(tmp.path() / "blocker" / "projects.json");
    HeartbeatScheduler hb(store, makeProfile());

    EXPECT_NO_THROW({
        EXPECT_FALSE(hb.registerOrUpdate());
        EXPECT_FALSE(hb.refreshHeartbeat());
        EXPECT_FALSE(hb.deactivate());
        EXPECT_FALSE(hb.onTransientSuspend());
    });
    EXPECT_FALSE(hb.currentEntry().has_value());
}
