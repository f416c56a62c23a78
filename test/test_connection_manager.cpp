#include <unity.h>

#include "CommandQueue.h"
#include "Commands.h"
#include "ConnectionManager.h"
#include "FakeTransport.h"
#include "system/Log.h"
#include "system/TaskScheduler.h"

#include <memory>
#include <string>
#include <vector>

extern "C" void setUp(void) { movehub::system::clearLogHistory(); }
extern "C" void tearDown(void) {}

using movehub::CommandQueue;
using movehub::ConnectionCallbacks;
using movehub::ConnectionConfig;
using movehub::ConnectionManager;
using movehub::ConnectionState;
using movehub::SensorKind;
using movehub::fake::FakeTransport;
using movehub::system::TaskScheduler;

namespace {

struct Harness {
    FakeTransport transport;
    TaskScheduler scheduler;
    CommandQueue queue{scheduler};
    std::unique_ptr<ConnectionManager> manager;

    int statusChanges = 0;
    int resets = 0;
    std::vector<std::vector<uint8_t>> frames;

    explicit Harness(ConnectionConfig config = ConnectionConfig{}) {
        ConnectionCallbacks callbacks;
        callbacks.onStatusChanged = [this](uint64_t) { ++statusChanges; };
        callbacks.onFrame = [this](const uint8_t* data, size_t length, uint64_t) {
            frames.emplace_back(data, data + length);
        };
        callbacks.onSessionReset = [this](uint64_t) { ++resets; };
        manager = std::make_unique<ConnectionManager>(config, transport, queue, scheduler, std::move(callbacks));
    }

    void runUntil(uint64_t endMs) {
        while (transport.clockMs < endMs) {
            transport.clockMs += 10;
            manager->service(transport.clockMs);
            scheduler.service(transport.clockMs);
        }
    }
};

}  // namespace

static void test_connect_subscribes_full_set() {
    Harness h;
    TEST_ASSERT_TRUE(h.manager->connect(0));
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.manager->state());
    TEST_ASSERT_EQUAL_STRING("Movesense 233830000123", h.manager->deviceName().c_str());
    TEST_ASSERT_FALSE(h.manager->connect(0));

    h.runUntil(2000);
    const std::vector<movehub::Command> expected = movehub::subscriptionSet(104, 125);
    TEST_ASSERT_EQUAL_UINT(expected.size(), h.transport.writes.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        TEST_ASSERT_EQUAL_UINT64(i * 200, h.transport.writes[i].atMs);
        TEST_ASSERT_TRUE(expected[i].payload == h.transport.writes[i].payload);
    }
}

static void test_retries_exhausted_after_three_attempts() {
    Harness h;
    h.manager->connect(0);
    h.runUntil(2000);

    h.transport.failOpen = true;
    h.transport.drop("supervision timeout");
    h.runUntil(2010);
    TEST_ASSERT_EQUAL(ConnectionState::Reconnecting, h.manager->state());
    TEST_ASSERT_EQUAL_UINT32(1, h.manager->reconnectAttempt());
    TEST_ASSERT_EQUAL_STRING("supervision timeout", h.manager->lastError().c_str());
    TEST_ASSERT_FALSE(h.transport.linkOpen());

    h.runUntil(20000);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.manager->state());
    TEST_ASSERT_EQUAL_UINT(4, h.transport.openTimes.size());
    // Drop handled at 2010: attempts 2000 ms, then 3000 ms apart
    TEST_ASSERT_EQUAL_UINT64(4010, h.transport.openTimes[1]);
    TEST_ASSERT_EQUAL_UINT64(7010, h.transport.openTimes[2]);
    TEST_ASSERT_EQUAL_UINT64(10010, h.transport.openTimes[3]);
    TEST_ASSERT_EQUAL_INT(1, h.resets);
    TEST_ASSERT_EQUAL_UINT32(0, h.manager->reconnectAttempt());
    TEST_ASSERT_EQUAL_STRING("Reconnect failed after 3 attempts: Device not found", h.manager->lastError().c_str());
    TEST_ASSERT_EQUAL_UINT(0, h.scheduler.size());
}

static void test_reconnect_resubscribes() {
    Harness h;
    h.manager->connect(0);
    h.runUntil(2000);
    h.transport.drop("");
    h.runUntil(2010);
    TEST_ASSERT_EQUAL_STRING("Link lost", h.manager->lastError().c_str());

    h.runUntil(4010);
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.manager->state());
    TEST_ASSERT_EQUAL_UINT32(0, h.manager->reconnectAttempt());
    TEST_ASSERT_TRUE(h.manager->lastError().empty());
    TEST_ASSERT_EQUAL_INT(0, h.resets);

    h.runUntil(6000);
    TEST_ASSERT_EQUAL_UINT(12, h.transport.writes.size());
    TEST_ASSERT_EQUAL_UINT64(4010, h.transport.writes[6].atMs);
    TEST_ASSERT_TRUE(h.transport.writes[0].payload == h.transport.writes[6].payload);
    TEST_ASSERT_TRUE(movehub::system::logContains("Reconnected to"));
}

static void test_intentional_disconnect_suppresses_reconnect() {
    Harness h;
    h.manager->connect(0);
    h.runUntil(1500);

    h.manager->disconnect(1500);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.manager->state());
    TEST_ASSERT_TRUE(h.manager->intentionalDisconnect());
    TEST_ASSERT_EQUAL_INT(1, h.resets);
    TEST_ASSERT_EQUAL_INT(1, h.transport.closeCalls);

    h.transport.drop("peer closed");
    h.runUntil(1990);
    TEST_ASSERT_TRUE(h.manager->intentionalDisconnect());
    h.runUntil(2000);
    TEST_ASSERT_FALSE(h.manager->intentionalDisconnect());

    h.runUntil(15000);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.manager->state());
    TEST_ASSERT_EQUAL_INT(1, h.transport.openCalls);
}

static void test_initial_connect_failure_reports_error() {
    Harness h;
    h.transport.failOpen = true;
    TEST_ASSERT_TRUE(h.manager->connect(0));
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.manager->state());
    TEST_ASSERT_EQUAL_STRING("Device not found", h.manager->lastError().c_str());

    h.runUntil(10000);
    TEST_ASSERT_EQUAL_INT(1, h.transport.openCalls);
    TEST_ASSERT_EQUAL_INT(0, h.resets);
}

static void test_subscribe_failure_closes_link() {
    Harness h;
    h.transport.subscribeOk = false;
    h.manager->connect(0);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.manager->state());
    TEST_ASSERT_EQUAL_STRING("Notification subscribe failed: CCCD write failed", h.manager->lastError().c_str());
    TEST_ASSERT_EQUAL_INT(1, h.transport.closeCalls);
    TEST_ASSERT_FALSE(h.queue.attached());
}

static void test_cancel_pending_open_on_disconnect() {
    Harness h;
    h.transport.autoOpen = false;
    h.manager->connect(0);
    TEST_ASSERT_EQUAL(ConnectionState::Connecting, h.manager->state());
    TEST_ASSERT_TRUE(h.transport.hasPendingOpen());

    h.manager->disconnect(100);
    TEST_ASSERT_EQUAL_INT(1, h.transport.cancelCalls);
    TEST_ASSERT_FALSE(h.transport.hasPendingOpen());
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.manager->state());
}

static void test_frames_after_drop_are_discarded() {
    Harness h;
    h.manager->connect(0);
    TEST_ASSERT_TRUE(h.transport.notify({0x01, 0x02}));
    h.transport.drop("supervision timeout");
    TEST_ASSERT_TRUE(h.transport.notify({0x03, 0x04}));

    TEST_ASSERT_EQUAL_UINT(1, h.manager->service(10));
    TEST_ASSERT_EQUAL_UINT(1, h.frames.size());
    TEST_ASSERT_EQUAL_HEX8(0x01, h.frames[0][0]);
    TEST_ASSERT_EQUAL(ConnectionState::Reconnecting, h.manager->state());
}

static void test_drop_from_previous_link_is_ignored() {
    Harness h;
    h.manager->connect(0);
    h.runUntil(2000);
    h.transport.drop("supervision timeout");
    h.runUntil(4010);
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.manager->state());
    TEST_ASSERT_EQUAL_INT(2, h.transport.openCalls);

    h.transport.dropStale(0, "BLE disconnect, reason 531");
    h.runUntil(8000);
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.manager->state());
    TEST_ASSERT_EQUAL_INT(2, h.transport.openCalls);
    TEST_ASSERT_TRUE(h.manager->lastError().empty());
    TEST_ASSERT_TRUE(h.transport.linkOpen());
}

static void test_inbox_evicts_oldest_frames() {
    ConnectionConfig config;
    config.inboxCapacity = 4;
    Harness h(config);
    h.manager->connect(0);
    for (uint8_t i = 0; i < 6; ++i) {
        h.transport.notify({i, 0x00});
    }
    TEST_ASSERT_EQUAL_UINT32(2, h.manager->droppedFrames());
    TEST_ASSERT_EQUAL_UINT(4, h.manager->service(10));
    TEST_ASSERT_EQUAL_HEX8(2, h.frames.front()[0]);
    TEST_ASSERT_EQUAL_HEX8(5, h.frames.back()[0]);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_connect_subscribes_full_set);
    RUN_TEST(test_retries_exhausted_after_three_attempts);
    RUN_TEST(test_reconnect_resubscribes);
    RUN_TEST(test_intentional_disconnect_suppresses_reconnect);
    RUN_TEST(test_initial_connect_failure_reports_error);
    RUN_TEST(test_subscribe_failure_closes_link);
    RUN_TEST(test_cancel_pending_open_on_disconnect);
    RUN_TEST(test_frames_after_drop_are_discarded);
    RUN_TEST(test_drop_from_previous_link_is_ignored);
    RUN_TEST(test_inbox_evicts_oldest_frames);
    return UNITY_END();
}
