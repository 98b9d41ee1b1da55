#include "slimetrack/net/NetService.hpp"
#include "slimetrack/tracker/HeartbeatEmitter.hpp"
#include "slimetrack/tracker/LivenessWatchdog.hpp"
#include "support/TestMacros.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace slimetrack;
using namespace slimetrack::tracker;
using namespace std::chrono_literals;

namespace asio = slimetrack::net::asio;

static void testEmitterStopsOnInitializing() {
    auto io = net::shared_io_context();
    auto strand = asio::make_strand(*io);
    auto status = std::make_shared<StatusBroadcast>(SessionStatus::Idle);
    std::atomic<int> beats{0};

    auto emitter = std::make_shared<HeartbeatEmitter>(strand, status, 20ms, [&beats] { beats.fetch_add(1); });
    asio::post(strand, [emitter] { emitter->start(); });

    std::this_thread::sleep_for(150ms);
    const int whileIdle = beats.load();
    ASSERT_TRUE(whileIdle >= 3, "beats while idle");

    status->publish(SessionStatus::Initializing);
    std::this_thread::sleep_for(60ms);
    const int afterStop = beats.load();
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(beats.load(), afterStop, "no beats once initializing is observed");

    asio::post(strand, [emitter] { emitter->stop(); });
}

static void testEmitterNeverBeatsWhenInitializing() {
    auto io = net::shared_io_context();
    auto strand = asio::make_strand(*io);
    auto status = std::make_shared<StatusBroadcast>(SessionStatus::Initializing);
    std::atomic<int> beats{0};

    auto emitter = std::make_shared<HeartbeatEmitter>(strand, status, 10ms, [&beats] { beats.fetch_add(1); });
    asio::post(strand, [emitter] { emitter->start(); });
    std::this_thread::sleep_for(60ms);
    ASSERT_EQ(beats.load(), 0, "no beat before a session exists");
}

static void testEmitterStop() {
    auto io = net::shared_io_context();
    auto strand = asio::make_strand(*io);
    auto status = std::make_shared<StatusBroadcast>(SessionStatus::ConnectedToServer);
    std::atomic<int> beats{0};

    auto emitter = std::make_shared<HeartbeatEmitter>(strand, status, 20ms, [&beats] { beats.fetch_add(1); });
    asio::post(strand, [emitter] { emitter->start(); });
    std::this_thread::sleep_for(50ms);
    asio::post(strand, [emitter] { emitter->stop(); });
    std::this_thread::sleep_for(30ms);
    const int stopped = beats.load();
    ASSERT_TRUE(stopped >= 1, "beat at least once");
    std::this_thread::sleep_for(80ms);
    ASSERT_EQ(beats.load(), stopped, "stop() ends the task");
}

static void testWatchdogExpiresOnce() {
    auto io = net::shared_io_context();
    auto strand = asio::make_strand(*io);
    std::atomic<int> expired{0};
    std::atomic<long long> silenceMs{0};

    auto watchdog = std::make_shared<LivenessWatchdog>(strand, 50ms, [&](net::milliseconds silence) {
        silenceMs.store(silence.count());
        expired.fetch_add(1);
    });
    asio::post(strand, [watchdog] { watchdog->start(); });

    std::this_thread::sleep_for(300ms);
    ASSERT_EQ(expired.load(), 1, "expires exactly once");
    ASSERT_TRUE(silenceMs.load() >= 50, "reported silence exceeds the timeout");
}

static void testWatchdogFedStaysQuiet() {
    auto io = net::shared_io_context();
    auto strand = asio::make_strand(*io);
    std::atomic<int> expired{0};

    auto watchdog = std::make_shared<LivenessWatchdog>(strand, 100ms, [&](net::milliseconds) {
        expired.fetch_add(1);
    });
    asio::post(strand, [watchdog] { watchdog->start(); });

    for (int i = 0; i < 15; ++i) {
        std::this_thread::sleep_for(20ms);
        asio::post(strand, [watchdog] { watchdog->feed(); });
    }
    ASSERT_EQ(expired.load(), 0, "regular feeds keep it quiet");

    std::this_thread::sleep_for(400ms);
    ASSERT_EQ(expired.load(), 1, "expires once feeding stops");

    asio::post(strand, [watchdog] { watchdog->stop(); });
}

static void testWatchdogStop() {
    auto io = net::shared_io_context();
    auto strand = asio::make_strand(*io);
    std::atomic<int> expired{0};

    auto watchdog = std::make_shared<LivenessWatchdog>(strand, 40ms, [&](net::milliseconds) {
        expired.fetch_add(1);
    });
    asio::post(strand, [watchdog] {
        watchdog->start();
        watchdog->stop();
    });
    std::this_thread::sleep_for(150ms);
    ASSERT_EQ(expired.load(), 0, "stopped watchdog never fires");
}

int main() {
    testEmitterStopsOnInitializing();
    testEmitterNeverBeatsWhenInitializing();
    testEmitterStop();
    testWatchdogExpiresOnce();
    testWatchdogFedStaysQuiet();
    testWatchdogStop();
    return reportAndExit("Heartbeat and watchdog");
}
