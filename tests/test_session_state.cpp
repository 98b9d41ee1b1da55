#include "slimetrack/tracker/SessionState.hpp"
#include "support/TestMacros.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace slimetrack::tracker;

namespace {

class RecordingHandle : public SessionHandle {
public:
    void shutdown() override { shutdowns.fetch_add(1); }
    std::error_code send(const slimetrack::schema::Bytes&) override { return {}; }

    std::atomic<int> shutdowns{0};
};

struct Fixture {
    std::shared_ptr<StatusBroadcast> broadcast = std::make_shared<StatusBroadcast>();
    SessionState session{broadcast};
};

} // namespace

static void testLifecycle() {
    Fixture f;
    StatusSubscription sub(f.broadcast);
    auto link = std::make_shared<RecordingHandle>();

    ASSERT_TRUE(f.session.status() == SessionStatus::Initializing, "starts initializing");
    ASSERT_TRUE(f.session.link() == nullptr, "no link before begin");

    ASSERT_TRUE(f.session.beginSession(link), "begin from initializing");
    ASSERT_TRUE(f.session.status() == SessionStatus::Idle, "idle after begin");
    ASSERT_TRUE(f.session.link() == link, "link installed");
    ASSERT_TRUE(!f.session.beginSession(std::make_shared<RecordingHandle>()), "second begin refused");
    ASSERT_TRUE(f.session.link() == link, "refused begin leaves the link alone");

    ASSERT_TRUE(f.session.markConnected(*link, 1234), "first datagram connects");
    ASSERT_TRUE(!f.session.markConnected(*link, 1235), "later datagrams do not transition again");
    ASSERT_EQ(f.session.snapshot().lastReceivedPacketTime, std::uint16_t(1235), "receipt time updated");
    ASSERT_TRUE(f.session.isConnectedVia(*link), "connected via link");
    ASSERT_EQ(f.broadcast->version(), std::uint64_t(2), "idle + connected published once each");

    ASSERT_TRUE(f.session.endSession(EndReason::Deinit), "end session");
    ASSERT_TRUE(f.session.status() == SessionStatus::Initializing, "back to initializing");
    ASSERT_TRUE(f.session.link() == nullptr, "link released");
    ASSERT_EQ(link->shutdowns.load(), 1, "link shut down once");
    ASSERT_TRUE(link->endReason() == EndReason::Deinit, "reason recorded on the link");
    ASSERT_TRUE(!f.session.endSession(EndReason::Deinit), "ending twice is a no-op");
    ASSERT_EQ(link->shutdowns.load(), 1, "no second shutdown");
    ASSERT_TRUE(sub.markSeen() == SessionStatus::Initializing, "subscriber sees the final value");
}

static void testStaleLinkCannotEndNewSession() {
    Fixture f;
    auto first = std::make_shared<RecordingHandle>();
    auto second = std::make_shared<RecordingHandle>();

    f.session.beginSession(first);
    f.session.endSession(EndReason::ServerTimeout, first.get());
    f.session.beginSession(second);

    ASSERT_TRUE(!f.session.endSession(EndReason::ServerTimeout, first.get()), "stale watchdog ignored");
    ASSERT_TRUE(f.session.link() == second, "new session untouched");
    ASSERT_TRUE(!f.session.markConnected(*first, 1), "stale link cannot connect the session");
    ASSERT_TRUE(f.session.status() == SessionStatus::Idle, "still idle");
    ASSERT_EQ(second->shutdowns.load(), 0, "new link still open");
}

static void testPacketNumbersAreUniqueAcrossThreads() {
    Fixture f;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;

    std::vector<std::vector<std::uint64_t>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) seen[t].push_back(f.session.nextPacketNumber());
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::uint64_t> all;
    for (auto& v : seen) all.insert(v.begin(), v.end());
    ASSERT_EQ(all.size(), std::size_t(kThreads * kPerThread), "no duplicates");
    ASSERT_EQ(*all.begin(), std::uint64_t(1), "first number is 1");
    ASSERT_EQ(*all.rbegin(), std::uint64_t(kThreads * kPerThread), "no gaps");

    // The counter survives session cycles.
    auto link = std::make_shared<RecordingHandle>();
    f.session.beginSession(link);
    f.session.endSession(EndReason::Deinit);
    ASSERT_EQ(f.session.nextPacketNumber(), std::uint64_t(kThreads * kPerThread + 1), "counter never resets");
}

int main() {
    testLifecycle();
    testStaleLinkCannotEndNewSession();
    testPacketNumbersAreUniqueAcrossThreads();
    return reportAndExit("Session state");
}
