#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "intercept_bridge.h"

namespace {

struct SentInstall {
    std::string event_id;
    int generation;
};

class FakeChannel : public InterceptChannel {
public:
    bool send_install(const InterceptRequest &request, int generation) override {
        if (!available) return false;
        sent.push_back({request.event_id, generation});
        return true;
    }

    bool available = true;
    std::vector<SentInstall> sent;
};

// Collects delayed tasks so tests decide when timers fire.
struct ManualScheduler {
    std::vector<std::pair<int, std::function<void()>>> pending;

    InterceptBridge::DelayScheduler scheduler() {
        return [this](int delay_ms, std::function<void()> task) {
            pending.emplace_back(delay_ms, std::move(task));
        };
    }

    void run_all() {
        auto tasks = std::move(pending);
        pending.clear();
        for (auto &entry : tasks) entry.second();
    }
};

InterceptRequest fullscreen_request() {
    return InterceptRequest{{"btnFullscreen"}, "fullscreenButton"};
}

class InterceptBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge_.set_channel(&channel_);
        bridge_.set_event_handler([this](const std::string &id) { events_.push_back(id); });
        ASSERT_TRUE(bridge_.add_intercept(fullscreen_request(), nullptr));
    }

    ManualScheduler timers_;
    FakeChannel channel_;
    InterceptBridge bridge_{timers_.scheduler(), 1000};
    std::vector<std::string> events_;
};

} // namespace

TEST_F(InterceptBridgeTest, InstallsAfterSettleDelay) {
    int generation = bridge_.page_load_started();
    bridge_.page_load_finished();
    ASSERT_EQ(timers_.pending.size(), 1u);
    EXPECT_EQ(timers_.pending[0].first, 1000);
    EXPECT_TRUE(channel_.sent.empty());

    timers_.run_all();
    ASSERT_EQ(channel_.sent.size(), 1u);
    EXPECT_EQ(channel_.sent[0].event_id, "fullscreenButton");
    EXPECT_EQ(channel_.sent[0].generation, generation);
    EXPECT_TRUE(bridge_.is_pending(fullscreen_request()));
    EXPECT_FALSE(bridge_.is_installed(fullscreen_request()));

    EXPECT_TRUE(bridge_.handle_install_result(fullscreen_request(), generation, true));
    EXPECT_FALSE(bridge_.is_pending(fullscreen_request()));
    EXPECT_TRUE(bridge_.is_installed(fullscreen_request()));
}

TEST_F(InterceptBridgeTest, RepeatedInstallIsNotResent) {
    bridge_.page_load_started();
    EXPECT_TRUE(bridge_.install(fullscreen_request()));
    EXPECT_TRUE(bridge_.install(fullscreen_request()));
    EXPECT_EQ(bridge_.install_registered(), 1);
    EXPECT_EQ(channel_.sent.size(), 1u);
}

TEST_F(InterceptBridgeTest, NewPageLoadReinstalls) {
    int first = bridge_.page_load_started();
    bridge_.page_load_finished();
    timers_.run_all();
    ASSERT_TRUE(bridge_.handle_install_result(fullscreen_request(), first, true));
    int second = bridge_.page_load_started();
    EXPECT_FALSE(bridge_.is_installed(fullscreen_request()));
    bridge_.page_load_finished();
    timers_.run_all();
    ASSERT_EQ(channel_.sent.size(), 2u);
    EXPECT_EQ(channel_.sent[1].generation, second);
}

TEST_F(InterceptBridgeTest, FailedInstallIsRetriedAfterDelay) {
    int generation = bridge_.page_load_started();
    ASSERT_TRUE(bridge_.install(fullscreen_request()));
    ASSERT_EQ(channel_.sent.size(), 1u);

    EXPECT_TRUE(bridge_.handle_install_result(fullscreen_request(), generation, false));
    EXPECT_FALSE(bridge_.is_installed(fullscreen_request()));
    ASSERT_EQ(timers_.pending.size(), 1u);
    EXPECT_EQ(timers_.pending[0].first, 1000);
    EXPECT_EQ(channel_.sent.size(), 1u);

    timers_.run_all();
    ASSERT_EQ(channel_.sent.size(), 2u);
    EXPECT_EQ(channel_.sent[1].generation, generation);
    EXPECT_TRUE(bridge_.handle_install_result(fullscreen_request(), generation, true));
    EXPECT_TRUE(bridge_.is_installed(fullscreen_request()));
}

TEST_F(InterceptBridgeTest, RetriesStopAfterAttemptLimit) {
    int generation = bridge_.page_load_started();
    ASSERT_TRUE(bridge_.install(fullscreen_request()));
    for (int i = 1; i < InterceptBridge::kMaxInstallAttempts; ++i) {
        bridge_.handle_install_result(fullscreen_request(), generation, false);
        timers_.run_all();
    }
    EXPECT_EQ(channel_.sent.size(), static_cast<size_t>(InterceptBridge::kMaxInstallAttempts));

    bridge_.handle_install_result(fullscreen_request(), generation, false);
    EXPECT_TRUE(timers_.pending.empty());
    EXPECT_FALSE(bridge_.is_pending(fullscreen_request()));
    EXPECT_FALSE(bridge_.is_installed(fullscreen_request()));
}

TEST_F(InterceptBridgeTest, ResultFromReplacedPageIsIgnored) {
    int old_generation = bridge_.page_load_started();
    ASSERT_TRUE(bridge_.install(fullscreen_request()));
    bridge_.page_load_started();

    EXPECT_FALSE(bridge_.handle_install_result(fullscreen_request(), old_generation, true));
    EXPECT_FALSE(bridge_.is_installed(fullscreen_request()));
    EXPECT_FALSE(bridge_.handle_install_result(fullscreen_request(), old_generation, false));
    EXPECT_TRUE(timers_.pending.empty());
}

TEST_F(InterceptBridgeTest, RetryTimerFromReplacedPageDoesNothing) {
    int generation = bridge_.page_load_started();
    ASSERT_TRUE(bridge_.install(fullscreen_request()));
    bridge_.handle_install_result(fullscreen_request(), generation, false);
    ASSERT_EQ(timers_.pending.size(), 1u);

    bridge_.page_load_started();
    timers_.run_all();
    EXPECT_EQ(channel_.sent.size(), 1u);
}

TEST_F(InterceptBridgeTest, SupersededSettleTimerDoesNothing) {
    bridge_.page_load_started();
    bridge_.page_load_finished();
    int second = bridge_.page_load_started();
    timers_.run_all();
    EXPECT_TRUE(channel_.sent.empty());

    bridge_.page_load_finished();
    timers_.run_all();
    ASSERT_EQ(channel_.sent.size(), 1u);
    EXPECT_EQ(channel_.sent[0].generation, second);
}

TEST_F(InterceptBridgeTest, ZeroDelayInstallsImmediately) {
    bridge_.set_settle_delay_ms(0);
    bridge_.page_load_started();
    bridge_.page_load_finished();
    EXPECT_TRUE(timers_.pending.empty());
    EXPECT_EQ(channel_.sent.size(), 1u);
}

TEST_F(InterceptBridgeTest, NegativeDelayClampsToZero) {
    bridge_.set_settle_delay_ms(-20);
    EXPECT_EQ(bridge_.settle_delay_ms(), 0);
}

TEST_F(InterceptBridgeTest, UnavailableChannelSkipsQuietly) {
    channel_.available = false;
    bridge_.page_load_started();
    EXPECT_FALSE(bridge_.install(fullscreen_request()));
    EXPECT_FALSE(bridge_.is_installed(fullscreen_request()));

    channel_.available = true;
    EXPECT_TRUE(bridge_.install(fullscreen_request()));
}

TEST_F(InterceptBridgeTest, NoChannelSkipsQuietly) {
    bridge_.set_channel(nullptr);
    bridge_.page_load_started();
    EXPECT_EQ(bridge_.install_registered(), 0);
}

TEST_F(InterceptBridgeTest, EventFromCurrentPageIsDispatched) {
    int generation = bridge_.page_load_started();
    EXPECT_TRUE(bridge_.handle_button_event("fullscreenButton", generation));
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0], "fullscreenButton");
}

TEST_F(InterceptBridgeTest, EventFromReplacedPageIsDropped) {
    int old_generation = bridge_.page_load_started();
    bridge_.page_load_started();
    EXPECT_FALSE(bridge_.handle_button_event("fullscreenButton", old_generation));
    EXPECT_TRUE(events_.empty());
}

TEST_F(InterceptBridgeTest, UnknownEventIsDropped) {
    int generation = bridge_.page_load_started();
    EXPECT_FALSE(bridge_.handle_button_event("somethingElse", generation));
    EXPECT_TRUE(events_.empty());
}

TEST_F(InterceptBridgeTest, DuplicateRegistrationIsIgnored) {
    EXPECT_TRUE(bridge_.add_intercept(fullscreen_request(), nullptr));
    EXPECT_EQ(bridge_.intercepts().size(), 1u);
}

TEST_F(InterceptBridgeTest, InvalidRequestsAreRejected) {
    std::string error;
    EXPECT_FALSE(bridge_.add_intercept(InterceptRequest{{}, "x"}, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(bridge_.add_intercept(InterceptRequest{{"btn"}, ""}, &error));
    EXPECT_FALSE(bridge_.add_intercept(InterceptRequest{{"btn", ""}, "x"}, &error));
    EXPECT_FALSE(bridge_.add_intercept(InterceptRequest{{"btn full"}, "x"}, &error));
    EXPECT_EQ(bridge_.intercepts().size(), 1u);

    bridge_.page_load_started();
    EXPECT_FALSE(bridge_.install(InterceptRequest{{"a\tb"}, "x"}));
    EXPECT_TRUE(channel_.sent.empty());
}

TEST(InterceptRequestTest, MultipleClassesAreValid) {
    std::string error;
    EXPECT_TRUE(validate_intercept_request(InterceptRequest{{"btnFullscreen", "autoSize"}, "fs"}, &error));
}

TEST(InterceptBridgeNoRequestsTest, LoadFinishWithoutRequestsSchedulesNothing) {
    ManualScheduler timers;
    InterceptBridge bridge(timers.scheduler(), 500);
    bridge.page_load_started();
    bridge.page_load_finished();
    EXPECT_TRUE(timers.pending.empty());
}
