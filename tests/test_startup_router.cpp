#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "startup_router.h"

using Screen = StartupRouter::Screen;

TEST(StartupRouterTest, NoStoredUrlGoesToConfigure) {
    StartupRouter router;
    EXPECT_EQ(router.enter_root(std::nullopt), Screen::Configure);
    EXPECT_FALSE(router.can_go_back());
}

TEST(StartupRouterTest, EmptyStoredUrlGoesToConfigure) {
    StartupRouter router;
    EXPECT_EQ(router.enter_root(std::string()), Screen::Configure);
}

TEST(StartupRouterTest, StoredUrlGoesToDisplay) {
    StartupRouter router;
    EXPECT_EQ(router.enter_root(std::string("https://x")), Screen::Display);
    EXPECT_EQ(router.display_url(), "https://x");
    EXPECT_FALSE(router.can_go_back());
}

TEST(StartupRouterTest, FirstRunSaveOpensDisplay) {
    StartupRouter router;
    router.enter_root(std::nullopt);
    EXPECT_EQ(router.configuration_saved("https://x"), Screen::Display);
    EXPECT_EQ(router.display_url(), "https://x");
    // Display already shows the saved value.
    EXPECT_FALSE(router.refresh_display_target(std::string("https://x")));
}

TEST(StartupRouterTest, DetourSaveReloadsWithNewValue) {
    StartupRouter router;
    router.enter_root(std::string("https://x"));
    EXPECT_EQ(router.open_configure(), Screen::Configure);
    EXPECT_TRUE(router.can_go_back());

    EXPECT_EQ(router.configuration_saved("https://y"), Screen::Display);
    EXPECT_FALSE(router.can_go_back());
    EXPECT_TRUE(router.refresh_display_target(std::string("https://y")));
    EXPECT_EQ(router.display_url(), "https://y");
    EXPECT_FALSE(router.refresh_display_target(std::string("https://y")));
}

TEST(StartupRouterTest, DetourSaveOfSameValueDoesNotReload) {
    StartupRouter router;
    router.enter_root(std::string("https://x"));
    router.open_configure();
    router.configuration_saved("https://x");
    EXPECT_FALSE(router.refresh_display_target(std::string("https://x")));
}

TEST(StartupRouterTest, CancelReturnsToDisplayUnchanged) {
    StartupRouter router;
    router.enter_root(std::string("https://x"));
    router.open_configure();
    EXPECT_EQ(router.leave_configure(), Screen::Display);
    EXPECT_FALSE(router.refresh_display_target(std::string("https://x")));
    EXPECT_EQ(router.display_url(), "https://x");
}

TEST(StartupRouterTest, CancelWithoutHistoryStaysOnConfigure) {
    StartupRouter router;
    router.enter_root(std::nullopt);
    EXPECT_EQ(router.leave_configure(), Screen::Configure);
}

TEST(StartupRouterTest, OpenConfigureTwiceKeepsOneHistoryEntry) {
    StartupRouter router;
    router.enter_root(std::string("https://x"));
    router.open_configure();
    router.open_configure();
    EXPECT_EQ(router.leave_configure(), Screen::Display);
    EXPECT_FALSE(router.can_go_back());
}

TEST(StartupRouterTest, RefreshOnlyActsOnDisplay) {
    StartupRouter router;
    router.enter_root(std::string("https://x"));
    router.open_configure();
    EXPECT_FALSE(router.refresh_display_target(std::string("https://y")));
    EXPECT_EQ(router.display_url(), "https://x");
}

TEST(StartupRouterTest, LaunchUrlOverridesWithoutCountingAsChange) {
    StartupRouter router;
    EXPECT_EQ(router.enter_root(std::string("https://stored"), "https://launch"), Screen::Display);
    EXPECT_EQ(router.display_url(), "https://launch");
    EXPECT_FALSE(router.refresh_display_target(std::string("https://stored")));
    EXPECT_EQ(router.display_url(), "https://launch");
}

TEST(StartupRouterTest, LaunchUrlWithoutStoredValue) {
    StartupRouter router;
    EXPECT_EQ(router.enter_root(std::nullopt, "https://launch"), Screen::Display);
    EXPECT_EQ(router.display_url(), "https://launch");
}

TEST(StartupRouterTest, ReenteringRootResetsHistory) {
    StartupRouter router;
    router.enter_root(std::string("https://x"));
    router.open_configure();
    EXPECT_EQ(router.enter_root(std::string("https://x")), Screen::Display);
    EXPECT_FALSE(router.can_go_back());
}

TEST(StartupRouterTest, ScreenNames) {
    EXPECT_STREQ(screen_name(Screen::Root), "root");
    EXPECT_STREQ(screen_name(Screen::Configure), "configure");
    EXPECT_STREQ(screen_name(Screen::Display), "display");
}
