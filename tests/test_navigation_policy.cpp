#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "navigation_policy.h"

namespace {

class FakeLauncher : public ExternalLauncher {
public:
    bool can_launch(const std::string &uri) override {
        queried.push_back(uri);
        return has_handler;
    }
    bool launch(const std::string &uri) override {
        launched.push_back(uri);
        return launch_succeeds;
    }

    bool has_handler = true;
    bool launch_succeeds = true;
    std::vector<std::string> queried;
    std::vector<std::string> launched;
};

} // namespace

TEST(NavigationPolicyTest, WebSchemesStayInBrowser) {
    FakeLauncher launcher;
    NavigationPolicy policy(&launcher);
    EXPECT_EQ(policy.decide("https://media.example.com/web/index.html"), NavigationDecision::Allow);
    EXPECT_EQ(policy.decide("http://192.168.1.10:8096/"), NavigationDecision::Allow);
    EXPECT_EQ(policy.decide("about:blank"), NavigationDecision::Allow);
    EXPECT_EQ(policy.decide("data:text/plain,hi"), NavigationDecision::Allow);
    EXPECT_EQ(policy.decide("HTTPS://MEDIA.EXAMPLE.COM/"), NavigationDecision::Allow);
    EXPECT_TRUE(launcher.queried.empty());
    EXPECT_TRUE(launcher.launched.empty());
}

TEST(NavigationPolicyTest, HandledSchemeIsDelegatedOnce) {
    FakeLauncher launcher;
    NavigationPolicy policy(&launcher);
    const std::string uri = "magnet:?xt=urn:btih:abcdef";
    EXPECT_EQ(policy.decide(uri), NavigationDecision::DelegateExternal);
    ASSERT_EQ(launcher.launched.size(), 1u);
    EXPECT_EQ(launcher.launched[0], uri);
}

TEST(NavigationPolicyTest, MailtoIsDelegated) {
    FakeLauncher launcher;
    NavigationPolicy policy(&launcher);
    EXPECT_EQ(policy.decide("mailto:admin@example.com"), NavigationDecision::DelegateExternal);
    EXPECT_EQ(launcher.launched.size(), 1u);
}

TEST(NavigationPolicyTest, UnhandledSchemeFallsThrough) {
    FakeLauncher launcher;
    launcher.has_handler = false;
    NavigationPolicy policy(&launcher);
    EXPECT_EQ(policy.decide("steam://run/440"), NavigationDecision::Allow);
    EXPECT_EQ(launcher.queried.size(), 1u);
    EXPECT_TRUE(launcher.launched.empty());
}

TEST(NavigationPolicyTest, FailedLaunchFallsThrough) {
    FakeLauncher launcher;
    launcher.launch_succeeds = false;
    NavigationPolicy policy(&launcher);
    EXPECT_EQ(policy.decide("magnet:?xt=urn:btih:abcdef"), NavigationDecision::Allow);
    EXPECT_EQ(launcher.launched.size(), 1u);
}

TEST(NavigationPolicyTest, NoLauncherAllowsEverything) {
    NavigationPolicy policy(nullptr);
    EXPECT_EQ(policy.decide("magnet:?xt=urn:btih:abcdef"), NavigationDecision::Allow);
}

TEST(NavigationPolicyTest, UriWithoutSchemeIsAllowed) {
    FakeLauncher launcher;
    NavigationPolicy policy(&launcher);
    EXPECT_EQ(policy.decide("/web/index.html"), NavigationDecision::Allow);
    EXPECT_TRUE(launcher.queried.empty());
}

TEST(NavigationPolicyTest, ParseUriScheme) {
    EXPECT_EQ(parse_uri_scheme("HTTPS://example.com"), "https");
    EXPECT_EQ(parse_uri_scheme("mailto:a@b"), "mailto");
    EXPECT_EQ(parse_uri_scheme("x-custom+v1.2://thing"), "x-custom+v1.2");
    EXPECT_EQ(parse_uri_scheme("no scheme here"), "");
    EXPECT_EQ(parse_uri_scheme(":empty"), "");
    EXPECT_EQ(parse_uri_scheme("1abc:foo"), "");
    EXPECT_EQ(parse_uri_scheme("/path/with:colon"), "");
}

TEST(NavigationPolicyTest, DecisionNames) {
    EXPECT_STREQ(navigation_decision_name(NavigationDecision::Allow), "ALLOW");
    EXPECT_STREQ(navigation_decision_name(NavigationDecision::DelegateExternal), "DELEGATE_EXTERNAL");
}
