#ifndef MINIFIN_NAVIGATION_POLICY_H
#define MINIFIN_NAVIGATION_POLICY_H

#include <string>

// OS side of external link handling (mail client for mailto:, torrent
// client for magnet:, ...).
class ExternalLauncher {
public:
    virtual ~ExternalLauncher() = default;
    virtual bool can_launch(const std::string &uri) = 0;
    // Starts the handler without waiting for it.
    virtual bool launch(const std::string &uri) = 0;
};

enum class NavigationDecision {
    Allow,
    DelegateExternal,
};

struct NavigationRequest {
    std::string target_uri;
    std::string scheme;
};

// Lower-cased scheme of uri, or "" when it has none.
std::string parse_uri_scheme(const std::string &uri);
NavigationRequest make_navigation_request(const std::string &uri);

class NavigationPolicy {
public:
    explicit NavigationPolicy(ExternalLauncher *launcher);

    static bool is_internal_scheme(const std::string &scheme);

    NavigationDecision decide(const NavigationRequest &request);
    NavigationDecision decide(const std::string &uri) { return decide(make_navigation_request(uri)); }

private:
    ExternalLauncher *launcher_ = nullptr;
};

const char *navigation_decision_name(NavigationDecision decision);

#endif // MINIFIN_NAVIGATION_POLICY_H
