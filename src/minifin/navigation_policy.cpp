#include "navigation_policy.h"

#include <stdio.h>

#include "minifin_log.h"

static const char *const kInternalSchemes[] = {
    "http",
    "https",
    "file",
    "chrome",
    "data",
    "javascript",
    "about",
};

std::string parse_uri_scheme(const std::string &uri)
{
    size_t colon = uri.find(':');
    if (colon == std::string::npos || colon == 0) return std::string();
    std::string scheme;
    scheme.reserve(colon);
    for (size_t i = 0; i < colon; ++i) {
        char c = uri[i];
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        bool alpha = (c >= 'a' && c <= 'z');
        bool ok = alpha || (i > 0 && ((c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.'));
        if (!ok) return std::string();
        scheme.push_back(c);
    }
    return scheme;
}

NavigationRequest make_navigation_request(const std::string &uri)
{
    NavigationRequest request;
    request.target_uri = uri;
    request.scheme = parse_uri_scheme(uri);
    return request;
}

NavigationPolicy::NavigationPolicy(ExternalLauncher *launcher) : launcher_(launcher) {}

bool NavigationPolicy::is_internal_scheme(const std::string &scheme)
{
    for (const char *known : kInternalSchemes) {
        if (scheme == known) return true;
    }
    return false;
}

NavigationDecision NavigationPolicy::decide(const NavigationRequest &request)
{
    if (request.scheme.empty() || is_internal_scheme(request.scheme)) {
        return NavigationDecision::Allow;
    }
    if (!launcher_) {
        LOG_ENTER("no launcher for scheme=%s, allowing", request.scheme.c_str());
        return NavigationDecision::Allow;
    }
    if (!launcher_->can_launch(request.target_uri)) {
        LOG_ENTER("no external handler for scheme=%s, allowing", request.scheme.c_str());
        return NavigationDecision::Allow;
    }
    if (!launcher_->launch(request.target_uri)) {
        fprintf(stderr, "[minifin] external handler failed to start for %s, letting the engine try\n",
                request.target_uri.c_str());
        return NavigationDecision::Allow;
    }
    fprintf(stderr, "[minifin] delegated %s to external handler\n", request.target_uri.c_str());
    return NavigationDecision::DelegateExternal;
}

const char *navigation_decision_name(NavigationDecision decision)
{
    switch (decision) {
        case NavigationDecision::Allow: return "ALLOW";
        case NavigationDecision::DelegateExternal: return "DELEGATE_EXTERNAL";
    }
    return "OTHER";
}
