#ifndef MINIFIN_EXTERNAL_LAUNCHER_H
#define MINIFIN_EXTERNAL_LAUNCHER_H

#include <map>
#include <string>

#include "navigation_policy.h"

// Hands URIs to the desktop's registered scheme handlers through the
// xdg-utils tools (xdg-mime for the lookup, xdg-open for the launch).
class XdgLauncher : public ExternalLauncher {
public:
    bool can_launch(const std::string &uri) override;
    bool launch(const std::string &uri) override;

    // Desktop entry registered for x-scheme-handler/<scheme>, or "".
    // Looked up once per scheme for the life of the launcher.
    std::string handler_for_scheme(const std::string &scheme);

protected:
    // Runs xdg-mime synchronously.
    virtual std::string query_scheme_handler(const std::string &scheme) const;

private:
    std::map<std::string, std::string> handler_cache_;
};

#endif // MINIFIN_EXTERNAL_LAUNCHER_H
