#ifndef MINIFIN_STARTUP_ROUTER_H
#define MINIFIN_STARTUP_ROUTER_H

#include <optional>
#include <string>
#include <vector>

// Decides which screen the window shows. Root is transient: entering it
// resolves to Configure or Display immediately. The router renders
// nothing; callers switch pages after each transition.
class StartupRouter {
public:
    enum class Screen {
        Root,
        Configure,
        Display,
    };

    // Resolves Root from the stored server URL. History is reset. A
    // non-empty launch_url is shown instead of the stored value without
    // replacing it.
    Screen enter_root(const std::optional<std::string> &stored_url,
                      const std::string &launch_url = std::string());

    // Explicit detour from Display (the settings button).
    Screen open_configure();

    // A validated URL was saved on Configure. Returns to the previous
    // screen when there is one, otherwise goes to Display.
    Screen configuration_saved(const std::string &saved_url);

    // Cancel on Configure. Stays on Configure when there is nowhere to go
    // back to.
    Screen leave_configure();

    // Called when Display becomes visible again. Returns true when the
    // stored value changed since Display last picked it up; display_url()
    // then holds the new value.
    bool refresh_display_target(const std::optional<std::string> &stored_url);

    Screen current() const { return current_; }
    const std::string &display_url() const { return display_url_; }
    bool can_go_back() const { return !history_.empty(); }

private:
    Screen current_ = Screen::Root;
    std::vector<Screen> history_;
    std::string display_url_;
    // Stored value as of the last time Display picked it up.
    std::string seen_stored_url_;
};

const char *screen_name(StartupRouter::Screen screen);

#endif // MINIFIN_STARTUP_ROUTER_H
