#include "startup_router.h"

#include "minifin_log.h"

StartupRouter::Screen StartupRouter::enter_root(const std::optional<std::string> &stored_url,
                                                const std::string &launch_url)
{
    history_.clear();
    current_ = Screen::Root;
    seen_stored_url_ = stored_url ? *stored_url : std::string();
    if (!launch_url.empty()) {
        display_url_ = launch_url;
        current_ = Screen::Display;
    } else if (seen_stored_url_.empty()) {
        current_ = Screen::Configure;
    } else {
        display_url_ = seen_stored_url_;
        current_ = Screen::Display;
    }
    LOG_ENTER("root -> %s", screen_name(current_));
    return current_;
}

StartupRouter::Screen StartupRouter::open_configure()
{
    if (current_ == Screen::Configure) return current_;
    history_.push_back(current_);
    current_ = Screen::Configure;
    return current_;
}

StartupRouter::Screen StartupRouter::configuration_saved(const std::string &saved_url)
{
    if (current_ != Screen::Configure) return current_;
    if (!history_.empty()) {
        current_ = history_.back();
        history_.pop_back();
    } else {
        // First run: nothing to go back to.
        current_ = Screen::Display;
        display_url_ = saved_url;
        seen_stored_url_ = saved_url;
    }
    LOG_ENTER("saved -> %s", screen_name(current_));
    return current_;
}

StartupRouter::Screen StartupRouter::leave_configure()
{
    if (current_ != Screen::Configure || history_.empty()) return current_;
    current_ = history_.back();
    history_.pop_back();
    return current_;
}

bool StartupRouter::refresh_display_target(const std::optional<std::string> &stored_url)
{
    if (current_ != Screen::Display) return false;
    if (!stored_url || stored_url->empty()) return false;
    if (*stored_url == seen_stored_url_) return false;
    seen_stored_url_ = *stored_url;
    display_url_ = *stored_url;
    return true;
}

const char *screen_name(StartupRouter::Screen screen)
{
    switch (screen) {
        case StartupRouter::Screen::Root: return "root";
        case StartupRouter::Screen::Configure: return "configure";
        case StartupRouter::Screen::Display: return "display";
    }
    return "root";
}
