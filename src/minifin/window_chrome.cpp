#include "window_chrome.h"

#include <stdio.h>

#include "minifin_log.h"

WindowChrome::WindowChrome(WindowSystem *window) : window_(window) {}

void WindowChrome::minimize()
{
    if (!window_) return;
    window_->minimize();
}

void WindowChrome::toggle_maximize()
{
    if (!window_) return;
    bool maximized = window_->is_maximized();
    LOG_ENTER("maximized=%d", maximized ? 1 : 0);
    if (maximized) {
        window_->unmaximize();
    } else {
        window_->maximize();
    }
}

void WindowChrome::close()
{
    if (!window_) return;
    window_->close();
}

bool WindowChrome::handle_intercept_event(const std::string &event_id)
{
    if (event_id == kFullscreenEventId) {
        toggle_maximize();
        return true;
    }
    fprintf(stderr, "[minifin] no chrome action for page event '%s'\n", event_id.c_str());
    return false;
}

void WindowChrome::present()
{
    if (!window_) return;
    window_->set_frameless(true);
    window_->show();
    window_->focus();
}

ChromeLayout WindowChrome::compute_layout(int window_width, int window_height, int controls_width) const
{
    ChromeLayout layout;
    if (window_width <= 0 || window_height <= 0) return layout;
    if (controls_width < 0) controls_width = 0;
    if (controls_width > window_width) controls_width = window_width;

    int strip_height = kStripHeight < window_height ? kStripHeight : window_height;
    int free_width = window_width - controls_width;
    int left_width = (free_width * 7) / 10;
    int right_width = free_width - left_width;

    layout.move_left = {0, 0, left_width, strip_height};
    layout.controls = {left_width, 0, controls_width, strip_height};
    layout.move_right = {left_width + controls_width, 0, right_width, strip_height};
    layout.resize_border = kResizeBorder;
    return layout;
}

WindowSystem::ResizeEdge WindowChrome::hit_test_resize(int x, int y, int window_width, int window_height) const
{
    using Edge = WindowSystem::ResizeEdge;
    if (x < 0 || y < 0 || x >= window_width || y >= window_height) return Edge::None;
    bool left = x < kResizeBorder;
    bool right = x >= window_width - kResizeBorder;
    bool top = y < kResizeBorder;
    bool bottom = y >= window_height - kResizeBorder;
    if (top && left) return Edge::TopLeft;
    if (top && right) return Edge::TopRight;
    if (bottom && left) return Edge::BottomLeft;
    if (bottom && right) return Edge::BottomRight;
    if (top) return Edge::Top;
    if (bottom) return Edge::Bottom;
    if (left) return Edge::Left;
    if (right) return Edge::Right;
    return Edge::None;
}

void WindowChrome::pointer_entered_strip()
{
    controls_visible_ = true;
}

void WindowChrome::pointer_left_strip()
{
    controls_visible_ = false;
}

const char *resize_edge_name(WindowSystem::ResizeEdge edge)
{
    using Edge = WindowSystem::ResizeEdge;
    switch (edge) {
        case Edge::None: return "none";
        case Edge::Top: return "top";
        case Edge::Bottom: return "bottom";
        case Edge::Left: return "left";
        case Edge::Right: return "right";
        case Edge::TopLeft: return "top-left";
        case Edge::TopRight: return "top-right";
        case Edge::BottomLeft: return "bottom-left";
        case Edge::BottomRight: return "bottom-right";
    }
    return "none";
}
