#ifndef MINIFIN_WINDOW_CHROME_H
#define MINIFIN_WINDOW_CHROME_H

#include <string>

// Window operations provided by the window manager. Maximized state is
// owned by the window manager and must be queried, never cached.
class WindowSystem {
public:
    enum class ResizeEdge {
        None,
        Top,
        Bottom,
        Left,
        Right,
        TopLeft,
        TopRight,
        BottomLeft,
        BottomRight,
    };

    virtual ~WindowSystem() = default;
    virtual void minimize() = 0;
    virtual void maximize() = 0;
    virtual void unmaximize() = 0;
    virtual bool is_maximized() = 0;
    virtual void close() = 0;
    virtual void set_frameless(bool frameless) = 0;
    virtual void show() = 0;
    virtual void focus() = 0;
    // Hand an interactive move/resize to the window manager. root_x/root_y
    // is the pointer position that started the drag.
    virtual void begin_move(int root_x, int root_y, unsigned int button) = 0;
    virtual void begin_resize(ResizeEdge edge, int root_x, int root_y, unsigned int button) = 0;
};

struct ChromeRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int px, int py) const
    {
        return width > 0 && height > 0 && px >= x && py >= y && px < x + width && py < y + height;
    }
};

// Placement of the chrome regions for a window of a given size. The
// control strip sits at 70% of the free width (left move area takes
// seven parts, right move area three).
struct ChromeLayout {
    ChromeRect move_left;
    ChromeRect controls;
    ChromeRect move_right;
    int resize_border = 0;
};

class WindowChrome {
public:
    static constexpr const char *kFullscreenEventId = "fullscreenButton";
    static constexpr int kStripHeight = 20;
    static constexpr int kResizeBorder = 4;

    explicit WindowChrome(WindowSystem *window);

    void minimize();
    // Queries the live maximized state and requests the inverse.
    void toggle_maximize();
    void close();

    // Page events delivered by the interception bridge. Returns true when
    // the id is one the chrome reacts to.
    bool handle_intercept_event(const std::string &event_id);

    // Frameless window, shown and focused.
    void present();

    ChromeLayout compute_layout(int window_width, int window_height, int controls_width) const;
    WindowSystem::ResizeEdge hit_test_resize(int x, int y, int window_width, int window_height) const;

    // Hover driven visibility of the control strip.
    void pointer_entered_strip();
    void pointer_left_strip();
    bool controls_visible() const { return controls_visible_; }

private:
    WindowSystem *window_ = nullptr;
    bool controls_visible_ = false;
};

const char *resize_edge_name(WindowSystem::ResizeEdge edge);

#endif // MINIFIN_WINDOW_CHROME_H
