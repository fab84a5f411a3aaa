#ifndef MINIFIN_X11_WINDOW_SYSTEM_H
#define MINIFIN_X11_WINDOW_SYSTEM_H

#include <Xm/Xm.h>
#include <X11/Xlib.h>

#include <functional>

#include "window_chrome.h"

// WindowSystem for a Motif top level shell. Decorations go through the
// Mwm hints resource; maximize state, iconify and interactive move/resize
// go through the EWMH protocol of the running window manager.
class X11WindowSystem : public WindowSystem {
public:
    using CloseHandler = std::function<void()>;

    X11WindowSystem(Widget shell, CloseHandler close_handler);

    void minimize() override;
    void maximize() override;
    void unmaximize() override;
    bool is_maximized() override;
    void close() override;
    void set_frameless(bool frameless) override;
    void show() override;
    void focus() override;
    void begin_move(int root_x, int root_y, unsigned int button) override;
    void begin_resize(ResizeEdge edge, int root_x, int root_y, unsigned int button) override;

    // Routes WM_DELETE_WINDOW to the close handler. Motif no longer
    // destroys the shell by itself, so the browser can close first.
    void handle_wm_close();

private:
    static void wm_delete_cb(Widget w, XtPointer client_data, XtPointer call_data);

    Display *display() const;
    Window window() const;
    void send_root_message(Atom type, long l0, long l1, long l2, long l3, long l4);
    void set_maximized(bool maximized);
    void send_move_resize(long direction, int root_x, int root_y, unsigned int button);

    Widget shell_ = NULL;
    CloseHandler close_handler_;
};

#endif // MINIFIN_X11_WINDOW_SYSTEM_H
