#include "x11_window_system.h"

#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <Xm/MwmUtil.h>
#include <Xm/Protocols.h>

#include <stdio.h>

#include <utility>

#include "minifin_log.h"

namespace {
// _NET_WM_MOVERESIZE directions.
const long kMoveResizeTopLeft = 0;
const long kMoveResizeTop = 1;
const long kMoveResizeTopRight = 2;
const long kMoveResizeRight = 3;
const long kMoveResizeBottomRight = 4;
const long kMoveResizeBottom = 5;
const long kMoveResizeBottomLeft = 6;
const long kMoveResizeLeft = 7;
const long kMoveResizeMove = 8;

const long kNetWmStateRemove = 0;
const long kNetWmStateAdd = 1;
// Source indication: normal application.
const long kSourceApplication = 1;
} // namespace

X11WindowSystem::X11WindowSystem(Widget shell, CloseHandler close_handler)
    : shell_(shell), close_handler_(std::move(close_handler))
{
}

Display *X11WindowSystem::display() const
{
    return shell_ ? XtDisplay(shell_) : NULL;
}

Window X11WindowSystem::window() const
{
    if (!shell_ || !XtIsRealized(shell_)) return None;
    return XtWindow(shell_);
}

void X11WindowSystem::send_root_message(Atom type, long l0, long l1, long l2, long l3, long l4)
{
    Display *dpy = display();
    Window win = window();
    if (!dpy || win == None) return;
    XEvent event = {};
    event.xclient.type = ClientMessage;
    event.xclient.serial = 0;
    event.xclient.send_event = True;
    event.xclient.display = dpy;
    event.xclient.window = win;
    event.xclient.message_type = type;
    event.xclient.format = 32;
    event.xclient.data.l[0] = l0;
    event.xclient.data.l[1] = l1;
    event.xclient.data.l[2] = l2;
    event.xclient.data.l[3] = l3;
    event.xclient.data.l[4] = l4;
    XSendEvent(dpy,
               DefaultRootWindow(dpy),
               False,
               SubstructureRedirectMask | SubstructureNotifyMask,
               &event);
    XFlush(dpy);
}

void X11WindowSystem::minimize()
{
    Display *dpy = display();
    Window win = window();
    if (!dpy || win == None) return;
    XIconifyWindow(dpy, win, DefaultScreen(dpy));
    XFlush(dpy);
}

void X11WindowSystem::set_maximized(bool maximized)
{
    Display *dpy = display();
    if (!dpy) return;
    Atom state = XInternAtom(dpy, "_NET_WM_STATE", False);
    Atom vert = XInternAtom(dpy, "_NET_WM_STATE_MAXIMIZED_VERT", False);
    Atom horz = XInternAtom(dpy, "_NET_WM_STATE_MAXIMIZED_HORZ", False);
    fprintf(stderr, "[minifin] %s window\n", maximized ? "maximize" : "unmaximize");
    send_root_message(state,
                      maximized ? kNetWmStateAdd : kNetWmStateRemove,
                      (long)vert,
                      (long)horz,
                      kSourceApplication,
                      0);
}

void X11WindowSystem::maximize()
{
    set_maximized(true);
}

void X11WindowSystem::unmaximize()
{
    set_maximized(false);
}

bool X11WindowSystem::is_maximized()
{
    Display *dpy = display();
    Window win = window();
    if (!dpy || win == None) return false;
    Atom state = XInternAtom(dpy, "_NET_WM_STATE", False);
    Atom vert = XInternAtom(dpy, "_NET_WM_STATE_MAXIMIZED_VERT", False);
    Atom horz = XInternAtom(dpy, "_NET_WM_STATE_MAXIMIZED_HORZ", False);

    Atom actual_type = None;
    int actual_format = 0;
    unsigned long count = 0;
    unsigned long bytes_after = 0;
    unsigned char *data = NULL;
    int rc = XGetWindowProperty(dpy, win, state, 0, 1024, False, XA_ATOM,
                                &actual_type, &actual_format, &count, &bytes_after, &data);
    if (rc != Success || !data) {
        if (data) XFree(data);
        return false;
    }
    bool has_vert = false;
    bool has_horz = false;
    if (actual_type == XA_ATOM && actual_format == 32) {
        Atom *atoms = reinterpret_cast<Atom *>(data);
        for (unsigned long i = 0; i < count; ++i) {
            if (atoms[i] == vert) has_vert = true;
            if (atoms[i] == horz) has_horz = true;
        }
    }
    XFree(data);
    LOG_ENTER("vert=%d horz=%d", has_vert ? 1 : 0, has_horz ? 1 : 0);
    return has_vert && has_horz;
}

void X11WindowSystem::close()
{
    fprintf(stderr, "[minifin] close requested from window chrome\n");
    if (close_handler_) {
        close_handler_();
    }
}

void X11WindowSystem::handle_wm_close()
{
    if (!shell_) return;
    XtVaSetValues(shell_, XmNdeleteResponse, XmDO_NOTHING, NULL);
    Atom wm_delete = XmInternAtom(XtDisplay(shell_), (char *)"WM_DELETE_WINDOW", False);
    XmAddWMProtocolCallback(shell_, wm_delete, wm_delete_cb, (XtPointer)this);
    XmActivateWMProtocol(shell_, wm_delete);
}

void X11WindowSystem::wm_delete_cb(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    X11WindowSystem *self = static_cast<X11WindowSystem *>(client_data);
    fprintf(stderr, "[minifin] close requested by window manager\n");
    if (self && self->close_handler_) {
        self->close_handler_();
    }
}

void X11WindowSystem::set_frameless(bool frameless)
{
    if (!shell_) return;
    XtVaSetValues(shell_,
                  XmNmwmDecorations, frameless ? 0 : (int)MWM_DECOR_ALL,
                  NULL);
}

void X11WindowSystem::show()
{
    if (!shell_) return;
    if (!XtIsRealized(shell_)) {
        XtRealizeWidget(shell_);
    }
    Display *dpy = display();
    Window win = window();
    if (!dpy || win == None) return;
    XMapRaised(dpy, win);
    XFlush(dpy);
}

void X11WindowSystem::focus()
{
    Display *dpy = display();
    if (!dpy) return;
    Atom active = XInternAtom(dpy, "_NET_ACTIVE_WINDOW", False);
    send_root_message(active, kSourceApplication, CurrentTime, 0, 0, 0);
}

void X11WindowSystem::send_move_resize(long direction, int root_x, int root_y, unsigned int button)
{
    Display *dpy = display();
    if (!dpy) return;
    // The window manager takes over the pointer; our implicit grab from
    // the button press must be released first.
    XUngrabPointer(dpy, CurrentTime);
    Atom move_resize = XInternAtom(dpy, "_NET_WM_MOVERESIZE", False);
    send_root_message(move_resize, root_x, root_y, direction, (long)button, kSourceApplication);
}

void X11WindowSystem::begin_move(int root_x, int root_y, unsigned int button)
{
    send_move_resize(kMoveResizeMove, root_x, root_y, button);
}

void X11WindowSystem::begin_resize(ResizeEdge edge, int root_x, int root_y, unsigned int button)
{
    long direction = -1;
    switch (edge) {
        case ResizeEdge::TopLeft: direction = kMoveResizeTopLeft; break;
        case ResizeEdge::Top: direction = kMoveResizeTop; break;
        case ResizeEdge::TopRight: direction = kMoveResizeTopRight; break;
        case ResizeEdge::Right: direction = kMoveResizeRight; break;
        case ResizeEdge::BottomRight: direction = kMoveResizeBottomRight; break;
        case ResizeEdge::Bottom: direction = kMoveResizeBottom; break;
        case ResizeEdge::BottomLeft: direction = kMoveResizeBottomLeft; break;
        case ResizeEdge::Left: direction = kMoveResizeLeft; break;
        case ResizeEdge::None: break;
    }
    if (direction < 0) return;
    send_move_resize(direction, root_x, root_y, button);
}
