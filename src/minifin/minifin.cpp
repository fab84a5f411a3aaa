#include <Xm/Xm.h>
#include <Xm/Form.h>
#include <Xm/TextF.h>
#include <X11/Xlib.h>
#include <X11/cursorfont.h>

#include <stdio.h>
#include <stdlib.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <include/cef_app.h>
#include <include/cef_browser.h>
#include <include/cef_client.h>
#include <include/internal/cef_linux.h>

#include "browser_app.h"
#include "browser_client.h"
#include "external_launcher.h"
#include "intercept_bridge.h"
#include "minifin_cef_app.h"
#include "minifin_log.h"
#include "navigation_policy.h"
#include "settings_store.h"
#include "startup_router.h"
#include "ui_builder.h"
#include "url_validator.h"
#include "window_chrome.h"
#include "x11_window_system.h"

using UiBuilder::xm_name;

static const int kWindowWidth = 1280;
static const int kWindowHeight = 720;
static const int kMessagePumpIntervalMs = 10;
static const int kBrowserCreateRetryMs = 20;
static const int kSaveTransitionDelayMs = 500;
static const char kFullscreenButtonClass[] = "btnFullscreen";

// Everything the Xt callbacks need, handed to them as client_data.
struct ShellContext {
    XtAppContext app = NULL;
    Widget toplevel = NULL;
    Widget main_form = NULL;
    UiBuilder::ChromeStripHandles chrome_ui;
    UiBuilder::ConfigurePageHandles configure_ui;
    UiBuilder::DisplayPageHandles display_ui;

    SettingsStore *settings = nullptr;
    StartupRouter router;
    InterceptBridge *bridge = nullptr;
    NavigationPolicy *policy = nullptr;
    WindowChrome *chrome = nullptr;
    WindowSystem *window_system = nullptr;
    CefRefPtr<BrowserClient> client;

    bool browser_create_scheduled = false;
    bool message_pump_started = false;
    bool saving = false;
    std::string pending_saved_url;
    bool shutdown_requested = false;
    Time last_move_click = 0;
    WindowSystem::ResizeEdge cursor_edge = WindowSystem::ResizeEdge::None;
    Cursor edge_cursors[9] = {};
};

struct DelayedTask {
    std::function<void()> task;
};

static void run_delayed_task_cb(XtPointer client_data, XtIntervalId *id)
{
    (void)id;
    std::unique_ptr<DelayedTask> delayed(static_cast<DelayedTask *>(client_data));
    if (delayed && delayed->task) {
        delayed->task();
    }
}

static void schedule_on_app(XtAppContext app, int delay_ms, std::function<void()> task)
{
    DelayedTask *delayed = new DelayedTask();
    delayed->task = std::move(task);
    XtAppAddTimeOut(app, (unsigned long)delay_ms, run_delayed_task_cb, delayed);
}

static void cef_message_pump(XtPointer client_data, XtIntervalId *id)
{
    (void)id;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    CefDoMessageLoopWork();
    XtAppAddTimeOut(ctx->app, kMessagePumpIntervalMs, cef_message_pump, ctx);
}

static void begin_shutdown_sequence(ShellContext *ctx, const char *reason)
{
    if (ctx->shutdown_requested) return;
    ctx->shutdown_requested = true;
    bool has_browser = ctx->client && ctx->client->browser();
    fprintf(stderr,
            "[minifin] begin shutdown reason=%s pending=%d\n",
            reason ? reason : "(null)",
            has_browser ? 1 : 0);
    if (!has_browser) {
        XtAppSetExitFlag(ctx->app);
        return;
    }
    ctx->client->close_browser();
}

static void on_browser_closed(ShellContext *ctx)
{
    fprintf(stderr, "[minifin] browser closed\n");
    if (!ctx->shutdown_requested) return;
    fprintf(stderr, "[minifin] shutdown complete, exiting main loop\n");
    XtAppSetExitFlag(ctx->app);
}

static void resize_cef_browser_to_area(ShellContext *ctx, const char *reason)
{
    if (!ctx->client || !ctx->display_ui.browser_area) return;
    CefRefPtr<CefBrowser> browser = ctx->client->browser();
    if (!browser) return;
    CefRefPtr<CefBrowserHost> host = browser->GetHost();
    if (!host) return;

    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(ctx->display_ui.browser_area, XmNwidth, &width, XmNheight, &height, NULL);
    if (width <= 1 || height <= 1) return;

    CefWindowHandle child_handle = host->GetWindowHandle();
    Display *dpy = XtDisplay(ctx->display_ui.browser_area);
    if (child_handle && dpy) {
        XMoveResizeWindow(dpy, (Window)child_handle, 0, 0, (unsigned int)width, (unsigned int)height);
        XFlush(dpy);
    }
    host->NotifyMoveOrResizeStarted();
    host->WasResized();
    LOG_ENTER("%s area=%dx%d", reason ? reason : "unknown", (int)width, (int)height);
}

static bool create_cef_browser(ShellContext *ctx)
{
    Widget area = ctx->display_ui.browser_area;
    if (!area || !XtIsRealized(area)) return false;
    Window xid = XtWindow(area);
    if (!xid) return false;

    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(area, XmNwidth, &width, XmNheight, &height, NULL);
    if (width <= 1 || height <= 1) return false;

    CefWindowInfo window_info;
    window_info.SetAsChild(reinterpret_cast<CefWindowHandle>(xid),
                           CefRect(0, 0, (int)width, (int)height));
    CefBrowserSettings browser_settings;
    browser_settings.chrome_status_bubble = STATE_DISABLED;

    const std::string &url = ctx->router.display_url();
    fprintf(stderr, "[minifin] creating browser for %s\n", url.c_str());
    CefRefPtr<CefBrowser> browser = CefBrowserHost::CreateBrowserSync(window_info,
                                                                      ctx->client,
                                                                      CefString(url),
                                                                      browser_settings,
                                                                      nullptr,
                                                                      nullptr);
    if (!browser) return false;
    // OnAfterCreated records the browser; CreateBrowserSync returns after it.
    if (!ctx->message_pump_started) {
        ctx->message_pump_started = true;
        XtAppAddTimeOut(ctx->app, kMessagePumpIntervalMs, cef_message_pump, ctx);
    }
    resize_cef_browser_to_area(ctx, "initial create");
    return true;
}

static void initialize_cef_browser_cb(XtPointer client_data, XtIntervalId *id)
{
    (void)id;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    if (ctx->shutdown_requested) {
        ctx->browser_create_scheduled = false;
        return;
    }
    if (ctx->client->browser()) {
        ctx->browser_create_scheduled = false;
        return;
    }
    if (!create_cef_browser(ctx)) {
        XtAppAddTimeOut(ctx->app, kBrowserCreateRetryMs, initialize_cef_browser_cb, ctx);
        return;
    }
    ctx->browser_create_scheduled = false;
}

static void schedule_browser_creation(ShellContext *ctx)
{
    if (ctx->browser_create_scheduled || ctx->client->browser()) return;
    ctx->browser_create_scheduled = true;
    XtAppAddTimeOut(ctx->app, kBrowserCreateRetryMs, initialize_cef_browser_cb, ctx);
}

static void show_configure_page(ShellContext *ctx)
{
    const UiBuilder::ConfigurePageHandles &ui = ctx->configure_ui;
    std::optional<std::string> stored = ctx->settings->server_url();
    XmTextFieldSetString(ui.url_field, (char *)(stored ? stored->c_str() : ""));
    UiBuilder::setLabelText(ui.status_label, "");
    XtSetSensitive(ui.save_button, True);
    if (ctx->router.can_go_back()) {
        XtManageChild(ui.cancel_button);
    } else {
        XtUnmanageChild(ui.cancel_button);
    }
    XtUnmanageChild(ctx->display_ui.page);
    XtManageChild(ui.page);
    XmProcessTraversal(ui.url_field, XmTRAVERSE_CURRENT);
}

static void show_display_page(ShellContext *ctx)
{
    XtUnmanageChild(ctx->configure_ui.page);
    XtManageChild(ctx->display_ui.page);
    bool changed = ctx->router.refresh_display_target(ctx->settings->server_url());
    CefRefPtr<CefBrowser> browser = ctx->client->browser();
    if (!browser) {
        schedule_browser_creation(ctx);
        return;
    }
    if (changed) {
        fprintf(stderr, "[minifin] server URL changed, reloading display\n");
        ctx->client->load_url(ctx->router.display_url());
    }
    resize_cef_browser_to_area(ctx, "display shown");
}

static void show_screen(ShellContext *ctx, StartupRouter::Screen screen)
{
    fprintf(stderr, "[minifin] screen -> %s\n", screen_name(screen));
    switch (screen) {
        case StartupRouter::Screen::Configure:
            show_configure_page(ctx);
            break;
        case StartupRouter::Screen::Display:
            show_display_page(ctx);
            break;
        case StartupRouter::Screen::Root:
            break;
    }
}

// Chrome strip callbacks.

void on_settings_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    if (ctx->router.current() == StartupRouter::Screen::Configure) return;
    show_screen(ctx, ctx->router.open_configure());
}

void on_minimize_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    static_cast<ShellContext *>(client_data)->chrome->minimize();
}

void on_maximize_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    static_cast<ShellContext *>(client_data)->chrome->toggle_maximize();
}

void on_close_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    static_cast<ShellContext *>(client_data)->chrome->close();
}

void on_strip_resize(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)call_data;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(w, XmNwidth, &width, XmNheight, &height, NULL);
    int controls_width = UiBuilder::controlsPreferredWidth(ctx->chrome_ui);
    ChromeLayout layout = ctx->chrome->compute_layout((int)width, (int)height, controls_width);
    UiBuilder::applyChromeLayout(ctx->chrome_ui, layout);
}

void on_strip_crossing(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    (void)w;
    if (continue_to_dispatch) *continue_to_dispatch = True;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    if (!event) return;
    if (event->type == EnterNotify) {
        ctx->chrome->pointer_entered_strip();
    } else if (event->type == LeaveNotify) {
        if (event->xcrossing.detail == NotifyInferior) return;
        ctx->chrome->pointer_left_strip();
    }
    Widget controls = ctx->chrome_ui.controls;
    if (ctx->chrome->controls_visible() && !XtIsManaged(controls)) {
        XtManageChild(controls);
    } else if (!ctx->chrome->controls_visible() && XtIsManaged(controls)) {
        XtUnmanageChild(controls);
    }
}

void on_move_area_press(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    if (continue_to_dispatch) *continue_to_dispatch = True;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    if (!event || event->type != ButtonPress || event->xbutton.button != Button1) return;
    Time now = event->xbutton.time;
    Time multi_click = (Time)XtGetMultiClickTime(XtDisplay(w));
    if (ctx->last_move_click != 0 && now - ctx->last_move_click <= multi_click) {
        ctx->last_move_click = 0;
        ctx->chrome->toggle_maximize();
        return;
    }
    ctx->last_move_click = now;
    ctx->window_system->begin_move(event->xbutton.x_root, event->xbutton.y_root, event->xbutton.button);
}

static Cursor cursor_for_edge(ShellContext *ctx, WindowSystem::ResizeEdge edge)
{
    static const unsigned int shapes[9] = {
        XC_left_ptr,
        XC_top_side,
        XC_bottom_side,
        XC_left_side,
        XC_right_side,
        XC_top_left_corner,
        XC_top_right_corner,
        XC_bottom_left_corner,
        XC_bottom_right_corner,
    };
    int index = (int)edge;
    if (index < 0 || index >= 9) index = 0;
    if (!ctx->edge_cursors[index]) {
        ctx->edge_cursors[index] = XCreateFontCursor(XtDisplay(ctx->main_form), shapes[index]);
    }
    return ctx->edge_cursors[index];
}

static void on_border_input(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    if (continue_to_dispatch) *continue_to_dispatch = True;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    if (!event || !XtIsRealized(w)) return;
    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(w, XmNwidth, &width, XmNheight, &height, NULL);
    if (event->type == MotionNotify) {
        WindowSystem::ResizeEdge edge =
            ctx->chrome->hit_test_resize(event->xmotion.x, event->xmotion.y, (int)width, (int)height);
        if (edge == ctx->cursor_edge) return;
        ctx->cursor_edge = edge;
        XDefineCursor(XtDisplay(w), XtWindow(w), cursor_for_edge(ctx, edge));
        return;
    }
    if (event->type == ButtonPress && event->xbutton.button == Button1) {
        WindowSystem::ResizeEdge edge =
            ctx->chrome->hit_test_resize(event->xbutton.x, event->xbutton.y, (int)width, (int)height);
        if (edge == WindowSystem::ResizeEdge::None) return;
        LOG_ENTER("resize from %s", resize_edge_name(edge));
        ctx->window_system->begin_resize(edge, event->xbutton.x_root, event->xbutton.y_root, event->xbutton.button);
    }
}

// Configure page callbacks.

static void finish_save_cb(XtPointer client_data, XtIntervalId *id)
{
    (void)id;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    ctx->saving = false;
    XtSetSensitive(ctx->configure_ui.save_button, True);
    if (ctx->shutdown_requested) return;
    show_screen(ctx, ctx->router.configuration_saved(ctx->pending_saved_url));
}

void on_save_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    const UiBuilder::ConfigurePageHandles &ui = ctx->configure_ui;
    if (ctx->saving) return;

    char *text = XmTextFieldGetString(ui.url_field);
    UrlValidation validation = validate_server_url(text ? text : "");
    if (text) XtFree(text);
    if (!validation.valid) {
        UiBuilder::setLabelText(ui.status_label, url_problem_message(validation.problem));
        return;
    }

    ctx->saving = true;
    XtSetSensitive(ui.save_button, False);
    std::string error;
    if (!ctx->settings->set_server_url(validation.url, &error)) {
        fprintf(stderr, "[minifin] saving server URL failed: %s\n", error.c_str());
        std::string message = "Error saving URL: " + error;
        UiBuilder::setLabelText(ui.status_label, message.c_str());
        XtSetSensitive(ui.save_button, True);
        ctx->saving = false;
        return;
    }
    fprintf(stderr, "[minifin] server URL saved: %s\n", validation.url.c_str());
    XmTextFieldSetString(ui.url_field, (char *)validation.url.c_str());
    UiBuilder::setLabelText(ui.status_label, "Server URL saved successfully!");
    ctx->pending_saved_url = validation.url;
    XtAppAddTimeOut(ctx->app, kSaveTransitionDelayMs, finish_save_cb, ctx);
}

void on_cancel_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    ShellContext *ctx = static_cast<ShellContext *>(client_data);
    if (ctx->saving || !ctx->router.can_go_back()) return;
    show_screen(ctx, ctx->router.leave_configure());
}

void on_browser_area_resize(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    resize_cef_browser_to_area(static_cast<ShellContext *>(client_data), "area resize");
}

static void build_main_window(ShellContext *ctx)
{
    Widget main_form = XmCreateForm(ctx->toplevel, xm_name("minifinMainForm"), NULL, 0);
    XtVaSetValues(main_form,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  NULL);
    XtManageChild(main_form);
    ctx->main_form = main_form;
    // The form itself is only exposed along the resize border.
    XtAddEventHandler(main_form, ButtonPressMask | PointerMotionMask, False, on_border_input, ctx);

    Widget strip = UiBuilder::createChromeStrip(main_form, ctx, &ctx->chrome_ui);
    UiBuilder::createConfigurePage(main_form, strip, ctx, &ctx->configure_ui);
    UiBuilder::createDisplayPage(main_form, strip, ctx, &ctx->display_ui);
}

int main(int argc, char *argv[])
{
    CefRefPtr<MinifinCefApp> cef_app = new MinifinCefApp();
    BrowserApp browser_app(cef_app);
    BrowserPreflightState preflight;
    int exit_code = browser_app.run_cef_preflight(argc, argv, &preflight);
    if (exit_code >= 0) {
        return exit_code;
    }

    SettingsStore settings;
    std::string error;
    if (!settings.init(&error)) {
        fprintf(stderr, "[minifin] fatal: cannot open settings: %s\n", error.c_str());
        return 1;
    }
    int settle_delay_ms = effective_settle_delay_ms(preflight.options, settings.settle_delay_ms());
    fprintf(stderr,
            "[minifin] settings %s, settle delay %d ms\n",
            settings.file_path().c_str(),
            settle_delay_ms);

    ShellContext ctx;
    ctx.settings = &settings;

    XtAppContext app;
    Widget toplevel = XtVaAppInitialize(&app, "Minifin", NULL, 0, &argc, argv, NULL, NULL);
    if (!toplevel) {
        fprintf(stderr, "[minifin] fatal: cannot open display\n");
        return 1;
    }
    ctx.app = app;
    ctx.toplevel = toplevel;
    XtVaSetValues(toplevel,
                  XmNtitle, "Minifin",
                  XmNiconName, "Minifin",
                  XmNwidth, kWindowWidth,
                  XmNheight, kWindowHeight,
                  XmNdeleteResponse, XmDO_NOTHING,
                  NULL);

    X11WindowSystem window_system(toplevel, [&ctx]() { begin_shutdown_sequence(&ctx, "close"); });
    WindowChrome chrome(&window_system);
    ctx.window_system = &window_system;
    ctx.chrome = &chrome;
    window_system.set_frameless(true);

    XdgLauncher launcher;
    NavigationPolicy policy(&launcher);
    ctx.policy = &policy;

    InterceptBridge bridge(
        [app](int delay_ms, std::function<void()> task) { schedule_on_app(app, delay_ms, std::move(task)); },
        settle_delay_ms);
    InterceptRequest fullscreen_request;
    fullscreen_request.required_classes.push_back(kFullscreenButtonClass);
    fullscreen_request.event_id = WindowChrome::kFullscreenEventId;
    if (!bridge.add_intercept(fullscreen_request, &error)) {
        fprintf(stderr, "[minifin] fatal: bad intercept request: %s\n", error.c_str());
        return 1;
    }
    bridge.set_event_handler([&chrome](const std::string &event_id) {
        if (!chrome.handle_intercept_event(event_id)) {
            LOG_ENTER("page event '%s' ignored", event_id.c_str());
        }
    });
    ctx.bridge = &bridge;

    ctx.client = new BrowserClient(&bridge, &policy);
    ctx.client->set_progress_handler([&ctx](double progress) {
        UiBuilder::setProgress(ctx.display_ui, progress);
    });
    ctx.client->set_closed_handler([&ctx]() { on_browser_closed(&ctx); });
    bridge.set_channel(ctx.client.get());

    build_main_window(&ctx);

    window_system.handle_wm_close();

    if (!browser_app.initialize_cef(preflight, &error)) {
        fprintf(stderr, "[minifin] fatal: browser engine unavailable: %s\n", error.c_str());
        return 1;
    }

    std::string launch_url;
    if (preflight.options.has_url) {
        UrlValidation validation = validate_server_url(preflight.options.url);
        if (validation.valid) {
            launch_url = validation.url;
        } else {
            fprintf(stderr, "[minifin] ignoring --minifin-url='%s' (%s)\n",
                    preflight.options.url.c_str(), validation.reason.c_str());
        }
    }
    StartupRouter::Screen screen = ctx.router.enter_root(settings.server_url(), launch_url);
    chrome.present();
    show_screen(&ctx, screen);

    XtAppMainLoop(app);
    LOG_ENTER("main loop finished, shutdown requested=%d", ctx.shutdown_requested ? 1 : 0);

    bridge.set_channel(nullptr);
    ctx.client->detach();
    ctx.client = nullptr;
    Display *dpy = XtDisplay(toplevel);
    for (Cursor cursor : ctx.edge_cursors) {
        if (cursor) XFreeCursor(dpy, cursor);
    }
    browser_app.shutdown_cef();
    return 0;
}
