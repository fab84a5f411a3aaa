#include "ui_builder.h"

#include <Xm/DrawingA.h>
#include <Xm/Form.h>
#include <Xm/Label.h>
#include <Xm/PushB.h>
#include <Xm/RowColumn.h>
#include <Xm/TextF.h>

extern void on_settings_activate(Widget, XtPointer, XtPointer);
extern void on_minimize_activate(Widget, XtPointer, XtPointer);
extern void on_maximize_activate(Widget, XtPointer, XtPointer);
extern void on_close_activate(Widget, XtPointer, XtPointer);
extern void on_strip_resize(Widget, XtPointer, XtPointer);
extern void on_strip_crossing(Widget, XtPointer, XEvent *, Boolean *);
extern void on_move_area_press(Widget, XtPointer, XEvent *, Boolean *);
extern void on_save_activate(Widget, XtPointer, XtPointer);
extern void on_cancel_activate(Widget, XtPointer, XtPointer);
extern void on_browser_area_resize(Widget, XtPointer, XtPointer);

static const int kProgressHeight = 3;
static const int kProgressScale = 1000;

namespace {
static XmString make_string_internal(const char *text)
{
    return XmStringCreateLocalized((String)(text ? text : ""));
}

static Widget create_strip_button(Widget parent, const char *name, const char *label,
                                  XtCallbackProc callback, XtPointer client_data)
{
    XmString xm_label = make_string_internal(label);
    Widget button = XtVaCreateManagedWidget(name,
                                            xmPushButtonWidgetClass,
                                            parent,
                                            XmNlabelString, xm_label,
                                            XmNmarginWidth, 6,
                                            XmNmarginHeight, 0,
                                            XmNshadowThickness, 1,
                                            XmNhighlightThickness, 0,
                                            XmNtraversalOn, False,
                                            NULL);
    XmStringFree(xm_label);
    XtAddCallback(button, XmNactivateCallback, callback, client_data);
    return button;
}

static Widget create_move_area(Widget parent, const char *name, XtPointer client_data)
{
    Widget area = XtVaCreateManagedWidget(name,
                                          xmDrawingAreaWidgetClass,
                                          parent,
                                          XmNmarginWidth, 0,
                                          XmNmarginHeight, 0,
                                          XmNresizePolicy, XmRESIZE_NONE,
                                          XmNtraversalOn, False,
                                          NULL);
    XtAddEventHandler(area, ButtonPressMask, False, on_move_area_press, client_data);
    return area;
}
} // namespace

namespace UiBuilder {

XmString make_string(const char *text)
{
    return make_string_internal(text);
}

char *xm_name(const char *name)
{
    return const_cast<char *>(name);
}

Widget createChromeStrip(Widget parent, XtPointer client_data, ChromeStripHandles *handles_out)
{
    Widget strip = XtVaCreateManagedWidget("chromeStrip",
                                           xmDrawingAreaWidgetClass,
                                           parent,
                                           XmNheight, WindowChrome::kStripHeight,
                                           XmNmarginWidth, 0,
                                           XmNmarginHeight, 0,
                                           XmNresizePolicy, XmRESIZE_NONE,
                                           XmNtopAttachment, XmATTACH_FORM,
                                           XmNleftAttachment, XmATTACH_FORM,
                                           XmNrightAttachment, XmATTACH_FORM,
                                           XmNtopOffset, WindowChrome::kResizeBorder,
                                           XmNleftOffset, WindowChrome::kResizeBorder,
                                           XmNrightOffset, WindowChrome::kResizeBorder,
                                           NULL);
    XtAddCallback(strip, XmNresizeCallback, on_strip_resize, client_data);
    // Crossings into the strip's children arrive here as virtual
    // enter/leave events; the controls row is managed while inside.
    XtAddEventHandler(strip, EnterWindowMask | LeaveWindowMask, False, on_strip_crossing, client_data);

    Widget move_left = create_move_area(strip, "moveLeft", client_data);

    Widget controls = XmCreateRowColumn(strip, xm_name("chromeControls"), NULL, 0);
    XtVaSetValues(controls,
                  XmNorientation, XmHORIZONTAL,
                  XmNpacking, XmPACK_TIGHT,
                  XmNspacing, 2,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  NULL);
    Widget settings = create_strip_button(controls, "chromeSettings", "Settings", on_settings_activate, client_data);
    Widget minimize = create_strip_button(controls, "chromeMinimize", "_", on_minimize_activate, client_data);
    Widget maximize = create_strip_button(controls, "chromeMaximize", "[ ]", on_maximize_activate, client_data);
    Widget close = create_strip_button(controls, "chromeClose", "X", on_close_activate, client_data);

    Widget move_right = create_move_area(strip, "moveRight", client_data);

    if (handles_out) {
        handles_out->strip = strip;
        handles_out->move_left = move_left;
        handles_out->move_right = move_right;
        handles_out->controls = controls;
        handles_out->settings_button = settings;
        handles_out->minimize_button = minimize;
        handles_out->maximize_button = maximize;
        handles_out->close_button = close;
    }
    return strip;
}

Widget createConfigurePage(Widget parent, Widget attach_top, XtPointer client_data, ConfigurePageHandles *handles_out)
{
    Widget page = XmCreateForm(parent, xm_name("configurePage"), NULL, 0);
    XtVaSetValues(page,
                  XmNtopAttachment, XmATTACH_WIDGET,
                  XmNtopWidget, attach_top,
                  XmNbottomAttachment, XmATTACH_FORM,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  XmNleftOffset, WindowChrome::kResizeBorder,
                  XmNrightOffset, WindowChrome::kResizeBorder,
                  XmNbottomOffset, WindowChrome::kResizeBorder,
                  XmNfractionBase, 100,
                  NULL);

    XmString title = make_string("Jellyfin Server URL");
    Widget title_label = XtVaCreateManagedWidget("configureTitle",
                                                 xmLabelWidgetClass,
                                                 page,
                                                 XmNlabelString, title,
                                                 XmNalignment, XmALIGNMENT_BEGINNING,
                                                 XmNtopAttachment, XmATTACH_POSITION,
                                                 XmNtopPosition, 30,
                                                 XmNleftAttachment, XmATTACH_POSITION,
                                                 XmNleftPosition, 20,
                                                 XmNrightAttachment, XmATTACH_POSITION,
                                                 XmNrightPosition, 80,
                                                 NULL);
    XmStringFree(title);

    Widget url_field = XtVaCreateManagedWidget("serverUrlField",
                                               xmTextFieldWidgetClass,
                                               page,
                                               XmNtopAttachment, XmATTACH_WIDGET,
                                               XmNtopWidget, title_label,
                                               XmNtopOffset, 8,
                                               XmNleftAttachment, XmATTACH_POSITION,
                                               XmNleftPosition, 20,
                                               XmNrightAttachment, XmATTACH_POSITION,
                                               XmNrightPosition, 80,
                                               NULL);
    // Enter in the field saves.
    XtAddCallback(url_field, XmNactivateCallback, on_save_activate, client_data);

    XmString empty = make_string("");
    Widget status_label = XtVaCreateManagedWidget("configureStatus",
                                                  xmLabelWidgetClass,
                                                  page,
                                                  XmNlabelString, empty,
                                                  XmNalignment, XmALIGNMENT_BEGINNING,
                                                  XmNtopAttachment, XmATTACH_WIDGET,
                                                  XmNtopWidget, url_field,
                                                  XmNtopOffset, 6,
                                                  XmNleftAttachment, XmATTACH_POSITION,
                                                  XmNleftPosition, 20,
                                                  XmNrightAttachment, XmATTACH_POSITION,
                                                  XmNrightPosition, 80,
                                                  NULL);
    XmStringFree(empty);

    Widget buttons = XmCreateRowColumn(page, xm_name("configureButtons"), NULL, 0);
    XtVaSetValues(buttons,
                  XmNorientation, XmHORIZONTAL,
                  XmNpacking, XmPACK_TIGHT,
                  XmNspacing, 8,
                  XmNtopAttachment, XmATTACH_WIDGET,
                  XmNtopWidget, status_label,
                  XmNtopOffset, 12,
                  XmNrightAttachment, XmATTACH_POSITION,
                  XmNrightPosition, 80,
                  NULL);
    XtManageChild(buttons);

    XmString save_label = make_string("Save");
    Widget save_button = XtVaCreateManagedWidget("configureSave",
                                                 xmPushButtonWidgetClass,
                                                 buttons,
                                                 XmNlabelString, save_label,
                                                 NULL);
    XmStringFree(save_label);
    XtAddCallback(save_button, XmNactivateCallback, on_save_activate, client_data);

    XmString cancel_label = make_string("Cancel");
    Widget cancel_button = XtVaCreateWidget("configureCancel",
                                            xmPushButtonWidgetClass,
                                            buttons,
                                            XmNlabelString, cancel_label,
                                            NULL);
    XmStringFree(cancel_label);
    XtAddCallback(cancel_button, XmNactivateCallback, on_cancel_activate, client_data);

    if (handles_out) {
        handles_out->page = page;
        handles_out->url_field = url_field;
        handles_out->status_label = status_label;
        handles_out->save_button = save_button;
        handles_out->cancel_button = cancel_button;
    }
    return page;
}

Widget createDisplayPage(Widget parent, Widget attach_top, XtPointer client_data, DisplayPageHandles *handles_out)
{
    Widget page = XmCreateForm(parent, xm_name("displayPage"), NULL, 0);
    XtVaSetValues(page,
                  XmNtopAttachment, XmATTACH_WIDGET,
                  XmNtopWidget, attach_top,
                  XmNbottomAttachment, XmATTACH_FORM,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  XmNleftOffset, WindowChrome::kResizeBorder,
                  XmNrightOffset, WindowChrome::kResizeBorder,
                  XmNbottomOffset, WindowChrome::kResizeBorder,
                  NULL);

    Widget browser_area = XtVaCreateManagedWidget("browserArea",
                                                  xmDrawingAreaWidgetClass,
                                                  page,
                                                  XmNmarginWidth, 0,
                                                  XmNmarginHeight, 0,
                                                  XmNtopAttachment, XmATTACH_FORM,
                                                  XmNbottomAttachment, XmATTACH_FORM,
                                                  XmNleftAttachment, XmATTACH_FORM,
                                                  XmNrightAttachment, XmATTACH_FORM,
                                                  XmNtraversalOn, True,
                                                  NULL);
    XtAddCallback(browser_area, XmNresizeCallback, on_browser_area_resize, client_data);

    // Created after the browser area so it stacks above the CEF child.
    Widget progress_strip = XmCreateForm(page, xm_name("loadProgress"), NULL, 0);
    XtVaSetValues(progress_strip,
                  XmNheight, kProgressHeight,
                  XmNfractionBase, kProgressScale,
                  XmNtopAttachment, XmATTACH_FORM,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  NULL);
    Widget progress_bar = XtVaCreateManagedWidget("loadProgressBar",
                                                  xmDrawingAreaWidgetClass,
                                                  progress_strip,
                                                  XtVaTypedArg, XmNbackground, XmRString, "SteelBlue", 10,
                                                  XmNtopAttachment, XmATTACH_FORM,
                                                  XmNbottomAttachment, XmATTACH_FORM,
                                                  XmNleftAttachment, XmATTACH_FORM,
                                                  XmNrightAttachment, XmATTACH_POSITION,
                                                  XmNrightPosition, 1,
                                                  NULL);

    if (handles_out) {
        handles_out->page = page;
        handles_out->progress_strip = progress_strip;
        handles_out->progress_bar = progress_bar;
        handles_out->browser_area = browser_area;
    }
    return page;
}

void applyChromeLayout(const ChromeStripHandles &handles, const ChromeLayout &layout)
{
    auto place = [](Widget w, const ChromeRect &rect) {
        if (!w || rect.width <= 0 || rect.height <= 0) return;
        XtConfigureWidget(w,
                          (Position)rect.x,
                          (Position)rect.y,
                          (Dimension)rect.width,
                          (Dimension)rect.height,
                          0);
    };
    place(handles.move_left, layout.move_left);
    place(handles.controls, layout.controls);
    place(handles.move_right, layout.move_right);
}

int controlsPreferredWidth(const ChromeStripHandles &handles)
{
    if (!handles.controls) return 0;
    XtWidgetGeometry preferred;
    XtQueryGeometry(handles.controls, NULL, &preferred);
    if (!(preferred.request_mode & CWWidth)) return 0;
    return (int)preferred.width;
}

void setLabelText(Widget label, const char *text)
{
    if (!label) return;
    XmString xm_text = make_string(text);
    XtVaSetValues(label, XmNlabelString, xm_text, NULL);
    XmStringFree(xm_text);
}

void setProgress(const DisplayPageHandles &handles, double progress)
{
    if (!handles.progress_strip || !handles.progress_bar) return;
    if (progress >= 1.0) {
        XtUnmanageChild(handles.progress_strip);
        return;
    }
    int position = (int)(progress * kProgressScale);
    if (position < 1) position = 1;
    if (position > kProgressScale) position = kProgressScale;
    XtVaSetValues(handles.progress_bar, XmNrightPosition, position, NULL);
    if (!XtIsManaged(handles.progress_strip)) {
        XtManageChild(handles.progress_strip);
    }
}

} // namespace UiBuilder
