#ifndef MINIFIN_UI_BUILDER_H
#define MINIFIN_UI_BUILDER_H

#include <Xm/Xm.h>

#include "window_chrome.h"

namespace UiBuilder {

// Top strip: two drag areas around the window controls. The controls
// row is created unmanaged and shown on hover.
struct ChromeStripHandles {
    Widget strip = NULL;
    Widget move_left = NULL;
    Widget move_right = NULL;
    Widget controls = NULL;
    Widget settings_button = NULL;
    Widget minimize_button = NULL;
    Widget maximize_button = NULL;
    Widget close_button = NULL;
};

struct ConfigurePageHandles {
    Widget page = NULL;
    Widget url_field = NULL;
    Widget status_label = NULL;
    Widget save_button = NULL;
    Widget cancel_button = NULL;
};

struct DisplayPageHandles {
    Widget page = NULL;
    Widget progress_strip = NULL;
    Widget progress_bar = NULL;
    Widget browser_area = NULL;
};

XmString make_string(const char *text);
char *xm_name(const char *name);

// All callbacks receive client_data.
Widget createChromeStrip(Widget parent, XtPointer client_data, ChromeStripHandles *handles_out);
Widget createConfigurePage(Widget parent, Widget attach_top, XtPointer client_data, ConfigurePageHandles *handles_out);
Widget createDisplayPage(Widget parent, Widget attach_top, XtPointer client_data, DisplayPageHandles *handles_out);

// Places the strip children according to layout.
void applyChromeLayout(const ChromeStripHandles &handles, const ChromeLayout &layout);
// Preferred width of the controls row.
int controlsPreferredWidth(const ChromeStripHandles &handles);

void setLabelText(Widget label, const char *text);
// progress in [0, 1]; the strip is hidden at 1.
void setProgress(const DisplayPageHandles &handles, double progress);

} // namespace UiBuilder

#endif // MINIFIN_UI_BUILDER_H
