#ifndef MINIFIN_INTERCEPT_SCRIPT_H
#define MINIFIN_INTERCEPT_SCRIPT_H

#include <string>

#include <include/cef_frame.h>
#include <include/cef_process_message.h>
#include <include/cef_v8.h>
#include <include/cef_values.h>

#include "intercept_bridge.h"

// Browser -> renderer: [0] int generation, [1] string event id,
// [2] list of required class names.
extern const char kInstallInterceptMessage[];
// Renderer -> browser: [0] string event id, [1] int generation.
extern const char kButtonClickedMessage[];
// Renderer -> browser: the install arguments followed by [3] bool
// telling whether the script ran.
extern const char kInstallResultMessage[];
// Name of the object exposed on window for page scripts to call back.
extern const char kHostObjectName[];

// Fixed script evaluated once per install. It evaluates to a function
// taking (requiredClasses, eventId, generation) so nothing from the
// request is ever spliced into script text.
const char *intercept_script_source();

CefRefPtr<CefProcessMessage> build_install_message(const InterceptRequest &request, int generation);
bool parse_install_message(CefRefPtr<CefProcessMessage> message,
                           InterceptRequest *out_request,
                           int *out_generation);
CefRefPtr<CefProcessMessage> build_install_result_message(const InterceptRequest &request,
                                                          int generation,
                                                          bool installed);
bool parse_install_result_message(CefRefPtr<CefProcessMessage> message,
                                  InterceptRequest *out_request,
                                  int *out_generation,
                                  bool *out_installed);
bool parse_button_clicked_message(CefRefPtr<CefProcessMessage> message,
                                  std::string *out_event_id,
                                  int *out_generation);

// Renderer side. Exposes window.minifinHost.buttonClicked in context.
void register_host_object(CefRefPtr<CefV8Context> context);
// Renderer side. Runs the interception script in frame's context.
bool run_intercept_script(CefRefPtr<CefFrame> frame, const InterceptRequest &request, int generation);

#endif // MINIFIN_INTERCEPT_SCRIPT_H
