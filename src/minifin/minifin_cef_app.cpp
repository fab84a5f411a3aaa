#include "minifin_cef_app.h"

#include <stdio.h>

#include <include/cef_command_line.h>
#include <include/cef_frame.h>
#include <include/cef_v8.h>

#include "intercept_script.h"
#include "minifin_log.h"

void MinifinCefApp::OnBeforeCommandLineProcessing(const CefString &process_type,
                                                  CefRefPtr<CefCommandLine> command_line)
{
    if (!command_line) return;
    // Browser process only; sub-processes inherit the switch.
    if (!process_type.empty()) return;
    command_line->AppendSwitchWithValue("autoplay-policy", "no-user-gesture-required");
}

void MinifinCefApp::OnContextCreated(CefRefPtr<CefBrowser> browser,
                                     CefRefPtr<CefFrame> frame,
                                     CefRefPtr<CefV8Context> context)
{
    (void)browser;
    if (!frame || !frame->IsMain()) return;
    register_host_object(context);
}

bool MinifinCefApp::OnProcessMessageReceived(CefRefPtr<CefBrowser> browser,
                                             CefRefPtr<CefFrame> frame,
                                             CefProcessId source_process,
                                             CefRefPtr<CefProcessMessage> message)
{
    (void)browser;
    (void)source_process;
    if (!frame || !message) return false;
    if (message->GetName().ToString() != kInstallInterceptMessage) return false;

    InterceptRequest request;
    int generation = 0;
    if (!parse_install_message(message, &request, &generation)) {
        fprintf(stderr, "[minifin-renderer] dropping malformed install request\n");
        return true;
    }
    bool installed = frame->IsMain() && run_intercept_script(frame, request, generation);
    if (!installed) {
        LOG_ENTER("intercept '%s' not installed for generation %d",
                  request.event_id.c_str(), generation);
    }
    frame->SendProcessMessage(PID_BROWSER, build_install_result_message(request, generation, installed));
    return true;
}
