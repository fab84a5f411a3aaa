#include "browser_client.h"

#include <stdio.h>

#include <include/cef_browser.h>
#include <include/cef_frame.h>
#include <include/cef_process_message.h>
#include <include/cef_request.h>
#include <include/wrapper/cef_helpers.h>

#include "intercept_script.h"
#include "minifin_log.h"

// Dispositions that navigate the frame itself instead of asking for a
// new surface.
static bool targets_current_surface(cef_window_open_disposition_t disposition)
{
    return disposition == CEF_WOD_CURRENT_TAB ||
           disposition == CEF_WOD_SWITCH_TO_TAB ||
           disposition == CEF_WOD_SINGLETON_TAB;
}

BrowserClient::BrowserClient(InterceptBridge *bridge, NavigationPolicy *policy)
    : bridge_(bridge), policy_(policy)
{
}

void BrowserClient::OnAfterCreated(CefRefPtr<CefBrowser> browser)
{
    CEF_REQUIRE_UI_THREAD();
    if (!browser_) {
        browser_ = browser;
    }
}

bool BrowserClient::DoClose(CefRefPtr<CefBrowser> browser)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    return false;
}

void BrowserClient::OnBeforeClose(CefRefPtr<CefBrowser> browser)
{
    CEF_REQUIRE_UI_THREAD();
    if (browser_ && browser && browser_->IsSame(browser)) {
        browser_ = nullptr;
    }
    if (closed_handler_) {
        closed_handler_();
    }
}

bool BrowserClient::OnBeforePopup(CefRefPtr<CefBrowser> browser,
                                  CefRefPtr<CefFrame> frame,
                                  int popup_id,
                                  const CefString &target_url,
                                  const CefString &target_frame_name,
                                  cef_window_open_disposition_t target_disposition,
                                  bool user_gesture,
                                  const CefPopupFeatures &popupFeatures,
                                  CefWindowInfo &windowInfo,
                                  CefRefPtr<CefClient> &client,
                                  CefBrowserSettings &settings,
                                  CefRefPtr<CefDictionaryValue> &extra_info,
                                  bool *no_javascript_access)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)frame;
    (void)target_frame_name;
    (void)popupFeatures;
    (void)windowInfo;
    (void)client;
    (void)settings;
    (void)extra_info;
    (void)no_javascript_access;

    std::string url = target_url.ToString();
    fprintf(stderr,
            "[minifin] OnBeforePopup popup_id=%d disposition=%d user_gesture=%d url=%s\n",
            popup_id,
            (int)target_disposition,
            user_gesture ? 1 : 0,
            url.c_str());
    // There is only one surface; the popup is always cancelled.
    route_into_surface(url, "popup");
    return true;
}

void BrowserClient::OnLoadingProgressChange(CefRefPtr<CefBrowser> browser, double progress)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (progress_handler_) {
        progress_handler_(progress);
    }
}

void BrowserClient::OnLoadStart(CefRefPtr<CefBrowser> browser,
                                CefRefPtr<CefFrame> frame,
                                TransitionType transition_type)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)transition_type;
    if (!frame || !frame->IsMain() || !bridge_) return;
    int generation = bridge_->page_load_started();
    fprintf(stderr,
            "[minifin] load start generation=%d url=%s\n",
            generation,
            frame->GetURL().ToString().c_str());
}

void BrowserClient::OnLoadEnd(CefRefPtr<CefBrowser> browser,
                              CefRefPtr<CefFrame> frame,
                              int httpStatusCode)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!frame || !frame->IsMain() || !bridge_) return;
    fprintf(stderr,
            "[minifin] load end generation=%d status=%d, installing intercepts in %d ms\n",
            bridge_->generation(),
            httpStatusCode,
            bridge_->settle_delay_ms());
    bridge_->page_load_finished();
}

void BrowserClient::OnLoadError(CefRefPtr<CefBrowser> browser,
                                CefRefPtr<CefFrame> frame,
                                ErrorCode errorCode,
                                const CefString &errorText,
                                const CefString &failedUrl)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!frame || !frame->IsMain()) return;
    // Cancelled navigations (ours included) report ERR_ABORTED.
    if (errorCode == ERR_ABORTED) return;
    fprintf(stderr,
            "[minifin] load error %d (%s) url=%s\n",
            (int)errorCode,
            errorText.ToString().c_str(),
            failedUrl.ToString().c_str());
}

bool BrowserClient::OnBeforeBrowse(CefRefPtr<CefBrowser> browser,
                                   CefRefPtr<CefFrame> frame,
                                   CefRefPtr<CefRequest> request,
                                   bool user_gesture,
                                   bool is_redirect)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)user_gesture;
    (void)is_redirect;
    if (!request || !policy_) return false;
    std::string url = request->GetURL().ToString();
    if (url.empty()) return false;
    NavigationDecision decision = policy_->decide(url);
    LOG_ENTER("%s frame=%s url=%s",
              navigation_decision_name(decision),
              frame && frame->IsMain() ? "main" : "sub",
              url.c_str());
    return decision == NavigationDecision::DelegateExternal;
}

bool BrowserClient::OnOpenURLFromTab(CefRefPtr<CefBrowser> browser,
                                     CefRefPtr<CefFrame> frame,
                                     const CefString &target_url,
                                     cef_window_open_disposition_t target_disposition,
                                     bool user_gesture)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)frame;
    std::string url = target_url.ToString();
    fprintf(stderr,
            "[minifin] OnOpenURLFromTab disposition=%d user_gesture=%d url=%s\n",
            (int)target_disposition,
            user_gesture ? 1 : 0,
            url.c_str());
    if (url.empty()) return false;
    // Current-tab loads still pass OnBeforeBrowse.
    if (targets_current_surface(target_disposition)) return false;
    route_into_surface(url, "open-url-from-tab");
    return true;
}

bool BrowserClient::OnRequestMediaAccessPermission(CefRefPtr<CefBrowser> browser,
                                                   CefRefPtr<CefFrame> frame,
                                                   const CefString &requesting_origin,
                                                   uint32_t requested_permissions,
                                                   CefRefPtr<CefMediaAccessCallback> callback)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)frame;
    if (!callback) return false;
    fprintf(stderr,
            "[minifin] granting media access 0x%x to %s\n",
            (unsigned)requested_permissions,
            requesting_origin.ToString().c_str());
    callback->Continue(requested_permissions);
    return true;
}

bool BrowserClient::OnShowPermissionPrompt(CefRefPtr<CefBrowser> browser,
                                           uint64_t prompt_id,
                                           const CefString &requesting_origin,
                                           uint32_t requested_permissions,
                                           CefRefPtr<CefPermissionPromptCallback> callback)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!callback) return false;
    fprintf(stderr,
            "[minifin] granting permission prompt %llu (0x%x) for %s\n",
            (unsigned long long)prompt_id,
            (unsigned)requested_permissions,
            requesting_origin.ToString().c_str());
    callback->Continue(CEF_PERMISSION_RESULT_ACCEPT);
    return true;
}

bool BrowserClient::OnProcessMessageReceived(CefRefPtr<CefBrowser> browser,
                                             CefRefPtr<CefFrame> frame,
                                             CefProcessId source_process,
                                             CefRefPtr<CefProcessMessage> message)
{
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)frame;
    (void)source_process;
    if (!message) return false;
    const std::string name = message->GetName().ToString();
    if (name == kInstallResultMessage) {
        InterceptRequest request;
        int generation = -1;
        bool installed = false;
        if (!parse_install_result_message(message, &request, &generation, &installed)) {
            fprintf(stderr, "[minifin] dropping malformed install result\n");
            return true;
        }
        if (bridge_) bridge_->handle_install_result(request, generation, installed);
        return true;
    }
    if (name != kButtonClickedMessage) return false;
    std::string event_id;
    int generation = -1;
    if (!parse_button_clicked_message(message, &event_id, &generation)) {
        fprintf(stderr, "[minifin] dropping malformed button event\n");
        return true;
    }
    if (!bridge_) return true;
    if (!bridge_->handle_button_event(event_id, generation)) {
        LOG_ENTER("button event '%s' generation=%d not dispatched", event_id.c_str(), generation);
    }
    return true;
}

bool BrowserClient::send_install(const InterceptRequest &request, int generation)
{
    if (!browser_) return false;
    CefRefPtr<CefFrame> frame = browser_->GetMainFrame();
    if (!frame || !frame->IsValid()) return false;
    frame->SendProcessMessage(PID_RENDERER, build_install_message(request, generation));
    return true;
}

void BrowserClient::load_url(const std::string &url)
{
    if (!browser_ || url.empty()) return;
    CefRefPtr<CefFrame> frame = browser_->GetMainFrame();
    if (!frame) return;
    fprintf(stderr, "[minifin] loading %s\n", url.c_str());
    frame->LoadURL(url);
}

void BrowserClient::close_browser()
{
    if (!browser_) return;
    CefRefPtr<CefBrowserHost> host = browser_->GetHost();
    if (host) {
        host->CloseBrowser(true);
    }
}

void BrowserClient::detach()
{
    bridge_ = nullptr;
    policy_ = nullptr;
}

void BrowserClient::route_into_surface(const std::string &url, const char *source)
{
    if (url.empty()) return;
    // The navigation policy runs once, in OnBeforeBrowse for this load.
    LOG_ENTER("%s -> display surface: %s", source, url.c_str());
    load_url(url);
}
