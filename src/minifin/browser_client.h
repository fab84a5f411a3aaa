#ifndef MINIFIN_BROWSER_CLIENT_H
#define MINIFIN_BROWSER_CLIENT_H

#include <functional>
#include <string>
#include <utility>

#include <include/cef_client.h>
#include <include/cef_display_handler.h>
#include <include/cef_life_span_handler.h>
#include <include/cef_load_handler.h>
#include <include/cef_permission_handler.h>
#include <include/cef_request_handler.h>

#include "intercept_bridge.h"
#include "navigation_policy.h"

// Client of the single display browser. Feeds page load events into the
// interception bridge, routes every navigation through the navigation
// policy, and carries install requests to the renderer.
class BrowserClient : public CefClient,
                      public CefLifeSpanHandler,
                      public CefDisplayHandler,
                      public CefLoadHandler,
                      public CefRequestHandler,
                      public CefPermissionHandler,
                      public InterceptChannel {
 public:
  using ProgressCallback = std::function<void(double progress)>;
  using ClosedCallback = std::function<void()>;

  BrowserClient(InterceptBridge *bridge, NavigationPolicy *policy);

  void set_progress_handler(ProgressCallback handler) { progress_handler_ = std::move(handler); }
  void set_closed_handler(ClosedCallback handler) { closed_handler_ = std::move(handler); }

  CefRefPtr<CefLifeSpanHandler> GetLifeSpanHandler() override { return this; }
  CefRefPtr<CefDisplayHandler> GetDisplayHandler() override { return this; }
  CefRefPtr<CefLoadHandler> GetLoadHandler() override { return this; }
  CefRefPtr<CefRequestHandler> GetRequestHandler() override { return this; }
  CefRefPtr<CefPermissionHandler> GetPermissionHandler() override { return this; }

  // CefLifeSpanHandler
  void OnAfterCreated(CefRefPtr<CefBrowser> browser) override;
  bool DoClose(CefRefPtr<CefBrowser> browser) override;
  void OnBeforeClose(CefRefPtr<CefBrowser> browser) override;
  bool OnBeforePopup(CefRefPtr<CefBrowser> browser,
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
                     bool *no_javascript_access) override;

  // CefDisplayHandler
  void OnLoadingProgressChange(CefRefPtr<CefBrowser> browser, double progress) override;

  // CefLoadHandler
  void OnLoadStart(CefRefPtr<CefBrowser> browser,
                   CefRefPtr<CefFrame> frame,
                   TransitionType transition_type) override;
  void OnLoadEnd(CefRefPtr<CefBrowser> browser,
                 CefRefPtr<CefFrame> frame,
                 int httpStatusCode) override;
  void OnLoadError(CefRefPtr<CefBrowser> browser,
                   CefRefPtr<CefFrame> frame,
                   ErrorCode errorCode,
                   const CefString &errorText,
                   const CefString &failedUrl) override;

  // CefRequestHandler
  bool OnBeforeBrowse(CefRefPtr<CefBrowser> browser,
                      CefRefPtr<CefFrame> frame,
                      CefRefPtr<CefRequest> request,
                      bool user_gesture,
                      bool is_redirect) override;
  bool OnOpenURLFromTab(CefRefPtr<CefBrowser> browser,
                        CefRefPtr<CefFrame> frame,
                        const CefString &target_url,
                        cef_window_open_disposition_t target_disposition,
                        bool user_gesture) override;

  // CefPermissionHandler
  bool OnRequestMediaAccessPermission(CefRefPtr<CefBrowser> browser,
                                      CefRefPtr<CefFrame> frame,
                                      const CefString &requesting_origin,
                                      uint32_t requested_permissions,
                                      CefRefPtr<CefMediaAccessCallback> callback) override;
  bool OnShowPermissionPrompt(CefRefPtr<CefBrowser> browser,
                              uint64_t prompt_id,
                              const CefString &requesting_origin,
                              uint32_t requested_permissions,
                              CefRefPtr<CefPermissionPromptCallback> callback) override;

  // CefClient
  bool OnProcessMessageReceived(CefRefPtr<CefBrowser> browser,
                                CefRefPtr<CefFrame> frame,
                                CefProcessId source_process,
                                CefRefPtr<CefProcessMessage> message) override;

  // InterceptChannel
  bool send_install(const InterceptRequest &request, int generation) override;

  CefRefPtr<CefBrowser> browser() const { return browser_; }
  void load_url(const std::string &url);
  void close_browser();
  // Drops the bridge and policy pointers once their owners go away.
  void detach();

 private:
  // Loads url into the display surface. Used for popups and new-window
  // requests; external schemes are caught by OnBeforeBrowse.
  void route_into_surface(const std::string &url, const char *source);

  InterceptBridge *bridge_ = nullptr;
  NavigationPolicy *policy_ = nullptr;
  CefRefPtr<CefBrowser> browser_;
  ProgressCallback progress_handler_;
  ClosedCallback closed_handler_;
  IMPLEMENT_REFCOUNTING(BrowserClient);
};

#endif // MINIFIN_BROWSER_CLIENT_H
