#ifndef MINIFIN_CEF_APP_H
#define MINIFIN_CEF_APP_H

#include <include/cef_app.h>
#include <include/cef_render_process_handler.h>

// Process-wide CEF application object. The same executable serves as
// browser and renderer process; the renderer half exposes the host
// callback object and runs interception installs sent by the browser.
class MinifinCefApp : public CefApp, public CefRenderProcessHandler {
 public:
  CefRefPtr<CefRenderProcessHandler> GetRenderProcessHandler() override { return this; }

  void OnBeforeCommandLineProcessing(const CefString &process_type,
                                     CefRefPtr<CefCommandLine> command_line) override;

  void OnContextCreated(CefRefPtr<CefBrowser> browser,
                        CefRefPtr<CefFrame> frame,
                        CefRefPtr<CefV8Context> context) override;

  bool OnProcessMessageReceived(CefRefPtr<CefBrowser> browser,
                                CefRefPtr<CefFrame> frame,
                                CefProcessId source_process,
                                CefRefPtr<CefProcessMessage> message) override;

 private:
  IMPLEMENT_REFCOUNTING(MinifinCefApp);
};

#endif // MINIFIN_CEF_APP_H
