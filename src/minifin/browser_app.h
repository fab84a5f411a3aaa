#ifndef MINIFIN_BROWSER_APP_H
#define MINIFIN_BROWSER_APP_H

#include <string>
#include <vector>

#include <include/cef_app.h>

#include "launch_options.h"

struct BrowserPaths {
    std::string resources_path;
    std::string locales_path;
    std::string subprocess_path;
};

struct BrowserPreflightState {
    BrowserPaths cef_paths;
    bool force_disable_gpu = false;
    LaunchOptions options;
    std::vector<char *> cef_argv;
};

// CEF process bootstrap: resource discovery, sub-process dispatch,
// initialisation and shutdown. Owned by main() for the process lifetime.
class BrowserApp {
public:
    explicit BrowserApp(CefRefPtr<CefApp> cef_app);

    // Runs CefExecuteProcess. Returns the sub-process exit code (>= 0)
    // when this process is a CEF helper, -1 for the browser process.
    int run_cef_preflight(int argc, char *argv[], BrowserPreflightState *state) const;

    bool initialize_cef(const BrowserPreflightState &preflight, std::string *error_out);
    void shutdown_cef();

    BrowserPaths discover_cef_paths() const;
    // Directory <ancestor>/<suffix> of the executable (or the working
    // directory) holding marker, or "" when none matches.
    std::string find_existing_path(const char *suffix, const char *marker) const;
    bool has_opengl_support() const;
    void apply_gpu_switches(bool disable_gpu) const;
    std::string build_data_path(const char *name) const;

private:
    void report_cef_resource_status(const BrowserPaths &paths) const;

    CefRefPtr<CefApp> cef_app_;
    bool initialized_ = false;
};

#endif // MINIFIN_BROWSER_APP_H
