#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <include/cef_app.h>

#include "browser_app.h"
#include "cef_test_env.h"
#include "minifin_cef_app.h"

namespace fs = std::filesystem;

static bool g_cef_initialized = false;

bool cef_test_initialized()
{
    return g_cef_initialized;
}

static std::string make_scratch_cache()
{
    std::string pattern = (fs::temp_directory_path() / "minifin-cef-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) return std::string();
    return std::string(buffer.data());
}

// Windowless browsers on a single-threaded loop without GPU. The same
// binary runs the renderer processes.
static bool start_test_browser_process(const BrowserApp &app,
                                       const BrowserPreflightState &preflight,
                                       CefRefPtr<CefApp> cef_app,
                                       const std::string &cache_path)
{
    if (!getenv("DISPLAY")) {
        fprintf(stderr, "[minifin] no DISPLAY, CEF tests will be skipped\n");
        return false;
    }
    std::vector<char *> argv = preflight.cef_argv;
    static char disable_gpu[] = "--disable-gpu";
    static char disable_compositing[] = "--disable-gpu-compositing";
    argv.push_back(disable_gpu);
    argv.push_back(disable_compositing);

    CefSettings settings;
    settings.no_sandbox = 1;
    settings.windowless_rendering_enabled = 1;
    settings.log_severity = LOGSEVERITY_WARNING;
    BrowserPaths paths = app.discover_cef_paths();
    if (!paths.resources_path.empty()) {
        CefString(&settings.resources_dir_path) = paths.resources_path;
    }
    if (!paths.locales_path.empty()) {
        CefString(&settings.locales_dir_path) = paths.locales_path;
    }
    if (!cache_path.empty()) {
        CefString(&settings.root_cache_path) = cache_path;
    }

    CefMainArgs main_args((int)argv.size(), argv.data());
    bool ok = CefInitialize(main_args, settings, cef_app, nullptr);
    fprintf(stderr, "[minifin] test CefInitialize result=%d\n", ok ? 1 : 0);
    return ok;
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    CefRefPtr<CefApp> cef_app = new MinifinCefApp();
    BrowserApp app(cef_app);
    BrowserPreflightState preflight;
    int exit_code = app.run_cef_preflight(argc, argv, &preflight);
    if (exit_code >= 0) {
        return exit_code;
    }

    std::string cache_path;
    if (!::testing::GTEST_FLAG(list_tests)) {
        cache_path = make_scratch_cache();
        g_cef_initialized = start_test_browser_process(app, preflight, cef_app, cache_path);
    }

    int result = RUN_ALL_TESTS();

    if (g_cef_initialized) {
        CefShutdown();
        g_cef_initialized = false;
    }
    if (!cache_path.empty()) {
        std::error_code ec;
        fs::remove_all(cache_path, ec);
        if (ec) {
            fprintf(stderr, "[minifin] cannot remove %s: %s\n", cache_path.c_str(), ec.message().c_str());
        }
    }
    return result;
}
