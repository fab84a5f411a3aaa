#include "browser_app.h"

#include <dlfcn.h>
#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <string.h>

#include <filesystem>
#include <initializer_list>
#include <system_error>

#include <include/cef_command_line.h>

#include "minifin_log.h"

extern "C" {
#include "../shared/config_utils.h"
}

BrowserApp::BrowserApp(CefRefPtr<CefApp> cef_app) : cef_app_(cef_app) {}

namespace fs = std::filesystem;

static fs::path executable_path()
{
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return fs::path();
    return exe;
}

// A directory is usable when marker exists inside it, or when it is
// non-empty if no marker is given.
static bool directory_matches(const fs::path &dir, const char *marker)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
    if (marker) return fs::exists(dir / marker, ec);
    return fs::directory_iterator(dir, ec) != fs::directory_iterator();
}

// Searches <base>/<suffix> for every ancestor base of the executable's
// directory, then the working directory.
std::string BrowserApp::find_existing_path(const char *suffix, const char *marker) const
{
    fs::path relative = (suffix && suffix[0]) ? fs::path(suffix) : fs::path();
    fs::path exe = executable_path();
    if (!exe.empty()) {
        for (fs::path base = exe.parent_path(); !base.empty(); base = base.parent_path()) {
            fs::path candidate = relative.empty() ? base : base / relative;
            if (directory_matches(candidate, marker)) return candidate.string();
            if (base == base.root_path()) break;
        }
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        fs::path candidate = relative.empty() ? cwd : cwd / relative;
        if (directory_matches(candidate, marker)) return candidate.string();
    }
    return std::string();
}

BrowserPaths BrowserApp::discover_cef_paths() const
{
    BrowserPaths paths;
    // Binary distributions ship icudtl.dat either beside libcef.so or in
    // a Resources directory.
    for (const char *dir : {"", "Resources", "cef/Resources", "cef/resources"}) {
        paths.resources_path = find_existing_path(dir, "icudtl.dat");
        if (!paths.resources_path.empty()) break;
    }
    for (const char *dir : {"locales", "Resources/locales", "cef/Resources/locales", "cef/locales"}) {
        paths.locales_path = find_existing_path(dir, nullptr);
        if (!paths.locales_path.empty()) break;
    }
    paths.subprocess_path = executable_path().string();
    return paths;
}

void BrowserApp::report_cef_resource_status(const BrowserPaths &paths) const
{
    fprintf(stderr,
            "[minifin] CEF resources_dir_path=%s\n",
            paths.resources_path.empty() ? "(default)" : paths.resources_path.c_str());
    fprintf(stderr,
            "[minifin] CEF locales_dir_path=%s\n",
            paths.locales_path.empty() ? "(default)" : paths.locales_path.c_str());
    if (paths.resources_path.empty()) {
        fprintf(stderr, "[minifin] icudtl.dat not found next to the executable\n");
    }
}

bool BrowserApp::has_opengl_support() const
{
    // Either GLX or EGL is enough for the GPU process.
    for (const char *lib : {"libGL.so.1", "libEGL.so.1"}) {
        void *handle = dlopen(lib, RTLD_LAZY | RTLD_LOCAL);
        if (handle) {
            dlclose(handle);
            return true;
        }
    }
    return false;
}

void BrowserApp::apply_gpu_switches(bool disable_gpu) const
{
    if (!disable_gpu) return;
    CefRefPtr<CefCommandLine> global = CefCommandLine::GetGlobalCommandLine();
    if (!global) return;
    global->AppendSwitch("disable-gpu");
    global->AppendSwitch("disable-software-rasterizer");
    global->AppendSwitch("disable-gpu-compositing");
}

std::string BrowserApp::build_data_path(const char *name) const
{
    char path[PATH_MAX];
    config_build_data_path(path, sizeof(path), name);
    return std::string(path);
}

int BrowserApp::run_cef_preflight(int argc, char *argv[], BrowserPreflightState *state) const
{
    if (!state) return -1;
    state->cef_paths = discover_cef_paths();
    state->force_disable_gpu = !has_opengl_support();
    if (state->force_disable_gpu) {
        fprintf(stderr,
                "[minifin] OpenGL stack missing (libGL), forcing --disable-gpu + software fallback\n");
    }
    state->options = parse_launch_options(argc, argv);
    build_cef_argv(argc, argv, &state->cef_argv);
    LOG_ENTER("cef argc=%d", (int)state->cef_argv.size());

    CefMainArgs main_args((int)state->cef_argv.size(), state->cef_argv.data());
    apply_gpu_switches(state->force_disable_gpu);
    int exit_code = CefExecuteProcess(main_args, cef_app_, nullptr);
    if (exit_code >= 0) {
        return exit_code;
    }
    return -1;
}

bool BrowserApp::initialize_cef(const BrowserPreflightState &preflight, std::string *error_out)
{
    if (initialized_) {
        if (error_out) *error_out = "CEF already initialized";
        return false;
    }
    if (config_ensure_data_dir() != 0) {
        if (error_out) {
            *error_out = std::string("cannot create data directory: ") + strerror(errno);
        }
        return false;
    }

    CefSettings settings;
    settings.no_sandbox = 1;
    settings.external_message_pump = 1;
    settings.command_line_args_disabled = 1;
    settings.log_severity = log_entry_enabled() ? LOGSEVERITY_VERBOSE : LOGSEVERITY_WARNING;
    std::string log_path = build_data_path("minifin-cef.log");
    if (!log_path.empty()) {
        CefString(&settings.log_file) = log_path;
    }
    const BrowserPaths &paths = preflight.cef_paths;
    if (!paths.resources_path.empty()) {
        CefString(&settings.resources_dir_path) = paths.resources_path;
    }
    if (!paths.locales_path.empty()) {
        CefString(&settings.locales_dir_path) = paths.locales_path;
    }
    if (!paths.subprocess_path.empty()) {
        CefString(&settings.browser_subprocess_path) = paths.subprocess_path;
    }
    std::string cache_path = build_data_path("cache");
    if (!cache_path.empty()) {
        CefString(&settings.root_cache_path) = cache_path;
        fprintf(stderr, "[minifin] root_cache_path=%s\n", cache_path.c_str());
    }
    report_cef_resource_status(paths);

    CefMainArgs main_args((int)preflight.cef_argv.size(),
                          const_cast<char **>(preflight.cef_argv.data()));
    fprintf(stderr, "[minifin] calling CefInitialize\n");
    initialized_ = CefInitialize(main_args, settings, cef_app_, nullptr);
    fprintf(stderr, "[minifin] CefInitialize result=%d\n", initialized_ ? 1 : 0);
    if (!initialized_) {
        if (error_out) {
            *error_out = "CefInitialize failed (see " + log_path + ")";
        }
        return false;
    }
    return true;
}

void BrowserApp::shutdown_cef()
{
    if (!initialized_) return;
    fprintf(stderr, "[minifin] calling CefShutdown\n");
    CefShutdown();
    initialized_ = false;
}
