#ifndef MINIFIN_LAUNCH_OPTIONS_H
#define MINIFIN_LAUNCH_OPTIONS_H

#include <string>
#include <vector>

// minifin's own command line switches. They are removed from argv before
// the remainder is passed to CEF.
struct LaunchOptions {
    bool has_settle_delay = false;
    int settle_delay_ms = 0;
    bool has_url = false;
    std::string url;
};

// Parses --minifin-settle-ms and --minifin-url (both "--opt=value" and
// "--opt value"). Out-of-range delays and empty URLs are reported on
// stderr and ignored. The URL is validated by the caller once CEF is up.
LaunchOptions parse_launch_options(int argc, char *argv[]);

// argv without minifin switches; argv[0] is always kept.
void build_cef_argv(int argc, char *argv[], std::vector<char *> *out_argv);

// Delay from the command line when given, otherwise from the settings file.
int effective_settle_delay_ms(const LaunchOptions &options, int stored_delay_ms);

#endif // MINIFIN_LAUNCH_OPTIONS_H
