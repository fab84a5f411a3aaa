#include "launch_options.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>

#include "settings_store.h"

static const char kSettleFlag[] = "--minifin-settle-ms";
static const char kUrlFlag[] = "--minifin-url";

// Matches "--flag=value" or "--flag value". On a match *out_value is set
// and *consumed is the number of extra argv entries taken.
static bool match_flag(int argc, char *argv[], int i, const char *flag,
                       std::string *out_value, int *consumed)
{
    const char *arg = argv[i];
    size_t flag_len = strlen(flag);
    *consumed = 0;
    if (strncmp(arg, flag, flag_len) != 0) return false;
    if (arg[flag_len] == '=') {
        *out_value = std::string(arg + flag_len + 1);
        return true;
    }
    if (arg[flag_len] != '\0') return false;
    if (i + 1 < argc && argv[i + 1]) {
        *out_value = std::string(argv[i + 1]);
        *consumed = 1;
    } else {
        out_value->clear();
    }
    return true;
}

static bool parse_delay(const std::string &text, int *out_delay)
{
    if (text.empty()) return false;
    char *end = NULL;
    errno = 0;
    long value = strtol(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    if (value < 0 || value > SettingsStore::kMaxSettleDelayMs) return false;
    *out_delay = (int)value;
    return true;
}

LaunchOptions parse_launch_options(int argc, char *argv[])
{
    LaunchOptions options;
    if (argc <= 0 || !argv) return options;
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) continue;
        std::string value;
        int consumed = 0;
        if (match_flag(argc, argv, i, kSettleFlag, &value, &consumed)) {
            int delay = 0;
            if (parse_delay(value, &delay)) {
                options.has_settle_delay = true;
                options.settle_delay_ms = delay;
            } else {
                fprintf(stderr,
                        "[minifin] ignoring %s='%s' (expected 0..%d)\n",
                        kSettleFlag,
                        value.c_str(),
                        SettingsStore::kMaxSettleDelayMs);
            }
            i += consumed;
            continue;
        }
        if (match_flag(argc, argv, i, kUrlFlag, &value, &consumed)) {
            if (!value.empty()) {
                options.has_url = true;
                options.url = value;
            } else {
                fprintf(stderr, "[minifin] ignoring %s without a value\n", kUrlFlag);
            }
            i += consumed;
            continue;
        }
    }
    return options;
}

void build_cef_argv(int argc, char *argv[], std::vector<char *> *out_argv)
{
    if (!out_argv) return;
    out_argv->clear();
    if (argc <= 0 || !argv) return;
    out_argv->reserve((size_t)argc);
    out_argv->push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) continue;
        std::string value;
        int consumed = 0;
        if (match_flag(argc, argv, i, kSettleFlag, &value, &consumed) ||
            match_flag(argc, argv, i, kUrlFlag, &value, &consumed)) {
            i += consumed;
            continue;
        }
        out_argv->push_back(argv[i]);
    }
}

int effective_settle_delay_ms(const LaunchOptions &options, int stored_delay_ms)
{
    if (options.has_settle_delay) return options.settle_delay_ms;
    return stored_delay_ms;
}
