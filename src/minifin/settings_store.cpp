#include "settings_store.h"

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <string.h>

#include <utility>

extern "C" {
#include "../shared/config_utils.h"
}

#include "minifin_log.h"

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

SettingsStore::SettingsStore(std::string file_name) : file_name_(std::move(file_name)) {}

std::string SettingsStore::file_path() const
{
    char path[PATH_MAX];
    config_build_path(path, sizeof(path), file_name_.c_str());
    return std::string(path);
}

bool SettingsStore::init(std::string *error_out)
{
    if (initialized_) {
        if (error_out) *error_out = "settings store already initialized";
        return false;
    }
    if (config_ensure_dir() != 0) {
        int err = errno;
        if (error_out) {
            *error_out = std::string("cannot create config directory: ") + strerror(err);
        }
        fprintf(stderr, "[minifin] settings init failed: %s\n", strerror(err));
        return false;
    }

    char value[4096];
    int rc = config_read_string(file_name_.c_str(), kServerUrlKey, value, sizeof(value));
    if (rc < 0) {
        int err = errno;
        if (error_out) {
            *error_out = std::string("cannot read ") + file_path() + ": " + strerror(err);
        }
        fprintf(stderr, "[minifin] settings read failed path=%s: %s\n",
                file_path().c_str(), strerror(err));
        return false;
    }
    if (rc == 1) {
        server_url_ = std::string(value);
    }

    int delay = config_read_int(file_name_.c_str(), kSettleDelayKey, kDefaultSettleDelayMs);
    if (delay < 0 || delay > kMaxSettleDelayMs) {
        fprintf(stderr, "[minifin] ignoring %s=%d (allowed 0..%d)\n",
                kSettleDelayKey, delay, kMaxSettleDelayMs);
        delay = kDefaultSettleDelayMs;
    }
    settle_delay_ms_ = delay;

    initialized_ = true;
    LOG_ENTER("path=%s serverUrl=%s settleDelayMs=%d",
              file_path().c_str(),
              server_url_ ? server_url_->c_str() : "(unset)",
              settle_delay_ms_);
    return true;
}

std::optional<std::string> SettingsStore::server_url() const
{
    return server_url_;
}

bool SettingsStore::set_server_url(const std::string &url, std::string *error_out)
{
    if (!initialized_) {
        if (error_out) *error_out = "settings store not initialized";
        return false;
    }
    if (config_write_string(file_name_.c_str(), kServerUrlKey, url.c_str()) != 0) {
        int err = errno;
        if (error_out) *error_out = strerror(err);
        fprintf(stderr, "[minifin] saving %s failed path=%s: %s\n",
                kServerUrlKey, file_path().c_str(), strerror(err));
        return false;
    }
    server_url_ = url;
    fprintf(stderr, "[minifin] saved %s=%s path=%s\n",
            kServerUrlKey, url.c_str(), file_path().c_str());
    return true;
}
