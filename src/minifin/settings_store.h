#ifndef MINIFIN_SETTINGS_STORE_H
#define MINIFIN_SETTINGS_STORE_H

#include <optional>
#include <string>

// Persistent application settings backed by a "key value" file in the
// minifin config directory. One instance is created by main() and handed
// by reference to everything that reads or writes the server URL.
//
// Lifecycle: init() must succeed exactly once before any other call.
class SettingsStore {
public:
    static constexpr const char *kDefaultFileName = "settings";
    static constexpr const char *kServerUrlKey = "serverUrl";
    static constexpr const char *kSettleDelayKey = "settleDelayMs";
    static constexpr int kDefaultSettleDelayMs = 1000;
    static constexpr int kMaxSettleDelayMs = 60000;

    explicit SettingsStore(std::string file_name = kDefaultFileName);

    bool init(std::string *error_out);
    bool is_initialized() const { return initialized_; }

    // Last successfully saved server URL, or nullopt when never saved.
    std::optional<std::string> server_url() const;

    // Persists the value durably. On failure the previous value stays in
    // effect and error_out receives the cause.
    bool set_server_url(const std::string &url, std::string *error_out);

    // Settle delay before DOM interception; falls back to the default for
    // missing or out-of-range values.
    int settle_delay_ms() const { return settle_delay_ms_; }

    std::string file_path() const;

private:
    std::string file_name_;
    bool initialized_ = false;
    std::optional<std::string> server_url_;
    int settle_delay_ms_ = kDefaultSettleDelayMs;
};

#endif // MINIFIN_SETTINGS_STORE_H
