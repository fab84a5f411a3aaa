#include "intercept_bridge.h"

#include <stdio.h>

#include <utility>

#include "minifin_log.h"

bool validate_intercept_request(const InterceptRequest &request, std::string *error_out)
{
    if (request.event_id.empty()) {
        if (error_out) *error_out = "empty event id";
        return false;
    }
    if (request.required_classes.empty()) {
        if (error_out) *error_out = "no required classes";
        return false;
    }
    for (const std::string &name : request.required_classes) {
        if (name.empty()) {
            if (error_out) *error_out = "empty class name";
            return false;
        }
        // Class tokens are whitespace separated in the DOM.
        if (name.find_first_of(" \t\r\n\f") != std::string::npos) {
            if (error_out) *error_out = "class name contains whitespace: '" + name + "'";
            return false;
        }
    }
    return true;
}

InterceptBridge::InterceptBridge(DelayScheduler scheduler, int settle_delay_ms)
    : scheduler_(std::move(scheduler))
{
    set_settle_delay_ms(settle_delay_ms);
}

void InterceptBridge::set_settle_delay_ms(int delay_ms)
{
    settle_delay_ms_ = delay_ms < 0 ? 0 : delay_ms;
}

std::string InterceptBridge::request_key(const InterceptRequest &request)
{
    std::string key = request.event_id;
    for (const std::string &name : request.required_classes) {
        key.push_back('\x1f');
        key.append(name);
    }
    return key;
}

bool InterceptBridge::add_intercept(const InterceptRequest &request, std::string *error_out)
{
    if (!validate_intercept_request(request, error_out)) return false;
    std::string key = request_key(request);
    for (const InterceptRequest &existing : requests_) {
        if (request_key(existing) == key) return true;
    }
    requests_.push_back(request);
    return true;
}

int InterceptBridge::page_load_started()
{
    generation_++;
    installed_.clear();
    pending_.clear();
    attempts_.clear();
    LOG_ENTER("generation=%d", generation_);
    return generation_;
}

void InterceptBridge::page_load_finished()
{
    if (requests_.empty()) return;
    const int generation = generation_;
    auto task = [this, generation]() {
        if (generation != generation_) {
            LOG_ENTER("settle timer for generation %d superseded by %d", generation, generation_);
            return;
        }
        install_registered();
    };
    if (!scheduler_ || settle_delay_ms_ == 0) {
        task();
        return;
    }
    scheduler_(settle_delay_ms_, task);
}

bool InterceptBridge::is_installed(const InterceptRequest &request) const
{
    return installed_.count(request_key(request)) > 0;
}

bool InterceptBridge::is_pending(const InterceptRequest &request) const
{
    return pending_.count(request_key(request)) > 0;
}

bool InterceptBridge::install(const InterceptRequest &request)
{
    std::string error;
    if (!validate_intercept_request(request, &error)) {
        fprintf(stderr, "[minifin] rejecting intercept '%s': %s\n",
                request.event_id.c_str(), error.c_str());
        return false;
    }
    std::string key = request_key(request);
    if (installed_.count(key) || pending_.count(key)) {
        LOG_ENTER("'%s' already sent for generation %d", request.event_id.c_str(), generation_);
        return true;
    }
    if (!channel_ || !channel_->send_install(request, generation_)) {
        LOG_ENTER("script channel unavailable, skipping '%s'", request.event_id.c_str());
        return false;
    }
    pending_.insert(key);
    attempts_[key]++;
    LOG_ENTER("sent '%s' generation=%d attempt=%d classes=%zu",
              request.event_id.c_str(), generation_, attempts_[key], request.required_classes.size());
    return true;
}

bool InterceptBridge::handle_install_result(const InterceptRequest &request, int generation, bool installed)
{
    if (generation != generation_) {
        LOG_ENTER("dropping install result for '%s' from generation %d (current %d)",
                  request.event_id.c_str(), generation, generation_);
        return false;
    }
    std::string key = request_key(request);
    pending_.erase(key);
    if (installed) {
        installed_.insert(key);
        LOG_ENTER("'%s' active for generation %d", request.event_id.c_str(), generation_);
        return true;
    }
    int attempts = attempts_[key];
    if (attempts >= kMaxInstallAttempts) {
        fprintf(stderr, "[minifin] giving up on intercept '%s' after %d attempts\n",
                request.event_id.c_str(), attempts);
        return true;
    }
    schedule_retry(request);
    return true;
}

void InterceptBridge::schedule_retry(const InterceptRequest &request)
{
    const int generation = generation_;
    auto task = [this, generation, request]() {
        if (generation != generation_) return;
        install(request);
    };
    if (!scheduler_ || settle_delay_ms_ == 0) {
        task();
        return;
    }
    scheduler_(settle_delay_ms_, task);
}

int InterceptBridge::install_registered()
{
    int count = 0;
    for (const InterceptRequest &request : requests_) {
        if (install(request)) count++;
    }
    return count;
}

bool InterceptBridge::is_registered_event(const std::string &event_id) const
{
    for (const InterceptRequest &request : requests_) {
        if (request.event_id == event_id) return true;
    }
    return false;
}

bool InterceptBridge::handle_button_event(const std::string &event_id, int generation)
{
    if (generation != generation_) {
        LOG_ENTER("dropping stale '%s' from generation %d (current %d)",
                  event_id.c_str(), generation, generation_);
        return false;
    }
    if (!is_registered_event(event_id)) {
        LOG_ENTER("dropping unknown event '%s'", event_id.c_str());
        return false;
    }
    if (!event_handler_) return false;
    event_handler_(event_id);
    return true;
}
