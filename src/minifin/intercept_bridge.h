#ifndef MINIFIN_INTERCEPT_BRIDGE_H
#define MINIFIN_INTERCEPT_BRIDGE_H

#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

// An element of the loaded page is matched when it carries every class in
// required_classes. Clicks on matched elements are rerouted to the host
// with event_id instead of running the page's own behaviour.
struct InterceptRequest {
    std::vector<std::string> required_classes;
    std::string event_id;
};

bool validate_intercept_request(const InterceptRequest &request, std::string *error_out);

// Transport for install requests into the current page.
class InterceptChannel {
public:
    virtual ~InterceptChannel() = default;
    // Returns false when no page is attached to receive the request.
    virtual bool send_install(const InterceptRequest &request, int generation) = 0;
};

// Host side of the DOM button interception. Tracks page loads with a
// generation counter: each main frame load start opens a new generation,
// install requests carry it into the page and button events carry it
// back, so events from a page that has since been replaced are dropped.
class InterceptBridge {
public:
    using EventHandler = std::function<void(const std::string &event_id)>;
    using DelayScheduler = std::function<void(int delay_ms, std::function<void()> task)>;

    static constexpr int kMaxInstallAttempts = 3;

    InterceptBridge(DelayScheduler scheduler, int settle_delay_ms);

    void set_channel(InterceptChannel *channel) { channel_ = channel; }
    void set_event_handler(EventHandler handler) { event_handler_ = std::move(handler); }

    // Registers a request that is installed after every page load.
    bool add_intercept(const InterceptRequest &request, std::string *error_out);
    const std::vector<InterceptRequest> &intercepts() const { return requests_; }

    int page_load_started();
    // Starts the settle delay; registered requests are installed when it
    // elapses unless another load started meanwhile.
    void page_load_finished();

    // Sends one request to the current page. A request already installed
    // or awaiting its result for this generation is not sent again.
    bool install(const InterceptRequest &request);
    int install_registered();

    // Result reported by the page for an install request. A failed install
    // is retried after the settle delay, up to kMaxInstallAttempts sends
    // per page load. Returns false for results from a replaced page.
    bool handle_install_result(const InterceptRequest &request, int generation, bool installed);

    // Returns true when the event was dispatched to the handler.
    bool handle_button_event(const std::string &event_id, int generation);

    int generation() const { return generation_; }
    int settle_delay_ms() const { return settle_delay_ms_; }
    void set_settle_delay_ms(int delay_ms);
    bool is_installed(const InterceptRequest &request) const;
    bool is_pending(const InterceptRequest &request) const;

private:
    static std::string request_key(const InterceptRequest &request);
    bool is_registered_event(const std::string &event_id) const;
    void schedule_retry(const InterceptRequest &request);

    DelayScheduler scheduler_;
    int settle_delay_ms_ = 0;
    InterceptChannel *channel_ = nullptr;
    EventHandler event_handler_;
    std::vector<InterceptRequest> requests_;
    std::set<std::string> installed_;
    std::set<std::string> pending_;
    std::map<std::string, int> attempts_;
    int generation_ = 0;
};

#endif // MINIFIN_INTERCEPT_BRIDGE_H
