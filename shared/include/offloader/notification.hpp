#pragma once

#include "offloader/progress_tracker.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct NotificationEvent {
    enum class Kind {
        Started,
        Milestone,
        Completed,
        Failed
    };

    std::string job_id;
    Kind kind = Kind::Started;
    int milestone = 0;

    // payload
    std::string project_name;
    std::string destination;
    size_t files_total = 0;
    size_t files_done = 0;
    size_t error_count = 0;
    std::uintmax_t bytes_total = 0;
    std::uintmax_t bytes_done = 0;
    double duration_seconds = 0.0;
    std::optional<double> eta_seconds;
    std::string error;
};

std::string to_string(const NotificationEvent::Kind &kind);
NotificationEvent make_event(const NotificationEvent::Kind &kind, const ProgressSnapshot &snapshot, const int &milestone = 0);

// chat message text for an event
std::string format_message(const NotificationEvent &event);

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    // true when the target accepted the event
    virtual bool deliver(const NotificationEvent &event) = 0;
};

// Discord compatible webhook: POST {"content": "<message>"}
class WebhookSink : public NotificationSink {
public:
    WebhookSink(const std::string &url, const long &timeout_ms);

    bool deliver(const NotificationEvent &event) override;

private:
    std::string url;
    long timeout_ms;
};

// fires each event kind and each milestone at most once per job, delivery runs on its own thread
class NotificationDispatcher {
public:
    NotificationDispatcher();
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    // forgets what was fired for the previous job
    void beginJob(const std::string &job_id, const std::vector<int> &milestones, std::shared_ptr<NotificationSink> sink);

    // returns false when the event was already fired or belongs to another job
    bool notify(const NotificationEvent &event);

    // fires every configured milestone the snapshot has reached
    void onProgress(const ProgressSnapshot &snapshot);

    // blocks until every queued event was handed to the sink
    void flush();

    std::vector<int> getFiredMilestones() const;

private:
    mutable std::mutex mutex;
    std::condition_variable queue_changed;
    std::condition_variable queue_drained;
    std::deque<std::pair<NotificationEvent, std::shared_ptr<NotificationSink>>> queue;
    bool delivering = false;
    bool stopping = false;

    std::string job_id;
    std::vector<int> milestones;
    std::shared_ptr<NotificationSink> sink;
    std::set<int> fired_milestones;
    bool started_fired = false;
    bool terminal_fired = false;

    std::thread worker;

    void run();
    void deliver(const NotificationEvent &event, NotificationSink &sink);
};
