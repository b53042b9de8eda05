#include "offloader/notification.hpp"
#include "offloader/helpers.hpp"

#include <algorithm>
#include <iostream>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace {

size_t discard_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    (void)ptr;
    (void)userdata;
    return size * nmemb;
}

}

std::string to_string(const NotificationEvent::Kind &kind) {
    switch (kind) {
        case NotificationEvent::Kind::Started: return "started";
        case NotificationEvent::Kind::Milestone: return "milestone";
        case NotificationEvent::Kind::Completed: return "completed";
        case NotificationEvent::Kind::Failed: return "failed";
    }
    return "unknown";
}

NotificationEvent make_event(const NotificationEvent::Kind &kind, const ProgressSnapshot &snapshot, const int &milestone) {
    NotificationEvent event;
    event.job_id = snapshot.job_id;
    event.kind = kind;
    event.milestone = milestone;
    event.project_name = snapshot.project_name;
    event.destination = snapshot.destination;
    event.files_total = snapshot.files_total;
    event.files_done = snapshot.files_copied;
    event.error_count = snapshot.error_count;
    event.bytes_total = snapshot.bytes_total;
    event.bytes_done = snapshot.bytes_copied;
    event.duration_seconds = snapshot.elapsed_seconds;
    event.eta_seconds = snapshot.eta_seconds;
    event.error = snapshot.last_error;
    return event;
}

std::string format_message(const NotificationEvent &event) {
    std::string files = std::to_string(event.files_total) + " files";
    std::string title = event.project_name.empty() ? "" : " `" + event.project_name + "`";

    switch (event.kind) {
        case NotificationEvent::Kind::Started:
            return "🚀 **Transfer started**" + title + "\n"
                 + "📁 " + files + " — " + human_size(static_cast<double>(event.bytes_total)) + "\n"
                 + "📍 `" + event.destination + "`";

        case NotificationEvent::Kind::Milestone:
            return "📊 **" + std::to_string(event.milestone) + "% complete**" + title + "\n"
                 + "📁 " + std::to_string(event.files_done) + "/" + files + " — "
                 + human_size(static_cast<double>(event.bytes_done)) + " / " + human_size(static_cast<double>(event.bytes_total)) + "\n"
                 + "⏱ " + format_eta(event.eta_seconds);

        case NotificationEvent::Kind::Completed: {
            double avg = event.duration_seconds > 0 ? static_cast<double>(event.bytes_done) / event.duration_seconds : 0.0;
            std::string errors = event.error_count ? " — " + std::to_string(event.error_count) + " error(s)" : "";
            return "✅ **Transfer complete**" + title + "\n"
                 + "📁 " + files + " — " + human_size(static_cast<double>(event.bytes_total)) + errors + "\n"
                 + "📍 `" + event.destination + "`\n"
                 + "⏱ Duration: " + format_duration(event.duration_seconds) + " — Avg: " + human_size(avg) + "/s";
        }

        case NotificationEvent::Kind::Failed:
            return "❌ **Transfer failed**" + title + "\n"
                 + "📁 " + std::to_string(event.files_done) + "/" + files + " copied\n"
                 + "⚠️ " + (event.error.empty() ? "unknown error" : event.error);
    }
    return "";
}

// WebhookSink

WebhookSink::WebhookSink(const std::string &url, const long &timeout_ms) : url(url), timeout_ms(timeout_ms) {
}

bool WebhookSink::deliver(const NotificationEvent &event) {
    CURL *curl = curl_easy_init();
    if (!curl) {
        return false;
    }

    std::string payload = nlohmann::json{{"content", format_message(event)}}.dump();
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, this->url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, this->timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    } else {
        std::cerr << "[notify] Webhook request failed: " << curl_easy_strerror(res) << std::endl;
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return res == CURLE_OK && status >= 200 && status < 300;
}

// NotificationDispatcher

NotificationDispatcher::NotificationDispatcher() {
    this->worker = std::thread(&NotificationDispatcher::run, this);
}

NotificationDispatcher::~NotificationDispatcher() {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->stopping = true;
    }
    this->queue_changed.notify_all();
    if (this->worker.joinable()) {
        this->worker.join();
    }
}

void NotificationDispatcher::beginJob(const std::string &job_id, const std::vector<int> &milestones, std::shared_ptr<NotificationSink> sink) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->job_id = job_id;
    this->milestones.clear();
    for (int m : milestones) {
        if (m > 0 && m <= 100) {
            this->milestones.push_back(m);
        }
    }
    std::sort(this->milestones.begin(), this->milestones.end());
    this->milestones.erase(std::unique(this->milestones.begin(), this->milestones.end()), this->milestones.end());
    this->sink = std::move(sink);
    this->fired_milestones.clear();
    this->started_fired = false;
    this->terminal_fired = false;
}

bool NotificationDispatcher::notify(const NotificationEvent &event) {
    std::unique_lock<std::mutex> lock(this->mutex);
    if (event.job_id != this->job_id) {
        return false;
    }

    // at most once per job
    switch (event.kind) {
        case NotificationEvent::Kind::Started:
            if (this->started_fired) return false;
            this->started_fired = true;
            break;
        case NotificationEvent::Kind::Milestone:
            if (!this->fired_milestones.insert(event.milestone).second) return false;
            break;
        case NotificationEvent::Kind::Completed:
        case NotificationEvent::Kind::Failed:
            if (this->terminal_fired) return false;
            this->terminal_fired = true;
            break;
    }

    std::cout << "[notify] " << to_string(event.kind)
              << (event.kind == NotificationEvent::Kind::Milestone ? " " + std::to_string(event.milestone) + "%" : "")
              << " for job " << event.job_id << std::endl;
    if (this->sink) {
        this->queue.emplace_back(event, this->sink);
        lock.unlock();
        this->queue_changed.notify_one();
    }
    return true;
}

void NotificationDispatcher::onProgress(const ProgressSnapshot &snapshot) {
    std::vector<int> reached;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (snapshot.job_id != this->job_id) {
            return;
        }
        for (int m : this->milestones) {
            if (snapshot.percent >= static_cast<double>(m) && this->fired_milestones.count(m) == 0) {
                reached.push_back(m);
            }
        }
    }

    // ascending, so milestones go out in order
    for (int m : reached) {
        this->notify(make_event(NotificationEvent::Kind::Milestone, snapshot, m));
    }
}

void NotificationDispatcher::flush() {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->queue_drained.wait(lock, [this]() { return this->queue.empty() && !this->delivering; });
}

std::vector<int> NotificationDispatcher::getFiredMilestones() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return std::vector<int>(this->fired_milestones.begin(), this->fired_milestones.end());
}

void NotificationDispatcher::run() {
    std::unique_lock<std::mutex> lock(this->mutex);
    while (true) {
        this->queue_changed.wait(lock, [this]() { return this->stopping || !this->queue.empty(); });
        if (this->queue.empty()) {
            break; // stopping with nothing left
        }

        auto item = std::move(this->queue.front());
        this->queue.pop_front();
        this->delivering = true;
        lock.unlock();

        this->deliver(item.first, *item.second);

        lock.lock();
        this->delivering = false;
        if (this->queue.empty()) {
            this->queue_drained.notify_all();
        }
    }
    this->queue_drained.notify_all();
}

void NotificationDispatcher::deliver(const NotificationEvent &event, NotificationSink &sink) {
    // one immediate retry, then give up
    for (int attempt = 1; attempt <= 2; ++attempt) {
        try {
            if (sink.deliver(event)) {
                return;
            }
        } catch (const std::exception &e) {
            std::cerr << "[notify] Delivery error: " << e.what() << std::endl;
        }
        if (attempt == 1) {
            std::cerr << "[notify] Delivery of " << to_string(event.kind) << " for job " << event.job_id << " failed, retrying once" << std::endl;
        }
    }
    std::cerr << "[notify] Dropped " << to_string(event.kind) << " notification for job " << event.job_id << std::endl;
}
