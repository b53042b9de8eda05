#include "offloader/progress_tracker.hpp"

void to_json(nlohmann::json &j, const ProgressSnapshot &snapshot) {
    j = nlohmann::json{
        {"seq", snapshot.seq},
        {"job_id", snapshot.job_id},
        {"project_name", snapshot.project_name},
        {"state", to_string(snapshot.state)},
        {"percent", snapshot.percent},
        {"bytes_copied", snapshot.bytes_copied},
        {"bytes_total", snapshot.bytes_total},
        {"throughput_bps", snapshot.throughput_bps},
        {"eta_seconds", snapshot.eta_seconds ? nlohmann::json(*snapshot.eta_seconds) : nlohmann::json(nullptr)},
        {"current_file", snapshot.current_file},
        {"current_file_index", snapshot.current_file_index},
        {"current_file_percent", snapshot.current_file_percent},
        {"files_total", snapshot.files_total},
        {"files_copied", snapshot.files_copied},
        {"files_processed", snapshot.files_processed},
        {"error_count", snapshot.error_count},
        {"elapsed_seconds", snapshot.elapsed_seconds},
        {"destination", snapshot.destination},
        {"last_error", snapshot.last_error}
    };
}

void from_json(const nlohmann::json &j, ProgressSnapshot &snapshot) {
    static const JobState states[] = {
        JobState::Idle, JobState::Mounting, JobState::Scanning, JobState::Copying,
        JobState::Verifying, JobState::Completed, JobState::Failed, JobState::Cancelled
    };

    snapshot.seq = j.value("seq", std::uint64_t{0});
    snapshot.job_id = j.value("job_id", "");
    snapshot.project_name = j.value("project_name", "");
    std::string state = j.value("state", "idle");
    for (const auto &s : states) {
        if (to_string(s) == state) {
            snapshot.state = s;
        }
    }
    snapshot.percent = j.value("percent", 0.0);
    snapshot.bytes_copied = j.value("bytes_copied", std::uintmax_t{0});
    snapshot.bytes_total = j.value("bytes_total", std::uintmax_t{0});
    snapshot.throughput_bps = j.value("throughput_bps", 0.0);
    if (j.contains("eta_seconds") && j["eta_seconds"].is_number()) {
        snapshot.eta_seconds = j["eta_seconds"].get<double>();
    } else {
        snapshot.eta_seconds.reset();
    }
    snapshot.current_file = j.value("current_file", "");
    snapshot.current_file_index = j.value("current_file_index", size_t{0});
    snapshot.current_file_percent = j.value("current_file_percent", 0.0);
    snapshot.files_total = j.value("files_total", size_t{0});
    snapshot.files_copied = j.value("files_copied", size_t{0});
    snapshot.files_processed = j.value("files_processed", size_t{0});
    snapshot.error_count = j.value("error_count", size_t{0});
    snapshot.elapsed_seconds = j.value("elapsed_seconds", 0.0);
    snapshot.destination = j.value("destination", "");
    snapshot.last_error = j.value("last_error", "");
}

std::uintmax_t transferred_bytes(const JobCounters &counters) {
    return counters.bytes_copied + counters.current_file_bytes;
}

ProgressTracker::ProgressTracker(const double &smoothing) : smoothing(smoothing) {
}

void ProgressTracker::reset() {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->has_sample = false;
    this->has_rate = false;
    this->last_bytes = 0;
    this->throughput = 0.0;
}

void ProgressTracker::setSmoothing(const double &smoothing) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->smoothing = smoothing;
}

ProgressSnapshot ProgressTracker::sample(const TransferJob &job) {
    return this->sample(job, Clock::now());
}

ProgressSnapshot ProgressTracker::sample(const TransferJob &job, const Clock::time_point &now) {
    std::lock_guard<std::mutex> lock(this->mutex);
    JobCounters counters = job.getCounters();
    std::uintmax_t bytes = transferred_bytes(counters);

    if (this->has_sample) {
        double dt = std::chrono::duration<double>(now - this->last_time).count();
        if (dt > 0.0) {
            // a failed file drops its partial bytes, count that interval as zero
            double delta = bytes > this->last_bytes ? static_cast<double>(bytes - this->last_bytes) : 0.0;
            double rate = delta / dt;
            this->throughput = this->has_rate ? this->smoothing * rate + (1.0 - this->smoothing) * this->throughput : rate;
            this->has_rate = true;
            this->last_time = now;
            this->last_bytes = bytes;
        }
    } else {
        this->has_sample = true;
        this->last_time = now;
        this->last_bytes = bytes;
    }
    return this->build(job, counters);
}

ProgressSnapshot ProgressTracker::peek(const TransferJob &job) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    JobCounters counters = job.getCounters();
    return this->build(job, counters);
}

ProgressSnapshot ProgressTracker::build(const TransferJob &job, const JobCounters &counters) const {
    ProgressSnapshot s;
    s.revision = ++this->revisions;
    s.job_id = job.getId();
    s.project_name = job.getProjectName();
    s.state = job.getState();
    s.bytes_copied = counters.bytes_copied;
    s.bytes_total = counters.bytes_total;
    s.current_file = counters.current_file;
    s.current_file_index = counters.current_index;
    s.files_total = counters.files_total;
    s.files_copied = counters.files_copied;
    s.files_processed = counters.files_processed;
    s.error_count = counters.error_count;
    s.elapsed_seconds = job.getElapsedSeconds();
    s.destination = job.getDestination();
    s.last_error = job.getLastError().value_or("");

    // failed files count as processed so a finished job reaches 100
    std::uintmax_t done = counters.bytes_processed + counters.current_file_bytes;
    if (counters.bytes_total > 0) {
        s.percent = done >= counters.bytes_total ? 100.0 : static_cast<double>(done) * 100.0 / static_cast<double>(counters.bytes_total);
    } else if (counters.files_total > 0) {
        s.percent = static_cast<double>(counters.files_processed) * 100.0 / static_cast<double>(counters.files_total);
    }
    if (counters.current_file_size > 0) {
        s.current_file_percent = static_cast<double>(counters.current_file_bytes) * 100.0 / static_cast<double>(counters.current_file_size);
    }

    s.throughput_bps = this->throughput;
    bool moving = s.state == JobState::Copying || s.state == JobState::Verifying;
    if (moving && this->throughput > 0.0) {
        std::uintmax_t remaining = done >= counters.bytes_total ? 0 : counters.bytes_total - done;
        s.eta_seconds = static_cast<double>(remaining) / this->throughput;
    }
    return s;
}
