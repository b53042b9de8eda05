#pragma once

#include "offloader/transfer_job.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct ProgressSnapshot {
    std::uint64_t seq = 0; // assigned on publish
    // order in which the tracker took this view, 0 for the idle snapshot
    std::uint64_t revision = 0;
    std::string job_id;
    std::string project_name;
    JobState state = JobState::Idle;
    double percent = 0.0;
    std::uintmax_t bytes_copied = 0;
    std::uintmax_t bytes_total = 0;
    double throughput_bps = 0.0;
    std::optional<double> eta_seconds;
    std::string current_file;
    size_t current_file_index = 0;
    double current_file_percent = 0.0;
    size_t files_total = 0;
    size_t files_copied = 0;
    size_t files_processed = 0;
    size_t error_count = 0;
    double elapsed_seconds = 0.0;
    std::string destination;
    std::string last_error;
};

void to_json(nlohmann::json &j, const ProgressSnapshot &snapshot);
void from_json(const nlohmann::json &j, ProgressSnapshot &snapshot);

// derives percent, smoothed throughput and ETA from the job counters
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(const double &smoothing = 0.3);

    // advances the throughput average with one interval
    ProgressSnapshot sample(const TransferJob &job);
    ProgressSnapshot sample(const TransferJob &job, const Clock::time_point &now);

    // current view without touching the average
    // job counters are read under the tracker lock, so a higher revision never shows an older job view
    ProgressSnapshot peek(const TransferJob &job) const;

    void reset();
    void setSmoothing(const double &smoothing);

private:
    mutable std::mutex mutex;
    double smoothing;
    bool has_sample = false;
    bool has_rate = false;
    Clock::time_point last_time;
    std::uintmax_t last_bytes = 0;
    double throughput = 0.0;
    // never reset, views of a later job always order after the earlier one
    mutable std::uint64_t revisions = 0;

    ProgressSnapshot build(const TransferJob &job, const JobCounters &counters) const;
};

// bytes written to the destination so far, including the file in flight
std::uintmax_t transferred_bytes(const JobCounters &counters);
