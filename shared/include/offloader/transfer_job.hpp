#pragma once

#include "offloader/file_enumerator.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class JobState {
    Idle,
    Mounting,
    Scanning,
    Copying,
    Verifying,
    Completed,
    Failed,
    Cancelled
};

enum class FileStatus {
    Pending,
    Copying,
    Copied,
    VerifyFailed,
    Failed
};

std::string to_string(const JobState &state);
std::string to_string(const FileStatus &status);
bool is_terminal(const JobState &state);
bool can_transition(const JobState &from, const JobState &to);

// consistent view of the job counters
struct JobCounters {
    std::uintmax_t bytes_total = 0;
    std::uintmax_t bytes_copied = 0;     // sizes of files whose copy succeeded
    std::uintmax_t bytes_processed = 0;  // sizes of files attempted, copied or failed
    std::uintmax_t current_file_bytes = 0;
    std::uintmax_t current_file_size = 0;
    size_t files_total = 0;
    size_t files_processed = 0;
    size_t files_copied = 0;
    size_t current_index = 0;
    size_t error_count = 0;
    std::string current_file;
};

class TransferJob {
public:
    TransferJob(const std::string &id, const std::string &project_name);

    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;

    const std::string &getId() const;
    const std::string &getProjectName() const;
    std::time_t getCreatedAt() const;
    double getElapsedSeconds() const;

    // state machine, throws on a transition the machine does not allow
    JobState getState() const;
    void transition(const JobState &next);

    // manifest can be set exactly once
    void setManifest(std::shared_ptr<const Manifest> manifest);
    std::shared_ptr<const Manifest> getManifest() const;

    void setDestination(const std::string &root, const std::string &display);
    std::string getDestinationRoot() const;
    std::string getDestination() const;

    // per file progress, only called by the engine
    void beginFile(const size_t &index);
    void updateFileProgress(const std::uintmax_t &attempt_bytes);
    void finishFile(const size_t &index, const bool &copied, const std::string &error = "");
    void markVerifying(const size_t &index);
    void markVerifyFailed(const size_t &index, const std::string &error);

    FileStatus getFileStatus(const size_t &index) const;
    std::vector<FileStatus> getFileStatuses() const;
    std::vector<std::string> getFailedFiles() const;
    JobCounters getCounters() const;

    void setLastError(const std::string &error);
    std::optional<std::string> getLastError() const;

    void requestCancel();
    bool isCancelRequested() const;

private:
    const std::string id;
    const std::string project_name;
    const std::time_t created_at;
    const std::chrono::steady_clock::time_point started;
    std::atomic<std::int64_t> finished_ms{-1};

    std::atomic<JobState> state{JobState::Idle};
    std::atomic<bool> cancel_requested{false};

    mutable std::mutex mutex;
    std::shared_ptr<const Manifest> manifest;
    std::vector<FileStatus> statuses;
    JobCounters counters;
    std::string destination_root;
    std::string destination;
    std::optional<std::string> last_error;
};

std::string generate_job_id();
