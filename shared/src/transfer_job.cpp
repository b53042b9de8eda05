#include "offloader/transfer_job.hpp"
#include "offloader/checksum.hpp"

#include <stdexcept>

std::string to_string(const JobState &state) {
    switch (state) {
        case JobState::Idle: return "idle";
        case JobState::Mounting: return "mounting";
        case JobState::Scanning: return "scanning";
        case JobState::Copying: return "copying";
        case JobState::Verifying: return "verifying";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string to_string(const FileStatus &status) {
    switch (status) {
        case FileStatus::Pending: return "pending";
        case FileStatus::Copying: return "copying";
        case FileStatus::Copied: return "copied";
        case FileStatus::VerifyFailed: return "verify_failed";
        case FileStatus::Failed: return "failed";
    }
    return "unknown";
}

bool is_terminal(const JobState &state) {
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
}

bool can_transition(const JobState &from, const JobState &to) {
    switch (from) {
        case JobState::Idle:
            return to == JobState::Mounting;
        case JobState::Mounting:
            return to == JobState::Scanning || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Scanning:
            return to == JobState::Copying || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Copying:
            return to == JobState::Verifying || to == JobState::Completed || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Verifying:
            return to == JobState::Completed || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Completed:
        case JobState::Failed:
        case JobState::Cancelled:
            return false;
    }
    return false;
}

std::string generate_job_id() {
    return random_hex(8);
}

TransferJob::TransferJob(const std::string &id, const std::string &project_name)
    : id(id), project_name(project_name), created_at(std::time(nullptr)), started(std::chrono::steady_clock::now()) {
}

const std::string &TransferJob::getId() const {
    return this->id;
}

const std::string &TransferJob::getProjectName() const {
    return this->project_name;
}

std::time_t TransferJob::getCreatedAt() const {
    return this->created_at;
}

double TransferJob::getElapsedSeconds() const {
    std::int64_t finished = this->finished_ms.load();
    if (finished >= 0) {
        return static_cast<double>(finished) / 1000.0;
    }
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - this->started).count();
}

JobState TransferJob::getState() const {
    return this->state.load();
}

void TransferJob::transition(const JobState &next) {
    JobState current = this->state.load();
    if (!can_transition(current, next)) {
        throw std::logic_error("invalid_transition: " + to_string(current) + " -> " + to_string(next));
    }
    if (is_terminal(next)) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - this->started);
        this->finished_ms.store(elapsed.count());
    }
    this->state.store(next);
}

void TransferJob::setManifest(std::shared_ptr<const Manifest> manifest) {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->manifest) {
        throw std::logic_error("manifest_set: Manifest of job " + this->id + " is immutable");
    }
    this->manifest = std::move(manifest);
    this->statuses.assign(this->manifest->size(), FileStatus::Pending);
    this->counters = JobCounters{};
    this->counters.bytes_total = this->manifest->getTotalBytes();
    this->counters.files_total = this->manifest->size();
}

std::shared_ptr<const Manifest> TransferJob::getManifest() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->manifest;
}

void TransferJob::setDestination(const std::string &root, const std::string &display) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->destination_root = root;
    this->destination = display;
}

std::string TransferJob::getDestinationRoot() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->destination_root;
}

std::string TransferJob::getDestination() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->destination;
}

void TransferJob::beginFile(const size_t &index) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->statuses.at(index) = FileStatus::Copying;
    this->counters.current_index = index;
    this->counters.current_file = this->manifest->at(index).relative_path;
    this->counters.current_file_size = this->manifest->at(index).size;
    this->counters.current_file_bytes = 0;
}

void TransferJob::updateFileProgress(const std::uintmax_t &attempt_bytes) {
    std::lock_guard<std::mutex> lock(this->mutex);
    // a retried attempt restarts from zero, progress does not go back
    if (attempt_bytes > this->counters.current_file_bytes) {
        this->counters.current_file_bytes = attempt_bytes < this->counters.current_file_size ? attempt_bytes : this->counters.current_file_size;
    }
}

void TransferJob::finishFile(const size_t &index, const bool &copied, const std::string &error) {
    std::lock_guard<std::mutex> lock(this->mutex);
    const FileEntry &entry = this->manifest->at(index);
    if (copied) {
        this->statuses.at(index) = FileStatus::Copied;
        this->counters.bytes_copied += entry.size;
        this->counters.files_copied++;
    } else {
        this->statuses.at(index) = FileStatus::Failed;
        this->counters.error_count++;
        this->last_error = entry.relative_path + ": " + error;
    }
    this->counters.bytes_processed += entry.size;
    this->counters.files_processed++;
    this->counters.current_file_bytes = 0;
}

void TransferJob::markVerifying(const size_t &index) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->counters.current_index = index;
    this->counters.current_file = this->manifest->at(index).relative_path;
    this->counters.current_file_size = this->manifest->at(index).size;
    this->counters.current_file_bytes = 0;
}

void TransferJob::markVerifyFailed(const size_t &index, const std::string &error) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->statuses.at(index) = FileStatus::VerifyFailed;
    this->counters.error_count++;
    this->last_error = this->manifest->at(index).relative_path + ": " + error;
}

FileStatus TransferJob::getFileStatus(const size_t &index) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->statuses.at(index);
}

std::vector<FileStatus> TransferJob::getFileStatuses() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->statuses;
}

std::vector<std::string> TransferJob::getFailedFiles() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<std::string> failed;
    for (size_t i = 0; i < this->statuses.size(); ++i) {
        if (this->statuses[i] == FileStatus::Failed || this->statuses[i] == FileStatus::VerifyFailed) {
            failed.push_back(this->manifest->at(i).relative_path);
        }
    }
    return failed;
}

JobCounters TransferJob::getCounters() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->counters;
}

void TransferJob::setLastError(const std::string &error) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->last_error = error;
}

std::optional<std::string> TransferJob::getLastError() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->last_error;
}

void TransferJob::requestCancel() {
    this->cancel_requested.store(true);
}

bool TransferJob::isCancelRequested() const {
    return this->cancel_requested.load();
}
