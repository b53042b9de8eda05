#include "offloader/job_history.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

void to_json(nlohmann::json &j, const JobRecord &record) {
    j = nlohmann::json{
        {"id", record.id},
        {"title", record.title},
        {"state", record.state},
        {"started_at", record.started_at},
        {"finished_at", record.finished_at},
        {"duration", record.duration},
        {"total_files", record.total_files},
        {"files_copied", record.files_copied},
        {"errors", record.errors},
        {"total_bytes", record.total_bytes},
        {"bytes_copied", record.bytes_copied},
        {"avg_speed_bps", record.avg_speed_bps},
        {"destination", record.destination},
        {"error", record.error},
        {"failed_files", record.failed_files}
    };
}

void from_json(const nlohmann::json &j, JobRecord &record) {
    record.id = j.value("id", std::string());
    record.title = j.value("title", std::string());
    record.state = j.value("state", std::string());
    record.started_at = j.value("started_at", static_cast<std::time_t>(0));
    record.finished_at = j.value("finished_at", static_cast<std::time_t>(0));
    record.duration = j.value("duration", 0.0);
    record.total_files = j.value("total_files", static_cast<size_t>(0));
    record.files_copied = j.value("files_copied", static_cast<size_t>(0));
    record.errors = j.value("errors", static_cast<size_t>(0));
    record.total_bytes = j.value("total_bytes", static_cast<std::uintmax_t>(0));
    record.bytes_copied = j.value("bytes_copied", static_cast<std::uintmax_t>(0));
    record.avg_speed_bps = j.value("avg_speed_bps", 0.0);
    record.destination = j.value("destination", std::string());
    record.error = j.value("error", std::string());
    record.failed_files = j.value("failed_files", std::vector<std::string>());
}

JobRecord make_record(const TransferJob &job) {
    JobCounters counters = job.getCounters();

    JobRecord record;
    record.id = job.getId();
    record.title = job.getProjectName();
    record.state = to_string(job.getState());
    record.started_at = job.getCreatedAt();
    record.duration = job.getElapsedSeconds();
    record.finished_at = record.started_at + static_cast<std::time_t>(record.duration);
    record.total_files = counters.files_total;
    record.files_copied = counters.files_copied;
    record.errors = counters.error_count;
    record.total_bytes = counters.bytes_total;
    record.bytes_copied = counters.bytes_copied;
    record.avg_speed_bps = record.duration > 0.0 ? static_cast<double>(counters.bytes_copied) / record.duration : 0.0;
    record.destination = job.getDestination();
    record.error = job.getLastError().value_or("");
    record.failed_files = job.getFailedFiles();
    return record;
}

JobHistory::JobHistory(const std::string &path, const size_t &max_records) : path(path), max_records(max_records) {
    if (this->max_records == 0) {
        this->max_records = 1;
    }
}

const std::string &JobHistory::getPath() const {
    return this->path;
}

std::vector<JobRecord> JobHistory::read() const {
    // missing file means no history yet
    if (!std::filesystem::exists(this->path)) {
        return {};
    }

    std::ifstream file(this->path);
    if (!file.is_open()) {
        std::cerr << "[history] Could not open " << this->path << " for reading" << std::endl;
        return {};
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            std::cerr << "[history] Ignoring " << this->path << ": not a list of records" << std::endl;
            return {};
        }
        return j.get<std::vector<JobRecord>>();
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "[history] Ignoring unreadable " << this->path << ": " << e.what() << std::endl;
        return {};
    }
}

void JobHistory::append(const JobRecord &record) {
    std::lock_guard<std::mutex> lock(this->mutex);

    std::vector<JobRecord> records = this->read();
    records.push_back(record);
    if (records.size() > this->max_records) {
        records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(this->max_records));
    }

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(this->path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    // write next to the file and rename over it
    std::string tmp_path = this->path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("history: Could not open " + tmp_path + " for writing");
        }
        file << nlohmann::json(records).dump(2);
        if (!file) {
            throw std::runtime_error("history: Could not write " + tmp_path);
        }
    }
    std::filesystem::rename(tmp_path, this->path, ec);
    if (ec) {
        throw std::runtime_error("history: Could not replace " + this->path + " (" + ec.message() + ")");
    }
}

std::vector<JobRecord> JobHistory::load() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->read();
}

std::optional<JobRecord> JobHistory::latest() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<JobRecord> records = this->read();
    if (records.empty()) {
        return std::nullopt;
    }
    return records.back();
}
