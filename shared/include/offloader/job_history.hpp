#pragma once

#include "offloader/transfer_job.hpp"

#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// summary of a job that reached a terminal state
struct JobRecord {
    std::string id;
    std::string title;
    std::string state;
    std::time_t started_at = 0;
    std::time_t finished_at = 0;
    double duration = 0.0;
    size_t total_files = 0;
    size_t files_copied = 0;
    size_t errors = 0;
    std::uintmax_t total_bytes = 0;
    std::uintmax_t bytes_copied = 0;
    double avg_speed_bps = 0.0;
    std::string destination;
    std::string error;
    std::vector<std::string> failed_files;
};

void to_json(nlohmann::json &j, const JobRecord &record);
void from_json(const nlohmann::json &j, JobRecord &record);

JobRecord make_record(const TransferJob &job);

// bounded list of job records kept in a json file, newest last
class JobHistory {
public:
    explicit JobHistory(const std::string &path, const size_t &max_records = 50);

    // throws "history: ..." when the file cannot be written
    void append(const JobRecord &record);
    std::vector<JobRecord> load() const;
    std::optional<JobRecord> latest() const;

    const std::string &getPath() const;

private:
    std::string path;
    size_t max_records;
    mutable std::mutex mutex;

    std::vector<JobRecord> read() const;
};
