#pragma once

#include "offloader/config.hpp"
#include "offloader/drive_detector.hpp"
#include "offloader/file_copier.hpp"
#include "offloader/job_history.hpp"
#include "offloader/mount_manager.hpp"
#include "offloader/notification.hpp"
#include "offloader/progress_tracker.hpp"
#include "offloader/speed_test.hpp"
#include "offloader/status_broadcaster.hpp"
#include "offloader/transfer_engine.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

struct StartOptions {
    // block device of the source drive, first detected usb drive when empty
    std::string device;
    std::string source_subfolder;
    // relative paths to copy, everything when empty
    std::vector<std::string> files;
};

using DriveDetector = std::function<std::vector<DriveInfo>()>;
using SinkFactory = std::function<std::shared_ptr<NotificationSink>(const Config &)>;

// webhook sink for the configured url, nullptr when notifications are off
std::shared_ptr<NotificationSink> make_webhook_sink(const Config &config);

// owns the single job slot of the appliance and wires engine, tracker, notifications and status together
class TransferService : private TransferObserver {
public:
    TransferService(const std::string &config_path, MountBackend &backend, FileCopier &copier,
                    DriveDetector detect_drives = find_usb_drives, SinkFactory make_sink = make_webhook_sink);
    ~TransferService();

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    // returns the job id, throws "job_active: ..." or "job_not_cleared: ..." while the slot is taken
    std::string start(const std::string &project_name, const StartOptions &options = {});
    // false when no job is running
    bool cancel();
    // acknowledges a terminal job, throws "job_active: ..." while it still runs
    void clear();

    ProgressSnapshot current() const;
    StatusBroadcaster::Subscription subscribe() const;

    std::optional<JobRecord> lastRecord() const;
    std::vector<JobRecord> history() const;
    std::vector<DriveInfo> detectDrives() const;

    // mounts the drive read-only, lists what START would copy and releases it again
    // device and source_subfolder of options apply, the file selection does not
    Manifest listFiles(const StartOptions &options = {});
    // write test against the mounted share, both throw "job_active: ..." while a job runs
    SpeedTestResult speedTest();

    Config getConfig() const;
    // merges and saves, applies to the next job
    void updateConfig(const nlohmann::json &update);

    void flushNotifications();

private:
    std::string config_path;
    mutable std::mutex config_mutex;
    Config config;

    MountManager mounts;
    TransferEngine engine;
    DriveDetector detect_drives;
    SinkFactory make_sink;

    JobHistory job_history;
    ProgressTracker tracker;
    StatusBroadcaster broadcaster;
    NotificationDispatcher dispatcher;

    mutable std::mutex job_mutex;
    std::shared_ptr<TransferJob> job;
    std::optional<JobRecord> last_record;
    std::thread worker;

    std::unique_lock<std::mutex> lockIdleSlot() const;
    std::string resolveDevice(const std::string &device) const;
    EngineSettings makeSettings(const Config &config, const std::string &project_name, const StartOptions &options) const;
    void runJob(std::shared_ptr<TransferJob> job, EngineSettings settings, long sample_interval_ms);
    void finalize(TransferJob &job);
    void onStateChange(const TransferJob &job, const JobState &state) override;
};
