#include "offloader/transfer_service.hpp"
#include "offloader/helpers.hpp"

#include <condition_variable>
#include <filesystem>
#include <iostream>

std::shared_ptr<NotificationSink> make_webhook_sink(const Config &config) {
    if (config.discord_webhook.empty()) {
        return nullptr;
    }
    return std::make_shared<WebhookSink>(config.discord_webhook, config.webhook_timeout_ms);
}

TransferService::TransferService(const std::string &config_path, MountBackend &backend, FileCopier &copier,
                                 DriveDetector detect_drives, SinkFactory make_sink)
    : config_path(config_path),
      config(load_config(config_path)),
      mounts(backend),
      engine(this->mounts, copier),
      detect_drives(std::move(detect_drives)),
      make_sink(std::move(make_sink)),
      job_history(this->config.history_file),
      tracker(this->config.throughput_smoothing) {
    this->last_record = this->job_history.latest();
    this->broadcaster.publish(ProgressSnapshot{});
}

TransferService::~TransferService() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(this->job_mutex);
        if (this->job && !is_terminal(this->job->getState())) {
            std::cout << "[service] Cancelling job " << this->job->getId() << " on shutdown" << std::endl;
            this->job->requestCancel();
        }
        finished = std::move(this->worker);
    }
    if (finished.joinable()) {
        finished.join();
    }
    this->dispatcher.flush();
}

std::string TransferService::start(const std::string &project_name, const StartOptions &options) {
    if (project_name.empty()) {
        throw std::runtime_error("invalid_argument: Project name must not be empty");
    }
    if (project_name.find('/') != std::string::npos || project_name == "." || project_name == "..") {
        throw std::runtime_error("invalid_argument: Project name must be a plain folder name");
    }

    // configuration is read once per job, the running job keeps its copy
    Config config;
    {
        std::lock_guard<std::mutex> lock(this->config_mutex);
        this->config = load_config(this->config_path);
        config = this->config;
    }
    EngineSettings settings = this->makeSettings(config, project_name, options);

    std::lock_guard<std::mutex> lock(this->job_mutex);
    if (this->job) {
        if (!is_terminal(this->job->getState())) {
            throw std::runtime_error("job_active: Job " + this->job->getId() + " is still running");
        }
        throw std::runtime_error("job_not_cleared: Job " + this->job->getId() + " has finished but was not cleared");
    }

    auto job = std::make_shared<TransferJob>(generate_job_id(), project_name);
    this->tracker.reset();
    this->tracker.setSmoothing(config.throughput_smoothing);
    this->dispatcher.beginJob(job->getId(), config.discord_notify_milestones, this->make_sink ? this->make_sink(config) : nullptr);
    this->broadcaster.publish(this->tracker.peek(*job));

    this->job = job;
    this->worker = std::thread(&TransferService::runJob, this, job, settings, config.sample_interval_ms);
    std::cout << "[service] Started job " << job->getId() << " (" << project_name << ")" << std::endl;
    return job->getId();
}

bool TransferService::cancel() {
    std::lock_guard<std::mutex> lock(this->job_mutex);
    if (!this->job || is_terminal(this->job->getState())) {
        return false;
    }
    std::cout << "[service] Cancel requested for job " << this->job->getId() << std::endl;
    this->job->requestCancel();
    return true;
}

void TransferService::clear() {
    std::shared_ptr<TransferJob> cleared;
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(this->job_mutex);
        if (!this->job) {
            return;
        }
        if (!is_terminal(this->job->getState())) {
            throw std::runtime_error("job_active: Job " + this->job->getId() + " is still running");
        }
        cleared = this->job;
        finished = std::move(this->worker);
    }

    // worker may still be finishing its record, the slot stays taken until it is done
    if (finished.joinable()) {
        finished.join();
    }

    std::lock_guard<std::mutex> lock(this->job_mutex);
    if (this->job != cleared) {
        return;
    }
    std::cout << "[service] Cleared job " << cleared->getId() << std::endl;
    this->job.reset();
    this->tracker.reset();
    this->broadcaster.publish(ProgressSnapshot{});
}

ProgressSnapshot TransferService::current() const {
    return this->broadcaster.current();
}

StatusBroadcaster::Subscription TransferService::subscribe() const {
    return this->broadcaster.subscribe();
}

std::optional<JobRecord> TransferService::lastRecord() const {
    std::lock_guard<std::mutex> lock(this->job_mutex);
    return this->last_record;
}

std::vector<JobRecord> TransferService::history() const {
    return this->job_history.load();
}

std::vector<DriveInfo> TransferService::detectDrives() const {
    return this->detect_drives ? this->detect_drives() : std::vector<DriveInfo>{};
}

Manifest TransferService::listFiles(const StartOptions &options) {
    EngineSettings settings = this->makeSettings(this->getConfig(), "", options);
    settings.source.device = this->resolveDevice(settings.source.device);
    settings.enumerate.selection.clear();

    std::unique_lock<std::mutex> lock = this->lockIdleSlot();
    MountedVolume volume = this->mounts.acquire(settings.source);
    try {
        Manifest manifest = enumerate(volume.mount_point, settings.source_subfolder, settings.enumerate);
        this->mounts.release(volume);
        return manifest;
    } catch (const EnumerationError &e) {
        this->mounts.release(volume);
        if (e.getKind() != EnumerationError::Kind::Empty) {
            throw;
        }
        // nothing to offer is a valid listing
        return Manifest(volume.mount_point, {});
    } catch (const std::exception &) {
        this->mounts.release(volume);
        throw;
    }
}

SpeedTestResult TransferService::speedTest() {
    Config config = this->getConfig();
    EngineSettings settings = this->makeSettings(config, "", StartOptions{});

    std::unique_lock<std::mutex> lock = this->lockIdleSlot();
    MountedVolume volume = this->mounts.acquire(settings.destination);
    try {
        SpeedTestResult result = measure_write_speed(volume.mount_point, config.speed_test_size);
        result.destination = volume.source;
        this->mounts.release(volume);
        return result;
    } catch (const std::exception &) {
        this->mounts.release(volume);
        throw;
    }
}

Config TransferService::getConfig() const {
    std::lock_guard<std::mutex> lock(this->config_mutex);
    return this->config;
}

void TransferService::updateConfig(const nlohmann::json &update) {
    std::lock_guard<std::mutex> lock(this->config_mutex);
    Config updated = this->config;
    update_config(updated, update);
    save_config(this->config_path, updated);
    this->config = updated;
    std::cout << "[config] Saved " << this->config_path << std::endl;
}

void TransferService::flushNotifications() {
    this->dispatcher.flush();
}

std::unique_lock<std::mutex> TransferService::lockIdleSlot() const {
    std::unique_lock<std::mutex> lock(this->job_mutex);
    if (this->job && !is_terminal(this->job->getState())) {
        throw std::runtime_error("job_active: Job " + this->job->getId() + " is using the volumes");
    }
    return lock;
}

std::string TransferService::resolveDevice(const std::string &device) const {
    if (!device.empty()) {
        return device;
    }
    try {
        std::vector<DriveInfo> drives = this->detectDrives();
        if (!drives.empty()) {
            std::cout << "[service] Using drive " << drives.front().device << " (" << drives.front().model << ")" << std::endl;
            return drives.front().device;
        }
    } catch (const std::exception &e) {
        std::cerr << "[service] Drive detection failed: " << e.what() << std::endl;
    }
    return "";
}

EngineSettings TransferService::makeSettings(const Config &config, const std::string &project_name, const StartOptions &options) const {
    EngineSettings settings;

    // removable drive, never written to
    settings.source.kind = VolumeKind::Source;
    settings.source.mount_point = config.usb_mount;
    settings.source.device = options.device;
    settings.source.read_only = true;
    settings.source.attempts = config.mount_retries;
    settings.source.retry_delay = std::chrono::milliseconds(config.mount_retry_delay_ms);

    // network share
    settings.destination.kind = VolumeKind::Destination;
    settings.destination.mount_point = config.nas_mount;
    settings.destination.primary_address = primary_address(config);
    settings.destination.secondary_address = secondary_address(config);
    settings.destination.share_name = config.share_name;
    settings.destination.username = config.smb_username;
    settings.destination.password = config.smb_password;
    settings.destination.protocol_version = config.smb_version;
    settings.destination.read_only = false;

    settings.source_subfolder = options.source_subfolder;
    settings.destination_subfolder = config.subfolder.empty()
        ? project_name
        : (std::filesystem::path(config.subfolder) / project_name).string();

    settings.enumerate.skip_hidden = config.skip_hidden;
    settings.enumerate.min_file_size = config.min_file_size;
    settings.enumerate.selection = options.files;
    settings.verify_checksums = config.verify_checksums;
    settings.failure_threshold = config.failure_threshold;
    settings.copy_retries = config.copy_retries;
    return settings;
}

void TransferService::runJob(std::shared_ptr<TransferJob> job, EngineSettings settings, long sample_interval_ms) {
    settings.source.device = this->resolveDevice(settings.source.device);

    // periodic progress samples while the engine runs
    std::mutex sampler_mutex;
    std::condition_variable sampler_wakeup;
    bool sampler_stop = false;
    std::thread sampler([&]() {
        std::unique_lock<std::mutex> lock(sampler_mutex);
        while (!sampler_wakeup.wait_for(lock, std::chrono::milliseconds(sample_interval_ms), [&]() { return sampler_stop; })) {
            ProgressSnapshot snapshot = this->tracker.sample(*job);
            if (is_terminal(snapshot.state)) {
                continue;
            }
            if (this->broadcaster.publish(snapshot)) {
                this->dispatcher.onProgress(snapshot);
            }
        }
    });

    this->engine.run(*job, settings, this);

    {
        std::lock_guard<std::mutex> lock(sampler_mutex);
        sampler_stop = true;
    }
    sampler_wakeup.notify_all();
    sampler.join();

    this->finalize(*job);
}

void TransferService::finalize(TransferJob &job) {
    ProgressSnapshot final_snapshot = this->tracker.sample(job);

    // milestones first so 100% never arrives after the completion message
    if (final_snapshot.state == JobState::Completed) {
        this->dispatcher.onProgress(final_snapshot);
        this->dispatcher.notify(make_event(NotificationEvent::Kind::Completed, final_snapshot));
    } else if (final_snapshot.state == JobState::Failed) {
        this->dispatcher.notify(make_event(NotificationEvent::Kind::Failed, final_snapshot));
    }

    JobRecord record = make_record(job);
    try {
        this->job_history.append(record);
    } catch (const std::exception &e) {
        std::cerr << "[service] Could not record job " << job.getId() << ": " << e.what() << std::endl;
    }
    {
        std::lock_guard<std::mutex> lock(this->job_mutex);
        this->last_record = record;
    }

    this->broadcaster.publish(final_snapshot);
    std::cout << "[service] Job " << job.getId() << " finished: " << record.state << ", "
              << record.files_copied << "/" << record.total_files << " files, "
              << human_size(static_cast<double>(record.bytes_copied)) << " in " << format_duration(record.duration) << std::endl;
}

void TransferService::onStateChange(const TransferJob &job, const JobState &state) {
    // terminal snapshot is published once the record exists
    if (is_terminal(state)) {
        return;
    }
    ProgressSnapshot snapshot = this->tracker.peek(job);
    this->broadcaster.publish(snapshot);
    if (state == JobState::Copying) {
        this->dispatcher.notify(make_event(NotificationEvent::Kind::Started, snapshot));
    }
}
