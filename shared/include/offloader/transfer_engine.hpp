#pragma once

#include "offloader/file_copier.hpp"
#include "offloader/file_enumerator.hpp"
#include "offloader/mount_manager.hpp"
#include "offloader/transfer_job.hpp"

#include <optional>
#include <string>

struct EngineSettings {
    VolumeSpec source;
    VolumeSpec destination;

    // folder on the source volume to enumerate, empty for the whole volume
    std::string source_subfolder;
    // folder under the destination mount that receives the files
    std::string destination_subfolder;

    EnumerateOptions enumerate;
    bool verify_checksums = false;
    int failure_threshold = 3;
    int copy_retries = 1;
};

class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    // called on the engine thread after the job entered state
    virtual void onStateChange(const TransferJob &job, const JobState &state) = 0;
};

// runs one job through mounting, scanning, copying and verifying
class TransferEngine {
public:
    TransferEngine(MountManager &mounts, FileCopier &copier);

    // blocks until the job reached a terminal state, never throws for job errors
    void run(TransferJob &job, const EngineSettings &settings, TransferObserver *observer = nullptr);

private:
    MountManager &mounts;
    FileCopier &copier;

    JobState execute(TransferJob &job, const EngineSettings &settings, TransferObserver *observer,
                     std::optional<MountedVolume> &source, std::optional<MountedVolume> &destination);
    void enter(TransferJob &job, const JobState &state, TransferObserver *observer);
    bool copyFiles(TransferJob &job, const EngineSettings &settings);
    bool verifyFiles(TransferJob &job);
    void releaseVolumes(std::optional<MountedVolume> &source, std::optional<MountedVolume> &destination);
};
