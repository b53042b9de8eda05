#include "offloader/transfer_engine.hpp"
#include "offloader/checksum.hpp"
#include "offloader/helpers.hpp"

#include <filesystem>
#include <iostream>

TransferEngine::TransferEngine(MountManager &mounts, FileCopier &copier) : mounts(mounts), copier(copier) {
}

void TransferEngine::run(TransferJob &job, const EngineSettings &settings, TransferObserver *observer) {
    std::optional<MountedVolume> source;
    std::optional<MountedVolume> destination;
    JobState outcome = JobState::Failed;

    try {
        outcome = this->execute(job, settings, observer, source, destination);
    } catch (const MountError &e) {
        job.setLastError(e.what());
    } catch (const EnumerationError &e) {
        job.setLastError(e.what());
    } catch (const TransferError &e) {
        job.setLastError(e.what());
    } catch (const std::exception &e) {
        job.setLastError(std::string("internal_error: ") + e.what());
    }

    if (outcome == JobState::Failed) {
        std::cerr << "[engine] Job " << job.getId() << " failed: " << job.getLastError().value_or("unknown error") << std::endl;
    }

    // every terminal state releases both volumes, once
    this->releaseVolumes(source, destination);
    this->enter(job, outcome, observer);
}

JobState TransferEngine::execute(TransferJob &job, const EngineSettings &settings, TransferObserver *observer,
                                 std::optional<MountedVolume> &source, std::optional<MountedVolume> &destination) {
    namespace fs = std::filesystem;

    // mounting: source first, then destination
    this->enter(job, JobState::Mounting, observer);
    source = this->mounts.acquire(settings.source);
    if (job.isCancelRequested()) {
        return JobState::Cancelled;
    }
    destination = this->mounts.acquire(settings.destination);
    if (job.isCancelRequested()) {
        return JobState::Cancelled;
    }

    // scanning
    this->enter(job, JobState::Scanning, observer);
    EnumerateOptions options = settings.enumerate;
    options.compute_hashes = settings.verify_checksums;
    auto manifest = std::make_shared<const Manifest>(enumerate(source->mount_point, settings.source_subfolder, options));
    job.setManifest(manifest);

    fs::path root(destination->mount_point);
    std::string display = destination->source;
    if (!settings.destination_subfolder.empty()) {
        root /= settings.destination_subfolder;
        display += "/" + settings.destination_subfolder;
    }
    job.setDestination(root.string(), display);
    std::cout << "[engine] Job " << job.getId() << ": " << manifest->size() << " files ("
              << human_size(static_cast<double>(manifest->getTotalBytes())) << ") -> " << display << std::endl;
    if (job.isCancelRequested()) {
        return JobState::Cancelled;
    }

    // copying
    this->enter(job, JobState::Copying, observer);
    if (!this->copyFiles(job, settings)) {
        return JobState::Cancelled;
    }

    // verifying
    if (settings.verify_checksums) {
        if (job.isCancelRequested()) {
            return JobState::Cancelled;
        }
        this->enter(job, JobState::Verifying, observer);
        if (!this->verifyFiles(job)) {
            return JobState::Cancelled;
        }
    }
    return JobState::Completed;
}

bool TransferEngine::copyFiles(TransferJob &job, const EngineSettings &settings) {
    namespace fs = std::filesystem;

    std::shared_ptr<const Manifest> manifest = job.getManifest();
    fs::path source_root(manifest->getRoot());
    fs::path destination_root(job.getDestinationRoot());
    int threshold = settings.failure_threshold < 1 ? 1 : settings.failure_threshold;
    int attempts = settings.copy_retries < 0 ? 1 : settings.copy_retries + 1;

    // failed attempts in a row, and the file that started the run
    int consecutive_failures = 0;
    size_t run_start = 0;

    for (size_t i = 0; i < manifest->size(); ++i) {
        // cancellation is only observed between files
        if (job.isCancelRequested()) {
            std::cout << "[engine] Job " << job.getId() << " cancelled before file " << i + 1 << "/" << manifest->size() << std::endl;
            return false;
        }

        const FileEntry &entry = manifest->at(i);
        std::string source = (source_root / entry.relative_path).string();
        std::string destination = (destination_root / entry.relative_path).string();
        job.beginFile(i);

        bool copied = false;
        std::string error;
        for (int attempt = 1; attempt <= attempts && !copied; ++attempt) {
            try {
                this->copier.copy(source, destination, [&job](const std::uintmax_t &written) {
                    job.updateFileProgress(written);
                });
                copied = true;
            } catch (const std::exception &e) {
                error = e.what();
                if (consecutive_failures == 0) {
                    run_start = i;
                }
                consecutive_failures++;
                std::cerr << "[engine] Copy attempt " << attempt << "/" << attempts << " of " << entry.relative_path << " failed: " << error << std::endl;

                // a burst of failures across files means the destination is gone,
                // retries of one bad file alone never abort
                if (consecutive_failures >= threshold && run_start < i) {
                    job.finishFile(i, false, error);
                    throw TransferError(TransferError::Kind::SystemicIOError,
                        std::to_string(consecutive_failures) + " consecutive copy failures, last on " + entry.relative_path + ": " + error);
                }
            }
        }

        if (copied) {
            consecutive_failures = 0;
        }
        job.finishFile(i, copied, error);
    }
    return true;
}

bool TransferEngine::verifyFiles(TransferJob &job) {
    namespace fs = std::filesystem;

    std::shared_ptr<const Manifest> manifest = job.getManifest();
    fs::path source_root(manifest->getRoot());
    fs::path destination_root(job.getDestinationRoot());

    for (size_t i = 0; i < manifest->size(); ++i) {
        if (job.isCancelRequested()) {
            return false;
        }
        if (job.getFileStatus(i) != FileStatus::Copied) {
            continue;
        }

        const FileEntry &entry = manifest->at(i);
        job.markVerifying(i);
        try {
            std::string expected = entry.hash.empty() ? hash_file((source_root / entry.relative_path).string()) : entry.hash;
            std::string actual = hash_file((destination_root / entry.relative_path).string());
            if (expected != actual) {
                TransferError mismatch(TransferError::Kind::VerificationMismatch, "Checksum mismatch for " + entry.relative_path);
                std::cerr << "[engine] " << mismatch.what() << std::endl;
                job.markVerifyFailed(i, mismatch.what());
            }
        } catch (const std::exception &e) {
            std::cerr << "[engine] Verification of " << entry.relative_path << " failed: " << e.what() << std::endl;
            job.markVerifyFailed(i, e.what());
        }
    }
    return true;
}

void TransferEngine::releaseVolumes(std::optional<MountedVolume> &source, std::optional<MountedVolume> &destination) {
    if (destination) {
        this->mounts.release(*destination);
        destination.reset();
    }
    if (source) {
        this->mounts.release(*source);
        source.reset();
    }
}

void TransferEngine::enter(TransferJob &job, const JobState &state, TransferObserver *observer) {
    job.transition(state);
    std::cout << "[engine] Job " << job.getId() << " -> " << to_string(state) << std::endl;
    if (!observer) {
        return;
    }
    try {
        observer->onStateChange(job, state);
    } catch (const std::exception &e) {
        std::cerr << "[engine] State observer failed on " << to_string(state) << ": " << e.what() << std::endl;
    }
}
