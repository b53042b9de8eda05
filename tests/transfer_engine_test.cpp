#include "offloader/transfer_engine.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <iomanip>
#include <sstream>

namespace {

std::string clip_name(const int &i) {
    std::ostringstream name;
    name << "clip" << std::setw(2) << std::setfill('0') << i << ".mov";
    return name.str();
}

class RecordingObserver : public TransferObserver {
public:
    void onStateChange(const TransferJob &job, const JobState &state) override {
        (void)job;
        this->states.push_back(state);
    }

    std::vector<JobState> states;
};

}

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // ten files, 1000000 bytes in total
        for (int i = 0; i < 10; ++i) {
            test::write_file(source.path / "DCIM" / clip_name(i), 100000, static_cast<char>('a' + i));
        }
        test::write_file(source.path / ".Trashes/old.mov", 10);

        settings.source.kind = VolumeKind::Source;
        settings.source.mount_point = source.str();
        settings.source.device = "/dev/sdb1";
        settings.source.read_only = true;

        settings.destination.kind = VolumeKind::Destination;
        settings.destination.mount_point = destination.str();
        settings.destination.primary_address = "100.109.23.38";
        settings.destination.secondary_address = "192.168.88.20";
        settings.destination.share_name = "archive";

        settings.destination_subfolder = "Projects/shoot";
        settings.failure_threshold = 3;
        settings.copy_retries = 1;
    }

    std::filesystem::path copied(const int &i) const {
        return destination.path / "Projects/shoot/DCIM" / clip_name(i);
    }

    void run() {
        engine.run(job, settings, &observer);
    }

    test::TempDir source;
    test::TempDir destination;
    test::FakeMountBackend backend;
    MountManager mounts{backend};
    test::ScriptedCopier copier;
    TransferEngine engine{mounts, copier};
    EngineSettings settings;
    TransferJob job{"job1", "shoot"};
    RecordingObserver observer;
};

TEST_F(TransferEngineTest, CopiesEveryFile) {
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    EXPECT_EQ(observer.states, (std::vector<JobState>{JobState::Mounting, JobState::Scanning, JobState::Copying, JobState::Completed}));

    JobCounters c = job.getCounters();
    EXPECT_EQ(c.files_total, 10u);
    EXPECT_EQ(c.files_copied, 10u);
    EXPECT_EQ(c.bytes_total, 1000000u);
    EXPECT_EQ(c.bytes_copied, 1000000u);
    EXPECT_EQ(c.error_count, 0u);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(std::filesystem::exists(copied(i))) << clip_name(i);
        EXPECT_EQ(test::read_file(copied(i)), test::read_file(source.path / "DCIM" / clip_name(i)));
    }
    EXPECT_FALSE(std::filesystem::exists(destination.path / "Projects/shoot/.Trashes"));
    EXPECT_EQ(job.getDestination(), "//100.109.23.38/archive/Projects/shoot");

    // both volumes released, source mounted read-only
    EXPECT_EQ(backend.getUnmounts().size(), 2u);
    EXPECT_TRUE(has_mount_option(backend.getMounts()[0].options, "ro"));
    EXPECT_EQ(mounts.getState(source.str()), MountState::Unmounted);
    EXPECT_EQ(mounts.getState(destination.str()), MountState::Unmounted);
}

TEST_F(TransferEngineTest, PreservesModificationTime) {
    auto mtime = std::filesystem::last_write_time(source.path / "DCIM" / clip_name(0)) - std::chrono::hours(48);
    std::filesystem::last_write_time(source.path / "DCIM" / clip_name(0), mtime);

    run();
    EXPECT_EQ(std::filesystem::last_write_time(copied(0)), mtime);
}

TEST_F(TransferEngineTest, RetriedFileIsNotAnError) {
    copier.failTimes(clip_name(1), 1);
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    EXPECT_EQ(job.getCounters().error_count, 0u);
    EXPECT_EQ(job.getFileStatus(1), FileStatus::Copied);
}

TEST_F(TransferEngineTest, IsolatedFailuresDoNotAbort) {
    copier.failTimes(clip_name(2), 2);
    copier.failTimes(clip_name(5), 2);
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    JobCounters c = job.getCounters();
    EXPECT_EQ(c.files_copied, 8u);
    EXPECT_EQ(c.error_count, 2u);
    EXPECT_EQ(c.bytes_copied, 800000u);
    EXPECT_EQ(job.getFileStatus(2), FileStatus::Failed);
    EXPECT_EQ(job.getFileStatus(5), FileStatus::Failed);
    EXPECT_EQ(job.getFailedFiles(), (std::vector<std::string>{"DCIM/" + clip_name(2), "DCIM/" + clip_name(5)}));
}

TEST_F(TransferEngineTest, ConsecutiveFailuresAbortAsSystemic) {
    // file 7 fails both attempts, file 8 fails its first -> three in a row
    copier.failTimes(clip_name(6), 2);
    copier.failTimes(clip_name(7), 5);
    run();

    EXPECT_EQ(job.getState(), JobState::Failed);
    ASSERT_TRUE(job.getLastError().has_value());
    EXPECT_TRUE(job.getLastError()->starts_with("systemic_io_error"));

    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(job.getFileStatus(i), FileStatus::Copied) << i;
    }
    EXPECT_EQ(job.getFileStatus(6), FileStatus::Failed);
    EXPECT_EQ(job.getFileStatus(7), FileStatus::Failed);
    EXPECT_EQ(job.getFileStatus(8), FileStatus::Pending);
    EXPECT_EQ(job.getFileStatus(9), FileStatus::Pending);
    EXPECT_EQ(job.getCounters().bytes_copied, 600000u);

    // nothing after the abort was attempted
    std::vector<std::string> calls = copier.getCalls();
    EXPECT_EQ(calls.back(), clip_name(7));
    EXPECT_EQ(backend.getUnmounts().size(), 2u);
}

TEST_F(TransferEngineTest, RetriesOfOneFileDoNotAbort) {
    // more attempts per file than the threshold allows in a row
    settings.copy_retries = 2;
    copier.failTimes(clip_name(2), 3);
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    EXPECT_EQ(job.getFileStatus(2), FileStatus::Failed);
    EXPECT_EQ(job.getFileStatus(3), FileStatus::Copied);
    JobCounters c = job.getCounters();
    EXPECT_EQ(c.files_copied, 9u);
    EXPECT_EQ(c.error_count, 1u);
}

TEST_F(TransferEngineTest, RunAcrossFilesStillAbortsWithManyRetries) {
    settings.copy_retries = 4;
    copier.failTimes(clip_name(2), 5);
    copier.failTimes(clip_name(3), 5);
    run();

    EXPECT_EQ(job.getState(), JobState::Failed);
    EXPECT_TRUE(job.getLastError()->starts_with("systemic_io_error"));
    EXPECT_EQ(job.getFileStatus(2), FileStatus::Failed);
    EXPECT_EQ(job.getFileStatus(3), FileStatus::Failed);
    EXPECT_EQ(job.getFileStatus(4), FileStatus::Pending);
}

TEST_F(TransferEngineTest, UnreachablePrimaryUsesFallbackAddress) {
    backend.failMount("//100.109.23.38/archive", {MountError::Kind::Unreachable});
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    EXPECT_EQ(job.getDestination(), "//192.168.88.20/archive/Projects/shoot");
}

TEST_F(TransferEngineTest, VerificationFlagsCorruptedCopy) {
    settings.verify_checksums = true;
    copier.corruptAfterCopy(clip_name(4));
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    EXPECT_EQ(observer.states, (std::vector<JobState>{JobState::Mounting, JobState::Scanning, JobState::Copying, JobState::Verifying, JobState::Completed}));
    EXPECT_EQ(job.getFileStatus(4), FileStatus::VerifyFailed);
    EXPECT_EQ(job.getFileStatus(3), FileStatus::Copied);

    JobCounters c = job.getCounters();
    EXPECT_EQ(c.error_count, 1u);
    EXPECT_EQ(c.bytes_copied, 1000000u);
    ASSERT_TRUE(job.getLastError().has_value());
    EXPECT_NE(job.getLastError()->find("verify_mismatch"), std::string::npos);
}

TEST_F(TransferEngineTest, CancelBetweenFiles) {
    copier.before_copy = [this](const std::string &name) {
        if (name == clip_name(3)) {
            this->job.requestCancel();
        }
    };
    run();

    EXPECT_EQ(job.getState(), JobState::Cancelled);
    EXPECT_EQ(job.getCounters().files_copied, 4u);
    EXPECT_EQ(job.getFileStatus(4), FileStatus::Pending);
    EXPECT_FALSE(std::filesystem::exists(copied(4)));
    EXPECT_EQ(backend.getUnmounts().size(), 2u);
}

TEST_F(TransferEngineTest, CancelWhileMounting) {
    job.requestCancel();
    run();

    EXPECT_EQ(job.getState(), JobState::Cancelled);
    EXPECT_EQ(observer.states, (std::vector<JobState>{JobState::Mounting, JobState::Cancelled}));
    EXPECT_EQ(backend.getUnmounts(), (std::vector<std::string>{source.str()}));
}

TEST_F(TransferEngineTest, SourceMountFailure) {
    backend.failMount("/dev/sdb1", {MountError::Kind::AuthFailed});
    run();

    EXPECT_EQ(job.getState(), JobState::Failed);
    EXPECT_TRUE(job.getLastError()->starts_with("auth_failed"));
    EXPECT_EQ(backend.getMounts().size(), 1u);
    EXPECT_TRUE(backend.getUnmounts().empty());
}

TEST_F(TransferEngineTest, DestinationFailureReleasesSource) {
    backend.failMount("//100.109.23.38/archive", {MountError::Kind::AuthFailed});
    run();

    EXPECT_EQ(job.getState(), JobState::Failed);
    EXPECT_TRUE(job.getLastError()->starts_with("auth_failed"));
    EXPECT_EQ(backend.getUnmounts(), (std::vector<std::string>{source.str()}));
}

TEST_F(TransferEngineTest, EmptySourceFails) {
    settings.enumerate.min_file_size = 200000;
    run();

    EXPECT_EQ(job.getState(), JobState::Failed);
    EXPECT_TRUE(job.getLastError()->starts_with("empty"));
    EXPECT_EQ(backend.getUnmounts().size(), 2u);
}

TEST_F(TransferEngineTest, DetachedVolumeStillFinishes) {
    copier.before_copy = [this](const std::string &name) {
        if (name == clip_name(9)) {
            this->backend.detach(this->source.str());
        }
    };
    run();

    EXPECT_EQ(job.getState(), JobState::Completed);
    EXPECT_EQ(mounts.getState(source.str()), MountState::Unmounted);
}
