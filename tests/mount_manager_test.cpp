#include "offloader/mount_manager.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace {

VolumeSpec share_spec() {
    VolumeSpec spec;
    spec.kind = VolumeKind::Destination;
    spec.mount_point = "/mnt/offloader/nas";
    spec.primary_address = "100.109.23.38";
    spec.secondary_address = "192.168.88.20";
    spec.share_name = "archive";
    spec.username = "camera";
    spec.password = "pw";
    return spec;
}

VolumeSpec drive_spec() {
    VolumeSpec spec;
    spec.kind = VolumeKind::Source;
    spec.mount_point = "/mnt/offloader/usb";
    spec.device = "/dev/sdb1";
    spec.read_only = true;
    return spec;
}

}

class MountManagerTest : public ::testing::Test {
protected:
    test::FakeMountBackend backend;
    MountManager manager{backend};
};

TEST_F(MountManagerTest, MountsShareAtPrimaryAddress) {
    MountedVolume volume = manager.acquire(share_spec());
    EXPECT_EQ(volume.address, "100.109.23.38");
    EXPECT_EQ(volume.source, "//100.109.23.38/archive");
    EXPECT_FALSE(volume.reused);
    EXPECT_EQ(manager.getState("/mnt/offloader/nas"), MountState::Mounted);

    std::vector<MountRequest> mounts = backend.getMounts();
    ASSERT_EQ(mounts.size(), 1u);
    EXPECT_EQ(mounts[0].fstype, "cifs");
    EXPECT_TRUE(has_mount_option(mounts[0].options, "vers=3.0"));
    EXPECT_FALSE(has_mount_option(mounts[0].options, "ro"));
    EXPECT_FALSE(has_mount_option(mounts[0].options, "guest"));
}

TEST_F(MountManagerTest, PasswordNeverInMountOptions) {
    VolumeSpec spec = share_spec();
    spec.password = "se,cret";
    manager.acquire(spec);

    std::vector<MountRequest> mounts = backend.getMounts();
    ASSERT_EQ(mounts.size(), 1u);
    EXPECT_EQ(mounts[0].options.find("se,cret"), std::string::npos);
    EXPECT_EQ(mounts[0].options.find("password"), std::string::npos);
    EXPECT_EQ(mounts[0].username, "camera");
    EXPECT_EQ(mounts[0].password, "se,cret");
}

TEST_F(MountManagerTest, GuestShareWithoutUsername) {
    VolumeSpec spec = share_spec();
    spec.username.clear();
    spec.password.clear();
    manager.acquire(spec);

    EXPECT_TRUE(has_mount_option(backend.getMounts()[0].options, "guest"));
    EXPECT_TRUE(backend.getMounts()[0].username.empty());
}

TEST(CredentialsFile, PrivateFileRemovedOnDestruction) {
    test::TempDir dir;
    std::string path;
    {
        CredentialsFile credentials("camera", "se,cret", dir.str());
        path = credentials.getPath();
        ASSERT_TRUE(std::filesystem::exists(path));
        EXPECT_EQ(test::read_file(path), "username=camera\npassword=se,cret\n");

        std::filesystem::perms perms = std::filesystem::status(path).permissions();
        EXPECT_EQ(perms & std::filesystem::perms::all, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(CredentialsFile, MissingDirectoryIsMountError) {
    EXPECT_THROW(CredentialsFile("camera", "pw", "/nonexistent/offloader"), MountError);
}

TEST_F(MountManagerTest, UnreachablePrimaryFallsBackToSecondary) {
    backend.failMount("//100.109.23.38/archive", {MountError::Kind::Unreachable});

    MountedVolume volume = manager.acquire(share_spec());
    EXPECT_EQ(volume.address, "192.168.88.20");
    EXPECT_EQ(backend.getMounts().size(), 2u);
    EXPECT_TRUE(backend.isMounted("/mnt/offloader/nas"));
}

TEST_F(MountManagerTest, AuthFailureDoesNotTryFallback) {
    backend.failMount("//100.109.23.38/archive", {MountError::Kind::AuthFailed});

    try {
        manager.acquire(share_spec());
        FAIL() << "expected auth_failed";
    } catch (const MountError &e) {
        EXPECT_EQ(e.getKind(), MountError::Kind::AuthFailed);
    }
    EXPECT_EQ(backend.getMounts().size(), 1u);
    EXPECT_EQ(manager.getState("/mnt/offloader/nas"), MountState::MountFailed);
}

TEST_F(MountManagerTest, BothAddressesUnreachable) {
    backend.failMount("//100.109.23.38/archive", {MountError::Kind::Unreachable});
    backend.failMount("//192.168.88.20/archive", {MountError::Kind::Unreachable});

    try {
        manager.acquire(share_spec());
        FAIL() << "expected unreachable";
    } catch (const MountError &e) {
        EXPECT_EQ(e.getKind(), MountError::Kind::Unreachable);
    }
    EXPECT_FALSE(backend.isMounted("/mnt/offloader/nas"));
}

TEST_F(MountManagerTest, ExistingMountFromFallbackAddressIsReused) {
    backend.preMount({"//192.168.88.20/archive", "/mnt/offloader/nas", "cifs", "rw,vers=3.0"});

    MountedVolume volume = manager.acquire(share_spec());
    EXPECT_TRUE(volume.reused);
    EXPECT_EQ(volume.address, "192.168.88.20");
    EXPECT_TRUE(backend.getMounts().empty());
}

TEST_F(MountManagerTest, ForeignMountIsReplaced) {
    backend.preMount({"//10.0.0.9/other", "/mnt/offloader/nas", "cifs", "rw"});

    MountedVolume volume = manager.acquire(share_spec());
    EXPECT_FALSE(volume.reused);
    EXPECT_EQ(backend.getUnmounts(), (std::vector<std::string>{"/mnt/offloader/nas"}));
    EXPECT_EQ(backend.findMount("/mnt/offloader/nas")->source, "//100.109.23.38/archive");
}

TEST_F(MountManagerTest, BusyMountIsForcedAndRetriedOnce) {
    backend.failMount("//100.109.23.38/archive", {MountError::Kind::Busy});

    MountedVolume volume = manager.acquire(share_spec());
    EXPECT_EQ(volume.address, "100.109.23.38");
    EXPECT_EQ(backend.getMounts().size(), 2u);
    EXPECT_EQ(backend.getUnmounts().size(), 1u);
}

TEST_F(MountManagerTest, SourceIsAlwaysReadOnly) {
    VolumeSpec spec = drive_spec();
    spec.read_only = false;

    manager.acquire(spec);
    std::vector<MountRequest> mounts = backend.getMounts();
    ASSERT_EQ(mounts.size(), 1u);
    EXPECT_EQ(mounts[0].source, "/dev/sdb1");
    EXPECT_TRUE(has_mount_option(mounts[0].options, "ro"));
}

TEST_F(MountManagerTest, SourceWritableMountIsNotReused) {
    backend.preMount({"/dev/sdb1", "/mnt/offloader/usb", "exfat", "rw,relatime"});

    MountedVolume volume = manager.acquire(drive_spec());
    EXPECT_FALSE(volume.reused);
    EXPECT_TRUE(has_mount_option(backend.findMount("/mnt/offloader/usb")->options, "ro"));
}

TEST_F(MountManagerTest, SourceMountIsRetried) {
    VolumeSpec spec = drive_spec();
    spec.attempts = 3;
    spec.retry_delay = std::chrono::milliseconds(1);
    backend.failMount("/dev/sdb1", {MountError::Kind::NotFound, MountError::Kind::NotFound});

    MountedVolume volume = manager.acquire(spec);
    EXPECT_EQ(volume.source, "/dev/sdb1");
    EXPECT_EQ(backend.getMounts().size(), 3u);
}

TEST_F(MountManagerTest, MissingDeviceIsNotFound) {
    VolumeSpec spec = drive_spec();
    spec.device = "";
    try {
        manager.acquire(spec);
        FAIL() << "expected not_found";
    } catch (const MountError &e) {
        EXPECT_EQ(e.getKind(), MountError::Kind::NotFound);
    }
}

TEST_F(MountManagerTest, ReleaseIsLazyAndIdempotent) {
    MountedVolume volume = manager.acquire(share_spec());

    manager.release(volume);
    manager.release(volume);
    EXPECT_EQ(backend.getUnmounts().size(), 1u);
    EXPECT_EQ(backend.getLazyFlags(), (std::vector<bool>{true}));
    EXPECT_EQ(manager.getState("/mnt/offloader/nas"), MountState::Unmounted);
}

TEST_F(MountManagerTest, DetachedVolumeReleaseDoesNotThrow) {
    MountedVolume volume = manager.acquire(drive_spec());
    backend.detach("/mnt/offloader/usb");

    EXPECT_NO_THROW(manager.release(volume));
    EXPECT_EQ(manager.getState("/mnt/offloader/usb"), MountState::Unmounted);
}

TEST(MountParsing, ParsesProcMountsWithEscapes) {
    std::istringstream in(
        "/dev/sda1 / ext4 rw,relatime 0 0\n"
        "//192.168.88.20/archive /mnt/offloader/nas cifs rw,vers=3.0 0 0\n"
        "/dev/sdb1 /media/CAM\\040CARD exfat ro 0 0\n"
        "broken\n");
    std::vector<MountEntry> entries = parse_mounts(in);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].fstype, "cifs");
    EXPECT_EQ(entries[2].mount_point, "/media/CAM CARD");
}

TEST(MountParsing, ClassifiesMountFailures) {
    EXPECT_EQ(classify_mount_failure("mount error(13): Permission denied"), MountError::Kind::AuthFailed);
    EXPECT_EQ(classify_mount_failure("mount error(16): Device or resource busy"), MountError::Kind::Busy);
    EXPECT_EQ(classify_mount_failure("mount: /dev/sdz1: special device does not exist."), MountError::Kind::NotFound);
    EXPECT_EQ(classify_mount_failure("mount error(113): could not connect to 100.109.23.38"), MountError::Kind::Unreachable);
    EXPECT_EQ(classify_mount_failure("mount error(112): Host is down"), MountError::Kind::Unreachable);
}

TEST(MountParsing, HasMountOption) {
    EXPECT_TRUE(has_mount_option("rw,ro,vers=3.0", "ro"));
    EXPECT_FALSE(has_mount_option("rw,errors=remount-ro", "ro"));
}
