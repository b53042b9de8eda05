#pragma once

#include "offloader/errors.hpp"

#include <chrono>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class VolumeKind {
    Source,
    Destination
};

enum class MountState {
    Unmounted,
    Mounting,
    Mounted,
    MountFailed
};

std::string to_string(const VolumeKind &kind);
std::string to_string(const MountState &state);

// what to mount and where
struct VolumeSpec {
    VolumeKind kind = VolumeKind::Source;
    std::string mount_point;

    // source: block device of the removable drive
    std::string device;

    // destination: SMB share, tried at primary then secondary address
    std::string primary_address;
    std::string secondary_address;
    std::string share_name;
    std::string username;
    std::string password;
    std::string protocol_version = "3.0";

    bool read_only = false;
    int attempts = 1;
    std::chrono::milliseconds retry_delay{0};
};

struct MountedVolume {
    VolumeKind kind = VolumeKind::Source;
    std::string mount_point;
    std::string source;
    std::string address;
    bool reused = false;
};

// one line of /proc/mounts
struct MountEntry {
    std::string source;
    std::string mount_point;
    std::string fstype;
    std::string options;
};

struct MountRequest {
    std::string source;
    std::string mount_point;
    std::string fstype;
    std::string options;
    // share login, passed to mount through a credentials file and never in options
    std::string username;
    std::string password;
};

// private file in cifs credentials format, removed again when destroyed
class CredentialsFile {
public:
    // throws MountError when the file cannot be written
    CredentialsFile(const std::string &username, const std::string &password, const std::string &directory = "");
    ~CredentialsFile();

    CredentialsFile(const CredentialsFile&) = delete;
    CredentialsFile& operator=(const CredentialsFile&) = delete;

    const std::string &getPath() const;

private:
    std::string path;
};

// system side of mounting, swapped out in tests
class MountBackend {
public:
    virtual ~MountBackend() = default;

    virtual std::optional<MountEntry> findMount(const std::string &mount_point) = 0;
    // both throw MountError
    virtual void mount(const MountRequest &request) = 0;
    virtual void unmount(const std::string &mount_point, const bool &lazy) = 0;
};

class SystemMountBackend : public MountBackend {
public:
    explicit SystemMountBackend(const bool &use_sudo, const std::string &mounts_file = "/proc/mounts");

    std::optional<MountEntry> findMount(const std::string &mount_point) override;
    void mount(const MountRequest &request) override;
    void unmount(const std::string &mount_point, const bool &lazy) override;

private:
    bool use_sudo;
    std::string mounts_file;

    std::vector<std::string> command(const std::vector<std::string> &args) const;
    void ensureMountPoint(const std::string &mount_point) const;
};

std::vector<MountEntry> parse_mounts(std::istream &in);
MountError::Kind classify_mount_failure(const std::string &stderr_text);
bool has_mount_option(const std::string &options, const std::string &option);

class MountManager {
public:
    explicit MountManager(MountBackend &backend);

    MountManager(const MountManager&) = delete;
    MountManager& operator=(const MountManager&) = delete;

    // throws MountError
    MountedVolume acquire(const VolumeSpec &spec);
    // never throws, an already detached volume is only logged
    void release(const MountedVolume &volume);

    MountState getState(const std::string &mount_point) const;

private:
    MountBackend &backend;
    mutable std::mutex mutex;
    std::unordered_map<std::string, MountState> states;

    MountedVolume acquireSource(const VolumeSpec &spec);
    MountedVolume acquireDestination(const VolumeSpec &spec);
    bool mountOnce(const MountRequest &request, const std::string &expected_source, const bool &read_only);
    void setState(const std::string &mount_point, const MountState &state);
};
