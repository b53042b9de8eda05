#include "offloader/mount_manager.hpp"
#include "offloader/process.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

std::string to_string(const VolumeKind &kind) {
    return kind == VolumeKind::Source ? "source" : "destination";
}

std::string to_string(const MountState &state) {
    switch (state) {
        case MountState::Unmounted: return "unmounted";
        case MountState::Mounting: return "mounting";
        case MountState::Mounted: return "mounted";
        case MountState::MountFailed: return "mount_failed";
    }
    return "unknown";
}

namespace {

// /proc/mounts escapes whitespace and backslashes as octal
std::string unescape_mount_field(const std::string &field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()
            && std::isdigit(static_cast<unsigned char>(field[i + 1]))
            && std::isdigit(static_cast<unsigned char>(field[i + 2]))
            && std::isdigit(static_cast<unsigned char>(field[i + 3]))) {
            out.push_back(static_cast<char>((field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0')));
            i += 3;
        } else {
            out.push_back(field[i]);
        }
    }
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_any(const std::string &haystack, const std::vector<std::string> &needles) {
    for (const auto &needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string share_source(const std::string &address, const std::string &share) {
    return "//" + address + "/" + share;
}

std::string cifs_options(const VolumeSpec &spec) {
    std::string opts = "vers=" + spec.protocol_version;
    if (spec.username.empty()) {
        opts += ",guest";
    }
    opts += ",uid=0,gid=0,file_mode=0777,dir_mode=0777";
    if (spec.read_only) {
        opts += ",ro";
    }
    return opts;
}

}

std::vector<MountEntry> parse_mounts(std::istream &in) {
    std::vector<MountEntry> entries;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        MountEntry entry;
        if (!(iss >> entry.source >> entry.mount_point >> entry.fstype >> entry.options)) {
            continue; // malformed line
        }
        entry.source = unescape_mount_field(entry.source);
        entry.mount_point = unescape_mount_field(entry.mount_point);
        entries.push_back(entry);
    }
    return entries;
}

MountError::Kind classify_mount_failure(const std::string &stderr_text) {
    std::string text = lower(stderr_text);
    if (contains_any(text, {"permission denied", "error(13)", "access denied", "logon failure", "nt_status_logon_failure"})) {
        return MountError::Kind::AuthFailed;
    }
    if (contains_any(text, {"busy", "error(16)"})) {
        return MountError::Kind::Busy;
    }
    if (contains_any(text, {"no such file or directory", "does not exist", "no such device", "can't find", "not found", "error(2)", "error(19)"})) {
        return MountError::Kind::NotFound;
    }
    return MountError::Kind::Unreachable;
}

bool has_mount_option(const std::string &options, const std::string &option) {
    std::istringstream iss(options);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (token == option) {
            return true;
        }
    }
    return false;
}

// CredentialsFile

CredentialsFile::CredentialsFile(const std::string &username, const std::string &password, const std::string &directory) {
    std::string dir = directory.empty() ? std::filesystem::temp_directory_path().string() : directory;
    std::string pattern = (std::filesystem::path(dir) / "offloader-cred-XXXXXX").string();

    // mkstemp creates the file with mode 0600
    int fd = mkstemp(pattern.data());
    if (fd < 0) {
        throw MountError(MountError::Kind::NotFound, "Cannot create credentials file in " + dir);
    }
    this->path = pattern;

    std::string content = "username=" + username + "\npassword=" + password + "\n";
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n <= 0) {
            close(fd);
            unlink(this->path.c_str());
            throw MountError(MountError::Kind::NotFound, "Cannot write credentials file " + this->path);
        }
        written += static_cast<size_t>(n);
    }
    fchmod(fd, S_IRUSR | S_IWUSR);
    close(fd);
}

CredentialsFile::~CredentialsFile() {
    if (!this->path.empty()) {
        unlink(this->path.c_str());
    }
}

const std::string &CredentialsFile::getPath() const {
    return this->path;
}

// SystemMountBackend

SystemMountBackend::SystemMountBackend(const bool &use_sudo, const std::string &mounts_file) : use_sudo(use_sudo), mounts_file(mounts_file) {
}

std::vector<std::string> SystemMountBackend::command(const std::vector<std::string> &args) const {
    std::vector<std::string> argv;
    if (this->use_sudo) {
        argv.push_back("sudo");
        argv.push_back("-n");
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

void SystemMountBackend::ensureMountPoint(const std::string &mount_point) const {
    std::error_code ec;
    if (std::filesystem::is_directory(mount_point, ec)) {
        return;
    }
    std::filesystem::create_directories(mount_point, ec);
    if (!ec) {
        return;
    }

    // mount points under /mnt usually need root
    if (this->use_sudo) {
        CommandResult r = run_command(this->command({"mkdir", "-p", mount_point}));
        if (r.exit_code == 0) {
            return;
        }
    }
    throw MountError(MountError::Kind::NotFound, "Cannot create mount point " + mount_point + ": " + ec.message());
}

std::optional<MountEntry> SystemMountBackend::findMount(const std::string &mount_point) {
    std::ifstream in(this->mounts_file);
    if (!in) {
        return std::nullopt;
    }

    // stacked mounts -> the last entry is the visible one
    std::optional<MountEntry> found;
    std::string wanted = std::filesystem::path(mount_point).lexically_normal().string();
    for (const auto &entry : parse_mounts(in)) {
        if (std::filesystem::path(entry.mount_point).lexically_normal().string() == wanted) {
            found = entry;
        }
    }
    return found;
}

void SystemMountBackend::mount(const MountRequest &request) {
    this->ensureMountPoint(request.mount_point);

    // keeps the password out of the process list, lives until mount returns
    std::optional<CredentialsFile> credentials;
    std::string options = request.options;
    if (!request.username.empty()) {
        credentials.emplace(request.username, request.password);
        options += (options.empty() ? "" : ",") + std::string("credentials=") + credentials->getPath();
    }

    std::vector<std::string> args = {"mount"};
    if (!request.fstype.empty()) {
        args.push_back("-t");
        args.push_back(request.fstype);
    }
    if (!options.empty()) {
        args.push_back("-o");
        args.push_back(options);
    }
    args.push_back(request.source);
    args.push_back(request.mount_point);

    CommandResult r;
    try {
        r = run_command(this->command(args));
    } catch (const std::exception &e) {
        throw MountError(MountError::Kind::NotFound, std::string("Cannot run mount: ") + e.what());
    }
    if (r.exit_code != 0) {
        std::string err = r.err.empty() ? r.out : r.err;
        while (!err.empty() && (err.back() == '\n' || err.back() == ' ')) {
            err.pop_back();
        }
        throw MountError(classify_mount_failure(err), "mount " + request.source + " on " + request.mount_point + " failed: " + err);
    }
}

void SystemMountBackend::unmount(const std::string &mount_point, const bool &lazy) {
    std::vector<std::string> args = {"umount"};
    if (lazy) {
        args.push_back("-l");
    }
    args.push_back(mount_point);

    CommandResult r;
    try {
        r = run_command(this->command(args));
    } catch (const std::exception &e) {
        throw MountError(MountError::Kind::NotFound, std::string("Cannot run umount: ") + e.what());
    }
    if (r.exit_code != 0) {
        std::string err = r.err;
        while (!err.empty() && (err.back() == '\n' || err.back() == ' ')) {
            err.pop_back();
        }
        std::string text = lower(err);
        MountError::Kind kind = contains_any(text, {"not mounted", "no mount point", "not found", "no such file"})
            ? MountError::Kind::NotFound
            : classify_mount_failure(err);
        throw MountError(kind, "umount " + mount_point + " failed: " + err);
    }
}

// MountManager

MountManager::MountManager(MountBackend &backend) : backend(backend) {
}

MountedVolume MountManager::acquire(const VolumeSpec &spec) {
    if (spec.mount_point.empty()) {
        throw MountError(MountError::Kind::NotFound, "No mount point configured for " + to_string(spec.kind) + " volume");
    }

    std::lock_guard<std::mutex> lock(this->mutex);
    this->setState(spec.mount_point, MountState::Mounting);
    try {
        MountedVolume volume = spec.kind == VolumeKind::Source ? this->acquireSource(spec) : this->acquireDestination(spec);
        this->setState(spec.mount_point, MountState::Mounted);
        return volume;
    } catch (const MountError &e) {
        this->setState(spec.mount_point, MountState::MountFailed);
        std::cerr << "[mount] " << to_string(spec.kind) << " volume not mounted: " << e.what() << std::endl;
        throw;
    }
}

MountedVolume MountManager::acquireSource(const VolumeSpec &spec) {
    if (spec.device.empty()) {
        throw MountError(MountError::Kind::NotFound, "No removable drive detected");
    }

    // source is always read-only, whatever was asked for
    MountRequest request;
    request.source = spec.device;
    request.mount_point = spec.mount_point;
    request.options = "ro";

    int attempts = spec.attempts < 1 ? 1 : spec.attempts;
    for (int attempt = 1; ; ++attempt) {
        try {
            MountedVolume volume;
            volume.kind = VolumeKind::Source;
            volume.mount_point = spec.mount_point;
            volume.source = spec.device;
            volume.reused = this->mountOnce(request, spec.device, true);
            std::cout << "[mount] " << (volume.reused ? "Reusing " : "Mounted ") << spec.device << " read-only at " << spec.mount_point << std::endl;
            return volume;
        } catch (const MountError &e) {
            if (e.getKind() == MountError::Kind::AuthFailed || attempt >= attempts) {
                throw;
            }
            // drive may still be initializing
            std::cout << "[mount] Mount attempt " << attempt << "/" << attempts << " failed for " << spec.device
                      << ", retrying in " << spec.retry_delay.count() << "ms" << std::endl;
            std::this_thread::sleep_for(spec.retry_delay);
        }
    }
}

MountedVolume MountManager::acquireDestination(const VolumeSpec &spec) {
    if (spec.primary_address.empty() || spec.share_name.empty()) {
        throw MountError(MountError::Kind::NotFound, "No share address configured");
    }

    std::vector<std::string> addresses = {spec.primary_address};
    if (!spec.secondary_address.empty() && spec.secondary_address != spec.primary_address) {
        addresses.push_back(spec.secondary_address);
    }

    // already mounted from either address -> reuse
    std::optional<MountEntry> existing = this->backend.findMount(spec.mount_point);
    if (existing) {
        for (const auto &address : addresses) {
            if (existing->source == share_source(address, spec.share_name)) {
                std::cout << "[mount] Reusing " << existing->source << " at " << spec.mount_point << std::endl;
                return MountedVolume{VolumeKind::Destination, spec.mount_point, existing->source, address, true};
            }
        }
    }

    std::string last_error;
    for (size_t i = 0; i < addresses.size(); ++i) {
        MountRequest request;
        request.source = share_source(addresses[i], spec.share_name);
        request.mount_point = spec.mount_point;
        request.fstype = "cifs";
        request.options = cifs_options(spec);
        request.username = spec.username;
        request.password = spec.password;
        try {
            bool reused = this->mountOnce(request, request.source, spec.read_only);
            std::cout << "[mount] Mounted " << request.source << " at " << spec.mount_point << std::endl;
            return MountedVolume{VolumeKind::Destination, spec.mount_point, request.source, addresses[i], reused};
        } catch (const MountError &e) {
            // only a connection failure moves on to the fallback address
            if (e.getKind() != MountError::Kind::Unreachable) {
                throw;
            }
            last_error = e.what();
            if (i + 1 < addresses.size()) {
                std::cout << "[mount] " << request.source << " unreachable, trying fallback address " << addresses[i + 1] << std::endl;
            }
        }
    }
    throw MountError(MountError::Kind::Unreachable, "Share " + spec.share_name + " unreachable at all addresses (last: " + last_error + ")");
}

bool MountManager::mountOnce(const MountRequest &request, const std::string &expected_source, const bool &read_only) {
    std::optional<MountEntry> existing = this->backend.findMount(request.mount_point);
    if (existing) {
        if (existing->source == expected_source && (!read_only || has_mount_option(existing->options, "ro"))) {
            return true;
        }

        // stale mount from a previous run
        std::cout << "[mount] " << request.mount_point << " occupied by " << existing->source << ", forcing unmount" << std::endl;
        try {
            this->backend.unmount(request.mount_point, true);
        } catch (const MountError &e) {
            throw MountError(MountError::Kind::Busy, request.mount_point + " is occupied and could not be released: " + e.what());
        }
    }

    try {
        this->backend.mount(request);
    } catch (const MountError &e) {
        if (e.getKind() != MountError::Kind::Busy) {
            throw;
        }

        // not cleanly released before -> force unmount and retry once
        std::cout << "[mount] " << request.mount_point << " busy, forcing unmount and retrying" << std::endl;
        try {
            this->backend.unmount(request.mount_point, true);
        } catch (const MountError &unmount_error) {
            std::cerr << "[mount] Forced unmount of " << request.mount_point << " failed: " << unmount_error.what() << std::endl;
        }
        this->backend.mount(request);
    }
    return false;
}

void MountManager::release(const MountedVolume &volume) {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = this->states.find(volume.mount_point);
    if (it == this->states.end() || it->second == MountState::Unmounted) {
        return; // already released
    }

    try {
        this->backend.unmount(volume.mount_point, true);
        std::cout << "[mount] Released " << to_string(volume.kind) << " volume at " << volume.mount_point << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "[mount] Anomaly releasing " << volume.mount_point << " (treated as released): " << e.what() << std::endl;
    }
    this->setState(volume.mount_point, MountState::Unmounted);
}

MountState MountManager::getState(const std::string &mount_point) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = this->states.find(mount_point);
    return it == this->states.end() ? MountState::Unmounted : it->second;
}

void MountManager::setState(const std::string &mount_point, const MountState &state) {
    this->states[mount_point] = state;
}
