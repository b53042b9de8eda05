#pragma once

#include "offloader/errors.hpp"
#include "offloader/file_copier.hpp"
#include "offloader/mount_manager.hpp"
#include "offloader/notification.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace test {

// scratch directory removed with its content on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        this->path = std::filesystem::temp_directory_path() / ("offloader-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(this->path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(this->path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const {
        return this->path.string();
    }

    std::string sub(const std::string &relative) const {
        std::filesystem::create_directories(this->path / relative);
        return (this->path / relative).string();
    }

    std::filesystem::path path;
};

inline void write_file(const std::filesystem::path &path, const std::string &content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void write_file(const std::filesystem::path &path, const size_t &size, const char &fill = 'x') {
    write_file(path, std::string(size, fill));
}

inline std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// in-memory mount table with scripted mount failures per source
class FakeMountBackend : public MountBackend {
public:
    std::optional<MountEntry> findMount(const std::string &mount_point) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->table.find(mount_point);
        if (it == this->table.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void mount(const MountRequest &request) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->mounts.push_back(request);
        auto &script = this->failures[request.source];
        if (!script.empty()) {
            MountError::Kind kind = script.front();
            script.pop_front();
            throw MountError(kind, "scripted failure for " + request.source);
        }
        if (this->table.count(request.mount_point) > 0) {
            throw MountError(MountError::Kind::Busy, request.mount_point + " is busy");
        }
        this->table[request.mount_point] = MountEntry{request.source, request.mount_point, request.fstype, request.options};
    }

    void unmount(const std::string &mount_point, const bool &lazy) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->unmounts.push_back(mount_point);
        this->lazy_flags.push_back(lazy);
        if (this->table.erase(mount_point) == 0) {
            throw MountError(MountError::Kind::NotFound, mount_point + " not mounted");
        }
    }

    // mount failures returned in order for a source, then success
    void failMount(const std::string &source, const std::vector<MountError::Kind> &kinds) {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->failures[source].insert(this->failures[source].end(), kinds.begin(), kinds.end());
    }

    void preMount(const MountEntry &entry) {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->table[entry.mount_point] = entry;
    }

    // the volume disappears behind our back
    void detach(const std::string &mount_point) {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->table.erase(mount_point);
    }

    bool isMounted(const std::string &mount_point) {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->table.count(mount_point) > 0;
    }

    std::vector<MountRequest> getMounts() {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->mounts;
    }

    std::vector<std::string> getUnmounts() {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->unmounts;
    }

    std::vector<bool> getLazyFlags() {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->lazy_flags;
    }

private:
    std::mutex mutex;
    std::map<std::string, MountEntry> table;
    std::map<std::string, std::deque<MountError::Kind>> failures;
    std::vector<MountRequest> mounts;
    std::vector<std::string> unmounts;
    std::vector<bool> lazy_flags;
};

// real stream copy with injected failures, corruption and a per copy hook
class ScriptedCopier : public FileCopier {
public:
    void copy(const std::string &source, const std::string &destination, const CopyProgress &on_progress) override {
        std::string name = std::filesystem::path(source).filename().string();
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            this->calls.push_back(name);
        }
        if (this->before_copy) {
            this->before_copy(name);
        }

        {
            std::lock_guard<std::mutex> lock(this->mutex);
            auto it = this->failures.find(name);
            if (it != this->failures.end() && it->second > 0) {
                it->second--;
                if (on_progress) {
                    on_progress(1); // partial progress before the failure
                }
                throw TransferError(TransferError::Kind::IOError, "injected write failure on " + name);
            }
        }

        this->copier.copy(source, destination, on_progress);

        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->corrupt.count(name) > 0) {
            std::fstream out(destination, std::ios::binary | std::ios::in | std::ios::out);
            out.seekp(0);
            out.put('#');
        }
    }

    // fail the next n copy attempts of a file name
    void failTimes(const std::string &name, const int &n) {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->failures[name] = n;
    }

    void corruptAfterCopy(const std::string &name) {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->corrupt.insert(name);
    }

    std::vector<std::string> getCalls() {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->calls;
    }

    std::function<void(const std::string &)> before_copy;

private:
    StreamFileCopier copier{4096};
    std::mutex mutex;
    std::map<std::string, int> failures;
    std::set<std::string> corrupt;
    std::vector<std::string> calls;
};

// keeps every delivered event
class RecordingSink : public NotificationSink {
public:
    bool deliver(const NotificationEvent &event) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->attempts++;
        if (this->failures_left > 0) {
            this->failures_left--;
            return false;
        }
        this->events.push_back(event);
        return true;
    }

    std::vector<NotificationEvent> getEvents() {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->events;
    }

    int getAttempts() {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->attempts;
    }

    void failNext(const int &n) {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->failures_left = n;
    }

private:
    std::mutex mutex;
    std::vector<NotificationEvent> events;
    int attempts = 0;
    int failures_left = 0;
};

// polls until pred holds or the timeout expires
inline bool wait_for(const std::function<bool()> &pred, const std::chrono::milliseconds &timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}
