#pragma once

#include "offloader/progress_tracker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

// latest value publication: one overwritten snapshot plus a change signal, no per subscriber queue
class StatusBroadcaster {
public:
    class Subscription {
    public:
        // first call returns the snapshot current at subscribe time, later calls wait for a newer one
        std::optional<ProgressSnapshot> next(const std::chrono::milliseconds &timeout);
        // non-blocking variant of next
        std::optional<ProgressSnapshot> poll();

        std::uint64_t getLastSeq() const;

    private:
        friend class StatusBroadcaster;
        Subscription(const StatusBroadcaster *broadcaster, ProgressSnapshot first);

        const StatusBroadcaster *broadcaster;
        std::uint64_t last_seq;
        std::optional<ProgressSnapshot> pending;
    };

    StatusBroadcaster();

    StatusBroadcaster(const StatusBroadcaster&) = delete;
    StatusBroadcaster& operator=(const StatusBroadcaster&) = delete;

    // false when a newer revision is already published, idle snapshots always go out
    bool publish(ProgressSnapshot snapshot);
    ProgressSnapshot current() const;
    Subscription subscribe() const;
    std::uint64_t seq() const;

private:
    mutable std::mutex mutex;
    mutable std::condition_variable changed;
    ProgressSnapshot latest;
};
