#include "offloader/status_broadcaster.hpp"

StatusBroadcaster::StatusBroadcaster() {
    this->latest.seq = 0;
}

bool StatusBroadcaster::publish(ProgressSnapshot snapshot) {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        // a view taken before the current one lost the race to publish
        if (snapshot.revision != 0 && snapshot.revision < this->latest.revision) {
            return false;
        }
        snapshot.seq = this->latest.seq + 1;
        this->latest = std::move(snapshot);
    }
    this->changed.notify_all();
    return true;
}

ProgressSnapshot StatusBroadcaster::current() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->latest;
}

StatusBroadcaster::Subscription StatusBroadcaster::subscribe() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return Subscription(this, this->latest);
}

std::uint64_t StatusBroadcaster::seq() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->latest.seq;
}

// Subscription

StatusBroadcaster::Subscription::Subscription(const StatusBroadcaster *broadcaster, ProgressSnapshot first)
    : broadcaster(broadcaster), last_seq(first.seq), pending(std::move(first)) {
}

std::optional<ProgressSnapshot> StatusBroadcaster::Subscription::next(const std::chrono::milliseconds &timeout) {
    // late joiner catches up with current state first
    if (this->pending) {
        std::optional<ProgressSnapshot> first = std::move(this->pending);
        this->pending.reset();
        return first;
    }

    std::unique_lock<std::mutex> lock(this->broadcaster->mutex);
    bool fresh = this->broadcaster->changed.wait_for(lock, timeout, [this]() {
        return this->broadcaster->latest.seq > this->last_seq;
    });
    if (!fresh) {
        return std::nullopt;
    }
    this->last_seq = this->broadcaster->latest.seq;
    return this->broadcaster->latest;
}

std::optional<ProgressSnapshot> StatusBroadcaster::Subscription::poll() {
    return this->next(std::chrono::milliseconds(0));
}

std::uint64_t StatusBroadcaster::Subscription::getLastSeq() const {
    return this->last_seq;
}
