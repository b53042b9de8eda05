#include "session.hpp"

#include <nlohmann/json.hpp>

void Session::watch() {
    this->subscription.emplace(this->service.subscribe());
    this->setState(State::Watching);
    this->send("OK");

    // first push is the current snapshot
    this->pushStatus();
}

void Session::unwatch() {
    this->subscription.reset();
    this->setState(State::AwaitingMessage);
    this->send("OK");
}

void Session::pushStatus() {
    if (this->state != State::Watching || !this->subscription) {
        return;
    }

    std::optional<ProgressSnapshot> snapshot = this->subscription->poll();
    if (!snapshot) {
        return;
    }
    nlohmann::json j = *snapshot;
    this->send("STATUS " + j.dump());
}
