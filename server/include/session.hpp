#pragma once

#include "offloader/helpers.hpp"
#include "offloader/status_broadcaster.hpp"
#include "offloader/transfer_service.hpp"

#include <functional>
#include <iostream>
#include <optional>
#include <string>

class Session {
public:
    enum class State {
        AwaitingMessage,
        Watching
    };

    Session(const int &fd, TransferService &service, std::function<void(int)> close_callback);

    void onMessage(const std::string &msg);
    void exit();

    // sends the latest snapshot to a watching client if it changed since the last push
    void pushStatus();

    // getters
    const int &getClientFD() const;
    State getState() const;

private:
    const int client_fd;
    TransferService &service;
    std::function<void(int)> close_callback;
    State state = State::AwaitingMessage;
    std::optional<StatusBroadcaster::Subscription> subscription;

    // session helpers
    void send(const std::string &msg) const;
    void setState(const State &new_state);

    // job control
    void start(const std::string &msg);
    void cancel();
    void clear();
    void status();
    void history();
    void last();
    void drives();
    void files(const std::string &msg);
    void speedTest();

    // configuration
    void config();
    void setConfig(const std::string &msg);

    // status pushes
    void watch();
    void unwatch();
};
