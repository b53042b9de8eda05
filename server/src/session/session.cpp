#include "session.hpp"

// constructor
Session::Session(const int &fd, TransferService &service, std::function<void(int)> close_callback) : client_fd(fd), service(service), close_callback(close_callback) {
}

// main message handler
void Session::onMessage(const std::string &msg) {
    try {
        if (is_cmd(msg, "START")) {
            this->start(msg);
        } else if (is_cmd(msg, "CANCEL")) {
            this->cancel();
        } else if (is_cmd(msg, "CLEAR")) {
            this->clear();
        } else if (is_cmd(msg, "STATUS")) {
            this->status();
        } else if (is_cmd(msg, "WATCH")) {
            this->watch();
        } else if (is_cmd(msg, "UNWATCH")) {
            this->unwatch();
        } else if (is_cmd(msg, "HISTORY")) {
            this->history();
        } else if (is_cmd(msg, "LAST")) {
            this->last();
        } else if (is_cmd(msg, "DRIVES")) {
            this->drives();
        } else if (is_cmd(msg, "FILES")) {
            this->files(msg);
        } else if (is_cmd(msg, "SPEEDTEST")) {
            this->speedTest();
        } else if (is_cmd(msg, "CONFIG")) {
            this->config();
        } else if (is_cmd(msg, "SETCONFIG")) {
            this->setConfig(msg);
        } else if (is_cmd(msg, "EXIT")) {
            this->exit();
        } else {
            throw std::runtime_error("unknown_command: Unknown command: " + word_from(msg, 0));
        }
    } catch (const std::exception &e) {
        std::string err_msg = "ERROR " + std::string(e.what());
        size_t pos = err_msg.find(": ");
        if (pos != std::string::npos) {
            err_msg.replace(pos, 2, ":\n");
        }
        this->send(err_msg);
        std::cerr << "[server] Error processing command from client fd=" << this->client_fd << ": " << e.what() << std::endl;
    }
}

void Session::exit() {
    this->subscription.reset();
    close_callback(this->client_fd);
}

void Session::send(const std::string &msg) const {
    send_msg(this->client_fd, msg);
}

void Session::setState(const State &new_state) {
    this->state = new_state;
}

// getters

const int &Session::getClientFD() const {
    return this->client_fd;
}

Session::State Session::getState() const {
    return this->state;
}
