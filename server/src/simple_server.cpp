#include "simple_server.hpp"
#include "session.hpp"

namespace {

// how often watching sessions are checked for a newer snapshot
constexpr long PUSH_INTERVAL_US = 200 * 1000;

int create_listen_socket(std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::perror("socket");
        return -1;
    }

    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        std::perror("setsockopt");
        ::close(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(fd);
        return -1;
    }

    if (::listen(fd, 8) < 0) {
        std::perror("listen");
        ::close(fd);
        return -1;
    }
    return fd;
}

}

void start_simple_server(const std::uint16_t &port, TransferService &service, const std::atomic<bool> &stop) {
    // create listen socket
    int listen_fd = create_listen_socket(port);
    if (listen_fd < 0) {
        std::cerr << "[server] Failed to set up listen socket on port " << port << std::endl;
        return;
    }
    std::cout << "[server] Listening on port " << port << std::endl;

    std::unordered_map<int, std::unique_ptr<Session>> sessions;

    // main server loop
    std::vector<int> toClose;
    while (!stop) {
        toClose.clear();

        // add all client fds to set
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listen_fd, &readfds);
        int maxfd = listen_fd;
        for (auto &p : sessions) {
            FD_SET(p.first, &readfds);
            if (p.first > maxfd) maxfd = p.first;
        }

        // wait for event, wake up periodically for status pushes
        timeval timeout{};
        timeout.tv_sec = 0;
        timeout.tv_usec = PUSH_INTERVAL_US;
        int activity = select(maxfd + 1, &readfds, nullptr, nullptr, &timeout);
        if (activity < 0) {
            if (errno == EINTR) continue;
            perror("select");
            break;
        }

        // new client -> accept connection and create session
        if (activity > 0 && FD_ISSET(listen_fd, &readfds)) {
            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = ::accept(listen_fd,
                                     reinterpret_cast<sockaddr*>(&client_addr),
                                     &client_len);
            if (client_fd < 0) {
                perror("accept");
            } else {
                char ipbuf[INET_ADDRSTRLEN];
                const char* ipstr = ::inet_ntop(AF_INET, &client_addr.sin_addr, ipbuf, sizeof(ipbuf));
                if (ipstr) {
                    std::cout << "[server] Client connected from " << ipstr << ":" << ntohs(client_addr.sin_port) << std::endl;
                }

                // create session
                sessions.emplace(client_fd,
                    std::make_unique<Session>(client_fd, service, [&](int fd){
                        toClose.push_back(fd);
                    })
                );
            }
        }

        for (auto &p : sessions) {
            int fd = p.first;

            // existing client sent message -> read and process
            if (activity > 0 && FD_ISSET(fd, &readfds)) {
                std::string msg;
                try {
                    msg = recv_msg(fd);
                } catch (const std::exception &e) {
                    if (error_code(e) == "connection_closed") {
                        std::cout << "[server] Client " << fd << " disconnected" << std::endl;
                    } else {
                        std::cerr << "[server] Error receiving message from client " << fd << ": " << e.what() << std::endl;
                    }
                    toClose.push_back(fd);
                    continue;
                }

                if (msg.empty()) {
                    std::cout << "[server] Client " << fd << " disconnected" << std::endl;
                    toClose.push_back(fd);
                    continue;
                }

                std::cout << "[server] Received from fd=" << fd << ": " << word_from(msg, 0) << std::endl;

                // delegate session logic
                try {
                    p.second->onMessage(msg);
                } catch (const std::exception &e) {
                    std::cerr << "[server] Lost client " << fd << ": " << e.what() << std::endl;
                    toClose.push_back(fd);
                    continue;
                }
            }

            // push changed status to watchers
            try {
                p.second->pushStatus();
            } catch (const std::exception &e) {
                std::cerr << "[server] Lost watching client " << fd << ": " << e.what() << std::endl;
                toClose.push_back(fd);
            }
        }

        // close disconnected sessions
        for (int fd : toClose) {
            if (sessions.erase(fd) > 0) {
                ::close(fd);
            }
        }
    }

    for (auto &p : sessions) {
        ::close(p.first);
    }
    ::close(listen_fd);
    std::cout << "[server] Stopped" << std::endl;
}
