#include "offloader/version.hpp"
#include "offloader/helpers.hpp"
#include "offloader/progress_tracker.hpp"

#include <iostream>
#include <string>
#include <cstring>
#include <cerrno>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <signal.h>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

struct HostPort {
    std::string host;
    uint16_t port{};
};

static bool parse_host_port(const std::string& input, HostPort& out) {
    auto colon = input.rfind(':');
    if (colon == std::string::npos) return false;
    std::string host = input.substr(0, colon);
    std::string port_str = input.substr(colon + 1);
    if (host.empty() || port_str.empty()) return false;
    char* end = nullptr;
    long p = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || p < 0 || p > 65535) return false;
    out.host = std::move(host);
    out.port = static_cast<uint16_t>(p);
    return true;
}

void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "HELP - Show this help message\n";
    std::cout << "EXIT - Exit the client\n";
    std::cout << "START <project> [--device <dev>] [--folder <dir>] [file ...] - Copy the drive to the share\n";
    std::cout << "CANCEL - Cancel the running job\n";
    std::cout << "CLEAR - Acknowledge a finished job\n";
    std::cout << "STATUS - Show the current progress\n";
    std::cout << "WATCH / UNWATCH - Follow progress live\n";
    std::cout << "HISTORY - List finished jobs\n";
    std::cout << "LAST - Show the most recent finished job\n";
    std::cout << "DRIVES - List detected usb drives\n";
    std::cout << "FILES [--device <dev>] [--folder <dir>] - List the files on the drive\n";
    std::cout << "SPEEDTEST - Measure write speed to the share\n";
    std::cout << "CONFIG - Show the configuration\n";
    std::cout << "SETCONFIG <json> - Change configuration keys\n";
}

std::string progress_line(const ProgressSnapshot &s) {
    std::ostringstream line;
    line << "[" << to_string(s.state) << "] ";
    line.setf(std::ios::fixed);
    line.precision(1);
    line << s.percent << "% "
         << human_size(static_cast<double>(s.bytes_copied)) << " / " << human_size(static_cast<double>(s.bytes_total));
    if (s.state == JobState::Copying || s.state == JobState::Verifying) {
        line << "  " << human_size(s.throughput_bps) << "/s  " << format_eta(s.eta_seconds);
        if (!s.current_file.empty()) {
            line << "  " << s.current_file << " (" << s.current_file_index + 1 << "/" << s.files_total << ")";
        }
    } else if (is_terminal(s.state)) {
        line << "  " << s.files_copied << "/" << s.files_total << " files in " << format_duration(s.elapsed_seconds);
        if (s.error_count > 0) {
            line << ", " << s.error_count << " errors";
        }
        if (!s.last_error.empty()) {
            line << "\n" << s.last_error;
        }
    }
    return line.str();
}

// server message: status push or command reply
void handle_message(const std::string &msg) {
    if (is_cmd(msg, "STATUS")) {
        ProgressSnapshot snapshot = nlohmann::json::parse(msg.substr(7)).get<ProgressSnapshot>();
        std::cout << "\r\033[K" << progress_line(snapshot);
        if (is_terminal(snapshot.state) || snapshot.state == JobState::Idle) {
            std::cout << "\n";
        }
        std::cout << std::flush;
        return;
    }

    // pretty print json payloads
    size_t pos = msg.find('\n');
    if (msg.starts_with("OK\n") && pos != std::string::npos) {
        try {
            nlohmann::json j = nlohmann::json::parse(msg.substr(pos + 1));
            std::cout << "OK\n" << j.dump(2) << "\n> " << std::flush;
            return;
        } catch (const nlohmann::json::parse_error &) {
            // plain text payload, like a job id
        }
    }
    std::cout << msg << "\n> " << std::flush;
}

void main_loop(const int &fd) {
    std::string input_buffer;
    char temp[TMP_BUFF_SIZE];
    
    std::cout << "> " << std::flush;
    while (true) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FILENO, &readfds);
        FD_SET(fd, &readfds);
        int activity = select(fd + 1, &readfds, nullptr, nullptr, nullptr);
        if (activity < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("select: Failed to wait for input");
        }

        // server pushed or replied
        if (FD_ISSET(fd, &readfds)) {
            handle_message(recv_msg(fd));
        }

        if (!FD_ISSET(STDIN_FILENO, &readfds)) {
            continue;
        }

        // read up to TMP_BUFF_SIZE bytes from stdin
        ssize_t read_bytes = ::read(STDIN_FILENO, temp, sizeof(temp));
        if (read_bytes < 0) {
            throw std::runtime_error("read_stdin_failed: Failed to read from stdin");
        }
        if (read_bytes == 0) {
            send_msg(fd, "EXIT");
            return;
        }
        input_buffer.append(temp, static_cast<size_t>(read_bytes));

        // process complete lines
        size_t pos;
        while ((pos = input_buffer.find('\n')) != std::string::npos) {
            std::string cmd = input_buffer.substr(0, pos);
            input_buffer.erase(0, pos + 1);
            if (cmd.empty()) {
                std::cout << "> " << std::flush;
                continue;
            }

            // process local commands
            if (is_cmd(cmd, "HELP")) {
                print_help();
                std::cout << "> " << std::flush;
            } else if (is_cmd(cmd, "EXIT")) {
                send_msg(fd, "EXIT");
                std::cout << "Exiting...\n";
                return;
            } else {
                send_msg(fd, cmd);
            }
        }
    }
}

int main(int argc, char* argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;
    
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <host>:<port>" << std::endl;
        return 1;
    }
    
    HostPort hp;
    if (!parse_host_port(argv[1], hp)) {
        std::cerr << "Invalid endpoint format: " << argv[1] << std::endl;
        return 1;
    }
    
    std::cout << "Offloader client (version " << offloader::version() << ")" << std::endl;
    std::cout << "Connecting to " << hp.host << ':' << hp.port << std::endl;
    signal(SIGPIPE, SIG_IGN);
    
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::perror("socket");
        return 2;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(hp.port);
    if (::inet_pton(AF_INET, hp.host.c_str(), &addr.sin_addr) != 1) {
        std::cerr << "Invalid IPv4 address: " << hp.host << std::endl;
        ::close(fd);
        return 2;
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::perror("connect");
        ::close(fd);
        return 2;
    }
    std::cout << "Connected to server." << std::endl;

    try {
        main_loop(fd);
    } catch (const std::exception &e) {
        std::cerr << "\nERROR: " << e.what() << std::endl;
        ::close(fd);
        return 1;
    }

    ::close(fd);
    return 0;
}
