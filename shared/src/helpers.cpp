#include "offloader/helpers.hpp"

#include <cerrno>
#include <cstdio>
#include <unistd.h>

bool is_cmd(const std::string &msg, const std::string &cmd) {
    return msg.starts_with(cmd) && (msg.size() == cmd.size() || msg[cmd.size()] == ' ' || msg[cmd.size()] == '\n');
}

const std::string word_from(const std::string &str, const size_t &start) {
    if (start >= str.size()) {
        return "";
    }

    size_t pos = str.find_first_of(" \n", start);
    if (pos == std::string::npos) {
        return str.substr(start);
    }
    return str.substr(start, pos - start);
}

const std::vector<std::string> split_cmd(const std::string &cmd) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < cmd.size()) {
        size_t pos = cmd.find(' ', start);
        if (pos == std::string::npos) {
            parts.push_back(cmd.substr(start));
            break;
        } else {
            if (pos > start) {
                parts.push_back(cmd.substr(start, pos - start));
            }
            start = pos + 1;
        }
    }
    return parts;
}

const std::vector<std::string> split_lines(const std::string &str) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= str.size()) {
        size_t pos = str.find('\n', start);
        if (pos == std::string::npos) {
            if (start < str.size()) {
                lines.push_back(str.substr(start));
            }
            break;
        }
        lines.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

size_t receive_length_prefix(const int &fd) {
    char c = '\0';
    size_t length = 0;
    size_t digits = 0;
    while (true) {
        ssize_t recvd = ::recv(fd, &c, 1, 0);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("recv: Failed to receive length");
        }
        if (recvd == 0) {
            throw std::runtime_error("connection_closed: Connection closed by remote node");
        }
        if (c == ' ') {
            break;
        }
        if (c < '0' || c > '9' || ++digits > 12) {
            throw std::runtime_error("malformed_message: Invalid length prefix");
        }
        length *= 10;
        length += static_cast<size_t>(c - '0');
    }
    return length;
}

const std::string recv_msg(const int &fd) {
    std::string result;

    // receive message length
    size_t len = receive_length_prefix(fd);

    // receive full message
    size_t remaining = len;
    char temp[TMP_BUFF_SIZE];
    while (remaining > 0) {
        ssize_t recvd = ::recv(fd, temp, remaining < sizeof(temp) ? remaining : sizeof(temp), 0);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("recv: Failed to receive message");
        }
        if (recvd == 0) {
            throw std::runtime_error("connection_closed: Connection closed by remote node");
        }
        result.append(temp, static_cast<size_t>(recvd));
        remaining -= static_cast<size_t>(recvd);
    }
    return result;
}

void send_msg(const int &fd, const std::string &msg) {
    // add length prefix
    std::string full_msg = std::to_string(msg.size()) + ' ' + msg;

    // send full message
    ssize_t total_sent = 0;
    ssize_t total_size = static_cast<ssize_t>(full_msg.size());
    while (total_sent < total_size) {
        ssize_t sent = ::send(fd, full_msg.c_str() + total_sent, static_cast<size_t>(total_size - total_sent), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE || errno == ECONNRESET) {
                throw std::runtime_error("connection_closed: Connection closed by remote node");
            }
            throw std::runtime_error("send: Failed to send message");
        }
        total_sent += sent;
    }
}

std::string human_size(double nbytes) {
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    char buf[32];
    for (const char *unit : units) {
        if (nbytes < 1024) {
            std::snprintf(buf, sizeof(buf), "%.1f %s", nbytes, unit);
            return buf;
        }
        nbytes /= 1024;
    }
    std::snprintf(buf, sizeof(buf), "%.1f PB", nbytes);
    return buf;
}

std::string format_duration(const double &seconds) {
    long total = seconds > 0 ? static_cast<long>(seconds) : 0;
    if (total < 60) {
        return std::to_string(total) + "s";
    }
    if (total < 3600) {
        return std::to_string(total / 60) + "m " + std::to_string(total % 60) + "s";
    }
    return std::to_string(total / 3600) + "h " + std::to_string((total % 3600) / 60) + "m";
}

std::string format_eta(const std::optional<double> &seconds) {
    if (!seconds) {
        return "estimating...";
    }
    if (*seconds <= 0) {
        return "almost done";
    }
    return format_duration(*seconds) + " remaining";
}
