#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <stdexcept>

// command parsing
bool is_cmd(const std::string &msg, const std::string &cmd);

const std::string word_from(const std::string &str, const size_t &start);
const std::vector<std::string> split_cmd(const std::string &cmd);
const std::vector<std::string> split_lines(const std::string &str);

// length prefixed messages: "<length> <payload>"
size_t receive_length_prefix(const int &fd);
const std::string recv_msg(const int &fd);
void send_msg(const int &fd, const std::string &msg);

// human readable formatting
std::string human_size(double nbytes);
std::string format_duration(const double &seconds);
std::string format_eta(const std::optional<double> &seconds);

constexpr size_t TMP_BUFF_SIZE = 64 * 1024; // 64 KB buffer size
constexpr size_t COPY_CHUNK_SIZE = 4 * 1024 * 1024; // 4 MB chunks for large video files
