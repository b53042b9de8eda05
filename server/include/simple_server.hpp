#pragma once

#include "offloader/errors.hpp"
#include "offloader/helpers.hpp"
#include "offloader/transfer_service.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <vector>

// serves the control protocol until stop becomes true
void start_simple_server(const std::uint16_t &port, TransferService &service, const std::atomic<bool> &stop);
