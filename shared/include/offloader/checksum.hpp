#pragma once

#include <string>
#include <vector>

// hex BLAKE2b-256 of the file content, throws TransferError(IOError) if unreadable
std::string hash_file(const std::string &path);

// hex string of n random bytes
std::string random_hex(const size_t &n);

// n bytes from the libsodium generator
std::vector<unsigned char> random_bytes(const size_t &n);
