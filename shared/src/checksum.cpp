#include "offloader/checksum.hpp"
#include "offloader/errors.hpp"
#include "offloader/helpers.hpp"

#include <fstream>
#include <mutex>
#include <vector>
#include <sodium.h>

namespace {

void ensure_sodium() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (sodium_init() < 0) {
            throw std::runtime_error("sodium_init: Failed to initialize libsodium");
        }
    });
}

std::string to_hex(const unsigned char *bin, const size_t &len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bin, len);
    hex.resize(len * 2);
    return hex;
}

}

std::string hash_file(const std::string &path) {
    ensure_sodium();

    std::ifstream infile(path, std::ios::binary);
    if (!infile) {
        throw TransferError(TransferError::Kind::IOError, "Failed to open file for hashing (path: " + path + ")");
    }

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES);

    std::vector<char> buffer(TMP_BUFF_SIZE * 16);
    while (true) {
        infile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read_bytes = infile.gcount();
        if (read_bytes > 0) {
            crypto_generichash_update(&state, reinterpret_cast<const unsigned char *>(buffer.data()), static_cast<unsigned long long>(read_bytes));
        }
        if (!infile) {
            if (infile.eof()) {
                break;
            }
            throw TransferError(TransferError::Kind::IOError, "Failed to read file for hashing (path: " + path + ")");
        }
    }

    unsigned char digest[crypto_generichash_BYTES];
    crypto_generichash_final(&state, digest, sizeof(digest));
    return to_hex(digest, sizeof(digest));
}

std::vector<unsigned char> random_bytes(const size_t &n) {
    ensure_sodium();
    std::vector<unsigned char> bytes(n);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

std::string random_hex(const size_t &n) {
    std::vector<unsigned char> bytes = random_bytes(n);
    return to_hex(bytes.data(), bytes.size());
}
