#include "offloader/file_copier.hpp"
#include "offloader/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

StreamFileCopier::StreamFileCopier(const size_t &chunk_size) : chunk_size(chunk_size == 0 ? COPY_CHUNK_SIZE : chunk_size) {
}

void StreamFileCopier::copy(const std::string &source, const std::string &destination, const CopyProgress &on_progress) {
    namespace fs = std::filesystem;

    // ensure parent directory exists
    fs::path parent_dir = fs::path(destination).parent_path();
    if (!parent_dir.empty()) {
        std::error_code ec;
        fs::create_directories(parent_dir, ec);
        if (ec) {
            throw TransferError(TransferError::Kind::IOError, "Failed to create directory " + parent_dir.string() + ": " + ec.message());
        }
    }

    std::ifstream infile(source, std::ios::binary);
    if (!infile) {
        throw TransferError(TransferError::Kind::IOError, "Failed to open file for reading (path: " + source + ")");
    }
    std::ofstream outfile(destination, std::ios::binary | std::ios::trunc);
    if (!outfile) {
        throw TransferError(TransferError::Kind::IOError, "Failed to open file for writing (path: " + destination + ")");
    }

    // copy in chunks
    std::vector<char> buffer(this->chunk_size);
    std::uintmax_t written = 0;
    while (true) {
        infile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read_bytes = infile.gcount();
        if (read_bytes > 0) {
            outfile.write(buffer.data(), read_bytes);
            if (!outfile) {
                throw TransferError(TransferError::Kind::IOError, "Failed to write to file (path: " + destination + ")");
            }
            written += static_cast<std::uintmax_t>(read_bytes);
            if (on_progress) {
                on_progress(written);
            }
        }
        if (!infile) {
            if (infile.eof()) {
                break; // EOF
            }
            throw TransferError(TransferError::Kind::IOError, "Failed to read from file (path: " + source + ")");
        }
    }

    outfile.close();
    if (!outfile) {
        throw TransferError(TransferError::Kind::IOError, "Failed to flush file (path: " + destination + ")");
    }

    // keep the original modification time, not fatal on shares that refuse it
    std::error_code ec;
    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(destination, mtime, ec);
    }
    if (ec) {
        std::cerr << "[copy] Could not preserve modification time of " << destination << ": " << ec.message() << std::endl;
    }
}
