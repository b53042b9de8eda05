#include "offloader/file_enumerator.hpp"
#include "offloader/checksum.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <unordered_set>

namespace {

// OS metadata folders and files left behind by cameras and desktops
const std::unordered_set<std::string> HIDDEN_DIRS = {
    ".Spotlight-V100", ".fseventsd", ".Trashes", ".TemporaryItems",
    ".DS_Store", "._.Trashes", ".journal", ".VolumeIcon.icns",
    "System Volume Information", "$RECYCLE.BIN", "RECYCLER",
};

std::uintmax_t sum_sizes(const std::vector<FileEntry> &entries) {
    return std::accumulate(entries.begin(), entries.end(), std::uintmax_t{0}, [](std::uintmax_t acc, const FileEntry &e) {
        return acc + e.size;
    });
}

}

Manifest::Manifest(const std::string &root, std::vector<FileEntry> entries) : root(root), entries(std::move(entries)), total_bytes(sum_sizes(this->entries)) {
}

const std::string &Manifest::getRoot() const {
    return this->root;
}

const std::vector<FileEntry> &Manifest::getEntries() const {
    return this->entries;
}

const FileEntry &Manifest::at(const size_t &index) const {
    return this->entries.at(index);
}

size_t Manifest::size() const {
    return this->entries.size();
}

bool Manifest::empty() const {
    return this->entries.empty();
}

std::uintmax_t Manifest::getTotalBytes() const {
    return this->total_bytes;
}

bool is_hidden_component(const std::string &name) {
    return name.starts_with(".") || HIDDEN_DIRS.count(name) > 0;
}

Manifest enumerate(const std::string &source_root, const std::string &subfolder, const EnumerateOptions &options) {
    namespace fs = std::filesystem;

    fs::path root = subfolder.empty() ? fs::path(source_root) : fs::path(source_root) / subfolder;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw EnumerationError(EnumerationError::Kind::Unreadable, "Source is not a readable directory: " + root.string());
    }

    std::vector<FileEntry> entries;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw EnumerationError(EnumerationError::Kind::Unreadable, "Cannot read " + root.string() + ": " + ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw EnumerationError(EnumerationError::Kind::Unreadable, "Failed walking " + root.string() + ": " + ec.message());
        }

        const fs::directory_entry &entry = *it;
        std::string name = entry.path().filename().string();
        if (options.skip_hidden && is_hidden_component(name)) {
            if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        // symlinks and directories are not transfer targets
        if (entry.is_symlink(ec) || !entry.is_regular_file(ec)) {
            continue;
        }

        std::uintmax_t size = entry.file_size(ec);
        if (ec) {
            std::cerr << "[scan] Skipping unreadable file " << entry.path() << ": " << ec.message() << std::endl;
            ec.clear();
            continue;
        }
        if (size < options.min_file_size) {
            continue;
        }

        FileEntry file;
        file.relative_path = entry.path().lexically_relative(root).generic_string();
        file.size = size;
        entries.push_back(file);
    }
    if (ec) {
        throw EnumerationError(EnumerationError::Kind::Unreadable, "Failed walking " + root.string() + ": " + ec.message());
    }

    // stable order for the lifetime of the manifest
    std::sort(entries.begin(), entries.end(), [](const FileEntry &a, const FileEntry &b) {
        return a.relative_path < b.relative_path;
    });

    if (!options.selection.empty()) {
        std::unordered_set<std::string> wanted(options.selection.begin(), options.selection.end());
        entries.erase(std::remove_if(entries.begin(), entries.end(), [&wanted](const FileEntry &e) {
            return wanted.count(e.relative_path) == 0;
        }), entries.end());
    }

    if (entries.empty()) {
        throw EnumerationError(EnumerationError::Kind::Empty, "No files to transfer under " + root.string());
    }

    if (options.compute_hashes) {
        for (auto &file : entries) {
            try {
                file.hash = hash_file((root / file.relative_path).string());
            } catch (const TransferError &e) {
                // hashed again from the source during verification
                std::cerr << "[scan] " << e.what() << std::endl;
            }
        }
    }

    return Manifest(root.string(), std::move(entries));
}
