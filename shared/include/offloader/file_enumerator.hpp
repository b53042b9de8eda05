#pragma once

#include "offloader/errors.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct FileEntry {
    std::string relative_path;
    std::uintmax_t size = 0;
    std::string hash; // empty unless hashes were requested
};

// fixed list of files for one job, ordered by relative path
class Manifest {
public:
    Manifest(const std::string &root, std::vector<FileEntry> entries);

    const std::string &getRoot() const;
    const std::vector<FileEntry> &getEntries() const;
    const FileEntry &at(const size_t &index) const;
    size_t size() const;
    bool empty() const;
    std::uintmax_t getTotalBytes() const;

private:
    const std::string root;
    const std::vector<FileEntry> entries;
    const std::uintmax_t total_bytes;
};

struct EnumerateOptions {
    bool skip_hidden = true;
    std::uintmax_t min_file_size = 0;
    bool compute_hashes = false;
    // restricts the manifest to these relative paths when not empty
    std::vector<std::string> selection;
};

// throws EnumerationError
Manifest enumerate(const std::string &source_root, const std::string &subfolder, const EnumerateOptions &options = {});

bool is_hidden_component(const std::string &name);
