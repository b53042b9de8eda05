#pragma once

#include "offloader/helpers.hpp"

#include <cstdint>
#include <functional>
#include <string>

// called with the number of bytes of the current attempt written so far
using CopyProgress = std::function<void(const std::uintmax_t &)>;

class FileCopier {
public:
    virtual ~FileCopier() = default;

    // throws TransferError(IOError) when the copy cannot be completed
    virtual void copy(const std::string &source, const std::string &destination, const CopyProgress &on_progress) = 0;
};

// chunked stream copy, overwrites the destination and keeps its modification time
class StreamFileCopier : public FileCopier {
public:
    explicit StreamFileCopier(const size_t &chunk_size = COPY_CHUNK_SIZE);

    void copy(const std::string &source, const std::string &destination, const CopyProgress &on_progress) override;

private:
    size_t chunk_size;
};
