#pragma once

#include "framing.hpp"

#include <mutex>
#include <string>

namespace mcp {

/**
 * Single exclusive write path for one output stream.
 *
 * Each frame is encoded and written under one lock, retrying partial
 * writes, so concurrently produced frames never interleave and appear in
 * the order their writers acquired the lock.
 */
class FrameWriter {
public:
    FrameWriter(int fd, FramingMode mode = FramingMode::content_length, bool owns_fd = false);
    ~FrameWriter();

    FrameWriter(const FrameWriter&) = delete;
    FrameWriter& operator=(const FrameWriter&) = delete;

    /// Returns false if the stream is closed or the write failed; a failed
    /// write closes the writer.
    bool write_frame(const std::string& payload);

    /// Closes the write side. Later writes fail.
    void close();
    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    int fd_;
    FramingMode mode_;
    bool owns_fd_;
    bool closed_ = false;

    bool write_all(const std::string& bytes);
    void close_locked();
};

} // namespace mcp
