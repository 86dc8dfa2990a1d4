#include "frame_writer.hpp"

#include "logger.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace mcp {

FrameWriter::FrameWriter(int fd, FramingMode mode, bool owns_fd) : fd_(fd), mode_(mode), owns_fd_(owns_fd) {}

FrameWriter::~FrameWriter() {
    close();
}

bool FrameWriter::write_frame(const std::string& payload) {
    std::string frame = encode_frame(payload, mode_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        LOG4CPLUS_WARN(transport_logger(), "Dropping " << payload.size() << " byte frame: output closed");
        return false;
    }
    LOG4CPLUS_DEBUG(transport_logger(), "Sending frame (" << payload.size() << " bytes): " << payload);
    if (!write_all(frame)) {
        close_locked();
        return false;
    }
    return true;
}

void FrameWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

bool FrameWriter::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool FrameWriter::write_all(const std::string& bytes) {
    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + offset, bytes.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(transport_logger(), "write failed after " << offset << "/" << bytes.size()
                                                                      << " bytes: " << std::strerror(errno));
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

void FrameWriter::close_locked() {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

} // namespace mcp
