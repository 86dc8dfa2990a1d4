#include "framing.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace mcp {

namespace {

constexpr const char* kContentLength = "Content-Length";
constexpr size_t kReadChunk = 4096;
constexpr size_t kMaxReadChunk = 1 << 20;
constexpr size_t kMaxHeaderLines = 32;

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

bool parse_length(const std::string& text, long long& length) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return false;
    }
    length = value;
    return true;
}

} // namespace

const char* to_string(FrameStatus status) {
    switch (status) {
        case FrameStatus::ok:
            return "ok";
        case FrameStatus::end_of_stream:
            return "end of stream";
        case FrameStatus::framing_error:
            return "framing error";
    }
    return "unknown";
}

bool parse_framing_mode(const std::string& text, FramingMode& mode) {
    if (text == "header" || text == "content-length") {
        mode = FramingMode::content_length;
        return true;
    }
    if (text == "newline" || text == "ndjson") {
        mode = FramingMode::newline_delimited;
        return true;
    }
    return false;
}

std::string encode_frame(const std::string& payload, FramingMode mode) {
    if (mode == FramingMode::newline_delimited) {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    std::string frame = kContentLength;
    frame += ": ";
    frame += std::to_string(payload.size());
    frame += "\r\n\r\n";
    frame += payload;
    return frame;
}

FrameReader::FrameReader(int fd, FramingMode mode) : fd_(fd), mode_(mode) {}

FrameStatus FrameReader::read_frame(std::string& payload, std::string& error) {
    if (mode_ == FramingMode::newline_delimited) {
        return read_line_frame(payload, error);
    }
    return read_header_frame(payload, error);
}

FrameReader::FillResult FrameReader::fill(size_t hint) {
    if (wakeup_fd_ >= 0) {
        pollfd fds[2] = {{fd_, POLLIN, 0}, {wakeup_fd_, POLLIN, 0}};
        for (;;) {
            int rc = ::poll(fds, 2, -1);
            if (rc < 0 && errno == EINTR) {
                continue;
            }
            if (rc < 0) {
                io_error_ = std::string("poll: ") + std::strerror(errno);
                return FillResult::error;
            }
            break;
        }
        if (fds[1].revents != 0) {
            return FillResult::eof;
        }
    }

    size_t chunk = std::min(std::max(hint, kReadChunk), kMaxReadChunk);
    size_t old_size = buffer_.size();
    buffer_.resize(old_size + chunk);

    ssize_t n = 0;
    do {
        n = ::read(fd_, &buffer_[old_size], chunk);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        io_error_ = std::string("read: ") + std::strerror(errno);
        buffer_.resize(old_size);
        return FillResult::error;
    }
    buffer_.resize(old_size + static_cast<size_t>(n));
    return n == 0 ? FillResult::eof : FillResult::data;
}

FrameStatus FrameReader::read_line(std::string& line, std::string& error) {
    size_t limit = mode_ == FramingMode::content_length ? kMaxHeaderLine : std::string::npos;
    size_t scan_from = pos_;
    for (;;) {
        size_t nl = buffer_.find('\n', scan_from);
        if (nl != std::string::npos) {
            line.assign(buffer_, pos_, nl - pos_);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            pos_ = nl + 1;
            return FrameStatus::ok;
        }
        if (buffer_.size() - pos_ > limit) {
            error = "header line exceeds " + std::to_string(limit) + " bytes";
            return FrameStatus::framing_error;
        }
        scan_from = buffer_.size();
        switch (fill(kReadChunk)) {
            case FillResult::data:
                break;
            case FillResult::eof:
                error = "stream closed while reading a line";
                return FrameStatus::end_of_stream;
            case FillResult::error:
                error = io_error_;
                return FrameStatus::framing_error;
        }
    }
}

FrameStatus FrameReader::read_header_frame(std::string& payload, std::string& error) {
    long long length = 0;
    bool has_length = false;
    size_t header_lines = 0;
    std::string line;

    for (;;) {
        FrameStatus status = read_line(line, error);
        if (status != FrameStatus::ok) {
            return status;
        }
        if (line.empty()) {
            break;
        }
        if (++header_lines > kMaxHeaderLines) {
            error = "too many header lines";
            return FrameStatus::framing_error;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            error = "malformed header line: " + line;
            return FrameStatus::framing_error;
        }
        std::string name = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (iequals(name, kContentLength)) {
            if (!parse_length(value, length)) {
                error = "invalid Content-Length value '" + value + "'";
                return FrameStatus::framing_error;
            }
            has_length = true;
        }
    }

    if (!has_length) {
        error = "missing Content-Length header";
        return FrameStatus::framing_error;
    }
    if (length <= 0) {
        error = "non-positive Content-Length " + std::to_string(length);
        return FrameStatus::framing_error;
    }

    auto wanted = static_cast<size_t>(length);
    while (buffer_.size() - pos_ < wanted) {
        size_t available = buffer_.size() - pos_;
        switch (fill(wanted - available)) {
            case FillResult::data:
                break;
            case FillResult::eof:
                error = "stream closed after " + std::to_string(available) + " of " + std::to_string(wanted) +
                        " body bytes";
                return FrameStatus::end_of_stream;
            case FillResult::error:
                error = io_error_;
                return FrameStatus::framing_error;
        }
    }

    payload.assign(buffer_, pos_, wanted);
    pos_ += wanted;
    compact();
    return FrameStatus::ok;
}

FrameStatus FrameReader::read_line_frame(std::string& payload, std::string& error) {
    std::string line;
    for (;;) {
        FrameStatus status = read_line(line, error);
        if (status != FrameStatus::ok) {
            return status;
        }
        if (trim(line).empty()) {
            continue;
        }
        payload = std::move(line);
        compact();
        return FrameStatus::ok;
    }
}

void FrameReader::compact() {
    if (pos_ == buffer_.size()) {
        buffer_.clear();
        pos_ = 0;
    } else if (pos_ > kMaxReadChunk) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
}

} // namespace mcp
