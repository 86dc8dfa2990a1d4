#pragma once

#include <cstddef>
#include <string>

namespace mcp {

enum class FramingMode {
    content_length,    // "Content-Length: <n>\r\n\r\n<payload>"
    newline_delimited, // one JSON document per line
};

enum class FrameStatus {
    ok,
    end_of_stream,
    framing_error,
};

const char* to_string(FrameStatus status);

/// Parses "header" / "content-length" and "newline" / "ndjson"; returns false on anything else.
bool parse_framing_mode(const std::string& text, FramingMode& mode);

std::string encode_frame(const std::string& payload, FramingMode mode = FramingMode::content_length);

/**
 * Blocking frame decoder over a file descriptor.
 *
 * The reader never returns a short payload: either the whole declared body
 * is available, or the stream ended (end_of_stream), or the header block
 * could not be trusted (framing_error, fatal for the connection).
 *
 * An optional wakeup descriptor lets another thread interrupt a blocked
 * read; when it becomes readable the reader reports end_of_stream.
 */
class FrameReader {
public:
    explicit FrameReader(int fd, FramingMode mode = FramingMode::content_length);

    FrameStatus read_frame(std::string& payload, std::string& error);

    void set_wakeup_fd(int fd) { wakeup_fd_ = fd; }
    int fd() const { return fd_; }
    FramingMode mode() const { return mode_; }

    static constexpr size_t kMaxHeaderLine = 8192;

private:
    enum class FillResult { data, eof, error };

    int fd_;
    int wakeup_fd_ = -1;
    FramingMode mode_;
    std::string buffer_;
    size_t pos_ = 0;
    std::string io_error_;

    FillResult fill(size_t hint);
    FrameStatus read_line(std::string& line, std::string& error);
    FrameStatus read_header_frame(std::string& payload, std::string& error);
    FrameStatus read_line_frame(std::string& payload, std::string& error);
    void compact();
};

} // namespace mcp
