#include "random_text.hpp"

#include <cerrno>
#include <cstdlib>
#include <random>

namespace mcp::handlers {

const char* const kAlphanumericChars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

const char* const kPrintableAsciiChars =
    " !\"#$%&'()*+,-./0123456789:;<=>?@ABCDEFGHIJKLMNOPQRSTUVWXYZ[\\]^_`abcdefghijklmnopqrstuvwxyz{|}~";

std::string random_text(std::size_t length, const std::string& charset) {
    if (charset.empty()) {
        return std::string();
    }
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, charset.size() - 1);

    std::string text;
    text.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        text.push_back(charset[pick(engine)]);
    }
    return text;
}

bool check_length(long long value, std::size_t& length, std::string& problem) {
    if (value <= 0) {
        problem = "length must be positive";
        return false;
    }
    if (value > static_cast<long long>(kMaxRandomLength)) {
        problem = "requested length " + std::to_string(value) + " exceeds maximum allowed length " +
                  std::to_string(kMaxRandomLength);
        return false;
    }
    length = static_cast<std::size_t>(value);
    return true;
}

bool parse_length(const std::string& text, std::size_t& length, std::string& problem) {
    if (text.empty()) {
        problem = "missing length";
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        problem = "invalid length '" + text + "'";
        return false;
    }
    return check_length(value, length, problem);
}

} // namespace mcp::handlers
