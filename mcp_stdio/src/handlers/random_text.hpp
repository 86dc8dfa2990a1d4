#pragma once

#include <cstddef>
#include <string>

namespace mcp::handlers {

inline constexpr std::size_t kMaxRandomLength = 1024;

extern const char* const kAlphanumericChars;
// ' ' through '~'
extern const char* const kPrintableAsciiChars;

/// Returns length characters drawn uniformly from charset.
std::string random_text(std::size_t length, const std::string& charset);

/**
 * Reads a length argument given as a JSON integer or a decimal string.
 * On failure returns false and fills problem.
 */
bool parse_length(const std::string& text, std::size_t& length, std::string& problem);
bool check_length(long long value, std::size_t& length, std::string& problem);

} // namespace mcp::handlers
