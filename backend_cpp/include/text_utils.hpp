#pragma once
#include <string>

namespace data_analyst {

// First `length` bytes of `str`, backed off so no UTF-8 sequence is split.
std::string utf8_safe_substr(const std::string& str, size_t length);

// Last `length` bytes of `str`, advanced past any leading continuation bytes.
std::string utf8_safe_tail(const std::string& str, size_t length);

// Keeps the end of `text` (where tracebacks finish) within `max_bytes`,
// prefixed with a marker saying how much was dropped.
std::string tail_excerpt(const std::string& text, size_t max_bytes);

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

} // namespace data_analyst
