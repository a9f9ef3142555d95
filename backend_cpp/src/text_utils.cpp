#include "text_utils.hpp"
#include <cctype>

namespace data_analyst {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

std::string utf8_safe_tail(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    size_t start = str.length() - length;
    // 10xxxxxx bytes continue a sequence that began before the cut
    while (start < str.length() &&
           (static_cast<unsigned char>(str[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return str.substr(start);
}

std::string tail_excerpt(const std::string& text, size_t max_bytes) {
    if (text.length() <= max_bytes) return text;
    std::string tail = utf8_safe_tail(text, max_bytes);
    size_t dropped = text.length() - tail.length();
    return "...[" + std::to_string(dropped) + " bytes truncated]\n" + tail;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace data_analyst
