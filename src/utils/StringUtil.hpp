#pragma once
#include <string>
#include <vector>
#include <algorithm>

namespace LinkPreview {
namespace StringUtil {

inline bool IsAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && IsAsciiSpace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && IsAsciiSpace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

inline std::string ToLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

inline bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        unsigned char x = static_cast<unsigned char>(a[i]);
        unsigned char y = static_cast<unsigned char>(b[i]);
        if (x >= 'A' && x <= 'Z') x = static_cast<unsigned char>(x + 32);
        if (y >= 'A' && y <= 'Z') y = static_cast<unsigned char>(y + 32);
        if (x != y) return false;
    }
    return true;
}

// Case-insensitive substring test; needle must already be lowercase.
inline bool ContainsIgnoreCase(const std::string& haystack, const std::string& lower_needle) {
    return ToLowerAscii(haystack).find(lower_needle) != std::string::npos;
}

inline std::vector<std::string> SplitWhitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : s) {
        if (IsAsciiSpace(c)) {
            if (!current.empty()) tokens.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(static_cast<char>(c));
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

}
}
