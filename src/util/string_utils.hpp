#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace seqreport {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           s.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

// Split on runs of whitespace; no empty fields.
inline std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) i++;
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) i++;
        if (i > start) fields.push_back(s.substr(start, i - start));
    }
    return fields;
}

inline std::string join(const std::vector<std::string>& parts,
                        const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::string lstrip(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) i++;
    return s.substr(i);
}

inline std::string strip(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && is_space(s[b])) b++;
    size_t e = s.size();
    while (e > b && is_space(s[e - 1])) e--;
    return s.substr(b, e - b);
}

// Escape the characters that are significant in HTML text and attributes.
inline std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace seqreport
