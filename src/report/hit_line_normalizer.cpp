#include "report/hit_line_normalizer.hpp"

namespace seqreport {

// Length of the empty anchor "<a ...></a>" starting at pos, or 0 if there is
// none. The tag name must end right after "<a"; attributes may not contain '>'.
static size_t empty_anchor_at(const std::string& line, size_t pos) {
    if (line.compare(pos, 2, "<a") != 0) return 0;
    size_t after_name = pos + 2;
    if (after_name >= line.size()) return 0;
    char c = line[after_name];
    if (c != '>' && c != ' ' && c != '\t') return 0;

    size_t close = line.find('>', after_name);
    if (close == std::string::npos) return 0;
    if (line.compare(close + 1, 4, "</a>") != 0) return 0;
    return close + 5 - pos;
}

bool strip_trailing_anchor(const std::string& line, std::string& out) {
    if (line.size() < 2 || line[0] != '>') return false;

    // The id takes at least one character; the first anchor after it wins.
    for (size_t pos = line.find("<a", 2); pos != std::string::npos;
         pos = line.find("<a", pos + 1)) {
        size_t len = empty_anchor_at(line, pos);
        if (len == 0) continue;
        out = line.substr(0, pos) + line.substr(pos + len);
        return true;
    }
    return false;
}

bool strip_leading_anchor(const std::string& line, std::string& out) {
    if (line.empty() || line[0] != '>') return false;
    size_t len = empty_anchor_at(line, 1);
    if (len == 0) return false;
    out = ">" + line.substr(1 + len);
    return true;
}

std::string normalize_hit_line(const std::string& line) {
    std::string result = line;
    std::string stripped;
    if (strip_trailing_anchor(result, stripped)) {
        result = std::move(stripped);
    }
    if (strip_leading_anchor(result, stripped)) {
        result = std::move(stripped);
    }
    return result;
}

} // namespace seqreport
