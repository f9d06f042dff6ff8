#include "report/coordinate_scanner.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace seqreport {

static bool parse_coord(const std::string& field, SeqCoord& out) {
    if (field.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(field.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<SeqCoord>(v);
    return true;
}

size_t find_hit_boundary(const std::vector<ReportLine>& lines,
                         LineNo hit_ordinal) {
    // Line with ordinal n sits at index n - 1; scanning starts after it.
    for (size_t i = hit_ordinal; i < lines.size(); i++) {
        const std::string& text = lines[i].text;
        if (contains(text, ">lcl") || contains(text, "Lambda")) {
            return i;
        }
    }
    return lines.size();
}

std::optional<CoordinateSpan> scan_hit_coordinates(
    const std::vector<ReportLine>& lines, LineNo hit_ordinal) {
    size_t end = find_hit_boundary(lines, hit_ordinal);

    bool found = false;
    CoordinateSpan span{0, 0};
    for (size_t i = hit_ordinal; i < end; i++) {
        if (!contains(lines[i].text, "Sbjct")) continue;

        auto fields = split_whitespace(lines[i].text);
        if (fields.size() < 2) continue;

        const std::string* candidates[2] = {&fields[1], &fields.back()};
        for (const std::string* field : candidates) {
            SeqCoord v;
            if (!parse_coord(*field, v)) continue;
            if (!found) {
                span = {v, v};
                found = true;
            } else {
                span.min = std::min(span.min, v);
                span.max = std::max(span.max, v);
            }
        }
    }

    if (!found) return std::nullopt;
    return span;
}

} // namespace seqreport
