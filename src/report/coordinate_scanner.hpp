#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/types.hpp"

namespace seqreport {

// Index (0-based) of the first line after the hit header at hit_ordinal that
// contains ">lcl" or "Lambda". Returns lines.size() when there is none, so
// the hit extends to the end of the report.
size_t find_hit_boundary(const std::vector<ReportLine>& lines,
                         LineNo hit_ordinal);

// Subject coordinate span of the hit whose header is at hit_ordinal:
// min and max over the second and last fields of every "Sbjct" row between
// the header and its boundary. Fields that are not integers are ignored.
// Returns nullopt when no coordinate was found.
std::optional<CoordinateSpan> scan_hit_coordinates(
    const std::vector<ReportLine>& lines, LineNo hit_ordinal);

} // namespace seqreport
