#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seqreport {

using LineNo = uint32_t;   // 1-based line ordinal within a report
using SeqCoord = int64_t;  // subject sequence coordinate

// One line of an alignment report, without its line terminator.
struct ReportLine {
    LineNo ordinal;
    std::string text;
};

// Report regions, in the order they appear. Body is terminal.
enum class ReportSection : uint8_t {
    kBanner = 0,
    kReference = 1,
    kDatabaseSummary = 2,
    kBody = 3,
};

struct QueryBlock {
    uint32_t ordinal = 0;  // 1-based; 0 = no query seen yet
    std::string label;
};

// Min and max subject coordinates covered by a hit's Sbjct rows.
struct CoordinateSpan {
    SeqCoord min;
    SeqCoord max;
};

inline bool operator==(const CoordinateSpan& a, const CoordinateSpan& b) {
    return a.min == b.min && a.max == b.max;
}

struct HitRecord {
    std::string line;
    std::string sequence_id;
    std::optional<CoordinateSpan> span;
    std::optional<std::string> link;
};

struct HyperlinkRequest {
    std::string sequence_id;
    std::vector<std::string> databases;
    std::optional<CoordinateSpan> span;
    std::string hit_line;  // normalized hit header line
};

struct RetrievalRequest {
    std::vector<std::string> sequence_ids;  // deduplicated, order-preserving
    std::vector<std::string> databases;     // not deduplicated
};

struct RetrievalResult {
    std::string sequences;  // concatenated FASTA text
    size_t found_count = 0;
};

// Input of one BLAST+ run.
struct AlignmentRequest {
    std::string method;
    std::string query;                    // FASTA text
    std::vector<std::string> databases;   // BLAST DB paths
    std::string advanced_options;
};

// Output of one BLAST+ run. error_status follows HTTP conventions
// (400 = rejected input, 500 = failure of the run itself).
struct AlignmentResult {
    bool success = false;
    std::vector<std::string> lines;
    int error_status = 0;
    std::string error_message;
};

} // namespace seqreport
