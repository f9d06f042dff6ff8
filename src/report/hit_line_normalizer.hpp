#pragma once

#include <string>

namespace seqreport {

// BLAST writes an empty named anchor into every hit header of its HTML
// report. Its position depends on how the database was formatted; both
// rules below remove it so the line can be linked again.

// Database formatted with -parse_seqids: ">ID<a name=...></a> rest".
// On a match, writes ">ID rest" to out and returns true.
bool strip_trailing_anchor(const std::string& line, std::string& out);

// Database formatted without -parse_seqids: "><a name=...></a>ID rest".
// On a match, writes ">ID rest" to out and returns true.
bool strip_leading_anchor(const std::string& line, std::string& out);

// Apply both rules in order. Lines without an anchor are returned unchanged.
std::string normalize_hit_line(const std::string& line);

} // namespace seqreport
