#pragma once

#include <istream>
#include <string>
#include <vector>

namespace seqreport {

// Split text into lines without terminators ("\n" or "\r\n").
// A trailing newline does not produce an empty last line.
std::vector<std::string> split_report_lines(const std::string& text);

// Read all lines from an input stream.
std::vector<std::string> read_report_stream(std::istream& in);

// Read all lines of a report file. path can be "-" for stdin.
// Returns false and sets error_msg if the file cannot be opened.
bool read_report(const std::string& path, std::vector<std::string>& lines,
                 std::string& error_msg);

} // namespace seqreport
