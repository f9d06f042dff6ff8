#include "io/report_reader.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace seqreport {

std::vector<std::string> read_report_stream(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<std::string> split_report_lines(const std::string& text) {
    std::istringstream in(text);
    return read_report_stream(in);
}

bool read_report(const std::string& path, std::vector<std::string>& lines,
                 std::string& error_msg) {
    if (path == "-") {
        lines = read_report_stream(std::cin);
        return true;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    lines = read_report_stream(file);
    return true;
}

} // namespace seqreport
