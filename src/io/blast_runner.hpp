#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace seqreport {

// Runs a BLAST+ program with HTML output and captures its report.
class BlastRunner {
public:
    // bin_dir: directory holding the BLAST+ executables; empty = use PATH.
    explicit BlastRunner(std::string bin_dir = {});

    // Arguments passed to the program for req (the query goes to stdin).
    std::vector<std::string> build_args(const AlignmentRequest& req) const;

    // Program path for req.method.
    std::string program(const AlignmentRequest& req) const;

    // Printable command line, for logging.
    std::string command(const AlignmentRequest& req) const;

    // Run BLAST and wait for it. On success, result.lines holds the report.
    // On failure, error_status is 400 when BLAST rejected the query or its
    // options (exit code 1) and 500 otherwise; error_message holds stderr.
    AlignmentResult run(const AlignmentRequest& req) const;

private:
    std::string bin_dir_;
};

} // namespace seqreport
