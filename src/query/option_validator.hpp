#pragma once

#include <string>
#include <vector>

namespace seqreport {

// BLAST+ programs a search may run.
const std::vector<std::string>& blast_methods();

// Returns false and sets error_msg unless method is one of blast_methods().
bool validate_method(const std::string& method, std::string& error_msg);

// Check user-supplied extra BLAST options. Only letters, digits, space and
// "-_.'" are allowed, and options used internally (-out, -html, -outfmt,
// -db, -query) may not be given. Returns false and sets error_msg otherwise.
bool validate_advanced_options(const std::string& options,
                               std::string& error_msg);

// Complete the option string for a run: blastn defaults to "-task blastn"
// (not megablast) unless a task is given, and the thread count is appended.
std::string prepare_advanced_options(const std::string& method,
                                     const std::string& options,
                                     int num_threads);

} // namespace seqreport
