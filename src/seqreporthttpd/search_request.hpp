#pragma once

#include <string>

#include "core/types.hpp"
#include "io/database_set.hpp"

namespace seqreport {

// Fields of a submitted search form.
struct SearchForm {
    std::string method;
    std::string sequence;
    std::string databases;  // database ids, whitespace-separated
    std::string advanced;
};

// Validate form and turn it into a BLAST run over the selected databases.
// The query is normalized with to_fasta() and the advanced options are
// completed with prepare_advanced_options().
// On failure returns false with status 400 and a message for the user.
bool build_alignment_request(const SearchForm& form, const DatabaseSet& dbs,
                             int num_threads, AlignmentRequest& out,
                             int& status, std::string& error_msg);

} // namespace seqreport
