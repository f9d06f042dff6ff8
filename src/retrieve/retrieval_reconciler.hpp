#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "util/logger.hpp"

namespace seqreport {

// Fetch the FASTA records of ids from one database. Ids not present in the
// database are simply absent from the result, which may be empty.
using SequenceFetchFn = std::function<std::string(
    const std::vector<std::string>& ids, const std::string& database)>;

// Build a request from the whitespace-separated "id" and "db" parameters of
// a get_sequence link. Ids are deduplicated keeping first occurrences;
// databases are kept as given.
RetrievalRequest parse_retrieval_request(const std::string& id_param,
                                         const std::string& db_param);

// Number of lines starting with '>'.
size_t count_fasta_headers(const std::string& fasta);

// Fetch req.sequence_ids from every database in turn and concatenate the
// non-empty results.
RetrievalResult fetch_sequences(const RetrievalRequest& req,
                                const SequenceFetchFn& fetch,
                                const Logger& logger);

// HTML for a retrieval: a diagnostic when the number of sequences found
// differs from the number requested, then the sequences in <pre><code>.
std::string render_retrieval(const RetrievalRequest& req,
                             const RetrievalResult& result);

// fetch_sequences() followed by render_retrieval().
std::string reconcile_retrieval(const RetrievalRequest& req,
                                const SequenceFetchFn& fetch,
                                const Logger& logger);

} // namespace seqreport
