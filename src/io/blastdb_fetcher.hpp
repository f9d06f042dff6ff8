#pragma once

#include <string>
#include <vector>

#include "retrieve/retrieval_reconciler.hpp"
#include "util/logger.hpp"

namespace seqreport {

// Residues per line in fetched FASTA records (blastdbcmd default).
inline constexpr size_t kFastaLineWidth = 80;

// Look up ids in the BLAST DB at db_path and return their FASTA records,
// in the order of ids. Ids not in the database are skipped; a database
// that cannot be opened yields an empty string (logged as an error).
std::string fetch_from_blastdb(const std::vector<std::string>& ids,
                               const std::string& db_path,
                               const Logger& logger);

// fetch_from_blastdb() as the fetch capability of the retrieval reconciler.
// logger must outlive the returned function.
SequenceFetchFn make_blastdb_fetcher(const Logger& logger);

} // namespace seqreport
