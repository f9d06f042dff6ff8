#include "io/blastdb_fetcher.hpp"
#include "io/blastdb_reader.hpp"

#include <algorithm>

namespace seqreport {

static void write_fasta_record(std::string& out, const std::string& id,
                               const std::string& title,
                               const std::string& residues) {
    out += '>';
    out += id;
    if (!title.empty()) {
        out += ' ';
        out += title;
    }
    out += '\n';
    for (size_t i = 0; i < residues.size(); i += kFastaLineWidth) {
        size_t len = std::min(kFastaLineWidth, residues.size() - i);
        out.append(residues, i, len);
        out += '\n';
    }
}

std::string fetch_from_blastdb(const std::vector<std::string>& ids,
                               const std::string& db_path,
                               const Logger& logger) {
    BlastDbReader db;
    std::string error_msg;
    if (!db.open(db_path, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return {};
    }

    std::string out;
    for (const auto& id : ids) {
        auto oids = db.find_oids(id);
        if (oids.empty()) {
            logger.debug("'%s' not in %s", id.c_str(), db_path.c_str());
            continue;
        }
        if (oids.size() > 1) {
            logger.warn("'%s' matches %zu sequences in %s; using the first",
                        id.c_str(), oids.size(), db_path.c_str());
        }

        uint32_t oid = oids.front();
        std::string residues = db.get_sequence(oid);
        if (residues.empty()) {
            logger.warn("Failed to read sequence of '%s' (OID %u) from %s",
                        id.c_str(), oid, db_path.c_str());
            continue;
        }
        write_fasta_record(out, id, db.get_defline_title(oid), residues);
    }
    return out;
}

SequenceFetchFn make_blastdb_fetcher(const Logger& logger) {
    const Logger* log = &logger;
    return [log](const std::vector<std::string>& ids, const std::string& db) {
        return fetch_from_blastdb(ids, db, *log);
    };
}

} // namespace seqreport
