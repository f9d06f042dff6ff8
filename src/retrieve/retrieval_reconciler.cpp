#include "retrieve/retrieval_reconciler.hpp"
#include "util/string_utils.hpp"

#include <unordered_set>

namespace seqreport {

static std::string sequences_word(size_t n) {
    return n == 1 ? "sequence" : "sequences";
}

RetrievalRequest parse_retrieval_request(const std::string& id_param,
                                         const std::string& db_param) {
    RetrievalRequest req;
    std::unordered_set<std::string> seen;
    for (auto& id : split_whitespace(id_param)) {
        if (seen.insert(id).second) req.sequence_ids.push_back(std::move(id));
    }
    req.databases = split_whitespace(db_param);
    return req;
}

size_t count_fasta_headers(const std::string& fasta) {
    size_t n = 0;
    bool at_line_start = true;
    for (char c : fasta) {
        if (at_line_start && c == '>') n++;
        at_line_start = (c == '\n');
    }
    return n;
}

RetrievalResult fetch_sequences(const RetrievalRequest& req,
                                const SequenceFetchFn& fetch,
                                const Logger& logger) {
    std::string ids = join(req.sequence_ids, ", ");
    logger.info("Looking for: '%s' in '%s'", ids.c_str(),
                join(req.databases, ", ").c_str());

    // Hits do not say which database they came from, so every database
    // used for the search is tried.
    RetrievalResult result;
    for (const auto& db : req.databases) {
        std::string found = fetch(req.sequence_ids, db);
        if (found.empty()) {
            logger.debug("'%s' not found in %s", ids.c_str(), db.c_str());
            continue;
        }
        if (found.back() != '\n') found += '\n';
        result.sequences += found;
    }
    result.found_count = count_fasta_headers(result.sequences);
    return result;
}

std::string render_retrieval(const RetrievalRequest& req,
                             const RetrievalResult& result) {
    size_t requested = req.sequence_ids.size();
    size_t found = result.found_count;

    std::string out;
    if (found != requested) {
        out += "<h1>ERROR: incorrect number of sequences found.</h1>\n";
        out += "<p>Dear user,</p>\n\n";
        out += "<p><strong>We have found\n<em>";
        out += (found > requested) ? "more" : "less";
        out += "</em>\nsequence than expected.</strong></p>\n\n";
        out += "<p>This is likely due to a problem with how databases are "
               "formatted.\n<strong>Please share this text with the person "
               "managing this website so\nthey can resolve the issue."
               "</strong></p>\n\n";
        out += "<p> You requested " + std::to_string(requested) + " " +
               sequences_word(requested) +
               "\nwith the following identifiers: <code>" +
               html_escape(join(req.sequence_ids, ", ")) +
               "</code>,\nfrom the following databases: <code>" +
               html_escape(join(req.databases, ", ")) + "</code>.\n";
        out += "But we found " + std::to_string(found) + " " +
               sequences_word(found) + ".\n</p>\n\n";
        out += "<p>If sequences were retrieved, you can find them below "
               "(but some may be incorrect, so be careful!).</p>\n<hr/>\n";
    }

    out += "<pre><code>" + html_escape(result.sequences) + "</code></pre>";
    return out;
}

std::string reconcile_retrieval(const RetrievalRequest& req,
                                const SequenceFetchFn& fetch,
                                const Logger& logger) {
    RetrievalResult result = fetch_sequences(req, fetch, logger);
    if (result.found_count != req.sequence_ids.size()) {
        logger.warn("Requested %zu sequence(s) but found %zu",
                    req.sequence_ids.size(), result.found_count);
    }
    return render_retrieval(req, result);
}

} // namespace seqreport
