#include "seqreporthttpd/search_request.hpp"
#include "query/option_validator.hpp"
#include "query/query_normalizer.hpp"
#include "util/string_utils.hpp"

namespace seqreport {

static bool reject(int& status, std::string& error_msg, std::string msg) {
    status = 400;
    error_msg = std::move(msg);
    return false;
}

bool build_alignment_request(const SearchForm& form, const DatabaseSet& dbs,
                             int num_threads, AlignmentRequest& out,
                             int& status, std::string& error_msg) {
    if (form.method.empty()) {
        return reject(status, error_msg, "No BLAST method provided.");
    }
    if (strip(form.sequence).empty()) {
        return reject(status, error_msg, "No input sequence provided.");
    }
    auto db_ids = split_whitespace(form.databases);
    if (db_ids.empty()) {
        return reject(status, error_msg, "No BLAST database provided.");
    }

    std::string err;
    if (!validate_method(form.method, err)) {
        return reject(status, error_msg, err);
    }
    if (!validate_advanced_options(form.advanced, err)) {
        return reject(status, error_msg, "Advanced parameters invalid: " + err);
    }

    out = AlignmentRequest{};
    for (const auto& id : db_ids) {
        const DatabaseEntry* entry = dbs.find(id);
        if (!entry) {
            return reject(status, error_msg, "Unknown BLAST database: " + id + ".");
        }
        out.databases.push_back(entry->path);
    }

    out.method = form.method;
    out.query = to_fasta(form.sequence);
    out.advanced_options =
        prepare_advanced_options(form.method, form.advanced, num_threads);
    return true;
}

} // namespace seqreport
