#include "io/blast_runner.hpp"
#include "io/report_reader.hpp"
#include "util/string_utils.hpp"

#include <connect/ncbi_pipe.hpp>

#include <sstream>

namespace seqreport {

// blast_app_exit_codes: 1 = error in query sequence(s) or BLAST options.
static constexpr int kBlastInputError = 1;

BlastRunner::BlastRunner(std::string bin_dir) : bin_dir_(std::move(bin_dir)) {
    if (!bin_dir_.empty() && bin_dir_.back() == '/') {
        bin_dir_.pop_back();
    }
}

std::string BlastRunner::program(const AlignmentRequest& req) const {
    if (bin_dir_.empty()) return req.method;
    return bin_dir_ + "/" + req.method;
}

// Split options the way a POSIX shell splits words: whitespace separates
// arguments except inside quotes, and the quotes themselves are removed.
// "-entrez_query 'a b'" gives {"-entrez_query", "a b"}.
static std::vector<std::string> split_option_words(const std::string& options) {
    std::vector<std::string> words;
    std::string cur;
    bool in_word = false;
    char quote = '\0';
    for (char c : options) {
        if (quote != '\0') {
            if (c == quote) quote = '\0';
            else cur += c;
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (is_space(c)) {
            if (in_word) words.push_back(std::move(cur));
            cur.clear();
            in_word = false;
        } else {
            cur += c;
            in_word = true;
        }
    }
    // An unterminated quote runs to the end of the string.
    if (in_word) words.push_back(std::move(cur));
    return words;
}

std::vector<std::string> BlastRunner::build_args(const AlignmentRequest& req) const {
    std::vector<std::string> args = {"-db", join(req.databases, " "), "-html"};
    for (auto& word : split_option_words(req.advanced_options)) {
        args.push_back(std::move(word));
    }
    return args;
}

std::string BlastRunner::command(const AlignmentRequest& req) const {
    std::string cmd = program(req);
    for (const auto& a : build_args(req)) {
        cmd += ' ';
        if (a.find(' ') != std::string::npos) {
            cmd += "'" + a + "'";
        } else {
            cmd += a;
        }
    }
    return cmd;
}

AlignmentResult BlastRunner::run(const AlignmentRequest& req) const {
    AlignmentResult result;

    std::istringstream in(req.query);
    std::ostringstream out;
    std::ostringstream err;
    int exit_code = 0;

    try {
        ncbi::CPipe::EFinish finish = ncbi::CPipe::ExecWait(
            program(req), build_args(req), in, out, err, exit_code);
        if (finish != ncbi::CPipe::eDone) {
            result.error_status = 500;
            result.error_message = "BLAST was terminated before it finished";
            return result;
        }
    } catch (const std::exception& e) {
        result.error_status = 500;
        result.error_message = std::string("Failed to run BLAST: ") + e.what();
        return result;
    }

    if (exit_code != 0) {
        result.error_status = (exit_code == kBlastInputError) ? 400 : 500;
        result.error_message = strip(err.str());
        if (result.error_message.empty()) {
            result.error_message =
                "BLAST exited with status " + std::to_string(exit_code);
        }
        return result;
    }

    result.success = true;
    result.lines = split_report_lines(out.str());
    return result;
}

} // namespace seqreport
