#include "query/query_normalizer.hpp"
#include "util/string_utils.hpp"

#include <unordered_map>

namespace seqreport {

std::string submission_label(std::time_t when) {
    std::tm tm_buf{};
    localtime_r(&when, &tm_buf);
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf),
                             "Submitted at %H:%M, %A, %B %d, %Y", &tm_buf);
    return std::string(buf, n);
}

std::string to_fasta(const std::string& text, const std::string& label) {
    std::string seq = lstrip(text);
    if (seq.empty()) return seq;

    if (seq[0] != '>') {
        seq.insert(0, ">" + label + "\n");
    }

    std::unordered_map<std::string, int> seen;
    std::string out;
    out.reserve(seq.size() + 16);

    size_t pos = 0;
    while (pos < seq.size()) {
        size_t eol = seq.find('\n', pos);
        size_t next = (eol == std::string::npos) ? seq.size() : eol + 1;

        // Header id: the run of non-space characters right after '>'.
        size_t id_end = pos + 1;
        if (seq[pos] == '>') {
            while (id_end < next && !is_space(seq[id_end])) id_end++;
        }

        if (seq[pos] == '>' && id_end > pos + 1) {
            std::string key = seq.substr(pos, id_end - pos);
            int count = ++seen[key];
            out += key;
            if (count > 1) {
                out += '_';
                out += std::to_string(count - 1);
            }
            out.append(seq, id_end, next - id_end);
        } else {
            out.append(seq, pos, next - pos);
        }
        pos = next;
    }
    return out;
}

std::string to_fasta(const std::string& text) {
    return to_fasta(text, submission_label(std::time(nullptr)));
}

} // namespace seqreport
