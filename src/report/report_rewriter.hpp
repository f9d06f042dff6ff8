#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "report/hyperlink_resolver.hpp"
#include "util/logger.hpp"

namespace seqreport {

// Number the raw lines of a report 1, 2, 3, ...
std::vector<ReportLine> make_report_lines(const std::vector<std::string>& texts);

struct RenderedReport {
    std::string html;
    std::vector<QueryBlock> queries;          // in report order
    std::vector<std::string> retrievable_ids; // linked hits, first appearance
    size_t hit_count = 0;
    bool summary_injected = false;
};

// Rewrites the HTML report of one BLAST run into a fragment with one
// <div class="resultn"> per query, linked hit lines, the database summary
// moved after the alignments and the reference block moved to the end.
//
// Fixed report shape: lines 1-5 banner (dropped), line 6 body, lines 7-15
// reference, then the database summary up to and including the
// "total letters" line, then the body.
class ReportRewriter {
public:
    ReportRewriter(const HyperlinkResolver& resolver, const Logger& logger);

    RenderedReport render(const std::vector<ReportLine>& lines,
                          const std::vector<std::string>& databases) const;

    std::string rewrite(const std::vector<ReportLine>& lines,
                        const std::vector<std::string>& databases) const {
        return render(lines, databases).html;
    }

private:
    struct PassState;

    void on_banner_line(PassState& st, const ReportLine& line) const;
    void on_reference_line(PassState& st, const ReportLine& line) const;
    void on_summary_line(PassState& st, const ReportLine& line) const;
    void on_body_line(PassState& st, const ReportLine& line) const;

    const HyperlinkResolver& resolver_;
    const Logger& logger_;
};

} // namespace seqreport
