#include "report/report_rewriter.hpp"
#include "report/coordinate_scanner.hpp"
#include "report/hit_line_normalizer.hpp"
#include "util/string_utils.hpp"

namespace seqreport {

// Last line of the banner and last line of the reference block.
static constexpr LineNo kBannerEnd = 5;
static constexpr LineNo kReferenceStart = 7;
static constexpr LineNo kReferenceEnd = 15;

static const char* const kDroppedPrefixes[] = {"</BODY>", "</HTML>", "</PRE>"};

static const char kQueryMarker[] = "<b>Query=</b> ";

// Remove every <script src="..."></script> from text.
static std::string strip_script_tags(const std::string& text) {
    static const std::string kOpen = "<script src=\"";
    static const std::string kClose = "\"></script>";

    std::string out;
    size_t copied = 0;
    size_t pos = text.find(kOpen);
    while (pos != std::string::npos) {
        size_t quote = text.find('"', pos + kOpen.size());
        if (quote == std::string::npos) break;
        if (text.compare(quote, kClose.size(), kClose) == 0) {
            out.append(text, copied, pos - copied);
            copied = quote + kClose.size();
            pos = text.find(kOpen, copied);
        } else {
            pos = text.find(kOpen, pos + 1);
        }
    }
    out.append(text, copied, std::string::npos);
    return out;
}

std::vector<ReportLine> make_report_lines(const std::vector<std::string>& texts) {
    std::vector<ReportLine> lines;
    lines.reserve(texts.size());
    LineNo n = 0;
    for (const auto& t : texts) {
        lines.push_back({++n, t});
    }
    return lines;
}

struct ReportRewriter::PassState {
    const std::vector<ReportLine>& lines;
    const std::vector<std::string>& databases;

    ReportSection section = ReportSection::kBanner;
    std::string reference;
    std::string summary;
    std::string body;

    QueryBlock query;
    bool query_open = false;
    bool summary_injected = false;

    RetrievableIds retrievable;
    std::vector<QueryBlock> queries;
    size_t hit_count = 0;

    PassState(const std::vector<ReportLine>& l, const std::vector<std::string>& d)
        : lines(l), databases(d) {}

    void emit(const std::string& s) {
        body += s;
        body += '\n';
    }
};

ReportRewriter::ReportRewriter(const HyperlinkResolver& resolver,
                               const Logger& logger)
    : resolver_(resolver), logger_(logger) {}

void ReportRewriter::on_banner_line(PassState& st, const ReportLine& line) const {
    if (line.ordinal <= kBannerEnd) return;

    // The line between banner and reference is not part of either.
    st.section = ReportSection::kReference;
    if (line.ordinal < kReferenceStart) {
        on_body_line(st, line);
    } else {
        on_reference_line(st, line);
    }
}

void ReportRewriter::on_reference_line(PassState& st, const ReportLine& line) const {
    if (line.ordinal > kReferenceEnd) {
        st.section = ReportSection::kDatabaseSummary;
        on_summary_line(st, line);
        return;
    }
    st.reference += line.text;
    st.reference += '\n';
    if (line.ordinal == kReferenceEnd) {
        st.section = ReportSection::kDatabaseSummary;
    }
}

void ReportRewriter::on_summary_line(PassState& st, const ReportLine& line) const {
    st.summary += line.text;
    st.summary += '\n';
    if (contains(line.text, "total letters")) {
        st.section = ReportSection::kBody;
    }
}

void ReportRewriter::on_body_line(PassState& st, const ReportLine& line) const {
    for (const char* prefix : kDroppedPrefixes) {
        if (starts_with(line.text, prefix)) return;
    }

    std::string text = strip_script_tags(line.text);

    if (!text.empty() && text[0] == '>') {
        HitRecord hit;
        hit.line = normalize_hit_line(text);
        hit.span = scan_hit_coordinates(st.lines, line.ordinal);
        st.emit(resolver_.resolve(hit, st.databases, st.retrievable));
        st.hit_count++;
        return;
    }

    if (starts_with(text, kQueryMarker)) {
        std::string label = text.substr(sizeof(kQueryMarker) - 1);
        if (st.query_open) {
            st.emit("</pre></div>");
        }
        st.query.ordinal++;
        st.query.label = label;
        st.queries.push_back(st.query);
        st.query_open = true;
        std::string escaped = html_escape(label);
        st.emit("<div class=\"resultn\" id=\"" + escaped + "\">");
        st.emit("<h3>Query= " + escaped + "</h3><pre>");
        return;
    }

    if (!st.summary_injected && starts_with(text, "  Database: ")) {
        if (st.query_open) {
            st.emit("</pre></div>");
            st.query_open = false;
        }
        st.emit("<pre>" + st.summary);
        st.emit(text);
        st.summary_injected = true;
        return;
    }

    st.emit(text);
}

RenderedReport ReportRewriter::render(const std::vector<ReportLine>& lines,
                                      const std::vector<std::string>& databases) const {
    PassState st(lines, databases);

    for (const auto& line : lines) {
        switch (st.section) {
            case ReportSection::kBanner:          on_banner_line(st, line); break;
            case ReportSection::kReference:       on_reference_line(st, line); break;
            case ReportSection::kDatabaseSummary: on_summary_line(st, line); break;
            case ReportSection::kBody:            on_body_line(st, line); break;
        }
    }

    if (st.section == ReportSection::kDatabaseSummary) {
        logger_.warn("Report has no 'total letters' line; "
                     "treated everything after line %u as database summary",
                     static_cast<unsigned>(kReferenceEnd));
    }

    // Close whatever preformatted block is still open. A report with neither
    // a query nor a Database: marker has none, and gets no closing tag.
    if (st.query_open) {
        st.body += "</pre></div>";
    } else if (st.summary_injected) {
        st.body += "</pre>";
    }

    RenderedReport out;
    out.html = "<h2>Results</h2>";
    if (!st.retrievable.empty()) {
        out.html += "<a href='" + resolver_.url_prefix() + "/get_sequence/?id=" +
                    join(st.retrievable.ids(), " ") + "&db=" +
                    join(databases, " ") + "'>FASTA of " +
                    std::to_string(st.retrievable.size()) +
                    " retrievable hit(s)</a>";
    }
    out.html += "<br/><br/>";
    out.html += st.body;
    out.html += "<br/>";
    out.html += "<pre>" + strip(st.reference) + "</pre>";

    out.queries = std::move(st.queries);
    out.retrievable_ids = st.retrievable.ids();
    out.hit_count = st.hit_count;
    out.summary_injected = st.summary_injected;

    logger_.debug("Rewrote report: %zu line(s), %zu query block(s), %zu hit(s), "
                  "%zu linked", lines.size(), out.queries.size(), out.hit_count,
                  out.retrievable_ids.size());
    return out;
}

} // namespace seqreport
