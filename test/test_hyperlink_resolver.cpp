#include "test_util.hpp"
#include "report/hit_line_normalizer.hpp"
#include "report/hyperlink_resolver.hpp"
#include "util/logger.hpp"

#include <string>
#include <vector>

using namespace seqreport;

static Logger g_logger(Logger::kError);
static const std::vector<std::string> kDbs = {"/db/genome", "/db/cdna"};

static HitRecord make_hit(const std::string& line,
                          std::optional<CoordinateSpan> span = std::nullopt) {
    HitRecord hit;
    hit.line = line;
    hit.span = span;
    return hit;
}

static void test_split_hit_line() {
    std::fprintf(stderr, "-- test_split_hit_line\n");

    std::string prefix, id, rest;
    CHECK(split_hit_line(">lcl|seq1 some description", prefix, id, rest));
    CHECK_STR_EQ(prefix, "");
    CHECK_STR_EQ(id, "lcl|seq1");
    CHECK_STR_EQ(rest, " some description");

    CHECK(split_hit_line(">  seq2", prefix, id, rest));
    CHECK_STR_EQ(prefix, "  ");
    CHECK_STR_EQ(id, "seq2");
    CHECK_STR_EQ(rest, "");

    CHECK(!split_hit_line(">", prefix, id, rest));
    CHECK(!split_hit_line(">   ", prefix, id, rest));
    CHECK(!split_hit_line("seq", prefix, id, rest));
}

static void test_standard_link() {
    std::fprintf(stderr, "-- test_standard_link\n");

    HyperlinkResolver resolver(HyperlinkStrategies{}, "", g_logger);
    RetrievableIds ids;
    HitRecord hit = make_hit(">lcl|seq1 first subject", CoordinateSpan{101, 160});

    std::string out = resolver.resolve(hit, kDbs, ids);
    CHECK_STR_EQ(out,
        "><a href='/get_sequence/?id=lcl|seq1&db=/db/genome /db/cdna' "
        "target='_blank'>lcl|seq1</a> first subject");
    CHECK_STR_EQ(hit.sequence_id, "lcl|seq1");
    CHECK(hit.link.has_value());
    CHECK_EQ(ids.size(), 1u);
    CHECK_STR_EQ(ids.ids()[0], "lcl|seq1");
}

static void test_url_prefix() {
    std::fprintf(stderr, "-- test_url_prefix\n");

    HyperlinkResolver resolver(HyperlinkStrategies{}, "/blast", g_logger);
    RetrievableIds ids;
    HitRecord hit = make_hit(">seq9");
    std::string out = resolver.resolve(hit, {"/db/x"}, ids);
    CHECK_STR_EQ(out,
        "><a href='/blast/get_sequence/?id=seq9&db=/db/x' target='_blank'>seq9</a>");
}

static void test_no_id_no_link() {
    std::fprintf(stderr, "-- test_no_id_no_link\n");

    HyperlinkResolver resolver(HyperlinkStrategies{}, "", g_logger);
    RetrievableIds ids;

    // Whitespace right after '>' means there is nothing to link.
    HitRecord spaced = make_hit(">  seq2 description");
    CHECK_STR_EQ(resolver.resolve(spaced, kDbs, ids), ">  seq2 description");
    CHECK(!spaced.link.has_value());

    HitRecord empty = make_hit(">");
    CHECK_STR_EQ(resolver.resolve(empty, kDbs, ids), ">");
    CHECK(ids.empty());
}

static void test_line_strategy_wins() {
    std::fprintf(stderr, "-- test_line_strategy_wins\n");

    bool link_called = false;
    HyperlinkStrategies s;
    s.line = [](const HyperlinkRequest& req) -> std::optional<std::string> {
        if (!req.span) return std::nullopt;
        return "><a href='http://genome.example.org/" + req.sequence_id + ":" +
               std::to_string(req.span->min) + "-" +
               std::to_string(req.span->max) + "'>" + req.sequence_id + "</a>";
    };
    s.link = [&link_called](const HyperlinkRequest&) -> std::optional<std::string> {
        link_called = true;
        return std::string("/custom");
    };

    HyperlinkResolver resolver(s, "", g_logger);
    RetrievableIds ids;

    HitRecord hit = make_hit(">scaffold1 desc", CoordinateSpan{5, 50});
    CHECK_STR_EQ(resolver.resolve(hit, kDbs, ids),
                 "><a href='http://genome.example.org/scaffold1:5-50'>scaffold1</a>");
    CHECK(!link_called);
    CHECK(ids.empty());

    // Declining the line falls through to the link strategy.
    HitRecord no_span = make_hit(">scaffold2 desc");
    CHECK_STR_EQ(resolver.resolve(no_span, kDbs, ids),
                 "><a href='/custom' target='_blank'>scaffold2</a> desc");
    CHECK(link_called);
    CHECK_EQ(ids.size(), 1u);
}

static void test_link_strategy_replaces_standard() {
    std::fprintf(stderr, "-- test_link_strategy_replaces_standard\n");

    HyperlinkStrategies s;
    s.link = [](const HyperlinkRequest& req) -> std::optional<std::string> {
        if (req.sequence_id.rfind("lcl|", 0) == 0) return std::nullopt;
        return "/browse/" + req.sequence_id + "?db=" + req.databases.front();
    };

    HyperlinkResolver resolver(s, "", g_logger);
    RetrievableIds ids;

    HitRecord a = make_hit(">chr2 chromosome 2");
    CHECK_STR_EQ(resolver.resolve(a, kDbs, ids),
                 "><a href='/browse/chr2?db=/db/genome' target='_blank'>chr2</a> chromosome 2");

    // A registered link strategy that declines means no link at all.
    HitRecord b = make_hit(">lcl|seq1 local");
    CHECK_STR_EQ(resolver.resolve(b, kDbs, ids), ">lcl|seq1 local");
    CHECK(!b.link.has_value());
    CHECK_EQ(ids.size(), 1u);
}

static void test_no_strategies_at_all() {
    std::fprintf(stderr, "-- test_no_strategies_at_all\n");

    HyperlinkStrategies s;
    s.standard = nullptr;
    HyperlinkResolver resolver(s, "", g_logger);
    RetrievableIds ids;
    HitRecord hit = make_hit(">seq1 x");
    CHECK_STR_EQ(resolver.resolve(hit, kDbs, ids), ">seq1 x");
    CHECK(ids.empty());
}

static void test_retrievable_ids_unique_in_order() {
    std::fprintf(stderr, "-- test_retrievable_ids_unique_in_order\n");

    RetrievableIds ids;
    ids.add("b");
    ids.add("a");
    ids.add("b");
    ids.add("c");
    CHECK_EQ(ids.size(), 3u);
    CHECK_STR_EQ(ids.ids()[0], "b");
    CHECK_STR_EQ(ids.ids()[1], "a");
    CHECK_STR_EQ(ids.ids()[2], "c");
}

// Taking a linked line back to one of BLAST's anchor shapes and running it
// through the pipeline again gives the same link.
static void test_relink_after_restoring_anchor() {
    std::fprintf(stderr, "-- test_relink_after_restoring_anchor\n");

    HyperlinkResolver resolver(HyperlinkStrategies{}, "", g_logger);
    CoordinateSpan span{211, 250};

    RetrievableIds ids1;
    HitRecord first = make_hit(normalize_hit_line(
        "><a name=\"2\"></a>lcl|SI2.2.0_13722 locus=Si_gnF.scaffold06207"), span);
    std::string linked = resolver.resolve(first, kDbs, ids1);

    // Replace the added link with each of the two anchor shapes.
    std::string open_tag = linked.substr(1, linked.find('>', 1));
    std::string without_link = linked;
    without_link.erase(1, open_tag.size());
    without_link.erase(without_link.find("</a>"), 4);
    CHECK_STR_EQ(without_link, ">lcl|SI2.2.0_13722 locus=Si_gnF.scaffold06207");

    std::string leading = "><a name=\"2\"></a>" + without_link.substr(1);
    std::string trailing = ">lcl|SI2.2.0_13722<a name=\"2\"></a> locus=Si_gnF.scaffold06207";

    for (const auto& shape : {leading, trailing}) {
        RetrievableIds ids2;
        HitRecord again = make_hit(normalize_hit_line(shape), span);
        CHECK_STR_EQ(resolver.resolve(again, kDbs, ids2), linked);
        CHECK(again.link == first.link);
    }
}

int main() {
    test_split_hit_line();
    test_standard_link();
    test_url_prefix();
    test_no_id_no_link();
    test_line_strategy_wins();
    test_link_strategy_replaces_standard();
    test_no_strategies_at_all();
    test_retrievable_ids_unique_in_order();
    test_relink_after_restoring_anchor();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
