#include "test_util.hpp"
#include "report/hit_line_normalizer.hpp"

#include <string>

using namespace seqreport;

static void test_trailing_anchor() {
    std::fprintf(stderr, "-- test_trailing_anchor\n");

    std::string out;
    CHECK(strip_trailing_anchor(
        ">lcl|SI2.2.0_06267<a name=\"1\"></a> locus=Si_gnF.scaffold02797", out));
    CHECK_STR_EQ(out, ">lcl|SI2.2.0_06267 locus=Si_gnF.scaffold02797");

    // The other shape is not this rule's business.
    CHECK(!strip_trailing_anchor("><a name=\"1\"></a>lcl|x desc", out));
}

static void test_leading_anchor() {
    std::fprintf(stderr, "-- test_leading_anchor\n");

    std::string out;
    CHECK(strip_leading_anchor(
        "><a name=\"1\"></a>lcl|SI2.2.0_06267 locus=Si_gnF.scaffold02797", out));
    CHECK_STR_EQ(out, ">lcl|SI2.2.0_06267 locus=Si_gnF.scaffold02797");

    CHECK(!strip_leading_anchor(">lcl|x<a name=\"1\"></a> desc", out));
}

static void test_shapes_normalize_identically() {
    std::fprintf(stderr, "-- test_shapes_normalize_identically\n");

    std::string with_seqids = ">contig_42<a name=\"contig_42\"></a> len=1200 cov=3.5";
    std::string without_seqids = "><a name=\"17\"></a>contig_42 len=1200 cov=3.5";

    std::string a = normalize_hit_line(with_seqids);
    std::string b = normalize_hit_line(without_seqids);
    CHECK_STR_EQ(a, b);
    CHECK_STR_EQ(a, ">contig_42 len=1200 cov=3.5");
}

static void test_no_anchor_unchanged() {
    std::fprintf(stderr, "-- test_no_anchor_unchanged\n");

    std::string plain = ">gi|12345|gb|AAA00001.1| hypothetical protein";
    CHECK_STR_EQ(normalize_hit_line(plain), plain);

    std::string out = "untouched";
    CHECK(!strip_trailing_anchor(plain, out));
    CHECK(!strip_leading_anchor(plain, out));
    CHECK_STR_EQ(out, "untouched");

    // A non-empty anchor is a link, not the named anchor BLAST writes.
    std::string linked = "><a href='/get_sequence/?id=x&db=d' target='_blank'>x</a> desc";
    CHECK_STR_EQ(normalize_hit_line(linked), linked);
}

static void test_id_only_line() {
    std::fprintf(stderr, "-- test_id_only_line\n");

    CHECK_STR_EQ(normalize_hit_line("><a name=\"3\"></a>seq3"), ">seq3");
    CHECK_STR_EQ(normalize_hit_line(">seq3<a name=\"3\"></a>"), ">seq3");
}

static void test_anchor_shape_details() {
    std::fprintf(stderr, "-- test_anchor_shape_details\n");

    // Attribute-less anchor.
    CHECK_STR_EQ(normalize_hit_line(">seq1<a></a> desc"), ">seq1 desc");

    // "<abbr>" is not an anchor; the first real anchor after the id is removed.
    CHECK_STR_EQ(normalize_hit_line(">seq1<abbr>x</abbr><a name=\"1\"></a> desc"),
                 ">seq1<abbr>x</abbr> desc");

    // Only the first trailing anchor goes.
    CHECK_STR_EQ(normalize_hit_line(">s<a name=\"1\"></a>mid<a name=\"2\"></a>end"),
                 ">smid<a name=\"2\"></a>end");

    // Unterminated anchors are left alone.
    std::string broken = "><a name=\"1\">seq1 desc";
    CHECK_STR_EQ(normalize_hit_line(broken), broken);
    CHECK_STR_EQ(normalize_hit_line("><a name=\"1\""), "><a name=\"1\"");
}

static void test_very_long_lines() {
    std::fprintf(stderr, "-- test_very_long_lines\n");

    std::string tail(100000, 'A');
    CHECK_STR_EQ(normalize_hit_line("><a name=\"1\"></a>lcl|x " + tail),
                 ">lcl|x " + tail);
    CHECK_STR_EQ(normalize_hit_line(">lcl|x<a name=\"1\"></a> " + tail),
                 ">lcl|x " + tail);

    std::string plain = ">lcl|x " + tail;
    CHECK_STR_EQ(normalize_hit_line(plain), plain);
}

int main() {
    test_trailing_anchor();
    test_leading_anchor();
    test_shapes_normalize_identically();
    test_no_anchor_unchanged();
    test_id_only_line();
    test_anchor_shape_details();
    test_very_long_lines();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
