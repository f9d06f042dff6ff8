#include "test_util.hpp"
#include "util/cli_parser.hpp"

#include <string>
#include <vector>

using namespace seqreport;

// CliParser copies what it needs out of argv.
static CliParser parse(std::vector<std::string> args) {
    static std::vector<std::string> storage;
    storage = std::move(args);
    std::vector<char*> argv;
    for (auto& a : storage) argv.push_back(&a[0]);
    return CliParser(static_cast<int>(argv.size()), argv.data());
}

static void test_key_value() {
    std::fprintf(stderr, "-- test_key_value\n");

    auto cli = parse({"seqreport", "-report", "out.html", "-num_threads", "4", "-v"});
    CHECK_STR_EQ(cli.program(), "seqreport");
    CHECK(cli.has("-report"));
    CHECK_STR_EQ(cli.get_string("-report"), "out.html");
    CHECK_EQ(cli.get_int("-num_threads"), 4);
    CHECK(cli.has("-v"));
    CHECK(!cli.has("-db"));
    CHECK_STR_EQ(cli.get_string("-db", "none"), "none");
}

static void test_stdin_value() {
    std::fprintf(stderr, "-- test_stdin_value\n");

    auto cli = parse({"seqreport", "-report", "-", "-o", "-"});
    CHECK_STR_EQ(cli.get_string("-report"), "-");
    CHECK_STR_EQ(cli.get_string("-o"), "-");
}

static void test_repeated_and_list() {
    std::fprintf(stderr, "-- test_repeated_and_list\n");

    auto cli = parse({"x", "-db", "/db/a /db/b", "-db", "/db/c,/db/d", "-db", "/db/e"});
    auto all = cli.get_strings("-db");
    CHECK_EQ(all.size(), 3u);
    CHECK_STR_EQ(cli.get_string("-db"), "/db/e");

    auto list = cli.get_list("-db");
    CHECK_EQ(list.size(), 5u);
    CHECK_STR_EQ(list[0], "/db/a");
    CHECK_STR_EQ(list[3], "/db/d");
    CHECK_STR_EQ(list[4], "/db/e");
    CHECK(cli.get_list("-missing").empty());
}

static void test_long_option_with_equals() {
    std::fprintf(stderr, "-- test_long_option_with_equals\n");

    // Advanced options start with '-' and so need the --key=value form.
    auto cli = parse({"x", "--advanced=-evalue 1e-5 -word_size 7", "-method", "blastn"});
    CHECK_STR_EQ(cli.get_string("--advanced"), "-evalue 1e-5 -word_size 7");
    CHECK_STR_EQ(cli.get_string("-method"), "blastn");
}

static void test_bad_int_and_positional() {
    std::fprintf(stderr, "-- test_bad_int_and_positional\n");

    auto cli = parse({"x", "input.html", "-num_threads", "many", "extra"});
    CHECK_EQ(cli.get_int("-num_threads", 2), 2);
    CHECK_EQ(cli.positional().size(), 2u);
    CHECK_STR_EQ(cli.positional()[0], "input.html");
    CHECK_STR_EQ(cli.positional()[1], "extra");
}

int main() {
    test_key_value();
    test_stdin_value();
    test_repeated_and_list();
    test_long_option_with_equals();
    test_bad_int_and_positional();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
