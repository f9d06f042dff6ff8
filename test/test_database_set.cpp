#include "test_util.hpp"
#include "io/database_set.hpp"

#include <string>

using namespace seqreport;

static void test_database_id() {
    std::fprintf(stderr, "-- test_database_id\n");

    CHECK_STR_EQ(database_id("abc"), "900150983cd24fb0d6963f7d28e17f72");
    CHECK_STR_EQ(database_id(""), "d41d8cd98f00b204e9800998ecf8427e");
    CHECK_EQ(database_id("/db/genome").size(), 32u);
    CHECK(database_id("/db/genome") != database_id("/db/genome2"));
}

static void test_add_and_find() {
    std::fprintf(stderr, "-- test_add_and_find\n");

    DatabaseSet dbs;
    CHECK(dbs.empty());
    dbs.add({database_id("/db/a"), "/db/a", "A", "nucleotide"});
    dbs.add({database_id("/db/b"), "/db/b", "B", "protein"});
    CHECK(!dbs.empty());
    CHECK_EQ(dbs.entries().size(), 2u);

    const DatabaseEntry* b = dbs.find(database_id("/db/b"));
    CHECK(b != nullptr);
    if (b) {
        CHECK_STR_EQ(b->path, "/db/b");
        CHECK_STR_EQ(b->type, "protein");
    }
    CHECK(dbs.find("/db/b") == nullptr);
}

static void test_load_missing() {
    std::fprintf(stderr, "-- test_load_missing\n");

    Logger logger(Logger::kError);
    DatabaseSet dbs;
    std::string err;
    CHECK(!dbs.load({"/nonexistent/seqreport_test_db"}, logger, err));
    CHECK(!err.empty());
    CHECK(dbs.empty());
}

int main() {
    test_database_id();
    test_add_and_find();
    test_load_missing();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
