#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>

static int g_fail_count = 0;
static int g_pass_count = 0;

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_EQ(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got %lld vs %lld)\n", \
                         __FILE__, __LINE__, #a, #b, \
                         (long long)_a, (long long)_b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_STR_EQ(a, b) \
    do { \
        std::string _a = (a); \
        std::string _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s\n  got:      \"%s\"\n  expected: \"%s\"\n", \
                         __FILE__, __LINE__, #a, #b, _a.c_str(), _b.c_str()); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define TEST_SUMMARY() \
    do { \
        std::fprintf(stderr, "%d passed, %d failed\n", g_pass_count, g_fail_count); \
    } while (0)

// Number of non-overlapping occurrences of needle in haystack.
inline size_t count_occurrences(const std::string& haystack,
                                const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        n++;
    }
    return n;
}
