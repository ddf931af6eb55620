#pragma once

#include <QString>

#include <cstdio>
#include <stdexcept>
#include <string>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) static void test_##name()
#define RUN_TEST(name)                                                                             \
    do {                                                                                           \
        printf("  %-48s", #name);                                                                  \
        fflush(stdout);                                                                            \
        try {                                                                                      \
            test_##name();                                                                         \
            printf(" OK\n");                                                                       \
            tests_passed++;                                                                        \
        } catch (const std::exception &e) {                                                        \
            printf(" FAIL: %s\n", e.what());                                                       \
            tests_failed++;                                                                        \
        } catch (...) {                                                                            \
            printf(" FAIL: unknown exception\n");                                                  \
            tests_failed++;                                                                        \
        }                                                                                          \
    } while (0)

#define ASSERT(cond)                                                                               \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__)              \
                                     + ": assertion failed: " #cond);                              \
        }                                                                                          \
    } while (0)

#define ASSERT_EQ(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) == (b))) {                                                                       \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__)              \
                                     + ": assertion failed: " #a " == " #b);                       \
        }                                                                                          \
    } while (0)

#define ASSERT_NE(a, b)                                                                            \
    do {                                                                                           \
        if ((a) == (b)) {                                                                          \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__)              \
                                     + ": assertion failed: " #a " != " #b);                       \
        }                                                                                          \
    } while (0)

#define ASSERT_GT(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) > (b))) {                                                                        \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__)              \
                                     + ": assertion failed: " #a " > " #b);                        \
        }                                                                                          \
    } while (0)

#define ASSERT_GE(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) >= (b))) {                                                                       \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__)              \
                                     + ": assertion failed: " #a " >= " #b);                       \
        }                                                                                          \
    } while (0)

#define ASSERT_LE(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) <= (b))) {                                                                       \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__)              \
                                     + ": assertion failed: " #a " <= " #b);                       \
        }                                                                                          \
    } while (0)

#define ASSERT_STR_EQ(a, b)                                                                        \
    do {                                                                                           \
        const QString lhs_ = (a);                                                                  \
        const QString rhs_ = (b);                                                                  \
        if (lhs_ != rhs_) {                                                                        \
            throw std::runtime_error(std::string("line ") + std::to_string(__LINE__) + ": \""      \
                                     + lhs_.toStdString() + "\" != \"" + rhs_.toStdString()        \
                                     + "\"");                                                      \
        }                                                                                          \
    } while (0)

static int report_results()
{
    if (tests_failed > 0) {
        printf("\n%d tests passed, %d FAILED\n", tests_passed, tests_failed);
    } else {
        printf("\n%d tests passed\n", tests_passed);
    }
    return tests_failed > 0 ? 1 : 0;
}
