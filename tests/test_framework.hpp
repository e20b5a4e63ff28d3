/**
 * QuakeMigrate test harness
 *
 * Tests register themselves with TEST(Suite, Name). The runner takes an
 * optional filter, either a suite name or "Suite.Name", so that each suite
 * can be registered with CTest on its own.
 */

#pragma once

#include <chrono>
#include <cmath>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace quakemigrate {
namespace test {

struct TestResult {
    std::string suite;
    std::string name;
    bool passed;
    std::string message;
    double duration_ms;

    std::string fullName() const { return suite + "." + name; }
};

struct TestCase {
    std::string suite;
    std::string name;
    std::function<void()> func;

    bool matches(const std::string& filter) const {
        return filter.empty() || filter == suite || filter == suite + "." + name;
    }
};

/**
 * TestRegistry - Tests in registration order and the failure state of the
 * one currently running
 */
class TestRegistry {
public:
    static TestRegistry& instance() {
        static TestRegistry reg;
        return reg;
    }

    void addTest(const std::string& suite, const std::string& name,
                 std::function<void()> func) {
        tests_.push_back({suite, name, std::move(func)});
    }

    // Runs every test matching the filter; an unmatched filter is a failure
    std::vector<TestResult> run(const std::string& filter) {
        std::vector<TestResult> results;
        std::string current_suite;

        for (const auto& test : tests_) {
            if (!test.matches(filter)) continue;
            if (test.suite != current_suite) {
                current_suite = test.suite;
                std::cout << "\n[" << current_suite << "]" << std::endl;
            }
            results.push_back(runOne(test));
        }

        if (results.empty()) {
            std::cerr << "No test matches '" << filter << "'" << std::endl;
            results.push_back({filter, "", false, "no matching test", 0.0});
        }
        return results;
    }

    std::vector<std::string> suiteNames() const {
        std::vector<std::string> names;
        for (const auto& test : tests_) {
            if (names.empty() || names.back() != test.suite) names.push_back(test.suite);
        }
        return names;
    }

    // Keeps the first failure of a test
    void fail(const std::string& message) {
        if (failed_) return;
        failed_ = true;
        failure_message_ = message;
    }

    bool isFailed() const { return failed_; }

private:
    TestRegistry() = default;

    TestResult runOne(const TestCase& test) {
        TestResult result{test.suite, test.name, false, "", 0.0};
        failed_ = false;
        failure_message_.clear();

        auto start = std::chrono::steady_clock::now();
        try {
            test.func();
            result.passed = !failed_;
            result.message = failure_message_;
        } catch (const std::exception& e) {
            result.message = std::string("uncaught exception: ") + e.what();
        }
        result.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();

        if (result.passed) {
            std::cout << "  PASS " << test.name << " (" << std::fixed
                      << std::setprecision(1) << result.duration_ms << " ms)" << std::endl;
        } else {
            std::cout << "  FAIL " << test.name << ": " << result.message << std::endl;
        }
        return result;
    }

    std::vector<TestCase> tests_;
    bool failed_ = false;
    std::string failure_message_;
};

struct TestRegistrar {
    TestRegistrar(const std::string& suite, const std::string& name,
                  std::function<void()> func) {
        TestRegistry::instance().addTest(suite, name, std::move(func));
    }
};

// Fresh path below the system temp directory, unique per process
inline std::string scratchPath(const std::string& name) {
    static int counter = 0;
    std::filesystem::path path = std::filesystem::temp_directory_path() /
        ("quakemigrate_test_" + std::to_string(getpid()) + "_" +
         std::to_string(++counter) + "_" + name);
    return path.string();
}

#define QM_TEST_FAIL(what) \
    { \
        std::ostringstream oss; \
        oss << what << " at " << __FILE__ << ":" << __LINE__; \
        quakemigrate::test::TestRegistry::instance().fail(oss.str()); \
        return; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) QM_TEST_FAIL("ASSERT_TRUE(" #cond ")")

#define ASSERT_FALSE(cond) \
    if (cond) QM_TEST_FAIL("ASSERT_FALSE(" #cond ")")

#define ASSERT_EQ(a, b) \
    if (!((a) == (b))) QM_TEST_FAIL("ASSERT_EQ: " << (a) << " != " << (b))

#define ASSERT_NE(a, b) \
    if ((a) == (b)) QM_TEST_FAIL("ASSERT_NE: " << (a) << " == " << (b))

#define ASSERT_LT(a, b) \
    if (!((a) < (b))) QM_TEST_FAIL("ASSERT_LT: " << (a) << " >= " << (b))

#define ASSERT_LE(a, b) \
    if (!((a) <= (b))) QM_TEST_FAIL("ASSERT_LE: " << (a) << " > " << (b))

#define ASSERT_GT(a, b) \
    if (!((a) > (b))) QM_TEST_FAIL("ASSERT_GT: " << (a) << " <= " << (b))

#define ASSERT_GE(a, b) \
    if (!((a) >= (b))) QM_TEST_FAIL("ASSERT_GE: " << (a) << " < " << (b))

#define ASSERT_NEAR(a, b, eps) \
    if (!(std::abs((a) - (b)) <= (eps))) \
        QM_TEST_FAIL("ASSERT_NEAR: |" << (a) << " - " << (b) << "| > " << (eps))

#define ASSERT_THROW(expr, exc_type) \
    { \
        bool caught_ = false; \
        std::string other_; \
        try { expr; } \
        catch (const exc_type&) { caught_ = true; } \
        catch (const std::exception& e_) { other_ = e_.what(); } \
        if (!caught_) \
            QM_TEST_FAIL("ASSERT_THROW: expected " #exc_type \
                         << (other_.empty() ? std::string() : ", got: " + other_)) \
    }

#define ASSERT_NO_THROW(expr) \
    try { expr; } \
    catch (const std::exception& e_) QM_TEST_FAIL("ASSERT_NO_THROW: " << e_.what())

#define TEST(suite, name) \
    void test_##suite##_##name(); \
    static quakemigrate::test::TestRegistrar registrar_##suite##_##name( \
        #suite, #name, test_##suite##_##name); \
    void test_##suite##_##name()

inline int printSummary(const std::vector<TestResult>& results) {
    int failed = 0;
    double total_ms = 0;
    for (const auto& r : results) {
        if (!r.passed) failed++;
        total_ms += r.duration_ms;
    }

    std::cout << "\n" << (results.size() - failed) << "/" << results.size()
              << " tests passed in " << std::fixed << std::setprecision(1)
              << total_ms << " ms" << std::endl;
    for (const auto& r : results) {
        if (!r.passed) std::cout << "  FAILED " << r.fullName() << ": " << r.message << std::endl;
    }
    return failed;
}

} // namespace test
} // namespace quakemigrate
