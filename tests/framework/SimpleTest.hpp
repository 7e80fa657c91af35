#pragma once

#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio::test {

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner instance;
        return instance;
    }

    void register_test(const std::string& name, std::function<void()> test_func) {
        tests_.push_back({name, std::move(test_func)});
    }

    int run_all() {
        int passed = 0;
        int failed = 0;

        std::cout << "\n=== FOLIO TEST SUITE ===\n" << std::endl;

        for (const auto& test : tests_) {
            try {
                test.func();
                std::cout << "[PASS] " << test.name << std::endl;
                passed++;
            } catch (const std::exception& e) {
                std::cout << "[FAIL] " << test.name << " - " << e.what() << std::endl;
                failed++;
            } catch (...) {
                std::cout << "[FAIL] " << test.name << " - Unknown exception" << std::endl;
                failed++;
            }
        }

        std::cout << "\nResults: " << passed << " Passed, " << failed << " Failed." << std::endl;
        return failed > 0 ? 1 : 0;
    }

private:
    struct TestEntry {
        std::string name;
        std::function<void()> func;
    };
    std::vector<TestEntry> tests_;
};

struct Registrar {
    Registrar(const std::string& name, std::function<void()> func) {
        TestRunner::instance().register_test(name, std::move(func));
    }
};

class AssertionFailure : public std::runtime_error {
public:
    explicit AssertionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

inline std::string where(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line);
}

}  // namespace folio::test

#define TEST_CASE(name) \
    void name(); \
    static folio::test::Registrar reg_##name(#name, name); \
    void name()

#define ASSERT_TRUE(condition) \
    do { if (!(condition)) throw folio::test::AssertionFailure("Assertion failed: " #condition " at " + folio::test::where(__FILE__, __LINE__)); } while (0)

#define ASSERT_FALSE(condition) \
    do { if (condition) throw folio::test::AssertionFailure("Assertion failed: " #condition " is true at " + folio::test::where(__FILE__, __LINE__)); } while (0)

#define ASSERT_EQ(a, b) \
    do { if ((a) != (b)) throw folio::test::AssertionFailure("Assertion failed: " #a " == " #b " at " + folio::test::where(__FILE__, __LINE__)); } while (0)

#define ASSERT_NEAR(a, b, epsilon) \
    do { if (std::abs((a) - (b)) > (epsilon)) throw folio::test::AssertionFailure("Assertion failed: " #a " near " #b " at " + folio::test::where(__FILE__, __LINE__)); } while (0)

// Passes only if `statement` throws `exception_type`
#define ASSERT_THROWS(statement, exception_type) \
    do { \
        bool thrown_ = false; \
        try { statement; } catch (const exception_type&) { thrown_ = true; } \
        if (!thrown_) throw folio::test::AssertionFailure("Expected " #exception_type " from " #statement " at " + folio::test::where(__FILE__, __LINE__)); \
    } while (0)
