/*
 * test_framework.h - Minimal test harness for the flacdec tests
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TEST_FRAMEWORK_H
#define TEST_FRAMEWORK_H

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <typeinfo>
#include <vector>

namespace TestFramework {

/**
 * @brief Thrown by the ASSERT_* macros; ends the current test as FAILED
 */
class AssertionFailure : public std::exception {
public:
    explicit AssertionFailure(const std::string& message) : m_message(message) {}
    const char* what() const noexcept override { return m_message.c_str(); }
private:
    std::string m_message;
};

// Builds the failure text shared by every assertion
std::string formatFailure(const std::string& message, const char* file, int line,
                          const std::string& detail);

} // namespace TestFramework

#define TF_FAIL_(message, detail) \
    throw TestFramework::AssertionFailure( \
        TestFramework::formatFailure((message), __FILE__, __LINE__, (detail)))

#define ASSERT_TRUE(condition, message) \
    do { \
        if (!(condition)) { \
            TF_FAIL_(message, "expected true"); \
        } \
    } while (0)

#define ASSERT_FALSE(condition, message) \
    do { \
        if ((condition)) { \
            TF_FAIL_(message, "expected false"); \
        } \
    } while (0)

// Both operands must be streamable
#define ASSERT_EQUALS(expected, actual, message) \
    do { \
        if (!((expected) == (actual))) { \
            std::ostringstream tf_detail_; \
            tf_detail_ << "expected " << (expected) << ", got " << (actual); \
            TF_FAIL_(message, tf_detail_.str()); \
        } \
    } while (0)

#define ASSERT_NOT_EQUALS(unexpected, actual, message) \
    do { \
        if ((unexpected) == (actual)) { \
            std::ostringstream tf_detail_; \
            tf_detail_ << "did not expect " << (actual); \
            TF_FAIL_(message, tf_detail_.str()); \
        } \
    } while (0)

#define ASSERT_NULL(ptr, message) \
    do { \
        if ((ptr) != nullptr) { \
            TF_FAIL_(message, "expected null pointer"); \
        } \
    } while (0)

#define ASSERT_NOT_NULL(ptr, message) \
    do { \
        if ((ptr) == nullptr) { \
            TF_FAIL_(message, "unexpected null pointer"); \
        } \
    } while (0)

namespace TestFramework {

enum class TestResult {
    PASSED,
    FAILED,     ///< An assertion did not hold
    ERROR       ///< Any other exception escaped the test
};

struct TestCaseInfo {
    std::string name;
    TestResult result;
    std::string failure_message;
    std::chrono::milliseconds execution_time;

    explicit TestCaseInfo(const std::string& test_name)
        : name(test_name), result(TestResult::PASSED), execution_time(0) {}
};

/**
 * @brief One named test with optional fixture hooks
 *
 * tearDown() runs whenever setUp() succeeded, whether or not the test
 * body passed.
 */
class TestCase {
public:
    explicit TestCase(const std::string& name) : m_name(name) {}
    virtual ~TestCase() = default;

    TestCaseInfo run();

    const std::string& getName() const { return m_name; }

protected:
    virtual void setUp() {}
    virtual void runTest() = 0;
    virtual void tearDown() {}

private:
    std::string m_name;
};

class FunctionTestCase : public TestCase {
public:
    FunctionTestCase(const std::string& name, std::function<void()> test_func)
        : TestCase(name), m_test_func(std::move(test_func)) {}

protected:
    void runTest() override;

private:
    std::function<void()> m_test_func;
};

/**
 * @brief Ordered collection of tests run as one executable
 *
 * When the FLACDEC_TEST_FILTER environment variable is set, only tests
 * whose names contain it are run.
 */
class TestSuite {
public:
    explicit TestSuite(const std::string& name) : m_name(name) {}

    void addTest(std::unique_ptr<TestCase> test);
    void addTest(const std::string& name, std::function<void()> test_func);

    std::vector<TestCaseInfo> runAll();
    void printResults(const std::vector<TestCaseInfo>& results) const;

    // FAILED and ERROR both count
    int getFailureCount(const std::vector<TestCaseInfo>& results) const;

    const std::string& getName() const { return m_name; }
    size_t getTestCount() const { return m_tests.size(); }

private:
    std::string m_name;
    std::vector<std::unique_ptr<TestCase>> m_tests;
};

namespace TestPatterns {

/**
 * @brief Fails unless test_func throws ExceptionType
 *
 * When expected_message is non-empty the exception text must contain it.
 */
template<typename ExceptionType>
void assertThrows(const std::function<void()>& test_func, const std::string& expected_message = "",
                  const std::string& message = "Expected exception was not thrown") {
    try {
        test_func();
    } catch (const ExceptionType& e) {
        std::string actual = e.what();
        if (!expected_message.empty() && actual.find(expected_message) == std::string::npos) {
            throw AssertionFailure(message + ": message '" + actual + "' lacks '" + expected_message + "'");
        }
        return;
    } catch (const AssertionFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw AssertionFailure(message + ": wrong exception " + typeid(e).name() + " (" + e.what() + ")");
    }
    throw AssertionFailure(message);
}

} // namespace TestPatterns

} // namespace TestFramework

#endif // TEST_FRAMEWORK_H
