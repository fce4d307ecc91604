#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace {

// Prints each test case and subcase as it starts, and the cases slower than 100ms when they end.
struct ProgressListener : public doctest::IReporter {
    explicit ProgressListener(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override {
        started = std::chrono::steady_clock::now();
        print("Test: ", in.m_name);
    }
    void subcase_start(const doctest::SubcaseSignature& in) override { print("\tSubcase: ", in.m_name.c_str()); }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        if (elapsed.count() > 100)
            print("\tslow: ", std::to_string(elapsed.count()) + "ms");
    }

    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}

private:
    static void print(std::string_view prefix, std::string_view name) {
#ifdef TS_LOG_DEBUG
        std::lock_guard<std::mutex> lock(TS::TaggedLogger::coutMutex);
#endif
        std::cout << prefix << name << std::endl;
    }

    std::chrono::steady_clock::time_point started{};
};

} // namespace

REGISTER_LISTENER("progress", 1, ProgressListener);

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

#ifdef TS_LOG_DEBUG
    // TONESTYLE_LOG=1 turns on the shared logger for the whole run.
    const char* envLog    = std::getenv("TONESTYLE_LOG");
    const bool  logTheRun = envLog != nullptr && std::string_view{envLog} != "0";
    TS::set_thread_name("TestMain");
    if (logTheRun) {
        TS::set_logging_enabled(true);
        ts_log("Starting tonestyle tests", "TEST");
    }
#endif

    int res = context.run();

#ifdef TS_LOG_DEBUG
    if (logTheRun)
        ts_log(res == 0 ? "All tests passed" : "Some tests failed", "TEST", res == 0 ? "SUCCESS" : "FAILURE");
#endif
    return res;
}
