#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        RT::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_container_writes") {
    auto skipped = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("noisy write", std::source_location::current(), "Container");
        waitForFlush();
    });
    CHECK(skipped.empty());

    auto allowed = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.log_impl("write allowed", std::source_location::current(), "Container");
        waitForFlush();
    });
    CHECK(allowed.find("write allowed") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto accepted = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"MergeEngine"});
        logger.log_impl("keep me", std::source_location::current(), "MergeEngine");
        waitForFlush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"MergeEngine"});
        logger.log_impl("drop me", std::source_location::current(), "MergeEngine", "SchemaEvolution");
        waitForFlush();
    });
    CHECK(rejected.empty());
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Replica-7");
        logger.log_impl("with name", std::source_location::current(), "Test");
        waitForFlush();
    });

    CHECK(output.find("[Replica-7]") != std::string::npos);
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto output = captureStderr([] {
        RT::set_thread_name("WrapperThread");
        RT::set_logging_enabled(true);
        rt_log("via macro", "Alpha", "Beta");
        waitForFlush();
        RT::set_logging_enabled(false);
    });

    CHECK(output.find("Alpha][Beta") != std::string::npos);
    CHECK(output.find("[WrapperThread]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        RT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 130 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE
