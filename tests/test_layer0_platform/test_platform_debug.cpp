/**
 * @file test_platform_debug.cpp
 * @brief Layer 0 tests for the fatal-error and diagnostic helpers the library
 *        reports its own problems with.
 *
 * This target is compiled with LOGTEST_ENABLE_DEBUG_MESSAGES so that
 * LOGTEST_DBG prints.
 */
#include "logtest_base.hpp"
#include "shared_test_helpers.h"
#include "utils/log_level.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <iterator>
#include <string>

using namespace ::testing;
using logtest::format_tools::buffer_view;
using logtest::format_tools::filename_only;
using logtest::tests::helper::StringCapture;

// ============================================================================
// LOGTEST_DBG
// ============================================================================

TEST(DebugInfoTest, DbgWritesOnePrefixedLine)
{
    StringCapture capture(STDERR_FILENO);
    LOGTEST_DBG("sink {} installed", "CaptureSink");
    EXPECT_EQ(capture.GetOutput(), "[DBG]  sink CaptureSink installed\n");
}

TEST(DebugInfoTest, DbgUsesLibraryFormatters)
{
    StringCapture capture(STDERR_FILENO);
    LOGTEST_DBG("threshold={} level={:>5}|", logtest::utils::LevelFilter::L_OFF,
                logtest::utils::Level::L_WARN);
    EXPECT_EQ(capture.GetOutput(), "[DBG]  threshold=OFF level= WARN|\n");
}

// ============================================================================
// Call sites and buffers
// ============================================================================

TEST(DebugInfoTest, CallSiteNamesFileLineAndFunction)
{
    const auto here = std::source_location::current();
    const std::string text = logtest::debug::srcloc_to_str(here);

    EXPECT_EQ(text, fmt::format("test_platform_debug.cpp:{}:{}", here.line(), here.function_name()));
}

TEST(DebugInfoTest, FilenameOnlyStripsDirectories)
{
    static_assert(filename_only("a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("/usr/src/logger.cpp"), "logger.cpp");
    EXPECT_EQ(filename_only("C:\\src\\logger.cpp"), "logger.cpp");
    EXPECT_EQ(filename_only("C:\\src/mixed\\logger.cpp"), "logger.cpp");
    EXPECT_EQ(filename_only("logger.cpp"), "logger.cpp");
    EXPECT_EQ(filename_only("dir/"), "");
}

TEST(DebugInfoTest, BufferViewSeesFormattedBytes)
{
    fmt::memory_buffer mb;
    EXPECT_TRUE(buffer_view(mb).empty());

    fmt::format_to(std::back_inserter(mb), "{}:{}", "queue", 3);
    EXPECT_EQ(buffer_view(mb), "queue:3");
    EXPECT_EQ(buffer_view(mb).data(), mb.data());
}

// ============================================================================
// Stack traces and panics
// ============================================================================

namespace
{
void trace_then_exit()
{
    logtest::debug::print_stack_trace();
    std::exit(0);
}

[[noreturn]] void fail_with_queue_size(int size)
{
    LOGTEST_PANIC("queue holds {} records", size);
}

[[noreturn]] void fail_with_level()
{
    LOGTEST_PANIC("unexpected {} event", logtest::utils::Level::L_TRACE);
}
} // namespace

TEST(DebugInfoDeathTest, StackTraceGoesToStderr)
{
    EXPECT_EXIT(trace_then_exit(), ExitedWithCode(0),
                HasSubstr("Stack Trace (most recent call first):"));
}

TEST(DebugInfoDeathTest, PanicAbortsWithCallSiteMessageAndTrace)
{
    EXPECT_DEATH(fail_with_queue_size(7),
                 AllOf(HasSubstr("[PANIC] test_platform_debug.cpp:"),
                       HasSubstr("fail_with_queue_size"), HasSubstr(" -- queue holds 7 records"),
                       HasSubstr("Stack Trace (most recent call first):")));
}

TEST(DebugInfoDeathTest, PanicFormatsLibraryTypes)
{
    EXPECT_DEATH(fail_with_level(), HasSubstr("unexpected TRACE event"));
}
