#ifndef VDFPATCH_TESTS_LOG__
#define VDFPATCH_TESTS_LOG__

#include "vdfpatch_test_harness.hpp"
#include "../include/vdfpatch_log.hpp"

namespace vdfpatch::tests
{

static bool log_sink_receives_lines_at_threshold()
{
    log_capture logs(log::level::info);

    VDFPATCH_LOG_DEBUG("test", "below threshold");
    VDFPATCH_LOG_INFO("test", "at threshold");
    VDFPATCH_LOG_ERROR("test", "above threshold");

    EXPECT(logs.lines.size() == 2, "two lines expected");
    EXPECT(logs.contains(log::level::info, "test: at threshold"), "info line missing");
    EXPECT(logs.contains(log::level::error, "test: above threshold"), "error line missing");
    EXPECT(!logs.contains(log::level::debug, "below"), "debug line should be filtered");

    return true;
}

static bool log_sink_may_query_logger()
{
    log_capture logs(log::level::warn);

    log::level seen = log::level::off;
    log::set_sink([&](log::level, std::string_view, std::string_view) {
        seen = log::get_level();
    });

    VDFPATCH_LOG_WARN("test", "forwarded");

    EXPECT(seen == log::level::warn, "sink should read the current level");

    return true;
}

static bool log_sink_may_log_again()
{
    log_capture logs(log::level::info);

    std::vector<std::string> received;
    log::set_sink([&](log::level, std::string_view tag, std::string_view msg) {
        received.emplace_back(std::string(tag) + ": " + std::string(msg));
        if (tag != "echo")
            VDFPATCH_LOG_INFO("echo", std::string(msg));
    });

    VDFPATCH_LOG_WARN("test", "once");

    EXPECT(received.size() == 2, "sink should see the line and its echo");
    EXPECT(received[1] == "echo: once", "echo line wrong");

    return true;
}

static bool log_filtered_message_is_not_built()
{
    log_capture logs(log::level::warn);

    int built = 0;
    auto message = [&]() { ++built; return std::string("expensive"); };

    VDFPATCH_LOG_DEBUG("test", message());
    EXPECT(built == 0, "filtered message should not be built");

    log::set_level(log::level::debug);
    VDFPATCH_LOG_DEBUG("test", message());
    EXPECT(built == 1, "enabled message should be built once");
    EXPECT(logs.contains(log::level::debug, "expensive"), "enabled message not delivered");

    log::set_level(log::level::off);
    VDFPATCH_LOG_ERROR("test", message());
    EXPECT(built == 1, "nothing is built when logging is off");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_log_tests()
{
    SUBCAT("Levels");
    RUN_TEST(log_sink_receives_lines_at_threshold);
    RUN_TEST(log_filtered_message_is_not_built);

    SUBCAT("Re-entrant sinks");
    RUN_TEST(log_sink_may_query_logger);
    RUN_TEST(log_sink_may_log_again);
}

}

#endif
