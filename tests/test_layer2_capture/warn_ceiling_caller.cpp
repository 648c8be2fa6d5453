// Logs at every level with the compile-time ceiling lowered to Warn.
#undef LOGTEST_COMPILE_LEVEL
#define LOGTEST_COMPILE_LEVEL 2
#define LOGTEST_TARGET "warn_ceiling"
#include "logtest.hpp"

void log_every_level_under_warn_ceiling()
{
    LOGTEST_ERROR("error");
    LOGTEST_WARN("warn");
    LOGTEST_INFO("info");
    LOGTEST_DEBUG("debug");
    LOGTEST_TRACE("trace");
    LOGTEST_LOG(logtest::Level::L_INFO, "explicit", logtest::KeyValues{}, "explicit info");
    LOGTEST_LOG(logtest::Level::L_WARN, "explicit", logtest::KeyValues{}, "explicit warn");
}
