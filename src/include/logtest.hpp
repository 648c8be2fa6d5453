#pragma once
/**
 * @file logtest.hpp
 * @brief Layer 2: the logging facade and the capture logger for tests.
 *
 * Include this in test code. It pulls in the facade macros (`LOGTEST_INFO`, ...),
 * the capture handle (`logtest::Logger`, `logtest::start()`) and the record type.
 */
#include "logtest_base.hpp"

#include "utils/log_level.hpp"
#include "utils/log_sinks/sink.hpp"
#include "utils/log_facade.hpp"
#include "utils/record.hpp"
#include "utils/capture_queue.hpp"
#include "utils/log_sinks/capture_sink.hpp"
#include "utils/logger.hpp"

namespace logtest
{
using utils::fields;
using utils::KeyValue;
using utils::KeyValues;
using utils::Level;
using utils::LevelFilter;
using utils::Logger;
using utils::Record;
using utils::start;
} // namespace logtest
