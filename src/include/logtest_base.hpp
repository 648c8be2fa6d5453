#pragma once
/**
 * @file logtest_base.hpp
 * @brief Layer 1: Basic modules built on logtest_platform.
 *
 * Provides format_tools and debug_info (panic, debug messages, stack traces).
 * Include this when you need formatting or fatal-error reporting.
 */
#include "logtest_platform.hpp"

#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
