#pragma once

// ------------------------------------------------------------- Library defines

// Turn on 64bit files, stdio.h
#define _FILE_OFFSET_BITS 64

#ifndef __cplusplus
// --------------------------------------------------------------------------- C
#include <assert.h>
#include <stdio.h>

#else
// ------------------------------------------------------------------------- C++

// Contrib
#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#include "spdlog/spdlog.h"

#include "base/logging.hpp"

#include <algorithm>
#include <compare>
#include <functional>
#include <memory>
#include <numeric>

#include <array>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <span>

#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace junction {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

using fmt::format;

using std::function;
using thunk_type = std::function<void()>;

using std::array;
using std::string;
using std::string_view;
using std::unordered_map;
using std::unordered_set;
using std::vector;

// Smart Pointers
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;

using std::begin;
using std::cbegin;
using std::cend;
using std::end;

using std::error_code;

using std::lock_guard;

// NOTE:
//        1s is 1 second
using namespace std::literals::chrono_literals;

} // namespace junction

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define JUNCTION_LIKELY(x) __builtin_expect(!!(x), 1)
#define JUNCTION_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define JUNCTION_LIKELY(x) (!!(x))
#define JUNCTION_UNLIKELY(x) (!!(x))
#endif

// --------------------------------------------------------------------- Logging

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...)                                                                            \
  {                                                                                                \
    ::junction::logging::log_trace(::junction::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                 \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#define LOG_DEBUG(fmt, ...)                                                                        \
  {                                                                                                \
    ::junction::logging::log_debug(::junction::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                 \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...)                                                                             \
  {                                                                                                \
    ::junction::logging::log_info(::junction::logging::debug_logger(),                             \
                                  "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                  \
                                  __LINE__ __VA_OPT__(, ) __VA_ARGS__);                            \
  }

#define WARN(fmt, ...)                                                                             \
  {                                                                                                \
    ::junction::logging::log_warn(::junction::logging::debug_logger(),                             \
                                  "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                  \
                                  __LINE__ __VA_OPT__(, ) __VA_ARGS__);                            \
  }

#define LOG_ERR(fmt, ...)                                                                          \
  {                                                                                                \
    ::junction::logging::log_error(::junction::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                 \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#define FATAL(fmt, ...)                                                                            \
  {                                                                                                \
    ::junction::logging::log_fatal(::junction::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                 \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  if (!JUNCTION_LIKELY(condition))                                                                 \
    FATAL("precondition failed: {}", #condition);
#endif

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif

#endif // #defined cplusplus
