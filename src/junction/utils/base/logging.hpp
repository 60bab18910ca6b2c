#pragma once

#include "spdlog/spdlog.h"

#include <exception>
#include <utility>

/**
 * @defgroup logging Logging
 * @ingroup junction-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * A convenience wrapper around `spdlog`. The
 * logger instance is held as a `static shared_ptr` in `logging.cpp`.
 *
 * Only supports 1 default logger, that outputs to stdout/stderr.
 * The logger is lazily initialized by the `junction::logging::debug_logger()` function.
 * Set the environment variable `LOG_LEVEL_OVERRIDE` (trace, debug, info, warn, err,
 * critical, off) to change the level at startup.
 */

namespace junction::logging
{
using logger_type = spdlog::logger;

logger_type& debug_logger();

enum class LogLevel : int { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

namespace detail
{
   constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level)
   {
      switch(level) {
      case LogLevel::TRACE: return spdlog::level::trace;
      case LogLevel::DEBUG: return spdlog::level::debug;
      case LogLevel::INFO: return spdlog::level::info;
      case LogLevel::WARN: return spdlog::level::warn;
      case LogLevel::ERROR: return spdlog::level::err;
      case LogLevel::FATAL: return spdlog::level::critical;
      }
      return spdlog::level::critical;
   }

   /**
    * The format string is checked at compile time by `fmt::format_string`, so the
    * logging macros must always be passed a string literal.
    */
   template<typename... Args>
   inline void log_internal_(LogLevel level,
                             logger_type& logger,
                             fmt::format_string<Args...> fmt,
                             Args&&... args)
   {
      logger.log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
      if(level == LogLevel::FATAL) {
         logger.flush();
         std::terminate();
      }
   }
} // namespace detail

template<typename... Args>
inline void log_trace(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args)
{
   detail::log_internal_(LogLevel::TRACE, logger, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args)
{
   detail::log_internal_(LogLevel::DEBUG, logger, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args)
{
   detail::log_internal_(LogLevel::INFO, logger, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args)
{
   detail::log_internal_(LogLevel::WARN, logger, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args)
{
   detail::log_internal_(LogLevel::ERROR, logger, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_fatal(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args)
{
   detail::log_internal_(LogLevel::FATAL, logger, fmt, std::forward<Args>(args)...);
}

} // namespace junction::logging
