#pragma once

#include <objbridge/core/config.hpp>
#include <boost/log/trivial.hpp>

/**
 * @file logging.hpp
 * @brief Stream logging macros backed by Boost.Log
 */

#define OBJBRIDGE_LOG_TRACE_STREAM BOOST_LOG_TRIVIAL(trace) << "[objbridge] "
#define OBJBRIDGE_LOG_DEBUG_STREAM BOOST_LOG_TRIVIAL(debug) << "[objbridge] "
#define OBJBRIDGE_LOG_INFO_STREAM BOOST_LOG_TRIVIAL(info) << "[objbridge] "
#define OBJBRIDGE_LOG_WARN_STREAM BOOST_LOG_TRIVIAL(warning) << "[objbridge] "
#define OBJBRIDGE_LOG_ERROR_STREAM BOOST_LOG_TRIVIAL(error) << "[objbridge] "
#define OBJBRIDGE_LOG_FATAL_STREAM BOOST_LOG_TRIVIAL(fatal) << "[objbridge] "

namespace objbridge::log {

/**
 * @brief Install the severity filter on the Boost.Log core
 *
 * Safe to call more than once; the last call wins.
 */
void init(LogLevel level);

void set_level(LogLevel level);

LogLevel level() noexcept;

} // namespace objbridge::log
