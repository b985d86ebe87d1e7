#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#ifndef OBJBRIDGE_TRACK_OWNERSHIP
/**
 * Keep a ledger of every retain the bridge performs so that an unmatched
 * release is reported instead of reaching the runtime
 */
#define OBJBRIDGE_TRACK_OWNERSHIP 1
#endif

#ifndef OBJBRIDGE_VERIFY_ENCODINGS
/**
 * Compare the declared signature with the runtime's method type encoding
 * before every call
 */
#define OBJBRIDGE_VERIFY_ENCODINGS 1
#endif

#ifndef OBJBRIDGE_DISPATCH_CACHE_RESERVE
#define OBJBRIDGE_DISPATCH_CACHE_RESERVE 256
#endif

#ifndef OBJBRIDGE_MAX_ANCESTRY_DEPTH
/**
 * Upper bound on capability trait ancestry. A chain that does not terminate
 * within this many links is treated as cyclic.
 */
#define OBJBRIDGE_MAX_ANCESTRY_DEPTH 32
#endif

namespace objbridge {

enum class LogLevel : uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warning = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Run-time configuration of the bridge
 */
struct Config {
    LogLevel log_level = LogLevel::warning;
    bool track_ownership = OBJBRIDGE_TRACK_OWNERSHIP != 0;
    bool verify_encodings = OBJBRIDGE_VERIFY_ENCODINGS != 0;
    std::size_t dispatch_cache_reserve = OBJBRIDGE_DISPATCH_CACHE_RESERVE;

    /**
     * @brief Defaults overlaid with OBJBRIDGE_* environment variables
     *
     * Recognised: OBJBRIDGE_LOG_LEVEL (trace|debug|info|warning|error|fatal),
     * OBJBRIDGE_TRACK_OWNERSHIP and OBJBRIDGE_VERIFY_ENCODINGS (0/1,
     * true/false, on/off). Unparseable values are ignored with a warning.
     */
    static Config from_environment();
};

std::optional<LogLevel> parse_log_level(std::string_view text);
std::optional<bool> parse_flag(std::string_view text);
std::string_view to_string(LogLevel level);

} // namespace objbridge
