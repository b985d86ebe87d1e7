#include <objbridge/core/config.hpp>
#include <objbridge/core/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace objbridge {

namespace {

std::string lowercase(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) {
    const std::string value = lowercase(text);
    if (value == "trace") return LogLevel::trace;
    if (value == "debug") return LogLevel::debug;
    if (value == "info") return LogLevel::info;
    if (value == "warning" || value == "warn") return LogLevel::warning;
    if (value == "error") return LogLevel::error;
    if (value == "fatal") return LogLevel::fatal;
    return std::nullopt;
}

std::optional<bool> parse_flag(std::string_view text) {
    const std::string value = lowercase(text);
    if (value == "1" || value == "true" || value == "on" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "off" || value == "no") return false;
    return std::nullopt;
}

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::trace: return "trace";
        case LogLevel::debug: return "debug";
        case LogLevel::info: return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error: return "error";
        case LogLevel::fatal: return "fatal";
    }
    return "warning";
}

Config Config::from_environment() {
    Config config;
    if (const char* value = env("OBJBRIDGE_LOG_LEVEL")) {
        if (auto level = parse_log_level(value)) {
            config.log_level = *level;
        } else {
            OBJBRIDGE_LOG_WARN_STREAM << "Ignoring OBJBRIDGE_LOG_LEVEL=" << value;
        }
    }
    if (const char* value = env("OBJBRIDGE_TRACK_OWNERSHIP")) {
        if (auto flag = parse_flag(value)) {
            config.track_ownership = *flag;
        } else {
            OBJBRIDGE_LOG_WARN_STREAM << "Ignoring OBJBRIDGE_TRACK_OWNERSHIP=" << value;
        }
    }
    if (const char* value = env("OBJBRIDGE_VERIFY_ENCODINGS")) {
        if (auto flag = parse_flag(value)) {
            config.verify_encodings = *flag;
        } else {
            OBJBRIDGE_LOG_WARN_STREAM << "Ignoring OBJBRIDGE_VERIFY_ENCODINGS=" << value;
        }
    }
    return config;
}

} // namespace objbridge
