#include <objbridge/core/logging.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <atomic>

namespace objbridge::log {

namespace {

std::atomic<LogLevel> current_level_{LogLevel::warning};

boost::log::trivial::severity_level to_boost(LogLevel level) {
    switch (level) {
        case LogLevel::trace:
            return boost::log::trivial::trace;
        case LogLevel::debug:
            return boost::log::trivial::debug;
        case LogLevel::info:
            return boost::log::trivial::info;
        case LogLevel::warning:
            return boost::log::trivial::warning;
        case LogLevel::error:
            return boost::log::trivial::error;
        case LogLevel::fatal:
            return boost::log::trivial::fatal;
    }
    return boost::log::trivial::warning;
}

} // namespace

void init(LogLevel level) {
    set_level(level);
}

void set_level(LogLevel level) {
    current_level_.store(level, std::memory_order_release);
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= to_boost(level));
}

LogLevel level() noexcept {
    return current_level_.load(std::memory_order_acquire);
}

} // namespace objbridge::log
