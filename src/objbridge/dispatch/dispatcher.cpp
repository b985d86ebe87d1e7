#include <objbridge/dispatch/dispatcher.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/logging.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <mutex>

namespace objbridge::dispatch {

Dispatcher::Dispatcher(runtime::Runtime& runtime, std::size_t reserve)
    : runtime_(runtime) {
    cache_.reserve(reserve);
}

Implementation Dispatcher::resolve(Handle target, const Selector& selector) {
    if (target.is_nil()) {
        throw ResolutionError(OB_ERROR_NIL_RECEIVER, "nil receiver for " + selector.name());
    }
    return resolve_in(runtime_.class_of(target), selector);
}

Implementation Dispatcher::resolve_in(ClassRef cls, const Selector& selector) {
    if (auto implementation = try_resolve_in(cls, selector)) {
        return std::move(*implementation);
    }
    const char prefix = runtime_.is_metaclass(cls) ? '+' : '-';
    std::string message;
    message += prefix;
    message += "[" + runtime_.class_name(cls) + " " + selector.name() + "]: unrecognized selector";
    OBJBRIDGE_LOG_DEBUG_STREAM << message;
    throw ResolutionError(OB_ERROR_SELECTOR_NOT_FOUND, message);
}

std::optional<Implementation> Dispatcher::try_resolve_in(ClassRef cls, const Selector& selector) {
    if (cls.is_nil()) {
        throw ResolutionError(OB_ERROR_CLASS_NOT_FOUND, "nil class for " + selector.name());
    }
    const Key key{cls.raw(), selector.ref().raw()};
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }
    misses_.fetch_add(1, std::memory_order_relaxed);

    for (ClassRef current = cls; current; current = runtime_.superclass_of(current)) {
        if (auto entry = runtime_.find_own_method(current, selector.ref())) {
            Implementation implementation{entry->imp, current, std::move(entry->encoding)};
            OBJBRIDGE_LOG_TRACE_STREAM << "resolved " << selector.name() << " on "
                                       << runtime_.class_name(cls) << " via " << runtime_.class_name(current);
            std::unique_lock<std::shared_mutex> lock(mutex_);
            cache_.emplace(key, implementation);
            return implementation;
        }
    }
    return std::nullopt;
}

void Dispatcher::invalidate() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
}

std::size_t Dispatcher::cache_size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

} // namespace objbridge::dispatch
