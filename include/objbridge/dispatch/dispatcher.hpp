#pragma once

#include <objbridge/core/handle.hpp>
#include <objbridge/dispatch/selector.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

/**
 * @file dispatcher.hpp
 * @brief Cached method resolution
 */

namespace objbridge {

namespace runtime {
class Runtime;
}

namespace dispatch {

/**
 * @brief A resolved method
 */
struct Implementation {
    Imp imp{nullptr};
    ClassRef provider;     ///< Class whose method table supplied imp
    std::string encoding;  ///< Runtime type encoding, may be empty
};

/**
 * @class Dispatcher
 * @brief Resolves (dynamic class, selector) pairs to implementations
 *
 * Resolution starts at the given class and walks superclasses until one
 * declares the selector; the first hit wins. Hits are cached for the life of
 * the runtime, misses are not, so a method added later is still found.
 * Adding a method through the bridge invalidates the cache.
 *
 * Thread-safe: lookups take a shared lock, the runtime is queried with no
 * lock held.
 */
class Dispatcher {
public:
    Dispatcher(runtime::Runtime& runtime, std::size_t reserve);

    /**
     * @brief Resolve @p selector against the dynamic class of @p target
     *
     * For a class object this finds class methods, since the dynamic class
     * of a class is its metaclass.
     *
     * @throw ResolutionError OB_ERROR_NIL_RECEIVER for nil,
     *        OB_ERROR_SELECTOR_NOT_FOUND when no ancestor declares it
     */
    Implementation resolve(Handle target, const Selector& selector);

    /**
     * @brief Resolve starting at @p cls instead of a receiver's class
     *
     * Pass a metaclass to find class methods, or a superclass to find the
     * implementation an override replaces.
     */
    Implementation resolve_in(ClassRef cls, const Selector& selector);

    std::optional<Implementation> try_resolve_in(ClassRef cls, const Selector& selector);

    /**
     * @brief Drop every cached resolution
     */
    void invalidate();

    std::size_t cache_size() const;
    std::size_t hits() const noexcept { return hits_.load(std::memory_order_relaxed); }
    std::size_t misses() const noexcept { return misses_.load(std::memory_order_relaxed); }

private:
    struct Key {
        const void* cls;
        const void* selector;

        bool operator==(const Key& other) const noexcept {
            return cls == other.cls && selector == other.selector;
        }
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            const std::size_t h1 = std::hash<const void*>{}(key.cls);
            const std::size_t h2 = std::hash<const void*>{}(key.selector);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    runtime::Runtime& runtime_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, Implementation, KeyHash> cache_;
    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};
};

} // namespace dispatch
} // namespace objbridge
