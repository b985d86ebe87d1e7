#pragma once

#include <objbridge/core/handle.hpp>
#include <cstddef>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file autorelease_scope.hpp
 * @brief Scoped deferred release
 */

namespace objbridge {

namespace runtime {
class Runtime;
}

namespace detail {
struct ScopeStack;
}

/**
 * @class AutoreleaseScope
 * @brief RAII autorelease region of the calling thread
 *
 * Construction pushes a native autorelease pool and makes this scope the
 * innermost one of the thread. Destruction releases every handle queued by
 * autorelease() exactly once, last queued first, whether the scope ends
 * normally or by stack unwinding, then pops the native pool.
 *
 * Scopes nest strictly and belong to the thread that created them. Ending a
 * scope that is not innermost is a scope_order violation. Ending it on
 * another thread is a scope_thread violation: the scope is removed from its
 * owner thread's stack, but its queued handles and native pool are leaked
 * (and logged). Violation handlers invoked from here must not throw.
 */
class AutoreleaseScope {
public:
    AutoreleaseScope();
    ~AutoreleaseScope();

    AutoreleaseScope(const AutoreleaseScope&) = delete;
    AutoreleaseScope& operator=(const AutoreleaseScope&) = delete;
    AutoreleaseScope(AutoreleaseScope&&) = delete;
    AutoreleaseScope& operator=(AutoreleaseScope&&) = delete;

    /**
     * @brief Innermost scope of the calling thread, or nullptr
     */
    static AutoreleaseScope* current() noexcept;

    /**
     * @brief Nesting depth on the calling thread
     */
    static std::size_t depth() noexcept;

    /**
     * @brief Handles queued and not yet released
     */
    std::size_t pending() const noexcept { return queue_.size(); }

    void enqueue(Handle handle);

private:
    void drain();

    std::vector<Handle> queue_;
    std::thread::id thread_;
    std::shared_ptr<detail::ScopeStack> stack_;
    std::shared_ptr<runtime::Runtime> runtime_;
    void* pool_token_{nullptr};
};

/**
 * @brief Run @p fn inside a fresh autorelease scope
 * @return Whatever @p fn returns
 */
template<typename F>
decltype(auto) autoreleasepool(F&& fn) {
    AutoreleaseScope scope;
    if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
        std::forward<F>(fn)();
    } else {
        return std::forward<F>(fn)();
    }
}

} // namespace objbridge
