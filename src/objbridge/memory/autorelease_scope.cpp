#include <objbridge/memory/autorelease_scope.hpp>
#include <objbridge/core/bridge.hpp>
#include <objbridge/core/logging.hpp>
#include <objbridge/memory/ownership.hpp>
#include <objbridge/memory/reference_counting.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <algorithm>
#include <mutex>

namespace objbridge {

namespace detail {

/**
 * Scopes of one thread, innermost last. Shared with every scope entered on
 * the thread so a scope ended elsewhere can still remove itself.
 */
struct ScopeStack {
    mutable std::mutex mutex;
    std::vector<AutoreleaseScope*> scopes;
};

} // namespace detail

namespace {

const std::shared_ptr<detail::ScopeStack>& thread_stack() {
    thread_local const std::shared_ptr<detail::ScopeStack> stack = std::make_shared<detail::ScopeStack>();
    return stack;
}

} // namespace

AutoreleaseScope::AutoreleaseScope()
    : thread_(std::this_thread::get_id()),
      stack_(thread_stack()),
      runtime_(get_bridge().runtime_ptr()) {
    pool_token_ = runtime_->pool_push();
    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(stack_->mutex);
        stack_->scopes.push_back(this);
        depth = stack_->scopes.size();
    }
    OBJBRIDGE_LOG_TRACE_STREAM << "Entered autorelease scope, depth " << depth;
}

AutoreleaseScope::~AutoreleaseScope() {
    if (std::this_thread::get_id() != thread_) {
        {
            std::lock_guard<std::mutex> lock(stack_->mutex);
            auto& scopes = stack_->scopes;
            scopes.erase(std::remove(scopes.begin(), scopes.end(), this), scopes.end());
        }
        OBJBRIDGE_LOG_WARN_STREAM << "Autorelease scope ended off its thread; leaking " << queue_.size()
                                  << " queued handle(s) and native pool " << pool_token_;
        report_violation(ViolationKind::scope_thread, nil_handle,
                         "autorelease scope ended on a thread other than the one that entered it");
        return;
    }

    bool innermost = false;
    {
        std::lock_guard<std::mutex> lock(stack_->mutex);
        innermost = !stack_->scopes.empty() && stack_->scopes.back() == this;
    }
    if (!innermost) {
        report_violation(ViolationKind::scope_order, nil_handle,
                         "autorelease scope ended while an inner scope is still active");
    }

    drain();

    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(stack_->mutex);
        auto& scopes = stack_->scopes;
        auto it = std::find(scopes.begin(), scopes.end(), this);
        if (it != scopes.end()) {
            scopes.erase(it);
        }
        depth = scopes.size();
    }
    // An outer native pool cannot be popped without destroying the inner one
    if (innermost) {
        runtime_->pool_pop(pool_token_);
    }
    OBJBRIDGE_LOG_TRACE_STREAM << "Left autorelease scope, depth " << depth;
}

AutoreleaseScope* AutoreleaseScope::current() noexcept {
    const auto& stack = thread_stack();
    std::lock_guard<std::mutex> lock(stack->mutex);
    return stack->scopes.empty() ? nullptr : stack->scopes.back();
}

std::size_t AutoreleaseScope::depth() noexcept {
    const auto& stack = thread_stack();
    std::lock_guard<std::mutex> lock(stack->mutex);
    return stack->scopes.size();
}

void AutoreleaseScope::enqueue(Handle handle) {
    queue_.push_back(handle);
}

void AutoreleaseScope::drain() {
    Bridge& bridge = get_bridge();
    // Releases may autorelease more objects into this scope
    while (!queue_.empty()) {
        const Handle handle = queue_.back();
        queue_.pop_back();
        if (bridge.config().track_ownership) {
            bridge.ledger().settle_autorelease(handle);
        }
        release(handle);
    }
}

} // namespace objbridge
