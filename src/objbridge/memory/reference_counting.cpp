#include <objbridge/memory/reference_counting.hpp>
#include <objbridge/core/bridge.hpp>
#include <objbridge/memory/autorelease_scope.hpp>
#include <objbridge/memory/ownership.hpp>
#include <objbridge/runtime/runtime.hpp>

namespace objbridge {

Handle retain(Handle handle) {
    if (handle.is_nil()) {
        return handle;
    }
    Bridge& bridge = get_bridge();
    Handle result = bridge.runtime().retain(handle);
    if (bridge.config().track_ownership) {
        bridge.ledger().credit(result);
    }
    return result;
}

void release(Handle handle) {
    if (handle.is_nil()) {
        return;
    }
    Bridge& bridge = get_bridge();
    if (bridge.config().track_ownership && !bridge.ledger().debit(handle)) {
        report_violation(ViolationKind::unbalanced_release, handle, "release without a matching retain");
        return;
    }
    bridge.runtime().release(handle);
}

Handle autorelease(Handle handle) {
    if (handle.is_nil()) {
        return handle;
    }
    AutoreleaseScope* scope = AutoreleaseScope::current();
    if (!scope) {
        report_violation(ViolationKind::autorelease_without_scope, handle,
                         "autorelease with no autorelease scope on this thread");
        return handle;
    }
    Bridge& bridge = get_bridge();
    if (bridge.config().track_ownership && !bridge.ledger().reserve_autorelease(handle)) {
        report_violation(ViolationKind::autorelease_unowned, handle,
                         "autorelease of a handle the bridge holds no unqueued retain on");
        return handle;
    }
    scope->enqueue(handle);
    return handle;
}

Handle adopt(Handle handle) {
    if (handle.is_nil()) {
        return handle;
    }
    Bridge& bridge = get_bridge();
    if (bridge.config().track_ownership) {
        bridge.ledger().credit(handle);
    }
    return handle;
}

std::size_t retain_balance(Handle handle) {
    return get_bridge().ledger().balance(handle);
}

} // namespace objbridge
