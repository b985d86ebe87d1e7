#include <objbridge/memory/ownership.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/logging.hpp>
#include <cstdlib>
#include <sstream>

namespace objbridge {

namespace {

std::mutex handler_mutex_;
ViolationHandler handler_;

[[noreturn]] void abort_on_violation(const Violation& violation) {
    OBJBRIDGE_LOG_FATAL_STREAM << "Ownership violation (" << to_string(violation.kind)
                               << ") on handle " << violation.handle.raw() << ": " << violation.message;
    std::abort();
}

} // namespace

std::string_view to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::unbalanced_release: return "unbalanced_release";
        case ViolationKind::autorelease_without_scope: return "autorelease_without_scope";
        case ViolationKind::autorelease_unowned: return "autorelease_unowned";
        case ViolationKind::scope_order: return "scope_order";
        case ViolationKind::scope_thread: return "scope_thread";
        case ViolationKind::stale_handle: return "stale_handle";
        case ViolationKind::pool_mismatch: return "pool_mismatch";
    }
    return "unknown";
}

ViolationHandler set_violation_handler(ViolationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    ViolationHandler previous = std::move(handler_);
    handler_ = std::move(handler);
    return previous;
}

ViolationHandler throw_on_violation() {
    return [](const Violation& violation) {
        std::ostringstream message;
        message << to_string(violation.kind) << ": " << violation.message;
        throw OwnershipViolationError(message.str());
    };
}

void report_violation(ViolationKind kind, Handle handle, std::string message) {
    ViolationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    Violation violation{kind, handle, std::move(message)};
    if (!handler) {
        abort_on_violation(violation);
    }
    OBJBRIDGE_LOG_ERROR_STREAM << "Ownership violation (" << to_string(kind) << ") on handle "
                               << handle.raw() << ": " << violation.message;
    handler(violation);
}

// OwnershipLedger

void OwnershipLedger::credit(Handle handle) {
    if (handle.is_nil()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    ++entries_[handle].credits;
}

bool OwnershipLedger::debit(Handle handle) {
    if (handle.is_nil()) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end() || it->second.credits == 0) {
        return false;
    }
    if (--it->second.credits == 0 && it->second.pending == 0) {
        entries_.erase(it);
    }
    return true;
}

bool OwnershipLedger::reserve_autorelease(Handle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end() || it->second.credits <= it->second.pending) {
        return false;
    }
    ++it->second.pending;
    return true;
}

void OwnershipLedger::settle_autorelease(Handle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it != entries_.end() && it->second.pending > 0) {
        --it->second.pending;
    }
}

std::size_t OwnershipLedger::balance(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    return it == entries_.end() ? 0 : it->second.credits;
}

std::size_t OwnershipLedger::pending_autoreleases(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    return it == entries_.end() ? 0 : it->second.pending;
}

std::size_t OwnershipLedger::tracked_handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void OwnershipLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace objbridge
