#pragma once

#include <objbridge/core/handle.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * @file ownership.hpp
 * @brief Ownership tags, the retain ledger and ownership violations
 */

namespace objbridge {

/**
 * @brief Whether a reference must release its handle when it goes away
 */
enum class Ownership : uint8_t {
    owned = 0,     ///< Holds one +1 on the foreign object
    borrowed = 1   ///< Holds nothing; never releases
};

enum class ViolationKind : uint8_t {
    unbalanced_release,          ///< release with no matching retain
    autorelease_without_scope,   ///< autorelease on a thread with no active scope
    autorelease_unowned,         ///< autorelease of a handle with no credit left
    scope_order,                 ///< an outer scope ended before an inner one
    scope_thread,                ///< a scope ended on a thread other than its own
    stale_handle,                ///< use of an already deallocated object
    pool_mismatch                ///< native pool popped out of order
};

std::string_view to_string(ViolationKind kind);

struct Violation {
    ViolationKind kind;
    Handle handle;
    std::string message;
};

/**
 * @brief Called for every ownership-discipline violation
 *
 * A violation means the ownership invariant is already broken. The default
 * handler logs at fatal severity and aborts. A replacement may throw, but it
 * must not return normally and expect the offending operation to proceed: the
 * bridge skips the operation after the handler returns.
 */
using ViolationHandler = std::function<void(const Violation&)>;

/**
 * @brief Install a violation handler
 * @param handler New handler; an empty function restores the default
 * @return The previously installed handler
 */
ViolationHandler set_violation_handler(ViolationHandler handler);

/**
 * @brief Handler that throws OwnershipViolationError
 */
ViolationHandler throw_on_violation();

void report_violation(ViolationKind kind, Handle handle, std::string message);

/**
 * @class OwnershipLedger
 * @brief Per-handle bookkeeping of the +1s the bridge holds
 *
 * Every increment attributable to a bridge reference is credited here, every
 * release is debited. A debit with no credit is an unbalanced release. Handles
 * queued in an autorelease scope keep their credit until the scope drains.
 */
class OwnershipLedger {
public:
    void credit(Handle handle);

    /**
     * @return false if the handle has no credit to give back
     */
    [[nodiscard]] bool debit(Handle handle);

    /**
     * @brief Reserve one credit for a deferred release
     * @return false if every credit is already reserved
     */
    [[nodiscard]] bool reserve_autorelease(Handle handle);

    /**
     * @brief Drop a reservation made by reserve_autorelease()
     */
    void settle_autorelease(Handle handle);

    std::size_t balance(Handle handle) const;
    std::size_t pending_autoreleases(Handle handle) const;
    std::size_t tracked_handles() const;
    void clear();

private:
    struct Entry {
        std::size_t credits{0};
        std::size_t pending{0};
    };

    mutable std::mutex mutex_;
    std::unordered_map<Handle, Entry> entries_;
};

} // namespace objbridge
