#pragma once

#include <objbridge/core/handle.hpp>
#include <cstddef>

/**
 * @file reference_counting.hpp
 * @brief Retain, release, autorelease and adopt on raw handles
 *
 * These are the only paths by which the bridge changes a foreign reference
 * count. Each one is checked against the ownership ledger when
 * Config::track_ownership is on. Host code normally goes through ObjectRef
 * or a generated wrapper instead of calling them directly.
 */

namespace objbridge {

/**
 * @brief Increment the foreign reference count
 * @return The same handle; nil is returned unchanged without a runtime call
 */
Handle retain(Handle handle);

/**
 * @brief Decrement the foreign reference count
 *
 * A release that no earlier retain or adopt accounts for is reported as an
 * unbalanced_release violation and never reaches the runtime.
 */
void release(Handle handle);

/**
 * @brief Hand one +1 to the innermost autorelease scope of this thread
 * @return The same handle, for chaining
 */
Handle autorelease(Handle handle);

/**
 * @brief Record a +1 the runtime already transferred to the caller
 *
 * Used for the results of alloc/new/copy/mutableCopy/init family methods.
 */
Handle adopt(Handle handle);

/**
 * @brief Number of +1s the ledger attributes to the bridge for @p handle
 */
std::size_t retain_balance(Handle handle);

} // namespace objbridge
