#pragma once
/**
 * @file objbridge.hpp
 * @brief Main header for the objbridge object bridge
 *
 * Includes the whole public interface: runtime backends, ownership and
 * autorelease scopes, typed message sends, capability traits and the class
 * builder. Users should include this single header.
 */

// Core
#include <objbridge/core/handle.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/config.hpp>
#include <objbridge/core/logging.hpp>
#include <objbridge/core/bridge.hpp>
// Runtime backends
#include <objbridge/runtime/runtime.hpp>
#include <objbridge/runtime/sim_runtime.hpp>
#include <objbridge/runtime/objc_runtime.hpp>
// Ownership
#include <objbridge/memory/ownership.hpp>
#include <objbridge/memory/reference_counting.hpp>
#include <objbridge/memory/object_ref.hpp>
#include <objbridge/memory/autorelease_scope.hpp>
// Dispatch
#include <objbridge/dispatch/selector.hpp>
#include <objbridge/dispatch/method_family.hpp>
#include <objbridge/dispatch/encoding.hpp>
#include <objbridge/dispatch/dispatcher.hpp>
#include <objbridge/dispatch/marshal.hpp>
#include <objbridge/dispatch/message.hpp>
// Capability traits
#include <objbridge/traits/capability.hpp>
#include <objbridge/traits/interface.hpp>
#include <objbridge/traits/object.hpp>
#include <objbridge/traits/class_builder.hpp>
#include <objbridge/foundation/ns_object.hpp>
