#pragma once

#include <objbridge/core/handle.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file runtime.hpp
 * @brief Boundary between the bridge and a foreign object runtime
 */

namespace objbridge::runtime {

/**
 * @brief A method entry found on exactly one class
 */
struct MethodEntry {
    Imp imp{nullptr};        ///< Implementation, called as R(*)(void*, void*, Args...)
    std::string encoding;    ///< Runtime type encoding, empty if the runtime has none
};

/**
 * @class Runtime
 * @brief Interface to the foreign object runtime
 *
 * Implementations expose the primitive queries of an Objective-C style
 * runtime. Method lookup is per class only: walking the ancestry chain and
 * caching the result is the dispatcher's job. All calls are synchronous and
 * run on the caller's thread.
 */
class Runtime {
public:
    virtual ~Runtime() = default;

    /**
     * @brief Short backend name for diagnostics
     */
    virtual std::string_view name() const noexcept = 0;

    /* Classes */

    /**
     * @brief Look up a registered class by name
     * @return The class, or a nil reference if the runtime does not know it
     */
    virtual ClassRef lookup_class(std::string_view name) const = 0;

    /**
     * @brief Dynamic class of an object; the metaclass when given a class object
     */
    virtual ClassRef class_of(Handle object) const = 0;

    virtual ClassRef superclass_of(ClassRef cls) const = 0;
    virtual std::string class_name(ClassRef cls) const = 0;
    virtual bool is_metaclass(ClassRef cls) const = 0;
    virtual bool conforms_to(ClassRef cls, std::string_view protocol) const = 0;

    /**
     * @brief The runtime's object for a protocol, as conformsToProtocol: takes it
     * @return nil if the runtime does not know the protocol
     */
    virtual Handle lookup_protocol(std::string_view name) const = 0;

    /* Selectors and methods */

    virtual SelectorRef register_selector(std::string_view name) = 0;
    virtual std::string selector_name(SelectorRef selector) const = 0;

    /**
     * @brief Find a method declared directly on @p cls, ignoring superclasses
     */
    virtual std::optional<MethodEntry> find_own_method(ClassRef cls, SelectorRef selector) const = 0;

    /* Reference counting */

    virtual Handle retain(Handle object) = 0;
    virtual void release(Handle object) = 0;
    virtual std::size_t retain_count(Handle object) const = 0;

    /**
     * @brief Push a native autorelease pool
     * @return Token to hand back to pool_pop()
     */
    virtual void* pool_push() = 0;
    virtual void pool_pop(void* token) = 0;

    /* Class declaration */

    /**
     * @brief Create an unregistered class pair under @p superclass
     * @return The new class, or nil if the name is taken
     */
    virtual ClassRef allocate_class(std::string_view name, ClassRef superclass) = 0;

    /**
     * @brief Add a method to a class (or to a metaclass for class methods)
     * @return false if the class already declares the selector
     */
    virtual bool add_method(ClassRef cls, SelectorRef selector, Imp imp, std::string_view encoding) = 0;

    virtual bool add_protocol(ClassRef cls, std::string_view protocol) = 0;
    virtual void register_class(ClassRef cls) = 0;
};

/**
 * @brief Runtime of the host platform
 *
 * The Objective-C runtime on Apple platforms, nullptr elsewhere.
 */
std::shared_ptr<Runtime> make_platform_runtime();

} // namespace objbridge::runtime
