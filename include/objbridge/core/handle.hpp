#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

/**
 * @file handle.hpp
 * @brief Opaque references into the foreign object runtime
 *
 * A Handle is the address-sized identity of a foreign object instance. Host
 * code never dereferences it: the only operations are equality, the nil test
 * and hand-off to the dispatcher or the reference-count manager.
 */

namespace objbridge {

/**
 * @brief Opaque handle type for foreign objects
 */
class Handle {
public:
    using raw_type = void*;

    constexpr Handle() noexcept = default;
    constexpr Handle(std::nullptr_t) noexcept {}
    constexpr explicit Handle(raw_type raw) noexcept : raw_(raw) {}

    constexpr raw_type raw() const noexcept { return raw_; }

    /**
     * @brief Check whether this handle is the nil sentinel
     */
    constexpr bool is_nil() const noexcept { return raw_ == nullptr; }

    constexpr explicit operator bool() const noexcept { return raw_ != nullptr; }

    friend constexpr bool operator==(Handle lhs, Handle rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    raw_type raw_{nullptr};
};

/**
 * @brief The distinguished "no object" value
 *
 * A constant, not shared state: nil has no identity beyond the zero address.
 */
inline constexpr Handle nil_handle{};

/**
 * @brief Typed opaque reference for runtime entities that are not instances
 *
 * @tparam Tag Distinguishes class references from selector references
 */
template<typename Tag>
class OpaqueRef {
public:
    using raw_type = void*;

    constexpr OpaqueRef() noexcept = default;
    constexpr OpaqueRef(std::nullptr_t) noexcept {}
    constexpr explicit OpaqueRef(raw_type raw) noexcept : raw_(raw) {}

    constexpr raw_type raw() const noexcept { return raw_; }
    constexpr bool is_nil() const noexcept { return raw_ == nullptr; }
    constexpr explicit operator bool() const noexcept { return raw_ != nullptr; }

    friend constexpr bool operator==(OpaqueRef lhs, OpaqueRef rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    raw_type raw_{nullptr};
};

struct ClassTag {};
struct SelectorTag {};

using ClassRef = OpaqueRef<ClassTag>;        ///< A foreign class (or metaclass)
using SelectorRef = OpaqueRef<SelectorTag>;  ///< The runtime's canonical selector value

/**
 * @brief Type-erased method implementation pointer
 *
 * Cast to the concrete signature `R(*)(void*, void*, Args...)` right before
 * the call; the first two parameters are the receiver and the selector.
 */
using Imp = void (*)();

/**
 * @brief A class is itself an object in the foreign runtime
 */
constexpr Handle class_handle(ClassRef cls) noexcept {
    return Handle{cls.raw()};
}

} // namespace objbridge

template<>
struct std::hash<objbridge::Handle> {
    std::size_t operator()(objbridge::Handle handle) const noexcept {
        return std::hash<void*>{}(handle.raw());
    }
};

template<typename Tag>
struct std::hash<objbridge::OpaqueRef<Tag>> {
    std::size_t operator()(objbridge::OpaqueRef<Tag> ref) const noexcept {
        return std::hash<void*>{}(ref.raw());
    }
};
