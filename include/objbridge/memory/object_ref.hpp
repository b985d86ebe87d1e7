#pragma once

#include <objbridge/core/handle.hpp>
#include <objbridge/memory/ownership.hpp>
#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

/**
 * @file object_ref.hpp
 * @brief Handle paired with an ownership tag
 */

namespace objbridge {

/**
 * @class ObjectRef
 * @brief A handle that knows whether it must release
 *
 * An owned ObjectRef accounts for exactly one +1 on its object: copying it
 * retains, destroying or reassigning it releases once. A borrowed ObjectRef
 * never touches the reference count. A default-constructed ObjectRef is a
 * borrowed nil.
 */
class ObjectRef {
public:
    ObjectRef() noexcept = default;

    /**
     * @brief Take over a +1 the caller already holds
     */
    static ObjectRef adopt(Handle handle);

    /**
     * @brief Retain @p handle and own the new +1
     */
    static ObjectRef retain(Handle handle);

    /**
     * @brief Refer to @p handle without owning it
     */
    static ObjectRef borrow(Handle handle) noexcept {
        return ObjectRef(handle, Ownership::borrowed);
    }

    ObjectRef(const ObjectRef& other);
    ObjectRef(ObjectRef&& other) noexcept
        : handle_(std::exchange(other.handle_, nil_handle)),
          ownership_(std::exchange(other.ownership_, Ownership::borrowed)) {}

    ObjectRef& operator=(const ObjectRef& other);
    ObjectRef& operator=(ObjectRef&& other) noexcept;

    ~ObjectRef();

    Handle handle() const noexcept { return handle_; }
    Ownership ownership() const noexcept { return ownership_; }
    bool is_owned() const noexcept { return ownership_ == Ownership::owned && !handle_.is_nil(); }
    bool is_nil() const noexcept { return handle_.is_nil(); }
    explicit operator bool() const noexcept { return !handle_.is_nil(); }

    /**
     * @brief An owned reference to the same object
     *
     * Retains when this reference is borrowed.
     */
    ObjectRef to_owned() &&;
    ObjectRef to_owned() const&;

    /**
     * @brief Give back this reference's +1 and keep only a borrowed reference
     *
     * The object must be kept alive by some other owner.
     */
    ObjectRef to_borrowed() &&;

    /**
     * @brief Hand the +1 (if any) to the caller, leaving this reference nil
     */
    Handle into_handle() && noexcept;

    /**
     * @brief Move this reference's +1 into the innermost autorelease scope
     *
     * A borrowed reference is retained first, so the object lives at least
     * until the scope drains.
     */
    Handle autorelease() &&;

    /**
     * @brief Release (if owned) and become a borrowed nil
     */
    void reset();

    void swap(ObjectRef& other) noexcept {
        std::swap(handle_, other.handle_);
        std::swap(ownership_, other.ownership_);
    }

    friend bool operator==(const ObjectRef& lhs, const ObjectRef& rhs) noexcept {
        return lhs.handle_ == rhs.handle_;
    }

    friend std::ostream& operator<<(std::ostream& os, const ObjectRef& ref);

private:
    ObjectRef(Handle handle, Ownership ownership) noexcept
        : handle_(handle), ownership_(ownership) {}

    Handle handle_{};
    Ownership ownership_{Ownership::borrowed};
};

} // namespace objbridge

template<>
struct std::hash<objbridge::ObjectRef> {
    std::size_t operator()(const objbridge::ObjectRef& ref) const noexcept {
        return std::hash<objbridge::Handle>{}(ref.handle());
    }
};
