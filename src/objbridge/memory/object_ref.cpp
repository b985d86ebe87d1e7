#include <objbridge/memory/object_ref.hpp>
#include <objbridge/memory/reference_counting.hpp>

namespace objbridge {

ObjectRef ObjectRef::adopt(Handle handle) {
    return ObjectRef(objbridge::adopt(handle), Ownership::owned);
}

ObjectRef ObjectRef::retain(Handle handle) {
    return ObjectRef(objbridge::retain(handle), Ownership::owned);
}

ObjectRef::ObjectRef(const ObjectRef& other)
    : handle_(other.handle_), ownership_(other.ownership_) {
    if (is_owned()) {
        objbridge::retain(handle_);
    }
}

ObjectRef& ObjectRef::operator=(const ObjectRef& other) {
    if (this != &other) {
        ObjectRef copy(other);
        swap(copy);
    }
    return *this;
}

ObjectRef& ObjectRef::operator=(ObjectRef&& other) noexcept {
    if (this != &other) {
        ObjectRef moved(std::move(other));
        swap(moved);
    }
    return *this;
}

ObjectRef::~ObjectRef() {
    if (is_owned()) {
        objbridge::release(handle_);
    }
}

ObjectRef ObjectRef::to_owned() && {
    if (ownership_ == Ownership::owned) {
        return std::move(*this);
    }
    return ObjectRef::retain(std::exchange(handle_, nil_handle));
}

ObjectRef ObjectRef::to_owned() const& {
    return ObjectRef::retain(handle_);
}

ObjectRef ObjectRef::to_borrowed() && {
    const Handle handle = std::exchange(handle_, nil_handle);
    if (std::exchange(ownership_, Ownership::borrowed) == Ownership::owned) {
        objbridge::release(handle);
    }
    return ObjectRef::borrow(handle);
}

Handle ObjectRef::into_handle() && noexcept {
    ownership_ = Ownership::borrowed;
    return std::exchange(handle_, nil_handle);
}

Handle ObjectRef::autorelease() && {
    if (handle_.is_nil()) {
        return nil_handle;
    }
    if (ownership_ == Ownership::borrowed) {
        objbridge::retain(handle_);
        ownership_ = Ownership::owned;
    }
    // Still owned if autorelease() throws, so the +1 is released here
    const Handle handle = objbridge::autorelease(handle_);
    handle_ = nil_handle;
    ownership_ = Ownership::borrowed;
    return handle;
}

void ObjectRef::reset() {
    ObjectRef released;
    swap(released);
}

std::ostream& operator<<(std::ostream& os, const ObjectRef& ref) {
    if (ref.is_nil()) {
        return os << "<nil>";
    }
    return os << "<" << (ref.is_owned() ? "owned " : "borrowed ") << ref.handle().raw() << ">";
}

} // namespace objbridge
