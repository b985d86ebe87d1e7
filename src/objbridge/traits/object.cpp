#include <objbridge/traits/object.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <sstream>

namespace objbridge {

std::string ObjectBase::dynamic_class_name() const {
    if (is_nil()) {
        return std::string();
    }
    runtime::Runtime& rt = get_bridge().runtime();
    return rt.class_name(rt.class_of(handle()));
}

std::string ObjectBase::description() const {
    std::ostringstream os;
    os << *this;
    return os.str();
}

std::string ObjectBase::debug_description() const {
    if (is_nil()) {
        return "<nil>";
    }
    const ObjectRef text = msg_send<ObjectRef()>(ref_, "debugDescription");
    return msg_send<std::string()>(text, "UTF8String");
}

std::ostream& operator<<(std::ostream& os, const ObjectBase& object) {
    if (object.is_nil()) {
        return os << "<nil>";
    }
    return os << "<" << object.dynamic_class_name() << ": " << object.handle().raw() << ">";
}

} // namespace objbridge
