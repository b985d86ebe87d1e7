#pragma once

#include <objbridge/traits/interface.hpp>
#include <objbridge/traits/object.hpp>
#include <cstdint>
#include <string>

/**
 * @file ns_object.hpp
 * @brief Root class capability trait
 *
 * Every class trait's ancestry ends at INSObject. The description methods
 * return the runtime's string object; wrap it in NSString to read the text,
 * or use ObjectBase::debug_description().
 *
 * conforms_to_protocol() takes the runtime's protocol object, as returned by
 * Bridge::lookup_protocol().
 */

namespace objbridge {

OBJBRIDGE_ROOT_INTERFACE(INSObject, "NSObject",
    ((class_method, alloc, "alloc", instancetype()))
    ((class_method, new_object, "new", instancetype()))
    ((method, init, "init", instancetype()))
    ((method, class_object, "class", ClassRef()))
    ((method, hash, "hash", std::uint64_t()))
    ((method, is_equal, "isEqual:", bool(ObjectRef)))
    ((method, responds_to_selector, "respondsToSelector:", bool(Selector)))
    ((method, is_kind_of_class, "isKindOfClass:", bool(ClassRef)))
    ((method, is_member_of_class, "isMemberOfClass:", bool(ClassRef)))
    ((method, conforms_to_protocol, "conformsToProtocol:", bool(ObjectRef)))
    ((method, description_object, "description", ObjectRef()))
    ((method, debug_description_object, "debugDescription", ObjectRef()))
    ((method, perform_selector, "performSelector:", ObjectRef(Selector)))
    ((method, perform_selector_with_object, "performSelector:withObject:", ObjectRef(Selector, ObjectRef)))
    ((method, is_proxy, "isProxy", bool()))
    ((method, retain_count, "retainCount", std::uint64_t()))
    ((method, copy, "copy", instancetype()))
    ((method, self_object, "self", instancetype()))
)

OBJBRIDGE_PROTOCOL(PNSCopying, "NSCopying",
    ((method, copy_with_zone, "copyWithZone:", instancetype(void*)))
)

OBJBRIDGE_DECLARE_OBJECT(NSObject, INSObject)

OBJBRIDGE_INTERFACE(INSString, "NSString", INSObject,
    ((method, utf8_string, "UTF8String", std::string()))
    ((method, length, "length", std::uint64_t()))
)

OBJBRIDGE_DECLARE_OBJECT(NSString, INSString)

} // namespace objbridge
