#include <objbridge/runtime/objc_runtime.hpp>

#ifdef __APPLE__

#include <objbridge/core/error.hpp>
#include <objbridge/core/logging.hpp>
#include <objc/message.h>
#include <objc/runtime.h>
#include <cstdlib>
#include <string>

extern "C" {
void* objc_autoreleasePoolPush(void);
void objc_autoreleasePoolPop(void* context);
}

namespace objbridge::runtime {

namespace {

Class to_class(ClassRef cls) {
    return static_cast<Class>(cls.raw());
}

id to_id(Handle object) {
    return static_cast<id>(object.raw());
}

SEL to_sel(SelectorRef selector) {
    return static_cast<SEL>(selector.raw());
}

} // namespace

ClassRef ObjcRuntime::lookup_class(std::string_view name) const {
    const std::string key(name);
    return ClassRef{static_cast<void*>(objc_lookUpClass(key.c_str()))};
}

ClassRef ObjcRuntime::class_of(Handle object) const {
    if (object.is_nil()) {
        return ClassRef{};
    }
    return ClassRef{static_cast<void*>(object_getClass(to_id(object)))};
}

ClassRef ObjcRuntime::superclass_of(ClassRef cls) const {
    return ClassRef{static_cast<void*>(class_getSuperclass(to_class(cls)))};
}

std::string ObjcRuntime::class_name(ClassRef cls) const {
    const char* name = class_getName(to_class(cls));
    return name ? std::string(name) : std::string();
}

bool ObjcRuntime::is_metaclass(ClassRef cls) const {
    return class_isMetaClass(to_class(cls));
}

bool ObjcRuntime::conforms_to(ClassRef cls, std::string_view protocol) const {
    const std::string key(protocol);
    Protocol* proto = objc_getProtocol(key.c_str());
    return proto != nullptr && class_conformsToProtocol(to_class(cls), proto);
}

Handle ObjcRuntime::lookup_protocol(std::string_view name) const {
    const std::string key(name);
    return Handle{static_cast<void*>(objc_getProtocol(key.c_str()))};
}

SelectorRef ObjcRuntime::register_selector(std::string_view name) {
    const std::string key(name);
    return SelectorRef{static_cast<void*>(sel_registerName(key.c_str()))};
}

std::string ObjcRuntime::selector_name(SelectorRef selector) const {
    return sel_getName(to_sel(selector));
}

std::optional<MethodEntry> ObjcRuntime::find_own_method(ClassRef cls, SelectorRef selector) const {
    // class_getInstanceMethod searches superclasses; only the class's own list is wanted here
    unsigned int count = 0;
    Method* methods = class_copyMethodList(to_class(cls), &count);
    std::optional<MethodEntry> result;
    for (unsigned int i = 0; i < count; ++i) {
        if (method_getName(methods[i]) == to_sel(selector)) {
            const char* encoding = method_getTypeEncoding(methods[i]);
            result = MethodEntry{reinterpret_cast<Imp>(method_getImplementation(methods[i])),
                                 encoding ? std::string(encoding) : std::string()};
            break;
        }
    }
    std::free(methods);
    return result;
}

Handle ObjcRuntime::retain(Handle object) {
    if (object.is_nil()) {
        return object;
    }
    auto send = reinterpret_cast<id (*)(id, SEL)>(objc_msgSend);
    return Handle{static_cast<void*>(send(to_id(object), sel_registerName("retain")))};
}

void ObjcRuntime::release(Handle object) {
    if (object.is_nil()) {
        return;
    }
    auto send = reinterpret_cast<void (*)(id, SEL)>(objc_msgSend);
    send(to_id(object), sel_registerName("release"));
}

std::size_t ObjcRuntime::retain_count(Handle object) const {
    if (object.is_nil()) {
        return 0;
    }
    auto send = reinterpret_cast<unsigned long (*)(id, SEL)>(objc_msgSend);
    return static_cast<std::size_t>(send(to_id(object), sel_registerName("retainCount")));
}

void* ObjcRuntime::pool_push() {
    return objc_autoreleasePoolPush();
}

void ObjcRuntime::pool_pop(void* token) {
    objc_autoreleasePoolPop(token);
}

ClassRef ObjcRuntime::allocate_class(std::string_view name, ClassRef superclass) {
    const std::string key(name);
    Class cls = objc_allocateClassPair(to_class(superclass), key.c_str(), 0);
    if (!cls) {
        OBJBRIDGE_LOG_DEBUG_STREAM << "objc: class pair " << key << " could not be allocated";
    }
    return ClassRef{static_cast<void*>(cls)};
}

bool ObjcRuntime::add_method(ClassRef cls, SelectorRef selector, Imp imp, std::string_view encoding) {
    const std::string types(encoding);
    return class_addMethod(to_class(cls), to_sel(selector), reinterpret_cast<IMP>(imp), types.c_str());
}

bool ObjcRuntime::add_protocol(ClassRef cls, std::string_view protocol) {
    const std::string key(protocol);
    Protocol* proto = objc_getProtocol(key.c_str());
    if (!proto) {
        throw OBException(OB_ERROR_NOT_SUPPORTED, "protocol " + key + " is not known to the runtime");
    }
    return class_addProtocol(to_class(cls), proto);
}

void ObjcRuntime::register_class(ClassRef cls) {
    objc_registerClassPair(to_class(cls));
}

} // namespace objbridge::runtime

#endif // __APPLE__
