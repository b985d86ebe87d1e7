#pragma once

#include <objbridge/runtime/runtime.hpp>

/**
 * @file objc_runtime.hpp
 * @brief Runtime backend over the Apple Objective-C runtime (libobjc)
 *
 * Only built on Apple platforms. Reference counting goes through the
 * runtime's own retain/release messages so that classes overriding them keep
 * working; autorelease pools map onto objc_autoreleasePoolPush/Pop.
 */

#ifdef __APPLE__

namespace objbridge::runtime {

class ObjcRuntime : public Runtime {
public:
    ObjcRuntime() = default;

    std::string_view name() const noexcept override { return "objc"; }

    ClassRef lookup_class(std::string_view name) const override;
    ClassRef class_of(Handle object) const override;
    ClassRef superclass_of(ClassRef cls) const override;
    std::string class_name(ClassRef cls) const override;
    bool is_metaclass(ClassRef cls) const override;
    bool conforms_to(ClassRef cls, std::string_view protocol) const override;
    Handle lookup_protocol(std::string_view name) const override;

    SelectorRef register_selector(std::string_view name) override;
    std::string selector_name(SelectorRef selector) const override;
    std::optional<MethodEntry> find_own_method(ClassRef cls, SelectorRef selector) const override;

    Handle retain(Handle object) override;
    void release(Handle object) override;
    std::size_t retain_count(Handle object) const override;

    void* pool_push() override;
    void pool_pop(void* token) override;

    ClassRef allocate_class(std::string_view name, ClassRef superclass) override;
    bool add_method(ClassRef cls, SelectorRef selector, Imp imp, std::string_view encoding) override;
    bool add_protocol(ClassRef cls, std::string_view protocol) override;
    void register_class(ClassRef cls) override;
};

} // namespace objbridge::runtime

#endif // __APPLE__
