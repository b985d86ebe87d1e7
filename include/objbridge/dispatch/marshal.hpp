#pragma once

#include <objbridge/core/error.hpp>
#include <objbridge/core/handle.hpp>
#include <objbridge/dispatch/encoding.hpp>
#include <objbridge/dispatch/selector.hpp>
#include <objbridge/memory/object_ref.hpp>
#include <objbridge/memory/reference_counting.hpp>
#include <boost/numeric/conversion/cast.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * @file marshal.hpp
 * @brief Conversion of host values to and from the foreign calling convention
 *
 * ArgHolder<P> converts one host argument for a parameter declared as P and
 * keeps whatever storage the converted value points into alive for the
 * duration of the call. ReturnConverter<R> turns the raw return value back
 * into R. Both are instantiated per declared type; a type with no
 * specialisation fails to compile at the call that uses it.
 */

namespace objbridge::dispatch {

namespace detail {

template<typename>
inline constexpr bool dependent_false_v = false;

inline Handle object_handle(Handle handle) noexcept { return handle; }
inline Handle object_handle(const ObjectRef& ref) noexcept { return ref.handle(); }
inline Handle object_handle(std::nullptr_t) noexcept { return nil_handle; }

template<typename W, std::enable_if_t<is_object_wrapper<W>::value, int> = 0>
Handle object_handle(const W& wrapper) noexcept {
    return wrapper.handle();
}

/**
 * @brief The handle a message is sent to; a class object for ClassRef
 */
template<typename Target>
Handle receiver_handle(const Target& target) noexcept {
    if constexpr (std::is_same_v<Target, ClassRef>) {
        return class_handle(target);
    } else {
        return object_handle(target);
    }
}

template<typename P, typename A>
P convert_number(const A& value) {
    static_assert(std::is_arithmetic_v<A>, "a numeric parameter needs a numeric argument");
    try {
        return boost::numeric_cast<P>(value);
    } catch (const boost::numeric::bad_numeric_cast& e) {
        throw ConversionError(OB_ERROR_NUMERIC_OVERFLOW, std::string("argument not representable: ") + e.what());
    }
}

template<typename P>
inline constexpr bool is_selector_type_v =
    std::is_same_v<P, Selector> || std::is_same_v<P, SelectorRef>;

template<typename P>
inline constexpr bool is_string_type_v =
    std::is_same_v<P, std::string> || (std::is_pointer_v<P> && is_char_v<std::remove_pointer_t<P>>);

template<typename P>
inline constexpr bool is_plain_pointer_v =
    std::is_pointer_v<P> && !is_char_v<std::remove_pointer_t<P>> &&
    !is_object_type_v<std::remove_cv_t<std::remove_pointer_t<P>>>;

/**
 * Structs travel by value; each needs a TypeEncoding specialisation
 */
template<typename P>
inline constexpr bool is_struct_type_v =
    std::is_class_v<P> && std::is_trivially_copyable_v<P> && !is_object_type_v<P> &&
    !is_selector_type_v<P> && !std::is_same_v<P, ClassRef>;

} // namespace detail

template<typename P, typename = void>
struct ArgHolder {
    static_assert(detail::dependent_false_v<P>, "parameter type cannot be passed to a foreign method");
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<std::is_arithmetic_v<P> && !std::is_same_v<P, bool>>> {
    P value;

    template<typename A>
    explicit ArgHolder(const A& arg) : value(detail::convert_number<P>(arg)) {}

    P abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<>
struct ArgHolder<bool> {
    bool value;

    template<typename A>
    explicit ArgHolder(const A& arg) : value(arg) {
        static_assert(std::is_same_v<A, bool>, "a BOOL parameter needs a bool argument");
    }

    bool abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<std::is_enum_v<P>>> {
    P value;

    explicit ArgHolder(P arg) : value(arg) {}

    P abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<is_object_type_v<P>>> {
    void* value;

    template<typename A>
    explicit ArgHolder(const A& arg) : value(detail::object_handle(arg).raw()) {}

    void* abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<>
struct ArgHolder<ClassRef> {
    void* value;

    explicit ArgHolder(ClassRef cls) : value(cls.raw()) {}

    void* abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<detail::is_selector_type_v<P>>> {
    void* value;

    explicit ArgHolder(const Selector& selector) : value(selector.ref().raw()) {}
    explicit ArgHolder(SelectorRef selector) : value(selector.raw()) {}
    explicit ArgHolder(const char* name) : value(sel(name).ref().raw()) {}
    explicit ArgHolder(const std::string& name) : value(sel(name).ref().raw()) {}

    void* abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<detail::is_string_type_v<P>>> {
    using abi_type = std::conditional_t<std::is_same_v<P, std::string>, const char*, P>;

    std::string storage;
    const char* value;

    explicit ArgHolder(const char* text) : value(text) {}
    explicit ArgHolder(const std::string& text) : storage(text), value(storage.c_str()) {}
    ArgHolder(const ArgHolder&) = delete;
    ArgHolder& operator=(const ArgHolder&) = delete;

    abi_type abi() const noexcept { return const_cast<abi_type>(value); }
    void write_back() noexcept {}
};

/**
 * @brief Object out-parameter
 *
 * The callee receives the address of a temporary slot. If it stores a
 * different object there, the target is replaced by a borrowed reference to
 * it, following the convention that out-parameters are not owned.
 */
template<>
struct ArgHolder<ObjectRef*> {
    ObjectRef* target;
    void* slot;

    explicit ArgHolder(ObjectRef* out) : target(out), slot(out ? out->handle().raw() : nullptr) {}

    void** abi() noexcept { return target ? &slot : nullptr; }

    void write_back() {
        if (target && slot != target->handle().raw()) {
            *target = ObjectRef::borrow(Handle{slot});
        }
    }
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<detail::is_plain_pointer_v<P>>> {
    P value;

    explicit ArgHolder(P arg) : value(arg) {}
    explicit ArgHolder(std::nullptr_t) : value(nullptr) {}

    P abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<typename P>
struct ArgHolder<P, std::enable_if_t<detail::is_struct_type_v<P>>> {
    P value;

    explicit ArgHolder(const P& arg) : value(arg) {}

    P abi() const noexcept { return value; }
    void write_back() noexcept {}
};

template<typename R, typename = void>
struct ReturnConverter {
    static_assert(detail::dependent_false_v<R>, "return type cannot be received from a foreign method");
};

template<>
struct ReturnConverter<void> {
    using type = void;
    using abi_type = void;

    static void zero() noexcept {}
};

template<typename R>
struct ReturnConverter<R, std::enable_if_t<std::is_arithmetic_v<R> || std::is_enum_v<R> ||
                                           detail::is_struct_type_v<R> || detail::is_plain_pointer_v<R>>> {
    using type = R;
    using abi_type = R;

    static R from_abi(R value, bool) noexcept { return value; }
    static R zero() noexcept { return R{}; }
};

template<typename R>
struct ReturnConverter<R, std::enable_if_t<is_object_type_v<R>>> {
    using type = std::conditional_t<std::is_same_v<R, instancetype>, ObjectRef, R>;
    using abi_type = void*;

    static type from_abi(void* raw, bool retained) {
        const Handle handle{raw};
        if constexpr (std::is_same_v<R, Handle>) {
            // A raw handle carries any +1 unrecorded; adopt() or
            // ObjectRef::adopt() records it
            return handle;
        } else {
            ObjectRef ref = retained ? ObjectRef::adopt(handle) : ObjectRef::borrow(handle);
            if constexpr (std::is_same_v<type, ObjectRef>) {
                return ref;
            } else {
                return type(std::move(ref));
            }
        }
    }

    static type zero() { return type{}; }
};

template<>
struct ReturnConverter<ClassRef> {
    using type = ClassRef;
    using abi_type = void*;

    static ClassRef from_abi(void* raw, bool) noexcept { return ClassRef{raw}; }
    static ClassRef zero() noexcept { return ClassRef{}; }
};

template<>
struct ReturnConverter<SelectorRef> {
    using type = SelectorRef;
    using abi_type = void*;

    static SelectorRef from_abi(void* raw, bool) noexcept { return SelectorRef{raw}; }
    static SelectorRef zero() noexcept { return SelectorRef{}; }
};

template<>
struct ReturnConverter<Selector> {
    using type = Selector;
    using abi_type = void*;

    static Selector from_abi(void* raw, bool);
    static Selector zero() { return Selector{}; }
};

template<typename R>
struct ReturnConverter<R, std::enable_if_t<detail::is_string_type_v<R>>> {
    using type = R;
    using abi_type = std::conditional_t<std::is_same_v<R, std::string>, const char*, R>;

    static R from_abi(abi_type text, bool) {
        if constexpr (std::is_same_v<R, std::string>) {
            return text ? std::string(text) : std::string();
        } else {
            return text;
        }
    }

    static R zero() { return R{}; }
};

} // namespace objbridge::dispatch
