#pragma once

#include <objbridge/core/handle.hpp>
#include <objbridge/dispatch/selector.hpp>
#include <objbridge/memory/object_ref.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * @file encoding.hpp
 * @brief Objective-C type encodings of host types
 *
 * Integers are encoded by size and signedness, so `long` and `long long`
 * both map to q/Q on LP64 targets. Structs have no automatic encoding:
 * specialise TypeEncoding for each struct passed by value, e.g.
 *
 * @code
 * template<> struct objbridge::TypeEncoding<Point> {
 *     static std::string value() { return "{Point=dd}"; }
 * };
 * @endcode
 */

namespace objbridge {

/**
 * @brief Marks "the receiver's own wrapper type" in a trait method signature
 */
struct instancetype {};

template<typename T, typename = void>
struct is_object_wrapper : std::false_type {};

/**
 * Generated wrapper types carry the objbridge_object_tag member typedef
 */
template<typename T>
struct is_object_wrapper<T, std::void_t<typename T::objbridge_object_tag>> : std::true_type {};

/**
 * @brief Types that travel across the boundary as an object pointer
 */
template<typename T>
inline constexpr bool is_object_type_v =
    std::is_same_v<T, Handle> || std::is_same_v<T, ObjectRef> ||
    std::is_same_v<T, instancetype> || is_object_wrapper<T>::value;

template<typename T>
inline constexpr bool is_char_v =
    std::is_same_v<std::remove_cv_t<T>, char>;

template<typename T, typename = void>
struct TypeEncoding;

template<>
struct TypeEncoding<void> {
    static std::string value() { return "v"; }
};

template<>
struct TypeEncoding<bool> {
    static std::string value() { return "B"; }
};

template<typename T>
struct TypeEncoding<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::string value() {
        constexpr bool is_signed = std::is_signed_v<T>;
        switch (sizeof(T)) {
            case 1: return is_signed ? "c" : "C";
            case 2: return is_signed ? "s" : "S";
            case 4: return is_signed ? "i" : "I";
            default: return is_signed ? "q" : "Q";
        }
    }
};

template<>
struct TypeEncoding<char> {
    static std::string value() { return "c"; }
};

template<>
struct TypeEncoding<float> {
    static std::string value() { return "f"; }
};

template<>
struct TypeEncoding<double> {
    static std::string value() { return "d"; }
};

template<>
struct TypeEncoding<long double> {
    static std::string value() { return "D"; }
};

template<typename T>
struct TypeEncoding<T, std::enable_if_t<std::is_enum_v<T>>> {
    static std::string value() { return TypeEncoding<std::underlying_type_t<T>>::value(); }
};

template<typename T>
struct TypeEncoding<T, std::enable_if_t<is_object_type_v<T>>> {
    static std::string value() { return "@"; }
};

template<>
struct TypeEncoding<ClassRef> {
    static std::string value() { return "#"; }
};

template<>
struct TypeEncoding<Selector> {
    static std::string value() { return ":"; }
};

template<>
struct TypeEncoding<SelectorRef> {
    static std::string value() { return ":"; }
};

template<>
struct TypeEncoding<std::string> {
    static std::string value() { return "*"; }
};

template<typename T>
struct TypeEncoding<T*, std::enable_if_t<is_char_v<T>>> {
    static std::string value() { return "*"; }
};

template<typename T>
struct TypeEncoding<T*, std::enable_if_t<!is_char_v<T>>> {
    static std::string value() { return "^" + TypeEncoding<std::remove_cv_t<T>>::value(); }
};

template<typename T>
std::string type_encoding() {
    return TypeEncoding<std::remove_cv_t<T>>::value();
}

/**
 * @brief Return and parameter types of a function signature
 */
template<typename Sig>
struct signature_traits;

template<typename R, typename... Params>
struct signature_traits<R(Params...)> {
    using result = R;
    static constexpr std::size_t arity = sizeof...(Params);
};

/**
 * @brief Full method encoding of @p Sig, receiver and selector included
 *
 * Frame offsets are omitted: "q@:" rather than "q16@0:8".
 */
template<typename Sig>
struct MethodEncoding;

template<typename R, typename... Params>
struct MethodEncoding<R(Params...)> {
    static std::string value() {
        std::string result = type_encoding<R>() + "@:";
        ((result += type_encoding<Params>()), ...);
        return result;
    }
};

template<typename Sig>
std::string method_encoding() {
    return MethodEncoding<Sig>::value();
}

/**
 * @brief Strip frame offsets and qualifiers
 *
 * Also folds B onto c, since BOOL is a signed char on some targets and a
 * C bool on others.
 */
std::string normalize_encoding(std::string_view encoding);

/**
 * @brief Whether two method encodings describe the same call
 */
bool encodings_compatible(std::string_view expected, std::string_view actual);

} // namespace objbridge
