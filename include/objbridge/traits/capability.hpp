#pragma once

#include <objbridge/core/config.hpp>
#include <objbridge/dispatch/encoding.hpp>
#include <objbridge/dispatch/method_family.hpp>
#include <cstddef>
#include <string_view>
#include <type_traits>

/**
 * @file capability.hpp
 * @brief Capability trait metadata and composition checks
 *
 * A capability trait models one foreign class or protocol. It is a mixin
 * template over its base,
 *
 * @code
 * template<class Base>
 * class IBox : public Base {
 * public:
 *     using Base::Base;
 *     static constexpr std::string_view foreign_name = "Box";
 *     static constexpr objbridge::TraitKind trait_kind = objbridge::TraitKind::class_;
 *     template<class B> using super_trait = INSObject<B>;
 *     using methods = objbridge::type_list<objbridge::MethodDecl<"length", std::int64_t()>>;
 *     // one member per method, dispatching through invoke<>()
 * };
 * @endcode
 *
 * and is normally produced by the generator macros in interface.hpp. The
 * metadata is read by instantiating the trait over TraitInspector, which never
 * instantiates any member function.
 */

namespace objbridge {

template<typename... Ts>
struct type_list {};

template<template<class> class... Ts>
struct trait_list {};

/**
 * @brief String literal usable as a template argument
 */
template<std::size_t N>
struct FixedString {
    char value[N]{};

    constexpr FixedString(const char (&text)[N]) {
        for (std::size_t i = 0; i < N; ++i) {
            value[i] = text[i];
        }
    }

    constexpr std::string_view view() const noexcept { return std::string_view(value, N - 1); }
};

enum class TraitKind : unsigned char {
    root_class,  ///< A class with no superclass trait
    class_,      ///< A class whose super_trait is its superclass's trait
    protocol     ///< A protocol; composed below the class chain
};

enum class MethodKind : unsigned char {
    instance,
    class_
};

/**
 * @brief One method declared by a capability trait
 */
template<FixedString Selector, typename Sig, MethodKind Kind = MethodKind::instance,
         MethodFlags Flags = MethodFlags::none>
struct MethodDecl {
    static constexpr std::string_view selector = Selector.view();
    using signature = Sig;
    static constexpr MethodKind kind = Kind;
    static constexpr MethodFlags flags = Flags;

    static_assert(is_valid_selector(Selector.view()), "malformed selector");
    static_assert(selector_arity(Selector.view()) == signature_traits<Sig>::arity,
                  "selector arity does not match the parameter count");
};

namespace detail {

/**
 * @brief Base a trait is instantiated over to read its metadata
 */
class TraitInspector {
public:
    TraitInspector() = default;
};

/**
 * @brief First element of the generated method lists, dropped again
 */
struct list_head {};

template<typename List>
struct strip_head;

template<typename... Ts>
struct strip_head<type_list<list_head, Ts...>> {
    using type = type_list<Ts...>;
};

template<typename List>
using strip_head_t = typename strip_head<List>::type;

template<template<class> class T>
using inspect_t = T<TraitInspector>;

template<typename... Lists>
struct concat;

template<>
struct concat<> {
    using type = type_list<>;
};

template<typename... Ts>
struct concat<type_list<Ts...>> {
    using type = type_list<Ts...>;
};

template<typename... As, typename... Bs, typename... Rest>
struct concat<type_list<As...>, type_list<Bs...>, Rest...> {
    using type = typename concat<type_list<As..., Bs...>, Rest...>::type;
};

template<template<class> class T, typename List>
struct prepend_trait;

template<template<class> class T, template<class> class... Ts>
struct prepend_trait<T, trait_list<Ts...>> {
    using type = trait_list<T, Ts...>;
};

/*
 * Ancestry walk. Each step follows super_trait until a root class trait is
 * reached; the depth bound turns a cyclic chain into a compile error.
 */

template<bool Stop, template<class> class T, std::size_t Depth>
struct ancestry_step;

template<template<class> class T, std::size_t Depth>
struct ancestry_of {
    static_assert(inspect_t<T>::trait_kind != TraitKind::protocol,
                  "a protocol trait cannot be part of a class ancestry");
    static_assert(Depth < OBJBRIDGE_MAX_ANCESTRY_DEPTH,
                  "capability trait ancestry does not reach a root class (cyclic or too deep)");

    static constexpr bool stop = inspect_t<T>::trait_kind == TraitKind::root_class ||
                                 Depth >= OBJBRIDGE_MAX_ANCESTRY_DEPTH;
    using type = typename ancestry_step<stop, T, Depth>::type;
};

template<template<class> class T, std::size_t Depth>
struct ancestry_step<true, T, Depth> {
    using type = trait_list<T>;
};

template<template<class> class T, std::size_t Depth>
struct ancestry_step<false, T, Depth> {
    using type = typename prepend_trait<
        T, typename ancestry_of<inspect_t<T>::template super_trait, Depth + 1>::type>::type;
};

/*
 * Stack construction: the first trait of the list ends up outermost.
 */

template<typename Base, template<class> class... Ts>
struct apply_traits;

template<typename Base>
struct apply_traits<Base> {
    using type = Base;
};

template<typename Base, template<class> class T, template<class> class... Rest>
struct apply_traits<Base, T, Rest...> {
    using type = T<typename apply_traits<Base, Rest...>::type>;
};

template<typename Base, typename List>
struct apply_list;

template<typename Base, template<class> class... Ts>
struct apply_list<Base, trait_list<Ts...>> {
    using type = typename apply_traits<Base, Ts...>::type;
};

template<typename List>
struct list_methods;

template<template<class> class... Ts>
struct list_methods<trait_list<Ts...>> {
    using type = typename concat<typename inspect_t<Ts>::methods...>::type;
};

template<typename List>
struct list_names;

template<template<class> class... Ts>
struct list_names<trait_list<Ts...>> {
    static constexpr std::size_t size = sizeof...(Ts);
    static constexpr std::string_view values[size == 0 ? 1 : size] = {inspect_t<Ts>::foreign_name...};
};

/*
 * Collision check between method lists
 */

template<typename A, typename B>
constexpr bool decls_conflict() {
    return A::selector == B::selector && A::kind == B::kind &&
           !std::is_same_v<typename A::signature, typename B::signature>;
}

template<typename A, typename... Bs>
constexpr bool conflicts_with_any(type_list<Bs...>) {
    return (decls_conflict<A, Bs>() || ...);
}

template<typename... As, typename ListB>
constexpr bool lists_conflict(type_list<As...>, ListB list) {
    return (conflicts_with_any<As>(list) || ...);
}

template<typename ClassMethods, template<class> class... Protocols>
struct protocols_composable;

template<typename ClassMethods>
struct protocols_composable<ClassMethods> : std::true_type {};

template<typename ClassMethods, template<class> class P, template<class> class... Rest>
struct protocols_composable<ClassMethods, P, Rest...>
    : std::bool_constant<
          !lists_conflict(typename inspect_t<P>::methods{}, ClassMethods{}) &&
          !(lists_conflict(typename inspect_t<P>::methods{}, typename inspect_t<Rest>::methods{}) || ...) &&
          protocols_composable<ClassMethods, Rest...>::value> {};

template<template<class> class T>
inline constexpr bool is_protocol_v = inspect_t<T>::trait_kind == TraitKind::protocol;

} // namespace detail

/**
 * @brief Class traits from @p T up to its root, most-derived first
 */
template<template<class> class T>
using ancestry_t = typename detail::ancestry_of<T, 0>::type;

/**
 * @brief Whether a class trait and a protocol set can share one wrapper
 *
 * Rejects a protocol method that has the selector and kind of a method on
 * the class chain or on another protocol but a different signature. Class
 * chain methods among themselves never collide: the most derived one wins.
 */
template<template<class> class ClassTrait, template<class> class... Protocols>
inline constexpr bool composable_v =
    detail::protocols_composable<typename detail::list_methods<ancestry_t<ClassTrait>>::type,
                                 Protocols...>::value;

} // namespace objbridge
