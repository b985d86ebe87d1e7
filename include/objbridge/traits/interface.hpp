#pragma once

#include <objbridge/dispatch/method_family.hpp>
#include <objbridge/dispatch/selector.hpp>
#include <objbridge/traits/capability.hpp>
#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/comparison/equal.hpp>
#include <boost/preprocessor/control/iif.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/tuple/size.hpp>
#include <string_view>
#include <utility>

/**
 * @file interface.hpp
 * @brief Generators for capability traits
 *
 * Each generator defines a mixin template whose members send the declared
 * selectors. Methods are given as a Boost.PP sequence of tuples:
 *
 * @code
 * OBJBRIDGE_INTERFACE(IBox, "Box", INSObject,
 *     ((method, length, "length", std::int64_t()))
 *     ((method, set_length, "setLength:", void(std::int64_t)))
 *     ((class_method, box_with_length, "boxWithLength:", instancetype(std::int64_t)))
 *     ((method, take_value, "takeValue", std::int64_t(), objbridge::MethodFlags::nil_tolerant))
 * )
 * @endcode
 *
 * Tuple fields: method kind (method or class_method), C++ member name,
 * selector, signature, and optionally MethodFlags. Signatures whose types
 * contain unparenthesised commas need a type alias. The sequence may be
 * empty.
 *
 * A malformed selector, or a selector whose colon count differs from the
 * parameter count, fails to compile where the trait is defined.
 */

#define OBJBRIDGE_ROOT_INTERFACE(Trait, ForeignName, seq) \
    OBJBRIDGE_DETAIL_TRAIT(Trait, ForeignName, ::objbridge::TraitKind::root_class, , seq)

#define OBJBRIDGE_INTERFACE(Trait, ForeignName, SuperTrait, seq) \
    OBJBRIDGE_DETAIL_TRAIT(Trait, ForeignName, ::objbridge::TraitKind::class_, \
        template<class B> using super_trait = SuperTrait<B>;, seq)

#define OBJBRIDGE_PROTOCOL(Trait, ForeignName, seq) \
    OBJBRIDGE_DETAIL_TRAIT(Trait, ForeignName, ::objbridge::TraitKind::protocol, , seq)

#define OBJBRIDGE_DETAIL_TRAIT(Trait, ForeignName, Kind, SuperDecl, seq) \
    template<class Base> \
    class Trait : public Base { \
    public: \
        using Base::Base; \
        static_assert(!std::string_view(ForeignName).empty(), "foreign name must not be empty"); \
        static constexpr std::string_view foreign_name = ForeignName; \
        static constexpr ::objbridge::TraitKind trait_kind = Kind; \
        SuperDecl \
        using methods = ::objbridge::detail::strip_head_t<::objbridge::type_list< \
            ::objbridge::detail::list_head \
            BOOST_PP_SEQ_FOR_EACH(OBJBRIDGE_DETAIL_DECL_ENTRY, _, ((skip)) seq)>>; \
        BOOST_PP_SEQ_FOR_EACH(OBJBRIDGE_DETAIL_MEMBER_ENTRY, _, ((skip)) seq) \
    };

/* Tuple access */

#define OBJBRIDGE_DETAIL_TAG(entry) BOOST_PP_TUPLE_ELEM(0, entry)
#define OBJBRIDGE_DETAIL_NAME(entry) BOOST_PP_TUPLE_ELEM(1, entry)
#define OBJBRIDGE_DETAIL_SELECTOR(entry) BOOST_PP_TUPLE_ELEM(2, entry)
#define OBJBRIDGE_DETAIL_SIGNATURE(entry) BOOST_PP_TUPLE_ELEM(3, entry)

#define OBJBRIDGE_DETAIL_FLAGS(entry) \
    BOOST_PP_IIF(BOOST_PP_EQUAL(BOOST_PP_TUPLE_SIZE(entry), 5), \
                 OBJBRIDGE_DETAIL_FLAGS_GIVEN, OBJBRIDGE_DETAIL_FLAGS_DEFAULT)(entry)
#define OBJBRIDGE_DETAIL_FLAGS_GIVEN(entry) BOOST_PP_TUPLE_ELEM(4, entry)
#define OBJBRIDGE_DETAIL_FLAGS_DEFAULT(entry) ::objbridge::MethodFlags::none

#define OBJBRIDGE_DETAIL_DECL_TYPE(entry, Kind) \
    ::objbridge::MethodDecl<OBJBRIDGE_DETAIL_SELECTOR(entry), OBJBRIDGE_DETAIL_SIGNATURE(entry), \
                            Kind, OBJBRIDGE_DETAIL_FLAGS(entry)>

/* Method list entries */

#define OBJBRIDGE_DETAIL_DECL_ENTRY(r, data, entry) \
    BOOST_PP_CAT(OBJBRIDGE_DETAIL_DECL_, OBJBRIDGE_DETAIL_TAG(entry))(entry)

#define OBJBRIDGE_DETAIL_DECL_skip(entry)
#define OBJBRIDGE_DETAIL_DECL_method(entry) \
    , OBJBRIDGE_DETAIL_DECL_TYPE(entry, ::objbridge::MethodKind::instance)
#define OBJBRIDGE_DETAIL_DECL_class_method(entry) \
    , OBJBRIDGE_DETAIL_DECL_TYPE(entry, ::objbridge::MethodKind::class_)

/* Members */

#define OBJBRIDGE_DETAIL_MEMBER_ENTRY(r, data, entry) \
    BOOST_PP_CAT(OBJBRIDGE_DETAIL_MEMBER_, OBJBRIDGE_DETAIL_TAG(entry))(entry)

#define OBJBRIDGE_DETAIL_MEMBER_skip(entry)

#define OBJBRIDGE_DETAIL_MEMBER_method(entry) \
    OBJBRIDGE_DETAIL_CHECK(entry) \
    template<typename... A> \
    decltype(auto) OBJBRIDGE_DETAIL_NAME(entry)(A&&... args) const { \
        using decl = OBJBRIDGE_DETAIL_DECL_TYPE(entry, ::objbridge::MethodKind::instance); \
        return this->template invoke<decl>(std::forward<A>(args)...); \
    }

#define OBJBRIDGE_DETAIL_MEMBER_class_method(entry) \
    OBJBRIDGE_DETAIL_CHECK(entry) \
    template<typename... A> \
    static decltype(auto) OBJBRIDGE_DETAIL_NAME(entry)(A&&... args) { \
        using decl = OBJBRIDGE_DETAIL_DECL_TYPE(entry, ::objbridge::MethodKind::class_); \
        return Base::template invoke_class<decl>(std::forward<A>(args)...); \
    }

#define OBJBRIDGE_DETAIL_CHECK(entry) \
    static_assert(::objbridge::is_valid_selector(OBJBRIDGE_DETAIL_SELECTOR(entry)), \
                  "malformed selector " OBJBRIDGE_DETAIL_SELECTOR(entry)); \
    static_assert(::objbridge::selector_arity(OBJBRIDGE_DETAIL_SELECTOR(entry)) == \
                      ::objbridge::signature_traits<OBJBRIDGE_DETAIL_SIGNATURE(entry)>::arity, \
                  "parameter count does not match selector " OBJBRIDGE_DETAIL_SELECTOR(entry));
