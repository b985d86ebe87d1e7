#pragma once

#include <objbridge/core/bridge.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/handle.hpp>
#include <objbridge/dispatch/message.hpp>
#include <objbridge/memory/object_ref.hpp>
#include <objbridge/traits/capability.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file object.hpp
 * @brief Host wrapper types for foreign objects
 *
 * @code
 * OBJBRIDGE_INTERFACE(IBox, "Box", INSObject,
 *     ((method, length, "length", std::int64_t()))
 * )
 * OBJBRIDGE_DECLARE_OBJECT(Box, IBox)
 *
 * Box box = Box::new_object();
 * std::int64_t n = box.length();
 * @endcode
 *
 * A wrapper holds exactly one ObjectRef. Its identity is the handle: two
 * wrappers are equal when they refer to the same object.
 */

namespace objbridge {

/**
 * @brief Wrappers that own their object (retain borrowed input)
 */
struct OwnedPolicy {
    static constexpr Ownership ownership = Ownership::owned;

    static ObjectRef apply(ObjectRef ref) { return std::move(ref).to_owned(); }
};

/**
 * @brief Wrappers that never own their object
 *
 * For objects whose lifetime the foreign side guarantees, such as shared
 * singletons. Owned input, such as the result of alloc, new or copy, is
 * handed to the innermost autorelease scope so the object outlives the
 * wrapper at least until that scope ends. Without a scope that is an
 * autorelease_without_scope violation.
 */
struct BorrowedPolicy {
    static constexpr Ownership ownership = Ownership::borrowed;

    static ObjectRef apply(ObjectRef ref) {
        if (!ref.is_owned()) {
            return ref;
        }
        return ObjectRef::borrow(std::move(ref).autorelease());
    }
};

/**
 * @class ObjectBase
 * @brief Non-template part of every wrapper
 */
class ObjectBase {
public:
    using objbridge_object_tag = void;

    ObjectBase() = default;
    explicit ObjectBase(ObjectRef ref) : ref_(std::move(ref)) {}

    Handle handle() const noexcept { return ref_.handle(); }
    const ObjectRef& ref() const noexcept { return ref_; }
    bool is_nil() const noexcept { return ref_.is_nil(); }
    explicit operator bool() const noexcept { return !ref_.is_nil(); }

    /**
     * @brief Name of the object's dynamic class, empty for nil
     */
    std::string dynamic_class_name() const;

    /**
     * @brief "<ClassName: 0x...>" or "<nil>"
     */
    std::string description() const;

    /**
     * @brief Text of the object's own -debugDescription, "<nil>" for nil
     */
    std::string debug_description() const;

    friend bool operator==(const ObjectBase& lhs, const ObjectBase& rhs) noexcept {
        return lhs.handle() == rhs.handle();
    }

    friend std::ostream& operator<<(std::ostream& os, const ObjectBase& object);

protected:
    ObjectRef ref_;
};

/**
 * @class ObjectCore
 * @brief Bottom of every composed trait stack
 *
 * Traits reach the dispatch engine through invoke() and invoke_class();
 * instancetype in a declared signature becomes Self.
 */
template<typename Self, typename Policy, template<class> class ClassTrait, template<class> class... Protocols>
class ObjectCore : public ObjectBase {
    static_assert(detail::inspect_t<ClassTrait>::trait_kind != TraitKind::protocol,
                  "the first trait of an object must be a class trait");
    static_assert((detail::is_protocol_v<Protocols> && ...),
                  "traits after the class trait must be protocol traits");
    static_assert(composable_v<ClassTrait, Protocols...>,
                  "a protocol declares a selector already declared with a different signature");

    template<typename T>
    using replace_t = std::conditional_t<std::is_same_v<T, instancetype>, Self, T>;

    template<typename Sig>
    struct bind_self;

    template<typename R, typename... Params>
    struct bind_self<R(Params...)> {
        using type = replace_t<R>(replace_t<Params>...);
    };

public:
    using policy = Policy;
    using ancestry_list = ancestry_t<ClassTrait>;
    using protocol_list = trait_list<Protocols...>;

    static constexpr std::string_view foreign_name = detail::inspect_t<ClassTrait>::foreign_name;

    ObjectCore() = default;

    /**
     * @brief Wrap @p ref, applying the ownership policy
     */
    explicit ObjectCore(ObjectRef ref) : ObjectBase(Policy::apply(std::move(ref))) {}

    /**
     * @brief Wrap a raw handle
     *
     * @param ownership owned when the caller hands over a +1, borrowed
     *        otherwise
     */
    static Self from_handle(Handle handle, Ownership ownership) {
        return Self(ownership == Ownership::owned ? ObjectRef::adopt(handle) : ObjectRef::borrow(handle));
    }

    /**
     * @brief The foreign class named by the class trait
     * @throw ResolutionError if the runtime does not know it
     */
    static ClassRef foreign_class() {
        return get_bridge().lookup_class(foreign_name);
    }

    /**
     * @brief Class trait names, most-derived first
     */
    static std::vector<std::string_view> ancestry() {
        using names = detail::list_names<ancestry_list>;
        return std::vector<std::string_view>(names::values, names::values + names::size);
    }

    static std::vector<std::string_view> protocols() {
        using names = detail::list_names<protocol_list>;
        return std::vector<std::string_view>(names::values, names::values + names::size);
    }

    /**
     * @brief Check the declaration against the runtime
     *
     * The class must exist, the declared ancestry must appear in order in
     * its superclass chain starting at the class itself, and it must
     * conform to every declared protocol.
     *
     * @throw ResolutionError with OB_ERROR_CLASS_NOT_FOUND or OB_ERROR_ANCESTRY_MISMATCH
     */
    static void verify_declaration() {
        Bridge& bridge = get_bridge();
        runtime::Runtime& rt = bridge.runtime();
        const ClassRef cls = bridge.lookup_class(foreign_name);

        const std::vector<std::string_view> declared = ancestry();
        std::size_t matched = 0;
        for (ClassRef current = cls; current && matched < declared.size(); current = rt.superclass_of(current)) {
            const std::string name = rt.class_name(current);
            if (name == declared[matched]) {
                ++matched;
            } else if (matched == 0) {
                break;
            }
        }
        if (matched != declared.size()) {
            throw ResolutionError(OB_ERROR_ANCESTRY_MISMATCH,
                                  std::string(foreign_name) + " does not descend from " +
                                  std::string(declared[matched]));
        }
        for (std::string_view protocol : protocols()) {
            if (!rt.conforms_to(cls, protocol)) {
                throw ResolutionError(OB_ERROR_ANCESTRY_MISMATCH,
                                      std::string(foreign_name) + " does not conform to " + std::string(protocol));
            }
        }
    }

protected:
    template<typename Decl, typename... Args>
    decltype(auto) invoke(Args&&... args) const {
        using signature = typename bind_self<typename Decl::signature>::type;
        return msg_send<signature, Decl::flags>(ref_, sel(Decl::selector), std::forward<Args>(args)...);
    }

    template<typename Decl, typename... Args>
    static decltype(auto) invoke_class(Args&&... args) {
        using signature = typename bind_self<typename Decl::signature>::type;
        return msg_send<signature, Decl::flags>(foreign_class(), sel(Decl::selector), std::forward<Args>(args)...);
    }
};

/**
 * @brief Composed trait stack for a wrapper type
 *
 * ClassTrait and its ancestors, most-derived outermost, over the protocol
 * traits, over ObjectCore. A selector redeclared by a subclass trait hides
 * the ancestor's member of the same name.
 */
template<typename Self, typename Policy, template<class> class ClassTrait, template<class> class... Protocols>
using Object = typename detail::apply_list<
    typename detail::apply_traits<ObjectCore<Self, Policy, ClassTrait, Protocols...>, Protocols...>::type,
    ancestry_t<ClassTrait>>::type;

} // namespace objbridge

/**
 * @brief Declare a wrapper type that owns its object
 *
 * @param Name Wrapper type to define
 * @param ClassTrait Capability trait of the foreign class
 * @param ... Protocol capability traits
 */
#define OBJBRIDGE_DECLARE_OBJECT(Name, ClassTrait, ...) \
    OBJBRIDGE_DETAIL_DECLARE_OBJECT(Name, ::objbridge::OwnedPolicy, ClassTrait __VA_OPT__(,) __VA_ARGS__)

/**
 * @brief Declare a wrapper type that never owns its object
 */
#define OBJBRIDGE_DECLARE_BORROWED_OBJECT(Name, ClassTrait, ...) \
    OBJBRIDGE_DETAIL_DECLARE_OBJECT(Name, ::objbridge::BorrowedPolicy, ClassTrait __VA_OPT__(,) __VA_ARGS__)

#define OBJBRIDGE_DETAIL_DECLARE_OBJECT(Name, Policy, ...) \
    class Name final : public ::objbridge::Object<Name, Policy, __VA_ARGS__> { \
    public: \
        using object_base = ::objbridge::Object<Name, Policy, __VA_ARGS__>; \
        using object_base::object_base; \
    };

template<typename T>
    requires std::derived_from<T, objbridge::ObjectBase>
struct std::hash<T> {
    std::size_t operator()(const T& object) const noexcept {
        return std::hash<objbridge::Handle>{}(object.handle());
    }
};
