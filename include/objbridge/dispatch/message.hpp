#pragma once

#include <objbridge/core/bridge.hpp>
#include <objbridge/core/config.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/dispatch/dispatcher.hpp>
#include <objbridge/dispatch/encoding.hpp>
#include <objbridge/dispatch/marshal.hpp>
#include <objbridge/dispatch/method_family.hpp>
#include <objbridge/dispatch/selector.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

/**
 * @file message.hpp
 * @brief Typed message sends
 *
 * @code
 * auto length = objbridge::msg_send<std::int64_t()>(box, objbridge::sel("length"));
 * objbridge::send<void>(box, "setLength:", std::int64_t{42});
 * @endcode
 *
 * msg_send takes the full signature, so arguments are converted to the
 * declared parameter types (numeric range checked). send deduces the
 * parameter types from the arguments.
 *
 * A send resolves the selector, checks the argument count against the
 * selector, checks the declared signature against the runtime's encoding
 * (Config::verify_encodings), converts every argument, then calls the
 * implementation directly. Nothing reaches the foreign side if any step
 * fails. Object results are owned when the selector's family or the flags
 * say the callee returns +1, borrowed otherwise.
 */

namespace objbridge {

namespace dispatch {

namespace detail {

template<typename T>
struct param_of {
    using type = T;
};

template<>
struct param_of<std::nullptr_t> {
    using type = Handle;
};

template<typename T>
using param_of_t = typename param_of<std::decay_t<T>>::type;

} // namespace detail

template<typename Sig>
struct Caller;

template<typename R, typename... Params>
struct Caller<R(Params...)> {
    using converter = ReturnConverter<R>;
    using result_type = typename converter::type;
    using function_type = typename converter::abi_type (*)(void*, void*,
        decltype(std::declval<ArgHolder<Params>&>().abi())...);

    template<typename... Args>
    static result_type call(Imp imp, Handle receiver, const Selector& selector, bool retained, Args&&... args) {
        std::tuple<ArgHolder<Params>...> holders{std::forward<Args>(args)...};
        auto fn = reinterpret_cast<function_type>(imp);
        auto invoke = [&](auto&... holder) {
            return fn(receiver.raw(), selector.ref().raw(), holder.abi()...);
        };
        auto write_back = [](auto&... holder) { (holder.write_back(), ...); };

        if constexpr (std::is_void_v<R>) {
            std::apply(invoke, holders);
            std::apply(write_back, holders);
        } else {
            auto raw = std::apply(invoke, holders);
            std::apply(write_back, holders);
            return converter::from_abi(raw, retained);
        }
    }
};

template<typename Sig>
using send_result_t = typename Caller<Sig>::result_type;

/**
 * @brief Check and perform a call to an already resolved implementation
 */
template<typename Sig, MethodFlags Flags, typename... Args>
send_result_t<Sig> perform(const Implementation& implementation, Handle receiver,
                           const Selector& selector, Args&&... args) {
    Bridge& bridge = get_bridge();
    if (selector.arity() != signature_traits<Sig>::arity) {
        throw ConversionError(OB_ERROR_ARITY_MISMATCH,
                              selector.name() + " takes " + std::to_string(selector.arity()) +
                              " arguments, signature declares " + std::to_string(signature_traits<Sig>::arity));
    }
    if (bridge.config().verify_encodings && !implementation.encoding.empty()) {
        const std::string expected = method_encoding<Sig>();
        if (!encodings_compatible(expected, implementation.encoding)) {
            throw ConversionError(OB_ERROR_ENCODING_MISMATCH,
                                  selector.name() + " declared as " + expected +
                                  " but implemented as " + implementation.encoding);
        }
    }

    const bool retained = returns_retained(selector.name(), Flags);
    if (!consumes_receiver(selector.name(), Flags)) {
        return Caller<Sig>::call(implementation.imp, receiver, selector, retained, std::forward<Args>(args)...);
    }

    // init consumes a +1 on its receiver; give it one of its own so the
    // caller's reference stays balanced
    runtime::Runtime& rt = bridge.runtime();
    rt.retain(receiver);
    try {
        return Caller<Sig>::call(implementation.imp, receiver, selector, retained, std::forward<Args>(args)...);
    } catch (...) {
        rt.release(receiver);
        throw;
    }
}

template<typename Sig, MethodFlags Flags>
send_result_t<Sig> nil_result(const Selector& selector) {
    if constexpr (has_flag(Flags, MethodFlags::nil_tolerant)) {
        return Caller<Sig>::converter::zero();
    } else {
        throw ResolutionError(OB_ERROR_NIL_RECEIVER, selector.name() + " sent to nil");
    }
}

} // namespace dispatch

/**
 * @brief Send @p selector to @p target with the declared signature @p Sig
 *
 * @tparam Sig Return and parameter types, e.g. `bool(ObjectRef)`
 * @tparam Flags Ownership and nil-tolerance overrides
 * @param target Handle, ObjectRef, generated wrapper, or ClassRef for class methods
 *
 * @throw ResolutionError for a nil target (unless nil-tolerant) or an unknown selector
 * @throw ConversionError for arity, encoding or range failures
 */
template<typename Sig, MethodFlags Flags = MethodFlags::none, typename Target, typename... Args>
dispatch::send_result_t<Sig> msg_send(const Target& target, const Selector& selector, Args&&... args) {
    static_assert(sizeof...(Args) == signature_traits<Sig>::arity,
                  "argument count does not match the declared signature");
    const Handle receiver = dispatch::detail::receiver_handle(target);
    if (receiver.is_nil()) {
        return dispatch::nil_result<Sig, Flags>(selector);
    }
    dispatch::Implementation implementation = get_bridge().dispatcher().resolve(receiver, selector);
    return dispatch::perform<Sig, Flags>(implementation, receiver, selector, std::forward<Args>(args)...);
}

template<typename Sig, MethodFlags Flags = MethodFlags::none, typename Target, typename... Args>
dispatch::send_result_t<Sig> msg_send(const Target& target, std::string_view selector, Args&&... args) {
    return msg_send<Sig, Flags>(target, sel(selector), std::forward<Args>(args)...);
}

/**
 * @brief Send to @p target the implementation found from @p cls upwards
 *
 * With the receiver's superclass as @p cls this is a super call.
 */
template<typename Sig, MethodFlags Flags = MethodFlags::none, typename Target, typename... Args>
dispatch::send_result_t<Sig> msg_send_super(const Target& target, ClassRef cls, const Selector& selector, Args&&... args) {
    static_assert(sizeof...(Args) == signature_traits<Sig>::arity,
                  "argument count does not match the declared signature");
    const Handle receiver = dispatch::detail::receiver_handle(target);
    if (receiver.is_nil()) {
        return dispatch::nil_result<Sig, Flags>(selector);
    }
    dispatch::Implementation implementation = get_bridge().dispatcher().resolve_in(cls, selector);
    return dispatch::perform<Sig, Flags>(implementation, receiver, selector, std::forward<Args>(args)...);
}

/**
 * @brief Send with parameter types deduced from the arguments
 */
template<typename R, MethodFlags Flags = MethodFlags::none, typename Target, typename... Args>
decltype(auto) send(const Target& target, const Selector& selector, Args&&... args) {
    return msg_send<R(dispatch::detail::param_of_t<Args>...), Flags>(target, selector, std::forward<Args>(args)...);
}

template<typename R, MethodFlags Flags = MethodFlags::none, typename Target, typename... Args>
decltype(auto) send(const Target& target, std::string_view selector, Args&&... args) {
    return msg_send<R(dispatch::detail::param_of_t<Args>...), Flags>(target, sel(selector), std::forward<Args>(args)...);
}

} // namespace objbridge
