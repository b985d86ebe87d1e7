#pragma once

#include <cstdint>
#include <string_view>

/**
 * @file method_family.hpp
 * @brief Ownership conventions derived from selector names
 *
 * A selector belongs to a family when its first camel-case word, after any
 * leading underscores, is the family name: "copy" and "copyWithZone:" are in
 * the copy family, "copying" is not. Methods in the alloc, new, copy,
 * mutableCopy and init families return an object the caller owns; init
 * additionally consumes its receiver.
 */

namespace objbridge {

enum class MethodFamily : uint8_t {
    none,
    alloc,
    new_,
    copy,
    mutable_copy,
    init
};

/**
 * @brief Per-method overrides of the naming convention
 */
enum class MethodFlags : uint32_t {
    none = 0,
    returns_retained = 1u << 0,    ///< Result is +1 whatever the name says
    returns_unretained = 1u << 1,  ///< Result is +0 whatever the name says
    nil_tolerant = 1u << 2         ///< A nil receiver yields the zero value
};

constexpr MethodFlags operator|(MethodFlags lhs, MethodFlags rhs) noexcept {
    return static_cast<MethodFlags>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

constexpr bool has_flag(MethodFlags flags, MethodFlags flag) noexcept {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

namespace detail {

constexpr bool in_family(std::string_view selector, std::string_view family) noexcept {
    if (selector.substr(0, family.size()) != family) {
        return false;
    }
    if (selector.size() == family.size()) {
        return true;
    }
    const char next = selector[family.size()];
    return !(next >= 'a' && next <= 'z');
}

} // namespace detail

constexpr MethodFamily method_family(std::string_view selector) noexcept {
    while (!selector.empty() && selector.front() == '_') {
        selector.remove_prefix(1);
    }
    if (detail::in_family(selector, "alloc")) return MethodFamily::alloc;
    if (detail::in_family(selector, "new")) return MethodFamily::new_;
    if (detail::in_family(selector, "copy")) return MethodFamily::copy;
    if (detail::in_family(selector, "mutableCopy")) return MethodFamily::mutable_copy;
    if (detail::in_family(selector, "init")) return MethodFamily::init;
    return MethodFamily::none;
}

/**
 * @brief Whether a call transfers a +1 on its result to the caller
 */
constexpr bool returns_retained(std::string_view selector, MethodFlags flags = MethodFlags::none) noexcept {
    if (has_flag(flags, MethodFlags::returns_retained)) return true;
    if (has_flag(flags, MethodFlags::returns_unretained)) return false;
    return method_family(selector) != MethodFamily::none;
}

/**
 * @brief Whether a call takes over the caller's +1 on the receiver
 */
constexpr bool consumes_receiver(std::string_view selector, MethodFlags flags = MethodFlags::none) noexcept {
    return method_family(selector) == MethodFamily::init && !has_flag(flags, MethodFlags::returns_unretained);
}

} // namespace objbridge
