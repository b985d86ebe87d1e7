#pragma once

#include <objbridge/core/handle.hpp>
#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

/**
 * @file selector.hpp
 * @brief Interned method selectors
 */

namespace objbridge {

namespace runtime {
class Runtime;
}

constexpr bool is_selector_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == ':';
}

/**
 * @brief Check selector syntax
 *
 * Accepts unary selectors ("length") and keyword selectors
 * ("initWithBytes:length:"): identifier characters and colons only, not
 * starting with a colon or a digit, and ending with a colon if it has any.
 */
constexpr bool is_valid_selector(std::string_view name) noexcept {
    if (name.empty() || name.front() == ':' || (name.front() >= '0' && name.front() <= '9')) {
        return false;
    }
    bool has_colon = false;
    for (char c : name) {
        if (!is_selector_char(c)) {
            return false;
        }
        has_colon = has_colon || c == ':';
    }
    return !has_colon || name.back() == ':';
}

/**
 * @brief Number of arguments a selector takes (its colon count)
 */
constexpr std::size_t selector_arity(std::string_view name) noexcept {
    std::size_t count = 0;
    for (char c : name) {
        if (c == ':') {
            ++count;
        }
    }
    return count;
}

/**
 * @class Selector
 * @brief A selector name together with the runtime's canonical value
 *
 * Immutable. Two selectors from the same runtime are equal exactly when
 * their names are.
 */
class Selector {
public:
    Selector() = default;
    Selector(std::string name, SelectorRef ref) : name_(std::move(name)), ref_(ref) {}

    const std::string& name() const noexcept { return name_; }
    SelectorRef ref() const noexcept { return ref_; }
    std::size_t arity() const noexcept { return selector_arity(name_); }
    bool is_nil() const noexcept { return ref_.is_nil(); }

    friend bool operator==(const Selector& lhs, const Selector& rhs) noexcept {
        return lhs.ref_ == rhs.ref_;
    }

private:
    std::string name_;
    SelectorRef ref_{};
};

namespace dispatch {

/**
 * @class SelectorTable
 * @brief Name to selector cache in front of the runtime's registry
 */
class SelectorTable {
public:
    explicit SelectorTable(runtime::Runtime& runtime) : runtime_(runtime) {}

    /**
     * @throw ConversionError with OB_ERROR_INVALID_ARGUMENT for malformed names
     */
    Selector intern(std::string_view name);

    std::size_t size() const;

private:
    runtime::Runtime& runtime_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SelectorRef> table_;
};

} // namespace dispatch

/**
 * @brief Intern @p name in the active runtime
 */
Selector sel(std::string_view name);

} // namespace objbridge

template<>
struct std::hash<objbridge::Selector> {
    std::size_t operator()(const objbridge::Selector& selector) const noexcept {
        return std::hash<objbridge::SelectorRef>{}(selector.ref());
    }
};
