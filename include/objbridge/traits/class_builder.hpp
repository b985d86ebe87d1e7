#pragma once

#include <objbridge/core/handle.hpp>
#include <objbridge/dispatch/encoding.hpp>
#include <objbridge/dispatch/message.hpp>
#include <memory>
#include <string>
#include <string_view>

/**
 * @file class_builder.hpp
 * @brief Declaring new foreign classes from the host
 *
 * @code
 * auto counter = objbridge::ClassBuilder("Counter")
 *     .add_method<std::int64_t()>("count", [](void* self, void*) -> std::int64_t {
 *         return objbridge::host_object<State>(objbridge::Handle{self})->count;
 *     })
 *     .add_protocol("NSCopying")
 *     .register_class();
 * @endcode
 *
 * Implementations are plain functions taking the receiver and the selector
 * first, with parameters in their call representation: objects, classes
 * and selectors as void*, strings as const char*. The type encoding is
 * derived from the declared signature.
 *
 * Host state is attached per instance with bind_host_object(). Every built
 * class gets a dealloc that drops the binding and then runs the superclass
 * dealloc.
 */

namespace objbridge {

template<typename Sig>
using imp_t = typename dispatch::Caller<Sig>::function_type;

class ClassBuilder {
public:
    /**
     * @throw GenerationError with OB_ERROR_INVALID_DECLARATION for a malformed
     *        name or OB_ERROR_CLASS_EXISTS for a taken one
     * @throw ResolutionError if @p superclass is not registered
     */
    explicit ClassBuilder(std::string_view name, std::string_view superclass = "NSObject");
    ~ClassBuilder();

    ClassBuilder(const ClassBuilder&) = delete;
    ClassBuilder& operator=(const ClassBuilder&) = delete;
    ClassBuilder(ClassBuilder&&) = default;
    ClassBuilder& operator=(ClassBuilder&&) = delete;

    template<typename Sig>
    ClassBuilder& add_method(std::string_view selector, imp_t<Sig> fn) {
        add_entry(selector, reinterpret_cast<Imp>(fn), method_encoding<Sig>(),
                  signature_traits<Sig>::arity, false);
        return *this;
    }

    template<typename Sig>
    ClassBuilder& add_class_method(std::string_view selector, imp_t<Sig> fn) {
        add_entry(selector, reinterpret_cast<Imp>(fn), method_encoding<Sig>(),
                  signature_traits<Sig>::arity, true);
        return *this;
    }

    ClassBuilder& add_protocol(std::string_view protocol);

    /**
     * @brief Register the class with the runtime
     * @return The class, usable from then on
     */
    ClassRef register_class();

    ClassRef cls() const noexcept { return cls_; }
    const std::string& name() const noexcept { return name_; }

private:
    void add_entry(std::string_view selector, Imp imp, const std::string& encoding,
                   std::size_t arity, bool class_method);

    std::string name_;
    ClassRef cls_;
    bool registered_{false};
};

/**
 * @brief Attach host state to a foreign instance
 *
 * Replaces any earlier binding. Dropped when the instance deallocates if
 * its class was built by ClassBuilder, or explicitly by unbind_host_object().
 */
void bind_host_object(Handle object, std::shared_ptr<void> state);
void unbind_host_object(Handle object);
std::shared_ptr<void> host_object_ptr(Handle object);

/**
 * @return The bound state, or nullptr if none is bound
 */
template<typename T>
std::shared_ptr<T> host_object(Handle object) {
    return std::static_pointer_cast<T>(host_object_ptr(object));
}

std::size_t host_object_count();

} // namespace objbridge
