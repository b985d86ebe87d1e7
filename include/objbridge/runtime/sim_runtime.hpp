#pragma once

#include <objbridge/runtime/runtime.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @file sim_runtime.hpp
 * @brief In-process reference-counted object runtime
 *
 * SimRuntime models the parts of an Objective-C style runtime the bridge
 * talks to: classes with metaclasses, single inheritance, per-class method
 * tables of plain C function pointers with type encodings, protocol
 * conformance, retain counts and native autorelease pool tokens. The test
 * suite and the example programs run against it; on hosts without an Objective-C
 * runtime it is what the bridge drives.
 *
 * Deallocated objects are kept as zombies until the runtime is destroyed so
 * that any later retain, release or dispatch through them is reported as a
 * stale handle instead of touching freed memory.
 *
 * Besides the root class the runtime registers "Protocol", whose instances
 * stand for declared protocols, and "NSString", whose instances hold text
 * for -description and -debugDescription. The description of an object is
 * created on first request and owned by the object until it deallocates.
 */

namespace objbridge::runtime {

class SimRuntime : public Runtime {
public:
    /**
     * @brief Create a runtime with the root class "NSObject" registered
     */
    SimRuntime();
    ~SimRuntime() override;

    SimRuntime(const SimRuntime&) = delete;
    SimRuntime& operator=(const SimRuntime&) = delete;

    std::string_view name() const noexcept override { return "sim"; }

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

    /* Convenience used by tests and examples */

    /**
     * @brief Allocate and register a class in one step
     * @throw OBException if the superclass is unknown or the name is taken
     */
    ClassRef define_class(std::string_view name, std::string_view superclass = "NSObject");

    void add_instance_method(ClassRef cls, std::string_view selector, Imp imp, std::string_view encoding);
    void add_class_method(ClassRef cls, std::string_view selector, Imp imp, std::string_view encoding);

    ClassRef metaclass_of(ClassRef cls) const;
    ClassRef root_class() const noexcept { return root_; }
    ClassRef string_class() const noexcept { return string_class_; }

    /**
     * @brief Name of a protocol object returned by lookup_protocol()
     * @throw OBException with OB_ERROR_INVALID_ARGUMENT for anything else
     */
    std::string protocol_name(Handle protocol) const;

    /**
     * @brief New NSString instance holding @p text, retain count one
     */
    Handle make_string(std::string_view text);

    /**
     * @brief Text of an NSString instance
     * @throw OBException with OB_ERROR_INVALID_ARGUMENT if @p string is not one
     */
    const std::string& string_value(Handle string) const;

    /**
     * @brief "<ClassName: 0x...>" as an NSString owned by @p object
     *
     * Class objects describe themselves by name.
     */
    Handle description_of(Handle object);

    /**
     * @brief Create an instance with a retain count of one, as alloc does
     */
    Handle instantiate(ClassRef cls);

    /**
     * @brief New instance of the same class with the same slots, retain count one
     */
    Handle clone(Handle object);

    /**
     * @brief Integer instance storage for method implementations
     */
    void set_slot(Handle object, std::string_view key, std::int64_t value);
    std::int64_t slot(Handle object, std::string_view key) const;

    /* Statistics */

    std::size_t retains_received(Handle object) const;
    std::size_t releases_received(Handle object) const;
    bool is_deallocated(Handle object) const;
    std::size_t live_objects() const;
    std::size_t deallocations() const noexcept { return deallocations_.load(std::memory_order_relaxed); }
    std::size_t method_lookups() const noexcept { return method_lookups_.load(std::memory_order_relaxed); }
    std::size_t pool_depth() const;

    /**
     * @brief The runtime that created a sim object or class
     *
     * Method implementations receive only the receiver pointer; this is how
     * they reach their runtime.
     */
    static SimRuntime& owner_of(Handle object);

private:
    struct Object;
    struct Class;

    Object* object_at(Handle object) const;
    Class* class_at(ClassRef cls) const;
    Imp lookup_unlocked(const Class* cls, SelectorRef selector) const;
    Class* create_class_pair(std::string_view name, Class* superclass);
    Object* declare_protocol_unlocked(const std::string& name);
    void install_root_methods();
    void deallocate(Object* object, std::unique_lock<std::recursive_mutex>& lock);

    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::string>> selectors_;
    std::unordered_set<const void*> selector_ptrs_;
    std::vector<std::unique_ptr<Class>> classes_;
    std::unordered_map<std::string, Class*> classes_by_name_;
    std::unordered_set<const void*> class_ptrs_;
    std::unordered_map<const void*, std::unique_ptr<Object>> objects_;
    std::unordered_map<std::string, std::unique_ptr<Object>> protocols_;
    std::unordered_map<const void*, std::string> protocol_names_;
    std::unordered_map<const void*, std::string> strings_;
    std::vector<void*> pool_tokens_;
    std::uintptr_t next_pool_token_{1};
    ClassRef root_{};
    ClassRef protocol_class_{};
    ClassRef string_class_{};
    mutable std::atomic<std::size_t> method_lookups_{0};
    std::atomic<std::size_t> deallocations_{0};
};

} // namespace objbridge::runtime
