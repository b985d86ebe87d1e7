#include <objbridge/runtime/sim_runtime.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/logging.hpp>
#include <objbridge/memory/ownership.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <utility>

namespace objbridge::runtime {

struct SimRuntime::Object {
    SimRuntime* owner{nullptr};
    Class* isa{nullptr};
    std::size_t retain_count{1};
    std::size_t retains{0};
    std::size_t releases{0};
    bool is_class{false};
    bool deallocating{false};
    bool deallocated{false};
    Object* description{nullptr};
    std::unordered_map<std::string, std::int64_t> slots;
};

struct SimRuntime::Class : SimRuntime::Object {
    std::string name;
    Class* superclass{nullptr};
    bool metaclass{false};
    bool registered{false};
    std::unordered_map<const void*, MethodEntry> methods;
    std::unordered_set<std::string> protocols;
};

namespace {

template<typename Fn>
Imp to_imp(Fn fn) {
    return reinterpret_cast<Imp>(fn);
}

Imp find_imp(SimRuntime& rt, ClassRef cls, SelectorRef selector) {
    for (ClassRef current = cls; current; current = rt.superclass_of(current)) {
        if (auto entry = rt.find_own_method(current, selector)) {
            return entry->imp;
        }
    }
    return nullptr;
}

Imp require_imp(SimRuntime& rt, Handle self, SelectorRef selector) {
    const ClassRef cls = rt.class_of(self);
    Imp imp = find_imp(rt, cls, selector);
    if (!imp) {
        throw ResolutionError(OB_ERROR_SELECTOR_NOT_FOUND,
                              std::string(rt.is_metaclass(cls) ? "+[" : "-[") + rt.class_name(cls) + " " +
                              rt.selector_name(selector) + "]: unrecognized selector");
    }
    return imp;
}

/* Root class implementations. Every one receives (self, _cmd, args...). */

void* root_alloc(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).instantiate(ClassRef{self}).raw();
}

void* root_new(void* self, void*) {
    SimRuntime& rt = SimRuntime::owner_of(Handle{self});
    Handle object = rt.instantiate(ClassRef{self});
    SelectorRef init = rt.register_selector("init");
    Imp imp = find_imp(rt, ClassRef{self}, init);
    if (!imp) {
        return object.raw();
    }
    return reinterpret_cast<void* (*)(void*, void*)>(imp)(object.raw(), init.raw());
}

void* root_class_self(void* self, void*) {
    return self;
}

void* root_init(void* self, void*) {
    return self;
}

void* root_self(void* self, void*) {
    return self;
}

void* root_class_imp(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).class_of(Handle{self}).raw();
}

void* root_retain(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).retain(Handle{self}).raw();
}

void root_release(void* self, void*) {
    SimRuntime::owner_of(Handle{self}).release(Handle{self});
}

std::uint64_t root_retain_count(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).retain_count(Handle{self});
}

std::uint64_t root_hash(void* self, void*) {
    return static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(self));
}

bool root_is_equal(void* self, void*, void* other) {
    return self == other;
}

bool root_responds_to_selector(void* self, void*, void* selector) {
    SimRuntime& rt = SimRuntime::owner_of(Handle{self});
    return find_imp(rt, rt.class_of(Handle{self}), SelectorRef{selector}) != nullptr;
}

bool root_is_kind_of_class(void* self, void*, void* cls) {
    SimRuntime& rt = SimRuntime::owner_of(Handle{self});
    for (ClassRef current = rt.class_of(Handle{self}); current; current = rt.superclass_of(current)) {
        if (current.raw() == cls) {
            return true;
        }
    }
    return false;
}

bool root_is_member_of_class(void* self, void*, void* cls) {
    return SimRuntime::owner_of(Handle{self}).class_of(Handle{self}).raw() == cls;
}

bool root_conforms_to_protocol(void* self, void*, void* protocol) {
    if (!protocol) {
        return false;
    }
    SimRuntime& rt = SimRuntime::owner_of(Handle{self});
    ClassRef cls = rt.class_of(Handle{self});
    // Sent to a class object, the question is about the class itself
    if (rt.is_metaclass(cls)) {
        cls = ClassRef{self};
    }
    return rt.conforms_to(cls, rt.protocol_name(Handle{protocol}));
}

void* root_description(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).description_of(Handle{self}).raw();
}

void* root_perform_selector(void* self, void*, void* selector) {
    SimRuntime& rt = SimRuntime::owner_of(Handle{self});
    Imp imp = require_imp(rt, Handle{self}, SelectorRef{selector});
    return reinterpret_cast<void* (*)(void*, void*)>(imp)(self, selector);
}

void* root_perform_selector_with_object(void* self, void*, void* selector, void* object) {
    SimRuntime& rt = SimRuntime::owner_of(Handle{self});
    Imp imp = require_imp(rt, Handle{self}, SelectorRef{selector});
    return reinterpret_cast<void* (*)(void*, void*, void*)>(imp)(self, selector, object);
}

bool root_is_proxy(void*, void*) {
    return false;
}

const char* string_utf8(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).string_value(Handle{self}).c_str();
}

std::uint64_t string_length(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).string_value(Handle{self}).size();
}

void* root_copy(void* self, void*) {
    return SimRuntime::owner_of(Handle{self}).clone(Handle{self}).raw();
}

void root_dealloc(void*, void*) {}

std::string describe(Handle object) {
    std::ostringstream text;
    text << object.raw();
    return text.str();
}

} // namespace

SimRuntime::SimRuntime() {
    install_root_methods();
    OBJBRIDGE_LOG_TRACE_STREAM << "sim: runtime created with root class NSObject";
}

SimRuntime::~SimRuntime() = default;

SimRuntime& SimRuntime::owner_of(Handle object) {
    if (object.is_nil()) {
        throw OBException(OB_ERROR_INVALID_HANDLE, "nil handle has no sim runtime");
    }
    return *static_cast<Object*>(object.raw())->owner;
}

SimRuntime::Object* SimRuntime::object_at(Handle object) const {
    auto it = objects_.find(object.raw());
    if (it != objects_.end()) {
        return it->second.get();
    }
    if (class_ptrs_.count(object.raw()) != 0 || protocol_names_.count(object.raw()) != 0) {
        return static_cast<Object*>(object.raw());
    }
    throw OBException(OB_ERROR_INVALID_HANDLE, "unknown object " + describe(object));
}

SimRuntime::Class* SimRuntime::class_at(ClassRef cls) const {
    if (class_ptrs_.count(cls.raw()) == 0) {
        throw OBException(OB_ERROR_CLASS_NOT_FOUND, "unknown class " + describe(class_handle(cls)));
    }
    return static_cast<Class*>(static_cast<Object*>(cls.raw()));
}

Imp SimRuntime::lookup_unlocked(const Class* cls, SelectorRef selector) const {
    for (const Class* current = cls; current; current = current->superclass) {
        auto it = current->methods.find(selector.raw());
        if (it != current->methods.end()) {
            return it->second.imp;
        }
    }
    return nullptr;
}

SimRuntime::Class* SimRuntime::create_class_pair(std::string_view name, Class* superclass) {
    auto meta = std::make_unique<Class>();
    auto cls = std::make_unique<Class>();

    meta->owner = this;
    meta->is_class = true;
    meta->metaclass = true;
    meta->name = std::string(name);

    cls->owner = this;
    cls->is_class = true;
    cls->name = std::string(name);
    cls->superclass = superclass;
    cls->isa = meta.get();

    if (superclass) {
        meta->superclass = superclass->isa;
        meta->isa = superclass->isa->isa;
    } else {
        // A root metaclass inherits from its own root class
        meta->superclass = cls.get();
        meta->isa = meta.get();
    }

    Class* result = cls.get();
    class_ptrs_.insert(static_cast<Object*>(meta.get()));
    class_ptrs_.insert(static_cast<Object*>(cls.get()));
    classes_by_name_[result->name] = result;
    classes_.push_back(std::move(meta));
    classes_.push_back(std::move(cls));
    return result;
}

void SimRuntime::install_root_methods() {
    Class* root = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        root = create_class_pair("NSObject", nullptr);
        root_ = ClassRef{static_cast<Object*>(root)};
    }

    add_class_method(root_, "alloc", to_imp(&root_alloc), "@16@0:8");
    add_class_method(root_, "new", to_imp(&root_new), "@16@0:8");
    add_class_method(root_, "class", to_imp(&root_class_self), "#16@0:8");

    add_instance_method(root_, "init", to_imp(&root_init), "@16@0:8");
    add_instance_method(root_, "self", to_imp(&root_self), "@16@0:8");
    add_instance_method(root_, "class", to_imp(&root_class_imp), "#16@0:8");
    add_instance_method(root_, "retain", to_imp(&root_retain), "@16@0:8");
    add_instance_method(root_, "release", to_imp(&root_release), "v16@0:8");
    add_instance_method(root_, "retainCount", to_imp(&root_retain_count), "Q16@0:8");
    add_instance_method(root_, "hash", to_imp(&root_hash), "Q16@0:8");
    add_instance_method(root_, "isEqual:", to_imp(&root_is_equal), "B24@0:8@16");
    add_instance_method(root_, "respondsToSelector:", to_imp(&root_responds_to_selector), "B24@0:8:16");
    add_instance_method(root_, "isKindOfClass:", to_imp(&root_is_kind_of_class), "B24@0:8#16");
    add_instance_method(root_, "copy", to_imp(&root_copy), "@16@0:8");
    add_instance_method(root_, "dealloc", to_imp(&root_dealloc), "v16@0:8");
    add_instance_method(root_, "isMemberOfClass:", to_imp(&root_is_member_of_class), "B24@0:8#16");
    add_instance_method(root_, "conformsToProtocol:", to_imp(&root_conforms_to_protocol), "B24@0:8@16");
    add_instance_method(root_, "description", to_imp(&root_description), "@16@0:8");
    add_instance_method(root_, "debugDescription", to_imp(&root_description), "@16@0:8");
    add_instance_method(root_, "performSelector:", to_imp(&root_perform_selector), "@24@0:8:16");
    add_instance_method(root_, "performSelector:withObject:", to_imp(&root_perform_selector_with_object),
                        "@32@0:8:16@24");
    add_instance_method(root_, "isProxy", to_imp(&root_is_proxy), "B16@0:8");
    register_class(root_);

    protocol_class_ = allocate_class("Protocol", root_);
    register_class(protocol_class_);
    add_protocol(root_, "NSObject");

    string_class_ = allocate_class("NSString", root_);
    add_instance_method(string_class_, "UTF8String", to_imp(&string_utf8), "r*16@0:8");
    add_instance_method(string_class_, "length", to_imp(&string_length), "Q16@0:8");
    register_class(string_class_);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    declare_protocol_unlocked("NSCopying");
}

SimRuntime::Object* SimRuntime::declare_protocol_unlocked(const std::string& name) {
    auto& protocol = protocols_[name];
    if (!protocol) {
        protocol = std::make_unique<Object>();
        protocol->owner = this;
        // Protocols live as long as the runtime, like classes
        protocol->is_class = true;
        protocol->isa = protocol_class_ ? class_at(protocol_class_) : nullptr;
        protocol_names_[protocol.get()] = name;
    }
    return protocol.get();
}

// Classes

ClassRef SimRuntime::lookup_class(std::string_view name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = classes_by_name_.find(std::string(name));
    if (it == classes_by_name_.end() || !it->second->registered) {
        return ClassRef{};
    }
    return ClassRef{static_cast<Object*>(it->second)};
}

ClassRef SimRuntime::class_of(Handle object) const {
    if (object.is_nil()) {
        return ClassRef{};
    }
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        const Object* obj = object_at(object);
        if (!obj->deallocated) {
            return ClassRef{static_cast<Object*>(obj->isa)};
        }
    }
    report_violation(ViolationKind::stale_handle, object, "message sent to deallocated object");
    throw OBException(OB_ERROR_INVALID_HANDLE, "deallocated object " + describe(object));
}

ClassRef SimRuntime::superclass_of(ClassRef cls) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Class* superclass = class_at(cls)->superclass;
    return superclass ? ClassRef{static_cast<Object*>(superclass)} : ClassRef{};
}

std::string SimRuntime::class_name(ClassRef cls) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return class_at(cls)->name;
}

bool SimRuntime::is_metaclass(ClassRef cls) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return class_at(cls)->metaclass;
}

bool SimRuntime::conforms_to(ClassRef cls, std::string_view protocol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const std::string name(protocol);
    for (const Class* current = class_at(cls); current; current = current->superclass) {
        if (current->protocols.count(name) != 0) {
            return true;
        }
    }
    return false;
}

Handle SimRuntime::lookup_protocol(std::string_view name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = protocols_.find(std::string(name));
    return it == protocols_.end() ? nil_handle : Handle{static_cast<void*>(it->second.get())};
}

std::string SimRuntime::protocol_name(Handle protocol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = protocol_names_.find(protocol.raw());
    if (it == protocol_names_.end()) {
        throw OBException(OB_ERROR_INVALID_ARGUMENT, "not a protocol " + describe(protocol));
    }
    return it->second;
}

// Selectors and methods

SelectorRef SimRuntime::register_selector(std::string_view name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto& slot = selectors_[std::string(name)];
    if (!slot) {
        slot = std::make_unique<std::string>(name);
        selector_ptrs_.insert(slot.get());
    }
    return SelectorRef{static_cast<void*>(slot.get())};
}

std::string SimRuntime::selector_name(SelectorRef selector) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (selector_ptrs_.count(selector.raw()) == 0) {
        throw OBException(OB_ERROR_INVALID_ARGUMENT, "unknown selector");
    }
    return *static_cast<const std::string*>(selector.raw());
}

std::optional<MethodEntry> SimRuntime::find_own_method(ClassRef cls, SelectorRef selector) const {
    method_lookups_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Class* target = class_at(cls);
    auto it = target->methods.find(selector.raw());
    if (it == target->methods.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Reference counting

Handle SimRuntime::retain(Handle object) {
    if (object.is_nil()) {
        return object;
    }
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        Object* obj = object_at(object);
        if (!obj->deallocated) {
            if (!obj->is_class) {
                ++obj->retain_count;
                ++obj->retains;
            }
            return object;
        }
    }
    report_violation(ViolationKind::stale_handle, object, "retain sent to deallocated object");
    return object;
}

void SimRuntime::release(Handle object) {
    if (object.is_nil()) {
        return;
    }
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    Object* obj = object_at(object);
    if (obj->is_class) {
        return;
    }
    if (obj->deallocated || obj->retain_count == 0) {
        lock.unlock();
        report_violation(ViolationKind::stale_handle, object, "release sent to deallocated object");
        return;
    }
    ++obj->releases;
    if (--obj->retain_count == 0) {
        deallocate(obj, lock);
    }
}

std::size_t SimRuntime::retain_count(Handle object) const {
    if (object.is_nil()) {
        return 0;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Object* obj = object_at(object);
    if (obj->is_class) {
        return std::numeric_limits<std::size_t>::max();
    }
    return obj->deallocated ? 0 : obj->retain_count;
}

void SimRuntime::deallocate(Object* object, std::unique_lock<std::recursive_mutex>& lock) {
    object->deallocating = true;
    SelectorRef dealloc = register_selector("dealloc");
    Imp imp = lookup_unlocked(object->isa, dealloc);
    const std::string name = object->isa->name;

    lock.unlock();
    if (imp) {
        reinterpret_cast<void (*)(void*, void*)>(imp)(object, dealloc.raw());
    }
    lock.lock();

    object->deallocating = false;
    object->deallocated = true;
    object->slots.clear();
    strings_.erase(object);
    deallocations_.fetch_add(1, std::memory_order_relaxed);
    OBJBRIDGE_LOG_TRACE_STREAM << "sim: deallocated <" << name << ": " << static_cast<void*>(object) << ">";

    if (Object* description = std::exchange(object->description, nullptr)) {
        ++description->releases;
        if (--description->retain_count == 0) {
            deallocate(description, lock);
        }
    }
}

void* SimRuntime::pool_push() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    void* token = reinterpret_cast<void*>(next_pool_token_++);
    pool_tokens_.push_back(token);
    return token;
}

void SimRuntime::pool_pop(void* token) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    if (!pool_tokens_.empty() && pool_tokens_.back() == token) {
        pool_tokens_.pop_back();
        return;
    }
    // Popping an outer pool pops everything above it, as the native runtime does
    auto it = std::find(pool_tokens_.begin(), pool_tokens_.end(), token);
    if (it != pool_tokens_.end()) {
        pool_tokens_.erase(it, pool_tokens_.end());
    }
    lock.unlock();
    report_violation(ViolationKind::pool_mismatch, nil_handle, "autorelease pool popped out of order");
}

// Class declaration

ClassRef SimRuntime::allocate_class(std::string_view name, ClassRef superclass) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (classes_by_name_.count(std::string(name)) != 0) {
        return ClassRef{};
    }
    Class* super = superclass ? class_at(superclass) : nullptr;
    if (super && super->metaclass) {
        throw OBException(OB_ERROR_INVALID_ARGUMENT, "a metaclass cannot be a superclass");
    }
    return ClassRef{static_cast<Object*>(create_class_pair(name, super))};
}

bool SimRuntime::add_method(ClassRef cls, SelectorRef selector, Imp imp, std::string_view encoding) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Class* target = class_at(cls);
    return target->methods.emplace(selector.raw(), MethodEntry{imp, std::string(encoding)}).second;
}

bool SimRuntime::add_protocol(ClassRef cls, std::string_view protocol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const std::string name(protocol);
    declare_protocol_unlocked(name);
    return class_at(cls)->protocols.insert(name).second;
}

void SimRuntime::register_class(ClassRef cls) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Class* target = class_at(cls);
    target->registered = true;
    target->isa->registered = true;
}

ClassRef SimRuntime::define_class(std::string_view name, std::string_view superclass) {
    ClassRef super = lookup_class(superclass);
    if (!super) {
        throw OBException(OB_ERROR_CLASS_NOT_FOUND, "superclass " + std::string(superclass) + " is not registered");
    }
    ClassRef cls = allocate_class(name, super);
    if (!cls) {
        throw OBException(OB_ERROR_CLASS_EXISTS, "class " + std::string(name) + " already exists");
    }
    register_class(cls);
    return cls;
}

void SimRuntime::add_instance_method(ClassRef cls, std::string_view selector, Imp imp, std::string_view encoding) {
    if (!add_method(cls, register_selector(selector), imp, encoding)) {
        throw OBException(OB_ERROR_INVALID_DECLARATION,
                          class_name(cls) + " already declares -" + std::string(selector));
    }
}

void SimRuntime::add_class_method(ClassRef cls, std::string_view selector, Imp imp, std::string_view encoding) {
    if (!add_method(metaclass_of(cls), register_selector(selector), imp, encoding)) {
        throw OBException(OB_ERROR_INVALID_DECLARATION,
                          class_name(cls) + " already declares +" + std::string(selector));
    }
}

ClassRef SimRuntime::metaclass_of(ClassRef cls) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ClassRef{static_cast<Object*>(class_at(cls)->isa)};
}

// Instances

Handle SimRuntime::instantiate(ClassRef cls) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Class* target = class_at(cls);
    if (target->metaclass) {
        throw OBException(OB_ERROR_INVALID_ARGUMENT, "cannot instantiate metaclass " + target->name);
    }
    auto object = std::make_unique<Object>();
    object->owner = this;
    object->isa = target;
    Handle handle{static_cast<void*>(object.get())};
    objects_.emplace(handle.raw(), std::move(object));
    return handle;
}

Handle SimRuntime::clone(Handle object) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Object* source = object_at(object);
    if (source->is_class) {
        return object;
    }
    Handle copy = instantiate(ClassRef{static_cast<Object*>(source->isa)});
    objects_.at(copy.raw())->slots = source->slots;
    return copy;
}

void SimRuntime::set_slot(Handle object, std::string_view key, std::int64_t value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    object_at(object)->slots[std::string(key)] = value;
}

std::int64_t SimRuntime::slot(Handle object, std::string_view key) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Object* obj = object_at(object);
    auto it = obj->slots.find(std::string(key));
    return it == obj->slots.end() ? 0 : it->second;
}

Handle SimRuntime::make_string(std::string_view text) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Handle string = instantiate(string_class_);
    strings_[string.raw()] = std::string(text);
    return string;
}

const std::string& SimRuntime::string_value(Handle string) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = strings_.find(string.raw());
    if (it == strings_.end()) {
        throw OBException(OB_ERROR_INVALID_ARGUMENT, "not a string " + describe(string));
    }
    return it->second;
}

Handle SimRuntime::description_of(Handle object) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Object* target = object_at(object);
    if (!target->description) {
        std::ostringstream text;
        if (class_ptrs_.count(target) != 0) {
            text << static_cast<Class*>(target)->name;
        } else {
            text << "<" << target->isa->name << ": " << object.raw() << ">";
        }
        target->description = static_cast<Object*>(make_string(text.str()).raw());
    }
    return Handle{static_cast<void*>(target->description)};
}

// Statistics

std::size_t SimRuntime::retains_received(Handle object) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return object_at(object)->retains;
}

std::size_t SimRuntime::releases_received(Handle object) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return object_at(object)->releases;
}

bool SimRuntime::is_deallocated(Handle object) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return object_at(object)->deallocated;
}

std::size_t SimRuntime::live_objects() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(objects_.begin(), objects_.end(),
        [](const auto& entry) { return !entry.second->deallocated; }));
}

std::size_t SimRuntime::pool_depth() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pool_tokens_.size();
}

} // namespace objbridge::runtime
