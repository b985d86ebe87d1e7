#include <objbridge/traits/class_builder.hpp>
#include <objbridge/core/bridge.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/logging.hpp>
#include <objbridge/dispatch/dispatcher.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <mutex>
#include <unordered_map>

namespace objbridge {

namespace {

std::mutex host_objects_mutex_;
std::unordered_map<Handle, std::shared_ptr<void>> host_objects_;

bool is_valid_class_name(std::string_view name) {
    if (name.empty() || (name.front() >= '0' && name.front() <= '9')) {
        return false;
    }
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

void built_class_dealloc(void* self, void* cmd);

/**
 * The dealloc of the nearest class above the built ones. Subclasses of a
 * built class share built_class_dealloc, so skip every class that uses it.
 */
Imp inherited_dealloc(runtime::Runtime& rt, Handle object, SelectorRef dealloc) {
    for (ClassRef cls = rt.class_of(object); cls; cls = rt.superclass_of(cls)) {
        auto entry = rt.find_own_method(cls, dealloc);
        if (entry && entry->imp != reinterpret_cast<Imp>(&built_class_dealloc)) {
            return entry->imp;
        }
    }
    return nullptr;
}

void built_class_dealloc(void* self, void* cmd) {
    const Handle object{self};
    unbind_host_object(object);
    runtime::Runtime& rt = get_bridge().runtime();
    if (Imp imp = inherited_dealloc(rt, object, SelectorRef{cmd})) {
        reinterpret_cast<void (*)(void*, void*)>(imp)(self, cmd);
    }
}

} // namespace

ClassBuilder::ClassBuilder(std::string_view name, std::string_view superclass)
    : name_(name) {
    if (!is_valid_class_name(name)) {
        throw GenerationError(OB_ERROR_INVALID_DECLARATION, "malformed class name '" + name_ + "'");
    }
    Bridge& bridge = get_bridge();
    runtime::Runtime& rt = bridge.runtime();
    const ClassRef super = bridge.lookup_class(superclass);
    if (rt.lookup_class(name)) {
        throw GenerationError(OB_ERROR_CLASS_EXISTS, "class " + name_ + " already exists");
    }
    cls_ = rt.allocate_class(name, super);
    if (!cls_) {
        throw GenerationError(OB_ERROR_CLASS_EXISTS, "class " + name_ + " could not be allocated");
    }
    const SelectorRef dealloc = rt.register_selector("dealloc");
    if (!rt.add_method(cls_, dealloc, reinterpret_cast<Imp>(&built_class_dealloc), "v16@0:8")) {
        throw GenerationError(OB_ERROR_INVALID_DECLARATION, "class " + name_ + " already declares dealloc");
    }
}

ClassBuilder::~ClassBuilder() {
    if (cls_ && !registered_) {
        OBJBRIDGE_LOG_WARN_STREAM << "Class " << name_ << " was declared but never registered";
    }
}

void ClassBuilder::add_entry(std::string_view selector, Imp imp, const std::string& encoding,
                             std::size_t arity, bool class_method) {
    const char kind = class_method ? '+' : '-';
    if (!is_valid_selector(selector)) {
        throw GenerationError(OB_ERROR_INVALID_DECLARATION,
                              std::string(1, kind) + "[" + name_ + " " + std::string(selector) + "]: malformed selector");
    }
    if (selector_arity(selector) != arity) {
        throw GenerationError(OB_ERROR_INVALID_DECLARATION,
                              std::string(1, kind) + "[" + name_ + " " + std::string(selector) +
                              "]: parameter count does not match the selector");
    }
    if (!imp) {
        throw GenerationError(OB_ERROR_INVALID_DECLARATION,
                              std::string(1, kind) + "[" + name_ + " " + std::string(selector) + "]: null implementation");
    }

    Bridge& bridge = get_bridge();
    runtime::Runtime& rt = bridge.runtime();
    const ClassRef target = class_method ? rt.class_of(class_handle(cls_)) : cls_;
    const Selector interned = sel(selector);
    if (!rt.add_method(target, interned.ref(), imp, encoding)) {
        throw GenerationError(OB_ERROR_INVALID_DECLARATION,
                              std::string(1, kind) + "[" + name_ + " " + std::string(selector) + "]: declared twice");
    }
    // A new method may shadow one already cached for a subclass
    bridge.dispatcher().invalidate();
    OBJBRIDGE_LOG_DEBUG_STREAM << "Added " << kind << "[" << name_ << " " << selector << "] " << encoding;
}

ClassBuilder& ClassBuilder::add_protocol(std::string_view protocol) {
    if (!get_bridge().runtime().add_protocol(cls_, protocol)) {
        OBJBRIDGE_LOG_DEBUG_STREAM << name_ << " already conforms to " << protocol;
    }
    return *this;
}

ClassRef ClassBuilder::register_class() {
    if (registered_) {
        return cls_;
    }
    get_bridge().runtime().register_class(cls_);
    registered_ = true;
    OBJBRIDGE_LOG_INFO_STREAM << "Registered class " << name_;
    return cls_;
}

void bind_host_object(Handle object, std::shared_ptr<void> state) {
    if (object.is_nil()) {
        throw OBException(OB_ERROR_INVALID_HANDLE, "cannot bind host state to nil");
    }
    std::lock_guard<std::mutex> lock(host_objects_mutex_);
    host_objects_[object] = std::move(state);
}

void unbind_host_object(Handle object) {
    std::shared_ptr<void> released;
    {
        std::lock_guard<std::mutex> lock(host_objects_mutex_);
        auto it = host_objects_.find(object);
        if (it == host_objects_.end()) {
            return;
        }
        released = std::move(it->second);
        host_objects_.erase(it);
    }
}

std::shared_ptr<void> host_object_ptr(Handle object) {
    std::lock_guard<std::mutex> lock(host_objects_mutex_);
    auto it = host_objects_.find(object);
    return it == host_objects_.end() ? nullptr : it->second;
}

std::size_t host_object_count() {
    std::lock_guard<std::mutex> lock(host_objects_mutex_);
    return host_objects_.size();
}

} // namespace objbridge
