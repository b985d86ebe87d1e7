#include <objbridge/core/bridge.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/core/logging.hpp>
#include <objbridge/dispatch/dispatcher.hpp>
#include <objbridge/dispatch/selector.hpp>
#include <objbridge/memory/ownership.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <mutex>

namespace objbridge {

Bridge::Bridge()
    : ledger_(std::make_unique<OwnershipLedger>()),
      config_(Config::from_environment()) {
    log::init(config_.log_level);
    if (auto platform = runtime::make_platform_runtime()) {
        install_runtime(std::move(platform));
    }
}

Bridge::~Bridge() = default;

void Bridge::throw_no_runtime() const {
    throw OBException(OB_ERROR_NO_RUNTIME, ob_error_message(OB_ERROR_NO_RUNTIME));
}

void Bridge::install_runtime(std::shared_ptr<runtime::Runtime> runtime) {
    dispatcher_.reset();
    selectors_.reset();
    ledger_->clear();
    {
        std::unique_lock<std::shared_mutex> lock(classes_mutex_);
        classes_.clear();
    }
    runtime_ = std::move(runtime);
    if (!runtime_) {
        OBJBRIDGE_LOG_INFO_STREAM << "Runtime uninstalled";
        return;
    }
    selectors_ = std::make_unique<dispatch::SelectorTable>(*runtime_);
    dispatcher_ = std::make_unique<dispatch::Dispatcher>(*runtime_, config_.dispatch_cache_reserve);
    OBJBRIDGE_LOG_INFO_STREAM << "Installed runtime '" << runtime_->name() << "'";
}

runtime::Runtime& Bridge::runtime() const {
    if (!runtime_) {
        throw_no_runtime();
    }
    return *runtime_;
}

std::shared_ptr<runtime::Runtime> Bridge::runtime_ptr() const {
    if (!runtime_) {
        throw_no_runtime();
    }
    return runtime_;
}

dispatch::Dispatcher& Bridge::dispatcher() const {
    if (!dispatcher_) {
        throw_no_runtime();
    }
    return *dispatcher_;
}

dispatch::SelectorTable& Bridge::selectors() const {
    if (!selectors_) {
        throw_no_runtime();
    }
    return *selectors_;
}

ClassRef Bridge::find_class(std::string_view name) {
    const std::string key(name);
    {
        std::shared_lock<std::shared_mutex> lock(classes_mutex_);
        auto it = classes_.find(key);
        if (it != classes_.end()) {
            return it->second;
        }
    }
    ClassRef cls = runtime().lookup_class(name);
    if (cls) {
        std::unique_lock<std::shared_mutex> lock(classes_mutex_);
        classes_.emplace(key, cls);
    }
    return cls;
}

ClassRef Bridge::lookup_class(std::string_view name) {
    ClassRef cls = find_class(name);
    if (!cls) {
        throw ResolutionError(OB_ERROR_CLASS_NOT_FOUND, "class " + std::string(name) + " is not registered");
    }
    return cls;
}

Handle Bridge::lookup_protocol(std::string_view name) const {
    const Handle protocol = runtime().lookup_protocol(name);
    if (protocol.is_nil()) {
        throw ResolutionError(OB_ERROR_CLASS_NOT_FOUND, "protocol " + std::string(name) + " is not registered");
    }
    return protocol;
}

void Bridge::configure(const Config& config) {
    if (config_.track_ownership && !config.track_ownership) {
        ledger_->clear();
    }
    config_ = config;
    log::set_level(config_.log_level);
    OBJBRIDGE_LOG_DEBUG_STREAM << "Configured: log_level=" << to_string(config_.log_level)
                               << " track_ownership=" << config_.track_ownership
                               << " verify_encodings=" << config_.verify_encodings;
}

} // namespace objbridge
