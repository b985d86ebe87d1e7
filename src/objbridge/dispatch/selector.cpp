#include <objbridge/dispatch/selector.hpp>
#include <objbridge/core/bridge.hpp>
#include <objbridge/core/error.hpp>
#include <objbridge/runtime/runtime.hpp>
#include <mutex>

namespace objbridge {

namespace dispatch {

Selector SelectorTable::intern(std::string_view name) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = table_.find(std::string(name));
        if (it != table_.end()) {
            return Selector(it->first, it->second);
        }
    }
    if (!is_valid_selector(name)) {
        throw ConversionError(OB_ERROR_INVALID_ARGUMENT, "malformed selector '" + std::string(name) + "'");
    }
    SelectorRef ref = runtime_.register_selector(name);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto result = table_.emplace(std::string(name), ref);
    return Selector(result.first->first, result.first->second);
}

std::size_t SelectorTable::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return table_.size();
}

} // namespace dispatch

Selector sel(std::string_view name) {
    return get_bridge().selectors().intern(name);
}

} // namespace objbridge
