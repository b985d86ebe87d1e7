#pragma once

#include <objbridge/core/config.hpp>
#include <objbridge/core/handle.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * @file bridge.hpp
 * @brief Process-wide bridge context
 */

namespace objbridge {

namespace runtime {
class Runtime;
}

namespace dispatch {
class Dispatcher;
class SelectorTable;
}

class OwnershipLedger;

/**
 * @class Bridge
 * @brief Registry of the active runtime and the state derived from it
 *
 * Owns the runtime, the selector table, the dispatch cache, the ownership
 * ledger and the class lookup cache. All of them are tied to one runtime and
 * are dropped together by install_runtime().
 *
 * On Apple platforms the Objective-C runtime is installed on first use;
 * elsewhere a runtime must be installed before anything is dispatched.
 */
class Bridge {
private:
    Bridge();

    std::shared_ptr<runtime::Runtime> runtime_;
    std::unique_ptr<dispatch::SelectorTable> selectors_;
    std::unique_ptr<dispatch::Dispatcher> dispatcher_;
    std::unique_ptr<OwnershipLedger> ledger_;

    mutable std::shared_mutex classes_mutex_;
    std::unordered_map<std::string, ClassRef> classes_;  ///< Name lookup cache

    Config config_;

    [[noreturn]] void throw_no_runtime() const;

public:
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    static Bridge& instance() {
        static Bridge bridge;
        return bridge;
    }

    /**
     * @brief Replace the active runtime
     *
     * Drops the selector table, the dispatch cache, the ledger and the class
     * cache. Not safe while other threads dispatch; handles obtained from the
     * previous runtime must not be used afterwards.
     *
     * @param runtime New runtime, or nullptr to uninstall
     */
    void install_runtime(std::shared_ptr<runtime::Runtime> runtime);

    bool has_runtime() const noexcept { return runtime_ != nullptr; }

    /**
     * @throw OBException with OB_ERROR_NO_RUNTIME when none is installed
     */
    runtime::Runtime& runtime() const;
    std::shared_ptr<runtime::Runtime> runtime_ptr() const;

    dispatch::Dispatcher& dispatcher() const;
    dispatch::SelectorTable& selectors() const;
    OwnershipLedger& ledger() const { return *ledger_; }

    /**
     * @brief Cached class lookup by name
     * @throw ResolutionError with OB_ERROR_CLASS_NOT_FOUND
     */
    ClassRef lookup_class(std::string_view name);

    /**
     * @brief Cached class lookup by name
     * @return nil if the runtime does not know the class
     */
    ClassRef find_class(std::string_view name);

    /**
     * @brief Protocol object by name, for conformsToProtocol:
     * @throw ResolutionError with OB_ERROR_CLASS_NOT_FOUND
     */
    Handle lookup_protocol(std::string_view name) const;

    /**
     * @brief Apply a configuration, including the log filter
     *
     * Turning ownership tracking off clears the ledger.
     */
    void configure(const Config& config);
    const Config& config() const noexcept { return config_; }
};

inline Bridge& get_bridge() {
    return Bridge::instance();
}

} // namespace objbridge
