#include <objbridge/dispatch/marshal.hpp>
#include <objbridge/core/bridge.hpp>
#include <objbridge/runtime/runtime.hpp>

namespace objbridge::dispatch {

Selector ReturnConverter<Selector>::from_abi(void* raw, bool) {
    if (!raw) {
        return Selector{};
    }
    const SelectorRef ref{raw};
    return Selector(get_bridge().runtime().selector_name(ref), ref);
}

} // namespace objbridge::dispatch
