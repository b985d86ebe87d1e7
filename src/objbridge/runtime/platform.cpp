#include <objbridge/runtime/runtime.hpp>

#ifdef __APPLE__
#include <objbridge/runtime/objc_runtime.hpp>
#endif

namespace objbridge::runtime {

std::shared_ptr<Runtime> make_platform_runtime() {
#ifdef __APPLE__
    return std::make_shared<ObjcRuntime>();
#else
    return nullptr;
#endif
}

} // namespace objbridge::runtime
