/**
 * @file 02_autorelease_scopes.cpp
 * @brief Deferred release with autorelease scopes
 *
 * This example shows:
 * - Autoreleasing objects into the innermost scope
 * - Nested scopes draining independently
 * - Draining on exceptional exit
 * - autoreleasepool() around a block of work
 */

#include <objbridge.hpp>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace objbridge;

int main() {
    auto sim = std::make_shared<runtime::SimRuntime>();
    get_bridge().install_runtime(sim);
    set_violation_handler(throw_on_violation());

    ClassRef item = sim->define_class("Item");

    std::cout << "1. One scope, three objects" << std::endl;
    std::vector<Handle> items;
    {
        AutoreleaseScope scope;
        for (int i = 0; i < 3; ++i) {
            ObjectRef created = msg_send<ObjectRef()>(item, "new");
            items.push_back(std::move(created).autorelease());
        }
        std::cout << "   pending in scope: " << scope.pending() << std::endl;
        std::cout << "   live objects: " << sim->live_objects() << std::endl;
    }
    std::cout << "   live objects after the scope: " << sim->live_objects() << std::endl;

    std::cout << "2. Nested scopes" << std::endl;
    {
        AutoreleaseScope outer;
        std::move(msg_send<ObjectRef()>(item, "new")).autorelease();
        {
            AutoreleaseScope inner;
            std::move(msg_send<ObjectRef()>(item, "new")).autorelease();
            std::cout << "   depth " << AutoreleaseScope::depth() << ", live objects: " << sim->live_objects()
                      << std::endl;
        }
        std::cout << "   inner drained, live objects: " << sim->live_objects() << std::endl;
    }
    std::cout << "   outer drained, live objects: " << sim->live_objects() << std::endl;

    std::cout << "3. Exceptional exit" << std::endl;
    try {
        AutoreleaseScope scope;
        std::move(msg_send<ObjectRef()>(item, "new")).autorelease();
        throw std::runtime_error("work failed");
    } catch (const std::exception& e) {
        std::cout << "   caught '" << e.what() << "', live objects: " << sim->live_objects() << std::endl;
    }

    std::cout << "4. autoreleasepool" << std::endl;
    std::size_t created = autoreleasepool([&] {
        for (int i = 0; i < 100; ++i) {
            std::move(msg_send<ObjectRef()>(item, "new")).autorelease();
        }
        return sim->live_objects();
    });
    std::cout << "   live inside: " << created << ", after: " << sim->live_objects() << std::endl;

    get_bridge().install_runtime(nullptr);
    return 0;
}
