/**
 * @file 01_basic_objects.cpp
 * @brief Wrapping a foreign class and sending it messages
 *
 * This example shows:
 * - Declaring a capability trait and a wrapper type for a class
 * - Allocating and initialising through generated class methods
 * - Typed message sends with and without a wrapper
 * - Owned and borrowed references
 */

#include <objbridge.hpp>
#include <cstdint>
#include <iostream>

using namespace objbridge;

namespace {

std::int64_t counter_value(void* self, void*) {
    return runtime::SimRuntime::owner_of(Handle{self}).slot(Handle{self}, "value");
}

void counter_increment_by(void* self, void*, std::int64_t amount) {
    auto& rt = runtime::SimRuntime::owner_of(Handle{self});
    rt.set_slot(Handle{self}, "value", rt.slot(Handle{self}, "value") + amount);
}

void* counter_init_with_value(void* self, void*, std::int64_t value) {
    runtime::SimRuntime::owner_of(Handle{self}).set_slot(Handle{self}, "value", value);
    return self;
}

} // namespace

OBJBRIDGE_INTERFACE(ICounter, "Counter", objbridge::INSObject,
    ((method, value, "value", std::int64_t()))
    ((method, increment_by, "incrementBy:", void(std::int64_t)))
    ((method, init_with_value, "initWithValue:", objbridge::instancetype(std::int64_t)))
)

OBJBRIDGE_DECLARE_OBJECT(Counter, ICounter)

int main() {
    auto sim = std::make_shared<runtime::SimRuntime>();
    get_bridge().install_runtime(sim);

    ClassRef counter_class = sim->define_class("Counter");
    sim->add_instance_method(counter_class, "value", reinterpret_cast<Imp>(&counter_value), "q16@0:8");
    sim->add_instance_method(counter_class, "incrementBy:", reinterpret_cast<Imp>(&counter_increment_by), "v24@0:8q16");
    sim->add_instance_method(counter_class, "initWithValue:", reinterpret_cast<Imp>(&counter_init_with_value), "@24@0:8q16");

    std::cout << "1. Wrapper types" << std::endl;
    {
        Counter counter = Counter::alloc().init_with_value(10);
        counter.increment_by(5);
        std::cout << "   " << counter << " value = " << counter.value() << std::endl;
        std::cout << "   ancestry:";
        for (auto name : Counter::ancestry()) {
            std::cout << " " << name;
        }
        std::cout << std::endl;
        std::cout << "   debugDescription: " << counter.debug_description() << std::endl;
        Counter::verify_declaration();
    }

    std::cout << "2. Plain message sends" << std::endl;
    {
        ObjectRef raw = msg_send<ObjectRef()>(counter_class, "new");
        send<void>(raw, "incrementBy:", std::int64_t{3});
        std::cout << "   " << raw << " value = " << msg_send<std::int64_t()>(raw, "value") << std::endl;
        std::cout << "   responds to incrementBy: "
                  << std::boolalpha << msg_send<bool(Selector)>(raw, "respondsToSelector:", "incrementBy:")
                  << std::endl;
    }

    std::cout << "3. Owned and borrowed references" << std::endl;
    {
        Counter owner = Counter::new_object();
        ObjectRef borrowed = ObjectRef::borrow(owner.handle());
        ObjectRef extra = borrowed.to_owned();
        std::cout << "   retain count with two owners: " << owner.retain_count() << std::endl;
        extra.reset();
        std::cout << "   retain count with one owner: " << owner.retain_count() << std::endl;
    }

    std::cout << "   live objects at exit: " << sim->live_objects() << std::endl;
    get_bridge().install_runtime(nullptr);
    return 0;
}
