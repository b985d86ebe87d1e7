/**
 * @file 04_error_handling.cpp
 * @brief Error handling across the bridge
 *
 * This example shows:
 * - Resolution errors for unknown classes and selectors
 * - Conversion errors for arity, encoding and numeric range
 * - Nil receivers
 * - Ownership violations with a throwing or recording handler
 */

#include <objbridge.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

using namespace objbridge;

namespace {

std::int64_t gauge_level(void* self, void*) {
    return runtime::SimRuntime::owner_of(Handle{self}).slot(Handle{self}, "level");
}

void gauge_set_level(void* self, void*, std::int8_t level) {
    runtime::SimRuntime::owner_of(Handle{self}).set_slot(Handle{self}, "level", level);
}

void resolution_error_example() {
    std::cout << "1. Resolution Error Handling" << std::endl;

    try {
        get_bridge().lookup_class("Missing");
    } catch (const ResolutionError& e) {
        std::cout << "   Expected error: " << e.what() << std::endl;
    }

    ObjectRef gauge = msg_send<ObjectRef()>(get_bridge().lookup_class("Gauge"), "new");
    try {
        msg_send<void()>(gauge, "explode");
    } catch (const ResolutionError& e) {
        std::cout << "   Expected error: " << e.what() << std::endl;
    }
}

void conversion_error_example() {
    std::cout << "\n2. Conversion Error Handling" << std::endl;

    ObjectRef gauge = msg_send<ObjectRef()>(get_bridge().lookup_class("Gauge"), "new");

    try {
        msg_send<void(std::int64_t)>(gauge, "level", std::int64_t{1});
    } catch (const ConversionError& e) {
        std::cout << "   Expected error: " << e.what() << std::endl;
    }

    try {
        msg_send<double()>(gauge, "level");
    } catch (const ConversionError& e) {
        std::cout << "   Expected error: " << e.what() << std::endl;
    }

    try {
        msg_send<void(std::int8_t)>(gauge, "setLevel:", 300);
    } catch (const ConversionError& e) {
        std::cout << "   Expected error: " << e.what() << " (code " << e.code() << ")" << std::endl;
    }

    msg_send<void(std::int8_t)>(gauge, "setLevel:", 42);
    std::cout << "   level is now " << msg_send<std::int64_t()>(gauge, "level") << std::endl;
}

void nil_receiver_example() {
    std::cout << "\n3. Nil Receivers" << std::endl;

    try {
        msg_send<std::int64_t()>(nil_handle, "level");
    } catch (const OBException& e) {
        std::cout << "   Expected error: " << e.what() << std::endl;
    }

    const auto level = msg_send<std::int64_t(), MethodFlags::nil_tolerant>(nil_handle, "level");
    std::cout << "   nil-tolerant send returned " << level << std::endl;
}

void ownership_violation_example(runtime::SimRuntime& sim) {
    std::cout << "\n4. Ownership Violations" << std::endl;

    const Handle gauge = sim.instantiate(get_bridge().lookup_class("Gauge"));

    ViolationHandler previous = set_violation_handler(throw_on_violation());
    try {
        release(gauge);
    } catch (const OwnershipViolationError& e) {
        std::cout << "   Expected error: " << e.what() << std::endl;
    }

    auto seen = std::make_shared<std::vector<Violation>>();
    set_violation_handler([seen](const Violation& violation) { seen->push_back(violation); });
    release(gauge);
    {
        AutoreleaseScope scope;
        autorelease(gauge);
    }
    for (const Violation& violation : *seen) {
        std::cout << "   recorded " << to_string(violation.kind) << ": " << violation.message << std::endl;
    }
    std::cout << "   retain count untouched: " << sim.retain_count(gauge) << std::endl;

    set_violation_handler(std::move(previous));
    sim.release(gauge);
}

} // namespace

int main() {
    auto sim = std::make_shared<runtime::SimRuntime>();
    get_bridge().install_runtime(sim);

    const ClassRef gauge = sim->define_class("Gauge");
    sim->add_instance_method(gauge, "level", reinterpret_cast<Imp>(&gauge_level), "q16@0:8");
    sim->add_instance_method(gauge, "setLevel:", reinterpret_cast<Imp>(&gauge_set_level), "v20@0:8c16");

    try {
        resolution_error_example();
        conversion_error_example();
        nil_receiver_example();
        ownership_violation_example(*sim);
    } catch (const OBException& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        get_bridge().install_runtime(nullptr);
        return 1;
    }

    get_bridge().install_runtime(nullptr);
    return 0;
}
