/**
 * @file 03_capability_traits.cpp
 * @brief Capability traits, protocols and host-built classes
 *
 * This example shows:
 * - Building a foreign class from host functions with ClassBuilder
 * - Attaching host state to each instance
 * - Composing a wrapper from a class trait and protocol traits
 * - Checking a declaration against the runtime
 */

#include <objbridge.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

using namespace objbridge;

namespace {

struct Shape {
    std::int64_t sides{0};
    std::string name{"shape"};
};

ClassRef build_polygon() {
    return ClassBuilder("Polygon")
        .add_method<instancetype(std::int64_t)>("initWithSides:", [](void* self, void*, std::int64_t sides) -> void* {
            auto shape = std::make_shared<Shape>();
            shape->sides = sides;
            shape->name = sides == 3 ? "triangle" : sides == 4 ? "square" : "polygon";
            bind_host_object(Handle{self}, std::move(shape));
            return self;
        })
        .add_method<std::int64_t()>("sides", [](void* self, void*) -> std::int64_t {
            return host_object<Shape>(Handle{self})->sides;
        })
        .add_method<std::string()>("name", [](void* self, void*) -> const char* {
            return host_object<Shape>(Handle{self})->name.c_str();
        })
        .add_class_method<std::int64_t()>("maximumSides", [](void*, void*) -> std::int64_t {
            return 12;
        })
        .add_protocol("Named")
        .register_class();
}

} // namespace

OBJBRIDGE_PROTOCOL(PNamed, "Named",
    ((method, name, "name", std::string()))
)

OBJBRIDGE_INTERFACE(IPolygon, "Polygon", objbridge::INSObject,
    ((method, init_with_sides, "initWithSides:", objbridge::instancetype(std::int64_t)))
    ((method, sides, "sides", std::int64_t()))
    ((class_method, maximum_sides, "maximumSides", std::int64_t()))
)

OBJBRIDGE_DECLARE_OBJECT(Polygon, IPolygon, PNamed)

int main() {
    auto sim = std::make_shared<runtime::SimRuntime>();
    get_bridge().install_runtime(sim);

    std::cout << "1. Building a class" << std::endl;
    const ClassRef polygon = build_polygon();
    std::cout << "   registered " << get_bridge().runtime().class_name(polygon) << std::endl;
    Polygon::verify_declaration();
    std::cout << "   declaration matches the runtime" << std::endl;

    std::cout << "2. Using the wrapper" << std::endl;
    {
        Polygon triangle = Polygon::alloc().init_with_sides(3);
        Polygon square = Polygon::alloc().init_with_sides(4);
        std::cout << "   " << triangle.name() << " has " << triangle.sides() << " sides" << std::endl;
        std::cout << "   " << square.name() << " has " << square.sides() << " sides" << std::endl;
        std::cout << "   at most " << Polygon::maximum_sides() << " sides" << std::endl;
        std::cout << "   host objects alive: " << host_object_count() << std::endl;
    }
    std::cout << "   host objects after release: " << host_object_count() << std::endl;

    std::cout << "3. Trait metadata" << std::endl;
    std::cout << "   ancestry:";
    for (auto name : Polygon::ancestry()) {
        std::cout << " " << name;
    }
    std::cout << std::endl << "   protocols:";
    for (auto name : Polygon::protocols()) {
        std::cout << " " << name;
    }
    std::cout << std::endl;

    get_bridge().install_runtime(nullptr);
    return 0;
}
