/**
 * @brief Unit tests for host-declared classes
 */

#include <catch2/catch_test_macros.hpp>
#include "test_fixture.hpp"
#include <memory>
#include <string>

using namespace objbridge;
using namespace objbridge::test;

namespace {

struct CounterState {
    std::int64_t count{0};
    std::shared_ptr<int> destroyed;

    ~CounterState() {
        if (destroyed) {
            ++*destroyed;
        }
    }
};

std::shared_ptr<int> destroyed_states = std::make_shared<int>(0);

ClassRef build_counter() {
    return ClassBuilder("Counter")
        .add_method<instancetype()>("init", [](void* self, void*) -> void* {
            auto state = std::make_shared<CounterState>();
            state->destroyed = destroyed_states;
            bind_host_object(Handle{self}, std::move(state));
            return self;
        })
        .add_method<std::int64_t()>("count", [](void* self, void*) -> std::int64_t {
            return host_object<CounterState>(Handle{self})->count;
        })
        .add_method<void(std::int64_t)>("addAmount:", [](void* self, void*, std::int64_t amount) {
            host_object<CounterState>(Handle{self})->count += amount;
        })
        .add_class_method<std::int64_t()>("instanceLimit", [](void*, void*) -> std::int64_t {
            return 8;
        })
        .add_protocol("NSCopying")
        .register_class();
}

} // namespace

namespace objbridge::test {

OBJBRIDGE_INTERFACE(ICounter, "Counter", INSObject,
    ((method, count, "count", std::int64_t()))
    ((method, add_amount, "addAmount:", void(std::int64_t)))
    ((class_method, instance_limit, "instanceLimit", std::int64_t()))
)

OBJBRIDGE_DECLARE_OBJECT(Counter, ICounter, PNSCopying)

} // namespace objbridge::test

TEST_CASE_METHOD(SimFixture, "Building and using a class", "[builder]") {
    const ClassRef counter = build_counter();
    *destroyed_states = 0;

    SECTION("The class is registered with its methods and protocols") {
        REQUIRE(get_bridge().find_class("Counter") == counter);
        REQUIRE(sim->conforms_to(counter, "NSCopying"));
        REQUIRE_NOTHROW(Counter::verify_declaration());

        const auto count = get_bridge().dispatcher().resolve_in(counter, sel("count"));
        REQUIRE(count.provider == counter);
        REQUIRE(count.encoding == "q@:");
        REQUIRE(get_bridge().dispatcher().resolve_in(counter, sel("addAmount:")).encoding == "v@:q");
    }

    SECTION("Instances carry host state for their lifetime") {
        Handle raw;
        {
            Counter c = Counter::new_object();
            raw = c.handle();
            REQUIRE(host_object_count() == 1);
            c.add_amount(3);
            c.add_amount(4);
            REQUIRE(c.count() == 7);
            REQUIRE(host_object<CounterState>(raw)->count == 7);
        }
        REQUIRE(sim->is_deallocated(raw));
        REQUIRE(host_object_count() == 0);
        REQUIRE(*destroyed_states == 1);
        REQUIRE(host_object<CounterState>(raw) == nullptr);
    }

    SECTION("Class methods go on the metaclass") {
        REQUIRE(Counter::instance_limit() == 8);
        REQUIRE_THROWS_AS((msg_send<std::int64_t()>(Counter::new_object(), "instanceLimit")), ResolutionError);
    }

    SECTION("Subclasses of a built class release host state once") {
        ClassBuilder("SubCounter", "Counter").register_class();
        Handle raw;
        {
            ObjectRef sub = msg_send<ObjectRef()>(get_bridge().lookup_class("SubCounter"), "new");
            raw = sub.handle();
            msg_send<void(std::int64_t)>(sub, "addAmount:", 2);
            REQUIRE(msg_send<std::int64_t()>(sub, "count") == 2);
        }
        REQUIRE(sim->is_deallocated(raw));
        REQUIRE(*destroyed_states == 1);
        REQUIRE(host_object_count() == 0);
    }
}

TEST_CASE_METHOD(SimFixture, "Methods added later shadow cached ones", "[builder][dispatch]") {
    ClassBuilder("Shape")
        .add_method<std::int64_t()>("sides", [](void*, void*) -> std::int64_t { return 0; })
        .register_class();
    ClassBuilder square("Square", "Shape");
    square.register_class();

    ObjectRef shape = msg_send<ObjectRef()>(square.cls(), "new");
    REQUIRE(msg_send<std::int64_t()>(shape, "sides") == 0);

    square.add_method<std::int64_t()>("sides", [](void*, void*) -> std::int64_t { return 4; });
    REQUIRE(msg_send<std::int64_t()>(shape, "sides") == 4);
}

TEST_CASE_METHOD(SimFixture, "Malformed declarations", "[builder][error]") {
    SECTION("Class names") {
        auto code_of = [](const char* name) {
            try {
                ClassBuilder builder(name);
            } catch (const GenerationError& e) {
                return e.code();
            }
            return OB_SUCCESS;
        };
        REQUIRE(code_of("1Counter") == OB_ERROR_INVALID_DECLARATION);
        REQUIRE(code_of("Bad Name") == OB_ERROR_INVALID_DECLARATION);
        REQUIRE(code_of("") == OB_ERROR_INVALID_DECLARATION);
        REQUIRE(code_of("NSObject") == OB_ERROR_CLASS_EXISTS);
    }

    SECTION("Unknown superclass") {
        try {
            ClassBuilder builder("Thing", "Nothing");
            FAIL("declaration should fail");
        } catch (const ResolutionError& e) {
            REQUIRE(e.code() == OB_ERROR_CLASS_NOT_FOUND);
        }
    }

    SECTION("Selectors") {
        ClassBuilder builder("Widget");
        auto zero = [](void*, void*) -> std::int64_t { return 0; };
        REQUIRE_THROWS_AS(builder.add_method<std::int64_t()>("9lives", zero), GenerationError);
        REQUIRE_THROWS_AS(builder.add_method<std::int64_t()>("size:", zero), GenerationError);
        REQUIRE_THROWS_AS(builder.add_method<std::int64_t()>("dealloc", zero), GenerationError);
        builder.add_method<std::int64_t()>("size", zero);
        REQUIRE_THROWS_AS(builder.add_method<std::int64_t()>("size", zero), GenerationError);
        builder.register_class();
        REQUIRE(builder.register_class() == builder.cls());
    }

    SECTION("Host state needs an object") {
        REQUIRE_THROWS_AS(bind_host_object(nil_handle, std::make_shared<int>(1)), OBException);
        REQUIRE(host_object<int>(Handle{&destroyed_states}) == nullptr);
    }
}
