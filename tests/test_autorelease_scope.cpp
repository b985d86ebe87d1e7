/**
 * @brief Unit tests for AutoreleaseScope
 */

#include <catch2/catch_test_macros.hpp>
#include "test_fixture.hpp"
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace objbridge;
using objbridge::test::SimFixture;

namespace {

std::vector<std::int64_t> dealloc_order;

void tracked_dealloc(void* self, void*) {
    dealloc_order.push_back(runtime::SimRuntime::owner_of(Handle{self}).slot(Handle{self}, "id"));
}

} // namespace

TEST_CASE_METHOD(SimFixture, "Autorelease scope drains on exit", "[autorelease]") {
    const ClassRef box = define_box();

    SECTION("Three handles each receive exactly one release") {
        std::vector<Handle> handles;
        for (int i = 0; i < 3; ++i) {
            handles.push_back(sim->instantiate(box));
        }
        {
            AutoreleaseScope scope;
            for (Handle h : handles) {
                autorelease(retain(h));
            }
            REQUIRE(scope.pending() == 3);
            for (Handle h : handles) {
                REQUIRE(sim->releases_received(h) == 0);
            }
        }
        for (Handle h : handles) {
            REQUIRE(sim->releases_received(h) == 1);
            REQUIRE(sim->retain_count(h) == 1);
            REQUIRE(retain_balance(h) == 0);
        }
    }

    SECTION("Exit by exception drains too") {
        std::vector<Handle> handles;
        for (int i = 0; i < 4; ++i) {
            handles.push_back(sim->instantiate(box));
        }
        try {
            AutoreleaseScope scope;
            for (Handle h : handles) {
                autorelease(retain(h));
            }
            throw std::runtime_error("leaving early");
        } catch (const std::runtime_error&) {
        }
        for (Handle h : handles) {
            REQUIRE(sim->releases_received(h) == 1);
        }
        REQUIRE(AutoreleaseScope::depth() == 0);
    }

    SECTION("Releases run last queued first") {
        const ClassRef tracked = sim->define_class("Tracked");
        sim->add_instance_method(tracked, "dealloc", reinterpret_cast<Imp>(&tracked_dealloc), "v16@0:8");
        dealloc_order.clear();
        {
            AutoreleaseScope scope;
            for (std::int64_t id = 1; id <= 3; ++id) {
                const Handle h = sim->instantiate(tracked);
                sim->set_slot(h, "id", id);
                autorelease(adopt(h));
            }
        }
        REQUIRE(dealloc_order == std::vector<std::int64_t>{3, 2, 1});
    }

    SECTION("The native pool is pushed and popped") {
        REQUIRE(sim->pool_depth() == 0);
        {
            AutoreleaseScope outer;
            REQUIRE(sim->pool_depth() == 1);
            {
                AutoreleaseScope inner;
                REQUIRE(sim->pool_depth() == 2);
            }
            REQUIRE(sim->pool_depth() == 1);
        }
        REQUIRE(sim->pool_depth() == 0);
    }
}

TEST_CASE_METHOD(SimFixture, "Nested autorelease scopes", "[autorelease]") {
    const ClassRef box = define_box();
    const Handle a = sim->instantiate(box);
    const Handle b = sim->instantiate(box);

    SECTION("Handles go to the innermost scope") {
        AutoreleaseScope outer;
        autorelease(retain(a));
        {
            AutoreleaseScope inner;
            REQUIRE(AutoreleaseScope::current() == &inner);
            REQUIRE(AutoreleaseScope::depth() == 2);
            autorelease(retain(b));
            REQUIRE(inner.pending() == 1);
        }
        REQUIRE(sim->releases_received(b) == 1);
        REQUIRE(sim->releases_received(a) == 0);
        REQUIRE(AutoreleaseScope::current() == &outer);
        REQUIRE(outer.pending() == 1);
    }

    SECTION("Ending an outer scope first is a scope_order violation") {
        auto seen = record_violations();
        auto outer = std::make_unique<AutoreleaseScope>();
        autorelease(retain(a));
        auto inner = std::make_unique<AutoreleaseScope>();
        autorelease(retain(b));

        outer.reset();
        REQUIRE(seen->size() == 1);
        REQUIRE((*seen)[0].kind == ViolationKind::scope_order);
        REQUIRE(sim->releases_received(a) == 1);
        REQUIRE(AutoreleaseScope::current() == inner.get());

        inner.reset();
        REQUIRE(sim->releases_received(b) == 1);
        REQUIRE(AutoreleaseScope::depth() == 0);
    }

    SECTION("Ending a scope on another thread is a scope_thread violation") {
        auto seen = record_violations();
        std::unique_ptr<AutoreleaseScope> foreign;
        std::thread worker([&] {
            foreign = std::make_unique<AutoreleaseScope>();
            autorelease(retain(a));
        });
        worker.join();

        foreign.reset();
        REQUIRE(seen->size() == 1);
        REQUIRE((*seen)[0].kind == ViolationKind::scope_thread);
        REQUIRE(sim->releases_received(a) == 0);
        REQUIRE(AutoreleaseScope::depth() == 0);
    }

    SECTION("The owner thread forgets a scope ended elsewhere") {
        auto seen = record_violations();
        auto scope = std::make_unique<AutoreleaseScope>();
        autorelease(retain(a));
        REQUIRE(AutoreleaseScope::current() == scope.get());

        std::thread worker([&] { scope.reset(); });
        worker.join();

        REQUIRE(seen->size() == 1);
        REQUIRE((*seen)[0].kind == ViolationKind::scope_thread);
        REQUIRE(AutoreleaseScope::current() == nullptr);
        REQUIRE(AutoreleaseScope::depth() == 0);

        autorelease(retain(b));
        REQUIRE(seen->size() == 2);
        REQUIRE((*seen)[1].kind == ViolationKind::autorelease_without_scope);
        release(b);

        {
            AutoreleaseScope fresh;
            autorelease(retain(b));
            REQUIRE(fresh.pending() == 1);
        }
        REQUIRE(sim->releases_received(b) == 2);
        REQUIRE(sim->releases_received(a) == 0);
    }
}

TEST_CASE_METHOD(SimFixture, "Autorelease misuse", "[autorelease][violation]") {
    const ClassRef box = define_box();
    const Handle h = sim->instantiate(box);

    SECTION("No active scope") {
        retain(h);
        REQUIRE(AutoreleaseScope::current() == nullptr);
        REQUIRE_THROWS_AS(autorelease(h), OwnershipViolationError);
        release(h);
    }

    SECTION("A handle the bridge holds no +1 on") {
        AutoreleaseScope scope;
        REQUIRE_THROWS_AS(autorelease(h), OwnershipViolationError);
        REQUIRE(scope.pending() == 0);
    }

    SECTION("More autoreleases than retains") {
        AutoreleaseScope scope;
        retain(h);
        autorelease(h);
        REQUIRE_THROWS_AS(autorelease(h), OwnershipViolationError);
        REQUIRE(get_bridge().ledger().pending_autoreleases(h) == 1);
    }
}

TEST_CASE_METHOD(SimFixture, "ObjectRef autorelease and autoreleasepool", "[autorelease][objectref]") {
    const ClassRef box = define_box();
    const Handle h = sim->instantiate(box);

    SECTION("An owned reference moves its +1 into the scope") {
        {
            AutoreleaseScope scope;
            ObjectRef owned = ObjectRef::retain(h);
            std::move(owned).autorelease();
            REQUIRE(owned.is_nil());
            REQUIRE(sim->retain_count(h) == 2);
        }
        REQUIRE(sim->retain_count(h) == 1);
    }

    SECTION("A borrowed reference is retained before it is queued") {
        {
            AutoreleaseScope scope;
            std::move(ObjectRef::borrow(h)).autorelease();
            REQUIRE(sim->retain_count(h) == 2);
        }
        REQUIRE(sim->retain_count(h) == 1);
    }

    SECTION("A failed autorelease leaves the reference owned") {
        ObjectRef owned = ObjectRef::retain(h);
        REQUIRE_THROWS_AS(std::move(owned).autorelease(), OwnershipViolationError);
        REQUIRE(owned.is_owned());
        REQUIRE(owned.handle() == h);
        REQUIRE(retain_balance(h) == 1);

        owned.reset();
        REQUIRE(sim->retain_count(h) == 1);
        REQUIRE(retain_balance(h) == 0);
    }

    SECTION("A borrowed reference that fails to autorelease gives its retain back") {
        {
            ObjectRef borrowed = ObjectRef::borrow(h);
            REQUIRE_THROWS_AS(std::move(borrowed).autorelease(), OwnershipViolationError);
            REQUIRE(sim->retain_count(h) == 2);
        }
        REQUIRE(sim->retain_count(h) == 1);
        REQUIRE(retain_balance(h) == 0);
    }

    SECTION("autoreleasepool returns the callable's result") {
        const std::int64_t length = autoreleasepool([&] {
            REQUIRE(AutoreleaseScope::depth() == 1);
            test::Box box_object = test::Box::box_with_length(12);
            return box_object.length();
        });
        REQUIRE(length == 12);
        REQUIRE(AutoreleaseScope::depth() == 0);
        REQUIRE(sim->live_objects() == 1);
    }
}
