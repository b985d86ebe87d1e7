/**
 * @brief Unit tests for generated wrapper types
 */

#include <catch2/catch_test_macros.hpp>
#include "test_fixture.hpp"
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>

using namespace objbridge;
using namespace objbridge::test;

namespace objbridge::test {

OBJBRIDGE_DECLARE_BORROWED_OBJECT(BorrowedBox, IBox)

OBJBRIDGE_INTERFACE(IOrphan, "Orphan", IBox, )
OBJBRIDGE_DECLARE_OBJECT(Orphan, IOrphan)

OBJBRIDGE_INTERFACE(ITall, "Tall", IBox, )
OBJBRIDGE_DECLARE_OBJECT(Tall, ITall)

} // namespace objbridge::test

TEST_CASE_METHOD(SimFixture, "A wrapper over an allocated Box", "[object]") {
    define_box();

    SECTION("length() returns what the foreign side reports") {
        const Handle raw = msg_send<Handle()>(Box::foreign_class(), "alloc");
        sim->set_slot(raw, "length", 42);
        {
            Box box = Box::from_handle(raw, Ownership::owned);
            REQUIRE(box.length() == 42);
            REQUIRE(box.handle() == raw);
            REQUIRE(box.ref().is_owned());
        }
        REQUIRE(sim->is_deallocated(raw));
    }

    SECTION("Generated class methods") {
        Box box = Box::alloc().init_with_length(6);
        REQUIRE(box.length() == 6);
        REQUIRE(sim->retain_count(box.handle()) == 1);
        REQUIRE(retain_balance(box.handle()) == 1);

        Box fresh = Box::new_object();
        REQUIRE(fresh.length() == 0);
        REQUIRE(fresh.retain_count() == 1u);
    }

    SECTION("Copies share the object and retain it") {
        Box box = Box::new_object();
        {
            Box copy = box;
            REQUIRE(copy == box);
            REQUIRE(sim->retain_count(box.handle()) == 2);
        }
        REQUIRE(sim->retain_count(box.handle()) == 1);

        Box moved = std::move(box);
        REQUIRE(box.is_nil());
        REQUIRE(sim->retain_count(moved.handle()) == 1);
    }

    SECTION("copy returns a distinct owned object") {
        Box box = Box::alloc().init_with_length(2);
        Box copy = box.copy();
        REQUIRE_FALSE(copy == box);
        REQUIRE(copy.length() == 2);
        REQUIRE(copy.ref().is_owned());
        REQUIRE_FALSE(box.is_equal(copy.ref()));
        REQUIRE(box.is_equal(box.ref()));
    }
}

TEST_CASE_METHOD(SimFixture, "Wrapper identity and formatting", "[object]") {
    define_box();
    define_small_box();

    SECTION("Equality and hashing follow the handle") {
        Box a = Box::new_object();
        Box b = Box::from_handle(a.handle(), Ownership::borrowed);
        Box c = Box::new_object();
        REQUIRE(a == b);
        REQUIRE_FALSE(a == c);
        REQUIRE(b.ref().is_owned());

        std::unordered_set<Box> boxes{a, b, c};
        REQUIRE(boxes.size() == 2);
        REQUIRE(std::hash<Box>{}(a) == std::hash<Handle>{}(a.handle()));
        REQUIRE(a.hash() == static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(a.handle().raw())));
    }

    SECTION("Descriptions name the dynamic class") {
        SmallBox small = SmallBox::new_object();
        Box as_box(small.ref());
        REQUIRE(as_box.dynamic_class_name() == "SmallBox");

        std::ostringstream expected;
        expected << "<SmallBox: " << small.handle().raw() << ">";
        REQUIRE(as_box.description() == expected.str());

        std::ostringstream text;
        text << Box{};
        REQUIRE(text.str() == "<nil>");
        REQUIRE(Box{}.dynamic_class_name().empty());
    }

    SECTION("Subclass wrappers pick up inherited class methods") {
        SmallBox small = SmallBox::alloc().init_with_length(30);
        REQUIRE(small.length() == 10);
        REQUIRE(small.dynamic_class_name() == "SmallBox");
        {
            AutoreleaseScope scope;
            SmallBox made = SmallBox::box_with_length(4);
            REQUIRE(made.dynamic_class_name() == "SmallBox");
            REQUIRE(made.length() == 4);
        }
    }
}

TEST_CASE_METHOD(SimFixture, "Ownership policies", "[object][policy]") {
    const Handle h = sim->instantiate(define_box());

    SECTION("Owned wrappers retain borrowed input") {
        {
            Box box(ObjectRef::borrow(h));
            REQUIRE(box.ref().is_owned());
            REQUIRE(sim->retain_count(h) == 2);
        }
        REQUIRE(sim->retain_count(h) == 1);
    }

    SECTION("Borrowed wrappers never own") {
        {
            BorrowedBox shared(ObjectRef::borrow(h));
            BorrowedBox copy = shared;
            REQUIRE_FALSE(copy.ref().is_owned());
            REQUIRE(sim->retain_count(h) == 1);
            REQUIRE(shared.length() == 0);
        }
        REQUIRE(sim->retain_count(h) == 1);
        REQUIRE(sim->retains_received(h) == 0);
    }

    SECTION("Borrowed wrappers hand owned input to the current scope") {
        {
            AutoreleaseScope scope;
            BorrowedBox shared(ObjectRef::retain(h));
            REQUIRE_FALSE(shared.ref().is_owned());
            REQUIRE(sim->retain_count(h) == 2);
            REQUIRE(scope.pending() == 1);
        }
        REQUIRE(sim->retain_count(h) == 1);
        REQUIRE(retain_balance(h) == 0);
    }

    SECTION("Owned input without a scope is a violation and stays owned") {
        REQUIRE_THROWS_AS(BorrowedBox(ObjectRef::retain(h)), OwnershipViolationError);
        REQUIRE(sim->retain_count(h) == 1);
        REQUIRE(retain_balance(h) == 0);
    }

    SECTION("Policies are visible on the type") {
        STATIC_REQUIRE(Box::policy::ownership == Ownership::owned);
        STATIC_REQUIRE(BorrowedBox::policy::ownership == Ownership::borrowed);
        STATIC_REQUIRE(Box::foreign_name == "Box");
    }
}

TEST_CASE_METHOD(SimFixture, "Borrowed wrappers over retained results", "[object][policy]") {
    define_box();

    SECTION("new keeps the object alive until the scope ends") {
        Handle raw;
        {
            AutoreleaseScope scope;
            BorrowedBox box = BorrowedBox::new_object();
            raw = box.handle();
            REQUIRE_FALSE(sim->is_deallocated(raw));
            REQUIRE_FALSE(box.ref().is_owned());
            box.set_length(5);
            REQUIRE(box.length() == 5);
            REQUIRE(scope.pending() == 1);
        }
        REQUIRE(sim->is_deallocated(raw));
        REQUIRE(sim->releases_received(raw) == 1);
    }

    SECTION("copy of a borrowed wrapper is alive too") {
        AutoreleaseScope scope;
        BorrowedBox original = BorrowedBox::alloc();
        original.set_length(3);
        BorrowedBox copy = original.copy();
        REQUIRE_FALSE(copy == original);
        REQUIRE_FALSE(sim->is_deallocated(copy.handle()));
        REQUIRE(copy.length() == 3);
    }

    SECTION("Without a scope the retained result is reported") {
        auto seen = record_violations();
        BorrowedBox box = BorrowedBox::new_object();
        REQUIRE(seen->size() == 1);
        REQUIRE((*seen)[0].kind == ViolationKind::autorelease_without_scope);
        REQUIRE_FALSE(box.ref().is_owned());
        // The +1 the scope could not take is leaked, never released early
        REQUIRE_FALSE(sim->is_deallocated(box.handle()));
    }
}

TEST_CASE_METHOD(SimFixture, "Declarations are checked against the runtime", "[object][verify]") {
    SECTION("A missing class") {
        try {
            Box::verify_declaration();
            FAIL("verification should fail");
        } catch (const ResolutionError& e) {
            REQUIRE(e.code() == OB_ERROR_CLASS_NOT_FOUND);
        }
    }

    SECTION("A matching chain and protocol set") {
        define_box();
        define_small_box();
        REQUIRE_NOTHROW(Box::verify_declaration());
        REQUIRE_NOTHROW(SmallBox::verify_declaration());
        REQUIRE_NOTHROW(NSObject::verify_declaration());
    }

    SECTION("Intermediate runtime classes may be left out") {
        define_box();
        sim->define_class("Middle", "Box");
        sim->define_class("Tall", "Middle");
        REQUIRE_NOTHROW(Tall::verify_declaration());
    }

    SECTION("A declared superclass the runtime does not have") {
        define_box();
        sim->define_class("Orphan");
        try {
            Orphan::verify_declaration();
            FAIL("verification should fail");
        } catch (const ResolutionError& e) {
            REQUIRE(e.code() == OB_ERROR_ANCESTRY_MISMATCH);
        }
    }

    SECTION("A protocol the class does not conform to") {
        define_box();
        sim->define_class("SmallBox", "Box");
        REQUIRE_THROWS_AS(SmallBox::verify_declaration(), ResolutionError);
    }
}
