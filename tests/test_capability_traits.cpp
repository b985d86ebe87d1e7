/**
 * @brief Unit tests for capability trait composition
 */

#include <catch2/catch_test_macros.hpp>
#include "test_fixture.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

using namespace objbridge;
using namespace objbridge::test;

namespace objbridge::test {

OBJBRIDGE_PROTOCOL(PLength32, "Length32",
    ((method, length, "length", std::int32_t()))
)

OBJBRIDGE_PROTOCOL(PLength64, "Length64",
    ((method, length, "length", std::int64_t()))
)

OBJBRIDGE_PROTOCOL(PLabelled, "Labelled",
    ((method, label, "label", std::string()))
    ((class_method, length, "length", std::int32_t()))
)

OBJBRIDGE_PROTOCOL(PEmpty, "Empty", )

// A subclass may redeclare an inherited selector with another signature
OBJBRIDGE_INTERFACE(IWideBox, "WideBox", IBox,
    ((method, length, "length", double()))
    ((method, width, "width", double(), MethodFlags::nil_tolerant))
)

OBJBRIDGE_DECLARE_OBJECT(WideBox, IWideBox)
OBJBRIDGE_DECLARE_OBJECT(LabelledBox, IBox, PLabelled, PLength64)

} // namespace objbridge::test

TEST_CASE("Trait metadata", "[traits]") {
    SECTION("Kinds and foreign names") {
        STATIC_REQUIRE(detail::inspect_t<INSObject>::trait_kind == TraitKind::root_class);
        STATIC_REQUIRE(detail::inspect_t<IBox>::trait_kind == TraitKind::class_);
        STATIC_REQUIRE(detail::inspect_t<PNSCopying>::trait_kind == TraitKind::protocol);
        STATIC_REQUIRE(detail::inspect_t<IBox>::foreign_name == "Box");
        STATIC_REQUIRE(detail::inspect_t<PEmpty>::foreign_name == "Empty");
    }

    SECTION("Method declarations") {
        using decl = MethodDecl<"setLength:", void(std::int64_t)>;
        STATIC_REQUIRE(decl::selector == "setLength:");
        STATIC_REQUIRE(decl::kind == MethodKind::instance);
        STATIC_REQUIRE(decl::flags == MethodFlags::none);
        STATIC_REQUIRE(std::is_same_v<detail::inspect_t<PEmpty>::methods, type_list<>>);
        STATIC_REQUIRE(std::is_same_v<detail::inspect_t<PLength64>::methods,
                                      type_list<MethodDecl<"length", std::int64_t()>>>);

        using width = MethodDecl<"width", double(), MethodKind::instance, MethodFlags::nil_tolerant>;
        STATIC_REQUIRE(std::is_same_v<detail::inspect_t<IWideBox>::methods,
                                      type_list<MethodDecl<"length", double()>, width>>);
    }

    SECTION("Ancestry runs from the class to the root") {
        STATIC_REQUIRE(std::is_same_v<ancestry_t<INSObject>, trait_list<INSObject>>);
        STATIC_REQUIRE(std::is_same_v<ancestry_t<ISmallBox>, trait_list<ISmallBox, IBox, INSObject>>);
        REQUIRE(SmallBox::ancestry() == std::vector<std::string_view>{"SmallBox", "Box", "NSObject"});
        REQUIRE(SmallBox::protocols() == std::vector<std::string_view>{"NSCopying"});
        REQUIRE(NSObject::ancestry() == std::vector<std::string_view>{"NSObject"});
        REQUIRE(NSObject::protocols().empty());
    }
}

TEST_CASE("Trait composition rejects conflicting selectors", "[traits][compose]") {
    SECTION("A protocol may restate a class method with the same signature") {
        STATIC_REQUIRE(composable_v<IBox, PLength64>);
        STATIC_REQUIRE(composable_v<IBox, PLabelled, PLength64>);
        STATIC_REQUIRE(composable_v<IBox>);
    }

    SECTION("The same selector with another signature is rejected") {
        STATIC_REQUIRE_FALSE(composable_v<IBox, PLength32>);
        STATIC_REQUIRE_FALSE(composable_v<INSObject, PLength32, PLength64>);
        STATIC_REQUIRE_FALSE(composable_v<INSObject, PLength64, PLength32>);
    }

    SECTION("Instance and class methods do not collide") {
        STATIC_REQUIRE(composable_v<INSObject, PLabelled, PLength32>);
    }

    SECTION("Within a class chain the most derived declaration wins") {
        STATIC_REQUIRE(composable_v<IWideBox>);
        STATIC_REQUIRE(composable_v<IWideBox, PNSCopying>);
        STATIC_REQUIRE(std::is_same_v<decltype(std::declval<const WideBox&>().length()), double>);
        STATIC_REQUIRE(std::is_same_v<decltype(std::declval<const Box&>().length()), std::int64_t>);
        STATIC_REQUIRE(std::is_same_v<decltype(std::declval<const LabelledBox&>().label()), std::string>);
    }
}

namespace {

double wide_box_length(void* self, void*) {
    return static_cast<double>(sim_of(self).slot(Handle{self}, "length")) / 2.0;
}

} // namespace

TEST_CASE_METHOD(SimFixture, "Composed wrappers dispatch through every layer", "[traits][dispatch]") {
    define_box();
    const ClassRef wide = sim->define_class("WideBox", "Box");
    sim->add_instance_method(wide, "length", reinterpret_cast<Imp>(&wide_box_length), "d16@0:8");

    SECTION("Subclass, superclass and root members") {
        WideBox box = WideBox::alloc().init_with_length(9);
        REQUIRE(box.length() == 4.5);
        box.set_length(3);
        REQUIRE(box.length() == 1.5);
        REQUIRE(box.label() == "box");
        REQUIRE(box.is_kind_of_class(Box::foreign_class()));
        REQUIRE(box.responds_to_selector(sel("setLength:")));
        REQUIRE_FALSE(box.responds_to_selector(sel("width")));
    }

    SECTION("A nil-tolerant member on a nil wrapper") {
        WideBox empty;
        REQUIRE(empty.width() == 0.0);
        REQUIRE_THROWS_AS(empty.length(), ResolutionError);
    }

    SECTION("An undeclared method on a live object") {
        WideBox box = WideBox::new_object();
        REQUIRE_THROWS_AS(box.width(), ResolutionError);
    }
}
