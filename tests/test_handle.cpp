/**
 * @brief Unit tests for Handle, ClassRef and SelectorRef
 */

#include <catch2/catch_test_macros.hpp>
#include <objbridge/core/handle.hpp>
#include <objbridge/core/error.hpp>
#include <string>
#include <type_traits>
#include <unordered_set>

using namespace objbridge;

TEST_CASE("Handle identity", "[handle]") {
    int a = 0;
    int b = 0;

    SECTION("nil is the zero address") {
        STATIC_REQUIRE(nil_handle.is_nil());
        STATIC_REQUIRE(Handle{}.is_nil());
        STATIC_REQUIRE(Handle{nullptr} == nil_handle);
        REQUIRE_FALSE(static_cast<bool>(nil_handle));
    }

    SECTION("Equality is raw equality") {
        Handle h1{&a};
        Handle h2{&a};
        Handle h3{&b};
        REQUIRE(h1 == h2);
        REQUIRE_FALSE(h1 == h3);
        REQUIRE_FALSE(h1.is_nil());
        REQUIRE(h1.raw() == &a);
    }

    SECTION("Handles hash by address") {
        std::unordered_set<Handle> handles{Handle{&a}, Handle{&a}, Handle{&b}, nil_handle};
        REQUIRE(handles.size() == 3);
    }

    SECTION("Handles are plain values") {
        STATIC_REQUIRE(std::is_trivially_copyable_v<Handle>);
        STATIC_REQUIRE(sizeof(Handle) == sizeof(void*));
    }
}

TEST_CASE("Typed opaque references", "[handle]") {
    int storage = 0;

    SECTION("Class and selector references are distinct types") {
        STATIC_REQUIRE_FALSE(std::is_same_v<ClassRef, SelectorRef>);
        STATIC_REQUIRE_FALSE(std::is_convertible_v<ClassRef, SelectorRef>);
        STATIC_REQUIRE_FALSE(std::is_convertible_v<void*, Handle>);
    }

    SECTION("A class is an object") {
        ClassRef cls{&storage};
        REQUIRE(class_handle(cls) == Handle{&storage});
        REQUIRE(class_handle(ClassRef{}).is_nil());
    }
}

TEST_CASE("Error codes", "[handle][error]") {
    SECTION("Every code has a message") {
        for (int32_t code = 0; code >= OB_ERROR_NOT_SUPPORTED; --code) {
            const char* message = ob_error_message(static_cast<OBError>(code));
            REQUIRE(message != nullptr);
            REQUIRE(std::string(message).size() > 0);
        }
    }

    SECTION("Exceptions carry their code") {
        ResolutionError error(OB_ERROR_SELECTOR_NOT_FOUND, "-[Box frob]: unrecognized selector");
        REQUIRE(error.code() == OB_ERROR_SELECTOR_NOT_FOUND);
        REQUIRE(std::string(error.what()) == "-[Box frob]: unrecognized selector");

        OwnershipViolationError violation("double release");
        REQUIRE(violation.code() == OB_ERROR_OWNERSHIP_VIOLATION);
    }
}
