/**
 * @brief Unit tests for configuration, logging and the bridge context
 */

#include <catch2/catch_test_macros.hpp>
#include "test_fixture.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <cstdlib>
#include <sstream>
#include <string>

using namespace objbridge;
using objbridge::test::SimFixture;

namespace {

/**
 * Collects formatted log messages for the lifetime of the object
 */
class LogCapture {
public:
    using sink_type = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

    LogCapture()
        : stream_(boost::make_shared<std::ostringstream>()),
          sink_(boost::make_shared<sink_type>()) {
        sink_->locked_backend()->add_stream(stream_);
        sink_->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
        boost::log::core::get()->add_sink(sink_);
    }

    ~LogCapture() {
        boost::log::core::get()->remove_sink(sink_);
    }

    std::string text() {
        sink_->flush();
        return stream_->str();
    }

private:
    boost::shared_ptr<std::ostringstream> stream_;
    boost::shared_ptr<sink_type> sink_;
};

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }

    ~ScopedEnv() {
        ::unsetenv(name_);
    }

private:
    const char* name_;
};

} // namespace

TEST_CASE("Configuration parsing", "[config]") {
    SECTION("Log levels") {
        REQUIRE(parse_log_level("trace") == LogLevel::trace);
        REQUIRE(parse_log_level("DEBUG") == LogLevel::debug);
        REQUIRE(parse_log_level("warn") == LogLevel::warning);
        REQUIRE(parse_log_level("Fatal") == LogLevel::fatal);
        REQUIRE_FALSE(parse_log_level("loud").has_value());
        REQUIRE(to_string(LogLevel::error) == "error");
    }

    SECTION("Flags") {
        REQUIRE(parse_flag("1") == true);
        REQUIRE(parse_flag("On") == true);
        REQUIRE(parse_flag("false") == false);
        REQUIRE(parse_flag("no") == false);
        REQUIRE_FALSE(parse_flag("maybe").has_value());
    }

    SECTION("Compile-time defaults") {
        Config config;
        REQUIRE(config.log_level == LogLevel::warning);
        REQUIRE(config.track_ownership == (OBJBRIDGE_TRACK_OWNERSHIP != 0));
        REQUIRE(config.verify_encodings == (OBJBRIDGE_VERIFY_ENCODINGS != 0));
        REQUIRE(config.dispatch_cache_reserve == OBJBRIDGE_DISPATCH_CACHE_RESERVE);
    }

    SECTION("Environment overrides") {
        ScopedEnv level("OBJBRIDGE_LOG_LEVEL", "debug");
        ScopedEnv tracking("OBJBRIDGE_TRACK_OWNERSHIP", "off");
        ScopedEnv verify("OBJBRIDGE_VERIFY_ENCODINGS", "sometimes");
        const Config config = Config::from_environment();
        REQUIRE(config.log_level == LogLevel::debug);
        REQUIRE_FALSE(config.track_ownership);
        REQUIRE(config.verify_encodings == (OBJBRIDGE_VERIFY_ENCODINGS != 0));
    }
}

TEST_CASE_METHOD(SimFixture, "Logging goes through Boost.Log", "[logging]") {
    LogCapture capture;

    SECTION("Messages at or above the level are kept") {
        Config config;
        config.log_level = LogLevel::info;
        get_bridge().configure(config);
        REQUIRE(log::level() == LogLevel::info);

        get_bridge().install_runtime(std::make_shared<runtime::SimRuntime>());
        REQUIRE(capture.text().find("[objbridge] Installed runtime 'sim'") != std::string::npos);
    }

    SECTION("Messages below the level are dropped") {
        Config config;
        config.log_level = LogLevel::error;
        get_bridge().configure(config);

        get_bridge().install_runtime(std::make_shared<runtime::SimRuntime>());
        REQUIRE(capture.text().find("Installed runtime") == std::string::npos);
    }

    SECTION("Creating a sim runtime logs at trace only") {
        Config config;
        config.log_level = LogLevel::debug;
        get_bridge().configure(config);

        auto other = std::make_shared<runtime::SimRuntime>();
        REQUIRE(capture.text().find("sim: runtime created") == std::string::npos);
    }

    SECTION("Violations are logged as errors before the handler runs") {
        auto seen = record_violations();
        const Handle h = sim->instantiate(define_box());
        release(h);
        REQUIRE(seen->size() == 1);
        REQUIRE(capture.text().find("Ownership violation (unbalanced_release)") != std::string::npos);
    }
}

TEST_CASE_METHOD(SimFixture, "Bridge context", "[bridge]") {
    Bridge& bridge = get_bridge();

    SECTION("Class lookups are cached and checked") {
        REQUIRE(bridge.find_class("Box").is_nil());
        try {
            bridge.lookup_class("Box");
            FAIL("lookup should fail");
        } catch (const ResolutionError& e) {
            REQUIRE(e.code() == OB_ERROR_CLASS_NOT_FOUND);
        }
        const ClassRef box = define_box();
        REQUIRE(bridge.lookup_class("Box") == box);
        REQUIRE(bridge.find_class("NSObject") == sim->root_class());
    }

    SECTION("Installing a runtime drops everything derived from the old one") {
        sel("length");
        const ClassRef root = bridge.lookup_class("NSObject");
        REQUIRE(bridge.selectors().size() == 1);

        auto replacement = std::make_shared<runtime::SimRuntime>();
        bridge.install_runtime(replacement);
        REQUIRE(bridge.selectors().size() == 0);
        REQUIRE(bridge.dispatcher().cache_size() == 0);
        REQUIRE_FALSE(bridge.lookup_class("NSObject") == root);
        REQUIRE(bridge.lookup_class("NSObject") == replacement->root_class());
    }

    SECTION("Turning tracking off clears the ledger") {
        const Handle h = sim->instantiate(define_box());
        retain(h);
        REQUIRE(bridge.ledger().tracked_handles() == 1);
        Config config;
        config.track_ownership = false;
        bridge.configure(config);
        REQUIRE(bridge.ledger().tracked_handles() == 0);
        REQUIRE_FALSE(bridge.config().track_ownership);
    }

    SECTION("Without a runtime nothing can be dispatched") {
        bridge.install_runtime(nullptr);
        REQUIRE_FALSE(bridge.has_runtime());
        try {
            sel("length");
            FAIL("interning should fail");
        } catch (const OBException& e) {
            REQUIRE(e.code() == OB_ERROR_NO_RUNTIME);
        }
        REQUIRE_THROWS_AS(bridge.runtime(), OBException);
        REQUIRE_THROWS_AS(AutoreleaseScope(), OBException);
        REQUIRE_THROWS_AS(bridge.lookup_class("NSObject"), OBException);
    }
}
