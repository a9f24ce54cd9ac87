#include <boost/test/unit_test.hpp>

#include <cstdlib>

#include "Core/Config.h"

#include "Fixture.h"

namespace
{
    // sets an environment variable for the lifetime of the object
    struct ScopedEnvironment
    {
        std::string name;

        ScopedEnvironment(std::string name, const char *value) : name(std::move(name))
        {
            setenv(this->name.c_str(), value, 1);
        }
        ~ScopedEnvironment()
        {
            unsetenv(name.c_str());
        }
    };
}

BOOST_AUTO_TEST_SUITE(ConfigSuite)

BOOST_AUTO_TEST_CASE(Defaults)
{
    EngineConfig config;
    BOOST_CHECK(config.useAccelerated);
    BOOST_CHECK_EQUAL(config.backendLibrary, "libtabula_accel.so");
    BOOST_CHECK_EQUAL(config.minAcceleratedLength, 0);
    BOOST_CHECK_EQUAL(config.isinTolerance, 1e-9);
    BOOST_CHECK(!config.verbose);
}

BOOST_AUTO_TEST_CASE(FromJson)
{
    auto config = EngineConfig::fromJson(R"({
        "useAccelerated": false,
        "backendLibrary": "/opt/tabula/libtabula_accel.so",
        "minAcceleratedLength": 4096,
        "isinTolerance": 1e-6,
        "somethingElse": [1, 2, 3]
    })");
    BOOST_CHECK(!config.useAccelerated);
    BOOST_CHECK_EQUAL(config.backendLibrary, "/opt/tabula/libtabula_accel.so");
    BOOST_CHECK_EQUAL(config.minAcceleratedLength, 4096);
    BOOST_CHECK_EQUAL(config.isinTolerance, 1e-6);
    BOOST_CHECK(!config.verbose);

    // integral tolerance is still a number
    BOOST_CHECK_EQUAL(EngineConfig::fromJson(R"({"isinTolerance": 0})").isinTolerance, 0.0);
    BOOST_CHECK(EngineConfig::fromJson("{}").useAccelerated);
}

BOOST_AUTO_TEST_CASE(FromJsonErrors)
{
    BOOST_CHECK_THROW(EngineConfig::fromJson("{"), UsageError);
    BOOST_CHECK_THROW(EngineConfig::fromJson("[]"), UsageError);
    BOOST_CHECK_THROW(EngineConfig::fromJson(R"({"useAccelerated": "yes"})"), UsageError);
    BOOST_CHECK_THROW(EngineConfig::fromJson(R"({"minAcceleratedLength": 1.5})"), UsageError);
    BOOST_CHECK_THROW(EngineConfig::fromJson(R"({"minAcceleratedLength": -1})"), UsageError);
    BOOST_CHECK_THROW(EngineConfig::fromJson(R"({"isinTolerance": -0.1})"), UsageError);
    BOOST_CHECK_THROW(EngineConfig::fromJson(R"({"backendLibrary": 7})"), UsageError);
}

BOOST_AUTO_TEST_CASE(Flags)
{
    for(auto text : { "", "0", "false", "FALSE", "Off", "no" })
        BOOST_CHECK_MESSAGE(!parseFlag(text), "'" << text << "' should be false");
    for(auto text : { "1", "true", "on", "yes", "anything" })
        BOOST_CHECK_MESSAGE(parseFlag(text), "'" << text << "' should be true");
}

BOOST_AUTO_TEST_CASE(FromEnvironment)
{
    EngineConfig base;
    base.minAcceleratedLength = 128;
    {
        ScopedEnvironment backend("TABULA_BACKEND", "/tmp/libother.so");
        ScopedEnvironment accelerated("TABULA_ACCELERATED", "off");
        ScopedEnvironment verbose("TABULA_VERBOSE", "1");

        auto config = EngineConfig::fromEnvironment(base);
        BOOST_CHECK_EQUAL(config.backendLibrary, "/tmp/libother.so");
        BOOST_CHECK(!config.useAccelerated);
        BOOST_CHECK(config.verbose);
        BOOST_CHECK_EQUAL(config.minAcceleratedLength, 128);
    }

    auto untouched = EngineConfig::fromEnvironment(base);
    BOOST_CHECK_EQUAL(untouched.backendLibrary, base.backendLibrary);
    BOOST_CHECK(untouched.useAccelerated);
}

BOOST_AUTO_TEST_CASE(VerbosityFollowsConfig)
{
    EngineConfig config;
    config.useAccelerated = false;
    config.verbose = true;
    ExecutionContext::fromConfig(config);
    BOOST_CHECK(Logger::instance().enabled.load());

    config.verbose = false;
    ExecutionContext::fromConfig(config);
    BOOST_CHECK(!Logger::instance().enabled.load());
}

BOOST_AUTO_TEST_SUITE_END()
