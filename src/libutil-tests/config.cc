#include "pipetoml/util/configuration.hh"
#include "pipetoml/util/logging.hh"
#include "pipetoml/util/terminal.hh"

#include <gtest/gtest.h>

namespace pipetoml {

struct TestSettings : Config
{
    Setting<bool> strict{this, false, "strict", "whether to be strict"};
    Setting<unsigned int> depth{this, 10, "depth", "how deep to go"};
    Setting<int> precision{this, 17, "precision", "how many digits"};
};

/* ----------------------------------------------------------------------------
 * Config::set
 * --------------------------------------------------------------------------*/

TEST(Config, setKnownSetting)
{
    TestSettings settings;

    ASSERT_TRUE(settings.set("depth", "3"));
    ASSERT_EQ(settings.depth.get(), 3u);
    ASSERT_TRUE(settings.depth.overridden);
    ASSERT_FALSE(settings.strict.overridden);
}

TEST(Config, setUnknownSetting)
{
    TestSettings settings;

    ASSERT_FALSE(settings.set("colour", "always"));
    ASSERT_FALSE(settings.setKnown("colour", "always"));
}

TEST(Config, booleanValues)
{
    TestSettings settings;

    settings.set("strict", "true");
    ASSERT_TRUE(settings.strict);
    settings.set("strict", "no");
    ASSERT_FALSE(settings.strict);
    settings.set("strict", "1");
    ASSERT_TRUE(settings.strict);
}

TEST(Config, invalidBoolean)
{
    TestSettings settings;

    ASSERT_THROW(settings.set("strict", "maybe"), UsageError);
}

TEST(Config, invalidInteger)
{
    TestSettings settings;

    ASSERT_THROW(settings.set("depth", "ten"), UsageError);
    ASSERT_THROW(settings.set("depth", "-1"), UsageError);
    ASSERT_EQ(settings.depth.get(), 10u);
}

TEST(Config, negativeSignedInteger)
{
    TestSettings settings;

    settings.set("precision", " -3 ");
    ASSERT_EQ(settings.precision.get(), -3);
}

TEST(Config, unknownSettingIsAppliedWhenAdded)
{
    Config config;
    ASSERT_FALSE(config.set("late", "42"));

    Setting<unsigned int> late{&config, 0, "late", "added after being set"};
    ASSERT_EQ(late.get(), 42u);
    ASSERT_TRUE(late.overridden);
}

/* ----------------------------------------------------------------------------
 * Config::applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigEmpty)
{
    TestSettings settings;

    settings.applyConfig("", "test");
    ASSERT_FALSE(settings.strict.overridden);
}

TEST(Config, applyConfigSetsEachLine)
{
    TestSettings settings;

    settings.applyConfig(
        "# comment\n"
        "strict = true\n"
        "\n"
        "  depth=4   # trailing comment\r\n",
        "test");

    ASSERT_TRUE(settings.strict);
    ASSERT_EQ(settings.depth.get(), 4u);
}

TEST(Config, applyConfigWithoutEquals)
{
    TestSettings settings;

    try {
        settings.applyConfig("strict = true\nstrict\n", "PIPETOML_CONFIG");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_EQ(filterANSIEscapes(e.message()), "PIPETOML_CONFIG:2: expected 'name = value'");
    }
}

TEST(Config, applyConfigWithoutName)
{
    TestSettings settings;

    ASSERT_THROW(settings.applyConfig(" = 1\n", "test"), UsageError);
}

TEST(Config, warnUnknownSettings)
{
    TestSettings settings;
    settings.applyConfig("colour = always\n", "test");

    testing::internal::CaptureStderr();
    settings.warnUnknownSettings();
    auto err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(filterANSIEscapes(err), "warning: unknown setting 'colour'\n");
}

/* ----------------------------------------------------------------------------
 * GlobalConfig
 * --------------------------------------------------------------------------*/

TEST(GlobalConfig, dispatchesToRegisteredConfigs)
{
    static TestSettings registered;
    static GlobalConfig::Register r(&registered);

    ASSERT_TRUE(globalConfig.set("precision", "9"));
    ASSERT_EQ(registered.precision.get(), 9);
    ASSERT_FALSE(globalConfig.set("no-such-setting", "1"));
}

} // namespace pipetoml
