#include <gtest/gtest.h>

#include "scribe/options.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using scribe::config::OptionDefinition;
using scribe::config::OptionKind;
using scribe::config::OptionRegistry;
using scribe::config::OptionValue;

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("scribe_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "scribe_options_test.json";
}

void registerThreshold(OptionRegistry &registry)
{
    registry.registerOption({"threshold", OptionKind::Integer, OptionValue(std::int64_t{10}), "Threshold",
                             "Integer threshold", 1, 100});
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    OptionRegistry registry("test-app");
    OptionDefinition def{"featureEnabled", OptionKind::Boolean, OptionValue(true), "Feature Enabled",
                         "Enables a feature for testing."};
    registry.registerOption(def);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));
    EXPECT_FALSE(registry.isOverridden("featureEnabled"));

    registry.set("featureEnabled", OptionValue(false));
    EXPECT_TRUE(registry.isOverridden("featureEnabled"));
    EXPECT_FALSE(registry.getBool("featureEnabled"));

    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    OptionRegistry registry("test-app");
    registerThreshold(registry);
    registry.registerOption({"ignored", OptionKind::Boolean, OptionValue(false), "Ignored", "Boolean flag"});

    registry.set("threshold", OptionValue(std::string("42")));
    registry.set("ignored", OptionValue(std::string("yes")));

    EXPECT_EQ(registry.getInteger("threshold"), 42);
    EXPECT_TRUE(registry.getBool("ignored"));
    EXPECT_EQ(registry.get("threshold").kind(), OptionKind::Integer);
}

TEST(OptionRegistry, ClampsIntegersToBounds)
{
    OptionRegistry registry("test-app");
    registerThreshold(registry);

    registry.set("threshold", OptionValue(500));
    EXPECT_EQ(registry.getInteger("threshold"), 100);

    ASSERT_TRUE(registry.setFromString("threshold", "-3"));
    EXPECT_EQ(registry.getInteger("threshold"), 1);
}

TEST(OptionRegistry, RejectsUnknownKeysAndBadText)
{
    OptionRegistry registry("test-app");
    registerThreshold(registry);

    EXPECT_FALSE(registry.set("missing", OptionValue(true)));
    EXPECT_FALSE(registry.setFromString("threshold", "twelve"));
    EXPECT_EQ(registry.getInteger("threshold"), 10);
    EXPECT_TRUE(registry.get("missing").isNull());
    EXPECT_EQ(registry.definition("missing"), nullptr);
}

TEST(OptionRegistry, ListsOptionsSortedByKey)
{
    OptionRegistry registry("test-app");
    registry.registerOption({"zeta", OptionKind::String, OptionValue("z"), "Zeta", ""});
    registry.registerOption({"alpha", OptionKind::String, OptionValue("a"), "Alpha", ""});

    auto options = registry.listRegisteredOptions();
    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(options[0].key, "alpha");
    EXPECT_EQ(options[1].key, "zeta");
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    OptionRegistry registry("test-app");
    registry.registerOption({"paths", OptionKind::StringList, OptionValue(std::vector<std::string>{}), "Paths",
                             "List of paths"});

    std::vector<std::string> expected{"/tmp/a", "/tmp/b"};
    registry.set("paths", OptionValue(expected));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(registry.saveToFile(filePath));

    OptionRegistry loaded("test-app");
    loaded.registerOption({"paths", OptionKind::StringList, OptionValue(std::vector<std::string>{}), "Paths",
                           "List of paths"});
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getStringList("paths"), expected);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, IgnoresMalformedFiles)
{
    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ not json";
    }

    OptionRegistry registry("test-app");
    registerThreshold(registry);
    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("threshold"), 10);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, DefaultsLiveUnderConfigHome)
{
    const auto root = makeTempFilePath();
    ASSERT_EQ(setenv("XDG_CONFIG_HOME", root.c_str(), 1), 0);

    OptionRegistry registry("test-app");
    registerThreshold(registry);
    EXPECT_EQ(registry.defaultOptionsPath(), root / "scribe" / "test-app" / "defaults.json");
    EXPECT_FALSE(registry.loadDefaults());

    registry.set("threshold", OptionValue(7));
    ASSERT_TRUE(registry.saveDefaults());

    OptionRegistry reloaded("test-app");
    registerThreshold(reloaded);
    ASSERT_TRUE(reloaded.loadDefaults());
    EXPECT_EQ(reloaded.getInteger("threshold"), 7);

    EXPECT_TRUE(reloaded.clearDefaults());
    EXPECT_FALSE(std::filesystem::exists(reloaded.defaultOptionsPath()));

    unsetenv("XDG_CONFIG_HOME");
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}
