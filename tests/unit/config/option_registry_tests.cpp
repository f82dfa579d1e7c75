#include <gtest/gtest.h>

#include "disksight/options.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace config = disksight::config;

namespace
{

std::filesystem::path makeTempPath(const std::string &suffix)
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("disksight_options_test_" + std::to_string(dist(rng)) + suffix);
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / ("disksight_options_test" + suffix);
}

struct EnvGuard
{
    std::string name;
    std::string previous;
    bool hadValue = false;

    EnvGuard(std::string variable, const char *value)
        : name(std::move(variable))
    {
        if (const char *existing = std::getenv(name.c_str()))
        {
            hadValue = true;
            previous = existing;
        }
        if (value)
            ::setenv(name.c_str(), value, 1);
        else
            ::unsetenv(name.c_str());
    }

    ~EnvGuard()
    {
        if (hadValue)
            ::setenv(name.c_str(), previous.c_str(), 1);
        else
            ::unsetenv(name.c_str());
    }
};

void registerSample(config::OptionRegistry &registry)
{
    registry.registerOption({"featureEnabled", config::OptionKind::Boolean, config::OptionValue(true),
                             "Feature Enabled", "Enables a feature for testing."});
    registry.registerOption({"threshold", config::OptionKind::Integer, config::OptionValue(std::int64_t{10}),
                             "Threshold", "Integer threshold"});
    registry.registerOption({"label", config::OptionKind::String, config::OptionValue(std::string("none")),
                             "Label", "String value"});
    registry.registerOption({"paths", config::OptionKind::StringList,
                             config::OptionValue(std::vector<std::string>{}), "Paths", "List of paths"});
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));
    EXPECT_EQ(registry.getInteger("threshold"), 10);
    EXPECT_FALSE(registry.isOverridden("threshold"));

    registry.set("featureEnabled", config::OptionValue(false));
    EXPECT_TRUE(registry.isOverridden("featureEnabled"));
    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    config::OptionRegistry registry("test-app");
    registerSample(registry);

    registry.set("threshold", config::OptionValue(std::string("42")));
    registry.set("featureEnabled", config::OptionValue(std::string("no")));
    registry.set("unknown", config::OptionValue(true));

    EXPECT_EQ(registry.get("threshold").type(), config::OptionValueType::Integer);
    EXPECT_EQ(registry.getInteger("threshold"), 42);
    EXPECT_FALSE(registry.getBool("featureEnabled"));
    EXPECT_TRUE(registry.get("unknown").isNull());
}

TEST(OptionRegistry, SetFromTextRejectsMalformedValues)
{
    config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_TRUE(registry.setFromText("threshold", " 7 "));
    EXPECT_EQ(registry.getInteger("threshold"), 7);
    EXPECT_FALSE(registry.setFromText("threshold", "seven"));
    EXPECT_EQ(registry.getInteger("threshold"), 7);
    EXPECT_FALSE(registry.setFromText("featureEnabled", "maybe"));
    EXPECT_FALSE(registry.setFromText("missing", "1"));

    EXPECT_TRUE(registry.setFromText("paths", "/a; /b ,/c"));
    EXPECT_EQ(registry.getStringList("paths"), (std::vector<std::string>{"/a", "/b", "/c"}));
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    config::OptionRegistry registry("test-app");
    registerSample(registry);

    std::vector<std::string> expected{"/tmp/a", "/tmp/b"};
    registry.set("paths", config::OptionValue(expected));
    registry.set("threshold", config::OptionValue(std::int64_t{3}));

    const auto filePath = makeTempPath(".json");
    ASSERT_TRUE(registry.saveToFile(filePath));

    config::OptionRegistry loaded("test-app");
    registerSample(loaded);
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getStringList("paths"), expected);
    EXPECT_EQ(loaded.getInteger("threshold"), 3);
    EXPECT_EQ(loaded.getString("label"), "none");

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, ReportsMalformedFiles)
{
    const auto filePath = makeTempPath(".json");
    {
        std::ofstream out(filePath);
        out << "{ \"threshold\": ";
    }

    config::OptionRegistry registry("test-app");
    registerSample(registry);
    std::string error;
    EXPECT_FALSE(registry.loadFromFile(filePath, &error));
    EXPECT_NE(error.find("malformed"), std::string::npos);

    {
        std::ofstream out(filePath);
        out << "{ \"threshold\": [1, 2] }";
    }
    EXPECT_FALSE(registry.loadFromFile(filePath, &error));
    EXPECT_NE(error.find("threshold"), std::string::npos);

    EXPECT_FALSE(registry.loadFromFile(makeTempPath(".missing"), &error));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, StoresDefaultsUnderConfigRoot)
{
    const auto root = makeTempPath("_xdg");
    EnvGuard xdg("XDG_CONFIG_HOME", root.c_str());

    EXPECT_EQ(config::OptionRegistry::configRoot().string(), (root / "disksight").string());

    config::OptionRegistry registry("sample");
    registerSample(registry);
    EXPECT_EQ(registry.defaultOptionsPath().string(), (root / "disksight" / "sample" / "defaults.json").string());
    EXPECT_FALSE(registry.loadDefaults());

    registry.set("label", config::OptionValue(std::string("saved")));
    ASSERT_TRUE(registry.saveDefaults());
    EXPECT_EQ(config::OptionRegistry::availableProfiles(), std::vector<std::string>{"sample"});

    config::OptionRegistry reloaded("sample");
    registerSample(reloaded);
    ASSERT_TRUE(reloaded.loadDefaults());
    EXPECT_EQ(reloaded.getString("label"), "saved");

    EXPECT_TRUE(reloaded.clearDefaults());
    EXPECT_TRUE(config::OptionRegistry::availableProfiles().empty());

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST(OptionRegistry, AppliesEnvironmentOverrides)
{
    EXPECT_EQ(config::environmentVariableName("threshold"), "DISKSIGHT_THRESHOLD");
    EXPECT_EQ(config::environmentVariableName("featureEnabled"), "DISKSIGHT_FEATURE_ENABLED");

    EnvGuard threshold("DISKSIGHT_THRESHOLD", "99");
    EnvGuard feature("DISKSIGHT_FEATURE_ENABLED", "not-a-bool");
    EnvGuard label("DISKSIGHT_LABEL", nullptr);

    config::OptionRegistry registry("test-app");
    registerSample(registry);
    auto applied = registry.applyEnvironment();

    EXPECT_EQ(applied, std::vector<std::string>{"threshold"});
    EXPECT_EQ(registry.getInteger("threshold"), 99);
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, DescribesValuesForDisplay)
{
    config::OptionRegistry registry("test-app");
    registerSample(registry);

    const auto *paths = registry.definition("paths");
    ASSERT_NE(paths, nullptr);
    EXPECT_EQ(config::describeValue(*paths, config::OptionValue(std::vector<std::string>{"a", "b"})), "[a, b]");

    const auto *label = registry.definition("label");
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(config::describeValue(*label, config::OptionValue(std::string())), "\"\"");

    auto keys = registry.listRegisteredOptions();
    ASSERT_EQ(keys.size(), 4u);
    EXPECT_EQ(keys.front().key, "featureEnabled");
    EXPECT_EQ(keys.back().key, "threshold");
}
