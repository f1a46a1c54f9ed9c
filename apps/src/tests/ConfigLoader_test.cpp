#include "core/ConfigLoader.h"
#include "dispatch/ConsumerConfig.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace Switchboard;

struct TestConfig {
    std::string key;
    std::string source;
    bool from_file = false;
};

void from_json(const nlohmann::json& j, TestConfig& c)
{
    if (j.contains("key")) {
        c.key = j["key"].get<std::string>();
    }
    if (j.contains("source")) {
        c.source = j["source"].get<std::string>();
    }
    if (j.contains("from_file")) {
        c.from_file = j["from_file"].get<bool>();
    }
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "switchboard_config_loader_test";
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
        unsetenv("SWITCHBOARD_CONFIG_DIR");
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::filesystem::path path = testDir_ / filename;
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, LoadReturnsErrorWhenFileNotFound)
{
    ConfigLoader::setConfigDir(testDir_.string());
    auto result = ConfigLoader::load<TestConfig>("nonexistent.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("not found") != std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadReturnsValueWhenFileExists)
{
    writeConfigFile("test.json", R"({"key": "value"})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("test.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().key, "value");
}

TEST_F(ConfigLoaderTest, LocalFileIsMergedOverBase)
{
    writeConfigFile("test.json", R"({"key": "base-key", "source": "base"})");
    writeConfigFile("test.json.local", R"({"source": "local"})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("test.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().source, "local");
    EXPECT_EQ(result.value().key, "base-key");
}

TEST_F(ConfigLoaderTest, LocalNullRemovesBaseKey)
{
    writeConfigFile("test.json", R"({"key": "base-key", "source": "base"})");
    writeConfigFile("test.json.local", R"({"key": null})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("test.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().key, "");
    EXPECT_EQ(result.value().source, "base");
}

TEST_F(ConfigLoaderTest, LocalFileAloneIsUsed)
{
    writeConfigFile("only.json.local", R"({"source": "local"})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("only.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().source, "local");
}

TEST_F(ConfigLoaderTest, FindConfigReportsBothFiles)
{
    writeConfigFile("test.json", "{}");
    writeConfigFile("test.json.local", "{}");
    ConfigLoader::setConfigDir(testDir_.string());

    auto source = ConfigLoader::findConfig("test.json");
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source->directory, testDir_);
    EXPECT_EQ(source->base, testDir_ / "test.json");
    EXPECT_EQ(source->local, testDir_ / "test.json.local");
}

TEST_F(ConfigLoaderTest, BrokenLocalFileIsAnError)
{
    writeConfigFile("test.json", R"({"source": "base"})");
    writeConfigFile("test.json.local", "{ nope");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("test.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("test.json.local"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EnvironmentDirectoryIsSearched)
{
    writeConfigFile("env.json", R"({"source": "env"})");
    setenv("SWITCHBOARD_CONFIG_DIR", testDir_.string().c_str(), 1);

    auto result = ConfigLoader::load<TestConfig>("env.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().source, "env");
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsError)
{
    writeConfigFile("bad.json", "not valid json {{{");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("bad.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("Parse error") != std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyFileReturnsError)
{
    writeConfigFile("empty.json", "");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TestConfig>("empty.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("Empty config file") != std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadOrFallsBackOnlyWhenMissing)
{
    ConfigLoader::setConfigDir(testDir_.string());
    TestConfig defaults;
    defaults.source = "defaults";

    auto missing = ConfigLoader::loadOr<TestConfig>("absent.json", defaults);
    ASSERT_TRUE(missing.isValue());
    EXPECT_EQ(missing.value().source, "defaults");

    writeConfigFile("broken.json", "{");
    EXPECT_TRUE(ConfigLoader::loadOr<TestConfig>("broken.json", defaults).isError());
}

TEST_F(ConfigLoaderTest, ConsumerConfigLoadsAndRejectsBadValues)
{
    writeConfigFile("chat.json", R"({"completionSignalsEnabled": true, "discriminatorField": "type"})");
    writeConfigFile("bad_chat.json", R"({"discriminatorField": ""})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ConsumerConfig>("chat.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_TRUE(result.value().completionSignalsEnabled);
    EXPECT_EQ(result.value().discriminatorField, "type");

    auto bad = ConfigLoader::load<ConsumerConfig>("bad_chat.json");
    ASSERT_TRUE(bad.isError());
    EXPECT_NE(bad.errorValue().find("discriminatorField"), std::string::npos);
}

TEST_F(ConfigLoaderTest, SearchPathsStartWithExplicitDirectory)
{
    ConfigLoader::setConfigDir(testDir_.string());
    auto paths = ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), testDir_);
}
