#include <gtest/gtest.h>
#include "core/engine_config.hpp"
#include "fixtures/test_fixtures.hpp"
#include <filesystem>

using namespace clinscribe::core;

class ConfigTest : public ::testing::Test {
protected:
    EngineConfigManager manager;
};

TEST_F(ConfigTest, DefaultValues) {
    EXPECT_TRUE(manager.loadFromFile("nonexistent.json"));

    auto config = manager.getConfig();
    EXPECT_FLOAT_EQ(config.fusion.specializationBoost, 1.2f);
    EXPECT_FLOAT_EQ(config.fusion.domainTermBonus, 0.05f);
    EXPECT_FLOAT_EQ(config.fusion.maxWeight, 1.0f);
    EXPECT_EQ(config.fusion.votingStrategy, VotingStrategy::POSITIONAL);
    EXPECT_EQ(config.fusion.providerTimeoutMs, 5000);
    EXPECT_EQ(config.extraction.windowTokens, 10);
    EXPECT_FLOAT_EQ(config.deduplication.similarityThreshold, 0.85f);
    EXPECT_EQ(config.notes.defaultNoteType, "SOAP");
    EXPECT_EQ(config.notes.placeholder, "Not assessed.");
    EXPECT_EQ(config.logging.level, "INFO");
    EXPECT_EQ(manager.getConfigFilePath(), "nonexistent.json");
}

TEST_F(ConfigTest, DefaultsAreValid) {
    auto result = manager.validateConfig(EngineConfig());
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.hasErrors());
}

TEST_F(ConfigTest, LoadsSections) {
    ASSERT_TRUE(manager.loadFromJson(R"({
        "fusion": {"specializationBoost": 1.5, "votingStrategy": "aligned", "providerTimeoutMs": 250},
        "extraction": {"windowTokens": 6, "applyRiskRules": false},
        "deduplication": {"enabled": false, "similarityThreshold": 0.9},
        "notes": {"defaultNoteType": "ED_NOTE", "placeholder": "Not documented."},
        "logging": {"level": "DEBUG"}
    })"));

    auto config = manager.getConfig();
    EXPECT_FLOAT_EQ(config.fusion.specializationBoost, 1.5f);
    EXPECT_EQ(config.fusion.votingStrategy, VotingStrategy::ALIGNED);
    EXPECT_EQ(config.fusion.providerTimeoutMs, 250);
    EXPECT_EQ(config.extraction.windowTokens, 6);
    EXPECT_FALSE(config.extraction.applyRiskRules);
    EXPECT_FALSE(config.deduplication.enabled);
    EXPECT_FLOAT_EQ(config.deduplication.similarityThreshold, 0.9f);
    EXPECT_EQ(config.notes.defaultNoteType, "ED_NOTE");
    EXPECT_EQ(config.notes.placeholder, "Not documented.");
    EXPECT_EQ(config.logging.level, "DEBUG");
    // Keys that were not given keep their defaults
    EXPECT_FLOAT_EQ(config.fusion.maxWeight, 1.0f);
}

TEST_F(ConfigTest, InvalidJsonLeavesConfigUnchanged) {
    ASSERT_TRUE(manager.loadFromJson(R"({"fusion": {"providerTimeoutMs": 1234}})"));

    EXPECT_FALSE(manager.loadFromJson("{ not json"));
    EXPECT_FALSE(manager.loadFromJson("[1, 2]"));
    EXPECT_FALSE(manager.loadFromJson(R"({"fusion": {"votingStrategy": "random"}})"));
    EXPECT_FALSE(manager.loadFromJson(R"({"deduplication": {"similarityThreshold": 1.5}})"));

    EXPECT_EQ(manager.getConfig().fusion.providerTimeoutMs, 1234);
}

TEST_F(ConfigTest, OutOfRangeNumbersAreRejected) {
    ASSERT_TRUE(manager.loadFromJson(R"({"fusion": {"workerThreads": 8}})"));

    EXPECT_FALSE(manager.loadFromJson(R"({"fusion": {"workerThreads": 1e20}})"));
    EXPECT_FALSE(manager.loadFromJson(R"({"fusion": {"providerTimeoutMs": -1e20}})"));
    EXPECT_FALSE(manager.loadFromJson(R"({"extraction": {"windowTokens": 4294967296}})"));
    EXPECT_FALSE(manager.loadFromJson(R"({"deduplication": {"similarityThreshold": 1e300}})"));

    EXPECT_EQ(manager.getConfig().fusion.workerThreads, 8);
}

TEST_F(ConfigTest, ValidationRules) {
    EngineConfig config;
    config.fusion.specializationBoost = 0.5f;
    config.fusion.providerTimeoutMs = 0;
    config.extraction.windowTokens = 0;
    config.notes.defaultNoteType = "LETTER";
    config.notes.placeholder = "  ";

    auto result = manager.validateConfig(config);
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 5u);
}

TEST_F(ConfigTest, ValidationWarnings) {
    EngineConfig config;
    config.fusion.specializationBoost = 3.0f;
    config.logging.level = "chatty";
    config.deduplication.enabled = true;
    config.deduplication.embeddingsPath.clear();

    auto result = manager.validateConfig(config);
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.warnings.size(), 3u);
}

TEST_F(ConfigTest, NoteTypeIsCaseInsensitive) {
    EngineConfig config;
    config.notes.defaultNoteType = "handoff";
    EXPECT_TRUE(manager.validateConfig(config).isValid);
}

TEST_F(ConfigTest, UpdateConfigValue) {
    std::vector<ConfigChangeNotification> changes;
    manager.registerChangeCallback([&](const ConfigChangeNotification& change) {
        changes.push_back(change);
    });

    auto result = manager.updateConfigValue("fusion", "providerTimeoutMs", "2500");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(manager.getConfig().fusion.providerTimeoutMs, 2500);
    EXPECT_TRUE(manager.isModified());

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].section, "fusion");
    EXPECT_EQ(changes[0].key, "providerTimeoutMs");
    EXPECT_EQ(changes[0].oldValue, "5000");
    EXPECT_EQ(changes[0].newValue, "2500");
}

TEST_F(ConfigTest, RejectedUpdateRollsBack) {
    EXPECT_FALSE(manager.updateConfigValue("fusion", "providerTimeoutMs", "-5").isValid);
    EXPECT_FALSE(manager.updateConfigValue("fusion", "providerTimeoutMs", "12abc").isValid);
    EXPECT_FALSE(manager.updateConfigValue("fusion", "noSuchKey", "1").isValid);
    EXPECT_FALSE(manager.updateConfigValue("deduplication", "enabled", "maybe").isValid);

    EXPECT_EQ(manager.getConfig().fusion.providerTimeoutMs, 5000);
    EXPECT_TRUE(manager.getConfig().deduplication.enabled);
}

TEST_F(ConfigTest, SaveAndReload) {
    ASSERT_TRUE(manager.updateConfigValue("notes", "defaultNoteType", "CONSULT").isValid);
    ASSERT_TRUE(manager.updateConfigValue("fusion", "votingStrategy", "aligned").isValid);

    std::string path = fixtures::writeTempFile("config.json", "");
    ASSERT_TRUE(manager.saveToFile(path));

    EngineConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    EXPECT_EQ(reloaded.getConfig().notes.defaultNoteType, "CONSULT");
    EXPECT_EQ(reloaded.getConfig().fusion.votingStrategy, VotingStrategy::ALIGNED);
    EXPECT_FALSE(reloaded.isModified());

    std::filesystem::remove(path);
}

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    std::string path = fixtures::writeTempFile("empty.json", "   \n");
    EXPECT_TRUE(manager.loadFromFile(path));
    EXPECT_EQ(manager.getConfig().fusion.providerTimeoutMs, 5000);
    std::filesystem::remove(path);
}

TEST_F(ConfigTest, ResetToDefaults) {
    ASSERT_TRUE(manager.updateConfigValue("extraction", "windowTokens", "4").isValid);
    manager.resetToDefaults();
    EXPECT_EQ(manager.getConfig().extraction.windowTokens, 10);
}

TEST_F(ConfigTest, VotingStrategyNames) {
    VotingStrategy strategy = VotingStrategy::POSITIONAL;
    EXPECT_TRUE(parseVotingStrategy("Aligned", strategy));
    EXPECT_EQ(strategy, VotingStrategy::ALIGNED);
    EXPECT_FALSE(parseVotingStrategy("rover", strategy));
    EXPECT_EQ(votingStrategyToString(VotingStrategy::POSITIONAL), "positional");
}
