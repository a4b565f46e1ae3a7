// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptspan/config.hpp"
#include "promptspan/engine_config.hpp"
#include "promptspan/error.hpp"

#include <filesystem>
#include <fstream>

using namespace promptspan;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::getInstance().clear(); }
    void TearDown() override { Config::getInstance().clear(); }

    Config& config() { return Config::getInstance(); }
};

// =============================================================================
// Typed accessors
// =============================================================================

TEST_F(EngineConfigTest, TypedGet) {
    config().set("a.int", "42");
    config().set("a.bool", "Yes");
    config().set("a.off", "off");
    config().set("a.double", "nope");

    EXPECT_EQ(config().get<int>("a.int"), 42);
    EXPECT_TRUE(config().get<bool>("a.bool"));
    EXPECT_FALSE(config().get<bool>("a.off", true));
    EXPECT_DOUBLE_EQ(config().get<double>("a.double", 2.5), 2.5);
    EXPECT_EQ(config().get<std::string>("a.missing", "fallback"), "fallback");
    EXPECT_TRUE(config().has("a.int"));
    EXPECT_FALSE(config().has("a.missing"));
}

TEST_F(EngineConfigTest, LoadsKeyValueFile) {
    auto path = std::filesystem::temp_directory_path() / "promptspan_config_test.conf";
    {
        std::ofstream out(path);
        out << "# engine settings\n"
            << "merge.strategy = confidence\n"
            << "this line is ignored\n"
            << "; so is this\n"
            << "ner.threshold=0.45\n";
    }
    EXPECT_TRUE(config().load(path.string()));
    EXPECT_EQ(config().get<std::string>("merge.strategy"), "confidence");
    EXPECT_DOUBLE_EQ(config().get<double>("ner.threshold"), 0.45);
    // Keys absent from the file keep their defaults.
    EXPECT_EQ(config().get<std::string>("ner.timeout_ms"), "1500");
    std::filesystem::remove(path);
}

TEST_F(EngineConfigTest, LoadRejectsUnknownStrategy) {
    auto path = std::filesystem::temp_directory_path() / "promptspan_config_bad.conf";
    {
        std::ofstream out(path);
        out << "merge.strategy=shortest\n";
    }
    EXPECT_FALSE(config().load(path.string()));
    std::filesystem::remove(path);
}

// =============================================================================
// EngineConfig
// =============================================================================

TEST_F(EngineConfigTest, DefaultsWhenUnset) {
    auto ec = EngineConfig::from(config());
    EXPECT_EQ(ec.vocab_path, "data/vocab.json");
    EXPECT_TRUE(ec.taxonomy_path.empty());
    EXPECT_TRUE(ec.patterns_enabled);
    EXPECT_TRUE(ec.action_enabled);
    EXPECT_TRUE(ec.lighting_enabled);
    EXPECT_DOUBLE_EQ(ec.action.min_confidence, 0.75);
    EXPECT_DOUBLE_EQ(ec.lighting.min_confidence, 0.70);
    EXPECT_EQ(ec.embedding_dimensions, 256u);

    EXPECT_FALSE(ec.open_vocab.enabled);
    EXPECT_DOUBLE_EQ(ec.open_vocab.threshold, 0.3);
    EXPECT_EQ(ec.open_vocab.timeout_ms, 1500);
    EXPECT_EQ(ec.open_vocab.max_width, 12);
    EXPECT_TRUE(ec.open_vocab.label_thresholds.empty());

    EXPECT_TRUE(ec.merge.prefer_source_priority);
    EXPECT_EQ(ec.merge.strategy, MergeStrategy::Longest);
    EXPECT_DOUBLE_EQ(ec.fast_path.min_coverage_percent, 30.0);
    EXPECT_EQ(ec.fast_path.min_spans, 3u);
}

TEST_F(EngineConfigTest, ReadsOverrides) {
    config().set("patterns.enabled", "off");
    config().set("merge.strategy", "confidence");
    config().set("merge.prefer_source_priority", "false");
    config().set("ner.enabled", "true");
    config().set("ner.worker", "/opt/promptspan/ner-worker");
    config().set("ner.timeout_ms", "250");
    config().set("ner.label_thresholds", "Person=0.5, lighting.timeOfDay=0.4");
    config().set("fast_path.min_spans", "5");

    auto ec = EngineConfig::from(config());
    EXPECT_FALSE(ec.patterns_enabled);
    EXPECT_EQ(ec.merge.strategy, MergeStrategy::Confidence);
    EXPECT_FALSE(ec.merge.prefer_source_priority);
    EXPECT_TRUE(ec.open_vocab.enabled);
    EXPECT_EQ(ec.open_vocab.worker_path, "/opt/promptspan/ner-worker");
    EXPECT_EQ(ec.open_vocab.timeout_ms, 250);
    ASSERT_EQ(ec.open_vocab.label_thresholds.size(), 2u);
    EXPECT_DOUBLE_EQ(ec.open_vocab.label_thresholds.at("person"), 0.5);
    EXPECT_DOUBLE_EQ(ec.open_vocab.label_thresholds.at("lighting.timeOfDay"), 0.4);
    EXPECT_EQ(ec.fast_path.min_spans, 5u);
}

TEST_F(EngineConfigTest, RejectsInvalidValues) {
    auto expect_invalid = [this](const std::string& key, const std::string& value) {
        config().clear();
        config().set(key, value);
        try {
            EngineConfig::from(config());
            ADD_FAILURE() << key << "=" << value << " was accepted";
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
        }
    };

    expect_invalid("merge.strategy", "shortest");
    expect_invalid("ner.threshold", "1.5");
    expect_invalid("ner.timeout_ms", "-1");
    expect_invalid("ner.timeout_ms", "0");
    expect_invalid("action.max_phrase_words", "0");
    expect_invalid("lighting.min_confidence", "-0.1");
    expect_invalid("fast_path.min_coverage_percent", "120");
    expect_invalid("fast_path.sparse_high_confidence", "2");
    expect_invalid("ner.label_thresholds", "person");
}

TEST_F(EngineConfigTest, UnparseableNumberFallsBackToDefault) {
    config().set("lighting.min_confidence", "bright");
    auto ec = EngineConfig::from(config());
    EXPECT_DOUBLE_EQ(ec.lighting.min_confidence, 0.70);
}

// =============================================================================
// Build version
// =============================================================================

TEST(VersionTest, StringMatchesComponents) {
    std::string expected = std::to_string(PROMPTSPAN_VERSION_MAJOR) + "." +
                           std::to_string(PROMPTSPAN_VERSION_MINOR) + "." +
                           std::to_string(PROMPTSPAN_VERSION_PATCH);
    EXPECT_EQ(std::string(PROMPTSPAN_VERSION_STRING), expected);
    EXPECT_EQ(std::string(PROMPTSPAN_VERSION_STRING), "0.1.0");
}

// =============================================================================
// Label thresholds
// =============================================================================

TEST(LabelThresholdsTest, Parse) {
    auto parsed = EngineConfig::parse_label_thresholds(" Person = 0.5 ,, camera.lens=0.4, ");
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_DOUBLE_EQ(parsed.at("person"), 0.5);
    EXPECT_DOUBLE_EQ(parsed.at("camera.lens"), 0.4);

    EXPECT_TRUE(EngineConfig::parse_label_thresholds("").empty());

    // Dotted ids keep their case.
    auto ids = EngineConfig::parse_label_thresholds("lighting.timeOfDay=1");
    EXPECT_EQ(ids.count("lighting.timeOfDay"), 1u);
}

TEST(LabelThresholdsTest, Errors) {
    EXPECT_THROW(EngineConfig::parse_label_thresholds("person"), ConfigError);
    EXPECT_THROW(EngineConfig::parse_label_thresholds("person=high"), ConfigError);
    EXPECT_THROW(EngineConfig::parse_label_thresholds("person=0.5x"), ConfigError);
    EXPECT_THROW(EngineConfig::parse_label_thresholds("person=1.5"), ConfigError);
    EXPECT_THROW(EngineConfig::parse_label_thresholds("=0.5"), ConfigError);
}
