// =============================================================================
// Open-Vocabulary Extractor Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptspan/error.hpp"
#include "promptspan/open_vocab_extractor.hpp"
#include "promptspan/taxonomy.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace promptspan;

namespace {

const char* kScene = "A cowboy rides a horse through the rain past the saloon in the desert with a gizmo";

OpenVocabConfig worker_config(std::vector<std::string> args) {
    OpenVocabConfig config;
    config.enabled = true;
    config.worker_path = PROMPTSPAN_SCRIPTED_WORKER_PATH;
    config.worker_args = std::move(args);
    config.threshold = 0.3;
    config.timeout_ms = 2000;
    return config;
}

const CandidateSpan* find_text(const std::vector<CandidateSpan>& spans, const std::string& text) {
    auto it = std::find_if(spans.begin(), spans.end(),
                           [&](const CandidateSpan& s) { return s.text == text; });
    return it == spans.end() ? nullptr : &*it;
}

} // namespace

class OpenVocabTest : public ::testing::Test {
protected:
    Taxonomy taxonomy = Taxonomy::builtin();
};

// =============================================================================
// Calibration and label mapping
// =============================================================================

TEST_F(OpenVocabTest, CalibrationBounds) {
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(0.3, 0.3), 0.5);
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(1.0, 0.3), 1.0);
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(0.66, 0.3), 0.76);
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(0.1, 0.3), 0.5);
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(1.7, 0.3), 1.0);
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(-2.0, 0.3), 0.5);
    // The threshold is capped at 0.99 so the scale never divides by zero.
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(1.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(OpenVocabExtractor::calibrate(0.995, 1.0), 0.75);

    for (double s = 0.0; s <= 1.0; s += 0.05) {
        double c = OpenVocabExtractor::calibrate(s, 0.3);
        EXPECT_GE(c, 0.5);
        EXPECT_LE(c, 1.0);
    }
}

TEST_F(OpenVocabTest, LabelMapping) {
    OpenVocabExtractor extractor(taxonomy, OpenVocabConfig{});
    EXPECT_EQ(extractor.map_label("Person "), "subject.identity");
    EXPECT_EQ(extractor.map_label("time of day"), "lighting.timeOfDay");
    EXPECT_EQ(extractor.map_label("building"), "environment.location");
    EXPECT_EQ(extractor.map_label("fps"), "technical.frameRate");
    // Humanized attribute keys map too.
    EXPECT_EQ(extractor.map_label("color temp"), "lighting.colorTemp");
    EXPECT_EQ(extractor.map_label("framing"), "shot.type");
    EXPECT_FALSE(extractor.map_label("widget").has_value());

    const auto& labels = extractor.labels();
    EXPECT_NE(std::find(labels.begin(), labels.end(), "camera"), labels.end());
    EXPECT_NE(std::find(labels.begin(), labels.end(), "person"), labels.end());
    auto sorted = labels;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
}

TEST_F(OpenVocabTest, MappingsToUnknownIdsAreDropped) {
    auto lighting_only = Taxonomy::from_json(R"({
        "categories": [{"id": "lighting", "label": "Lighting",
                        "attributes": {"TIME": "lighting.timeOfDay"}}]
    })");
    OpenVocabExtractor extractor(lighting_only, OpenVocabConfig{});
    EXPECT_FALSE(extractor.map_label("person").has_value());
    EXPECT_EQ(extractor.map_label("time of day"), "lighting.timeOfDay");

    OpenVocabExtractor full(taxonomy, OpenVocabConfig{});
    EXPECT_LT(extractor.mapped_label_count(), full.mapped_label_count());
}

TEST_F(OpenVocabTest, PerLabelThresholds) {
    OpenVocabConfig config;
    config.threshold = 0.3;
    config.label_thresholds = {{"person", 0.5}, {"subject.identity", 0.6}, {"animal", 1.0}};
    OpenVocabExtractor extractor(taxonomy, config);

    EXPECT_DOUBLE_EQ(extractor.threshold_for("Person", "subject.identity"), 0.5);
    EXPECT_DOUBLE_EQ(extractor.threshold_for("character", "subject.identity"), 0.6);
    EXPECT_DOUBLE_EQ(extractor.threshold_for("animal", "subject.identity"), 0.99);
    EXPECT_DOUBLE_EQ(extractor.threshold_for("weather", "environment.weather"), 0.3);
}

// =============================================================================
// Disabled and unconfigured
// =============================================================================

TEST_F(OpenVocabTest, DisabledTierDoesNothing) {
    OpenVocabExtractor extractor(taxonomy, OpenVocabConfig{});
    EXPECT_TRUE(extractor.extract(kScene).empty());
    EXPECT_FALSE(extractor.ensure_initialized());
    EXPECT_FALSE(extractor.is_ready());

    auto warm = extractor.warmup();
    EXPECT_FALSE(warm.success);
    EXPECT_EQ(warm.message, "open-vocabulary tier is disabled");
}

TEST_F(OpenVocabTest, MissingWorkerPathFailsInitialization) {
    OpenVocabConfig config;
    config.enabled = true;
    OpenVocabExtractor extractor(taxonomy, config);
    EXPECT_TRUE(extractor.extract(kScene).empty());
    EXPECT_FALSE(extractor.is_ready());
}

// =============================================================================
// Against the scripted worker
// =============================================================================

TEST_F(OpenVocabTest, ExtractsMappedDetectionsAboveThreshold) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"normal"}));
    auto spans = extractor.extract(kScene);

    ASSERT_EQ(spans.size(), 4u);
    const auto* cowboy = find_text(spans, "cowboy");
    ASSERT_NE(cowboy, nullptr);
    EXPECT_EQ(cowboy->role, "subject.identity");
    EXPECT_DOUBLE_EQ(cowboy->confidence, 0.94);
    EXPECT_EQ(cowboy->start, 2u);
    EXPECT_EQ(cowboy->source, SpanSource::OpenVocab);

    const auto* rain = find_text(spans, "rain");
    ASSERT_NE(rain, nullptr);
    EXPECT_EQ(rain->role, "environment.weather");
    EXPECT_DOUBLE_EQ(rain->confidence, 0.76);

    const auto* saloon = find_text(spans, "saloon");
    ASSERT_NE(saloon, nullptr);
    EXPECT_EQ(saloon->role, "environment.location");

    // Below threshold, and an unmapped label.
    EXPECT_EQ(find_text(spans, "desert"), nullptr);
    EXPECT_EQ(find_text(spans, "gizmo"), nullptr);
    EXPECT_TRUE(extractor.is_ready());
}

TEST_F(OpenVocabTest, LabelThresholdExcludesDetection) {
    auto config = worker_config({"normal"});
    config.label_thresholds = {{"animal", 0.9}, {"environment.weather", 0.7}};
    OpenVocabExtractor extractor(taxonomy, config);

    auto spans = extractor.extract(kScene);
    EXPECT_EQ(find_text(spans, "horse"), nullptr);
    EXPECT_EQ(find_text(spans, "rain"), nullptr);
    EXPECT_NE(find_text(spans, "cowboy"), nullptr);
    EXPECT_NE(find_text(spans, "saloon"), nullptr);
}

TEST_F(OpenVocabTest, TimeoutYieldsNoSpansAndKeepsWorker) {
    auto config = worker_config({"slow", "--delay-ms", "1000"});
    config.timeout_ms = 1;
    OpenVocabExtractor extractor(taxonomy, config);

    EXPECT_TRUE(extractor.extract(kScene).empty());
    EXPECT_TRUE(extractor.is_ready());
}

TEST_F(OpenVocabTest, RejectsUnboundedTimeout) {
    auto config = worker_config({"normal"});
    config.timeout_ms = 0;
    EXPECT_THROW(OpenVocabExtractor(taxonomy, config), InvalidArgumentError);
}

TEST_F(OpenVocabTest, CrashedWorkerIsReplacedOnNextCall) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"crash"}));

    EXPECT_TRUE(extractor.extract(kScene).empty());
    EXPECT_FALSE(extractor.is_ready());

    EXPECT_TRUE(extractor.ensure_initialized());
    EXPECT_TRUE(extractor.is_ready());
}

TEST_F(OpenVocabTest, FailedInitializationIsStickyUntilReset) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"fail-init"}));

    EXPECT_TRUE(extractor.extract(kScene).empty());
    EXPECT_FALSE(extractor.ensure_initialized());
    EXPECT_FALSE(extractor.is_ready());

    auto warm = extractor.warmup();
    EXPECT_FALSE(warm.success);
    EXPECT_EQ(warm.message, "open-vocabulary worker initialization failed");

    extractor.reset();
    EXPECT_FALSE(extractor.is_ready());
    EXPECT_FALSE(extractor.ensure_initialized());
}

TEST_F(OpenVocabTest, ResetStopsAHealthyWorker) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"normal"}));
    ASSERT_TRUE(extractor.ensure_initialized());

    extractor.reset();
    EXPECT_FALSE(extractor.is_ready());
    EXPECT_EQ(extractor.extract(kScene).size(), 4u);
    EXPECT_TRUE(extractor.is_ready());
}

TEST_F(OpenVocabTest, MalformedResultYieldsNoSpans) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"garbage"}));
    EXPECT_TRUE(extractor.extract(kScene).empty());
    EXPECT_TRUE(extractor.is_ready());
}

TEST_F(OpenVocabTest, WarmupInitializes) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"normal"}));
    auto warm = extractor.warmup();
    EXPECT_TRUE(warm.success);
    EXPECT_EQ(warm.message, "open-vocabulary worker initialized");
    EXPECT_TRUE(extractor.is_ready());
}

TEST_F(OpenVocabTest, ConcurrentFirstCallersShareInitialization) {
    OpenVocabExtractor extractor(taxonomy, worker_config({"normal"}));

    std::atomic<int> ready{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&] {
            if (extractor.ensure_initialized()) ++ready;
        });
    }
    for (auto& t : callers) t.join();

    EXPECT_EQ(ready.load(), 4);
    EXPECT_TRUE(extractor.is_ready());
}
