// =============================================================================
// Span Extraction Pipeline Tests
// =============================================================================
//
// End to end through SpanExtractionService with the shipped vocabulary.

#include <gtest/gtest.h>
#include "promptspan/span_extractor.hpp"

#include <algorithm>
#include <chrono>

using namespace promptspan;

namespace {

const char* kPrompt = "35mm lens, golden hour light, the camera slowly pans across the valley, 24fps";

std::string data_path(const std::string& name) {
    return std::string(PROMPTSPAN_DATA_DIR) + "/" + name;
}

const Span* find_span(const std::vector<Span>& spans, const std::string& text) {
    auto it = std::find_if(spans.begin(), spans.end(),
                           [&](const Span& s) { return s.text == text; });
    return it == spans.end() ? nullptr : &*it;
}

std::string branch(const std::string& role) {
    return role.substr(0, role.find('.'));
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    static EngineConfig engine_config() {
        EngineConfig ec;
        ec.vocab_path = data_path("vocab.json");
        return ec;
    }

    SpanExtractionService service{Taxonomy::builtin(),
                                  VocabularyStore::load(data_path("vocab.json")),
                                  engine_config()};
};

// =============================================================================
// Tiers working together
// =============================================================================

TEST_F(PipelineTest, CinematicPrompt) {
    auto result = service.extract_spans(kPrompt);
    const auto& spans = result.spans;
    EXPECT_EQ(result.stats.phase, "neuro-symbolic");
    EXPECT_EQ(result.stats.total_spans, spans.size());

    const Span* lens = find_span(spans, "35mm");
    ASSERT_NE(lens, nullptr);
    EXPECT_EQ(lens->role, "camera.lens");
    EXPECT_DOUBLE_EQ(lens->confidence, 1.0);
    EXPECT_EQ(lens->start, 0u);

    const Span* golden = find_span(spans, "golden hour");
    ASSERT_NE(golden, nullptr);
    EXPECT_EQ(golden->role, "lighting.timeOfDay");
    EXPECT_EQ(golden->start, 11u);
    EXPECT_EQ(find_span(spans, "golden hour light"), nullptr);

    const Span* pans = find_span(spans, "pans");
    ASSERT_NE(pans, nullptr);
    EXPECT_EQ(pans->role, "camera.movement");
    EXPECT_EQ(pans->start, 48u);

    const Span* valley = find_span(spans, "valley");
    ASSERT_NE(valley, nullptr);
    EXPECT_EQ(valley->role, "environment.location");

    const Span* fps = find_span(spans, "24fps");
    ASSERT_NE(fps, nullptr);
    EXPECT_EQ(fps->role, "technical.frameRate");
    EXPECT_DOUBLE_EQ(fps->confidence, 0.95);

    EXPECT_TRUE(result.stats.closed_vocab.ran);
    EXPECT_TRUE(result.stats.patterns.ran);
    EXPECT_FALSE(result.stats.open_vocab.ran);
    EXPECT_FALSE(result.stats.open_vocab_ready);
}

TEST_F(PipelineTest, SpansAreWellFormed) {
    std::string text = kPrompt;
    auto spans = service.extract_spans(text).spans;
    ASSERT_FALSE(spans.empty());

    const auto& taxonomy = service.taxonomy();
    for (size_t i = 0; i < spans.size(); ++i) {
        const auto& s = spans[i];
        EXPECT_LT(s.start, s.end);
        EXPECT_LE(s.end, text.size());
        EXPECT_EQ(text.substr(s.start, s.end - s.start), s.text);
        EXPECT_TRUE(taxonomy.is_valid(s.role)) << s.role;
        EXPECT_GE(s.confidence, 0.0);
        EXPECT_LE(s.confidence, 1.0);
        if (i > 0) EXPECT_LE(spans[i - 1].start, s.start);

        for (size_t j = i + 1; j < spans.size(); ++j) {
            const auto& o = spans[j];
            bool overlap = s.start < o.end && o.start < s.end;
            if (overlap) {
                EXPECT_NE(branch(s.role), branch(o.role)) << s.text << " / " << o.text;
            }
        }
    }
}

TEST_F(PipelineTest, Deterministic) {
    auto first = service.extract_spans(kPrompt).spans;
    auto second = service.extract_spans(kPrompt).spans;
    EXPECT_EQ(first, second);
}

TEST_F(PipelineTest, CulinaryPanIsNotACameraMove) {
    auto spans = service.extract_spans("She began to pan the bread dough").spans;
    for (const auto& s : spans) {
        EXPECT_NE(s.role, "camera.movement") << s.text;
    }
}

TEST_F(PipelineTest, LettersBeforeFpsAreNotAFrameRate) {
    auto spans = service.extract_spans("a bag of chipsfps").spans;
    for (const auto& s : spans) {
        EXPECT_NE(s.role, "technical.frameRate");
    }
}

TEST_F(PipelineTest, EmptyInput) {
    auto result = service.extract_spans("  \n\t ");
    EXPECT_EQ(result.stats.phase, "empty-input");
    EXPECT_TRUE(result.spans.empty());
    EXPECT_EQ(result.stats.total_spans, 0u);
    EXPECT_FALSE(result.stats.closed_vocab.ran);

    EXPECT_TRUE(service.extract_known_spans("").empty());
    EXPECT_EQ(service.estimate_coverage(""), 0);
}

TEST_F(PipelineTest, OptionsOverrideConfiguredTiers) {
    ExtractionOptions options;
    options.use_patterns = false;
    options.use_action = false;
    options.use_lighting = false;

    auto result = service.extract_spans(kPrompt, options);
    EXPECT_EQ(find_span(result.spans, "24fps"), nullptr);
    EXPECT_NE(find_span(result.spans, "golden hour"), nullptr);
    EXPECT_FALSE(result.stats.patterns.ran);
    EXPECT_FALSE(result.stats.action.ran);
    EXPECT_FALSE(result.stats.lighting.ran);
    EXPECT_EQ(result.stats.lighting.candidates, 0u);
}

// =============================================================================
// Known spans, coverage and fast path
// =============================================================================

TEST_F(PipelineTest, KnownSpansAndCoverage) {
    auto known = service.extract_known_spans(kPrompt);
    ASSERT_EQ(known.size(), 5u);
    EXPECT_EQ(known[0].text, "35mm");
    EXPECT_EQ(known[4].text, "24fps");

    // 6 covered words of 13.
    EXPECT_EQ(service.estimate_coverage(kPrompt), 46);
    EXPECT_EQ(service.estimate_coverage("nothing to see here"), 0);
    EXPECT_EQ(service.estimate_coverage("golden hour"), 100);
}

TEST_F(PipelineTest, FastPathOnExtractedSpans) {
    auto spans = service.extract_spans(kPrompt).spans;
    auto assessment = service.assess_fast_path(spans, kPrompt);
    EXPECT_EQ(assessment.expected_min_spans, 1u);
    EXPECT_TRUE(assessment.accept);
    EXPECT_EQ(assessment.span_count, spans.size());
}

TEST_F(PipelineTest, VocabStats) {
    auto stats = service.vocab_stats();
    EXPECT_EQ(stats.total_terms, service.vocabulary().term_count());
    EXPECT_EQ(stats.total_categories, service.vocabulary().category_count());
    EXPECT_GT(stats.open_vocab_labels, 0u);
    EXPECT_FALSE(stats.open_vocab_ready);

    auto it = stats.categories.find("lighting.timeOfDay");
    ASSERT_NE(it, stats.categories.end());
    EXPECT_LE(it->second.sample_terms.size(), 5u);
}

// =============================================================================
// Custom tables
// =============================================================================

TEST(PipelineCustomTest, SectionHeadersAreSuppressed) {
    VocabularyStore vocab({{"camera", {"camera"}}, {"camera.movement", {"dolly in"}}});
    SpanExtractionService service(Taxonomy::builtin(), vocab, EngineConfig{});

    ExtractionOptions options;
    options.use_action = false;
    options.use_lighting = false;

    auto headed = service.extract_spans("## Camera\nA slow dolly in", options).spans;
    ASSERT_EQ(headed.size(), 1u);
    EXPECT_EQ(headed[0].text, "dolly in");

    auto prose = service.extract_spans("the camera does a dolly in", options).spans;
    EXPECT_EQ(prose.size(), 2u);
}

TEST(PipelineCustomTest, MissingVocabularyDegradesToPatterns) {
    EngineConfig ec;
    ec.vocab_path = "/nonexistent/vocab.json";
    SpanExtractionService service(ec);

    EXPECT_EQ(service.vocabulary().term_count(), 0u);
    auto spans = service.extract_spans("golden hour at 24fps").spans;
    EXPECT_EQ(find_span(spans, "golden hour"), nullptr);
    ASSERT_NE(find_span(spans, "24fps"), nullptr);
}

TEST(PipelineCustomTest, LoadsConfiguredVocabulary) {
    EngineConfig ec;
    ec.vocab_path = data_path("vocab.json");
    SpanExtractionService service(ec);
    EXPECT_GT(service.vocabulary().term_count(), 0u);
    EXPECT_EQ(service.taxonomy().categories().size(), Taxonomy::builtin().categories().size());
}

// =============================================================================
// Open vocabulary through the scripted worker
// =============================================================================

TEST(PipelineOpenVocabTest, WorkerSpansJoinTheMerge) {
    EngineConfig ec;
    ec.open_vocab.enabled = true;
    ec.open_vocab.worker_path = PROMPTSPAN_SCRIPTED_WORKER_PATH;
    ec.open_vocab.worker_args = {"normal"};
    ec.open_vocab.timeout_ms = 2000;
    SpanExtractionService service(Taxonomy::builtin(), VocabularyStore{}, ec);

    auto warm = service.warmup();
    EXPECT_TRUE(warm.success);

    auto result = service.extract_spans("A cowboy rides a horse past the saloon");
    EXPECT_TRUE(result.stats.open_vocab.ran);
    EXPECT_TRUE(result.stats.open_vocab_ready);

    const Span* saloon = find_span(result.spans, "saloon");
    ASSERT_NE(saloon, nullptr);
    EXPECT_EQ(saloon->role, "environment.location");
    const Span* cowboy = find_span(result.spans, "cowboy");
    ASSERT_NE(cowboy, nullptr);
    EXPECT_EQ(cowboy->role, "subject.identity");

    ExtractionOptions closed_only;
    closed_only.use_open_vocabulary = false;
    auto without = service.extract_spans("A cowboy rides a horse past the saloon", closed_only);
    EXPECT_FALSE(without.stats.open_vocab.ran);
    EXPECT_EQ(find_span(without.spans, "saloon"), nullptr);
}

TEST(PipelineOpenVocabTest, SlowWorkerLeavesTheOtherTiersIntact) {
    EngineConfig ec;
    ec.open_vocab.enabled = true;
    ec.open_vocab.worker_path = PROMPTSPAN_SCRIPTED_WORKER_PATH;
    ec.open_vocab.worker_args = {"slow", "--delay-ms", "1000"};
    ec.open_vocab.timeout_ms = 1;
    SpanExtractionService service(Taxonomy::builtin(),
                                  VocabularyStore::load(data_path("vocab.json")), ec);

    const std::string text = "A cowboy rides a horse past the saloon at golden hour, 24fps";

    // The first call also spawns and initializes the worker.
    auto first = service.extract_spans(text);
    EXPECT_EQ(find_span(first.spans, "saloon"), nullptr);

    auto started = std::chrono::steady_clock::now();
    auto timed_out = service.extract_spans(text);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));

    ExtractionOptions closed_only;
    closed_only.use_open_vocabulary = false;
    auto reference = service.extract_spans(text, closed_only);

    ASSERT_FALSE(reference.spans.empty());
    EXPECT_NE(find_span(reference.spans, "golden hour"), nullptr);
    EXPECT_NE(find_span(reference.spans, "24fps"), nullptr);
    EXPECT_EQ(timed_out.spans, reference.spans);
    EXPECT_EQ(first.spans, reference.spans);
}
