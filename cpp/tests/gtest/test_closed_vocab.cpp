// =============================================================================
// Closed Vocabulary Matcher Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptspan/closed_vocab_matcher.hpp"
#include "promptspan/taxonomy.hpp"
#include "promptspan/util/text.hpp"
#include "promptspan/vocabulary.hpp"

#include <algorithm>

using namespace promptspan;

class ClosedVocabTest : public ::testing::Test {
protected:
    Taxonomy taxonomy = Taxonomy::builtin();
    VocabularyStore vocab{VocabularyStore::Entries{
        {"camera.movement", {"pan", "dolly zoom", "tracking shot", "crane"}},
        {"camera.lens", {"35mm", "anamorphic"}},
        {"technical.aspectRatio", {"anamorphic widescreen"}},
        {"lighting.timeOfDay", {"golden hour"}},
        {"lighting.colorTemp", {"tungsten"}},
        {"lighting.source", {"tungsten"}},
        {"style.filmStock", {"35mm film"}},
    }};
    ClosedVocabMatcher matcher{vocab, taxonomy};

    std::vector<CandidateSpan> with_role(std::string_view text, const std::string& role) {
        std::vector<CandidateSpan> out;
        for (auto& c : matcher.match(text)) {
            if (c.role == role) out.push_back(c);
        }
        return out;
    }
};

TEST_F(ClosedVocabTest, KeepsInputCasingAndOffsets) {
    auto spans = matcher.match("Shot at Golden Hour.");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "Golden Hour");
    EXPECT_EQ(spans[0].role, "lighting.timeOfDay");
    EXPECT_DOUBLE_EQ(spans[0].confidence, 1.0);
    EXPECT_EQ(spans[0].start, 8u);
    EXPECT_EQ(spans[0].end, 19u);
    EXPECT_EQ(spans[0].source, SpanSource::ClosedVocab);
}

TEST_F(ClosedVocabTest, RequiresWordBoundaries) {
    EXPECT_TRUE(matcher.match("a panorama of the bay").empty());
    EXPECT_TRUE(matcher.match("goldenhour").empty());
    EXPECT_TRUE(matcher.match("135mm").empty());
}

TEST_F(ClosedVocabTest, ByteOffsetsAfterMultibyteText) {
    auto spans = matcher.match("café golden hour");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].start, 6u);
    EXPECT_EQ(spans[0].end, 16u);
}

TEST_F(ClosedVocabTest, TypographicPunctuationIsABoundary) {
    auto dashed = matcher.match("35mm lens\u2014golden hour\u201424fps");
    ASSERT_EQ(dashed.size(), 2u);
    EXPECT_EQ(dashed[0].text, "35mm");
    EXPECT_EQ(dashed[1].text, "golden hour");
    EXPECT_EQ(dashed[1].start, 12u);
    EXPECT_EQ(dashed[1].end, 23u);

    auto quoted = matcher.match("\u201cgolden hour\u201d on\u00a035mm");
    ASSERT_EQ(quoted.size(), 2u);
    EXPECT_EQ(quoted[0].text, "golden hour");
    EXPECT_EQ(quoted[0].start, 3u);
    EXPECT_EQ(quoted[1].text, "35mm");
    EXPECT_EQ(quoted[1].start, 22u);
    EXPECT_DOUBLE_EQ(quoted[1].confidence, 1.0);
}

TEST_F(ClosedVocabTest, AccentedLetterContinuesTheWord) {
    EXPECT_TRUE(matcher.match("35mm\u00e9").empty());
    EXPECT_TRUE(matcher.match("\u00e9golden hour").empty());
}

TEST_F(ClosedVocabTest, CameraVerbConjugationsNeedCameraContext) {
    auto spans = with_role("The camera slowly pans across the valley", "camera.movement");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "pans");

    EXPECT_TRUE(with_role("She pans across the room", "camera.movement").empty());
}

TEST_F(ClosedVocabTest, CulinaryCollocationSuppressesCameraVerb) {
    EXPECT_TRUE(with_role("She began to pan the bread dough", "camera.movement").empty());
    EXPECT_TRUE(with_role("In this shot the cook will pan the eggs", "camera.movement").empty());
}

TEST_F(ClosedVocabTest, CameraCueInsideTheMatchDoesNotCount) {
    std::string lowered = "tracking shot";
    EXPECT_FALSE(ClosedVocabMatcher::has_camera_context(lowered, 0, lowered.size()));

    std::string framed = "the shot then pans";
    EXPECT_TRUE(ClosedVocabMatcher::has_camera_context(framed, 14, 18));
}

TEST_F(ClosedVocabTest, UnambiguousCameraTermsNeedNoContext) {
    auto spans = with_role("a slow dolly zoom", "camera.movement");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "dolly zoom");
}

TEST_F(ClosedVocabTest, LensBeforeFilmIsAFilmStock) {
    EXPECT_TRUE(with_role("shot on 35mm film", "camera.lens").empty());
    auto stock = with_role("shot on 35mm film", "style.filmStock");
    ASSERT_EQ(stock.size(), 1u);
    EXPECT_EQ(stock[0].text, "35mm film");

    EXPECT_EQ(with_role("35mm lens", "camera.lens").size(), 1u);
}

TEST_F(ClosedVocabTest, OverlappingTermsAndSharedTermsAreAllEmitted) {
    auto spans = matcher.match("anamorphic widescreen, tungsten");

    auto has = [&](const std::string& text, const std::string& role) {
        return std::any_of(spans.begin(), spans.end(), [&](const CandidateSpan& c) {
            return c.text == text && c.role == role;
        });
    };
    EXPECT_TRUE(has("anamorphic", "camera.lens"));
    EXPECT_TRUE(has("anamorphic widescreen", "technical.aspectRatio"));
    EXPECT_TRUE(has("tungsten", "lighting.colorTemp"));
    EXPECT_TRUE(has("tungsten", "lighting.source"));
    EXPECT_EQ(spans.size(), 4u);
}

TEST_F(ClosedVocabTest, AmbiguousTermClassification) {
    EXPECT_TRUE(ClosedVocabMatcher::is_ambiguous_camera_term("pan"));
    EXPECT_TRUE(ClosedVocabMatcher::is_ambiguous_camera_term("cranes"));
    EXPECT_TRUE(ClosedVocabMatcher::is_ambiguous_camera_term("rolling"));
    EXPECT_FALSE(ClosedVocabMatcher::is_ambiguous_camera_term("dolly zoom"));
    EXPECT_FALSE(ClosedVocabMatcher::is_ambiguous_camera_term("steadicam"));
}

TEST_F(ClosedVocabTest, EmptyVocabularyMatchesNothing) {
    ClosedVocabMatcher empty(VocabularyStore(), taxonomy);
    EXPECT_EQ(empty.pattern_count(), 0u);
    EXPECT_TRUE(empty.match("golden hour").empty());
}
