// =============================================================================
// Encoder and Prototype Classifier Tests
// =============================================================================

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "promptspan/embedding/prototype_classifier.hpp"
#include "promptspan/embedding/text_encoder.hpp"
#include "promptspan/error.hpp"

#include <memory>

using namespace promptspan;
using namespace promptspan::embedding;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockTextEncoder : public TextEncoder {
public:
    MOCK_METHOD(Eigen::VectorXf, encode, (std::string_view text), (const, override));
    MOCK_METHOD(size_t, dimensions, (), (const, override));
};

Eigen::VectorXf vec3(float x, float y, float z) {
    Eigen::VectorXf v(3);
    v << x, y, z;
    return v;
}

} // namespace

// =============================================================================
// Hashed encoder
// =============================================================================

TEST(HashedNgramEncoderTest, UnitLengthOrZero) {
    HashedNgramEncoder encoder(128);
    EXPECT_EQ(encoder.dimensions(), 128u);

    Eigen::VectorXf v = encoder.encode("soft diffused light");
    EXPECT_EQ(v.size(), 128);
    EXPECT_NEAR(v.norm(), 1.0f, 1e-5f);

    EXPECT_FLOAT_EQ(encoder.encode("").norm(), 0.0f);
    EXPECT_FLOAT_EQ(encoder.encode(" , . ").norm(), 0.0f);
}

TEST(HashedNgramEncoderTest, MorphologicalNeighboursAreCloser) {
    HashedNgramEncoder encoder;
    auto soft = encoder.encode("soft");
    double near = cosine_similarity(soft, encoder.encode("softly"));
    double far = cosine_similarity(soft, encoder.encode("tungsten"));
    EXPECT_GT(near, far);
    EXPECT_NEAR(cosine_similarity(soft, encoder.encode("SOFT")), 1.0, 1e-6);
}

TEST(HashedNgramEncoderTest, CosineEdgeCases) {
    EXPECT_DOUBLE_EQ(cosine_similarity(vec3(0, 0, 0), vec3(1, 0, 0)), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity(vec3(1, 0, 0), Eigen::VectorXf::Ones(2)), 0.0);
    EXPECT_NEAR(cosine_similarity(vec3(2, 0, 0), vec3(5, 0, 0)), 1.0, 1e-9);
    EXPECT_THROW(HashedNgramEncoder(0), PromptSpanException);
}

// =============================================================================
// Prototype classifier
// =============================================================================

class PrototypeClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        encoder = std::make_shared<NiceMock<MockTextEncoder>>();
        ON_CALL(*encoder, dimensions()).WillByDefault(Return(3));
        ON_CALL(*encoder, encode(Eq("x"))).WillByDefault(Return(vec3(1, 0, 0)));
        ON_CALL(*encoder, encode(Eq("y"))).WillByDefault(Return(vec3(0, 1, 0)));
        ON_CALL(*encoder, encode(Eq("z"))).WillByDefault(Return(vec3(0, 0, 1)));
        ON_CALL(*encoder, encode(Eq("query"))).WillByDefault(Return(vec3(0.6f, 0.8f, 0)));
    }

    std::shared_ptr<NiceMock<MockTextEncoder>> encoder;
};

TEST_F(PrototypeClassifierTest, BestExampleScoresTheCluster) {
    PrototypeClassifier classifier(encoder, {{"a", {"x", "y"}}, {"b", {"z"}}});

    auto scores = classifier.scores("query");
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores[0].label, "a");
    EXPECT_NEAR(scores[0].similarity, 0.8, 1e-6);
    EXPECT_EQ(scores[1].label, "b");
    EXPECT_NEAR(scores[1].similarity, 0.0, 1e-6);

    auto best = classifier.classify("query");
    EXPECT_EQ(best.label, "a");
    EXPECT_NEAR(best.similarity, 0.8, 1e-6);
}

TEST_F(PrototypeClassifierTest, ExamplesAreEmbeddedOnce) {
    EXPECT_CALL(*encoder, encode(Eq("x"))).Times(1);
    EXPECT_CALL(*encoder, encode(Eq("y"))).Times(1);
    EXPECT_CALL(*encoder, encode(Eq("query"))).Times(3);

    PrototypeClassifier classifier(encoder, {{"a", {"x"}}, {"b", {"y"}}});
    classifier.classify("query");
    classifier.classify("query");
    classifier.prepare();
    classifier.classify("query");
}

TEST_F(PrototypeClassifierTest, TiesKeepTheFirstCluster) {
    ON_CALL(*encoder, encode(Eq("x again"))).WillByDefault(Return(vec3(1, 0, 0)));
    PrototypeClassifier classifier(encoder, {{"first", {"x"}}, {"second", {"x again"}}});
    EXPECT_EQ(classifier.classify("x").label, "first");
}

TEST_F(PrototypeClassifierTest, ZeroQueryScoresZero) {
    ON_CALL(*encoder, encode(Eq(""))).WillByDefault(Return(vec3(0, 0, 0)));
    PrototypeClassifier classifier(encoder, {{"a", {"x"}}});
    auto best = classifier.classify("");
    EXPECT_EQ(best.label, "a");
    EXPECT_DOUBLE_EQ(best.similarity, 0.0);
}

TEST_F(PrototypeClassifierTest, NoClustersGiveEmptyLabel) {
    PrototypeClassifier classifier(encoder, {});
    EXPECT_TRUE(classifier.classify("query").label.empty());
}

TEST_F(PrototypeClassifierTest, WrongWidthEncoderIsAnError) {
    ON_CALL(*encoder, encode(Eq("bad"))).WillByDefault(Return(Eigen::VectorXf::Ones(2)));
    PrototypeClassifier classifier(encoder, {{"a", {"bad"}}});
    EXPECT_THROW(classifier.classify("query"), PromptSpanException);
}

TEST(PrototypeClassifierNullTest, RequiresEncoder) {
    EXPECT_THROW(PrototypeClassifier(nullptr, {}), PromptSpanException);
}
