// =============================================================================
// Verb Form Generation Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptspan/verb_forms.hpp"

using namespace promptspan;

TEST(VerbFormsTest, RegularDoubling) {
    std::set<std::string> expected = {"pan", "pans", "panning", "panned"};
    EXPECT_EQ(VerbForms::generate("pan"), expected);
    EXPECT_EQ(VerbForms::present_participle("nod"), "nodding");
}

TEST(VerbFormsTest, NoDoublingAfterVowelPair) {
    std::set<std::string> expected = {"zoom", "zooms", "zooming", "zoomed"};
    EXPECT_EQ(VerbForms::generate("zoom"), expected);
    EXPECT_EQ(VerbForms::past("tilt"), "tilted");
}

TEST(VerbFormsTest, SpellingRules) {
    EXPECT_EQ(VerbForms::third_person("watch"), "watches");
    EXPECT_EQ(VerbForms::third_person("cry"), "cries");
    EXPECT_EQ(VerbForms::third_person("play"), "plays");
    EXPECT_EQ(VerbForms::present_participle("dance"), "dancing");
    EXPECT_EQ(VerbForms::present_participle("flee"), "fleeing");
    EXPECT_EQ(VerbForms::past("cry"), "cried");
    EXPECT_EQ(VerbForms::past("wave"), "waved");
}

TEST(VerbFormsTest, Irregulars) {
    std::set<std::string> run = {"run", "runs", "running", "ran"};
    EXPECT_EQ(VerbForms::generate("run"), run);

    std::set<std::string> lie = {"lie", "lies", "lying", "lay", "lain"};
    EXPECT_EQ(VerbForms::generate("lie"), lie);
}

TEST(VerbFormsTest, FormsAreMemoized) {
    const auto& first = VerbForms::forms("dolly");
    const auto& second = VerbForms::forms("dolly");
    EXPECT_EQ(&first, &second);
    EXPECT_TRUE(first.count("dollies"));
    EXPECT_TRUE(first.count("dollying"));
    EXPECT_TRUE(VerbForms::generate("").empty());
}
