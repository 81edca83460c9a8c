#include <gtest/gtest.h>
#include <tally/rewriting.hpp>
#include "test_helpers.hpp"

using test_utils::str;
using test_utils::make_rules;

class RewritingTest : public ::testing::Test {
protected:
    tally::RewritingEngine toggle{test_utils::toggle_rules()};
};

// === MATCHING AND APPLICATION ===

TEST_F(RewritingTest, FindPositionsIncludesOverlaps) {
    EXPECT_EQ(tally::RewritingEngine::find_positions(str("00|00"), str("00")),
              (std::vector<std::size_t>{0, 3}));
    EXPECT_EQ(tally::RewritingEngine::find_positions(str("000"), str("00")),
              (std::vector<std::size_t>{0, 1}));
    EXPECT_TRUE(tally::RewritingEngine::find_positions(str("0"), str("00")).empty());
    EXPECT_TRUE(tally::RewritingEngine::find_positions(str("|||"), str("0")).empty());
}

TEST_F(RewritingTest, ApplyRuleSplicesRightHandSide) {
    auto grow = tally::Rule::from_str("0", "00|");
    auto shrink = tally::Rule::from_str("0|0", "|");

    EXPECT_EQ(tally::RewritingEngine::apply_rule(str("00|00"), toggle.rule(0), 3), str("00|0|"));
    EXPECT_EQ(tally::RewritingEngine::apply_rule(str("|0|"), grow, 1), str("|00||"));
    EXPECT_EQ(tally::RewritingEngine::apply_rule(str("00|00"), shrink, 1), str("0|0"));

    // Length changes by |right| - |left|
    auto result = tally::RewritingEngine::apply_rule(str("0000"), grow, 2);
    EXPECT_EQ(result.size(), 4u - 1u + 3u);
}

TEST_F(RewritingTest, AllApplicationsFollowRuleThenPositionOrder) {
    auto applications = toggle.all_applications(str("000"));
    ASSERT_EQ(applications.size(), 2u);
    EXPECT_EQ(applications[0].result, str("0|0"));
    EXPECT_EQ(applications[0].rule_index, 0u);
    EXPECT_EQ(applications[0].position, 0u);
    EXPECT_EQ(applications[1].result, str("00|"));
    EXPECT_EQ(applications[1].position, 1u);

    EXPECT_EQ(tally::debug::application_to_string(toggle, applications[1]), "00 → 0| @1 => 00|");
}

TEST_F(RewritingTest, SuccessorsAreDistinct) {
    tally::RewritingEngine engine(make_rules({{"0", "|"}, {"00", "|0"}}));

    // 0→| at 0 and 00→|0 at 0 both yield |0
    auto next = engine.successors(str("00"));
    EXPECT_EQ(test_utils::to_texts(next), (std::vector<std::string>{"|0", "0|"}));
    EXPECT_EQ(engine.all_applications(str("00")).size(), 3u);
}

TEST_F(RewritingTest, NormalFormDetection) {
    EXPECT_TRUE(toggle.is_normal_form(str("|||")));
    EXPECT_TRUE(toggle.is_normal_form(str("")));
    EXPECT_TRUE(toggle.is_normal_form(str("|0")));
    EXPECT_FALSE(toggle.is_normal_form(str("|00")));
}

// === BOUNDED REACH ===

TEST_F(RewritingTest, BoundedReachStopsOnCycle) {
    auto levels = toggle.bounded_reach(str("00"), 5);

    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(test_utils::to_texts(levels.at(0)), (std::vector<std::string>{"00"}));
    EXPECT_EQ(test_utils::to_texts(levels.at(1)), (std::vector<std::string>{"0|"}));
    EXPECT_EQ(levels.count(2), 0u);

    EXPECT_EQ(tally::debug::levels_to_string(levels), "0: 00\n1: 0|\n");

    // Depth 2 with a width cap: level 2 would only revisit "00"
    auto capped = toggle.bounded_reach(str("00"), 2, 10);
    ASSERT_EQ(capped.size(), 2u);
    EXPECT_EQ(test_utils::to_texts(capped.at(1)), (std::vector<std::string>{"0|"}));
    EXPECT_EQ(capped.count(2), 0u);
}

TEST_F(RewritingTest, BoundedReachLevelsAreDisjoint) {
    tally::RewritingEngine engine(make_rules({{"0", "|"}, {"|0", "0|"}}));
    auto levels = engine.bounded_reach(str("000"), 6);

    std::size_t total = 0;
    for (const auto& [level, strings] : levels) {
        total += strings.size();
    }
    EXPECT_EQ(tally::flatten_levels(levels).size(), total);
    EXPECT_TRUE(tally::flatten_levels(levels).count(str("|||")));
}

TEST_F(RewritingTest, DepthZeroReturnsOnlyStart) {
    auto levels = toggle.bounded_reach(str("000"), 0);
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_EQ(levels.at(0).size(), 1u);
}

TEST_F(RewritingTest, WidthLimitSamplesFirstApplications) {
    tally::RewritingEngine engine(make_rules({{"0", "|"}}));

    auto full = engine.bounded_reach(str("000"), 3);
    EXPECT_EQ(full.at(1).size(), 3u);
    EXPECT_EQ(tally::flatten_levels(full).size(), 8u);

    auto sampled = engine.bounded_reach(str("000"), 3, 1);
    EXPECT_EQ(test_utils::to_texts(sampled.at(1)), (std::vector<std::string>{"|00"}));
    EXPECT_EQ(test_utils::to_texts(sampled.at(2)), (std::vector<std::string>{"||0"}));
    EXPECT_EQ(test_utils::to_texts(sampled.at(3)), (std::vector<std::string>{"|||"}));

    auto all = tally::flatten_levels(full);
    for (const auto& s : tally::flatten_levels(sampled)) {
        EXPECT_TRUE(all.count(s)) << s.to_string();
    }
}

// === PATHS ===

TEST_F(RewritingTest, ReachableReturnsPath) {
    auto path = toggle.reachable(str("00"), str("0|"), 1);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(test_utils::to_texts(*path), (std::vector<std::string>{"00", "0|"}));

    auto trivial = toggle.reachable(str("00"), str("00"), 0);
    ASSERT_TRUE(trivial.has_value());
    EXPECT_EQ(trivial->size(), 1u);

    EXPECT_FALSE(toggle.reachable(str("00"), str("|"), 5).has_value());
}

TEST_F(RewritingTest, ReachablePathIsValidRewriteChain) {
    tally::RewritingEngine engine(make_rules({{"0", "|"}, {"|0", "0|"}}));
    auto path = engine.reachable(str("000"), str("|||"), 10);
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->size(), 4u);

    for (std::size_t i = 0; i + 1 < path->size(); ++i) {
        auto next = engine.successors((*path)[i]);
        EXPECT_NE(std::find(next.begin(), next.end(), (*path)[i + 1]), next.end());
    }
}

TEST_F(RewritingTest, ReachableRespectsDepth) {
    tally::RewritingEngine engine(make_rules({{"0", "|"}}));
    EXPECT_FALSE(engine.reachable(str("000"), str("|||"), 2).has_value());
    EXPECT_TRUE(engine.reachable(str("000"), str("|||"), 3).has_value());
}

// === OMEGA LIMIT ===

TEST_F(RewritingTest, OmegaLimitFindsCycle) {
    auto omega = toggle.omega_limit(str("00"));
    EXPECT_EQ(omega.kind, tally::OmegaKind::Cycle);
    EXPECT_TRUE(omega.is_exact());
    EXPECT_EQ(test_utils::to_texts(omega.states), (std::vector<std::string>{"00", "0|"}));
}

TEST_F(RewritingTest, OmegaLimitFindsNormalForm) {
    tally::RewritingEngine engine(make_rules({{"0", "|"}}));
    auto omega = engine.omega_limit(str("00"));
    EXPECT_EQ(omega.kind, tally::OmegaKind::NormalForm);
    EXPECT_EQ(test_utils::to_texts(omega.states), (std::vector<std::string>{"||"}));
}

TEST_F(RewritingTest, OmegaLimitApproximatesGrowth) {
    tally::RewritingEngine engine(make_rules({{"0", "00"}}));

    auto short_run = engine.omega_limit(str("0"), 10);
    EXPECT_EQ(short_run.kind, tally::OmegaKind::Approximation);
    EXPECT_FALSE(short_run.is_exact());
    ASSERT_EQ(short_run.states.size(), 10u);
    EXPECT_EQ(short_run.states.back().size(), 10u);

    auto long_run = engine.omega_limit(str("0"), 150);
    ASSERT_EQ(long_run.states.size(), tally::RewritingEngine::OMEGA_WINDOW);
    EXPECT_EQ(long_run.states.front().size(), 51u);
    EXPECT_EQ(long_run.states.back().size(), 150u);
}

// === NORMAL FORMS ===

TEST_F(RewritingTest, NormalFormsWithinReach) {
    tally::RewritingEngine engine(make_rules({{"0|", "|"}, {"0|", "0"}}));
    auto forms = engine.normal_forms(str("00|"), 5);
    EXPECT_EQ(test_utils::sorted_texts(forms), (std::vector<std::string>{"0", "00", "|"}));

    for (const auto& s : forms) {
        EXPECT_TRUE(engine.is_normal_form(s));
    }

    EXPECT_TRUE(toggle.normal_forms(str("00"), 5).empty());
}
