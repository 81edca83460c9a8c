#include <gtest/gtest.h>
#include <tally/aho_corasick.hpp>
#include "test_helpers.hpp"

using test_utils::str;
using test_utils::strs;
using test_utils::make_rules;

class AhoCorasickTest : public ::testing::Test {};

// === AUTOMATON ===

TEST_F(AhoCorasickTest, FindsOverlappingAndNestedMatches) {
    tally::AhoCorasick automaton(strs({"00", "0|", "000", "|0"}));
    ASSERT_TRUE(automaton.is_built());

    auto positions = automaton.find_all_positions(str("00|000|0"));
    ASSERT_EQ(positions.size(), 4u);
    EXPECT_EQ(positions[0], (std::vector<std::size_t>{0, 3, 4}));
    EXPECT_EQ(positions[1], (std::vector<std::size_t>{1, 5}));
    EXPECT_EQ(positions[2], (std::vector<std::size_t>{3}));
    EXPECT_EQ(positions[3], (std::vector<std::size_t>{2, 6}));
}

TEST_F(AhoCorasickTest, SearchOrdersLongerPatternFirst) {
    tally::AhoCorasick automaton(strs({"00", "0|", "000", "|0"}));
    auto matches = automaton.search(str("00|000|0"));

    using Match = tally::AhoCorasick::Match;
    std::vector<Match> expected = {
        {1, 0}, {2, 1}, {3, 3}, {4, 0}, {5, 2}, {5, 0}, {6, 1}, {7, 3}
    };
    EXPECT_EQ(matches, expected);
}

TEST_F(AhoCorasickTest, AgreesWithNaiveSearch) {
    auto patterns = strs({"0", "|", "0|0", "||", "00|", "|0|"});
    tally::AhoCorasick automaton(patterns);
    auto text = str("0|0||00|0|0|||000|0");

    auto positions = automaton.find_all_positions(text);
    for (std::size_t p = 0; p < patterns.size(); ++p) {
        std::vector<std::size_t> naive;
        for (std::size_t i = 0; i + patterns[p].size() <= text.size(); ++i) {
            if (text.matches_at(patterns[p], i)) {
                naive.push_back(i);
            }
        }
        EXPECT_EQ(positions[p], naive) << patterns[p].to_string();
    }
}

TEST_F(AhoCorasickTest, DuplicatePatternsGetOwnIndex) {
    tally::AhoCorasick automaton;
    EXPECT_EQ(automaton.add_pattern(str("0|")), 0u);
    EXPECT_EQ(automaton.add_pattern(str("0|")), 1u);
    automaton.build();

    auto positions = automaton.find_all_positions(str("|0|"));
    EXPECT_EQ(positions[0], (std::vector<std::size_t>{1}));
    EXPECT_EQ(positions[1], (std::vector<std::size_t>{1}));
}

TEST_F(AhoCorasickTest, RejectsMisuse) {
    tally::AhoCorasick automaton;
    EXPECT_THROW(automaton.add_pattern(str("")), std::invalid_argument);

    automaton.add_pattern(str("00"));
    EXPECT_THROW(automaton.search(str("000")), std::logic_error);
    automaton.build();
    EXPECT_TRUE(automaton.matches_any(str("000")));

    // Adding after build requires another build
    automaton.add_pattern(str("|"));
    EXPECT_FALSE(automaton.is_built());
    EXPECT_THROW(automaton.matches_any(str("|")), std::logic_error);
    automaton.build();
    EXPECT_TRUE(automaton.matches_any(str("|")));
    EXPECT_EQ(automaton.find_all_positions(str("00|"))[0], (std::vector<std::size_t>{0}));
}

TEST_F(AhoCorasickTest, NoMatchOnForeignText) {
    tally::AhoCorasick automaton(strs({"00", "0|"}));
    EXPECT_FALSE(automaton.matches_any(str("|||")));
    EXPECT_FALSE(automaton.matches_any(str("")));
    EXPECT_TRUE(automaton.search(str("AB")).empty());
}

// === OVERLAPS ===

class OverlapTest : public ::testing::Test {};

TEST_F(OverlapTest, SuffixPrefixOverlap) {
    using D = tally::OverlapDetector;
    EXPECT_EQ(D::find_suffix_prefix_overlap(str("00|"), str("|0")), 1u);
    EXPECT_EQ(D::find_suffix_prefix_overlap(str("000"), str("00")), 2u);
    EXPECT_EQ(D::find_suffix_prefix_overlap(str("0|"), str("0|")), 2u);
    EXPECT_FALSE(D::find_suffix_prefix_overlap(str("||"), str("00")).has_value());
    EXPECT_FALSE(D::find_suffix_prefix_overlap(str(""), str("00")).has_value());
}

TEST_F(OverlapTest, AllOverlapsSkipSelfPairs) {
    auto overlaps = tally::OverlapDetector::find_all_overlaps(strs({"00", "0|"}));
    ASSERT_EQ(overlaps.size(), 1u);
    EXPECT_EQ(overlaps[0].first, 0u);
    EXPECT_EQ(overlaps[0].second, 1u);
    EXPECT_EQ(overlaps[0].length, 1u);
    EXPECT_EQ(overlaps[0].overlap, str("0"));

    EXPECT_TRUE(tally::OverlapDetector::find_all_overlaps(strs({"00", "0|"}), 2).empty());
    EXPECT_TRUE(tally::OverlapDetector::find_all_overlaps(strs({"000"})).empty());
}

TEST_F(OverlapTest, MaxOverlapAndLocality) {
    auto toggle = test_utils::toggle_rules();
    EXPECT_EQ(tally::OverlapDetector::get_max_overlap(toggle), 1u);
    EXPECT_FALSE(tally::OverlapDetector::check_m_locality(toggle, 0));
    EXPECT_TRUE(tally::OverlapDetector::check_m_locality(toggle, 1));

    auto nested = make_rules({{"000", "|"}, {"00", "0"}});
    EXPECT_EQ(tally::OverlapDetector::get_max_overlap(nested), 2u);

    auto disjoint = make_rules({{"0", "00"}});
    EXPECT_EQ(tally::OverlapDetector::get_max_overlap(disjoint), 0u);
    EXPECT_TRUE(tally::OverlapDetector::check_m_locality(disjoint, 0));
}

TEST_F(OverlapTest, LocalityIsMonotone) {
    auto rules = make_rules({{"0|0|", "|"}, {"|0|0", "0"}, {"00", "0|"}});
    bool previous = false;
    for (std::size_t m = 0; m <= 6; ++m) {
        bool local = tally::OverlapDetector::check_m_locality(rules, m);
        if (previous) {
            EXPECT_TRUE(local) << "m = " << m;
        }
        previous = local;
    }
    EXPECT_TRUE(previous);
}

TEST_F(OverlapTest, Superpositions) {
    using D = tally::OverlapDetector;
    EXPECT_EQ(test_utils::to_texts(D::superpositions(str("00"), str("00"))),
              (std::vector<std::string>{"000"}));
    EXPECT_EQ(test_utils::to_texts(D::superpositions(str("0|0"), str("0|0"))),
              (std::vector<std::string>{"0|0|0"}));
    EXPECT_EQ(test_utils::to_texts(D::superpositions(str("000"), str("00|"))),
              (std::vector<std::string>{"000|", "0000|"}));
    EXPECT_TRUE(D::superpositions(str("0"), str("0")).empty());
    EXPECT_TRUE(D::superpositions(str("||"), str("00")).empty());
}

// === RULE INTERACTIONS ===

TEST_F(OverlapTest, ToggleRulesFormCriticalPair) {
    auto interactions = tally::OverlapDetector::rule_interactions(test_utils::toggle_rules());
    ASSERT_EQ(interactions.size(), 1u);
    EXPECT_EQ(interactions[0].first, 0u);
    EXPECT_EQ(interactions[0].second, 1u);
    EXPECT_TRUE(interactions[0].is_critical);
}

TEST_F(OverlapTest, OneSidedInteraction) {
    auto rules = make_rules({{"0|", "|"}, {"|", "00"}, {"00|", "0"}});
    auto interactions = tally::OverlapDetector::rule_interactions(rules);

    // Only the first right side contains a left side
    ASSERT_EQ(interactions.size(), 2u);
    EXPECT_EQ(interactions[0].first, 0u);
    EXPECT_EQ(interactions[0].second, 1u);
    EXPECT_FALSE(interactions[0].is_critical);
    EXPECT_EQ(interactions[1].first, 0u);
    EXPECT_EQ(interactions[1].second, 2u);
    EXPECT_FALSE(interactions[1].is_critical);
}

TEST_F(OverlapTest, NoInteractions) {
    auto rules = make_rules({{"0|", "|"}, {"00", "|0"}});
    EXPECT_TRUE(tally::OverlapDetector::rule_interactions(rules).empty());
}
