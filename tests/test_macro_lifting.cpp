#include <gtest/gtest.h>
#include <tally/macro_lifting.hpp>
#include "test_helpers.hpp"

using test_utils::str;

class MacroLiftingTest : public ::testing::Test {
protected:
    // Reach sets of short strings are finite, so a bisimulation depth this
    // large compares two empty final levels and only confluence decides
    tally::PipelineConfig permissive_config() {
        tally::PipelineConfig config;
        config.max_length = 3;
        config.bisimulation_depth = 400;
        return config;
    }

    // The attractor {000, 0|0, 00|, 0||} of the toggle rules
    tally::ConfigurationGraph toggle_attractor() {
        tally::GraphBuilder builder(test_utils::toggle_rules(), tally::Alphabet::binary());
        return builder.build_from_reach(str("000"), 5);
    }
};

// === MINING ===

TEST_F(MacroLiftingTest, MinesLargeComponentsOnly) {
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(),
                                         permissive_config());
    tally::GraphBuilder builder(test_utils::toggle_rules(), tally::Alphabet::binary());
    auto graph = builder.build_graph(3);
    auto decomposition = tally::TarjanSCC(graph).find_sccs();
    tally::MacroDictionary dictionary;

    std::size_t mined = 0;
    auto candidates = pipeline.mine_candidates(graph, decomposition, dictionary, &mined);
    EXPECT_EQ(mined, 1u);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].pattern, str("0|"));
    EXPECT_EQ(candidates[1].pattern, str("00"));
}

TEST_F(MacroLiftingTest, MiningSkipsKnownDefinitionsAndCaps) {
    auto config = permissive_config();
    auto graph = toggle_attractor();
    auto decomposition = tally::TarjanSCC(graph).find_sccs();

    tally::MacroDictionary dictionary;
    dictionary.admit(tally::Macro::create(tally::Symbol('A'), str("0|")));

    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(), config);
    auto candidates = pipeline.mine_candidates(graph, decomposition, dictionary);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].pattern, str("00"));

    config.max_candidates = 1;
    tally::MacroLiftingPipeline capped(test_utils::toggle_rules(), tally::Alphabet::binary(), config);
    tally::MacroDictionary fresh;
    auto one = capped.mine_candidates(graph, decomposition, fresh);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].pattern, str("0|"));
}

TEST_F(MacroLiftingTest, NoCandidatesBelowSizeThreshold) {
    auto config = permissive_config();
    config.min_scc_size = 5;
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(), config);
    tally::MacroDictionary dictionary;

    auto report = pipeline.run(toggle_attractor(), dictionary);
    EXPECT_EQ(report.components_mined, 0u);
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(dictionary.version(), 1);
}

// === VERIFICATION AND ADMISSION ===

TEST_F(MacroLiftingTest, AdmitsVerifiedMacros) {
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(),
                                         permissive_config());
    tally::MacroDictionary dictionary;

    auto report = pipeline.run(toggle_attractor(), dictionary);
    EXPECT_EQ(report.graph_vertices, 4u);
    EXPECT_EQ(report.graph_edges, 6u);
    EXPECT_EQ(report.components_mined, 1u);
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.admitted_count(), 2u);
    EXPECT_EQ(report.rejected_count(), 0u);

    const auto& first = report.outcomes[0];
    EXPECT_EQ(first.symbol, tally::Symbol('A'));
    EXPECT_EQ(first.state, tally::CandidateState::Admitted);
    EXPECT_EQ(first.confluent, std::optional<bool>(true));
    EXPECT_EQ(first.bisimilar, std::optional<bool>(true));
    EXPECT_EQ(first.version, std::optional<std::int64_t>(2));
    EXPECT_EQ(report.outcomes[1].symbol, tally::Symbol('B'));
    EXPECT_EQ(report.outcomes[1].version, std::optional<std::int64_t>(3));

    EXPECT_EQ(dictionary.version(), 3);
    auto macro = dictionary.get_macro(tally::Symbol('A'));
    ASSERT_TRUE(macro.has_value());
    EXPECT_TRUE(macro->verified);
    EXPECT_EQ(macro->definition, str("0|"));
    EXPECT_EQ(std::get<std::int64_t>(macro->metadata.at("frequency")), 3);
    EXPECT_DOUBLE_EQ(std::get<double>(macro->metadata.at("stability")), 0.75);
    EXPECT_EQ(dictionary.history().size(), 2u);
}

TEST_F(MacroLiftingTest, StrictBisimulationRejects) {
    // Default depth 3 exposes the new strings the macros introduce
    tally::PipelineConfig config;
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(), config);
    tally::MacroDictionary dictionary;

    auto report = pipeline.run(toggle_attractor(), dictionary);
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.rejected_count(), 2u);
    for (const auto& outcome : report.outcomes) {
        EXPECT_EQ(outcome.state, tally::CandidateState::Rejected);
        EXPECT_EQ(outcome.confluent, std::optional<bool>(true));
        EXPECT_EQ(outcome.bisimilar, std::optional<bool>(false));
        EXPECT_EQ(outcome.reason, "bounded bisimulation failed");
        EXPECT_FALSE(outcome.version.has_value());
    }
    EXPECT_TRUE(dictionary.empty());
    EXPECT_EQ(dictionary.version(), 1);
}

TEST_F(MacroLiftingTest, VerifiesAgainstExistingMacros) {
    tally::MacroDictionary dictionary;
    dictionary.admit(tally::Macro::create(tally::Symbol('A'), str("0|"), {}, true));

    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(),
                                         permissive_config());
    auto report = pipeline.run(toggle_attractor(), dictionary);

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].candidate.pattern, str("00"));
    EXPECT_EQ(report.outcomes[0].symbol, tally::Symbol('B'));
    EXPECT_EQ(report.outcomes[0].state, tally::CandidateState::Admitted);
    EXPECT_EQ(dictionary.version(), 3);
}

TEST_F(MacroLiftingTest, RunOverConfigurationGraph) {
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(),
                                         permissive_config());
    tally::MacroDictionary dictionary;

    auto report = pipeline.run(dictionary);
    EXPECT_EQ(report.graph_vertices, 15u);
    EXPECT_EQ(report.components_mined, 1u);
    EXPECT_GE(report.admitted_count(), 1u);

    std::int64_t expected = 2;
    for (const auto& outcome : report.outcomes) {
        if (outcome.state == tally::CandidateState::Admitted) {
            EXPECT_EQ(outcome.version, std::optional<std::int64_t>(expected++));
        }
    }
    for (const auto& macro : dictionary.macros()) {
        EXPECT_TRUE(macro.verified);
    }
}

TEST_F(MacroLiftingTest, ParallelVerificationMatchesSerial) {
    auto config = permissive_config();
    tally::MacroLiftingPipeline serial(test_utils::toggle_rules(), tally::Alphabet::binary(), config);
    config.num_threads = 4;
    tally::MacroLiftingPipeline parallel(test_utils::toggle_rules(), tally::Alphabet::binary(), config);

    tally::MacroDictionary serial_dictionary;
    tally::MacroDictionary parallel_dictionary;
    auto expected = serial.run(serial_dictionary);
    auto actual = parallel.run(parallel_dictionary);

    ASSERT_EQ(actual.outcomes.size(), expected.outcomes.size());
    for (std::size_t i = 0; i < expected.outcomes.size(); ++i) {
        EXPECT_EQ(actual.outcomes[i].symbol, expected.outcomes[i].symbol);
        EXPECT_EQ(actual.outcomes[i].state, expected.outcomes[i].state);
        EXPECT_EQ(actual.outcomes[i].version, expected.outcomes[i].version);
    }
    EXPECT_EQ(parallel_dictionary.version(), serial_dictionary.version());
}

// === REPORTING ===

TEST_F(MacroLiftingTest, ReportSerializes) {
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(),
                                         permissive_config());
    tally::MacroDictionary dictionary;
    auto report = pipeline.run(toggle_attractor(), dictionary);

    auto value = wxf::deserialize_value(wxf::serialize(report.to_wxf()));
    const auto& root = wxf::as_association(value);
    EXPECT_EQ(wxf::as_integer(*wxf::find_key(root, "admitted")), 2);
    EXPECT_EQ(wxf::as_integer(*wxf::find_key(root, "graph_vertices")), 4);

    const auto& outcomes = wxf::as_list(*wxf::find_key(root, "outcomes"));
    ASSERT_EQ(outcomes.size(), 2u);
    const auto& first = wxf::as_association(outcomes[0]);
    EXPECT_EQ(wxf::as_string(*wxf::find_key(first, "state")), "Admitted");
    EXPECT_EQ(wxf::as_string(*wxf::find_key(first, "pattern")), "0|");
    EXPECT_TRUE(wxf::as_bool(*wxf::find_key(first, "confluent")));
    EXPECT_EQ(wxf::find_key(first, "reason"), nullptr);
}

TEST_F(MacroLiftingTest, StateNames) {
    EXPECT_STREQ(tally::candidate_state_name(tally::CandidateState::Proposed), "Proposed");
    EXPECT_STREQ(tally::candidate_state_name(tally::CandidateState::BisimulationChecked), "BisimulationChecked");
    EXPECT_STREQ(tally::candidate_state_name(tally::CandidateState::Rejected), "Rejected");
}

TEST_F(MacroLiftingTest, InvalidConfigIsRejected) {
    tally::PipelineConfig config;
    config.min_macro_length = 0;
    EXPECT_THROW(tally::MacroLiftingPipeline(test_utils::toggle_rules(), tally::Alphabet::binary(), config),
                 std::invalid_argument);
}
