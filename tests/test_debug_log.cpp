#include <gtest/gtest.h>
#include <tally/debug_log.hpp>
#include <tally/macro_dictionary.hpp>
#include <tally/macro_lifting.hpp>
#include "test_helpers.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace {

std::mutex g_captured_mutex;
std::vector<std::pair<tally::debug::LogLevel, std::string>> g_captured;

void capture(tally::debug::LogLevel level, const char* message) {
    std::lock_guard<std::mutex> lock(g_captured_mutex);
    g_captured.emplace_back(level, message);
}

} // namespace

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = tally::debug::get_log_level();
        g_captured.clear();
        tally::debug::set_log_callback(capture);
    }

    void TearDown() override {
        tally::debug::clear_log_callback();
        tally::debug::set_log_level(saved_level_);
    }

    static bool captured_contains(const std::string& fragment) {
        std::lock_guard<std::mutex> lock(g_captured_mutex);
        for (const auto& [level, message] : g_captured) {
            if (message.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    tally::debug::LogLevel saved_level_ = tally::debug::LogLevel::Warning;
};

TEST_F(DebugLogTest, ThresholdFiltersMessages) {
    tally::debug::set_log_level(tally::debug::LogLevel::Warning);
    TALLY_LOG(Info, "dropped %d", 1);
    TALLY_LOG(Warning, "kept %d", 2);
    TALLY_LOG(Error, "kept %s", "too");

    ASSERT_EQ(g_captured.size(), 2u);
    EXPECT_EQ(g_captured[0].first, tally::debug::LogLevel::Warning);
    EXPECT_EQ(g_captured[0].second.rfind("[WARN][T", 0), 0u);
    EXPECT_NE(g_captured[0].second.find("] kept 2"), std::string::npos);
    EXPECT_EQ(g_captured[1].second.rfind("[ERROR]", 0), 0u);

    EXPECT_TRUE(tally::debug::log_enabled(tally::debug::LogLevel::Error));
    EXPECT_FALSE(tally::debug::log_enabled(tally::debug::LogLevel::Debug));
}

TEST_F(DebugLogTest, OffSilencesEverything) {
    tally::debug::set_log_level(tally::debug::LogLevel::Off);
    TALLY_LOG(Error, "never seen");
    EXPECT_TRUE(g_captured.empty());
    EXPECT_STREQ(tally::debug::level_name(tally::debug::LogLevel::Info), "INFO");
}

TEST_F(DebugLogTest, LiftingLogsEveryDecision) {
    tally::debug::set_log_level(tally::debug::LogLevel::Info);

    tally::GraphBuilder builder(test_utils::toggle_rules(), tally::Alphabet::binary());
    auto graph = builder.build_from_reach(test_utils::str("000"), 5);
    tally::MacroLiftingPipeline pipeline(test_utils::toggle_rules(), tally::Alphabet::binary(),
                                         tally::PipelineConfig{});
    tally::MacroDictionary dictionary;
    pipeline.run(graph, dictionary);

    EXPECT_TRUE(captured_contains("Macro lifting: 2 candidates"));
    EXPECT_TRUE(captured_contains("Rejected macro candidate 0| as A: bounded bisimulation failed"));
    EXPECT_TRUE(captured_contains("Rejected macro candidate 00 as B"));
}

TEST_F(DebugLogTest, ExpansionCapIsWarned) {
    tally::debug::set_log_level(tally::debug::LogLevel::Warning);

    tally::MacroDictionary dictionary;
    dictionary.admit(tally::Macro::create(tally::Symbol('A'), test_utils::str("00")));
    dictionary.admit(tally::Macro::create(tally::Symbol('B'), test_utils::str("A0")));

    EXPECT_EQ(dictionary.expand(test_utils::str("B"), 1), test_utils::str("A0"));
    EXPECT_TRUE(captured_contains("stopped after 1 iterations"));
}
