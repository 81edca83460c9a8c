#ifndef TALLY_ANALYSIS_PIPELINE_HPP
#define TALLY_ANALYSIS_PIPELINE_HPP

#include <tally/aho_corasick.hpp>
#include <tally/config.hpp>
#include <tally/macro_dictionary.hpp>
#include <tally/macro_lifting.hpp>
#include <tally/rewriting.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace tally {

/**
 * Summary of one analysis run. Stages that fail record a message in
 * `errors` and leave their fields at defaults; later stages still run.
 */
struct AnalysisResult {
    String initial;
    String start;                       // initial with dictionary macros expanded

    // Dynamics
    std::vector<String> reachable;      // BFS discovery order
    OmegaLimit omega{{}, OmegaKind::Approximation};
    std::vector<String> normal_forms;

    // Graph on the reachable set
    std::size_t graph_vertices = 0;
    std::size_t graph_edges = 0;
    std::size_t scc_count = 0;
    std::size_t largest_scc = 0;
    std::size_t attractor_count = 0;

    // Rule overlaps
    std::vector<RuleInteraction> interactions;
    bool m_local = false;
    std::size_t max_overlap = 0;

    // Macros
    LiftingReport lifting;
    double macro_coverage = 0.0;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    double elapsed_seconds = 0.0;

    std::size_t overlap_pair_count() const { return interactions.size(); }
    std::size_t critical_pair_count() const;
    bool success() const { return errors.empty(); }

    wxf::WXFValue to_wxf() const;
};

/**
 * Runs dynamics, graph, overlap and macro stages over one initial string.
 */
class AnalysisPipeline {
private:
    std::vector<Rule> rules_;
    PipelineConfig config_;
    RewritingEngine engine_;

    void analyze_dynamics(AnalysisResult& result) const;
    void analyze_overlaps(AnalysisResult& result) const;
    void analyze_macros(AnalysisResult& result, MacroDictionary& dictionary) const;

public:
    explicit AnalysisPipeline(std::vector<Rule> rules, PipelineConfig config = {});

    const std::vector<Rule>& rules() const { return rules_; }
    const PipelineConfig& config() const { return config_; }

    /**
     * Macro symbols in `initial` are expanded through the dictionary before
     * exploration; all stages then work on the expanded start string.
     */
    AnalysisResult analyze(const String& initial, MacroDictionary& dictionary) const;
};

} // namespace tally

#endif // TALLY_ANALYSIS_PIPELINE_HPP
