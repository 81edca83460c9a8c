#ifndef TALLY_MACRO_LIFTING_HPP
#define TALLY_MACRO_LIFTING_HPP

#include <tally/config.hpp>
#include <tally/configuration_graph.hpp>
#include <tally/macro_dictionary.hpp>
#include <tally/macro_system.hpp>
#include <tally/scc.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tally {

/**
 * Candidate lifecycle. Transitions only move forward:
 * Proposed -> ConfluenceChecked -> BisimulationChecked -> Admitted,
 * with Rejected reachable from any non-final state.
 */
enum class CandidateState {
    Proposed,
    ConfluenceChecked,
    BisimulationChecked,
    Admitted,
    Rejected
};

const char* candidate_state_name(CandidateState state);

struct CandidateOutcome {
    PatternCandidate candidate;
    Symbol symbol;
    CandidateState state = CandidateState::Proposed;
    std::optional<bool> confluent;
    std::optional<bool> bisimilar;
    std::optional<std::int64_t> version;   // Set once admitted
    std::string reason;                    // Set once rejected
};

struct LiftingReport {
    std::size_t graph_vertices = 0;
    std::size_t graph_edges = 0;
    std::size_t components_mined = 0;
    std::vector<CandidateOutcome> outcomes;

    std::size_t admitted_count() const;
    std::size_t rejected_count() const;

    wxf::WXFValue to_wxf() const;
};

/**
 * Mines frequent patterns from large SCCs, verifies each candidate against a
 * snapshot of the rule set, and admits the survivors to a dictionary.
 *
 * The snapshot is the base rules plus the dictionary's macro rules at the
 * start of the run. Verification of distinct candidates runs in parallel;
 * admission is sequential in candidate order through compare_and_append.
 */
class MacroLiftingPipeline {
private:
    std::vector<Rule> rules_;
    Alphabet alphabet_;
    PipelineConfig config_;

public:
    MacroLiftingPipeline(std::vector<Rule> rules, Alphabet alphabet, PipelineConfig config = {});

    const PipelineConfig& config() const { return config_; }

    /**
     * Candidates from every component of at least min_scc_size vertices,
     * attractors first, deduplicated by pattern, skipping definitions the
     * dictionary already holds, capped at max_candidates.
     */
    std::vector<PatternCandidate> mine_candidates(const ConfigurationGraph& graph,
                                                  const SCCDecomposition& decomposition,
                                                  const MacroDictionary& dictionary,
                                                  std::size_t* components_mined = nullptr) const;

    // Lift over G_L with L = config.max_length
    LiftingReport run(MacroDictionary& dictionary) const;

    // Lift over a caller-supplied graph
    LiftingReport run(const ConfigurationGraph& graph, MacroDictionary& dictionary) const;
};

} // namespace tally

#endif // TALLY_MACRO_LIFTING_HPP
