#include <tally/macro_lifting.hpp>
#include <tally/debug_log.hpp>
#include <tally/parallel.hpp>
#include <algorithm>

namespace tally {

const char* candidate_state_name(CandidateState state) {
    switch (state) {
        case CandidateState::Proposed: return "Proposed";
        case CandidateState::ConfluenceChecked: return "ConfluenceChecked";
        case CandidateState::BisimulationChecked: return "BisimulationChecked";
        case CandidateState::Admitted: return "Admitted";
        case CandidateState::Rejected: return "Rejected";
    }
    return "Unknown";
}

std::size_t LiftingReport::admitted_count() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const CandidateOutcome& o) { return o.state == CandidateState::Admitted; }));
}

std::size_t LiftingReport::rejected_count() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const CandidateOutcome& o) { return o.state == CandidateState::Rejected; }));
}

wxf::WXFValue LiftingReport::to_wxf() const {
    auto key = [](const char* name) { return wxf::WXFValue(std::string(name)); };
    auto count = [](std::size_t n) { return wxf::WXFValue(static_cast<std::int64_t>(n)); };
    auto flag = [](bool b) { return wxf::WXFValue(wxf::SymbolName{b ? "True" : "False"}); };

    wxf::WXFValueList entries;
    for (const auto& outcome : outcomes) {
        wxf::WXFValueAssociation entry;
        entry.emplace_back(key("pattern"), wxf::WXFValue(outcome.candidate.pattern.to_string()));
        entry.emplace_back(key("symbol"), wxf::WXFValue(outcome.symbol.value()));
        entry.emplace_back(key("frequency"), count(outcome.candidate.frequency));
        entry.emplace_back(key("stability"), wxf::WXFValue(outcome.candidate.stability));
        entry.emplace_back(key("score"), wxf::WXFValue(outcome.candidate.score));
        entry.emplace_back(key("state"), wxf::WXFValue(std::string(candidate_state_name(outcome.state))));
        if (outcome.confluent) {
            entry.emplace_back(key("confluent"), flag(*outcome.confluent));
        }
        if (outcome.bisimilar) {
            entry.emplace_back(key("bisimilar"), flag(*outcome.bisimilar));
        }
        if (outcome.version) {
            entry.emplace_back(key("version"), wxf::WXFValue(*outcome.version));
        }
        if (!outcome.reason.empty()) {
            entry.emplace_back(key("reason"), wxf::WXFValue(outcome.reason));
        }
        entries.push_back(wxf::WXFValue(std::move(entry)));
    }

    wxf::WXFValueAssociation root;
    root.emplace_back(key("graph_vertices"), count(graph_vertices));
    root.emplace_back(key("graph_edges"), count(graph_edges));
    root.emplace_back(key("components_mined"), count(components_mined));
    root.emplace_back(key("admitted"), count(admitted_count()));
    root.emplace_back(key("rejected"), count(rejected_count()));
    root.emplace_back(key("outcomes"), wxf::WXFValue(std::move(entries)));
    return wxf::WXFValue(std::move(root));
}

MacroLiftingPipeline::MacroLiftingPipeline(std::vector<Rule> rules, Alphabet alphabet, PipelineConfig config)
    : rules_(std::move(rules)), alphabet_(std::move(alphabet)), config_(config) {
    config_.validate();
    for (const auto& rule : rules_) {
        for (const auto& symbol : rule.left.symbols()) alphabet_.add_symbol(symbol);
        for (const auto& symbol : rule.right.symbols()) alphabet_.add_symbol(symbol);
    }
}

std::vector<PatternCandidate> MacroLiftingPipeline::mine_candidates(const ConfigurationGraph& graph,
                                                                    const SCCDecomposition& decomposition,
                                                                    const MacroDictionary& dictionary,
                                                                    std::size_t* components_mined) const {
    std::vector<std::size_t> order;
    for (std::size_t c = 0; c < decomposition.size(); ++c) {
        const auto& component = decomposition.components[c];
        if (component.is_attractor && component.size() >= config_.min_scc_size) {
            order.push_back(c);
        }
    }
    for (std::size_t c = 0; c < decomposition.size(); ++c) {
        const auto& component = decomposition.components[c];
        if (!component.is_attractor && component.size() >= config_.min_scc_size) {
            order.push_back(c);
        }
    }
    if (components_mined) {
        *components_mined = order.size();
    }

    std::vector<PatternCandidate> result;
    StringSet seen;
    for (std::size_t c : order) {
        if (result.size() >= config_.max_candidates) break;

        auto ranked = FrequencyAnalyzer::analyze_scc(graph, decomposition.components[c],
                                                     config_.min_macro_length, config_.max_macro_length);
        if (config_.candidates_per_scc != 0 && ranked.size() > config_.candidates_per_scc) {
            ranked.resize(config_.candidates_per_scc);
        }

        for (auto& candidate : ranked) {
            if (result.size() >= config_.max_candidates) break;
            if (!seen.insert(candidate.pattern).second) continue;
            if (dictionary.contains_definition(candidate.pattern)) continue;
            result.push_back(std::move(candidate));
        }
    }

    return result;
}

LiftingReport MacroLiftingPipeline::run(MacroDictionary& dictionary) const {
    GraphBuilder builder(rules_, alphabet_, config_.num_threads);
    ConfigurationGraph graph = builder.build_graph(config_.max_length);
    return run(graph, dictionary);
}

LiftingReport MacroLiftingPipeline::run(const ConfigurationGraph& graph, MacroDictionary& dictionary) const {
    SCCDecomposition decomposition = TarjanSCC(graph).find_sccs();

    LiftingReport report;
    report.graph_vertices = graph.num_vertices();
    report.graph_edges = graph.num_edges();

    std::vector<PatternCandidate> candidates =
        mine_candidates(graph, decomposition, dictionary, &report.components_mined);

    std::vector<Symbol> reserved;
    for (auto& candidate : candidates) {
        CandidateOutcome outcome;
        outcome.symbol = dictionary.next_free_symbol(alphabet_, reserved);
        outcome.candidate = std::move(candidate);
        reserved.push_back(outcome.symbol);
        report.outcomes.push_back(std::move(outcome));
    }

    TALLY_LOG(Info, "Macro lifting: %zu candidates from %zu components", report.outcomes.size(),
              report.components_mined);

    std::vector<Rule> snapshot = rules_;
    for (auto& rule : dictionary.rules()) {
        snapshot.push_back(std::move(rule));
    }

    auto make_macro = [](const CandidateOutcome& outcome, bool verified) {
        Metadata metadata{
            {"frequency", static_cast<std::int64_t>(outcome.candidate.frequency)},
            {"stability", outcome.candidate.stability},
            {"score", outcome.candidate.score}
        };
        return Macro::create(outcome.symbol, outcome.candidate.pattern, std::move(metadata), verified);
    };

    LocalConfluenceChecker confluence(config_.confluence_depth, config_.confluence_width,
                                      config_.max_critical_strings);
    BoundedBisimulation bisimulation(config_.bisimulation_max_length, config_.bisimulation_depth,
                                     config_.bisimulation_width, config_.bisimulation_tests);

    // Each job touches only its own outcome slot
    parallel_for(report.outcomes.size(), config_.num_threads, AnalysisJobType::MACRO_VERIFICATION,
        [&](std::size_t i) {
            CandidateOutcome& outcome = report.outcomes[i];
            Macro macro = make_macro(outcome, false);

            outcome.confluent = confluence.check(snapshot, macro);
            if (!*outcome.confluent) {
                outcome.state = CandidateState::Rejected;
                outcome.reason = "local confluence failed";
                return;
            }
            outcome.state = CandidateState::ConfluenceChecked;

            outcome.bisimilar = bisimulation.check(snapshot, macro);
            if (!*outcome.bisimilar) {
                outcome.state = CandidateState::Rejected;
                outcome.reason = "bounded bisimulation failed";
                return;
            }
            outcome.state = CandidateState::BisimulationChecked;
        });

    for (auto& outcome : report.outcomes) {
        if (outcome.state != CandidateState::BisimulationChecked) {
            TALLY_LOG(Info, "Rejected macro candidate %s as %s: %s",
                      outcome.candidate.pattern.to_string().c_str(), outcome.symbol.value().c_str(),
                      outcome.reason.c_str());
            continue;
        }

        Macro macro = make_macro(outcome, true);
        try {
            outcome.version = dictionary.admit(macro);
            outcome.state = CandidateState::Admitted;
            TALLY_LOG(Info, "Admitted macro %s (version %lld)", macro.to_string().c_str(),
                      static_cast<long long>(*outcome.version));
        } catch (const std::invalid_argument& e) {
            // Another writer took the symbol or made the definition cyclic since verification
            outcome.state = CandidateState::Rejected;
            outcome.reason = e.what();
            TALLY_LOG(Info, "Rejected macro candidate %s as %s at admission: %s",
                      outcome.candidate.pattern.to_string().c_str(), outcome.symbol.value().c_str(),
                      e.what());
        }
    }

    return report;
}

} // namespace tally
