#include <tally/analysis_pipeline.hpp>
#include <tally/configuration_graph.hpp>
#include <tally/debug_log.hpp>
#include <tally/scc.hpp>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace tally {

namespace {

const char* omega_kind_name(OmegaKind kind) {
    switch (kind) {
        case OmegaKind::Cycle: return "Cycle";
        case OmegaKind::NormalForm: return "NormalForm";
        case OmegaKind::Approximation: return "Approximation";
    }
    return "Unknown";
}

wxf::WXFValue string_list(const std::vector<String>& strings) {
    wxf::WXFValueList items;
    items.reserve(strings.size());
    for (const auto& s : strings) {
        items.push_back(wxf::WXFValue(s.to_string()));
    }
    return wxf::WXFValue(std::move(items));
}

wxf::WXFValue text_list(const std::vector<std::string>& messages) {
    wxf::WXFValueList items(messages.begin(), messages.end());
    return wxf::WXFValue(std::move(items));
}

} // namespace

std::size_t AnalysisResult::critical_pair_count() const {
    return static_cast<std::size_t>(std::count_if(interactions.begin(), interactions.end(),
        [](const RuleInteraction& i) { return i.is_critical; }));
}

wxf::WXFValue AnalysisResult::to_wxf() const {
    auto key = [](const char* name) { return wxf::WXFValue(std::string(name)); };
    auto count = [](std::size_t n) { return wxf::WXFValue(static_cast<std::int64_t>(n)); };

    wxf::WXFValueAssociation omega_entry;
    omega_entry.emplace_back(key("kind"), wxf::WXFValue(std::string(omega_kind_name(omega.kind))));
    omega_entry.emplace_back(key("states"), string_list(omega.states));

    wxf::WXFValueList pairs;
    for (const auto& interaction : interactions) {
        wxf::WXFValueAssociation entry;
        entry.emplace_back(key("first"), count(interaction.first));
        entry.emplace_back(key("second"), count(interaction.second));
        entry.emplace_back(key("critical"),
                           wxf::WXFValue(wxf::SymbolName{interaction.is_critical ? "True" : "False"}));
        pairs.push_back(wxf::WXFValue(std::move(entry)));
    }

    wxf::WXFValueAssociation root;
    root.emplace_back(key("initial"), wxf::WXFValue(initial.to_string()));
    root.emplace_back(key("start"), wxf::WXFValue(start.to_string()));
    root.emplace_back(key("reachable"), string_list(reachable));
    root.emplace_back(key("omega_limit"), wxf::WXFValue(std::move(omega_entry)));
    root.emplace_back(key("normal_forms"), string_list(normal_forms));
    root.emplace_back(key("graph_vertices"), count(graph_vertices));
    root.emplace_back(key("graph_edges"), count(graph_edges));
    root.emplace_back(key("scc_count"), count(scc_count));
    root.emplace_back(key("largest_scc"), count(largest_scc));
    root.emplace_back(key("attractor_count"), count(attractor_count));
    root.emplace_back(key("rule_interactions"), wxf::WXFValue(std::move(pairs)));
    root.emplace_back(key("overlap_pairs"), count(overlap_pair_count()));
    root.emplace_back(key("critical_pairs"), count(critical_pair_count()));
    root.emplace_back(key("m_local"), wxf::WXFValue(wxf::SymbolName{m_local ? "True" : "False"}));
    root.emplace_back(key("max_overlap"), count(max_overlap));
    root.emplace_back(key("lifting"), lifting.to_wxf());
    root.emplace_back(key("macro_coverage"), wxf::WXFValue(macro_coverage));
    root.emplace_back(key("errors"), text_list(errors));
    root.emplace_back(key("warnings"), text_list(warnings));
    root.emplace_back(key("elapsed_seconds"), wxf::WXFValue(elapsed_seconds));
    return wxf::WXFValue(std::move(root));
}

AnalysisPipeline::AnalysisPipeline(std::vector<Rule> rules, PipelineConfig config)
    : rules_(std::move(rules)), config_(config), engine_(rules_) {
    config_.validate();
    for (const auto& rule : rules_) {
        if (rule.left.empty()) {
            throw std::invalid_argument("Rule " + rule.id + " has an empty left-hand side");
        }
    }
}

void AnalysisPipeline::analyze_dynamics(AnalysisResult& result) const {
    ReachLevels levels = engine_.bounded_reach(result.start, config_.reach_depth, config_.reach_width_limit());
    for (const auto& [level, strings] : levels) {
        result.reachable.insert(result.reachable.end(), strings.begin(), strings.end());
    }

    result.omega = engine_.omega_limit(result.start, config_.omega_max_steps);
    if (!result.omega.is_exact()) {
        result.warnings.push_back("omega limit is an approximation after "
                                  + std::to_string(config_.omega_max_steps) + " steps");
    }

    for (const auto& s : result.reachable) {
        if (engine_.is_normal_form(s)) {
            result.normal_forms.push_back(s);
        }
    }
}

void AnalysisPipeline::analyze_overlaps(AnalysisResult& result) const {
    result.interactions = OverlapDetector::rule_interactions(rules_);
    result.max_overlap = OverlapDetector::get_max_overlap(rules_);
    result.m_local = result.max_overlap <= config_.locality_bound;
    if (!result.m_local) {
        result.warnings.push_back("rules are not " + std::to_string(config_.locality_bound)
                                  + "-local (max overlap " + std::to_string(result.max_overlap) + ")");
    }
}

void AnalysisPipeline::analyze_macros(AnalysisResult& result, MacroDictionary& dictionary) const {
    Alphabet alphabet = Alphabet::binary();
    for (const auto& symbol : result.start.symbols()) {
        alphabet.add_symbol(symbol);
    }

    GraphBuilder builder(rules_, alphabet, config_.num_threads);
    ConfigurationGraph graph = builder.build_from_reach(result.start, config_.reach_depth,
                                                        config_.reach_width_limit());

    SCCDecomposition decomposition = TarjanSCC(graph).find_sccs();
    result.graph_vertices = graph.num_vertices();
    result.graph_edges = graph.num_edges();
    result.scc_count = decomposition.size();
    result.largest_scc = decomposition.largest_component_size();
    result.attractor_count = decomposition.attractors().size();

    MacroLiftingPipeline lifting(rules_, alphabet, config_);
    result.lifting = lifting.run(graph, dictionary);

    std::vector<Macro> macros = dictionary.macros();
    if (!result.reachable.empty() && !macros.empty()) {
        std::size_t covered = static_cast<std::size_t>(std::count_if(result.reachable.begin(), result.reachable.end(),
            [&macros](const String& s) {
                return std::any_of(macros.begin(), macros.end(),
                    [&s](const Macro& macro) { return s.contains(macro.definition); });
            }));
        result.macro_coverage = static_cast<double>(covered) / static_cast<double>(result.reachable.size());
    }
}

AnalysisResult AnalysisPipeline::analyze(const String& initial, MacroDictionary& dictionary) const {
    auto started = std::chrono::steady_clock::now();

    AnalysisResult result;
    result.initial = initial;

    ExpansionResult expanded = dictionary.try_expand(initial, config_.expansion_max_iterations);
    result.start = expanded.value;
    if (!expanded.complete) {
        result.warnings.push_back("macro expansion of the initial string stopped after "
                                  + std::to_string(expanded.iterations) + " iterations");
    }

    // Stage failures are recorded so that independent stages still report
    try {
        analyze_dynamics(result);
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("dynamics: ") + e.what());
        TALLY_LOG(Error, "Analysis dynamics stage failed: %s", e.what());
    }

    try {
        analyze_overlaps(result);
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("overlaps: ") + e.what());
        TALLY_LOG(Error, "Analysis overlap stage failed: %s", e.what());
    }

    try {
        analyze_macros(result, dictionary);
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("macros: ") + e.what());
        TALLY_LOG(Error, "Analysis macro stage failed: %s", e.what());
    }

    result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    TALLY_LOG(Info, "Analysis of %s: %zu reachable, %zu SCCs, %zu macros admitted in %.3fs",
              initial.to_string().c_str(), result.reachable.size(), result.scc_count,
              result.lifting.admitted_count(), result.elapsed_seconds);
    return result;
}

} // namespace tally
