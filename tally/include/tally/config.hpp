#ifndef TALLY_CONFIG_HPP
#define TALLY_CONFIG_HPP

#include <wxf/wxf.hpp>
#include <cstddef>
#include <optional>

namespace tally {

/**
 * Budgets and thresholds for analysis and macro lifting.
 * Every bound is a hard computational budget: hitting it yields a partial
 * result, never an error. A width of 0 means unbounded.
 */
struct PipelineConfig {
    // Configuration graph G_L (standalone lifting)
    std::size_t max_length = 5;

    // Exploration from the initial string
    std::size_t reach_depth = 10;
    std::size_t reach_width = 0;
    std::size_t omega_max_steps = 1000;

    // Overlap analysis
    std::size_t locality_bound = 1;

    // Macro mining
    std::size_t min_macro_length = 2;
    std::size_t max_macro_length = 10;
    std::size_t min_scc_size = 3;
    std::size_t candidates_per_scc = 20;
    std::size_t max_candidates = 20;

    // Local confluence
    std::size_t confluence_depth = 5;
    std::size_t confluence_width = 50;
    std::size_t max_critical_strings = 20;

    // Bounded bisimulation
    std::size_t bisimulation_max_length = 5;
    std::size_t bisimulation_depth = 3;
    std::size_t bisimulation_width = 30;
    std::size_t bisimulation_tests = 10;

    std::size_t expansion_max_iterations = 100;

    // 1 = serial, 0 = hardware concurrency
    std::size_t num_threads = 1;

    std::optional<std::size_t> reach_width_limit() const {
        return reach_width == 0 ? std::nullopt : std::optional<std::size_t>(reach_width);
    }

    // Throws std::invalid_argument on inconsistent settings
    void validate() const;

    wxf::WXFValue to_wxf() const;

    /**
     * Unknown keys are ignored and missing keys keep their defaults.
     * Throws wxf::TypeError for non-integer or negative values.
     */
    static PipelineConfig from_wxf(const wxf::WXFValue& value);
};

} // namespace tally

#endif // TALLY_CONFIG_HPP
