#include <tally/config.hpp>
#include <stdexcept>
#include <string>

namespace tally {

namespace {

// Single field table shared by to_wxf and from_wxf
template<typename Config, typename Visitor>
void for_each_field(Config& config, Visitor&& visit) {
    visit("max_length", config.max_length);
    visit("reach_depth", config.reach_depth);
    visit("reach_width", config.reach_width);
    visit("omega_max_steps", config.omega_max_steps);
    visit("locality_bound", config.locality_bound);
    visit("min_macro_length", config.min_macro_length);
    visit("max_macro_length", config.max_macro_length);
    visit("min_scc_size", config.min_scc_size);
    visit("candidates_per_scc", config.candidates_per_scc);
    visit("max_candidates", config.max_candidates);
    visit("confluence_depth", config.confluence_depth);
    visit("confluence_width", config.confluence_width);
    visit("max_critical_strings", config.max_critical_strings);
    visit("bisimulation_max_length", config.bisimulation_max_length);
    visit("bisimulation_depth", config.bisimulation_depth);
    visit("bisimulation_width", config.bisimulation_width);
    visit("bisimulation_tests", config.bisimulation_tests);
    visit("expansion_max_iterations", config.expansion_max_iterations);
    visit("num_threads", config.num_threads);
}

} // namespace

void PipelineConfig::validate() const {
    if (min_macro_length == 0) {
        throw std::invalid_argument("min_macro_length must be at least 1");
    }
    if (min_macro_length > max_macro_length) {
        throw std::invalid_argument("min_macro_length (" + std::to_string(min_macro_length)
            + ") exceeds max_macro_length (" + std::to_string(max_macro_length) + ")");
    }
    if (min_scc_size == 0) {
        throw std::invalid_argument("min_scc_size must be at least 1");
    }
}

wxf::WXFValue PipelineConfig::to_wxf() const {
    wxf::WXFValueAssociation entries;
    for_each_field(*this, [&entries](const char* key, std::size_t value) {
        entries.emplace_back(wxf::WXFValue(std::string(key)),
                             wxf::WXFValue(static_cast<std::int64_t>(value)));
    });
    return wxf::WXFValue(std::move(entries));
}

PipelineConfig PipelineConfig::from_wxf(const wxf::WXFValue& value) {
    const auto& entries = wxf::as_association(value);

    PipelineConfig config;
    for_each_field(config, [&entries](const char* key, std::size_t& field) {
        if (const auto* item = wxf::find_key(entries, key)) {
            std::int64_t raw = wxf::as_integer(*item);
            if (raw < 0) {
                throw wxf::TypeError(std::string("Negative value for ") + key);
            }
            field = static_cast<std::size_t>(raw);
        }
    });
    return config;
}

} // namespace tally
