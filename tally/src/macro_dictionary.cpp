#include <tally/macro_dictionary.hpp>
#include <tally/debug_log.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace tally {

namespace {

wxf::WXFValue text(const std::string& value) {
    return wxf::WXFValue(value);
}

wxf::WXFValue boolean(bool value) {
    return wxf::WXFValue(wxf::SymbolName{value ? "True" : "False"});
}

wxf::WXFValue integer(std::int64_t value) {
    return wxf::WXFValue(value);
}

wxf::WXFValue metadata_value_to_wxf(const MetadataValue& value) {
    return std::visit([](const auto& v) -> wxf::WXFValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return boolean(v);
        } else {
            return wxf::WXFValue(v);
        }
    }, value);
}

MetadataValue metadata_value_from_wxf(const wxf::WXFValue& value) {
    if (value.holds<wxf::SymbolName>()) {
        return wxf::as_bool(value);
    }
    if (value.holds<std::int64_t>()) {
        return value.get<std::int64_t>();
    }
    if (value.holds<double>()) {
        return value.get<double>();
    }
    return wxf::as_string(value);
}

const wxf::WXFValue& require_key(const wxf::WXFValueAssociation& association, const std::string& key) {
    const wxf::WXFValue* value = wxf::find_key(association, key);
    if (!value) {
        throw wxf::TypeError("Missing key \"" + key + "\" in macro dictionary");
    }
    return *value;
}

Macro macro_from_wxf(const wxf::WXFValue& value) {
    const auto& entry = wxf::as_association(value);

    Symbol symbol(wxf::as_string(require_key(entry, "symbol")));

    // The symbol list is authoritative; the flat string splits per character
    String definition;
    if (const auto* symbols = wxf::find_key(entry, "symbols")) {
        std::vector<Symbol> parts;
        for (const auto& part : wxf::as_list(*symbols)) {
            parts.emplace_back(wxf::as_string(part));
        }
        definition = String(std::move(parts));
    } else {
        definition = String::from_str(wxf::as_string(require_key(entry, "definition")));
    }

    bool verified = false;
    if (const auto* flag = wxf::find_key(entry, "verified")) {
        verified = wxf::as_bool(*flag);
    }

    Metadata metadata;
    if (const auto* meta = wxf::find_key(entry, "metadata")) {
        for (const auto& [key, item] : wxf::as_association(*meta)) {
            metadata[wxf::as_string(key)] = metadata_value_from_wxf(item);
        }
    }

    try {
        return Macro::create(symbol, definition, std::move(metadata), verified);
    } catch (const std::invalid_argument& e) {
        throw wxf::TypeError(std::string("Invalid macro in dictionary: ") + e.what());
    }
}

/**
 * Symbol of a macro whose definition reaches back to itself through other
 * macros of the list. DFS with an explicit stack of (macro, next symbol).
 */
std::optional<Symbol> find_definition_cycle(const std::vector<Macro>& macros) {
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < macros.size(); ++i) {
        index.emplace(macros[i].symbol.value(), i);
    }

    enum class Mark { Unvisited, OnStack, Done };
    std::vector<Mark> marks(macros.size(), Mark::Unvisited);

    for (std::size_t root = 0; root < macros.size(); ++root) {
        if (marks[root] != Mark::Unvisited) continue;

        std::vector<std::pair<std::size_t, std::size_t>> stack{{root, 0}};
        marks[root] = Mark::OnStack;
        while (!stack.empty()) {
            std::size_t current = stack.back().first;
            std::size_t next = stack.back().second;
            const auto& symbols = macros[current].definition.symbols();
            if (next == symbols.size()) {
                marks[current] = Mark::Done;
                stack.pop_back();
                continue;
            }
            stack.back().second++;

            auto it = index.find(symbols[next].value());
            if (it == index.end()) continue;
            if (marks[it->second] == Mark::OnStack) {
                return macros[it->second].symbol;
            }
            if (marks[it->second] == Mark::Unvisited) {
                marks[it->second] = Mark::OnStack;
                stack.emplace_back(it->second, 0);
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::int64_t MacroDictionary::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::size_t MacroDictionary::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return macros_.size();
}

std::vector<Macro> MacroDictionary::macros() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return macros_;
}

std::vector<HistoryEntry> MacroDictionary::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::vector<Rule> MacroDictionary::rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Rule> result;
    result.reserve(macros_.size() * 2);
    for (const auto& macro : macros_) {
        result.push_back(macro.elimination);
        result.push_back(macro.introduction);
    }
    return result;
}

std::optional<Macro> MacroDictionary::get_macro(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& macro : macros_) {
        if (macro.symbol == symbol) {
            return macro;
        }
    }
    return std::nullopt;
}

bool MacroDictionary::contains_symbol(const Symbol& symbol) const {
    return get_macro(symbol).has_value();
}

bool MacroDictionary::contains_definition(const String& definition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(macros_.begin(), macros_.end(),
        [&definition](const Macro& macro) { return macro.definition == definition; });
}

Symbol MacroDictionary::next_free_symbol(const Alphabet& alphabet, const std::vector<Symbol>& reserved) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto is_free = [&](const Symbol& candidate) {
        if (alphabet.contains(candidate)) return false;
        if (std::find(reserved.begin(), reserved.end(), candidate) != reserved.end()) return false;
        return std::none_of(macros_.begin(), macros_.end(),
            [&candidate](const Macro& macro) { return macro.symbol == candidate; });
    };

    for (char c = 'A'; c <= 'Z'; ++c) {
        Symbol candidate(c);
        if (is_free(candidate)) {
            return candidate;
        }
    }

    for (std::size_t n = 1;; ++n) {
        Symbol candidate("M" + std::to_string(n));
        if (is_free(candidate)) {
            return candidate;
        }
    }
}

void MacroDictionary::check_admissible_locked(const Macro& macro) const {
    for (const auto& existing : macros_) {
        if (existing.symbol == macro.symbol) {
            throw std::invalid_argument("Macro symbol " + macro.symbol.value() + " is already defined");
        }
    }

    // Admission and loading both keep the macros acyclic, so this expansion terminates
    ExpansionResult expanded = expand_locked(macro.definition, DEFAULT_MAX_ITERATIONS);
    if (expanded.value.contains_symbol(macro.symbol)) {
        throw std::invalid_argument("Macro " + macro.to_string() + " expands back into its own symbol");
    }
}

std::optional<std::int64_t> MacroDictionary::compare_and_append(const Macro& macro, std::int64_t expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (version_ != expected_version) {
        return std::nullopt;
    }
    check_admissible_locked(macro);

    macros_.push_back(macro);
    ++version_;
    history_.push_back({version_, "add", macro.to_string(), macro.symbol.value()});

    TALLY_LOG(Debug, "MacroDictionary: %s appended at version %lld",
              macro.to_string().c_str(), static_cast<long long>(version_));
    return version_;
}

std::int64_t MacroDictionary::admit(const Macro& macro) {
    while (true) {
        if (auto assigned = compare_and_append(macro, version())) {
            return *assigned;
        }
    }
}

ExpansionResult MacroDictionary::expand_locked(const String& string, std::size_t max_iterations) const {
    String current = string;
    std::size_t iterations = 0;
    bool changed = true;

    while (changed && iterations < max_iterations) {
        changed = false;
        ++iterations;

        for (const auto& macro : macros_) {
            if (!current.contains_symbol(macro.symbol)) continue;

            std::vector<Symbol> symbols;
            symbols.reserve(current.size() + macro.definition.size());
            for (const auto& symbol : current.symbols()) {
                if (symbol == macro.symbol) {
                    symbols.insert(symbols.end(), macro.definition.symbols().begin(), macro.definition.symbols().end());
                } else {
                    symbols.push_back(symbol);
                }
            }
            current = String(std::move(symbols));
            changed = true;
        }
    }

    bool complete = std::none_of(macros_.begin(), macros_.end(),
        [&current](const Macro& macro) { return current.contains_symbol(macro.symbol); });
    return {current, complete, iterations};
}

ExpansionResult MacroDictionary::try_expand(const String& string, std::size_t max_iterations) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expand_locked(string, max_iterations);
}

String MacroDictionary::expand(const String& string, std::size_t max_iterations) const {
    ExpansionResult result = try_expand(string, max_iterations);
    if (!result.complete) {
        TALLY_LOG(Warning, "Macro expansion of %s stopped after %zu iterations: %s",
                  string.to_string().c_str(), result.iterations, result.value.to_string().c_str());
    }
    return result.value;
}

wxf::WXFValue MacroDictionary::to_wxf() const {
    std::lock_guard<std::mutex> lock(mutex_);

    wxf::WXFValueList macros;
    for (const auto& macro : macros_) {
        wxf::WXFValueList symbols;
        for (const auto& symbol : macro.definition.symbols()) {
            symbols.push_back(text(symbol.value()));
        }

        wxf::WXFValueAssociation metadata;
        for (const auto& [key, value] : macro.metadata) {
            metadata.emplace_back(text(key), metadata_value_to_wxf(value));
        }

        wxf::WXFValueAssociation entry;
        entry.emplace_back(text("symbol"), text(macro.symbol.value()));
        entry.emplace_back(text("definition"), text(macro.definition.to_string()));
        entry.emplace_back(text("symbols"), wxf::WXFValue(std::move(symbols)));
        entry.emplace_back(text("verified"), boolean(macro.verified));
        entry.emplace_back(text("metadata"), wxf::WXFValue(std::move(metadata)));
        macros.push_back(wxf::WXFValue(std::move(entry)));
    }

    wxf::WXFValueList history;
    for (const auto& record : history_) {
        wxf::WXFValueAssociation entry;
        entry.emplace_back(text("version"), integer(record.version));
        entry.emplace_back(text("action"), text(record.action));
        entry.emplace_back(text("macro"), text(record.macro));
        entry.emplace_back(text("symbol"), text(record.symbol));
        history.push_back(wxf::WXFValue(std::move(entry)));
    }

    wxf::WXFValueAssociation root;
    root.emplace_back(text("version"), integer(version_));
    root.emplace_back(text("macros"), wxf::WXFValue(std::move(macros)));
    root.emplace_back(text("history"), wxf::WXFValue(std::move(history)));
    return wxf::WXFValue(std::move(root));
}

void MacroDictionary::from_wxf(const wxf::WXFValue& value) {
    const auto& root = wxf::as_association(value);

    std::int64_t version = wxf::as_integer(require_key(root, "version"));
    if (version < 1) {
        throw wxf::TypeError("Macro dictionary version must be positive, got " + std::to_string(version));
    }

    std::vector<Macro> macros;
    for (const auto& item : wxf::as_list(require_key(root, "macros"))) {
        Macro macro = macro_from_wxf(item);
        bool duplicate = std::any_of(macros.begin(), macros.end(),
            [&macro](const Macro& other) { return other.symbol == macro.symbol; });
        if (duplicate) {
            throw wxf::TypeError("Duplicate macro symbol " + macro.symbol.value());
        }
        macros.push_back(std::move(macro));
    }
    if (auto symbol = find_definition_cycle(macros)) {
        throw wxf::TypeError("Macro " + symbol->value() + " expands back into its own symbol");
    }

    std::vector<HistoryEntry> history;
    if (const auto* records = wxf::find_key(root, "history")) {
        for (const auto& item : wxf::as_list(*records)) {
            const auto& entry = wxf::as_association(item);
            history.push_back({
                wxf::as_integer(require_key(entry, "version")),
                wxf::as_string(require_key(entry, "action")),
                wxf::as_string(require_key(entry, "macro")),
                wxf::as_string(require_key(entry, "symbol"))
            });
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    macros_.swap(macros);
    history_.swap(history);
    version_ = version;
}

void MacroDictionary::save_to_file(const std::string& path) const {
    std::vector<uint8_t> bytes = wxf::serialize(to_wxf());
    std::string temporary = path + ".tmp";

    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceError("Cannot open temporary dictionary file", temporary);
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temporary, ignored);
            TALLY_LOG(Error, "Failed writing macro dictionary to %s", temporary.c_str());
            throw PersistenceError("Failed writing dictionary", temporary);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        TALLY_LOG(Error, "Failed replacing %s: %s", path.c_str(), ec.message().c_str());
        throw PersistenceError("Cannot replace dictionary file (" + ec.message() + ")", path);
    }

    TALLY_LOG(Info, "Saved %zu macros to %s", size(), path.c_str());
}

void MacroDictionary::load_from_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        TALLY_LOG(Error, "Cannot open macro dictionary %s", path.c_str());
        throw PersistenceError("Cannot open dictionary file", path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw PersistenceError("Failed reading dictionary file", path);
    }

    from_wxf(wxf::deserialize_value(bytes));
    TALLY_LOG(Info, "Loaded %zu macros (version %lld) from %s",
              size(), static_cast<long long>(version()), path.c_str());
}

} // namespace tally
