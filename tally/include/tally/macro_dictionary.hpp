#ifndef TALLY_MACRO_DICTIONARY_HPP
#define TALLY_MACRO_DICTIONARY_HPP

#include <tally/macro_system.hpp>
#include <wxf/wxf.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tally {

class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& message, const std::string& path)
        : std::runtime_error(message + ": " + path), path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

struct HistoryEntry {
    std::int64_t version;
    std::string action;
    std::string macro;      // Macro::to_string() at admission time
    std::string symbol;
};

struct ExpansionResult {
    String value;
    bool complete;              // False when the iteration cap stopped expansion
    std::size_t iterations;
};

/**
 * Versioned, append-only macro dictionary.
 *
 * The version starts at 1 and is bumped by every admission; each admission
 * appends one history entry carrying the new version. All access goes through
 * one mutex, and admission is a compare-and-append on the version so that
 * concurrent writers cannot both claim the same version.
 */
class MacroDictionary {
private:
    mutable std::mutex mutex_;
    std::vector<Macro> macros_;
    std::int64_t version_ = 1;
    std::vector<HistoryEntry> history_;

    // Caller holds mutex_
    ExpansionResult expand_locked(const String& string, std::size_t max_iterations) const;
    void check_admissible_locked(const Macro& macro) const;

public:
    static constexpr std::size_t DEFAULT_MAX_ITERATIONS = 100;

    MacroDictionary() = default;
    MacroDictionary(const MacroDictionary&) = delete;
    MacroDictionary& operator=(const MacroDictionary&) = delete;

    std::int64_t version() const;
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // Snapshots
    std::vector<Macro> macros() const;
    std::vector<HistoryEntry> history() const;

    // Elimination then introduction rule of every macro, in admission order
    std::vector<Rule> rules() const;

    std::optional<Macro> get_macro(const Symbol& symbol) const;
    bool contains_symbol(const Symbol& symbol) const;
    bool contains_definition(const String& definition) const;

    /**
     * First of A..Z that is neither in the alphabet, nor a macro, nor
     * reserved; then M1, M2, ...
     */
    Symbol next_free_symbol(const Alphabet& alphabet, const std::vector<Symbol>& reserved = {}) const;

    /**
     * Append if the dictionary is still at `expected_version`.
     * Returns the new version, or nullopt if another writer got there first.
     * Throws std::invalid_argument when the symbol is taken or the definition
     * would expand back into the macro's own symbol.
     */
    std::optional<std::int64_t> compare_and_append(const Macro& macro, std::int64_t expected_version);

    // Unconditional append; returns the new version
    std::int64_t admit(const Macro& macro);

    /**
     * Replace macro symbols by their definitions until a pass changes
     * nothing or max_iterations passes have run.
     */
    ExpansionResult try_expand(const String& string, std::size_t max_iterations = DEFAULT_MAX_ITERATIONS) const;

    // try_expand, logging a warning when the cap is hit
    String expand(const String& string, std::size_t max_iterations = DEFAULT_MAX_ITERATIONS) const;

    /**
     * Association with "version", "macros" (symbol, definition as a flat
     * string, symbols, verified, metadata) and "history".
     */
    wxf::WXFValue to_wxf() const;

    /**
     * Replace the contents. Decoding happens before anything is swapped in,
     * so a malformed value leaves the dictionary unchanged.
     * Throws wxf::TypeError on shape mismatches.
     */
    void from_wxf(const wxf::WXFValue& value);

    /**
     * Write to a sibling temporary file and rename it over `path`.
     * Throws PersistenceError on I/O failure.
     */
    void save_to_file(const std::string& path) const;

    // Throws PersistenceError if unreadable, wxf::WXFException if malformed
    void load_from_file(const std::string& path);
};

} // namespace tally

#endif // TALLY_MACRO_DICTIONARY_HPP
