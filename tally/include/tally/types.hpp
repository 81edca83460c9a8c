#ifndef TALLY_TYPES_HPP
#define TALLY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tally {

/**
 * Atomic alphabet element. Value-equal and hashable.
 * The base alphabet is {0, |}; macro lifting synthesizes further symbols.
 */
class Symbol {
private:
    std::string value_;

public:
    Symbol() = default;
    explicit Symbol(std::string value) : value_(std::move(value)) {}
    explicit Symbol(char c) : value_(1, c) {}

    static Symbol unit() { return Symbol('0'); }
    static Symbol separator() { return Symbol('|'); }

    const std::string& value() const { return value_; }

    bool is_unit() const { return value_.size() == 1 && value_[0] == '0'; }
    bool is_separator() const { return value_.size() == 1 && value_[0] == '|'; }
    bool is_base() const { return is_unit() || is_separator(); }

    bool operator==(const Symbol& other) const { return value_ == other.value_; }
    bool operator!=(const Symbol& other) const { return value_ != other.value_; }
    bool operator<(const Symbol& other) const { return value_ < other.value_; }
};

class Alphabet;

/**
 * Immutable finite sequence of symbols.
 * Equality, ordering and hashing are structural; the hash is computed once on
 * construction since content never changes afterwards.
 */
class String {
private:
    std::vector<Symbol> symbols_;
    std::size_t hash_;

    std::size_t compute_hash() const;

public:
    String() : hash_(compute_hash()) {}
    explicit String(std::vector<Symbol> symbols)
        : symbols_(std::move(symbols)), hash_(compute_hash()) {}

    /**
     * One symbol per character: "00|0" -> [0, 0, |, 0].
     */
    static String from_str(std::string_view text);

    /**
     * Build 0^b1 | 0^b2 | ... | 0^bn.
     */
    static String from_blocks(const std::vector<std::size_t>& blocks,
                              const Symbol& separator = Symbol::separator());

    std::size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }
    const Symbol& operator[](std::size_t index) const { return symbols_[index]; }
    const std::vector<Symbol>& symbols() const { return symbols_; }
    std::size_t hash() const { return hash_; }

    std::string to_string() const;

    /**
     * Arithmetic view: lengths of the maximal runs of 0 delimited by |.
     * "00|000|0" -> [2, 3, 1], "0||0" -> [1, 0, 1]. A trailing separator does
     * not open a new block and the empty string has no blocks.
     * Symbols other than 0 and | are ignored.
     */
    std::vector<std::size_t> get_blocks() const;

    // True if every symbol belongs to the alphabet
    bool validate(const Alphabet& alphabet) const;

    String substr(std::size_t position, std::size_t length) const;
    String concat(const String& other) const;

    bool matches_at(const String& pattern, std::size_t position) const;
    bool contains(const String& pattern) const;
    bool contains_symbol(const Symbol& symbol) const;
    std::size_t count(const Symbol& symbol) const;

    bool operator==(const String& other) const {
        return hash_ == other.hash_ && symbols_ == other.symbols_;
    }
    bool operator!=(const String& other) const { return !(*this == other); }
    bool operator<(const String& other) const;
};

/**
 * Ordered, extensible symbol set. Iteration follows insertion order so that
 * enumeration over the alphabet is reproducible.
 */
class Alphabet {
private:
    std::vector<Symbol> symbols_;
    std::unordered_set<std::string> lookup_;

public:
    Alphabet() = default;
    explicit Alphabet(const std::vector<Symbol>& symbols);

    static Alphabet binary();

    // Returns the existing symbol if already present
    Symbol add_symbol(const Symbol& symbol);

    bool contains(const Symbol& symbol) const {
        return lookup_.count(symbol.value()) > 0;
    }

    std::size_t size() const { return symbols_.size(); }
    const std::vector<Symbol>& symbols() const { return symbols_; }
    std::vector<Symbol>::const_iterator begin() const { return symbols_.begin(); }
    std::vector<Symbol>::const_iterator end() const { return symbols_.end(); }

    std::string to_string() const;
};

struct StringHash {
    std::size_t operator()(const String& s) const { return s.hash(); }
};

using StringSet = std::unordered_set<String, StringHash>;

} // namespace tally

namespace std {
    template<>
    struct hash<tally::Symbol> {
        std::size_t operator()(const tally::Symbol& symbol) const {
            return std::hash<std::string>{}(symbol.value());
        }
    };

    template<>
    struct hash<tally::String> {
        std::size_t operator()(const tally::String& s) const {
            return s.hash();
        }
    };
}

#endif // TALLY_TYPES_HPP
