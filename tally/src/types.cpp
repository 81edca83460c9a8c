#include <tally/types.hpp>
#include <algorithm>
#include <stdexcept>

namespace tally {

std::size_t String::compute_hash() const {
    std::size_t seed = symbols_.size();
    std::hash<std::string> hasher;
    for (const auto& symbol : symbols_) {
        seed ^= hasher(symbol.value()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

String String::from_str(std::string_view text) {
    std::vector<Symbol> symbols;
    symbols.reserve(text.size());
    for (char c : text) {
        symbols.emplace_back(c);
    }
    return String(std::move(symbols));
}

String String::from_blocks(const std::vector<std::size_t>& blocks, const Symbol& separator) {
    std::vector<Symbol> symbols;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) {
            symbols.push_back(separator);
        }
        symbols.insert(symbols.end(), blocks[i], Symbol::unit());
    }
    return String(std::move(symbols));
}

std::string String::to_string() const {
    std::string result;
    result.reserve(symbols_.size());
    for (const auto& symbol : symbols_) {
        result += symbol.value();
    }
    return result;
}

std::vector<std::size_t> String::get_blocks() const {
    std::vector<std::size_t> blocks;
    std::size_t current = 0;

    for (const auto& symbol : symbols_) {
        if (symbol.is_unit()) {
            ++current;
        } else if (symbol.is_separator()) {
            blocks.push_back(current);
            current = 0;
        }
    }

    if (current > 0 || (!symbols_.empty() && !symbols_.back().is_separator())) {
        blocks.push_back(current);
    }

    return blocks;
}

bool String::validate(const Alphabet& alphabet) const {
    return std::all_of(symbols_.begin(), symbols_.end(),
        [&alphabet](const Symbol& s) { return alphabet.contains(s); });
}

String String::substr(std::size_t position, std::size_t length) const {
    if (position > symbols_.size()) {
        throw std::out_of_range("String::substr position past end");
    }
    std::size_t end = std::min(symbols_.size(), position + length);
    return String(std::vector<Symbol>(symbols_.begin() + position, symbols_.begin() + end));
}

String String::concat(const String& other) const {
    std::vector<Symbol> symbols;
    symbols.reserve(symbols_.size() + other.symbols_.size());
    symbols.insert(symbols.end(), symbols_.begin(), symbols_.end());
    symbols.insert(symbols.end(), other.symbols_.begin(), other.symbols_.end());
    return String(std::move(symbols));
}

bool String::matches_at(const String& pattern, std::size_t position) const {
    if (position + pattern.size() > symbols_.size()) {
        return false;
    }
    return std::equal(pattern.symbols_.begin(), pattern.symbols_.end(),
                      symbols_.begin() + position);
}

bool String::contains(const String& pattern) const {
    if (pattern.empty()) {
        return true;
    }
    return std::search(symbols_.begin(), symbols_.end(),
                       pattern.symbols_.begin(), pattern.symbols_.end()) != symbols_.end();
}

bool String::contains_symbol(const Symbol& symbol) const {
    return std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end();
}

std::size_t String::count(const Symbol& symbol) const {
    return static_cast<std::size_t>(std::count(symbols_.begin(), symbols_.end(), symbol));
}

bool String::operator<(const String& other) const {
    if (symbols_.size() != other.symbols_.size()) {
        return symbols_.size() < other.symbols_.size();
    }
    return symbols_ < other.symbols_;
}

Alphabet::Alphabet(const std::vector<Symbol>& symbols) {
    for (const auto& symbol : symbols) {
        add_symbol(symbol);
    }
}

Alphabet Alphabet::binary() {
    return Alphabet({Symbol::unit(), Symbol::separator()});
}

Symbol Alphabet::add_symbol(const Symbol& symbol) {
    if (lookup_.insert(symbol.value()).second) {
        symbols_.push_back(symbol);
    }
    return symbol;
}

std::string Alphabet::to_string() const {
    std::string result = "{";
    for (std::size_t i = 0; i < symbols_.size(); ++i) {
        if (i > 0) result += ", ";
        result += symbols_[i].value();
    }
    result += "}";
    return result;
}

} // namespace tally
