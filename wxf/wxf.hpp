#ifndef WXF_HPP
#define WXF_HPP

#include <vector>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <cstdint>
#include <utility>
#include <variant>

/**
 * Wolfram Exchange Format (WXF) codec.
 * Covers the uncompressed atomic tokens, Function and Association; used as the
 * on-disk and interchange format for dictionaries, configurations and reports.
 */
namespace wxf {

// WXF token bytes
enum class Token : uint8_t {
    // Atomic types
    String = 'S',           // UTF-8 string
    Symbol = 's',           // Wolfram symbol
    BigInteger = 'I',       // Arbitrary precision integer
    BigReal = 'R',          // Arbitrary precision real

    // Numeric types
    Integer8 = 'C',
    Integer16 = 'j',
    Integer32 = 'i',
    Integer64 = 'L',
    Real64 = 'r',           // IEEE 754 double precision

    // Structured types
    Function = 'f',         // Function[head, args...]
    Association = 'A',      // Association[key1->val1, ...]
    Rule = '-',             // Rule marker (key->value)
    DelayedRule = ':',
    BinaryString = 'B',

    PackedArray = 0xC1,
    NumericArray = 0xC2,
};

class WXFException : public std::runtime_error {
public:
    WXFException(const std::string& message, size_t position = 0)
        : std::runtime_error(message), position_(position) {}

    size_t position() const noexcept { return position_; }

private:
    size_t position_;
};

class ParseError : public WXFException {
public:
    ParseError(const std::string& message, size_t position = 0)
        : WXFException("Parse error: " + message, position) {}
};

class TypeError : public WXFException {
public:
    TypeError(const std::string& message, size_t position = 0)
        : WXFException("Type error: " + message, position) {}
};

// Symbol name, kept distinct from String so True/False survive a round trip
struct SymbolName {
    std::string name;

    bool operator==(const SymbolName& other) const { return name == other.name; }
};

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
struct WXFValue;

using WXFValueList = std::vector<WXFValue>;
using WXFValueAssociation = std::vector<std::pair<WXFValue, WXFValue>>;  // Insertion-ordered

/**
 * Decoded WXF expression tree. Lists are Function[List, ...]; other heads are
 * rejected by Parser::read_value().
 */
struct WXFValue {
    std::variant<
        std::monostate,           // Null/empty
        int64_t,
        double,
        std::string,
        SymbolName,
        std::vector<uint8_t>,     // BinaryString
        WXFValueList,
        WXFValueAssociation
    > data;

    WXFValue() : data(std::monostate{}) {}

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, WXFValue>>>
    WXFValue(T&& value) : data(std::forward<T>(value)) {}

    template<typename T>
    T& get() { return std::get<T>(data); }

    template<typename T>
    const T& get() const { return std::get<T>(data); }

    template<typename T>
    bool holds() const { return std::holds_alternative<T>(data); }
};
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

// Typed accessors; throw TypeError when the value has a different shape
int64_t as_integer(const WXFValue& value);
double as_real(const WXFValue& value);       // Integers widen to double
bool as_bool(const WXFValue& value);         // Symbols True / False
const std::string& as_string(const WXFValue& value);
const WXFValueList& as_list(const WXFValue& value);
const WXFValueAssociation& as_association(const WXFValue& value);

// Value under a string key, or nullptr when absent
const WXFValue* find_key(const WXFValueAssociation& association, const std::string& key);

/**
 * WXF Parser - decodes WXF binary data
 */
class Parser {
private:
    const uint8_t* data_;
    size_t size_;
    size_t read_position_;

public:
    explicit Parser(const uint8_t* data, size_t size)
        : data_(data), size_(size), read_position_(0) {}

    explicit Parser(const std::vector<uint8_t>& data)
        : Parser(data.data(), data.size()) {}

    uint8_t read_byte();
    size_t read_varint();
    void skip_header();

    int8_t read_int8();
    int16_t read_int16();
    int32_t read_int32();
    int64_t read_int64();
    double read_real64();
    std::string read_string();
    std::string read_symbol();
    std::vector<uint8_t> read_binary_string();

    // Any integer width, widened to int64
    int64_t read_integer();

    /**
     * Read one complete expression into a WXFValue tree.
     */
    WXFValue read_value();

    size_t position() const noexcept { return read_position_; }
    size_t remaining() const noexcept { return size_ - read_position_; }
    bool at_end() const noexcept { return read_position_ >= size_; }

private:
    void ensure_bytes(size_t count);
    Token peek_token();
    void reject_unsupported(Token token);
};

/**
 * WXF Writer - encodes WXF binary data
 */
class Writer {
private:
    std::vector<uint8_t> data_;

public:
    Writer() = default;

    void write_byte(uint8_t value);
    void write_varint(size_t value);
    void write_header();

    void write_int8(int8_t value);
    void write_int16(int16_t value);
    void write_int32(int32_t value);
    void write_int64(int64_t value);
    void write_real64(double value);
    void write_string(const std::string& value);
    void write_symbol(const std::string& value);
    void write_binary_string(const std::vector<uint8_t>& value);

    // Smallest integer token that holds the value, as Wolfram does
    void write_integer(int64_t value);

    // Heterogeneous trees; null is written as an empty list
    void write(const WXFValue& value);

    void write_function(const std::string& head, size_t arg_count);

    const std::vector<uint8_t>& data() const noexcept { return data_; }
    std::vector<uint8_t> release_data() noexcept { return std::move(data_); }
    void clear() noexcept { data_.clear(); }
    size_t size() const noexcept { return data_.size(); }
};

// Header plus one expression
std::vector<uint8_t> serialize(const WXFValue& value);

// Header plus exactly one expression; trailing bytes are a ParseError
WXFValue deserialize_value(const std::vector<uint8_t>& data);

} // namespace wxf

#endif // WXF_HPP
