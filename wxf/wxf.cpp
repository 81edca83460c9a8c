#include "wxf.hpp"
#include <cstring>
#include <algorithm>
#include <cmath>
#include <limits>

namespace wxf {

namespace {

bool is_little_endian() {
    uint16_t endian_test = 1;
    return *reinterpret_cast<uint8_t*>(&endian_test) == 1;
}

const char* value_kind(const WXFValue& value) {
    switch (value.data.index()) {
        case 0: return "Null";
        case 1: return "Integer";
        case 2: return "Real";
        case 3: return "String";
        case 4: return "Symbol";
        case 5: return "BinaryString";
        case 6: return "List";
        case 7: return "Association";
    }
    return "Unknown";
}

} // namespace

// Accessors

int64_t as_integer(const WXFValue& value) {
    if (!value.holds<int64_t>()) {
        throw TypeError(std::string("Expected Integer, got ") + value_kind(value));
    }
    return value.get<int64_t>();
}

double as_real(const WXFValue& value) {
    if (value.holds<double>()) {
        return value.get<double>();
    }
    if (value.holds<int64_t>()) {
        return static_cast<double>(value.get<int64_t>());
    }
    throw TypeError(std::string("Expected Real, got ") + value_kind(value));
}

bool as_bool(const WXFValue& value) {
    if (value.holds<SymbolName>()) {
        const auto& name = value.get<SymbolName>().name;
        if (name == "True") return true;
        if (name == "False") return false;
    }
    throw TypeError(std::string("Expected True or False, got ") + value_kind(value));
}

const std::string& as_string(const WXFValue& value) {
    if (!value.holds<std::string>()) {
        throw TypeError(std::string("Expected String, got ") + value_kind(value));
    }
    return value.get<std::string>();
}

const WXFValueList& as_list(const WXFValue& value) {
    if (!value.holds<WXFValueList>()) {
        throw TypeError(std::string("Expected List, got ") + value_kind(value));
    }
    return value.get<WXFValueList>();
}

const WXFValueAssociation& as_association(const WXFValue& value) {
    if (!value.holds<WXFValueAssociation>()) {
        throw TypeError(std::string("Expected Association, got ") + value_kind(value));
    }
    return value.get<WXFValueAssociation>();
}

const WXFValue* find_key(const WXFValueAssociation& association, const std::string& key) {
    for (const auto& [k, v] : association) {
        if (k.holds<std::string>() && k.get<std::string>() == key) {
            return &v;
        }
    }
    return nullptr;
}

// Parser implementation

uint8_t Parser::read_byte() {
    ensure_bytes(1);
    return data_[read_position_++];
}

size_t Parser::read_varint() {
    size_t value = 0;
    size_t shift = 0;
    uint8_t byte;

    do {
        byte = read_byte();
        if (shift >= 63) {
            throw ParseError("Varint too large", read_position_ - 1);
        }
        value |= (size_t(byte & 0x7F) << shift);
        shift += 7;
    } while (byte & 0x80);

    return value;
}

void Parser::skip_header() {
    // "8:" uncompressed, "8C:" compressed
    uint8_t first = read_byte();
    uint8_t second = read_byte();

    if (first == '8' && second == ':') {
        return;
    } else if (first == '8' && second == 'C') {
        throw ParseError("Compressed WXF format not supported", 0);
    } else {
        throw ParseError("Invalid WXF header", 0);
    }
}

int8_t Parser::read_int8() {
    if (peek_token() != Token::Integer8) {
        throw TypeError("Expected 8-bit integer", read_position_);
    }
    read_byte();
    return static_cast<int8_t>(read_byte());
}

int16_t Parser::read_int16() {
    if (peek_token() != Token::Integer16) {
        throw TypeError("Expected 16-bit integer", read_position_);
    }
    read_byte();

    ensure_bytes(2);
    uint16_t bits = 0;
    // Little-endian encoding
    for (int i = 0; i < 2; i++) {
        bits |= static_cast<uint16_t>(data_[read_position_ + i]) << (i * 8);
    }
    read_position_ += 2;
    return static_cast<int16_t>(bits);
}

int32_t Parser::read_int32() {
    if (peek_token() != Token::Integer32) {
        throw TypeError("Expected 32-bit integer", read_position_);
    }
    read_byte();

    ensure_bytes(4);
    uint32_t bits = 0;
    for (int i = 0; i < 4; i++) {
        bits |= static_cast<uint32_t>(data_[read_position_ + i]) << (i * 8);
    }
    read_position_ += 4;
    return static_cast<int32_t>(bits);
}

int64_t Parser::read_int64() {
    if (peek_token() != Token::Integer64) {
        throw TypeError("Expected 64-bit integer", read_position_);
    }
    read_byte();

    ensure_bytes(8);
    uint64_t bits = 0;
    for (int i = 0; i < 8; i++) {
        bits |= static_cast<uint64_t>(data_[read_position_ + i]) << (i * 8);
    }
    read_position_ += 8;
    return static_cast<int64_t>(bits);
}

int64_t Parser::read_integer() {
    switch (peek_token()) {
        case Token::Integer8: return read_int8();
        case Token::Integer16: return read_int16();
        case Token::Integer32: return read_int32();
        case Token::Integer64: return read_int64();
        default:
            throw TypeError("Expected integer type", read_position_);
    }
}

double Parser::read_real64() {
    if (peek_token() != Token::Real64) {
        throw TypeError("Expected 64-bit real", read_position_);
    }
    read_byte();

    ensure_bytes(8);
    uint64_t bits;
    std::memcpy(&bits, &data_[read_position_], 8);
    read_position_ += 8;

    if (!is_little_endian()) {
        bits = __builtin_bswap64(bits);
    }

    double value;
    std::memcpy(&value, &bits, 8);
    return value;
}

std::string Parser::read_string() {
    if (peek_token() != Token::String) {
        throw TypeError("Expected string", read_position_);
    }
    read_byte();

    size_t len = read_varint();
    ensure_bytes(len);

    std::string result(reinterpret_cast<const char*>(data_ + read_position_), len);
    read_position_ += len;
    return result;
}

std::string Parser::read_symbol() {
    if (peek_token() != Token::Symbol) {
        throw TypeError("Expected symbol", read_position_);
    }
    read_byte();

    size_t len = read_varint();
    ensure_bytes(len);

    std::string result(reinterpret_cast<const char*>(data_ + read_position_), len);
    read_position_ += len;
    return result;
}

std::vector<uint8_t> Parser::read_binary_string() {
    if (peek_token() != Token::BinaryString) {
        throw TypeError("Expected binary string", read_position_);
    }
    read_byte();

    size_t len = read_varint();
    ensure_bytes(len);

    std::vector<uint8_t> result(data_ + read_position_, data_ + read_position_ + len);
    read_position_ += len;
    return result;
}

WXFValue Parser::read_value() {
    Token token = peek_token();
    reject_unsupported(token);

    switch (token) {
        case Token::Integer8:
        case Token::Integer16:
        case Token::Integer32:
        case Token::Integer64:
            return WXFValue(read_integer());
        case Token::Real64:
            return WXFValue(read_real64());
        case Token::String:
            return WXFValue(read_string());
        case Token::Symbol:
            return WXFValue(SymbolName{read_symbol()});
        case Token::BinaryString:
            return WXFValue(read_binary_string());
        case Token::Function: {
            size_t start = read_position_;
            read_byte();
            size_t len = read_varint();
            std::string head = read_symbol();
            if (head != "List") {
                throw TypeError("Unsupported function head " + head, start);
            }
            WXFValueList items;
            items.reserve(std::min(len, remaining()));
            for (size_t i = 0; i < len; ++i) {
                items.push_back(read_value());
            }
            return WXFValue(std::move(items));
        }
        case Token::Association: {
            read_byte();
            size_t len = read_varint();
            WXFValueAssociation entries;
            entries.reserve(std::min(len, remaining()));
            for (size_t i = 0; i < len; ++i) {
                if (peek_token() != Token::Rule) {
                    throw TypeError("Expected rule marker in association", read_position_);
                }
                read_byte();
                WXFValue key = read_value();
                WXFValue value = read_value();
                entries.emplace_back(std::move(key), std::move(value));
            }
            return WXFValue(std::move(entries));
        }
        default:
            throw ParseError("Unknown token " + std::to_string(static_cast<int>(token)), read_position_);
    }
}

void Parser::ensure_bytes(size_t count) {
    if (count > size_ - read_position_) {
        throw ParseError("Unexpected end of WXF data", read_position_);
    }
}

Token Parser::peek_token() {
    ensure_bytes(1);
    return static_cast<Token>(data_[read_position_]);
}

void Parser::reject_unsupported(Token token) {
    switch (token) {
        case Token::BigInteger:
            throw ParseError("BigInteger not supported", read_position_);
        case Token::BigReal:
            throw ParseError("BigReal not supported", read_position_);
        case Token::DelayedRule:
            throw ParseError("DelayedRule not supported", read_position_);
        case Token::PackedArray:
            throw ParseError("PackedArray not supported", read_position_);
        case Token::NumericArray:
            throw ParseError("NumericArray not supported", read_position_);
        default:
            break;
    }
}

WXFValue deserialize_value(const std::vector<uint8_t>& data) {
    Parser parser(data);
    parser.skip_header();
    WXFValue value = parser.read_value();
    if (!parser.at_end()) {
        throw ParseError("Trailing bytes after expression", parser.position());
    }
    return value;
}

// Writer implementation

void Writer::write_byte(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_varint(size_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value & 0x7F));
}

void Writer::write_header() {
    data_.push_back('8');
    data_.push_back(':');
}

void Writer::write_int8(int8_t value) {
    write_byte(static_cast<uint8_t>(Token::Integer8));
    write_byte(static_cast<uint8_t>(value));
}

void Writer::write_int16(int16_t value) {
    write_byte(static_cast<uint8_t>(Token::Integer16));
    uint16_t bits = static_cast<uint16_t>(value);
    for (int i = 0; i < 2; i++) {
        write_byte(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

void Writer::write_int32(int32_t value) {
    write_byte(static_cast<uint8_t>(Token::Integer32));
    uint32_t bits = static_cast<uint32_t>(value);
    for (int i = 0; i < 4; i++) {
        write_byte(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

void Writer::write_int64(int64_t value) {
    write_byte(static_cast<uint8_t>(Token::Integer64));
    uint64_t bits = static_cast<uint64_t>(value);
    for (int i = 0; i < 8; i++) {
        write_byte(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

void Writer::write_real64(double value) {
    write_byte(static_cast<uint8_t>(Token::Real64));

    // Normalize -0.0 to 0.0 to match Wolfram behavior
    if (value == 0.0 && std::signbit(value)) {
        value = 0.0;
    }

    uint64_t bits;
    std::memcpy(&bits, &value, 8);
    if (!is_little_endian()) {
        bits = __builtin_bswap64(bits);
    }

    for (int i = 0; i < 8; i++) {
        write_byte(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

void Writer::write_string(const std::string& value) {
    write_byte(static_cast<uint8_t>(Token::String));
    write_varint(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_symbol(const std::string& value) {
    write_byte(static_cast<uint8_t>(Token::Symbol));
    write_varint(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_binary_string(const std::vector<uint8_t>& value) {
    write_byte(static_cast<uint8_t>(Token::BinaryString));
    write_varint(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_function(const std::string& head, size_t arg_count) {
    write_byte(static_cast<uint8_t>(Token::Function));
    write_varint(arg_count);
    write_symbol(head);
}

void Writer::write_integer(int64_t value) {
    if (value >= std::numeric_limits<int8_t>::min() && value <= std::numeric_limits<int8_t>::max()) {
        write_int8(static_cast<int8_t>(value));
    } else if (value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max()) {
        write_int16(static_cast<int16_t>(value));
    } else if (value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max()) {
        write_int32(static_cast<int32_t>(value));
    } else {
        write_int64(value);
    }
}

void Writer::write(const WXFValue& value) {
    std::visit([this](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            write_function("List", 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            write_integer(v);
        } else if constexpr (std::is_same_v<T, double>) {
            write_real64(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_string(v);
        } else if constexpr (std::is_same_v<T, SymbolName>) {
            write_symbol(v.name);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            write_binary_string(v);
        } else if constexpr (std::is_same_v<T, WXFValueList>) {
            write_function("List", v.size());
            for (const auto& item : v) {
                write(item);
            }
        } else {
            write_byte(static_cast<uint8_t>(Token::Association));
            write_varint(v.size());
            for (const auto& [key, item] : v) {
                write_byte(static_cast<uint8_t>(Token::Rule));
                write(key);
                write(item);
            }
        }
    }, value.data);
}

std::vector<uint8_t> serialize(const WXFValue& value) {
    Writer writer;
    writer.write_header();
    writer.write(value);
    return writer.release_data();
}

} // namespace wxf
