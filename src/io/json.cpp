// SPDX-License-Identifier: BSD-3-Clause
// Minimal JSON support: recursive descent parser, zero dependencies.
#include "recede/io/json.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace recede::io {

// ─── JsonValue ───────────────────────────────────────────────────────────────

namespace {

template <typename T>
const T& get(const JsonValue& v, const char* expected) {
    if (const auto* p = std::get_if<T>(&v.data)) return *p;
    throw std::runtime_error(std::string("JSON value is not ") + expected);
}

}  // namespace

double JsonValue::asNumber() const { return get<double>(*this, "a number"); }
bool JsonValue::asBool() const { return get<bool>(*this, "a boolean"); }
const std::string& JsonValue::asString() const { return get<std::string>(*this, "a string"); }
const JsonObject& JsonValue::asObject() const { return get<JsonObject>(*this, "an object"); }
const JsonArray& JsonValue::asArray() const { return get<JsonArray>(*this, "an array"); }

const JsonValue& JsonValue::operator[](std::string_view key) const {
    if (const auto* v = find(key)) return *v;
    throw std::runtime_error("JSON key not found: " + std::string(key));
}

const JsonValue* JsonValue::find(std::string_view key) const {
    if (!isObject()) return nullptr;
    for (const auto& [k, v] : asObject()) {
        if (k == key) return &v;
    }
    return nullptr;
}

// ─── Parser ──────────────────────────────────────────────────────────────────

namespace {

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input), pos_(0) {}

    JsonValue parse() {
        auto val = parseValue();
        skipWhitespace();
        if (pos_ != input_.size()) fail("trailing characters");
        return val;
    }

private:
    std::string_view input_;
    std::size_t pos_;
    int depth_{0};

    /// Counts one level of object/array nesting while alive.
    class NestingGuard {
    public:
        explicit NestingGuard(JsonParser& parser) : parser_(parser) {
            if (++parser_.depth_ > kMaxJsonDepth) parser_.fail("nesting too deep");
        }
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        JsonParser& parser_;
    };

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) +
                                 ": " + what);
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }

    char advance() {
        if (pos_ >= input_.size()) fail("unexpected end of input");
        return input_[pos_++];
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])))
            ++pos_;
    }

    void expect(char c) {
        skipWhitespace();
        if (advance() != c) fail(std::string("expected '") + c + "'");
    }

    JsonValue parseValue() {
        skipWhitespace();
        switch (peek()) {
            case '"': return JsonValue{parseString()};
            case '{': return parseObject();
            case '[': return parseArray();
            case 't':
            case 'f': return parseBool();
            case 'n': return parseNull();
            default:  return parseNumber();
        }
    }

    std::string parseString() {
        expect('"');
        std::string s;
        while (true) {
            char c = advance();
            if (c == '"') break;
            if (c != '\\') {
                s += c;
                continue;
            }
            char e = advance();
            switch (e) {
                case 'n': s += '\n'; break;
                case 't': s += '\t'; break;
                case 'r': s += '\r'; break;
                case 'b': s += '\b'; break;
                case 'f': s += '\f'; break;
                case 'u': {
                    // Basic Multilingual Plane only, encoded as UTF-8
                    if (pos_ + 4 > input_.size()) fail("truncated \\u escape");
                    unsigned code = 0;
                    auto [p, ec] = std::from_chars(input_.data() + pos_,
                                                   input_.data() + pos_ + 4, code, 16);
                    if (ec != std::errc{} || p != input_.data() + pos_ + 4)
                        fail("invalid \\u escape");
                    pos_ += 4;
                    if (code < 0x80) {
                        s += static_cast<char>(code);
                    } else if (code < 0x800) {
                        s += static_cast<char>(0xC0 | (code >> 6));
                        s += static_cast<char>(0x80 | (code & 0x3F));
                    } else {
                        s += static_cast<char>(0xE0 | (code >> 12));
                        s += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                        s += static_cast<char>(0x80 | (code & 0x3F));
                    }
                    break;
                }
                default: s += e; break;  // \" \\ \/
            }
        }
        return s;
    }

    JsonValue parseNumber() {
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        while (pos_ < input_.size()) {
            char c = input_[pos_];
            bool sign_after_exp = (c == '+' || c == '-') && pos_ > start &&
                                  (input_[pos_ - 1] == 'e' || input_[pos_ - 1] == 'E');
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.' && c != 'e' &&
                c != 'E' && !sign_after_exp)
                break;
            ++pos_;
        }
        double val = 0;
        auto [p, ec] = std::from_chars(input_.data() + start, input_.data() + pos_, val);
        if (start == pos_ || ec != std::errc{} || p != input_.data() + pos_) {
            pos_ = start;
            fail("invalid value");
        }
        return JsonValue{val};
    }

    JsonValue parseObject() {
        NestingGuard guard(*this);
        expect('{');
        JsonObject obj;
        skipWhitespace();
        if (peek() == '}') { ++pos_; return JsonValue{obj}; }
        while (true) {
            auto key = parseString();
            expect(':');
            auto val = parseValue();
            obj.emplace_back(std::move(key), std::move(val));
            skipWhitespace();
            if (peek() == '}') { ++pos_; break; }
            expect(',');
            skipWhitespace();
        }
        return JsonValue{std::move(obj)};
    }

    JsonValue parseArray() {
        NestingGuard guard(*this);
        expect('[');
        JsonArray arr;
        skipWhitespace();
        if (peek() == ']') { ++pos_; return JsonValue{arr}; }
        while (true) {
            arr.push_back(parseValue());
            skipWhitespace();
            if (peek() == ']') { ++pos_; break; }
            expect(',');
        }
        return JsonValue{std::move(arr)};
    }

    JsonValue parseBool() {
        if (input_.substr(pos_, 4) == "true")  { pos_ += 4; return JsonValue{true}; }
        if (input_.substr(pos_, 5) == "false") { pos_ += 5; return JsonValue{false}; }
        fail("invalid literal");
    }

    JsonValue parseNull() {
        if (input_.substr(pos_, 4) == "null") { pos_ += 4; return JsonValue{nullptr}; }
        fail("invalid literal");
    }
};

void writeString(std::ostream& os, const std::string& s) {
    os << '"';
    for (char c : s) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\t': os << "\\t"; break;
            case '\r': os << "\\r"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    os << "\\u00" << kHex[(c >> 4) & 0xF] << kHex[c & 0xF];
                } else {
                    os << c;
                }
                break;
        }
    }
    os << '"';
}

}  // anonymous namespace

JsonValue parseJson(std::string_view text) {
    return JsonParser(text).parse();
}

// ─── Writer ──────────────────────────────────────────────────────────────────

std::string formatNumber(double v) {
    // JSON has no inf/nan
    if (!std::isfinite(v)) return "null";
    std::array<char, 32> buf{};
    auto [p, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (ec != std::errc{}) return "null";
    return std::string(buf.data(), p);
}

void writeJson(std::ostream& os, const JsonValue& value) {
    std::visit([&os](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, double>) {
            os << formatNumber(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(os, v);
        } else if constexpr (std::is_same_v<T, bool>) {
            os << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            os << "null";
        } else if constexpr (std::is_same_v<T, JsonObject>) {
            os << '{';
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) os << ',';
                writeString(os, v[i].first);
                os << ':';
                writeJson(os, v[i].second);
            }
            os << '}';
        } else {
            os << '[';
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) os << ',';
                writeJson(os, v[i]);
            }
            os << ']';
        }
    }, value.data);
}

std::string dumpJson(const JsonValue& value) {
    std::ostringstream ss;
    writeJson(ss, value);
    return ss.str();
}

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("Cannot open file: " + path.string());
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

JsonValue toJsonArray(const VecX& v) {
    JsonArray arr;
    arr.reserve(static_cast<std::size_t>(v.size()));
    for (Index i = 0; i < v.size(); ++i) {
        arr.push_back(JsonValue{static_cast<double>(v[i])});
    }
    return JsonValue{std::move(arr)};
}

VecX toVecX(const JsonValue& v) {
    const auto& arr = v.asArray();
    VecX out(static_cast<Index>(arr.size()));
    for (std::size_t i = 0; i < arr.size(); ++i) {
        out[static_cast<Index>(i)] = static_cast<Scalar>(arr[i].asNumber());
    }
    return out;
}

}  // namespace recede::io
