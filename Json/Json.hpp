#pragma once
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tsched::json {

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const { return offset_; }
private:
    std::size_t offset_;
};

// Порядок ключей объекта сохраняется (payload пишем как пришёл)
class Value {
public:
    using Array  = std::vector<Value>;
    using Object = std::vector<std::pair<std::string, Value>>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : v_(b) {}
    Value(int i) : v_(static_cast<std::int64_t>(i)) {}
    Value(long i) : v_(static_cast<std::int64_t>(i)) {}
    Value(long long i) : v_(static_cast<std::int64_t>(i)) {}
    Value(unsigned i) : v_(static_cast<std::int64_t>(i)) {}
    Value(double d) : v_(d) {}
    Value(const char* s) : v_(std::string(s)) {}
    Value(std::string s) : v_(std::move(s)) {}
    Value(Array a) : v_(std::move(a)) {}
    Value(Object o) : v_(std::move(o)) {}

    static Value object() { return Value(Object{}); }
    static Value array()  { return Value(Array{}); }

    bool isNull()   const { return std::holds_alternative<std::nullptr_t>(v_); }
    bool isBool()   const { return std::holds_alternative<bool>(v_); }
    bool isInt()    const { return std::holds_alternative<std::int64_t>(v_); }
    bool isDouble() const { return std::holds_alternative<double>(v_); }
    bool isNumber() const { return isInt() || isDouble(); }
    bool isString() const { return std::holds_alternative<std::string>(v_); }
    bool isArray()  const { return std::holds_alternative<Array>(v_); }
    bool isObject() const { return std::holds_alternative<Object>(v_); }

    bool asBool() const { return get<bool>("bool"); }
    std::int64_t asInt() const {
        if (isDouble()) {
            double d = std::get<double>(v_);
            if (std::floor(d) != d) throw std::runtime_error("json: number is not an integer");
            // 2^63 точно представимо в double
            if (d < -9223372036854775808.0 || d >= 9223372036854775808.0)
                throw std::runtime_error("json: integer out of int64 range");
            return static_cast<std::int64_t>(d);
        }
        return get<std::int64_t>("integer");
    }
    double asDouble() const {
        if (isInt()) return static_cast<double>(std::get<std::int64_t>(v_));
        return get<double>("number");
    }
    const std::string& asString() const { return get<std::string>("string"); }
    const Array&  asArray()  const { return get<Array>("array"); }
    Array&        asArray()        { return getMut<Array>("array"); }
    const Object& asObject() const { return get<Object>("object"); }
    Object&       asObject()       { return getMut<Object>("object"); }

    // nullptr если ключа нет или это не объект
    const Value* find(const std::string& key) const {
        if (!isObject()) return nullptr;
        for (const auto& kv : std::get<Object>(v_))
            if (kv.first == key) return &kv.second;
        return nullptr;
    }

    // вставка/замена ключа; null превращается в объект
    Value& operator[](const std::string& key) {
        if (isNull()) v_ = Object{};
        auto& obj = getMut<Object>("object");
        for (auto& kv : obj)
            if (kv.first == key) return kv.second;
        obj.emplace_back(key, Value{});
        return obj.back().second;
    }

    void push_back(Value v) {
        if (isNull()) v_ = Array{};
        getMut<Array>("array").push_back(std::move(v));
    }

    std::string getString(const std::string& key, const std::string& def = "") const {
        const Value* v = find(key);
        return (v && v->isString()) ? v->asString() : def;
    }

    std::size_t size() const {
        if (isArray())  return std::get<Array>(v_).size();
        if (isObject()) return std::get<Object>(v_).size();
        return 0;
    }

    friend bool operator==(const Value& a, const Value& b) { return a.v_ == b.v_; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

    std::string dump(int indent = -1) const {
        std::string out;
        dumpTo(out, indent, 0);
        return out;
    }

    static Value parse(const std::string& text);

private:
    template <class T>
    const T& get(const char* name) const {
        if (auto p = std::get_if<T>(&v_)) return *p;
        throw std::runtime_error(std::string("json: value is not a ") + name);
    }
    template <class T>
    T& getMut(const char* name) {
        if (auto p = std::get_if<T>(&v_)) return *p;
        throw std::runtime_error(std::string("json: value is not a ") + name);
    }

    void dumpTo(std::string& out, int indent, int depth) const;

    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> v_{nullptr};
};

// -------------------------- ESCAPE --------------------------

inline std::string escape(const std::string& s) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

inline std::string formatNumber(double d) {
    if (!std::isfinite(d)) return "null";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string s(buf, res.ptr);
    // 1e+20 и 3 тоже валидный JSON, но оставим признак double
    if (s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

inline void Value::dumpTo(std::string& out, int indent, int depth) const {
    auto newline = [&](int d) {
        if (indent < 0) return;
        out += '\n';
        out.append(static_cast<std::size_t>(indent * d), ' ');
    };

    if (isNull()) { out += "null"; return; }
    if (isBool()) { out += std::get<bool>(v_) ? "true" : "false"; return; }
    if (isInt())  { out += std::to_string(std::get<std::int64_t>(v_)); return; }
    if (isDouble()) { out += formatNumber(std::get<double>(v_)); return; }
    if (isString()) { out += '"'; out += escape(std::get<std::string>(v_)); out += '"'; return; }

    if (isArray()) {
        const auto& a = std::get<Array>(v_);
        out += '[';
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (i) out += ',';
            newline(depth + 1);
            a[i].dumpTo(out, indent, depth + 1);
        }
        if (!a.empty()) newline(depth);
        out += ']';
        return;
    }

    const auto& o = std::get<Object>(v_);
    out += '{';
    for (std::size_t i = 0; i < o.size(); ++i) {
        if (i) out += ',';
        newline(depth + 1);
        out += '"'; out += escape(o[i].first); out += '"';
        out += indent < 0 ? ":" : ": ";
        o[i].second.dumpTo(out, indent, depth + 1);
    }
    if (!o.empty()) newline(depth);
    out += '}';
}

// -------------------------- PARSER --------------------------

namespace detail {

class Parser {
public:
    explicit Parser(const std::string& s) : s_(s) {}

    Value parseDocument() {
        Value v = parseValue(0);
        skipWs();
        if (i_ != s_.size()) fail("trailing characters");
        return v;
    }

private:
    static constexpr int kMaxDepth = 128;

    const std::string& s_;
    std::size_t i_{0};

    [[noreturn]] void fail(const std::string& what) const { throw ParseError(what, i_); }

    void skipWs() {
        while (i_ < s_.size() && (s_[i_] == ' ' || s_[i_] == '\n' || s_[i_] == '\r' || s_[i_] == '\t')) ++i_;
    }

    bool consume(const char* lit) {
        std::size_t n = std::char_traits<char>::length(lit);
        if (s_.compare(i_, n, lit) != 0) return false;
        i_ += n;
        return true;
    }

    Value parseValue(int depth) {
        if (depth > kMaxDepth) fail("nesting too deep");
        skipWs();
        if (i_ >= s_.size()) fail("unexpected end of input");

        char c = s_[i_];
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == '"') return Value(parseString());
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
        if (consume("true"))  return Value(true);
        if (consume("false")) return Value(false);
        if (consume("null"))  return Value(nullptr);
        fail(std::string("unexpected character '") + c + "'");
    }

    Value parseObject(int depth) {
        ++i_; // {
        Value::Object obj;
        skipWs();
        if (i_ < s_.size() && s_[i_] == '}') { ++i_; return Value(std::move(obj)); }
        for (;;) {
            skipWs();
            if (i_ >= s_.size() || s_[i_] != '"') fail("expected object key");
            std::string key = parseString();
            skipWs();
            if (i_ >= s_.size() || s_[i_] != ':') fail("expected ':'");
            ++i_;
            obj.emplace_back(std::move(key), parseValue(depth + 1));
            skipWs();
            if (i_ < s_.size() && s_[i_] == ',') { ++i_; continue; }
            if (i_ < s_.size() && s_[i_] == '}') { ++i_; break; }
            fail("expected ',' or '}'");
        }
        return Value(std::move(obj));
    }

    Value parseArray(int depth) {
        ++i_; // [
        Value::Array arr;
        skipWs();
        if (i_ < s_.size() && s_[i_] == ']') { ++i_; return Value(std::move(arr)); }
        for (;;) {
            arr.push_back(parseValue(depth + 1));
            skipWs();
            if (i_ < s_.size() && s_[i_] == ',') { ++i_; continue; }
            if (i_ < s_.size() && s_[i_] == ']') { ++i_; break; }
            fail("expected ',' or ']'");
        }
        return Value(std::move(arr));
    }

    unsigned parseHex4() {
        if (i_ + 4 > s_.size()) fail("truncated \\u escape");
        unsigned cp = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s_[i_++];
            cp <<= 4;
            if (h >= '0' && h <= '9')      cp |= unsigned(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= unsigned(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= unsigned(h - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return cp;
    }

    static void appendUtf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += char(cp);
        } else if (cp < 0x800) {
            out += char(0xC0 | (cp >> 6));
            out += char(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += char(0xE0 | (cp >> 12));
            out += char(0x80 | ((cp >> 6) & 0x3F));
            out += char(0x80 | (cp & 0x3F));
        } else {
            out += char(0xF0 | (cp >> 18));
            out += char(0x80 | ((cp >> 12) & 0x3F));
            out += char(0x80 | ((cp >> 6) & 0x3F));
            out += char(0x80 | (cp & 0x3F));
        }
    }

    std::string parseString() {
        ++i_; // "
        std::string out;
        while (i_ < s_.size()) {
            char c = s_[i_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') { out += c; continue; }

            if (i_ >= s_.size()) break;
            char e = s_[i_++];
            switch (e) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    unsigned cp = parseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // суррогатная пара
                        if (!consume("\\u")) fail("lone high surrogate");
                        unsigned lo = parseHex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("bad low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("lone low surrogate");
                    }
                    appendUtf8(out, cp);
                    break;
                }
                default: fail(std::string("bad escape '\\") + e + "'");
            }
        }
        fail("unterminated string");
    }

    Value parseNumber() {
        std::size_t start = i_;
        bool isFloat = false;
        if (s_[i_] == '-') ++i_;
        if (i_ >= s_.size() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) fail("bad number");
        if (s_[i_] == '0') {
            ++i_;
        } else {
            while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
        }
        if (i_ < s_.size() && s_[i_] == '.') {
            isFloat = true;
            ++i_;
            if (i_ >= s_.size() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) fail("bad fraction");
            while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
        }
        if (i_ < s_.size() && (s_[i_] == 'e' || s_[i_] == 'E')) {
            isFloat = true;
            ++i_;
            if (i_ < s_.size() && (s_[i_] == '+' || s_[i_] == '-')) ++i_;
            if (i_ >= s_.size() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) fail("bad exponent");
            while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
        }

        const char* first = s_.data() + start;
        const char* last  = s_.data() + i_;
        if (!isFloat) {
            std::int64_t v = 0;
            auto r = std::from_chars(first, last, v);
            if (r.ec == std::errc() && r.ptr == last) return Value(static_cast<long long>(v));
            // не влезло в int64: читаем как double
        }
        double d = 0;
        auto r = std::from_chars(first, last, d);
        if (r.ec != std::errc() || r.ptr != last) fail("number out of range");
        return Value(d);
    }
};

} // namespace detail

inline Value Value::parse(const std::string& text) {
    return detail::Parser(text).parseDocument();
}

} // namespace tsched::json
