/*
 * Minimal JSON value implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/json/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace toolbox::json {

const Value* Value::find(const std::string& key) const {
    if (m_type != Type::Object) return nullptr;
    for (auto& m : m_members) if (m.first == key) return &m.second;
    return nullptr;
}

Value& Value::operator[](const std::string& key) {
    if (m_type == Type::Null) m_type = Type::Object;
    for (auto& m : m_members) if (m.first == key) return m.second;
    m_members.emplace_back(key, Value());
    return m_members.back().second;
}

void Value::push_back(Value v) {
    if (m_type == Type::Null) m_type = Type::Array;
    m_items.push_back(std::move(v));
}

// Length of the well-formed UTF-8 sequence at in[i], or 0. Overlong forms,
// surrogates and code points past U+10FFFF are not well-formed.
static size_t utf8_sequence(const std::string& in, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(in[k]); };
    auto cont = [&](size_t k) { return k < in.size() && (byte(k) & 0xC0) == 0x80; };
    unsigned char c = byte(i);
    if (c < 0x80) return 1;
    if (c >= 0xC2 && c <= 0xDF) return cont(i + 1) ? 2 : 0;
    if (c >= 0xE0 && c <= 0xEF) {
        if (!cont(i + 1) || !cont(i + 2)) return 0;
        unsigned char c1 = byte(i + 1);
        if (c == 0xE0 && c1 < 0xA0) return 0;
        if (c == 0xED && c1 > 0x9F) return 0;
        return 3;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return 0;
        unsigned char c1 = byte(i + 1);
        if (c == 0xF0 && c1 < 0x90) return 0;
        if (c == 0xF4 && c1 > 0x8F) return 0;
        return 4;
    }
    return 0;
}

std::string escape(const std::string& in) {
    std::string out; out.reserve(in.size() + 16);
    for (size_t i = 0; i < in.size();) {
        char c = in[i];
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else if (size_t n = utf8_sequence(in, i)) {
                    out.append(in, i, n);
                    i += n;
                    continue;
                } else {
                    out += "\\ufffd"; // one replacement per invalid byte
                }
        }
        ++i;
    }
    return out;
}

std::string Value::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

void Value::dump_to(std::string& out) const {
    switch (m_type) {
        case Type::Null: out += "null"; break;
        case Type::Bool: out += m_bool ? "true" : "false"; break;
        case Type::Number: {
            if (!std::isfinite(m_number)) { out += "null"; break; }
            char buf[32];
            if (std::floor(m_number) == m_number && std::fabs(m_number) < 1e15)
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(m_number));
            else
                std::snprintf(buf, sizeof(buf), "%.17g", m_number);
            out += buf;
            break;
        }
        case Type::String: out += '"'; out += escape(m_string); out += '"'; break;
        case Type::Array:
            out += '[';
            for (size_t i = 0; i < m_items.size(); ++i) {
                if (i) out += ',';
                m_items[i].dump_to(out);
            }
            out += ']';
            break;
        case Type::Object:
            out += '{';
            for (size_t i = 0; i < m_members.size(); ++i) {
                if (i) out += ',';
                out += '"'; out += escape(m_members[i].first); out += "\":";
                m_members[i].second.dump_to(out);
            }
            out += '}';
            break;
    }
}

namespace {

const int kMaxDepth = 256;

class Parser {
public:
    explicit Parser(const std::string& s) : m_s(s) {}

    std::optional<Value> document(std::string& error) {
        Value v;
        skip_ws();
        if (!value(v, 0)) { error = m_error; return std::nullopt; }
        skip_ws();
        if (m_pos != m_s.size()) { error = "unexpected trailing characters at offset " + std::to_string(m_pos); return std::nullopt; }
        return v;
    }

private:
    bool fail(const std::string& what) {
        if (m_error.empty()) m_error = what + " at offset " + std::to_string(m_pos);
        return false;
    }
    void skip_ws() {
        while (m_pos < m_s.size() && (m_s[m_pos] == ' ' || m_s[m_pos] == '\t' || m_s[m_pos] == '\n' || m_s[m_pos] == '\r')) ++m_pos;
    }
    bool literal(const char* word) {
        size_t n = std::char_traits<char>::length(word);
        if (m_s.compare(m_pos, n, word) != 0) return fail("invalid literal");
        m_pos += n;
        return true;
    }

    bool value(Value& out, int depth) {
        if (depth > kMaxDepth) return fail("nesting too deep");
        if (m_pos >= m_s.size()) return fail("unexpected end of input");
        char c = m_s[m_pos];
        switch (c) {
            case 'n': if (!literal("null")) return false; out = Value(); return true;
            case 't': if (!literal("true")) return false; out = Value(true); return true;
            case 'f': if (!literal("false")) return false; out = Value(false); return true;
            case '"': { std::string s; if (!string(s)) return false; out = Value(std::move(s)); return true; }
            case '[': return array(out, depth);
            case '{': return object(out, depth);
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return number(out);
                return fail("unexpected character");
        }
    }

    bool number(Value& out) {
        size_t start = m_pos;
        if (m_s[m_pos] == '-') ++m_pos;
        if (m_pos >= m_s.size() || !std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) return fail("invalid number");
        if (m_s[m_pos] == '0') ++m_pos;
        else while (m_pos < m_s.size() && std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) ++m_pos;
        if (m_pos < m_s.size() && m_s[m_pos] == '.') {
            ++m_pos;
            if (m_pos >= m_s.size() || !std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) return fail("invalid number");
            while (m_pos < m_s.size() && std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) ++m_pos;
        }
        if (m_pos < m_s.size() && (m_s[m_pos] == 'e' || m_s[m_pos] == 'E')) {
            ++m_pos;
            if (m_pos < m_s.size() && (m_s[m_pos] == '+' || m_s[m_pos] == '-')) ++m_pos;
            if (m_pos >= m_s.size() || !std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) return fail("invalid number");
            while (m_pos < m_s.size() && std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) ++m_pos;
        }
        out = Value(std::strtod(m_s.substr(start, m_pos - start).c_str(), nullptr));
        return true;
    }

    bool hex4(unsigned& cp) {
        if (m_pos + 4 > m_s.size()) return fail("truncated \\u escape");
        cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = m_s[m_pos++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else return fail("invalid \\u escape");
        }
        return true;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) out.push_back(static_cast<char>(cp));
        else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool string(std::string& out) {
        ++m_pos; // opening quote
        while (true) {
            if (m_pos >= m_s.size()) return fail("unterminated string");
            char c = m_s[m_pos++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
            if (c != '\\') { out.push_back(c); continue; }
            if (m_pos >= m_s.size()) return fail("unterminated string");
            char e = m_s[m_pos++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = 0;
                    if (!hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        unsigned lo = 0;
                        if (m_s.compare(m_pos, 2, "\\u") != 0) return fail("unpaired surrogate");
                        m_pos += 2;
                        if (!hex4(lo)) return false;
                        if (lo < 0xDC00 || lo > 0xDFFF) return fail("unpaired surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        return fail("unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: return fail("invalid escape");
            }
        }
    }

    bool array(Value& out, int depth) {
        ++m_pos;
        out = Value::array();
        skip_ws();
        if (m_pos < m_s.size() && m_s[m_pos] == ']') { ++m_pos; return true; }
        while (true) {
            Value item;
            skip_ws();
            if (!value(item, depth + 1)) return false;
            out.push_back(std::move(item));
            skip_ws();
            if (m_pos >= m_s.size()) return fail("unterminated array");
            char c = m_s[m_pos++];
            if (c == ']') return true;
            if (c != ',') return fail("expected ',' or ']'");
        }
    }

    bool object(Value& out, int depth) {
        ++m_pos;
        out = Value::object();
        skip_ws();
        if (m_pos < m_s.size() && m_s[m_pos] == '}') { ++m_pos; return true; }
        while (true) {
            skip_ws();
            if (m_pos >= m_s.size() || m_s[m_pos] != '"') return fail("expected string key");
            std::string key;
            if (!string(key)) return false;
            skip_ws();
            if (m_pos >= m_s.size() || m_s[m_pos] != ':') return fail("expected ':'");
            ++m_pos;
            skip_ws();
            Value v;
            if (!value(v, depth + 1)) return false;
            out[key] = std::move(v);
            skip_ws();
            if (m_pos >= m_s.size()) return fail("unterminated object");
            char c = m_s[m_pos++];
            if (c == '}') return true;
            if (c != ',') return fail("expected ',' or '}'");
        }
    }

    const std::string& m_s;
    size_t m_pos = 0;
    std::string m_error;
};

} // namespace

std::optional<Value> parse(const std::string& text, std::string& error) {
    Parser p(text);
    return p.document(error);
}

} // namespace toolbox::json
