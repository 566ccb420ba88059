/*
 * Minimal JSON value - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toolbox::json {

enum class Type { Null, Bool, Number, String, Array, Object };

// Small DOM for protocol messages. Objects keep insertion order.
class Value {
public:
    using Member = std::pair<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : m_type(Type::Bool), m_bool(b) {}
    Value(int n) : m_type(Type::Number), m_number(n) {}
    Value(long n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
    Value(long long n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
    Value(unsigned long n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
    Value(double n) : m_type(Type::Number), m_number(n) {}
    Value(const char* s) : m_type(Type::String), m_string(s) {}
    Value(std::string s) : m_type(Type::String), m_string(std::move(s)) {}

    static Value array() { Value v; v.m_type = Type::Array; return v; }
    static Value object() { Value v; v.m_type = Type::Object; return v; }

    Type type() const { return m_type; }
    bool is_null() const { return m_type == Type::Null; }
    bool is_bool() const { return m_type == Type::Bool; }
    bool is_number() const { return m_type == Type::Number; }
    bool is_string() const { return m_type == Type::String; }
    bool is_array() const { return m_type == Type::Array; }
    bool is_object() const { return m_type == Type::Object; }

    bool as_bool() const { return m_bool; }
    double as_number() const { return m_number; }
    long long as_int() const { return static_cast<long long>(m_number); }
    const std::string& as_string() const { return m_string; }

    const std::vector<Value>& items() const { return m_items; }
    const std::vector<Member>& members() const { return m_members; }
    size_t size() const { return m_type == Type::Array ? m_items.size() : m_members.size(); }

    // Object access. find() returns nullptr when the key is absent or this is not an object.
    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }
    // Inserts a null member if missing; a null value becomes an object first.
    Value& operator[](const std::string& key);

    // Array append; a null value becomes an array first.
    void push_back(Value v);

    std::string dump() const;

private:
    void dump_to(std::string& out) const;

    Type m_type = Type::Null;
    bool m_bool = false;
    double m_number = 0;
    std::string m_string;
    std::vector<Value> m_items;
    std::vector<Member> m_members;
};

// Strict RFC 8259 parse of a complete document; nullopt with `error` set otherwise.
std::optional<Value> parse(const std::string& text, std::string& error);

std::string escape(const std::string& s);

} // namespace toolbox::json
