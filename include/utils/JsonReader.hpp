/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Lifeline {

class JsonValue;

// Ordered so documents written back to disk keep a stable key order
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
std::ostream &operator<<(std::ostream &os, JsonType type);

/**
 * @brief In-memory JSON document node.
 *
 * Config documents are read into this tree, migrated as trees, then written
 * back with JsonWriter. Numbers are doubles; integers up to 2^53 survive a
 * read/write cycle exactly.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

private:
  ValueType m_value;

public:
  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(int64_t value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(const JsonArray &value) : m_value(value) {}
  explicit JsonValue(JsonArray &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const JsonObject &value) : m_value(value) {}
  explicit JsonValue(JsonObject &&value) : m_value(std::move(value)) {}

  static JsonValue object() { return JsonValue(JsonObject{}); }
  static JsonValue array() { return JsonValue(JsonArray{}); }

  JsonType getType() const;
  bool isNull() const {
    return std::holds_alternative<std::nullptr_t>(m_value);
  }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on a type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Member lookups with a fallback for absent or mistyped keys
  double getNumber(const std::string &key, double fallback) const;
  int getInt(const std::string &key, int fallback) const;
  bool getBool(const std::string &key, bool fallback) const;
  std::string getString(const std::string &key,
                        const std::string &fallback) const;

  bool hasKey(const std::string &key) const;
  bool erase(const std::string &key);
  const JsonValue &operator[](const std::string &key) const;
  JsonValue &operator[](const std::string &key);

  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](size_t index);
  size_t size() const;
  void push(JsonValue value);

  /**
   * @brief Recursively copies every member of @p overlay into this object.
   *
   * Objects merge key by key, anything else replaces. Keys that exist only
   * here are left alone.
   */
  void overlay(const JsonValue &overlay);

  bool operator==(const JsonValue &other) const {
    return m_value == other.m_value;
  }
  bool operator!=(const JsonValue &other) const { return !(*this == other); }

  // Compact single-line form
  std::string toString() const;
};

/**
 * @brief Serializes a JsonValue tree with indentation and full escaping.
 */
class JsonWriter {
public:
  explicit JsonWriter(int indent = 2) : m_indent(indent) {}

  std::string write(const JsonValue &value) const;
  bool writeToFile(const JsonValue &value, const std::string &path) const;

  static std::string escapeString(const std::string &text);
  static std::string formatNumber(double value);

private:
  void writeValue(std::string &out, const JsonValue &value, int depth) const;
  void newline(std::string &out, int depth) const;

  int m_indent;
};

class JsonReader {
public:
  JsonReader();

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  JsonValue takeRoot() { return std::move(m_root); }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseLiteral(const char *literal, JsonValue value, JsonValue &out);
  bool parseUnicodeEscape(uint32_t &codepoint);
  static void appendUtf8(std::string &out, uint32_t codepoint);

  char peek() const;
  char advance();
  bool consume(char expected);
  void skipWhitespace();
  bool atEnd() const { return m_position >= m_input.length(); }
  bool fail(const std::string &message);

  std::string m_input;
  size_t m_position;
  size_t m_line;
  size_t m_column;
  std::string m_lastError;
  JsonValue m_root;
};

} // namespace Lifeline

#endif // JSONREADER_HPP
