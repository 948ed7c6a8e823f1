/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <ostream>
#include <sstream>

namespace Lifeline {

namespace {
// Nesting guard for hostile or corrupted documents
constexpr int MAX_DEPTH = 128;
} // namespace

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

// JsonValue implementation
JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

double JsonValue::getNumber(const std::string &key, double fallback) const {
  return (*this)[key].tryAsNumber().value_or(fallback);
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  return (*this)[key].tryAsInt().value_or(fallback);
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

bool JsonValue::erase(const std::string &key) {
  return isObject() && asObject().erase(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  if (!isObject())
    return nullValue;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue nullValue;
  if (!isArray() || index >= asArray().size())
    return nullValue;
  return asArray()[index];
}

JsonValue &JsonValue::operator[](size_t index) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  auto &arr = asArray();
  if (index >= arr.size()) {
    arr.resize(index + 1);
  }
  return arr[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

void JsonValue::push(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
}

void JsonValue::overlay(const JsonValue &overlay) {
  if (!overlay.isObject() || !isObject()) {
    *this = overlay;
    return;
  }
  auto &target = asObject();
  for (const auto &[key, value] : overlay.asObject()) {
    auto it = target.find(key);
    if (it != target.end() && it->second.isObject() && value.isObject()) {
      it->second.overlay(value);
    } else {
      target[key] = value;
    }
  }
}

std::string JsonValue::toString() const { return JsonWriter(0).write(*this); }

// JsonWriter implementation
std::string JsonWriter::write(const JsonValue &value) const {
  std::string out;
  writeValue(out, value, 0);
  if (m_indent > 0) {
    out += '\n';
  }
  return out;
}

bool JsonWriter::writeToFile(const JsonValue &value,
                             const std::string &path) const {
  std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  file << write(value);
  file.flush();
  return file.good();
}

std::string JsonWriter::escapeString(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buffer;
      } else {
        out += c;
      }
      break;
    }
  }
  out += '"';
  return out;
}

std::string JsonWriter::formatNumber(double value) {
  if (!std::isfinite(value)) {
    return "null"; // JSON has no representation for NaN/Inf
  }
  if (std::floor(value) == value && std::abs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  // Shortest text that reads back to the same double
  char buffer[32];
  auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  return std::string(buffer, result.ptr);
}

void JsonWriter::newline(std::string &out, int depth) const {
  if (m_indent <= 0) {
    return;
  }
  out += '\n';
  out.append(static_cast<size_t>(depth * m_indent), ' ');
}

void JsonWriter::writeValue(std::string &out, const JsonValue &value,
                            int depth) const {
  switch (value.getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += value.asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    out += formatNumber(value.asNumber());
    break;
  case JsonType::String:
    out += escapeString(value.asString());
    break;
  case JsonType::Array: {
    const auto &arr = value.asArray();
    if (arr.empty()) {
      out += "[]";
      break;
    }
    out += '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        out += ',';
      newline(out, depth + 1);
      writeValue(out, arr[i], depth + 1);
    }
    newline(out, depth);
    out += ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = value.asObject();
    if (obj.empty()) {
      out += "{}";
      break;
    }
    out += '{';
    bool first = true;
    for (const auto &[key, member] : obj) {
      if (!first)
        out += ',';
      first = false;
      newline(out, depth + 1);
      out += escapeString(key);
      out += m_indent > 0 ? ": " : ":";
      writeValue(out, member, depth + 1);
    }
    newline(out, depth);
    out += '}';
    break;
  }
  }
}

// JsonReader implementation
JsonReader::JsonReader() : m_position(0), m_line(1), m_column(1) {}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected content after JSON value");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
  return false;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  if (peek() != expected) {
    return false;
  }
  advance();
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      break;
    }
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character: ") + c);
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject members;

  skipWhitespace();
  if (consume('}')) {
    out = JsonValue(std::move(members));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }

    skipWhitespace();
    if (!consume(':')) {
      return fail("Expected ':' after object key");
    }

    JsonValue member;
    if (!parseValue(member, depth + 1)) {
      return false;
    }
    members[key] = std::move(member);

    skipWhitespace();
    if (consume(',')) {
      continue;
    }
    if (consume('}')) {
      break;
    }
    return fail("Expected '}' or ',' in object");
  }

  out = JsonValue(std::move(members));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray elements;

  skipWhitespace();
  if (consume(']')) {
    out = JsonValue(std::move(elements));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1)) {
      return false;
    }
    elements.push_back(std::move(element));

    skipWhitespace();
    if (consume(',')) {
      continue;
    }
    if (consume(']')) {
      break;
    }
    return fail("Expected ']' or ',' in array");
  }

  out = JsonValue(std::move(elements));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    char c = advance();

    if (c == '"') {
      return true;
    }

    if (c == '\\') {
      if (atEnd()) {
        return fail("Unexpected end of input in string escape");
      }
      char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out += escaped;
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u': {
        uint32_t codepoint = 0;
        if (!parseUnicodeEscape(codepoint)) {
          return false;
        }
        // Combine UTF-16 surrogate pairs
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
          uint32_t low = 0;
          if (!consume('\\') || !consume('u') || !parseUnicodeEscape(low) ||
              low < 0xDC00 || low > 0xDFFF) {
            return fail("Invalid UTF-16 surrogate pair");
          }
          codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        }
        appendUtf8(out, codepoint);
        break;
      }
      default:
        return fail(std::string("Invalid escape sequence: \\") + escaped);
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    } else {
      out += c;
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  consume('-');
  if (peek() == '0') {
    advance();
  } else if (peek() >= '0' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  } else {
    return fail("Invalid number format");
  }

  if (consume('.')) {
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Invalid number format: expected digit after decimal point");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Invalid number format: expected digit in exponent");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  double number = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto result = std::from_chars(first, last, number);
  if (result.ec != std::errc() || result.ptr != last) {
    return fail("Number out of range: " + std::string(first, last));
  }
  out = JsonValue(number);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (!consume(*p)) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
  }
  out = std::move(value);
  return true;
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
    advance();
    codepoint = (codepoint << 4) | digit;
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // namespace Lifeline
