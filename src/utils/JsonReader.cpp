/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace PolyForge {

namespace {

constexpr int kMaxDepth = 64;

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
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

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\r':
      stream << "\\r";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << "\\u" << std::hex << std::setw(4) << std::setfill('0')
               << static_cast<int>(c) << std::dec;
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}

} // anonymous namespace

// JsonValue

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool()) {
    return asBool();
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber()) {
    return asNumber();
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString()) {
    return asString();
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().find(key) != asObject().end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject()) {
    throw std::out_of_range("JsonValue is not an object, cannot look up '" + key + "'");
  }
  return asObject().at(key);
}

size_t JsonValue::size() const {
  if (isArray()) {
    return asArray().size();
  }
  if (isObject()) {
    return asObject().size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream stream;
  writeToStream(stream);
  return stream.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number:
    stream << asNumber();
    break;
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first) {
        stream << ',';
      }
      first = false;
      element.writeToStream(stream);
    }
    stream << ']';
    break;
  }
  case JsonType::Object: {
    stream << '{';
    bool first = true;
    for (const auto &[key, member] : asObject()) {
      if (!first) {
        stream << ',';
      }
      first = false;
      writeEscaped(stream, key);
      stream << ':';
      member.writeToStream(stream);
    }
    stream << '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    clearError();
    return fail("Could not open file: " + path);
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
  if (m_position >= m_input.size()) {
    return fail("Empty JSON input");
  }

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    return fail("Unexpected content after JSON value");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > kMaxDepth) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
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
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
      return parseNumber(out);
    }
    return fail("Unexpected character: " + std::string(1, c));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
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
    if (!expect(':')) {
      return fail("Expected ':' after object key");
    }

    JsonValue member;
    if (!parseValue(member, depth)) {
      return false;
    }
    object[key] = std::move(member);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (expect('}')) {
      break;
    }
    return fail("Expected '}' or ',' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (expect(']')) {
      break;
    }
    return fail("Expected ']' or ',' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (m_position < m_input.size()) {
    const char c = advance();
    if (c == '"') {
      return true;
    }

    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }

    if (c != '\\') {
      out += c;
      continue;
    }

    if (m_position >= m_input.size()) {
      break;
    }

    const char escaped = advance();
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
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail("Invalid escape sequence: \\" + std::string(1, escaped));
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  auto readHex = [this](uint32_t &value) {
    if (m_position + 4 > m_input.size()) {
      return false;
    }
    const char *begin = m_input.data() + m_position;
    auto [ptr, ec] = std::from_chars(begin, begin + 4, value, 16);
    if (ec != std::errc() || ptr != begin + 4) {
      return false;
    }
    m_position += 4;
    m_column += 4;
    return true;
  };

  if (!readHex(codepoint)) {
    return fail("Invalid Unicode escape sequence");
  }

  // Surrogate pair
  if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
    uint32_t low = 0;
    if (peek() != '\\' || m_position + 1 >= m_input.size() ||
        m_input[m_position + 1] != 'u') {
      return fail("Unpaired surrogate in Unicode escape");
    }
    advance();
    advance();
    if (!readHex(low) || low < 0xDC00 || low > 0xDFFF) {
      return fail("Invalid low surrogate in Unicode escape");
    }
    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }
  if (!std::isdigit(static_cast<unsigned char>(peek()))) {
    return fail("Invalid number format");
  }
  while (std::isdigit(static_cast<unsigned char>(peek()))) {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Invalid number format: expected digit after decimal point");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Invalid number format: expected digit in exponent");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  double value = 0.0;
  try {
    value = std::stod(text);
  } catch (const std::out_of_range &) {
    return fail("Number out of range: " + text);
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value, JsonValue &out) {
  const std::string expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    return fail("Invalid token starting with '" + std::string(1, peek()) + "'");
  }
  for (size_t i = 0; i < expected.size(); ++i) {
    advance();
  }
  out = std::move(value);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size() &&
         std::isspace(static_cast<unsigned char>(m_input[m_position]))) {
    advance();
  }
}

bool JsonReader::expect(char expected) {
  if (peek() != expected) {
    return false;
  }
  advance();
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = message + " at line " + std::to_string(m_line) + ", column " +
                  std::to_string(m_column);
  }
  return false;
}

} // namespace PolyForge
