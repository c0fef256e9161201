/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>

namespace GridAgents {

namespace {
// Deeper documents are rejected rather than risking the call stack
constexpr int MAX_DEPTH = 128;

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

bool isDigit(char c) { return c >= '0' && c <= '9'; }
} // anonymous namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
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

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().find(key) != asObject().end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    stream << '"';
    for (char c : asString()) {
      if (c == '"' || c == '\\')
        stream << '\\';
      stream << c;
    }
    stream << '"';
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      stream << "\"" << key << "\":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
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

  auto value = parseValue(0);
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.length()) {
    setError("Unexpected trailing content");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

void JsonReader::setError(const std::string &message) {
  // Keep the innermost error
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
}

char JsonReader::peek() const {
  return m_position < m_input.length() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.length())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.length()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c) {
    setError(std::format("Expected '{}'", c));
    return false;
  }
  advance();
  return true;
}

bool JsonReader::consumeKeyword(const char *keyword) {
  const std::string_view word(keyword);
  if (m_input.compare(m_position, word.size(), word) != 0) {
    setError(std::format("Invalid token starting with '{}'", peek()));
    return false;
  }
  for (size_t i = 0; i < word.size(); ++i)
    advance();
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  skipWhitespace();
  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth);
  case '[':
    return parseArray(depth);
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
    if (!consumeKeyword("true"))
      return std::nullopt;
    return JsonValue(true);
  case 'f':
    if (!consumeKeyword("false"))
      return std::nullopt;
    return JsonValue(false);
  case 'n':
    if (!consumeKeyword("null"))
      return std::nullopt;
    return JsonValue();
  case '\0':
    setError("Unexpected end of input");
    return std::nullopt;
  default:
    if (isDigit(c) || c == '-')
      return parseNumber();
    setError("Unexpected character: " + std::string(1, c));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key || !expect(':'))
      return std::nullopt;

    auto value = parseValue(depth + 1);
    if (!value)
      return std::nullopt;
    object.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect('}'))
      return std::nullopt;
    return JsonValue(std::move(object));
  }
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth + 1);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect(']'))
      return std::nullopt;
    return JsonValue(std::move(array));
  }
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (m_position < m_input.length()) {
    char c = advance();
    if (c == '"')
      return result;
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    switch (advance()) {
    case '"':
      result += '"';
      break;
    case '\\':
      result += '\\';
      break;
    case '/':
      result += '/';
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u': {
      auto codepoint = parseHex4();
      if (!codepoint)
        return std::nullopt;
      // Surrogate pair
      if (*codepoint >= 0xD800 && *codepoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          setError("Unpaired high surrogate");
          return std::nullopt;
        }
        auto low = parseHex4();
        if (!low)
          return std::nullopt;
        if (*low < 0xDC00 || *low > 0xDFFF) {
          setError("Invalid low surrogate");
          return std::nullopt;
        }
        *codepoint = 0x10000 + ((*codepoint - 0xD800) << 10) + (*low - 0xDC00);
      }
      appendUtf8(result, *codepoint);
      break;
    }
    default:
      setError("Invalid escape sequence");
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid unicode escape");
      return std::nullopt;
    }
  }
  return value;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number");
    return std::nullopt;
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Expected digit after decimal point");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Expected digit in exponent");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  return JsonValue(std::strtod(text.c_str(), nullptr));
}

} // namespace GridAgents
