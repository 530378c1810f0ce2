/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace TesselEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }
} // anonymous namespace

// JsonValue implementation
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

std::optional<float> JsonValue::tryAsFloat() const {
  if (isNumber())
    return asFloat();
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
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue();
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
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
  m_depth = 0;
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    setError("Empty JSON input");
    return false;
  }

  auto value = parseValue();
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected token after JSON value");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

std::optional<JsonValue> JsonReader::parseValue() {
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
    if (!parseLiteral("true"))
      return std::nullopt;
    return JsonValue(true);
  case 'f':
    if (!parseLiteral("false"))
      return std::nullopt;
    return JsonValue(false);
  case 'n':
    if (!parseLiteral("null"))
      return std::nullopt;
    return JsonValue();
  default:
    if (isDigit(peek()) || peek() == '-')
      return parseNumber();
    setError(atEnd() ? "Unexpected end of input"
                     : "Unexpected character: " + std::string(1, peek()));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject() {
  if (++m_depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  advance(); // '{'
  JsonObject result;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    --m_depth;
    return JsonValue(std::move(result));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return std::nullopt;
    }
    advance();

    auto value = parseValue();
    if (!value)
      return std::nullopt;
    result.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected '}' or ',' in object");
      return std::nullopt;
    }
  }

  --m_depth;
  return JsonValue(std::move(result));
}

std::optional<JsonValue> JsonReader::parseArray() {
  if (++m_depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  advance(); // '['
  JsonArray result;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    --m_depth;
    return JsonValue(std::move(result));
  }

  while (true) {
    auto value = parseValue();
    if (!value)
      return std::nullopt;
    result.push_back(std::move(*value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ']' or ',' in array");
      return std::nullopt;
    }
  }

  --m_depth;
  return JsonValue(std::move(result));
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote

  std::string result;
  while (!atEnd()) {
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

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
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
    case 'u':
      if (!appendUnicodeEscape(result))
        return std::nullopt;
      break;
    default:
      setError("Invalid escape sequence: \\" + std::string(1, escaped));
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  if (m_position + 4 > m_input.size()) {
    setError("Invalid Unicode escape sequence");
    return false;
  }

  uint32_t codepoint = 0;
  const char *first = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, first + 4, codepoint, 16);
  if (ec != std::errc{} || ptr != first + 4) {
    setError("Invalid Unicode escape sequence");
    return false;
  }
  for (int i = 0; i < 4; ++i)
    advance();

  // Encode as UTF-8 (surrogate pairs are passed through as-is)
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number format");
    return std::nullopt;
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
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
      setError("Invalid number format: expected digit in exponent");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }

  double number = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, number);
  if (ec != std::errc{} || ptr != last) {
    setError("Invalid number format: " + std::string(first, last));
    return std::nullopt;
  }
  return JsonValue(number);
}

bool JsonReader::parseLiteral(const char *literal) {
  for (const char *c = literal; *c != '\0'; ++c) {
    if (peek() != *c) {
      setError(std::format("Invalid token, expected '{}'", literal));
      return false;
    }
    advance();
  }
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
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

void JsonReader::setError(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
}

} // namespace TesselEngine
