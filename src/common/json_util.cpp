#include "rmm/common/json_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rmm::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

// End (exclusive) of the JSON value starting at pos, or npos when malformed.
std::size_t find_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end == pos ? std::string::npos : end;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto code = parse_hex4(raw, i + 1);
      if (!code.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      std::uint32_t code_point = *code;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        if (auto low = parse_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00 &&
                                               *low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_number(const double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return buffer;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<std::string> json_get_raw(const std::string &json, const std::string &field) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      return std::nullopt;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);

    const auto value_end = find_value_end(json, pos);
    if (value_end == std::string::npos) {
      return std::nullopt;
    }
    if (key == field) {
      return json.substr(pos, value_end - pos);
    }
    pos = value_end;
  }
  return std::nullopt;
}

std::optional<std::string> json_get_string(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->size() < 2 || raw->front() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw->substr(1, raw->size() - 2));
}

std::optional<double> json_get_double(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->empty()) {
    return std::nullopt;
  }
  const char first = raw->front();
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(raw->c_str(), &end);
  if (end != raw->c_str() + raw->size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::int64_t> json_get_int(const std::string &json, const std::string &field) {
  const auto value = json_get_double(json, field);
  // [-2^63, 2^63) is exactly the doubles that convert to int64 without overflow.
  constexpr double kInt64Bound = 9223372036854775808.0;
  if (!value.has_value() || std::floor(*value) != *value || *value < -kInt64Bound ||
      *value >= kInt64Bound) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(*value);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->empty() || raw->front() != '{') {
    return "";
  }
  return *raw;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->empty() || raw->front() != '[') {
    return "";
  }
  return *raw;
}

Result<std::vector<std::string>> json_split_array(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return Result<std::vector<std::string>>::failure("expected JSON array");
  }
  ++pos;

  std::vector<std::string> out;
  bool expect_value = true;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size()) {
      return Result<std::vector<std::string>>::failure("unterminated JSON array");
    }
    if (array_json[pos] == ']') {
      if (expect_value && !out.empty()) {
        return Result<std::vector<std::string>>::failure("trailing comma in JSON array");
      }
      break;
    }
    if (!expect_value) {
      if (array_json[pos] != ',') {
        return Result<std::vector<std::string>>::failure("expected ',' in JSON array");
      }
      ++pos;
      expect_value = true;
      continue;
    }
    const auto end = find_value_end(array_json, pos);
    if (end == std::string::npos) {
      return Result<std::vector<std::string>>::failure("malformed JSON array element");
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
    expect_value = false;
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

Result<std::vector<double>> json_parse_number_array(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return Result<std::vector<double>>::failure("expected JSON number array");
  }
  ++pos;

  std::vector<double> values;
  pos = json_skip_ws(array_json, pos);
  if (pos < array_json.size() && array_json[pos] == ']') {
    return Result<std::vector<double>>::success(std::move(values));
  }

  const char *begin = array_json.c_str();
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    const char ch = pos < array_json.size() ? array_json[pos] : '\0';
    if (ch != '-' && std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return Result<std::vector<double>>::failure("non-numeric array element");
    }
    char *end = nullptr;
    const double value = std::strtod(begin + pos, &end);
    if (end == begin + pos || !std::isfinite(value)) {
      return Result<std::vector<double>>::failure("invalid number in array");
    }
    values.push_back(value);
    pos = json_skip_ws(array_json, static_cast<std::size_t>(end - begin));
    if (pos >= array_json.size()) {
      break;
    }
    if (array_json[pos] == ']') {
      return Result<std::vector<double>>::success(std::move(values));
    }
    if (array_json[pos] != ',') {
      return Result<std::vector<double>>::failure("expected ',' in number array");
    }
    ++pos;
  }
  return Result<std::vector<double>>::failure("unterminated number array");
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &array_json) {
  auto elements = json_split_array(array_json);
  if (!elements.ok()) {
    return elements;
  }
  std::vector<std::string> out;
  out.reserve(elements.value().size());
  for (const auto &element : elements.value()) {
    if (element.size() < 2 || element.front() != '"') {
      return Result<std::vector<std::string>>::failure("non-string array element");
    }
    out.push_back(json_unescape(element.substr(1, element.size() - 2)));
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

} // namespace rmm::common
