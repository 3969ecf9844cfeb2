#include "pathfence/common/toml.hpp"

#include "pathfence/common/fs.hpp"

#include <sstream>

namespace pathfence::common {

namespace {

using ValueResult = Result<TomlValue>;

std::string at_line(const std::string &what, const std::size_t line_number) {
  return what + " at line " + std::to_string(line_number);
}

// Anything left after a value must be whitespace or a comment.
bool only_comment_follows(const std::string &rest) {
  const std::string tail = trim(rest);
  return tail.empty() || tail.front() == '#';
}

ValueResult read_basic_string(const std::string &raw, const std::size_t line_number) {
  TomlValue value{.kind = TomlValue::Kind::String, .text = {}, .flag = false};
  for (std::size_t i = 1; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch == '"') {
      if (!only_comment_follows(raw.substr(i + 1))) {
        return ValueResult::failure(at_line("Unexpected text after string", line_number));
      }
      return ValueResult::success(std::move(value));
    }
    if (ch != '\\') {
      value.text.push_back(ch);
      continue;
    }
    if (++i == raw.size()) {
      break;
    }
    switch (raw[i]) {
    case 'n':
      value.text.push_back('\n');
      break;
    case 't':
      value.text.push_back('\t');
      break;
    case '"':
    case '\\':
      value.text.push_back(raw[i]);
      break;
    default:
      return ValueResult::failure(at_line("Unsupported escape sequence", line_number));
    }
  }
  return ValueResult::failure(at_line("Unterminated string", line_number));
}

ValueResult read_literal_string(const std::string &raw, const std::size_t line_number) {
  const std::size_t close = raw.find('\'', 1);
  if (close == std::string::npos) {
    return ValueResult::failure(at_line("Unterminated string", line_number));
  }
  if (!only_comment_follows(raw.substr(close + 1))) {
    return ValueResult::failure(at_line("Unexpected text after string", line_number));
  }
  return ValueResult::success(
      TomlValue{.kind = TomlValue::Kind::String, .text = raw.substr(1, close - 1), .flag = false});
}

ValueResult read_value(const std::string &raw, const std::size_t line_number) {
  if (raw.empty()) {
    return ValueResult::failure(at_line("Missing value", line_number));
  }
  if (raw.front() == '"') {
    return read_basic_string(raw, line_number);
  }
  if (raw.front() == '\'') {
    return read_literal_string(raw, line_number);
  }

  const std::string token = trim(raw.substr(0, raw.find('#')));
  if (token == "true" || token == "false") {
    return ValueResult::success(
        TomlValue{.kind = TomlValue::Kind::Boolean, .text = token, .flag = token == "true"});
  }
  return ValueResult::success(TomlValue{.kind = TomlValue::Kind::Bare, .text = token, .flag = false});
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : it->second.text;
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Boolean) {
    return fallback;
  }
  return it->second.flag;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string text = trim(line);
    if (text.empty() || text.front() == '#') {
      continue;
    }

    if (text.front() == '[') {
      const std::size_t close = text.find(']');
      if (close == std::string::npos || !only_comment_follows(text.substr(close + 1))) {
        return Result<TomlDocument>::failure(at_line("Malformed section header", line_number));
      }
      section = trim(text.substr(1, close - 1));
      if (section.empty()) {
        return Result<TomlDocument>::failure(at_line("Invalid empty section", line_number));
      }
      continue;
    }

    const std::size_t equals = text.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(at_line("Invalid key/value", line_number));
    }
    const std::string key = trim(text.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(at_line("Missing key", line_number));
    }

    auto value = read_value(trim(text.substr(equals + 1)), line_number);
    if (!value.ok()) {
      return Result<TomlDocument>::failure(value.error());
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, std::move(value.value())).second) {
      return Result<TomlDocument>::failure(at_line("Duplicate key '" + full_key + "'",
                                                   line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string quoted = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      quoted += "\\\"";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      quoted.push_back(ch);
    }
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace pathfence::common
