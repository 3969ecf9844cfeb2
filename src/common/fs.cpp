#include "pathfence/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>

namespace pathfence::common {

std::string trim(const std::string &input) {
  constexpr const char *WHITESPACE = " \t\n\r\f\v";
  const std::size_t first = input.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  return input.substr(first, input.find_last_not_of(WHITESPACE) - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
#if defined(_WIN32)
  if (const char *profile = std::getenv("USERPROFILE"); profile != nullptr && *profile != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(profile));
  }
#endif
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

namespace {

bool is_name_char(const char ch, const bool first) {
  const auto c = static_cast<unsigned char>(ch);
  return std::isalpha(c) != 0 || ch == '_' || (!first && std::isdigit(c) != 0);
}

} // namespace

// "~" and "~/..." use the home directory; "$NAME" and "${NAME}" use the environment, with
// unset variables expanding to nothing. Anything else, "~user" included, is kept verbatim.
std::string expand_path(const std::string &value) {
  std::string out;
  std::size_t i = 0;

  if (!value.empty() && value[0] == '~' && (value.size() == 1 || value[1] == '/')) {
    if (auto home = home_dir(); home.ok()) {
      out = home.value().string();
      i = 1;
    }
  }

  while (i < value.size()) {
    if (value[i] != '$') {
      out.push_back(value[i++]);
      continue;
    }

    const bool braced = i + 1 < value.size() && value[i + 1] == '{';
    const std::size_t name_start = i + (braced ? 2 : 1);
    std::size_t name_end = name_start;
    while (name_end < value.size() && is_name_char(value[name_end], name_end == name_start)) {
      ++name_end;
    }

    const bool closed = !braced || (name_end < value.size() && value[name_end] == '}');
    if (name_end == name_start || !closed) {
      out.push_back(value[i++]);
      continue;
    }

    const std::string name = value.substr(name_start, name_end - name_start);
    if (const char *var = std::getenv(name.c_str()); var != nullptr) {
      out += var;
    }
    i = braced ? name_end + 1 : name_end;
  }
  return out;
}

std::vector<std::string> split_path_segments(const std::string &value) {
  std::vector<std::string> segments;
  std::string current;
  const auto native = static_cast<char>(std::filesystem::path::preferred_separator);

  for (const char ch : value) {
    if (ch == '/' || ch == native) {
      if (!current.empty()) {
        segments.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    segments.push_back(std::move(current));
  }
  return segments;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  auto p_it = parent.begin();

  for (; p_it != parent.end(); ++p_it, ++c_it) {
    // "a/b/" iterates as {a, b, ""}; the trailing empty element is not a component.
    if (p_it->empty() && std::next(p_it) == parent.end()) {
      break;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

} // namespace pathfence::common
