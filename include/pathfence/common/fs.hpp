#pragma once

#include "pathfence/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace pathfence::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(const std::string &value);

/// Splits on both '/' and the native separator. Empty segments are dropped.
[[nodiscard]] std::vector<std::string> split_path_segments(const std::string &value);

/// True when every component of `parent` matches the leading components of `candidate`.
/// Both paths are expected to be canonical; no filesystem access happens here.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

} // namespace pathfence::common
