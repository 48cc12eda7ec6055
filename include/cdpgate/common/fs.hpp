#pragma once

#include "cdpgate/common/result.hpp"

#include <filesystem>
#include <string>

namespace cdpgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Make `path` absolute against the current working directory.
[[nodiscard]] std::filesystem::path absolute_from_cwd(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write through a sibling .tmp file and rename over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Current UTC time as RFC 3339 with second precision, e.g. 2024-05-01T12:00:00Z.
[[nodiscard]] std::string now_rfc3339();

} // namespace cdpgate::common
