#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace acquisition::storage::common {

/*
  Resolve a caller-supplied relative path under the output root.
  Absolute paths and ".." components are rejected.
*/
inline std::filesystem::path ResolveOutputPath(const std::filesystem::path& root, const std::string& relative) {
  if (relative.empty()) {
    throw std::invalid_argument("output path must not be empty");
  }
  if (relative.find('\0') != std::string::npos) {
    throw std::invalid_argument("output path contains invalid character");
  }

  const std::filesystem::path path(relative);
  if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
    throw std::invalid_argument("output path must be relative: " + relative);
  }
  for (const auto& part : path) {
    if (part == "..") {
      throw std::invalid_argument("output path must not contain '..': " + relative);
    }
  }
  if (!path.has_filename() || path.filename() == ".") {
    throw std::invalid_argument("output path must name a file: " + relative);
  }

  return root / path.lexically_normal();
}

} // namespace acquisition::storage::common
