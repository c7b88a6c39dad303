#pragma once

#include <dv_alm/core/result.hpp>

#include <filesystem>
#include <string>

namespace dv_alm {

// Whole-file binary I/O for solution zips. Errors carry `category` so the
// caller's workflow decides how they are reported.
[[nodiscard]] Result<std::string, Error> ReadBinaryFile(const std::filesystem::path& path,
                                                        ErrorCategory category);

[[nodiscard]] Result<void, Error> WriteBinaryFile(const std::filesystem::path& path,
                                                  const std::string& data,
                                                  ErrorCategory category);

// Replace `target` with a recursive copy of `source`. The copy is built in a
// sibling folder and renamed into place; on failure `target` is unchanged.
[[nodiscard]] Result<void, Error> ReplaceDirectory(const std::filesystem::path& source,
                                                   const std::filesystem::path& target,
                                                   ErrorCategory category);

} // namespace dv_alm
