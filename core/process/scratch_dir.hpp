#pragma once

#include <filesystem>

namespace adabench {

/// Deletes `dir` with everything in it and creates it again, empty.
/// Throws std::filesystem::filesystem_error if either step fails.
void ensureEmptyDir(const std::filesystem::path& dir);

} // namespace adabench
