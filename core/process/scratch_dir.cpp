#include "process/scratch_dir.hpp"

namespace fs = std::filesystem;

namespace adabench {

void ensureEmptyDir(const fs::path& dir) {
    fs::create_directories(dir);
    fs::remove_all(dir);
    fs::create_directories(dir);
}

} // namespace adabench
