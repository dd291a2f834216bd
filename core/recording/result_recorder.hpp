#pragma once

#include "sampling/statistics.hpp"
#include "space/benchmark_description.hpp"
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace adabench {

/// One completed description with its rounded intervals.
struct BenchmarkResult {
    BenchmarkDescription description;
    std::map<std::string, ConfidenceInterval> intervals;

    /// {"benchmark": {...}, "results": {"metric": [low, high], ...}}
    nlohmann::json toJson() const;
    static BenchmarkResult fromJson(const nlohmann::json& j);
};

// ─── Result Recorder ───────────────────────────────────────────
// Append-only JSON-lines store. Each completed description becomes one
// self-contained line; a later run can resume by loading the
// descriptions already present.

class ResultRecorder {
public:
    explicit ResultRecorder(std::filesystem::path path);

    /// Removes any previous output (fresh, non-resumed run).
    void reset();

    /// Reads every recorded result. A missing file reads as empty.
    /// Throws ConfigurationError on a malformed line.
    std::vector<BenchmarkResult> load() const;

    /// Descriptions already recorded, for skipping on resume.
    std::set<BenchmarkDescription> completedDescriptions() const;

    /// Appends one line and flushes it.
    void append(const BenchmarkResult& result);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace adabench
