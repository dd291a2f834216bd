#pragma once

#include "drivers/benchmark_driver.hpp"
#include "drivers/driver_context.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace adabench {

/// Source trees a benchmark kind cannot run without.
enum class RequiredSources {
    FruitSources,
    FruitBenchmarkSources,
    BoostDiSources,
};

using DriverFactory = std::function<std::unique_ptr<BenchmarkDriver>(const BenchmarkDescription&,
                                                                     const DriverContext&)>;

/// Throws ConfigurationError if a dimension the kind reads is missing or
/// out of range.
using DimensionCheck = std::function<void(const BenchmarkDescription&)>;

// ─── Driver Registry ───────────────────────────────────────────
// Closed name → factory table. The "name" dimension of a description
// selects the entry; an unknown name is a ConfigurationError listing the
// known kinds.

class DriverRegistry {
public:
    /// Register a kind. Re-registering a name replaces it.
    void registerKind(const std::string& kind, DriverFactory factory,
                      std::vector<RequiredSources> requirements = {},
                      DimensionCheck check = {});

    bool contains(const std::string& kind) const { return entries_.count(kind) > 0; }

    /// Registered kinds, sorted.
    std::vector<std::string> kinds() const;

    /// Throws ConfigurationError if the kind is unknown, a source tree it
    /// needs is not configured in `ctx`, or its dimension check fails.
    void validate(const BenchmarkDescription& desc, const DriverContext& ctx) const;

    /// validate() then construct.
    std::unique_ptr<BenchmarkDriver> create(const BenchmarkDescription& desc, const DriverContext& ctx) const;

    size_t count() const { return entries_.size(); }

    /// The eight built-in kinds.
    static DriverRegistry withDefaultDrivers();

private:
    struct Entry {
        DriverFactory factory;
        std::vector<RequiredSources> requirements;
        DimensionCheck check;
    };

    const Entry& lookup(const std::string& kind) const;

    std::map<std::string, Entry> entries_;
};

} // namespace adabench
