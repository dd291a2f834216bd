#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace adabench {

/// A dimension value: bool, integer, real, string, or a list of those.
using DimensionValue = nlohmann::json;

// ─── Benchmark Template ────────────────────────────────────────
// Declares a sub-space of the configuration space. Each dimension maps
// to either a scalar (one candidate) or a list of candidates.

struct BenchmarkTemplate {
    std::vector<std::pair<std::string, DimensionValue>> dimensions;

    void set(const std::string& name, DimensionValue value);
};

// ─── Benchmark Description ─────────────────────────────────────
// One fully resolved point of the configuration space. Dimension names
// are kept sorted, so two descriptions compare equal iff their
// name → value mappings are identical.

class BenchmarkDescription {
public:
    BenchmarkDescription() = default;
    explicit BenchmarkDescription(std::map<std::string, DimensionValue> dimensions)
        : dimensions_(std::move(dimensions)) {}

    void set(const std::string& name, DimensionValue value);
    bool has(const std::string& name) const;

    /// Throws ConfigurationError if the dimension is absent.
    const DimensionValue& at(const std::string& name) const;

    std::string getString(const std::string& name) const;
    int64_t getInt(const std::string& name) const;
    double getNumber(const std::string& name) const;
    std::vector<std::string> getStringList(const std::string& name) const;

    const std::map<std::string, DimensionValue>& dimensions() const { return dimensions_; }
    size_t size() const { return dimensions_.size(); }

    /// The benchmark kind ("name" dimension).
    std::string kind() const { return getString("name"); }

    nlohmann::json toJson() const;
    static BenchmarkDescription fromJson(const nlohmann::json& j);

    /// Compact single-line JSON rendering, used in logs.
    std::string toString() const;

    bool operator==(const BenchmarkDescription& other) const { return dimensions_ == other.dimensions_; }
    bool operator!=(const BenchmarkDescription& other) const { return !(*this == other); }
    bool operator<(const BenchmarkDescription& other) const { return dimensions_ < other.dimensions_; }

private:
    std::map<std::string, DimensionValue> dimensions_;
};

/// Renders a scalar dimension value as a command-line argument
/// (strings unquoted, numbers in their JSON form).
std::string valueToArgument(const DimensionValue& value);

} // namespace adabench
