#include "space/benchmark_description.hpp"
#include "common/errors.hpp"

namespace adabench {

void BenchmarkTemplate::set(const std::string& name, DimensionValue value) {
    for (auto& [key, existing] : dimensions) {
        if (key == name) {
            existing = std::move(value);
            return;
        }
    }
    dimensions.emplace_back(name, std::move(value));
}

void BenchmarkDescription::set(const std::string& name, DimensionValue value) {
    dimensions_[name] = std::move(value);
}

bool BenchmarkDescription::has(const std::string& name) const {
    return dimensions_.count(name) > 0;
}

const DimensionValue& BenchmarkDescription::at(const std::string& name) const {
    auto it = dimensions_.find(name);
    if (it == dimensions_.end()) {
        throw ConfigurationError("Benchmark " + toString() + " has no dimension '" + name + "'");
    }
    return it->second;
}

std::string BenchmarkDescription::getString(const std::string& name) const {
    const DimensionValue& v = at(name);
    if (!v.is_string()) {
        throw ConfigurationError("Dimension '" + name + "' must be a string, got " + v.dump());
    }
    return v.get<std::string>();
}

int64_t BenchmarkDescription::getInt(const std::string& name) const {
    const DimensionValue& v = at(name);
    if (!v.is_number_integer()) {
        throw ConfigurationError("Dimension '" + name + "' must be an integer, got " + v.dump());
    }
    return v.get<int64_t>();
}

double BenchmarkDescription::getNumber(const std::string& name) const {
    const DimensionValue& v = at(name);
    if (!v.is_number()) {
        throw ConfigurationError("Dimension '" + name + "' must be a number, got " + v.dump());
    }
    return v.get<double>();
}

std::vector<std::string> BenchmarkDescription::getStringList(const std::string& name) const {
    const DimensionValue& v = at(name);
    std::vector<std::string> result;
    if (!v.is_array()) {
        throw ConfigurationError("Dimension '" + name + "' must be a list, got " + v.dump());
    }
    for (const auto& item : v) {
        result.push_back(valueToArgument(item));
    }
    return result;
}

nlohmann::json BenchmarkDescription::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : dimensions_) {
        j[name] = value;
    }
    return j;
}

BenchmarkDescription BenchmarkDescription::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Benchmark description must be an object, got " + j.dump());
    }
    BenchmarkDescription d;
    for (auto it = j.begin(); it != j.end(); ++it) {
        d.set(it.key(), it.value());
    }
    return d;
}

std::string BenchmarkDescription::toString() const {
    return toJson().dump();
}

std::string valueToArgument(const DimensionValue& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // namespace adabench
