#include "config/run_config.hpp"
#include "common/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace adabench {

namespace {

DimensionValue scalarValue(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    // Quoted scalars ("100") stay strings.
    if (node.Tag() == "!") return text;

    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    // YAML 1.1 style: decimal integers, and reals only with a '.'.
    static const std::regex integer("[-+]?[0-9]+");
    static const std::regex real("[-+]?([0-9]+\\.[0-9]*|\\.[0-9]+)([eE][-+]?[0-9]+)?");

    if (std::regex_match(text, integer)) {
        errno = 0;
        long long i = std::strtoll(text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            throw ConfigurationError("Integer value out of range: " + text);
        }
        return static_cast<int64_t>(i);
    }
    if (std::regex_match(text, real)) {
        errno = 0;
        double d = std::strtod(text.c_str(), nullptr);
        if (errno == ERANGE || !std::isfinite(d)) {
            throw ConfigurationError("Real value out of range: " + text);
        }
        return d;
    }
    return text;
}

int intSetting(const YAML::Node& global, const char* key, int fallback) {
    if (!global[key]) return fallback;
    try {
        return global[key].as<int>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError(std::string("global.") + key + " must be an integer");
    }
}

double realSetting(const YAML::Node& global, const char* key, double fallback) {
    if (!global[key]) return fallback;
    try {
        return global[key].as<double>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError(std::string("global.") + key + " must be a number");
    }
}

RunConfig fromDocument(const YAML::Node& doc) {
    if (!doc.IsMap()) {
        throw ConfigurationError("Benchmark definition must be a mapping with 'global' and 'benchmarks'");
    }

    const YAML::Node global = doc["global"];
    if (!global || !global.IsMap()) {
        throw ConfigurationError("Benchmark definition has no 'global' section");
    }
    if (!global["max_runs"]) {
        throw ConfigurationError("Benchmark definition has no global.max_runs");
    }

    RunConfig config;
    config.sampler.max_runs = intSetting(global, "max_runs", config.sampler.max_runs);
    config.sampler.min_runs = intSetting(global, "min_runs", config.sampler.min_runs);
    config.sampler.significance = realSetting(global, "significance", config.sampler.significance);
    config.sampler.significant_digits = intSetting(global, "significant_digits", config.sampler.significant_digits);
    config.sampler.validate();

    const YAML::Node benchmarks = doc["benchmarks"];
    if (!benchmarks || !benchmarks.IsSequence()) {
        throw ConfigurationError("Benchmark definition has no 'benchmarks' list");
    }
    for (size_t i = 0; i < benchmarks.size(); i++) {
        const YAML::Node entry = benchmarks[i];
        if (!entry.IsMap()) {
            throw ConfigurationError("benchmarks[" + std::to_string(i) + "] must be a mapping");
        }
        BenchmarkTemplate tmpl;
        for (const auto& kv : entry) {
            tmpl.set(kv.first.as<std::string>(), toDimensionValue(kv.second));
        }
        config.benchmarks.push_back(std::move(tmpl));
    }
    return config;
}

} // namespace

DimensionValue toDimensionValue(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalarValue(node);
        case YAML::NodeType::Sequence: {
            DimensionValue list = DimensionValue::array();
            for (const auto& item : node) {
                list.push_back(toDimensionValue(item));
            }
            return list;
        }
        case YAML::NodeType::Null:
            return nullptr;
        default:
            throw ConfigurationError("Dimension values must be scalars or lists");
    }
}

RunConfig loadRunConfig(const std::string& path) {
    if (path.empty()) {
        throw ConfigurationError("You must specify --benchmark-definition");
    }
    try {
        return fromDocument(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot read benchmark definition " + path + ": " + e.what());
    }
}

RunConfig parseRunConfig(const std::string& yaml_text) {
    try {
        return fromDocument(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Cannot parse benchmark definition: ") + e.what());
    }
}

bool parseFlagValue(const std::string& flag, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigurationError("--" + flag + " must be 'true' or 'false', got '" + value + "'");
}

void RunOptions::validate() const {
    if (output_file.empty()) {
        throw ConfigurationError("You must specify --output-file");
    }
    if (benchmark_definition.empty()) {
        throw ConfigurationError("You must specify --benchmark-definition");
    }
}

} // namespace adabench
