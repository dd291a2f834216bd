#include "recording/result_recorder.hpp"
#include "common/errors.hpp"

#include <fstream>

namespace adabench {

nlohmann::json BenchmarkResult::toJson() const {
    nlohmann::json results = nlohmann::json::object();
    for (const auto& [metric, ci] : intervals) {
        results[metric] = {ci.low, ci.high};
    }
    return {{"benchmark", description.toJson()}, {"results", results}};
}

BenchmarkResult BenchmarkResult::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("benchmark")) {
        throw ConfigurationError("Result record has no \"benchmark\" entry: " + j.dump());
    }
    BenchmarkResult result;
    result.description = BenchmarkDescription::fromJson(j.at("benchmark"));
    if (j.contains("results")) {
        for (auto it = j.at("results").begin(); it != j.at("results").end(); ++it) {
            const nlohmann::json& bounds = it.value();
            if (!bounds.is_array() || bounds.size() != 2) {
                throw ConfigurationError("Result for metric " + it.key() + " must be [low, high]: " + bounds.dump());
            }
            result.intervals[it.key()] = {bounds[0].get<double>(), bounds[1].get<double>()};
        }
    }
    return result;
}

ResultRecorder::ResultRecorder(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.empty()) {
        throw ConfigurationError("You must specify --output-file");
    }
}

void ResultRecorder::reset() {
    std::filesystem::remove(path_);
}

std::vector<BenchmarkResult> ResultRecorder::load() const {
    std::vector<BenchmarkResult> results;
    std::ifstream in(path_);
    if (!in) return results;

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        line_number++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            results.push_back(BenchmarkResult::fromJson(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            throw ConfigurationError(path_.string() + ":" + std::to_string(line_number) +
                                     ": malformed result record: " + e.what());
        }
    }
    return results;
}

std::set<BenchmarkDescription> ResultRecorder::completedDescriptions() const {
    std::set<BenchmarkDescription> done;
    for (const auto& result : load()) {
        done.insert(result.description);
    }
    return done;
}

void ResultRecorder::append(const BenchmarkResult& result) {
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path_.string());
    }
    out << result.toJson().dump() << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write to output file: " + path_.string());
    }
}

} // namespace adabench
