#include "drivers/metric_parser.hpp"

#include <sstream>
#include <stdexcept>

namespace adabench {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

MetricSamples parseMetricLines(const std::string& output) {
    MetricSamples result;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Malformed benchmark output line: " + line);
        }
        std::string metric = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value, &consumed);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Non-numeric value in benchmark output line: " + line);
        }
        if (consumed != value.size()) {
            throw std::runtime_error("Non-numeric value in benchmark output line: " + line);
        }
        result[metric] = parsed;
    }
    return result;
}

} // namespace adabench
