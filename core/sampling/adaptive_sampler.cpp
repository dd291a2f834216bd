#include "sampling/adaptive_sampler.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace adabench {

namespace {

constexpr double kWidthTolerance = std::numeric_limits<double>::epsilon() * 10;

std::string formatSamples(const MetricSamples& samples) {
    std::string out = "{";
    for (const auto& [name, value] : samples) {
        if (out.size() > 1) out += ", ";
        out += fmt::format("'{}': {}", name, value);
    }
    return out + "}";
}

} // namespace

void SamplerConfig::validate() const {
    if (max_runs < 1) {
        throw ConfigurationError("max_runs must be at least 1, got " + std::to_string(max_runs));
    }
    if (min_runs < 1) {
        throw ConfigurationError("min_runs must be at least 1, got " + std::to_string(min_runs));
    }
    if (!(significance > 0.0 && significance < 1.0)) {
        throw ConfigurationError("significance must be in (0, 1), got " + std::to_string(significance));
    }
    if (significant_digits < 1) {
        throw ConfigurationError("significant_digits must be at least 1, got " +
                                 std::to_string(significant_digits));
    }
}

AdaptiveSampler::AdaptiveSampler(SamplerConfig config) : config_(config) {
    config_.validate();
}

void AdaptiveSampler::runOnce(BenchmarkDriver& driver, Series& series) const {
    MetricSamples result = driver.run();
    log::info("Running benchmark... {}", formatSamples(result));
    for (const auto& [metric, value] : result) {
        series[metric].push_back(value);
    }
}

std::vector<std::string> AdaptiveSampler::unconverged(const Series& series) const {
    std::vector<std::string> open;
    for (const auto& [metric, samples] : series) {
        if (allIdentical(samples)) continue;
        ConfidenceInterval ci = tConfidenceInterval(samples, config_.significance);
        ConfidenceInterval rounded = roundInterval(ci, config_.significant_digits);
        if (std::fabs(rounded.width()) > kWidthTolerance) {
            open.push_back(metric);
        }
    }
    return open;
}

SamplingOutcome AdaptiveSampler::sample(BenchmarkDriver& driver) const {
    log::info("Preparing for benchmark...");
    driver.prepare();

    Series series;
    SamplingOutcome outcome;

    const int initial_runs = std::min(config_.min_runs, config_.max_runs);
    for (int i = 0; i < initial_runs; i++) {
        runOnce(driver, series);
        outcome.runs++;
    }

    while (true) {
        std::vector<std::string> open = unconverged(series);
        if (open.empty()) break;

        if (outcome.runs >= config_.max_runs) {
            for (const auto& metric : open) {
                ConfidenceInterval ci = tConfidenceInterval(series[metric], config_.significance);
                log::warning("Couldn't determine a precise result for the metric {}. Confidence interval: [{:.3g}, {:.3g}]",
                             metric, ci.low, ci.high);
            }
            outcome.unconverged_metrics = std::move(open);
            break;
        }

        ConfidenceInterval ci = tConfidenceInterval(series[open.front()], config_.significance);
        log::info("Running again to get more precision on the metric {}. Current confidence interval: [{:.3g}, {:.3g}]",
                  open.front(), ci.low, ci.high);
        runOnce(driver, series);
        outcome.runs++;
    }

    for (const auto& [metric, samples] : series) {
        outcome.intervals[metric] = roundInterval(tConfidenceInterval(samples, config_.significance),
                                                  config_.significant_digits);
    }
    return outcome;
}

} // namespace adabench
