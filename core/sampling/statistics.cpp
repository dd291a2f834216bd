#include "sampling/statistics.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace adabench {

double roundToSignificantDigits(double x, int digits) {
    if (x == 0.0) return 0.0;
    int decimals = digits - static_cast<int>(std::floor(std::log10(std::fabs(x)))) - 1;
    if (decimals >= 0) {
        // printf rounds the exact binary value, ties to even.
        int size = std::snprintf(nullptr, 0, "%.*f", decimals, x);
        std::string text(static_cast<size_t>(size) + 1, '\0');
        std::snprintf(&text[0], text.size(), "%.*f", decimals, x);
        return std::strtod(text.c_str(), nullptr);
    }
    // x / 10^k is exact at a tie, so nearbyint's ties-to-even applies.
    double factor = std::pow(10.0, -decimals);
    return std::nearbyint(x / factor) * factor;
}

double mean(const std::vector<double>& samples) {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (double v : samples) sum += v;
    return sum / static_cast<double>(samples.size());
}

double sampleStdDev(const std::vector<double>& samples) {
    if (samples.size() < 2) return 0.0;
    double m = mean(samples);
    double var = 0.0;
    for (double v : samples) {
        double d = v - m;
        var += d * d;
    }
    var /= static_cast<double>(samples.size() - 1);
    return std::sqrt(var);
}

bool allIdentical(const std::vector<double>& samples) {
    for (double v : samples) {
        if (std::memcmp(&v, &samples.front(), sizeof(double)) != 0) return false;
    }
    return true;
}

ConfidenceInterval tConfidenceInterval(const std::vector<double>& samples, double alpha) {
    if (samples.empty()) return {};
    if (allIdentical(samples)) return {samples.front(), samples.front()};

    double m = mean(samples);
    double sd = sampleStdDev(samples);
    if (sd == 0.0) return {m, m};

    double n = static_cast<double>(samples.size());
    boost::math::students_t dist(n - 1.0);
    double t = boost::math::quantile(boost::math::complement(dist, alpha / 2.0));
    double half_width = t * sd / std::sqrt(n);
    return {m - half_width, m + half_width};
}

ConfidenceInterval roundInterval(const ConfidenceInterval& ci, int digits) {
    return {roundToSignificantDigits(ci.low, digits), roundToSignificantDigits(ci.high, digits)};
}

} // namespace adabench
