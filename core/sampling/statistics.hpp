#pragma once

#include <vector>

namespace adabench {

struct ConfidenceInterval {
    double low = 0.0;
    double high = 0.0;

    double width() const { return high - low; }

    bool operator==(const ConfidenceInterval& other) const {
        return low == other.low && high == other.high;
    }
};

/// round(x, digits - floor(log10|x|) - 1). Zero stays zero.
///   roundToSignificantDigits(123.45, 2) == 120
///   roundToSignificantDigits(0.012345, 2) == 0.012
double roundToSignificantDigits(double x, int digits);

double mean(const std::vector<double>& samples);

/// Sample standard deviation (n - 1 denominator). 0 for fewer than 2 samples.
double sampleStdDev(const std::vector<double>& samples);

/// True if every sample is bit-identical to the first one.
bool allIdentical(const std::vector<double>& samples);

/// Two-sided Student-t confidence interval for the mean at significance
/// `alpha` (0.05 → 95%). A series with fewer than two samples, or with
/// zero variance, yields the degenerate interval [mean, mean].
ConfidenceInterval tConfidenceInterval(const std::vector<double>& samples, double alpha);

ConfidenceInterval roundInterval(const ConfidenceInterval& ci, int digits);

} // namespace adabench
