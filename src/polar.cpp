#include "polar.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace {

void checkTable(const std::vector<double>& xs, const std::vector<double>& ys,
                const std::string& context) {
    if (xs.empty()) {
        throw std::invalid_argument(context + ": coefficient table is empty");
    }
    if (xs.size() != ys.size()) {
        throw std::invalid_argument(context + ": table has " + std::to_string(xs.size()) +
                                    " angle samples but " + std::to_string(ys.size()) +
                                    " coefficient samples");
    }
    for (size_t i = 0; i < xs.size(); ++i) {
        if (!std::isfinite(xs[i]) || !std::isfinite(ys[i])) {
            throw std::invalid_argument(context + ": non-finite sample at index " +
                                        std::to_string(i));
        }
        if (i > 0 && !(xs[i] > xs[i - 1])) {
            throw std::invalid_argument(context + ": angle samples must be strictly increasing (index " +
                                        std::to_string(i) + ")");
        }
    }
}

}  // namespace

double interpolateClamped(double x, const std::vector<double>& xs, const std::vector<double>& ys) {
    checkTable(xs, ys, "interpolateClamped");
    if (!std::isfinite(x)) {
        throw std::invalid_argument("interpolateClamped: query must be finite");
    }

    if (x <= xs.front()) return ys.front();
    if (x >= xs.back()) return ys.back();

    // xs.front() < x < xs.back(), so 1 <= j <= n-1
    auto it = std::upper_bound(xs.begin(), xs.end(), x);
    const size_t j = static_cast<size_t>(std::distance(xs.begin(), it));
    const double x0 = xs[j - 1];
    const double x1 = xs[j];

    const double t = (x - x0) / (x1 - x0);
    return ys[j - 1] + (ys[j] - ys[j - 1]) * t;
}

void validateCurve(const CoefficientCurve& curve, const std::string& context) {
    checkTable(curve.alpha_deg, curve.value, context);
}

CoefficientLookup lookupCoefficient(const CoefficientCurve& curve, double alpha_deg) {
    CoefficientLookup lookup;
    try {
        lookup.value = interpolateClamped(alpha_deg, curve.alpha_deg, curve.value);
    } catch (const std::invalid_argument&) {
        lookup.value = 0.0;
        lookup.status = LookupStatus::Malformed;
        return lookup;
    }

    if (alpha_deg < curve.alpha_deg.front()) {
        lookup.status = LookupStatus::ClampedLow;
    } else if (alpha_deg > curve.alpha_deg.back()) {
        lookup.status = LookupStatus::ClampedHigh;
    }
    return lookup;
}
