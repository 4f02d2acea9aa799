#pragma once

#include <string>
#include <utility>
#include <vector>

// Tabulated airfoil coefficient as a function of angle of attack (degrees)
struct CoefficientCurve {
    std::vector<double> alpha_deg;
    std::vector<double> value;

    CoefficientCurve() = default;
    CoefficientCurve(std::vector<double> alpha_deg_, std::vector<double> value_)
        : alpha_deg(std::move(alpha_deg_)), value(std::move(value_)) {}

    // Flat table with the same coefficient at both ends of [alpha_min, alpha_max]
    static CoefficientCurve constant(double value, double alpha_min, double alpha_max) {
        return CoefficientCurve({alpha_min, alpha_max}, {value, value});
    }

    bool empty() const { return alpha_deg.empty(); }
    size_t size() const { return alpha_deg.size(); }
};

enum class LookupStatus {
    Ok,
    ClampedLow,
    ClampedHigh,
    Malformed
};

inline const char* toString(LookupStatus status) {
    switch (status) {
        case LookupStatus::Ok: return "ok";
        case LookupStatus::ClampedLow: return "clamped_low";
        case LookupStatus::ClampedHigh: return "clamped_high";
        case LookupStatus::Malformed: return "malformed";
    }
    return "unknown";
}

struct CoefficientLookup {
    double value = 0.0;
    LookupStatus status = LookupStatus::Ok;

    bool degraded() const { return status != LookupStatus::Ok; }
};

// Linear interpolation of ys(xs) at x. Outside [xs.front(), xs.back()] the
// boundary sample is returned; there is no extrapolation.
// Throws std::invalid_argument for empty, mismatched, non-increasing or
// non-finite tables.
double interpolateClamped(double x, const std::vector<double>& xs, const std::vector<double>& ys);

// Throws std::invalid_argument describing the first structural problem found
void validateCurve(const CoefficientCurve& curve, const std::string& context);

// Never throws: a malformed table yields value 0 with status Malformed
CoefficientLookup lookupCoefficient(const CoefficientCurve& curve, double alpha_deg);
