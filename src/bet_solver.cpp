#include "bet_solver.hpp"
#include "linalg.hpp"

#include <cmath>
#include <iostream>
#include <string>

namespace {
constexpr double RPM_TO_RAD_PER_SEC = 2.0 * M_PI / 60.0;
constexpr double RAD_TO_DEG = 180.0 / M_PI;
constexpr double DEG_TO_RAD = M_PI / 180.0;

void validateOperatingPoint(double rpm, double free_stream_velocity, const BetOptions& options) {
    if (!std::isfinite(rpm)) {
        throw InvalidOperatingPoint("rpm must be finite");
    }
    if (rpm < 0.0) {
        throw InvalidOperatingPoint("rpm must be >= 0, got " + std::to_string(rpm));
    }
    if (!std::isfinite(free_stream_velocity)) {
        throw InvalidOperatingPoint("free-stream velocity must be finite");
    }
    if (!std::isfinite(options.air_density) || options.air_density <= 0.0) {
        throw InvalidOperatingPoint("air density must be positive and finite");
    }
}

void recordLookup(SolveResult& result, size_t index, Coefficient which, double alpha_deg,
                  const CoefficientLookup& lookup, const BladeSection& section,
                  bool report) {
    if (!lookup.degraded()) {
        return;
    }
    result.diagnostics.push_back(LookupDiagnostic{index, which, alpha_deg, lookup.status, lookup.value});
    if (!report) {
        return;
    }

    const CoefficientCurve& curve = (which == Coefficient::Lift) ? section.lift : section.drag;
    std::cerr << "Warning: section " << index << " (r = " << section.radius << " m): ";
    if (lookup.status == LookupStatus::Malformed) {
        std::cerr << toString(which) << " table is malformed, using " << toString(which) << " = 0\n";
    } else {
        std::cerr << "alpha " << alpha_deg << " deg outside " << toString(which) << " table ["
                  << curve.alpha_deg.front() << ", " << curve.alpha_deg.back()
                  << "], clamped to " << lookup.value << "\n";
    }
}
}

double SolveResult::omega() const {
    return rpm * RPM_TO_RAD_PER_SEC;
}

double SolveResult::power() const {
    return torque * omega();
}

size_t SolveResult::degradedSections() const {
    size_t n = 0;
    for (const auto& s : sections) {
        if (s.cl_status != LookupStatus::Ok || s.cd_status != LookupStatus::Ok) n++;
    }
    return n;
}

SolveResult computeThrustAndTorque(const Propeller& prop, double rpm, double free_stream_velocity,
                                   const BetOptions& options) {
    validateOperatingPoint(rpm, free_stream_velocity, options);

    const auto& blades = prop.sections();
    const double R = prop.tipRadius();

    // Uniform width from the section count and the tip radius, whatever the
    // actual station spacing
    const double section_width = R / static_cast<double>(blades.size());
    const double omega = rpm * RPM_TO_RAD_PER_SEC;
    const double rho = options.air_density;

    SolveResult result;
    result.rpm = rpm;
    result.velocity = free_stream_velocity;
    result.air_density = rho;
    result.sections.reserve(blades.size());

    double thrust_sum = 0.0;
    double torque_sum = 0.0;

    for (size_t i = 0; i < blades.size(); ++i) {
        const BladeSection& blade = blades[i];

        // Velocity triangle; atan2 keeps phi defined when both components vanish
        const Vec2 inflow(omega * blade.radius, free_stream_velocity);
        const double U = inflow.norm();
        const double phi = std::atan2(inflow.y(), inflow.x());

        const double alpha = blade.twist * DEG_TO_RAD - phi;
        const double alpha_deg = alpha * RAD_TO_DEG;

        const CoefficientLookup cl = lookupCoefficient(blade.lift, alpha_deg);
        const CoefficientLookup cd = lookupCoefficient(blade.drag, alpha_deg);
        recordLookup(result, i, Coefficient::Lift, alpha_deg, cl, blade, options.report_degraded);
        recordLookup(result, i, Coefficient::Drag, alpha_deg, cd, blade, options.report_degraded);

        const double q = 0.5 * rho * U * U;
        const double dL = cl.value * q * blade.chord * section_width;
        const double dD = cd.value * q * blade.chord * section_width;

        const double c_phi = std::cos(phi);
        const double s_phi = std::sin(phi);
        const double dT = dL * c_phi - dD * s_phi;
        const double dQ = (dL * s_phi + dD * c_phi) * blade.radius;

        SectionResult sr;
        sr.radius = blade.radius;
        sr.r_over_R = blade.radius / R;
        sr.alpha_deg = alpha_deg;
        sr.phi_deg = phi * RAD_TO_DEG;
        sr.chord = blade.chord;
        sr.twist = blade.twist;
        sr.cl = cl.value;
        sr.cd = cd.value;
        sr.dL = dL;
        sr.dD = dD;
        sr.velocity = U;
        sr.dT = dT;
        sr.dQ = dQ;
        sr.cl_status = cl.status;
        sr.cd_status = cd.status;
        result.sections.push_back(sr);

        thrust_sum += dT;
        torque_sum += dQ;
    }

    const double n_blades = static_cast<double>(prop.numBlades());
    result.thrust = n_blades * thrust_sum;
    result.torque = n_blades * torque_sum;
    return result;
}
