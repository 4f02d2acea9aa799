#pragma once

#include "polar.hpp"
#include "propeller.hpp"

#include <stdexcept>
#include <vector>

// Operating condition outside the supported physical bounds
class InvalidOperatingPoint : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace aero_defaults {
constexpr double kSeaLevelAirDensity = 1.225;  // kg/m^3
}

struct BetOptions {
    double air_density = aero_defaults::kSeaLevelAirDensity;
    bool report_degraded = false;  // Also print each degraded lookup to stderr
};

enum class Coefficient { Lift, Drag };

inline const char* toString(Coefficient c) {
    return (c == Coefficient::Lift) ? "Cl" : "Cd";
}

// A lookup that was clamped to the table boundary or fell back to zero.
// Reported, never thrown.
struct LookupDiagnostic {
    size_t section_index = 0;
    Coefficient coefficient = Coefficient::Lift;
    double alpha_deg = 0.0;
    LookupStatus status = LookupStatus::Ok;
    double value = 0.0;  // Coefficient actually used
};

struct SectionResult {
    double radius = 0.0;     // m
    double r_over_R = 0.0;   // Normalized radial position
    double alpha_deg = 0.0;  // Angle of attack
    double phi_deg = 0.0;    // Inflow angle
    double chord = 0.0;      // m
    double twist = 0.0;      // deg
    double cl = 0.0;
    double cd = 0.0;
    double dL = 0.0;         // Sectional lift (N)
    double dD = 0.0;         // Sectional drag (N)
    double velocity = 0.0;   // Resultant local velocity (m/s)
    double dT = 0.0;         // Sectional thrust (N)
    double dQ = 0.0;         // Sectional torque (N m)
    LookupStatus cl_status = LookupStatus::Ok;
    LookupStatus cd_status = LookupStatus::Ok;
};

struct SolveResult {
    double thrust = 0.0;  // N, all blades
    double torque = 0.0;  // N m, all blades
    std::vector<SectionResult> sections;  // Same order as the propeller sections

    // Inputs, echoed for traceability
    double rpm = 0.0;
    double velocity = 0.0;
    double air_density = aero_defaults::kSeaLevelAirDensity;

    std::vector<LookupDiagnostic> diagnostics;

    double omega() const;           // rad/s
    double power() const;           // Shaft power, torque * omega (W)
    size_t degradedSections() const;
};

// Direct, single-pass blade element summation at one operating point.
// Pure function of its arguments; throws InvalidOperatingPoint for negative or
// non-finite rpm, non-finite velocity, or a non-positive air density.
SolveResult computeThrustAndTorque(const Propeller& prop, double rpm, double free_stream_velocity,
                                   const BetOptions& options = BetOptions());
