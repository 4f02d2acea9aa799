#pragma once

#include "bet_solver.hpp"
#include "linalg.hpp"
#include "propeller.hpp"

#include <vector>

// Solver results over an RPM x velocity grid (rows = rpm, columns = velocity)
struct SweepTable {
    std::vector<double> rpm;
    std::vector<double> velocity;
    Mat thrust;
    Mat torque;
    Mat power;          // torque * omega
    Mat efficiency;     // thrust * V / power, 0 when power <= 0
    Mat advance_ratio;  // V / (n D), NaN at zero rpm
    Eigen::MatrixXi degraded_sections;

    size_t rows() const { return rpm.size(); }
    size_t cols() const { return velocity.size(); }
};

// Per-point derived quantities shared by sweeps and the optimizer
double propulsiveEfficiency(const SolveResult& result);
double advanceRatio(double rpm, double velocity, double diameter);

SweepTable sweepOperatingPoints(const Propeller& prop,
                                const std::vector<double>& rpm_values,
                                const std::vector<double>& velocity_values,
                                const BetOptions& options = BetOptions());
