#pragma once

#include "bet_solver.hpp"
#include "propeller.hpp"

#include <string>
#include <utility>

// RPM trim: find the rotational speed giving a target thrust at fixed velocity
struct TrimConfig {
    double rpm_min = 0.0;
    double rpm_max = 20000.0;
    int n_grid = 21;           // Coarse scan points before local refinement
    int max_eval = 200;        // Max evaluations for the local optimizer
    double tolerance = 1e-4;   // Relative thrust residual counted as converged
    BetOptions bet;
};

struct TrimResult {
    double rpm = 0.0;
    double thrust = 0.0;
    double torque = 0.0;
    double residual = 0.0;     // (thrust - target) / max(|target|, 1)
    bool converged = false;
    int evaluations = 0;
};

TrimResult trimRpmForThrust(const Propeller& prop, double target_thrust, double velocity,
                            const TrimConfig& config = TrimConfig());

enum class DesignObjective {
    ThrustPerPower,  // thrust / shaft power (N/W), usable in static thrust
    Efficiency       // propulsive efficiency thrust * V / power
};

DesignObjective parseObjective(const std::string& name);
const char* toString(DesignObjective objective);

struct TwistOptimConfig {
    std::pair<double, double> root_bounds{0.0, 45.0};  // deg
    std::pair<double, double> tip_bounds{-5.0, 30.0};  // deg
    DesignObjective objective = DesignObjective::ThrustPerPower;
    int max_eval = 300;
    BetOptions bet;
};

struct TwistOptimResult {
    PropellerDesign design;         // Best design found
    double objective = 0.0;
    double initial_objective = 0.0; // At the starting twist, clamped to the bounds
    SolveResult solve;              // Operating point evaluated with the best design
    int evaluations = 0;
};

// Figure of merit of one solve; 0 where it is undefined (no shaft power)
double designMerit(const SolveResult& result, DesignObjective objective);

// Vary root and tip twist of the design to maximize the objective at (rpm, velocity).
// The returned objective is never below the initial one.
TwistOptimResult optimizeTwist(const PropellerDesign& design, double rpm, double velocity,
                               const TwistOptimConfig& config = TwistOptimConfig());
