#pragma once

#include "bet_solver.hpp"
#include "config.hpp"
#include "optimize.hpp"
#include "propeller.hpp"

struct OperatingPoint {
    double rpm = 0.0;
    double velocity = 0.0;
};

// Global airfoil tables: alpha_deg with cl and cd (cd_alpha_deg optionally
// gives the drag table its own angle samples)
CoefficientCurve readLiftCurve(const Config& cfg);
CoefficientCurve readDragCurve(const Config& cfg);

PropellerDesign readPropellerDesign(const Config& cfg);

// [[section]] blocks when present, otherwise the parametric design
Propeller buildPropeller(const Config& cfg);

OperatingPoint readOperatingPoint(const Config& cfg);
BetOptions readBetOptions(const Config& cfg);
TrimConfig readTrimConfig(const Config& cfg);
TwistOptimConfig readTwistOptimConfig(const Config& cfg);
