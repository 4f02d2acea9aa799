#include "optimize.hpp"
#include "grid.hpp"
#include "sweep.hpp"

#include <nlopt.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

// Context for the trim objective callback
struct TrimContext {
    const Propeller* prop;
    const BetOptions* bet;
    double target;
    double scale;
    double velocity;
    int evaluations = 0;
    double best_rpm = 0.0;
    double best_f = std::numeric_limits<double>::infinity();
};

double trimResidual(TrimContext& ctx, double rpm) {
    const SolveResult r = computeThrustAndTorque(*ctx.prop, rpm, ctx.velocity, *ctx.bet);
    ctx.evaluations++;
    const double res = (r.thrust - ctx.target) / ctx.scale;
    const double f = res * res;
    if (f < ctx.best_f) {
        ctx.best_f = f;
        ctx.best_rpm = rpm;
    }
    return f;
}

double trimObjective(const std::vector<double>& x, std::vector<double>& grad, void* data) {
    (void)grad;
    return trimResidual(*static_cast<TrimContext*>(data), x[0]);
}

struct TwistContext {
    PropellerDesign design;
    const TwistOptimConfig* config;
    double rpm;
    double velocity;
    int evaluations = 0;
    std::vector<double> best_x;
    double best_f = -std::numeric_limits<double>::infinity();
};

double evaluateTwist(TwistContext& ctx, const std::vector<double>& x) {
    ctx.design.twist_range = {x[0], x[1]};
    const Propeller prop = ctx.design.build();
    const SolveResult r = computeThrustAndTorque(prop, ctx.rpm, ctx.velocity, ctx.config->bet);
    ctx.evaluations++;
    const double f = designMerit(r, ctx.config->objective);
    if (f > ctx.best_f) {
        ctx.best_f = f;
        ctx.best_x = x;
    }
    return f;
}

double twistObjective(const std::vector<double>& x, std::vector<double>& grad, void* data) {
    (void)grad;
    return evaluateTwist(*static_cast<TwistContext*>(data), x);
}

double clampTo(double x, const std::pair<double, double>& bounds) {
    return std::max(bounds.first, std::min(bounds.second, x));
}

void checkBounds(const std::pair<double, double>& bounds, const char* name) {
    if (!std::isfinite(bounds.first) || !std::isfinite(bounds.second) ||
        bounds.second <= bounds.first) {
        throw std::invalid_argument(std::string(name) + ": expected finite bounds with min < max");
    }
}

}  // namespace

TrimResult trimRpmForThrust(const Propeller& prop, double target_thrust, double velocity,
                            const TrimConfig& config) {
    if (!std::isfinite(target_thrust)) {
        throw std::invalid_argument("trimRpmForThrust: target thrust must be finite");
    }
    if (config.rpm_min < 0.0 || !(config.rpm_max > config.rpm_min)) {
        throw std::invalid_argument("trimRpmForThrust: expected 0 <= rpm_min < rpm_max");
    }
    if (config.n_grid < 2) {
        throw std::invalid_argument("trimRpmForThrust: n_grid must be >= 2");
    }

    TrimContext ctx{&prop, &config.bet, target_thrust,
                    std::max(std::abs(target_thrust), 1.0), velocity};

    // Coarse scan to start the local search in the right basin
    const std::vector<double> grid = linspace(config.rpm_min, config.rpm_max, config.n_grid);
    for (double rpm : grid) {
        trimResidual(ctx, rpm);
    }

    nlopt::opt opt(nlopt::LN_COBYLA, 1);
    opt.set_lower_bounds(std::vector<double>{config.rpm_min});
    opt.set_upper_bounds(std::vector<double>{config.rpm_max});
    opt.set_min_objective(trimObjective, &ctx);
    opt.set_maxeval(config.max_eval);
    opt.set_initial_step(0.5 * (grid[1] - grid[0]));
    opt.set_xtol_rel(1e-10);
    opt.set_ftol_abs(1e-20);

    std::vector<double> x = {ctx.best_rpm};
    double minf = ctx.best_f;
    try {
        opt.optimize(x, minf);
    } catch (const std::exception& e) {
        std::cerr << "NLopt failed: " << e.what() << ", keeping best rpm found" << std::endl;
    }

    const SolveResult best = computeThrustAndTorque(prop, ctx.best_rpm, velocity, config.bet);

    TrimResult result;
    result.rpm = ctx.best_rpm;
    result.thrust = best.thrust;
    result.torque = best.torque;
    result.residual = (best.thrust - target_thrust) / ctx.scale;
    result.converged = std::abs(result.residual) < config.tolerance;
    result.evaluations = ctx.evaluations;
    return result;
}

DesignObjective parseObjective(const std::string& name) {
    if (name == "thrust_per_power") return DesignObjective::ThrustPerPower;
    if (name == "efficiency") return DesignObjective::Efficiency;
    throw std::runtime_error("Unknown objective: '" + name +
                             "' (expected 'thrust_per_power' or 'efficiency')");
}

const char* toString(DesignObjective objective) {
    switch (objective) {
        case DesignObjective::ThrustPerPower: return "thrust_per_power";
        case DesignObjective::Efficiency: return "efficiency";
    }
    return "unknown";
}

double designMerit(const SolveResult& result, DesignObjective objective) {
    switch (objective) {
        case DesignObjective::ThrustPerPower: {
            const double power = result.power();
            return (power > 0.0) ? result.thrust / power : 0.0;
        }
        case DesignObjective::Efficiency:
            return propulsiveEfficiency(result);
    }
    throw std::runtime_error("Unsupported design objective");
}

TwistOptimResult optimizeTwist(const PropellerDesign& design, double rpm, double velocity,
                               const TwistOptimConfig& config) {
    checkBounds(config.root_bounds, "optimizeTwist root twist");
    checkBounds(config.tip_bounds, "optimizeTwist tip twist");

    TwistContext ctx{design, &config, rpm, velocity};

    std::vector<double> x = {
        clampTo(design.twist_range.first, config.root_bounds),
        clampTo(design.twist_range.second, config.tip_bounds)
    };
    const double initial = evaluateTwist(ctx, x);

    nlopt::opt opt(nlopt::LN_COBYLA, 2);
    opt.set_lower_bounds({config.root_bounds.first, config.tip_bounds.first});
    opt.set_upper_bounds({config.root_bounds.second, config.tip_bounds.second});
    opt.set_max_objective(twistObjective, &ctx);
    opt.set_maxeval(config.max_eval);
    opt.set_xtol_rel(1e-8);
    opt.set_ftol_rel(1e-10);

    double maxf = initial;
    try {
        opt.optimize(x, maxf);
    } catch (const std::exception& e) {
        std::cerr << "NLopt failed: " << e.what() << ", keeping best twist found" << std::endl;
    }

    TwistOptimResult result;
    result.design = design;
    result.design.twist_range = {ctx.best_x[0], ctx.best_x[1]};
    result.objective = ctx.best_f;
    result.initial_objective = initial;
    result.solve = computeThrustAndTorque(result.design.build(), rpm, velocity, config.bet);
    result.evaluations = ctx.evaluations;
    return result;
}
