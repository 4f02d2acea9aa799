#include "prop_setup.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

Propeller buildCustomPropeller(const Config& cfg) {
    const int num_blades = cfg.getInt("num_blades");
    const double diameter = cfg.getDouble("diameter");
    const double hub_radius = cfg.getDouble("hub_radius", 0.0);

    // Only required when some section does not carry its own tables
    const bool has_global_airfoil = cfg.has("alpha_deg");
    CoefficientCurve global_lift;
    CoefficientCurve global_drag;
    if (has_global_airfoil) {
        global_lift = readLiftCurve(cfg);
        global_drag = readDragCurve(cfg);
    }

    std::vector<BladeSection> sections;
    for (const auto& entry : cfg.getSectionEntries()) {
        BladeSection s;
        s.radius = entry.radius;
        s.chord = entry.chord;
        s.twist = entry.twist;

        const bool own_lift = !entry.cl.empty();
        const bool own_drag = !entry.cd.empty();
        const bool self_contained = own_lift && own_drag && !entry.alpha_deg.empty();
        if (!self_contained && !has_global_airfoil) {
            throw std::runtime_error("[[section]] at line " + std::to_string(entry.line) +
                                     " needs alpha_deg, cl and cd, or global airfoil tables");
        }

        if (own_lift) {
            s.lift = CoefficientCurve(entry.alpha_deg.empty() ? global_lift.alpha_deg
                                                              : entry.alpha_deg,
                                      entry.cl);
        } else {
            s.lift = global_lift;
        }
        if (own_drag) {
            s.drag = CoefficientCurve(entry.alpha_deg.empty() ? global_drag.alpha_deg
                                                              : entry.alpha_deg,
                                      entry.cd);
        } else {
            s.drag = global_drag;
        }
        sections.push_back(std::move(s));
    }

    return Propeller(num_blades, diameter, hub_radius, std::move(sections));
}

}  // namespace

CoefficientCurve readLiftCurve(const Config& cfg) {
    return CoefficientCurve(cfg.getDoubleList("alpha_deg"), cfg.getDoubleList("cl"));
}

CoefficientCurve readDragCurve(const Config& cfg) {
    const std::string alpha_key = cfg.has("cd_alpha_deg") ? "cd_alpha_deg" : "alpha_deg";
    return CoefficientCurve(cfg.getDoubleList(alpha_key), cfg.getDoubleList("cd"));
}

PropellerDesign readPropellerDesign(const Config& cfg) {
    PropellerDesign design;
    design.num_blades = cfg.getInt("num_blades");
    design.diameter = cfg.getDouble("diameter");
    design.hub_radius = cfg.getDouble("hub_radius", 0.0);
    design.num_sections = cfg.getInt("num_sections", design.num_sections);
    design.chord_range = cfg.getPair("chord_range");
    design.twist_range = cfg.getPair("twist_range");
    design.lift = readLiftCurve(cfg);
    design.drag = readDragCurve(cfg);
    return design;
}

Propeller buildPropeller(const Config& cfg) {
    if (cfg.hasSections()) {
        return buildCustomPropeller(cfg);
    }
    return readPropellerDesign(cfg).build();
}

OperatingPoint readOperatingPoint(const Config& cfg) {
    OperatingPoint op;
    op.rpm = cfg.getDouble("rpm");
    op.velocity = cfg.getDouble("velocity", 0.0);
    return op;
}

BetOptions readBetOptions(const Config& cfg) {
    BetOptions options;
    options.air_density = cfg.getDouble("air_density", options.air_density);
    options.report_degraded = cfg.getBool("report_degraded", options.report_degraded);
    return options;
}

TrimConfig readTrimConfig(const Config& cfg) {
    TrimConfig trim;
    trim.rpm_min = cfg.getDouble("rpm_min", trim.rpm_min);
    trim.rpm_max = cfg.getDouble("rpm_max", trim.rpm_max);
    trim.n_grid = cfg.getInt("trim_grid", trim.n_grid);
    trim.max_eval = cfg.getInt("max_eval", trim.max_eval);
    trim.tolerance = cfg.getDouble("trim_tol", trim.tolerance);
    trim.bet = readBetOptions(cfg);
    return trim;
}

TwistOptimConfig readTwistOptimConfig(const Config& cfg) {
    TwistOptimConfig optim;
    optim.root_bounds = cfg.getPair("twist_root_bounds", optim.root_bounds);
    optim.tip_bounds = cfg.getPair("twist_tip_bounds", optim.tip_bounds);
    if (cfg.has("objective")) {
        optim.objective = parseObjective(cfg.getString("objective"));
    }
    optim.max_eval = cfg.getInt("max_eval", optim.max_eval);
    optim.bet = readBetOptions(cfg);
    return optim;
}
