#include "cmd_trim.hpp"
#include "optimize.hpp"
#include "prop_setup.hpp"

#include <iostream>

int runTrim(const Config& cfg, const CliOverrides& overrides) {
    const Propeller prop = buildPropeller(cfg);
    const double target = cfg.getDouble("target_thrust");
    const double velocity = overrides.velocity ? *overrides.velocity : cfg.getDouble("velocity", 0.0);
    const TrimConfig trim = readTrimConfig(cfg);

    std::cout << "Trimming for " << target << " N at V = " << velocity << " m/s, rpm in ["
              << trim.rpm_min << ", " << trim.rpm_max << "]..." << std::endl;

    const TrimResult result = trimRpmForThrust(prop, target, velocity, trim);

    std::cout << "  rpm:         " << result.rpm << "\n";
    std::cout << "  thrust:      " << result.thrust << " N\n";
    std::cout << "  torque:      " << result.torque << " N m\n";
    std::cout << "  residual:    " << result.residual << "\n";
    std::cout << "  evaluations: " << result.evaluations << "\n";

    if (!result.converged) {
        std::cerr << "Target thrust not reached within rpm bounds" << std::endl;
        return 1;
    }
    return 0;
}
