#include "cmd_optim.hpp"
#include "optimize.hpp"
#include "output.hpp"
#include "prop_setup.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int runOptim(const Config& cfg, const CliOverrides& overrides) {
    if (cfg.hasSections()) {
        throw std::runtime_error("optim varies the parametric twist range; remove [[section]] blocks");
    }
    const PropellerDesign design = readPropellerDesign(cfg);
    OperatingPoint op = readOperatingPoint(cfg);
    if (overrides.rpm) op.rpm = *overrides.rpm;
    if (overrides.velocity) op.velocity = *overrides.velocity;
    const TwistOptimConfig optim = readTwistOptimConfig(cfg);

    std::cout << "Optimizing twist for " << toString(optim.objective) << " at rpm = " << op.rpm
              << ", V = " << op.velocity << " m/s" << std::endl;

    const TwistOptimResult result = optimizeTwist(design, op.rpm, op.velocity, optim);

    std::cout << "  twist root/tip: " << result.design.twist_range.first << " / "
              << result.design.twist_range.second << " deg\n";
    std::cout << "  objective:      " << result.objective << " (initial "
              << result.initial_objective << ")\n";
    std::cout << "  evaluations:    " << result.evaluations << "\n\n";
    printSectionTable(std::cout, result.solve);

    const std::string output_file = overrides.output ? *overrides.output : cfg.getString("output", "");
    if (!output_file.empty()) {
        writeSolveHDF5(output_file, result.design.build(), result.solve);
        std::cout << "Output written to " << output_file << std::endl;
    }
    return 0;
}
