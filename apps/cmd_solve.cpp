#include "cmd_solve.hpp"
#include "bet_solver.hpp"
#include "output.hpp"
#include "prop_setup.hpp"

#include <iostream>
#include <string>

int runSolve(const Config& cfg, const CliOverrides& overrides) {
    const Propeller prop = buildPropeller(cfg);
    OperatingPoint op = readOperatingPoint(cfg);
    if (overrides.rpm) op.rpm = *overrides.rpm;
    if (overrides.velocity) op.velocity = *overrides.velocity;
    const BetOptions options = readBetOptions(cfg);

    std::cout << "Propeller: " << prop.numBlades() << " blades, D = " << prop.diameter()
              << " m, " << prop.numSections() << " sections" << std::endl;

    const SolveResult result = computeThrustAndTorque(prop, op.rpm, op.velocity, options);
    printSectionTable(std::cout, result);

    const std::string output_file = overrides.output ? *overrides.output : cfg.getString("output", "");
    if (!output_file.empty()) {
        writeSolveHDF5(output_file, prop, result);
        std::cout << "Output written to " << output_file << std::endl;
    }
    return 0;
}
