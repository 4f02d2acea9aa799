#include "cmd_sweep.hpp"
#include "output.hpp"
#include "prop_setup.hpp"
#include "sweep.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int runSweep(const Config& cfg, const CliOverrides& overrides) {
    const Propeller prop = buildPropeller(cfg);
    BetOptions options = readBetOptions(cfg);
    // One warning per degraded lookup would flood the terminal on a grid
    options.report_degraded = false;

    std::vector<double> rpm_values = cfg.has("rpm_sweep") ? cfg.getAxis("rpm_sweep")
                                                          : std::vector<double>{cfg.getDouble("rpm")};
    std::vector<double> velocity_values = cfg.has("velocity_sweep")
                                              ? cfg.getAxis("velocity_sweep")
                                              : std::vector<double>{cfg.getDouble("velocity", 0.0)};
    if (overrides.rpm) rpm_values = {*overrides.rpm};
    if (overrides.velocity) velocity_values = {*overrides.velocity};

    std::cout << "Sweeping " << rpm_values.size() << " rpm x " << velocity_values.size()
              << " velocity points..." << std::endl;
    const SweepTable table = sweepOperatingPoints(prop, rpm_values, velocity_values, options);

    std::cout << std::setw(10) << "rpm" << std::setw(10) << "V"
              << std::setw(12) << "thrust" << std::setw(12) << "torque"
              << std::setw(12) << "power" << std::setw(8) << "eta"
              << std::setw(8) << "J" << "\n";
    std::cout << std::fixed;
    for (size_t i = 0; i < table.rows(); ++i) {
        for (size_t j = 0; j < table.cols(); ++j) {
            const Eigen::Index r = static_cast<Eigen::Index>(i);
            const Eigen::Index c = static_cast<Eigen::Index>(j);
            std::cout << std::setprecision(1) << std::setw(10) << table.rpm[i]
                      << std::setw(10) << table.velocity[j]
                      << std::setprecision(4) << std::setw(12) << table.thrust(r, c)
                      << std::setw(12) << table.torque(r, c)
                      << std::setprecision(2) << std::setw(12) << table.power(r, c)
                      << std::setprecision(3) << std::setw(8) << table.efficiency(r, c)
                      << std::setw(8) << table.advance_ratio(r, c);
            if (table.degraded_sections(r, c) > 0) {
                std::cout << "  (" << table.degraded_sections(r, c) << " degraded)";
            }
            std::cout << "\n";
        }
    }

    const std::string output_file = overrides.output ? *overrides.output : cfg.getString("output", "");
    if (!output_file.empty()) {
        writeSweepHDF5(output_file, prop, table);
        std::cout << "Output written to " << output_file << std::endl;
    }
    return 0;
}
