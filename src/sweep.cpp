#include "sweep.hpp"

#include <limits>
#include <stdexcept>

double propulsiveEfficiency(const SolveResult& result) {
    const double power = result.power();
    if (!(power > 0.0)) {
        return 0.0;
    }
    return result.thrust * result.velocity / power;
}

double advanceRatio(double rpm, double velocity, double diameter) {
    const double n = rpm / 60.0;  // rev/s
    if (n <= 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return velocity / (n * diameter);
}

SweepTable sweepOperatingPoints(const Propeller& prop,
                                const std::vector<double>& rpm_values,
                                const std::vector<double>& velocity_values,
                                const BetOptions& options) {
    if (rpm_values.empty() || velocity_values.empty()) {
        throw std::invalid_argument("sweepOperatingPoints: rpm and velocity axes must be non-empty");
    }

    const Eigen::Index n_rpm = static_cast<Eigen::Index>(rpm_values.size());
    const Eigen::Index n_vel = static_cast<Eigen::Index>(velocity_values.size());

    SweepTable table;
    table.rpm = rpm_values;
    table.velocity = velocity_values;
    table.thrust = Mat::Zero(n_rpm, n_vel);
    table.torque = Mat::Zero(n_rpm, n_vel);
    table.power = Mat::Zero(n_rpm, n_vel);
    table.efficiency = Mat::Zero(n_rpm, n_vel);
    table.advance_ratio = Mat::Zero(n_rpm, n_vel);
    table.degraded_sections = Eigen::MatrixXi::Zero(n_rpm, n_vel);

    // Each cell is an independent pure solve
    for (Eigen::Index i = 0; i < n_rpm; ++i) {
        for (Eigen::Index j = 0; j < n_vel; ++j) {
            const double rpm = rpm_values[static_cast<size_t>(i)];
            const double V = velocity_values[static_cast<size_t>(j)];
            const SolveResult r = computeThrustAndTorque(prop, rpm, V, options);

            table.thrust(i, j) = r.thrust;
            table.torque(i, j) = r.torque;
            table.power(i, j) = r.power();
            table.efficiency(i, j) = propulsiveEfficiency(r);
            table.advance_ratio(i, j) = advanceRatio(rpm, V, prop.diameter());
            table.degraded_sections(i, j) = static_cast<int>(r.degradedSections());
        }
    }
    return table;
}
