#include "output.hpp"

#include <highfive/H5Easy.hpp>
#include <highfive/H5File.hpp>

#include <iomanip>
#include <utility>
#include <vector>

namespace {

// Extract one SectionResult column
std::vector<double> column(const SolveResult& result, double SectionResult::* member) {
    std::vector<double> values;
    values.reserve(result.sections.size());
    for (const auto& s : result.sections) {
        values.push_back(s.*member);
    }
    return values;
}

std::vector<int> statusColumn(const SolveResult& result, LookupStatus SectionResult::* member) {
    std::vector<int> values;
    values.reserve(result.sections.size());
    for (const auto& s : result.sections) {
        values.push_back(static_cast<int>(s.*member));
    }
    return values;
}

// Row-major nested vectors for HDF5 2D datasets
template <typename Derived>
std::vector<std::vector<typename Derived::Scalar>> toRows(const Eigen::MatrixBase<Derived>& m) {
    std::vector<std::vector<typename Derived::Scalar>> rows(static_cast<size_t>(m.rows()));
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        rows[static_cast<size_t>(i)].resize(static_cast<size_t>(m.cols()));
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            rows[static_cast<size_t>(i)][static_cast<size_t>(j)] = m(i, j);
        }
    }
    return rows;
}

void writeGeometry(HighFive::File& file, const Propeller& prop) {
    file.createGroup("/geometry");
    H5Easy::dump(file, "/geometry/num_blades", prop.numBlades());
    H5Easy::dump(file, "/geometry/diameter", prop.diameter());
    H5Easy::dump(file, "/geometry/hub_radius", prop.hubRadius());
    H5Easy::dump(file, "/geometry/num_sections", static_cast<int>(prop.numSections()));
}

}  // namespace

void writeSolveHDF5(const std::string& filename, const Propeller& prop, const SolveResult& result) {
    HighFive::File file(filename, HighFive::File::Overwrite);

    writeGeometry(file, prop);

    file.createGroup("/operating_point");
    H5Easy::dump(file, "/operating_point/rpm", result.rpm);
    H5Easy::dump(file, "/operating_point/velocity", result.velocity);
    H5Easy::dump(file, "/operating_point/air_density", result.air_density);

    file.createGroup("/totals");
    H5Easy::dump(file, "/totals/thrust", result.thrust);
    H5Easy::dump(file, "/totals/torque", result.torque);
    H5Easy::dump(file, "/totals/power", result.power());

    file.createGroup("/sections");
    const std::pair<const char*, double SectionResult::*> columns[] = {
        {"radius", &SectionResult::radius},
        {"r_over_R", &SectionResult::r_over_R},
        {"alpha_deg", &SectionResult::alpha_deg},
        {"phi_deg", &SectionResult::phi_deg},
        {"chord", &SectionResult::chord},
        {"twist", &SectionResult::twist},
        {"cl", &SectionResult::cl},
        {"cd", &SectionResult::cd},
        {"dL", &SectionResult::dL},
        {"dD", &SectionResult::dD},
        {"velocity", &SectionResult::velocity},
        {"dT", &SectionResult::dT},
        {"dQ", &SectionResult::dQ},
    };
    for (const auto& col : columns) {
        H5Easy::dump(file, std::string("/sections/") + col.first, column(result, col.second));
    }
    H5Easy::dump(file, "/sections/cl_status", statusColumn(result, &SectionResult::cl_status));
    H5Easy::dump(file, "/sections/cd_status", statusColumn(result, &SectionResult::cd_status));
}

void writeSweepHDF5(const std::string& filename, const Propeller& prop, const SweepTable& table) {
    HighFive::File file(filename, HighFive::File::Overwrite);

    writeGeometry(file, prop);

    H5Easy::dump(file, "/rpm", table.rpm);
    H5Easy::dump(file, "/velocity", table.velocity);
    H5Easy::dump(file, "/thrust", toRows(table.thrust));
    H5Easy::dump(file, "/torque", toRows(table.torque));
    H5Easy::dump(file, "/power", toRows(table.power));
    H5Easy::dump(file, "/efficiency", toRows(table.efficiency));
    H5Easy::dump(file, "/advance_ratio", toRows(table.advance_ratio));
    H5Easy::dump(file, "/degraded_sections", toRows(table.degraded_sections));
}

void printSectionTable(std::ostream& os, const SolveResult& result) {
    const std::ios::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();

    os << "rpm = " << result.rpm << ", velocity = " << result.velocity
       << " m/s, air density = " << result.air_density << " kg/m^3\n";
    os << std::setw(8) << "r" << std::setw(8) << "r/R"
       << std::setw(9) << "alpha" << std::setw(9) << "phi"
       << std::setw(8) << "chord" << std::setw(8) << "twist"
       << std::setw(8) << "cl" << std::setw(8) << "cd"
       << std::setw(11) << "dL" << std::setw(11) << "dD"
       << std::setw(10) << "V" << std::setw(11) << "dT"
       << std::setw(11) << "dQ" << "\n";

    os << std::fixed;
    for (const auto& s : result.sections) {
        os << std::setprecision(4) << std::setw(8) << s.radius
           << std::setw(8) << s.r_over_R
           << std::setprecision(2) << std::setw(9) << s.alpha_deg
           << std::setw(9) << s.phi_deg
           << std::setprecision(4) << std::setw(8) << s.chord
           << std::setprecision(2) << std::setw(8) << s.twist
           << std::setprecision(4) << std::setw(8) << s.cl
           << std::setw(8) << s.cd
           << std::setprecision(5) << std::setw(11) << s.dL
           << std::setw(11) << s.dD
           << std::setprecision(2) << std::setw(10) << s.velocity
           << std::setprecision(5) << std::setw(11) << s.dT
           << std::setw(11) << s.dQ;
        if (s.cl_status != LookupStatus::Ok || s.cd_status != LookupStatus::Ok) {
            os << "  *";
        }
        os << "\n";
    }

    os << std::setprecision(5);
    os << "Total thrust: " << result.thrust << " N\n";
    os << "Total torque: " << result.torque << " N m\n";
    os << "Shaft power:  " << result.power() << " W\n";
    if (!result.diagnostics.empty()) {
        os << "(*) " << result.degradedSections() << " section(s) with degraded coefficient lookup\n";
    }

    os.flags(flags);
    os.precision(precision);
}
