#pragma once

#include "polar.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

// Structurally impossible propeller geometry
class InvalidGeometry : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One radial slice of a blade
struct BladeSection {
    double radius = 0.0;  // Distance from hub center (m)
    double chord = 0.0;   // Local chord length (m)
    double twist = 0.0;   // Geometric twist (deg)
    CoefficientCurve lift;
    CoefficientCurve drag;
};

// Complete blade geometry. Validated on construction and read-only afterwards,
// so one instance can be shared by any number of solver calls.
class Propeller {
public:
    Propeller(int num_blades, double diameter, double hub_radius,
              std::vector<BladeSection> sections);

    int numBlades() const { return num_blades_; }
    double diameter() const { return diameter_; }
    double tipRadius() const { return 0.5 * diameter_; }
    double hubRadius() const { return hub_radius_; }
    size_t numSections() const { return sections_.size(); }
    const std::vector<BladeSection>& sections() const { return sections_; }
    const BladeSection& section(size_t i) const { return sections_.at(i); }

private:
    int num_blades_;
    double diameter_;
    double hub_radius_;
    std::vector<BladeSection> sections_;  // Strictly increasing radius
};

// Linearly interpolated blade: stations evenly spaced from the hub to the tip,
// chord and twist varying linearly from root to tip, one airfoil for all sections.
Propeller createPropeller(int num_blades, double diameter, double hub_radius, int num_sections,
                          const std::pair<double, double>& chord_range,
                          const std::pair<double, double>& twist_range,
                          const CoefficientCurve& lift, const CoefficientCurve& drag);

// Parametric inputs of createPropeller, kept as a value so a field can be varied and rebuilt
struct PropellerDesign {
    int num_blades = 2;
    double diameter = 0.0;
    double hub_radius = 0.0;
    int num_sections = 10;
    std::pair<double, double> chord_range{0.0, 0.0};  // Root, tip (m)
    std::pair<double, double> twist_range{0.0, 0.0};  // Root, tip (deg)
    CoefficientCurve lift;
    CoefficientCurve drag;

    Propeller build() const {
        return createPropeller(num_blades, diameter, hub_radius, num_sections,
                               chord_range, twist_range, lift, drag);
    }
};
