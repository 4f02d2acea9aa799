#include "propeller.hpp"
#include "grid.hpp"

#include <cmath>
#include <string>

namespace {

void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidGeometry(std::string(name) + " must be finite");
    }
}

void validateEnvelope(int num_blades, double diameter, double hub_radius) {
    requireFinite(diameter, "diameter");
    requireFinite(hub_radius, "hub_radius");
    if (num_blades < 1) {
        throw InvalidGeometry("num_blades must be >= 1, got " + std::to_string(num_blades));
    }
    if (hub_radius < 0.0) {
        throw InvalidGeometry("hub_radius must be >= 0");
    }
    if (diameter <= 2.0 * hub_radius) {
        throw InvalidGeometry("diameter (" + std::to_string(diameter) +
                              ") must exceed twice the hub radius (" +
                              std::to_string(hub_radius) + ")");
    }
}

}  // namespace

Propeller::Propeller(int num_blades, double diameter, double hub_radius,
                     std::vector<BladeSection> sections)
    : num_blades_(num_blades), diameter_(diameter), hub_radius_(hub_radius),
      sections_(std::move(sections)) {
    validateEnvelope(num_blades_, diameter_, hub_radius_);
    if (sections_.empty()) {
        throw InvalidGeometry("propeller must have at least one blade section");
    }

    const double tip = tipRadius();
    for (size_t i = 0; i < sections_.size(); ++i) {
        const BladeSection& s = sections_[i];
        const std::string where = "section " + std::to_string(i);
        requireFinite(s.radius, "section radius");
        requireFinite(s.chord, "section chord");
        requireFinite(s.twist, "section twist");
        if (s.radius < hub_radius_ || s.radius > tip) {
            throw InvalidGeometry(where + ": radius " + std::to_string(s.radius) +
                                  " outside [hub_radius, diameter/2]");
        }
        if (s.chord <= 0.0) {
            throw InvalidGeometry(where + ": chord must be > 0, got " + std::to_string(s.chord));
        }
        if (i > 0 && !(s.radius > sections_[i - 1].radius)) {
            throw InvalidGeometry(where + ": sections must be ordered by increasing radius");
        }
    }
}

Propeller createPropeller(int num_blades, double diameter, double hub_radius, int num_sections,
                          const std::pair<double, double>& chord_range,
                          const std::pair<double, double>& twist_range,
                          const CoefficientCurve& lift, const CoefficientCurve& drag) {
    if (num_sections < 1) {
        throw InvalidGeometry("num_sections must be >= 1, got " + std::to_string(num_sections));
    }
    validateEnvelope(num_blades, diameter, hub_radius);
    requireFinite(chord_range.first, "chord_range");
    requireFinite(chord_range.second, "chord_range");
    requireFinite(twist_range.first, "twist_range");
    requireFinite(twist_range.second, "twist_range");

    const std::vector<double> radii = linspace(hub_radius, 0.5 * diameter, num_sections);
    const std::vector<double> chords = linspace(chord_range.first, chord_range.second, num_sections);
    const std::vector<double> twists = linspace(twist_range.first, twist_range.second, num_sections);

    std::vector<BladeSection> sections;
    sections.reserve(radii.size());
    for (size_t i = 0; i < radii.size(); ++i) {
        if (chords[i] <= 0.0) {
            throw InvalidGeometry("chord at station " + std::to_string(i) +
                                  " must be > 0, got " + std::to_string(chords[i]));
        }
        sections.push_back(BladeSection{radii[i], chords[i], twists[i], lift, drag});
    }

    return Propeller(num_blades, diameter, hub_radius, std::move(sections));
}
