#include "propeller.hpp"

#include <cmath>
#include <functional>
#include <iostream>
#include <vector>

namespace {

bool expectInvalidGeometry(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const InvalidGeometry&) {
        return true;
    }
}

CoefficientCurve flatLift() { return CoefficientCurve::constant(0.5, -10.0, 10.0); }
CoefficientCurve flatDrag() { return CoefficientCurve::constant(0.02, -10.0, 10.0); }

BladeSection makeSection(double radius, double chord, double twist) {
    return BladeSection{radius, chord, twist, flatLift(), flatDrag()};
}

bool testLinearStations() {
    std::cout << "Test: createPropeller interpolates chord and twist with exact endpoints\n";
    const Propeller prop = createPropeller(2, 0.5, 0.05, 3, {0.05, 0.03}, {20.0, 5.0},
                                           flatLift(), flatDrag());

    bool passed = true;
    const auto& s = prop.sections();
    if (s.size() != 3) {
        std::cout << "  FAILED: expected 3 sections, got " << s.size() << "\n";
        std::cout << "  FAILED\n\n";
        return false;
    }
    if (s[0].chord != 0.05 || s[2].chord != 0.03) {
        std::cout << "  FAILED: chord endpoints " << s[0].chord << ", " << s[2].chord << "\n";
        passed = false;
    }
    if (s[0].twist != 20.0 || s[2].twist != 5.0) {
        std::cout << "  FAILED: twist endpoints " << s[0].twist << ", " << s[2].twist << "\n";
        passed = false;
    }
    if (s[0].radius != 0.05 || s[2].radius != 0.25) {
        std::cout << "  FAILED: station endpoints " << s[0].radius << ", " << s[2].radius << "\n";
        passed = false;
    }
    if (std::abs(s[1].radius - 0.15) > 1e-15 || std::abs(s[1].chord - 0.04) > 1e-15 ||
        std::abs(s[1].twist - 12.5) > 1e-12) {
        std::cout << "  FAILED: middle station not at the linear midpoint\n";
        passed = false;
    }
    for (const auto& sec : s) {
        if (sec.lift.value != flatLift().value || sec.drag.value != flatDrag().value) {
            std::cout << "  FAILED: sections should all carry the same airfoil tables\n";
            passed = false;
            break;
        }
    }
    if (prop.numBlades() != 2 || prop.diameter() != 0.5 || prop.hubRadius() != 0.05 ||
        prop.tipRadius() != 0.25) {
        std::cout << "  FAILED: propeller parameters not stored\n";
        passed = false;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testSingleSectionAtHub() {
    std::cout << "Test: A single section is placed at the hub radius\n";
    const Propeller prop = createPropeller(3, 1.0, 0.1, 1, {0.08, 0.02}, {15.0, 2.0},
                                           flatLift(), flatDrag());

    bool passed = prop.numSections() == 1 && prop.section(0).radius == 0.1 &&
                  prop.section(0).chord == 0.08 && prop.section(0).twist == 15.0;
    if (!passed) {
        std::cout << "  FAILED: single station should take the root values at the hub\n";
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testManyStationsIncreasing() {
    std::cout << "Test: Generated stations span hub to tip in increasing order\n";
    const Propeller prop = createPropeller(2, 0.3, 0.0, 25, {0.03, 0.01}, {30.0, 8.0},
                                           flatLift(), flatDrag());

    bool passed = true;
    const auto& s = prop.sections();
    if (s.front().radius != 0.0 || s.back().radius != 0.15) {
        std::cout << "  FAILED: first/last station should be hub/tip\n";
        passed = false;
    }
    for (size_t i = 1; i < s.size(); ++i) {
        if (!(s[i].radius > s[i - 1].radius)) {
            std::cout << "  FAILED: stations not increasing at " << i << "\n";
            passed = false;
            break;
        }
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testCreateRejectsInvalidInputs() {
    std::cout << "Test: createPropeller rejects impossible geometry\n";
    bool passed = true;

    struct Case {
        const char* name;
        std::function<void()> fn;
    };
    const std::vector<Case> cases = {
        {"zero sections", []() {
            (void)createPropeller(2, 0.5, 0.05, 0, {0.05, 0.03}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"diameter equal to hub diameter", []() {
            (void)createPropeller(2, 0.1, 0.05, 5, {0.05, 0.03}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"hub larger than tip", []() {
            (void)createPropeller(2, 0.2, 0.15, 5, {0.05, 0.03}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"negative tip chord", []() {
            (void)createPropeller(2, 0.5, 0.05, 3, {0.05, -0.01}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"zero tip chord", []() {
            (void)createPropeller(2, 0.5, 0.05, 4, {0.02, 0.0}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"zero blades", []() {
            (void)createPropeller(0, 0.5, 0.05, 5, {0.05, 0.03}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"negative hub", []() {
            (void)createPropeller(2, 0.5, -0.01, 5, {0.05, 0.03}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
        {"nan diameter", []() {
            (void)createPropeller(2, std::nan(""), 0.05, 5, {0.05, 0.03}, {20.0, 5.0}, flatLift(), flatDrag());
        }},
    };
    for (const Case& c : cases) {
        if (!expectInvalidGeometry(c.fn)) {
            std::cout << "  FAILED: " << c.name << " was accepted\n";
            passed = false;
        }
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testCustomSections() {
    std::cout << "Test: Custom section lists are validated\n";
    bool passed = true;

    try {
        // Non-uniform spacing is allowed
        Propeller prop(3, 0.6, 0.05, {makeSection(0.06, 0.05, 25.0),
                                      makeSection(0.2, 0.04, 12.0),
                                      makeSection(0.3, 0.02, 6.0)});
        if (prop.numSections() != 3 || prop.section(1).radius != 0.2) {
            std::cout << "  FAILED: custom sections not stored in order\n";
            passed = false;
        }
    } catch (const std::exception& e) {
        std::cout << "  FAILED: valid custom propeller rejected: " << e.what() << "\n";
        passed = false;
    }

    const std::vector<std::pair<const char*, std::vector<BladeSection>>> bad = {
        {"no sections", {}},
        {"unordered radii", {makeSection(0.2, 0.04, 12.0), makeSection(0.1, 0.05, 20.0)}},
        {"duplicate radius", {makeSection(0.1, 0.04, 12.0), makeSection(0.1, 0.05, 20.0)}},
        {"radius beyond tip", {makeSection(0.1, 0.04, 12.0), makeSection(0.31, 0.02, 5.0)}},
        {"radius inside hub", {makeSection(0.04, 0.04, 12.0), makeSection(0.2, 0.02, 5.0)}},
        {"zero chord", {makeSection(0.1, 0.0, 12.0)}},
    };
    for (const auto& b : bad) {
        if (!expectInvalidGeometry([&]() { Propeller p(2, 0.6, 0.05, b.second); })) {
            std::cout << "  FAILED: " << b.first << " was accepted\n";
            passed = false;
        }
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testDesignBuild() {
    std::cout << "Test: PropellerDesign builds the same propeller as createPropeller\n";
    PropellerDesign design;
    design.num_blades = 4;
    design.diameter = 0.4;
    design.hub_radius = 0.02;
    design.num_sections = 8;
    design.chord_range = {0.04, 0.02};
    design.twist_range = {25.0, 8.0};
    design.lift = flatLift();
    design.drag = flatDrag();

    const Propeller a = design.build();
    const Propeller b = createPropeller(4, 0.4, 0.02, 8, {0.04, 0.02}, {25.0, 8.0}, flatLift(), flatDrag());

    bool passed = a.numSections() == b.numSections() && a.numBlades() == 4;
    for (size_t i = 0; passed && i < a.numSections(); ++i) {
        passed = a.section(i).radius == b.section(i).radius &&
                 a.section(i).chord == b.section(i).chord &&
                 a.section(i).twist == b.section(i).twist;
    }
    if (!passed) {
        std::cout << "  FAILED: design build differs\n";
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Propeller Geometry Tests\n";
    std::cout << "========================\n\n";

    int passed = 0;
    const int total = 6;

    if (testLinearStations()) passed++;
    if (testSingleSectionAtHub()) passed++;
    if (testManyStationsIncreasing()) passed++;
    if (testCreateRejectsInvalidInputs()) passed++;
    if (testCustomSections()) passed++;
    if (testDesignBuild()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
