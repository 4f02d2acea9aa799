#include "polar.hpp"

#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

bool expectInvalid(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const std::invalid_argument&) {
        return true;
    }
}

bool near(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

bool testInteriorInterpolation() {
    std::cout << "Test: Linear interpolation between table points\n";
    const std::vector<double> xs = {0.0, 10.0, 20.0};
    const std::vector<double> ys = {0.0, 1.0, 4.0};

    bool passed = true;
    struct Check { double x; double expected; };
    for (const Check& c : std::vector<Check>{{5.0, 0.5}, {15.0, 2.5}, {2.5, 0.25}, {19.0, 3.7}}) {
        const double got = interpolateClamped(c.x, xs, ys);
        if (!near(got, c.expected)) {
            std::cout << "  FAILED: x = " << c.x << " gave " << got << ", expected " << c.expected << "\n";
            passed = false;
        }
    }

    // Samples are reproduced exactly
    if (interpolateClamped(10.0, xs, ys) != 1.0 || interpolateClamped(20.0, xs, ys) != 4.0 ||
        interpolateClamped(0.0, xs, ys) != 0.0) {
        std::cout << "  FAILED: table samples not reproduced exactly\n";
        passed = false;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testClampOutsideDomain() {
    std::cout << "Test: Queries outside the table clamp to the boundary value\n";
    const std::vector<double> xs = {-10.0, 0.0, 10.0};
    const std::vector<double> ys = {-0.6, 0.2, 1.1};

    bool passed = true;
    if (interpolateClamped(-25.0, xs, ys) != -0.6) {
        std::cout << "  FAILED: low side not clamped\n";
        passed = false;
    }
    if (interpolateClamped(90.0, xs, ys) != 1.1) {
        std::cout << "  FAILED: high side not clamped\n";
        passed = false;
    }
    if (interpolateClamped(-1e300, xs, ys) != -0.6 || interpolateClamped(1e300, xs, ys) != 1.1) {
        std::cout << "  FAILED: extreme queries not clamped\n";
        passed = false;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testSinglePointTable() {
    std::cout << "Test: Single-point table is constant\n";
    const std::vector<double> xs = {3.0};
    const std::vector<double> ys = {0.7};

    bool passed = true;
    for (double x : {-100.0, 3.0, 100.0}) {
        if (interpolateClamped(x, xs, ys) != 0.7) {
            std::cout << "  FAILED: x = " << x << "\n";
            passed = false;
        }
    }
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testMalformedTablesRejected() {
    std::cout << "Test: Malformed tables throw std::invalid_argument\n";
    const double nan = std::numeric_limits<double>::quiet_NaN();

    bool passed = true;
    struct Case {
        const char* name;
        std::vector<double> xs;
        std::vector<double> ys;
        double x;
    };
    const std::vector<Case> cases = {
        {"empty", {}, {}, 0.0},
        {"size mismatch", {0.0, 1.0}, {0.0}, 0.5},
        {"repeated abscissa", {0.0, 0.0, 1.0}, {0.0, 1.0, 2.0}, 0.5},
        {"decreasing abscissa", {2.0, 1.0}, {0.0, 1.0}, 1.5},
        {"nan sample", {0.0, 1.0}, {0.0, nan}, 0.5},
        {"nan query", {0.0, 1.0}, {0.0, 1.0}, nan},
    };
    for (const Case& c : cases) {
        if (!expectInvalid([&]() { (void)interpolateClamped(c.x, c.xs, c.ys); })) {
            std::cout << "  FAILED: " << c.name << " was accepted\n";
            passed = false;
        }
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testLookupStatus() {
    std::cout << "Test: lookupCoefficient reports clamping and malformed tables\n";
    const CoefficientCurve curve({-5.0, 5.0}, {-0.5, 0.8});

    bool passed = true;
    CoefficientLookup in_range = lookupCoefficient(curve, 0.0);
    if (in_range.status != LookupStatus::Ok || !near(in_range.value, 0.15)) {
        std::cout << "  FAILED: in-range lookup\n";
        passed = false;
    }

    CoefficientLookup edge = lookupCoefficient(curve, 5.0);
    if (edge.status != LookupStatus::Ok || edge.value != 0.8) {
        std::cout << "  FAILED: lookup on the boundary sample should not be degraded\n";
        passed = false;
    }

    CoefficientLookup low = lookupCoefficient(curve, -12.0);
    if (low.status != LookupStatus::ClampedLow || low.value != -0.5 || !low.degraded()) {
        std::cout << "  FAILED: low clamp status/value\n";
        passed = false;
    }

    CoefficientLookup high = lookupCoefficient(curve, 40.0);
    if (high.status != LookupStatus::ClampedHigh || high.value != 0.8) {
        std::cout << "  FAILED: high clamp status/value\n";
        passed = false;
    }

    CoefficientLookup broken = lookupCoefficient(CoefficientCurve({0.0, 1.0}, {0.3}), 0.5);
    if (broken.status != LookupStatus::Malformed || broken.value != 0.0) {
        std::cout << "  FAILED: malformed table should give 0 with Malformed status\n";
        passed = false;
    }

    CoefficientLookup empty = lookupCoefficient(CoefficientCurve(), 0.0);
    if (empty.status != LookupStatus::Malformed || empty.value != 0.0) {
        std::cout << "  FAILED: empty table should give 0 with Malformed status\n";
        passed = false;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testConstantCurveAndValidation() {
    std::cout << "Test: Constant curve builder and validateCurve\n";
    const CoefficientCurve flat = CoefficientCurve::constant(0.02, -10.0, 10.0);

    bool passed = true;
    for (double a : {-30.0, -10.0, 0.0, 7.5, 10.0, 30.0}) {
        if (lookupCoefficient(flat, a).value != 0.02) {
            std::cout << "  FAILED: constant curve at alpha = " << a << "\n";
            passed = false;
        }
    }
    try {
        validateCurve(flat, "flat");
    } catch (const std::exception& e) {
        std::cout << "  FAILED: valid curve rejected: " << e.what() << "\n";
        passed = false;
    }
    if (!expectInvalid([]() { validateCurve(CoefficientCurve({1.0, 0.0}, {0.0, 0.0}), "bad"); })) {
        std::cout << "  FAILED: decreasing curve accepted\n";
        passed = false;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Airfoil Polar Tests\n";
    std::cout << "===================\n\n";

    int passed = 0;
    const int total = 6;

    if (testInteriorInterpolation()) passed++;
    if (testClampOutsideDomain()) passed++;
    if (testSinglePointTable()) passed++;
    if (testMalformedTablesRejected()) passed++;
    if (testLookupStatus()) passed++;
    if (testConstantCurveAndValidation()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
