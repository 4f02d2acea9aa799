#pragma once

#include "bet_solver.hpp"
#include "propeller.hpp"
#include "sweep.hpp"

#include <ostream>
#include <string>

// Write one operating point (geometry, totals, per-section columns) to HDF5
void writeSolveHDF5(const std::string& filename, const Propeller& prop, const SolveResult& result);

// Write sweep axes and RPM x velocity result grids to HDF5
void writeSweepHDF5(const std::string& filename, const Propeller& prop, const SweepTable& table);

// Fixed-width per-section rows followed by totals
void printSectionTable(std::ostream& os, const SolveResult& result);
