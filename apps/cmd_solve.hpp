#pragma once

#include "cmd_args.hpp"
#include "config.hpp"

int runSolve(const Config& cfg, const CliOverrides& overrides);
