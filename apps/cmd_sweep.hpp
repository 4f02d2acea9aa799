#pragma once

#include "cmd_args.hpp"
#include "config.hpp"

int runSweep(const Config& cfg, const CliOverrides& overrides);
