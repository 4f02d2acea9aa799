#pragma once

#include "cmd_args.hpp"
#include "config.hpp"

int runOptim(const Config& cfg, const CliOverrides& overrides);
