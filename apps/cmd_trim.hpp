#pragma once

#include "cmd_args.hpp"
#include "config.hpp"

int runTrim(const Config& cfg, const CliOverrides& overrides);
