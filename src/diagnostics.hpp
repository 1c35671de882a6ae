#pragma once

#include "config.hpp"

// Prints configuration, device detection, captured capabilities, the state of
// both stable links and uinput access to stdout. Creates nothing and always
// returns 0; problems are reported in the output.
int diagnostics_mode(const Config& config);
