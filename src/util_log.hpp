#pragma once
#include <string>

// Thread-safe one-line log to stderr and perfpulse.err.log
void safe_log(const std::string &s);
