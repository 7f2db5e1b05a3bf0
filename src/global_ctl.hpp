#pragma once
#include <atomic>

// Process-wide shutdown flag; defined once in main.cpp (tests/test_globals.cpp for tests).
extern std::atomic<bool> g_terminate;
