#include "astrofield/core/debug.hpp"

// Initialize static members
long DebugStats::contacts = 0;
long DebugStats::wall_clamps = 0;
double DebugStats::max_speed = 0.0;
long DebugStats::frames = 0;
