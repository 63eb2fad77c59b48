#include "contagion/core/debug.hpp"

// Initialize static members
thread_local int EpidemicStats::infections = 0;
thread_local int EpidemicStats::recoveries = 0;
thread_local int EpidemicStats::contacts = 0;
