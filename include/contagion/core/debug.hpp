#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef CONTAGION_ENABLE_DEBUG
#define CONTAGION_ENABLE_DEBUG 0
#endif

// Debug levels
#define CONTAGION_DEBUG_LEVEL_NONE 0
#define CONTAGION_DEBUG_LEVEL_BASIC 1
#define CONTAGION_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CONTAGION_CURRENT_DEBUG_LEVEL CONTAGION_DEBUG_LEVEL_BASIC

// Debug macros
#define CONTAGION_DEBUG_MSG(level, x) do { \
    if (CONTAGION_ENABLE_DEBUG && level <= CONTAGION_CURRENT_DEBUG_LEVEL) { \
        std::cerr << x; \
    } \
} while(0)

// Collects infection and recovery counts between two calls to reset().
// Counters are per thread, so Models ticked on different threads do not mix.
class EpidemicStats {
public:
    static void reset() {
        infections = 0;
        recoveries = 0;
        contacts = 0;
    }

    static void recordContact() { contacts++; }
    static void recordInfection() { infections++; }
    static void recordRecovery() { recoveries++; }

    static int getInfections() { return infections; }
    static int getRecoveries() { return recoveries; }
    static int getContacts() { return contacts; }

    static void printTickStats(int time) {
        CONTAGION_DEBUG_MSG(CONTAGION_DEBUG_LEVEL_BASIC,
            "Tick " << time << ":\n"
            "  Contacts: " << contacts << "\n"
            "  New infections: " << infections << "\n"
            "  Recoveries: " << recoveries << "\n"
        );
    }

private:
    static thread_local int infections;
    static thread_local int recoveries;
    static thread_local int contacts;
};
