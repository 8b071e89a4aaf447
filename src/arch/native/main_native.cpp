/**
 * @file main_native.cpp
 * @brief Entry point for the desktop debug viewer.
 *
 * Creates a SimManager, runs the main loop and prints profiling stats on exit.
 */

#include "tiltball/core/profile.hpp"
#include "tiltball/core/sim_manager.hpp"

int main() {
    {
        PROFILE_SCOPE("main");

        SimManager simManager;
        simManager.run();
    }

    Profiling::Profiler::printStats();
    return 0;
}
