/**
 * optimlib - command line entry point
 */

#include "optimlib/core/solver.hpp"

#include <csignal>

// Set by SIGINT; every running search stops at the top of its next iteration with reason "cancelled"
static std::atomic<bool> cancel_requested(false);

extern "C" void HandleInterrupt(int)
{
    cancel_requested.store(true);
}

int main(int argc, char* argv[])
{
    optimlib::OptimizerSolver solver;

    int code = solver.init(argc, argv);
    if (code != 0) return code;

    std::signal(SIGINT, HandleInterrupt);

    return solver.run(&cancel_requested);
}
