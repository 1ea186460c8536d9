///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "options.hpp"
#include "opencl_solver.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>

static OpenCLScheduleSolver* g_current_solver = nullptr;

static void interruptHandler(int) {
    if (g_current_solver) g_current_solver->stop();
}

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL schedule solver.
 *
 * Builds a demo catalog, runs the CPU enumeration + GPU evaluation
 * pipeline and prints the ranked candidates.
 */
int main(int argc, char** argv) {
    RunOptions opts;
    try {
        opts = parseRunOptions(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (opts.help) {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    try {
        Catalog catalog = makeDemoCatalog(opts.demo);
        std::vector<Offering> offerings = catalog.listOfferings();

        OpenCLScheduleSolver solver(opts.maxCandidates, opts.batchSize, opts.policy);
        solver.setVerbose(opts.verbose);
        g_current_solver = &solver;
        std::signal(SIGINT, interruptHandler);

        std::cout << "========================================\n";
        std::cout << "OPENCL SCHEDULE SOLVER\n";
        std::cout << "Device: " << solver.deviceName() << "\n";
        std::cout << "Demo catalog: " << demoSizeName(opts.demo) << " (" << offerings.size() << " offerings)\n";
        std::cout << "GPU batch size: " << opts.batchSize << "\n";
        std::cout << "========================================\n";

        // Measure wall-clock time for the OpenCL solver.
        auto start = std::chrono::high_resolution_clock::now();
        ScheduleResult result = solver.solve(offerings);
        auto end = std::chrono::high_resolution_clock::now();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();
        g_current_solver = nullptr;

        std::cout << "OpenCL solver time: " << elapsedMs << " ms\n\n";
        printScheduleResult(std::cout, offerings, result, opts.top);
        std::cout << "========================================\n";
        return result.ok() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
