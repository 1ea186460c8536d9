///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "model.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "options.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>

static ThreadedScheduleSolver* g_current_solver = nullptr;

static void interruptHandler(int) {
    if (g_current_solver) g_current_solver->stop();
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the multithreaded schedule solver.
 *
 * Builds a demo catalog, evaluates its candidates with a pool of worker
 * threads and prints the ranked result.
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

        std::cout << "========================================\n";
        std::cout << "MULTITHREADED SCHEDULE SOLVER\n";
        std::cout << "Demo catalog: " << demoSizeName(opts.demo) << " (" << offerings.size() << " offerings)\n";
        std::cout << "Threads: " << opts.numThreads << "\n";
        std::cout << "Max candidates: " << opts.maxCandidates << "\n";
        std::cout << "========================================\n";

        ThreadedScheduleSolver solver(opts.maxCandidates, opts.numThreads, opts.policy);
        solver.setVerbose(opts.verbose);
        g_current_solver = &solver;
        std::signal(SIGINT, interruptHandler);

        auto start = std::chrono::high_resolution_clock::now();
        ScheduleResult result = solver.solve(offerings);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();
        g_current_solver = nullptr;

        std::cout << "Threaded solver time: " << ms << " ms\n\n";
        printScheduleResult(std::cout, offerings, result, opts.top);
        std::cout << "========================================\n";
        return result.ok() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
