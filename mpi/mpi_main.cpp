///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_solver.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "options.hpp"
#include <mpi.h>
#include <chrono>
#include <iostream>
#include <stdexcept>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads schedule solver.
 *
 * Initializes MPI, builds the same demo catalog on each rank, runs the
 * MPIScheduleSolver, and finalizes MPI. Rank 0 prints the run information
 * and the ranked candidates gathered from all ranks.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    RunOptions opts;
    try {
        opts = parseRunOptions(argc, argv);
    } catch (const std::invalid_argument& e) {
        if (rank == 0) {
            std::cerr << "Error: " << e.what() << "\n";
            printUsage(std::cerr, argv[0]);
        }
        MPI_Finalize();
        return 1;
    }
    if (opts.help) {
        if (rank == 0) printUsage(std::cout, argv[0]);
        MPI_Finalize();
        return 0;
    }

    int status = 0;
    try {
        Catalog catalog = makeDemoCatalog(opts.demo);
        std::vector<Offering> offerings = catalog.listOfferings();

        // Only rank 0 prints a brief header about the MPI configuration.
        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "MPI+THREADS SCHEDULE SOLVER\n";
            std::cout << "Processes: " << size << "\n";
            std::cout << "Threads per process: " << opts.numThreads << "\n";
            std::cout << "Demo catalog: " << demoSizeName(opts.demo) << " (" << offerings.size() << " offerings)\n";
            std::cout << "========================================\n";
        }

        MPIScheduleSolver solver(opts.maxCandidates, opts.numThreads, opts.policy);
        solver.setVerbose(opts.verbose);

        // All ranks participate; rank 0 holds the ranked union.
        auto start = std::chrono::high_resolution_clock::now();
        ScheduleResult result = solver.solve(offerings);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        if (rank == 0) {
            std::cout << "MPI solver time: " << ms << " ms\n\n";
            printScheduleResult(std::cout, offerings, result, opts.top);
            std::cout << "========================================\n";
            status = result.ok() ? 0 : 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error (rank " << rank << "): " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return status;
}
