///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "enumerator.hpp"
#include "grouping.hpp"
#include "ranking.hpp"
#include <mpi.h>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>


///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkMpi(int err, const char* operation) {
    if (err != MPI_SUCCESS) {
        std::stringstream ss;
        ss << "MPI error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the hybrid MPI + threaded solver.
 *
 * @param maxCandidates Global cap on candidates over all ranks.
 * @param numThreads    Number of worker threads used on each MPI rank.
 * @param policy        Ranking policy applied on rank 0.
 */
MPIScheduleSolver::MPIScheduleSolver(std::uint64_t maxCandidates, int numThreads, RankingPolicy policy)
        : maxCandidates_(maxCandidates),
          policy_(policy),
          threadedSolver_(maxCandidates, numThreads, policy) {}

/**
 * @brief Solve the catalog with one ordinal block per rank plus threads per rank.
 *
 * The pre-check is deterministic, so every rank reaches the same verdict
 * without communication. After local evaluation, ranks agree on
 * cancellation via MPI_Allreduce; non-root ranks then send their
 * candidates to rank 0 (length, then data), which assembles the ranking.
 */
ScheduleResult MPIScheduleSolver::solve(const std::vector<Offering>& catalog) {
    threadedSolver_.resetStop();
    EvaluationGuard running(state_);

    int rank, size;
    checkMpi(MPI_Comm_rank(MPI_COMM_WORLD, &rank), "MPI_Comm_rank");
    checkMpi(MPI_Comm_size(MPI_COMM_WORLD, &size), "MPI_Comm_size");

    std::vector<OfferingGroup> groups;
    try {
        groups = buildOfferingGroups(catalog);
    } catch (const MandatoryUnsatisfiable& e) {
        if (verbose_ && rank == 0) std::cerr << "MPIScheduleSolver: " << e.what() << "\n";
        state_ = EngineState::FAILED;
        return failedResult(e, policy_);
    }

    CombinationEnumerator enumerator(groups, maxCandidates_);
    const std::uint64_t planned = enumerator.plannedCount();

    // Contiguous block per rank; the first (planned % size) ranks take one extra.
    std::uint64_t base = planned / (std::uint64_t)size;
    std::uint64_t extra = planned % (std::uint64_t)size;
    std::uint64_t r = (std::uint64_t)rank;
    std::uint64_t begin = r * base + std::min(r, extra);
    std::uint64_t end = begin + base + (r < extra ? 1 : 0);

    if (verbose_) {
        std::cerr << "MPIScheduleSolver[rank " << rank << "/" << size << "]: productSize="
                  << enumerator.productSize() << ", planned=" << planned
                  << ", block=[" << begin << "," << end << ")\n";
    }

    std::vector<ScheduleCandidate> local = threadedSolver_.evaluateRange(catalog, enumerator, begin, end);

    // Cancelled anywhere means cancelled everywhere.
    int localStopped = threadedSolver_.isStopped() ? 1 : 0;
    int anyStopped = 0;
    checkMpi(MPI_Allreduce(&localStopped, &anyStopped, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD), "MPI_Allreduce");
    if (anyStopped) {
        state_ = EngineState::CANCELLED;
        return cancelledResult(policy_, enumerator.productSize());
    }

    const int TAG_META = 300;
    const int TAG_DATA = 301;

    // Non-root ranks ship their block to rank 0.
    if (rank != 0) {
        std::vector<long long> buf;
        serializeCandidates(local, buf);
        long long len = (long long)buf.size();
        int count = messageCount(len);

        checkMpi(MPI_Send(&len, 1, MPI_LONG_LONG, 0, TAG_META, MPI_COMM_WORLD), "MPI_Send(meta)");
        if (count > 0) {
            checkMpi(MPI_Send(buf.data(), count, MPI_LONG_LONG, 0, TAG_DATA, MPI_COMM_WORLD), "MPI_Send(data)");
        }

        ScheduleResult result;
        result.state = EngineState::DONE;
        result.policy = policy_;
        result.truncated = enumerator.willTruncate();
        result.productSize = enumerator.productSize();
        state_ = EngineState::DONE;
        return result;
    }

    // Rank 0 receives blocks in rank order, so ordinals stay ascending.
    std::vector<ScheduleCandidate> all = std::move(local);
    for (int source = 1; source < size; ++source) {
        long long len = 0;
        checkMpi(MPI_Recv(&len, 1, MPI_LONG_LONG, source, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE),
                 "MPI_Recv(meta)");

        int count = messageCount(len);
        std::vector<long long> buf((size_t)count);
        if (count > 0) {
            checkMpi(MPI_Recv(buf.data(), count, MPI_LONG_LONG, source, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE),
                     "MPI_Recv(data)");
        }
        deserializeCandidates(buf, all);
    }

    if (all.size() != planned) {
        std::stringstream ss;
        ss << "MPIScheduleSolver: gathered " << all.size() << " candidates, expected " << planned;
        throw std::runtime_error(ss.str());
    }

    ScheduleResult result = assembleResult(std::move(all), policy_,
                                           enumerator.willTruncate(), enumerator.productSize());
    state_ = EngineState::DONE;
    return result;
}
