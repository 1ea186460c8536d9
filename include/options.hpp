#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "solver_base.hpp"
#include <cstdint>
#include <iosfwd>


///////////////////////////
///       OPTIONS       ///
///////////////////////////
/**
 * @brief Command-line configuration shared by the demo drivers.
 */
struct RunOptions {
    std::uint64_t maxCandidates = 0; ///< --max N (required, > 0).
    RankingPolicy policy = RankingPolicy::CONFLICT_FIRST; ///< --policy conflict|priority.
    int numThreads = 1; ///< --threads N; defaults to hardware concurrency.
    int batchSize = 256; ///< --batch N (OpenCL).
    DemoSize demo = DemoSize::M; ///< --demo S|M|L|XL.
    int top = 3; ///< --top N, candidates printed per set.
    bool verbose = false; ///< --verbose.
    bool help = false; ///< --help; other options are not validated.
};

/**
 * @brief Parse driver options.
 *
 * @throws std::invalid_argument on an unknown option, a missing or
 *         malformed value, or a missing --max.
 */
RunOptions parseRunOptions(int argc, char** argv);

/**
 * @brief Print the option summary.
 */
void printUsage(std::ostream& out, const char* program);
