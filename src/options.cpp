///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "options.hpp"
#include "ranking.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>

///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Parse a strictly positive decimal integer no larger than maxValue.
 */
static std::uint64_t parsePositive(const char* option, const char* text, std::uint64_t maxValue) {
    std::string value = text;
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(option) + " expects a positive integer (got '" + value + "')");
    }
    errno = 0;
    unsigned long long n = std::strtoull(text, nullptr, 10);
    if (errno == ERANGE || n == 0 || n > maxValue) {
        throw std::invalid_argument(std::string(option) + " out of range (got '" + value + "')");
    }
    return (std::uint64_t)n;
}

static const char* requireValue(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string(argv[i]) + " requires a value");
    }
    return argv[++i];
}

///////////////////////////
///       OPTIONS       ///
///////////////////////////
RunOptions parseRunOptions(int argc, char** argv) {
    RunOptions opts;
    unsigned hw = std::thread::hardware_concurrency();
    opts.numThreads = hw > 0 ? (int)hw : 1;

    const std::uint64_t kIntMax = (std::uint64_t)std::numeric_limits<int>::max();
    bool haveMax = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--max") == 0) {
            opts.maxCandidates = parsePositive("--max", requireValue(argc, argv, i),
                                               std::numeric_limits<std::uint64_t>::max());
            haveMax = true;
        } else if (std::strcmp(argv[i], "--policy") == 0) {
            opts.policy = parsePolicy(requireValue(argc, argv, i));
        } else if (std::strcmp(argv[i], "--threads") == 0) {
            opts.numThreads = (int)parsePositive("--threads", requireValue(argc, argv, i), kIntMax);
        } else if (std::strcmp(argv[i], "--batch") == 0) {
            opts.batchSize = (int)parsePositive("--batch", requireValue(argc, argv, i), kIntMax);
        } else if (std::strcmp(argv[i], "--demo") == 0) {
            opts.demo = parseDemoSize(requireValue(argc, argv, i));
        } else if (std::strcmp(argv[i], "--top") == 0) {
            opts.top = (int)parsePositive("--top", requireValue(argc, argv, i), kIntMax);
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            opts.help = true;
            return opts;
        } else {
            throw std::invalid_argument(std::string("Unknown option: ") + argv[i]);
        }
    }

    if (!haveMax) {
        throw std::invalid_argument("--max N is required");
    }
    return opts;
}

void printUsage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " --max N [options]\n";
    out << "  --max N            Maximum number of candidates to evaluate (required, > 0)\n";
    out << "  --policy P         Ranking policy: conflict (default) or priority\n";
    out << "  --threads N        Worker threads (default: hardware concurrency)\n";
    out << "  --batch N          OpenCL batch size (default: 256)\n";
    out << "  --demo S|M|L|XL    Demo catalog size (default: M)\n";
    out << "  --top N            Candidates printed per set (default: 3)\n";
    out << "  -v, --verbose      Print solver diagnostics to stderr\n";
    out << "  -h, --help         Show this message\n";
}
