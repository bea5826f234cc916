// ==========================
// sssp: single-source shortest paths from the command line
// ==========================
// Parses: [-s <start>] [-f <file>|-n] [-a <auto|dijkstra|bellman-ford>]
//         [-c] [-v] [-h]
// Builds the sample graph (or reads an edge list), runs the engine and
// prints which algorithm ran plus the distance of every node.
// ==========================

#include "algo/BellmanFord.hpp"      // NegativeCycleError
#include "algo/ShortestPaths.hpp"    // engine
#include "graph/Fixtures.hpp"        // sampleGraph()
#include "io/EdgeListReader.hpp"     // readEdgeList
#include "io/Report.hpp"             // printReport
#include "util/Log.hpp"              // SSSP_LOG
#include <getopt.h>                  // getopt_long for command-line parsing
#include <cstdlib>                   // std::exit
#include <exception>
#include <iostream>                  // I/O
#include <string>

static void usage(const char* prog, int code) {              // print usage and exit
    std::ostream& out = code == 0 ? std::cout : std::cerr;
    out << "Usage: " << prog
        << " [-s <start>] [-f <edge-list>|-n] [-a <auto|dijkstra|bellman-ford>] [-c] [-v]\n"
        << "  -s, --start <node>       start node (default A)\n"
        << "  -f, --file <path>        read '<from> <to> <weight>' lines ('-' = stdin)\n"
        << "  -n, --negative           sample graph with A->B = -2\n"
        << "  -a, --algorithm <name>   force an algorithm (default auto)\n"
        << "  -c, --detect-cycles      fail on a negative cycle\n"
        << "  -v, --verbose            debug output on stderr\n";
    std::exit(code);
}

int main(int argc, char* argv[]) {                            // entry point
    std::string start = "A", file, algorithm = "auto";        // defaults
    bool negative = false, verbose = false;
    ShortestPathOptions opts;
    int li = 0;
    option lo[] = {                                           // long options
        {"start",         required_argument, nullptr, 's'},
        {"file",          required_argument, nullptr, 'f'},
        {"negative",      no_argument,       nullptr, 'n'},
        {"algorithm",     required_argument, nullptr, 'a'},
        {"detect-cycles", no_argument,       nullptr, 'c'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"help",          no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "s:f:na:cvh", lo, &li)) != -1; ) { // parse flags
        if (opt == 's') start = optarg;
        else if (opt == 'f') file = optarg;
        else if (opt == 'n') negative = true;
        else if (opt == 'a') algorithm = optarg;
        else if (opt == 'c') opts.detectNegativeCycles = true;
        else if (opt == 'v') verbose = true;
        else if (opt == 'h') usage(argv[0], 0);
        else usage(argv[0], 1);                               // invalid flag
    }
    if (optind < argc || (negative && !file.empty())) usage(argv[0], 1);

    try {
        opts.selection = parseSelection(algorithm);

        Graph g;
        if (file == "-") g = readEdgeList(std::cin);
        else if (!file.empty()) g = readEdgeListFile(file);
        else g = negative ? sampleGraphWithNegativeEdge() : sampleGraph();

        if (verbose) {
            SSSP_LOG("DEBUG", "loaded " << g.label() << (g.hasNegativeEdge() ? " with negative edges" : ""));
        }

        Result<std::string> r = shortestPaths(g, start, opts);

        if (verbose) SSSP_LOG("DEBUG", "ran " << r.algorithmName() << " from " << start);
        printReport(std::cout, start, r);
    } catch (const UnknownStartNodeError& e) {
        SSSP_LOG("ERROR", e.what());
        return 1;
    } catch (const NegativeCycleError& e) {
        SSSP_LOG("ERROR", e.what());
        return 2;
    } catch (const std::exception& e) {
        SSSP_LOG("ERROR", e.what());
        return 1;
    }
    return 0;                                                 // success
}
