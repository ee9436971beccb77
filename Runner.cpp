#ifndef __RUNNER_CPP__
#define __RUNNER_CPP__

#include <iostream>
#include <stdint.h>
#include <vector>

#include "AcoCpu.cpp"
#include "AcoFF.cpp"
#include "Colony.cpp"
#include "City.cpp"
#include "Parameters.cpp"
#include "common.hpp"

template <typename T>
struct Options {
    T alpha             = 1.0;
    T beta              = 2.0;
    T q                 = 100.0;
    T rho               = 0.5;
    uint32_t maxEpoch   = 100;
    uint32_t nAnts      = 10;
    uint64_t seed       = randomSeed;
    uint32_t mapWorkers = 0;
};

/*
 * Positional arguments: [alpha beta q rho maxEpoch nAnts [seed [mapWorkers]]].
 * Returns 0 or the ERROR code to exit with; every message goes to std::clog.
 */
template <typename T>
int parseOptions(int argc, char * argv[], Options<T> & options) {

    if (argc != 1 && (argc < 7 || argc > 9)) {
        std::clog << "Usage: ./acotour [alpha beta q rho maxEpoch nAnts [seed [mapWorkers]]]" << std::endl;
        return EXIT_ARGUMENTS_NUMBER;
    }

    argc--;
    argv++;
    bool parsed = true;
    if (argc > 0) {
        parsed = parsed
            && parseArg(argv[0], options.alpha)
            && parseArg(argv[1], options.beta)
            && parseArg(argv[2], options.q)
            && parseArg(argv[3], options.rho)
            && parseArg(argv[4], options.maxEpoch)
            && parseArg(argv[5], options.nAnts);
    }
    if (parsed && argc > 6) {
        parsed = parseArg(argv[6], options.seed);
    }
    if (parsed && argc > 7) {
        parsed = parseArg(argv[7], options.mapWorkers);
    }

    return parsed ? 0 : EXIT_PARSE_ARG;
}

/*
 * Builds the colony, runs the selected driver and prints the best tour and
 * its length on std::cout. Construction errors map to their ERROR code.
 */
template <typename T>
int runColony(const Options<T> & options, const std::vector< City<T> > & cities) {
    try {
        Parameters<T> params(options.nAnts, options.alpha, options.beta, options.q, options.rho, options.maxEpoch);
        Colony<T> colony(params, cities);

        Timer timer;
        std::vector<uint32_t> bestTour;
        T bestTourLength;
        T runBestTourLength;

        if (options.mapWorkers == 0) {
            std::clog << "***** ACO CPU *****" << std::endl;
            AcoCpu<T> acocpu(colony, options.seed);

            timer.start();
            acocpu.solve();
            timer.stop();

            bestTour          = acocpu.getBestTour();
            bestTourLength    = acocpu.getBestTourLength();
            runBestTourLength = acocpu.getRunBestTourLength();
        } else {
            std::clog << "***** ACO FastFlow *****" << std::endl;
            AcoFF<T> acoff(colony, options.seed, options.mapWorkers);

            timer.start();
            acoff.solve();
            timer.stop();

            bestTour          = acoff.getBestTour();
            bestTourLength    = acoff.getBestTourLength();
            runBestTourLength = acoff.getRunBestTourLength();
        }

        printTour("Best tour", bestTour);
        std::cout << "Best tour length: " << bestTourLength << std::endl;
        printResult("acotour", options.mapWorkers, options.nAnts, options.maxEpoch, options.seed,
                    timer, bestTourLength, runBestTourLength, colony.checkTour(bestTour));

    } catch (const InvalidParameterError & e) {
        std::clog << "Error: " << e.what() << std::endl;
        return EXIT_INVALID_PARAMETER;
    } catch (const DegenerateInputError & e) {
        std::clog << "Error: " << e.what() << std::endl;
        return EXIT_DEGENERATE_INPUT;
    }

    return 0;
}

#endif
