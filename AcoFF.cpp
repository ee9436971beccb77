#ifndef __ACO_FF_CPP__
#define __ACO_FF_CPP__

#include <stdint.h>
#include <vector>
#include <limits>
#include <algorithm>

#include <ff/parallel_for.hpp>

#include "Colony.cpp"
#include "Ant.cpp"
#include "random.hpp"
#include "common.hpp"

using namespace ff;

/*
 * Same epoch loop as AcoCpu, with tour construction spread over mapWorkers
 * FastFlow workers. Start cities come from the master stream; each ant slot
 * draws its roulette values from its own stream, so the result only depends
 * on the seed and never on the number of workers.
 */
template <typename T>
class AcoFF {

private:
    Colony<T> & colony;
    Random<T> random;
    std::vector< Random<T> > antRandoms;
    std::vector<uint32_t> bestTour;
    T bestTourLength;
    T runBestTourLength;

    ParallelFor pf;

    void calcTour(std::vector<Ant> & ants) {
        pf.parallel_for(0L, static_cast<long>(ants.size()), [&](const long i) {
            colony.antMove(ants[i], antRandoms[i]);
        });
        pf.threadPause();
    }

    uint32_t bestAnt(const std::vector<Ant> & ants) const {
        uint32_t best = 0;
        for (uint32_t i = 1; i < ants.size(); ++i) {
            if (colony.tourLength(ants[i].getTabu()) < colony.tourLength(ants[best].getTabu())) {
                best = i;
            }
        }
        return best;
    }

    void updateRunBest(const std::vector<Ant> & ants) {
        const T length = colony.tourLength(ants[bestAnt(ants)].getTabu());
        if (length < runBestTourLength) {
            runBestTourLength = length;
        }
    }

public:

    AcoFF(Colony<T> & colony, const uint64_t seed, const uint32_t mapWorkers) :
    colony        (colony),
    random        (seed),
    bestTourLength(std::numeric_limits<T>::max()),
    runBestTourLength(std::numeric_limits<T>::max()),
    pf            (mapWorkers)
    {
        const uint32_t nAnts = colony.getParams().nAnts;
        antRandoms.reserve(nAnts);
        for (uint32_t i = 0; i < nAnts; ++i) {
            antRandoms.emplace_back(seed + i + 1);
        }
    }

    void solve() {
        for (uint32_t epoch = 0; epoch < colony.getParams().maxEpoch; ++epoch) {
            std::vector<Ant> ants = colony.initializeAnts(random);
            calcTour               (ants);
            updateRunBest          (ants);
            colony.updatePheromones(ants);
        }

        std::vector<Ant> ants = colony.initializeAnts(random);
        calcTour(ants);
        bestTour       = ants[bestAnt(ants)].getTabu();
        bestTourLength = colony.tourLength(bestTour);
        updateRunBest(ants);
    }

    const std::vector<uint32_t> & getBestTour() const {
        return bestTour;
    }

    T getBestTourLength() const {
        return bestTourLength;
    }

    T getRunBestTourLength() const {
        return runBestTourLength;
    }
};

#endif
