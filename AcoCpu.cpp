#ifndef __ACO_CPU_CPP__
#define __ACO_CPU_CPP__

#include <stdint.h>
#include <vector>
#include <limits>
#include <algorithm>

#include "Colony.cpp"
#include "Ant.cpp"
#include "random.hpp"
#include "common.hpp"

template <typename T>
class AcoCpu {

private:
    Colony<T> & colony;
    Random<T> random;
    std::vector<uint32_t> bestTour;
    T bestTourLength;
    T runBestTourLength;

    void calcTour(std::vector<Ant> & ants) {
        colony.antsMove(ants, random);
    }

    const Ant & bestAnt(const std::vector<Ant> & ants) const {
        return *std::min_element(ants.begin(), ants.end(), [this](const Ant & a, const Ant & b) {
            return colony.tourLength(a.getTabu()) < colony.tourLength(b.getTabu());
        });
    }

    void updateRunBest(const std::vector<Ant> & ants) {
        runBestTourLength = std::min(runBestTourLength, colony.tourLength(bestAnt(ants).getTabu()));
    }

public:

    AcoCpu(Colony<T> & colony, const uint64_t seed):
    colony(colony),
    random(seed),
    bestTourLength(std::numeric_limits<T>::max()),
    runBestTourLength(std::numeric_limits<T>::max())
    {}

    void solve() {
        for (uint32_t epoch = 0; epoch < colony.getParams().maxEpoch; ++epoch) {
            std::vector<Ant> ants = colony.initializeAnts(random);
            calcTour               (ants);
            updateRunBest          (ants);
            colony.updatePheromones(ants);
        }

        // the reported tour is the best of one more batch on the final trails
        std::vector<Ant> ants = colony.initializeAnts(random);
        calcTour(ants);
        bestTour       = bestAnt(ants).getTabu();
        bestTourLength = colony.tourLength(bestTour);
        updateRunBest(ants);
    }

    const std::vector<uint32_t> & getBestTour() const {
        return bestTour;
    }

    T getBestTourLength() const {
        return bestTourLength;
    }

    // best length of any batch, epochs included
    T getRunBestTourLength() const {
        return runBestTourLength;
    }
};

#endif
