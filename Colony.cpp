#ifndef __COLONY_CPP__
#define __COLONY_CPP__

#include <iostream>
#include <stdint.h>
#include <vector>
#include <string>
#include <cmath>
#include <limits>
#include <algorithm>
#include <stdexcept>

#include "City.cpp"
#include "Parameters.cpp"
#include "Ant.cpp"
#include "random.hpp"
#include "common.hpp"

#define _edges(a, b)     edges    [(a) * nCities + (b)]
#define _pheromone(a, b) pheromone[(a) * nCities + (b)]
#define _delta(a, b)     delta    [(a) * nCities + (b)]
#define _fitness(a, b)   fitness  [(a) * nCities + (b)]

// Outcome of one roulette draw. fallback is set when no candidate carried a
// usable weight and the nearest unvisited city was taken instead.
struct Selection {
    uint32_t city;
    bool fallback;
};

template <typename T>
class Colony {

private:

    const Parameters<T> params;
    const uint32_t nCities;
    std::vector<T> edges;
    std::vector<T> eta;
    std::vector<T> pheromone;
    std::vector<T> delta;
    std::vector<T> fitness;

    void initEdges(const std::vector< City<T> > & cities) {
        for (uint32_t i = 0; i < nCities; ++i) {
            for (uint32_t j = 0; j < nCities; ++j) {
                _edges(i, j) = (i == j ? 0.0 : distance(cities[i], cities[j]));
            }
        }
    }

    // Coincident cities get the heuristic of a minEdge long edge.
    void initEta() {
        const T minEdge = 1e-6;

        auto bEta   = eta.begin();
        auto bEdges = edges.begin();
        while ( bEta != eta.end() ) {
            T & etaVal = *(bEta++);
            const T & edgeVal = *(bEdges++);

            etaVal = 1.0 / std::max(edgeVal, minEdge);
        }
    }

    void calcFitness() {
        auto bFitness   = fitness.begin();
        auto bPheromone = pheromone.begin();
        auto bEta       = eta.begin();

        while ( bFitness != fitness.end() ) {
            T & fitVal = *(bFitness++);
            const T & pheromoneVal = *(bPheromone++);
            const T & etaVal = *(bEta++);
            fitVal = std::pow(pheromoneVal, params.alpha) * std::pow(etaVal, params.beta);
        }
    }

    bool hasDistinctCities() const {
        return std::any_of(edges.begin(), edges.end(), [](const T edgeVal) {
            return edgeVal > 0.0;
        });
    }

    uint32_t nearestUnvisited(const Ant & ant) const {
        const uint32_t from = ant.current();
        uint32_t nearest = nCities;
        T nearestEdge = std::numeric_limits<T>::max();

        for (uint32_t i = 0; i < nCities; ++i) {
            if ( !ant.hasVisited(i) && (nearest == nCities || _edges(from, i) < nearestEdge) ) {
                nearest     = i;
                nearestEdge = _edges(from, i);
            }
        }
        return nearest;
    }

    void updateDelta(const std::vector<Ant> & ants) {
        std::fill(delta.begin(), delta.end(), 0.0);

        for (const Ant & ant : ants) {
            const std::vector<uint32_t> & tabu = ant.getTabu();
            const T length = tourLength(tabu);

            // zero length tours deposit nothing
            if (length <= 0.0) {
                continue;
            }
            const T tau = params.q / length;

            for (uint32_t s = 0; s + 1 < tabu.size(); ++s) {
                const uint32_t from = tabu[s];
                const uint32_t to   = tabu[s + 1];
                _delta(from, to) += tau;
                _delta(to, from) += tau;
            }
        }
    }

    void updatePheromone() {
        auto bPheromone = pheromone.begin();
        auto bDelta     = delta.begin();

        while ( bPheromone != pheromone.end() ) {
            T & pheromoneVal = *(bPheromone++);
            const T & deltaVal = *(bDelta++);

            pheromoneVal = pheromoneVal * params.decay + deltaVal;
        }
    }

public:

    Colony(const Parameters<T> & params, const std::vector< City<T> > & cities) :
    params   (params),
    nCities  (static_cast<uint32_t>(cities.size())),
    edges    (cities.size() * cities.size(), 0.0),
    eta      (cities.size() * cities.size(), 0.0),
    pheromone(cities.size() * cities.size(), 0.0),
    delta    (cities.size() * cities.size(), 0.0),
    fitness  (cities.size() * cities.size(), 0.0)
    {
        if (nCities < 2) {
            throw DegenerateInputError("at least 2 cities are required, got " + std::to_string(nCities));
        }
        if (params.nAnts == 0) {
            throw DegenerateInputError("at least 1 ant is required");
        }

        initEdges(cities);
        if (!hasDistinctCities()) {
            throw DegenerateInputError("at least 2 distinct cities are required");
        }

        initEta();
        calcFitness();
    }

    std::vector<Ant> initializeAnts(Random<T> & random) const {
        std::vector<Ant> ants;
        ants.reserve(params.nAnts);
        for (uint32_t i = 0; i < params.nAnts; ++i) {
            ants.emplace_back(nCities, random.nextIndex(nCities));
        }
        return ants;
    }

    /*
     * Roulette wheel over the unvisited cities, weighted by
     * pheromone^alpha * eta^beta. One random value is drawn on every call.
     */
    Selection nextCity(const Ant & ant, Random<T> & random) const {
        if (ant.isComplete()) {
            throw std::logic_error("nextCity called on a complete tour");
        }

        const uint32_t from = ant.current();

        T sum = 0.0;
        for (uint32_t i = 0; i < nCities; ++i) {
            if (!ant.hasVisited(i)) {
                sum += _fitness(from, i);
            }
        }

        const T r = random.nextFloat() * sum;

        if (sum > 0.0 && std::isfinite(sum)) {
            T cumulative = 0.0;
            for (uint32_t i = 0; i < nCities; ++i) {
                if (!ant.hasVisited(i)) {
                    cumulative += _fitness(from, i);
                    if (cumulative >= r) {
                        return Selection{i, false};
                    }
                }
            }
        }

        return Selection{nearestUnvisited(ant), true};
    }

    void antMove(Ant & ant, Random<T> & random) const {
        while (!ant.isComplete()) {
            ant.visit(nextCity(ant, random).city);
        }
    }

    void antsMove(std::vector<Ant> & ants, Random<T> & random) const {
        for (Ant & ant : ants) {
            antMove(ant, random);
        }
    }

    void updatePheromones(const std::vector<Ant> & ants) {
        updateDelta(ants);
        updatePheromone();
        calcFitness();
    }

    // Open path: there is no edge back from the last city to the first.
    T tourLength(const std::vector<uint32_t> & tour) const {
        T length = 0.0;
        for (uint32_t s = 0; s + 1 < tour.size(); ++s) {
            length += _edges(tour[s], tour[s + 1]);
        }
        return length;
    }

    bool checkTour(const std::vector<uint32_t> & tour) const {
        bool success = true;
        std::vector<uint32_t> duplicate(nCities, 0);

        if (tour.size() != nCities) {
            std::clog << "Tour has " << tour.size() << " cities instead of " << nCities << "!" << std::endl;
            success = false;
        }

        for (uint32_t s = 0; s < tour.size(); ++s) {
            if (tour[s] >= nCities) {
                std::clog << "Illegal city in position: " << s << "!" << std::endl;
                success = false;
            } else {
                duplicate[tour[s]] += 1;
            }
        }

        for (uint32_t i = 0; i < nCities; ++i) {
            if (duplicate[i] > 1) {
                std::clog << "Duplicate city: " << i << std::endl;
                success = false;
            }
        }

        return success;
    }

    T getEdge(const uint32_t from, const uint32_t to) const {
        return _edges(from, to);
    }

    T getPheromone(const uint32_t from, const uint32_t to) const {
        return _pheromone(from, to);
    }

    const std::vector<T> & getPheromones() const {
        return pheromone;
    }

    const Parameters<T> & getParams() const {
        return params;
    }

    uint32_t getNCities() const {
        return nCities;
    }
};

#undef _edges
#undef _pheromone
#undef _delta
#undef _fitness

#endif
