#ifndef __ANT_CPP__
#define __ANT_CPP__

#include <stdint.h>
#include <vector>

class Ant {

private:

    std::vector<uint32_t> tabu;
    std::vector<uint8_t> visited;

public:

    Ant(const uint32_t nCities, const uint32_t start) :
    visited(nCities, 0)
    {
        tabu.reserve(nCities);
        visit(start);
    }

    void visit(const uint32_t city) {
        tabu.push_back(city);
        visited[city] = 1;
    }

    bool hasVisited(const uint32_t city) const {
        return visited[city] != 0;
    }

    uint32_t current() const {
        return tabu.back();
    }

    bool isComplete() const {
        return tabu.size() == visited.size();
    }

    const std::vector<uint32_t> & getTabu() const {
        return tabu;
    }
};

#endif
