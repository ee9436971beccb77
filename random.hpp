#ifndef __RANDOM_HPP__
#define __RANDOM_HPP__

#include <stdint.h>
#include <random>

template <typename T>
class Random {

private:
    std::mt19937_64 generator;
    std::uniform_real_distribution<T> distribution;

public:

    explicit Random(const uint64_t seed) :
    generator   (seed),
    distribution(0.0, 1.0)
    {}

    // uniform in [0, 1)
    T nextFloat() {
        return distribution(generator);
    }

    // uniform in [0, n - 1]
    uint32_t nextIndex(const uint32_t n) {
        std::uniform_int_distribution<uint32_t> index(0, n - 1);
        return index(generator);
    }
};

#endif
