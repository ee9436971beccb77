#ifndef __PARAMETERS_CPP__
#define __PARAMETERS_CPP__

#include <stdint.h>
#include <cmath>
#include <string>

#include "common.hpp"

template < typename T>
class Parameters {

private:

    static void require(const bool condition, const std::string & message) {
        if (!condition) {
            throw InvalidParameterError(message);
        }
    }

public:

    const uint32_t nAnts;
    const T alpha;
    const T beta;
    const T q;
    const T rho;
    const T decay;
    const uint32_t maxEpoch;

    Parameters(uint32_t nAnts, T alpha, T beta, T q, T rho, uint32_t maxEpoch) :
    nAnts(nAnts),
    alpha(alpha),
    beta(beta),
    q(q),
    rho(rho),
    decay(1.0 - rho),
    maxEpoch(maxEpoch)
    {
        require(std::isfinite(alpha) && alpha >= 0, "alpha must be a non-negative real");
        require(std::isfinite(beta) && beta >= 0, "beta must be a non-negative real");
        require(std::isfinite(q) && q > 0, "q must be a positive real");
        require(rho >= 0 && rho <= 1, "rho must be in [0, 1]");
    }
};

#endif
