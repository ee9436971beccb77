#ifndef __COMMON_HPP__
#define __COMMON_HPP__

#include <iostream>
#include <stdint.h>
#include <cstdlib>
#include <cerrno>
#include <string>
#include <ctime>
#include <chrono>
#include <vector>
#include <stdexcept>

static uint64_t randomSeed = time(0);

enum ERROR {
    EXIT_ARGUMENTS_NUMBER = -1,
    EXIT_PARSE_ARG = -32,
    EXIT_INVALID_PARAMETER,
    EXIT_DEGENERATE_INPUT
};

// Colony cannot be built from the given cities or ant count
class DegenerateInputError : public std::invalid_argument {
public:
    explicit DegenerateInputError(const std::string & what) :
    std::invalid_argument(what)
    {}
};

// Algorithm parameter out of its admissible range
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string & what) :
    std::invalid_argument(what)
    {}
};

inline bool parseError(const char * arg, const char * type) {
    std::clog << "Error: \"" << arg << "\" is not a valid " << type << "!" << std::endl;
    return false;
}

template <typename T>
inline bool parseArg(const char * arg, T & val) {
    std::clog << "Error: type not supported!" << std::endl;
    return false;
}

template<>
inline bool parseArg(const char * arg, uint32_t & val) {
    char * end = nullptr;
    errno = 0;
    const unsigned long long parsed = strtoull(arg, &end, 10);
    if (end == arg || *end != '\0' || errno == ERANGE || arg[0] == '-' || parsed > UINT32_MAX) {
        return parseError(arg, "unsigned integer");
    }
    val = static_cast<uint32_t>(parsed);
    return true;
}

template<>
inline bool parseArg(const char * arg, uint64_t & val) {
    char * end = nullptr;
    errno = 0;
    const unsigned long long parsed = strtoull(arg, &end, 10);
    if (end == arg || *end != '\0' || errno == ERANGE || arg[0] == '-') {
        return parseError(arg, "seed");
    }
    val = static_cast<uint64_t>(parsed);
    return true;
}

template<>
inline bool parseArg(const char * arg, float & val) {
    char * end = nullptr;
    errno = 0;
    const float parsed = strtof(arg, &end);
    if (end == arg || *end != '\0' || errno == ERANGE) {
        return parseError(arg, "real number");
    }
    val = parsed;
    return true;
}

template<>
inline bool parseArg(const char * arg, double & val) {
    char * end = nullptr;
    errno = 0;
    const double parsed = strtod(arg, &end);
    if (end == arg || *end != '\0' || errno == ERANGE) {
        return parseError(arg, "real number");
    }
    val = parsed;
    return true;
}

template <typename T>
inline void printTour(const std::string & name, const std::vector<T> & tour) {
    std::cout << name << ":";
    for (const T & city : tour) {
        std::cout << " " << city;
    }
    std::cout << std::endl;
}

class Timer {

private:
    typedef std::chrono::steady_clock Clock;
    Clock::time_point startPoint;
    Clock::time_point endPoint;

public:

    void start() {
        startPoint = endPoint = Clock::now();
    }

    void stop() {
        endPoint = Clock::now();
        std::clog << "Compute time: " << ms() << " ms " << us() << " usec " << std::endl;
    }

    long ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(endPoint - startPoint).count();
    }

    long us() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(endPoint - startPoint).count();
    }
};

template <typename T>
inline void printResult(const std::string & name,
                        const uint32_t mapWorkers,
                        const uint32_t nAnts,
                        const uint32_t maxEpoch,
                        const uint64_t seed,
                        const Timer &  timer,
                        const T        bestTourLength,
                        const T        runBestTourLength,
                        const bool     checkTour)
{
#define LOG_SEP " "
    std::clog << std::fixed
    << " *** "                 << LOG_SEP
    << name                    << LOG_SEP
    << mapWorkers              << LOG_SEP
    << nAnts                   << LOG_SEP
    << maxEpoch                << LOG_SEP
    << seed                    << LOG_SEP
    << timer.ms()              << LOG_SEP
    << timer.us()              << LOG_SEP
    << bestTourLength          << LOG_SEP
    << runBestTourLength       << LOG_SEP
    << (checkTour ? "Y" : "N") << LOG_SEP
    << std::endl;
#undef LOG_SEP
}

#endif
