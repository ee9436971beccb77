#include <vector>

#include "Runner.cpp"
#include "City.cpp"
#include "common.hpp"

#ifndef D_TYPE
#define D_TYPE double
#endif

int main(int argc, char * argv[]) {

    Options<D_TYPE> options;
    const int status = parseOptions(argc, argv, options);
    if (status != 0) {
        exit(status);
    }

    const std::vector< City<D_TYPE> > cities = {
        City<D_TYPE>(0, 0),
        City<D_TYPE>(1, 1),
        City<D_TYPE>(2, 2),
        City<D_TYPE>(3, 3),
        City<D_TYPE>(4, 4)
    };

    return runColony(options, cities);
}
