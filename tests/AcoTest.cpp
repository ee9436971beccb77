#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "AcoCpu.cpp"
#include "AcoFF.cpp"
#include "Colony.cpp"
#include "City.cpp"
#include "Parameters.cpp"
#include "random.hpp"

static std::vector< City<double> > diagonalCities() {
    return {
        City<double>(0, 0),
        City<double>(1, 1),
        City<double>(2, 2),
        City<double>(3, 3),
        City<double>(4, 4)
    };
}

static std::vector< City<double> > collinearCities() {
    return {
        City<double>(0, 0),
        City<double>(1, 0),
        City<double>(2, 0)
    };
}

SCENARIO( "Solving the diagonal instance", "[aco]" ) {
    GIVEN( "the default parameters" ) {
        const Parameters<double> params(10, 1.0, 2.0, 100.0, 0.5, 100);
        Colony<double> colony(params, diagonalCities());
        AcoCpu<double> aco(colony, 123);

        WHEN( "the colony runs every epoch" ) {
            aco.solve();

            THEN( "the reported tour is valid and the run found the diagonal" ) {
                REQUIRE( colony.checkTour(aco.getBestTour()) );
                REQUIRE( std::isfinite(aco.getBestTourLength()) );
                REQUIRE( aco.getBestTourLength() == Approx(colony.tourLength(aco.getBestTour())) );
                REQUIRE( aco.getRunBestTourLength() == Approx(4.0 * std::sqrt(2.0)) );
                REQUIRE( aco.getRunBestTourLength() <= aco.getBestTourLength() );
            }
        }
    }
}

SCENARIO( "Three collinear cities", "[aco]" ) {
    GIVEN( "one ant and one epoch" ) {
        const Parameters<double> params(1, 1.0, 2.0, 10.0, 0.5, 1);

        WHEN( "solved under several seeds" ) {
            THEN( "every tour is valid and the straight path shows up" ) {
                uint32_t straight = 0;
                for (uint64_t seed = 1; seed <= 20; ++seed) {
                    Colony<double> colony(params, collinearCities());
                    AcoCpu<double> aco(colony, seed);
                    aco.solve();

                    const double length = aco.getBestTourLength();
                    REQUIRE( colony.checkTour(aco.getBestTour()) );
                    REQUIRE( length == Approx(colony.tourLength(aco.getBestTour())) );
                    REQUIRE( (std::abs(length - 2.0) < 1e-9 || std::abs(length - 3.0) < 1e-9) );
                    if (std::abs(length - 2.0) < 1e-9) {
                        ++straight;
                    }
                }
                REQUIRE( straight > 0 );
            }
        }
    }

    GIVEN( "a full colony" ) {
        const Parameters<double> params(30, 1.0, 2.0, 10.0, 0.5, 1);
        Colony<double> colony(params, collinearCities());
        AcoCpu<double> aco(colony, 77);

        WHEN( "solved" ) {
            aco.solve();

            THEN( "the best tour has length 2" ) {
                REQUIRE( colony.checkTour(aco.getBestTour()) );
                REQUIRE( aco.getBestTourLength() == Approx(2.0) );
            }
        }
    }
}

SCENARIO( "Coincident cities", "[aco]" ) {
    GIVEN( "two cities sharing coordinates" ) {
        const std::vector< City<double> > cities = {
            City<double>(0, 0),
            City<double>(3, 1),
            City<double>(3, 1),
            City<double>(5, 5),
            City<double>(1, 4)
        };
        const Parameters<double> params(10, 1.0, 2.0, 100.0, 0.5, 50);
        Colony<double> colony(params, cities);
        AcoCpu<double> aco(colony, 8);

        WHEN( "solved" ) {
            aco.solve();

            THEN( "the run completes with a finite length" ) {
                REQUIRE( colony.checkTour(aco.getBestTour()) );
                REQUIRE( std::isfinite(aco.getBestTourLength()) );
                for (const double p : colony.getPheromones()) {
                    REQUIRE( std::isfinite(p) );
                    REQUIRE( p >= 0.0 );
                }
            }
        }
    }
}

TEST_CASE( "A run with zero epochs still reports the final batch", "[aco]" ) {
    const Parameters<double> params(4, 1.0, 2.0, 100.0, 0.5, 0);
    Colony<double> colony(params, diagonalCities());
    AcoCpu<double> aco(colony, 3);

    aco.solve();

    REQUIRE( colony.checkTour(aco.getBestTour()) );
    REQUIRE( aco.getRunBestTourLength() == aco.getBestTourLength() );
    const std::vector<double> & pheromone = colony.getPheromones();
    REQUIRE( std::all_of(pheromone.begin(), pheromone.end(), [](const double p) { return p == 0.0; }) );
}

static double bestOf(const Colony<double> & colony, const std::vector<Ant> & ants) {
    double best = std::numeric_limits<double>::max();
    for (const Ant & ant : ants) {
        best = std::min(best, colony.tourLength(ant.getTabu()));
    }
    return best;
}

TEST_CASE( "The reported tour comes from the batch after the last epoch", "[aco]" ) {
    const std::vector< City<double> > cities = {
        City<double>(0, 0),
        City<double>(7, 2),
        City<double>(3, 9),
        City<double>(8, 8),
        City<double>(1, 5),
        City<double>(6, 4),
        City<double>(9, 1),
        City<double>(2, 2)
    };
    const Parameters<double> params(3, 1.0, 2.0, 100.0, 0.5, 20);

    for (uint64_t seed = 1; seed <= 10; ++seed) {
        Colony<double> solved(params, cities);
        AcoCpu<double> aco(solved, seed);
        aco.solve();

        Colony<double> replayed(params, cities);
        Random<double> random(seed);
        double runBest = std::numeric_limits<double>::max();
        for (uint32_t epoch = 0; epoch < params.maxEpoch; ++epoch) {
            std::vector<Ant> ants = replayed.initializeAnts(random);
            replayed.antsMove(ants, random);
            runBest = std::min(runBest, bestOf(replayed, ants));
            replayed.updatePheromones(ants);
        }
        std::vector<Ant> last = replayed.initializeAnts(random);
        replayed.antsMove(last, random);
        runBest = std::min(runBest, bestOf(replayed, last));

        REQUIRE( aco.getBestTourLength() == bestOf(replayed, last) );
        REQUIRE( aco.getRunBestTourLength() == runBest );
        REQUIRE( solved.checkTour(aco.getBestTour()) );
    }
}

TEST_CASE( "Same seed gives the same run", "[aco]" ) {
    const Parameters<double> params(10, 1.0, 2.0, 100.0, 0.5, 30);

    Colony<double> first(params, diagonalCities());
    Colony<double> second(params, diagonalCities());
    AcoCpu<double> a(first, 555);
    AcoCpu<double> b(second, 555);
    a.solve();
    b.solve();

    REQUIRE( a.getBestTour() == b.getBestTour() );
    REQUIRE( a.getBestTourLength() == b.getBestTourLength() );
    REQUIRE( first.getPheromones() == second.getPheromones() );
}

TEST_CASE( "FastFlow tour construction", "[aco][fastflow]" ) {
    const std::vector< City<double> > cities = {
        City<double>(0, 0),
        City<double>(5, 1),
        City<double>(2, 7),
        City<double>(9, 3),
        City<double>(4, 4),
        City<double>(8, 8)
    };
    const Parameters<double> params(12, 1.0, 2.0, 100.0, 0.5, 25);

    Colony<double> single(params, cities);
    Colony<double> multi(params, cities);
    AcoFF<double> one (single, 42, 1);
    AcoFF<double> four(multi,  42, 4);
    one.solve();
    four.solve();

    SECTION( "tours are valid" ) {
        REQUIRE( single.checkTour(one.getBestTour()) );
        REQUIRE( one.getBestTourLength() == Approx(single.tourLength(one.getBestTour())) );
        REQUIRE( one.getRunBestTourLength() <= one.getBestTourLength() );
    }

    SECTION( "the result does not depend on the worker count" ) {
        REQUIRE( one.getBestTour() == four.getBestTour() );
        REQUIRE( one.getBestTourLength() == four.getBestTourLength() );
        REQUIRE( one.getRunBestTourLength() == four.getRunBestTourLength() );
        REQUIRE( single.getPheromones() == multi.getPheromones() );
    }
}
