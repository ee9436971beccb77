#ifndef __CITY_CPP__
#define __CITY_CPP__

#include <cmath>

template <typename T>
struct City {
    const T x;
    const T y;

    City(const T x, const T y) :
    x(x),
    y(y)
    {}
};

template <typename T>
inline T distance(const City<T> & a, const City<T> & b) {
    const T xd = a.x - b.x;
    const T yd = a.y - b.y;
    return std::sqrt(xd * xd + yd * yd);
}

#endif
