#ifndef DYNEST_TYPEDEFS_H
#define DYNEST_TYPEDEFS_H

#include <Eigen/Core>
#include <concepts>
#include <utility>
#include <vector>

typedef double float_type;

typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;
typedef Eigen::Matrix<int, Eigen::Dynamic, 1> Coli;

template <typename T>
concept NumericType = std::integral<T> or std::floating_point<T>;

namespace DYN {
    // (logl threshold, population) pairs, ascending in logl
    typedef std::vector<std::pair<float_type, int>> NliveSteps;
}

#endif // DYNEST_TYPEDEFS_H
