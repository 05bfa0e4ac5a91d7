#ifndef FKMEANS_CENTROID_HPP
#define FKMEANS_CENTROID_HPP

#include <utility>

#include "FeatureVector.hpp"

/**
 * @file Centroid.hpp
 * @brief Center of a cluster.
 */

namespace fkmeans {

/**
 * @brief Center of a cluster.
 *
 * Centroids are compared by value, i.e., two centroids are equal if they have the same feature names with the same values.
 * This allows them to be used as keys in ordered containers via `operator<`.
 *
 * @tparam Float_ Floating-point type of the coordinates.
 */
template<typename Float_ = double>
struct Centroid {
    /**
     * @cond
     */
    Centroid() = default;

    Centroid(FeatureVector<Float_> coordinates) : coordinates(std::move(coordinates)) {}
    /**
     * @endcond
     */

    /**
     * Coordinates of the centroid in the feature space.
     */
    FeatureVector<Float_> coordinates;
};

/**
 * @cond
 */
template<typename Float_>
bool operator==(const Centroid<Float_>& left, const Centroid<Float_>& right) {
    return left.coordinates == right.coordinates;
}

template<typename Float_>
bool operator!=(const Centroid<Float_>& left, const Centroid<Float_>& right) {
    return !(left == right);
}

template<typename Float_>
bool operator<(const Centroid<Float_>& left, const Centroid<Float_>& right) {
    return left.coordinates < right.coordinates;
}
/**
 * @endcond
 */

}

#endif
