#ifndef FKMEANS_FEATURE_VECTOR_HPP
#define FKMEANS_FEATURE_VECTOR_HPP

#include <map>
#include <string>

/**
 * @file FeatureVector.hpp
 * @brief Points with named dimensions.
 */

namespace fkmeans {

/**
 * A point in a feature space where dimensions are identified by name rather than by position.
 * Entries are ordered by feature name, so iteration order is reproducible across runs.
 *
 * Two vectors do not need to declare their dimensionality up front.
 * Any operation that combines two vectors only considers the feature names present in both,
 * see `EuclideanDistance` for an example.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
using FeatureVector = std::map<std::string, Float_>;

}

#endif
