#ifndef FKMEANS_DISTANCE_HPP
#define FKMEANS_DISTANCE_HPP

#include <cmath>
#include <utility>
#include <type_traits>

#include "FeatureVector.hpp"

/**
 * @file Distance.hpp
 * @brief Distance metrics between feature vectors.
 *
 * A distance metric is any class that provides a `distance()` method accepting two `FeatureVector` objects,
 * returning a non-negative dissimilarity between them.
 * The clustering procedure does not require the metric to be symmetric, only that it is used consistently.
 * Metrics should not fail if the feature names differ between vectors;
 * rather, dimensions that are not present in both vectors should not contribute to the distance.
 */

namespace fkmeans {

/**
 * @brief Check whether a class satisfies the distance metric interface.
 *
 * @tparam Metric_ Class to be checked.
 * @tparam Float_ Floating-point type of the feature values.
 *
 * `value` is true if `Metric_` has a `const` method `distance()` that accepts two `FeatureVector<Float_>` objects
 * and returns a value convertible to `Float_`.
 */
template<class Metric_, typename Float_, typename = void>
struct is_distance_metric : std::false_type {};

/**
 * @cond
 */
template<class Metric_, typename Float_>
struct is_distance_metric<Metric_, Float_, std::void_t<decltype(
    std::declval<const Metric_&>().distance(std::declval<const FeatureVector<Float_>&>(), std::declval<const FeatureVector<Float_>&>())
)> > : std::is_convertible<decltype(
    std::declval<const Metric_&>().distance(std::declval<const FeatureVector<Float_>&>(), std::declval<const FeatureVector<Float_>&>())
), Float_> {};
/**
 * @endcond
 */

/**
 * @brief Euclidean distance between feature vectors.
 *
 * For each feature in the first vector that is also present in the second, the squared difference is accumulated.
 * The square root of the sum is returned.
 * If the vectors do not share any feature names, the distance is zero.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
class EuclideanDistance {
public:
    /**
     * @param first First feature vector.
     * @param second Second feature vector.
     * @return Euclidean distance between `first` and `second` across their shared features.
     */
    Float_ distance(const FeatureVector<Float_>& first, const FeatureVector<Float_>& second) const {
        Float_ output = 0;
        for (const auto& entry : first) {
            auto it = second.find(entry.first);
            if (it != second.end()) {
                const Float_ delta = entry.second - it->second;
                output += delta * delta;
            }
        }
        return std::sqrt(output);
    }
};

/**
 * @brief Manhattan distance between feature vectors.
 *
 * Sum of absolute differences across all features that are present in both vectors.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
class ManhattanDistance {
public:
    /**
     * @param first First feature vector.
     * @param second Second feature vector.
     * @return Manhattan distance between `first` and `second` across their shared features.
     */
    Float_ distance(const FeatureVector<Float_>& first, const FeatureVector<Float_>& second) const {
        Float_ output = 0;
        for (const auto& entry : first) {
            auto it = second.find(entry.first);
            if (it != second.end()) {
                output += std::abs(entry.second - it->second);
            }
        }
        return output;
    }
};

/**
 * @brief Weighted Euclidean distance between feature vectors.
 *
 * Each squared difference is multiplied by the weight of its feature before summation.
 * Features without an explicit weight are given a weight of 1.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
class WeightedEuclideanDistance {
public:
    /**
     * @param weights Non-negative weight for each feature.
     */
    WeightedEuclideanDistance(FeatureVector<Float_> weights) : my_weights(std::move(weights)) {}

private:
    FeatureVector<Float_> my_weights;

public:
    /**
     * @param first First feature vector.
     * @param second Second feature vector.
     * @return Weighted Euclidean distance between `first` and `second` across their shared features.
     */
    Float_ distance(const FeatureVector<Float_>& first, const FeatureVector<Float_>& second) const {
        Float_ output = 0;
        for (const auto& entry : first) {
            auto it = second.find(entry.first);
            if (it == second.end()) {
                continue;
            }

            const Float_ delta = entry.second - it->second;
            auto wIt = my_weights.find(entry.first);
            const Float_ weight = (wIt == my_weights.end() ? static_cast<Float_>(1) : wIt->second);
            output += weight * delta * delta;
        }
        return std::sqrt(output);
    }

    /**
     * @return Weights for each feature.
     */
    const FeatureVector<Float_>& get_weights() const {
        return my_weights;
    }
};

/**
 * @brief Distance metric defined by an arbitrary function.
 *
 * This allows lambdas and other callables to be used wherever a distance metric class is expected.
 *
 * @tparam Float_ Floating-point type of the feature values.
 * @tparam Function_ Callable that accepts two `FeatureVector<Float_>` objects and returns a `Float_`.
 */
template<typename Float_, class Function_>
class FunctionDistance {
public:
    /**
     * @param fun Function to compute the distance.
     */
    FunctionDistance(Function_ fun) : my_fun(std::move(fun)) {}

private:
    Function_ my_fun;

public:
    /**
     * @param first First feature vector.
     * @param second Second feature vector.
     * @return Distance between `first` and `second`, as computed by the function.
     */
    Float_ distance(const FeatureVector<Float_>& first, const FeatureVector<Float_>& second) const {
        return my_fun(first, second);
    }
};

/**
 * @tparam Float_ Floating-point type of the feature values.
 * @tparam Function_ Callable that accepts two `FeatureVector<Float_>` objects and returns a `Float_`.
 *
 * @param fun Function to compute the distance.
 * @return A `FunctionDistance` wrapping `fun`.
 */
template<typename Float_ = double, class Function_>
FunctionDistance<Float_, Function_> make_distance(Function_ fun) {
    return FunctionDistance<Float_, Function_>(std::move(fun));
}

}

#endif
