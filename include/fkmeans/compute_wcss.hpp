#ifndef FKMEANS_COMPUTE_WCSS_HPP
#define FKMEANS_COMPUTE_WCSS_HPP

#include <vector>
#include <cstddef>

#include "Partition.hpp"
#include "Distance.hpp"

/**
 * @file compute_wcss.hpp
 * @brief Compute within-cluster sum of squares.
 */

namespace fkmeans {

/**
 * @tparam Float_ Floating-point type of the feature values and output.
 * @tparam Metric_ Class satisfying the distance metric interface.
 *
 * @param partition Partition of records into clusters, typically from `Results::partition`.
 * @param metric Distance metric, typically the same as that used for clustering.
 *
 * @return Vector of length equal to the number of clusters in `partition`.
 * Each entry contains the sum of squared distances from each record in the cluster to the cluster's centroid.
 * Empty clusters have a within-cluster sum of squares of zero.
 */
template<typename Float_, class Metric_>
std::vector<Float_> compute_wcss(const Partition<Float_>& partition, const Metric_& metric) {
    static_assert(is_distance_metric<Metric_, Float_>::value);

    std::vector<Float_> wcss(partition.size());
    for (std::size_t c = 0, end = partition.size(); c < end; ++c) {
        const auto& clust = partition[c];
        Float_& curwcss = wcss[c];
        for (auto rec : clust.members) {
            const Float_ delta = metric.distance(rec->features, clust.centroid.coordinates);
            curwcss += delta * delta;
        }
    }

    return wcss;
}

/**
 * Overload of `compute_wcss()` using the Euclidean distance.
 *
 * @tparam Float_ Floating-point type of the feature values and output.
 * @param partition Partition of records into clusters, typically from `Results::partition`.
 * @return Within-cluster sum of squares for each cluster.
 */
template<typename Float_>
std::vector<Float_> compute_wcss(const Partition<Float_>& partition) {
    return compute_wcss(partition, EuclideanDistance<Float_>());
}

}

#endif
