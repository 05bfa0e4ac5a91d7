#ifndef FKMEANS_REMOVE_UNUSED_CENTERS_HPP
#define FKMEANS_REMOVE_UNUSED_CENTERS_HPP

#include <vector>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Results.hpp"
#include "Partition.hpp"

/**
 * @file remove_unused_centers.hpp
 * @brief Remove unused centroids.
 */

namespace fkmeans {

/**
 * Remove unused centroids from the `Results` of `compute()`.
 * Specifically, empty clusters are dropped and the remaining clusters are relabelled, preserving their relative order.
 * On output, `Results::clusters` will contain all and only integers in `[0, N)` where `N` is the number of non-empty clusters.
 * `Results::centroids`, `Details::sizes` and `Results::partition` are shortened to `N` entries.
 *
 * The clustering procedure itself never removes a cluster, so this is only useful for downstream applications that do not care about empty clusters.
 *
 * @tparam Index_ Integer type of the record indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids.
 *
 * @param[in, out] results Results of the clustering.
 *
 * @return Number of non-empty clusters.
 * If this is equal to the number of centroids in `results`, this function is a no-op.
 */
template<typename Index_, typename Cluster_, typename Float_>
Cluster_ remove_unused_centers(Results<Index_, Cluster_, Float_>& results) {
    auto& sizes = results.details.sizes;
    const auto num_centers = sanisizer::cast<Cluster_>(sizes.size());

    bool has_zero = false;
    for (Cluster_ c = 0; c < num_centers; ++c) {
        if (sizes[c] == 0) {
            has_zero = true;
            break;
        }
    }
    if (!has_zero) {
        return num_centers;
    }

    auto remapping = sanisizer::create<std::vector<Cluster_> >(num_centers);
    Cluster_ remaining = 0;
    for (Cluster_ c = 0; c < num_centers; ++c) {
        if (sizes[c]) {
            remapping[c] = remaining;
            if (remaining != c) {
                results.centroids[remaining] = std::move(results.centroids[c]);
                sizes[remaining] = sizes[c];
            }
            ++remaining;
        }
    }

    results.centroids.resize(remaining);
    sizes.resize(remaining);
    for (auto& clust : results.clusters) {
        clust = remapping[clust];
    }
    results.partition.retain([](const Cluster<Float_>& clust) -> bool { return !clust.members.empty(); });

    return remaining;
}

}

#endif
