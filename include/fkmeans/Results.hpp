#ifndef FKMEANS_RESULTS_HPP
#define FKMEANS_RESULTS_HPP

#include <vector>
#include <cstddef>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Centroid.hpp"
#include "Partition.hpp"
#include "Details.hpp"

/**
 * @file Results.hpp
 * @brief Results of the clustering procedure.
 */

namespace fkmeans {

/**
 * @brief Results of the clustering procedure.
 *
 * @tparam Index_ Integer type of the record indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the feature values and centroids.
 */
template<typename Index_, typename Cluster_, typename Float_>
struct Results {
    /**
     * @cond
     */
    Results(std::vector<Centroid<Float_> > initial_centroids, const std::size_t num_records) :
        centroids(std::move(initial_centroids)),
        clusters(sanisizer::create<std::vector<Cluster_> >(num_records))
    {}

    Results() = default;
    /**
     * @endcond
     */

    /**
     * Final centroid for each cluster, in the same order as the initial centroids.
     */
    std::vector<Centroid<Float_> > centroids;

    /**
     * An array of length equal to the number of records, containing the 0-indexed cluster assignment for each record.
     * Each entry is an index into `Results::centroids`.
     */
    std::vector<Cluster_> clusters;

    /**
     * Final partition of the records.
     * This refers to the records that were passed to `compute()`, which should outlive this object.
     * `compute()` does not accept a temporary record vector for this reason.
     */
    Partition<Float_> partition;

    /**
     * Further details from the clustering procedure.
     */
    Details<Index_> details;
};

}

#endif
