#ifndef FKMEANS_FKMEANS_HPP
#define FKMEANS_FKMEANS_HPP

#include <vector>
#include <stdexcept>
#include <cstddef>
#include <utility>

#include "FeatureVector.hpp"
#include "Record.hpp"
#include "Centroid.hpp"
#include "Distance.hpp"
#include "Partition.hpp"
#include "Details.hpp"
#include "Results.hpp"
#include "RefineLloyd.hpp"

#include "compute_wcss.hpp"
#include "remove_unused_centers.hpp"
#include "summary.hpp"

/**
 * @file fkmeans.hpp
 * @brief Perform k-means clustering on records with named features.
 */

/**
 * @namespace fkmeans
 * @brief Perform k-means clustering on records with named features.
 */
namespace fkmeans {

/**
 * @cond
 */
namespace internal {

template<typename Cluster_, typename Float_>
void check_inputs(const std::vector<Record<Float_> >& records, const std::vector<Centroid<Float_> >& initial_centroids, const Cluster_ num_centers, const int max_iterations) {
    if (num_centers < 1) {
        throw std::invalid_argument("number of centers should be positive");
    }
    if (static_cast<std::size_t>(num_centers) != initial_centroids.size()) {
        throw std::invalid_argument("number of initial centroids should be equal to the number of centers");
    }
    if (records.empty()) {
        throw std::invalid_argument("at least one record should be supplied");
    }
    if (max_iterations < 1) {
        throw std::invalid_argument("maximum number of iterations should be positive");
    }
}

}
/**
 * @endcond
 */

/**
 * Cluster records with the Lloyd algorithm, starting from the supplied centroids.
 * Inputs are validated before any iterations are performed, so no partial results are produced for invalid inputs.
 *
 * @tparam Index_ Integer type of the record indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the feature values and centroids.
 * @tparam Metric_ Class satisfying the distance metric interface.
 *
 * @param records Records to be clustered.
 * These should outlive the returned `Results`, whose `Results::partition` refers to them.
 * Temporary vectors are rejected at compile time.
 * @param initial_centroids Starting centroids for each cluster.
 * @param num_centers Number of clusters.
 * @param refine Instance of the Lloyd algorithm, containing the distance metric and options.
 *
 * @return Results of the clustering.
 * @throws std::invalid_argument If `num_centers` is not positive, if it is not equal to the number of `initial_centroids`,
 * or if `records` is empty.
 */
template<typename Index_, typename Cluster_, typename Float_, class Metric_>
Results<Index_, Cluster_, Float_> compute(
    const std::vector<Record<Float_> >& records,
    std::vector<Centroid<Float_> > initial_centroids,
    const Cluster_ num_centers,
    const RefineLloyd<Index_, Cluster_, Float_, Metric_>& refine)
{
    internal::check_inputs(records, initial_centroids, num_centers, refine.get_options().max_iterations);

    Results<Index_, Cluster_, Float_> output(std::move(initial_centroids), records.size());
    output.details = refine.run(records, output.centroids, output.clusters.data());
    output.partition = internal::build_partition(records, output.centroids, output.clusters.data());
    return output;
}

/**
 * @cond
 */
// The partition would refer to records that are destroyed at the end of the call.
template<typename Index_, typename Cluster_, typename Float_, class Metric_>
Results<Index_, Cluster_, Float_> compute(
    std::vector<Record<Float_> >&& records,
    std::vector<Centroid<Float_> > initial_centroids,
    const Cluster_ num_centers,
    const RefineLloyd<Index_, Cluster_, Float_, Metric_>& refine) = delete;
/**
 * @endcond
 */

/**
 * Overload of `compute()` that constructs the Lloyd algorithm from a distance metric and options.
 *
 * @tparam Index_ Integer type of the record indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the feature values and centroids.
 * @tparam Metric_ Class satisfying the distance metric interface.
 *
 * @param records Records to be clustered.
 * These should outlive the returned `Results`, whose `Results::partition` refers to them.
 * @param initial_centroids Starting centroids for each cluster.
 * @param num_centers Number of clusters.
 * @param metric Distance metric to use for assignment.
 * @param options Further options to the Lloyd algorithm.
 *
 * @return Results of the clustering.
 * @throws std::invalid_argument See the other `compute()` overload.
 */
template<typename Index_ = int, typename Cluster_ = int, typename Float_ = double, class Metric_ = EuclideanDistance<Float_> >
Results<Index_, Cluster_, Float_> compute(
    const std::vector<Record<Float_> >& records,
    std::vector<Centroid<Float_> > initial_centroids,
    const Cluster_ num_centers,
    Metric_ metric = Metric_(),
    RefineLloydOptions<Float_> options = RefineLloydOptions<Float_>())
{
    RefineLloyd<Index_, Cluster_, Float_, Metric_> refine(std::move(metric), std::move(options));
    return compute(records, std::move(initial_centroids), num_centers, refine);
}

/**
 * @cond
 */
template<typename Index_ = int, typename Cluster_ = int, typename Float_ = double, class Metric_ = EuclideanDistance<Float_> >
Results<Index_, Cluster_, Float_> compute(
    std::vector<Record<Float_> >&& records,
    std::vector<Centroid<Float_> > initial_centroids,
    const Cluster_ num_centers,
    Metric_ metric = Metric_(),
    RefineLloydOptions<Float_> options = RefineLloydOptions<Float_>()) = delete;
/**
 * @endcond
 */

}

#endif
