#ifndef FKMEANS_REFINE_LLOYD_HPP
#define FKMEANS_REFINE_LLOYD_HPP

#include <vector>
#include <algorithm>
#include <functional>
#include <limits>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Record.hpp"
#include "Centroid.hpp"
#include "Partition.hpp"
#include "Distance.hpp"
#include "Details.hpp"
#include "find_closest.hpp"
#include "compute_centroids.hpp"
#include "parallelize.hpp"
#include "utils.hpp"

/**
 * @file RefineLloyd.hpp
 *
 * @brief Implements the Lloyd algorithm for k-means clustering.
 */

namespace fkmeans {

/**
 * @brief Options for `RefineLloyd`.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
struct RefineLloydOptions {
    /**
     * Maximum number of iterations, i.e., assignment passes.
     * By default, there is no practical limit and the algorithm runs until the assignments stop changing.
     * Smaller values can be used as a safety bound, in which case `Details::status` is set to `STATUS_MAX_ITERATIONS` if the limit is reached.
     */
    int max_iterations = std::numeric_limits<int>::max();

    /**
     * Number of threads to use for the assignment of records to centroids.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;

    /**
     * Optional function to observe the progress of the algorithm.
     * This is called after each assignment pass with the (1-based) iteration number and the partition from that pass,
     * including the final pass where convergence is detected.
     * It has no effect on the result.
     */
    std::function<void(int, const Partition<Float_>&)> observer;
};

/**
 * @cond
 */
namespace internal {

template<typename Cluster_, typename Float_>
Partition<Float_> build_partition(const std::vector<Record<Float_> >& records, const std::vector<Centroid<Float_> >& centroids, const Cluster_* const clusters) {
    Partition<Float_> output(centroids);
    const auto nobs = records.size();
    for (I<decltype(nobs)> obs = 0; obs < nobs; ++obs) {
        output.assign(clusters[obs], records[obs]);
    }
    return output;
}

}
/**
 * @endcond
 */

/**
 * @brief Implements the Lloyd algorithm for k-means clustering.
 *
 * The Lloyd algorithm is the simplest k-means clustering algorithm,
 * involving several iterations of batch assignments and center calculations.
 * Specifically, we assign each record to its closest centroid under the distance metric, and once all records are assigned, we recompute the centroids.
 * Each new centroid is the feature-wise mean of its assigned records.
 * This is repeated until there are no reassignments or the maximum number of iterations is reached.
 *
 * If a centroid has no assigned records in an iteration, it retains its previous coordinates.
 * Such clusters are not removed, so the number of clusters is always equal to the number of initial centroids.
 *
 * In the `Details::status` returned by `run()`, the status code is either `STATUS_CONVERGED` or `STATUS_MAX_ITERATIONS`.
 *
 * @tparam Index_ Integer type of the record indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the feature values and centroids.
 * @tparam Metric_ Class satisfying the distance metric interface, see `is_distance_metric`.
 *
 * @see
 * Lloyd, S. P. (1982).
 * Least squares quantization in PCM.
 * _IEEE Transactions on Information Theory_ 28, 128-137.
 */
template<typename Index_ = int, typename Cluster_ = int, typename Float_ = double, class Metric_ = EuclideanDistance<Float_> >
class RefineLloyd {
private:
    Metric_ my_metric;
    RefineLloydOptions<Float_> my_options;

    static_assert(is_distance_metric<Metric_, Float_>::value);

public:
    /**
     * @param metric Distance metric to use for assignment.
     * @param options Further options to the Lloyd algorithm.
     */
    RefineLloyd(Metric_ metric, RefineLloydOptions<Float_> options) : my_metric(std::move(metric)), my_options(std::move(options)) {}

    /**
     * @param metric Distance metric to use for assignment.
     */
    RefineLloyd(Metric_ metric) : my_metric(std::move(metric)) {}

    /**
     * Default constructor.
     */
    RefineLloyd() = default;

public:
    /**
     * @return Options for Lloyd clustering.
     * This can be modified prior to calling `run()`.
     */
    RefineLloydOptions<Float_>& get_options() {
        return my_options;
    }

    /**
     * @return Options for Lloyd clustering.
     */
    const RefineLloydOptions<Float_>& get_options() const {
        return my_options;
    }

    /**
     * @return Distance metric used for assignment.
     */
    const Metric_& get_metric() const {
        return my_metric;
    }

public:
    /**
     * @param records Records to be clustered.
     * This should contain at least one record.
     * @param[in, out] centroids Centroids for each cluster.
     * On input, this should contain at least one centroid, representing the starting locations.
     * On output, this will contain the final centroids.
     * @param[out] clusters Pointer to an array of length equal to the number of records.
     * On output, this will contain the 0-based cluster assignment for each record,
     * where each entry is an index into `centroids`.
     *
     * @return `centroids` and `clusters` are filled, and an object is returned containing clustering statistics.
     */
    Details<Index_> run(const std::vector<Record<Float_> >& records, std::vector<Centroid<Float_> >& centroids, Cluster_* const clusters) const {
        const auto nobs = sanisizer::cast<Index_>(records.size());
        const auto ncenters = sanisizer::cast<Cluster_>(centroids.size());

        auto sizes = sanisizer::create<std::vector<Index_> >(ncenters);
        auto copy = sanisizer::create<std::vector<Cluster_> >(nobs);

        I<decltype(my_options.max_iterations)> iter = 0;
        for (; iter < my_options.max_iterations; ++iter) {
            parallelize(my_options.num_threads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
                for (Index_ obs = start, end = start + length; obs < end; ++obs) {
                    copy[obs] = internal::find_closest<Cluster_>(records[obs].features, centroids, my_metric);
                }
            });

            // Checking if it already converged. There's nothing to compare to on the first pass.
            bool updated = (iter == 0);
            if (!updated) {
                for (Index_ obs = 0; obs < nobs; ++obs) {
                    if (copy[obs] != clusters[obs]) {
                        updated = true;
                        break;
                    }
                }
            }
            std::copy(copy.begin(), copy.end(), clusters);

            if (my_options.observer) {
                my_options.observer(iter + 1, internal::build_partition(records, centroids, clusters));
            }
            if (!updated) {
                break;
            }

            std::fill(sizes.begin(), sizes.end(), 0);
            for (Index_ obs = 0; obs < nobs; ++obs) {
                ++sizes[clusters[obs]];
            }
            internal::compute_centroids(records, ncenters, centroids, clusters, sizes);
        }

        int status = STATUS_CONVERGED;
        if (iter == my_options.max_iterations) {
            status = STATUS_MAX_ITERATIONS;
        } else {
            ++iter; // make it 1-based.
        }
        return Details<Index_>(std::move(sizes), iter, status);
    }
};

}

#endif
