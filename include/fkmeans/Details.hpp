#ifndef FKMEANS_DETAILS_HPP
#define FKMEANS_DETAILS_HPP

#include <vector>
#include <utility>

/**
 * @file Details.hpp
 *
 * @brief Statistics from the Lloyd iterations.
 */

namespace fkmeans {

/**
 * Status code for a run that stopped because an assignment pass left every record in the same cluster as the previous pass.
 */
constexpr int STATUS_CONVERGED = 0;

/**
 * Status code for a run that stopped because `RefineLloydOptions::max_iterations` passes were performed
 * while the assignments were still changing.
 */
constexpr int STATUS_MAX_ITERATIONS = 2;

/**
 * @brief Statistics from the Lloyd iterations.
 *
 * @tparam Index_ Integer type of the record index.
 */
template<typename Index_>
struct Details {
    /**
     * @cond
     */
    Details() = default;

    Details(std::vector<Index_> sizes, const int iterations, const int status) : sizes(std::move(sizes)), iterations(iterations), status(status) {}
    /**
     * @endcond
     */

    /**
     * Number of records assigned to each centroid by the last assignment pass, in the order of the initial centroids.
     * A centroid that attracted no records has a size of zero but is still reported,
     * so the length of this vector is always the number of initial centroids.
     * Such entries can be dropped afterwards with `remove_unused_centers()`.
     */
    std::vector<Index_> sizes;

    /**
     * Number of assignment passes.
     * On convergence, this includes the final pass that confirmed the assignments were unchanged,
     * so a run where the first update already lands on the fixed point reports 2.
     * If the iteration cap was reached, this is equal to `RefineLloydOptions::max_iterations`.
     */
    int iterations = 0;

    /**
     * Either `STATUS_CONVERGED` or `STATUS_MAX_ITERATIONS`.
     */
    int status = STATUS_CONVERGED;
};

}

#endif
