#ifndef FKMEANS_PARALLELIZE_HPP 
#define FKMEANS_PARALLELIZE_HPP

#include <utility>

/**
 * @file parallelize.hpp
 * @brief Parallel assignment of records.
 */

#ifndef FKMEANS_CUSTOM_PARALLEL
#include "subpar/subpar.hpp"
#endif

namespace fkmeans {

/**
 * Split the assignment of records to centroids across workers.
 * Each worker receives a contiguous range of record indices and writes the assignments for that range only,
 * so the order of processing has no effect on the result.
 *
 * By default, this forwards to `subpar::parallelize_range()`.
 * If the `FKMEANS_CUSTOM_PARALLEL` function-like macro is defined, it is called with the same arguments instead,
 * e.g., to run the ranges on an existing thread pool.
 *
 * @tparam Task_ Integer type of the number of records.
 * @tparam Run_ Function to process a range of records.
 *
 * @param num_workers Number of workers, see `RefineLloydOptions::num_threads`.
 * @param num_tasks Number of records.
 * @param run_task_range Function that accepts the worker index, the first record index and the number of records in the range.
 */
template<typename Task_, class Run_>
void parallelize(const int num_workers, const Task_ num_tasks, Run_ run_task_range) {
#ifndef FKMEANS_CUSTOM_PARALLEL
    // Do NOT make this no-throw as we don't know whether the distance metric might throw.
    subpar::parallelize_range(num_workers, num_tasks, std::move(run_task_range));
#else
    FKMEANS_CUSTOM_PARALLEL(num_workers, num_tasks, run_task_range);
#endif
}

}

#endif
