#ifndef FKMEANS_RECORD_HPP
#define FKMEANS_RECORD_HPP

#include <string>
#include <utility>

#include "FeatureVector.hpp"

/**
 * @file Record.hpp
 * @brief An observation to be clustered.
 */

namespace fkmeans {

/**
 * @brief An observation to be clustered.
 *
 * Records are owned by the caller and are only read by the clustering procedure.
 * They must outlive any `Partition` that refers to them.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
struct Record {
    /**
     * @cond
     */
    Record() = default;

    Record(std::string identifier, FeatureVector<Float_> features) : identifier(std::move(identifier)), features(std::move(features)) {}
    /**
     * @endcond
     */

    /**
     * Caller-assigned identifier of this record.
     * This is opaque to the clustering procedure, though it is expected to be unique within a dataset.
     */
    std::string identifier;

    /**
     * Feature values for this record.
     */
    FeatureVector<Float_> features;
};

}

#endif
