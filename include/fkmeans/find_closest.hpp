#ifndef FKMEANS_FIND_CLOSEST_HPP
#define FKMEANS_FIND_CLOSEST_HPP

#include <vector>

#include "sanisizer/sanisizer.hpp"

#include "FeatureVector.hpp"
#include "Centroid.hpp"

namespace fkmeans {

namespace internal {

/*
 * The first centroid is the incumbent and is only displaced by a strictly
 * smaller distance, so ties go to the earliest centroid in the list.
 */
template<typename Cluster_, typename Float_, class Metric_>
Cluster_ find_closest(const FeatureVector<Float_>& features, const std::vector<Centroid<Float_> >& centroids, const Metric_& metric) {
    Cluster_ best = 0;
    Float_ best_dist = metric.distance(features, centroids[0].coordinates);

    const auto ncenters = sanisizer::cast<Cluster_>(centroids.size());
    for (Cluster_ cen = 1; cen < ncenters; ++cen) {
        const Float_ dist = metric.distance(features, centroids[cen].coordinates);
        if (dist < best_dist) {
            best = cen;
            best_dist = dist;
        }
    }

    return best;
}

}

}

#endif
