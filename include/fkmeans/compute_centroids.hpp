#ifndef FKMEANS_COMPUTE_CENTROIDS_HPP
#define FKMEANS_COMPUTE_CENTROIDS_HPP

#include <vector>
#include <map>
#include <string>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Record.hpp"
#include "Centroid.hpp"
#include "FeatureVector.hpp"

namespace fkmeans {

namespace internal {

/*
 * Records are visited in their input order so that the summation order, and
 * thus the floating-point result, is reproducible. Each feature is averaged
 * over the records that actually carry it. Centroids of empty clusters are
 * left untouched.
 */
template<typename Index_, typename Cluster_, typename Float_>
void compute_centroids(
    const std::vector<Record<Float_> >& records,
    const Cluster_ ncenters,
    std::vector<Centroid<Float_> >& centroids,
    const Cluster_* const clusters,
    const std::vector<Index_>& sizes)
{
    auto sums = sanisizer::create<std::vector<FeatureVector<Float_> > >(ncenters);
    auto counts = sanisizer::create<std::vector<std::map<std::string, Index_> > >(ncenters);

    const auto nobs = sanisizer::cast<Index_>(records.size());
    for (Index_ obs = 0; obs < nobs; ++obs) {
        const auto curclust = clusters[obs];
        auto& cursum = sums[curclust];
        auto& curcount = counts[curclust];
        for (const auto& entry : records[obs].features) {
            cursum[entry.first] += entry.second;
            ++curcount[entry.first];
        }
    }

    for (Cluster_ cen = 0; cen < ncenters; ++cen) {
        if (sizes[cen] == 0) {
            continue;
        }

        const auto& curcount = counts[cen];
        FeatureVector<Float_> means;
        for (const auto& entry : sums[cen]) {
            means.emplace_hint(means.end(), entry.first, entry.second / static_cast<Float_>(curcount.find(entry.first)->second));
        }

        centroids[cen] = Centroid<Float_>(std::move(means));
    }
}

}

}

#endif
