#ifndef FKMEANS_PARTITION_HPP
#define FKMEANS_PARTITION_HPP

#include <vector>
#include <string>
#include <algorithm>
#include <cstddef>
#include <utility>

#include "Record.hpp"
#include "Centroid.hpp"

/**
 * @file Partition.hpp
 * @brief Assignment of records to centroids.
 */

namespace fkmeans {

/**
 * @brief A single cluster in a `Partition`.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
struct Cluster {
    /**
     * @cond
     */
    Cluster() = default;

    Cluster(Centroid<Float_> centroid) : centroid(std::move(centroid)) {}
    /**
     * @endcond
     */

    /**
     * Centroid of this cluster.
     */
    Centroid<Float_> centroid;

    /**
     * Records assigned to this cluster, in the order in which they were supplied to the clustering procedure.
     * These point to the caller's records, which must outlive this object.
     */
    std::vector<const Record<Float_>*> members;
};

/**
 * @brief Assignment of records to centroids.
 *
 * A partition maps each centroid to the records assigned to it.
 * Clusters are stored in the same order as the centroid list used to build the partition,
 * so that two positions with identical centroids still form separate clusters.
 * Each record belongs to exactly one cluster.
 *
 * @tparam Float_ Floating-point type of the feature values.
 */
template<typename Float_ = double>
class Partition {
public:
    /**
     * Default constructor, creating a partition with no clusters.
     */
    Partition() = default;

    /**
     * @param centroids Centroids for each cluster.
     * Each cluster is initially empty.
     */
    Partition(const std::vector<Centroid<Float_> >& centroids) {
        my_clusters.reserve(centroids.size());
        for (const auto& cen : centroids) {
            my_clusters.emplace_back(cen);
        }
    }

private:
    std::vector<Cluster<Float_> > my_clusters;

public:
    /**
     * @return Number of clusters, including empty clusters.
     */
    std::size_t size() const {
        return my_clusters.size();
    }

    /**
     * @param i Index of the cluster.
     * @return The `i`-th cluster.
     */
    const Cluster<Float_>& operator[](std::size_t i) const {
        return my_clusters[i];
    }

    /**
     * @param i Index of the cluster.
     * @return The `i`-th cluster.
     */
    Cluster<Float_>& operator[](std::size_t i) {
        return my_clusters[i];
    }

    /**
     * @return Iterator to the first cluster.
     */
    typename std::vector<Cluster<Float_> >::const_iterator begin() const {
        return my_clusters.begin();
    }

    /**
     * @return Iterator to the end of the clusters.
     */
    typename std::vector<Cluster<Float_> >::const_iterator end() const {
        return my_clusters.end();
    }

    /**
     * @param i Index of the cluster.
     * @param record Record to be added to the `i`-th cluster.
     * This should not already be present in any cluster of this partition.
     */
    void assign(std::size_t i, const Record<Float_>& record) {
        my_clusters[i].members.push_back(&record);
    }

    /**
     * @param centroid Centroid to search for.
     * @return Pointer to the first cluster with a centroid equal to `centroid`, or `NULL` if no such cluster exists.
     */
    const Cluster<Float_>* find(const Centroid<Float_>& centroid) const {
        for (const auto& clust : my_clusters) {
            if (clust.centroid == centroid) {
                return &clust;
            }
        }
        return NULL;
    }

    /**
     * @return Centroids of all clusters, in order.
     */
    std::vector<Centroid<Float_> > centroids() const {
        std::vector<Centroid<Float_> > output;
        output.reserve(my_clusters.size());
        for (const auto& clust : my_clusters) {
            output.push_back(clust.centroid);
        }
        return output;
    }

    /**
     * @param keep Function that accepts a `const Cluster<Float_>&` and returns whether it should be kept.
     * The relative order of the retained clusters is preserved.
     */
    template<class Keep_>
    void retain(Keep_ keep) {
        my_clusters.erase(
            std::remove_if(my_clusters.begin(), my_clusters.end(), [&](const Cluster<Float_>& clust) -> bool { return !keep(clust); }),
            my_clusters.end()
        );
    }
};

/**
 * @tparam Float_ Floating-point type of the feature values.
 * @param cluster A cluster.
 * @return Identifiers of the records in `cluster`, in order of assignment.
 */
template<typename Float_>
std::vector<std::string> member_identifiers(const Cluster<Float_>& cluster) {
    std::vector<std::string> output;
    output.reserve(cluster.members.size());
    for (auto rec : cluster.members) {
        output.push_back(rec->identifier);
    }
    return output;
}

/**
 * Two partitions are equal if they have the same number of clusters,
 * and if each pair of corresponding clusters has the same centroid and the same set of member identifiers.
 *
 * @tparam Float_ Floating-point type of the feature values.
 * @param left A partition.
 * @param right Another partition.
 * @return Whether the two partitions are equal.
 */
template<typename Float_>
bool operator==(const Partition<Float_>& left, const Partition<Float_>& right) {
    if (left.size() != right.size()) {
        return false;
    }

    for (std::size_t i = 0, end = left.size(); i < end; ++i) {
        const auto& lclust = left[i];
        const auto& rclust = right[i];
        if (lclust.centroid != rclust.centroid || lclust.members.size() != rclust.members.size()) {
            return false;
        }

        auto lids = member_identifiers(lclust);
        auto rids = member_identifiers(rclust);
        std::sort(lids.begin(), lids.end());
        std::sort(rids.begin(), rids.end());
        if (lids != rids) {
            return false;
        }
    }

    return true;
}

/**
 * @cond
 */
template<typename Float_>
bool operator!=(const Partition<Float_>& left, const Partition<Float_>& right) {
    return !(left == right);
}
/**
 * @endcond
 */

}

#endif
