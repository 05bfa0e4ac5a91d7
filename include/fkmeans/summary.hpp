#ifndef FKMEANS_SUMMARY_HPP
#define FKMEANS_SUMMARY_HPP

#include <string>
#include <sstream>
#include <ostream>

#include "FeatureVector.hpp"
#include "Record.hpp"
#include "Centroid.hpp"
#include "Partition.hpp"

/**
 * @file summary.hpp
 * @brief Human-readable summaries of the clustering inputs and outputs.
 *
 * None of these functions are used by the clustering procedure itself.
 * They are intended for reporting, e.g., from the `RefineLloydOptions::observer` callback.
 */

namespace fkmeans {

/**
 * @tparam Float_ Floating-point type of the feature values.
 * @param features Feature vector.
 * @return String of the form `(name1=value1, name2=value2)`, with features ordered by name.
 */
template<typename Float_>
std::string format_features(const FeatureVector<Float_>& features) {
    std::ostringstream out;
    out << "(";
    bool first = true;
    for (const auto& entry : features) {
        if (!first) {
            out << ", ";
        }
        out << entry.first << "=" << entry.second;
        first = false;
    }
    out << ")";
    return out.str();
}

/**
 * @tparam Float_ Floating-point type of the coordinates.
 * @param centroid A centroid.
 * @return String of the form `Centroid (name1=value1, name2=value2)`.
 */
template<typename Float_>
std::string format_centroid(const Centroid<Float_>& centroid) {
    return "Centroid " + format_features(centroid.coordinates);
}

/**
 * @tparam Float_ Floating-point type of the feature values.
 * @param record A record.
 * @return String of the form `Record{identifier='id', features=(name1=value1)}`.
 */
template<typename Float_>
std::string format_record(const Record<Float_>& record) {
    return "Record{identifier='" + record.identifier + "', features=" + format_features(record.features) + "}";
}

/**
 * @tparam Float_ Floating-point type of the feature values.
 * @param cluster A cluster.
 * @return String containing the centroid followed by the identifiers of its member records, e.g., `Centroid (x=1) Record Identifiers: [a, b]`.
 */
template<typename Float_>
std::string format_cluster(const Cluster<Float_>& cluster) {
    std::ostringstream out;
    out << format_centroid(cluster.centroid) << " Record Identifiers: [";
    bool first = true;
    for (auto rec : cluster.members) {
        if (!first) {
            out << ", ";
        }
        out << rec->identifier;
        first = false;
    }
    out << "]";
    return out.str();
}

/**
 * @tparam Float_ Floating-point type of the feature values.
 * @param out Output stream.
 * @param partition A partition.
 * One line is written to `out` for each cluster, see `format_cluster()`.
 */
template<typename Float_>
void print_partition(std::ostream& out, const Partition<Float_>& partition) {
    for (const auto& clust : partition) {
        out << format_cluster(clust) << "\n";
    }
}

}

#endif
