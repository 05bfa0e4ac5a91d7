#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "fkmeans/fkmeans.hpp"

namespace {

void report(const std::vector<fkmeans::Record<double> >& records, const std::vector<fkmeans::Centroid<double> >& centers) {
    for (const auto& rec : records) {
        std::cout << fkmeans::format_record(rec) << "\n";
    }

    fkmeans::RefineLloydOptions<double> opt;
    opt.observer = [](int iter, const fkmeans::Partition<double>& part) -> void {
        std::cout << "\nIteration " << iter << ":\n";
        fkmeans::print_partition(std::cout, part);
    };

    auto res = fkmeans::compute(records, centers, static_cast<int>(centers.size()), fkmeans::EuclideanDistance<double>(), opt);

    std::cout << "\nFinal clusters after " << res.details.iterations << " iterations:\n";
    fkmeans::print_partition(std::cout, res.partition);

    auto wcss = fkmeans::compute_wcss(res.partition);
    std::cout << "WCSS:";
    for (auto w : wcss) {
        std::cout << " " << w;
    }
    std::cout << "\n" << std::endl;
}

void one_dimensional() {
    std::vector<fkmeans::Record<double> > records;
    for (double v : { 6, 8, 18, 26, 13, 32, 24 }) {
        std::ostringstream id;
        id << v;
        records.emplace_back(id.str(), fkmeans::FeatureVector<double>{ { "value", v } });
    }

    std::vector<fkmeans::Centroid<double> > centers;
    for (double v : { 11, 20 }) {
        centers.emplace_back(fkmeans::FeatureVector<double>{ { "value", v } });
    }

    report(records, centers);
}

void two_dimensional() {
    const std::vector<std::vector<double> > values { { 185, 72 }, { 170, 56 }, { 168, 60 }, { 179, 68 }, { 182, 72 }, { 188, 77 } };
    std::vector<fkmeans::Record<double> > records;
    for (std::size_t i = 0; i < values.size(); ++i) {
        records.emplace_back(std::to_string(i + 1), fkmeans::FeatureVector<double>{ { "X", values[i][0] }, { "Y", values[i][1] } });
    }

    std::vector<fkmeans::Centroid<double> > centers;
    centers.emplace_back(records[0].features);
    centers.emplace_back(records[1].features);

    report(records, centers);
}

}

int main() {
    std::cout << "=== One-dimensional ===\n";
    one_dimensional();
    std::cout << "=== Two-dimensional ===\n";
    two_dimensional();
    return 0;
}
