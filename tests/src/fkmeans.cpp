#include "TestCore.h"

#ifdef TEST_CUSTOM_PARALLEL
// Must be before any fkmeans imports.
#include "custom_parallel.h"
#endif

#include "fkmeans/fkmeans.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

TEST(Compute, OneDimensional) {
    auto records = TestCore::create_1d_records({ 6, 8, 18, 26, 13, 32, 24 });
    auto centers = TestCore::create_1d_centers({ 11, 20 });

    auto res = fkmeans::compute(records, centers, 2);
    EXPECT_EQ(res.details.status, 0);
    EXPECT_EQ(res.details.sizes, std::vector<int>({ 3, 4 }));

    ASSERT_EQ(res.centroids.size(), 2);
    EXPECT_NEAR(res.centroids[0].coordinates.at("value"), 9, 1e-9);
    EXPECT_NEAR(res.centroids[1].coordinates.at("value"), 25, 1e-9);
    EXPECT_EQ(res.clusters, std::vector<int>({ 0, 0, 1, 1, 0, 1, 1 }));

    ASSERT_EQ(res.partition.size(), 2);
    EXPECT_EQ(res.partition[0].centroid, res.centroids[0]);
    EXPECT_EQ(fkmeans::member_identifiers(res.partition[0]), std::vector<std::string>({ "6", "8", "13" }));
    EXPECT_EQ(res.partition[1].centroid, res.centroids[1]);
    EXPECT_EQ(fkmeans::member_identifiers(res.partition[1]), std::vector<std::string>({ "18", "26", "32", "24" }));

    // Lookup by value.
    auto found = res.partition.find(fkmeans::Centroid<double>(fkmeans::FeatureVector<double>{ { "value", 25 } }));
    ASSERT_TRUE(found != NULL);
    EXPECT_EQ(found->members.size(), 4);
}

TEST(Compute, TwoDimensional) {
    std::vector<fkmeans::Record<double> > records {
        { "1", { { "X", 185 }, { "Y", 72 } } },
        { "2", { { "X", 170 }, { "Y", 56 } } },
        { "3", { { "X", 168 }, { "Y", 60 } } },
        { "4", { { "X", 179 }, { "Y", 68 } } },
        { "5", { { "X", 182 }, { "Y", 72 } } },
        { "6", { { "X", 188 }, { "Y", 77 } } }
    };
    std::vector<fkmeans::Centroid<double> > centers {
        fkmeans::FeatureVector<double>{ { "X", 185 }, { "Y", 72 } },
        fkmeans::FeatureVector<double>{ { "X", 170 }, { "Y", 56 } }
    };

    auto res = fkmeans::compute(records, centers, 2, fkmeans::EuclideanDistance<double>());
    EXPECT_EQ(res.details.status, 0);
    EXPECT_EQ(res.details.iterations, 2);

    EXPECT_NEAR(res.centroids[0].coordinates.at("X"), 183.5, 1e-9);
    EXPECT_NEAR(res.centroids[0].coordinates.at("Y"), 72.25, 1e-9);
    EXPECT_NEAR(res.centroids[1].coordinates.at("X"), 169, 1e-9);
    EXPECT_NEAR(res.centroids[1].coordinates.at("Y"), 58, 1e-9);

    EXPECT_EQ(fkmeans::member_identifiers(res.partition[0]), std::vector<std::string>({ "1", "4", "5", "6" }));
    EXPECT_EQ(fkmeans::member_identifiers(res.partition[1]), std::vector<std::string>({ "2", "3" }));
}

TEST(Compute, InvalidInputs) {
    auto records = TestCore::create_1d_records({ 1, 2, 3 });
    auto centers = TestCore::create_1d_centers({ 1 });

    bool observed = false;
    fkmeans::RefineLloydOptions<double> opt;
    opt.observer = [&](int, const fkmeans::Partition<double>&) -> void { observed = true; };

    EXPECT_THROW(fkmeans::compute(records, centers, 2, fkmeans::EuclideanDistance<double>(), opt), std::invalid_argument);
    EXPECT_THROW(fkmeans::compute(records, std::vector<fkmeans::Centroid<double> >(), 0, fkmeans::EuclideanDistance<double>(), opt), std::invalid_argument);
    EXPECT_THROW(fkmeans::compute(records, centers, -1, fkmeans::EuclideanDistance<double>(), opt), std::invalid_argument);
    std::vector<fkmeans::Record<double> > empty;
    EXPECT_THROW(fkmeans::compute(empty, centers, 1, fkmeans::EuclideanDistance<double>(), opt), std::invalid_argument);

    auto badopt = opt;
    badopt.max_iterations = 0;
    EXPECT_THROW(fkmeans::compute(records, centers, 1, fkmeans::EuclideanDistance<double>(), badopt), std::invalid_argument);

    // Rejected before any iterations are performed.
    EXPECT_FALSE(observed);

    std::string msg;
    try {
        fkmeans::compute(records, centers, 2);
    } catch (std::invalid_argument& e) {
        msg = e.what();
    }
    EXPECT_TRUE(msg.find("initial centroids") != std::string::npos);
}

template<class Records_, typename = void>
struct accepts_records : std::false_type {};

template<class Records_>
struct accepts_records<Records_, std::void_t<decltype(
    fkmeans::compute(std::declval<Records_>(), std::declval<std::vector<fkmeans::Centroid<double> > >(), 2)
)> > : std::true_type {};

template<class Records_, typename = void>
struct accepts_records_with_refine : std::false_type {};

template<class Records_>
struct accepts_records_with_refine<Records_, std::void_t<decltype(
    fkmeans::compute(std::declval<Records_>(), std::declval<std::vector<fkmeans::Centroid<double> > >(), 2, std::declval<const fkmeans::RefineLloyd<>&>())
)> > : std::true_type {};

TEST(Compute, RejectsTemporaryRecords) {
    // The partition points into the records, so they must be owned by the caller.
    static_assert(accepts_records<const std::vector<fkmeans::Record<double> >&>::value);
    static_assert(accepts_records<std::vector<fkmeans::Record<double> >&>::value);
    static_assert(!accepts_records<std::vector<fkmeans::Record<double> > >::value);
    static_assert(!accepts_records<std::vector<fkmeans::Record<double> >&&>::value);

    static_assert(accepts_records_with_refine<const std::vector<fkmeans::Record<double> >&>::value);
    static_assert(!accepts_records_with_refine<std::vector<fkmeans::Record<double> > >::value);

    // A caller-owned vector is still usable after the call.
    auto records = TestCore::create_1d_records({ 6, 8, 18, 26, 13, 32, 24 });
    auto res = fkmeans::compute(records, TestCore::create_1d_centers({ 11, 20 }), 2);
    ASSERT_EQ(res.partition.size(), 2);
    ASSERT_EQ(res.partition[0].members.size(), 3);
    EXPECT_EQ(res.partition[0].members[0], &records[0]);
    EXPECT_TRUE(fkmeans::format_cluster(res.partition[1]).find("Record Identifiers: [18, 26, 32, 24]") != std::string::npos);
}

TEST(Compute, EmptyClusterRetention) {
    auto records = TestCore::create_1d_records({ 1, 2, 3, 4 });
    auto centers = TestCore::create_1d_centers({ 2, 100 });

    auto res = fkmeans::compute(records, centers, 2);
    EXPECT_EQ(res.details.status, 0);
    EXPECT_EQ(res.centroids[1], centers[1]);
    EXPECT_NEAR(res.centroids[0].coordinates.at("value"), 2.5, 1e-9);

    ASSERT_EQ(res.partition.size(), 2);
    EXPECT_EQ(res.partition[0].members.size(), 4);
    EXPECT_TRUE(res.partition[1].members.empty());
    EXPECT_EQ(res.details.sizes, std::vector<int>({ 4, 0 }));
}

TEST(Compute, SingleCluster) {
    auto records = TestCore::create_1d_records({ 1, 5, 9 });
    auto centers = TestCore::create_1d_centers({ 100 });

    auto res = fkmeans::compute(records, centers, 1);
    EXPECT_EQ(res.details.status, 0);
    EXPECT_NEAR(res.centroids[0].coordinates.at("value"), 5, 1e-9);
    EXPECT_EQ(res.clusters, std::vector<int>({ 0, 0, 0 }));
}

TEST(Compute, DuplicateCentroids) {
    auto records = TestCore::create_1d_records({ 1, 2, 10, 11 });
    auto centers = TestCore::create_1d_centers({ 5, 5 });

    // Ties go to the first centroid, so the second is never used, but it is still reported.
    auto res = fkmeans::compute(records, centers, 2);
    ASSERT_EQ(res.partition.size(), 2);
    EXPECT_EQ(res.partition[0].members.size(), 4);
    EXPECT_TRUE(res.partition[1].members.empty());
    EXPECT_EQ(res.centroids[1], centers[1]);
}

class ComputeTest : public TestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(ComputeTest, Properties) {
    auto ncenters = std::get<1>(GetParam());
    auto centers = create_centers(ncenters);

    auto res = fkmeans::compute(records, centers, ncenters);
    EXPECT_EQ(res.details.status, 0);

    // Exactly k clusters, with every record present exactly once.
    ASSERT_EQ(res.partition.size(), ncenters);
    std::vector<int> seen(nc);
    for (int cen = 0; cen < ncenters; ++cen) {
        const auto& clust = res.partition[cen];
        EXPECT_EQ(clust.centroid, res.centroids[cen]);
        EXPECT_EQ(clust.members.size(), res.details.sizes[cen]);
        for (auto rec : clust.members) {
            auto idx = rec - records.data();
            ASSERT_TRUE(idx >= 0 && idx < nc);
            ++seen[idx];
            EXPECT_EQ(res.clusters[idx], cen);
        }
    }
    EXPECT_EQ(seen, std::vector<int>(nc, 1));

    // Each non-empty centroid is the mean of its members.
    for (const auto& clust : res.partition) {
        if (clust.members.empty()) {
            continue;
        }
        for (int r = 0; r < nr; ++r) {
            auto name = feature_name(r);
            double total = 0;
            for (auto rec : clust.members) {
                total += rec->features.at(name);
            }
            EXPECT_NEAR(total / clust.members.size(), clust.centroid.coordinates.at(name), 1e-9);
        }
    }

    // Deterministic.
    auto again = fkmeans::compute(records, centers, ncenters);
    EXPECT_EQ(again.centroids, res.centroids);
    EXPECT_EQ(again.clusters, res.clusters);
    EXPECT_TRUE(again.partition == res.partition);

    // Fixed point.
    auto restarted = fkmeans::compute(records, res.centroids, ncenters);
    EXPECT_TRUE(restarted.partition == res.partition);
    EXPECT_EQ(restarted.details.iterations, 2);

    // Same results with multiple threads.
    fkmeans::RefineLloydOptions<double> popt;
    popt.num_threads = 3;
    auto parallel = fkmeans::compute(records, centers, ncenters, fkmeans::EuclideanDistance<double>(), popt);
    EXPECT_EQ(parallel.centroids, res.centroids);
    EXPECT_EQ(parallel.clusters, res.clusters);
}

INSTANTIATE_TEST_SUITE_P(
    Compute,
    ComputeTest,
    ::testing::Combine(
        ::testing::Combine(
            ::testing::Values(3, 8), // number of dimensions
            ::testing::Values(50, 500) // number of observations 
        ),
        ::testing::Values(2, 4, 9) // number of clusters 
    )
);

TEST(Compute, RefineObject) {
    auto records = TestCore::create_1d_records({ 6, 8, 18, 26, 13, 32, 24 });
    auto centers = TestCore::create_1d_centers({ 11, 20 });

    fkmeans::RefineLloyd<std::size_t, unsigned char, double, fkmeans::ManhattanDistance<double> > ll;
    ll.get_options().max_iterations = 50;
    auto res = fkmeans::compute(records, centers, static_cast<unsigned char>(2), ll);

    EXPECT_EQ(res.details.status, 0);
    EXPECT_EQ(res.details.sizes, std::vector<std::size_t>({ 3, 4 }));
    EXPECT_NEAR(res.centroids[0].coordinates.at("value"), 9, 1e-9);
    EXPECT_NEAR(res.centroids[1].coordinates.at("value"), 25, 1e-9);
}
