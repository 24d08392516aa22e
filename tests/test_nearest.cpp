#include "testUtil.h"

#include <kdgraph.h>
#include <kdtree/nearest.h>

#include <gtest/gtest.h>
#include <nanoflann.hpp>

#include <cmath>
#include <functional>
#include <limits>
#include <random>
#include <vector>

using namespace kdg;

namespace {

// nanoflann view of a flat [N, 3] float buffer
struct CloudAdaptor {
    const std::vector<float> &data;

    inline std::size_t kdtree_get_point_count() const {
        return data.size() / 3;
    }

    inline float kdtree_get_pt(const std::size_t idx, const std::size_t dim) const {
        return data[ idx * 3 + dim ];
    }

    template <class BBOX> bool kdtree_get_bbox(BBOX & /*bb*/) const {
        return false;
    }
};

// recursive near-first descent, far side only when strictly closer than the best so far
template <typename T>
void recursiveNearest(const KDTree<T> &tree, uint32_t nodeIdx, const T *query, uint32_t &best,
                      T &bestDist2) {
    auto &node = tree.node(nodeIdx);
    if (node.isLeaf()) {
        for (auto i = node.start; i < node.end; i++) {
            auto dist2 = distance2(query, tree.point(i), tree.dimension());
            if (dist2 < bestDist2) {
                bestDist2 = dist2;
                best      = i;
            }
        }
        return;
    }

    T    diff   = query[ node.splitAxis ] - node.splitValue;
    bool isLeft = query[ node.splitAxis ] < node.splitValue;
    recursiveNearest(tree, isLeft ? node.left : node.right, query, best, bestDist2);
    if (diff * diff < bestDist2)
        recursiveNearest(tree, isLeft ? node.right : node.left, query, best, bestDist2);
}

using NanoTree =
    nanoflann::KDTreeSingleIndexAdaptor<nanoflann::L2_Simple_Adaptor<float, CloudAdaptor>,
                                        CloudAdaptor, 3, uint32_t>;

} // namespace

class NearestEdgesTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(test::RANDOM_SEED);
    }

    template <typename T>
    static void expectNearest(const Edges &edges, const std::vector<T> &source,
                              const std::vector<T> &target, int dimension) {
        ASSERT_EQ(edges.size(), source.size() / dimension);
        ASSERT_EQ(edges.source.size(), edges.target.size());
        for (std::size_t i = 0; i < edges.size(); i++) {
            EXPECT_EQ(edges.source[ i ], i);

            auto *query    = &source[ i * dimension ];
            auto  expected = test::bruteForceNearest(query, target, dimension);
            auto  dist2 =
                distance2(query, &target[ std::size_t(edges.target[ i ]) * dimension ], dimension);
            EXPECT_EQ(dist2, expected.second) << "source point " << i;
            EXPECT_EQ(edges.target[ i ], expected.first) << "source point " << i;
        }
    }

    static void expectCode(ErrorCode code, const std::function<void()> &func) {
        try {
            func();
            FAIL() << "expected " << errorCodeName(code);
        } catch (const Error &e) {
            EXPECT_EQ(e.code(), code) << e.what();
        }
    }

    std::mt19937 rng;
};

TEST_F(NearestEdgesTest, MatchesBruteForceFloat) {
    auto source = test::randomPoints<float>(rng, 100, 3);
    auto target = test::randomPoints<float>(rng, 100, 3);

    for (int leaf : {1, 3, 16, 200}) {
        auto edges = nearestEdges(Points(source, 3), Points(target, 3), BuildParam(leaf));
        expectNearest(edges, source, target, 3);
    }
}

TEST_F(NearestEdgesTest, MatchesBruteForceDouble) {
    auto source = test::randomPoints<double>(rng, 2000, 2, -10, 10);
    auto target = test::randomPoints<double>(rng, 5000, 2, -10, 10);

    Index index(Points(target, 2), BuildParam(16));
    auto  edges = index.nearestEdges(Points(source, 2));
    expectNearest(edges, source, target, 2);
}

TEST_F(NearestEdgesTest, QueriesFarOutside) {
    auto target = test::randomPoints<float>(rng, 500, 4);
    auto source = test::randomPoints<float>(rng, 50, 4, 20, 40);

    auto edges = nearestEdges(Points(source, 4), Points(target, 4), BuildParam(4));
    expectNearest(edges, source, target, 4);
}

TEST_F(NearestEdgesTest, SourceIndexIsPosition) {
    std::vector<float> source = {0, 0, 9, 9, 5, 5, 0, 0};
    std::vector<float> target = {10, 10, 0, 1, 6, 5};

    auto edges = nearestEdges(Points(source, 2), Points(target, 2), BuildParam(1));
    EXPECT_EQ(edges.source, (std::vector<uint32_t>{0, 1, 2, 3}));
    EXPECT_EQ(edges.target, (std::vector<uint32_t>{1, 0, 2, 1}));
}

TEST_F(NearestEdgesTest, DuplicateTargetsAreDeterministic) {
    std::vector<double> target = {1, 1, 1, 1, 1, 1, 5, 5};
    std::vector<double> source = {1, 1, 1.1, 0.9};

    Index index(Points(target, 2), BuildParam(1));
    auto  first = index.nearestEdges(Points(source, 2));
    for (int i = 0; i < 5; i++) {
        auto again = index.nearestEdges(Points(source, 2));
        EXPECT_EQ(again.target, first.target);
    }
    for (auto idx : first.target)
        EXPECT_LT(idx, 3u);
}

TEST_F(NearestEdgesTest, TieGoesToFirstVisitedPoint) {
    // identical points cannot be split, they share one leaf and the lowest position wins
    std::vector<float> same = {1, 1, 1, 1, 1, 1, 1, 1};
    KDTree<float>      leaf(same.data(), same.size(), 2, BuildParam(1));
    ASSERT_TRUE(leaf.root().isLeaf());

    float query[] = {1, 1};
    auto  match   = nearestSearch(leaf, query);
    EXPECT_EQ(match.position, 0u);
    EXPECT_EQ(match.distance2, 0.0f);

    auto edges = nearestEdges(leaf, query, 1);
    EXPECT_EQ(edges.target[ 0 ], leaf.order()[ 0 ]);

    // integer grid, every point twice; cell centres are equidistant to 8 points
    std::vector<float> grid;
    for (int copy = 0; copy < 2; copy++) {
        for (int x = 0; x < 5; x++) {
            for (int y = 0; y < 5; y++) {
                grid.push_back(float(x));
                grid.push_back(float(y));
            }
        }
    }
    std::vector<float> centres;
    for (int x = 0; x < 4; x++) {
        for (int y = 0; y < 4; y++) {
            centres.push_back(x + 0.5f);
            centres.push_back(y + 0.5f);
        }
    }

    for (int leafSize : {1, 3}) {
        KDTree<float> tree(grid.data(), grid.size(), 2, BuildParam(leafSize));
        auto          result = nearestEdges(tree, centres.data(), 16);
        for (uint32_t i = 0; i < 16; i++) {
            uint32_t expected  = INVALID_INDEX;
            float    bestDist2 = std::numeric_limits<float>::infinity();
            recursiveNearest(tree, 0, &centres[ i * 2 ], expected, bestDist2);

            auto found = nearestSearch(tree, &centres[ i * 2 ]);
            EXPECT_EQ(found.position, expected) << "centre " << i << " leaf size " << leafSize;
            EXPECT_EQ(found.distance2, 0.5f);
            EXPECT_EQ(result.target[ i ], tree.order()[ expected ]);
        }
    }
}

TEST_F(NearestEdgesTest, SingleTargetPoint) {
    auto               source = test::randomPoints<float>(rng, 64, 3);
    std::vector<float> target = {0.5f, 0.5f, 0.5f};

    auto edges = nearestEdges(Points(source, 3), Points(target, 3));
    EXPECT_EQ(edges.size(), 64u);
    for (auto idx : edges.target)
        EXPECT_EQ(idx, 0u);
}

TEST_F(NearestEdgesTest, SearchOnTree) {
    auto target = test::randomPoints<double>(rng, 1000, 3);
    auto query  = test::randomPoints<double>(rng, 1, 3);

    KDTree<double> tree(target.data(), target.size(), 3, BuildParam(8));
    auto           match    = nearestSearch(tree, query.data());
    auto           expected = test::bruteForceNearest(query.data(), target, 3);

    ASSERT_NE(match.position, INVALID_INDEX);
    EXPECT_EQ(tree.order()[ match.position ], expected.first);
    EXPECT_EQ(match.distance2, expected.second);

    KDTree<double> none;
    auto           nothing = nearestSearch(none, query.data());
    EXPECT_EQ(nothing.position, INVALID_INDEX);
    EXPECT_TRUE(std::isinf(nothing.distance2));
}

TEST_F(NearestEdgesTest, AgreesWithNanoflann) {
    auto source = test::randomPoints<float>(rng, 1000, 3, -2, 2);
    auto target = test::randomPoints<float>(rng, 3000, 3);

    CloudAdaptor cloud{target};
    NanoTree     reference(3, cloud, nanoflann::KDTreeSingleIndexAdaptorParams(10));
    reference.buildIndex();

    auto edges = nearestEdges(Points(source, 3), Points(target, 3), BuildParam(10));
    ASSERT_EQ(edges.size(), 1000u);
    for (std::size_t i = 0; i < 1000; i++) {
        uint32_t idx   = 0;
        float    dist2 = 0;
        reference.knnSearch(&source[ i * 3 ], 1, &idx, &dist2);

        EXPECT_EQ(edges.target[ i ], idx) << "source point " << i;
        EXPECT_FLOAT_EQ(distance2(&source[ i * 3 ], &target[ std::size_t(idx) * 3 ], 3), dist2);
    }
}

TEST_F(NearestEdgesTest, InvalidInput) {
    auto source = test::randomPoints<float>(rng, 10, 2);
    auto target = test::randomPoints<float>(rng, 10, 2);

    expectCode(ErrorCode::EmptyInput, [ & ] {
        (void)nearestEdges(Points(std::vector<float>{}, 2), Points(target, 2));
    });
    expectCode(ErrorCode::EmptyInput, [ & ] {
        (void)nearestEdges(Points(source, 2), Points(std::vector<float>{}, 2));
    });
    expectCode(ErrorCode::DimensionMismatch, [ & ] {
        (void)nearestEdges(Points(source, 2), Points(std::vector<float>(9, 0.0f), 3));
    });
    expectCode(ErrorCode::DTypeMismatch, [ & ] {
        (void)nearestEdges(Points(source, 2), Points(std::vector<double>(4, 0.0), 2));
    });
    expectCode(ErrorCode::InvalidArgument, [ & ] {
        (void)nearestEdges(Points(std::vector<float>(5, 0.0f), 2), Points(target, 2));
    });

    Index index(Points(target, 2));
    expectCode(ErrorCode::EmptyInput,
               [ & ] { (void)index.nearestEdges(Points(std::vector<float>{}, 2)); });
    expectCode(ErrorCode::DimensionMismatch,
               [ & ] { (void)index.nearestEdges(Points(std::vector<float>(3, 0.0f), 3)); });

    // no finite distance to any target point
    auto nan = std::numeric_limits<float>::quiet_NaN();
    expectCode(ErrorCode::InvalidArgument,
               [ & ] { (void)index.nearestEdges(Points(std::vector<float>{nan, 0.0f}, 2)); });

    Index none;
    expectCode(ErrorCode::InvalidArgument,
               [ & ] { (void)none.nearestEdges(Points(source, 2)); });
}
