#include "testUtil.h"

#include <edges.h>
#include <kdgraph.h>

#include <gtest/gtest.h>

#include <random>
#include <vector>

using namespace kdg;

TEST(EdgesTest, UnionAndSort) {
    Edges first({0, 1, 0}, {1, 2, 2});
    Edges second({0, 2}, {1, 3});

    auto edges = unionEdges({first, second});
    // first seen order
    EXPECT_EQ(edges.source, (std::vector<uint32_t>{0, 1, 0, 2}));
    EXPECT_EQ(edges.target, (std::vector<uint32_t>{1, 2, 2, 3}));

    sortEdgesBySource(edges);
    EXPECT_EQ(edges.source, (std::vector<uint32_t>{0, 0, 1, 2}));
    EXPECT_EQ(edges.target, (std::vector<uint32_t>{1, 2, 2, 3}));
}

TEST(EdgesTest, UnionRemovesDuplicatesWithinOneList) {
    Edges edges({3, 3, 1, 3}, {4, 4, 0, 4});

    auto result = unionEdges({edges});
    EXPECT_EQ(result.source, (std::vector<uint32_t>{3, 1}));
    EXPECT_EQ(result.target, (std::vector<uint32_t>{4, 0}));
}

TEST(EdgesTest, UnionKeepsDirection) {
    Edges edges({1, 2}, {2, 1});

    auto result = unionEdges({edges});
    EXPECT_EQ(result.size(), 2u);
}

TEST(EdgesTest, UnionWithEmptyLists) {
    Edges edges({5}, {6});

    auto result = unionEdges({Edges(), edges, Edges()});
    EXPECT_EQ(result.source, (std::vector<uint32_t>{5}));
    EXPECT_EQ(result.target, (std::vector<uint32_t>{6}));

    EXPECT_TRUE(unionEdges({Edges()}).empty());
}

TEST(EdgesTest, UnionInvalidInput) {
    try {
        (void)unionEdges({});
        FAIL() << "empty list accepted";
    } catch (const Error &e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }

    Edges broken;
    broken.source = {0, 1};
    broken.target = {0};
    EXPECT_THROW((void)unionEdges({broken}), Error);
    EXPECT_THROW(checkEdges(broken), Error);
    EXPECT_NO_THROW(checkEdges(Edges({0, 1}, {1, 0})));
}

TEST(EdgesTest, SortUsesFullIndexRange) {
    Edges edges({0x80000000u, 1, 0x80000000u, 0, 0xfffffffeu}, {1, 0x90000000u, 0, 7, 2});

    sortEdgesBySource(edges);
    EXPECT_EQ(edges.source, (std::vector<uint32_t>{0, 1, 0x80000000u, 0x80000000u, 0xfffffffeu}));
    EXPECT_EQ(edges.target, (std::vector<uint32_t>{7, 0x90000000u, 0, 1, 2}));

    Edges none;
    sortEdgesBySource(none);
    EXPECT_TRUE(none.empty());
}

TEST(EdgesTest, AppendAndPushBack) {
    Edges edges;
    edges.push_back(1, 2);
    edges.append(Edges({3, 4}, {5, 6}));

    EXPECT_EQ(edges.size(), 3u);
    EXPECT_EQ(edges.source, (std::vector<uint32_t>{1, 3, 4}));
    EXPECT_EQ(edges.target, (std::vector<uint32_t>{2, 5, 6}));
}

TEST(EdgesTest, GraphFromBothQueries) {
    std::mt19937 rng(test::RANDOM_SEED);
    auto         source = test::randomPoints<float>(rng, 300, 3);
    auto         target = test::randomPoints<float>(rng, 200, 3);

    auto radius  = radiusEdges(Points(source, 3), Points(target, 3), 0.3, BuildParam(8));
    auto nearest = nearestEdges(Points(source, 3), Points(target, 3), BuildParam(8));

    auto graph = unionEdges({radius, nearest});
    sortEdgesBySource(graph);

    auto pairs = test::toPairs(graph);
    EXPECT_EQ(pairs.size(), graph.size());
    for (std::size_t i = 1; i < graph.size(); i++) {
        EXPECT_TRUE(graph.source[ i - 1 ] < graph.source[ i ] ||
                    (graph.source[ i - 1 ] == graph.source[ i ] &&
                     graph.target[ i - 1 ] < graph.target[ i ]));
    }

    // every input pair survives
    for (auto &pair : test::toPairs(radius))
        EXPECT_EQ(pairs.count(pair), 1u);
    for (auto &pair : test::toPairs(nearest))
        EXPECT_EQ(pairs.count(pair), 1u);
    EXPECT_LE(graph.size(), radius.size() + nearest.size());
    EXPECT_GE(graph.size(), std::max(radius.size(), nearest.size()));
}
