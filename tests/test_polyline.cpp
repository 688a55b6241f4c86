#include <gtest/gtest.h>
#include <geometry/polyline.hpp>

using namespace geomill;

// ============================================
// Chaining Tests
// ============================================

TEST(ChainEdgesTest, OpenPath) {
    // 0-1-2-3 given out of order
    std::vector<uint32_t> edges{2, 3, 0, 1, 1, 2};
    auto chains = chain_edges(edges, 4);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(chains[0], (Chain{0, 1, 2, 3}));
    EXPECT_FALSE(is_closed(chains[0]));
}

TEST(ChainEdgesTest, ClosedLoop) {
    std::vector<uint32_t> edges{0, 1, 1, 2, 2, 3, 3, 0};
    auto chains = chain_edges(edges, 4);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_TRUE(is_closed(chains[0]));
    EXPECT_EQ(chains[0].size(), 5u);
}

TEST(ChainEdgesTest, JunctionSplitsChains) {
    // Star: center 0 with three arms
    std::vector<uint32_t> edges{0, 1, 0, 2, 0, 3};
    auto chains = chain_edges(edges, 4);
    EXPECT_EQ(chains.size(), 3u);
    for (const auto& chain : chains) {
        EXPECT_EQ(chain.size(), 2u);
    }
}

TEST(ChainEdgesTest, IgnoresDegenerateEdges) {
    std::vector<uint32_t> edges{0, 0, 0, 1};
    auto chains = chain_edges(edges, 2);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(chains[0], (Chain{0, 1}));
}

// ============================================
// Ramer-Douglas-Peucker Tests
// ============================================

TEST(SimplifyRdpTest, DropsCollinearPoints) {
    std::vector<Vec3> points{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}, {3, 0, 0}};
    EXPECT_EQ(simplify_rdp(points, 0.01, false), (std::vector<size_t>{0, 3}));
}

TEST(SimplifyRdpTest, KeepsCorner) {
    std::vector<Vec3> points{{0, 0, 0}, {1, 0.01f, 0}, {2, 0, 0}, {2, 2, 0}};
    EXPECT_EQ(simplify_rdp(points, 0.1, false), (std::vector<size_t>{0, 2, 3}));
}

TEST(SimplifyRdpTest, PlanarIgnoresHeight) {
    std::vector<Vec3> points{{0, 0, 0}, {1, 0, 5}, {2, 0, 0}};
    EXPECT_EQ(simplify_rdp(points, 0.1, false).size(), 2u);
    EXPECT_EQ(simplify_rdp(points, 0.1, true).size(), 3u);
}

TEST(SimplifyRdpTest, ShortInputUntouched) {
    std::vector<Vec2> points{{0, 0}, {1, 1}};
    EXPECT_EQ(simplify_rdp(points, 10.0), (std::vector<size_t>{0, 1}));
}

// ============================================
// Convex Hull Tests
// ============================================

TEST(ConvexHullTest, SquareWithInteriorPoint) {
    std::vector<Vec3> points{{0.5f, 0.5f, 0}, {1, 1, 0}, {0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
    auto hull = convex_hull_xy(points);
    // Counter-clockwise from the lowest-left point
    EXPECT_EQ(hull, (std::vector<size_t>{2, 3, 1, 4}));
}

TEST(ConvexHullTest, CollinearPointsDropped) {
    std::vector<Vec3> points{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}, {1, 1, 0}};
    EXPECT_EQ(convex_hull_xy(points).size(), 3u);
}

TEST(ConvexHullTest, AllCollinear) {
    std::vector<Vec3> points{{0, 0, 0}, {1, 1, 0}, {2, 2, 0}};
    EXPECT_LT(convex_hull_xy(points).size(), 3u);
}

// ============================================
// Outline and Subdivision Tests
// ============================================

TEST(OutlineEdgesTest, SharedEdgeIsDropped) {
    std::vector<uint32_t> triangles{0, 1, 2, 0, 2, 3};
    std::vector<uint32_t> expected{0, 1, 1, 2, 2, 3, 3, 0};
    EXPECT_EQ(outline_edges(triangles), expected);
}

TEST(OutlineEdgesTest, OppositeWindingStillCountsAsShared) {
    std::vector<uint32_t> triangles{0, 1, 2, 2, 1, 3};
    std::vector<uint32_t> expected{0, 1, 2, 0, 1, 3, 3, 2};
    EXPECT_EQ(outline_edges(triangles), expected);
}

TEST(SegmentPiecesTest, CeilsToMaximumLength) {
    EXPECT_EQ(segment_pieces(1.0, 0.25), 4u);
    EXPECT_EQ(segment_pieces(1.0, 0.3), 4u);
    EXPECT_EQ(segment_pieces(0.2, 0.25), 1u);
    EXPECT_EQ(segment_pieces(0.0, 0.25), 1u);
}

// ============================================
// Planar Helper Tests
// ============================================

TEST(InsideRingsTest, EvenOdd) {
    std::vector<Vec2> outer{{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    std::vector<Vec2> hole{{4, 4}, {6, 4}, {6, 6}, {4, 6}};
    EXPECT_TRUE(inside_rings({2, 2}, {outer, hole}));
    EXPECT_FALSE(inside_rings({5, 5}, {outer, hole}));
    EXPECT_FALSE(inside_rings({12, 5}, {outer, hole}));
}

TEST(DistanceToSegmentTest, ClampsToEnds) {
    EXPECT_DOUBLE_EQ(distance_to_segment({0.5, 1.0}, {0, 0}, {1, 0}), 1.0);
    EXPECT_DOUBLE_EQ(distance_to_segment({3.0, 4.0}, {0, 0}, {0, 0}), 5.0);
    EXPECT_DOUBLE_EQ(distance_to_segment({4.0, 4.0}, {0, 0}, {1, 0}), 5.0);
}
