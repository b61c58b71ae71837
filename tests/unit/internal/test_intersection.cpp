/**
 * @file test_intersection.cpp
 * @brief Unit tests for Internal/Intersection module
 */

#include <QiTraffic/Internal/Intersection.h>
#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Core/Constants.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace Qi::Traffic::Internal {
namespace {

// =============================================================================
// Segment-Segment Intersection Tests
// =============================================================================

class SegmentSegmentIntersectionTest : public ::testing::Test {};

TEST_F(SegmentSegmentIntersectionTest, CrossingSegments) {
    Segment2d seg1({0.0, 5.0}, {10.0, 5.0});
    Segment2d seg2({5.0, 0.0}, {5.0, 10.0});

    IntersectionResult result = IntersectSegmentSegment(seg1, seg2);

    ASSERT_TRUE(result.exists);
    EXPECT_NEAR(result.point.x, 5.0, 1e-10);
    EXPECT_NEAR(result.point.y, 5.0, 1e-10);
    EXPECT_NEAR(result.param1, 0.5, 1e-10);
    EXPECT_NEAR(result.param2, 0.5, 1e-10);
}

TEST_F(SegmentSegmentIntersectionTest, DisjointSegments) {
    Segment2d seg1({0.0, 0.0}, {4.0, 0.0});
    Segment2d seg2({5.0, -1.0}, {5.0, 1.0});

    EXPECT_FALSE(IntersectSegmentSegment(seg1, seg2).exists);
    EXPECT_FALSE(SegmentsIntersect(seg1, seg2));
}

TEST_F(SegmentSegmentIntersectionTest, TouchingEndpointCounts) {
    Segment2d seg1({0.0, 0.0}, {5.0, 0.0});
    Segment2d seg2({5.0, 0.0}, {5.0, 10.0});

    IntersectionResult result = IntersectSegmentSegment(seg1, seg2);

    ASSERT_TRUE(result.exists);
    EXPECT_NEAR(result.param1, 1.0, 1e-10);
    EXPECT_NEAR(result.param2, 0.0, 1e-10);
}

TEST_F(SegmentSegmentIntersectionTest, EndpointOnInteriorCounts) {
    Segment2d seg1({0.0, 0.0}, {5.0, 5.0});
    Segment2d seg2({5.0, 0.0}, {5.0, 10.0});

    EXPECT_TRUE(SegmentsIntersect(seg1, seg2));
}

TEST_F(SegmentSegmentIntersectionTest, ParallelSegmentsDoNotIntersect) {
    Segment2d seg1({0.0, 0.0}, {10.0, 0.0});
    Segment2d seg2({0.0, 1.0}, {10.0, 1.0});

    EXPECT_FALSE(SegmentsIntersect(seg1, seg2));
}

TEST_F(SegmentSegmentIntersectionTest, CollinearOverlapIntersects) {
    Segment2d seg1({0.0, 0.0}, {10.0, 0.0});
    Segment2d seg2({4.0, 0.0}, {20.0, 0.0});

    IntersectionResult result = IntersectSegmentSegment(seg1, seg2);

    ASSERT_TRUE(result.exists);
    EXPECT_NEAR(result.param1, 0.4, 1e-10);
}

TEST_F(SegmentSegmentIntersectionTest, CollinearDisjointDoesNotIntersect) {
    Segment2d seg1({0.0, 0.0}, {3.0, 0.0});
    Segment2d seg2({4.0, 0.0}, {8.0, 0.0});

    EXPECT_FALSE(SegmentsIntersect(seg1, seg2));
}

TEST_F(SegmentSegmentIntersectionTest, ZeroLengthSegmentOnOtherIntersects) {
    Segment2d point({5.0, 5.0}, {5.0, 5.0});
    Segment2d seg({5.0, 0.0}, {5.0, 10.0});

    EXPECT_TRUE(SegmentsIntersect(point, seg));
    EXPECT_TRUE(SegmentsIntersect(seg, point));
}

TEST_F(SegmentSegmentIntersectionTest, ZeroLengthSegmentOnCarrierLineOnly) {
    // On the carrier line of seg but beyond its end
    Segment2d point({5.0, 15.0}, {5.0, 15.0});
    Segment2d seg({5.0, 0.0}, {5.0, 10.0});

    EXPECT_FALSE(SegmentsIntersect(point, seg));
}

// =============================================================================
// Intersection Parameter Tests
// =============================================================================

TEST(SegmentIntersectionParamsTest, CrossingGivesOneParam) {
    std::vector<double> params = SegmentIntersectionParams(
        Segment2d({0.0, 0.0}, {10.0, 0.0}), Segment2d({2.5, -1.0}, {2.5, 1.0}));

    ASSERT_EQ(params.size(), 1u);
    EXPECT_NEAR(params[0], 0.25, 1e-10);
}

TEST(SegmentIntersectionParamsTest, OverlapGivesBothEnds) {
    std::vector<double> params = SegmentIntersectionParams(
        Segment2d({0.0, 0.0}, {10.0, 0.0}), Segment2d({8.0, 0.0}, {2.0, 0.0}));

    ASSERT_EQ(params.size(), 2u);
    EXPECT_NEAR(params[0], 0.2, 1e-10);
    EXPECT_NEAR(params[1], 0.8, 1e-10);
}

TEST(SegmentIntersectionParamsTest, DisjointGivesNone) {
    EXPECT_TRUE(SegmentIntersectionParams(
        Segment2d({0.0, 0.0}, {1.0, 0.0}), Segment2d({2.0, 0.0}, {2.0, 1.0})).empty());
}

// =============================================================================
// Polyline Intersection Tests
// =============================================================================

TEST(PolylinesIntersectTest, CrossingInLaterSegment) {
    std::vector<Coordinate> track{{0, 0}, {2, 0}, {2, 2}, {8, 2}};
    std::vector<Coordinate> line{{5, 0}, {5, 10}};

    EXPECT_TRUE(PolylinesIntersect(track, line));
}

TEST(PolylinesIntersectTest, BoundingBoxRejection) {
    std::vector<Coordinate> track{{0, 0}, {1, 1}};
    std::vector<Coordinate> line{{5, 5}, {6, 6}};

    EXPECT_FALSE(PolylinesIntersect(track, line));
}

TEST(PolylinesIntersectTest, BoxesOverlapButNoContact) {
    std::vector<Coordinate> track{{0, 0}, {10, 10}};
    std::vector<Coordinate> line{{6, 0}, {10, 4}};

    EXPECT_FALSE(PolylinesIntersect(track, line));
}

TEST(PolylinesIntersectTest, EmptyPolylineNeverIntersects) {
    EXPECT_FALSE(PolylinesIntersect({}, {{0, 0}, {1, 1}}));
}

} // namespace
} // namespace Qi::Traffic::Internal
