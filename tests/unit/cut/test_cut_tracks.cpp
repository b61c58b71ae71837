/**
 * @file test_cut_tracks.cpp
 * @brief Unit tests for Cut/CutTracks.h
 */

#include <QiTraffic/Cut/CutTracks.h>
#include <QiTraffic/Core/Exception.h>
#include <gtest/gtest.h>

#include "TestData.h"

#include <string>
#include <vector>

namespace Qi::Traffic::Cut {
namespace {

class CutTracksTest : public ::testing::Test {
protected:
    CalculateTrackClassificationByMaxConfidence calculator;
    CutTrackSegmentBuilder builder{calculator};
    CutTracksWithSection cutTracks{builder};

    LineSection cuttingLine = TestData::MakeLine("#clicked_cut", {5, 0}, {5, 10});
};

// =============================================================================
// CutTrackSegmentBuilder
// =============================================================================

TEST_F(CutTracksTest, BuilderAssignsIdToDetections) {
    builder.AddId("4_2");
    builder.AddDetection(TestData::MakeDetection(0, 0, 0, "4"));
    builder.AddDetection(TestData::MakeDetection(1, 1, 1, "4"));

    Track track = builder.Build();

    EXPECT_EQ(track.Id().Id(), "4_2");
    for (const auto& detection : track.Detections()) {
        EXPECT_EQ(detection.GetTrackId().Id(), "4_2");
    }
    EXPECT_EQ(builder.DetectionCount(), 0u);
}

TEST_F(CutTracksTest, BuilderWithoutIdThrows) {
    builder.AddDetection(TestData::MakeDetection(0, 0, 0));
    builder.AddDetection(TestData::MakeDetection(1, 1, 1));

    EXPECT_THROW(builder.Build(), BuilderSetupException);
}

TEST_F(CutTracksTest, BuilderWithSingleDetectionThrows) {
    builder.AddId("1_1");
    builder.AddDetection(TestData::MakeDetection(0, 0, 0));

    EXPECT_THROW(builder.Build(), InsufficientDataException);
}

TEST_F(CutTracksTest, BuilderRejectsEmptyId) {
    EXPECT_THROW(builder.AddId(""), InvalidArgumentException);
}

// =============================================================================
// CutTracksWithSection
// =============================================================================

TEST_F(CutTracksTest, SingleCrossingYieldsTwoSubTracks) {
    Track track = TestData::MakeTrack("1", {{0, 5}, {4, 5}, {6, 5}, {10, 5}});

    std::vector<Track> segments = cutTracks.CutTrack(track, cuttingLine);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].Id().Id(), "1_1");
    EXPECT_EQ(segments[1].Id().Id(), "1_2");

    ASSERT_EQ(segments[0].Size(), 2u);
    ASSERT_EQ(segments[1].Size(), 2u);
    EXPECT_EQ(segments[0].FirstDetection().Frame(), 1);
    EXPECT_EQ(segments[0].LastDetection().Frame(), 2);
    EXPECT_EQ(segments[1].FirstDetection().Frame(), 3);
    EXPECT_EQ(segments[1].LastDetection().Frame(), 4);
}

TEST_F(CutTracksTest, TwoCrossingsYieldThreeSubTracks) {
    Track track = TestData::MakeTrack("9", {{0, 5}, {4, 5}, {6, 5}, {8, 6}, {4, 6}, {0, 6}});

    std::vector<Track> segments = cutTracks.CutTrack(track, cuttingLine);

    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[2].Id().Id(), "9_3");

    size_t total = 0;
    for (const auto& segment : segments) {
        total += segment.Size();
    }
    EXPECT_EQ(total, track.Size());
}

TEST_F(CutTracksTest, UncrossedTrackYieldsOneCopy) {
    Track track = TestData::MakeTrack("3", {{0, 5}, {1, 5}, {2, 5}});

    std::vector<Track> segments = cutTracks.CutTrack(track, cuttingLine);

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].Id().Id(), "3_1");
    EXPECT_EQ(segments[0].Size(), 3u);
}

TEST_F(CutTracksTest, SubTracksGetOwnClassification) {
    std::vector<Detection> detections{TestData::MakeDetection(0, 5, 0, "1", "car"),
                                      TestData::MakeDetection(4, 5, 1, "1", "car"),
                                      TestData::MakeDetection(6, 5, 2, "1", "bicyclist"),
                                      TestData::MakeDetection(10, 5, 3, "1", "bicyclist")};
    Track track(TrackId(std::string("1")), "car", detections);

    std::vector<Track> segments = cutTracks.CutTrack(track, cuttingLine);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].Classification(), "car");
    EXPECT_EQ(segments[1].Classification(), "bicyclist");
}

TEST_F(CutTracksTest, CrossingInLastSegmentThrows) {
    Track track = TestData::MakeTrack("1", {{0, 5}, {2, 5}, {4, 5}, {6, 5}});

    EXPECT_THROW(cutTracks.CutTrack(track, cuttingLine), InsufficientDataException);
}

TEST_F(CutTracksTest, CutsAllTracksInOrder) {
    std::vector<Track> tracks{TestData::MakeTrack("1", {{0, 5}, {4, 5}, {6, 5}, {10, 5}}),
                              TestData::MakeTrack("2", {{0, 1}, {1, 1}})};

    std::vector<Track> segments = cutTracks(tracks, cuttingLine);

    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].Id().Id(), "1_1");
    EXPECT_EQ(segments[1].Id().Id(), "1_2");
    EXPECT_EQ(segments[2].Id().Id(), "2_1");
}

// =============================================================================
// CutTracksIntersectingSection
// =============================================================================

class CutTracksIntersectingSectionTest : public CutTracksTest {
protected:
    void SetUp() override {
        sections.Add(TestData::MakeLine("N", {20, 0}, {20, 10}));
        sections.Add(cuttingLine);
        tracks.AddAll({TestData::MakeTrack("1", {{0, 5}, {4, 5}, {6, 5}, {10, 5}}),
                       TestData::MakeTrack("2", {{0, 1}, {1, 1}})});
    }

    SectionRepository sections;
    TrackRepository tracks;
};

TEST_F(CutTracksIntersectingSectionTest, ReplacesCutTracks) {
    CutTracksIntersectingSection cut(sections, tracks, cutTracks);
    std::vector<CutTracksDto> notifications;
    cut.RegisterObserver([&notifications](const CutTracksDto& dto) {
        notifications.push_back(dto);
    });

    CutTracksDto result = cut(cuttingLine);

    EXPECT_EQ(result.sectionName, "#clicked_cut");
    EXPECT_EQ(result.originalTrackIds, std::vector<TrackId>{TrackId(std::string("1"))});

    EXPECT_EQ(tracks.Size(), 3u);
    EXPECT_FALSE(tracks.GetFor(TrackId(std::string("1"))).has_value());
    EXPECT_TRUE(tracks.GetFor(TrackId(std::string("1_1"))).has_value());
    EXPECT_TRUE(tracks.GetFor(TrackId(std::string("1_2"))).has_value());
    EXPECT_TRUE(tracks.GetFor(TrackId(std::string("2"))).has_value());

    EXPECT_FALSE(sections.Contains(SectionId("#clicked_cut")));
    EXPECT_TRUE(sections.Contains(SectionId("N")));

    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].sectionName, "#clicked_cut");
}

TEST_F(CutTracksIntersectingSectionTest, SectionNotInRepository) {
    sections.Remove(SectionId("#clicked_cut"));
    CutTracksIntersectingSection cut(sections, tracks, cutTracks);

    CutTracksDto result = cut(cuttingLine);

    EXPECT_EQ(result.originalTrackIds.size(), 1u);
    EXPECT_EQ(sections.Size(), 1u);
}

TEST_F(CutTracksIntersectingSectionTest, FailedCutLeavesRepositoriesUnchanged) {
    tracks.Add(TestData::MakeTrack("3", {{0, 7}, {2, 7}, {6, 7}}));
    CutTracksIntersectingSection cut(sections, tracks, cutTracks);

    EXPECT_THROW(cut(cuttingLine), InsufficientDataException);

    EXPECT_EQ(tracks.Size(), 3u);
    EXPECT_TRUE(tracks.GetFor(TrackId(std::string("1"))).has_value());
    EXPECT_EQ(sections.Size(), 2u);
}

} // namespace
} // namespace Qi::Traffic::Cut
