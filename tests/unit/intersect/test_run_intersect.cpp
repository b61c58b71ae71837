/**
 * @file test_run_intersect.cpp
 * @brief Unit tests for Intersect/RunIntersect.h
 */

#include <QiTraffic/Intersect/RunIntersect.h>
#include <QiTraffic/Core/Exception.h>
#include <QiTraffic/Platform/Log.h>
#include <gtest/gtest.h>

#include "TestData.h"

#include <algorithm>
#include <string>
#include <vector>

namespace Qi::Traffic::Intersect {
namespace {

size_t CountType(const std::vector<Event>& events, EventType type) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [type](const Event& e) { return e.Type() == type; }));
}

class RunIntersectTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel_ = Platform::GetLogLevel();
        params.logLevel = Platform::LogLevel::Warning;
    }

    void TearDown() override {
        Platform::SetLogLevel(savedLevel_);
    }

    AnalysisParams params;

private:
    Platform::LogLevel savedLevel_ = Platform::LogLevel::Info;
};

// =============================================================================
// IntersectTrack / RunIntersect
// =============================================================================

TEST_F(RunIntersectTest, IntersectTrackDispatchesPerSectionKind) {
    std::vector<Section> sections{TestData::MakeLine("N", {5, 0}, {5, 10}),
                                  TestData::MakeArea("A", {{20, 0}, {20, 10}, {30, 10}, {30, 0}, {20, 0}})};
    Track track = TestData::MakeTrack("1", {{0, 5}, {10, 5}, {25, 5}, {40, 5}});

    std::vector<Event> events = IntersectTrack(track, sections);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].GetSectionId()->Id(), "N");
    EXPECT_EQ(events[1].GetSectionId()->Id(), "A");
    EXPECT_EQ(events[1].Type(), EventType::SectionEnter);
    EXPECT_EQ(events[2].Type(), EventType::SectionLeave);
}

TEST_F(RunIntersectTest, IntersectTrackLineStrategy) {
    std::vector<Section> sections{TestData::MakeLine("N", {5, 0}, {5, 10})};
    Track track = TestData::MakeTrack("1", {{0, 5}, {5, 5}, {10, 5}});

    EXPECT_EQ(IntersectTrack(track, sections, LineIntersectionStrategy::SmallestSegments).size(), 2u);
    EXPECT_EQ(IntersectTrack(track, sections, LineIntersectionStrategy::SplittingLine).size(), 1u);
}

TEST_F(RunIntersectTest, RunIntersectOverTracks) {
    std::vector<Section> sections{TestData::MakeLine("N", {5, 0}, {5, 10})};
    std::vector<Track> tracks{TestData::MakeTrack("1", {{0, 5}, {10, 5}}),
                              TestData::MakeTrack("2", {{0, 6}, {10, 6}}),
                              TestData::MakeTrack("3", {{0, 20}, {10, 20}})};

    SequentialIntersectParallelization sequential;
    std::vector<Event> events =
        RunIntersect(sequential, LineIntersectionStrategy::SmallestSegments)(tracks, sections);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].RoadUserId(), "1");
    EXPECT_EQ(events[1].RoadUserId(), "2");
}

// =============================================================================
// CreateEvents
// =============================================================================

TEST_F(RunIntersectTest, CreateEventsPublishesOneBatch) {
    SectionRepository sections;
    TrackRepository tracks;
    EventRepository events;

    sections.Add(TestData::MakeLine("N", {5, 0}, {5, 10}));
    tracks.AddAll({TestData::MakeTrack("1", {{0, 5}, {10, 5}}),
                   TestData::MakeTrack("2", {{0, 20}, {10, 20}})});

    std::vector<EventRepositoryEvent> notifications;
    events.RegisterObserver([&notifications](const EventRepositoryEvent& e) {
        notifications.push_back(e);
    });

    CreateEvents(sections, tracks, events, params)();

    // One section event plus enter/leave scene for both tracks
    EXPECT_EQ(events.Size(), 5u);
    EXPECT_EQ(CountType(events.GetAll(), EventType::SectionEnter), 1u);
    EXPECT_EQ(CountType(events.GetAll(), EventType::EnterScene), 2u);
    EXPECT_EQ(CountType(events.GetAll(), EventType::LeaveScene), 2u);

    ASSERT_EQ(notifications.size(), 2u);
    EXPECT_TRUE(notifications[0].added.empty());
    EXPECT_EQ(notifications[1].added.size(), 5u);
}

TEST_F(RunIntersectTest, CreateEventsReplacesPreviousEvents) {
    SectionRepository sections;
    TrackRepository tracks;
    EventRepository events;

    sections.Add(TestData::MakeLine("N", {5, 0}, {5, 10}));
    tracks.Add(TestData::MakeTrack("1", {{0, 5}, {10, 5}}));

    CreateEvents create(sections, tracks, events, params);
    create();
    create();

    EXPECT_EQ(events.Size(), 3u);
}

TEST_F(RunIntersectTest, CreateEventsSequentialMatchesParallel) {
    SectionRepository sections;
    TrackRepository tracks;
    sections.AddAll({TestData::MakeLine("N", {5, 0}, {5, 100}), TestData::MakeSquareArea("A")});
    for (int i = 1; i <= 20; ++i) {
        tracks.Add(TestData::MakeTrack(std::to_string(i),
                                   {{0, static_cast<double>(i)}, {8, static_cast<double>(i)},
                                    {16, static_cast<double>(i)}}));
    }

    EventRepository parallelEvents;
    EventRepository sequentialEvents;
    AnalysisParams sequentialParams = params;
    sequentialParams.parallel = false;

    CreateEvents(sections, tracks, parallelEvents, params)();
    CreateEvents(sections, tracks, sequentialEvents, sequentialParams)();

    EXPECT_EQ(parallelEvents.Size(), sequentialEvents.Size());
    EXPECT_EQ(CountType(parallelEvents.GetAll(), EventType::SectionEnter),
              CountType(sequentialEvents.GetAll(), EventType::SectionEnter));
    EXPECT_EQ(CountType(parallelEvents.GetAll(), EventType::SectionLeave),
              CountType(sequentialEvents.GetAll(), EventType::SectionLeave));
}

TEST_F(RunIntersectTest, CreateEventsFailureLeavesRepositoryUntouched) {
    SectionRepository sections;
    TrackRepository tracks;
    EventRepository events;

    sections.Add(LineSection(SectionId("N"), {}, {}, {5, 0}, {5, 10}));
    tracks.Add(TestData::MakeTrack("1", {{0, 5}, {10, 5}}));
    events.Add(Event("9", "car", "myhostname", TestData::Epoch(), 1, std::nullopt,
                     Coordinate(0, 0), EventType::EnterScene, DirectionVector2d(1, 0),
                     TestData::VIDEO_NAME));

    EXPECT_THROW(CreateEvents(sections, tracks, events, params)(), ConfigurationException);
    EXPECT_EQ(events.Size(), 1u);
}

TEST_F(RunIntersectTest, CreateEventsRejectsInvalidParams) {
    SectionRepository sections;
    TrackRepository tracks;
    EventRepository events;

    params.numWorkers = 0;
    EXPECT_THROW(CreateEvents(sections, tracks, events, params), InvalidArgumentException);
}

TEST_F(RunIntersectTest, CreateEventsAppliesLogLevel) {
    SectionRepository sections;
    TrackRepository tracks;
    EventRepository events;

    params.logLevel = Platform::LogLevel::Error;
    CreateEvents create(sections, tracks, events, params);

    EXPECT_EQ(Platform::GetLogLevel(), Platform::LogLevel::Error);
}

// =============================================================================
// TracksIntersectingSections
// =============================================================================

TEST_F(RunIntersectTest, TracksIntersectingSections) {
    TrackRepository tracks;
    tracks.AddAll({TestData::MakeTrack("1", {{0, 5}, {10, 5}}),
                   TestData::MakeTrack("2", {{0, 20}, {10, 20}}),
                   TestData::MakeTrack("3", {{2, 2}, {3, 3}})});

    std::vector<Section> sections{TestData::MakeLine("N", {5, 0}, {5, 10}),
                                  TestData::MakeSquareArea("A")};

    std::set<TrackId> ids = TracksIntersectingSections(tracks)(sections);

    // Track 3 lies inside the area without touching its ring
    EXPECT_EQ(ids, std::set<TrackId>{TrackId(std::string("1"))});
}

TEST_F(RunIntersectTest, TracksIntersectingSectionsEmpty) {
    TrackRepository tracks;
    EXPECT_TRUE(TracksIntersectingSections(tracks)({TestData::MakeSquareArea("A")}).empty());
}

} // namespace
} // namespace Qi::Traffic::Intersect
