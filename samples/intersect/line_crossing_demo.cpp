/**
 * @file line_crossing_demo.cpp
 * @brief Event creation and track cutting on synthetic traffic
 *
 * Workflow:
 * 1) Generate straight tracks crossing a counting line and a zone
 * 2) Create section and scene events
 * 3) Cut the tracks with a second line and create events again
 *
 * Usage: line_crossing_demo [num_tracks] [num_workers]
 */

#include <QiTraffic/QiTraffic.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace Qi::Traffic;
using namespace Qi::Traffic::Intersect;

namespace {

const char* VIDEO = "demo-cam_2023-05-24_08-00-00.mp4";

Track MakeStraightTrack(int id, double y, double speed, const std::string& classification) {
    const Timestamp start(std::chrono::seconds(1684915200));
    std::vector<Detection> detections;
    for (int frame = 1; frame <= 40; ++frame) {
        double x = 2.5 + speed * (frame - 1);
        detections.emplace_back(classification, 0.8, x, y, 4.0, 2.0, frame,
                                start + std::chrono::milliseconds(40 * frame),
                                "demo-cam_2023-05-24_08-00-00.ottrk", false,
                                TrackId(id), VIDEO);
    }
    return Track(TrackId(id), classification, detections);
}

void PrintSummary(const EventRepository& events) {
    std::map<std::string, size_t> counts;
    for (const auto& event : events.GetAll()) {
        std::string key = Serialize(event.Type());
        if (event.GetSectionId()) {
            key += " @ " + event.GetSectionId()->Id();
        }
        ++counts[key];
    }
    for (const auto& entry : counts) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    int numTracks = argc > 1 ? std::atoi(argv[1]) : 200;
    AnalysisParams params;
    if (argc > 2) {
        params.numWorkers = std::atoi(argv[2]);
    }

    std::cout << "=== QiTraffic " << GetVersion() << " Line Crossing Demo ===\n";

    try {
        RelativeOffsets bottomCenter{
            {EventType::SectionEnter, RelativeOffsetCoordinate(0.5, 1.0)},
            {EventType::SectionLeave, RelativeOffsetCoordinate(0.5, 1.0)}};

        SectionRepository sections;
        TrackRepository tracks;
        EventRepository events;

        sections.Add(LineSection(SectionId("counting-line"), bottomCenter, {},
                                 Coordinate(100, 0), Coordinate(100, 2000)));
        sections.Add(Area(SectionId("zone"), bottomCenter, {},
                          {{150, 0}, {150, 2000}, {200, 2000}, {200, 0}, {150, 0}}));

        std::vector<Track> generated;
        for (int i = 1; i <= numTracks; ++i) {
            double speed = 2.0 + (i % 7);
            generated.push_back(MakeStraightTrack(i, 5.0 * i, speed,
                                                  i % 3 == 0 ? "bicyclist" : "car"));
        }
        tracks.AddAll(generated);

        ClearAllEvents clearOnChange(events);
        tracks.RegisterTracksObserver([&clearOnChange](const TrackRepositoryEvent& e) {
            clearOnChange.OnTracksChanged(e);
        });

        CreateEvents createEvents(sections, tracks, events, params);
        createEvents();
        std::cout << "Events before cutting (" << events.Size() << "):\n";
        PrintSummary(events);

        // Cut with a line left of the counting line
        CalculateTrackClassificationByMaxConfidence calculator;
        Cut::CutTrackSegmentBuilder builder(calculator);
        Cut::CutTracksWithSection cutWithSection(builder);
        Cut::CutTracksIntersectingSection cutTracks(sections, tracks, cutWithSection);

        LineSection cuttingLine(SectionId("#cut"), bottomCenter, {},
                                Coordinate(60, 0), Coordinate(60, 2000));
        CutTracksDto result = cutTracks(cuttingLine);
        std::cout << "Cut " << result.originalTrackIds.size() << " tracks, repository now holds "
                  << tracks.Size() << " tracks\n";

        createEvents();
        std::cout << "Events after cutting (" << events.Size() << "):\n";
        PrintSummary(events);
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
