#pragma once

/**
 * @file QiTraffic.h
 * @brief Main header file for QiTraffic library
 *
 * QiTraffic derives directional crossing events from road user tracks and
 * user-defined line and area sections, and cuts tracks at cutting sections.
 *
 * @author QiTraffic Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <QiTraffic/QiTrafficConfig.h>
#include <QiTraffic/Core/Export.h>

// Core types and utilities
#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Exception.h>

// Geometry
#include <QiTraffic/Geometry/Geometry.h>

// Domain model
#include <QiTraffic/Domain/Track.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/EventType.h>
#include <QiTraffic/Domain/Event.h>

// Repositories
#include <QiTraffic/Repository/TrackRepository.h>
#include <QiTraffic/Repository/SectionRepository.h>
#include <QiTraffic/Repository/EventRepository.h>

// Platform abstraction
#include <QiTraffic/Platform/Log.h>
#include <QiTraffic/Platform/Thread.h>
#include <QiTraffic/Platform/Timer.h>

// Feature modules
#include <QiTraffic/Intersect/AnalysisParams.h>
#include <QiTraffic/Intersect/Intersector.h>
#include <QiTraffic/Intersect/ActionDetector.h>
#include <QiTraffic/Intersect/Parallelization.h>
#include <QiTraffic/Intersect/RunIntersect.h>
#include <QiTraffic/Cut/CutTracks.h>

namespace Qi::Traffic {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return QITRAFFIC_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = QITRAFFIC_VERSION_MAJOR;
    minor = QITRAFFIC_VERSION_MINOR;
    patch = QITRAFFIC_VERSION_PATCH;
}

} // namespace Qi::Traffic
