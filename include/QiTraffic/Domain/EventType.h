#pragma once

/**
 * @file EventType.h
 * @brief Event type enumeration and its text form
 */

#include <QiTraffic/Core/Export.h>

#include <string>

namespace Qi::Traffic {

/**
 * @brief Kind of event produced by the detectors
 */
enum class EventType {
    SectionEnter,   ///< Track crosses a line or enters an area ("section-enter")
    SectionLeave,   ///< Track leaves an area ("section-leave")
    EnterScene,     ///< First detection of a track ("enter-scene")
    LeaveScene      ///< Last detection of a track ("leave-scene")
};

/// Text form used by event lists
QITRAFFIC_API const char* Serialize(EventType type);

/**
 * @brief Parse the text form of an event type
 * @throws InvalidArgumentException for unknown strings
 */
QITRAFFIC_API EventType ParseEventType(const std::string& text);

} // namespace Qi::Traffic
