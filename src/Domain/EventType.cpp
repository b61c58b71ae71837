#include <QiTraffic/Domain/EventType.h>
#include <QiTraffic/Core/Exception.h>

namespace Qi::Traffic {

const char* Serialize(EventType type) {
    switch (type) {
        case EventType::SectionEnter: return "section-enter";
        case EventType::SectionLeave: return "section-leave";
        case EventType::EnterScene:   return "enter-scene";
        case EventType::LeaveScene:   return "leave-scene";
    }
    return "unknown";
}

EventType ParseEventType(const std::string& text) {
    for (EventType type : {EventType::SectionEnter, EventType::SectionLeave,
                           EventType::EnterScene, EventType::LeaveScene}) {
        if (text == Serialize(type)) {
            return type;
        }
    }
    throw InvalidArgumentException("ParseEventType: unknown event type '" + text + "'");
}

} // namespace Qi::Traffic
