#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Exception.h>

#include <utility>

namespace Qi::Traffic {

// =============================================================================
// SectionBase
// =============================================================================

SectionBase::SectionBase(SectionId id, RelativeOffsets offsets, PluginData pluginData)
    : id_(std::move(id)),
      offsets_(std::move(offsets)),
      pluginData_(std::move(pluginData)) {}

const RelativeOffsetCoordinate& SectionBase::GetOffset(EventType type) const {
    auto it = offsets_.find(type);
    if (it == offsets_.end()) {
        throw ConfigurationException(
            "section '" + id_.Id() + "' has no relative offset for event type '" +
            Serialize(type) + "'");
    }
    return it->second;
}

void SectionBase::SetPluginValue(const std::string& key, const std::string& value) {
    pluginData_[key] = value;
}

bool SectionBase::RemovePluginValue(const std::string& key) {
    return pluginData_.erase(key) > 0;
}

// =============================================================================
// LineSection
// =============================================================================

LineSection::LineSection(SectionId id, RelativeOffsets offsets, PluginData pluginData,
                         Coordinate start, Coordinate end)
    : SectionBase(std::move(id), std::move(offsets), std::move(pluginData)),
      start_(start),
      end_(end) {
    if (start_ == end_) {
        throw InvalidArgumentException(
            "LineSection '" + Id().Id() +
            "': start and end point must be different to be a line, but are same");
    }
}

// =============================================================================
// Area
// =============================================================================

Area::Area(SectionId id, RelativeOffsets offsets, PluginData pluginData,
           std::vector<Coordinate> coordinates)
    : SectionBase(std::move(id), std::move(offsets), std::move(pluginData)),
      coordinates_(std::move(coordinates)) {
    if (coordinates_.size() < MIN_AREA_COORDINATES) {
        throw InvalidArgumentException(
            "Area '" + Id().Id() + "': number of coordinates must be >= 4, got " +
            std::to_string(coordinates_.size()));
    }
    if (coordinates_.front() != coordinates_.back()) {
        throw InvalidArgumentException(
            "Area '" + Id().Id() + "': coordinates do not define a closed area");
    }
}

// =============================================================================
// Section
// =============================================================================

const SectionBase& AsBase(const Section& section) {
    return std::visit([](const auto& s) -> const SectionBase& { return s; }, section);
}

SectionBase& AsBase(Section& section) {
    return std::visit([](auto& s) -> SectionBase& { return s; }, section);
}

std::vector<Coordinate> GetCoordinates(const Section& section) {
    return std::visit([](const auto& s) { return std::vector<Coordinate>(s.Coordinates()); },
                      section);
}

} // namespace Qi::Traffic
