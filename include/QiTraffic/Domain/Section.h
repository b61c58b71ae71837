#pragma once

/**
 * @file Section.h
 * @brief Section geometries that tracks are tested against
 *
 * A Section is a closed set of variants (line or area). Code that needs to
 * treat the variants differently uses std::visit so that adding a variant
 * is checked by the compiler at every dispatch site.
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Domain/EventType.h>

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Qi::Traffic {

// =============================================================================
// SectionId
// =============================================================================

class QITRAFFIC_API SectionId {
public:
    explicit SectionId(std::string id) : id_(std::move(id)) {}

    const std::string& Id() const { return id_; }

    bool operator==(const SectionId& other) const { return id_ == other.id_; }
    bool operator!=(const SectionId& other) const { return id_ != other.id_; }
    bool operator<(const SectionId& other) const { return id_ < other.id_; }

private:
    std::string id_;
};

/// Offset used to sample detections, per event type
using RelativeOffsets = std::map<EventType, RelativeOffsetCoordinate>;

/// Opaque data attached by plugins; not interpreted by the engine
using PluginData = std::map<std::string, std::string>;

// =============================================================================
// SectionBase
// =============================================================================

/**
 * @brief Attributes shared by all section variants
 */
class QITRAFFIC_API SectionBase {
public:
    const SectionId& Id() const { return id_; }
    const RelativeOffsets& Offsets() const { return offsets_; }
    const PluginData& GetPluginData() const { return pluginData_; }

    bool HasOffset(EventType type) const { return offsets_.count(type) > 0; }

    /**
     * @brief Offset configured for an event type
     * @throws ConfigurationException if the section has no offset for the type
     */
    const RelativeOffsetCoordinate& GetOffset(EventType type) const;

    /// Set or replace a plugin value
    void SetPluginValue(const std::string& key, const std::string& value);

    /// Remove a plugin value; returns false if the key was absent
    bool RemovePluginValue(const std::string& key);

protected:
    SectionBase(SectionId id, RelativeOffsets offsets, PluginData pluginData);

    bool SameAttributes(const SectionBase& other) const {
        return id_ == other.id_ && offsets_ == other.offsets_ &&
               pluginData_ == other.pluginData_;
    }

private:
    SectionId id_;
    RelativeOffsets offsets_;
    PluginData pluginData_;
};

// =============================================================================
// LineSection
// =============================================================================

/**
 * @brief Section defined by a line between two distinct coordinates
 */
class QITRAFFIC_API LineSection : public SectionBase {
public:
    /// @throws InvalidArgumentException if start == end
    LineSection(SectionId id, RelativeOffsets offsets, PluginData pluginData,
                Coordinate start, Coordinate end);

    const Coordinate& Start() const { return start_; }
    const Coordinate& End() const { return end_; }

    std::vector<Coordinate> Coordinates() const { return {start_, end_}; }

    bool operator==(const LineSection& other) const {
        return SameAttributes(other) && start_ == other.start_ && end_ == other.end_;
    }

private:
    Coordinate start_;
    Coordinate end_;
};

// =============================================================================
// Area
// =============================================================================

/**
 * @brief Section defined by a closed polygon [p1, p2, ..., pn] with p1 == pn
 */
class QITRAFFIC_API Area : public SectionBase {
public:
    /**
     * @throws InvalidArgumentException if fewer than four coordinates are given
     *         or the ring is not closed
     */
    Area(SectionId id, RelativeOffsets offsets, PluginData pluginData,
         std::vector<Coordinate> coordinates);

    const std::vector<Coordinate>& Coordinates() const { return coordinates_; }

    bool operator==(const Area& other) const {
        return SameAttributes(other) && coordinates_ == other.coordinates_;
    }

private:
    std::vector<Coordinate> coordinates_;
};

// =============================================================================
// Section
// =============================================================================

using Section = std::variant<LineSection, Area>;

/// Shared attributes of any section variant
QITRAFFIC_API const SectionBase& AsBase(const Section& section);
QITRAFFIC_API SectionBase& AsBase(Section& section);

/// Id of any section variant
inline const SectionId& GetSectionId(const Section& section) {
    return AsBase(section).Id();
}

/// All coordinates of any section variant, in definition order
QITRAFFIC_API std::vector<Coordinate> GetCoordinates(const Section& section);

} // namespace Qi::Traffic

namespace std {

template<>
struct hash<Qi::Traffic::SectionId> {
    size_t operator()(const Qi::Traffic::SectionId& id) const noexcept {
        return std::hash<std::string>()(id.Id());
    }
};

} // namespace std
