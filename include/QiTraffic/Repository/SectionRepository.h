#pragma once

/**
 * @file SectionRepository.h
 * @brief In-memory store of sections with change notification
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Section.h>

#include <functional>
#include <string>
#include <vector>

namespace Qi::Traffic {

/// Called with the ids of sections added to or removed from the repository
using SectionListObserver = std::function<void(const std::vector<SectionId>&)>;

/// Called when the attributes of a stored section change
using SectionChangedObserver = std::function<void(const SectionId&)>;

/**
 * @brief Owns the canonical section collection
 *
 * Sections keep their insertion order, which is the order the intersection
 * pass processes them in. Adding a section whose id is already present
 * replaces it in place.
 */
class QITRAFFIC_API SectionRepository {
public:
    SectionRepository() = default;

    void RegisterSectionsObserver(SectionListObserver observer);
    void RegisterSectionChangedObserver(SectionChangedObserver observer);

    void Add(const Section& section);

    /// Add several sections; list observers are notified once
    void AddAll(const std::vector<Section>& sections);

    const std::vector<Section>& GetAll() const { return sections_; }

    /// @throws NotFoundException if the id is unknown
    const Section& Get(const SectionId& id) const;

    bool Contains(const SectionId& id) const;

    /// @throws NotFoundException if the id is unknown
    void Remove(const SectionId& id);

    /**
     * @brief Replace a stored section with a new version carrying the same id
     * @throws NotFoundException if the id is unknown
     */
    void Update(const Section& section);

    /// @throws NotFoundException if the id is unknown
    void SetPluginValue(const SectionId& id, const std::string& key, const std::string& value);

    /**
     * @brief Remove a plugin value of a section (no-op if the key is absent)
     * @throws NotFoundException if the id is unknown
     */
    void RemovePluginValue(const SectionId& id, const std::string& key);

    size_t Size() const { return sections_.size(); }
    bool IsEmpty() const { return sections_.empty(); }

private:
    std::vector<Section>::iterator Find(const SectionId& id);
    std::vector<Section>::const_iterator Find(const SectionId& id) const;

    void NotifySections(const std::vector<SectionId>& ids) const;
    void NotifySectionChanged(const SectionId& id) const;

    std::vector<Section> sections_;
    std::vector<SectionListObserver> listObservers_;
    std::vector<SectionChangedObserver> changedObservers_;
};

} // namespace Qi::Traffic
