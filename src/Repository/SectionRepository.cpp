#include <QiTraffic/Repository/SectionRepository.h>
#include <QiTraffic/Core/Exception.h>

#include <algorithm>
#include <utility>

namespace Qi::Traffic {

namespace {

std::string MissingSection(const SectionId& id) {
    return "section '" + id.Id() + "' is not in the repository";
}

} // anonymous namespace

void SectionRepository::RegisterSectionsObserver(SectionListObserver observer) {
    listObservers_.push_back(std::move(observer));
}

void SectionRepository::RegisterSectionChangedObserver(SectionChangedObserver observer) {
    changedObservers_.push_back(std::move(observer));
}

void SectionRepository::Add(const Section& section) {
    AddAll({section});
}

void SectionRepository::AddAll(const std::vector<Section>& sections) {
    if (sections.empty()) {
        return;
    }
    std::vector<SectionId> ids;
    ids.reserve(sections.size());
    for (const auto& section : sections) {
        auto it = Find(GetSectionId(section));
        if (it != sections_.end()) {
            *it = section;
        } else {
            sections_.push_back(section);
        }
        ids.push_back(GetSectionId(section));
    }
    NotifySections(ids);
}

const Section& SectionRepository::Get(const SectionId& id) const {
    auto it = Find(id);
    if (it == sections_.end()) {
        throw NotFoundException(MissingSection(id));
    }
    return *it;
}

bool SectionRepository::Contains(const SectionId& id) const {
    return Find(id) != sections_.end();
}

void SectionRepository::Remove(const SectionId& id) {
    auto it = Find(id);
    if (it == sections_.end()) {
        throw NotFoundException(MissingSection(id));
    }
    sections_.erase(it);
    NotifySections({id});
}

void SectionRepository::Update(const Section& section) {
    const SectionId& id = GetSectionId(section);
    auto it = Find(id);
    if (it == sections_.end()) {
        throw NotFoundException(MissingSection(id));
    }
    *it = section;
    NotifySectionChanged(id);
}

void SectionRepository::SetPluginValue(const SectionId& id, const std::string& key,
                                       const std::string& value) {
    auto it = Find(id);
    if (it == sections_.end()) {
        throw NotFoundException(MissingSection(id));
    }
    AsBase(*it).SetPluginValue(key, value);
    NotifySectionChanged(id);
}

void SectionRepository::RemovePluginValue(const SectionId& id, const std::string& key) {
    auto it = Find(id);
    if (it == sections_.end()) {
        throw NotFoundException(MissingSection(id));
    }
    if (AsBase(*it).RemovePluginValue(key)) {
        NotifySectionChanged(id);
    }
}

std::vector<Section>::iterator SectionRepository::Find(const SectionId& id) {
    return std::find_if(sections_.begin(), sections_.end(),
                        [&id](const Section& s) { return GetSectionId(s) == id; });
}

std::vector<Section>::const_iterator SectionRepository::Find(const SectionId& id) const {
    return std::find_if(sections_.begin(), sections_.end(),
                        [&id](const Section& s) { return GetSectionId(s) == id; });
}

void SectionRepository::NotifySections(const std::vector<SectionId>& ids) const {
    for (const auto& observer : listObservers_) {
        observer(ids);
    }
}

void SectionRepository::NotifySectionChanged(const SectionId& id) const {
    for (const auto& observer : changedObservers_) {
        observer(id);
    }
}

} // namespace Qi::Traffic
