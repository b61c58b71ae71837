/**
 * @file test_section_repository.cpp
 * @brief Unit tests for Repository/SectionRepository.h
 */

#include <QiTraffic/Repository/SectionRepository.h>
#include <QiTraffic/Core/Exception.h>
#include <gtest/gtest.h>

#include "TestData.h"

#include <vector>

namespace Qi::Traffic {
namespace {

class SectionRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository.RegisterSectionsObserver([this](const std::vector<SectionId>& ids) {
            listNotifications.push_back(ids);
        });
        repository.RegisterSectionChangedObserver([this](const SectionId& id) {
            changedNotifications.push_back(id);
        });
    }

    SectionRepository repository;
    std::vector<std::vector<SectionId>> listNotifications;
    std::vector<SectionId> changedNotifications;
};

TEST_F(SectionRepositoryTest, KeepsInsertionOrder) {
    repository.Add(TestData::MakeLine("S", {0, 0}, {1, 1}));
    repository.Add(TestData::MakeSquareArea("A"));
    repository.Add(TestData::MakeLine("N", {0, 0}, {2, 2}));

    const std::vector<Section>& sections = repository.GetAll();
    ASSERT_EQ(sections.size(), 3u);
    EXPECT_EQ(GetSectionId(sections[0]).Id(), "S");
    EXPECT_EQ(GetSectionId(sections[1]).Id(), "A");
    EXPECT_EQ(GetSectionId(sections[2]).Id(), "N");
    EXPECT_EQ(listNotifications.size(), 3u);
}

TEST_F(SectionRepositoryTest, AddAllNotifiesOnce) {
    repository.AddAll({TestData::MakeLine("S", {0, 0}, {1, 1}), TestData::MakeSquareArea("A")});

    ASSERT_EQ(listNotifications.size(), 1u);
    EXPECT_EQ(listNotifications[0].size(), 2u);
}

TEST_F(SectionRepositoryTest, GetUnknownThrows) {
    EXPECT_THROW(repository.Get(SectionId("missing")), NotFoundException);
    EXPECT_FALSE(repository.Contains(SectionId("missing")));
}

TEST_F(SectionRepositoryTest, Remove) {
    repository.Add(TestData::MakeLine("S", {0, 0}, {1, 1}));
    listNotifications.clear();

    repository.Remove(SectionId("S"));

    EXPECT_TRUE(repository.IsEmpty());
    ASSERT_EQ(listNotifications.size(), 1u);
    EXPECT_EQ(listNotifications[0], std::vector<SectionId>{SectionId("S")});
    EXPECT_THROW(repository.Remove(SectionId("S")), NotFoundException);
}

TEST_F(SectionRepositoryTest, UpdateReplacesAndNotifiesChange) {
    repository.Add(TestData::MakeLine("S", {0, 0}, {1, 1}));

    repository.Update(TestData::MakeLine("S", {0, 0}, {5, 5}));

    const auto& line = std::get<LineSection>(repository.Get(SectionId("S")));
    EXPECT_EQ(line.End(), Coordinate(5, 5));
    ASSERT_EQ(changedNotifications.size(), 1u);
    EXPECT_EQ(changedNotifications[0], SectionId("S"));
}

TEST_F(SectionRepositoryTest, UpdateUnknownThrows) {
    EXPECT_THROW(repository.Update(TestData::MakeLine("S", {0, 0}, {1, 1})), NotFoundException);
}

TEST_F(SectionRepositoryTest, PluginData) {
    repository.Add(TestData::MakeSquareArea("A"));

    repository.SetPluginValue(SectionId("A"), "flow", "north");
    EXPECT_EQ(AsBase(repository.Get(SectionId("A"))).GetPluginData().at("flow"), "north");

    repository.RemovePluginValue(SectionId("A"), "flow");
    EXPECT_TRUE(AsBase(repository.Get(SectionId("A"))).GetPluginData().empty());

    // Removing an absent key changes nothing
    repository.RemovePluginValue(SectionId("A"), "flow");
    EXPECT_EQ(changedNotifications.size(), 2u);
}

} // namespace
} // namespace Qi::Traffic
