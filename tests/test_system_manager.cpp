#include "SystemManager.h"
#include "World.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace {

    class TaggedSystem : public ISystem {
    public:
        TaggedSystem(std::string label, SystemPriority priority, std::vector<std::string>* log)
            : ISystem(priority), mLabel(std::move(label)), mLog(log) {}

        void Update(float, const std::vector<Entity*>&) override {
            if (mLog) mLog->push_back(mLabel);
        }

    private:
        std::string mLabel;
        std::vector<std::string>* mLog;
    };

    bool contains(const std::vector<std::shared_ptr<ISystem>>& list, const std::shared_ptr<ISystem>& s) {
        return std::find(list.begin(), list.end(), s) != list.end();
    }

    class SystemManagerTest : public ::testing::Test {
    protected:
        SystemManagerTest() : manager(world) {}

        World world;
        SystemManager manager;
        std::vector<std::string> log;
    };

}

TEST_F(SystemManagerTest, RegisterAssignsSequentialIds)
{
    auto a = manager.RegisterSystem(std::make_shared<TaggedSystem>("a", SystemPriority::Normal, &log));
    auto b = manager.RegisterSystem(std::make_shared<TaggedSystem>("b", SystemPriority::Normal, &log));

    EXPECT_EQ(a->GetId(), "system_0");
    EXPECT_EQ(b->GetId(), "system_1");
    EXPECT_EQ(manager.GetSystem("system_1"), b);
    EXPECT_EQ(manager.GetSystem("system_9"), nullptr);
    EXPECT_EQ(world.GetSystems().size(), 2u);
}

TEST_F(SystemManagerTest, RegisterKeepsExistingId)
{
    auto system = std::make_shared<TaggedSystem>("named", SystemPriority::Normal, &log);
    system->SetId("camera");
    manager.RegisterSystem(system);

    EXPECT_EQ(system->GetId(), "camera");
    EXPECT_EQ(manager.GetSystem("camera"), system);
}

TEST_F(SystemManagerTest, CollidingIdIsReplacedOnRegistration)
{
    auto first = std::make_shared<TaggedSystem>("first", SystemPriority::Normal, &log);
    first->SetId("camera");
    manager.RegisterSystem(first);

    auto second = std::make_shared<TaggedSystem>("second", SystemPriority::Normal, &log);
    second->SetId("camera");
    manager.RegisterSystem(second);

    EXPECT_EQ(first->GetId(), "camera");
    EXPECT_NE(second->GetId(), "camera");
    EXPECT_EQ(manager.GetSystem("camera"), first);
    EXPECT_EQ(manager.GetSystem(second->GetId()), second);

    EXPECT_TRUE(manager.DisableSystem(second->GetId()));
    EXPECT_TRUE(first->IsActive());
    EXPECT_FALSE(second->IsActive());
}

TEST_F(SystemManagerTest, RegisteringTwiceOnlyExtendsGroups)
{
    auto system = manager.CreateSystem<TaggedSystem>("physics", "s", SystemPriority::Normal, &log);
    manager.RegisterSystem(system, "debug");

    EXPECT_EQ(world.GetSystems().size(), 1u);
    EXPECT_EQ(manager.GetAllSystems().size(), 1u);
    EXPECT_TRUE(contains(manager.GetSystemsInGroup("physics"), system));
    EXPECT_TRUE(contains(manager.GetSystemsInGroup("debug"), system));
}

TEST_F(SystemManagerTest, DisableMovesSystemBetweenLists)
{
    auto system = manager.CreateSystem<TaggedSystem>("physics", "s", SystemPriority::Normal, &log);
    const std::string id = system->GetId();

    EXPECT_TRUE(manager.DisableSystem(id));
    EXPECT_FALSE(system->IsActive());
    EXPECT_FALSE(contains(manager.GetActiveSystems(), system));
    EXPECT_TRUE(contains(manager.GetInactiveSystems(), system));
    EXPECT_FALSE(manager.DisableSystem(id));

    world.Update(0.016f);
    EXPECT_EQ(manager.UpdateSystemGroup("physics", 0.016f), 0u);
    EXPECT_TRUE(log.empty());

    EXPECT_TRUE(manager.EnableSystem(id));
    EXPECT_TRUE(system->IsActive());
    EXPECT_TRUE(contains(manager.GetActiveSystems(), system));
    EXPECT_FALSE(contains(manager.GetInactiveSystems(), system));

    world.Update(0.016f);
    EXPECT_EQ(log, std::vector<std::string>{ "s" });
}

TEST_F(SystemManagerTest, UnknownIdsAreRejected)
{
    EXPECT_FALSE(manager.EnableSystem("ghost"));
    EXPECT_FALSE(manager.DisableSystem("ghost"));
    EXPECT_FALSE(manager.SetSystemPriority("ghost", SystemPriority::High));
    EXPECT_EQ(manager.EnableSystemGroup("none"), 0u);
    EXPECT_EQ(manager.UpdateSystemGroup("none", 0.1f), 0u);
    EXPECT_TRUE(manager.GetSystemsInGroup("none").empty());
}

TEST_F(SystemManagerTest, InactiveOnRegistrationLandsInInactiveList)
{
    auto system = std::make_shared<TaggedSystem>("idle", SystemPriority::Normal, &log);
    system->SetActive(false);
    manager.RegisterSystem(system);

    EXPECT_TRUE(contains(manager.GetInactiveSystems(), system));
    EXPECT_TRUE(manager.GetActiveSystems().empty());
}

TEST_F(SystemManagerTest, GroupToggleReportsChangedCount)
{
    auto a = manager.CreateSystem<TaggedSystem>("ai", "a", SystemPriority::Normal, &log);
    auto b = manager.CreateSystem<TaggedSystem>("ai", "b", SystemPriority::Normal, &log);
    manager.CreateSystem<TaggedSystem>("render", "c", SystemPriority::Normal, &log);

    manager.DisableSystem(a->GetId());
    EXPECT_EQ(manager.DisableSystemGroup("ai"), 1u);
    EXPECT_FALSE(b->IsActive());

    world.Update(0.016f);
    EXPECT_EQ(log, std::vector<std::string>{ "c" });

    EXPECT_EQ(manager.EnableSystemGroup("ai"), 2u);
    EXPECT_EQ(manager.EnableSystemGroup("ai"), 0u);
}

TEST_F(SystemManagerTest, UpdateSystemGroupRunsOnlyThatGroupInPriorityOrder)
{
    manager.CreateSystem<TaggedSystem>("physics", "late", SystemPriority::Lowest, &log);
    manager.CreateSystem<TaggedSystem>("physics", "early", SystemPriority::Highest, &log);
    manager.CreateSystem<TaggedSystem>("gameplay", "other", SystemPriority::Highest, &log);
    auto off = manager.CreateSystem<TaggedSystem>("physics", "off", SystemPriority::Normal, &log);
    manager.DisableSystem(off->GetId());

    EXPECT_EQ(manager.UpdateSystemGroup("physics", 0.02f), 2u);
    EXPECT_EQ(log, (std::vector<std::string>{ "early", "late" }));
}

TEST_F(SystemManagerTest, SetSystemPriorityReordersWorld)
{
    auto a = manager.CreateSystem<TaggedSystem>("", "a", SystemPriority::Highest, &log);
    manager.CreateSystem<TaggedSystem>("", "b", SystemPriority::Normal, &log);

    EXPECT_TRUE(manager.SetSystemPriority(a->GetId(), SystemPriority::Lowest));
    EXPECT_EQ(a->GetPriority(), static_cast<int>(SystemPriority::Lowest));

    world.Update(0.016f);
    EXPECT_EQ(log, (std::vector<std::string>{ "b", "a" }));
}

TEST_F(SystemManagerTest, UnregisterRemovesEverywhere)
{
    auto system = manager.CreateSystem<TaggedSystem>("solo", "s", SystemPriority::Normal, &log);

    EXPECT_TRUE(manager.UnregisterSystem(system));
    EXPECT_TRUE(world.GetSystems().empty());
    EXPECT_EQ(manager.GetSystem(system->GetId()), nullptr);
    EXPECT_TRUE(manager.GetSystemGroups().empty());
    EXPECT_FALSE(manager.UnregisterSystem(system));
}

TEST_F(SystemManagerTest, GroupsAreListedInCreationOrder)
{
    manager.CreateSystem<TaggedSystem>("input", "i", SystemPriority::Normal, &log);
    manager.CreateSystem<TaggedSystem>("physics", "p", SystemPriority::Normal, &log);
    manager.CreateSystem<TaggedSystem>("gameplay", "g", SystemPriority::Normal, &log);

    EXPECT_EQ(manager.GetSystemGroups(), (std::vector<std::string>{ "input", "physics", "gameplay" }));
}

TEST_F(SystemManagerTest, DestroyRemovesAllSystemsFromWorld)
{
    manager.CreateSystem<TaggedSystem>("a", "x", SystemPriority::Normal, &log);
    manager.CreateSystem<TaggedSystem>("b", "y", SystemPriority::Normal, &log);

    int removed = 0;
    world.On(stroll::events::SystemRemoved, [&removed](const GameEvent&) { ++removed; });

    manager.Destroy();
    EXPECT_EQ(removed, 2);
    EXPECT_TRUE(world.GetSystems().empty());
    EXPECT_TRUE(manager.GetAllSystems().empty());
    EXPECT_TRUE(manager.GetSystemGroups().empty());
}
