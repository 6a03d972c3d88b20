#include "World.h"

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    class RecordingSystem : public ISystem {
    public:
        RecordingSystem(std::string name, SystemPriority priority, std::vector<std::string>* log,
            std::vector<ComponentKind> required = {})
            : ISystem(priority, std::move(required))
            , mName(std::move(name))
            , mLog(log)
        {
        }

        void Update(float, const std::vector<Entity*>& entities) override {
            if (mLog) mLog->push_back(mName);
            lastBatch = entities;
            ++updates;
        }
        void Initialize(World&) override { ++initialized; }
        void Cleanup() override { ++cleanedUp; }
        std::string GetName() const override { return mName; }

        std::vector<Entity*> lastBatch;
        int updates = 0;
        int initialized = 0;
        int cleanedUp = 0;

    private:
        std::string mName;
        std::vector<std::string>* mLog;
    };

    EcsConfig quietConfig() {
        EcsConfig config;
        config.verbose = false;
        return config;
    }

    class WorldTest : public ::testing::Test {
    protected:
        WorldTest() : world(quietConfig()) {
            RegisterBuiltinComponents(world.GetComponentFactory());
        }
        World world;
    };

}

TEST_F(WorldTest, CreatedEntitiesHaveUniqueIds)
{
    std::set<EntityId> ids;
    for (int i = 0; i < 200; ++i) {
        Entity& e = world.CreateEntity();
        EXPECT_FALSE(e.id.empty());
        EXPECT_TRUE(e.active);
        ids.insert(e.id);
    }
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(world.GetEntityCount(), 200u);
}

TEST_F(WorldTest, CreateEntityEmitsEntityCreated)
{
    std::vector<EntityId> seen;
    world.On(stroll::events::EntityCreated, [&seen](const GameEvent& ev) { seen.push_back(ev.entityId); });

    Entity& e = world.CreateEntity();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], e.id);
    EXPECT_EQ(world.GetEntity(e.id), &e);
}

TEST_F(WorldTest, AddComponentStampsOwnerAndEmits)
{
    Entity& e = world.CreateEntity();
    std::vector<ComponentKind> added;
    world.On(stroll::events::ComponentAdded, [&added](const GameEvent& ev) {
        ASSERT_TRUE(ev.componentType.has_value());
        added.push_back(*ev.componentType);
    });

    auto transform = world.GetComponentFactory().Create<TransformComponent>(glm::vec3(1.0f));
    EXPECT_TRUE(world.AddComponent(e.id, transform));
    EXPECT_EQ(transform->entityId, e.id);
    EXPECT_EQ(world.GetComponent<TransformComponent>(e.id), transform);
    EXPECT_EQ(added, std::vector<ComponentKind>{ ComponentKind::Transform });
}

TEST_F(WorldTest, AddComponentToUnknownEntityFails)
{
    auto transform = world.GetComponentFactory().Create<TransformComponent>();
    EXPECT_FALSE(world.AddComponent("missing", transform));
    EXPECT_EQ(world.EmplaceComponent<VelocityComponent>("missing"), nullptr);
    EXPECT_EQ(world.GetComponent("missing", ComponentKind::Transform), nullptr);
}

TEST_F(WorldTest, SecondComponentOfSameKindReplacesFirst)
{
    Entity& e = world.CreateEntity();
    world.EmplaceComponent<TransformComponent>(e.id, glm::vec3(1.0f));
    auto second = world.EmplaceComponent<TransformComponent>(e.id, glm::vec3(2.0f));

    EXPECT_EQ(e.components.size(), 1u);
    EXPECT_EQ(world.GetComponent<TransformComponent>(e.id), second);
}

TEST_F(WorldTest, RemoveComponentEmitsAndDetaches)
{
    Entity& e = world.CreateEntity();
    world.EmplaceComponent<ColliderComponent>(e.id);

    int removed = 0;
    world.On(stroll::events::ComponentRemoved, [&removed](const GameEvent&) { ++removed; });

    EXPECT_TRUE(world.RemoveComponent(e.id, ComponentKind::Collider));
    EXPECT_FALSE(e.HasComponent(ComponentKind::Collider));
    EXPECT_FALSE(world.RemoveComponent(e.id, ComponentKind::Collider));
    EXPECT_EQ(removed, 1);
}

TEST_F(WorldTest, RemoveEntityEmitsComponentEventsBeforeEntityEvent)
{
    Entity& e = world.CreateEntity();
    const EntityId id = e.id;
    world.EmplaceComponent<TransformComponent>(id);
    world.EmplaceComponent<VelocityComponent>(id);
    world.EmplaceComponent<PlayerComponent>(id);

    std::vector<std::string> order;
    world.On(stroll::events::ComponentRemoved, [&](const GameEvent& ev) {
        EXPECT_EQ(ev.entityId, id);
        EXPECT_NE(world.GetEntity(id), nullptr);
        order.push_back(ev.type);
    });
    world.On(stroll::events::EntityRemoved, [&](const GameEvent& ev) {
        EXPECT_EQ(ev.entityId, id);
        EXPECT_EQ(world.GetEntity(id), nullptr);
        order.push_back(ev.type);
    });

    EXPECT_TRUE(world.RemoveEntity(id));
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], stroll::events::ComponentRemoved);
    EXPECT_EQ(order[1], stroll::events::ComponentRemoved);
    EXPECT_EQ(order[2], stroll::events::ComponentRemoved);
    EXPECT_EQ(order[3], stroll::events::EntityRemoved);
    EXPECT_EQ(world.GetEntityCount(), 0u);
}

TEST_F(WorldTest, RemoveUnknownEntityReturnsFalse)
{
    int events = 0;
    world.On(stroll::events::EntityRemoved, [&events](const GameEvent&) { ++events; });
    EXPECT_FALSE(world.RemoveEntity("nope"));
    EXPECT_EQ(events, 0);
}

TEST(WorldRecycle, RemovedComponentsReturnToPoolWhenEnabled)
{
    EcsConfig config;
    config.recycleOnRemove = true;
    World world(config);
    RegisterBuiltinComponents(world.GetComponentFactory());

    Entity& e = world.CreateEntity();
    auto transform = world.EmplaceComponent<TransformComponent>(e.id);
    world.EmplaceComponent<HudComponent>(e.id);

    world.RemoveComponent(e.id, ComponentKind::Transform);
    EXPECT_EQ(world.GetComponentFactory().GetPoolSize(ComponentKind::Transform), 1u);
    EXPECT_FALSE(transform->active);

    world.RemoveEntity(e.id);
    EXPECT_EQ(world.GetComponentFactory().GetPoolSize(ComponentKind::Hud), 1u);

    Entity& other = world.CreateEntity();
    auto reused = world.EmplaceComponent<TransformComponent>(other.id);
    EXPECT_EQ(reused, transform);
    EXPECT_EQ(reused->entityId, other.id);
}

TEST_F(WorldTest, QueryHonoursAllAnyNoneAndTags)
{
    Entity& a = world.CreateEntity();
    world.EmplaceComponent<TransformComponent>(a.id);
    world.EmplaceComponent<VelocityComponent>(a.id);
    a.AddTag("mover");

    Entity& b = world.CreateEntity();
    world.EmplaceComponent<TransformComponent>(b.id);
    world.EmplaceComponent<ColliderComponent>(b.id);

    Entity& c = world.CreateEntity();
    world.EmplaceComponent<HudComponent>(c.id);

    EntityQuery all;
    all.all = { ComponentKind::Transform };
    EXPECT_EQ(world.QueryEntities(all), (std::vector<Entity*>{ &a, &b }));

    EntityQuery any;
    any.any = { ComponentKind::Velocity, ComponentKind::Hud };
    EXPECT_EQ(world.QueryEntities(any), (std::vector<Entity*>{ &a, &c }));

    EntityQuery none;
    none.all = { ComponentKind::Transform };
    none.none = { ComponentKind::Velocity };
    EXPECT_EQ(world.QueryEntities(none), (std::vector<Entity*>{ &b }));

    EntityQuery tagged;
    tagged.tags = { "mover" };
    EXPECT_EQ(world.QueryEntities(tagged), (std::vector<Entity*>{ &a }));

    EXPECT_EQ(world.QueryEntities(EntityQuery{}).size(), 3u);
}

TEST_F(WorldTest, AddThenRemoveComponentUpdatesQueries)
{
    Entity& e = world.CreateEntity();
    EntityQuery query;
    query.all = { ComponentKind::Transform };

    EXPECT_TRUE(world.AddComponent(e.id, world.GetComponentFactory().Create(ComponentKind::Transform)));
    EXPECT_EQ(world.QueryEntities(query), std::vector<Entity*>{ &e });

    EXPECT_TRUE(world.RemoveComponent(e.id, ComponentKind::Transform));
    EXPECT_TRUE(world.QueryEntities(query).empty());
}

TEST_F(WorldTest, InactiveEntitiesAreExcludedFromQueries)
{
    Entity& a = world.CreateEntity();
    Entity& b = world.CreateEntity();
    world.EmplaceComponent<TransformComponent>(a.id);
    world.EmplaceComponent<TransformComponent>(b.id);
    b.active = false;

    EntityQuery query;
    query.all = { ComponentKind::Transform };
    EXPECT_EQ(world.QueryEntities(query), (std::vector<Entity*>{ &a }));
}

TEST_F(WorldTest, SystemsUpdateInPriorityOrder)
{
    std::vector<std::string> log;
    world.AddSystem(std::make_shared<RecordingSystem>("normal", SystemPriority::Normal, &log));
    world.AddSystem(std::make_shared<RecordingSystem>("high", SystemPriority::High, &log));
    world.AddSystem(std::make_shared<RecordingSystem>("lowest", SystemPriority::Lowest, &log));
    world.AddSystem(std::make_shared<RecordingSystem>("highest", SystemPriority::Highest, &log));

    world.Update(0.016f);
    EXPECT_EQ(log, (std::vector<std::string>{ "highest", "high", "normal", "lowest" }));
}

TEST_F(WorldTest, EqualPrioritiesKeepInsertionOrder)
{
    std::vector<std::string> log;
    world.AddSystem(std::make_shared<RecordingSystem>("first", SystemPriority::Normal, &log));
    world.AddSystem(std::make_shared<RecordingSystem>("second", SystemPriority::Normal, &log));
    world.AddSystem(std::make_shared<RecordingSystem>("third", SystemPriority::Normal, &log));

    world.Update(0.016f);
    EXPECT_EQ(log, (std::vector<std::string>{ "first", "second", "third" }));
}

TEST_F(WorldTest, InactiveSystemsAreSkipped)
{
    std::vector<std::string> log;
    auto on = std::make_shared<RecordingSystem>("on", SystemPriority::Normal, &log);
    auto off = std::make_shared<RecordingSystem>("off", SystemPriority::High, &log);
    off->SetActive(false);
    world.AddSystem(on);
    world.AddSystem(off);

    world.Update(0.016f);
    EXPECT_EQ(log, std::vector<std::string>{ "on" });
    EXPECT_EQ(off->updates, 0);
}

TEST_F(WorldTest, SystemReceivesOnlyMatchingEntities)
{
    Entity& mover = world.CreateEntity();
    world.EmplaceComponent<TransformComponent>(mover.id);
    world.EmplaceComponent<VelocityComponent>(mover.id);
    Entity& still = world.CreateEntity();
    world.EmplaceComponent<TransformComponent>(still.id);

    auto system = std::make_shared<RecordingSystem>("movement", SystemPriority::Normal, nullptr,
        std::vector<ComponentKind>{ ComponentKind::Transform, ComponentKind::Velocity });
    world.AddSystem(system);

    world.Update(0.016f);
    EXPECT_EQ(system->lastBatch, std::vector<Entity*>{ &mover });
}

TEST_F(WorldTest, AddAndRemoveSystemRunLifecycleHooks)
{
    std::vector<std::string> events;
    world.On(stroll::events::SystemAdded, [&events](const GameEvent& ev) {
        events.push_back(std::string("added:") + (ev.system ? ev.system->GetName() : "?"));
    });
    world.On(stroll::events::SystemRemoved, [&events](const GameEvent& ev) {
        events.push_back(std::string("removed:") + (ev.system ? ev.system->GetName() : "?"));
    });

    auto system = std::make_shared<RecordingSystem>("hooks", SystemPriority::Normal, nullptr);
    world.AddSystem(system);
    EXPECT_EQ(system->initialized, 1);
    EXPECT_EQ(world.GetSystems().size(), 1u);

    EXPECT_TRUE(world.RemoveSystem(system));
    EXPECT_EQ(system->cleanedUp, 1);
    EXPECT_TRUE(world.GetSystems().empty());
    EXPECT_FALSE(world.RemoveSystem(system));

    EXPECT_EQ(events, (std::vector<std::string>{ "added:hooks", "removed:hooks" }));
}

TEST_F(WorldTest, ThrowingListenerDoesNotStopOthers)
{
    int reached = 0;
    world.On("ping", [](const GameEvent&) { throw std::runtime_error("boom"); });
    world.On("ping", [&reached](const GameEvent&) { ++reached; });

    EXPECT_NO_THROW(world.Emit(MakeEvent("ping")));
    EXPECT_EQ(reached, 1);
    EXPECT_EQ(world.GetDiagnostics().listenerFaultCount(), 1u);
    ASSERT_EQ(world.GetDiagnostics().recentFaults().size(), 1u);
    EXPECT_EQ(world.GetDiagnostics().recentFaults().front().eventType, "ping");
    EXPECT_EQ(world.GetDiagnostics().recentFaults().front().message, "boom");
}

TEST_F(WorldTest, UpdateAdvancesTime)
{
    world.Update(0.5f);
    world.Update(0.25f);

    const GameTime& time = world.GetTime();
    EXPECT_EQ(time.frameCount, 2u);
    EXPECT_FLOAT_EQ(time.deltaTime, 0.25f);
    EXPECT_DOUBLE_EQ(time.elapsedTime, 0.75);
}

TEST_F(WorldTest, InitializeWorldCreatesSceneEntities)
{
    bool initialized = false;
    world.On(stroll::events::WorldInitialized, [&initialized](const GameEvent&) { initialized = true; });

    world.InitializeWorld();
    EXPECT_TRUE(initialized);

    EntityQuery skybox;
    skybox.tags = { stroll::tags::Skybox };
    EXPECT_EQ(world.QueryEntities(skybox).size(), 1u);

    EntityQuery planet;
    planet.tags = { stroll::tags::Planet };
    EXPECT_EQ(world.QueryEntities(planet).size(), 1u);
}

TEST_F(WorldTest, ConvenienceCreatorsTagEntities)
{
    EXPECT_TRUE(world.CreatePlayerEntity().HasTag(stroll::tags::Player));
    EXPECT_TRUE(world.CreateNPCEntity(stroll::positions::Npc, "greet").HasTag(stroll::tags::Npc));
    EXPECT_TRUE(world.CreateBillboardEntity().HasTag(stroll::tags::Billboard));
    EXPECT_EQ(world.GetEntityCount(), 3u);
}

TEST_F(WorldTest, DestroyClearsEverything)
{
    auto system = std::make_shared<RecordingSystem>("doomed", SystemPriority::Normal, nullptr);
    world.AddSystem(system);
    world.CreateEntity();
    world.On("ping", [](const GameEvent&) {});

    world.Destroy();
    EXPECT_EQ(system->cleanedUp, 1);
    EXPECT_EQ(world.GetEntityCount(), 0u);
    EXPECT_TRUE(world.GetSystems().empty());
    EXPECT_EQ(world.GetEventBus().ListenerCount("ping"), 0u);
}

TEST_F(WorldTest, NestedRemovalOfSameEntityIsRejected)
{
    Entity& e = world.CreateEntity();
    const EntityId id = e.id;
    world.EmplaceComponent<TransformComponent>(id);
    world.EmplaceComponent<HudComponent>(id);

    std::vector<bool> nested;
    world.On(stroll::events::ComponentRemoved, [&](const GameEvent& ev) {
        nested.push_back(world.RemoveEntity(ev.entityId));
    });

    EXPECT_TRUE(world.RemoveEntity(id));
    EXPECT_EQ(nested, (std::vector<bool>{ false, false }));
    EXPECT_EQ(world.GetEntity(id), nullptr);
    EXPECT_EQ(world.GetEntityCount(), 0u);
}

TEST_F(WorldTest, SystemRemovedDuringUpdateDoesNotRunThatFrame)
{
    std::vector<std::string> log;
    auto later = std::make_shared<RecordingSystem>("later", SystemPriority::Low, &log);

    class RemovingSystem : public ISystem {
    public:
        RemovingSystem(World& world, std::shared_ptr<ISystem> target)
            : ISystem(SystemPriority::High), mWorld(world), mTarget(std::move(target)) {}
        void Update(float, const std::vector<Entity*>&) override {
            if (mTarget) {
                mWorld.RemoveSystem(mTarget);
                mTarget.reset();
            }
        }
        std::string GetName() const override { return "remover"; }
    private:
        World& mWorld;
        std::shared_ptr<ISystem> mTarget;
    };

    world.AddSystem(later);
    world.AddSystem(std::make_shared<RemovingSystem>(world, later));

    world.Update(0.016f);
    EXPECT_EQ(later->cleanedUp, 1);
    EXPECT_EQ(later->updates, 0);
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(world.GetSystems().size(), 1u);

    world.Update(0.016f);
    EXPECT_EQ(later->updates, 0);
}

TEST_F(WorldTest, ComponentAttachedDuringRemovalIsAnnounced)
{
    Entity& e = world.CreateEntity();
    const EntityId id = e.id;
    world.EmplaceComponent<TransformComponent>(id);

    std::vector<ComponentKind> removed;
    world.On(stroll::events::ComponentRemoved, [&](const GameEvent& ev) {
        removed.push_back(ev.componentType.value_or(ComponentKind::COUNT));
        if (ev.componentType == ComponentKind::Transform) {
            world.EmplaceComponent<HudComponent>(ev.entityId);
        }
    });

    EXPECT_TRUE(world.RemoveEntity(id));
    EXPECT_EQ(removed, (std::vector<ComponentKind>{ ComponentKind::Transform, ComponentKind::Hud }));
    EXPECT_EQ(world.GetEntity(id), nullptr);
}
