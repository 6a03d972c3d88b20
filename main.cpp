#include "Chrono.h"
#include "Components.h"
#include "DemoSystems.h"
#include "EntityManager.h"
#include "GameClock.h"
#include "Platform.h"
#include "SystemManager.h"
#include "World.h"

#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

    constexpr int    DEFAULT_FRAMES = 240;
    constexpr double FRAME_BUDGET_SECONDS = 1.0 / 60.0;

    void buildScene(World& world, EntityManager& entities)
    {
        world.InitializeWorld();

        Entity& player = entities.CreateCharacterEntity(stroll::positions::Player, true, "Visitor");
        world.EmplaceComponent<VelocityComponent>(player.id, glm::vec3(0.0f));
        world.EmplaceComponent<ColliderComponent>(player.id, glm::vec3(0.4f, 0.9f, 0.4f));

        entities.CreateEntityFormation(glm::vec3(0.0f), 6, 6.0f,
            [&entities](const glm::vec3& pos) -> Entity& {
                Entity& npc = entities.CreateNPCWithDialogue(pos, "npc_greeting", "Guide");
                entities.CreateInteractiveObject(pos, "talk");
                return npc;
            });

        Entity& resume = entities.CreatePortfolioBillboard(stroll::positions::Billboard, PortfolioContent::Resume);
        world.EmplaceComponent<AnimationComponent>(resume.id, "idle_spin");
        entities.CreatePortfolioBillboard(glm::vec3(4.0f, 2.0f, -5.0f), PortfolioContent::Projects);
        entities.CreatePortfolioBillboard(glm::vec3(-4.0f, 2.0f, -5.0f), PortfolioContent::Skills);
    }

}

int main(int argc, char** argv)
{
    int frames = DEFAULT_FRAMES;
    if (argc > 1) {
        const long requested = std::strtol(argv[1], nullptr, 10);
        if (requested > 0) frames = static_cast<int>(requested);
    }

    if (!plat::Init()) {
        return 1;
    }

    EcsConfig config;
    config.verbose = true;
    config.recycleOnRemove = true;

    World world(config);
    RegisterBuiltinComponents(world.GetComponentFactory());

    SystemManager systems(world);
    EntityManager entities(world);

    std::size_t enters = 0;
    world.On("interaction:enter", [&enters](const GameEvent& ev) {
        ++enters;
        std::cout << "[Demo] Entered " << ev.entityId << " ("
            << ev.data.at("interactionType") << ")\n";
    });
    world.Once(stroll::events::WorldInitialized, [](const GameEvent&) {
        std::cout << "[Demo] World initialized\n";
    });

    buildScene(world, entities);

    systems.CreateSystem<ScriptedInputSystem>("input");
    systems.CreateSystem<MovementSystem>("physics");
    auto proximity = systems.CreateSystem<ProximitySystem>("gameplay");
    systems.CreateSystem<AnimationSystem>("gameplay");

    GameClock clock;
    diag::Diagnostics& diagnostics = world.GetDiagnostics();

    for (int frame = 0; frame < frames; ++frame) {
        const double frameStartSeconds = plat::GetTimeSeconds();
        clock.Tick(frameStartSeconds);

        const diag::Stopwatch frameTimer;
        diagnostics.beginFrame(clock.GetFrameCount());

        const float dt = static_cast<float>(clock.GetDeltaTime());
        systems.UpdateSystemGroup("input", dt);
        while (clock.ShouldRunFixedUpdate()) {
            systems.UpdateSystemGroup("physics", static_cast<float>(clock.GetFixedDeltaTime()));
        }
        systems.UpdateSystemGroup("gameplay", dt);

        diagnostics.endFrame(clock.GetFrameCount(), frameTimer.elapsedMs());

        // Half way through, drop the formation's interactables to exercise removal.
        if (frame == frames / 2) {
            EntityQuery interactive;
            interactive.tags = { stroll::tags::Interactive };
            const std::size_t removed = entities.RemoveEntitiesMatching(interactive);
            std::cout << "[Demo] Removed " << removed << " interactables\n";
        }

        const double spent = plat::GetTimeSeconds() - frameStartSeconds;
        plat::SleepSeconds(FRAME_BUDGET_SECONDS - spent);
    }

    std::cout << "[Demo] Frames=" << clock.GetFrameCount()
        << " elapsed=" << clock.GetElapsedTime() << "s"
        << " fps=" << clock.GetFps()
        << " interactions=" << enters << "/" << proximity->GetEnterCount() << "\n";
    diagnostics.printSummary(std::cout);

    systems.Destroy();
    world.Destroy();
    plat::Shutdown();
    return 0;
}
