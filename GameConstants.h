#pragma once

#include <glm/glm.hpp>

namespace stroll {

    namespace events {
        // Entity events
        inline constexpr const char* EntityCreated = "entity:created";
        inline constexpr const char* EntityRemoved = "entity:removed";
        inline constexpr const char* ComponentAdded = "component:added";
        inline constexpr const char* ComponentRemoved = "component:removed";

        // System events
        inline constexpr const char* SystemAdded = "system:added";
        inline constexpr const char* SystemRemoved = "system:removed";

        // World events
        inline constexpr const char* WorldInitialized = "world:initialized";
    }

    namespace tags {
        inline constexpr const char* Skybox = "skybox";
        inline constexpr const char* Planet = "planet";
        inline constexpr const char* Player = "player";
        inline constexpr const char* Npc = "npc";
        inline constexpr const char* Billboard = "billboard";
        inline constexpr const char* Interactive = "interactive";
    }

    namespace positions {
        inline const glm::vec3 Player{ 0.0f, 0.0f, 0.0f };
        inline const glm::vec3 Npc{ 5.0f, 0.0f, 5.0f };
        inline const glm::vec3 Billboard{ 0.0f, 2.0f, -5.0f };
    }

}
