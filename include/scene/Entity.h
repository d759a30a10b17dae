#pragma once

#include "SoftRasterTypes.h"
#include "scene/Mesh.h"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <string>

namespace SoftRaster
{
    struct Transform
    {
        glm::vec3 position = glm::vec3( 0.0f );
        glm::quat rotation = glm::quat( 1.0f, 0.0f, 0.0f, 0.0f );
        glm::vec3 scale    = glm::vec3( 1.0f );

        // T * R * S
        glm::mat4 GetMatrix() const;

        void Rotate( const glm::vec3& axis, float angle );
    };

    /**
     * @brief A placed instance of a shared, finalized mesh.
     */
    struct Entity
    {
        std::string     name = "Entity";
        Ref<const Mesh> mesh;
        Transform       transform;
        RenderMode      renderMode = RenderMode::SOLID;
    };
} // namespace SoftRaster
