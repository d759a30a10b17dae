#pragma once

#include "core/Core.h"
#include <glm/glm.hpp>
#include <variant>

namespace SoftRaster
{
    // Distance falloff: 1 / max( 1, constant + linear * d + quadratic * d^2 )
    struct Attenuation
    {
        float constant  = 1.0f;
        float linear    = 0.09f;
        float quadratic = 0.032f;

        float Evaluate( float distance ) const;
    };

    struct DirectionalLight
    {
        glm::vec3 direction = glm::vec3( 0.0f, -1.0f, 0.0f ); // direction the light travels
    };

    struct PointLight
    {
        glm::vec3   position = glm::vec3( 0.0f );
        Attenuation attenuation;
    };

    struct SpotLight
    {
        glm::vec3   position  = glm::vec3( 0.0f );
        glm::vec3   direction = glm::vec3( 0.0f, -1.0f, 0.0f );
        float       innerCutoff = 0.9f;  // cos of the full-intensity half-angle
        float       outerCutoff = 0.85f; // cos of the cone half-angle; nothing outside
        Attenuation attenuation;

        // Angular falloff in [0, 1] for the normalized direction from the light to the surface
        float ConeFactor( const glm::vec3& lightToSurface ) const;
    };

    using LightParams = std::variant<DirectionalLight, PointLight, SpotLight>;

    struct Light
    {
        LightParams params    = DirectionalLight{};
        glm::vec3   color     = glm::vec3( 1.0f );
        float       intensity = 1.0f;

        static Light Directional( const glm::vec3& direction, const glm::vec3& color = glm::vec3( 1.0f ), float intensity = 1.0f );
        static Light Point( const glm::vec3& position, const Attenuation& attenuation = {}, const glm::vec3& color = glm::vec3( 1.0f ),
                            float intensity = 1.0f );

        /**
         * @brief Spot light from angles in degrees.
         * @param coneAngle Half-angle of the cone, measured from the axis.
         * @param softEdge Width of the fade band inside the cone edge (0 = hard edge).
         */
        static Light Spot( const glm::vec3& position, const glm::vec3& direction, float coneAngle, float softEdge = 0.0f,
                           const Attenuation& attenuation = {}, const glm::vec3& color = glm::vec3( 1.0f ), float intensity = 1.0f );

        bool IsDirectional() const { return std::holds_alternative<DirectionalLight>( params ); }
        bool IsPoint() const { return std::holds_alternative<PointLight>( params ); }
        bool IsSpot() const { return std::holds_alternative<SpotLight>( params ); }

        // Directional lights report the origin and ignore SetPosition
        glm::vec3 GetPosition() const;
        void      SetPosition( const glm::vec3& position );

        // Moves a positional light around the Y axis through center.
        void Orbit( const glm::vec3& center, float radius, float speed, float dt );
    };
} // namespace SoftRaster
