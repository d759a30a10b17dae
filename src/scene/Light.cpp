#include "scene/Light.h"

#include <algorithm>
#include <cmath>

namespace SoftRaster
{
    float Attenuation::Evaluate( float distance ) const
    {
        return 1.0f / std::max( 1.0f, constant + linear * distance + quadratic * distance * distance );
    }

    float SpotLight::ConeFactor( const glm::vec3& lightToSurface ) const
    {
        float cosTheta = glm::dot( lightToSurface, glm::normalize( direction ) );
        if( cosTheta <= outerCutoff )
            return 0.0f;
        if( cosTheta >= innerCutoff )
            return 1.0f;
        return std::clamp( ( cosTheta - outerCutoff ) / ( innerCutoff - outerCutoff ), 0.0f, 1.0f );
    }

    Light Light::Directional( const glm::vec3& direction, const glm::vec3& color, float intensity )
    {
        Light light;
        light.params    = DirectionalLight{ glm::normalize( direction ) };
        light.color     = color;
        light.intensity = intensity;
        return light;
    }

    Light Light::Point( const glm::vec3& position, const Attenuation& attenuation, const glm::vec3& color, float intensity )
    {
        Light light;
        light.params    = PointLight{ position, attenuation };
        light.color     = color;
        light.intensity = intensity;
        return light;
    }

    Light Light::Spot( const glm::vec3& position, const glm::vec3& direction, float coneAngle, float softEdge, const Attenuation& attenuation,
                       const glm::vec3& color, float intensity )
    {
        float outerAngle = std::clamp( coneAngle, 0.0f, 90.0f );
        float innerAngle = std::clamp( coneAngle - softEdge, 0.0f, outerAngle );

        SpotLight spot;
        spot.position    = position;
        spot.direction   = glm::normalize( direction );
        spot.outerCutoff = std::cos( glm::radians( outerAngle ) );
        spot.innerCutoff = std::cos( glm::radians( innerAngle ) );
        spot.attenuation = attenuation;

        Light light;
        light.params    = spot;
        light.color     = color;
        light.intensity = intensity;
        return light;
    }

    glm::vec3 Light::GetPosition() const
    {
        if( const PointLight* point = std::get_if<PointLight>( &params ) )
            return point->position;
        if( const SpotLight* spot = std::get_if<SpotLight>( &params ) )
            return spot->position;
        return glm::vec3( 0.0f );
    }

    void Light::SetPosition( const glm::vec3& position )
    {
        if( PointLight* point = std::get_if<PointLight>( &params ) )
            point->position = position;
        else if( SpotLight* spot = std::get_if<SpotLight>( &params ) )
            spot->position = position;
    }

    void Light::Orbit( const glm::vec3& center, float radius, float speed, float dt )
    {
        if( IsDirectional() )
            return;

        glm::vec3 position = GetPosition();
        float     angle    = std::atan2( position.z - center.z, position.x - center.x ) + speed * dt;
        position.x         = center.x + radius * std::cos( angle );
        position.z         = center.z + radius * std::sin( angle );
        SetPosition( position );
    }
} // namespace SoftRaster
