#include "pipeline/Shading.hpp"

#include <algorithm>
#include <cmath>

namespace SoftRaster
{
    namespace
    {
        // Diffuse + Blinn-Phong for a light arriving along lightDir (light -> surface) with the given radiance
        glm::vec3 Reflect( const SurfaceSample& sample, const Material& material, const glm::vec3& lightDir, const glm::vec3& radiance,
                           const glm::vec3& viewDir, ShadingModel model )
        {
            const glm::vec3 toLight = -lightDir;
            const float     nDotL   = glm::dot( sample.normal, toLight );
            if( nDotL <= 0.0f )
                return glm::vec3( 0.0f );

            glm::vec3 color = nDotL * radiance * material.diffuse * sample.albedo;

            if( model == ShadingModel::BLINN_PHONG )
            {
                glm::vec3 halfVector = toLight + viewDir;
                float     length     = glm::length( halfVector );
                if( length > 0.0f )
                {
                    float nDotH = std::max( 0.0f, glm::dot( sample.normal, halfVector / length ) );
                    color += std::pow( nDotH, material.shininess ) * material.specular * radiance;
                }
            }
            return color;
        }

        struct LightVisitor
        {
            const SurfaceSample& sample;
            const Material&      material;
            const Light&         light;
            glm::vec3            viewDir;
            ShadingModel         model;

            glm::vec3 operator()( const DirectionalLight& directional ) const
            {
                float length = glm::length( directional.direction );
                if( length == 0.0f )
                    return glm::vec3( 0.0f );
                return Reflect( sample, material, directional.direction / length, light.color * light.intensity, viewDir, model );
            }

            glm::vec3 operator()( const PointLight& point ) const
            {
                glm::vec3 offset   = sample.position - point.position;
                float     distance = glm::length( offset );
                if( distance == 0.0f )
                    return glm::vec3( 0.0f );

                glm::vec3 radiance = light.color * light.intensity * point.attenuation.Evaluate( distance );
                return Reflect( sample, material, offset / distance, radiance, viewDir, model );
            }

            glm::vec3 operator()( const SpotLight& spot ) const
            {
                glm::vec3 offset   = sample.position - spot.position;
                float     distance = glm::length( offset );
                if( distance == 0.0f )
                    return glm::vec3( 0.0f );

                glm::vec3 lightDir = offset / distance;
                float     cone     = spot.ConeFactor( lightDir );
                if( cone <= 0.0f )
                    return glm::vec3( 0.0f );

                glm::vec3 radiance = light.color * light.intensity * spot.attenuation.Evaluate( distance ) * cone;
                return Reflect( sample, material, lightDir, radiance, viewDir, model );
            }
        };

        glm::vec3 ViewDirection( const glm::vec3& position, const glm::vec3& cameraPos )
        {
            glm::vec3 view   = cameraPos - position;
            float     length = glm::length( view );
            return length > 0.0f ? view / length : glm::vec3( 0.0f );
        }
    } // namespace

    const Material& Shading::GetDefaultMaterial()
    {
        static const Material s_default;
        return s_default;
    }

    glm::vec3 Shading::ShadeLight( const SurfaceSample& sample, const Light& light, const glm::vec3& cameraPos, ShadingModel model )
    {
        const Material& material = sample.material ? *sample.material : GetDefaultMaterial();
        LightVisitor    visitor{ sample, material, light, ViewDirection( sample.position, cameraPos ), model };
        return std::visit( visitor, light.params );
    }

    glm::vec3 Shading::ShadePixel( const SurfaceSample& sample, const std::vector<Light>& lights, const glm::vec3& cameraPos, const ShadingConfig& config )
    {
        const Material& material = sample.material ? *sample.material : GetDefaultMaterial();

        glm::vec3 color = material.ambient * config.ambientIntensity;

        // A zero normal (degenerate face) receives ambient only
        if( glm::dot( sample.normal, sample.normal ) > 0.0f )
        {
            const glm::vec3 viewDir = ViewDirection( sample.position, cameraPos );
            for( const Light& light: lights )
                color += std::visit( LightVisitor{ sample, material, light, viewDir, config.model }, light.params );
        }

        return glm::clamp( color, glm::vec3( 0.0f ), glm::vec3( 1.0f ) );
    }

    void Shading::ResolveRange( const GBuffer& gbuffer, size_t begin, size_t end, const std::vector<Light>& lights, const glm::vec3& cameraPos,
                                const ShadingConfig& config, ColorBuffer& out )
    {
        end                       = std::min( end, gbuffer.GetPixelCount() );
        const uint32_t clearColor = PackColor( config.clearColor );

        for( size_t i = begin; i < end; ++i )
        {
            if( !gbuffer.IsCovered( i ) )
            {
                out.Set( i, clearColor );
                continue;
            }

            if( config.debugView == DebugView::NORMALS )
            {
                out.Set( i, PackColor( gbuffer.GetNormal( i ) * 0.5f + 0.5f ) );
                continue;
            }
            if( config.debugView == DebugView::DEPTH )
            {
                out.Set( i, PackColor( glm::vec3( 1.0f - gbuffer.GetDepth( i ) ) ) );
                continue;
            }

            const Material& material = gbuffer.GetMaterial( i ) ? *gbuffer.GetMaterial( i ) : GetDefaultMaterial();
            if( gbuffer.GetFlags( i ) & GBUFFER_FLAG_UNLIT )
            {
                out.Set( i, PackColor( material.diffuse * gbuffer.GetAlbedo( i ) ) );
                continue;
            }

            SurfaceSample sample;
            sample.position = gbuffer.GetPosition( i );
            sample.normal   = gbuffer.GetNormal( i );
            sample.albedo   = gbuffer.GetAlbedo( i );
            sample.material = &material;
            out.Set( i, PackColor( ShadePixel( sample, lights, cameraPos, config ) ) );
        }
    }
} // namespace SoftRaster
