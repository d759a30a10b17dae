#pragma once

#include "pipeline/FrameBuffer.hpp"
#include "scene/Light.h"
#include <vector>

namespace SoftRaster
{
    struct ShadingConfig
    {
        ShadingModel model            = ShadingModel::BLINN_PHONG;
        DebugView    debugView        = DebugView::NONE;
        glm::vec3    ambientIntensity = glm::vec3( 0.1f );
        glm::vec3    clearColor       = glm::vec3( 0.0f );
    };

    // Surface attributes of one covered pixel, as read back from the G-Buffer
    struct SurfaceSample
    {
        glm::vec3       position = glm::vec3( 0.0f ); // world space
        glm::vec3       normal   = glm::vec3( 0.0f ); // world space, normalized
        glm::vec3       albedo   = glm::vec3( 1.0f );
        const Material* material = nullptr;
    };

    /**
     * @brief Deferred lighting over the G-Buffer.
     */
    class Shading
    {
    public:
        /**
         * @brief Ambient + sum of light contributions, clamped to [0, 1].
         * Flat model: diffuse only. Blinn-Phong: diffuse + specular, specular only where the diffuse term is positive.
         */
        static glm::vec3 ShadePixel( const SurfaceSample& sample, const std::vector<Light>& lights, const glm::vec3& cameraPos,
                                     const ShadingConfig& config );

        // Contribution of a single light without ambient and without clamping
        static glm::vec3 ShadeLight( const SurfaceSample& sample, const Light& light, const glm::vec3& cameraPos, ShadingModel model );

        /**
         * @brief Resolves pixels [begin, end) of the G-Buffer into packed colors.
         * Uncovered pixels get the clear color, unlit pixels diffuse * albedo; debug views replace lighting.
         */
        static void ResolveRange( const GBuffer& gbuffer, size_t begin, size_t end, const std::vector<Light>& lights, const glm::vec3& cameraPos,
                                  const ShadingConfig& config, ColorBuffer& out );

        static const Material& GetDefaultMaterial();
    };
} // namespace SoftRaster
