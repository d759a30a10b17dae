#pragma once

#include "pipeline/PipelineTypes.hpp"
#include "scene/Entity.h"
#include <vector>

namespace SoftRaster
{
    struct TransformedVertex
    {
        glm::vec4 clip        = glm::vec4( 0.0f ); // no perspective divide yet
        glm::vec3 worldPos    = glm::vec3( 0.0f );
        glm::vec3 worldNormal = glm::vec3( 0.0f );
        glm::vec3 color       = glm::vec3( 1.0f );
    };

    struct TransformedMesh
    {
        std::vector<TransformedVertex> vertices;
        std::vector<glm::vec3>         faceNormals; // world space, one per tri
    };

    /**
     * @brief Object space -> world -> clip space.
     * Stateless; every call is a pure function of the mesh and the three matrices, so entities can be
     * transformed on different workers without synchronization.
     */
    class TransformStage
    {
    public:
        // Inverse-transpose of the model matrix's upper 3x3; keeps normals perpendicular under non-uniform scale
        static glm::mat3 NormalMatrix( const glm::mat4& model );

        static void TransformMesh( const Mesh& mesh, const glm::mat4& model, const glm::mat4& view, const glm::mat4& projection, TransformedMesh& out );

        // Builds one clip-space triangle per mesh tri, tagged with its material and render mode
        static void AssembleTriangles( const Mesh& mesh, const TransformedMesh& transformed, RenderMode mode, std::vector<ClipTriangle>& out );

        // World-space bounding sphere; radius scaled by the largest axis scale
        static void WorldBounds( const Mesh& mesh, const glm::mat4& model, glm::vec3& outCenter, float& outRadius );
    };
} // namespace SoftRaster
