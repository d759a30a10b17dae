#pragma once

#include "core/Core.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace SoftRaster
{
    struct Vertex
    {
        glm::vec3 position = glm::vec3( 0.0f );
        glm::vec3 normal   = glm::vec3( 0.0f ); // zero = derive from faces in Finalize()
        glm::vec3 color    = glm::vec3( 1.0f );
        glm::vec2 uv       = glm::vec2( 0.0f ); // reserved
    };

    struct Material
    {
        std::string name      = "Default";
        glm::vec3   ambient   = glm::vec3( 1.0f );
        glm::vec3   diffuse   = glm::vec3( 0.8f );
        glm::vec3   specular  = glm::vec3( 0.5f );
        float       shininess = 32.0f;
    };

    struct Tri
    {
        uint32_t  indices[ 3 ] = { 0, 0, 0 };
        glm::vec3 faceNormal   = glm::vec3( 0.0f ); // object space, set by Mesh::Finalize()
        uint32_t  material     = 0;                 // index into Mesh materials
    };

    /**
     * @brief Indexed triangle mesh.
     * Built through the Add* methods, then validated once with Finalize(). A finalized mesh is
     * immutable and may be shared read-only by any number of entities.
     */
    class Mesh
    {
    public:
        Mesh() = default;
        explicit Mesh( std::string name );

        uint32_t AddVertex( const Vertex& vertex );
        uint32_t AddMaterial( const Material& material );
        void     AddTri( uint32_t i0, uint32_t i1, uint32_t i2, uint32_t material = 0 );

        /**
         * @brief Validates indices and computes derived data (face normals, missing vertex normals, bounds).
         * @return INVALID_ARGS for an empty mesh or an out-of-range vertex/material index.
         */
        Result Finalize();

        bool IsFinalized() const { return m_finalized; }

        const std::string&           GetName() const { return m_name; }
        const std::vector<Vertex>&   GetVertices() const { return m_vertices; }
        const std::vector<Tri>&      GetTris() const { return m_tris; }
        const std::vector<Material>& GetMaterials() const { return m_materials; }
        uint32_t                     GetTriCount() const { return static_cast<uint32_t>( m_tris.size() ); }

        // Object-space bounding sphere (valid after Finalize)
        const glm::vec3& GetBoundsCenter() const { return m_boundsCenter; }
        float            GetBoundsRadius() const { return m_boundsRadius; }

    private:
        void ComputeFaceNormals();
        void ComputeVertexNormals();
        void ComputeBounds();

    private:
        std::string           m_name = "Mesh";
        std::vector<Vertex>   m_vertices;
        std::vector<Tri>      m_tris;
        std::vector<Material> m_materials;

        glm::vec3 m_boundsCenter = glm::vec3( 0.0f );
        float     m_boundsRadius = 0.0f;
        bool      m_finalized    = false;
    };
} // namespace SoftRaster
