#pragma once
#include "scene/Mesh.h"

namespace SoftRaster
{
    /**
     * @brief Procedural test geometry. Every mesh is returned finalized, CCW wound and facing outward.
     */
    class ShapeGenerator
    {
    public:
        static Mesh CreateTriangle( const Material& material = {} );
        static Mesh CreatePlane( float size, const Material& material = {} );
        static Mesh CreateCube( const Material& material = {} );
        static Mesh CreateOctahedron( const Material& material = {} );
        static Mesh CreateSphere( float radius, int stacks, int slices, const Material& material = {} );
    };
} // namespace SoftRaster
