#include "scene/ShapeGenerator.h"

#include "core/Log.h"
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace SoftRaster
{
    namespace
    {
        Mesh Finalized( Mesh&& mesh )
        {
            // Generated data is valid by construction; a failure here is a generator bug
            if( mesh.Finalize() != Result::SUCCESS )
            {
                SR_CORE_ERROR( "ShapeGenerator produced an invalid mesh '{}'.", mesh.GetName() );
            }
            return std::move( mesh );
        }
    } // namespace

    Mesh ShapeGenerator::CreateTriangle( const Material& material )
    {
        Mesh mesh( "Triangle" );
        mesh.AddMaterial( material );

        glm::vec3 normal( 0.0f, 0.0f, 1.0f );
        mesh.AddVertex( { glm::vec3( -0.5f, -0.5f, 0.0f ), normal } );
        mesh.AddVertex( { glm::vec3( 0.5f, -0.5f, 0.0f ), normal } );
        mesh.AddVertex( { glm::vec3( 0.0f, 0.5f, 0.0f ), normal } );
        mesh.AddTri( 0, 1, 2 );

        return Finalized( std::move( mesh ) );
    }

    Mesh ShapeGenerator::CreatePlane( float size, const Material& material )
    {
        Mesh mesh( "Plane" );
        mesh.AddMaterial( material );

        float     s = size * 0.5f;
        glm::vec3 normal( 0.0f, 1.0f, 0.0f );
        mesh.AddVertex( { glm::vec3( -s, 0.0f, s ), normal } );
        mesh.AddVertex( { glm::vec3( s, 0.0f, s ), normal } );
        mesh.AddVertex( { glm::vec3( s, 0.0f, -s ), normal } );
        mesh.AddVertex( { glm::vec3( -s, 0.0f, -s ), normal } );
        mesh.AddTri( 0, 1, 2 );
        mesh.AddTri( 2, 3, 0 );

        return Finalized( std::move( mesh ) );
    }

    Mesh ShapeGenerator::CreateCube( const Material& material )
    {
        Mesh mesh( "Cube" );
        mesh.AddMaterial( material );

        // Helper to push a face (4 vertices + 2 triangles)
        auto addFace = [ & ]( glm::vec3 normal, glm::vec3 v0, glm::vec3 v1, glm::vec3 v2, glm::vec3 v3 ) {
            uint32_t base = mesh.AddVertex( { v0, normal } );
            mesh.AddVertex( { v1, normal } );
            mesh.AddVertex( { v2, normal } );
            mesh.AddVertex( { v3, normal } );

            // CCW winding
            mesh.AddTri( base + 0, base + 1, base + 2 );
            mesh.AddTri( base + 2, base + 3, base + 0 );
        };

        // Half-size for unit cube centered at 0
        float     s = 0.5f;
        glm::vec3 p0( -s, -s, s );
        glm::vec3 p1( s, -s, s );
        glm::vec3 p2( s, s, s );
        glm::vec3 p3( -s, s, s );
        glm::vec3 p4( -s, -s, -s );
        glm::vec3 p5( s, -s, -s );
        glm::vec3 p6( s, s, -s );
        glm::vec3 p7( -s, s, -s );

        // Faces: Front, Back, Right, Left, Top, Bottom
        addFace( { 0, 0, 1 }, p0, p1, p2, p3 );
        addFace( { 0, 0, -1 }, p5, p4, p7, p6 );
        addFace( { 1, 0, 0 }, p1, p5, p6, p2 );
        addFace( { -1, 0, 0 }, p4, p0, p3, p7 );
        addFace( { 0, 1, 0 }, p3, p2, p6, p7 );
        addFace( { 0, -1, 0 }, p4, p5, p1, p0 );

        return Finalized( std::move( mesh ) );
    }

    Mesh ShapeGenerator::CreateOctahedron( const Material& material )
    {
        Mesh mesh( "Octahedron" );
        mesh.AddMaterial( material );

        const glm::vec3 axes[ 6 ] = { { 1, 0, 0 }, { -1, 0, 0 }, { 0, 1, 0 }, { 0, -1, 0 }, { 0, 0, 1 }, { 0, 0, -1 } };

        // Flat shaded: every face gets its own three vertices
        for( int sy: { 2, 3 } )
        {
            for( int sx: { 0, 1 } )
            {
                for( int sz: { 4, 5 } )
                {
                    glm::vec3 a = axes[ sy ];
                    glm::vec3 b = axes[ sx ];
                    glm::vec3 c = axes[ sz ];

                    // Orient outward
                    if( glm::dot( glm::cross( b - a, c - a ), a + b + c ) < 0.0f )
                        std::swap( b, c );

                    glm::vec3 normal = glm::normalize( a + b + c );
                    uint32_t  base   = mesh.AddVertex( { a, normal } );
                    mesh.AddVertex( { b, normal } );
                    mesh.AddVertex( { c, normal } );
                    mesh.AddTri( base, base + 1, base + 2 );
                }
            }
        }

        return Finalized( std::move( mesh ) );
    }

    Mesh ShapeGenerator::CreateSphere( float radius, int stacks, int slices, const Material& material )
    {
        Mesh mesh( "Sphere" );
        mesh.AddMaterial( material );

        // 1. Generate Vertices
        for( int i = 0; i <= stacks; ++i )
        {
            float phi = glm::pi<float>() * float( i ) / float( stacks ); // 0 to PI
            float y   = std::cos( phi );
            float r   = std::sin( phi );

            for( int j = 0; j <= slices; ++j )
            {
                float theta = 2.0f * glm::pi<float>() * float( j ) / float( slices ); // 0 to 2PI
                float x     = r * std::cos( theta );
                float z     = r * std::sin( theta );

                glm::vec3 normal( x, y, z );
                mesh.AddVertex( { normal * radius, normal } );
            }
        }

        // 2. Generate Triangles (pole rows produce zero-area triangles, which the clipper skips)
        for( int i = 0; i < stacks; ++i )
        {
            for( int j = 0; j < slices; ++j )
            {
                uint32_t first  = static_cast<uint32_t>( ( i * ( slices + 1 ) ) + j );
                uint32_t second = first + static_cast<uint32_t>( slices ) + 1;

                mesh.AddTri( first, first + 1, second );
                mesh.AddTri( second, first + 1, second + 1 );
            }
        }

        return Finalized( std::move( mesh ) );
    }
} // namespace SoftRaster
