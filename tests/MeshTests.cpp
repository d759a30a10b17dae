#include "scene/Mesh.h"
#include "scene/ShapeGenerator.h"
#include <cmath>
#include <gtest/gtest.h>

using namespace SoftRaster;

namespace
{
    Mesh MakeQuad()
    {
        Mesh mesh( "Quad" );
        mesh.AddVertex( { glm::vec3( 0, 0, 0 ) } );
        mesh.AddVertex( { glm::vec3( 1, 0, 0 ) } );
        mesh.AddVertex( { glm::vec3( 1, 1, 0 ) } );
        mesh.AddVertex( { glm::vec3( 0, 1, 0 ) } );
        mesh.AddTri( 0, 1, 2 );
        mesh.AddTri( 2, 3, 0 );
        return mesh;
    }
} // namespace

TEST( MeshTest, FinalizeComputesDerivedData )
{
    Mesh mesh = MakeQuad();
    ASSERT_EQ( mesh.Finalize(), Result::SUCCESS );
    EXPECT_TRUE( mesh.IsFinalized() );

    // A default material is supplied
    ASSERT_EQ( mesh.GetMaterials().size(), 1u );
    EXPECT_EQ( mesh.GetMaterials()[ 0 ].name, "Default" );

    // CCW in the XY plane faces +Z
    for( const Tri& tri: mesh.GetTris() )
    {
        EXPECT_NEAR( tri.faceNormal.z, 1.0f, 1e-6f );
    }

    // Missing vertex normals are rebuilt from the faces
    for( const Vertex& v: mesh.GetVertices() )
    {
        EXPECT_NEAR( v.normal.x, 0.0f, 1e-6f );
        EXPECT_NEAR( v.normal.y, 0.0f, 1e-6f );
        EXPECT_NEAR( v.normal.z, 1.0f, 1e-6f );
    }

    EXPECT_NEAR( mesh.GetBoundsCenter().x, 0.5f, 1e-6f );
    EXPECT_NEAR( mesh.GetBoundsCenter().y, 0.5f, 1e-6f );
    EXPECT_NEAR( mesh.GetBoundsRadius(), std::sqrt( 0.5f ), 1e-5f );
}

TEST( MeshTest, AuthoredNormalsAreKeptNormalized )
{
    Mesh mesh( "Authored" );
    mesh.AddVertex( { glm::vec3( 0, 0, 0 ), glm::vec3( 0, 2, 0 ) } );
    mesh.AddVertex( { glm::vec3( 1, 0, 0 ), glm::vec3( 0, 2, 0 ) } );
    mesh.AddVertex( { glm::vec3( 0, 1, 0 ), glm::vec3( 0, 2, 0 ) } );
    mesh.AddTri( 0, 1, 2 );
    ASSERT_EQ( mesh.Finalize(), Result::SUCCESS );

    for( const Vertex& v: mesh.GetVertices() )
    {
        EXPECT_NEAR( v.normal.y, 1.0f, 1e-6f );
    }
}

TEST( MeshTest, RejectsEmptyMesh )
{
    Mesh noVertices( "Empty" );
    EXPECT_EQ( noVertices.Finalize(), Result::INVALID_ARGS );
    EXPECT_FALSE( noVertices.IsFinalized() );

    Mesh noTris( "NoTris" );
    noTris.AddVertex( { glm::vec3( 0.0f ) } );
    EXPECT_EQ( noTris.Finalize(), Result::INVALID_ARGS );
}

TEST( MeshTest, RejectsOutOfRangeIndices )
{
    Mesh badVertex = MakeQuad();
    badVertex.AddTri( 0, 1, 4 );
    EXPECT_EQ( badVertex.Finalize(), Result::INVALID_ARGS );
    EXPECT_FALSE( badVertex.IsFinalized() );

    Mesh badMaterial = MakeQuad();
    badMaterial.AddTri( 0, 1, 2, 3 );
    EXPECT_EQ( badMaterial.Finalize(), Result::INVALID_ARGS );
}

TEST( MeshTest, EditingClearsFinalizedState )
{
    Mesh mesh = MakeQuad();
    ASSERT_EQ( mesh.Finalize(), Result::SUCCESS );
    mesh.AddTri( 0, 2, 3 );
    EXPECT_FALSE( mesh.IsFinalized() );
}

TEST( ShapeGeneratorTest, BuiltInShapesAreFinalized )
{
    Mesh triangle   = ShapeGenerator::CreateTriangle();
    Mesh plane      = ShapeGenerator::CreatePlane( 2.0f );
    Mesh cube       = ShapeGenerator::CreateCube();
    Mesh octahedron = ShapeGenerator::CreateOctahedron();
    Mesh sphere     = ShapeGenerator::CreateSphere( 1.0f, 8, 16 );

    EXPECT_TRUE( triangle.IsFinalized() );
    EXPECT_TRUE( plane.IsFinalized() );
    EXPECT_TRUE( cube.IsFinalized() );
    EXPECT_TRUE( octahedron.IsFinalized() );
    EXPECT_TRUE( sphere.IsFinalized() );

    EXPECT_EQ( triangle.GetTriCount(), 1u );
    EXPECT_EQ( plane.GetTriCount(), 2u );
    EXPECT_EQ( cube.GetTriCount(), 12u );
    EXPECT_EQ( octahedron.GetTriCount(), 8u );
    EXPECT_EQ( sphere.GetTriCount(), 8u * 16u * 2u );
}

// Every closed shape is wound counter-clockwise seen from outside
TEST( ShapeGeneratorTest, ClosedShapesFaceOutward )
{
    for( const Mesh& mesh: { ShapeGenerator::CreateCube(), ShapeGenerator::CreateOctahedron(), ShapeGenerator::CreateSphere( 1.0f, 8, 16 ) } )
    {
        for( const Tri& tri: mesh.GetTris() )
        {
            const glm::vec3& p0 = mesh.GetVertices()[ tri.indices[ 0 ] ].position;
            const glm::vec3& p1 = mesh.GetVertices()[ tri.indices[ 1 ] ].position;
            const glm::vec3& p2 = mesh.GetVertices()[ tri.indices[ 2 ] ].position;
            if( glm::length( glm::cross( p1 - p0, p2 - p0 ) ) < 1e-4f )
                continue; // pole slivers

            glm::vec3 centroid = ( p0 + p1 + p2 ) / 3.0f;
            EXPECT_GT( glm::dot( tri.faceNormal, centroid ), 0.0f ) << mesh.GetName();
        }
    }
}

TEST( ShapeGeneratorTest, MaterialIsAttached )
{
    Material red;
    red.name    = "Red";
    red.diffuse = glm::vec3( 1.0f, 0.0f, 0.0f );

    Mesh cube = ShapeGenerator::CreateCube( red );
    ASSERT_EQ( cube.GetMaterials().size(), 1u );
    EXPECT_EQ( cube.GetMaterials()[ 0 ].name, "Red" );
    for( const Tri& tri: cube.GetTris() )
        EXPECT_EQ( tri.material, 0u );
}
