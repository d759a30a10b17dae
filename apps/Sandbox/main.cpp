#include <SoftRaster.h>
#include <core/Log.h>
#include <scene/ShapeGenerator.h>

#include <glm/gtc/constants.hpp>

namespace
{
    SoftRaster::Material MakeMaterial( const char* name, const glm::vec3& diffuse, float shininess )
    {
        SoftRaster::Material material;
        material.name      = name;
        material.ambient   = diffuse;
        material.diffuse   = diffuse;
        material.specular  = glm::vec3( 0.6f );
        material.shininess = shininess;
        return material;
    }

    SoftRaster::Entity MakeEntity( const char* name, SoftRaster::Mesh mesh, const glm::vec3& position, SoftRaster::RenderMode mode )
    {
        SoftRaster::Entity entity;
        entity.name               = name;
        entity.mesh               = SoftRaster::CreateRef<const SoftRaster::Mesh>( std::move( mesh ) );
        entity.transform.position = position;
        entity.renderMode         = mode;
        return entity;
    }

    // Average brightness of the published frame, 0..1
    float AverageLuminance( const SoftRaster::FrameView& frame )
    {
        if( !frame.IsValid() )
            return 0.0f;

        const size_t count = static_cast<size_t>( frame.width ) * frame.height;
        double       sum   = 0.0;
        for( size_t i = 0; i < count; ++i )
        {
            uint32_t c = frame.colors[ i ];
            sum += 0.2126 * ( ( c >> 16 ) & 0xFF ) + 0.7152 * ( ( c >> 8 ) & 0xFF ) + 0.0722 * ( c & 0xFF );
        }
        return static_cast<float>( sum / ( 255.0 * static_cast<double>( count ) ) );
    }
} // namespace

int main()
{
    SoftRaster::SoftRaster       renderer;
    SoftRaster::SoftRasterConfig config;
    config.width            = 640;
    config.height           = 360;
    config.ambientIntensity = glm::vec3( 0.08f );
    config.clearColor       = glm::vec3( 0.05f, 0.05f, 0.08f );

    if( renderer.Initialize( config ) != SoftRaster::Result::SUCCESS )
        return 1;

    SR_INFO( "Starting Sandbox..." );

    // Scene
    SoftRaster::Scene scene;
    scene.camera = SoftRaster::Camera( 60.0f, static_cast<float>( config.width ) / static_cast<float>( config.height ), 0.1f, 100.0f );
    scene.camera.SetPosition( glm::vec3( 0.0f, 3.0f, 8.0f ) );
    scene.camera.LookAt( glm::vec3( 0.0f, 0.0f, 0.0f ) );

    scene.entities.push_back( MakeEntity( "Floor", SoftRaster::ShapeGenerator::CreatePlane( 12.0f, MakeMaterial( "Floor", glm::vec3( 0.6f ), 8.0f ) ),
                                          glm::vec3( 0.0f, -1.0f, 0.0f ), SoftRaster::RenderMode::SOLID ) );
    scene.entities.push_back( MakeEntity( "Cube", SoftRaster::ShapeGenerator::CreateCube( MakeMaterial( "Red", glm::vec3( 0.9f, 0.2f, 0.2f ), 32.0f ) ),
                                          glm::vec3( -2.5f, 0.0f, 0.0f ), SoftRaster::RenderMode::SOLID ) );
    scene.entities.push_back(
        MakeEntity( "Sphere", SoftRaster::ShapeGenerator::CreateSphere( 1.0f, 16, 32, MakeMaterial( "Green", glm::vec3( 0.2f, 0.9f, 0.3f ), 64.0f ) ),
                    glm::vec3( 0.0f, 0.0f, 0.0f ), SoftRaster::RenderMode::FIXED_POINT ) );
    scene.entities.push_back( MakeEntity( "Octahedron",
                                          SoftRaster::ShapeGenerator::CreateOctahedron( MakeMaterial( "Blue", glm::vec3( 0.3f, 0.4f, 1.0f ), 16.0f ) ),
                                          glm::vec3( 2.5f, 0.0f, 0.0f ), SoftRaster::RenderMode::WIREFRAME ) );

    for( const SoftRaster::Entity& entity: scene.entities )
    {
        if( !entity.mesh->IsFinalized() )
        {
            SR_ERROR( "Sandbox: mesh '{}' failed to build.", entity.mesh->GetName() );
            renderer.Shutdown();
            return 1;
        }
    }

    scene.lights.push_back( SoftRaster::Light::Directional( glm::vec3( -0.4f, -1.0f, -0.3f ), glm::vec3( 1.0f ), 0.7f ) );
    scene.lights.push_back( SoftRaster::Light::Point( glm::vec3( 3.0f, 2.0f, 0.0f ), {}, glm::vec3( 1.0f, 0.8f, 0.6f ), 1.5f ) );
    scene.lights.push_back(
        SoftRaster::Light::Spot( glm::vec3( 0.0f, 5.0f, 0.0f ), glm::vec3( 0.0f, -1.0f, 0.0f ), 25.0f, 5.0f, {}, glm::vec3( 0.6f, 0.7f, 1.0f ), 2.0f ) );

    // Main loop
    const uint32_t frameCount = 120;
    const float    dt         = 1.0f / 60.0f;
    float          totalMs    = 0.0f;

    for( uint32_t frame = 0; frame < frameCount; ++frame )
    {
        // 1. Animate
        scene.entities[ 1 ].transform.Rotate( glm::vec3( 0.0f, 1.0f, 0.0f ), dt );
        scene.entities[ 2 ].transform.Rotate( glm::vec3( 1.0f, 0.0f, 0.0f ), 0.5f * dt );
        scene.entities[ 3 ].transform.Rotate( glm::vec3( 0.0f, 1.0f, 0.0f ), -dt );
        scene.lights[ 1 ].Orbit( glm::vec3( 0.0f ), 3.0f, glm::half_pi<float>(), dt );

        // Cycle the debug views on the last frames
        if( frame == frameCount - 2 )
            renderer.SetDebugView( SoftRaster::DebugView::NORMALS );
        else if( frame == frameCount - 1 )
            renderer.SetDebugView( SoftRaster::DebugView::DEPTH );

        // 2. Render
        SoftRaster::Result result = renderer.RenderFrame( scene );
        if( result != SoftRaster::Result::SUCCESS )
        {
            SR_ERROR( "Sandbox: frame {} failed: {}", frame, SoftRaster::toString( result ) );
            break;
        }

        const SoftRaster::FrameStats& stats = renderer.GetFrameStats();
        totalMs += stats.totalMs;

        if( frame % 30 == 0 )
        {
            SR_INFO( "Frame {}: {} triangles, {} fragments, {:.2f} ms, luminance {:.3f}", stats.frameIndex, stats.trianglesOut, stats.fragmentsWritten,
                     stats.totalMs, AverageLuminance( renderer.GetFrame() ) );
        }
    }

    SR_INFO( "Average frame time: {:.2f} ms", totalMs / static_cast<float>( frameCount ) );
    SR_INFO( "Sandbox closing..." );
    renderer.Shutdown();

    return 0;
}
