#include "scene/Camera.h"
#include <cmath>
#include <glm/gtc/constants.hpp>
#include <gtest/gtest.h>

using namespace SoftRaster;

namespace
{
    glm::vec3 Project( const Camera& camera, const glm::vec3& world )
    {
        glm::vec4 clip = camera.GetViewProjection() * glm::vec4( world, 1.0f );
        return glm::vec3( clip ) / clip.w;
    }
} // namespace

class CameraTest : public ::testing::Test
{
protected:
    Camera camera;
};

TEST_F( CameraTest, DefaultLooksDownNegativeZ )
{
    glm::vec3 forward = camera.GetForward();
    EXPECT_NEAR( forward.x, 0.0f, 1e-6f );
    EXPECT_NEAR( forward.y, 0.0f, 1e-6f );
    EXPECT_NEAR( forward.z, -1.0f, 1e-6f );
    EXPECT_NEAR( camera.GetUp().y, 1.0f, 1e-6f );
    EXPECT_NEAR( camera.GetRight().x, 1.0f, 1e-6f );
}

TEST_F( CameraTest, ProjectionMapsDepthToZeroOne )
{
    camera = Camera( 60.0f, 1.0f, 0.5f, 50.0f );

    EXPECT_NEAR( Project( camera, glm::vec3( 0.0f, 0.0f, -0.5f ) ).z, 0.0f, 1e-5f );
    EXPECT_NEAR( Project( camera, glm::vec3( 0.0f, 0.0f, -50.0f ) ).z, 1.0f, 1e-5f );

    float mid = Project( camera, glm::vec3( 0.0f, 0.0f, -5.0f ) ).z;
    EXPECT_GT( mid, 0.0f );
    EXPECT_LT( mid, 1.0f );

    // +Y in world is +Y in NDC
    EXPECT_GT( Project( camera, glm::vec3( 0.0f, 1.0f, -5.0f ) ).y, 0.0f );
}

TEST_F( CameraTest, LookAtPointsForwardAtTarget )
{
    camera.SetPosition( glm::vec3( 0.0f, 3.0f, 8.0f ) );
    camera.LookAt( glm::vec3( 0.0f ) );

    glm::vec3 expected = glm::normalize( glm::vec3( 0.0f, -3.0f, -8.0f ) );
    glm::vec3 forward  = camera.GetForward();
    EXPECT_NEAR( forward.x, expected.x, 1e-5f );
    EXPECT_NEAR( forward.y, expected.y, 1e-5f );
    EXPECT_NEAR( forward.z, expected.z, 1e-5f );

    // The target projects to the screen center
    glm::vec3 ndc = Project( camera, glm::vec3( 0.0f ) );
    EXPECT_NEAR( ndc.x, 0.0f, 1e-5f );
    EXPECT_NEAR( ndc.y, 0.0f, 1e-5f );
}

TEST_F( CameraTest, LookAtStraightDownIsStable )
{
    camera.SetPosition( glm::vec3( 0.0f, 10.0f, 0.0f ) );
    camera.LookAt( glm::vec3( 0.0f ) );

    EXPECT_NEAR( camera.GetForward().y, -1.0f, 1e-5f );
    EXPECT_FALSE( std::isnan( camera.GetView()[ 0 ][ 0 ] ) );
}

TEST_F( CameraTest, MovementFollowsOrientation )
{
    camera.MoveForward( 2.0f );
    EXPECT_NEAR( camera.GetPosition().z, -2.0f, 1e-6f );

    camera.MoveRight( 1.0f );
    EXPECT_NEAR( camera.GetPosition().x, 1.0f, 1e-6f );

    camera.MoveUp( 3.0f );
    EXPECT_NEAR( camera.GetPosition().y, 3.0f, 1e-6f );

    // Yaw a quarter turn to the left: forward becomes -X
    camera.Rotate( 0.0f, glm::half_pi<float>() );
    EXPECT_NEAR( camera.GetForward().x, -1.0f, 1e-5f );
}

TEST_F( CameraTest, FrustumCornersLieInsideAllPlanes )
{
    camera = Camera( 70.0f, 1.5f, 0.1f, 30.0f );
    camera.SetPosition( glm::vec3( 1.0f, 2.0f, 3.0f ) );
    camera.LookAt( glm::vec3( -2.0f, 0.0f, -4.0f ) );

    for( const glm::vec3& corner: camera.GetFrustumCorners() )
    {
        for( const glm::vec4& plane: camera.GetFrustumPlanes() )
        {
            EXPECT_GE( glm::dot( glm::vec3( plane ), corner ) + plane.w, -1e-3f );
        }
    }
}

TEST_F( CameraTest, SphereVisibility )
{
    camera = Camera( 60.0f, 1.0f, 0.1f, 100.0f );

    EXPECT_TRUE( camera.IsSphereVisible( glm::vec3( 0.0f, 0.0f, -5.0f ), 1.0f ) );
    EXPECT_FALSE( camera.IsSphereVisible( glm::vec3( 0.0f, 0.0f, 5.0f ), 1.0f ) );    // behind
    EXPECT_FALSE( camera.IsSphereVisible( glm::vec3( 0.0f, 0.0f, -200.0f ), 1.0f ) ); // past far
    EXPECT_FALSE( camera.IsSphereVisible( glm::vec3( 50.0f, 0.0f, -5.0f ), 1.0f ) );  // off to the side

    // Straddling the near plane still counts
    EXPECT_TRUE( camera.IsSphereVisible( glm::vec3( 0.0f, 0.0f, 0.5f ), 1.0f ) );
}

TEST_F( CameraTest, ResizeUpdatesAspect )
{
    camera.OnResize( 800, 400 );
    EXPECT_FLOAT_EQ( camera.GetAspectRatio(), 2.0f );

    // Zero height is ignored
    camera.OnResize( 800, 0 );
    EXPECT_FLOAT_EQ( camera.GetAspectRatio(), 2.0f );
}
