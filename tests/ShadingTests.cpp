#include "pipeline/Shading.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace SoftRaster;

class ShadingTest : public ::testing::Test
{
protected:
    Material           material;
    std::vector<Light> lights;
    glm::vec3          camera = glm::vec3( 0.0f, 0.0f, 5.0f );

    void SetUp() override
    {
        material.name      = "Red";
        material.ambient   = glm::vec3( 0.0f );
        material.diffuse   = glm::vec3( 1.0f, 0.0f, 0.0f );
        material.specular  = glm::vec3( 1.0f );
        material.shininess = 16.0f;
    }

    SurfaceSample MakeSample( const glm::vec3& normal = glm::vec3( 0.0f, 0.0f, 1.0f ) ) const
    {
        SurfaceSample sample;
        sample.position = glm::vec3( 0.0f );
        sample.normal   = normal;
        sample.albedo   = glm::vec3( 1.0f );
        sample.material = &material;
        return sample;
    }

    static ShadingConfig MakeConfig( ShadingModel model )
    {
        ShadingConfig config;
        config.model            = model;
        config.ambientIntensity = glm::vec3( 0.0f );
        return config;
    }
};

TEST_F( ShadingTest, HeadOnDirectionalLightGivesFullDiffuse )
{
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, -1.0f ) ) );

    glm::vec3 color = Shading::ShadePixel( MakeSample(), lights, camera, MakeConfig( ShadingModel::FLAT ) );
    EXPECT_EQ( PackColor( color ), 0xFF0000u );
}

TEST_F( ShadingTest, LightFromBehindContributesNothing )
{
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, 1.0f ) ) );

    glm::vec3 color = Shading::ShadePixel( MakeSample(), lights, camera, MakeConfig( ShadingModel::BLINN_PHONG ) );
    EXPECT_EQ( color, glm::vec3( 0.0f ) );
}

TEST_F( ShadingTest, AmbientIsAddedOnce )
{
    material.ambient        = glm::vec3( 0.5f );
    ShadingConfig config    = MakeConfig( ShadingModel::BLINN_PHONG );
    config.ambientIntensity = glm::vec3( 0.2f );

    // Two lights that both miss the surface
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, 1.0f ) ) );
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, 1.0f ) ) );

    glm::vec3 color = Shading::ShadePixel( MakeSample(), lights, camera, config );
    EXPECT_NEAR( color.r, 0.1f, 1e-6f );
    EXPECT_NEAR( color.g, 0.1f, 1e-6f );
}

TEST_F( ShadingTest, FlatModelHasNoSpecular )
{
    material.diffuse = glm::vec3( 0.0f );
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, -1.0f ) ) );

    glm::vec3 flat  = Shading::ShadePixel( MakeSample(), lights, camera, MakeConfig( ShadingModel::FLAT ) );
    glm::vec3 phong = Shading::ShadePixel( MakeSample(), lights, camera, MakeConfig( ShadingModel::BLINN_PHONG ) );

    EXPECT_EQ( flat, glm::vec3( 0.0f ) );
    // Light, normal and viewer aligned: N.H = 1
    EXPECT_NEAR( phong.r, 1.0f, 1e-5f );
    EXPECT_NEAR( phong.g, 1.0f, 1e-5f );
}

TEST_F( ShadingTest, PointLightAttenuates )
{
    Attenuation attenuation;
    attenuation.constant  = 1.0f;
    attenuation.linear    = 0.0f;
    attenuation.quadratic = 1.0f;

    Light closeLight   = Light::Point( glm::vec3( 0.0f, 0.0f, 1.0f ), attenuation );
    Light distantLight = Light::Point( glm::vec3( 0.0f, 0.0f, 3.0f ), attenuation );

    float closeRed   = Shading::ShadeLight( MakeSample(), closeLight, camera, ShadingModel::FLAT ).r;
    float distantRed = Shading::ShadeLight( MakeSample(), distantLight, camera, ShadingModel::FLAT ).r;

    EXPECT_NEAR( closeRed, 0.5f, 1e-6f );           // 1 / (1 + 1)
    EXPECT_NEAR( distantRed, 1.0f / 10.0f, 1e-6f ); // 1 / (1 + 9)
}

TEST_F( ShadingTest, AttenuationNeverAmplifies )
{
    Attenuation attenuation;
    attenuation.constant  = 0.1f;
    attenuation.linear    = 0.0f;
    attenuation.quadratic = 0.0f;
    EXPECT_FLOAT_EQ( attenuation.Evaluate( 0.5f ), 1.0f );
}

TEST_F( ShadingTest, SpotLightPointedAwayContributesNothing )
{
    // 30 degree cone above the surface, pointing up and away from it
    Light spot = Light::Spot( glm::vec3( 0.0f, 0.0f, 2.0f ), glm::vec3( 0.0f, 0.0f, 1.0f ), 30.0f );

    glm::vec3 contribution = Shading::ShadeLight( MakeSample(), spot, camera, ShadingModel::BLINN_PHONG );
    EXPECT_EQ( contribution, glm::vec3( 0.0f ) );

    // Same light aimed at the surface does light it
    Light aimed = Light::Spot( glm::vec3( 0.0f, 0.0f, 2.0f ), glm::vec3( 0.0f, 0.0f, -1.0f ), 30.0f );
    EXPECT_GT( Shading::ShadeLight( MakeSample(), aimed, camera, ShadingModel::FLAT ).r, 0.0f );
}

TEST_F( ShadingTest, SpotConeFalloff )
{
    SpotLight spot;
    spot.direction   = glm::vec3( 0.0f, -1.0f, 0.0f );
    spot.innerCutoff = std::cos( glm::radians( 10.0f ) );
    spot.outerCutoff = std::cos( glm::radians( 20.0f ) );

    EXPECT_FLOAT_EQ( spot.ConeFactor( glm::vec3( 0.0f, -1.0f, 0.0f ) ), 1.0f );

    float     angle   = glm::radians( 15.0f );
    glm::vec3 between = glm::vec3( std::sin( angle ), -std::cos( angle ), 0.0f );
    float     factor  = spot.ConeFactor( between );
    EXPECT_GT( factor, 0.0f );
    EXPECT_LT( factor, 1.0f );

    angle = glm::radians( 25.0f );
    EXPECT_FLOAT_EQ( spot.ConeFactor( glm::vec3( std::sin( angle ), -std::cos( angle ), 0.0f ) ), 0.0f );
}

TEST_F( ShadingTest, ResultIsClamped )
{
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, -1.0f ), glm::vec3( 1.0f ), 10.0f ) );

    glm::vec3 color = Shading::ShadePixel( MakeSample(), lights, camera, MakeConfig( ShadingModel::BLINN_PHONG ) );
    EXPECT_LE( color.r, 1.0f );
    EXPECT_LE( color.g, 1.0f );
    EXPECT_GE( color.b, 0.0f );
}

TEST_F( ShadingTest, ResolveHandlesCoverageUnlitAndDebugViews )
{
    GBuffer gbuffer;
    gbuffer.Allocate( 4, 1 );

    Fragment lit;
    lit.x        = 0;
    lit.depth    = 0.25f;
    lit.normal   = glm::vec3( 0.0f, 0.0f, 1.0f );
    lit.color    = glm::vec3( 1.0f );
    lit.material = &material;
    ASSERT_TRUE( gbuffer.TestAndWrite( lit ) );

    Fragment unlit = lit;
    unlit.x        = 1;
    unlit.color    = glm::vec3( 0.5f );
    unlit.unlit    = true;
    ASSERT_TRUE( gbuffer.TestAndWrite( unlit ) );

    ColorBuffer colors;
    colors.Resize( 4, 1 );
    lights.push_back( Light::Directional( glm::vec3( 0.0f, 0.0f, -1.0f ) ) );

    ShadingConfig config = MakeConfig( ShadingModel::FLAT );
    config.clearColor    = glm::vec3( 0.0f, 0.0f, 1.0f );
    Shading::ResolveRange( gbuffer, 0, 4, lights, camera, config, colors );

    EXPECT_EQ( colors.Get( 0u ), 0xFF0000u );
    EXPECT_EQ( colors.Get( 1u ), PackColor( glm::vec3( 0.5f, 0.0f, 0.0f ) ) ); // diffuse * albedo
    EXPECT_EQ( colors.Get( 2u ), 0x0000FFu );
    EXPECT_EQ( colors.Get( 3u ), 0x0000FFu );

    config.debugView = DebugView::NORMALS;
    Shading::ResolveRange( gbuffer, 0, 4, lights, camera, config, colors );
    EXPECT_EQ( colors.Get( 0u ), PackColor( glm::vec3( 0.5f, 0.5f, 1.0f ) ) );
    EXPECT_EQ( colors.Get( 2u ), 0x0000FFu );

    config.debugView = DebugView::DEPTH;
    Shading::ResolveRange( gbuffer, 0, 4, lights, camera, config, colors );
    EXPECT_EQ( colors.Get( 0u ), PackColor( glm::vec3( 0.75f ) ) );
}
