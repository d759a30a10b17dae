#include "scene/Camera.h"

#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace SoftRaster
{
    static const glm::vec3 WORLD_UP = glm::vec3( 0.0f, 1.0f, 0.0f );

    Camera::Camera()
    {
        RecalculateProjection();
        RecalculateView();
    }

    Camera::Camera( float fov, float aspectRatio, float nearClip, float farClip )
        : m_fov( fov )
        , m_aspectRatio( aspectRatio )
        , m_nearClip( nearClip )
        , m_farClip( farClip )
    {
        RecalculateProjection();
        RecalculateView();
    }

    void Camera::OnResize( uint32_t width, uint32_t height )
    {
        if( height == 0 )
            return;
        m_aspectRatio = static_cast<float>( width ) / static_cast<float>( height );
        RecalculateProjection();
    }

    void Camera::SetPerspective( float fov, float nearClip, float farClip )
    {
        m_fov      = fov;
        m_nearClip = nearClip;
        m_farClip  = farClip;
        RecalculateProjection();
    }

    void Camera::SetPosition( const glm::vec3& position )
    {
        m_position = position;
        RecalculateView();
    }

    void Camera::SetOrientation( const glm::quat& orientation )
    {
        m_orientation = glm::normalize( orientation );
        RecalculateView();
    }

    void Camera::LookAt( const glm::vec3& target )
    {
        glm::vec3 direction = target - m_position;
        float     length    = glm::length( direction );
        if( length <= 0.0f )
            return;
        direction /= length;

        // quatLookAt degenerates when looking straight along the up axis
        glm::vec3 up = std::abs( glm::dot( direction, WORLD_UP ) ) > 0.999f ? glm::vec3( 0.0f, 0.0f, -1.0f ) : WORLD_UP;
        SetOrientation( glm::quatLookAt( direction, up ) );
    }

    void Camera::MoveForward( float distance )
    {
        m_position += GetForward() * distance;
        RecalculateView();
    }

    void Camera::MoveRight( float distance )
    {
        m_position += GetRight() * distance;
        RecalculateView();
    }

    void Camera::MoveUp( float distance )
    {
        m_position += WORLD_UP * distance;
        RecalculateView();
    }

    void Camera::Rotate( float pitch, float yaw )
    {
        // Yaw around world up, pitch around the local right axis
        glm::quat yawRotation   = glm::angleAxis( yaw, WORLD_UP );
        glm::quat pitchRotation = glm::angleAxis( pitch, GetRight() );
        SetOrientation( yawRotation * pitchRotation * m_orientation );
    }

    glm::vec3 Camera::GetForward() const
    {
        return m_orientation * glm::vec3( 0.0f, 0.0f, -1.0f );
    }

    glm::vec3 Camera::GetRight() const
    {
        return m_orientation * glm::vec3( 1.0f, 0.0f, 0.0f );
    }

    glm::vec3 Camera::GetUp() const
    {
        return m_orientation * glm::vec3( 0.0f, 1.0f, 0.0f );
    }

    std::array<glm::vec3, 8> Camera::GetFrustumCorners() const
    {
        float tanHalf    = std::tan( glm::radians( m_fov ) * 0.5f );
        float nearHeight = 2.0f * m_nearClip * tanHalf;
        float nearWidth  = nearHeight * m_aspectRatio;
        float farHeight  = 2.0f * m_farClip * tanHalf;
        float farWidth   = farHeight * m_aspectRatio;

        glm::vec3 forward = GetForward();
        glm::vec3 right   = GetRight();
        glm::vec3 up      = GetUp();

        glm::vec3 nearCenter = m_position + forward * m_nearClip;
        glm::vec3 farCenter  = m_position + forward * m_farClip;

        return { nearCenter + up * ( nearHeight * 0.5f ) - right * ( nearWidth * 0.5f ),
                 nearCenter + up * ( nearHeight * 0.5f ) + right * ( nearWidth * 0.5f ),
                 nearCenter - up * ( nearHeight * 0.5f ) - right * ( nearWidth * 0.5f ),
                 nearCenter - up * ( nearHeight * 0.5f ) + right * ( nearWidth * 0.5f ),
                 farCenter + up * ( farHeight * 0.5f ) - right * ( farWidth * 0.5f ),
                 farCenter + up * ( farHeight * 0.5f ) + right * ( farWidth * 0.5f ),
                 farCenter - up * ( farHeight * 0.5f ) - right * ( farWidth * 0.5f ),
                 farCenter - up * ( farHeight * 0.5f ) + right * ( farWidth * 0.5f ) };
    }

    bool Camera::IsSphereVisible( const glm::vec3& center, float radius ) const
    {
        for( const glm::vec4& plane: m_frustumPlanes )
        {
            if( glm::dot( glm::vec3( plane ), center ) + plane.w < -radius )
                return false;
        }
        return true;
    }

    void Camera::RecalculateView()
    {
        m_viewMatrix     = glm::lookAt( m_position, m_position + GetForward(), GetUp() );
        m_viewProjection = m_projectionMatrix * m_viewMatrix;
        RecalculateFrustum();
    }

    void Camera::RecalculateProjection()
    {
        // Depth in [0, 1]; the viewport transform flips Y for the top-down framebuffer
        m_projectionMatrix = glm::perspectiveRH_ZO( glm::radians( m_fov ), m_aspectRatio, m_nearClip, m_farClip );
        m_viewProjection   = m_projectionMatrix * m_viewMatrix;
        RecalculateFrustum();
    }

    void Camera::RecalculateFrustum()
    {
        // Gribb-Hartmann extraction; glm is column-major so row i is ( m[0][i], m[1][i], m[2][i], m[3][i] )
        const glm::mat4& m   = m_viewProjection;
        auto             row = [ &m ]( int i ) { return glm::vec4( m[ 0 ][ i ], m[ 1 ][ i ], m[ 2 ][ i ], m[ 3 ][ i ] ); };

        glm::vec4 r0 = row( 0 );
        glm::vec4 r1 = row( 1 );
        glm::vec4 r2 = row( 2 );
        glm::vec4 r3 = row( 3 );

        m_frustumPlanes[ PLANE_LEFT ]   = r3 + r0;
        m_frustumPlanes[ PLANE_RIGHT ]  = r3 - r0;
        m_frustumPlanes[ PLANE_BOTTOM ] = r3 + r1;
        m_frustumPlanes[ PLANE_TOP ]    = r3 - r1;
        m_frustumPlanes[ PLANE_NEAR ]   = r2; // 0 <= z
        m_frustumPlanes[ PLANE_FAR ]    = r3 - r2;

        for( glm::vec4& plane: m_frustumPlanes )
        {
            float length = glm::length( glm::vec3( plane ) );
            if( length > 0.0f )
                plane /= length;
        }
    }
} // namespace SoftRaster
