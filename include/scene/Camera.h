#pragma once
#include "core/Core.h"
#include <array>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace SoftRaster
{

    /**
     * @brief Free-look perspective camera.
     * Right-handed, looks down its local -Z. Projection maps depth to [0, 1].
     * View, projection and frustum planes are recomputed on every mutation, so the getters are plain reads.
     */
    class Camera
    {
    public:
        enum FrustumPlane : uint32_t
        {
            PLANE_LEFT = 0,
            PLANE_RIGHT,
            PLANE_BOTTOM,
            PLANE_TOP,
            PLANE_NEAR,
            PLANE_FAR,
            PLANE_COUNT
        };

        Camera();
        Camera( float fov, float aspectRatio, float nearClip, float farClip );

        void OnResize( uint32_t width, uint32_t height );
        void SetPerspective( float fov, float nearClip, float farClip );

        // Placement
        void SetPosition( const glm::vec3& position );
        void SetOrientation( const glm::quat& orientation );
        void LookAt( const glm::vec3& target );

        // Relative movement, as driven by an input layer
        void MoveForward( float distance );
        void MoveRight( float distance );
        void MoveUp( float distance );
        void Rotate( float pitch, float yaw );

        // Getters
        const glm::mat4& GetView() const { return m_viewMatrix; }
        const glm::mat4& GetProjection() const { return m_projectionMatrix; }
        const glm::mat4& GetViewProjection() const { return m_viewProjection; }
        const glm::vec3& GetPosition() const { return m_position; }
        const glm::quat& GetOrientation() const { return m_orientation; }

        glm::vec3 GetForward() const;
        glm::vec3 GetRight() const;
        glm::vec3 GetUp() const;

        float GetFov() const { return m_fov; }
        float GetAspectRatio() const { return m_aspectRatio; }
        float GetNearClip() const { return m_nearClip; }
        float GetFarClip() const { return m_farClip; }

        /**
         * @brief World-space frustum planes (xyz = inward unit normal, w = distance), extracted from the view-projection matrix.
         * A point p is inside a plane when dot( plane.xyz, p ) + plane.w >= 0.
         */
        const std::array<glm::vec4, PLANE_COUNT>& GetFrustumPlanes() const { return m_frustumPlanes; }

        // Near corners (TL, TR, BL, BR) followed by far corners in the same order
        std::array<glm::vec3, 8> GetFrustumCorners() const;

        bool IsSphereVisible( const glm::vec3& center, float radius ) const;

    private:
        void RecalculateView();
        void RecalculateProjection();
        void RecalculateFrustum();

    private:
        float m_fov         = 60.0f; // vertical, degrees
        float m_aspectRatio = 16.0f / 9.0f;
        float m_nearClip    = 0.1f;
        float m_farClip     = 100.0f;

        glm::mat4 m_viewMatrix       = glm::mat4( 1.0f );
        glm::mat4 m_projectionMatrix = glm::mat4( 1.0f );
        glm::mat4 m_viewProjection   = glm::mat4( 1.0f );

        glm::vec3 m_position    = { 0.0f, 0.0f, 0.0f };
        glm::quat m_orientation = glm::quat( 1.0f, 0.0f, 0.0f, 0.0f );

        std::array<glm::vec4, PLANE_COUNT> m_frustumPlanes{};
    };
} // namespace SoftRaster
