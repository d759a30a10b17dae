#include "scene/Entity.h"

#include <glm/gtc/matrix_transform.hpp>

namespace SoftRaster
{
    glm::mat4 Transform::GetMatrix() const
    {
        glm::mat4 model = glm::translate( glm::mat4( 1.0f ), position );
        model           = model * glm::mat4_cast( rotation );
        return glm::scale( model, scale );
    }

    void Transform::Rotate( const glm::vec3& axis, float angle )
    {
        rotation = glm::normalize( glm::angleAxis( angle, glm::normalize( axis ) ) * rotation );
    }
} // namespace SoftRaster
