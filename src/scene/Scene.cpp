#include "scene/Scene.h"

#include "core/Log.h"

namespace SoftRaster
{
    uint64_t Scene::GetTriangleCount() const
    {
        uint64_t count = 0;
        for( const Entity& entity: entities )
        {
            if( entity.mesh )
                count += entity.mesh->GetTriCount();
        }
        return count;
    }

    Result Scene::Validate() const
    {
        for( size_t i = 0; i < entities.size(); ++i )
        {
            const Entity& entity = entities[ i ];
            if( !entity.mesh )
            {
                SR_ERROR( "Entity {} ('{}') has no mesh.", i, entity.name );
                return Result::INVALID_ARGS;
            }
            if( !entity.mesh->IsFinalized() )
            {
                SR_ERROR( "Entity {} ('{}') uses mesh '{}' which was not finalized.", i, entity.name, entity.mesh->GetName() );
                return Result::INVALID_ARGS;
            }
        }
        return Result::SUCCESS;
    }
} // namespace SoftRaster
