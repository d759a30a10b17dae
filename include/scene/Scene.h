#pragma once
#include "scene/Camera.h"
#include "scene/Entity.h"
#include "scene/Light.h"
#include <vector>

namespace SoftRaster
{
    /**
     * @brief Snapshot of everything rendered in one frame.
     * The renderer only reads it; callers mutate it between frames, never while RenderFrame() runs.
     */
    struct Scene
    {
        Camera              camera;
        std::vector<Entity> entities;
        std::vector<Light>  lights;

        uint64_t GetTriangleCount() const;

        // Every entity must reference a finalized mesh
        Result Validate() const;
    };
} // namespace SoftRaster
