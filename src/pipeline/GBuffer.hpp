#pragma once

#include "pipeline/PipelineTypes.hpp"
#include <limits>
#include <vector>

namespace SoftRaster
{
    /**
     * @brief Per-pixel geometry channels written by the rasterizer and read by the shading resolve.
     * Structure of arrays; pixel i lives at index y * width + x in every channel.
     * Workers only touch the pixel range of their own chunk, so no locking is needed.
     */
    class GBuffer
    {
    public:
        static constexpr float CLEAR_DEPTH = std::numeric_limits<float>::infinity();

        void Allocate( uint32_t width, uint32_t height );

        // Resets depth to +inf and flags to none for pixels [begin, end)
        void ClearRange( size_t begin, size_t end );

        /**
         * @brief Depth test and write.
         * Strictly less-than: a fragment at equal depth does not overwrite. Depth outside [0, 1] is rejected.
         * @return true if the fragment was stored.
         */
        bool TestAndWrite( const Fragment& fragment );

        uint32_t GetWidth() const { return m_width; }
        uint32_t GetHeight() const { return m_height; }
        size_t   GetPixelCount() const { return m_depth.size(); }
        size_t   GetIndex( uint32_t x, uint32_t y ) const { return static_cast<size_t>( y ) * m_width + x; }

        float            GetDepth( size_t index ) const { return m_depth[ index ]; }
        const glm::vec3& GetNormal( size_t index ) const { return m_normal[ index ]; }
        const glm::vec3& GetPosition( size_t index ) const { return m_position[ index ]; }
        const glm::vec3& GetAlbedo( size_t index ) const { return m_albedo[ index ]; }
        const Material*  GetMaterial( size_t index ) const { return m_material[ index ]; }
        uint8_t          GetFlags( size_t index ) const { return m_flags[ index ]; }
        bool             IsCovered( size_t index ) const { return ( m_flags[ index ] & GBUFFER_FLAG_COVERED ) != 0; }

        const std::vector<float>& GetDepthBuffer() const { return m_depth; }
        std::vector<float>&       GetDepthBuffer() { return m_depth; }

        // Channels for debug views. Depth is left out; FrameBuffer publishes it.
        GBufferView GetView() const;

    private:
        uint32_t m_width  = 0;
        uint32_t m_height = 0;

        std::vector<float>           m_depth;
        std::vector<glm::vec3>       m_normal;
        std::vector<glm::vec3>       m_position;
        std::vector<glm::vec3>       m_albedo;
        std::vector<const Material*> m_material;
        std::vector<uint8_t>         m_flags;
    };
} // namespace SoftRaster
