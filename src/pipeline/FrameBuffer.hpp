#pragma once

#include "pipeline/GBuffer.hpp"
#include <vector>

namespace SoftRaster
{
    // Clamps to [0, 1] and packs as 0x00RRGGBB
    uint32_t  PackColor( const glm::vec3& color );
    glm::vec3 UnpackColor( uint32_t packed );

    class ColorBuffer
    {
    public:
        void Resize( uint32_t width, uint32_t height );

        void Fill( size_t begin, size_t end, uint32_t packed );
        void Set( size_t index, uint32_t packed ) { m_pixels[ index ] = packed; }

        uint32_t Get( size_t index ) const { return m_pixels[ index ]; }
        uint32_t Get( uint32_t x, uint32_t y ) const { return m_pixels[ static_cast<size_t>( y ) * m_width + x ]; }

        uint32_t GetWidth() const { return m_width; }
        uint32_t GetHeight() const { return m_height; }
        size_t   GetPixelCount() const { return m_pixels.size(); }

        // Row-major 0x00RRGGBB, ready to blit
        const std::vector<uint32_t>& ToPackedRGB() const { return m_pixels; }
        const uint32_t*              Data() const { return m_pixels.data(); }

        void Swap( ColorBuffer& other );

    private:
        uint32_t              m_width  = 0;
        uint32_t              m_height = 0;
        std::vector<uint32_t> m_pixels;
    };

    /**
     * @brief Owns the G-Buffer, the double-buffered color output and the chunk partition.
     *
     * Chunks write the back color buffer and the G-Buffer; Publish() makes the finished frame visible.
     * A frame that is never published leaves the front buffer as it was.
     */
    class FrameBuffer
    {
    public:
        void SetLimits( uint32_t maxWidth, uint32_t maxHeight );

        /**
         * @brief (Re)allocates every buffer and recomputes the chunk partition.
         * Nothing is modified when the call fails.
         * @return INVALID_ARGS for a zero dimension, OUT_OF_MEMORY beyond the configured limits.
         */
        Result Allocate( uint32_t width, uint32_t height, uint32_t chunkCount );

        bool IsAllocated() const { return m_width != 0 && m_height != 0; }

        // Clears the G-Buffer range and the back color range of one chunk
        void ClearChunk( uint32_t chunkIndex, const glm::vec3& clearColor );

        // Swaps front and back color, publishes the depth and bumps the frame index
        void Publish();

        uint32_t GetWidth() const { return m_width; }
        uint32_t GetHeight() const { return m_height; }

        const std::vector<Chunk>& GetChunks() const { return m_chunks; }
        const Chunk&              GetChunk( uint32_t index ) const { return m_chunks[ index ]; }
        uint32_t                  GetChunkCount() const { return static_cast<uint32_t>( m_chunks.size() ); }

        GBuffer&       GetGBuffer() { return m_gbuffer; }
        const GBuffer& GetGBuffer() const { return m_gbuffer; }

        ColorBuffer&       GetBackColor() { return m_back; }
        const ColorBuffer& GetFrontColor() const { return m_front; }

        const std::vector<float>& GetFrontDepth() const { return m_frontDepth; }
        uint64_t                  GetFrameIndex() const { return m_frameIndex; }

        FrameView   GetFront() const;
        GBufferView GetGBufferView() const;

        /**
         * @brief Splits height rows into horizontal bands.
         * chunkCount is clamped to [1, height]; the first (height % count) bands get one extra row.
         */
        static std::vector<Chunk> Partition( uint32_t width, uint32_t height, uint32_t chunkCount );

    private:
        uint32_t m_maxWidth  = 3840;
        uint32_t m_maxHeight = 2160;

        uint32_t m_width  = 0;
        uint32_t m_height = 0;

        std::vector<Chunk> m_chunks;
        GBuffer            m_gbuffer;
        ColorBuffer        m_front;
        ColorBuffer        m_back;
        std::vector<float> m_frontDepth;
        uint64_t           m_frameIndex = 0;
    };
} // namespace SoftRaster
