#include "pipeline/FrameBuffer.hpp"

#include "core/Log.h"
#include <algorithm>
#include <new>

namespace SoftRaster
{
    uint32_t PackColor( const glm::vec3& color )
    {
        glm::vec3 c = glm::clamp( color, glm::vec3( 0.0f ), glm::vec3( 1.0f ) );
        uint32_t  r = static_cast<uint32_t>( c.r * 255.0f + 0.5f );
        uint32_t  g = static_cast<uint32_t>( c.g * 255.0f + 0.5f );
        uint32_t  b = static_cast<uint32_t>( c.b * 255.0f + 0.5f );
        return ( r << 16 ) | ( g << 8 ) | b;
    }

    glm::vec3 UnpackColor( uint32_t packed )
    {
        return glm::vec3( static_cast<float>( ( packed >> 16 ) & 0xFF ), static_cast<float>( ( packed >> 8 ) & 0xFF ),
                          static_cast<float>( packed & 0xFF ) ) /
               255.0f;
    }

    void ColorBuffer::Resize( uint32_t width, uint32_t height )
    {
        m_width  = width;
        m_height = height;
        m_pixels.assign( static_cast<size_t>( width ) * height, 0u );
    }

    void ColorBuffer::Fill( size_t begin, size_t end, uint32_t packed )
    {
        end = std::min( end, m_pixels.size() );
        if( begin < end )
            std::fill( m_pixels.begin() + begin, m_pixels.begin() + end, packed );
    }

    void ColorBuffer::Swap( ColorBuffer& other )
    {
        std::swap( m_width, other.m_width );
        std::swap( m_height, other.m_height );
        m_pixels.swap( other.m_pixels );
    }

    void FrameBuffer::SetLimits( uint32_t maxWidth, uint32_t maxHeight )
    {
        m_maxWidth  = maxWidth;
        m_maxHeight = maxHeight;
    }

    Result FrameBuffer::Allocate( uint32_t width, uint32_t height, uint32_t chunkCount )
    {
        if( width == 0 || height == 0 )
        {
            SR_CORE_ERROR( "FrameBuffer: invalid resolution {}x{}.", width, height );
            return Result::INVALID_ARGS;
        }

        if( width > m_maxWidth || height > m_maxHeight )
        {
            SR_CORE_ERROR( "FrameBuffer: resolution {}x{} exceeds the limit of {}x{}.", width, height, m_maxWidth, m_maxHeight );
            return Result::OUT_OF_MEMORY;
        }

        // Build everything aside first so a failed allocation leaves the current buffers intact
        GBuffer            gbuffer;
        ColorBuffer        front;
        ColorBuffer        back;
        std::vector<float> frontDepth;
        try
        {
            gbuffer.Allocate( width, height );
            front.Resize( width, height );
            back.Resize( width, height );
            frontDepth.assign( static_cast<size_t>( width ) * height, GBuffer::CLEAR_DEPTH );
        }
        catch( const std::bad_alloc& )
        {
            SR_CORE_ERROR( "FrameBuffer: out of memory allocating {}x{}.", width, height );
            return Result::OUT_OF_MEMORY;
        }

        m_width      = width;
        m_height     = height;
        m_gbuffer    = std::move( gbuffer );
        m_front      = std::move( front );
        m_back       = std::move( back );
        m_frontDepth = std::move( frontDepth );
        m_chunks     = Partition( width, height, chunkCount );

        SR_CORE_INFO( "FrameBuffer allocated: {}x{}, {} chunks.", width, height, m_chunks.size() );
        return Result::SUCCESS;
    }

    std::vector<Chunk> FrameBuffer::Partition( uint32_t width, uint32_t height, uint32_t chunkCount )
    {
        std::vector<Chunk> chunks;
        if( height == 0 )
            return chunks;

        const uint32_t count     = std::clamp( chunkCount, 1u, height );
        const uint32_t baseRows  = height / count;
        const uint32_t extraRows = height % count;

        chunks.reserve( count );
        uint32_t row = 0;
        for( uint32_t i = 0; i < count; ++i )
        {
            Chunk chunk;
            chunk.index    = i;
            chunk.width    = width;
            chunk.rowBegin = row;
            chunk.rowEnd   = row + baseRows + ( i < extraRows ? 1u : 0u );
            row            = chunk.rowEnd;
            chunks.push_back( chunk );
        }
        return chunks;
    }

    void FrameBuffer::ClearChunk( uint32_t chunkIndex, const glm::vec3& clearColor )
    {
        SR_CORE_ASSERT( chunkIndex < m_chunks.size(), "FrameBuffer::ClearChunk index out of range." );
        const Chunk& chunk = m_chunks[ chunkIndex ];
        SR_CORE_ASSERT( chunk.GetPixelEnd() <= static_cast<size_t>( m_width ) * m_height, "Chunk extends past the frame." );
        m_gbuffer.ClearRange( chunk.GetPixelBegin(), chunk.GetPixelEnd() );
        m_back.Fill( chunk.GetPixelBegin(), chunk.GetPixelEnd(), PackColor( clearColor ) );
    }

    void FrameBuffer::Publish()
    {
        m_front.Swap( m_back );
        // Every chunk clears its own depth range before rasterizing, so the stale values swapped in are never read
        m_frontDepth.swap( m_gbuffer.GetDepthBuffer() );
        m_frameIndex++;
    }

    FrameView FrameBuffer::GetFront() const
    {
        FrameView view;
        if( !IsAllocated() )
            return view;

        view.width      = m_width;
        view.height     = m_height;
        view.colors     = m_front.Data();
        view.depth      = m_frontDepth.data();
        view.frameIndex = m_frameIndex;
        return view;
    }

    GBufferView FrameBuffer::GetGBufferView() const
    {
        if( !IsAllocated() )
            return GBufferView{};

        GBufferView view = m_gbuffer.GetView();
        view.depth       = m_frontDepth.data();
        return view;
    }
} // namespace SoftRaster
