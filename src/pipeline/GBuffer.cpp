#include "pipeline/GBuffer.hpp"

#include <algorithm>

namespace SoftRaster
{
    void GBuffer::Allocate( uint32_t width, uint32_t height )
    {
        m_width  = width;
        m_height = height;

        const size_t count = static_cast<size_t>( width ) * height;
        m_depth.assign( count, CLEAR_DEPTH );
        m_normal.assign( count, glm::vec3( 0.0f ) );
        m_position.assign( count, glm::vec3( 0.0f ) );
        m_albedo.assign( count, glm::vec3( 0.0f ) );
        m_material.assign( count, nullptr );
        m_flags.assign( count, GBUFFER_FLAG_NONE );
    }

    void GBuffer::ClearRange( size_t begin, size_t end )
    {
        end = std::min( end, m_depth.size() );
        if( begin >= end )
            return;

        std::fill( m_depth.begin() + begin, m_depth.begin() + end, CLEAR_DEPTH );
        std::fill( m_flags.begin() + begin, m_flags.begin() + end, static_cast<uint8_t>( GBUFFER_FLAG_NONE ) );
        std::fill( m_material.begin() + begin, m_material.begin() + end, nullptr );
    }

    bool GBuffer::TestAndWrite( const Fragment& fragment )
    {
        if( fragment.x >= m_width || fragment.y >= m_height )
            return false;

        // Written so that NaN fails too
        if( !( fragment.depth >= 0.0f && fragment.depth <= 1.0f ) )
            return false;

        const size_t index = GetIndex( fragment.x, fragment.y );
        if( !( fragment.depth < m_depth[ index ] ) )
            return false;

        m_depth[ index ]    = fragment.depth;
        m_normal[ index ]   = fragment.normal;
        m_position[ index ] = fragment.worldPos;
        m_albedo[ index ]   = fragment.color;
        m_material[ index ] = fragment.material;
        m_flags[ index ]    = static_cast<uint8_t>( GBUFFER_FLAG_COVERED | ( fragment.unlit ? GBUFFER_FLAG_UNLIT : GBUFFER_FLAG_NONE ) );
        return true;
    }

    GBufferView GBuffer::GetView() const
    {
        GBufferView view;
        view.width    = m_width;
        view.height   = m_height;
        view.normal   = m_normal.data();
        view.position = m_position.data();
        view.albedo   = m_albedo.data();
        view.flags    = m_flags.data();
        return view;
    }
} // namespace SoftRaster
