#include "pipeline/FrameBuffer.hpp"
#include <gtest/gtest.h>

using namespace SoftRaster;

class FrameBufferTest : public ::testing::Test
{
protected:
    FrameBuffer frameBuffer;
};

TEST_F( FrameBufferTest, PackAndUnpackColor )
{
    EXPECT_EQ( PackColor( glm::vec3( 1.0f, 0.0f, 0.0f ) ), 0xFF0000u );
    EXPECT_EQ( PackColor( glm::vec3( 0.0f, 1.0f, 0.0f ) ), 0x00FF00u );
    EXPECT_EQ( PackColor( glm::vec3( 2.0f, -1.0f, 0.5f ) ), 0xFF0080u ); // clamped

    glm::vec3 color = UnpackColor( 0x8040FFu );
    EXPECT_NEAR( color.r, 128.0f / 255.0f, 1e-6f );
    EXPECT_NEAR( color.g, 64.0f / 255.0f, 1e-6f );
    EXPECT_NEAR( color.b, 1.0f, 1e-6f );
}

TEST_F( FrameBufferTest, PartitionCoversEveryRowOnce )
{
    std::vector<Chunk> chunks = FrameBuffer::Partition( 10, 23, 4 );
    ASSERT_EQ( chunks.size(), 4u );

    // 23 = 6 + 6 + 6 + 5
    EXPECT_EQ( chunks[ 0 ].GetRowCount(), 6u );
    EXPECT_EQ( chunks[ 2 ].GetRowCount(), 6u );
    EXPECT_EQ( chunks[ 3 ].GetRowCount(), 5u );

    uint32_t row = 0;
    for( const Chunk& chunk: chunks )
    {
        EXPECT_EQ( chunk.rowBegin, row );
        EXPECT_EQ( chunk.GetPixelBegin(), static_cast<size_t>( row ) * 10 );
        row = chunk.rowEnd;
    }
    EXPECT_EQ( row, 23u );
}

TEST_F( FrameBufferTest, PartitionClampsChunkCount )
{
    EXPECT_EQ( FrameBuffer::Partition( 8, 3, 16 ).size(), 3u );
    EXPECT_EQ( FrameBuffer::Partition( 8, 3, 0 ).size(), 1u );
}

TEST_F( FrameBufferTest, AllocateRejectsInvalidResolutions )
{
    frameBuffer.SetLimits( 256, 128 );

    EXPECT_EQ( frameBuffer.Allocate( 0, 10, 1 ), Result::INVALID_ARGS );
    EXPECT_EQ( frameBuffer.Allocate( 10, 0, 1 ), Result::INVALID_ARGS );
    EXPECT_EQ( frameBuffer.Allocate( 257, 10, 1 ), Result::OUT_OF_MEMORY );
    EXPECT_EQ( frameBuffer.Allocate( 10, 129, 1 ), Result::OUT_OF_MEMORY );
    EXPECT_FALSE( frameBuffer.IsAllocated() );
    EXPECT_FALSE( frameBuffer.GetFront().IsValid() );

    ASSERT_EQ( frameBuffer.Allocate( 256, 128, 4 ), Result::SUCCESS );
    EXPECT_EQ( frameBuffer.GetChunkCount(), 4u );

    // A failed reallocation keeps the previous buffers
    EXPECT_EQ( frameBuffer.Allocate( 1024, 1024, 4 ), Result::OUT_OF_MEMORY );
    EXPECT_EQ( frameBuffer.GetWidth(), 256u );
    EXPECT_EQ( frameBuffer.GetHeight(), 128u );
}

TEST_F( FrameBufferTest, ClearChunkOnlyTouchesItsBand )
{
    ASSERT_EQ( frameBuffer.Allocate( 4, 4, 2 ), Result::SUCCESS );

    frameBuffer.ClearChunk( 1, glm::vec3( 0.0f, 1.0f, 0.0f ) );

    const ColorBuffer& back = frameBuffer.GetBackColor();
    EXPECT_EQ( back.Get( 0u, 0u ), 0u );
    EXPECT_EQ( back.Get( 3u, 1u ), 0u );
    EXPECT_EQ( back.Get( 0u, 2u ), 0x00FF00u );
    EXPECT_EQ( back.Get( 3u, 3u ), 0x00FF00u );
}

TEST_F( FrameBufferTest, PublishSwapsBuffers )
{
    ASSERT_EQ( frameBuffer.Allocate( 4, 2, 1 ), Result::SUCCESS );
    EXPECT_EQ( frameBuffer.GetFrameIndex(), 0u );

    frameBuffer.ClearChunk( 0, glm::vec3( 1.0f, 0.0f, 0.0f ) );

    Fragment fragment;
    fragment.x     = 1;
    fragment.y     = 1;
    fragment.depth = 0.25f;
    ASSERT_TRUE( frameBuffer.GetGBuffer().TestAndWrite( fragment ) );

    // Nothing is visible before the publish
    EXPECT_EQ( frameBuffer.GetFront().colors[ 0 ], 0u );

    frameBuffer.Publish();

    FrameView front = frameBuffer.GetFront();
    ASSERT_TRUE( front.IsValid() );
    EXPECT_EQ( front.frameIndex, 1u );
    EXPECT_EQ( front.width, 4u );
    EXPECT_EQ( front.height, 2u );
    EXPECT_EQ( front.colors[ 0 ], 0xFF0000u );
    EXPECT_FLOAT_EQ( front.depth[ 1 * 4 + 1 ], 0.25f );
    EXPECT_EQ( front.depth[ 0 ], GBuffer::CLEAR_DEPTH );

    GBufferView gbuffer = frameBuffer.GetGBufferView();
    ASSERT_TRUE( gbuffer.IsValid() );
    EXPECT_TRUE( gbuffer.flags[ 1 * 4 + 1 ] & GBUFFER_FLAG_COVERED );
    EXPECT_FLOAT_EQ( gbuffer.depth[ 1 * 4 + 1 ], 0.25f );
}

TEST_F( FrameBufferTest, DepthTestIsStrictlyLess )
{
    GBuffer gbuffer;
    gbuffer.Allocate( 2, 2 );

    Fragment fragment;
    fragment.depth = 0.5f;
    fragment.color = glm::vec3( 1.0f, 0.0f, 0.0f );
    EXPECT_TRUE( gbuffer.TestAndWrite( fragment ) );

    // Equal depth does not overwrite
    fragment.color = glm::vec3( 0.0f, 1.0f, 0.0f );
    EXPECT_FALSE( gbuffer.TestAndWrite( fragment ) );
    EXPECT_EQ( gbuffer.GetAlbedo( 0 ), glm::vec3( 1.0f, 0.0f, 0.0f ) );

    fragment.depth = 0.4f;
    EXPECT_TRUE( gbuffer.TestAndWrite( fragment ) );
    EXPECT_EQ( gbuffer.GetAlbedo( 0 ), glm::vec3( 0.0f, 1.0f, 0.0f ) );

    // Out of range and out of bounds
    fragment.depth = 1.01f;
    EXPECT_FALSE( gbuffer.TestAndWrite( fragment ) );
    fragment.depth = 0.1f;
    fragment.x     = 2;
    EXPECT_FALSE( gbuffer.TestAndWrite( fragment ) );

    gbuffer.ClearRange( 0, 4 );
    EXPECT_FALSE( gbuffer.IsCovered( 0 ) );
    EXPECT_EQ( gbuffer.GetDepth( 0 ), GBuffer::CLEAR_DEPTH );
}
