#include "mock_vulkan.h"
#include "vk_buffer.h"
#include "vk_check.h"
#include "vk_texture.h"

#include <gtest/gtest.h>
#include <vector>

namespace {

class MipChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        vrc_test::reset_mock();
        vrc_test::adopt_mock_device(ctx_);
    }
    void TearDown() override { ctx_.destroy(); }

    vrc::DeviceContext ctx_;
    VkCommandBuffer cmd_{vrc_test::fake_handle<VkCommandBuffer>(0xC0)};
    VkImage image_{vrc_test::fake_handle<VkImage>(0xD0)};
};

} // namespace

TEST(MipMath, LevelCountIsFloorLog2PlusOne) {
    EXPECT_EQ(vrc::mip_level_count(1, 1), 1u);
    EXPECT_EQ(vrc::mip_level_count(2, 1), 2u);
    EXPECT_EQ(vrc::mip_level_count(256, 256), 9u);
    EXPECT_EQ(vrc::mip_level_count(300, 20), 9u);
    EXPECT_EQ(vrc::mip_level_count(1024, 512), 11u);
    EXPECT_THROW((void)vrc::mip_level_count(0, 16), vrc::RenderError);
}

TEST(MipMath, ExtentHalvesAndClampsAtOne) {
    const VkExtent2D e = vrc::mip_extent(300, 20, 5);
    EXPECT_EQ(e.width, 9u);
    EXPECT_EQ(e.height, 1u);
    const VkExtent2D last = vrc::mip_extent(256, 256, 8);
    EXPECT_EQ(last.width, 1u);
    EXPECT_EQ(last.height, 1u);
}

TEST(MipMath, BytesPerPixel) {
    EXPECT_EQ(vrc::bytes_per_pixel(VK_FORMAT_R8G8B8A8_SRGB), 4u);
    EXPECT_EQ(vrc::bytes_per_pixel(VK_FORMAT_R8_UNORM), 1u);
    EXPECT_EQ(vrc::bytes_per_pixel(VK_FORMAT_R32G32B32A32_SFLOAT), 16u);
    EXPECT_EQ(vrc::bytes_per_pixel(VK_FORMAT_BC1_RGB_UNORM_BLOCK), 0u);
}

TEST_F(MipChainTest, FullChainFor256Square) {
    vrc::record_mip_chain(ctx_.vkd(), cmd_, image_, 256, 256, 9);
    const auto& m = vrc_test::mock();

    ASSERT_EQ(m.blits.size(), 8u);
    for (uint32_t k = 0; k < 8; ++k) {
        EXPECT_EQ(m.blits[k].src_level, k);
        EXPECT_EQ(m.blits[k].dst_level, k + 1);
        EXPECT_EQ(m.blits[k].filter, VK_FILTER_LINEAR);
        EXPECT_EQ(m.blits[k].dst_extent.x, static_cast<int32_t>(256u >> (k + 1)));
    }
    // One barrier before each blit plus the final dependency.
    ASSERT_EQ(m.barrier_batches.size(), 9u);
    for (size_t i = 0; i < 8; ++i) EXPECT_EQ(m.barrier_batches[i], 1u);
    EXPECT_EQ(m.barrier_batches.back(), 2u);
}

TEST_F(MipChainTest, EveryLevelEndsShaderReadable) {
    vrc::record_mip_chain(ctx_.vkd(), cmd_, image_, 64, 16, 7);
    const auto& bars = vrc_test::mock().image_barriers;
    ASSERT_GE(bars.size(), 2u);
    const VkImageMemoryBarrier2& lower = bars[bars.size() - 2];
    const VkImageMemoryBarrier2& last  = bars.back();
    EXPECT_EQ(lower.subresourceRange.baseMipLevel, 0u);
    EXPECT_EQ(lower.subresourceRange.levelCount, 6u);
    EXPECT_EQ(lower.oldLayout, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
    EXPECT_EQ(lower.newLayout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    EXPECT_EQ(last.subresourceRange.baseMipLevel, 6u);
    EXPECT_EQ(last.oldLayout, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
    EXPECT_EQ(last.newLayout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
}

TEST_F(MipChainTest, SourceLevelMovesToTransferSrcBeforeEachBlit) {
    vrc::record_mip_chain(ctx_.vkd(), cmd_, image_, 8, 8, 4);
    const auto& bars = vrc_test::mock().image_barriers;
    ASSERT_EQ(bars.size(), 5u);
    for (uint32_t k = 0; k < 3; ++k) {
        EXPECT_EQ(bars[k].subresourceRange.baseMipLevel, k);
        EXPECT_EQ(bars[k].subresourceRange.levelCount, 1u);
        EXPECT_EQ(bars[k].oldLayout, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        EXPECT_EQ(bars[k].newLayout, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
    }
}

TEST_F(MipChainTest, SingleLevelOnlyTransitions) {
    vrc::record_mip_chain(ctx_.vkd(), cmd_, image_, 256, 256, 1);
    const auto& m = vrc_test::mock();
    EXPECT_TRUE(m.blits.empty());
    ASSERT_EQ(m.image_barriers.size(), 1u);
    EXPECT_EQ(m.image_barriers[0].newLayout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
}

TEST_F(MipChainTest, RejectsMoreLevelsThanTheImageHas) {
    EXPECT_THROW(vrc::record_mip_chain(ctx_.vkd(), cmd_, image_, 16, 16, 6), vrc::RenderError);
    EXPECT_TRUE(vrc_test::mock().blits.empty());
}

TEST_F(MipChainTest, BlitSupportCheckFailsWithoutLinearBlit) {
    vrc_test::mock().optimal_tiling_features = VK_FORMAT_FEATURE_BLIT_SRC_BIT | VK_FORMAT_FEATURE_BLIT_DST_BIT;
    try {
        vrc::check_blit_support(ctx_.vki(), ctx_.physical(), VK_FORMAT_R8G8B8A8_SRGB);
        FAIL() << "expected UnsupportedBlitFormat";
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.kind(), vrc::ErrorKind::UnsupportedBlitFormat);
    }
}

TEST_F(MipChainTest, BuildTextureFailsOnUnsupportedFormatBeforeAllocating) {
    vrc_test::mock().optimal_tiling_features = 0;
    const vrc::BufferManager buffers(ctx_);
    const vrc::TextureBuilder textures(ctx_, buffers);
    const std::vector<std::byte> pixels(64u * 64u * 4u);
    try {
        (void)textures.build_texture(pixels, 64, 64, VK_FORMAT_R8G8B8A8_UNORM);
        FAIL() << "expected UnsupportedBlitFormat";
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.kind(), vrc::ErrorKind::UnsupportedBlitFormat);
    }
    EXPECT_EQ(vrc_test::mock().count("vkQueueSubmit2"), 0);
}

TEST_F(MipChainTest, BuildTextureRejectsWrongPixelCount) {
    const vrc::BufferManager buffers(ctx_);
    const vrc::TextureBuilder textures(ctx_, buffers);
    const std::vector<std::byte> pixels(10);
    EXPECT_THROW((void)textures.build_texture(pixels, 4, 4, VK_FORMAT_R8G8B8A8_UNORM), vrc::RenderError);
}

// ============================================================================
// Full texture builds through a VMA allocator on the test device
// ============================================================================
namespace {

class TextureBuildTest : public ::testing::Test {
protected:
    void SetUp() override {
        vrc_test::reset_mock();
        allocator_ = vrc_test::create_mock_allocator();
        ASSERT_NE(allocator_, VK_NULL_HANDLE);
    }
    void TearDown() override {
        ctx_.destroy();
        vmaDestroyAllocator(allocator_);
    }

    void attach(bool anisotropy) { vrc_test::adopt_mock_device(ctx_, allocator_, vrc::DeviceRequirements{.sampler_anisotropy = anisotropy, .prefer_discrete = true}); }

    vrc::DeviceContext ctx_;
    VmaAllocator allocator_{};
};

} // namespace

TEST_F(TextureBuildTest, BuildsEveryLevelAndReleasesStaging) {
    attach(false);
    const vrc::BufferManager buffers(ctx_);
    const vrc::TextureBuilder textures(ctx_, buffers);
    const std::vector<std::byte> pixels(256u * 256u * 4u);

    vrc::Texture tex = textures.build_texture(pixels, 256, 256, VK_FORMAT_R8G8B8A8_SRGB);
    const auto& m    = vrc_test::mock();
    EXPECT_EQ(tex.mip_levels, 9u);
    EXPECT_EQ(tex.level_views.size(), 9u);
    EXPECT_NE(tex.view, VK_NULL_HANDLE);
    EXPECT_NE(tex.sampler, VK_NULL_HANDLE);
    EXPECT_EQ(m.last_image.mip_levels, 9u);
    EXPECT_NE(m.last_image.usage & VK_IMAGE_USAGE_TRANSFER_SRC_BIT, 0u);
    EXPECT_EQ(m.buffer_image_copies, 1);
    EXPECT_EQ(m.blits.size(), 8u);
    EXPECT_EQ(m.count("vkQueueSubmit2"), 1);
    EXPECT_TRUE(m.buffers.empty());
    EXPECT_EQ(m.images.size(), 1u);
    EXPECT_EQ(m.live_image_views, 10);

    textures.destroy_texture(tex);
    EXPECT_TRUE(m.images.empty());
    EXPECT_EQ(m.live_image_views, 0);
    EXPECT_EQ(m.live_samplers, 0);
}

TEST_F(TextureBuildTest, AnisotropyStaysOffWithoutTheDeviceFeature) {
    attach(false);
    const vrc::BufferManager buffers(ctx_);
    const vrc::TextureBuilder textures(ctx_, buffers);
    const std::vector<std::byte> pixels(4u * 4u * 4u);
    vrc::TextureOptions opts{};
    opts.generate_mipmaps       = false;
    opts.sampler.max_anisotropy = 16.0f;

    vrc::Texture tex = textures.build_texture(pixels, 4, 4, VK_FORMAT_R8G8B8A8_UNORM, opts);
    EXPECT_EQ(vrc_test::mock().last_sampler.anisotropyEnable, VK_FALSE);
    EXPECT_FLOAT_EQ(vrc_test::mock().last_sampler.maxAnisotropy, 1.0f);
    textures.destroy_texture(tex);
}

TEST_F(TextureBuildTest, AnisotropyEnabledWhenTheDeviceHasIt) {
    attach(true);
    const vrc::BufferManager buffers(ctx_);
    const vrc::TextureBuilder textures(ctx_, buffers);
    const std::vector<std::byte> pixels(4u * 4u * 4u);
    vrc::TextureOptions opts{};
    opts.generate_mipmaps       = false;
    opts.sampler.max_anisotropy = 32.0f;

    vrc::Texture tex = textures.build_texture(pixels, 4, 4, VK_FORMAT_R8G8B8A8_UNORM, opts);
    EXPECT_EQ(vrc_test::mock().last_sampler.anisotropyEnable, VK_TRUE);
    // Clamped to the device limit.
    EXPECT_FLOAT_EQ(vrc_test::mock().last_sampler.maxAnisotropy, 16.0f);
    textures.destroy_texture(tex);
}
