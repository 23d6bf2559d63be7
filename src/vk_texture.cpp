// ============================================================================
// Vulkan RenderCore - vk_texture.cpp
// Texture upload, GPU mip chain generation (synchronization2 barriers + linear
// vkCmdBlitImage2), image views and samplers.
// ============================================================================
#include "vk_texture.h"
#include "vk_buffer.h"
#include "vk_check.h"
#include "vk_device.h"
#include "vk_log.h"

#include <algorithm>
#include <array>
#include <bit>
#include <format>

namespace vrc {

namespace {

VkImageMemoryBarrier2 make_level_barrier(VkImage image, uint32_t base_level, uint32_t level_count, VkImageLayout old_layout, VkImageLayout new_layout) {
    VkImageMemoryBarrier2 b{.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2};
    b.oldLayout           = old_layout;
    b.newLayout           = new_layout;
    b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.image               = image;
    b.subresourceRange    = {VK_IMAGE_ASPECT_COLOR_BIT, base_level, level_count, 0u, 1u};
    if (old_layout == VK_IMAGE_LAYOUT_UNDEFINED) {
        b.srcStageMask  = VK_PIPELINE_STAGE_2_NONE;
        b.srcAccessMask = 0u;
    } else if (old_layout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL) {
        b.srcStageMask  = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
        b.srcAccessMask = VK_ACCESS_2_TRANSFER_READ_BIT;
    } else {
        b.srcStageMask  = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
        b.srcAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
    }
    if (new_layout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL) {
        b.dstStageMask  = VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
        b.dstAccessMask = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT;
    } else if (new_layout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL) {
        b.dstStageMask  = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
        b.dstAccessMask = VK_ACCESS_2_TRANSFER_READ_BIT;
    } else {
        b.dstStageMask  = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
        b.dstAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
    }
    return b;
}

void cmd_barriers(const vkb::DispatchTable& vkd, VkCommandBuffer cmd, const VkImageMemoryBarrier2* barriers, uint32_t count) {
    VkDependencyInfo dep{.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO};
    dep.imageMemoryBarrierCount = count;
    dep.pImageMemoryBarriers    = barriers;
    vkd.cmdPipelineBarrier2(cmd, &dep);
}

VkImageView make_view(const vkb::DispatchTable& vkd, VkImage image, VkFormat format, uint32_t base_level, uint32_t level_count) {
    VkImageViewCreateInfo viewci{.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
        .pNext            = nullptr,
        .flags            = 0u,
        .image            = image,
        .viewType         = VK_IMAGE_VIEW_TYPE_2D,
        .format           = format,
        .components       = {VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY},
        .subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, base_level, level_count, 0u, 1u}};
    VkImageView view{};
    VRC_CHECK(vkd.createImageView(&viewci, nullptr, &view));
    return view;
}

} // namespace

// ============================================================================
// Mip math
// ============================================================================
uint32_t mip_level_count(uint32_t width, uint32_t height) {
    VRC_REQUIRE(width > 0 && height > 0, "texture dimensions must be non-zero");
    return static_cast<uint32_t>(std::bit_width(std::max(width, height)));
}

VkExtent2D mip_extent(uint32_t width, uint32_t height, uint32_t level) {
    if (level >= 32u) return {1u, 1u};
    return {std::max(1u, width >> level), std::max(1u, height >> level)};
}

uint32_t bytes_per_pixel(VkFormat format) {
    switch (format) {
    case VK_FORMAT_R8_UNORM:
    case VK_FORMAT_R8_SRGB: return 1u;
    case VK_FORMAT_R8G8_UNORM:
    case VK_FORMAT_R8G8_SRGB: return 2u;
    case VK_FORMAT_R8G8B8A8_UNORM:
    case VK_FORMAT_R8G8B8A8_SRGB:
    case VK_FORMAT_B8G8R8A8_UNORM:
    case VK_FORMAT_B8G8R8A8_SRGB: return 4u;
    case VK_FORMAT_R16G16B16A16_SFLOAT: return 8u;
    case VK_FORMAT_R32G32B32A32_SFLOAT: return 16u;
    default: return 0u;
    }
}

void check_blit_support(const vkb::InstanceDispatchTable& vki, VkPhysicalDevice physical, VkFormat format) {
    VkFormatProperties props{};
    vki.getPhysicalDeviceFormatProperties(physical, format, &props);
    constexpr VkFormatFeatureFlags required = VK_FORMAT_FEATURE_BLIT_SRC_BIT | VK_FORMAT_FEATURE_BLIT_DST_BIT | VK_FORMAT_FEATURE_SAMPLED_IMAGE_FILTER_LINEAR_BIT;
    if ((props.optimalTilingFeatures & required) != required) {
        throw RenderError(ErrorKind::UnsupportedBlitFormat, std::format("Format {} does not support linear blits with optimal tiling", static_cast<int>(format)));
    }
}

// ============================================================================
// record_mip_chain
// For k in [1, levels): level k-1 DST -> SRC, then blit k-1 into k (LINEAR).
// Finally levels [0, levels-1) SRC -> SHADER_READ and the last level
// DST -> SHADER_READ in one dependency.
// ============================================================================
void record_mip_chain(const vkb::DispatchTable& vkd, VkCommandBuffer cmd, VkImage image, uint32_t width, uint32_t height, uint32_t levels) {
    VRC_REQUIRE(levels >= 1 && levels <= mip_level_count(width, height), std::format("invalid mip level count {} for {}x{}", levels, width, height));

    for (uint32_t k = 1; k < levels; ++k) {
        const VkImageMemoryBarrier2 to_src = make_level_barrier(image, k - 1, 1u, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        cmd_barriers(vkd, cmd, &to_src, 1u);

        const VkExtent2D src = mip_extent(width, height, k - 1);
        const VkExtent2D dst = mip_extent(width, height, k);
        VkImageBlit2 blit{.sType = VK_STRUCTURE_TYPE_IMAGE_BLIT_2};
        blit.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, k - 1, 0u, 1u};
        blit.dstSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, k, 0u, 1u};
        blit.srcOffsets[0]  = {0, 0, 0};
        blit.srcOffsets[1]  = {static_cast<int32_t>(src.width), static_cast<int32_t>(src.height), 1};
        blit.dstOffsets[0]  = {0, 0, 0};
        blit.dstOffsets[1]  = {static_cast<int32_t>(dst.width), static_cast<int32_t>(dst.height), 1};

        VkBlitImageInfo2 bi{.sType = VK_STRUCTURE_TYPE_BLIT_IMAGE_INFO_2};
        bi.srcImage       = image;
        bi.srcImageLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        bi.dstImage       = image;
        bi.dstImageLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
        bi.regionCount    = 1u;
        bi.pRegions       = &blit;
        bi.filter         = VK_FILTER_LINEAR;
        vkd.cmdBlitImage2(cmd, &bi);
    }

    if (levels == 1) {
        const VkImageMemoryBarrier2 to_read = make_level_barrier(image, 0u, 1u, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        cmd_barriers(vkd, cmd, &to_read, 1u);
        return;
    }
    const std::array<VkImageMemoryBarrier2, 2> to_read{
        make_level_barrier(image, 0u, levels - 1, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL),
        make_level_barrier(image, levels - 1, 1u, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL),
    };
    cmd_barriers(vkd, cmd, to_read.data(), static_cast<uint32_t>(to_read.size()));
}

// ============================================================================
// TextureBuilder
// ============================================================================
Texture TextureBuilder::build_texture(std::span<const std::byte> pixels, uint32_t width, uint32_t height, VkFormat format, const TextureOptions& options) const {
    VRC_REQUIRE(width > 0 && height > 0, "texture dimensions must be non-zero");
    const uint32_t bpp = bytes_per_pixel(format);
    VRC_REQUIRE(bpp != 0, std::format("unsupported texture format {}", static_cast<int>(format)));
    const VkDeviceSize expected = static_cast<VkDeviceSize>(width) * height * bpp;
    VRC_REQUIRE(pixels.size() == expected, std::format("pixel data is {} bytes, expected {} for {}x{}", pixels.size(), expected, width, height));

    const uint32_t levels = options.generate_mipmaps ? mip_level_count(width, height) : 1u;
    if (levels > 1) check_blit_support(ctx_.vki(), ctx_.physical(), format);

    Texture tex{};
    tex.format     = format;
    tex.extent     = {width, height};
    tex.mip_levels = levels;

    VkImageCreateInfo imgci{.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
        .pNext                 = nullptr,
        .flags                 = 0u,
        .imageType             = VK_IMAGE_TYPE_2D,
        .format                = format,
        .extent                = {width, height, 1u},
        .mipLevels             = levels,
        .arrayLayers           = 1u,
        .samples               = VK_SAMPLE_COUNT_1_BIT,
        .tiling                = VK_IMAGE_TILING_OPTIMAL,
        .usage                 = VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT,
        .sharingMode           = VK_SHARING_MODE_EXCLUSIVE,
        .queueFamilyIndexCount = 0u,
        .pQueueFamilyIndices   = nullptr,
        .initialLayout         = VK_IMAGE_LAYOUT_UNDEFINED};
    VmaAllocationCreateInfo ainfo{};
    ainfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
    const VkResult res = vmaCreateImage(ctx_.allocator(), &imgci, &ainfo, &tex.image, &tex.allocation, nullptr);
    if (res == VK_ERROR_OUT_OF_DEVICE_MEMORY || res == VK_ERROR_OUT_OF_HOST_MEMORY) {
        throw RenderError(ErrorKind::OutOfDeviceMemory, std::format("Failed to allocate {}x{} texture", width, height), res);
    }
    VRC_CHECK(res);

    try {
        Buffer staging = buffers_.allocate_buffer(expected, VK_BUFFER_USAGE_TRANSFER_SRC_BIT, true);
        try {
            buffers_.write(staging, 0, pixels);
            ctx_.immediate_submit([&](VkCommandBuffer cmd) {
                const VkImageMemoryBarrier2 to_dst = make_level_barrier(tex.image, 0u, levels, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
                cmd_barriers(ctx_.vkd(), cmd, &to_dst, 1u);
                VkBufferImageCopy copy{};
                copy.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0u, 0u, 1u};
                copy.imageExtent      = {width, height, 1u};
                ctx_.vkd().cmdCopyBufferToImage(cmd, staging.buffer, tex.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &copy);
                record_mip_chain(ctx_.vkd(), cmd, tex.image, width, height, levels);
            });
        } catch (...) {
            buffers_.destroy(staging);
            throw;
        }
        buffers_.destroy(staging);

        tex.view = make_view(ctx_.vkd(), tex.image, format, 0u, levels);
        tex.level_views.reserve(levels);
        for (uint32_t k = 0; k < levels; ++k) tex.level_views.push_back(make_view(ctx_.vkd(), tex.image, format, k, 1u));
        tex.sampler = create_sampler(tex, options.sampler);
    } catch (...) {
        destroy_texture(tex);
        throw;
    }

    log_info("Built {}x{} texture with {} mip level(s)", width, height, levels);
    return tex;
}

VkSampler TextureBuilder::create_sampler(const Texture& texture, const SamplerOptions& options) const {
    VRC_REQUIRE(options.min_lod >= 0.0f && options.min_lod <= options.max_lod, "sampler LOD range is empty");
    float anisotropy = 1.0f;
    // Enabling anisotropy on a device created without the feature is invalid.
    if (options.max_anisotropy > 1.0f && !ctx_.enabled_features().sampler_anisotropy) {
        log_warn("max_anisotropy {} ignored: samplerAnisotropy was not enabled on the device", options.max_anisotropy);
    } else if (options.max_anisotropy > 1.0f) {
        VkPhysicalDeviceProperties props{};
        ctx_.vki().getPhysicalDeviceProperties(ctx_.physical(), &props);
        anisotropy = std::min(options.max_anisotropy, props.limits.maxSamplerAnisotropy);
    }
    VkSamplerCreateInfo sci{.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO};
    sci.magFilter        = options.mag_filter;
    sci.minFilter        = options.min_filter;
    sci.mipmapMode       = options.mipmap_mode;
    sci.addressModeU     = options.address_mode;
    sci.addressModeV     = options.address_mode;
    sci.addressModeW     = options.address_mode;
    sci.mipLodBias       = 0.0f;
    sci.anisotropyEnable = anisotropy > 1.0f ? VK_TRUE : VK_FALSE;
    sci.maxAnisotropy    = anisotropy;
    sci.compareEnable    = VK_FALSE;
    sci.compareOp        = VK_COMPARE_OP_ALWAYS;
    sci.minLod           = options.min_lod;
    sci.maxLod           = std::min(options.max_lod, static_cast<float>(texture.mip_levels));
    sci.borderColor      = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
    VkSampler sampler{};
    VRC_CHECK(ctx_.vkd().createSampler(&sci, nullptr, &sampler));
    return sampler;
}

void TextureBuilder::destroy_sampler(VkSampler& sampler) const { IF_NOT_NULL_DO_AND_SET(sampler, ctx_.vkd().destroySampler(sampler, nullptr), VK_NULL_HANDLE); }

void TextureBuilder::destroy_texture(Texture& texture) const {
    destroy_sampler(texture.sampler);
    for (auto v : texture.level_views) IF_NOT_NULL_DO(v, ctx_.vkd().destroyImageView(v, nullptr));
    texture.level_views.clear();
    IF_NOT_NULL_DO_AND_SET(texture.view, ctx_.vkd().destroyImageView(texture.view, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(texture.image, vmaDestroyImage(ctx_.allocator(), texture.image, texture.allocation), VK_NULL_HANDLE);
    texture = {};
}

} // namespace vrc
