// ============================================================================
// Vulkan RenderCore - Texture / Mipmap Builder
// Uploads RGBA-style pixel data to an optimal-tiling image and generates the
// full mip chain on the GPU with linear blits. Textures are immutable once built.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_TEXTURE_H
#define VULKAN_RENDERCORE_VK_TEXTURE_H

#include "VkBootstrap.h"
#include "vk_mem_alloc.h"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc {

class DeviceContext;
class BufferManager;

struct SamplerOptions {
    VkFilter mag_filter{VK_FILTER_LINEAR};
    VkFilter min_filter{VK_FILTER_LINEAR};
    VkSamplerMipmapMode mipmap_mode{VK_SAMPLER_MIPMAP_MODE_LINEAR};
    VkSamplerAddressMode address_mode{VK_SAMPLER_ADDRESS_MODE_REPEAT};
    float min_lod{0.0f};                 // Clamp sampling to levels >= min_lod
    float max_lod{VK_LOD_CLAMP_NONE};    // Clamped to the texture's level count
    float max_anisotropy{0.0f};          // <= 1 disables; ignored without the samplerAnisotropy feature
};

struct TextureOptions {
    bool generate_mipmaps{true};         // false builds a single-level texture
    SamplerOptions sampler{};
};

struct Texture {
    VkImage image{VK_NULL_HANDLE};       // Optimal-tiling image with all mip levels
    VmaAllocation allocation{};          // VMA allocation handle
    VkFormat format{VK_FORMAT_UNDEFINED};
    VkExtent2D extent{};                 // Level 0 size
    uint32_t mip_levels{};               // Number of levels in the chain
    VkImageView view{VK_NULL_HANDLE};    // View over every level
    std::vector<VkImageView> level_views; // One single-level view per level
    VkSampler sampler{VK_NULL_HANDLE};   // Default sampler built from TextureOptions
};

// floor(log2(max(width, height))) + 1
[[nodiscard]] uint32_t mip_level_count(uint32_t width, uint32_t height);

// Size of level 'level': each dimension halves, never below 1.
[[nodiscard]] VkExtent2D mip_extent(uint32_t width, uint32_t height, uint32_t level);

// Texel size for supported upload formats, 0 when unsupported.
[[nodiscard]] uint32_t bytes_per_pixel(VkFormat format);

// Throws RenderError(UnsupportedBlitFormat) unless 'format' can be a linear
// blit source and destination with optimal tiling.
void check_blit_support(const vkb::InstanceDispatchTable& vki, VkPhysicalDevice physical, VkFormat format);

// Record the mip chain for an image whose levels are all TRANSFER_DST_OPTIMAL
// and whose level 0 holds the base data. On exit every level is
// SHADER_READ_ONLY_OPTIMAL.
void record_mip_chain(const vkb::DispatchTable& vkd, VkCommandBuffer cmd, VkImage image, uint32_t width, uint32_t height, uint32_t levels);

class TextureBuilder {
public:
    TextureBuilder(const DeviceContext& ctx, const BufferManager& buffers) : ctx_(ctx), buffers_(buffers) {}

    // Blocking upload + mip generation. 'pixels' must hold exactly
    // width * height * bytes_per_pixel(format) bytes.
    [[nodiscard]] Texture build_texture(std::span<const std::byte> pixels, uint32_t width, uint32_t height, VkFormat format, const TextureOptions& options = {}) const;

    // Additional sampler for 'texture' (e.g. to pin sampling to one level).
    [[nodiscard]] VkSampler create_sampler(const Texture& texture, const SamplerOptions& options) const;

    void destroy_sampler(VkSampler& sampler) const;
    void destroy_texture(Texture& texture) const;

private:
    const DeviceContext& ctx_;
    const BufferManager& buffers_;
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_TEXTURE_H
