// ============================================================================
// Vulkan RenderCore - Pipeline & Descriptor Cache
// Graphics pipelines cached by (shader pair, vertex layout, depth state). Every pipeline uses
// the same descriptor contract:
//   binding 0 : uniform buffer          (vertex stage)
//   binding 1 : combined image sampler  (fragment stage)
// Descriptor sets are kept per (frame slot, pipeline) and only the bindings
// whose resource changed are rewritten.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_PIPELINE_H
#define VULKAN_RENDERCORE_VK_PIPELINE_H

#include "VkBootstrap.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc {

class DeviceContext;
struct Buffer;
struct Texture;

inline constexpr uint32_t kSpirvMagic = 0x07230203u;

struct VertexAttribute {
    uint32_t location{};                 // Shader input location
    VkFormat format{VK_FORMAT_UNDEFINED};
    uint32_t offset{};                   // Byte offset inside the vertex
    bool operator==(const VertexAttribute&) const = default;
};

struct VertexLayout {
    uint32_t stride{};                   // Bytes per vertex (binding 0, per-vertex rate)
    std::vector<VertexAttribute> attributes;
    bool operator==(const VertexLayout&) const = default;
};

// vec2 position + vec3 color
[[nodiscard]] VertexLayout vertex_layout_pos2_color3();
// vec3 position + vec2 uv
[[nodiscard]] VertexLayout vertex_layout_pos3_uv2();

struct ShaderBinding {
    uint32_t binding{};
    VkDescriptorType type{};
    VkShaderStageFlags stages{};
    bool operator==(const ShaderBinding&) const = default;
};

// The only descriptor layout pipelines are built against.
inline constexpr std::array<ShaderBinding, 2> kCanonicalBindings{{
    {0u, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, VK_SHADER_STAGE_VERTEX_BIT},
    {1u, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT},
}};

// Pre-compiled vertex + fragment program and the bindings it declares.
struct ShaderPair {
    std::string key;
    std::vector<uint32_t> vertex_spirv;
    std::vector<uint32_t> fragment_spirv;
    std::vector<ShaderBinding> declared_bindings;
};

// Depth testing only has an effect in a render pass with a depth attachment.
struct DepthState {
    bool test{false};
    bool write{false};
    VkCompareOp compare{VK_COMPARE_OP_LESS};
    bool operator==(const DepthState&) const = default;
};

struct PipelineKey {
    std::string shader_key;
    VertexLayout vertex_layout;
    DepthState depth;
    bool operator==(const PipelineKey&) const = default;
};

struct PipelineKeyHash {
    size_t operator()(const PipelineKey& key) const noexcept;
};

struct Pipeline {
    PipelineKey key;
    VkDescriptorSetLayout set_layout{VK_NULL_HANDLE}; // Canonical set layout (shared)
    VkPipelineLayout layout{VK_NULL_HANDLE};          // Pipeline layout (shared)
    VkPipeline pipeline{VK_NULL_HANDLE};              // Immutable once built
};

// Throws RenderError(BindingMismatch) unless 'declared' equals the canonical
// bindings by index and descriptor type.
void validate_bindings(std::string_view shader_key, std::span<const ShaderBinding> declared);

// Throws RenderError(Precondition) for blobs that cannot be SPIR-V.
void validate_spirv(std::string_view what, std::span<const uint32_t> code);

// Reads a .spv file into words. Throws RenderError(Precondition) on I/O errors.
[[nodiscard]] std::vector<uint32_t> load_spirv_file(const std::string& path);

// ----------------------------------------------------------------------------
// DescriptorAllocator
// Simple linear-style descriptor pool allocator with a single VkDescriptorPool.
// ----------------------------------------------------------------------------
struct DescriptorAllocator {
    struct PoolSizeRatio {
        VkDescriptorType type;  // Descriptor type (e.g. VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER)
        float ratio;            // Relative share of the maxSets budget for this type
    };
    VkDescriptorPool pool{};     // Underlying Vulkan descriptor pool

    void init_pool(const vkb::DispatchTable& vkd, uint32_t maxSets, std::span<const PoolSizeRatio> ratios);
    void destroy_pool(const vkb::DispatchTable& vkd);

    [[nodiscard]] VkDescriptorSet allocate(const vkb::DispatchTable& vkd, VkDescriptorSetLayout layout) const;
};

class PipelineCache {
public:
    PipelineCache(const DeviceContext& ctx, uint32_t frames_in_flight);
    ~PipelineCache();
    PipelineCache(const PipelineCache&)            = delete;
    PipelineCache& operator=(const PipelineCache&) = delete;

    // Create the canonical set/pipeline layouts and descriptor pool.
    // Pipelines are built for subpass 0 of 'render_pass'.
    void initialize(VkRenderPass render_pass);
    void destroy();

    // Add or replace a shader pair. Replacing one takes effect at the next rebuild_all().
    void register_shaders(ShaderPair pair);

    // Record a (shader, layout, depth) combination for build_declared().
    void declare(std::string_view shader_key, const VertexLayout& layout, const DepthState& depth = {});
    void build_declared();

    // Exact key lookup. Identical keys return the same instance. Once sealed,
    // an unknown key is a precondition failure instead of a lazy build.
    [[nodiscard]] const Pipeline& get_or_build(std::string_view shader_key, const VertexLayout& layout, const DepthState& depth = {});

    // Build every declared combination, then refuse further builds.
    void seal();
    [[nodiscard]] bool sealed() const { return sealed_; }

    // Recreate every pipeline handle (new render pass or reloaded shaders).
    // Pipeline objects keep their addresses. Device must be idle.
    void rebuild_all(VkRenderPass render_pass);

    // Descriptor set of (frame_slot, pipeline) pointing at 'uniform' and
    // 'texture'. 'sampler' overrides texture.sampler when non-null.
    [[nodiscard]] VkDescriptorSet bind_descriptors(uint32_t frame_slot, const Pipeline& pipeline, const Buffer& uniform, const Texture& texture, VkSampler sampler = VK_NULL_HANDLE);

    // Drop every cached write referring to a resource that is about to be
    // destroyed. A later resource that reuses the handle value is then
    // written again instead of being mistaken for the old one.
    void forget(const Buffer& uniform);
    void forget(const Texture& texture);
    void forget(VkSampler sampler);

    [[nodiscard]] size_t size() const { return pipelines_.size(); }
    [[nodiscard]] VkPipelineLayout pipeline_layout() const { return pipeline_layout_; }

private:
    struct SlotBindings {
        VkDescriptorSet set{VK_NULL_HANDLE};
        VkBuffer uniform{VK_NULL_HANDLE};    // Resource last written to binding 0
        VkImageView view{VK_NULL_HANDLE};    // Resources last written to binding 1
        VkSampler sampler{VK_NULL_HANDLE};
    };
    struct SlotKey {
        uint32_t slot{};
        const Pipeline* pipeline{};
        bool operator==(const SlotKey&) const = default;
    };
    struct SlotKeyHash {
        size_t operator()(const SlotKey& key) const noexcept;
    };

    void build_pipeline(Pipeline& pipeline) const;

    const DeviceContext& ctx_;
    uint32_t frames_in_flight_{};
    VkRenderPass render_pass_{VK_NULL_HANDLE};
    VkDescriptorSetLayout set_layout_{VK_NULL_HANDLE};
    VkPipelineLayout pipeline_layout_{VK_NULL_HANDLE};
    DescriptorAllocator descriptors_{};
    bool sealed_{false};

    std::unordered_map<std::string, ShaderPair> shaders_;
    std::vector<PipelineKey> declared_;
    std::unordered_map<PipelineKey, std::unique_ptr<Pipeline>, PipelineKeyHash> pipelines_;
    std::unordered_map<SlotKey, SlotBindings, SlotKeyHash> slot_bindings_;
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_PIPELINE_H
