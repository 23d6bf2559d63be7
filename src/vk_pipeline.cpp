// ============================================================================
// Vulkan RenderCore - vk_pipeline.cpp
// Shader validation, graphics pipeline construction, the pipeline cache and
// per-slot descriptor set management.
// ============================================================================
#include "vk_pipeline.h"
#include "vk_buffer.h"
#include "vk_check.h"
#include "vk_device.h"
#include "vk_log.h"
#include "vk_texture.h"

#include <algorithm>
#include <format>
#include <fstream>
#include <functional>

namespace vrc {

namespace {

void hash_combine(size_t& seed, size_t value) { seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2); }

const char* descriptor_type_name(VkDescriptorType type) {
    switch (type) {
    case VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER: return "uniform buffer";
    case VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER: return "combined image sampler";
    case VK_DESCRIPTOR_TYPE_STORAGE_BUFFER: return "storage buffer";
    case VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE: return "sampled image";
    case VK_DESCRIPTOR_TYPE_SAMPLER: return "sampler";
    case VK_DESCRIPTOR_TYPE_STORAGE_IMAGE: return "storage image";
    default: return "other";
    }
}

VkShaderModule make_shader(const vkb::DispatchTable& vkd, const std::vector<uint32_t>& words) {
    VkShaderModuleCreateInfo ci{.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO};
    ci.codeSize = words.size() * sizeof(uint32_t);
    ci.pCode    = words.data();
    VkShaderModule mod{};
    VRC_CHECK(vkd.createShaderModule(&ci, nullptr, &mod));
    return mod;
}

} // namespace

// ============================================================================
// Vertex layouts / keys
// ============================================================================
VertexLayout vertex_layout_pos2_color3() {
    return VertexLayout{.stride = 5u * sizeof(float),
        .attributes             = {
            {0u, VK_FORMAT_R32G32_SFLOAT, 0u},
            {1u, VK_FORMAT_R32G32B32_SFLOAT, 2u * sizeof(float)},
        }};
}

VertexLayout vertex_layout_pos3_uv2() {
    return VertexLayout{.stride = 5u * sizeof(float),
        .attributes             = {
            {0u, VK_FORMAT_R32G32B32_SFLOAT, 0u},
            {1u, VK_FORMAT_R32G32_SFLOAT, 3u * sizeof(float)},
        }};
}

size_t PipelineKeyHash::operator()(const PipelineKey& key) const noexcept {
    size_t seed = std::hash<std::string>{}(key.shader_key);
    hash_combine(seed, key.vertex_layout.stride);
    for (const auto& [location, format, offset] : key.vertex_layout.attributes) {
        hash_combine(seed, location);
        hash_combine(seed, static_cast<size_t>(format));
        hash_combine(seed, offset);
    }
    hash_combine(seed, (key.depth.test ? 1u : 0u) | (key.depth.write ? 2u : 0u));
    hash_combine(seed, static_cast<size_t>(key.depth.compare));
    return seed;
}

size_t PipelineCache::SlotKeyHash::operator()(const SlotKey& key) const noexcept {
    size_t seed = std::hash<uint32_t>{}(key.slot);
    hash_combine(seed, std::hash<const Pipeline*>{}(key.pipeline));
    return seed;
}

// ============================================================================
// Validation
// ============================================================================
void validate_bindings(std::string_view shader_key, std::span<const ShaderBinding> declared) {
    if (declared.size() != kCanonicalBindings.size()) {
        throw RenderError(ErrorKind::BindingMismatch, std::format("Shader '{}' declares {} binding(s), pipeline layout has {}", shader_key, declared.size(), kCanonicalBindings.size()));
    }
    for (const ShaderBinding& expected : kCanonicalBindings) {
        const auto it = std::ranges::find(declared, expected.binding, &ShaderBinding::binding);
        if (it == declared.end()) {
            throw RenderError(ErrorKind::BindingMismatch, std::format("Shader '{}' does not declare binding {}", shader_key, expected.binding));
        }
        if (it->type != expected.type) {
            throw RenderError(ErrorKind::BindingMismatch, std::format("Shader '{}' binding {} is a {}, pipeline layout expects a {}", shader_key, expected.binding, descriptor_type_name(it->type), descriptor_type_name(expected.type)));
        }
    }
}

void validate_spirv(std::string_view what, std::span<const uint32_t> code) {
    VRC_REQUIRE(!code.empty(), std::format("{}: empty SPIR-V", what));
    VRC_REQUIRE(code.front() == kSpirvMagic, std::format("{}: missing SPIR-V magic number", what));
}

std::vector<uint32_t> load_spirv_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    VRC_REQUIRE(f.good(), "cannot open " + path);
    const std::streamsize sz = f.tellg();
    VRC_REQUIRE(sz > 0 && sz % 4 == 0, std::format("{}: size {} is not a positive multiple of 4", path, static_cast<long long>(sz)));
    f.seekg(0);
    std::vector<uint32_t> words(static_cast<size_t>(sz) / sizeof(uint32_t));
    f.read(reinterpret_cast<char*>(words.data()), sz);
    VRC_REQUIRE(f.good(), "read failed: " + path);
    validate_spirv(path, words);
    return words;
}

// ============================================================================
// DescriptorAllocator Implementation (simple single-pool helper)
// ============================================================================
void DescriptorAllocator::init_pool(const vkb::DispatchTable& vkd, uint32_t maxSets, std::span<const PoolSizeRatio> ratios) {
    maxSets = std::max(1u, maxSets);
    std::vector<VkDescriptorPoolSize> sizes;
    sizes.reserve(ratios.size());
    for (const auto& [type, ratio] : ratios) {
        const uint32_t count = std::max(1u, static_cast<uint32_t>(ratio * static_cast<float>(maxSets)));
        sizes.push_back(VkDescriptorPoolSize{.type = type, .descriptorCount = count});
    }
    const VkDescriptorPoolCreateInfo info{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO, .pNext = nullptr, .flags = 0u, .maxSets = maxSets, .poolSizeCount = static_cast<uint32_t>(sizes.size()), .pPoolSizes = sizes.data()};
    VRC_CHECK(vkd.createDescriptorPool(&info, nullptr, &pool));
}
void DescriptorAllocator::destroy_pool(const vkb::DispatchTable& vkd) { IF_NOT_NULL_DO_AND_SET(pool, vkd.destroyDescriptorPool(pool, nullptr), VK_NULL_HANDLE); }
VkDescriptorSet DescriptorAllocator::allocate(const vkb::DispatchTable& vkd, VkDescriptorSetLayout layout) const {
    const VkDescriptorSetAllocateInfo ai{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO, .pNext = nullptr, .descriptorPool = pool, .descriptorSetCount = 1u, .pSetLayouts = &layout};
    VkDescriptorSet ds{}; VRC_CHECK(vkd.allocateDescriptorSets(&ai, &ds)); return ds; }

// ============================================================================
// PipelineCache
// ============================================================================
PipelineCache::PipelineCache(const DeviceContext& ctx, uint32_t frames_in_flight) : ctx_(ctx), frames_in_flight_(frames_in_flight) {
    VRC_REQUIRE(frames_in_flight >= 1, "pipeline cache needs at least one frame slot");
}

PipelineCache::~PipelineCache() {
    if (ctx_.valid()) destroy();
}

void PipelineCache::initialize(VkRenderPass render_pass) {
    VRC_REQUIRE(ctx_.valid(), "pipeline cache requires an initialized device");
    VRC_REQUIRE(render_pass != VK_NULL_HANDLE, "pipeline cache requires a render pass");
    VRC_REQUIRE(set_layout_ == VK_NULL_HANDLE, "pipeline cache already initialized");
    render_pass_ = render_pass;

    std::array<VkDescriptorSetLayoutBinding, kCanonicalBindings.size()> bindings{};
    for (size_t i = 0; i < kCanonicalBindings.size(); ++i) {
        bindings[i] = VkDescriptorSetLayoutBinding{.binding = kCanonicalBindings[i].binding, .descriptorType = kCanonicalBindings[i].type, .descriptorCount = 1u, .stageFlags = kCanonicalBindings[i].stages, .pImmutableSamplers = nullptr};
    }
    const VkDescriptorSetLayoutCreateInfo dslci{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO, .pNext = nullptr, .flags = 0u, .bindingCount = static_cast<uint32_t>(bindings.size()), .pBindings = bindings.data()};
    VRC_CHECK(ctx_.vkd().createDescriptorSetLayout(&dslci, nullptr, &set_layout_));

    const VkPipelineLayoutCreateInfo plci{.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO, .pNext = nullptr, .flags = 0u, .setLayoutCount = 1u, .pSetLayouts = &set_layout_, .pushConstantRangeCount = 0u, .pPushConstantRanges = nullptr};
    VRC_CHECK(ctx_.vkd().createPipelineLayout(&plci, nullptr, &pipeline_layout_));

    const std::array<DescriptorAllocator::PoolSizeRatio, 2> ratios{{{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1.0f}, {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 1.0f}}};
    descriptors_.init_pool(ctx_.vkd(), 64u * frames_in_flight_, ratios);
}

void PipelineCache::destroy() {
    for (auto& [key, p] : pipelines_) IF_NOT_NULL_DO_AND_SET(p->pipeline, ctx_.vkd().destroyPipeline(p->pipeline, nullptr), VK_NULL_HANDLE);
    pipelines_.clear();
    slot_bindings_.clear();
    declared_.clear();
    descriptors_.destroy_pool(ctx_.vkd());
    IF_NOT_NULL_DO_AND_SET(pipeline_layout_, ctx_.vkd().destroyPipelineLayout(pipeline_layout_, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(set_layout_, ctx_.vkd().destroyDescriptorSetLayout(set_layout_, nullptr), VK_NULL_HANDLE);
    render_pass_ = VK_NULL_HANDLE;
    sealed_      = false;
}

void PipelineCache::register_shaders(ShaderPair pair) {
    VRC_REQUIRE(!pair.key.empty(), "shader pair needs a key");
    validate_spirv(pair.key + ".vert", pair.vertex_spirv);
    validate_spirv(pair.key + ".frag", pair.fragment_spirv);
    std::string key = pair.key;
    shaders_.insert_or_assign(std::move(key), std::move(pair));
}

void PipelineCache::declare(std::string_view shader_key, const VertexLayout& layout, const DepthState& depth) {
    PipelineKey key{std::string(shader_key), layout, depth};
    if (std::ranges::find(declared_, key) == declared_.end()) declared_.push_back(std::move(key));
}

void PipelineCache::build_declared() {
    for (const PipelineKey& key : declared_) (void)get_or_build(key.shader_key, key.vertex_layout, key.depth);
}

void PipelineCache::seal() {
    build_declared();
    sealed_ = true;
}

const Pipeline& PipelineCache::get_or_build(std::string_view shader_key, const VertexLayout& layout, const DepthState& depth) {
    PipelineKey key{std::string(shader_key), layout, depth};
    if (const auto it = pipelines_.find(key); it != pipelines_.end()) return *it->second;

    VRC_REQUIRE(!sealed_, std::format("pipeline '{}' was not built before the cache was sealed", shader_key));
    auto p = std::make_unique<Pipeline>();
    p->key = key;
    build_pipeline(*p);
    const Pipeline& ref = *p;
    pipelines_.emplace(std::move(key), std::move(p));
    log_info("Built pipeline '{}' (stride {}, {} attribute(s))", shader_key, layout.stride, layout.attributes.size());
    return ref;
}

void PipelineCache::rebuild_all(VkRenderPass render_pass) {
    VRC_REQUIRE(render_pass != VK_NULL_HANDLE, "rebuild_all() requires a render pass");
    render_pass_ = render_pass;
    for (auto& [key, p] : pipelines_) {
        IF_NOT_NULL_DO_AND_SET(p->pipeline, ctx_.vkd().destroyPipeline(p->pipeline, nullptr), VK_NULL_HANDLE);
        build_pipeline(*p);
    }
    log_info("Rebuilt {} pipeline(s)", pipelines_.size());
}

// Fixed-function state: triangle list, no culling, one opaque color
// attachment, depth as keyed, viewport + scissor dynamic so swapchain
// resizes keep pipelines valid.
void PipelineCache::build_pipeline(Pipeline& pipeline) const {
    VRC_REQUIRE(set_layout_ != VK_NULL_HANDLE && render_pass_ != VK_NULL_HANDLE, "pipeline cache is not initialized");
    const auto sit = shaders_.find(pipeline.key.shader_key);
    VRC_REQUIRE(sit != shaders_.end(), std::format("unknown shader pair '{}'", pipeline.key.shader_key));
    const ShaderPair& shaders = sit->second;
    validate_bindings(shaders.key, shaders.declared_bindings);

    const VertexLayout& vl = pipeline.key.vertex_layout;
    const VkVertexInputBindingDescription vbinding{.binding = 0u, .stride = vl.stride, .inputRate = VK_VERTEX_INPUT_RATE_VERTEX};
    std::vector<VkVertexInputAttributeDescription> vattrs;
    vattrs.reserve(vl.attributes.size());
    for (const auto& [location, format, offset] : vl.attributes) vattrs.push_back({.location = location, .binding = 0u, .format = format, .offset = offset});

    VkShaderModule vs = make_shader(ctx_.vkd(), shaders.vertex_spirv);
    VkShaderModule fs = VK_NULL_HANDLE;
    try {
        fs = make_shader(ctx_.vkd(), shaders.fragment_spirv);

        VkPipelineShaderStageCreateInfo st[2]{};
        st[0].sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        st[0].stage  = VK_SHADER_STAGE_VERTEX_BIT;
        st[0].module = vs;
        st[0].pName  = "main";
        st[1]        = st[0];
        st[1].stage  = VK_SHADER_STAGE_FRAGMENT_BIT;
        st[1].module = fs;

        VkPipelineVertexInputStateCreateInfo vi{.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO};
        if (vl.stride > 0) {
            vi.vertexBindingDescriptionCount   = 1u;
            vi.pVertexBindingDescriptions      = &vbinding;
            vi.vertexAttributeDescriptionCount = static_cast<uint32_t>(vattrs.size());
            vi.pVertexAttributeDescriptions    = vattrs.data();
        }
        VkPipelineInputAssemblyStateCreateInfo ia{.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO};
        ia.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        VkPipelineViewportStateCreateInfo vp{.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO};
        vp.viewportCount = 1u;
        vp.scissorCount  = 1u;
        VkPipelineRasterizationStateCreateInfo rs{.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO};
        rs.polygonMode = VK_POLYGON_MODE_FILL;
        rs.cullMode    = VK_CULL_MODE_NONE;
        rs.frontFace   = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        rs.lineWidth   = 1.0f;
        VkPipelineMultisampleStateCreateInfo ms{.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO};
        ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;
        VkPipelineColorBlendAttachmentState ba{};
        ba.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        VkPipelineColorBlendStateCreateInfo cb{.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO};
        cb.attachmentCount = 1u;
        cb.pAttachments    = &ba;
        const DepthState& depth = pipeline.key.depth;
        VkPipelineDepthStencilStateCreateInfo ds{.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO};
        ds.depthTestEnable  = depth.test ? VK_TRUE : VK_FALSE;
        ds.depthWriteEnable = depth.write ? VK_TRUE : VK_FALSE;
        ds.depthCompareOp   = depth.test ? depth.compare : VK_COMPARE_OP_ALWAYS;
        ds.minDepthBounds   = 0.0f;
        ds.maxDepthBounds   = 1.0f;
        const VkDynamicState dyn_states[2] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
        VkPipelineDynamicStateCreateInfo dyn{.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO};
        dyn.dynamicStateCount = 2u;
        dyn.pDynamicStates    = dyn_states;

        VkGraphicsPipelineCreateInfo pci{.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO};
        pci.stageCount          = 2u;
        pci.pStages             = st;
        pci.pVertexInputState   = &vi;
        pci.pInputAssemblyState = &ia;
        pci.pViewportState      = &vp;
        pci.pRasterizationState = &rs;
        pci.pMultisampleState   = &ms;
        pci.pDepthStencilState  = &ds;
        pci.pColorBlendState    = &cb;
        pci.pDynamicState       = &dyn;
        pci.layout              = pipeline_layout_;
        pci.renderPass          = render_pass_;
        pci.subpass             = 0u;
        VRC_CHECK(ctx_.vkd().createGraphicsPipelines(VK_NULL_HANDLE, 1, &pci, nullptr, &pipeline.pipeline));
    } catch (...) {
        IF_NOT_NULL_DO(fs, ctx_.vkd().destroyShaderModule(fs, nullptr));
        ctx_.vkd().destroyShaderModule(vs, nullptr);
        throw;
    }
    ctx_.vkd().destroyShaderModule(fs, nullptr);
    ctx_.vkd().destroyShaderModule(vs, nullptr);

    pipeline.set_layout = set_layout_;
    pipeline.layout     = pipeline_layout_;
}

// ============================================================================
// Descriptor binding
// ============================================================================
VkDescriptorSet PipelineCache::bind_descriptors(uint32_t frame_slot, const Pipeline& pipeline, const Buffer& uniform, const Texture& texture, VkSampler sampler) {
    VRC_REQUIRE(frame_slot < frames_in_flight_, std::format("frame slot {} out of range (F = {})", frame_slot, frames_in_flight_));
    VRC_REQUIRE(pipeline.pipeline != VK_NULL_HANDLE, "bind_descriptors() on an unbuilt pipeline");
    VRC_REQUIRE(uniform.buffer != VK_NULL_HANDLE, "binding 0 requires a uniform buffer");
    VRC_REQUIRE(texture.view != VK_NULL_HANDLE, "binding 1 requires a texture view");
    if (sampler == VK_NULL_HANDLE) sampler = texture.sampler;
    VRC_REQUIRE(sampler != VK_NULL_HANDLE, "binding 1 requires a sampler");

    SlotBindings& sb = slot_bindings_[SlotKey{frame_slot, &pipeline}];
    if (sb.set == VK_NULL_HANDLE) sb.set = descriptors_.allocate(ctx_.vkd(), pipeline.set_layout);

    const VkDescriptorBufferInfo buffer_info{.buffer = uniform.buffer, .offset = 0u, .range = uniform.size};
    const VkDescriptorImageInfo image_info{.sampler = sampler, .imageView = texture.view, .imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL};
    std::array<VkWriteDescriptorSet, 2> writes{};
    uint32_t count = 0;
    if (sb.uniform != uniform.buffer) {
        writes[count++] = VkWriteDescriptorSet{.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET, .pNext = nullptr, .dstSet = sb.set, .dstBinding = 0u, .dstArrayElement = 0u, .descriptorCount = 1u, .descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, .pImageInfo = nullptr, .pBufferInfo = &buffer_info, .pTexelBufferView = nullptr};
        sb.uniform      = uniform.buffer;
    }
    if (sb.view != texture.view || sb.sampler != sampler) {
        writes[count++] = VkWriteDescriptorSet{.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET, .pNext = nullptr, .dstSet = sb.set, .dstBinding = 1u, .dstArrayElement = 0u, .descriptorCount = 1u, .descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, .pImageInfo = &image_info, .pBufferInfo = nullptr, .pTexelBufferView = nullptr};
        sb.view         = texture.view;
        sb.sampler      = sampler;
    }
    if (count > 0) ctx_.vkd().updateDescriptorSets(count, writes.data(), 0u, nullptr);
    return sb.set;
}

void PipelineCache::forget(const Buffer& uniform) {
    if (uniform.buffer == VK_NULL_HANDLE) return;
    for (auto& [key, sb] : slot_bindings_) {
        if (sb.uniform == uniform.buffer) sb.uniform = VK_NULL_HANDLE;
    }
}

void PipelineCache::forget(const Texture& texture) {
    for (auto& [key, sb] : slot_bindings_) {
        if (texture.view != VK_NULL_HANDLE && sb.view == texture.view) sb.view = VK_NULL_HANDLE;
    }
    forget(texture.sampler);
}

void PipelineCache::forget(VkSampler sampler) {
    if (sampler == VK_NULL_HANDLE) return;
    for (auto& [key, sb] : slot_bindings_) {
        if (sb.sampler == sampler) sb.sampler = VK_NULL_HANDLE;
    }
}

} // namespace vrc
