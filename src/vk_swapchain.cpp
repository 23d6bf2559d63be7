// ============================================================================
// Vulkan RenderCore - vk_swapchain.cpp
// Surface format / present mode / extent policy, swapchain (re)creation with
// oldSwapchain hand-off, image views, depth attachment, framebuffers and the
// presentation render pass.
// ============================================================================
#include "vk_swapchain.h"
#include "vk_check.h"
#include "vk_log.h"

#include <algorithm>
#include <array>
#include <format>

namespace vrc {

// ============================================================================
// Selection policy
// ============================================================================
uint32_t choose_image_count(uint32_t requested, const VkSurfaceCapabilitiesKHR& caps) {
    uint32_t count = std::max(requested, caps.minImageCount);
    if (caps.maxImageCount != 0) count = std::min(count, caps.maxImageCount);
    return count;
}

VkSurfaceFormatKHR choose_surface_format(std::span<const VkSurfaceFormatKHR> available, std::span<const VkSurfaceFormatKHR> preferred) {
    VRC_REQUIRE(!available.empty(), "surface reports no formats");
    for (const VkSurfaceFormatKHR& want : preferred) {
        const auto it = std::ranges::find_if(available, [&](const VkSurfaceFormatKHR& f) { return f.format == want.format && f.colorSpace == want.colorSpace; });
        if (it != available.end()) return *it;
    }
    log_warn("No preferred surface format available, falling back to format {}", static_cast<int>(available.front().format));
    return available.front();
}

VkPresentModeKHR choose_present_mode(std::span<const VkPresentModeKHR> available, VkPresentModeKHR preferred) {
    if (std::ranges::find(available, preferred) != available.end()) return preferred;
    if (preferred != VK_PRESENT_MODE_FIFO_KHR) log_info("Present mode {} unavailable, using FIFO", to_string(preferred));
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps, VkExtent2D drawable) {
    if (caps.currentExtent.width != UINT32_MAX) return caps.currentExtent;
    return {std::clamp(drawable.width, caps.minImageExtent.width, caps.maxImageExtent.width), std::clamp(drawable.height, caps.minImageExtent.height, caps.maxImageExtent.height)};
}

const char* to_string(VkPresentModeKHR mode) {
    switch (mode) {
    case VK_PRESENT_MODE_IMMEDIATE_KHR: return "IMMEDIATE";
    case VK_PRESENT_MODE_MAILBOX_KHR: return "MAILBOX";
    case VK_PRESENT_MODE_FIFO_KHR: return "FIFO";
    case VK_PRESENT_MODE_FIFO_RELAXED_KHR: return "FIFO_RELAXED";
    default: return "OTHER";
    }
}

VkImageAspectFlags depth_aspect(VkFormat format) {
    switch (format) {
    case VK_FORMAT_D16_UNORM_S8_UINT:
    case VK_FORMAT_D24_UNORM_S8_UINT:
    case VK_FORMAT_D32_SFLOAT_S8_UINT: return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;
    default: return VK_IMAGE_ASPECT_DEPTH_BIT;
    }
}

// ============================================================================
// SwapchainManager
// ============================================================================
SwapchainManager::SwapchainManager(const DeviceContext& ctx, SwapchainSettings settings) : ctx_(ctx), settings_(std::move(settings)) {}

SwapchainManager::~SwapchainManager() {
    if (ctx_.valid()) destroy();
}

bool SwapchainManager::create(VkSurfaceKHR surface, VkExtent2D drawable) {
    VRC_REQUIRE(ctx_.valid(), "swapchain creation requires an initialized device");
    VRC_REQUIRE(state_ == SwapchainState::Uninitialized, "swapchain already created");
    VRC_REQUIRE(surface != VK_NULL_HANDLE, "swapchain creation requires a surface");
    if (has_depth()) {
        VkFormatProperties props{};
        ctx_.vki().getPhysicalDeviceFormatProperties(ctx_.physical(), settings_.depth_format, &props);
        VRC_REQUIRE((props.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) != 0, std::format("format {} cannot be a depth attachment", static_cast<int>(settings_.depth_format)));
        VRC_REQUIRE(ctx_.allocator() != VK_NULL_HANDLE, "a depth attachment requires an initialized allocator");
    }
    surface_ = surface;
    state_   = SwapchainState::Stale;
    return build(drawable);
}

bool SwapchainManager::rebuild(VkExtent2D drawable) {
    VRC_REQUIRE(state_ == SwapchainState::Ready || state_ == SwapchainState::Stale, "rebuild() on a swapchain that was never created or is destroyed");
    return build(drawable);
}

bool SwapchainManager::build(VkExtent2D drawable) {
    ctx_.wait_idle();

    const auto& vki = ctx_.vki();
    const auto& vkd = ctx_.vkd();
    VkSurfaceCapabilitiesKHR caps{};
    VRC_CHECK(vki.getPhysicalDeviceSurfaceCapabilitiesKHR(ctx_.physical(), surface_, &caps));

    const VkExtent2D extent = choose_extent(caps, drawable);
    if (extent.width == 0 || extent.height == 0) {
        state_ = SwapchainState::Stale;
        log_debug("Drawable area is zero, swapchain rebuild deferred");
        return false;
    }

    uint32_t n = 0;
    VRC_CHECK(vki.getPhysicalDeviceSurfaceFormatsKHR(ctx_.physical(), surface_, &n, nullptr));
    std::vector<VkSurfaceFormatKHR> formats(n);
    VRC_CHECK(vki.getPhysicalDeviceSurfaceFormatsKHR(ctx_.physical(), surface_, &n, formats.data()));
    formats.resize(n);
    VRC_CHECK(vki.getPhysicalDeviceSurfacePresentModesKHR(ctx_.physical(), surface_, &n, nullptr));
    std::vector<VkPresentModeKHR> modes(n);
    VRC_CHECK(vki.getPhysicalDeviceSurfacePresentModesKHR(ctx_.physical(), surface_, &n, modes.data()));
    modes.resize(n);

    const VkSurfaceFormatKHR format = choose_surface_format(formats, settings_.preferred_formats);
    const VkPresentModeKHR mode     = choose_present_mode(modes, settings_.preferred_present_mode);
    const uint32_t image_count      = choose_image_count(settings_.requested_min_images, caps);

    VkCompositeAlphaFlagBitsKHR alpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    if (!(caps.supportedCompositeAlpha & alpha)) {
        for (VkCompositeAlphaFlagBitsKHR a : {VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR, VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR, VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR}) {
            if (caps.supportedCompositeAlpha & a) { alpha = a; break; }
        }
    }

    const DeviceHandles& h                 = ctx_.handles();
    const std::array<uint32_t, 2> families = {h.graphics_queue_family, h.present_queue_family};
    const bool shared                      = h.graphics_queue_family != h.present_queue_family;
    const VkSwapchainKHR old               = swapchain_;
    VkSwapchainCreateInfoKHR sci{.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR};
    sci.surface               = surface_;
    sci.minImageCount         = image_count;
    sci.imageFormat           = format.format;
    sci.imageColorSpace       = format.colorSpace;
    sci.imageExtent           = extent;
    sci.imageArrayLayers      = 1u;
    sci.imageUsage            = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    sci.imageSharingMode      = shared ? VK_SHARING_MODE_CONCURRENT : VK_SHARING_MODE_EXCLUSIVE;
    sci.queueFamilyIndexCount = shared ? 2u : 0u;
    sci.pQueueFamilyIndices   = shared ? families.data() : nullptr;
    sci.preTransform          = caps.currentTransform;
    sci.compositeAlpha        = alpha;
    sci.presentMode           = mode;
    sci.clipped               = VK_TRUE;
    sci.oldSwapchain          = old;

    // Views and framebuffers reference the old images; drop them before the hand-off.
    destroy_targets();
    VkSwapchainKHR fresh{};
    VRC_CHECK(vkd.createSwapchainKHR(&sci, nullptr, &fresh));
    IF_NOT_NULL_DO(old, vkd.destroySwapchainKHR(old, nullptr));
    swapchain_       = fresh;
    extent_          = extent;
    present_mode_    = mode;
    min_image_count_ = image_count;

    VRC_CHECK(vkd.getSwapchainImagesKHR(swapchain_, &n, nullptr));
    images_.resize(n);
    VRC_CHECK(vkd.getSwapchainImagesKHR(swapchain_, &n, images_.data()));
    images_.resize(n);

    const bool render_pass_changed = render_pass_ == VK_NULL_HANDLE || format.format != format_.format;
    format_                        = format;
    if (render_pass_changed) create_render_pass(format.format);
    if (has_depth()) create_depth_target(extent);

    image_views_.reserve(images_.size());
    framebuffers_.reserve(images_.size());
    render_finished_.reserve(images_.size());
    for (VkImage img : images_) {
        VkImageViewCreateInfo viewci{.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
            .pNext            = nullptr,
            .flags            = 0u,
            .image            = img,
            .viewType         = VK_IMAGE_VIEW_TYPE_2D,
            .format           = format.format,
            .components       = {VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY},
            .subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0u, 1u, 0u, 1u}};
        VkImageView view{};
        VRC_CHECK(vkd.createImageView(&viewci, nullptr, &view));
        image_views_.push_back(view);

        const std::array<VkImageView, 2> attachments{view, depth_view_};
        VkFramebufferCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO};
        fci.renderPass      = render_pass_;
        fci.attachmentCount = has_depth() ? 2u : 1u;
        fci.pAttachments    = attachments.data();
        fci.width           = extent.width;
        fci.height          = extent.height;
        fci.layers          = 1u;
        VkFramebuffer fb{};
        VRC_CHECK(vkd.createFramebuffer(&fci, nullptr, &fb));
        framebuffers_.push_back(fb);

        VkSemaphoreCreateInfo semci{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO, .pNext = nullptr, .flags = 0u};
        VkSemaphore done{};
        VRC_CHECK(vkd.createSemaphore(&semci, nullptr, &done));
        render_finished_.push_back(done);
    }

    if (old != VK_NULL_HANDLE) ++rebuild_count_;
    state_ = SwapchainState::Ready;
    log_info("Swapchain {}x{} format {} present {} images {}", extent.width, extent.height, static_cast<int>(format.format), to_string(mode), images_.size());
    if (on_rebuilt_) on_rebuilt_(render_pass_changed);
    return true;
}

// Color attachment 0: clear on load, store, hand to the presentation engine.
// Depth attachment 1 (when enabled): cleared every frame, never stored.
void SwapchainManager::create_render_pass(VkFormat format) {
    const auto& vkd = ctx_.vkd();
    IF_NOT_NULL_DO_AND_SET(render_pass_, vkd.destroyRenderPass(render_pass_, nullptr), VK_NULL_HANDLE);

    VkAttachmentDescription color{};
    color.format         = format;
    color.samples        = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp        = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout    = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentDescription depth{};
    depth.format         = settings_.depth_format;
    depth.samples        = VK_SAMPLE_COUNT_1_BIT;
    depth.loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
    depth.storeOp        = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depth.stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    depth.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depth.initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    depth.finalLayout    = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
    const std::array<VkAttachmentDescription, 2> attachments{color, depth};

    VkAttachmentReference color_ref{.attachment = 0u, .layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    VkAttachmentReference depth_ref{.attachment = 1u, .layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};
    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint       = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount    = 1u;
    subpass.pColorAttachments       = &color_ref;
    subpass.pDepthStencilAttachment = has_depth() ? &depth_ref : nullptr;

    // The acquire semaphore is waited at COLOR_ATTACHMENT_OUTPUT; the layout
    // transition must not start before it. The single depth image is shared by
    // all frames, so the previous frame's depth writes must finish before the clear.
    VkSubpassDependency dep{};
    dep.srcSubpass    = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass    = 0u;
    dep.srcStageMask  = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.srcAccessMask = 0u;
    dep.dstStageMask  = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    if (has_depth()) {
        dep.srcStageMask |= VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
        dep.srcAccessMask |= VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
        dep.dstStageMask |= VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
        dep.dstAccessMask |= VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
    }

    VkRenderPassCreateInfo rpci{.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO};
    rpci.attachmentCount = has_depth() ? 2u : 1u;
    rpci.pAttachments    = attachments.data();
    rpci.subpassCount    = 1u;
    rpci.pSubpasses      = &subpass;
    rpci.dependencyCount = 1u;
    rpci.pDependencies   = &dep;
    VRC_CHECK(vkd.createRenderPass(&rpci, nullptr, &render_pass_));
}

void SwapchainManager::create_depth_target(VkExtent2D extent) {
    VkImageCreateInfo imgci{.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO};
    imgci.imageType     = VK_IMAGE_TYPE_2D;
    imgci.format        = settings_.depth_format;
    imgci.extent        = {extent.width, extent.height, 1u};
    imgci.mipLevels     = 1u;
    imgci.arrayLayers   = 1u;
    imgci.samples       = VK_SAMPLE_COUNT_1_BIT;
    imgci.tiling        = VK_IMAGE_TILING_OPTIMAL;
    imgci.usage         = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    imgci.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    imgci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    VmaAllocationCreateInfo ainfo{};
    ainfo.usage         = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
    ainfo.requiredFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
    const VkResult res  = vmaCreateImage(ctx_.allocator(), &imgci, &ainfo, &depth_image_, &depth_allocation_, nullptr);
    if (res == VK_ERROR_OUT_OF_DEVICE_MEMORY || res == VK_ERROR_OUT_OF_HOST_MEMORY) {
        throw RenderError(ErrorKind::OutOfDeviceMemory, std::format("Failed to allocate {}x{} depth attachment", extent.width, extent.height), res);
    }
    VRC_CHECK(res);

    VkImageViewCreateInfo viewci{.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
    viewci.image            = depth_image_;
    viewci.viewType         = VK_IMAGE_VIEW_TYPE_2D;
    viewci.format           = settings_.depth_format;
    viewci.subresourceRange = {depth_aspect(settings_.depth_format), 0u, 1u, 0u, 1u};
    VRC_CHECK(ctx_.vkd().createImageView(&viewci, nullptr, &depth_view_));
}

AcquireResult SwapchainManager::acquire_next_image(VkSemaphore signal, uint64_t timeout_ns) {
    VRC_REQUIRE(state_ == SwapchainState::Ready, "acquire_next_image() requires a Ready swapchain; rebuild a stale one first");
    AcquireResult out{};
    const VkResult res = ctx_.vkd().acquireNextImageKHR(swapchain_, timeout_ns, signal, VK_NULL_HANDLE, &out.image_index);
    switch (res) {
    case VK_SUCCESS: out.status = AcquireStatus::Success; break;
    case VK_SUBOPTIMAL_KHR: out.status = AcquireStatus::Suboptimal; mark_stale(); break;
    case VK_ERROR_OUT_OF_DATE_KHR: out.status = AcquireStatus::OutOfDate; mark_stale(); break;
    case VK_TIMEOUT:
    case VK_NOT_READY: out.status = AcquireStatus::Timeout; break;
    default: VRC_CHECK(res); break;
    }
    return out;
}

PresentStatus SwapchainManager::present(uint32_t image_index, VkSemaphore wait) {
    VRC_REQUIRE(swapchain_ != VK_NULL_HANDLE, "present() without a swapchain");
    const PresentStatus st = ctx_.present(swapchain_, image_index, wait);
    if (st != PresentStatus::Success) mark_stale();
    return st;
}

void SwapchainManager::mark_stale() {
    if (state_ == SwapchainState::Ready) state_ = SwapchainState::Stale;
}

void SwapchainManager::destroy_targets() {
    const auto& vkd = ctx_.vkd();
    for (auto fb : framebuffers_) IF_NOT_NULL_DO(fb, vkd.destroyFramebuffer(fb, nullptr));
    framebuffers_.clear();
    for (auto v : image_views_) IF_NOT_NULL_DO(v, vkd.destroyImageView(v, nullptr));
    image_views_.clear();
    for (auto s : render_finished_) IF_NOT_NULL_DO(s, vkd.destroySemaphore(s, nullptr));
    render_finished_.clear();
    images_.clear();
    IF_NOT_NULL_DO_AND_SET(depth_view_, vkd.destroyImageView(depth_view_, nullptr), VK_NULL_HANDLE);
    if (depth_image_ != VK_NULL_HANDLE) {
        vmaDestroyImage(ctx_.allocator(), depth_image_, depth_allocation_);
        depth_image_      = VK_NULL_HANDLE;
        depth_allocation_ = {};
    }
}

void SwapchainManager::destroy() {
    if (state_ == SwapchainState::Destroyed || state_ == SwapchainState::Uninitialized) return;
    const VkResult idle = ctx_.vkd().deviceWaitIdle();
    if (idle != VK_SUCCESS) log_warn("vkDeviceWaitIdle before swapchain destruction returned {}", to_string(idle));
    destroy_targets();
    IF_NOT_NULL_DO_AND_SET(render_pass_, ctx_.vkd().destroyRenderPass(render_pass_, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(swapchain_, ctx_.vkd().destroySwapchainKHR(swapchain_, nullptr), VK_NULL_HANDLE);
    surface_ = VK_NULL_HANDLE;
    state_   = SwapchainState::Destroyed;
}

} // namespace vrc
