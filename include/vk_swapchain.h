// ============================================================================
// Vulkan RenderCore - Swapchain Manager
// Owns the swapchain, its image views, framebuffers, the per-image
// render-finished semaphores, the optional depth attachment and the render
// pass that targets them. Lifecycle:
//   Uninitialized -> Ready -> (Stale -> Ready)* -> Destroyed
// A Stale swapchain is never acquired from; it must be rebuilt first.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_SWAPCHAIN_H
#define VULKAN_RENDERCORE_VK_SWAPCHAIN_H

#include "vk_device.h"
#include <cstdint>
#include <functional>
#include <span>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc {

enum class SwapchainState { Uninitialized, Ready, Stale, Destroyed };
enum class AcquireStatus { Success, Suboptimal, OutOfDate, Timeout };

struct AcquireResult {
    AcquireStatus status{AcquireStatus::Success};
    uint32_t image_index{};              // Valid for Success / Suboptimal
};

struct SwapchainSettings {
    uint32_t requested_min_images{3};
    std::vector<VkSurfaceFormatKHR> preferred_formats; // Preference order
    VkPresentModeKHR preferred_present_mode{VK_PRESENT_MODE_MAILBOX_KHR};
    VkFormat depth_format{VK_FORMAT_UNDEFINED};        // UNDEFINED: no depth attachment
};

// --- Selection policy (pure) ---

// max(requested, caps.minImageCount), clamped to caps.maxImageCount when it is non-zero.
[[nodiscard]] uint32_t choose_image_count(uint32_t requested, const VkSurfaceCapabilitiesKHR& caps);

// First available format matching a preferred (format, color space) pair, in
// preference order; otherwise the first available format.
[[nodiscard]] VkSurfaceFormatKHR choose_surface_format(std::span<const VkSurfaceFormatKHR> available, std::span<const VkSurfaceFormatKHR> preferred);

// 'preferred' when available, otherwise FIFO (always supported).
[[nodiscard]] VkPresentModeKHR choose_present_mode(std::span<const VkPresentModeKHR> available, VkPresentModeKHR preferred);

// caps.currentExtent unless it is the 0xFFFFFFFF sentinel, in which case the
// drawable size clamped to [minImageExtent, maxImageExtent].
[[nodiscard]] VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps, VkExtent2D drawable);

[[nodiscard]] const char* to_string(VkPresentModeKHR mode);

// DEPTH, plus STENCIL for combined depth/stencil formats.
[[nodiscard]] VkImageAspectFlags depth_aspect(VkFormat format);

class SwapchainManager {
public:
    // Called after every successful build; 'render_pass_changed' is true when
    // the render pass was recreated (first build or surface format change).
    using RebuiltFn = std::function<void(bool render_pass_changed)>;

    SwapchainManager(const DeviceContext& ctx, SwapchainSettings settings);
    ~SwapchainManager();
    SwapchainManager(const SwapchainManager&)            = delete;
    SwapchainManager& operator=(const SwapchainManager&) = delete;

    // Build the first swapchain for 'surface'. Returns false (state Stale) when
    // the drawable area is zero, e.g. a minimized window. Throws
    // RenderError(Precondition) if the depth format cannot be an attachment.
    bool create(VkSurfaceKHR surface, VkExtent2D drawable);

    // Recreate swapchain, views and framebuffers for the current surface. The
    // surface is kept; the render pass is kept unless the format changed.
    // A zero-sized drawable leaves everything untouched and returns false.
    bool rebuild(VkExtent2D drawable);

    [[nodiscard]] AcquireResult acquire_next_image(VkSemaphore signal, uint64_t timeout_ns);

    // Present through the device context; OutOfDate / Suboptimal mark the swapchain Stale.
    PresentStatus present(uint32_t image_index, VkSemaphore wait);

    // Window resized: the next frame rebuilds before acquiring.
    void mark_stale();

    void destroy();

    void set_rebuilt_callback(RebuiltFn fn) { on_rebuilt_ = std::move(fn); }

    [[nodiscard]] SwapchainState state() const { return state_; }
    [[nodiscard]] bool stale() const { return state_ == SwapchainState::Stale; }
    [[nodiscard]] VkSwapchainKHR handle() const { return swapchain_; }
    [[nodiscard]] VkExtent2D extent() const { return extent_; }
    [[nodiscard]] VkSurfaceFormatKHR surface_format() const { return format_; }
    [[nodiscard]] VkPresentModeKHR present_mode() const { return present_mode_; }
    [[nodiscard]] VkRenderPass render_pass() const { return render_pass_; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(images_.size()); }
    [[nodiscard]] uint32_t min_image_count() const { return min_image_count_; }
    [[nodiscard]] const std::vector<VkImageView>& image_views() const { return image_views_; }
    [[nodiscard]] const std::vector<VkFramebuffer>& framebuffers() const { return framebuffers_; }
    // Signaled by the submit that renders 'image_index', waited by its present.
    // Per image, so it is only re-signaled after the image was acquired again.
    [[nodiscard]] VkSemaphore render_finished(uint32_t image_index) const { return render_finished_.at(image_index); }
    [[nodiscard]] bool has_depth() const { return settings_.depth_format != VK_FORMAT_UNDEFINED; }
    [[nodiscard]] VkFormat depth_format() const { return settings_.depth_format; }
    [[nodiscard]] VkImageView depth_view() const { return depth_view_; }
    [[nodiscard]] uint64_t rebuild_count() const { return rebuild_count_; }

private:
    bool build(VkExtent2D drawable);
    void create_render_pass(VkFormat format);
    void create_depth_target(VkExtent2D extent);
    void destroy_targets();

    const DeviceContext& ctx_;
    SwapchainSettings settings_;
    SwapchainState state_{SwapchainState::Uninitialized};
    RebuiltFn on_rebuilt_;

    VkSurfaceKHR surface_{VK_NULL_HANDLE};      // Borrowed; owned by the engine
    VkSwapchainKHR swapchain_{VK_NULL_HANDLE};  // Swapchain handle
    VkSurfaceFormatKHR format_{};               // Image format + color space
    VkPresentModeKHR present_mode_{VK_PRESENT_MODE_FIFO_KHR};
    VkExtent2D extent_{};                       // Current extent
    uint32_t min_image_count_{};                // Count requested at creation
    VkRenderPass render_pass_{VK_NULL_HANDLE};  // Color (clear + present) and optional depth
    std::vector<VkImage> images_;               // Images (owned by the swapchain)
    std::vector<VkImageView> image_views_;      // One view per image
    std::vector<VkFramebuffer> framebuffers_;   // One framebuffer per view
    std::vector<VkSemaphore> render_finished_;  // One per image, submit -> present
    VkImage depth_image_{VK_NULL_HANDLE};       // Shared by every framebuffer, sized to the extent
    VmaAllocation depth_allocation_{};
    VkImageView depth_view_{VK_NULL_HANDLE};
    uint64_t rebuild_count_{0};                 // Successful rebuilds after the first build
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_SWAPCHAIN_H
