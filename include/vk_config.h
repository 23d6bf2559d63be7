// ============================================================================
// Vulkan RenderCore - Renderer Configuration
// Plain settings struct handed to the engine before init(). Defaults give a
// double-buffered, mailbox-preferring, sRGB swapchain.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_CONFIG_H
#define VULKAN_RENDERCORE_VK_CONFIG_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc {

// Upper bound on frames in flight (size of the frame slot arena).
inline constexpr uint32_t kMaxFramesInFlight = 3;

struct RendererConfig {
    std::string app_name = "vulkan-rendercore"; // Window / application title
    int window_width{1280};                     // Initial window width (logical units)
    int window_height{720};                     // Initial window height (logical units)

    uint32_t frames_in_flight{2};               // F: CPU may record up to F frames ahead
    uint32_t requested_min_images{3};           // Swapchain image count request

    // Surface formats in preference order; first available is the fallback.
    std::vector<VkSurfaceFormatKHR> preferred_formats{
        {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        {VK_FORMAT_R8G8B8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
    };
    VkPresentModeKHR preferred_present_mode{VK_PRESENT_MODE_MAILBOX_KHR}; // FIFO when unavailable
    VkFormat depth_format{VK_FORMAT_UNDEFINED}; // Swapchain depth attachment; UNDEFINED for none

    uint64_t fence_timeout_ns{5'000'000'000ull};   // Frame fence wait bound; expiry means device lost
    uint64_t acquire_timeout_ns{1'000'000'000ull}; // Image acquisition bound; expiry skips the frame

    VkDeviceSize uniform_buffer_size{0};        // Per-slot uniform buffer bytes (0 = none)

    bool enable_validation{false};              // Request validation layers + debug messenger
    bool enable_overlay{true};                  // ImGui HUD drawn inside the frame render pass
    bool sampler_anisotropy{false};             // Require samplerAnisotropy on the device

    std::array<float, 4> clear_color{0.05f, 0.07f, 0.12f, 1.0f};
};

// Throws RenderError(Precondition) describing the first invalid field.
void validate(const RendererConfig& cfg);

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_CONFIG_H
