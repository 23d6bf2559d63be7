// ============================================================================
// Vulkan RenderCore - Test Device
// In-process fake of the Vulkan entry points the core calls. Handles are
// opaque counters; fences, semaphores, command buffers and swapchains carry
// just enough state to detect reuse of in-flight resources and to script
// driver results. Host-visible device memory is backed by real storage so a
// VMA allocator can run on top of the fake device.
// ============================================================================
#ifndef VULKAN_RENDERCORE_TESTS_MOCK_VULKAN_H
#define VULKAN_RENDERCORE_TESTS_MOCK_VULKAN_H

#include "vk_device.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc_test {

template <typename H>
H fake_handle(uint64_t id) {
    return (H)(uintptr_t)id; // NOLINT: dispatchable and non-dispatchable handles alike
}

struct FenceState {
    bool signaled{false};
    bool pending{false};                 // Submitted, not yet observed complete
};

struct SwapchainRecord {
    VkExtent2D extent{};
    VkSwapchainKHR old{VK_NULL_HANDLE};  // oldSwapchain passed at creation
    std::vector<VkImage> images;
    uint32_t next_image{0};
    // Semaphores waited by the last present of each image; the presentation
    // engine holds them until that image is acquired again.
    std::vector<std::vector<VkSemaphore>> present_waits;
};

struct ImageRecord {
    VkExtent3D extent{};
    uint32_t mip_levels{};
    VkFormat format{};
    VkImageUsageFlags usage{};
};

struct MemoryRecord {
    uint32_t type_index{};
    std::vector<std::byte> host;         // Empty for device-local memory
};

struct BlitRecord {
    uint32_t src_level{};
    uint32_t dst_level{};
    VkOffset3D dst_extent{};
    VkFilter filter{};
};

struct MockState {
    uint64_t next_id{0x1000};
    std::map<std::string, int> calls;    // Entry point name -> call count

    // --- Synchronization ---
    std::map<VkFence, FenceState> fences;
    std::map<VkCommandBuffer, VkFence> cmd_last_fence; // Fence of the last submit of each cmd
    int reuse_violations{0};             // Reset/begin of a cmd whose fence is still pending
    int fence_reset_violations{0};       // resetFences on a pending fence
    int max_pending_submits{0};          // Highest number of simultaneously pending fences
    int scripted_fence_timeouts{0};      // Next N waitForFences return VK_TIMEOUT
    std::deque<VkResult> submit_results; // Popped per queueSubmit2, VK_SUCCESS when empty
    std::map<VkSemaphore, bool> semaphores; // Live binary semaphores and their signal state
    int semaphore_signal_violations{0};  // Signal operation on an already signaled semaphore
    VkSemaphore last_submit_signal{VK_NULL_HANDLE};
    VkSemaphore last_present_wait{VK_NULL_HANDLE};

    // --- Surface / swapchain ---
    VkSurfaceCapabilitiesKHR caps{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> present_modes;
    std::map<VkSwapchainKHR, SwapchainRecord> swapchains;
    std::deque<VkResult> acquire_results; // Popped per acquire, VK_SUCCESS when empty
    std::deque<VkResult> present_results; // Popped per present, VK_SUCCESS when empty
    int live_image_views{0};
    int live_framebuffers{0};
    int live_render_passes{0};
    int live_swapchains{0};
    uint32_t last_render_pass_attachments{0};
    uint32_t last_framebuffer_attachments{0};
    uint32_t last_clear_value_count{0};

    // --- Pipelines / descriptors ---
    int graphics_pipelines_created{0};
    int live_pipelines{0};
    int live_shader_modules{0};
    int descriptor_update_calls{0};
    std::vector<uint32_t> last_written_bindings;
    VkBuffer last_written_uniform{VK_NULL_HANDLE}; // Buffer of the last binding 0 write
    bool last_pipeline_depth_test{false};
    bool last_pipeline_depth_write{false};

    // --- Transfer / mip chain ---
    VkFormatFeatureFlags optimal_tiling_features{VK_FORMAT_FEATURE_BLIT_SRC_BIT | VK_FORMAT_FEATURE_BLIT_DST_BIT | VK_FORMAT_FEATURE_SAMPLED_IMAGE_FILTER_LINEAR_BIT};
    std::vector<uint32_t> barrier_batches; // Image barrier count of each cmdPipelineBarrier2
    std::vector<VkImageMemoryBarrier2> image_barriers;
    std::vector<BlitRecord> blits;
    int draws{0};
    int buffer_copies{0};
    int buffer_image_copies{0};

    // --- Memory / resources ---
    std::map<VkDeviceMemory, MemoryRecord> memory;
    std::map<VkBuffer, VkDeviceSize> buffers; // Live buffers and their sizes
    std::map<VkImage, ImageRecord> images;    // Live images (swapchain images excluded)
    ImageRecord last_image{};
    int live_samplers{0};
    VkSamplerCreateInfo last_sampler{};

    uint64_t new_id() { return next_id++; }
    int count(const std::string& name) const {
        const auto it = calls.find(name);
        return it == calls.end() ? 0 : it->second;
    }
};

MockState& mock();
void reset_mock();

PFN_vkVoidFunction VKAPI_CALL mock_get_instance_proc_addr(VkInstance instance, const char* name);
PFN_vkVoidFunction VKAPI_CALL mock_get_device_proc_addr(VkDevice device, const char* name);

// Handles of the fake device (graphics and present share family 0).
vrc::DeviceHandles mock_device_handles();

// VMA allocator whose Vulkan calls all resolve to the fake device. Every
// allocation must be released before vmaDestroyAllocator.
VmaAllocator create_mock_allocator();

// Attach 'ctx' to the fake device.
void adopt_mock_device(vrc::DeviceContext& ctx, VmaAllocator allocator = VK_NULL_HANDLE, const vrc::DeviceRequirements& enabled = {});

} // namespace vrc_test

#endif // VULKAN_RENDERCORE_TESTS_MOCK_VULKAN_H
