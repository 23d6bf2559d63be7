// ============================================================================
// Vulkan RenderCore - Device Context
// Owns the logical device, its queues, the shared command pool and the VMA
// allocator. Every other component borrows it by reference, so it must be
// initialized first and destroyed last.
//
// All device-level calls go through the vk-bootstrap dispatch tables held here,
// which lets the same code run against a real driver or an adopted device.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_DEVICE_H
#define VULKAN_RENDERCORE_VK_DEVICE_H

#include "VkBootstrap.h"
#include "vk_mem_alloc.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vulkan/vulkan.h>

namespace vrc {

// Raw handles of a live device and its queues.
struct DeviceHandles {
    VkInstance instance{};               // Vulkan instance
    VkPhysicalDevice physical{};         // Chosen physical device
    VkDevice device{};                   // Logical device
    VkQueue graphics_queue{};            // Graphics queue handle
    VkQueue present_queue{};             // Presentation queue (often same as graphics)
    uint32_t graphics_queue_family{};    // Family index for graphics queue
    uint32_t present_queue_family{};     // Family index for present queue
};

// What the selected device must support.
struct DeviceRequirements {
    bool sampler_anisotropy{false};
    bool prefer_discrete{true};
};

enum class PresentStatus { Success, Suboptimal, OutOfDate };

class DeviceContext {
public:
    DeviceContext() = default;
    ~DeviceContext();
    DeviceContext(const DeviceContext&)            = delete;
    DeviceContext& operator=(const DeviceContext&) = delete;
    DeviceContext(DeviceContext&&)                 = delete;
    DeviceContext& operator=(DeviceContext&&)      = delete;

    // Select a physical device able to render and present to 'surface', create
    // the logical device, queues, allocator and command pool.
    // Throws RenderError(NoSuitableDevice) when no GPU qualifies.
    void initialize(const vkb::Instance& instance, VkSurfaceKHR surface, const DeviceRequirements& req);

    // Attach to a device created elsewhere. The device itself is not destroyed
    // by destroy(); the command pool created here is. 'enabled' states which
    // optional features the external device was created with.
    void adopt(const DeviceHandles& handles, PFN_vkGetInstanceProcAddr gipa, PFN_vkGetDeviceProcAddr gdpa, VmaAllocator allocator = VK_NULL_HANDLE, const DeviceRequirements& enabled = {});

    // Wait idle, then release the command pool, allocator and (if owned) device.
    void destroy();

    [[nodiscard]] bool valid() const { return handles_.device != VK_NULL_HANDLE; }

    // Submit one command buffer on the graphics queue. Null semaphores are skipped.
    void submit(VkCommandBuffer cmd, VkSemaphore wait, VkPipelineStageFlags2 wait_stage, VkSemaphore signal, VkFence fence) const;

    // Queue an image for presentation. OutOfDate / Suboptimal are reported, other failures throw.
    [[nodiscard]] PresentStatus present(VkSwapchainKHR swapchain, uint32_t image_index, VkSemaphore wait) const;

    // Record + submit + block until complete. Startup and reload uploads only.
    void immediate_submit(const std::function<void(VkCommandBuffer)>& record) const;

    void wait_idle() const;

    [[nodiscard]] const DeviceHandles& handles() const { return handles_; }
    [[nodiscard]] VkDevice device() const { return handles_.device; }
    [[nodiscard]] VkPhysicalDevice physical() const { return handles_.physical; }
    [[nodiscard]] VmaAllocator allocator() const { return allocator_; }
    [[nodiscard]] VkCommandPool command_pool() const { return command_pool_; }
    [[nodiscard]] const vkb::DispatchTable& vkd() const { return vkd_; }
    [[nodiscard]] const vkb::InstanceDispatchTable& vki() const { return vki_; }
    [[nodiscard]] const std::string& device_name() const { return device_name_; }
    // Optional features actually enabled on the logical device.
    [[nodiscard]] const DeviceRequirements& enabled_features() const { return enabled_; }

private:
    void create_command_pool();

    DeviceHandles handles_{};            // Live handles
    vkb::DispatchTable vkd_{};           // Device-level function table
    vkb::InstanceDispatchTable vki_{};   // Instance-level function table
    VmaAllocator allocator_{};           // VMA allocator for GPU memory
    VkCommandPool command_pool_{};       // Resettable pool on the graphics family
    vkb::Device vkb_device_{};           // Kept for vkb::destroy_device
    std::string device_name_;            // Physical device name (for logs / HUD)
    DeviceRequirements enabled_{};       // Features requested at creation
    bool owns_device_{false};            // false for adopted devices
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_DEVICE_H
