// ============================================================================
// Vulkan RenderCore - Memory & Buffer Manager
// VMA-backed buffers. Host-visible buffers stay persistently mapped; device-local
// buffers are filled through a transient staging buffer.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_BUFFER_H
#define VULKAN_RENDERCORE_VK_BUFFER_H

#include "vk_mem_alloc.h"
#include <cstddef>
#include <span>
#include <vulkan/vulkan.h>

namespace vrc {

class DeviceContext;

struct Buffer {
    VkBuffer buffer{VK_NULL_HANDLE};     // Vulkan buffer handle
    VmaAllocation allocation{};          // VMA allocation handle
    VkDeviceSize size{};                 // Size in bytes
    VkBufferUsageFlags usage{};          // Usage flags the buffer was created with
    bool host_visible{false};            // CPU-writable through 'mapped'
    void* mapped{nullptr};               // Persistent mapping (host-visible only)
};

class BufferManager {
public:
    explicit BufferManager(const DeviceContext& ctx) : ctx_(ctx) {}

    // Throws RenderError(OutOfDeviceMemory) when the allocation fails.
    [[nodiscard]] Buffer allocate_buffer(VkDeviceSize size, VkBufferUsageFlags usage, bool host_visible) const;

    // CPU copy into a host-visible buffer. The GPU must no longer read the range:
    // for per-frame buffers that means the owning slot's fence has been waited.
    void write(const Buffer& buffer, VkDeviceSize offset, std::span<const std::byte> bytes) const;

    // Blocking copy into a device-local buffer through a transient staging buffer.
    void upload_via_staging(const Buffer& dst, std::span<const std::byte> bytes) const;

    // Device-local buffer initialized with 'bytes' (vertex / index data).
    [[nodiscard]] Buffer create_with_data(std::span<const std::byte> bytes, VkBufferUsageFlags usage) const;

    // Release buffer + allocation and reset the handle. Null buffers are ignored.
    void destroy(Buffer& buffer) const;

private:
    const DeviceContext& ctx_;
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_BUFFER_H
