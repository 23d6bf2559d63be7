// ============================================================================
// Vulkan RenderCore - vk_buffer.cpp
// VMA-backed buffers: persistently mapped host buffers, device-local buffers
// and blocking staging uploads.
// ============================================================================
#include "vk_buffer.h"
#include "vk_check.h"
#include "vk_device.h"
#include "vk_log.h"

#include <cstring>
#include <format>

namespace vrc {

Buffer BufferManager::allocate_buffer(VkDeviceSize size, VkBufferUsageFlags usage, bool host_visible) const {
    VRC_REQUIRE(ctx_.allocator() != VK_NULL_HANDLE, "buffer allocation requires an initialized allocator");
    VRC_REQUIRE(size > 0, "buffer size must be non-zero");

    if (!host_visible) usage |= VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    VkBufferCreateInfo bci{.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
        .pNext                 = nullptr,
        .flags                 = 0u,
        .size                  = size,
        .usage                 = usage,
        .sharingMode           = VK_SHARING_MODE_EXCLUSIVE,
        .queueFamilyIndexCount = 0u,
        .pQueueFamilyIndices   = nullptr};
    VmaAllocationCreateInfo aci{};
    aci.usage = VMA_MEMORY_USAGE_AUTO;
    if (host_visible) aci.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;

    Buffer out{};
    VmaAllocationInfo info{};
    const VkResult res = vmaCreateBuffer(ctx_.allocator(), &bci, &aci, &out.buffer, &out.allocation, &info);
    if (res == VK_ERROR_OUT_OF_DEVICE_MEMORY || res == VK_ERROR_OUT_OF_HOST_MEMORY) {
        throw RenderError(ErrorKind::OutOfDeviceMemory, std::format("Failed to allocate {} byte buffer ({})", size, to_string(res)), res);
    }
    VRC_CHECK(res);
    out.size         = size;
    out.usage        = usage;
    out.host_visible = host_visible;
    out.mapped       = host_visible ? info.pMappedData : nullptr;
    return out;
}

void BufferManager::write(const Buffer& buffer, VkDeviceSize offset, std::span<const std::byte> bytes) const {
    VRC_REQUIRE(buffer.buffer != VK_NULL_HANDLE, "write to a null buffer");
    VRC_REQUIRE(buffer.host_visible && buffer.mapped != nullptr, "write() requires a host-visible buffer; use upload_via_staging for device-local memory");
    VRC_REQUIRE(offset <= buffer.size && bytes.size() <= buffer.size - offset, std::format("write of {} bytes at offset {} exceeds buffer size {}", bytes.size(), offset, buffer.size));
    if (bytes.empty()) return;
    std::memcpy(static_cast<std::byte*>(buffer.mapped) + offset, bytes.data(), bytes.size());
    VRC_CHECK(vmaFlushAllocation(ctx_.allocator(), buffer.allocation, offset, bytes.size()));
}

void BufferManager::upload_via_staging(const Buffer& dst, std::span<const std::byte> bytes) const {
    VRC_REQUIRE(dst.buffer != VK_NULL_HANDLE, "upload to a null buffer");
    VRC_REQUIRE(bytes.size() <= dst.size, std::format("upload of {} bytes exceeds buffer size {}", bytes.size(), dst.size));
    if (bytes.empty()) return;

    Buffer staging = allocate_buffer(bytes.size(), VK_BUFFER_USAGE_TRANSFER_SRC_BIT, true);
    try {
        write(staging, 0, bytes);
        ctx_.immediate_submit([&](VkCommandBuffer cmd) {
            VkBufferCopy region{.srcOffset = 0, .dstOffset = 0, .size = bytes.size()};
            ctx_.vkd().cmdCopyBuffer(cmd, staging.buffer, dst.buffer, 1, &region);
        });
    } catch (...) {
        destroy(staging);
        throw;
    }
    destroy(staging);
}

Buffer BufferManager::create_with_data(std::span<const std::byte> bytes, VkBufferUsageFlags usage) const {
    Buffer buf = allocate_buffer(bytes.size(), usage, false);
    try {
        upload_via_staging(buf, bytes);
    } catch (...) {
        destroy(buf);
        throw;
    }
    log_debug("Uploaded {} bytes to device-local buffer", bytes.size());
    return buf;
}

void BufferManager::destroy(Buffer& buffer) const {
    if (buffer.buffer == VK_NULL_HANDLE) return;
    vmaDestroyBuffer(ctx_.allocator(), buffer.buffer, buffer.allocation);
    buffer = {};
}

} // namespace vrc
