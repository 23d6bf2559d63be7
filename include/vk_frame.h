// ============================================================================
// Vulkan RenderCore - Frame Scheduler
// Drives one frame at a time over a fixed arena of F frame slots. Slot i's
// fence is always waited before slot i's command buffer or uniform buffer is
// touched again, so the CPU never runs more than F frames ahead of the GPU.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_FRAME_H
#define VULKAN_RENDERCORE_VK_FRAME_H

#include "vk_buffer.h"
#include "vk_device.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc {

class SwapchainManager;
struct Pipeline;

// Per-slot resources, indexed by frame_counter % F. The render-finished
// semaphore belongs to the swapchain image, not the slot.
struct FrameSlot {
    VkCommandBuffer command_buffer{};    // Primary command buffer, re-recorded every use
    VkSemaphore image_available{};       // Signaled by acquire, waited by submit
    VkFence in_flight{};                 // Signaled when this slot's last submission retired
    Buffer uniform{};                    // Host-visible uniform buffer (optional)
};

struct FrameTiming {
    double dt_sec{};                     // Delta-time (seconds) for the frame
    double time_sec{};                   // Accumulated time (seconds) since start
};

// Snapshot handed to renderer hooks for the frame being built.
struct FrameInfo {
    uint64_t frame_index{};              // Absolute frame counter
    uint32_t slot{};                     // Frame slot in use
    uint32_t image_index{};              // Acquired swapchain image
    VkExtent2D extent{};                 // Output surface extent (pixels)
    const Buffer* uniform{};             // Slot uniform buffer, null when disabled
    FrameTiming timing{};
};

struct DrawCall {
    const Pipeline* pipeline{};          // Pipeline from the cache
    VkDescriptorSet descriptor_set{};    // From PipelineCache::bind_descriptors
    VkBuffer vertex_buffer{};            // Binding 0 vertex buffer (may be null)
    VkDeviceSize vertex_offset{};
    VkBuffer index_buffer{};             // Null: non-indexed draw
    VkIndexType index_type{VK_INDEX_TYPE_UINT32};
    uint32_t count{};                    // Index count, or vertex count when non-indexed
    uint32_t instance_count{1};
};

// Bind pipeline, descriptor set and buffers, then draw.
void record_draw(const vkb::DispatchTable& vkd, VkCommandBuffer cmd, const DrawCall& draw);

// ============================================================================
// IFrameRenderer - per-frame hooks implemented by the caller of run_frame().
// ============================================================================
class IFrameRenderer {
public:
    virtual ~IFrameRenderer() = default;

    // CPU work for the frame; the slot is open, so write_uniform() is legal here.
    virtual void update(const FrameInfo& frm) { (void)frm; }

    // Mandatory: append the draws for this frame.
    virtual void build_draws(const FrameInfo& frm, std::vector<DrawCall>& out) = 0;

    // Optional extra commands recorded inside the render pass after the draws.
    virtual void record_overlay(VkCommandBuffer cmd, const FrameInfo& frm) { (void)cmd; (void)frm; }
};

enum class FrameOutcome { Presented, Skipped };

struct FrameStats {
    uint64_t frames_presented{};
    uint64_t frames_skipped{};
    uint64_t swapchain_rebuilds{};       // Rebuilds performed by the scheduler
};

struct FrameSchedulerSettings {
    uint32_t frames_in_flight{2};
    uint64_t fence_timeout_ns{5'000'000'000ull};
    uint64_t acquire_timeout_ns{1'000'000'000ull};
    VkDeviceSize uniform_buffer_size{0};
    std::array<float, 4> clear_color{0.0f, 0.0f, 0.0f, 1.0f};
};

class FrameScheduler {
public:
    using DrawableFn  = std::function<VkExtent2D()>;
    using PresentedFn = std::function<void(const FrameInfo&)>;

    FrameScheduler(const DeviceContext& ctx, const BufferManager& buffers, SwapchainManager& swapchain, FrameSchedulerSettings settings);
    ~FrameScheduler();
    FrameScheduler(const FrameScheduler&)            = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    // Allocate the slot arena (command buffers, semaphores, signaled fences, uniforms).
    void initialize();
    // Wait for the device to go idle, then release slot resources.
    void destroy();

    // Source of the drawable size used for swapchain rebuilds (window pixels).
    void set_drawable_extent_fn(DrawableFn fn) { drawable_fn_ = std::move(fn); }
    void set_frame_presented_callback(PresentedFn fn) { on_presented_ = std::move(fn); }

    // One full frame: fence wait, (re)build, acquire, update, record, submit, present.
    // Throws RenderError(DeviceLost) when the slot fence exceeds its timeout.
    // If anything throws between acquire and submit, the slot's semaphore and
    // fence are restored and the swapchain is marked stale before rethrowing,
    // so the next call starts from a clean slot.
    FrameOutcome run_frame(IFrameRenderer& renderer, const FrameTiming& timing = {});

    // Copy into the slot uniform buffer of 'frm'. Legal only while that slot is
    // open (after its fence wait, before submission).
    void write_uniform(const FrameInfo& frm, std::span<const std::byte> bytes, VkDeviceSize offset = 0);

    [[nodiscard]] const FrameStats& stats() const { return stats_; }
    [[nodiscard]] uint64_t frame_counter() const { return frame_counter_; }
    [[nodiscard]] uint32_t frames_in_flight() const { return settings_.frames_in_flight; }
    [[nodiscard]] const FrameSlot& slot(uint32_t index) const { return slots_.at(index); }
    [[nodiscard]] bool slot_open() const { return open_slot_.has_value(); }

private:
    void wait_fence(VkFence fence) const;
    bool rebuild_swapchain();
    FrameOutcome skip(const char* reason);
    void abandon_frame(FrameSlot& slot, bool fence_reset);
    void record(FrameSlot& slot, const FrameInfo& frm, IFrameRenderer& renderer);

    const DeviceContext& ctx_;
    const BufferManager& buffers_;
    SwapchainManager& swapchain_;
    FrameSchedulerSettings settings_;
    DrawableFn drawable_fn_;
    PresentedFn on_presented_;

    std::vector<FrameSlot> slots_;           // Ring of per-frame resources
    std::vector<VkFence> images_in_flight_;  // Fence of the slot that last rendered each image
    std::vector<DrawCall> draws_;            // Reused draw list
    std::optional<uint32_t> open_slot_;      // Slot between fence wait and submit
    uint64_t frame_counter_{0};
    FrameStats stats_{};
    bool initialized_{false};
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_FRAME_H
