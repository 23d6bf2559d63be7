// ============================================================================
// Vulkan RenderCore - vk_frame.cpp
// Frame slot arena and the per-frame sequence:
//   wait slot fence -> rebuild stale swapchain -> acquire -> update ->
//   record render pass -> reset fence -> submit -> present -> advance
// ============================================================================
#include "vk_frame.h"
#include "vk_check.h"
#include "vk_log.h"
#include "vk_pipeline.h"
#include "vk_swapchain.h"

#include <algorithm>
#include <format>

namespace vrc {

void record_draw(const vkb::DispatchTable& vkd, VkCommandBuffer cmd, const DrawCall& draw) {
    VRC_REQUIRE(draw.pipeline != nullptr && draw.pipeline->pipeline != VK_NULL_HANDLE, "draw without a built pipeline");
    vkd.cmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, draw.pipeline->pipeline);
    if (draw.descriptor_set != VK_NULL_HANDLE) vkd.cmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, draw.pipeline->layout, 0u, 1u, &draw.descriptor_set, 0u, nullptr);
    if (draw.vertex_buffer != VK_NULL_HANDLE) vkd.cmdBindVertexBuffers(cmd, 0u, 1u, &draw.vertex_buffer, &draw.vertex_offset);
    if (draw.index_buffer != VK_NULL_HANDLE) {
        vkd.cmdBindIndexBuffer(cmd, draw.index_buffer, 0u, draw.index_type);
        vkd.cmdDrawIndexed(cmd, draw.count, draw.instance_count, 0u, 0, 0u);
    } else {
        vkd.cmdDraw(cmd, draw.count, draw.instance_count, 0u, 0u);
    }
}

FrameScheduler::FrameScheduler(const DeviceContext& ctx, const BufferManager& buffers, SwapchainManager& swapchain, FrameSchedulerSettings settings)
    : ctx_(ctx), buffers_(buffers), swapchain_(swapchain), settings_(settings) {
    VRC_REQUIRE(settings_.frames_in_flight >= 1, "at least one frame in flight is required");
}

FrameScheduler::~FrameScheduler() {
    if (initialized_ && ctx_.valid()) destroy();
}

// ============================================================================
// Slot arena
// ============================================================================
void FrameScheduler::initialize() {
    VRC_REQUIRE(ctx_.valid(), "frame scheduler requires an initialized device");
    VRC_REQUIRE(!initialized_, "frame scheduler already initialized");
    const auto& vkd = ctx_.vkd();

    slots_.resize(settings_.frames_in_flight);
    for (FrameSlot& s : slots_) {
        VkCommandBufferAllocateInfo ai{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO, .pNext = nullptr, .commandPool = ctx_.command_pool(), .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY, .commandBufferCount = 1u};
        VRC_CHECK(vkd.allocateCommandBuffers(&ai, &s.command_buffer));
        VkSemaphoreCreateInfo sci{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO, .pNext = nullptr, .flags = 0u};
        VRC_CHECK(vkd.createSemaphore(&sci, nullptr, &s.image_available));
        // Created signaled so the first wait on each slot returns immediately.
        VkFenceCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO, .pNext = nullptr, .flags = VK_FENCE_CREATE_SIGNALED_BIT};
        VRC_CHECK(vkd.createFence(&fci, nullptr, &s.in_flight));
        if (settings_.uniform_buffer_size > 0) s.uniform = buffers_.allocate_buffer(settings_.uniform_buffer_size, VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, true);
    }
    images_in_flight_.assign(swapchain_.image_count(), VK_NULL_HANDLE);
    initialized_ = true;
    log_debug("Frame scheduler ready with {} slot(s)", slots_.size());
}

void FrameScheduler::destroy() {
    if (!initialized_) return;
    const auto& vkd     = ctx_.vkd();
    const VkResult idle = vkd.deviceWaitIdle();
    if (idle != VK_SUCCESS) log_warn("vkDeviceWaitIdle before frame slot destruction returned {}", to_string(idle));
    for (FrameSlot& s : slots_) {
        buffers_.destroy(s.uniform);
        IF_NOT_NULL_DO_AND_SET(s.in_flight, vkd.destroyFence(s.in_flight, nullptr), VK_NULL_HANDLE);
        IF_NOT_NULL_DO_AND_SET(s.image_available, vkd.destroySemaphore(s.image_available, nullptr), VK_NULL_HANDLE);
        IF_NOT_NULL_DO_AND_SET(s.command_buffer, vkd.freeCommandBuffers(ctx_.command_pool(), 1, &s.command_buffer), VK_NULL_HANDLE);
    }
    slots_.clear();
    images_in_flight_.clear();
    open_slot_.reset();
    initialized_ = false;
}

// ============================================================================
// FrameScheduler :: run_frame
// ============================================================================
FrameOutcome FrameScheduler::run_frame(IFrameRenderer& renderer, const FrameTiming& timing) {
    VRC_REQUIRE(initialized_, "run_frame() before initialize()");
    const uint32_t slot_index = static_cast<uint32_t>(frame_counter_ % settings_.frames_in_flight);
    FrameSlot& slot           = slots_[slot_index];

    wait_fence(slot.in_flight);

    if (swapchain_.stale() && !rebuild_swapchain()) return skip("surface has zero area");

    const AcquireResult acq = swapchain_.acquire_next_image(slot.image_available, settings_.acquire_timeout_ns);
    if (acq.status == AcquireStatus::OutOfDate) {
        rebuild_swapchain();
        return skip("swapchain out of date");
    }
    if (acq.status == AcquireStatus::Timeout) {
        log_warn("Swapchain image acquisition timed out");
        return skip("acquire timeout");
    }
    // Suboptimal images are still presentable; the swapchain is rebuilt after present.

    const uint32_t image = acq.image_index;
    if (image >= images_in_flight_.size()) images_in_flight_.resize(image + 1u, VK_NULL_HANDLE);
    if (images_in_flight_[image] != VK_NULL_HANDLE && images_in_flight_[image] != slot.in_flight) wait_fence(images_in_flight_[image]);

    FrameInfo frm{};
    frm.frame_index = frame_counter_;
    frm.slot        = slot_index;
    frm.image_index = image;
    frm.extent      = swapchain_.extent();
    frm.uniform     = slot.uniform.buffer != VK_NULL_HANDLE ? &slot.uniform : nullptr;
    frm.timing      = timing;

    open_slot_       = slot_index;
    bool fence_reset = false;
    try {
        renderer.update(frm);
        record(slot, frm, renderer);
        VRC_CHECK(ctx_.vkd().resetFences(1, &slot.in_flight));
        fence_reset = true;
        ctx_.submit(slot.command_buffer, slot.image_available, VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, swapchain_.render_finished(image), slot.in_flight);
    } catch (...) {
        open_slot_.reset();
        abandon_frame(slot, fence_reset);
        throw;
    }
    open_slot_.reset();
    images_in_flight_[image] = slot.in_flight;

    const PresentStatus ps = swapchain_.present(image, swapchain_.render_finished(image));
    ++stats_.frames_presented;
    ++frame_counter_;
    if (on_presented_) on_presented_(frm);

    if (ps != PresentStatus::Success || swapchain_.stale()) rebuild_swapchain();
    return FrameOutcome::Presented;
}

void FrameScheduler::write_uniform(const FrameInfo& frm, std::span<const std::byte> bytes, VkDeviceSize offset) {
    VRC_REQUIRE(open_slot_.has_value() && *open_slot_ == frm.slot && frm.frame_index == frame_counter_, std::format("write_uniform() for slot {} outside its open window", frm.slot));
    const Buffer& ub = slots_[frm.slot].uniform;
    VRC_REQUIRE(ub.buffer != VK_NULL_HANDLE, "frame slots were created without uniform buffers");
    buffers_.write(ub, offset, bytes);
}

void FrameScheduler::wait_fence(VkFence fence) const {
    const VkResult res = ctx_.vkd().waitForFences(1, &fence, VK_TRUE, settings_.fence_timeout_ns);
    if (res == VK_TIMEOUT) {
        throw RenderError(ErrorKind::DeviceLost, std::format("Frame fence not signaled within {} ms", settings_.fence_timeout_ns / 1'000'000ull), res);
    }
    VRC_CHECK(res);
}

bool FrameScheduler::rebuild_swapchain() {
    const VkExtent2D drawable = drawable_fn_ ? drawable_fn_() : swapchain_.extent();
    if (!swapchain_.rebuild(drawable)) return false;
    ++stats_.swapchain_rebuilds;
    images_in_flight_.assign(swapchain_.image_count(), VK_NULL_HANDLE);
    return true;
}

// The acquire signaled image_available but nothing waits on it, and past
// resetFences the slot fence will never be signaled again. Both are replaced,
// and the swapchain is rebuilt so the acquired image goes back with the old one.
void FrameScheduler::abandon_frame(FrameSlot& slot, bool fence_reset) {
    const auto& vkd = ctx_.vkd();
    swapchain_.mark_stale();
    const VkResult idle = vkd.deviceWaitIdle();
    if (idle != VK_SUCCESS) log_warn("vkDeviceWaitIdle while abandoning frame {} returned {}", frame_counter_, to_string(idle));

    IF_NOT_NULL_DO_AND_SET(slot.image_available, vkd.destroySemaphore(slot.image_available, nullptr), VK_NULL_HANDLE);
    VkSemaphoreCreateInfo sci{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO, .pNext = nullptr, .flags = 0u};
    VRC_CHECK(vkd.createSemaphore(&sci, nullptr, &slot.image_available));

    if (fence_reset) {
        const VkFence old = slot.in_flight;
        IF_NOT_NULL_DO_AND_SET(slot.in_flight, vkd.destroyFence(slot.in_flight, nullptr), VK_NULL_HANDLE);
        VkFenceCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO, .pNext = nullptr, .flags = VK_FENCE_CREATE_SIGNALED_BIT};
        VRC_CHECK(vkd.createFence(&fci, nullptr, &slot.in_flight));
        std::ranges::replace(images_in_flight_, old, VK_NULL_HANDLE);
    }
    log_warn("Frame {} abandoned before submission", frame_counter_);
}

FrameOutcome FrameScheduler::skip(const char* reason) {
    log_debug("Frame {} skipped: {}", frame_counter_, reason);
    ++stats_.frames_skipped;
    ++frame_counter_;
    return FrameOutcome::Skipped;
}

void FrameScheduler::record(FrameSlot& slot, const FrameInfo& frm, IFrameRenderer& renderer) {
    const auto& vkd     = ctx_.vkd();
    VkCommandBuffer cmd = slot.command_buffer;
    VRC_CHECK(vkd.resetCommandBuffer(cmd, 0));
    VkCommandBufferBeginInfo bi{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO, .pNext = nullptr, .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT, .pInheritanceInfo = nullptr};
    VRC_CHECK(vkd.beginCommandBuffer(cmd, &bi));

    std::array<VkClearValue, 2> clear{};
    clear[0].color        = {{settings_.clear_color[0], settings_.clear_color[1], settings_.clear_color[2], settings_.clear_color[3]}};
    clear[1].depthStencil = {1.0f, 0u};
    VkRenderPassBeginInfo rpbi{.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO};
    rpbi.renderPass      = swapchain_.render_pass();
    rpbi.framebuffer     = swapchain_.framebuffers().at(frm.image_index);
    rpbi.renderArea      = {{0, 0}, frm.extent};
    rpbi.clearValueCount = swapchain_.has_depth() ? 2u : 1u;
    rpbi.pClearValues    = clear.data();
    vkd.cmdBeginRenderPass(cmd, &rpbi, VK_SUBPASS_CONTENTS_INLINE);

    VkViewport vp{};
    vp.width    = static_cast<float>(frm.extent.width);
    vp.height   = static_cast<float>(frm.extent.height);
    vp.minDepth = 0.0f;
    vp.maxDepth = 1.0f;
    VkRect2D sc{{0, 0}, frm.extent};
    vkd.cmdSetViewport(cmd, 0u, 1u, &vp);
    vkd.cmdSetScissor(cmd, 0u, 1u, &sc);

    draws_.clear();
    renderer.build_draws(frm, draws_);
    for (const DrawCall& d : draws_) record_draw(vkd, cmd, d);
    renderer.record_overlay(cmd, frm);

    vkd.cmdEndRenderPass(cmd);
    VRC_CHECK(vkd.endCommandBuffer(cmd));
}

} // namespace vrc
