#include "mock_vulkan.h"
#include "vk_buffer.h"
#include "vk_check.h"
#include "vk_frame.h"
#include "vk_pipeline.h"
#include "vk_swapchain.h"

#include <array>
#include <functional>
#include <gtest/gtest.h>
#include <vector>

namespace {

// Records what the scheduler hands to the renderer hooks.
class RecordingRenderer final : public vrc::IFrameRenderer {
public:
    void update(const vrc::FrameInfo& frm) override {
        updates.push_back(frm);
        if (on_update) on_update(frm);
    }
    void build_draws(const vrc::FrameInfo& frm, std::vector<vrc::DrawCall>& out) override {
        (void)frm;
        if (pipeline) out.push_back(vrc::DrawCall{.pipeline = pipeline, .count = 3u});
    }
    void record_overlay(VkCommandBuffer cmd, const vrc::FrameInfo& frm) override {
        (void)cmd;
        (void)frm;
        ++overlays;
    }

    std::vector<vrc::FrameInfo> updates;
    std::function<void(const vrc::FrameInfo&)> on_update;
    const vrc::Pipeline* pipeline{};
    int overlays{0};
};

class FrameSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        vrc_test::reset_mock();
        allocator_ = vrc_test::create_mock_allocator();
        ASSERT_NE(allocator_, VK_NULL_HANDLE);
        vrc_test::adopt_mock_device(ctx_, allocator_);
        buffers_   = std::make_unique<vrc::BufferManager>(ctx_);
        swapchain_ = std::make_unique<vrc::SwapchainManager>(ctx_, vrc::SwapchainSettings{.requested_min_images = 3, .preferred_formats = {{VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR}}, .preferred_present_mode = VK_PRESENT_MODE_FIFO_KHR});
        ASSERT_TRUE(swapchain_->create(vrc_test::fake_handle<VkSurfaceKHR>(0x55), {800u, 600u}));
    }
    void TearDown() override {
        frames_.reset();
        swapchain_.reset();
        buffers_.reset();
        ctx_.destroy();
        vmaDestroyAllocator(allocator_);
    }

    vrc::FrameScheduler& make_scheduler(uint32_t frames_in_flight, VkDeviceSize uniform_size = 0) {
        frames_ = std::make_unique<vrc::FrameScheduler>(ctx_, *buffers_, *swapchain_, vrc::FrameSchedulerSettings{.frames_in_flight = frames_in_flight, .uniform_buffer_size = uniform_size});
        frames_->set_drawable_extent_fn([this] { return vrc_test::mock().caps.currentExtent; });
        frames_->initialize();
        return *frames_;
    }

    vrc::DeviceContext ctx_;
    VmaAllocator allocator_{};
    std::unique_ptr<vrc::BufferManager> buffers_;
    std::unique_ptr<vrc::SwapchainManager> swapchain_;
    std::unique_ptr<vrc::FrameScheduler> frames_;
    RecordingRenderer renderer_;
};

} // namespace

TEST_F(FrameSchedulerTest, InitializeCreatesOneSignaledFencePerSlot) {
    auto& frames = make_scheduler(2);
    EXPECT_EQ(frames.frames_in_flight(), 2u);
    for (uint32_t i = 0; i < 2; ++i) {
        const VkFence f = frames.slot(i).in_flight;
        EXPECT_TRUE(vrc_test::mock().fences.at(f).signaled);
        EXPECT_NE(frames.slot(i).image_available, VK_NULL_HANDLE);
    }
}

TEST_F(FrameSchedulerTest, NeverReusesInFlightSlotResources) {
    auto& frames = make_scheduler(2);
    for (int i = 0; i < 50; ++i) ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);

    const auto& m = vrc_test::mock();
    EXPECT_EQ(m.reuse_violations, 0);
    EXPECT_EQ(m.fence_reset_violations, 0);
    EXPECT_LE(m.max_pending_submits, 2);
    EXPECT_EQ(m.semaphore_signal_violations, 0);
    EXPECT_EQ(frames.stats().frames_presented, 50u);
    EXPECT_EQ(frames.frame_counter(), 50u);
    EXPECT_EQ(m.count("vkQueuePresentKHR"), 50);
}

// Two slots over three images: slot 0 renders image 2 while image 0's present
// may still hold the semaphore its first submit signaled.
TEST_F(FrameSchedulerTest, RenderFinishedFollowsTheSwapchainImage) {
    auto& frames = make_scheduler(2);
    ASSERT_EQ(swapchain_->image_count(), 3u);
    std::vector<uint32_t> images;
    std::vector<VkSemaphore> signaled;
    std::vector<VkSemaphore> waited;
    frames.set_frame_presented_callback([&](const vrc::FrameInfo& frm) {
        images.push_back(frm.image_index);
        signaled.push_back(vrc_test::mock().last_submit_signal);
        waited.push_back(vrc_test::mock().last_present_wait);
    });
    for (int i = 0; i < 6; ++i) ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);

    ASSERT_EQ(images.size(), 6u);
    for (size_t i = 0; i < images.size(); ++i) {
        EXPECT_EQ(signaled[i], swapchain_->render_finished(images[i]));
        EXPECT_EQ(waited[i], signaled[i]);
    }
    EXPECT_EQ(images[0], images[3]);
    EXPECT_NE(signaled[0], signaled[2]);
    EXPECT_EQ(vrc_test::mock().semaphore_signal_violations, 0);
}

TEST_F(FrameSchedulerTest, SlotsRotateWithFrameCounter) {
    auto& frames = make_scheduler(3);
    for (int i = 0; i < 7; ++i) (void)frames.run_frame(renderer_);
    ASSERT_EQ(renderer_.updates.size(), 7u);
    for (size_t i = 0; i < renderer_.updates.size(); ++i) {
        EXPECT_EQ(renderer_.updates[i].frame_index, i);
        EXPECT_EQ(renderer_.updates[i].slot, i % 3u);
    }
    EXPECT_EQ(vrc_test::mock().reuse_violations, 0);
}

TEST_F(FrameSchedulerTest, OutOfDateSkipsFrameAndRebuilds) {
    auto& frames = make_scheduler(2);
    std::vector<VkExtent2D> presented;
    frames.set_frame_presented_callback([&](const vrc::FrameInfo& frm) { presented.push_back(frm.extent); });
    for (int i = 0; i < 5; ++i) ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);

    auto& m              = vrc_test::mock();
    m.caps.currentExtent = {1024u, 768u};
    m.acquire_results    = {VK_ERROR_OUT_OF_DATE_KHR};
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Skipped);
    EXPECT_EQ(frames.stats().frames_skipped, 1u);
    EXPECT_EQ(frames.stats().swapchain_rebuilds, 1u);
    EXPECT_EQ(m.count("vkQueuePresentKHR"), 5);

    ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    ASSERT_EQ(presented.size(), 6u);
    EXPECT_EQ(presented.back().width, 1024u);
    EXPECT_EQ(presented.back().height, 768u);
    EXPECT_EQ(frames.frame_counter(), 7u);
    EXPECT_EQ(m.reuse_violations, 0);
}

TEST_F(FrameSchedulerTest, SuboptimalFrameIsPresentedThenRebuilt) {
    auto& frames                     = make_scheduler(2);
    vrc_test::mock().acquire_results = {VK_SUBOPTIMAL_KHR};
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_EQ(frames.stats().frames_presented, 1u);
    EXPECT_EQ(frames.stats().swapchain_rebuilds, 1u);
    EXPECT_EQ(swapchain_->state(), vrc::SwapchainState::Ready);
}

TEST_F(FrameSchedulerTest, PresentOutOfDateRebuildsAfterPresent) {
    auto& frames                     = make_scheduler(2);
    vrc_test::mock().present_results = {VK_ERROR_OUT_OF_DATE_KHR};
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_EQ(frames.stats().swapchain_rebuilds, 1u);
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
}

TEST_F(FrameSchedulerTest, AcquireTimeoutSkipsFrame) {
    auto& frames                     = make_scheduler(2);
    vrc_test::mock().acquire_results = {VK_TIMEOUT};
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Skipped);
    EXPECT_TRUE(renderer_.updates.empty());
    EXPECT_EQ(frames.stats().swapchain_rebuilds, 0u);
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
}

TEST_F(FrameSchedulerTest, MinimizedWindowSkipsUntilRestored) {
    auto& frames = make_scheduler(2);
    ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);

    auto& m              = vrc_test::mock();
    m.caps.currentExtent = {0u, 0u};
    swapchain_->mark_stale();
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Skipped);
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Skipped);
    EXPECT_EQ(m.count("vkAcquireNextImageKHR"), 1);

    m.caps.currentExtent = {640u, 360u};
    EXPECT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_EQ(renderer_.updates.back().extent.width, 640u);
}

TEST_F(FrameSchedulerTest, FenceTimeoutIsDeviceLost) {
    auto& frames                             = make_scheduler(2);
    vrc_test::mock().scripted_fence_timeouts = 1;
    try {
        (void)frames.run_frame(renderer_);
        FAIL() << "expected DeviceLost";
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.kind(), vrc::ErrorKind::DeviceLost);
        EXPECT_TRUE(e.fatal());
    }
    EXPECT_EQ(vrc_test::mock().count("vkQueueSubmit2"), 0);
}

TEST_F(FrameSchedulerTest, UniformWritesOnlyWhileSlotIsOpen) {
    auto& frames = make_scheduler(2);
    bool open_during_update = false;
    renderer_.on_update     = [&](const vrc::FrameInfo& frm) {
        (void)frm;
        open_during_update = frames.slot_open();
    };
    ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_TRUE(open_during_update);
    EXPECT_FALSE(frames.slot_open());

    const std::array<std::byte, 4> bytes{};
    try {
        frames.write_uniform(renderer_.updates.back(), bytes);
        FAIL() << "write after submission must be rejected";
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.kind(), vrc::ErrorKind::Precondition);
    }
}

TEST_F(FrameSchedulerTest, WriteUniformForAnotherSlotIsRejected) {
    auto& frames = make_scheduler(2);
    int rejected = 0;
    renderer_.on_update = [&](const vrc::FrameInfo& frm) {
        vrc::FrameInfo other = frm;
        other.slot           = (frm.slot + 1u) % 2u;
        const std::array<std::byte, 4> bytes{};
        try {
            frames.write_uniform(other, bytes);
        } catch (const vrc::RenderError& e) {
            if (e.kind() == vrc::ErrorKind::Precondition) ++rejected;
        }
    };
    (void)frames.run_frame(renderer_);
    EXPECT_EQ(rejected, 1);
}

TEST_F(FrameSchedulerTest, RecordsDrawsAndOverlayInsideRenderPass) {
    auto& frames = make_scheduler(2);
    vrc::Pipeline pipeline{};
    pipeline.pipeline  = vrc_test::fake_handle<VkPipeline>(0x77);
    pipeline.layout    = vrc_test::fake_handle<VkPipelineLayout>(0x78);
    renderer_.pipeline = &pipeline;
    (void)frames.run_frame(renderer_);

    const auto& m = vrc_test::mock();
    EXPECT_EQ(m.count("vkCmdBeginRenderPass"), 1);
    EXPECT_EQ(m.count("vkCmdEndRenderPass"), 1);
    EXPECT_EQ(m.count("vkCmdDraw"), 1);
    EXPECT_EQ(m.count("vkCmdDrawIndexed"), 0);
    EXPECT_EQ(renderer_.overlays, 1);
}

TEST_F(FrameSchedulerTest, DestroyDrainsAndReleasesSlots) {
    auto& frames = make_scheduler(2);
    for (int i = 0; i < 3; ++i) (void)frames.run_frame(renderer_);
    frames.destroy();
    EXPECT_TRUE(vrc_test::mock().fences.empty());
    EXPECT_EQ(vrc_test::mock().count("vkDestroySemaphore"), 2);
}

TEST_F(FrameSchedulerTest, ThrowingUpdateLeavesSlotReusable) {
    auto& frames        = make_scheduler(2);
    renderer_.on_update = [](const vrc::FrameInfo& frm) {
        if (frm.frame_index == 1u) throw vrc::RenderError(vrc::ErrorKind::Precondition, "renderer rejected frame");
    };
    ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_THROW((void)frames.run_frame(renderer_), vrc::RenderError);
    EXPECT_FALSE(frames.slot_open());
    EXPECT_TRUE(swapchain_->stale());

    renderer_.on_update = nullptr;
    for (int i = 0; i < 6; ++i) ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    const auto& m = vrc_test::mock();
    EXPECT_EQ(m.semaphore_signal_violations, 0);
    EXPECT_EQ(m.reuse_violations, 0);
    EXPECT_EQ(frames.stats().swapchain_rebuilds, 1u);
    EXPECT_EQ(frames.stats().frames_presented, 7u);
}

TEST_F(FrameSchedulerTest, FailedSubmitLeavesSlotReusable) {
    auto& frames                    = make_scheduler(2);
    vrc_test::mock().submit_results = {VK_ERROR_OUT_OF_HOST_MEMORY};
    EXPECT_THROW((void)frames.run_frame(renderer_), vrc::RenderError);

    // The slot fence was reset before the failed submit; it must not hang the next wait.
    const VkFence fence = frames.slot(0).in_flight;
    EXPECT_TRUE(vrc_test::mock().fences.at(fence).signaled);
    for (int i = 0; i < 4; ++i) ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_EQ(vrc_test::mock().semaphore_signal_violations, 0);
    EXPECT_EQ(vrc_test::mock().count("vkQueuePresentKHR"), 4);
}

TEST_F(FrameSchedulerTest, EachSlotOwnsItsUniformBuffer) {
    auto& frames = make_scheduler(2, 192);
    ASSERT_NE(frames.slot(0).uniform.buffer, VK_NULL_HANDLE);
    ASSERT_NE(frames.slot(1).uniform.buffer, VK_NULL_HANDLE);
    EXPECT_NE(frames.slot(0).uniform.buffer, frames.slot(1).uniform.buffer);

    vrc::PipelineCache cache(ctx_, 2u);
    cache.initialize(swapchain_->render_pass());
    cache.register_shaders(vrc::ShaderPair{
        .key               = "basic",
        .vertex_spirv      = {vrc::kSpirvMagic, 0x00010300u, 0u, 1u},
        .fragment_spirv    = {vrc::kSpirvMagic, 0x00010300u, 0u, 1u},
        .declared_bindings = {vrc::kCanonicalBindings.begin(), vrc::kCanonicalBindings.end()},
    });
    const vrc::Pipeline& pipeline = cache.get_or_build("basic", vrc::vertex_layout_pos3_uv2());
    vrc::Texture texture{};
    texture.view    = vrc_test::fake_handle<VkImageView>(0xA2);
    texture.sampler = vrc_test::fake_handle<VkSampler>(0xA3);

    std::vector<VkBuffer> bound;
    renderer_.on_update = [&](const vrc::FrameInfo& frm) {
        ASSERT_NE(frm.uniform, nullptr);
        const std::array<std::byte, 16> transforms{std::byte{7}};
        frames.write_uniform(frm, transforms);
        EXPECT_EQ(static_cast<const std::byte*>(frm.uniform->mapped)[0], std::byte{7});
        (void)cache.bind_descriptors(frm.slot, pipeline, *frm.uniform, texture);
        bound.push_back(vrc_test::mock().last_written_uniform);
    };
    for (int i = 0; i < 2; ++i) ASSERT_EQ(frames.run_frame(renderer_), vrc::FrameOutcome::Presented);

    ASSERT_EQ(bound.size(), 2u);
    EXPECT_EQ(bound[0], frames.slot(0).uniform.buffer);
    EXPECT_EQ(bound[1], frames.slot(1).uniform.buffer);
}

TEST_F(FrameSchedulerTest, DepthSwapchainClearsColorAndDepth) {
    auto& frames = make_scheduler(2);
    (void)frames.run_frame(renderer_);
    EXPECT_EQ(vrc_test::mock().last_clear_value_count, 1u);
    frames.destroy();

    swapchain_ = std::make_unique<vrc::SwapchainManager>(ctx_, vrc::SwapchainSettings{.requested_min_images = 3, .preferred_formats = {{VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR}}, .preferred_present_mode = VK_PRESENT_MODE_FIFO_KHR, .depth_format = VK_FORMAT_D32_SFLOAT});
    ASSERT_TRUE(swapchain_->create(vrc_test::fake_handle<VkSurfaceKHR>(0x55), {800u, 600u}));
    auto& depth_frames = make_scheduler(2);
    ASSERT_EQ(depth_frames.run_frame(renderer_), vrc::FrameOutcome::Presented);
    EXPECT_EQ(vrc_test::mock().last_clear_value_count, 2u);
}
