// ============================================================================
// Vulkan RenderCore - vk_device.cpp
// Device selection and creation through vk-bootstrap, VMA allocator setup, the
// shared command pool, and the submit / present / one-shot upload helpers.
// ============================================================================
#include "vk_device.h"

// --- Compiler diagnostics silencing for third-party code & VMA implementation
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4100 4189 4127 4324)
#elif defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wunused-parameter"
#pragma clang diagnostic ignored "-Wunused-variable"
#pragma clang diagnostic ignored "-Wconstant-conversion"
#pragma clang diagnostic ignored "-Wpadding"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#pragma GCC diagnostic ignored "-Wtype-limits"
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
#define VMA_IMPLEMENTATION
#include "vk_mem_alloc.h"
#if defined(_MSC_VER)
#pragma warning(pop)
#elif defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include "vk_check.h"
#include "vk_log.h"

namespace vrc {

DeviceContext::~DeviceContext() {
    if (valid()) {
        log_warn("DeviceContext destroyed implicitly; call destroy() during orderly shutdown");
        destroy();
    }
}

// ============================================================================
// DeviceContext :: initialize
// Picks a Vulkan 1.3 GPU with synchronization2 that can present to the surface
// (discrete preferred over integrated), then builds the device and queues.
// ============================================================================
void DeviceContext::initialize(const vkb::Instance& instance, VkSurfaceKHR surface, const DeviceRequirements& req) {
    VRC_REQUIRE(!valid(), "DeviceContext already initialized");
    VRC_REQUIRE(surface != VK_NULL_HANDLE, "a presentation surface is required for device selection");

    VkPhysicalDeviceVulkan13Features f13{.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES, .pNext = nullptr, .synchronization2 = VK_TRUE};
    VkPhysicalDeviceFeatures f10{};
    f10.samplerAnisotropy = req.sampler_anisotropy ? VK_TRUE : VK_FALSE;

    vkb::PhysicalDeviceSelector selector(instance);
    selector.set_surface(surface).set_minimum_version(1, 3).set_required_features_13(f13).set_required_features(f10);
    if (req.prefer_discrete) selector.prefer_gpu_device_type(vkb::PreferredDeviceType::discrete);
    auto phys_ret = selector.select();
    if (!phys_ret) {
        throw RenderError(ErrorKind::NoSuitableDevice, "No suitable GPU: " + phys_ret.error().message());
    }
    vkb::PhysicalDevice phys = phys_ret.value();

    auto dev_ret = vkb::DeviceBuilder(phys).build();
    if (!dev_ret) {
        throw RenderError(ErrorKind::NoSuitableDevice, "Device creation failed: " + dev_ret.error().message());
    }
    vkb_device_ = dev_ret.value();

    auto gfx_queue  = vkb_device_.get_queue(vkb::QueueType::graphics);
    auto prs_queue  = vkb_device_.get_queue(vkb::QueueType::present);
    auto gfx_family = vkb_device_.get_queue_index(vkb::QueueType::graphics);
    auto prs_family = vkb_device_.get_queue_index(vkb::QueueType::present);
    if (!gfx_queue || !prs_queue || !gfx_family || !prs_family) {
        vkb::destroy_device(vkb_device_);
        throw RenderError(ErrorKind::NoSuitableDevice, "Selected GPU lacks graphics or present queues");
    }

    handles_.instance              = instance.instance;
    handles_.physical              = phys.physical_device;
    handles_.device                = vkb_device_.device;
    handles_.graphics_queue        = gfx_queue.value();
    handles_.present_queue         = prs_queue.value();
    handles_.graphics_queue_family = gfx_family.value();
    handles_.present_queue_family  = prs_family.value();
    device_name_                   = phys.name;
    enabled_                       = req;
    owns_device_                   = true;

    vki_ = instance.make_table();
    vkd_ = vkb_device_.make_table();

    VmaAllocatorCreateInfo ac{};
    ac.physicalDevice   = handles_.physical;
    ac.device           = handles_.device;
    ac.instance         = handles_.instance;
    ac.vulkanApiVersion = VK_API_VERSION_1_3;
    VRC_CHECK(vmaCreateAllocator(&ac, &allocator_));

    create_command_pool();

    log_info("Selected GPU '{}' (graphics family {}, present family {})", device_name_, handles_.graphics_queue_family, handles_.present_queue_family);
}

void DeviceContext::adopt(const DeviceHandles& handles, PFN_vkGetInstanceProcAddr gipa, PFN_vkGetDeviceProcAddr gdpa, VmaAllocator allocator, const DeviceRequirements& enabled) {
    VRC_REQUIRE(!valid(), "DeviceContext already initialized");
    VRC_REQUIRE(handles.device != VK_NULL_HANDLE && gipa != nullptr && gdpa != nullptr, "adopt() needs a device and loader entry points");
    handles_     = handles;
    vki_         = vkb::InstanceDispatchTable(handles.instance, gipa);
    vkd_         = vkb::DispatchTable(handles.device, gdpa);
    allocator_   = allocator;
    enabled_     = enabled;
    owns_device_ = false;
    device_name_ = "adopted device";
    create_command_pool();
}

void DeviceContext::create_command_pool() {
    VkCommandPoolCreateInfo pci{.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO, .pNext = nullptr, .flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT, .queueFamilyIndex = handles_.graphics_queue_family};
    VRC_CHECK(vkd_.createCommandPool(&pci, nullptr, &command_pool_));
}

// Destroy in reverse creation order after draining the device.
void DeviceContext::destroy() {
    if (!valid()) return;
    // Errors during teardown (e.g. device already lost) must not stop the release.
    const VkResult idle = vkd_.deviceWaitIdle();
    if (idle != VK_SUCCESS) log_warn("vkDeviceWaitIdle during shutdown returned {}", to_string(idle));

    IF_NOT_NULL_DO_AND_SET(command_pool_, vkd_.destroyCommandPool(command_pool_, nullptr), VK_NULL_HANDLE);
    if (owns_device_) {
        IF_NOT_NULL_DO_AND_SET(allocator_, vmaDestroyAllocator(allocator_), VK_NULL_HANDLE);
        vkb::destroy_device(vkb_device_);
        vkb_device_ = {};
    }
    allocator_   = VK_NULL_HANDLE;
    enabled_     = {};
    handles_     = {};
    owns_device_ = false;
}

// ============================================================================
// Submission / Presentation
// ============================================================================
void DeviceContext::submit(VkCommandBuffer cmd, VkSemaphore wait, VkPipelineStageFlags2 wait_stage, VkSemaphore signal, VkFence fence) const {
    VRC_REQUIRE(valid(), "submit() before device initialization");
    VkCommandBufferSubmitInfo cbsi{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO, .pNext = nullptr, .commandBuffer = cmd, .deviceMask = 0u};
    VkSemaphoreSubmitInfo wait_info{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO, .pNext = nullptr, .semaphore = wait, .value = 0u, .stageMask = wait_stage, .deviceIndex = 0u};
    VkSemaphoreSubmitInfo signal_info{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO, .pNext = nullptr, .semaphore = signal, .value = 0u, .stageMask = VK_PIPELINE_STAGE_2_ALL_GRAPHICS_BIT, .deviceIndex = 0u};
    VkSubmitInfo2 si{.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2,
        .pNext                    = nullptr,
        .flags                    = 0u,
        .waitSemaphoreInfoCount   = wait ? 1u : 0u,
        .pWaitSemaphoreInfos      = wait ? &wait_info : nullptr,
        .commandBufferInfoCount   = 1u,
        .pCommandBufferInfos      = &cbsi,
        .signalSemaphoreInfoCount = signal ? 1u : 0u,
        .pSignalSemaphoreInfos    = signal ? &signal_info : nullptr};
    VRC_CHECK(vkd_.queueSubmit2(handles_.graphics_queue, 1, &si, fence));
}

PresentStatus DeviceContext::present(VkSwapchainKHR swapchain, uint32_t image_index, VkSemaphore wait) const {
    VRC_REQUIRE(valid(), "present() before device initialization");
    VkPresentInfoKHR pi{.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR,
        .pNext              = nullptr,
        .waitSemaphoreCount = wait ? 1u : 0u,
        .pWaitSemaphores    = wait ? &wait : nullptr,
        .swapchainCount     = 1u,
        .pSwapchains        = &swapchain,
        .pImageIndices      = &image_index,
        .pResults           = nullptr};
    const VkResult res = vkd_.queuePresentKHR(handles_.present_queue, &pi);
    if (res == VK_ERROR_OUT_OF_DATE_KHR) return PresentStatus::OutOfDate;
    if (res == VK_SUBOPTIMAL_KHR) return PresentStatus::Suboptimal;
    VRC_CHECK(res);
    return PresentStatus::Success;
}

// One-shot command buffer with a transient fence; blocks until the GPU is done.
void DeviceContext::immediate_submit(const std::function<void(VkCommandBuffer)>& record) const {
    VRC_REQUIRE(valid(), "immediate_submit() before device initialization");
    VkCommandBufferAllocateInfo ai{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO, .pNext = nullptr, .commandPool = command_pool_, .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY, .commandBufferCount = 1u};
    VkCommandBuffer cmd{};
    VRC_CHECK(vkd_.allocateCommandBuffers(&ai, &cmd));
    VkFence fence{};
    auto release = [&] {
        IF_NOT_NULL_DO_AND_SET(fence, vkd_.destroyFence(fence, nullptr), VK_NULL_HANDLE);
        vkd_.freeCommandBuffers(command_pool_, 1, &cmd);
    };
    try {
        VkFenceCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO, .pNext = nullptr, .flags = 0u};
        VRC_CHECK(vkd_.createFence(&fci, nullptr, &fence));
        VkCommandBufferBeginInfo bi{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO, .pNext = nullptr, .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT, .pInheritanceInfo = nullptr};
        VRC_CHECK(vkd_.beginCommandBuffer(cmd, &bi));
        record(cmd);
        VRC_CHECK(vkd_.endCommandBuffer(cmd));
        submit(cmd, VK_NULL_HANDLE, VK_PIPELINE_STAGE_2_NONE, VK_NULL_HANDLE, fence);
        VRC_CHECK(vkd_.waitForFences(1, &fence, VK_TRUE, UINT64_MAX));
    } catch (...) {
        release();
        throw;
    }
    release();
}

void DeviceContext::wait_idle() const {
    VRC_REQUIRE(valid(), "wait_idle() before device initialization");
    VRC_CHECK(vkd_.deviceWaitIdle());
}

} // namespace vrc
