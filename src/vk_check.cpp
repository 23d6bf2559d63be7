// ============================================================================
// Vulkan RenderCore - vk_check.cpp
// RenderError and the VkResult to ErrorKind mapping.
// ============================================================================
#include "vk_check.h"

#include <format>

namespace vrc {

RenderError::RenderError(ErrorKind kind, const std::string& what, VkResult result) : std::runtime_error(what), kind_(kind), result_(result) {}

bool RenderError::fatal() const noexcept { return is_fatal(kind_); }

bool is_fatal(ErrorKind kind) noexcept { return kind != ErrorKind::Precondition; }

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::NoSuitableDevice: return "NoSuitableDevice";
    case ErrorKind::OutOfDeviceMemory: return "OutOfDeviceMemory";
    case ErrorKind::DeviceLost: return "DeviceLost";
    case ErrorKind::BindingMismatch: return "BindingMismatch";
    case ErrorKind::UnsupportedBlitFormat: return "UnsupportedBlitFormat";
    case ErrorKind::Precondition: return "Precondition";
    case ErrorKind::Platform: return "Platform";
    case ErrorKind::Vulkan: return "Vulkan";
    }
    return "Unknown";
}

const char* to_string(VkResult result) noexcept {
    switch (result) {
    case VK_SUCCESS: return "VK_SUCCESS";
    case VK_NOT_READY: return "VK_NOT_READY";
    case VK_TIMEOUT: return "VK_TIMEOUT";
    case VK_SUBOPTIMAL_KHR: return "VK_SUBOPTIMAL_KHR";
    case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
    case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
    case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
    case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
    case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
    case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
    case VK_ERROR_SURFACE_LOST_KHR: return "VK_ERROR_SURFACE_LOST_KHR";
    case VK_ERROR_OUT_OF_DATE_KHR: return "VK_ERROR_OUT_OF_DATE_KHR";
    case VK_ERROR_NATIVE_WINDOW_IN_USE_KHR: return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
    default: return "VK_RESULT_UNKNOWN";
    }
}

void throw_vk_error(VkResult result, const char* expr, const char* file, int line) {
    ErrorKind kind = ErrorKind::Vulkan;
    switch (result) {
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
    case VK_ERROR_OUT_OF_HOST_MEMORY: kind = ErrorKind::OutOfDeviceMemory; break;
    case VK_ERROR_DEVICE_LOST: kind = ErrorKind::DeviceLost; break;
    default: break;
    }
    throw RenderError(kind, std::format("Vulkan error {} ({}) at {} [{}:{}]", to_string(result), static_cast<int>(result), expr, file, line), result);
}

} // namespace vrc
