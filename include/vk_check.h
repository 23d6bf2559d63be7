// ============================================================================
// Vulkan RenderCore - Error Types & Check Macros
// RenderError is the single exception type thrown by the rendering core. Its
// ErrorKind tells callers whether the failure is fatal (device lost, out of
// memory, no device, ...) or a precondition violation by the caller.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_CHECK_H
#define VULKAN_RENDERCORE_VK_CHECK_H

#include <stdexcept>
#include <string>
#include <vulkan/vulkan.h>

namespace vrc {

enum class ErrorKind {
    NoSuitableDevice,      // No GPU satisfies the selection requirements
    OutOfDeviceMemory,     // Allocation failed (device or host)
    DeviceLost,            // Device lost or a fence wait exceeded its bound
    BindingMismatch,       // Shader declared bindings differ from the pipeline layout
    UnsupportedBlitFormat, // Texture format cannot be linearly blitted
    Precondition,          // Caller violated an API contract
    Platform,              // Window / surface creation failed
    Vulkan,                // Any other non-success VkResult
};

class RenderError : public std::runtime_error {
public:
    RenderError(ErrorKind kind, const std::string& what, VkResult result = VK_SUCCESS);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] VkResult result() const noexcept { return result_; }
    [[nodiscard]] bool fatal() const noexcept;

private:
    ErrorKind kind_;
    VkResult result_;
};

// Precondition errors are recoverable; everything else ends the frame loop.
[[nodiscard]] bool is_fatal(ErrorKind kind) noexcept;

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;
[[nodiscard]] const char* to_string(VkResult result) noexcept;

// Map a failed VkResult onto the error taxonomy and throw.
[[noreturn]] void throw_vk_error(VkResult result, const char* expr, const char* file, int line);

} // namespace vrc

// ============================================================================
// Utility Macros
// VRC_CHECK              : Throws vrc::RenderError on non-success VkResult.
// VRC_REQUIRE            : Throws a Precondition RenderError when expr is false.
// IF_NOT_NULL_DO         : Execute statement if pointer / handle non-null.
// IF_NOT_NULL_DO_AND_SET : Execute statement then overwrite handle with value.
// ============================================================================
#define VRC_CHECK(x) do { VkResult _vrc_check_res = (x); if (_vrc_check_res != VK_SUCCESS) { ::vrc::throw_vk_error(_vrc_check_res, #x, __FILE__, __LINE__); } } while (false)
#define VRC_REQUIRE(expr, msg) do { if (!(expr)) { throw ::vrc::RenderError(::vrc::ErrorKind::Precondition, std::string("Check failed: ") + #expr + " | " + (msg)); } } while (false)
#ifndef IF_NOT_NULL_DO
#define IF_NOT_NULL_DO(ptr, stmt) do { if ((ptr) != nullptr) { stmt; } } while (false)
#endif
#ifndef IF_NOT_NULL_DO_AND_SET
#define IF_NOT_NULL_DO_AND_SET(ptr, stmt, val) do { if ((ptr) != nullptr) { stmt; (ptr) = (val); } } while (false)
#endif

#endif // VULKAN_RENDERCORE_VK_CHECK_H
