// ============================================================================
// Vulkan RenderCore - vk_config.cpp
// RendererConfig validation.
// ============================================================================
#include "vk_config.h"
#include "vk_check.h"

#include <format>

namespace vrc {

void validate(const RendererConfig& cfg) {
    VRC_REQUIRE(!cfg.app_name.empty(), "app_name must not be empty");
    VRC_REQUIRE(cfg.window_width > 0 && cfg.window_height > 0, std::format("invalid window size {}x{}", cfg.window_width, cfg.window_height));
    VRC_REQUIRE(cfg.frames_in_flight >= 1 && cfg.frames_in_flight <= kMaxFramesInFlight, std::format("frames_in_flight must be in [1, {}], got {}", kMaxFramesInFlight, cfg.frames_in_flight));
    VRC_REQUIRE(cfg.requested_min_images >= 1, "requested_min_images must be at least 1");
    VRC_REQUIRE(cfg.fence_timeout_ns > 0, "fence_timeout_ns must be non-zero");
}

} // namespace vrc
