// ============================================================================
// Vulkan RenderCore - Engine Shell
// RenderEngine owns the window, instance, surface and every core component,
// creates them in dependency order and tears them down in reverse after the
// device has drained. Applications plug in through IRenderer.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_RENDERER_H
#define VULKAN_RENDERCORE_VK_RENDERER_H

#include "VkBootstrap.h"
#include "vk_buffer.h"
#include "vk_check.h"
#include "vk_config.h"
#include "vk_device.h"
#include "vk_frame.h"
#include "vk_pipeline.h"
#include "vk_swapchain.h"
#include "vk_texture.h"
#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

namespace vrc {

// Borrowed pointers to the engine's components, valid between
// IRenderer::initialize() and IRenderer::destroy().
struct EngineContext {
    const DeviceContext* device{};       // Device, queues, dispatch tables
    const BufferManager* buffers{};      // Buffer allocation / uploads
    const TextureBuilder* textures{};    // Texture + mip chain builder
    PipelineCache* pipelines{};          // Pipeline & descriptor cache
    const SwapchainManager* swapchain{}; // Current swapchain (extent, format)
    FrameScheduler* frames{};            // For write_uniform()
    SDL_Window* window{};                // SDL window for platform events
    const RendererConfig* config{};      // Active configuration
};

// ============================================================================
// IRenderer - Abstract renderer interface implemented by the application.
// ============================================================================
class IRenderer {
public:
    virtual ~IRenderer() = default;

    // Mandatory: upload meshes / textures, register shaders, declare pipelines.
    virtual void initialize(const EngineContext& eng) = 0;

    // Mandatory: free everything created in initialize(). The device is idle.
    virtual void destroy(const EngineContext& eng) = 0;

    // Notified after every successful swapchain (re)build.
    virtual void on_swapchain_ready(const EngineContext& eng, VkExtent2D extent) { (void)eng; (void)extent; }

    // Per-frame CPU update; the frame slot is open (uniform writes allowed).
    virtual void update(const EngineContext& eng, const FrameInfo& frm) { (void)eng; (void)frm; }

    // Mandatory: produce this frame's draw list.
    virtual void build_draws(const EngineContext& eng, const FrameInfo& frm, std::vector<DrawCall>& out) = 0;

    // Raw SDL event forward (input, window, etc.)
    virtual void on_event(const SDL_Event& e, const EngineContext& eng) { (void)e; (void)eng; }

    // Provide additional ImGui panels (called between begin/end frame UI).
    virtual void on_imgui(const EngineContext& eng) { (void)eng; }
};

class RenderEngine {
public:
    using FatalErrorFn = std::function<void(const RenderError&)>;

    RenderEngine();
    ~RenderEngine();
    RenderEngine(const RenderEngine&)            = delete;
    RenderEngine& operator=(const RenderEngine&) = delete;

    // Replace the configuration (before init()).
    void configure(RendererConfig cfg);
    // Provide ownership of renderer implementation before init().
    void set_renderer(std::unique_ptr<IRenderer> r);
    void set_frame_presented_callback(FrameScheduler::PresentedFn fn);
    // Invoked with fatal errors before they propagate out of run().
    void set_fatal_error_callback(FatalErrorFn fn) { on_fatal_ = std::move(fn); }

    // Create window, instance, device, swapchain, caches, frame slots, renderer and UI.
    void init();
    // Run main loop until exit event (blocking call).
    void run();
    // Destroy resources (safe to call multiple times).
    void cleanup();

    [[nodiscard]] const RendererConfig& config() const { return config_; }

    // Mutable engine-wide state (lightweight). Public for debug readability.
    struct {
        bool initialized{false};            // Becomes true after init()
        bool running{false};                // Main loop active flag
        bool should_rendering{false};       // Skip rendering when minimized
        bool minimized{false};              // Window minimized state
        double time_sec{0.0};               // Total accumulated time
        double dt_sec{0.0};                 // Time elapsed since previous frame
    } state_;

private: // --- Context creation & destruction ---
    void create_context();
    void destroy_context();
    void create_core();
    EngineContext make_engine_context();
    [[nodiscard]] VkExtent2D drawable_extent() const;
    void on_swapchain_rebuilt(bool render_pass_changed);
    void report_fatal(const RenderError& e);

    RendererConfig config_{};
    SDL_Window* window_{nullptr};             // SDL window handle
    vkb::Instance instance_{};                // Instance + debug messenger
    VkSurfaceKHR surface_{VK_NULL_HANDLE};    // Presentation surface

    DeviceContext device_;                    // Must outlive everything below
    std::unique_ptr<BufferManager> buffers_;
    std::unique_ptr<TextureBuilder> textures_;
    std::unique_ptr<SwapchainManager> swapchain_;
    std::unique_ptr<PipelineCache> pipelines_;
    std::unique_ptr<FrameScheduler> frames_;
    FrameScheduler::PresentedFn on_presented_;
    FatalErrorFn on_fatal_;

private: // --- Renderer Integration ---
    class FrameBridge;                        // IFrameRenderer adapter over IRenderer + UI
    std::unique_ptr<IRenderer> renderer_;     // Active renderer implementation
    std::unique_ptr<FrameBridge> bridge_;
    bool renderer_initialized_{false};

private: // --- ImGui Integration ---
    struct UiSystem;                          // Forward-declared internal UI system
    void create_imgui();
    void destroy_imgui();
    std::unique_ptr<UiSystem> ui_;            // ImGui system object
    std::vector<std::move_only_function<void()>> mdq_; // Master destruction queue (engine lifetime)
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_RENDERER_H
