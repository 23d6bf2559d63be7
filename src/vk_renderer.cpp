// ============================================================================
// Vulkan RenderCore - vk_renderer.cpp
// RenderEngine: window / instance / surface creation, component wiring, the
// SDL event + frame loop, ImGui HUD overlay, and ordered teardown.
// ============================================================================
#include "vk_renderer.h"
#include "vk_log.h"

#include "backends/imgui_impl_sdl3.h"
#include "backends/imgui_impl_vulkan.h"
#include <SDL3/SDL_vulkan.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <imgui.h>
#include <ranges>
#include <string>

namespace vrc {

// ============================================================================
// Internal: ImGui / UI System Wrapper
// Descriptor pool + ImGui backend initialization for SDL3 + Vulkan, rendering
// inside subpass 0 of the swapchain render pass.
// ============================================================================
struct RenderEngine::UiSystem {
    using PanelFn = std::function<void()>;

    // Initialize ImGui context & Vulkan backend resources.
    bool init(SDL_Window* window, const DeviceContext& ctx, VkRenderPass render_pass, uint32_t min_image_count, uint32_t image_count) {
        std::array<VkDescriptorPoolSize, 2> pool_sizes{{
            {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 100},
            {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 100},
        }};
        VkDescriptorPoolCreateInfo pool_info{
            .sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
            .pNext         = nullptr,
            .flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT,
            .maxSets       = 100u * static_cast<uint32_t>(pool_sizes.size()),
            .poolSizeCount = static_cast<uint32_t>(pool_sizes.size()),
            .pPoolSizes    = pool_sizes.data(),
        };
        ctx_ = &ctx;
        VRC_CHECK(ctx.vkd().createDescriptorPool(&pool_info, nullptr, &pool_));

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();

        if (!ImGui_ImplSDL3_InitForVulkan(window)) {
            ImGui::DestroyContext();
            ctx.vkd().destroyDescriptorPool(pool_, nullptr);
            pool_ = VK_NULL_HANDLE;
            return false;
        }

        const DeviceHandles& h         = ctx.handles();
        init_info_                     = ImGui_ImplVulkan_InitInfo{}; // Standard ImGui Vulkan init structure
        init_info_.ApiVersion          = VK_API_VERSION_1_3;
        init_info_.Instance            = h.instance;
        init_info_.PhysicalDevice      = h.physical;
        init_info_.Device              = h.device;
        init_info_.QueueFamily         = h.graphics_queue_family;
        init_info_.Queue               = h.graphics_queue;
        init_info_.DescriptorPool      = pool_;
        init_info_.RenderPass          = render_pass;
        init_info_.Subpass             = 0u;
        init_info_.MinImageCount       = std::max(2u, min_image_count);
        init_info_.ImageCount          = std::max(init_info_.MinImageCount, image_count);
        init_info_.MSAASamples         = VK_SAMPLE_COUNT_1_BIT;
        init_info_.Allocator           = nullptr;
        init_info_.CheckVkResultFn     = [](VkResult res) { VRC_CHECK(res); };
        init_info_.UseDynamicRendering = false;

        if (!ImGui_ImplVulkan_Init(&init_info_)) {
            ImGui_ImplSDL3_Shutdown();
            ImGui::DestroyContext();
            ctx.vkd().destroyDescriptorPool(pool_, nullptr);
            pool_ = VK_NULL_HANDLE;
            return false;
        }
        initialized_ = true;
        return true;
    }

    // The backend pipeline is tied to the render pass; rebuild it after a format change.
    void recreate_backend(VkRenderPass render_pass) {
        if (!initialized_) return;
        ImGui_ImplVulkan_Shutdown();
        init_info_.RenderPass = render_pass;
        if (!ImGui_ImplVulkan_Init(&init_info_)) {
            initialized_ = false;
            throw RenderError(ErrorKind::Vulkan, "ImGui Vulkan backend re-initialization failed");
        }
    }

    // Release all ImGui/Vulkan backend resources.
    void shutdown() {
        if (!ctx_) return;
        if (initialized_) {
            ImGui_ImplVulkan_Shutdown();
            ImGui_ImplSDL3_Shutdown();
            ImGui::DestroyContext();
        }
        IF_NOT_NULL_DO_AND_SET(pool_, ctx_->vkd().destroyDescriptorPool(pool_, nullptr), VK_NULL_HANDLE);
        initialized_ = false;
        ctx_         = nullptr;
    }

    // Forward SDL events to ImGui.
    void process_event(const SDL_Event* e) const {
        if (!initialized_ || !e) return;
        ImGui_ImplSDL3_ProcessEvent(e);
    }

    // Start a new ImGui frame & invoke registered panels.
    void new_frame() const {
        if (!initialized_) return;
        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();
        for (auto& panel : panels_) {
            panel();
        }
    }

    // Record the overlay into the render pass that is currently open on 'cmd'.
    void render_overlay(VkCommandBuffer cmd) const {
        if (!initialized_) return;
        ImGui::Render();
        ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), cmd);
    }

    // Register an ImGui panel callback executed every frame.
    void add_panel(PanelFn fn) { panels_.push_back(std::move(fn)); }

    // Update backend min image count after swapchain recreation.
    void set_min_image_count(uint32_t count) const {
        if (!initialized_) return;
        ImGui_ImplVulkan_SetMinImageCount(std::max(2u, count));
    }

    [[nodiscard]] bool initialized() const { return initialized_; }

private:
    const DeviceContext* ctx_{nullptr};     // Device the pool was created on
    VkDescriptorPool pool_{VK_NULL_HANDLE}; // ImGui descriptor pool
    ImGui_ImplVulkan_InitInfo init_info_{}; // Kept for backend re-initialization
    bool initialized_{false};               // Init flag
    std::vector<PanelFn> panels_;           // Registered UI panels
};

// ============================================================================
// Internal: FrameBridge
// Adapts the application IRenderer (plus the HUD) to the scheduler hooks.
// ============================================================================
class RenderEngine::FrameBridge final : public IFrameRenderer {
public:
    explicit FrameBridge(RenderEngine& engine) : engine_(engine) {}

    void update(const FrameInfo& frm) override { engine_.renderer_->update(engine_.make_engine_context(), frm); }

    void build_draws(const FrameInfo& frm, std::vector<DrawCall>& out) override { engine_.renderer_->build_draws(engine_.make_engine_context(), frm, out); }

    void record_overlay(VkCommandBuffer cmd, const FrameInfo& frm) override {
        (void)frm;
        if (!engine_.ui_ || !engine_.ui_->initialized()) return;
        engine_.ui_->new_frame();
        engine_.renderer_->on_imgui(engine_.make_engine_context());
        engine_.ui_->render_overlay(cmd);
    }

private:
    RenderEngine& engine_;
};

// ============================================================================
// RenderEngine: Ctors / Dtors
// ============================================================================
RenderEngine::RenderEngine() = default;
RenderEngine::~RenderEngine() {
    if (state_.initialized || device_.valid() || window_) cleanup();
}

void RenderEngine::configure(RendererConfig cfg) {
    VRC_REQUIRE(!state_.initialized, "configure() after init()");
    config_ = std::move(cfg);
}

// Set the renderer implementation (must be done before init()).
void RenderEngine::set_renderer(std::unique_ptr<IRenderer> r) { renderer_ = std::move(r); }

void RenderEngine::set_frame_presented_callback(FrameScheduler::PresentedFn fn) {
    on_presented_ = std::move(fn);
    if (frames_) frames_->set_frame_presented_callback(on_presented_);
}

// ============================================================================
// RenderEngine :: init
// ============================================================================
void RenderEngine::init() {
    VRC_REQUIRE(!state_.initialized, "init() called twice");
    VRC_REQUIRE(renderer_ != nullptr, "Renderer not set");
    validate(config_);
    try {
        create_context();
        create_core();

        renderer_->initialize(make_engine_context());
        renderer_initialized_ = true;
        mdq_.emplace_back([this] {
            renderer_->destroy(make_engine_context());
            renderer_initialized_ = false;
        });
        // Builds the declared pipelines; no compiles mid-frame after this.
        pipelines_->seal();
        renderer_->on_swapchain_ready(make_engine_context(), swapchain_->extent());

        if (config_.enable_overlay) create_imgui();
    } catch (const RenderError& e) {
        report_fatal(e);
        cleanup();
        throw;
    }

    bridge_                 = std::make_unique<FrameBridge>(*this);
    state_.initialized      = true;
    state_.should_rendering = true;
}

// ============================================================================
// RenderEngine :: run
// Main event & frame loop. Fatal errors are reported through the fatal-error
// callback and then propagate to the caller.
// ============================================================================
void RenderEngine::run() {
    VRC_REQUIRE(state_.initialized, "run() before init()");
    state_.running          = true;
    state_.should_rendering = !state_.minimized;
    using clock             = std::chrono::steady_clock;
    auto t0                 = clock::now();
    auto t_prev             = t0;
    SDL_Event e{};

    try {
        while (state_.running) {
            // --- Event Pump ---
            while (SDL_PollEvent(&e)) {
                renderer_->on_event(e, make_engine_context());
                if (ui_) { ui_->process_event(&e); }

                switch (e.type) {
                case SDL_EVENT_QUIT:
                case SDL_EVENT_WINDOW_CLOSE_REQUESTED: state_.running = false; break;
                case SDL_EVENT_WINDOW_MINIMIZED: state_.minimized = true; state_.should_rendering = false; break;
                case SDL_EVENT_WINDOW_RESTORED:
                case SDL_EVENT_WINDOW_MAXIMIZED: state_.minimized = false; state_.should_rendering = true; swapchain_->mark_stale(); break;
                case SDL_EVENT_WINDOW_RESIZED:
                case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED: swapchain_->mark_stale(); break;
                default: break;
                }
            }

            // --- Time Update ---
            auto t_now      = clock::now();
            state_.dt_sec   = std::chrono::duration<double>(t_now - t_prev).count();
            state_.time_sec = std::chrono::duration<double>(t_now - t0).count();
            t_prev          = t_now;

            if (!state_.running) break;
            if (!state_.should_rendering) { SDL_WaitEventTimeout(nullptr, 100); continue; }

            frames_->run_frame(*bridge_, FrameTiming{.dt_sec = state_.dt_sec, .time_sec = state_.time_sec});
        }
    } catch (const RenderError& ex) {
        report_fatal(ex);
        throw;
    }
}

// ============================================================================
// RenderEngine :: cleanup
// Waits for device idle, destroys UI, renderer resources and components in
// reverse creation order, then the context.
// ============================================================================
void RenderEngine::cleanup() {
    if (device_.valid()) {
        const VkResult idle = device_.vkd().deviceWaitIdle();
        if (idle != VK_SUCCESS) log_warn("vkDeviceWaitIdle during cleanup returned {}", to_string(idle));
    }
    destroy_imgui();
    for (auto& f : std::ranges::reverse_view(mdq_)) { f(); }
    mdq_.clear();
    bridge_.reset();
    frames_.reset();
    pipelines_.reset();
    swapchain_.reset();
    textures_.reset();
    buffers_.reset();
    destroy_context();
    state_.initialized = false;
    state_.running     = false;
}

void RenderEngine::report_fatal(const RenderError& e) {
    if (!e.fatal()) return;
    log_error("Fatal render error ({}): {}", to_string(e.kind()), e.what());
    if (on_fatal_) on_fatal_(e);
}

// ============================================================================
// Context Creation / Destruction
// create_context: window, instance (vk-bootstrap), surface, device context.
// ============================================================================
void RenderEngine::create_context() {
    if (!SDL_Init(SDL_INIT_VIDEO)) throw RenderError(ErrorKind::Platform, std::string("SDL_Init failed: ") + SDL_GetError());
    window_ = SDL_CreateWindow(config_.app_name.c_str(), config_.window_width, config_.window_height, SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE);
    if (!window_) throw RenderError(ErrorKind::Platform, std::string("SDL_CreateWindow failed: ") + SDL_GetError());

    vkb::InstanceBuilder builder;
    builder.set_app_name(config_.app_name.c_str()).require_api_version(1, 3, 0).request_validation_layers(config_.enable_validation);
    if (config_.enable_validation) builder.use_default_debug_messenger();
    Uint32 ext_count        = 0;
    const char* const* exts = SDL_Vulkan_GetInstanceExtensions(&ext_count);
    if (exts) builder.enable_extensions(ext_count, exts);
    auto inst_ret = builder.build();
    if (!inst_ret) throw RenderError(ErrorKind::NoSuitableDevice, "Vulkan 1.3 instance creation failed: " + inst_ret.error().message());
    instance_ = inst_ret.value();

    if (!SDL_Vulkan_CreateSurface(window_, instance_.instance, nullptr, &surface_)) throw RenderError(ErrorKind::Platform, std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError());

    device_.initialize(instance_, surface_, DeviceRequirements{.sampler_anisotropy = config_.sampler_anisotropy});
}

// Destroy device-level resources and SDL components.
void RenderEngine::destroy_context() {
    device_.destroy();
    IF_NOT_NULL_DO_AND_SET(surface_, vkb::destroy_surface(instance_, surface_), VK_NULL_HANDLE);
    if (instance_.instance != VK_NULL_HANDLE) {
        vkb::destroy_instance(instance_);
        instance_ = {};
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
    }
}

// Buffers, textures, swapchain, pipeline cache and frame slots, in dependency order.
void RenderEngine::create_core() {
    buffers_  = std::make_unique<BufferManager>(device_);
    textures_ = std::make_unique<TextureBuilder>(device_, *buffers_);

    swapchain_ = std::make_unique<SwapchainManager>(device_, SwapchainSettings{.requested_min_images = config_.requested_min_images, .preferred_formats = config_.preferred_formats, .preferred_present_mode = config_.preferred_present_mode, .depth_format = config_.depth_format});
    swapchain_->set_rebuilt_callback([this](bool render_pass_changed) { on_swapchain_rebuilt(render_pass_changed); });
    mdq_.emplace_back([this] { swapchain_->destroy(); });
    VRC_REQUIRE(swapchain_->create(surface_, drawable_extent()), "initial window has no drawable area");

    pipelines_ = std::make_unique<PipelineCache>(device_, config_.frames_in_flight);
    pipelines_->initialize(swapchain_->render_pass());
    mdq_.emplace_back([this] { pipelines_->destroy(); });

    frames_ = std::make_unique<FrameScheduler>(device_, *buffers_, *swapchain_,
        FrameSchedulerSettings{.frames_in_flight = config_.frames_in_flight,
            .fence_timeout_ns                    = config_.fence_timeout_ns,
            .acquire_timeout_ns                  = config_.acquire_timeout_ns,
            .uniform_buffer_size                 = config_.uniform_buffer_size,
            .clear_color                         = config_.clear_color});
    frames_->set_drawable_extent_fn([this] { return drawable_extent(); });
    frames_->set_frame_presented_callback(on_presented_);
    frames_->initialize();
    mdq_.emplace_back([this] { frames_->destroy(); });
}

// Build an EngineContext snapshot for renderer usage.
EngineContext RenderEngine::make_engine_context() {
    EngineContext eng{};
    eng.device    = &device_;
    eng.buffers   = buffers_.get();
    eng.textures  = textures_.get();
    eng.pipelines = pipelines_.get();
    eng.swapchain = swapchain_.get();
    eng.frames    = frames_.get();
    eng.window    = window_;
    eng.config    = &config_;
    return eng;
}

VkExtent2D RenderEngine::drawable_extent() const {
    int pxw = 0; int pxh = 0; SDL_GetWindowSizeInPixels(window_, &pxw, &pxh);
    return {static_cast<uint32_t>(std::max(0, pxw)), static_cast<uint32_t>(std::max(0, pxh))};
}

void RenderEngine::on_swapchain_rebuilt(bool render_pass_changed) {
    if (render_pass_changed && pipelines_ && pipelines_->pipeline_layout() != VK_NULL_HANDLE) pipelines_->rebuild_all(swapchain_->render_pass());
    if (ui_) {
        if (render_pass_changed) ui_->recreate_backend(swapchain_->render_pass());
        ui_->set_min_image_count(swapchain_->min_image_count());
    }
    if (renderer_initialized_) renderer_->on_swapchain_ready(make_engine_context(), swapchain_->extent());
}

// ============================================================================
// ImGui Integration (engine-level convenience wrappers)
// ============================================================================
void RenderEngine::create_imgui() {
    ui_ = std::make_unique<UiSystem>();
    if (!ui_->init(window_, device_, swapchain_->render_pass(), swapchain_->min_image_count(), swapchain_->image_count())) {
        ui_->shutdown();
        ui_.reset();
        throw RenderError(ErrorKind::Platform, "ImGui initialization failed");
    }

    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowRounding   = 0.0f;
    style.WindowBorderSize = 0.0f;
    style.FrameRounding    = 4.0f;
    style.GrabRounding     = 4.0f;

    VkPhysicalDeviceMemoryProperties memProps{};
    device_.vki().getPhysicalDeviceMemoryProperties(device_.physical(), &memProps);

    // HUD panel (debug / stats)
    ui_->add_panel([this, memProps] {
        ImGuiViewport* vp = ImGui::GetMainViewport();
        ImVec2 pad(12.0f, 12.0f);
        ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + pad.x, vp->WorkPos.y + pad.y), ImGuiCond_Always);
        ImGui::SetNextWindowBgAlpha(0.32f);

        ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_AlwaysAutoResize;

        if (ImGui::Begin("HUD##top-left", nullptr, flags)) {
            const ImGuiIO& io = ImGui::GetIO();
            const float fps   = io.Framerate;
            const float ms    = fps > 0.f ? 1000.f / fps : 0.f;
            const FrameStats& st = frames_->stats();

            ImGui::Text("FPS: %.1f (%.2f ms)", fps, ms);
            ImGui::SeparatorText("Frame");
            ImGui::Text("Frame#:  %llu", static_cast<unsigned long long>(frames_->frame_counter()));
            ImGui::Text("InFlight: %u", frames_->frames_in_flight());
            ImGui::Text("Presented: %llu", static_cast<unsigned long long>(st.frames_presented));
            ImGui::Text("Skipped:   %llu", static_cast<unsigned long long>(st.frames_skipped));
            ImGui::Text("Time:    %.3f s", state_.time_sec);

            ImGui::SeparatorText("Swapchain");
            ImGui::Text("Extent:  %u x %u", swapchain_->extent().width, swapchain_->extent().height);
            ImGui::Text("Images:  %u", swapchain_->image_count());
            ImGui::Text("Format:  0x%08X", static_cast<uint32_t>(swapchain_->surface_format().format));
            ImGui::Text("Present: %s", to_string(swapchain_->present_mode()));
            ImGui::Text("Rebuilds: %llu", static_cast<unsigned long long>(swapchain_->rebuild_count()));

            ImGui::SeparatorText("Device");
            ImGui::TextUnformatted(device_.device_name().c_str());
            ImGui::Text("GFX qfam: %u", device_.handles().graphics_queue_family);
            ImGui::Text("PRS qfam: %u", device_.handles().present_queue_family);
            ImGui::Text("Pipelines: %zu", pipelines_->size());

            ImGui::SeparatorText("Memory (VMA)");
            std::vector<VmaBudget> budgets(memProps.memoryHeapCount);
            vmaGetHeapBudgets(device_.allocator(), budgets.data());
            uint64_t totalBudget = 0, totalUsage = 0; for (uint32_t i = 0; i < memProps.memoryHeapCount; ++i) { totalBudget += budgets[i].budget; totalUsage += budgets[i].usage; }
            auto fmtMB = [](uint64_t bytes) { return double(bytes) / (1024.0 * 1024.0); };
            ImGui::Text("Usage:  %.1f MB / %.1f MB", fmtMB(totalUsage), fmtMB(totalBudget));
        }
        ImGui::End();
    });
}

// Destroy ImGui backend & context.
void RenderEngine::destroy_imgui() { if (ui_) { ui_->shutdown(); ui_.reset(); } }

} // namespace vrc
