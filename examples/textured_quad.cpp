// Textured quad: a 256x256 checkerboard uploaded with a full GPU mip chain,
// drawn through the pipeline cache with per-frame uniform transforms.
// Every two seconds the sampler moves on to pin the next mip level; M toggles
// between that cycle and plain trilinear sampling.
#include "vk_renderer.h"
#include "vk_log.h"
#include "vrc_camera.h"

#include <cstdio>
#include <cstring>
#include <imgui.h>
#include <string>
#include <vector>

namespace {

struct Vertex {
    float pos[3];
    float uv[2];
};

std::vector<std::byte> make_checkerboard(uint32_t size, uint32_t cell) {
    std::vector<std::byte> px(static_cast<size_t>(size) * size * 4u);
    for (uint32_t y = 0; y < size; ++y) {
        for (uint32_t x = 0; x < size; ++x) {
            const bool dark  = ((x / cell) + (y / cell)) % 2u == 0u;
            const size_t i   = (static_cast<size_t>(y) * size + x) * 4u;
            px[i + 0]        = std::byte{dark ? uint8_t{30} : uint8_t{230}};
            px[i + 1]        = std::byte{dark ? uint8_t{30} : uint8_t{180}};
            px[i + 2]        = std::byte{dark ? uint8_t{40} : uint8_t{60}};
            px[i + 3]        = std::byte{255};
        }
    }
    return px;
}

template <typename T>
std::span<const std::byte> as_bytes_of(const std::vector<T>& v) { return std::as_bytes(std::span<const T>(v)); }

} // namespace

class TexturedQuadRenderer : public vrc::IRenderer {
public:
    void initialize(const vrc::EngineContext& eng) override {
        const std::string dir(SHADER_OUTPUT_DIR);
        eng.pipelines->register_shaders(vrc::ShaderPair{
            .key               = "textured",
            .vertex_spirv      = vrc::load_spirv_file(dir + "/textured.vert.spv"),
            .fragment_spirv    = vrc::load_spirv_file(dir + "/textured.frag.spv"),
            .declared_bindings = {vrc::kCanonicalBindings.begin(), vrc::kCanonicalBindings.end()},
        });
        pipeline_ = &eng.pipelines->get_or_build("textured", vrc::vertex_layout_pos3_uv2(), vrc::DepthState{.test = true, .write = true});

        const std::vector<Vertex> verts{
            {{-1.f, -1.f, 0.f}, {0.f, 0.f}},
            {{1.f, -1.f, 0.f}, {4.f, 0.f}},
            {{1.f, 1.f, 0.f}, {4.f, 4.f}},
            {{-1.f, 1.f, 0.f}, {0.f, 4.f}},
        };
        const std::vector<uint16_t> indices{0, 1, 2, 2, 3, 0};
        vbuf_ = eng.buffers->create_with_data(as_bytes_of(verts), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
        ibuf_ = eng.buffers->create_with_data(as_bytes_of(indices), VK_BUFFER_USAGE_INDEX_BUFFER_BIT);

        const auto pixels = make_checkerboard(256u, 16u);
        texture_          = eng.textures->build_texture(pixels, 256u, 256u, VK_FORMAT_R8G8B8A8_SRGB);
        for (uint32_t level = 0; level < texture_.mip_levels; ++level) {
            vrc::SamplerOptions so{};
            so.min_lod = static_cast<float>(level);
            so.max_lod = static_cast<float>(level);
            level_samplers_.push_back(eng.textures->create_sampler(texture_, so));
        }
        vrc::log_info("Textured quad ready: {} mip levels", texture_.mip_levels);
    }

    void destroy(const vrc::EngineContext& eng) override {
        for (VkSampler& s : level_samplers_) {
            eng.pipelines->forget(s);
            eng.textures->destroy_sampler(s);
        }
        level_samplers_.clear();
        eng.pipelines->forget(texture_);
        eng.textures->destroy_texture(texture_);
        eng.buffers->destroy(ibuf_);
        eng.buffers->destroy(vbuf_);
    }

    void on_event(const SDL_Event& e, const vrc::EngineContext& eng) override {
        (void)eng;
        if (e.type == SDL_EVENT_KEY_DOWN && e.key.key == SDLK_M) cycle_levels_ = !cycle_levels_;
    }

    void update(const vrc::EngineContext& eng, const vrc::FrameInfo& frm) override {
        // -1 selects the texture's own trilinear sampler.
        pinned_level_ = cycle_levels_ ? static_cast<int>(static_cast<uint64_t>(frm.timing.time_sec / 2.0) % level_samplers_.size()) : -1;
        const float aspect = frm.extent.height > 0 ? static_cast<float>(frm.extent.width) / static_cast<float>(frm.extent.height) : 1.0f;
        vrc::Transforms t{};
        t.model      = vrc::make_rotation_z(static_cast<float>(frm.timing.time_sec) * 0.3f);
        t.view       = camera_.view();
        t.projection = camera_.projection(aspect);
        eng.frames->write_uniform(frm, std::as_bytes(std::span<const vrc::Transforms>(&t, 1)));
    }

    void build_draws(const vrc::EngineContext& eng, const vrc::FrameInfo& frm, std::vector<vrc::DrawCall>& out) override {
        const VkSampler sampler = pinned_level_ >= 0 ? level_samplers_[static_cast<size_t>(pinned_level_)] : VK_NULL_HANDLE;
        vrc::DrawCall dc{};
        dc.pipeline       = pipeline_;
        dc.descriptor_set = eng.pipelines->bind_descriptors(frm.slot, *pipeline_, *frm.uniform, texture_, sampler);
        dc.vertex_buffer  = vbuf_.buffer;
        dc.index_buffer   = ibuf_.buffer;
        dc.index_type     = VK_INDEX_TYPE_UINT16;
        dc.count          = 6u;
        out.push_back(dc);
    }

    void on_imgui(const vrc::EngineContext& eng) override {
        (void)eng;
        ImGui::Begin("Texture");
        ImGui::Text("Mip levels: %u", texture_.mip_levels);
        if (pinned_level_ < 0) ImGui::TextUnformatted("Sampling: trilinear (M to cycle levels)");
        else ImGui::Text("Sampling: level %d only (M for trilinear)", pinned_level_);
        ImGui::End();
    }

private:
    const vrc::Pipeline* pipeline_{};
    vrc::Buffer vbuf_{};
    vrc::Buffer ibuf_{};
    vrc::Texture texture_{};
    std::vector<VkSampler> level_samplers_;
    int pinned_level_{-1};
    bool cycle_levels_{true};
    vrc::Camera camera_{};
};

int main() {
    try {
        vrc::RendererConfig cfg{};
        cfg.app_name            = "textured_quad";
        cfg.uniform_buffer_size = sizeof(vrc::Transforms);
        cfg.depth_format        = VK_FORMAT_D32_SFLOAT;

        vrc::RenderEngine engine;
        engine.configure(cfg);
        engine.set_renderer(std::make_unique<TexturedQuadRenderer>());
        engine.set_fatal_error_callback([](const vrc::RenderError& e) { std::fprintf(stderr, "Render error [%s]: %s\n", vrc::to_string(e.kind()), e.what()); });
        engine.init();
        engine.run();
        engine.cleanup();
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "Fatal: %s\n", ex.what());
        return 1;
    }
    return 0;
}
