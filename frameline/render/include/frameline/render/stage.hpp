#pragma once

#include <frameline/render/canvas.hpp>
#include <frameline/render/color.hpp>
#include <frameline/render/motion_blur.hpp>
#include <frameline/render/renderable.hpp>
#include <frameline/render/surface.hpp>
#include <frameline/core/settings.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace frameline::render {

// Background fill: none, a color, or a color string
using Background = std::variant<std::monostate, Color, std::string>;

// Partial stage configuration; unset fields keep their current value
struct StageSettings {
    std::optional<Vec2> size;
    std::optional<float> resolution_scale;
    std::optional<ColorSpace> color_space;
    std::optional<uint32_t> motion_blur;
    std::optional<Background> background;

    static StageSettings from_config(const core::StageConfig& config);
};

// Manages the surfaces an animation frame is composited on
class Stage {
public:
    using SupportProbe = std::function<bool()>;

    explicit Stage(SupportProbe motion_blur_probe = &MotionBlurRenderer::check_support);

    // Non-copyable
    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    void configure(const StageSettings& settings);

    // Renders both scenes and composites them into the final buffer
    void render(IRenderable& current, IRenderable* previous = nullptr);

    const Surface& final_buffer() const { return *m_final; }

    Vec2 get_size() const { return m_size; }
    float get_resolution_scale() const { return m_resolution_scale; }
    ColorSpace get_color_space() const { return m_color_space; }
    uint32_t get_motion_blur_samples() const { return m_motion_blur_samples; }
    const std::optional<std::string>& get_background() const { return m_background; }

    // Pixel size of the surfaces (size * resolution scale)
    IVec2 canvas_size() const;

    bool has_motion_blur() const { return m_motion_blur != nullptr; }
    const MotionBlurRenderer* motion_blur_renderer() const { return m_motion_blur.get(); }

    // Incremented whenever the surfaces are recreated
    uint32_t surface_generation() const { return m_surface_generation; }

private:
    void create_surfaces();
    void resize_surfaces();
    void render_scene(IRenderable& scene, Surface& surface);

    SupportProbe m_probe;

    std::optional<std::string> m_background;
    std::optional<Color> m_background_color;
    float m_resolution_scale = 1.0f;
    ColorSpace m_color_space = ColorSpace::SRGB;
    Vec2 m_size{0.0f};
    uint32_t m_motion_blur_samples = 1;

    std::unique_ptr<Surface> m_final;
    std::unique_ptr<Surface> m_current;
    std::unique_ptr<Surface> m_previous;
    std::unique_ptr<MotionBlurRenderer> m_motion_blur;

    uint32_t m_surface_generation = 0;
};

} // namespace frameline::render
