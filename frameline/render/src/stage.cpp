#include <frameline/render/stage.hpp>
#include <frameline/core/log.hpp>
#include <cmath>

namespace frameline::render {

using core::log;
using core::LogLevel;

StageSettings StageSettings::from_config(const core::StageConfig& config) {
    StageSettings settings;
    settings.size = Vec2(static_cast<float>(config.width), static_cast<float>(config.height));
    settings.resolution_scale = config.resolution_scale;
    settings.motion_blur = config.motion_blur;

    if (auto space = parse_color_space(config.color_space)) {
        settings.color_space = *space;
    } else {
        log(LogLevel::Warn, ("Stage: unsupported color space '" + config.color_space + "', keeping current").c_str());
    }

    if (config.background.empty()) {
        settings.background = Background{std::monostate{}};
    } else {
        settings.background = Background{config.background};
    }
    return settings;
}

Stage::Stage(SupportProbe motion_blur_probe)
    : m_probe(std::move(motion_blur_probe)) {
    create_surfaces();
}

IVec2 Stage::canvas_size() const {
    Vec2 scaled = m_size * m_resolution_scale;
    return IVec2(static_cast<int32_t>(std::lround(scaled.x)), static_cast<int32_t>(std::lround(scaled.y)));
}

void Stage::configure(const StageSettings& settings) {
    ColorSpace color_space = settings.color_space.value_or(m_color_space);
    Vec2 size = settings.size.value_or(m_size);
    float resolution_scale = settings.resolution_scale.value_or(m_resolution_scale);
    uint32_t motion_blur = settings.motion_blur.value_or(m_motion_blur_samples);

    if (resolution_scale <= 0.0f) {
        log(LogLevel::Warn, "Stage: resolution scale must be positive, keeping current");
        resolution_scale = m_resolution_scale;
    }
    if (size.x < 0.0f || size.y < 0.0f) {
        log(LogLevel::Warn, "Stage: negative size ignored");
        size = m_size;
    }

    if (color_space != m_color_space) {
        m_color_space = color_space;
        create_surfaces();
    }

    if (!exactly_equal(size, m_size) || resolution_scale != m_resolution_scale) {
        m_resolution_scale = resolution_scale;
        m_size = size;
        resize_surfaces();
    }

    m_motion_blur_samples = motion_blur;
    if (motion_blur <= 1 || !(m_probe && m_probe())) {
        if (m_motion_blur) {
            log(LogLevel::Debug, "Stage: motion blur disabled");
        } else if (motion_blur > 1) {
            log(LogLevel::Info, "Stage: motion blur is not supported, rendering without it");
        }
        m_motion_blur.reset();
    } else if (!m_motion_blur) {
        log(LogLevel::Debug, ("Stage: motion blur enabled with " + std::to_string(motion_blur) + " samples").c_str());
        m_motion_blur = std::make_unique<MotionBlurRenderer>(canvas_size(), motion_blur);
    }

    if (settings.background) {
        const Background& background = *settings.background;
        m_background.reset();
        m_background_color.reset();

        if (const auto* color = std::get_if<Color>(&background)) {
            m_background = color->serialize();
            m_background_color = *color;
        } else if (const auto* text = std::get_if<std::string>(&background)) {
            if (!text->empty()) {
                if (auto parsed = Color::parse(*text)) {
                    m_background = *text;
                    m_background_color = *parsed;
                } else {
                    log(LogLevel::Warn, ("Stage: invalid background '" + *text + "', using none").c_str());
                }
            }
        }
    }

    if (m_motion_blur) {
        m_motion_blur->resize(canvas_size());
        m_motion_blur->set_samples(motion_blur);
    }
}

void Stage::render(IRenderable& current, IRenderable* previous) {
    const bool previous_on_top = previous ? current.previous_on_top() : false;

    if (previous) {
        render_scene(*previous, *m_previous);
    }
    render_scene(current, *m_current);

    // Nothing touches the final buffer until both scenes rendered
    Canvas context(*m_final, m_resolution_scale);
    context.clear();
    if (m_background_color) {
        context.save();
        context.set_fill_style(*m_background_color);
        context.fill_rect(Rect(Vec2(0.0f), context.size()));
        context.restore();
    }

    if (previous && !previous_on_top) {
        context.draw_image(*m_previous);
    }
    context.draw_image(*m_current);
    if (previous && previous_on_top) {
        context.draw_image(*m_previous);
    }
}

void Stage::create_surfaces() {
    IVec2 size = glm::max(canvas_size(), IVec2(0));
    auto width = static_cast<uint32_t>(size.x);
    auto height = static_cast<uint32_t>(size.y);

    m_final = std::make_unique<Surface>(width, height, m_color_space);
    m_current = std::make_unique<Surface>(width, height, m_color_space);
    m_previous = std::make_unique<Surface>(width, height, m_color_space);
    m_surface_generation++;
}

void Stage::resize_surfaces() {
    IVec2 size = glm::max(canvas_size(), IVec2(0));
    auto width = static_cast<uint32_t>(size.x);
    auto height = static_cast<uint32_t>(size.y);

    m_final->resize(width, height);
    m_current->resize(width, height);
    m_previous->resize(width, height);
}

void Stage::render_scene(IRenderable& scene, Surface& surface) {
    Canvas canvas(surface, m_resolution_scale);
    if (m_motion_blur) {
        m_motion_blur->render(scene, canvas);
    } else {
        canvas.clear();
        scene.render(canvas, 0.0);
    }
}

} // namespace frameline::render
