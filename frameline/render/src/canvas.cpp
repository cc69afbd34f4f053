#include <frameline/render/canvas.hpp>
#include <frameline/core/log.hpp>
#include <algorithm>
#include <cmath>

namespace frameline::render {

Canvas::Canvas(Surface& surface, float resolution_scale)
    : m_surface(&surface)
    , m_scale(resolution_scale > 0.0f ? resolution_scale : 1.0f) {}

void Canvas::save() {
    m_stack.push_back(m_state);
}

void Canvas::restore() {
    if (m_stack.empty()) {
        core::log(core::LogLevel::Warn, "Canvas: restore() without matching save()");
        return;
    }
    m_state = m_stack.back();
    m_stack.pop_back();
}

void Canvas::fill_rect(const Rect& rect) {
    if (rect.empty()) return;

    int32_t x, y, w, h;
    to_pixels(rect, x, y, w, h);

    Color color = m_state.fill;
    color.rgba.a *= m_state.alpha;
    m_surface->blend_rect(x, y, w, h, color.premultiplied());
}

void Canvas::clear_rect(const Rect& rect) {
    int32_t x, y, w, h;
    to_pixels(rect, x, y, w, h);
    m_surface->clear(x, y, w, h);
}

void Canvas::clear() {
    m_surface->clear();
}

void Canvas::draw_image(const Surface& image, int32_t x, int32_t y) {
    m_surface->draw(image, x, y, m_state.alpha);
}

Vec2 Canvas::size() const {
    return Vec2(static_cast<float>(m_surface->width()), static_cast<float>(m_surface->height())) / m_scale;
}

void Canvas::to_pixels(const Rect& rect, int32_t& x, int32_t& y, int32_t& w, int32_t& h) const {
    Vec2 min = (rect.min() + m_state.translation) * m_scale;
    Vec2 max = (rect.max() + m_state.translation) * m_scale;

    // Pixel i is covered when its center i + 0.5 lies in [min, max).
    // Edges are clamped to the surface before leaving float space.
    const float width = static_cast<float>(m_surface->width());
    const float height = static_cast<float>(m_surface->height());
    auto edge = [](float v, float limit) {
        return static_cast<int64_t>(std::ceil(std::clamp(v - 0.5f, 0.0f, limit)));
    };

    int64_t x0 = edge(min.x, width);
    int64_t y0 = edge(min.y, height);
    int64_t x1 = edge(max.x, width);
    int64_t y1 = edge(max.y, height);

    x = static_cast<int32_t>(x0);
    y = static_cast<int32_t>(y0);
    w = static_cast<int32_t>(std::max<int64_t>(0, x1 - x0));
    h = static_cast<int32_t>(std::max<int64_t>(0, y1 - y0));
}

} // namespace frameline::render
