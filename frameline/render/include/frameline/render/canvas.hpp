#pragma once

#include <frameline/render/surface.hpp>
#include <vector>

namespace frameline::render {

// Drawing context handed to scenes for one render call. Coordinates are in
// logical units and scaled by the resolution scale of the target surface.
class Canvas {
public:
    Canvas(Surface& surface, float resolution_scale = 1.0f);

    // State stack
    void save();
    void restore();

    void translate(const Vec2& offset) { m_state.translation += offset; }
    void set_fill_style(const Color& color) { m_state.fill = color; }
    void set_global_alpha(float alpha) { m_state.alpha = alpha; }

    const Color& fill_style() const { return m_state.fill; }
    float global_alpha() const { return m_state.alpha; }
    const Vec2& translation() const { return m_state.translation; }

    // Logical-unit primitives
    void fill_rect(const Rect& rect);
    void clear_rect(const Rect& rect);
    void clear();

    // Pixel-space composite of another surface
    void draw_image(const Surface& image, int32_t x = 0, int32_t y = 0);

    Surface& surface() { return *m_surface; }
    const Surface& surface() const { return *m_surface; }
    float resolution_scale() const { return m_scale; }

    // Logical size of the target
    Vec2 size() const;

private:
    struct State {
        Vec2 translation{0.0f};
        Color fill{0.0f, 0.0f, 0.0f, 1.0f};
        float alpha = 1.0f;
    };

    // Pixel bounds covering every pixel whose center lies inside the rect
    void to_pixels(const Rect& rect, int32_t& x, int32_t& y, int32_t& w, int32_t& h) const;

    Surface* m_surface;
    float m_scale;
    State m_state;
    std::vector<State> m_stack;
};

} // namespace frameline::render
