#pragma once

#include <frameline/render/color.hpp>
#include <cstdint>
#include <vector>

namespace frameline::render {

// CPU raster of premultiplied RGBA float pixels
class Surface {
public:
    Surface() = default;
    Surface(uint32_t width, uint32_t height, ColorSpace color_space = ColorSpace::SRGB);

    // Resizing discards the current contents
    void resize(uint32_t width, uint32_t height);

    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }
    ColorSpace color_space() const { return m_color_space; }
    bool empty() const { return m_width == 0 || m_height == 0; }

    // Clears to transparent
    void clear();
    void clear(int32_t x, int32_t y, int32_t w, int32_t h);

    // Source-over blend of a premultiplied color into the pixel range
    void blend_rect(int32_t x, int32_t y, int32_t w, int32_t h, const Vec4& premultiplied);

    // Source-over composite of another surface with its top-left at (x, y)
    void draw(const Surface& source, int32_t x = 0, int32_t y = 0, float alpha = 1.0f);

    // Adds weight * source to every pixel; sizes must match
    bool accumulate(const Surface& source, float weight);

    // Copies pixels; sizes must match
    bool copy_from(const Surface& source);

    Vec4 pixel(uint32_t x, uint32_t y) const;
    Color color_at(uint32_t x, uint32_t y) const;   // Un-premultiplied

    const std::vector<Vec4>& pixels() const { return m_pixels; }

private:
    size_t index(uint32_t x, uint32_t y) const { return static_cast<size_t>(y) * m_width + x; }

    uint32_t m_width = 0;
    uint32_t m_height = 0;
    ColorSpace m_color_space = ColorSpace::SRGB;
    std::vector<Vec4> m_pixels;
};

} // namespace frameline::render
