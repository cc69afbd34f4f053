#include <frameline/render/surface.hpp>
#include <algorithm>

namespace frameline::render {

namespace {

struct Span {
    uint32_t x0, y0, x1, y1;
};

// Clips a signed rectangle against the surface bounds
Span clip(int32_t x, int32_t y, int32_t w, int32_t h, uint32_t width, uint32_t height) {
    int64_t x0 = std::max<int64_t>(x, 0);
    int64_t y0 = std::max<int64_t>(y, 0);
    int64_t x1 = std::min<int64_t>(static_cast<int64_t>(x) + w, width);
    int64_t y1 = std::min<int64_t>(static_cast<int64_t>(y) + h, height);
    if (x1 < x0) x1 = x0;
    if (y1 < y0) y1 = y0;
    return Span{static_cast<uint32_t>(x0), static_cast<uint32_t>(y0),
                static_cast<uint32_t>(x1), static_cast<uint32_t>(y1)};
}

Vec4 source_over(const Vec4& dst, const Vec4& src) {
    return src + dst * (1.0f - src.a);
}

} // anonymous namespace

Surface::Surface(uint32_t width, uint32_t height, ColorSpace color_space)
    : m_color_space(color_space) {
    resize(width, height);
}

void Surface::resize(uint32_t width, uint32_t height) {
    m_width = width;
    m_height = height;
    m_pixels.assign(static_cast<size_t>(width) * height, Vec4(0.0f));
}

void Surface::clear() {
    std::fill(m_pixels.begin(), m_pixels.end(), Vec4(0.0f));
}

void Surface::clear(int32_t x, int32_t y, int32_t w, int32_t h) {
    Span span = clip(x, y, w, h, m_width, m_height);
    for (uint32_t py = span.y0; py < span.y1; ++py) {
        for (uint32_t px = span.x0; px < span.x1; ++px) {
            m_pixels[index(px, py)] = Vec4(0.0f);
        }
    }
}

void Surface::blend_rect(int32_t x, int32_t y, int32_t w, int32_t h, const Vec4& premultiplied) {
    if (premultiplied.a <= 0.0f && premultiplied.r <= 0.0f &&
        premultiplied.g <= 0.0f && premultiplied.b <= 0.0f) {
        return;
    }

    Span span = clip(x, y, w, h, m_width, m_height);
    for (uint32_t py = span.y0; py < span.y1; ++py) {
        for (uint32_t px = span.x0; px < span.x1; ++px) {
            Vec4& dst = m_pixels[index(px, py)];
            dst = source_over(dst, premultiplied);
        }
    }
}

void Surface::draw(const Surface& source, int32_t x, int32_t y, float alpha) {
    if (alpha <= 0.0f) return;

    Span span = clip(x, y, static_cast<int32_t>(source.m_width),
                     static_cast<int32_t>(source.m_height), m_width, m_height);
    for (uint32_t py = span.y0; py < span.y1; ++py) {
        for (uint32_t px = span.x0; px < span.x1; ++px) {
            const Vec4& src = source.m_pixels[source.index(px - x, py - y)];
            Vec4& dst = m_pixels[index(px, py)];
            dst = source_over(dst, src * alpha);
        }
    }
}

bool Surface::accumulate(const Surface& source, float weight) {
    if (source.m_width != m_width || source.m_height != m_height) {
        return false;
    }
    for (size_t i = 0; i < m_pixels.size(); ++i) {
        m_pixels[i] += source.m_pixels[i] * weight;
    }
    return true;
}

bool Surface::copy_from(const Surface& source) {
    if (source.m_width != m_width || source.m_height != m_height) {
        return false;
    }
    m_pixels = source.m_pixels;
    return true;
}

Vec4 Surface::pixel(uint32_t x, uint32_t y) const {
    if (x >= m_width || y >= m_height) return Vec4(0.0f);
    return m_pixels[index(x, y)];
}

Color Surface::color_at(uint32_t x, uint32_t y) const {
    Vec4 p = pixel(x, y);
    if (p.a <= 0.0f) return Color::transparent();
    return Color(p.r / p.a, p.g / p.a, p.b / p.a, p.a);
}

} // namespace frameline::render
