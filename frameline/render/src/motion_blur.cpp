#include <frameline/render/motion_blur.hpp>
#include <frameline/core/log.hpp>
#include <algorithm>
#include <cstdlib>

namespace frameline::render {

using core::log;
using core::LogLevel;

MotionBlurRenderer::MotionBlurRenderer(const IVec2& size, uint32_t samples) {
    set_samples(samples);
    resize(size);
}

bool MotionBlurRenderer::check_support() {
    const char* disabled = std::getenv("FRAMELINE_DISABLE_MOTION_BLUR");
    return disabled == nullptr || disabled[0] == '\0' || disabled[0] == '0';
}

void MotionBlurRenderer::resize(const IVec2& size) {
    IVec2 clamped = glm::max(size, IVec2(0));
    if (clamped == m_size && !m_accumulator.empty()) return;

    m_size = clamped;
    m_sample.resize(static_cast<uint32_t>(m_size.x), static_cast<uint32_t>(m_size.y));
    m_accumulator.resize(static_cast<uint32_t>(m_size.x), static_cast<uint32_t>(m_size.y));
}

void MotionBlurRenderer::set_samples(uint32_t samples) {
    if (samples < 2) {
        log(LogLevel::Warn, "MotionBlurRenderer: at least 2 samples are required, using 2");
        samples = 2;
    }
    m_samples = samples;
}

void MotionBlurRenderer::render(IRenderable& scene, Canvas& target) {
    Surface& output = target.surface();
    if (output.width() != m_sample.width() || output.height() != m_sample.height()) {
        log(LogLevel::Debug, "MotionBlurRenderer: target size changed, resizing buffers");
        resize(IVec2(static_cast<int32_t>(output.width()), static_cast<int32_t>(output.height())));
    }

    const float weight = 1.0f / static_cast<float>(m_samples);
    m_accumulator.clear();

    // Samples run in order so the sum is reproducible
    for (uint32_t i = 0; i < m_samples; ++i) {
        m_sample.clear();
        Canvas canvas(m_sample, target.resolution_scale());
        scene.render(canvas, static_cast<double>(i) / static_cast<double>(m_samples));
        m_accumulator.accumulate(m_sample, weight);
        m_sample_renders++;
    }

    output.copy_from(m_accumulator);
}

} // namespace frameline::render
