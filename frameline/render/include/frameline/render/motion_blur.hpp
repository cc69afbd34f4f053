#pragma once

#include <frameline/render/renderable.hpp>
#include <frameline/render/surface.hpp>
#include <cstdint>

namespace frameline::render {

// Renders a scene at evenly spaced sub-frame offsets and averages the samples
class MotionBlurRenderer {
public:
    MotionBlurRenderer(const IVec2& size, uint32_t samples);

    // Non-copyable
    MotionBlurRenderer(const MotionBlurRenderer&) = delete;
    MotionBlurRenderer& operator=(const MotionBlurRenderer&) = delete;

    // Whether accumulation can run in this process. Disabled when the
    // FRAMELINE_DISABLE_MOTION_BLUR environment variable is set.
    static bool check_support();

    void resize(const IVec2& size);
    void set_samples(uint32_t samples);

    uint32_t get_samples() const { return m_samples; }
    IVec2 get_size() const { return m_size; }

    // Replaces the target's contents with the accumulated frame
    void render(IRenderable& scene, Canvas& target);

    // Number of sub-frame renders issued so far
    uint64_t sample_renders() const { return m_sample_renders; }

private:
    IVec2 m_size{0};
    uint32_t m_samples = 2;
    Surface m_sample;
    Surface m_accumulator;
    uint64_t m_sample_renders = 0;
};

} // namespace frameline::render
