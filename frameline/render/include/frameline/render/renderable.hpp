#pragma once

#include <frameline/render/canvas.hpp>

namespace frameline::render {

// Anything the stage can draw for the current frame
class IRenderable {
public:
    virtual ~IRenderable() = default;

    // sub_frame is the offset inside the current frame interval, in [0, 1)
    virtual void render(Canvas& canvas, double sub_frame = 0.0) = 0;

    // When this renderable is the current scene of a transition, whether the
    // previous scene is composited above it
    virtual bool previous_on_top() const { return false; }
};

} // namespace frameline::render
