#pragma once

#include <frameline/render/canvas.hpp>
#include <frameline/render/color.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace frameline::scene {

using namespace frameline::core;

// Closed set of drawable node variants
enum class NodeKind : uint8_t {
    Group,      // Container, draws only its children
    Rect        // Filled rectangle
};

const char* to_string(NodeKind kind);

// ============================================================================
// Node - Element of a scene's drawable tree
// ============================================================================

class Node {
public:
    using LayoutFn = std::function<void(Node&)>;

    Node(NodeKind kind, std::string id);

    // Non-copyable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    static std::unique_ptr<Node> group(std::string id);
    static std::unique_ptr<Node> rect(std::string id, const Vec2& size,
                                      const render::Color& fill = render::Color());

    NodeKind get_kind() const { return m_kind; }
    const std::string& get_id() const { return m_id; }

    // Transform and appearance
    Node& set_position(const Vec2& position);
    Node& set_size(const Vec2& size);
    Node& set_fill(const render::Color& fill);
    Node& set_opacity(float opacity);

    // Displacement per frame; sub-frame renders extrapolate along it
    Node& set_velocity(const Vec2& velocity);

    const Vec2& get_position() const { return m_position; }
    const Vec2& get_size() const { return m_size; }
    const render::Color& get_fill() const { return m_fill; }
    float get_opacity() const { return m_opacity; }
    const Vec2& get_velocity() const { return m_velocity; }

    void hide() { m_visible = false; }
    void show() { m_visible = true; }
    bool is_visible() const { return m_visible; }

    // Hierarchy
    Node& add(std::unique_ptr<Node> child);
    std::unique_ptr<Node> remove(const Node* child);
    void clear_children();

    const std::vector<std::unique_ptr<Node>>& get_children() const { return m_children; }
    Node* get_parent() const { return m_parent; }
    Node* find(const std::string& id);

    // Layout
    void set_layout_callback(LayoutFn fn) { m_layout = std::move(fn); }
    void mark_dirty();

    // One layout pass over the subtree. A layout callback that invalidates
    // layout again leaves the tree dirty for the next pass.
    void update_layout();

    // True while any node of the subtree needs another layout pass
    bool was_dirty() const;

    void render(render::Canvas& canvas, double sub_frame = 0.0) const;

private:
    NodeKind m_kind;
    std::string m_id;

    Vec2 m_position{0.0f};
    Vec2 m_size{0.0f};
    Vec2 m_velocity{0.0f};
    render::Color m_fill;
    float m_opacity = 1.0f;
    bool m_visible = true;
    bool m_dirty = true;

    Node* m_parent = nullptr;
    std::vector<std::unique_ptr<Node>> m_children;
    LayoutFn m_layout;
};

} // namespace frameline::scene
