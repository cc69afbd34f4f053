#include <frameline/scene/node.hpp>
#include <frameline/core/log.hpp>
#include <algorithm>

namespace frameline::scene {

const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Group: return "Group";
        case NodeKind::Rect: return "Rect";
        default: return "Unknown";
    }
}

Node::Node(NodeKind kind, std::string id)
    : m_kind(kind)
    , m_id(std::move(id)) {}

std::unique_ptr<Node> Node::group(std::string id) {
    return std::make_unique<Node>(NodeKind::Group, std::move(id));
}

std::unique_ptr<Node> Node::rect(std::string id, const Vec2& size, const render::Color& fill) {
    auto node = std::make_unique<Node>(NodeKind::Rect, std::move(id));
    node->m_size = size;
    node->m_fill = fill;
    return node;
}

Node& Node::set_position(const Vec2& position) {
    if (!exactly_equal(position, m_position)) {
        m_position = position;
        mark_dirty();
    }
    return *this;
}

Node& Node::set_size(const Vec2& size) {
    if (!exactly_equal(size, m_size)) {
        m_size = size;
        mark_dirty();
    }
    return *this;
}

Node& Node::set_fill(const render::Color& fill) {
    m_fill = fill;
    return *this;
}

Node& Node::set_opacity(float opacity) {
    m_opacity = std::clamp(opacity, 0.0f, 1.0f);
    return *this;
}

Node& Node::set_velocity(const Vec2& velocity) {
    m_velocity = velocity;
    return *this;
}

Node& Node::add(std::unique_ptr<Node> child) {
    if (!child) {
        core::log(core::LogLevel::Warn, ("Node '" + m_id + "': ignoring null child").c_str());
        return *this;
    }
    child->m_parent = this;
    m_children.push_back(std::move(child));
    mark_dirty();
    return *this;
}

std::unique_ptr<Node> Node::remove(const Node* child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [child](const std::unique_ptr<Node>& n) { return n.get() == child; });
    if (it == m_children.end()) {
        return nullptr;
    }

    std::unique_ptr<Node> removed = std::move(*it);
    m_children.erase(it);
    removed->m_parent = nullptr;
    mark_dirty();
    return removed;
}

void Node::clear_children() {
    m_children.clear();
    mark_dirty();
}

Node* Node::find(const std::string& id) {
    if (m_id == id) return this;
    for (auto& child : m_children) {
        if (Node* found = child->find(id)) {
            return found;
        }
    }
    return nullptr;
}

void Node::mark_dirty() {
    m_dirty = true;
}

void Node::update_layout() {
    if (m_dirty) {
        m_dirty = false;
        if (m_layout) {
            m_layout(*this);
        }
    }

    for (auto& child : m_children) {
        child->update_layout();
    }
}

bool Node::was_dirty() const {
    if (m_dirty) return true;
    return std::any_of(m_children.begin(), m_children.end(),
        [](const std::unique_ptr<Node>& child) { return child->was_dirty(); });
}

void Node::render(render::Canvas& canvas, double sub_frame) const {
    if (!m_visible || m_opacity <= 0.0f) return;

    canvas.save();
    canvas.translate(m_position + m_velocity * static_cast<float>(sub_frame));
    canvas.set_global_alpha(canvas.global_alpha() * m_opacity);

    if (m_kind == NodeKind::Rect) {
        canvas.set_fill_style(m_fill);
        canvas.fill_rect(Rect(Vec2(0.0f), m_size));
    }

    for (const auto& child : m_children) {
        child->render(canvas, sub_frame);
    }

    canvas.restore();
}

} // namespace frameline::scene
