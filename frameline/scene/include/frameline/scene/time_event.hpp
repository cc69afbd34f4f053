#pragma once

#include <frameline/core/signal.hpp>
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace frameline::scene {

// Named, adjustable point on a scene's timeline. Times are in seconds
// relative to the scene's first frame.
struct TimeEvent {
    std::string name;
    double initial_time = 0.0;  // When the routine first asked for the event
    double target_time = 0.0;   // When the event should happen
    double offset = 0.0;        // target_time - initial_time

    bool operator==(const TimeEvent& other) const {
        return name == other.name && initial_time == other.initial_time &&
               target_time == other.target_time && offset == other.offset;
    }
    bool operator!=(const TimeEvent& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const TimeEvent& event);
void from_json(const nlohmann::json& j, TimeEvent& event);

using TimeEventMap = std::map<std::string, TimeEvent>;

std::string serialize_time_events(const TimeEventMap& events);

// Returns false and leaves `events` untouched when the text is malformed
bool parse_time_events(const std::string& text, TimeEventMap& events);

// ============================================================================
// TimeEventLedger - Live and stored time events of one scene
// ============================================================================
//
// Live events are the ones requested since the last reload, kept in request
// order. Stored events outlive reloads and seed live events of the same name.

class TimeEventLedger {
public:
    using ChangedSignal = core::Signal<const std::vector<TimeEvent>&>;

    TimeEventLedger() = default;

    // Brings the event in line with the current request time and returns its
    // effective time (initial_time + offset)
    double resolve(const std::string& name, double initial_time);

    // Whether set_offset() would change anything
    bool accepts_offset(const std::string& name, double offset) const;

    // Returns false when the event is unknown or the offset is unchanged
    bool set_offset(const std::string& name, double offset, bool preserve = true);

    // Merges live events into the stored ones and forgets the live set
    void reload();

    bool is_preserving() const { return m_preserve; }
    void set_preserving(bool preserve) { m_preserve = preserve; }

    std::vector<TimeEvent> events() const { return m_events; }
    const TimeEvent* find(const std::string& name) const;

    const TimeEventMap& stored() const { return m_stored; }
    void set_stored(TimeEventMap stored) { m_stored = std::move(stored); }

    // Handlers receive the full current set on every change
    [[nodiscard]] core::ScopedConnection subscribe(ChangedSignal::Handler handler) {
        return m_changed.subscribe(std::move(handler));
    }

private:
    void reconcile(TimeEvent& event) const;
    void notify() const { m_changed.emit(m_events); }

    std::vector<TimeEvent> m_events;
    std::unordered_map<std::string, size_t> m_index;
    TimeEventMap m_stored;
    bool m_preserve = false;
    ChangedSignal m_changed;
};

} // namespace frameline::scene
