#include <frameline/scene/time_event.hpp>
#include <frameline/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace frameline::scene {

using json = nlohmann::json;

void to_json(json& j, const TimeEvent& event) {
    j = json{
        {"name", event.name},
        {"initialTime", event.initial_time},
        {"targetTime", event.target_time},
        {"offset", event.offset},
    };
}

void from_json(const json& j, TimeEvent& event) {
    event.name = j.value("name", event.name);
    event.initial_time = j.value("initialTime", 0.0);
    event.target_time = j.value("targetTime", event.initial_time);
    event.offset = j.value("offset", 0.0);
}

std::string serialize_time_events(const TimeEventMap& events) {
    json j = json::object();
    for (const auto& [name, event] : events) {
        j[name] = event;
    }
    return j.dump();
}

bool parse_time_events(const std::string& text, TimeEventMap& events) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            core::log(core::LogLevel::Warn, "Stored time events are not a JSON object");
            return false;
        }

        TimeEventMap parsed;
        for (auto it = j.begin(); it != j.end(); ++it) {
            TimeEvent event;
            event.name = it.key();
            it.value().get_to(event);
            parsed[event.name] = event;
        }
        events = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Warn, (std::string("Failed to parse stored time events: ") + e.what()).c_str());
        return false;
    }
}

double TimeEventLedger::resolve(const std::string& name, double initial_time) {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        TimeEvent event;
        event.name = name;
        event.initial_time = initial_time;
        event.target_time = initial_time;
        event.offset = 0.0;

        auto stored = m_stored.find(name);
        if (stored != m_stored.end()) {
            event.target_time = stored->second.target_time;
            event.offset = stored->second.offset;
            reconcile(event);
        }

        it = m_index.emplace(name, m_events.size()).first;
        m_events.push_back(event);
        notify();
    } else if (m_events[it->second].initial_time != initial_time) {
        // Upstream timing moved the request point
        TimeEvent event = m_events[it->second];
        event.initial_time = initial_time;
        reconcile(event);

        m_events[it->second] = event;
        m_stored[name] = event;
        notify();
    }

    const TimeEvent& event = m_events[it->second];
    return event.initial_time + event.offset;
}

bool TimeEventLedger::accepts_offset(const std::string& name, double offset) const {
    const TimeEvent* event = find(name);
    return event != nullptr && event->offset != offset;
}

bool TimeEventLedger::set_offset(const std::string& name, double offset, bool preserve) {
    if (!accepts_offset(name, offset)) {
        return false;
    }

    m_preserve = preserve;

    TimeEvent& event = m_events[m_index.at(name)];
    event.target_time = event.initial_time + offset;
    event.offset = offset;
    m_stored[name] = event;

    notify();
    return true;
}

void TimeEventLedger::reload() {
    for (const auto& event : m_events) {
        m_stored[event.name] = event;
    }
    m_events.clear();
    m_index.clear();
    notify();
}

const TimeEvent* TimeEventLedger::find(const std::string& name) const {
    auto it = m_index.find(name);
    return it != m_index.end() ? &m_events[it->second] : nullptr;
}

void TimeEventLedger::reconcile(TimeEvent& event) const {
    if (m_preserve) {
        // Keep the user's offset; negative offsets are allowed here
        event.target_time = event.initial_time + event.offset;
    } else {
        event.offset = std::max(0.0, event.target_time - event.initial_time);
    }
}

} // namespace frameline::scene
