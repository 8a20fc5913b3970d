//
//  components.hpp
//  aberred
//
//  Created by George Watson on 29/08/2025.
//

#pragma once

#include "flecs.h"
#include "glm/vec2.hpp"
#include "glm/vec4.hpp"
#include "glm/geometric.hpp"
#include "glm/common.hpp"
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <unordered_map>
#include <cstdint>
#include "signals.hpp"

struct Rect {
    float x = 0.f;
    float y = 0.f;
    float w = 0.f;
    float h = 0.f;
};

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

struct MapPosition {
    glm::vec2 pos{0.f};
};

struct ScreenPosition {
    glm::vec2 pos{0.f};
};

struct Rotation {
    float degrees = 0.f;
};

struct Scale {
    glm::vec2 scale{1.f};
};

struct ZIndex {
    float z = 0.f;
};

// Written by transform propagation only
struct GlobalTransform2D {
    glm::vec2 position{0.f};
    float rotation_degrees = 0.f;
    glm::vec2 scale{1.f};
};

struct Group {
    std::string name;
};

struct Persistent {};

// Tags everything spawned on behalf of a scene, scene switches despawn these
struct Spawned {};

struct Sprite {
    std::string tex_key;
    float width = 0.f;
    float height = 0.f;
    glm::vec2 offset{0.f};
    glm::vec2 origin{0.f};
    bool flip_h = false;
    bool flip_v = false;
};

struct Tint {
    Color color;
};

// Measured size is recomputed by dynamic_text_size only when dirty
class DynamicText {
    std::string _content;
    std::string _font;
    float _font_size = 16.f;
    bool _dirty = true;

public:
    Color color;
    glm::vec2 size{0.f};

    DynamicText() = default;
    DynamicText(std::string content, std::string font, float font_size, Color color)
        : _content(std::move(content)), _font(std::move(font)), _font_size(font_size), color(color) {}

    const std::string& content() const { return _content; }
    const std::string& font() const { return _font; }
    float font_size() const { return _font_size; }
    bool dirty() const { return _dirty; }
    void mark_measured() { _dirty = false; }

    // Returns true when the text actually changed
    bool set_text(const std::string& content) {
        if (content == _content)
            return false;
        _content = content;
        _dirty = true;
        return true;
    }

    bool set_font(const std::string& font, float font_size) {
        if (font == _font && font_size == _font_size)
            return false;
        _font = font;
        _font_size = font_size;
        _dirty = true;
        return true;
    }
};

struct BoxCollider {
    glm::vec2 size{0.f};
    glm::vec2 offset{0.f};
    glm::vec2 origin{0.f};

    // Normalized (min, max) corners
    std::pair<glm::vec2, glm::vec2> aabb(const glm::vec2& position) const {
        glm::vec2 a = position - origin + offset;
        glm::vec2 b = a + size;
        return {glm::min(a, b), glm::max(a, b)};
    }

    Rect rect(const glm::vec2& position) const {
        auto [min, max] = aabb(position);
        return Rect{min.x, min.y, max.x - min.x, max.y - min.y};
    }

    // Edge contact is not an overlap
    bool overlaps(const glm::vec2& position, const BoxCollider& other, const glm::vec2& other_position) const {
        auto [a_min, a_max] = aabb(position);
        auto [b_min, b_max] = other.aabb(other_position);
        return a_min.x < b_max.x && a_max.x > b_min.x &&
               a_min.y < b_max.y && a_max.y > b_min.y;
    }

    bool contains_point(const glm::vec2& position, const glm::vec2& point) const {
        auto [min, max] = aabb(position);
        return point.x >= min.x && point.x <= max.x && point.y >= min.y && point.y <= max.y;
    }
};

struct AccelerationForce {
    glm::vec2 value{0.f};
    bool enabled = true;
};

struct RigidBody {
    glm::vec2 velocity{0.f};
    std::unordered_map<std::string, AccelerationForce> forces;
    float friction = 0.f;
    std::optional<float> max_speed;
    bool frozen = false;

    // Same name overwrites both the vector and the enabled state
    void add_force(const std::string& name, const glm::vec2& value, bool enabled = true) {
        forces[name] = AccelerationForce{value, enabled};
    }

    bool remove_force(const std::string& name) {
        return forces.erase(name) > 0;
    }

    bool set_force_enabled(const std::string& name, bool enabled) {
        auto it = forces.find(name);
        if (it == forces.end())
            return false;
        it->second.enabled = enabled;
        return true;
    }

    bool set_force_value(const std::string& name, const glm::vec2& value) {
        auto it = forces.find(name);
        if (it == forces.end())
            return false;
        it->second.value = value;
        return true;
    }

    glm::vec2 total_acceleration() const {
        glm::vec2 total(0.f);
        for (const auto& [name, force] : forces)
            if (force.enabled)
                total += force.value;
        return total;
    }

    // No-op on a zero velocity, there is no direction to keep
    bool set_speed(float speed) {
        float current = glm::length(velocity);
        if (current <= 0.f)
            return false;
        velocity = velocity / current * speed;
        return true;
    }
};

struct Ttl {
    float remaining = 0.f;
};

struct Timer {
    float duration = 0.f;
    float elapsed = 0.f;
    std::string signal;
};

struct LuaTimer {
    float duration = 0.f;
    float elapsed = 0.f;
    std::string callback;
};

struct StuckTo {
    flecs::entity_t target = 0;
    glm::vec2 offset{0.f};
    bool follow_x = true;
    bool follow_y = true;
    std::optional<glm::vec2> stored_velocity;
};

struct MouseControlled {
    bool follow_x = true;
    bool follow_y = true;
};

struct SignalBinding {
    std::string key;
    std::optional<std::string> format;
    // 0 reads WorldSignals
    flecs::entity_t source = 0;

    std::string apply(const std::string& value) const {
        if (!format)
            return value;
        std::string out = *format;
        size_t at = 0;
        while ((at = out.find("{}", at)) != std::string::npos) {
            out.replace(at, 2, value);
            at += value.size();
        }
        return out;
    }
};

struct GridLayout {
    std::string path;
    std::string group;
    float z_index = 0.f;
    bool spawned = false;
};

using UniformValue = std::variant<float, int, glm::vec2, glm::vec4>;

struct EntityShader {
    std::string key;
    std::unordered_map<std::string, UniformValue> uniforms;
};

enum class EmitterShapeKind {
    Point,
    Rect
};

struct EmitterShape {
    EmitterShapeKind kind = EmitterShapeKind::Point;
    float width = 0.f;
    float height = 0.f;
};

struct TtlSpec {
    enum class Kind {
        None,
        Fixed,
        Range
    } kind = Kind::None;
    float min = 0.f;
    float max = 0.f;
};

struct ParticleEmitter {
    std::vector<flecs::entity_t> templates;
    EmitterShape shape;
    glm::vec2 offset{0.f};
    uint32_t particles_per_emission = 1;
    float emissions_per_second = 10.f;
    uint32_t emissions_remaining = 100;
    // Degrees, 0 points up and positive turns clockwise
    glm::vec2 arc{0.f, 360.f};
    glm::vec2 speed{50.f, 100.f};
    TtlSpec ttl;
    float time_since_emit = 0.f;
};

// Null handle when `id` is 0 or was freed
inline flecs::entity live_entity(flecs::world& world, flecs::entity_t id) {
    if (id == 0 || !world.is_alive(id))
        return flecs::entity();
    return world.entity(id);
}

// Mutable pointer to a component the entity already has, get_mut alone
// would add it
template<typename T>
T* existing(flecs::entity e) {
    return e.has<T>() ? e.get_mut<T>() : nullptr;
}
