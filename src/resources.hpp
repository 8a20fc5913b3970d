//
//  resources.hpp
//  aberred
//
//  Created by the aberred authors on 06/10/2025.
//

#pragma once

#include "glm/vec2.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <set>

// World singletons. Each is set on the flecs world and read with
// world.get<T>() / world.get_mut<T>().

struct WorldTime {
    float elapsed = 0.f;
    // Already multiplied by time_scale
    float delta = 0.f;
    float time_scale = 1.f;
    uint64_t frame_count = 0;

    void advance(float real_delta) {
        delta = real_delta * time_scale;
        elapsed += delta;
        frame_count++;
    }
};

class TrackedGroups {
    // Ordered so counts are published deterministically
    std::set<std::string> _groups;

public:
    void add(const std::string& group) { _groups.insert(group); }
    bool remove(const std::string& group) { return _groups.erase(group) > 0; }
    bool has(const std::string& group) const { return _groups.find(group) != _groups.end(); }
    void clear() { _groups.clear(); }
    bool empty() const { return _groups.empty(); }
    const std::set<std::string>& groups() const { return _groups; }
};

#define GAME_STATES     \
    X(None, "none")     \
    X(Setup, "setup")   \
    X(Playing, "playing") \
    X(Paused, "paused") \
    X(Quitting, "quitting")

enum class GameStates {
#define X(NAME, STR) NAME,
    GAME_STATES
#undef X
};

inline const char* game_state_name(GameStates state) {
    switch (state) {
#define X(NAME, STR) case GameStates::NAME: return STR;
        GAME_STATES
#undef X
    }
    return "none";
}

struct GameState {
    GameStates current = GameStates::None;
};

struct NextGameState {
    std::optional<GameStates> pending;

    void set(GameStates state) { pending = state; }
    void reset() { pending.reset(); }
};

struct StateChanged {
    GameStates from = GameStates::None;
    GameStates to = GameStates::None;
};

// Named host routines that scripts, menus and state hooks invoke indirectly
class SystemsStore {
    std::unordered_map<std::string, std::function<void()>> _systems;

public:
    void insert(const std::string& name, std::function<void()> system) {
        _systems[name] = std::move(system);
    }

    bool has(const std::string& name) const {
        return _systems.find(name) != _systems.end();
    }

    // Returns false when nothing is registered under `name`
    bool run(const std::string& name) const {
        auto it = _systems.find(name);
        if (it == _systems.end() || !it->second)
            return false;
        it->second();
        return true;
    }
};

struct Camera2D {
    glm::vec2 target{0.f};
    glm::vec2 offset{0.f};
    float rotation = 0.f;
    float zoom = 1.f;
};

struct ScreenSize {
    int width = 640;
    int height = 360;
};

struct WindowSize {
    int width = 1280;
    int height = 720;
};

// Mouse position in render-target pixels, written by the application shell
struct MouseWorldPosition {
    glm::vec2 screen{0.f};
    glm::vec2 world{0.f};
};

struct TilePosition {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t id = 0;
};

struct TileLayer {
    std::string name;
    std::vector<TilePosition> positions;
};

struct Tilemap {
    uint32_t tile_size = 16;
    uint32_t map_width = 0;
    uint32_t map_height = 0;
    std::vector<TileLayer> layers;
    std::string tex_key;
};

struct TilemapStore {
    std::unordered_map<std::string, Tilemap> maps;
};

// Loaded asset keys, kept so the core can answer "is this loaded". Textures
// keep their pixel size, tilemaps need it to find the atlas columns.
struct AssetRegistry {
    std::unordered_map<std::string, glm::vec2> textures;
    std::unordered_set<std::string> fonts;
    std::unordered_set<std::string> music;
    std::unordered_set<std::string> sounds;
};
