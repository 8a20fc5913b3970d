//
//  systems.hpp
//  aberred
//
//  Created by the aberred authors on 15/10/2025.
//

#pragma once

#include "flecs.h"
#include "components.hpp"
#include "tween.hpp"
#include "animation.hpp"
#include "resources.hpp"
#include "assets.hpp"
#include <random>
#include <vector>
#include <string>
#include <utility>

// Emitted on the entity whose Timer elapsed
struct TimerFired {
    std::string signal;
};

// Speed squared below this counts as standing still
#define MOVING_EPSILON 1e-4f
// Friction snaps anything slower than this to rest
#define VELOCITY_EPSILON .01f

// The pure world systems. None of them touch the script runtime, the game
// loop runs them in its fixed order and interleaves the scripted ones.
class Systems {
    flecs::world& _world;
    AssetLoader& _assets;
    std::mt19937 _rng;

    flecs::system _tween_position, _tween_rotation, _tween_scale;
    flecs::system _timers, _ttl, _physics, _stuckto, _mouse;
    flecs::system _signal_bindings, _animation_controllers, _animations, _dynamic_text;

    flecs::query<const MapPosition, const Rotation*, const Scale*> _transform_roots;
    flecs::query<ParticleEmitter, const MapPosition> _emitters;
    flecs::query<const Group> _groups;
    flecs::query<const GridLayout> _grid_layouts;

    std::vector<std::pair<flecs::entity_t, std::string>> _fired;

    float random(float min, float max);

public:
    Systems(flecs::world& world, AssetLoader& assets, uint32_t seed = std::random_device{}());
    Systems(const Systems&) = delete;
    Systems& operator=(const Systems&) = delete;

    void tweens(float dt);
    void timers(float dt);
    void ttl(float dt);
    void physics(float dt);
    void stuckto();
    void mouse();
    void transforms();
    void particles(float dt);
    void grid_layouts();
    void signal_bindings();
    void group_counts();
    void animation_controllers();
    void animations(float dt);
    void dynamic_text_sizes();
};
