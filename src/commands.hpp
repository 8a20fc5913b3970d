//
//  commands.hpp
//  aberred
//
//  Created by the aberred authors on 11/10/2025.
//

#pragma once

#include "components.hpp"
#include "tween.hpp"
#include "animation.hpp"
#include "phase.hpp"
#include "collision.hpp"
#include "menu.hpp"
#include <string>
#include <vector>
#include <variant>
#include <optional>

// Records queued by scripts and applied by the host between systems. Entity
// ids are raw flecs ids, a record naming a dead entity does nothing.

namespace cmd {
    struct LoadTexture { std::string id, path; };
    struct LoadFont { std::string id, path; float size; };
    struct LoadMusic { std::string id, path; };
    struct LoadSound { std::string id, path; };
    struct LoadTilemap { std::string id, path; };

    struct PlayMusic { std::string id; bool looped; };
    struct PlaySound { std::string id; };
    struct StopAllMusic {};
    struct StopAllSounds {};

    struct SetScalar { std::string key; float value; };
    struct SetInteger { std::string key; int value; };
    struct SetString { std::string key, value; };
    struct SetFlag { std::string key; };
    struct ClearFlag { std::string key; };
    struct ClearScalar { std::string key; };
    struct ClearInteger { std::string key; };
    struct ClearString { std::string key; };
    struct SetEntity { std::string key; flecs::entity_t entity; };
    struct RemoveEntity { std::string key; };

    struct PhaseTransition { flecs::entity_t entity; std::string phase; };

    struct Despawn { flecs::entity_t entity; };
    struct SetPosition { flecs::entity_t entity; glm::vec2 pos; };
    struct SetVelocity { flecs::entity_t entity; glm::vec2 velocity; };
    struct SetRotation { flecs::entity_t entity; float degrees; };
    struct SetScale { flecs::entity_t entity; glm::vec2 scale; };
    struct SetSpeed { flecs::entity_t entity; float speed; };
    struct SetFriction { flecs::entity_t entity; float friction; };
    struct SetMaxSpeed { flecs::entity_t entity; std::optional<float> max_speed; };
    struct AddForce { flecs::entity_t entity; std::string name; glm::vec2 value; bool enabled; };
    struct RemoveForce { flecs::entity_t entity; std::string name; };
    struct SetForceEnabled { flecs::entity_t entity; std::string name; bool enabled; };
    struct SetForceValue { flecs::entity_t entity; std::string name; glm::vec2 value; };
    struct Freeze { flecs::entity_t entity; };
    struct Unfreeze { flecs::entity_t entity; };
    struct InsertStuckTo { flecs::entity_t entity; StuckTo stuck; };
    struct ReleaseStuckTo { flecs::entity_t entity; };
    struct InsertTtl { flecs::entity_t entity; float seconds; };
    struct InsertTimer { flecs::entity_t entity; float duration; std::string signal; };
    struct RemoveTimer { flecs::entity_t entity; };
    struct InsertLuaTimer { flecs::entity_t entity; float duration; std::string callback; };
    struct RemoveLuaTimer { flecs::entity_t entity; };
    struct InsertTweenPosition { flecs::entity_t entity; TweenPosition tween; };
    struct InsertTweenRotation { flecs::entity_t entity; TweenRotation tween; };
    struct InsertTweenScale { flecs::entity_t entity; TweenScale tween; };
    struct RemoveTweenPosition { flecs::entity_t entity; };
    struct RemoveTweenRotation { flecs::entity_t entity; };
    struct RemoveTweenScale { flecs::entity_t entity; };
    struct RestartAnimation { flecs::entity_t entity; };
    struct SetAnimation { flecs::entity_t entity; std::string key; };
    struct SignalSetScalar { flecs::entity_t entity; std::string key; float value; };
    struct SignalSetInteger { flecs::entity_t entity; std::string key; int value; };
    struct SignalSetString { flecs::entity_t entity; std::string key, value; };
    struct SignalSetFlag { flecs::entity_t entity; std::string key; };
    struct SignalClearFlag { flecs::entity_t entity; std::string key; };
    struct SignalClearScalar { flecs::entity_t entity; std::string key; };
    struct SignalClearInteger { flecs::entity_t entity; std::string key; };
    struct SignalClearString { flecs::entity_t entity; std::string key; };
    struct SetShader { flecs::entity_t entity; std::string key; };
    struct RemoveShader { flecs::entity_t entity; };
    struct SetShaderUniform { flecs::entity_t entity; std::string name; UniformValue value; };
    struct SetParent { flecs::entity_t entity; flecs::entity_t parent; };

    struct TrackGroup { std::string name; };
    struct UntrackGroup { std::string name; };
    struct ClearTrackedGroups {};

    struct SpawnTiles { std::string id; };

    struct SetCamera { glm::vec2 target, offset; float rotation, zoom; };

    struct RegisterAnimation { std::string id; AnimationResource animation; };
}

using AssetCmd = std::variant<cmd::LoadTexture, cmd::LoadFont, cmd::LoadMusic, cmd::LoadSound, cmd::LoadTilemap>;

using AudioLuaCmd = std::variant<cmd::PlayMusic, cmd::PlaySound, cmd::StopAllMusic, cmd::StopAllSounds>;

using SignalCmd = std::variant<cmd::SetScalar, cmd::SetInteger, cmd::SetString, cmd::SetFlag, cmd::ClearFlag,
                               cmd::ClearScalar, cmd::ClearInteger, cmd::ClearString, cmd::SetEntity,
                               cmd::RemoveEntity>;

using PhaseCmd = std::variant<cmd::PhaseTransition>;

using EntityCmd = std::variant<cmd::Despawn, cmd::SetPosition, cmd::SetVelocity, cmd::SetRotation, cmd::SetScale,
                               cmd::SetSpeed, cmd::SetFriction, cmd::SetMaxSpeed, cmd::AddForce, cmd::RemoveForce,
                               cmd::SetForceEnabled, cmd::SetForceValue, cmd::Freeze, cmd::Unfreeze,
                               cmd::InsertStuckTo, cmd::ReleaseStuckTo, cmd::InsertTtl, cmd::InsertTimer,
                               cmd::RemoveTimer, cmd::InsertLuaTimer, cmd::RemoveLuaTimer,
                               cmd::InsertTweenPosition, cmd::InsertTweenRotation, cmd::InsertTweenScale,
                               cmd::RemoveTweenPosition, cmd::RemoveTweenRotation, cmd::RemoveTweenScale,
                               cmd::RestartAnimation, cmd::SetAnimation, cmd::SignalSetScalar,
                               cmd::SignalSetInteger, cmd::SignalSetString, cmd::SignalSetFlag,
                               cmd::SignalClearFlag, cmd::SignalClearScalar, cmd::SignalClearInteger,
                               cmd::SignalClearString, cmd::SetShader, cmd::RemoveShader, cmd::SetShaderUniform,
                               cmd::SetParent>;

using GroupCmd = std::variant<cmd::TrackGroup, cmd::UntrackGroup, cmd::ClearTrackedGroups>;

using TilemapCmd = std::variant<cmd::SpawnTiles>;

using CameraCmd = std::variant<cmd::SetCamera>;

using AnimationCmd = std::variant<cmd::RegisterAnimation>;

struct MenuSpawn {
    Menu menu;
    MenuActions actions;
    // WorldSignals entity key of the cursor sprite
    std::optional<std::string> cursor_key;
};

struct EmitterSpawn {
    ParticleEmitter emitter;
    // WorldSignals entity keys, resolved when the record is applied
    std::vector<std::string> template_keys;
};

// Full component set of one entity, only the fields that were set are inserted
struct SpawnCmd {
    std::optional<std::string> clone_source;
    std::optional<std::string> register_as;

    std::optional<std::string> group;
    std::optional<glm::vec2> position;
    std::optional<glm::vec2> screen_position;
    std::optional<float> zindex;
    std::optional<float> rotation;
    std::optional<glm::vec2> scale;
    bool persistent = false;
    std::optional<flecs::entity_t> parent;

    std::optional<Sprite> sprite;
    std::optional<DynamicText> text;
    std::optional<Tint> tint;
    std::optional<RigidBody> rigidbody;
    std::optional<BoxCollider> collider;
    std::optional<MouseControlled> mouse_controlled;

    bool has_signals = false;
    std::vector<std::pair<std::string, float>> signal_scalars;
    std::vector<std::pair<std::string, int>> signal_integers;
    std::vector<std::pair<std::string, std::string>> signal_strings;
    std::vector<std::string> signal_flags;

    std::optional<Phase> phase;
    std::optional<StuckTo> stuckto;
    std::optional<Timer> timer;
    std::optional<LuaTimer> lua_timer;
    std::optional<Ttl> ttl;
    std::optional<SignalBinding> signal_binding;
    std::optional<GridLayout> grid_layout;
    std::optional<TweenPosition> tween_position;
    std::optional<TweenRotation> tween_rotation;
    std::optional<TweenScale> tween_scale;
    std::optional<CollisionRule> collision_rule;
    std::optional<Animation> animation;
    std::optional<AnimationController> animation_controller;
    std::optional<MenuSpawn> menu;
    std::optional<EmitterSpawn> particle_emitter;
    std::optional<EntityShader> shader;
};

// One FIFO per record kind
template<typename T>
class CommandQueue {
    std::vector<T> _items;

public:
    void push(T item) {
        _items.push_back(std::move(item));
    }

    std::vector<T> drain() {
        std::vector<T> items;
        items.swap(_items);
        return items;
    }

    bool empty() const { return _items.empty(); }
    size_t size() const { return _items.size(); }
    void clear() { _items.clear(); }
};

struct CommandQueues {
    CommandQueue<AssetCmd> asset;
    CommandQueue<SpawnCmd> spawn;
    CommandQueue<AudioLuaCmd> audio;
    CommandQueue<SignalCmd> signal;
    CommandQueue<PhaseCmd> phase;
    CommandQueue<EntityCmd> entity;
    CommandQueue<GroupCmd> group;
    CommandQueue<TilemapCmd> tilemap;
    CommandQueue<CameraCmd> camera;
    CommandQueue<AnimationCmd> animation;

    void clear() {
        asset.clear();
        spawn.clear();
        audio.clear();
        signal.clear();
        phase.clear();
        entity.clear();
        group.clear();
        tilemap.clear();
        camera.clear();
        animation.clear();
    }
};

// Drained after every collision callback
struct CollisionQueues {
    CommandQueue<EntityCmd> entity;
    CommandQueue<SignalCmd> signal;
    CommandQueue<AudioLuaCmd> audio;
    CommandQueue<SpawnCmd> spawn;
    CommandQueue<PhaseCmd> phase;
    CommandQueue<CameraCmd> camera;

    void clear() {
        entity.clear();
        signal.clear();
        audio.clear();
        spawn.clear();
        phase.clear();
        camera.clear();
    }
};

template<class... Ts> struct overloaded: Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
