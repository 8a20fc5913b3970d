//
//  systems.cpp
//  aberred
//
//  Created by the aberred authors on 15/10/2025.
//

#include "systems.hpp"
#include "signals.hpp"
#include "layout.hpp"
#include "log.hpp"
#include "glm/trigonometric.hpp"
#include <cmath>
#include <functional>
#include <limits>
#include <optional>
#include <unordered_map>

static glm::vec2 rotate(const glm::vec2& v, float degrees) {
    float rad = glm::radians(degrees);
    float s = std::sin(rad), c = std::cos(rad);
    return glm::vec2(v.x * c - v.y * s, v.x * s + v.y * c);
}

Systems::Systems(flecs::world& world, AssetLoader& assets, uint32_t seed)
    : _world(world), _assets(assets), _rng(seed) {
    _tween_position = world.system<TweenPosition, MapPosition>("TweenPosition")
        .kind(0)
        .each([](flecs::iter& it, size_t, TweenPosition& tween, MapPosition& position) {
            if (tween.playing)
                position.pos = tween.step(it.delta_time());
        });

    _tween_rotation = world.system<TweenRotation, Rotation>("TweenRotation")
        .kind(0)
        .each([](flecs::iter& it, size_t, TweenRotation& tween, Rotation& rotation) {
            if (tween.playing)
                rotation.degrees = tween.step(it.delta_time());
        });

    _tween_scale = world.system<TweenScale, Scale>("TweenScale")
        .kind(0)
        .each([](flecs::iter& it, size_t, TweenScale& tween, Scale& scale) {
            if (tween.playing)
                scale.scale = tween.step(it.delta_time());
        });

    _timers = world.system<Timer>("Timers")
        .kind(0)
        .each([this](flecs::iter& it, size_t i, Timer& timer) {
            timer.elapsed += it.delta_time();
            if (timer.elapsed >= timer.duration) {
                timer.elapsed = 0.f;
                _fired.emplace_back(it.entity(i).id(), timer.signal);
            }
        });

    world.observer<Timer>("TimerSignal")
        .event<TimerFired>()
        .each([](flecs::iter& it, size_t i, Timer&) {
            const TimerFired *fired = it.param<TimerFired>();
            if (!fired)
                return;
            flecs::entity e = it.entity(i);
            Signals signals = e.has<Signals>() ? *e.get<Signals>() : Signals();
            signals.set_flag(fired->signal);
            e.set<Signals>(signals);
        });

    _ttl = world.system<Ttl>("Ttl")
        .kind(0)
        .each([](flecs::iter& it, size_t i, Ttl& ttl) {
            ttl.remaining -= it.delta_time();
            if (ttl.remaining <= 0.f)
                it.entity(i).destruct();
        });

    _physics = world.system<MapPosition, RigidBody, Signals*>("Physics")
        .kind(0)
        .without<StuckTo>()
        .each([](flecs::iter& it, size_t, MapPosition& position, RigidBody& body, Signals *signals) {
            if (body.frozen) {
                if (signals) {
                    signals->clear_flag("moving");
                    signals->set_scalar("speed_sq", 0.f);
                }
                return;
            }
            float dt = it.delta_time();
            body.velocity += body.total_acceleration() * dt;
            if (body.friction > 0.f) {
                body.velocity *= std::max(0.f, 1.f - body.friction * dt);
                if (glm::length(body.velocity) < VELOCITY_EPSILON)
                    body.velocity = glm::vec2(0.f);
            }
            if (body.max_speed) {
                float speed = glm::length(body.velocity);
                if (speed > *body.max_speed)
                    body.velocity = body.velocity / speed * *body.max_speed;
            }
            position.pos += body.velocity * dt;
            if (signals) {
                float speed_sq = glm::dot(body.velocity, body.velocity);
                if (speed_sq > MOVING_EPSILON)
                    signals->set_flag("moving");
                else
                    signals->clear_flag("moving");
                signals->set_scalar("speed_sq", speed_sq);
            }
        });

    _stuckto = world.system<const StuckTo, MapPosition>("StuckTo")
        .kind(0)
        .each([this](const StuckTo& stuck, MapPosition& position) {
            flecs::entity target = live_entity(_world, stuck.target);
            if (!target || target.has<StuckTo>())
                return;
            const MapPosition *target_position = target.get<MapPosition>();
            if (!target_position)
                return;
            if (stuck.follow_x)
                position.pos.x = target_position->pos.x + stuck.offset.x;
            if (stuck.follow_y)
                position.pos.y = target_position->pos.y + stuck.offset.y;
        });

    _mouse = world.system<MapPosition, const MouseControlled>("MouseControlled")
        .kind(0)
        .each([this](MapPosition& position, const MouseControlled& mouse) {
            const MouseWorldPosition *cursor = _world.get<MouseWorldPosition>();
            if (!cursor)
                return;
            if (mouse.follow_x)
                position.pos.x = cursor->world.x;
            if (mouse.follow_y)
                position.pos.y = cursor->world.y;
        });

    _signal_bindings = world.system<DynamicText, const SignalBinding>("SignalBinding")
        .kind(0)
        .each([this](DynamicText& text, const SignalBinding& binding) {
            const Signals *source = nullptr;
            if (binding.source == 0)
                source = _world.get<WorldSignals>();
            else if (flecs::entity e = live_entity(_world, binding.source))
                source = e.get<Signals>();
            if (!source)
                return;
            if (auto value = source->to_display_string(binding.key))
                text.set_text(binding.apply(*value));
        });

    _animation_controllers = world.system<AnimationController, Animation, const Signals*>("AnimationController")
        .kind(0)
        .each([](AnimationController& controller, Animation& animation, const Signals *signals) {
            static const Signals empty;
            const std::string& key = controller.select(signals ? *signals : empty);
            controller.current_key = key;
            if (key == animation.key)
                return;
            animation.key = key;
            animation.frame_index = 0;
            animation.elapsed = 0.f;
        });

    _animations = world.system<Animation, Sprite, Signals*>("Animation")
        .kind(0)
        .each([this](flecs::iter& it, size_t, Animation& animation, Sprite& sprite, Signals *signals) {
            const AnimationStore *store = _world.get<AnimationStore>();
            if (!store)
                return;
            auto found = store->animations.find(animation.key);
            if (found == store->animations.end())
                return;
            const AnimationResource& resource = found->second;
            if (resource.fps > 0.f && resource.frame_count > 0) {
                float frame_time = 1.f / resource.fps;
                animation.elapsed += it.delta_time();
                while (animation.elapsed >= frame_time) {
                    animation.elapsed -= frame_time;
                    if (animation.frame_index + 1 < resource.frame_count)
                        animation.frame_index++;
                    else if (resource.looped)
                        animation.frame_index = 0;
                    else {
                        animation.frame_index = resource.frame_count - 1;
                        animation.elapsed = 0.f;
                        if (signals)
                            signals->set_flag("animation_ended");
                        break;
                    }
                }
            }
            sprite.tex_key = resource.tex_key;
            sprite.offset = glm::vec2(resource.position.x + animation.frame_index * resource.displacement,
                                      resource.position.y);
        });

    _dynamic_text = world.system<DynamicText>("DynamicTextSize")
        .kind(0)
        .each([this](DynamicText& text) {
            if (!text.dirty())
                return;
            text.size = _assets.measure_text(text.font(), text.font_size(), text.content());
            text.mark_measured();
        });

    _transform_roots = world.query_builder<const MapPosition, const Rotation*, const Scale*>()
        .without(flecs::ChildOf, flecs::Wildcard)
        .build();
    _emitters = world.query<ParticleEmitter, const MapPosition>();
    _groups = world.query<const Group>();
    _grid_layouts = world.query<const GridLayout>();
}

float Systems::random(float min, float max) {
    if (max - min < std::numeric_limits<float>::epsilon())
        return min;
    std::uniform_real_distribution<float> dist(min, max);
    return dist(_rng);
}

void Systems::tweens(float dt) {
    _tween_position.run(dt);
    _tween_rotation.run(dt);
    _tween_scale.run(dt);
}

void Systems::timers(float dt) {
    _fired.clear();
    _timers.run(dt);
    for (const auto& [id, signal] : _fired) {
        flecs::entity e = live_entity(_world, id);
        if (!e)
            continue;
        TimerFired fired{signal};
        _world.event<TimerFired>()
            .id<Timer>()
            .entity(e)
            .ctx(&fired)
            .emit();
    }
    _fired.clear();
}

void Systems::ttl(float dt) {
    _ttl.run(dt);
}

void Systems::physics(float dt) {
    _physics.run(dt);
}

void Systems::stuckto() {
    _stuckto.run();
}

void Systems::mouse() {
    _mouse.run();
}

void Systems::transforms() {
    std::vector<std::pair<flecs::entity, GlobalTransform2D>> updates;
    std::function<void(flecs::entity, const GlobalTransform2D&)> walk;
    walk = [&](flecs::entity parent, const GlobalTransform2D& parent_transform) {
        parent.children([&](flecs::entity child) {
            const MapPosition *local = child.get<MapPosition>();
            if (!local)
                return;
            const Rotation *rotation = child.get<Rotation>();
            const Scale *scale = child.get<Scale>();
            glm::vec2 offset = rotate(local->pos * parent_transform.scale, parent_transform.rotation_degrees);
            GlobalTransform2D transform;
            transform.position = parent_transform.position + offset;
            transform.rotation_degrees = parent_transform.rotation_degrees + (rotation ? rotation->degrees : 0.f);
            transform.scale = parent_transform.scale * (scale ? scale->scale : glm::vec2(1.f));
            updates.emplace_back(child, transform);
            walk(child, transform);
        });
    };

    _transform_roots.each([&](flecs::entity e, const MapPosition& position, const Rotation *rotation, const Scale *scale) {
        bool has_children = false;
        e.children([&](flecs::entity) { has_children = true; });
        if (!has_children)
            return;
        GlobalTransform2D transform;
        transform.position = position.pos;
        transform.rotation_degrees = rotation ? rotation->degrees : 0.f;
        transform.scale = scale ? scale->scale : glm::vec2(1.f);
        updates.emplace_back(e, transform);
        walk(e, transform);
    });

    for (const auto& [e, transform] : updates)
        e.set<GlobalTransform2D>(transform);
}

void Systems::particles(float dt) {
    if (dt <= 0.f)
        return;
    struct Particle {
        flecs::entity_t source;
        glm::vec2 position;
        float angle;
        float speed;
        std::optional<float> ttl;
    };
    std::vector<Particle> particles;

    _emitters.each([&](ParticleEmitter& emitter, const MapPosition& owner) {
        if (emitter.templates.empty() || emitter.emissions_remaining == 0 || emitter.emissions_per_second <= 0.f)
            return;
        float period = 1.f / emitter.emissions_per_second;
        emitter.time_since_emit += dt;
        glm::vec2 base = owner.pos + emitter.offset;
        std::uniform_int_distribution<size_t> pick(0, emitter.templates.size() - 1);
        while (emitter.time_since_emit >= period && emitter.emissions_remaining > 0) {
            for (uint32_t n = 0; n < emitter.particles_per_emission; n++) {
                Particle particle;
                particle.source = emitter.templates[pick(_rng)];
                particle.position = base;
                if (emitter.shape.kind == EmitterShapeKind::Rect) {
                    particle.position.x += random(-emitter.shape.width * .5f, emitter.shape.width * .5f);
                    particle.position.y += random(-emitter.shape.height * .5f, emitter.shape.height * .5f);
                }
                particle.angle = random(emitter.arc.x, emitter.arc.y);
                particle.speed = random(emitter.speed.x, emitter.speed.y);
                switch (emitter.ttl.kind) {
                    case TtlSpec::Kind::Fixed:
                        particle.ttl = emitter.ttl.min;
                        break;
                    case TtlSpec::Kind::Range:
                        particle.ttl = random(emitter.ttl.min, emitter.ttl.max);
                        break;
                    case TtlSpec::Kind::None:
                        break;
                }
                particles.push_back(particle);
            }
            emitter.time_since_emit -= period;
            emitter.emissions_remaining--;
        }
    });

    for (const auto& particle : particles) {
        flecs::entity source = live_entity(_world, particle.source);
        if (!source)
            continue;
        flecs::entity e = source.clone(true);
        RigidBody body = source.has<RigidBody>() ? *source.get<RigidBody>() : RigidBody();
        float theta = glm::radians(particle.angle);
        body.velocity = glm::vec2(std::sin(theta), -std::cos(theta)) * particle.speed;
        e.add<Spawned>()
            .set<MapPosition>({particle.position})
            .set<Rotation>({particle.angle})
            .set<RigidBody>(body);
        if (particle.ttl)
            e.set<Ttl>({*particle.ttl});
    }
}

void Systems::grid_layouts() {
    std::vector<flecs::entity> pending;
    _grid_layouts.each([&](flecs::entity e, const GridLayout& layout) {
        if (!layout.spawned)
            pending.push_back(e);
    });
    for (flecs::entity e : pending) {
        GridLayout layout = *e.get<GridLayout>();
        expand_grid_layout(_world, layout);
        e.set<GridLayout>(layout);
    }
}

void Systems::signal_bindings() {
    _signal_bindings.run();
}

void Systems::group_counts() {
    const TrackedGroups *tracked = _world.get<TrackedGroups>();
    if (!tracked)
        return;
    WorldSignals *signals = _world.get_mut<WorldSignals>();
    std::unordered_map<std::string, int> counts;
    if (!tracked->empty())
        _groups.each([&](const Group& group) {
            if (tracked->has(group.name))
                counts[group.name]++;
        });
    signals->clear_group_counts();
    // Every tracked group is published, including empty ones
    for (const auto& name : tracked->groups()) {
        auto it = counts.find(name);
        signals->set_group_count(name, it == counts.end() ? 0 : it->second);
    }
}

void Systems::animation_controllers() {
    _animation_controllers.run();
}

void Systems::animations(float dt) {
    _animations.run(dt);
}

void Systems::dynamic_text_sizes() {
    _dynamic_text.run();
}
