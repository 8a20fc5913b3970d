//
//  command_processor.cpp
//  aberred
//
//  Created by the aberred authors on 14/10/2025.
//

#include "command_processor.hpp"
#include "resources.hpp"
#include "layout.hpp"
#include "log.hpp"
#include <functional>

void CommandProcessor::send_audio(AudioCmd command) {
    if (!_audio) {
        $Log.debug("[Audio] no worker, dropping command");
        return;
    }
    if (!_audio->send(std::move(command)))
        $Log.warn("[Audio] worker is closed, dropping command");
}

void CommandProcessor::apply(const AssetCmd& command) {
    std::visit(overloaded {
        [&](const cmd::LoadTexture& c) {
            int width = 0, height = 0;
            std::string error;
            if (!_assets.load_texture(c.id, c.path, width, height, error)) {
                $Log.error("Failed to load texture '{}' from {}: {}", c.id, c.path, error);
                return;
            }
            _world.get_mut<AssetRegistry>()->textures[c.id] = glm::vec2(width, height);
            $Log.info("Loaded texture '{}' ({}x{})", c.id, width, height);
        },
        [&](const cmd::LoadFont& c) {
            std::string error;
            if (!_assets.load_font(c.id, c.path, c.size, error)) {
                $Log.error("Failed to load font '{}' from {}: {}", c.id, c.path, error);
                return;
            }
            _world.get_mut<AssetRegistry>()->fonts.insert(c.id);
            $Log.info("Loaded font '{}' size {}", c.id, c.size);
        },
        [&](const cmd::LoadMusic& c) {
            send_audio(audio_cmd::LoadMusic{c.id, c.path});
        },
        [&](const cmd::LoadSound& c) {
            send_audio(audio_cmd::LoadFx{c.id, c.path});
        },
        [&](const cmd::LoadTilemap& c) {
            std::string error;
            auto tilemap = load_tilemap_file(c.path, error);
            if (!tilemap) {
                $Log.error("Failed to load tilemap '{}' from {}: {}", c.id, c.path, error);
                return;
            }
            int width = 0, height = 0;
            std::string atlas = tilemap_atlas_path(c.path);
            if (!_assets.load_texture(c.id, atlas, width, height, error)) {
                $Log.error("Failed to load tilemap atlas '{}' from {}: {}", c.id, atlas, error);
                return;
            }
            tilemap->tex_key = c.id;
            _world.get_mut<AssetRegistry>()->textures[c.id] = glm::vec2(width, height);
            _world.get_mut<TilemapStore>()->maps[c.id] = std::move(*tilemap);
            $Log.info("Loaded tilemap '{}' from {}", c.id, c.path);
        }
    }, command);
}

void CommandProcessor::apply(const AudioLuaCmd& command) {
    std::visit(overloaded {
        [&](const cmd::PlayMusic& c) { send_audio(audio_cmd::PlayMusic{c.id, c.looped}); },
        [&](const cmd::PlaySound& c) { send_audio(audio_cmd::PlayFx{c.id}); },
        [&](const cmd::StopAllMusic&) { send_audio(audio_cmd::StopAllMusic{}); },
        [&](const cmd::StopAllSounds&) { send_audio(audio_cmd::UnloadAllFx{}); }
    }, command);
}

void CommandProcessor::apply(const SignalCmd& command) {
    WorldSignals *signals = _world.get_mut<WorldSignals>();
    std::visit(overloaded {
        [&](const cmd::SetScalar& c) { signals->set_scalar(c.key, c.value); },
        [&](const cmd::SetInteger& c) { signals->set_integer(c.key, c.value); },
        [&](const cmd::SetString& c) { signals->set_string(c.key, c.value); },
        [&](const cmd::SetFlag& c) { signals->set_flag(c.key); },
        [&](const cmd::ClearFlag& c) { signals->clear_flag(c.key); },
        [&](const cmd::ClearScalar& c) { signals->clear_scalar(c.key); },
        [&](const cmd::ClearInteger& c) { signals->clear_integer(c.key); },
        [&](const cmd::ClearString& c) { signals->clear_string(c.key); },
        [&](const cmd::SetEntity& c) { signals->set_entity(c.key, c.entity); },
        [&](const cmd::RemoveEntity& c) { signals->remove_entity(c.key); }
    }, command);
}

void CommandProcessor::apply(const PhaseCmd& command) {
    std::visit(overloaded {
        [&](const cmd::PhaseTransition& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            if (Phase *phase = existing<Phase>(e))
                phase->transition_to(c.phase);
        }
    }, command);
}

static void set_entity_signals(flecs::entity e, const std::function<void(Signals&)>& fn) {
    Signals signals = e.has<Signals>() ? *e.get<Signals>() : Signals();
    fn(signals);
    e.set<Signals>(signals);
}

void CommandProcessor::apply(const EntityCmd& command) {
    std::visit(overloaded {
        [&](const cmd::Despawn& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.destruct();
        },
        [&](const cmd::SetPosition& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            if (e.has<ScreenPosition>() && !e.has<MapPosition>())
                e.set<ScreenPosition>({c.pos});
            else
                e.set<MapPosition>({c.pos});
        },
        [&](const cmd::SetVelocity& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            // A stuck entity keeps the velocity for when it is released
            if (StuckTo *stuck = existing<StuckTo>(e))
                stuck->stored_velocity = c.velocity;
            else if (RigidBody *body = existing<RigidBody>(e))
                body->velocity = c.velocity;
            else {
                RigidBody body;
                body.velocity = c.velocity;
                e.set<RigidBody>(body);
            }
        },
        [&](const cmd::SetRotation& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<Rotation>({c.degrees});
        },
        [&](const cmd::SetScale& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<Scale>({c.scale});
        },
        [&](const cmd::SetSpeed& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->set_speed(c.speed);
        },
        [&](const cmd::SetFriction& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->friction = std::max(0.f, c.friction);
        },
        [&](const cmd::SetMaxSpeed& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->max_speed = c.max_speed;
        },
        [&](const cmd::AddForce& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e || e.has<StuckTo>())
                return;
            if (RigidBody *body = existing<RigidBody>(e))
                body->add_force(c.name, c.value, c.enabled);
            else {
                RigidBody body;
                body.add_force(c.name, c.value, c.enabled);
                e.set<RigidBody>(body);
            }
        },
        [&](const cmd::RemoveForce& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->remove_force(c.name);
        },
        [&](const cmd::SetForceEnabled& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->set_force_enabled(c.name, c.enabled);
        },
        [&](const cmd::SetForceValue& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->set_force_value(c.name, c.value);
        },
        [&](const cmd::Freeze& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->frozen = true;
        },
        [&](const cmd::Unfreeze& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (RigidBody *body = existing<RigidBody>(e))
                    body->frozen = false;
        },
        [&](const cmd::InsertStuckTo& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            StuckTo stuck = c.stuck;
            if (const RigidBody *body = e.get<RigidBody>()) {
                if (!stuck.stored_velocity)
                    stuck.stored_velocity = body->velocity;
                e.remove<RigidBody>();
            }
            e.set<StuckTo>(stuck);
        },
        [&](const cmd::ReleaseStuckTo& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            if (const StuckTo *stuck = e.get<StuckTo>()) {
                if (stuck->stored_velocity) {
                    RigidBody body;
                    body.velocity = *stuck->stored_velocity;
                    e.set<RigidBody>(body);
                }
            }
            e.remove<StuckTo>();
        },
        [&](const cmd::InsertTtl& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<Ttl>({c.seconds});
        },
        [&](const cmd::InsertTimer& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<Timer>({c.duration, 0.f, c.signal});
        },
        [&](const cmd::RemoveTimer& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.remove<Timer>();
        },
        [&](const cmd::InsertLuaTimer& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<LuaTimer>({c.duration, 0.f, c.callback});
        },
        [&](const cmd::RemoveLuaTimer& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.remove<LuaTimer>();
        },
        [&](const cmd::InsertTweenPosition& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<TweenPosition>(c.tween);
        },
        [&](const cmd::InsertTweenRotation& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<TweenRotation>(c.tween);
        },
        [&](const cmd::InsertTweenScale& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.set<TweenScale>(c.tween);
        },
        [&](const cmd::RemoveTweenPosition& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.remove<TweenPosition>();
        },
        [&](const cmd::RemoveTweenRotation& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.remove<TweenRotation>();
        },
        [&](const cmd::RemoveTweenScale& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.remove<TweenScale>();
        },
        [&](const cmd::RestartAnimation& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (Animation *animation = existing<Animation>(e)) {
                    animation->frame_index = 0;
                    animation->elapsed = 0.f;
                }
        },
        [&](const cmd::SetAnimation& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (Animation *animation = existing<Animation>(e)) {
                    animation->key = c.key;
                    animation->frame_index = 0;
                    animation->elapsed = 0.f;
                }
        },
        [&](const cmd::SignalSetScalar& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                set_entity_signals(e, [&](Signals& s) { s.set_scalar(c.key, c.value); });
        },
        [&](const cmd::SignalSetInteger& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                set_entity_signals(e, [&](Signals& s) { s.set_integer(c.key, c.value); });
        },
        [&](const cmd::SignalSetString& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                set_entity_signals(e, [&](Signals& s) { s.set_string(c.key, c.value); });
        },
        [&](const cmd::SignalSetFlag& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            // Already set is not a change
            if (const Signals *s = e.get<Signals>(); s && s->has_flag(c.key))
                return;
            set_entity_signals(e, [&](Signals& s) { s.set_flag(c.key); });
        },
        [&](const cmd::SignalClearFlag& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (Signals *s = existing<Signals>(e))
                    s->clear_flag(c.key);
        },
        [&](const cmd::SignalClearScalar& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (Signals *s = existing<Signals>(e))
                    s->clear_scalar(c.key);
        },
        [&](const cmd::SignalClearInteger& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (Signals *s = existing<Signals>(e))
                    s->clear_integer(c.key);
        },
        [&](const cmd::SignalClearString& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (Signals *s = existing<Signals>(e))
                    s->clear_string(c.key);
        },
        [&](const cmd::SetShader& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            if (EntityShader *shader = existing<EntityShader>(e))
                shader->key = c.key;
            else
                e.set<EntityShader>({c.key, {}});
        },
        [&](const cmd::RemoveShader& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                e.remove<EntityShader>();
        },
        [&](const cmd::SetShaderUniform& c) {
            if (flecs::entity e = live_entity(_world, c.entity))
                if (EntityShader *shader = existing<EntityShader>(e))
                    shader->uniforms[c.name] = c.value;
        },
        [&](const cmd::SetParent& c) {
            flecs::entity e = live_entity(_world, c.entity);
            if (!e)
                return;
            if (c.parent == 0) {
                e.remove(flecs::ChildOf, flecs::Wildcard);
                return;
            }
            flecs::entity parent = live_entity(_world, c.parent);
            if (parent && parent.id() != e.id())
                e.child_of(parent);
        }
    }, command);
}

void CommandProcessor::apply(const GroupCmd& command) {
    TrackedGroups *groups = _world.get_mut<TrackedGroups>();
    WorldSignals *signals = _world.get_mut<WorldSignals>();
    std::visit(overloaded {
        [&](const cmd::TrackGroup& c) { groups->add(c.name); },
        [&](const cmd::UntrackGroup& c) {
            groups->remove(c.name);
            signals->clear_integer(GROUP_COUNT_PREFIX + c.name);
        },
        [&](const cmd::ClearTrackedGroups&) {
            groups->clear();
            signals->clear_group_counts();
        }
    }, command);
}

void CommandProcessor::apply(const TilemapCmd& command) {
    std::visit(overloaded {
        [&](const cmd::SpawnTiles& c) {
            const TilemapStore *store = _world.get<TilemapStore>();
            auto it = store->maps.find(c.id);
            if (it == store->maps.end()) {
                $Log.warn("spawn_tiles: tilemap '{}' is not loaded", c.id);
                return;
            }
            Tilemap tilemap = it->second;
            const AssetRegistry *registry = _world.get<AssetRegistry>();
            auto atlas = registry->textures.find(tilemap.tex_key);
            float atlas_width = atlas == registry->textures.end() ? 0.f : atlas->second.x;
            size_t count = spawn_tiles(_world, tilemap, atlas_width);
            $Log.info("Spawned {} tiles from '{}'", count, c.id);
        }
    }, command);
}

void CommandProcessor::apply(const CameraCmd& command) {
    std::visit(overloaded {
        [&](const cmd::SetCamera& c) {
            _world.set<Camera2D>({c.target, c.offset, c.rotation, c.zoom});
        }
    }, command);
}

void CommandProcessor::apply(const AnimationCmd& command) {
    std::visit(overloaded {
        [&](const cmd::RegisterAnimation& c) {
            _world.get_mut<AnimationStore>()->animations[c.id] = c.animation;
        }
    }, command);
}

flecs::entity CommandProcessor::apply(const SpawnCmd& c) {
    WorldSignals *world_signals = _world.get_mut<WorldSignals>();
    flecs::entity e;
    if (c.clone_source) {
        auto source_id = world_signals->get_entity(*c.clone_source);
        flecs::entity source = source_id ? live_entity(_world, *source_id) : flecs::entity();
        if (!source) {
            $Log.warn("clone: no live entity registered as '{}'", *c.clone_source);
            return flecs::entity();
        }
        e = source.clone(true);
    } else
        e = _world.entity();
    e.add<Spawned>();

    if (c.group)
        e.set<Group>({*c.group});
    if (c.position)
        e.set<MapPosition>({*c.position});
    if (c.screen_position)
        e.set<ScreenPosition>({*c.screen_position});
    if (c.zindex)
        e.set<ZIndex>({*c.zindex});
    if (c.rotation)
        e.set<Rotation>({*c.rotation});
    if (c.scale)
        e.set<Scale>({*c.scale});
    if (c.persistent)
        e.add<Persistent>();
    if (c.parent)
        if (flecs::entity parent = live_entity(_world, *c.parent))
            e.child_of(parent);

    if (c.sprite)
        e.set<Sprite>(*c.sprite);
    if (c.text)
        e.set<DynamicText>(*c.text);
    if (c.tint)
        e.set<Tint>(*c.tint);
    if (c.collider)
        e.set<BoxCollider>(*c.collider);
    if (c.mouse_controlled)
        e.set<MouseControlled>(*c.mouse_controlled);

    if (c.stuckto) {
        // Stuck entities carry no body, its velocity waits in the StuckTo
        StuckTo stuck = *c.stuckto;
        const RigidBody *body = c.rigidbody ? &*c.rigidbody : e.get<RigidBody>();
        if (body && !stuck.stored_velocity)
            stuck.stored_velocity = body->velocity;
        e.remove<RigidBody>();
        e.set<StuckTo>(stuck);
    } else if (c.rigidbody)
        e.set<RigidBody>(*c.rigidbody);

    if (c.has_signals || !c.signal_scalars.empty() || !c.signal_integers.empty() ||
        !c.signal_strings.empty() || !c.signal_flags.empty()) {
        Signals signals = e.has<Signals>() ? *e.get<Signals>() : Signals();
        for (const auto& [key, value] : c.signal_scalars)
            signals.set_scalar(key, value);
        for (const auto& [key, value] : c.signal_integers)
            signals.set_integer(key, value);
        for (const auto& [key, value] : c.signal_strings)
            signals.set_string(key, value);
        for (const auto& flag : c.signal_flags)
            signals.set_flag(flag);
        e.set<Signals>(signals);
    }

    if (c.phase)
        e.set<Phase>(*c.phase);
    if (c.timer)
        e.set<Timer>(*c.timer);
    if (c.lua_timer)
        e.set<LuaTimer>(*c.lua_timer);
    if (c.ttl)
        e.set<Ttl>(*c.ttl);
    if (c.signal_binding)
        e.set<SignalBinding>(*c.signal_binding);
    if (c.grid_layout)
        e.set<GridLayout>(*c.grid_layout);
    if (c.tween_position)
        e.set<TweenPosition>(*c.tween_position);
    if (c.tween_rotation)
        e.set<TweenRotation>(*c.tween_rotation);
    if (c.tween_scale)
        e.set<TweenScale>(*c.tween_scale);
    if (c.collision_rule)
        e.set<CollisionRule>(*c.collision_rule);
    if (c.animation)
        e.set<Animation>(*c.animation);
    if (c.animation_controller)
        e.set<AnimationController>(*c.animation_controller);
    if (c.shader)
        e.set<EntityShader>(*c.shader);

    if (c.menu) {
        Menu menu = c.menu->menu;
        if (c.menu->cursor_key) {
            if (auto cursor = world_signals->get_entity(*c.menu->cursor_key))
                menu.cursor_entity = *cursor;
            else
                $Log.warn("Menu cursor entity key '{}' not found in WorldSignals", *c.menu->cursor_key);
        }
        e.set<MenuActions>(c.menu->actions);
        e.set<Menu>(menu);
    }

    if (c.particle_emitter) {
        ParticleEmitter emitter = c.particle_emitter->emitter;
        for (const auto& key : c.particle_emitter->template_keys) {
            if (auto id = world_signals->get_entity(key))
                emitter.templates.push_back(*id);
            else
                $Log.warn("Particle template key '{}' not found in WorldSignals", key);
        }
        e.set<ParticleEmitter>(emitter);
    }

    if (c.register_as)
        world_signals->set_entity(*c.register_as, e.id());
    return e;
}

void CommandProcessor::drain(CommandQueues& queues) {
    process(queues.asset);
    process(queues.animation);
    process(queues.camera);
    process(queues.tilemap);
    process(queues.group);
    process(queues.signal);
    process(queues.audio);
    process(queues.entity);
    process(queues.spawn);
    process(queues.phase);
}

void CommandProcessor::drain_collision(CollisionQueues& queues) {
    process(queues.entity);
    process(queues.signal);
    process(queues.audio);
    process(queues.spawn);
    process(queues.phase);
    process(queues.camera);
}
