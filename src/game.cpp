//
//  game.cpp
//  aberred
//
//  Created by George Watson on 16/10/2025.
//

#include "game.hpp"
#include "collision.hpp"
#include "log.hpp"
#include "glm/trigonometric.hpp"
#include <cmath>
#include <vector>

Game::Game(std::unique_ptr<AssetLoader> assets, std::unique_ptr<AudioDevice> audio_device,
           const GameConfig& config, uint32_t seed)
    : _assets(std::move(assets)),
      _lua(config.script_path),
      _audio(std::make_unique<AudioWorker>(config.audio_enabled ? std::move(audio_device)
                                                                : std::unique_ptr<AudioDevice>(new SilentAudioDevice()))),
      _commands(_world, *_assets, _audio.get()),
      _systems(_world, *_assets, seed) {
    _world.set<WorldTime>({});
    _world.set<WorldSignals>({});
    _world.set<TrackedGroups>({});
    _world.set<GameState>({});
    _world.set<NextGameState>({});
    _world.set<SystemsStore>({});
    _world.set<Camera2D>({});
    _world.set<ScreenSize>({config.render_width, config.render_height});
    _world.set<WindowSize>({config.window_width, config.window_height});
    _world.set<MouseWorldPosition>({});
    _world.set<TilemapStore>({});
    _world.set<AssetRegistry>({});
    _world.set<AnimationStore>({});

    _phases = _world.query<const Phase>();
    _colliders = _world.query<const BoxCollider, const MapPosition>();
    _rules = _world.query<const CollisionRule>();
    _lua_timers = _world.query<LuaTimer>();
    _menus = _world.query<const Menu>();
    _scene_entities = _world.query_builder<>()
        .with<Spawned>()
        .without<Persistent>()
        .build();
    _spawned_entities = _world.query_builder<>()
        .with<Spawned>()
        .build();

    // Only reports. The exit and enter hooks run from check_state after the
    // event, since writes made inside an observer are deferred and the setup
    // hook reads back what it spawns.
    _world.observer<GameState>("GameStateChanged")
        .event<StateChanged>()
        .each([](flecs::iter& it, size_t, GameState&) {
            if (const StateChanged *changed = it.param<StateChanged>())
                $Log.info("Game state {} -> {}", game_state_name(changed->from), game_state_name(changed->to));
        });

    _world.observer<Phase>("PhaseChanged")
        .event<PhaseChanged>()
        .each([](flecs::iter& it, size_t i, Phase&) {
            if (const PhaseChanged *changed = it.param<PhaseChanged>())
                $Log.debug("Entity {} phase {} -> {}", it.entity(i).id(), changed->previous, changed->current);
        });

    register_systems();
}

Game::~Game() {
    _audio->stop();
}

void Game::register_systems() {
    SystemsStore store;
    store.insert("setup", [this]() {
        if (_lua.has_function("on_setup")) {
            sync_script_state();
            _lua.call_function("on_setup");
        } else
            $Log.warn("[Lua] No on_setup function defined");
        drain_commands();
        request_state(GameStates::Playing);
    });
    store.insert("switch_scene", [this]() {
        switch_scene();
    });
    store.insert("clean_all_entities", [this]() {
        despawn_scene(true);
    });
    store.insert("menu_despawn", [this]() {
        despawn_menus();
    });
    store.insert("quit", [this]() {
        _audio->stop();
        _running = false;
    });
    _world.set<SystemsStore>(store);
}

bool Game::load_script(const std::string& path) {
    return _lua.run_file(path);
}

void Game::start() {
    request_state(GameStates::Setup);
    check_state();
}

void Game::request_state(GameStates state) {
    NextGameState next = *_world.get<NextGameState>();
    next.set(state);
    _world.set<NextGameState>(next);
}

void Game::request_quit() {
    request_state(GameStates::Quitting);
}

void Game::pause() {
    if (state() == GameStates::Playing)
        request_state(GameStates::Paused);
}

void Game::resume() {
    if (state() == GameStates::Paused)
        request_state(GameStates::Playing);
}

void Game::check_state() {
    // Setup requests Playing from inside its hook, follow it in the same call
    for (int hops = 0; hops < 4; hops++) {
        NextGameState next = *_world.get<NextGameState>();
        if (!next.pending)
            return;
        GameStates to = *next.pending;
        _world.set<NextGameState>({});
        GameStates from = state();
        if (from == to)
            continue;
        _world.set<GameState>({to});
        StateChanged changed{from, to};
        _world.event<StateChanged>()
            .id<GameState>()
            .entity(_world.component<GameState>())
            .ctx(&changed)
            .emit();
        exit_state(from);
        enter_state(to);
    }
}

void Game::exit_state(GameStates state) {
    if (state == GameStates::Playing)
        $Log.debug("Leaving play");
}

void Game::enter_state(GameStates state) {
    const SystemsStore *store = _world.get<SystemsStore>();
    switch (state) {
        case GameStates::Setup:
            if (!store->run("setup"))
                $Log.error("No setup system registered");
            break;
        case GameStates::Quitting:
            store->run("quit");
            break;
        default:
            break;
    }
}

void Game::sync_script_state() {
    _lua.update_signal_cache(*_world.get<WorldSignals>());
    _lua.update_tracked_groups_cache(*_world.get<TrackedGroups>());
}

void Game::drain_commands() {
    _commands.drain(_lua.queues());
}

void Game::update_mouse() {
    const Camera2D *camera = _world.get<Camera2D>();
    MouseWorldPosition mouse;
    mouse.screen = _input.mouse_position();
    float zoom = camera->zoom != 0.f ? camera->zoom : 1.f;
    glm::vec2 local = (mouse.screen - camera->offset) / zoom;
    float rad = glm::radians(-camera->rotation);
    float s = std::sin(rad), c = std::cos(rad);
    mouse.world = glm::vec2(local.x * c - local.y * s, local.x * s + local.y * c) + camera->target;
    _world.set<MouseWorldPosition>(mouse);
}

bool Game::update(float dt) {
    if (!_running)
        return false;

    WorldTime time = *_world.get<WorldTime>();
    time.advance(dt);
    _world.set<WorldTime>(time);
    float delta = time.delta;

    update_mouse();
    _lua.update_input_snapshot(InputSnapshot::from(_input));
    check_state();

    if (_running && state() == GameStates::Playing) {
        scene_update(delta);
        phases(delta);
        drain_commands();
        lua_timers(delta);

        _systems.tweens(delta);
        _systems.timers(delta);
        _systems.ttl(delta);
        _systems.physics(delta);
        _systems.stuckto();
        _systems.mouse();
        _systems.transforms();
        _systems.particles(delta);
        _systems.grid_layouts();

        collisions();

        _systems.signal_bindings();
        _systems.group_counts();
        _systems.animation_controllers();
        _systems.animations(delta);
        _systems.dynamic_text_sizes();

        spawn_menus();
        menu_input();
        check_flags();
    }

    poll_audio();
    _input.end_frame();
    check_state();
    return _running;
}

void Game::scene_update(float dt) {
    drain_commands();
    std::string scene = _world.get<WorldSignals>()->get_string("scene").value_or(DEFAULT_SCENE);
    std::string name = "on_update_" + scene;
    if (_lua.has_function(name)) {
        sync_script_state();
        _lua.call_function(name, [dt](lua_State *L) {
            lua_pushnumber(L, dt);
            return 1;
        });
        drain_commands();
    }
    check_flags();
}

void Game::check_flags() {
    const WorldSignals *signals = _world.get<WorldSignals>();
    if (signals->has_flag("quit_game")) {
        WorldSignals updated = *signals;
        updated.clear_flag("quit_game");
        _world.set<WorldSignals>(updated);
        request_quit();
    } else if (signals->has_flag("switch_scene"))
        _world.get<SystemsStore>()->run("switch_scene");
}

void Game::poll_audio() {
    using K = AudioMessage::Kind;
    std::vector<AudioMessage> messages = _audio->poll_messages();
    if (messages.empty())
        return;
    AssetRegistry registry = *_world.get<AssetRegistry>();
    for (const auto& message : messages) {
        switch (message.kind) {
            case K::MusicLoaded:
                registry.music.insert(message.id);
                break;
            case K::MusicUnloaded:
                registry.music.erase(message.id);
                break;
            case K::MusicUnloadedAll:
                registry.music.clear();
                break;
            case K::FxLoaded:
                registry.sounds.insert(message.id);
                break;
            case K::FxUnloaded:
                registry.sounds.erase(message.id);
                break;
            case K::FxUnloadedAll:
                registry.sounds.clear();
                break;
            case K::MusicLoadFailed:
            case K::FxLoadFailed:
                $Log.warn("[Audio] {} id='{}' error='{}'", AudioMessage::kind_name(message.kind), message.id, message.error);
                break;
            default:
                $Log.debug("[Audio] {} id='{}'", AudioMessage::kind_name(message.kind), message.id);
                break;
        }
    }
    _world.set<AssetRegistry>(registry);
    for (auto message : messages)
        _world.event<AudioMessage>()
            .id<AssetRegistry>()
            .entity(_world.component<AssetRegistry>())
            .ctx(&message)
            .emit();
}

// Phases

void Game::phases(float dt) {
    std::vector<flecs::entity_t> entities;
    _phases.each([&](flecs::entity e, const Phase&) {
        entities.push_back(e.id());
    });
    for (flecs::entity_t id : entities)
        step_phase(id, dt);
}

void Game::step_phase(flecs::entity_t id, float dt) {
    auto alive = [&]() -> flecs::entity {
        flecs::entity e = live_entity(_world, id);
        return e && e.has<Phase>() ? e : flecs::entity();
    };

    flecs::entity e = alive();
    if (!e)
        return;

    // A transition requested by the first on_enter waits for the next frame
    bool entered = false;
    if (e.get<Phase>()->needs_enter_callback) {
        Phase *phase = e.get_mut<Phase>();
        phase->needs_enter_callback = false;
        PhaseCall call{PhaseHook::Enter, phase->current, std::nullopt, phase->time_in_phase};
        run_phase_callback(e, call);
        if (!(e = alive()))
            return;
        entered = true;
    }

    if (!entered && e.get<Phase>()->next) {
        Phase *phase = e.get_mut<Phase>();
        std::string previous = phase->current;
        phase->current = *phase->next;
        phase->next.reset();
        phase->previous = previous;
        phase->time_in_phase = 0.f;
        std::string current = phase->current;

        run_phase_callback(e, PhaseCall{PhaseHook::Exit, previous, current, 0.f});
        if (!(e = alive()))
            return;
        PhaseChanged changed{previous, current};
        _world.event<PhaseChanged>()
            .id<Phase>()
            .entity(e)
            .ctx(&changed)
            .emit();
        if (!(e = alive()))
            return;
        run_phase_callback(e, PhaseCall{PhaseHook::Enter, current, previous, 0.f});
    } else {
        const Phase *phase = e.get<Phase>();
        run_phase_callback(e, PhaseCall{PhaseHook::Update, phase->current, std::nullopt, phase->time_in_phase});
    }

    if ((e = alive()))
        e.get_mut<Phase>()->time_in_phase += dt;
}

void Game::run_phase_callback(flecs::entity e, const PhaseCall& call) {
    const PhaseCallbacks *callbacks = e.get<Phase>()->callbacks(call.phase);
    if (!callbacks || !callbacks->get(call.hook))
        return;
    // Copied, the drain below may move the component
    PhaseCallback callback = *callbacks->get(call.hook);
    flecs::entity_t id = e.id();

    std::visit(overloaded{
        [&](NativePhaseCallback fn) {
            if (fn)
                fn(e, call);
        },
        [&](const std::string& name) {
            sync_script_state();
            std::optional<std::string> result;
            _lua.call_function(name, [&](lua_State *L) {
                lua_pushinteger(L, entity_to_lua(id));
                switch (call.hook) {
                    case PhaseHook::Update:
                        lua_pushnumber(L, call.time_in_phase);
                        break;
                    case PhaseHook::Enter:
                    case PhaseHook::Exit:
                        if (call.other)
                            lua_pushstring(L, call.other->c_str());
                        else
                            lua_pushnil(L);
                        break;
                }
                _lua.push_entity_context(e);
                return 3;
            }, &result, "[Lua Phase]");
            drain_commands();
            if (!result)
                return;
            flecs::entity target = live_entity(_world, id);
            if (!target || !target.has<Phase>())
                return;
            Phase *phase = target.get_mut<Phase>();
            if (*result != phase->current)
                phase->next = *result;
        }
    }, callback);
}

// Timers that call back into scripts

void Game::lua_timers(float dt) {
    std::vector<std::pair<flecs::entity_t, std::string>> fired;
    _lua_timers.each([&](flecs::entity e, LuaTimer& timer) {
        timer.elapsed += dt;
        if (timer.elapsed >= timer.duration) {
            timer.elapsed -= timer.duration;
            fired.emplace_back(e.id(), timer.callback);
        }
    });
    for (const auto& [id, callback] : fired) {
        flecs::entity e = live_entity(_world, id);
        if (!e)
            continue;
        sync_script_state();
        _lua.call_function(callback, [&](lua_State *L) {
            lua_pushinteger(L, entity_to_lua(id));
            _lua.push_entity_context(e);
            return 2;
        }, nullptr, "[Lua Timer]");
        drain_commands();
    }
}

// Collisions

void Game::collisions() {
    std::vector<flecs::entity_t> rules;
    _rules.each([&](flecs::entity e, const CollisionRule&) {
        rules.push_back(e.id());
    });
    if (rules.empty())
        return;
    std::vector<flecs::entity_t> bodies;
    _colliders.each([&](flecs::entity e, const BoxCollider&, const MapPosition&) {
        bodies.push_back(e.id());
    });

    auto group_of = [](flecs::entity e) -> std::string {
        const Group *group = e.get<Group>();
        return group ? group->name : std::string();
    };
    auto body = [&](flecs::entity_t id) -> flecs::entity {
        flecs::entity e = live_entity(_world, id);
        return e && e.has<BoxCollider>() && e.has<MapPosition>() ? e : flecs::entity();
    };

    for (size_t i = 0; i < bodies.size(); i++) {
        for (size_t j = i + 1; j < bodies.size(); j++) {
            flecs::entity a = body(bodies[i]);
            if (!a)
                break;
            flecs::entity b = body(bodies[j]);
            if (!b)
                continue;
            if (!a.get<BoxCollider>()->overlaps(a.get<MapPosition>()->pos, *b.get<BoxCollider>(), b.get<MapPosition>()->pos))
                continue;
            std::string group_a = group_of(a);
            std::string group_b = group_of(b);

            for (flecs::entity_t rule_id : rules) {
                flecs::entity rule_entity = live_entity(_world, rule_id);
                if (!rule_entity || !rule_entity.has<CollisionRule>())
                    continue;
                CollisionRule rule = *rule_entity.get<CollisionRule>();
                auto ordered = rule.match_and_order(a.id(), b.id(), group_a, group_b);
                if (!ordered)
                    continue;
                flecs::entity first = body(ordered->first);
                flecs::entity second = body(ordered->second);
                if (!first || !second)
                    break;

                std::visit(overloaded{
                    [&](NativeCollisionCallback fn) {
                        if (fn)
                            fn(first, second);
                    },
                    [&](const std::string& name) {
                        sync_script_state();
                        _lua.call_function(name, [&](lua_State*) {
                            _lua.push_collision_context(first, second);
                            return 1;
                        }, nullptr, "[Lua Collision]");
                    }
                }, rule.callback);
                // Each pair sees what the previous callbacks left behind
                _commands.drain_collision(_lua.collision_queues());
            }
        }
    }
}

// Menus

void Game::spawn_menus() {
    std::vector<flecs::entity_t> pending;
    _menus.each([&](flecs::entity e, const Menu& menu) {
        if (!menu.spawned)
            pending.push_back(e.id());
    });
    for (flecs::entity_t id : pending) {
        flecs::entity e = live_entity(_world, id);
        if (!e)
            continue;
        Menu menu = *e.get<Menu>();
        menu.spawned = true;
        for (size_t i = 0; i < menu.items.size(); i++) {
            MenuItem& item = menu.items[i];
            Color color = i == menu.selected_index ? menu.selected_color : menu.normal_color;
            flecs::entity text = _world.entity()
                .add<Spawned>()
                .set<DynamicText>(DynamicText(item.label, menu.font, menu.font_size, color));
            if (menu.use_screen_space)
                text.set<ScreenPosition>({item.position});
            else
                text.set<MapPosition>({item.position})
                    .set<ZIndex>({MENU_Z_INDEX});
            item.entity = text.id();
        }
        e.set<Menu>(menu);
        move_menu_cursor(menu);

        Signals signals = e.has<Signals>() ? *e.get<Signals>() : Signals();
        signals.set_flag("waiting_selection");
        e.set<Signals>(signals);
    }
}

void Game::move_menu_cursor(const Menu& menu) {
    flecs::entity cursor = live_entity(_world, menu.cursor_entity);
    if (!cursor || menu.selected_index >= menu.items.size())
        return;
    glm::vec2 position = menu.items[menu.selected_index].position;
    if (menu.use_screen_space)
        cursor.set<ScreenPosition>({position});
    else
        cursor.set<MapPosition>({position})
            .set<ZIndex>({MENU_Z_INDEX});
}

void Game::menu_input() {
    bool up = _input.button(InputButton::SecondaryUp).just_pressed;
    bool down = _input.button(InputButton::SecondaryDown).just_pressed;
    bool confirm = _input.button(InputButton::Action1).just_pressed ||
                   _input.button(InputButton::Action2).just_pressed;
    if (!up && !down && !confirm)
        return;

    std::vector<flecs::entity_t> menus;
    _menus.each([&](flecs::entity e, const Menu& menu) {
        if (menu.active && menu.spawned && !menu.items.empty())
            menus.push_back(e.id());
    });

    for (flecs::entity_t id : menus) {
        flecs::entity e = live_entity(_world, id);
        if (!e)
            continue;
        Menu menu = *e.get<Menu>();
        size_t count = menu.items.size();

        if (confirm) {
            MenuSelected selected{id, menu.items[menu.selected_index % count].id};
            menu.active = false;
            e.set<Menu>(menu);
            Signals signals = e.has<Signals>() ? *e.get<Signals>() : Signals();
            signals.clear_flag("waiting_selection");
            signals.set_string("selected_item", selected.item_id);
            e.set<Signals>(signals);
            _world.event<MenuSelected>()
                .id<Menu>()
                .entity(e)
                .ctx(&selected)
                .emit();
            select_menu_item(selected);
            continue;
        }

        if (up)
            menu.selected_index = (menu.selected_index + count - 1) % count;
        else
            menu.selected_index = (menu.selected_index + 1) % count;
        e.set<Menu>(menu);

        if (menu.dynamic_text)
            for (size_t i = 0; i < count; i++) {
                flecs::entity item = live_entity(_world, menu.items[i].entity);
                if (!item || !item.has<DynamicText>())
                    continue;
                DynamicText text = *item.get<DynamicText>();
                text.color = i == menu.selected_index ? menu.selected_color : menu.normal_color;
                item.set<DynamicText>(text);
            }
        move_menu_cursor(menu);
        if (menu.selection_sound)
            _commands.apply(AudioLuaCmd{cmd::PlaySound{*menu.selection_sound}});
    }
}

void Game::select_menu_item(const MenuSelected& selected) {
    flecs::entity e = live_entity(_world, selected.menu);
    if (!e)
        return;
    const MenuActions *actions = e.get<MenuActions>();
    if (!actions) {
        $Log.error("No MenuActions on menu {} for item '{}'", selected.menu, selected.item_id);
        return;
    }
    MenuAction action = actions->get(selected.item_id);
    std::optional<std::string> callback = e.get<Menu>()->on_select_callback;

    switch (action.kind) {
        case MenuAction::Kind::SetScene: {
            WorldSignals signals = *_world.get<WorldSignals>();
            signals.set_string("scene", action.argument);
            _world.set<WorldSignals>(signals);
            _world.get<SystemsStore>()->run("switch_scene");
            break;
        }
        case MenuAction::Kind::ShowSubMenu: {
            WorldSignals signals = *_world.get<WorldSignals>();
            signals.set_string("show_submenu", action.argument);
            _world.set<WorldSignals>(signals);
            break;
        }
        case MenuAction::Kind::QuitGame:
            request_quit();
            break;
        case MenuAction::Kind::Noop:
            break;
    }

    if (callback) {
        sync_script_state();
        _lua.call_function(*callback, [&](lua_State *L) {
            lua_pushinteger(L, entity_to_lua(selected.menu));
            lua_pushstring(L, selected.item_id.c_str());
            return 2;
        }, nullptr, "[Lua Menu]");
        drain_commands();
    }
}

// Scenes

void Game::despawn_scene(bool include_persistent) {
    std::vector<flecs::entity_t> doomed;
    auto collect = [&](flecs::entity e) {
        doomed.push_back(e.id());
    };
    if (include_persistent)
        _spawned_entities.each(collect);
    else
        _scene_entities.each(collect);
    // Children go with their parents, skip anything already gone
    for (flecs::entity_t id : doomed)
        if (flecs::entity e = live_entity(_world, id))
            e.destruct();
    $Log.debug("Despawned {} entities", doomed.size());
}

void Game::despawn_menus() {
    std::vector<flecs::entity_t> doomed;
    _menus.each([&](flecs::entity e, const Menu& menu) {
        for (const auto& item : menu.items)
            doomed.push_back(item.entity);
        doomed.push_back(menu.cursor_entity);
        doomed.push_back(e.id());
    });
    for (flecs::entity_t id : doomed)
        if (flecs::entity e = live_entity(_world, id))
            e.destruct();
}

void Game::switch_scene() {
    WorldSignals signals = *_world.get<WorldSignals>();
    signals.clear_flag("switch_scene");
    signals.clear_group_counts();
    _world.set<WorldSignals>(signals);

    _commands.apply(AudioLuaCmd{cmd::StopAllMusic{}});
    despawn_scene(false);
    _world.set<TrackedGroups>({});

    std::string scene = signals.get_string("scene").value_or(DEFAULT_SCENE);
    $Log.info("Switching to scene '{}'", scene);
    if (_lua.has_function("on_switch_scene")) {
        sync_script_state();
        _lua.call_function("on_switch_scene", [&](lua_State *L) {
            lua_pushstring(L, scene.c_str());
            return 1;
        });
    }
    drain_commands();
}
