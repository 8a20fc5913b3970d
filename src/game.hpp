//
//  game.hpp
//  aberred
//
//  Created by George Watson on 16/10/2025.
//

#pragma once

#include "flecs.h"
#include "components.hpp"
#include "resources.hpp"
#include "settings.hpp"
#include "lua_runtime.hpp"
#include "command_processor.hpp"
#include "systems.hpp"
#include "assets.hpp"
#include "audio.hpp"
#include "input.hpp"
#include "phase.hpp"
#include "menu.hpp"
#include <memory>
#include <random>
#include <string>
#include <optional>

#define MENU_Z_INDEX 23.f
#define DEFAULT_SCENE "menu"

// Owns the world and everything that feeds it. The application shell calls
// update() once per frame and draws whatever the world holds afterwards,
// tests drive the same object without a window.
class Game {
    flecs::world _world;
    std::unique_ptr<AssetLoader> _assets;
    LuaRuntime _lua;
    std::unique_ptr<AudioWorker> _audio;
    InputState _input;
    CommandProcessor _commands;
    Systems _systems;
    bool _running = true;

    flecs::query<const Phase> _phases;
    flecs::query<const BoxCollider, const MapPosition> _colliders;
    flecs::query<const CollisionRule> _rules;
    flecs::query<LuaTimer> _lua_timers;
    flecs::query<const Menu> _menus;
    flecs::query<> _scene_entities;
    flecs::query<> _spawned_entities;

    void register_systems();
    void sync_script_state();
    void update_mouse();
    void check_flags();
    void poll_audio();

    void enter_state(GameStates state);
    void exit_state(GameStates state);

    void step_phase(flecs::entity_t id, float dt);
    void run_phase_callback(flecs::entity e, const PhaseCall& call);

    void move_menu_cursor(const Menu& menu);
    void select_menu_item(const MenuSelected& selected);

    void despawn_scene(bool include_persistent);
    void despawn_menus();
    void switch_scene();

public:
    Game(std::unique_ptr<AssetLoader> assets, std::unique_ptr<AudioDevice> audio_device,
         const GameConfig& config = GameConfig(), uint32_t seed = std::random_device{}());
    ~Game();
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    flecs::world& world() { return _world; }
    LuaRuntime& lua() { return _lua; }
    InputState& input() { return _input; }
    AssetLoader& assets() { return *_assets; }
    AudioWorker& audio() { return *_audio; }
    CommandProcessor& commands() { return _commands; }
    Systems& systems() { return _systems; }

    bool running() const { return _running; }
    GameStates state() const { return _world.get<GameState>()->current; }

    bool load_script(const std::string& path);

    // Enters Setup, which runs on_setup and then moves on to Playing
    void start();
    void request_state(GameStates state);
    void request_quit();
    void pause();
    void resume();

    // One full frame. Returns false once the game has quit.
    bool update(float dt);

    // The frame stages, public so each can be driven on its own
    void check_state();
    void drain_commands();
    void scene_update(float dt);
    void phases(float dt);
    void lua_timers(float dt);
    void collisions();
    void spawn_menus();
    void menu_input();
};
