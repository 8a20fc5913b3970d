/**
 * @file TestGame.cpp
 * @brief Game states, scene switching, quitting and menus driven frame by frame
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"

using Catch::Matchers::WithinAbs;

static std::string script_value(Game& game, const std::string& function) {
    std::optional<std::string> result;
    REQUIRE(game.lua().call_function(function, nullptr, &result) == CallStatus::Ok);
    return result.value_or("");
}

static flecs::entity registered(Game& game, const std::string& key) {
    auto id = game.world().get<WorldSignals>()->get_entity(key);
    return id ? live_entity(game.world(), *id) : flecs::entity();
}

static void tap(Game& game, int key) {
    game.input().key_down(key);
    game.update(1.f / 60.f);
    game.input().key_up(key);
    game.update(1.f / 60.f);
}

TEST_CASE("Starting runs setup and moves on to playing", "[game]") {
    auto game = make_game();
    REQUIRE(game->state() == GameStates::None);

    SECTION("setup commands are applied before the first frame") {
        start_with_script(*game, R"(
            function on_setup()
                engine.set_integer("lives", 3)
                engine.track_group("enemy")
                engine.spawn():with_group("enemy"):register_as("boss"):build()
            end
        )");
        REQUIRE(game->state() == GameStates::Playing);
        REQUIRE(*game->world().get<WorldSignals>()->get_integer("lives") == 3);
        REQUIRE(registered(*game, "boss"));
        REQUIRE(game->world().get<TrackedGroups>()->has("enemy"));
    }

    SECTION("a missing on_setup still reaches playing") {
        game->start();
        REQUIRE(game->state() == GameStates::Playing);
    }
}

TEST_CASE("State changes are announced before their hooks run", "[game][state]") {
    auto game = make_game();
    REQUIRE(game->lua().run_string(R"(
        function on_setup() engine.set_integer("lives", 3) end
    )"));

    std::vector<std::string> seen;
    game->world().observer<GameState>()
        .event<StateChanged>()
        .each([&](flecs::iter& it, size_t, GameState& state) {
            const StateChanged *changed = it.param<StateChanged>();
            bool setup_ran = game->world().get<WorldSignals>()->get_integer("lives").has_value();
            seen.push_back(std::string(game_state_name(changed->from)) + ">" + game_state_name(changed->to) +
                           (state.current == changed->to ? "" : " stale") + (setup_ran ? " after setup" : ""));
        });

    game->start();
    REQUIRE(seen == std::vector<std::string>{"None>Setup", "Setup>Playing after setup"});

    game->pause();
    game->update(.1f);
    REQUIRE(seen.back() == "Playing>Paused after setup");
}

TEST_CASE("Scenes update through their named function", "[game][scene]") {
    auto game = make_game();
    start_with_script(*game, R"(
        calls = {}
        function on_update_menu(dt) table.insert(calls, string.format("menu %.2f", dt)) end
        function on_update_level(dt) table.insert(calls, "level") end
        function joined() return table.concat(calls, ",") end
    )");

    REQUIRE(game->update(.5f));
    REQUIRE(script_value(*game, "joined") == "menu 0.50");

    game->commands().apply(SignalCmd{cmd::SetString{"scene", "level"}});
    REQUIRE(game->update(.5f));
    REQUIRE(script_value(*game, "joined") == "menu 0.50,level");
    REQUIRE(game->world().get<WorldTime>()->frame_count == 2);
    REQUIRE_THAT(game->world().get<WorldTime>()->elapsed, WithinAbs(1.f, 1e-6));
}

TEST_CASE("Pausing stops the scene but keeps the loop alive", "[game][state]") {
    auto game = make_game();
    start_with_script(*game, R"(
        frames = 0
        function on_update_menu(dt) frames = frames + 1 end
        function count() return tostring(frames) end
    )");
    game->update(.1f);
    game->pause();
    REQUIRE(game->update(.1f));
    REQUIRE(game->state() == GameStates::Paused);
    REQUIRE(game->update(.1f));
    REQUIRE(script_value(*game, "count") == "1");

    // The state switches back at the start of the frame, so it plays at once
    game->resume();
    game->update(.1f);
    REQUIRE(game->state() == GameStates::Playing);
    REQUIRE(script_value(*game, "count") == "2");
}

TEST_CASE("The quit flag ends the game", "[game][state]") {
    auto game = make_game();
    start_with_script(*game, R"(
        function on_update_menu(dt) engine.set_flag("quit_game") end
    )");
    REQUIRE_FALSE(game->update(.1f));
    REQUIRE_FALSE(game->running());
    REQUIRE(game->state() == GameStates::Quitting);
    REQUIRE_FALSE(game->audio().running());
    REQUIRE_FALSE(game->update(.1f));
}

TEST_CASE("Switching scenes despawns what the scene spawned", "[game][scene]") {
    auto game = make_game();
    start_with_script(*game, R"(
        switched = "none"
        function on_setup()
            engine.track_group("enemy")
            engine.spawn():with_group("enemy"):register_as("enemy"):build()
            engine.spawn():with_group("hud"):with_persistent():register_as("hud"):build()
        end
        function on_switch_scene(scene)
            switched = scene
            engine.spawn():with_group("enemy"):register_as("fresh"):build()
        end
        function which() return switched end
    )");
    flecs::entity native = game->world().entity().set<Group>({"enemy"});
    game->update(.1f);
    REQUIRE(*game->world().get<WorldSignals>()->get_group_count("enemy") == 2);

    game->commands().apply(SignalCmd{cmd::SetString{"scene", "level02"}});
    game->commands().apply(SignalCmd{cmd::SetFlag{"switch_scene"}});
    game->update(.1f);

    REQUIRE(script_value(*game, "which") == "level02");
    REQUIRE_FALSE(registered(*game, "enemy"));
    REQUIRE(registered(*game, "hud"));
    REQUIRE(registered(*game, "fresh"));
    REQUIRE(native.is_alive());
    REQUIRE_FALSE(game->world().get<WorldSignals>()->has_flag("switch_scene"));
    // Tracking starts over with the new scene
    REQUIRE(game->world().get<TrackedGroups>()->empty());
    REQUIRE_FALSE(game->world().get<WorldSignals>()->get_group_count("enemy"));

    SECTION("clean_all_entities takes persistent ones too") {
        REQUIRE(game->world().get<SystemsStore>()->run("clean_all_entities"));
        REQUIRE_FALSE(registered(*game, "hud"));
        REQUIRE(native.is_alive());
    }
}

TEST_CASE("Menus spawn their items and react to input", "[game][menu]") {
    auto game = make_game();
    start_with_script(*game, R"(
        picked = "none"
        function on_setup()
            engine.spawn():with_sprite("cursor", 8, 8):register_as("cursor"):build()
        end
        function on_update_menu(dt)
            if engine.get_entity("menu") == nil then
                engine.spawn()
                    :with_menu({ { "start", "Start" }, { "options", "Options" }, { "quit", "Quit" } },
                               20, 40, "default", 8, 10)
                    :with_menu_colors(200, 200, 200, 255, 255, 0, 0, 255)
                    :with_menu_cursor("cursor")
                    :with_menu_callback("on_pick")
                    :with_menu_action_show_submenu("options", "settings")
                    :with_menu_action_quit("quit")
                    :register_as("menu")
                    :build()
            end
        end
        function on_pick(menu, item) picked = item end
        function which() return picked end
    )");
    game->update(.1f);

    flecs::entity menu_entity = registered(*game, "menu");
    REQUIRE(menu_entity);
    const Menu *menu = menu_entity.get<Menu>();
    REQUIRE(menu->spawned);
    REQUIRE(menu_entity.get<Signals>()->has_flag("waiting_selection"));
    flecs::entity first = game->world().entity(menu->items[0].entity);
    REQUIRE(first.get<DynamicText>()->content() == "Start");
    REQUIRE(first.get<DynamicText>()->color.g == 0);
    REQUIRE(first.get<ScreenPosition>()->pos == glm::vec2(20.f, 40.f));
    REQUIRE(registered(*game, "cursor").get<ScreenPosition>()->pos == glm::vec2(20.f, 40.f));

    SECTION("moving wraps and recolours") {
        tap(*game, KEY_UP);
        menu = menu_entity.get<Menu>();
        REQUIRE(menu->selected_index == 2);
        REQUIRE(first.get<DynamicText>()->color.g == 200);
        REQUIRE(game->world().entity(menu->items[2].entity).get<DynamicText>()->color.g == 0);
        REQUIRE(registered(*game, "cursor").get<ScreenPosition>()->pos == glm::vec2(20.f, 60.f));
    }

    SECTION("confirming a submenu item records the choice") {
        tap(*game, KEY_DOWN);
        tap(*game, KEY_ENTER);
        REQUIRE(script_value(*game, "which") == "options");
        REQUIRE(*game->world().get<WorldSignals>()->get_string("show_submenu") == "settings");
        REQUIRE(*menu_entity.get<Signals>()->get_string("selected_item") == "options");
        REQUIRE_FALSE(menu_entity.get<Signals>()->has_flag("waiting_selection"));
        REQUIRE_FALSE(menu_entity.get<Menu>()->active);

        // An inactive menu ignores further input
        tap(*game, KEY_DOWN);
        REQUIRE(menu_entity.get<Menu>()->selected_index == 1);
    }

    SECTION("the quit action stops the game") {
        tap(*game, KEY_UP);
        game->input().key_down(KEY_SPACE);
        REQUIRE_FALSE(game->update(.1f));
        REQUIRE(script_value(*game, "which") == "quit");
    }

    SECTION("menu_despawn removes the menu, items and cursor") {
        flecs::entity_t item = menu->items[1].entity;
        REQUIRE(game->world().get<SystemsStore>()->run("menu_despawn"));
        REQUIRE_FALSE(menu_entity.is_alive());
        REQUIRE_FALSE(game->world().is_alive(item));
        REQUIRE_FALSE(registered(*game, "cursor"));
    }
}

TEST_CASE("Choosing a scene from a menu switches to it", "[game][menu][scene]") {
    auto game = make_game();
    start_with_script(*game, R"(
        entered = "none"
        function on_setup()
            engine.spawn()
                :with_menu({ { "play", "Play" } }, 0, 0, "default", 8, 10, false)
                :with_menu_action_set_scene("play", "level01")
                :register_as("menu")
                :build()
        end
        function on_switch_scene(scene) entered = scene end
        function which() return entered end
    )");
    game->update(.1f);
    flecs::entity menu_entity = registered(*game, "menu");
    flecs::entity item = game->world().entity(menu_entity.get<Menu>()->items[0].entity);
    REQUIRE(item.has<MapPosition>());
    REQUIRE_THAT(item.get<ZIndex>()->z, WithinAbs(MENU_Z_INDEX, 1e-6));

    tap(*game, KEY_SPACE);
    REQUIRE(script_value(*game, "which") == "level01");
    REQUIRE(*game->world().get<WorldSignals>()->get_string("scene") == "level01");
    REQUIRE_FALSE(menu_entity.is_alive());
    REQUIRE_FALSE(item.is_alive());
}
