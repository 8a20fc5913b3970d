/**
 * @file TestEntityBuilder.cpp
 * @brief Script side entity construction, cloning and stale ids
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "helpers.hpp"

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

static flecs::entity registered(Game& game, const std::string& key) {
    auto id = game.world().get<WorldSignals>()->get_entity(key);
    return id ? live_entity(game.world(), *id) : flecs::entity();
}

static void run_and_drain(Game& game, const std::string& script) {
    REQUIRE(game.lua().run_string(script));
    game.commands().drain(game.lua().queues());
}

TEST_CASE("Builders insert exactly the components they were given", "[builder][lua]") {
    auto game = make_game();
    run_and_drain(*game, R"(
        engine.spawn()
            :with_group("player")
            :with_position(32, 48)
            :with_sprite("hero", 16, 16, 8, 8)
            :with_sprite_flip(true, false)
            :with_velocity(1, 2)
            :with_friction(-3)
            :with_accel("gravity", 0, 9.8, false)
            :with_collider(12, 14, 6, 7)
            :with_signal_integer("hp", 3)
            :with_signal_flag("alive")
            :with_zindex(5)
            :register_as("player")
            :build()
    )");

    flecs::entity player = registered(*game, "player");
    REQUIRE(player);
    REQUIRE(player.has<Spawned>());
    REQUIRE(player.get<Group>()->name == "player");
    REQUIRE(player.get<MapPosition>()->pos == glm::vec2(32.f, 48.f));
    REQUIRE(player.get<Sprite>()->origin == glm::vec2(8.f, 8.f));
    REQUIRE(player.get<Sprite>()->flip_h);
    REQUIRE_FALSE(player.get<Sprite>()->flip_v);
    REQUIRE(player.get<RigidBody>()->velocity == glm::vec2(1.f, 2.f));
    REQUIRE_THAT(player.get<RigidBody>()->friction, WithinAbs(0.f, 1e-6));
    REQUIRE_FALSE(player.get<RigidBody>()->forces.at("gravity").enabled);
    REQUIRE(player.get<BoxCollider>()->size == glm::vec2(12.f, 14.f));
    REQUIRE(*player.get<Signals>()->get_integer("hp") == 3);
    REQUIRE(player.get<Signals>()->has_flag("alive"));
    REQUIRE_THAT(player.get<ZIndex>()->z, WithinAbs(5.f, 1e-6));
    REQUIRE_FALSE(player.has<Rotation>());
    REQUIRE_FALSE(player.has<Ttl>());
    REQUIRE_FALSE(player.has<Persistent>());
}

TEST_CASE("Modifier methods need their base component first", "[builder][lua]") {
    auto game = make_game();

    SECTION("menu colours before a menu") {
        REQUIRE_FALSE(game->lua().run_string(
            "engine.spawn():with_menu_colors(255, 255, 255, 255, 255, 0, 0, 255):build()"));
    }

    SECTION("sprite offset before a sprite") {
        REQUIRE_FALSE(game->lua().run_string("engine.spawn():with_sprite_offset(1, 2):build()"));
    }

    SECTION("tween easing before a tween") {
        REQUIRE_FALSE(game->lua().run_string("engine.spawn():with_tween_scale_easing('quad_in'):build()"));
    }

    SECTION("an animation rule before a controller") {
        REQUIRE_FALSE(game->lua().run_string(
            "engine.spawn():with_animation_rule({type = 'has_flag', key = 'x'}, 'walk'):build()"));
    }

    SECTION("a phase without an initial name") {
        REQUIRE_FALSE(game->lua().run_string("engine.spawn():with_phase({phases = {}}):build()"));
    }

    // Nothing was queued by the failed chains
    REQUIRE(game->lua().queues().spawn.empty());
}

TEST_CASE("Cloning copies the registered entity then applies overrides", "[builder][lua]") {
    auto game = make_game();
    run_and_drain(*game, R"(
        engine.spawn()
            :with_group("bullet")
            :with_sprite("shot", 4, 4)
            :with_velocity(0, -200)
            :with_signal_integer("damage", 2)
            :register_as("bullet_template")
            :build()
    )");
    run_and_drain(*game, R"(
        engine.clone("bullet_template")
            :with_position(5, 6)
            :with_signal_integer("damage", 5)
            :with_ttl(1)
            :register_as("bullet")
            :build()
        engine.clone("nothing_here"):with_position(1, 1):register_as("ghost"):build()
    )");

    flecs::entity original = registered(*game, "bullet_template");
    flecs::entity copy = registered(*game, "bullet");
    REQUIRE(copy);
    REQUIRE(copy != original);
    REQUIRE(copy.get<Group>()->name == "bullet");
    REQUIRE(copy.get<Sprite>()->tex_key == "shot");
    REQUIRE(copy.get<RigidBody>()->velocity == glm::vec2(0.f, -200.f));
    REQUIRE(copy.get<MapPosition>()->pos == glm::vec2(5.f, 6.f));
    REQUIRE(*copy.get<Signals>()->get_integer("damage") == 5);
    REQUIRE(*original.get<Signals>()->get_integer("damage") == 2);
    REQUIRE_FALSE(original.has<MapPosition>());
    REQUIRE_FALSE(original.has<Ttl>());

    // A missing clone source spawns nothing and registers nothing
    REQUIRE_FALSE(game->world().get<WorldSignals>()->get_entity("ghost"));
}

TEST_CASE("Commands naming a despawned entity do nothing", "[builder][commands]") {
    auto game = make_game();
    flecs::world& world = game->world();
    flecs::entity old = world.entity().set<MapPosition>({glm::vec2(0.f)});
    flecs::entity_t stale = old.id();
    old.destruct();
    flecs::entity fresh = world.entity().set<MapPosition>({glm::vec2(1.f)});

    game->commands().apply(EntityCmd{cmd::SetPosition{stale, {99.f, 99.f}}});
    game->commands().apply(EntityCmd{cmd::SignalSetFlag{stale, "touched"}});
    game->commands().apply(EntityCmd{cmd::Despawn{stale}});

    REQUIRE(fresh.is_alive());
    REQUIRE(fresh.get<MapPosition>()->pos == glm::vec2(1.f));
    REQUIRE_FALSE(fresh.has<Signals>());
}

TEST_CASE("Phases, rules and menus are carried from the builder", "[builder][lua]") {
    auto game = make_game();
    run_and_drain(*game, R"(
        engine.spawn()
            :with_phase({ initial = "idle", phases = {
                idle = { on_enter = "idle_enter", on_update = "idle_update" },
                run = { on_exit = "run_exit" },
            }})
            :with_animation_controller("idle")
            :with_animation_rule({ type = "all", conditions = {
                { type = "has_flag", key = "moving" },
                { type = "scalar_cmp", key = "speed_sq", op = "gt", value = 100 },
            }}, "run")
            :register_as("hero")
            :build()
        engine.spawn()
            :with_menu({ { id = "start", label = "Start" }, { "quit" } }, 10, 20, "default", 8, 12)
            :with_menu_action_set_scene("start", "level01")
            :with_menu_action_quit("quit")
            :register_as("menu")
            :build()
    )");

    flecs::entity hero = registered(*game, "hero");
    const Phase *phase = hero.get<Phase>();
    REQUIRE(phase->current == "idle");
    REQUIRE(phase->phases.size() == 2);
    REQUIRE(phase->phases.at("idle").on_enter);
    REQUIRE_FALSE(phase->phases.at("idle").on_exit);
    REQUIRE(phase->phases.at("run").on_exit);

    const AnimationController *controller = hero.get<AnimationController>();
    REQUIRE(controller->fallback_key == "idle");
    REQUIRE(controller->rules.size() == 1);
    REQUIRE(controller->rules[0].when.kind == Condition::Kind::All);
    REQUIRE(controller->rules[0].when.children.size() == 2);
    REQUIRE(controller->rules[0].when.children[1].op == CmpOp::Gt);

    flecs::entity menu = registered(*game, "menu");
    const Menu *m = menu.get<Menu>();
    REQUIRE(m->items.size() == 2);
    REQUIRE(m->items[1].label == "quit");
    REQUIRE(m->items[1].position == glm::vec2(10.f, 32.f));
    REQUIRE(menu.get<MenuActions>()->map.at("start").kind == MenuAction::Kind::SetScene);
    REQUIRE(menu.get<MenuActions>()->map.at("quit").kind == MenuAction::Kind::QuitGame);
}

TEST_CASE("The api describes itself", "[lua][meta]") {
    auto game = make_game();
    REQUIRE(game->lua().run_string(R"(
        function describe()
            return engine.__meta.functions.entity_insert_ttl.category .. " " ..
                   engine.__meta.builder.with_ttl.signature
        end
    )"));
    std::optional<std::string> result;
    REQUIRE(game->lua().call_function("describe", nullptr, &result) == CallStatus::Ok);
    REQUIRE(result == std::optional<std::string>("entity (seconds: number)"));
    REQUIRE(game->lua().call_function("no_such_function") == CallStatus::NotFound);
}

TEST_CASE("Bad script arguments raise Lua errors and leave the game running", "[builder][lua][errors]") {
    auto game = make_game();
    start_with_script(*game, R"(
        function attempt(fn)
            local ok, err = pcall(fn)
            return ok and "ok" or err
        end
        function half_built_menu()
            return attempt(function()
                engine.spawn()
                    :with_group("menu")
                    :with_sprite("panel", 64, 32)
                    :with_menu({ { "start", "Start" }, { label = 1 } }, 0, 0, "default", 8, 10)
                    :build()
            end)
        end
        function nested_rule()
            return attempt(function()
                engine.spawn()
                    :with_animation_controller("idle")
                    :with_animation_rule({ type = "all", conditions = {
                        { type = "has_flag", key = "moving" },
                        { type = "integer_cmp", key = "hp", op = "lt", value = 1.5 },
                    }}, "hurt")
                    :build()
            end)
        end
        function negative_count()
            return attempt(function()
                engine.spawn():with_particle_emitter({ particles_per_emission = -1 }):build()
            end)
        end
        function huge_integer()
            return attempt(function() engine.set_integer("score", 1 << 40) end)
        end
        function missing_argument()
            return attempt(function() engine.load_texture("hero") end)
        end
        function dotted_call()
            return attempt(function() engine.spawn().with_group("oops") end)
        end
    )");

    auto message = [&](const std::string& function) {
        std::optional<std::string> result;
        REQUIRE(game->lua().call_function(function, nullptr, &result) == CallStatus::Ok);
        return result.value_or("");
    };

    REQUIRE_THAT(message("half_built_menu"), ContainsSubstring("with_menu(): item 2 has no id"));
    REQUIRE_THAT(message("nested_rule"), ContainsSubstring("with_animation_rule(): 'value' must be an integer"));
    REQUIRE_THAT(message("negative_count"), ContainsSubstring("'particles_per_emission' must be a whole number"));
    REQUIRE_THAT(message("huge_integer"), ContainsSubstring("set_integer(): bad argument #2"));
    REQUIRE_THAT(message("missing_argument"), ContainsSubstring("load_texture(): bad argument #2 (string expected, got no value)"));
    REQUIRE_THAT(message("dotted_call"), ContainsSubstring("bad argument #1 (EntityBuilder expected, got string)"));

    // Nothing was queued and the loop carries on
    REQUIRE(game->lua().queues().spawn.empty());
    REQUIRE(game->lua().queues().asset.empty());
    REQUIRE(game->update(1.f / 60.f));
    REQUIRE(game->lua().run_string("engine.spawn():with_group('after'):register_as('after'):build()"));
    game->commands().drain(game->lua().queues());
    REQUIRE(registered(*game, "after"));
}
