/**
 * @file TestAnimation.cpp
 * @brief Frame stepping, controller rules and signal conditions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"

using Catch::Matchers::WithinAbs;

static Condition flag(const std::string& key, bool present = true) {
    Condition c;
    c.kind = present ? Condition::Kind::HasFlag : Condition::Kind::LacksFlag;
    c.key = key;
    return c;
}

static void register_walk(Game& game, bool looped) {
    AnimationResource walk;
    walk.tex_key = "hero";
    walk.position = {0.f, 16.f};
    walk.displacement = 16.f;
    walk.frame_count = 3;
    walk.fps = 10.f;
    walk.looped = looped;
    game.commands().apply(AnimationCmd{cmd::RegisterAnimation{"walk", walk}});
}

TEST_CASE("Conditions evaluate against signals", "[animation][conditions]") {
    Signals signals;
    signals.set_flag("grounded");
    signals.set_scalar("speed", 4.f);
    signals.set_integer("hp", 2);

    SECTION("flags") {
        REQUIRE(flag("grounded").evaluate(signals));
        REQUIRE_FALSE(flag("grounded", false).evaluate(signals));
        REQUIRE(flag("jumping", false).evaluate(signals));
    }

    SECTION("comparisons and ranges") {
        Condition cmp;
        cmp.kind = Condition::Kind::ScalarCmp;
        cmp.key = "speed";
        REQUIRE(cmp_op_from_name("gt", cmp.op));
        cmp.scalar = 1.f;
        REQUIRE(cmp.evaluate(signals));

        Condition range;
        range.kind = Condition::Kind::IntegerRange;
        range.key = "hp";
        range.integer_min = 0;
        range.integer_max = 2;
        REQUIRE(range.evaluate(signals));
        range.inclusive = false;
        REQUIRE_FALSE(range.evaluate(signals));

        CmpOp unused;
        REQUIRE_FALSE(cmp_op_from_name("approx", unused));
    }

    SECTION("missing keys never match a comparison") {
        Condition cmp;
        cmp.kind = Condition::Kind::IntegerCmp;
        cmp.key = "ammo";
        cmp.op = CmpOp::Ne;
        REQUIRE_FALSE(cmp.evaluate(signals));
    }

    SECTION("composites") {
        Condition all;
        all.kind = Condition::Kind::All;
        all.children = {flag("grounded"), flag("jumping", false)};
        REQUIRE(all.evaluate(signals));

        Condition any;
        any.kind = Condition::Kind::Any;
        any.children = {flag("jumping"), flag("dead")};
        REQUIRE_FALSE(any.evaluate(signals));

        Condition negated;
        negated.kind = Condition::Kind::Not;
        negated.children = {any};
        REQUIRE(negated.evaluate(signals));
    }
}

TEST_CASE("Controllers pick the first matching rule", "[animation][controller]") {
    auto game = make_game();
    flecs::world& world = game->world();

    AnimationController controller;
    controller.fallback_key = "idle";
    controller.rules.push_back({flag("hurt"), "hurt"});
    controller.rules.push_back({flag("moving"), "walk"});

    Animation animation;
    animation.key = "idle";
    animation.frame_index = 2;
    animation.elapsed = .05f;

    Signals signals;
    signals.set_flag("moving");
    flecs::entity e = world.entity()
        .set<AnimationController>(controller)
        .set<Animation>(animation)
        .set<Signals>(signals);

    game->systems().animation_controllers();
    REQUIRE(e.get<Animation>()->key == "walk");
    REQUIRE(e.get<Animation>()->frame_index == 0);
    REQUIRE_THAT(e.get<Animation>()->elapsed, WithinAbs(0.f, 1e-6));

    SECTION("an earlier rule wins") {
        e.get_mut<Signals>()->set_flag("hurt");
        game->systems().animation_controllers();
        REQUIRE(e.get<Animation>()->key == "hurt");
    }

    SECTION("the same key keeps the current frame") {
        e.get_mut<Animation>()->frame_index = 1;
        game->systems().animation_controllers();
        REQUIRE(e.get<Animation>()->frame_index == 1);
    }

    SECTION("without signals the fallback is used") {
        e.remove<Signals>();
        game->systems().animation_controllers();
        REQUIRE(e.get<Animation>()->key == "idle");
        REQUIRE(e.get<AnimationController>()->current_key == "idle");
    }
}

TEST_CASE("Animations step frames and move the sprite window", "[animation]") {
    auto game = make_game();
    flecs::world& world = game->world();

    SECTION("looped strips wrap") {
        register_walk(*game, true);
        flecs::entity e = world.entity().set<Animation>({"walk"}).set<Sprite>({});
        game->systems().animations(.25f);
        REQUIRE(e.get<Animation>()->frame_index == 2);
        REQUIRE(e.get<Sprite>()->tex_key == "hero");
        REQUIRE(e.get<Sprite>()->offset == glm::vec2(32.f, 16.f));
        game->systems().animations(.1f);
        REQUIRE(e.get<Animation>()->frame_index == 0);
    }

    SECTION("one shot strips stop on the last frame and raise a flag") {
        register_walk(*game, false);
        flecs::entity e = world.entity().set<Animation>({"walk"}).set<Sprite>({}).set<Signals>({});
        game->systems().animations(1.f);
        REQUIRE(e.get<Animation>()->frame_index == 2);
        REQUIRE(e.get<Signals>()->has_flag("animation_ended"));
    }

    SECTION("unknown keys leave the sprite untouched") {
        Sprite sprite;
        sprite.tex_key = "other";
        flecs::entity e = world.entity().set<Animation>({"missing"}).set<Sprite>(sprite);
        game->systems().animations(1.f);
        REQUIRE(e.get<Sprite>()->tex_key == "other");
    }

    SECTION("restart resets the frame") {
        register_walk(*game, true);
        flecs::entity e = world.entity().set<Animation>({"walk", 2, .05f}).set<Sprite>({});
        game->commands().apply(EntityCmd{cmd::RestartAnimation{e.id()}});
        REQUIRE(e.get<Animation>()->frame_index == 0);
        REQUIRE_THAT(e.get<Animation>()->elapsed, WithinAbs(0.f, 1e-6));
    }
}
