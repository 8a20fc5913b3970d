/**
 * @file TestPhysics.cpp
 * @brief Integration, friction, freezing and sticky attachment
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Physics integrates velocity and forces", "[physics]") {
    auto game = make_game();
    flecs::world& world = game->world();

    SECTION("velocity moves the position by velocity times delta") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {10.f, 0.f});
        game->systems().physics(.5f);
        REQUIRE_THAT(e.get<MapPosition>()->pos.x, WithinAbs(5.f, 1e-5));
        REQUIRE_THAT(e.get<MapPosition>()->pos.y, WithinAbs(0.f, 1e-5));
    }

    SECTION("an enabled force accelerates before the move") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {0.f, 0.f});
        RigidBody body = *e.get<RigidBody>();
        body.add_force("thrust", {2.f, 0.f});
        e.set<RigidBody>(body);
        game->systems().physics(1.f);
        REQUIRE_THAT(e.get<RigidBody>()->velocity.x, WithinAbs(2.f, 1e-5));
        REQUIRE_THAT(e.get<MapPosition>()->pos.x, WithinAbs(2.f, 1e-5));
    }

    SECTION("disabled forces are ignored") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {0.f, 0.f});
        RigidBody body = *e.get<RigidBody>();
        body.add_force("gravity", {0.f, 9.8f}, false);
        e.set<RigidBody>(body);
        game->systems().physics(1.f);
        REQUIRE(e.get<RigidBody>()->velocity == glm::vec2(0.f));
    }

    SECTION("max speed clamps the magnitude") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {30.f, 40.f});
        RigidBody body = *e.get<RigidBody>();
        body.max_speed = 10.f;
        e.set<RigidBody>(body);
        game->systems().physics(1.f);
        REQUIRE_THAT(glm::length(e.get<RigidBody>()->velocity), WithinAbs(10.f, 1e-4));
        REQUIRE_THAT(e.get<MapPosition>()->pos.x, WithinAbs(6.f, 1e-4));
    }

    SECTION("friction snaps slow bodies to rest") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {.005f, 0.f});
        RigidBody body = *e.get<RigidBody>();
        body.friction = .5f;
        e.set<RigidBody>(body);
        game->systems().physics(.1f);
        REQUIRE(e.get<RigidBody>()->velocity == glm::vec2(0.f));
    }
}

TEST_CASE("Physics publishes movement signals", "[physics][signals]") {
    auto game = make_game();
    flecs::world& world = game->world();

    SECTION("a moving body sets moving and speed_sq") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {3.f, 4.f}).set<Signals>({});
        game->systems().physics(.016f);
        REQUIRE(e.get<Signals>()->has_flag("moving"));
        REQUIRE_THAT(*e.get<Signals>()->get_scalar("speed_sq"), WithinAbs(25.f, 1e-4));
    }

    SECTION("a frozen body keeps its place and reports no motion") {
        Signals signals;
        signals.set_flag("moving");
        signals.set_scalar("speed_sq", 123.f);
        flecs::entity e = body_at(world, {1.f, 1.f}, {5.f, 0.f}).set<Signals>(signals);
        RigidBody body = *e.get<RigidBody>();
        body.frozen = true;
        e.set<RigidBody>(body);

        game->systems().physics(1.f);
        REQUIRE(e.get<MapPosition>()->pos == glm::vec2(1.f, 1.f));
        REQUIRE_FALSE(e.get<Signals>()->has_flag("moving"));
        REQUIRE_THAT(*e.get<Signals>()->get_scalar("speed_sq"), WithinAbs(0.f, 1e-6));
    }

    SECTION("bodies without signals are still integrated") {
        flecs::entity e = body_at(world, {0.f, 0.f}, {1.f, 1.f});
        game->systems().physics(1.f);
        REQUIRE_FALSE(e.has<Signals>());
        REQUIRE(e.get<MapPosition>()->pos == glm::vec2(1.f, 1.f));
    }
}

TEST_CASE("Stuck entities follow their target", "[physics][stuckto]") {
    auto game = make_game();
    flecs::world& world = game->world();
    flecs::entity target = body_at(world, {10.f, 20.f}, {0.f, 0.f});
    flecs::entity follower = world.entity().set<MapPosition>({glm::vec2(0.f)});

    SECTION("enabled axes copy the target position plus offset") {
        StuckTo stuck;
        stuck.target = target.id();
        stuck.offset = {2.f, 3.f};
        stuck.follow_y = false;
        follower.set<StuckTo>(stuck);
        game->systems().stuckto();
        REQUIRE(follower.get<MapPosition>()->pos == glm::vec2(12.f, 0.f));
    }

    SECTION("a dead target leaves the follower alone") {
        StuckTo stuck;
        stuck.target = target.id();
        follower.set<StuckTo>(stuck);
        target.destruct();
        game->systems().stuckto();
        REQUIRE(follower.get<MapPosition>()->pos == glm::vec2(0.f));
    }

    SECTION("stuck entities are skipped by physics") {
        RigidBody body;
        body.velocity = {100.f, 0.f};
        follower.set<RigidBody>(body).set<StuckTo>({target.id()});
        game->systems().physics(1.f);
        REQUIRE(follower.get<MapPosition>()->pos == glm::vec2(0.f));
    }
}

TEST_CASE("Attaching and releasing restores the stored velocity", "[physics][stuckto]") {
    auto game = make_game();
    flecs::world& world = game->world();
    flecs::entity target = world.entity().set<MapPosition>({glm::vec2(0.f)});
    flecs::entity e = body_at(world, {0.f, 0.f}, {7.f, -2.f});

    StuckTo stuck;
    stuck.target = target.id();
    game->commands().apply(EntityCmd{cmd::InsertStuckTo{e.id(), stuck}});
    REQUIRE(e.has<StuckTo>());
    REQUIRE_FALSE(e.has<RigidBody>());
    REQUIRE(e.get<StuckTo>()->stored_velocity == glm::vec2(7.f, -2.f));

    game->commands().apply(EntityCmd{cmd::ReleaseStuckTo{e.id()}});
    REQUIRE_FALSE(e.has<StuckTo>());
    REQUIRE(e.has<RigidBody>());
    REQUIRE(e.get<RigidBody>()->velocity == glm::vec2(7.f, -2.f));

    SECTION("release without a stored velocity adds no body") {
        flecs::entity other = world.entity().set<MapPosition>({glm::vec2(0.f)}).set<StuckTo>({target.id()});
        game->commands().apply(EntityCmd{cmd::ReleaseStuckTo{other.id()}});
        REQUIRE_FALSE(other.has<StuckTo>());
        REQUIRE_FALSE(other.has<RigidBody>());
    }
}

TEST_CASE("Speed changes keep the heading", "[physics]") {
    RigidBody body;

    SECTION("set_speed rescales a moving body") {
        body.velocity = {3.f, 4.f};
        REQUIRE(body.set_speed(10.f));
        REQUIRE_THAT(body.velocity.x, WithinAbs(6.f, 1e-5));
        REQUIRE_THAT(body.velocity.y, WithinAbs(8.f, 1e-5));
    }

    SECTION("set_speed on a resting body does nothing") {
        REQUIRE_FALSE(body.set_speed(10.f));
        REQUIRE(body.velocity == glm::vec2(0.f));
    }
}
