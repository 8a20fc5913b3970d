/**
 * @file TestParticles.cpp
 * @brief Emission timing, particle state and template resolution
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"

using Catch::Matchers::WithinAbs;

static int count_group(flecs::world& world, const std::string& name) {
    int count = 0;
    world.each([&](const Group& group) {
        if (group.name == name)
            count++;
    });
    return count;
}

static ParticleEmitter emitter_for(flecs::entity template_entity) {
    ParticleEmitter emitter;
    emitter.templates = {template_entity.id()};
    emitter.particles_per_emission = 2;
    emitter.emissions_per_second = 10.f;
    emitter.arc = {90.f, 90.f};
    emitter.speed = {10.f, 10.f};
    emitter.ttl.kind = TtlSpec::Kind::Fixed;
    emitter.ttl.min = emitter.ttl.max = 2.f;
    return emitter;
}

TEST_CASE("Emitters release particles at their rate", "[particles]") {
    auto game = make_game();
    flecs::world& world = game->world();
    flecs::entity spark = world.entity().set<Group>({"spark"}).set<Sprite>({"fx"});

    SECTION("whole periods emit, the remainder carries over") {
        flecs::entity owner = world.entity()
            .set<MapPosition>({glm::vec2(100.f, 50.f)})
            .set<ParticleEmitter>(emitter_for(spark));
        game->systems().particles(.35f);
        REQUIRE(count_group(world, "spark") == 1 + 6);
        REQUIRE(owner.get<ParticleEmitter>()->emissions_remaining == 97);
        REQUIRE_THAT(owner.get<ParticleEmitter>()->time_since_emit, WithinAbs(.05f, 1e-4));
    }

    SECTION("particles start at the emitter, heading along the arc") {
        world.entity()
            .set<MapPosition>({glm::vec2(100.f, 50.f)})
            .set<ParticleEmitter>(emitter_for(spark));
        game->systems().particles(.1f);
        int seen = 0;
        world.each([&](flecs::entity e, const Ttl& ttl) {
            REQUIRE(e.has<Spawned>());
            REQUIRE(e.get<Sprite>()->tex_key == "fx");
            REQUIRE(e.get<MapPosition>()->pos == glm::vec2(100.f, 50.f));
            REQUIRE_THAT(e.get<Rotation>()->degrees, WithinAbs(90.f, 1e-5));
            REQUIRE_THAT(e.get<RigidBody>()->velocity.x, WithinAbs(10.f, 1e-4));
            REQUIRE_THAT(e.get<RigidBody>()->velocity.y, WithinAbs(0.f, 1e-4));
            REQUIRE_THAT(ttl.remaining, WithinAbs(2.f, 1e-6));
            seen++;
        });
        REQUIRE(seen == 2);
    }

    SECTION("an exhausted emitter stops") {
        ParticleEmitter emitter = emitter_for(spark);
        emitter.emissions_remaining = 1;
        world.entity().set<MapPosition>({glm::vec2(0.f)}).set<ParticleEmitter>(emitter);
        game->systems().particles(1.f);
        REQUIRE(count_group(world, "spark") == 1 + 2);
    }

    SECTION("rect shapes scatter inside the box") {
        ParticleEmitter emitter = emitter_for(spark);
        emitter.shape.kind = EmitterShapeKind::Rect;
        emitter.shape.width = 20.f;
        emitter.shape.height = 10.f;
        emitter.particles_per_emission = 20;
        world.entity().set<MapPosition>({glm::vec2(0.f)}).set<ParticleEmitter>(emitter);
        game->systems().particles(.1f);
        world.each([&](flecs::entity, const Ttl&, const MapPosition& pos) {
            REQUIRE(pos.pos.x >= -10.f);
            REQUIRE(pos.pos.x <= 10.f);
            REQUIRE(pos.pos.y >= -5.f);
            REQUIRE(pos.pos.y <= 5.f);
        });
    }

    SECTION("dead templates are skipped") {
        world.entity().set<MapPosition>({glm::vec2(0.f)}).set<ParticleEmitter>(emitter_for(spark));
        spark.destruct();
        game->systems().particles(.1f);
        REQUIRE(count_group(world, "spark") == 0);
    }
}

TEST_CASE("Scripts name particle templates by registered key", "[particles][lua]") {
    auto game = make_game();
    flecs::world& world = game->world();
    REQUIRE(game->lua().run_string(R"(
        engine.spawn():with_group("spark"):with_ttl(5):register_as("spark"):build()
        engine.spawn()
            :with_position(10, 10)
            :with_particle_emitter({
                templates = { "spark", "missing" },
                emissions_per_second = 4,
                emissions_remaining = 2,
                ttl = { min = 3, max = 1 },
            })
            :register_as("fountain")
            :build()
    )"));
    game->commands().drain(game->lua().queues());

    const WorldSignals *signals = world.get<WorldSignals>();
    flecs::entity fountain = world.entity(*signals->get_entity("fountain"));
    const ParticleEmitter *emitter = fountain.get<ParticleEmitter>();
    REQUIRE(emitter->templates == std::vector<flecs::entity_t>{*signals->get_entity("spark")});
    REQUIRE(emitter->ttl.kind == TtlSpec::Kind::Range);
    REQUIRE_THAT(emitter->ttl.min, WithinAbs(1.f, 1e-6));
    REQUIRE_THAT(emitter->ttl.max, WithinAbs(3.f, 1e-6));

    game->systems().particles(1.f);
    REQUIRE(count_group(world, "spark") == 1 + 2);
    world.each([&](flecs::entity e, const Group& group, const Ttl& ttl) {
        if (group.name != "spark" || e.id() == *signals->get_entity("spark"))
            return;
        REQUIRE(ttl.remaining >= 1.f);
        REQUIRE(ttl.remaining <= 3.f);
    });
}
