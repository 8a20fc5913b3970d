/**
 * @file TestPhase.cpp
 * @brief Phase enter, update and exit ordering for native and scripted callbacks
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"
#include <vector>

using Catch::Matchers::WithinAbs;

static std::vector<std::string> calls;

static void record(flecs::entity, const PhaseCall& call) {
    std::string hook = call.hook == PhaseHook::Enter ? "enter" : call.hook == PhaseHook::Exit ? "exit" : "update";
    calls.push_back(hook + ":" + call.phase + ":" + call.other.value_or("nil"));
}

static void jump_to_run(flecs::entity e, const PhaseCall& call) {
    record(e, call);
    if (call.time_in_phase > 0.f)
        e.get_mut<Phase>()->transition_to("run");
}

TEST_CASE("Scripted phases run enter, update, exit then enter", "[phase][lua]") {
    auto game = make_game();
    flecs::world& world = game->world();
    REQUIRE(game->lua().run_string(R"(
        log = {}
        function idle_enter(id, previous, ctx)
            table.insert(log, "enter idle " .. tostring(previous))
        end
        function idle_update(id, time, ctx)
            table.insert(log, string.format("update idle %.2f", time))
            if time > 0 then engine.phase_transition(id, "run") end
        end
        function idle_exit(id, next, ctx)
            table.insert(log, "exit idle " .. tostring(next))
        end
        function run_enter(id, previous, ctx)
            table.insert(log, string.format("enter run %s %.2f", tostring(previous), ctx.time_in_phase))
        end
        function joined() return table.concat(log, "|") end
    )"));

    Phase phase("idle");
    phase.phases["idle"] = PhaseCallbacks{std::string("idle_enter"), std::string("idle_update"), std::string("idle_exit")};
    phase.phases["run"] = PhaseCallbacks{std::string("run_enter"), std::nullopt, std::nullopt};
    flecs::entity e = world.entity().set<Phase>(phase);

    auto history = [&]() {
        std::optional<std::string> result;
        REQUIRE(game->lua().call_function("joined", nullptr, &result) == CallStatus::Ok);
        return result.value_or("");
    };

    game->phases(.5f);
    REQUIRE(history() == "enter idle nil|update idle 0.00");

    game->phases(.5f);
    REQUIRE(history() == "enter idle nil|update idle 0.00|update idle 0.50");
    REQUIRE(e.get<Phase>()->next == std::optional<std::string>("run"));

    game->phases(.5f);
    REQUIRE(history() == "enter idle nil|update idle 0.00|update idle 0.50|exit idle run|enter run idle 0.00");
    REQUIRE(e.get<Phase>()->current == "run");
    REQUIRE(e.get<Phase>()->previous == std::optional<std::string>("idle"));
    REQUIRE_FALSE(e.get<Phase>()->next);
}

TEST_CASE("Native phase callbacks see the same ordering", "[phase]") {
    auto game = make_game();
    flecs::world& world = game->world();
    calls.clear();

    Phase phase("idle");
    phase.phases["idle"] = PhaseCallbacks{&record, &jump_to_run, &record};
    phase.phases["run"] = PhaseCallbacks{&record, std::nullopt, std::nullopt};
    flecs::entity e = world.entity().set<Phase>(phase);

    game->phases(.25f);
    game->phases(.25f);
    game->phases(.25f);
    REQUIRE(calls == std::vector<std::string>{
        "enter:idle:nil",
        "update:idle:nil",
        "update:idle:nil",
        "exit:idle:run",
        "enter:run:idle"
    });
    REQUIRE(e.get<Phase>()->current == "run");
}

TEST_CASE("A transition asked for by the first on_enter waits a frame", "[phase][lua]") {
    auto game = make_game();
    flecs::world& world = game->world();
    REQUIRE(game->lua().run_string(R"(
        log = {}
        function idle_enter_returning(id, previous, ctx)
            table.insert(log, "enter idle " .. tostring(previous))
            return "run"
        end
        function idle_enter_queueing(id, previous, ctx)
            table.insert(log, "enter idle " .. tostring(previous))
            engine.phase_transition(id, "run")
        end
        function idle_exit(id, next, ctx)
            table.insert(log, "exit idle " .. tostring(next))
        end
        function run_enter(id, previous, ctx)
            table.insert(log, "enter run " .. tostring(previous))
        end
        function joined() return table.concat(log, "|") end
    )"));

    auto history = [&]() {
        std::optional<std::string> result;
        REQUIRE(game->lua().call_function("joined", nullptr, &result) == CallStatus::Ok);
        return result.value_or("");
    };

    auto check = [&](const std::string& enter) {
        Phase phase("idle");
        phase.phases["idle"] = PhaseCallbacks{enter, std::nullopt, std::string("idle_exit")};
        phase.phases["run"] = PhaseCallbacks{std::string("run_enter"), std::nullopt, std::nullopt};
        flecs::entity e = world.entity().set<Phase>(phase);

        game->phases(.1f);
        REQUIRE(history() == "enter idle nil");
        REQUIRE(e.get<Phase>()->current == "idle");
        REQUIRE(e.get<Phase>()->next == std::optional<std::string>("run"));

        game->phases(.1f);
        REQUIRE(history() == "enter idle nil|exit idle run|enter run idle");
        REQUIRE(e.get<Phase>()->current == "run");
        REQUIRE_FALSE(e.get<Phase>()->next);
    };

    SECTION("returned from the callback") {
        check("idle_enter_returning");
    }

    SECTION("queued through phase_transition") {
        check("idle_enter_queueing");
    }
}

TEST_CASE("A returned phase name wins over a queued transition", "[phase][lua]") {
    auto game = make_game();
    flecs::world& world = game->world();
    REQUIRE(game->lua().run_string(R"(
        function decide(id, time, ctx)
            engine.phase_transition(id, "queued")
            return "returned"
        end
        function stay(id, time, ctx)
            return "idle"
        end
    )"));

    SECTION("different name requests the transition") {
        Phase phase("idle");
        phase.needs_enter_callback = false;
        phase.phases["idle"] = PhaseCallbacks{std::nullopt, std::string("decide"), std::nullopt};
        flecs::entity e = world.entity().set<Phase>(phase);
        game->phases(.1f);
        REQUIRE(e.get<Phase>()->next == std::optional<std::string>("returned"));
    }

    SECTION("returning the current name changes nothing") {
        Phase phase("idle");
        phase.needs_enter_callback = false;
        phase.phases["idle"] = PhaseCallbacks{std::nullopt, std::string("stay"), std::nullopt};
        flecs::entity e = world.entity().set<Phase>(phase);
        game->phases(.1f);
        REQUIRE_FALSE(e.get<Phase>()->next);
        REQUIRE_THAT(e.get<Phase>()->time_in_phase, WithinAbs(.1f, 1e-6));
    }
}

TEST_CASE("Phase transitions on dead entities are ignored", "[phase]") {
    auto game = make_game();
    flecs::world& world = game->world();
    flecs::entity e = world.entity().set<Phase>(Phase("idle"));
    flecs::entity_t id = e.id();
    e.destruct();
    game->commands().apply(PhaseCmd{cmd::PhaseTransition{id, "run"}});
    game->phases(.1f);
    REQUIRE_FALSE(world.is_alive(id));
}
