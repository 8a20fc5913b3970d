/**
 * @file TestSignals.cpp
 * @brief World and entity signals, group counting, text bindings and script snapshots
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Signals store typed values by key", "[signals]") {
    Signals signals;

    SECTION("set flag reports whether anything changed") {
        REQUIRE(signals.set_flag("ready"));
        REQUIRE_FALSE(signals.set_flag("ready"));
        REQUIRE(signals.clear_flag("ready"));
        REQUIRE_FALSE(signals.clear_flag("ready"));
    }

    SECTION("display strings prefer integers, then scalars, strings and flags") {
        signals.set_integer("score", 42);
        signals.set_scalar("score", 1.5f);
        signals.set_scalar("speed", 2.5f);
        signals.set_string("name", "ada");
        signals.set_flag("alive");
        REQUIRE(signals.to_display_string("score") == std::optional<std::string>("42"));
        REQUIRE(signals.to_display_string("speed") == std::optional<std::string>("2.5"));
        REQUIRE(signals.to_display_string("name") == std::optional<std::string>("ada"));
        REQUIRE(signals.to_display_string("alive") == std::optional<std::string>("true"));
        REQUIRE_FALSE(signals.to_display_string("missing"));
    }

    SECTION("clearing group counts leaves other integers") {
        WorldSignals world;
        world.set_integer("lives", 3);
        world.set_group_count("enemy", 4);
        world.clear_group_counts();
        REQUIRE(*world.get_integer("lives") == 3);
        REQUIRE_FALSE(world.get_group_count("enemy"));
    }
}

TEST_CASE("Setting a flag that is already set changes nothing", "[signals][commands]") {
    auto game = make_game();
    flecs::world& world = game->world();
    game->commands().apply(SignalCmd{cmd::SetFlag{"door_open"}});
    WorldSignals before = *world.get<WorldSignals>();
    game->commands().apply(SignalCmd{cmd::SetFlag{"door_open"}});
    REQUIRE(*world.get<WorldSignals>() == before);

    flecs::entity e = world.entity().set<Signals>({});
    game->commands().apply(EntityCmd{cmd::SignalSetFlag{e.id(), "lit"}});
    Signals entity_before = *e.get<Signals>();
    game->commands().apply(EntityCmd{cmd::SignalSetFlag{e.id(), "lit"}});
    REQUIRE(*e.get<Signals>() == entity_before);
}

TEST_CASE("The script snapshot follows world writes only", "[signals][lua]") {
    LuaRuntime lua;
    WorldSignals world;
    world.set_integer("lives", 3);
    world.set_entity("player", 42);

    lua.update_signal_cache(world);
    REQUIRE(lua.signal_cache().stamp() == world.stamp());
    REQUIRE(*lua.signal_cache().get_integer("lives") == 3);

    SECTION("reads leave the stamp alone") {
        std::uint64_t stamp = world.stamp();
        REQUIRE(world.get_integer("lives"));
        REQUIRE_FALSE(world.has_flag("ready"));
        REQUIRE(world.stamp() == stamp);
    }

    SECTION("a write is picked up by the next update") {
        world.set_integer("lives", 2);
        world.remove_entity("player");
        REQUIRE(*lua.signal_cache().get_integer("lives") == 3);
        lua.update_signal_cache(world);
        REQUIRE(*lua.signal_cache().get_integer("lives") == 2);
        REQUIRE_FALSE(lua.signal_cache().get_entity("player"));
    }

    SECTION("a replaced world never matches an old snapshot") {
        WorldSignals fresh;
        fresh.set_integer("lives", 9);
        fresh.set_entity("player", 7);
        REQUIRE(fresh.stamp() != lua.signal_cache().stamp());
        lua.update_signal_cache(fresh);
        REQUIRE(*lua.signal_cache().get_integer("lives") == 9);
        REQUIRE(*lua.signal_cache().get_entity("player") == 7);
    }

    SECTION("clearing group counts counts as a write") {
        world.set_group_count("enemy", 4);
        lua.update_signal_cache(world);
        world.clear_group_counts();
        lua.update_signal_cache(world);
        REQUIRE_FALSE(lua.signal_cache().get_group_count("enemy"));
    }
}

TEST_CASE("Tracked groups publish their population", "[signals][groups]") {
    auto game = make_game();
    flecs::world& world = game->world();
    game->commands().apply(GroupCmd{cmd::TrackGroup{"enemy"}});
    game->commands().apply(GroupCmd{cmd::TrackGroup{"coin"}});
    for (int i = 0; i < 3; i++)
        world.entity().set<Group>({"enemy"});
    world.entity().set<Group>({"player"});

    game->systems().group_counts();
    const WorldSignals *signals = world.get<WorldSignals>();
    REQUIRE(*signals->get_group_count("enemy") == 3);
    REQUIRE(*signals->get_group_count("coin") == 0);
    REQUIRE_FALSE(signals->get_group_count("player"));

    SECTION("counts follow despawns") {
        world.each([](flecs::entity e, const Group& group) {
            if (group.name == "enemy")
                e.destruct();
        });
        game->systems().group_counts();
        REQUIRE(*world.get<WorldSignals>()->get_group_count("enemy") == 0);
    }

    SECTION("untracking removes the count") {
        game->commands().apply(GroupCmd{cmd::UntrackGroup{"coin"}});
        game->systems().group_counts();
        REQUIRE_FALSE(world.get<WorldSignals>()->get_group_count("coin"));
    }
}

TEST_CASE("Signal bindings copy values into text", "[signals][text]") {
    auto game = make_game();
    flecs::world& world = game->world();

    SECTION("world signals with a format") {
        SignalBinding binding;
        binding.key = "score";
        binding.format = "Score: {}";
        flecs::entity label = world.entity()
            .set<DynamicText>(DynamicText("", "default", 8.f, Color()))
            .set<SignalBinding>(binding);
        game->commands().apply(SignalCmd{cmd::SetInteger{"score", 120}});
        game->systems().signal_bindings();
        REQUIRE(label.get<DynamicText>()->content() == "Score: 120");
        REQUIRE(label.get<DynamicText>()->dirty());
    }

    SECTION("an entity source") {
        Signals signals;
        signals.set_string("name", "bob");
        flecs::entity source = world.entity().set<Signals>(signals);
        SignalBinding binding;
        binding.key = "name";
        binding.source = source.id();
        flecs::entity label = world.entity()
            .set<DynamicText>(DynamicText("?", "default", 8.f, Color()))
            .set<SignalBinding>(binding);
        game->systems().signal_bindings();
        REQUIRE(label.get<DynamicText>()->content() == "bob");
    }

    SECTION("a missing key or dead source leaves the text") {
        SignalBinding binding;
        binding.key = "nothing";
        flecs::entity label = world.entity()
            .set<DynamicText>(DynamicText("keep", "default", 8.f, Color()))
            .set<SignalBinding>(binding);
        game->systems().signal_bindings();
        REQUIRE(label.get<DynamicText>()->content() == "keep");
    }

    SECTION("an unchanged value does not re-measure") {
        DynamicText text("7", "default", 8.f, Color());
        text.mark_measured();
        SignalBinding binding;
        binding.key = "count";
        flecs::entity label = world.entity().set<DynamicText>(text).set<SignalBinding>(binding);
        game->commands().apply(SignalCmd{cmd::SetInteger{"count", 7}});
        game->systems().signal_bindings();
        REQUIRE_FALSE(label.get<DynamicText>()->dirty());
    }
}

TEST_CASE("Dirty text is measured in glyph cells", "[text]") {
    auto game = make_game();
    flecs::world& world = game->world();
    flecs::entity label = world.entity().set<DynamicText>(DynamicText("abc\nde", "default", 10.f, Color()));
    game->systems().dynamic_text_sizes();
    REQUIRE(label.get<DynamicText>()->size == glm::vec2(30.f, 20.f));
    REQUIRE_FALSE(label.get<DynamicText>()->dirty());
}

TEST_CASE("Input snapshots", "[input]") {
    InputState input;

    SECTION("rebuilding from the same raw state gives equal snapshots") {
        input.key_down(KEY_W);
        input.key_down(KEY_SPACE);
        REQUIRE(InputSnapshot::from(input) == InputSnapshot::from(input));
    }

    SECTION("edges last one frame") {
        input.key_down(KEY_SPACE);
        InputSnapshot first = InputSnapshot::from(input);
        REQUIRE(first.action_1.pressed);
        REQUIRE(first.action_1.just_pressed);
        input.end_frame();
        InputSnapshot second = InputSnapshot::from(input);
        REQUIRE(second.action_1.pressed);
        REQUIRE_FALSE(second.action_1.just_pressed);
        input.key_up(KEY_SPACE);
        REQUIRE(InputSnapshot::from(input).action_1.just_released);
    }

    SECTION("directions merge both bindings") {
        input.key_down(KEY_UP);
        REQUIRE(InputSnapshot::from(input).up.pressed);
        input.key_up(KEY_UP);
        input.key_down(KEY_W);
        REQUIRE(InputSnapshot::from(input).up.pressed);
    }

    SECTION("scripts read the published snapshot") {
        auto game = make_game();
        REQUIRE(game->lua().run_string(R"(
            function read()
                local t = engine.input()
                return tostring(engine.input_pressed("left")) .. " " ..
                       tostring(t.digital.left.just_pressed) .. " " ..
                       tostring(engine.input_pressed("right"))
            end
        )"));
        input.key_down(KEY_A);
        game->lua().update_input_snapshot(InputSnapshot::from(input));
        std::optional<std::string> result;
        REQUIRE(game->lua().call_function("read", nullptr, &result) == CallStatus::Ok);
        REQUIRE(result == std::optional<std::string>("true true false"));
    }
}

TEST_CASE("Entity context tables", "[lua][context]") {
    auto game = make_game();
    flecs::world& world = game->world();
    REQUIRE(game->lua().run_string(R"(
        local function dump(value, indent)
            if type(value) ~= "table" then return tostring(value) end
            local keys = {}
            for k in pairs(value) do keys[#keys + 1] = tostring(k) end
            table.sort(keys)
            local out = {}
            for _, k in ipairs(keys) do
                local v = value[k]
                if v == nil then v = value[tonumber(k)] end
                out[#out + 1] = k .. "=" .. dump(v)
            end
            return "{" .. table.concat(out, ",") .. "}"
        end
        function serialize(ctx) return dump(ctx) end
        function twice(ctx)
            if dump(ctx) ~= dump(ctx) then error("unstable") end
            return dump(ctx)
        end
    )"));

    Signals signals;
    signals.set_flag("armed");
    signals.set_integer("hp", 3);
    RigidBody body;
    body.velocity = {3.f, 4.f};
    flecs::entity mover = world.entity()
        .set<Group>({"player"})
        .set<MapPosition>({glm::vec2(1.f, 2.f)})
        .set<RigidBody>(body)
        .set<Signals>(signals);
    flecs::entity still = world.entity().set<MapPosition>({glm::vec2(5.f, 5.f)});

    auto serialize = [&](const char *fn, flecs::entity e) {
        std::optional<std::string> result;
        REQUIRE(game->lua().call_function(fn, [&](lua_State*) {
            game->lua().push_entity_context(e);
            return 1;
        }, &result) == CallStatus::Ok);
        return result.value_or("");
    };

    SECTION("serializing twice in one callback is identical") {
        std::string dumped = serialize("twice", mover);
        REQUIRE(dumped.find("group=player") != std::string::npos);
        REQUIRE(dumped.find("speed_sq=25") != std::string::npos);
        REQUIRE(dumped.find("hp=3") != std::string::npos);
    }

    SECTION("fields of absent components are nil after reuse") {
        serialize("serialize", mover);
        std::string dumped = serialize("serialize", still);
        REQUIRE(dumped.find("vel=") == std::string::npos);
        REQUIRE(dumped.find("group=") == std::string::npos);
        REQUIRE(dumped.find("signals=") == std::string::npos);
        REQUIRE(dumped.find("pos={x=5") != std::string::npos);
    }
}
