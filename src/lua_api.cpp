//
//  lua_api.cpp
//  aberred
//
//  Created by the aberred authors on 14/10/2025.
//

#include "lua_runtime.hpp"
#include "log.hpp"
#include <algorithm>

// Collision-scoped variants are the same functions pointed at the per-pair
// queues, selected by the template argument.

static CommandQueues& queues(lua_State *L) {
    return LuaRuntime::from(L).queues();
}

template<bool Collision>
static void push_entity(lua_State *L, EntityCmd command) {
    LuaRuntime& runtime = LuaRuntime::from(L);
    if constexpr (Collision)
        runtime.collision_queues().entity.push(std::move(command));
    else
        runtime.queues().entity.push(std::move(command));
}

template<bool Collision>
static void push_signal(lua_State *L, SignalCmd command) {
    LuaRuntime& runtime = LuaRuntime::from(L);
    if constexpr (Collision)
        runtime.collision_queues().signal.push(std::move(command));
    else
        runtime.queues().signal.push(std::move(command));
}

// Logging

// Joined on the Lua stack, __tostring may raise
static const char* log_message(lua_State *L) {
    int n = lua_gettop(L);
    luaL_Buffer buffer;
    luaL_buffinit(L, &buffer);
    for (int i = 1; i <= n; i++) {
        if (i > 1)
            luaL_addchar(&buffer, '\t');
        luaL_tolstring(L, i, nullptr);
        luaL_addvalue(&buffer);
    }
    luaL_pushresult(&buffer);
    return lua_tostring(L, -1);
}

static int l_log_debug(lua_State *L) {
    $Log.debug("[Lua] {}", log_message(L));
    return 0;
}

static int l_log_info(lua_State *L) {
    $Log.info("[Lua] {}", log_message(L));
    return 0;
}

static int l_log_warn(lua_State *L) {
    $Log.warn("[Lua] {}", log_message(L));
    return 0;
}

static int l_log_error(lua_State *L) {
    $Log.error("[Lua] {}", log_message(L));
    return 0;
}

// Assets

static int l_load_texture(lua_State *L) {
    queues(L).asset.push(cmd::LoadTexture{check_string(L, 1), check_string(L, 2)});
    return 0;
}

static int l_load_font(lua_State *L) {
    queues(L).asset.push(cmd::LoadFont{check_string(L, 1), check_string(L, 2), check_float(L, 3)});
    return 0;
}

static int l_load_music(lua_State *L) {
    queues(L).asset.push(cmd::LoadMusic{check_string(L, 1), check_string(L, 2)});
    return 0;
}

static int l_load_sound(lua_State *L) {
    queues(L).asset.push(cmd::LoadSound{check_string(L, 1), check_string(L, 2)});
    return 0;
}

static int l_load_tilemap(lua_State *L) {
    queues(L).asset.push(cmd::LoadTilemap{check_string(L, 1), check_string(L, 2)});
    return 0;
}

// Spawning

template<bool Collision>
static int l_spawn(lua_State *L) {
    push_entity_builder(L, Collision);
    return 1;
}

template<bool Collision>
static int l_clone(lua_State *L) {
    push_entity_builder(L, Collision, std::string(check_string(L, 1)));
    return 1;
}

// Audio

static int l_play_music(lua_State *L) {
    queues(L).audio.push(cmd::PlayMusic{check_string(L, 1), opt_bool(L, 2, false)});
    return 0;
}

template<bool Collision>
static int l_play_sound(lua_State *L) {
    LuaRuntime& runtime = LuaRuntime::from(L);
    cmd::PlaySound command{check_string(L, 1)};
    if constexpr (Collision)
        runtime.collision_queues().audio.push(command);
    else
        runtime.queues().audio.push(command);
    return 0;
}

static int l_stop_all_music(lua_State *L) {
    queues(L).audio.push(cmd::StopAllMusic{});
    return 0;
}

static int l_stop_all_sounds(lua_State *L) {
    queues(L).audio.push(cmd::StopAllSounds{});
    return 0;
}

// World signals, reads come from the snapshot taken before the callback

static int l_get_scalar(lua_State *L) {
    auto value = LuaRuntime::from(L).signal_cache().get_scalar(check_string(L, 1));
    if (value)
        lua_pushnumber(L, *value);
    else
        lua_pushnil(L);
    return 1;
}

static int l_get_integer(lua_State *L) {
    auto value = LuaRuntime::from(L).signal_cache().get_integer(check_string(L, 1));
    if (value)
        lua_pushinteger(L, *value);
    else
        lua_pushnil(L);
    return 1;
}

static int l_get_string(lua_State *L) {
    auto value = LuaRuntime::from(L).signal_cache().get_string(check_string(L, 1));
    if (value)
        lua_pushstring(L, value->c_str());
    else
        lua_pushnil(L);
    return 1;
}

static int l_has_flag(lua_State *L) {
    lua_pushboolean(L, LuaRuntime::from(L).signal_cache().has_flag(check_string(L, 1)));
    return 1;
}

static int l_get_group_count(lua_State *L) {
    auto value = LuaRuntime::from(L).signal_cache().get_group_count(check_string(L, 1));
    if (value)
        lua_pushinteger(L, *value);
    else
        lua_pushnil(L);
    return 1;
}

static int l_get_entity(lua_State *L) {
    auto value = LuaRuntime::from(L).signal_cache().get_entity(check_string(L, 1));
    if (value)
        lua_pushinteger(L, entity_to_lua(*value));
    else
        lua_pushnil(L);
    return 1;
}

template<bool Collision>
static int l_set_scalar(lua_State *L) {
    push_signal<Collision>(L, cmd::SetScalar{check_string(L, 1), check_float(L, 2)});
    return 0;
}

template<bool Collision>
static int l_set_integer(lua_State *L) {
    push_signal<Collision>(L, cmd::SetInteger{check_string(L, 1), check_int(L, 2)});
    return 0;
}

template<bool Collision>
static int l_set_string(lua_State *L) {
    push_signal<Collision>(L, cmd::SetString{check_string(L, 1), check_string(L, 2)});
    return 0;
}

template<bool Collision>
static int l_set_flag(lua_State *L) {
    push_signal<Collision>(L, cmd::SetFlag{check_string(L, 1)});
    return 0;
}

template<bool Collision>
static int l_clear_flag(lua_State *L) {
    push_signal<Collision>(L, cmd::ClearFlag{check_string(L, 1)});
    return 0;
}

static int l_clear_scalar(lua_State *L) {
    push_signal<false>(L, cmd::ClearScalar{check_string(L, 1)});
    return 0;
}

static int l_clear_integer(lua_State *L) {
    push_signal<false>(L, cmd::ClearInteger{check_string(L, 1)});
    return 0;
}

static int l_clear_string(lua_State *L) {
    push_signal<false>(L, cmd::ClearString{check_string(L, 1)});
    return 0;
}

static int l_set_entity(lua_State *L) {
    push_signal<false>(L, cmd::SetEntity{check_string(L, 1), entity_from_lua(L, 2)});
    return 0;
}

static int l_remove_entity(lua_State *L) {
    push_signal<false>(L, cmd::RemoveEntity{check_string(L, 1)});
    return 0;
}

// Phase

template<bool Collision>
static int l_phase_transition(lua_State *L) {
    LuaRuntime& runtime = LuaRuntime::from(L);
    cmd::PhaseTransition command{entity_from_lua(L, 1), check_string(L, 2)};
    if constexpr (Collision)
        runtime.collision_queues().phase.push(command);
    else
        runtime.queues().phase.push(command);
    return 0;
}

// Entity

template<bool Collision>
static int l_entity_despawn(lua_State *L) {
    push_entity<Collision>(L, cmd::Despawn{entity_from_lua(L, 1)});
    return 0;
}

template<bool Collision>
static int l_entity_set_position(lua_State *L) {
    push_entity<Collision>(L, cmd::SetPosition{entity_from_lua(L, 1), check_vec2(L, 2)});
    return 0;
}

template<bool Collision>
static int l_entity_set_velocity(lua_State *L) {
    push_entity<Collision>(L, cmd::SetVelocity{entity_from_lua(L, 1), check_vec2(L, 2)});
    return 0;
}

static int l_entity_set_rotation(lua_State *L) {
    push_entity<false>(L, cmd::SetRotation{entity_from_lua(L, 1), check_float(L, 2)});
    return 0;
}

static int l_entity_set_scale(lua_State *L) {
    push_entity<false>(L, cmd::SetScale{entity_from_lua(L, 1), check_vec2(L, 2)});
    return 0;
}

template<bool Collision>
static int l_entity_set_speed(lua_State *L) {
    push_entity<Collision>(L, cmd::SetSpeed{entity_from_lua(L, 1), check_float(L, 2)});
    return 0;
}

static int l_entity_set_friction(lua_State *L) {
    push_entity<false>(L, cmd::SetFriction{entity_from_lua(L, 1), std::max(0.f, check_float(L, 2))});
    return 0;
}

// nil or a non-positive value removes the clamp
static int l_entity_set_max_speed(lua_State *L) {
    std::optional<float> speed;
    if (!lua_isnoneornil(L, 2)) {
        float value = check_float(L, 2);
        if (value > 0.f)
            speed = value;
    }
    push_entity<false>(L, cmd::SetMaxSpeed{entity_from_lua(L, 1), speed});
    return 0;
}

template<bool Collision>
static int l_entity_add_force(lua_State *L) {
    push_entity<Collision>(L, cmd::AddForce{entity_from_lua(L, 1), check_string(L, 2), check_vec2(L, 3), opt_bool(L, 5, true)});
    return 0;
}

static int l_entity_remove_force(lua_State *L) {
    push_entity<false>(L, cmd::RemoveForce{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

template<bool Collision>
static int l_entity_set_force_enabled(lua_State *L) {
    push_entity<Collision>(L, cmd::SetForceEnabled{entity_from_lua(L, 1), check_string(L, 2), opt_bool(L, 3, true)});
    return 0;
}

static int l_entity_set_force_value(lua_State *L) {
    push_entity<false>(L, cmd::SetForceValue{entity_from_lua(L, 1), check_string(L, 2), check_vec2(L, 3)});
    return 0;
}

template<bool Collision>
static int l_entity_freeze(lua_State *L) {
    push_entity<Collision>(L, cmd::Freeze{entity_from_lua(L, 1)});
    return 0;
}

template<bool Collision>
static int l_entity_unfreeze(lua_State *L) {
    push_entity<Collision>(L, cmd::Unfreeze{entity_from_lua(L, 1)});
    return 0;
}

// (id, target_id, follow_x, follow_y, offset_x, offset_y, stored_vx, stored_vy)
template<bool Collision>
static int l_entity_insert_stuckto(lua_State *L) {
    StuckTo stuck;
    stuck.target = entity_from_lua(L, 2);
    stuck.follow_x = opt_bool(L, 3, true);
    stuck.follow_y = opt_bool(L, 4, true);
    stuck.offset = glm::vec2(opt_float(L, 5, 0.f), opt_float(L, 6, 0.f));
    if (!lua_isnoneornil(L, 7))
        stuck.stored_velocity = check_vec2(L, 7);
    push_entity<Collision>(L, cmd::InsertStuckTo{entity_from_lua(L, 1), stuck});
    return 0;
}

template<bool Collision>
static int l_release_stuckto(lua_State *L) {
    push_entity<Collision>(L, cmd::ReleaseStuckTo{entity_from_lua(L, 1)});
    return 0;
}

template<bool Collision>
static int l_entity_insert_ttl(lua_State *L) {
    push_entity<Collision>(L, cmd::InsertTtl{entity_from_lua(L, 1), check_float(L, 2)});
    return 0;
}

template<bool Collision>
static int l_entity_insert_timer(lua_State *L) {
    push_entity<Collision>(L, cmd::InsertTimer{entity_from_lua(L, 1), check_float(L, 2), check_string(L, 3)});
    return 0;
}

static int l_entity_remove_timer(lua_State *L) {
    push_entity<false>(L, cmd::RemoveTimer{entity_from_lua(L, 1)});
    return 0;
}

template<bool Collision>
static int l_entity_insert_lua_timer(lua_State *L) {
    push_entity<Collision>(L, cmd::InsertLuaTimer{entity_from_lua(L, 1), check_float(L, 2), check_string(L, 3)});
    return 0;
}

static int l_entity_remove_lua_timer(lua_State *L) {
    push_entity<false>(L, cmd::RemoveLuaTimer{entity_from_lua(L, 1)});
    return 0;
}

// Trailing (easing, loop, backwards) are optional on every tween insert
template<typename T>
static T finish_tween(lua_State *L, T tween, int index) {
    if (!lua_isnoneornil(L, index))
        tween.easing = easing_from_name(check_string(L, index));
    if (!lua_isnoneornil(L, index + 1))
        tween.loop_mode = loop_mode_from_name(check_string(L, index + 1));
    if (opt_bool(L, index + 2, false))
        tween.set_backwards();
    return tween;
}

static int l_entity_insert_tween_position(lua_State *L) {
    TweenPosition tween(check_vec2(L, 2), check_vec2(L, 4), check_float(L, 6));
    push_entity<false>(L, cmd::InsertTweenPosition{entity_from_lua(L, 1), finish_tween(L, tween, 7)});
    return 0;
}

static int l_entity_insert_tween_rotation(lua_State *L) {
    TweenRotation tween(check_float(L, 2), check_float(L, 3), check_float(L, 4));
    push_entity<false>(L, cmd::InsertTweenRotation{entity_from_lua(L, 1), finish_tween(L, tween, 5)});
    return 0;
}

static int l_entity_insert_tween_scale(lua_State *L) {
    TweenScale tween(check_vec2(L, 2), check_vec2(L, 4), check_float(L, 6));
    push_entity<false>(L, cmd::InsertTweenScale{entity_from_lua(L, 1), finish_tween(L, tween, 7)});
    return 0;
}

static int l_entity_remove_tween_position(lua_State *L) {
    push_entity<false>(L, cmd::RemoveTweenPosition{entity_from_lua(L, 1)});
    return 0;
}

static int l_entity_remove_tween_rotation(lua_State *L) {
    push_entity<false>(L, cmd::RemoveTweenRotation{entity_from_lua(L, 1)});
    return 0;
}

static int l_entity_remove_tween_scale(lua_State *L) {
    push_entity<false>(L, cmd::RemoveTweenScale{entity_from_lua(L, 1)});
    return 0;
}

static int l_entity_restart_animation(lua_State *L) {
    push_entity<false>(L, cmd::RestartAnimation{entity_from_lua(L, 1)});
    return 0;
}

static int l_entity_set_animation(lua_State *L) {
    push_entity<false>(L, cmd::SetAnimation{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

static int l_entity_signal_set_scalar(lua_State *L) {
    push_entity<false>(L, cmd::SignalSetScalar{entity_from_lua(L, 1), check_string(L, 2), check_float(L, 3)});
    return 0;
}

template<bool Collision>
static int l_entity_signal_set_integer(lua_State *L) {
    push_entity<Collision>(L, cmd::SignalSetInteger{entity_from_lua(L, 1), check_string(L, 2),
                                                    check_int(L, 3)});
    return 0;
}

static int l_entity_signal_set_string(lua_State *L) {
    push_entity<false>(L, cmd::SignalSetString{entity_from_lua(L, 1), check_string(L, 2), check_string(L, 3)});
    return 0;
}

template<bool Collision>
static int l_entity_signal_set_flag(lua_State *L) {
    push_entity<Collision>(L, cmd::SignalSetFlag{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

template<bool Collision>
static int l_entity_signal_clear_flag(lua_State *L) {
    push_entity<Collision>(L, cmd::SignalClearFlag{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

static int l_entity_signal_clear_scalar(lua_State *L) {
    push_entity<false>(L, cmd::SignalClearScalar{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

static int l_entity_signal_clear_integer(lua_State *L) {
    push_entity<false>(L, cmd::SignalClearInteger{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

static int l_entity_signal_clear_string(lua_State *L) {
    push_entity<false>(L, cmd::SignalClearString{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

static int l_entity_set_shader(lua_State *L) {
    push_entity<false>(L, cmd::SetShader{entity_from_lua(L, 1), check_string(L, 2)});
    return 0;
}

static int l_entity_remove_shader(lua_State *L) {
    push_entity<false>(L, cmd::RemoveShader{entity_from_lua(L, 1)});
    return 0;
}

static int l_entity_shader_set_float(lua_State *L) {
    push_entity<false>(L, cmd::SetShaderUniform{entity_from_lua(L, 1), check_string(L, 2), check_float(L, 3)});
    return 0;
}

static int l_entity_shader_set_int(lua_State *L) {
    push_entity<false>(L, cmd::SetShaderUniform{entity_from_lua(L, 1), check_string(L, 2),
                                                check_int(L, 3)});
    return 0;
}

static int l_entity_shader_set_vec2(lua_State *L) {
    push_entity<false>(L, cmd::SetShaderUniform{entity_from_lua(L, 1), check_string(L, 2), check_vec2(L, 3)});
    return 0;
}

static int l_entity_shader_set_vec4(lua_State *L) {
    glm::vec4 value(check_float(L, 3), check_float(L, 4), check_float(L, 5), check_float(L, 6));
    push_entity<false>(L, cmd::SetShaderUniform{entity_from_lua(L, 1), check_string(L, 2), value});
    return 0;
}

static int l_entity_set_parent(lua_State *L) {
    push_entity<false>(L, cmd::SetParent{entity_from_lua(L, 1), entity_from_lua(L, 2)});
    return 0;
}

// Groups

static int l_track_group(lua_State *L) {
    queues(L).group.push(cmd::TrackGroup{check_string(L, 1)});
    return 0;
}

static int l_untrack_group(lua_State *L) {
    queues(L).group.push(cmd::UntrackGroup{check_string(L, 1)});
    return 0;
}

static int l_clear_tracked_groups(lua_State *L) {
    queues(L).group.push(cmd::ClearTrackedGroups{});
    return 0;
}

static int l_has_tracked_group(lua_State *L) {
    const auto& groups = LuaRuntime::from(L).tracked_groups_cache();
    lua_pushboolean(L, groups.find(check_string(L, 1)) != groups.end());
    return 1;
}

// Tilemaps, camera and animation

static int l_spawn_tiles(lua_State *L) {
    queues(L).tilemap.push(cmd::SpawnTiles{check_string(L, 1)});
    return 0;
}

template<bool Collision>
static int l_set_camera(lua_State *L) {
    cmd::SetCamera command{check_vec2(L, 1), check_vec2(L, 3), check_float(L, 5), check_float(L, 6)};
    LuaRuntime& runtime = LuaRuntime::from(L);
    if constexpr (Collision)
        runtime.collision_queues().camera.push(command);
    else
        runtime.queues().camera.push(command);
    return 0;
}

static int l_register_animation(lua_State *L) {
    AnimationResource animation;
    animation.tex_key = check_string(L, 2);
    animation.position = check_vec2(L, 3);
    animation.displacement = check_float(L, 5);
    lua_Integer frames = check_integer(L, 6);
    if (frames < 1)
        throw ScriptError("frame_count must be at least 1");
    animation.frame_count = static_cast<size_t>(frames);
    animation.fps = check_float(L, 7);
    animation.looped = opt_bool(L, 8, true);
    queues(L).animation.push(cmd::RegisterAnimation{check_string(L, 1), animation});
    return 0;
}

// Input

static ButtonState check_button(lua_State *L) {
    const char *name = check_string(L, 1);
    auto state = LuaRuntime::from(L).input_snapshot().get(name);
    if (!state)
        throw ScriptError(fmt::format("unknown input button '{}'", name));
    return *state;
}

static int l_input_pressed(lua_State *L) {
    lua_pushboolean(L, check_button(L).pressed);
    return 1;
}

static int l_input_just_pressed(lua_State *L) {
    lua_pushboolean(L, check_button(L).just_pressed);
    return 1;
}

static int l_input_just_released(lua_State *L) {
    lua_pushboolean(L, check_button(L).just_released);
    return 1;
}

static int l_input(lua_State *L) {
    LuaRuntime::from(L).push_input_table();
    return 1;
}

const std::vector<ApiFunction>& LuaRuntime::api() {
    static const std::vector<ApiFunction> functions = {
        {"log", "logging", "(...)", l_log_info},
        {"log_debug", "logging", "(...)", l_log_debug},
        {"log_info", "logging", "(...)", l_log_info},
        {"log_warn", "logging", "(...)", l_log_warn},
        {"log_error", "logging", "(...)", l_log_error},

        {"load_texture", "asset", "(id: string, path: string)", l_load_texture},
        {"load_font", "asset", "(id: string, path: string, size: number)", l_load_font},
        {"load_music", "asset", "(id: string, path: string)", l_load_music},
        {"load_sound", "asset", "(id: string, path: string)", l_load_sound},
        {"load_tilemap", "asset", "(id: string, path: string)", l_load_tilemap},

        {"spawn", "spawn", "(): EntityBuilder", l_spawn<false>},
        {"collision_spawn", "spawn", "(): EntityBuilder", l_spawn<true>},
        {"clone", "spawn", "(source_key: string): EntityBuilder", l_clone<false>},
        {"collision_clone", "spawn", "(source_key: string): EntityBuilder", l_clone<true>},

        {"play_music", "audio", "(id: string, looped: boolean)", l_play_music},
        {"play_sound", "audio", "(id: string)", l_play_sound<false>},
        {"stop_all_music", "audio", "()", l_stop_all_music},
        {"stop_all_sounds", "audio", "()", l_stop_all_sounds},
        {"collision_play_sound", "audio", "(id: string)", l_play_sound<true>},

        {"get_scalar", "signals", "(key: string): number?", l_get_scalar},
        {"get_integer", "signals", "(key: string): integer?", l_get_integer},
        {"get_string", "signals", "(key: string): string?", l_get_string},
        {"has_flag", "signals", "(key: string): boolean", l_has_flag},
        {"get_group_count", "signals", "(group: string): integer?", l_get_group_count},
        {"get_entity", "signals", "(key: string): integer?", l_get_entity},
        {"set_scalar", "signals", "(key: string, value: number)", l_set_scalar<false>},
        {"set_integer", "signals", "(key: string, value: integer)", l_set_integer<false>},
        {"set_string", "signals", "(key: string, value: string)", l_set_string<false>},
        {"set_flag", "signals", "(key: string)", l_set_flag<false>},
        {"clear_flag", "signals", "(key: string)", l_clear_flag<false>},
        {"clear_scalar", "signals", "(key: string)", l_clear_scalar},
        {"clear_integer", "signals", "(key: string)", l_clear_integer},
        {"clear_string", "signals", "(key: string)", l_clear_string},
        {"set_entity", "signals", "(key: string, id: integer)", l_set_entity},
        {"remove_entity", "signals", "(key: string)", l_remove_entity},
        {"collision_set_scalar", "signals", "(key: string, value: number)", l_set_scalar<true>},
        {"collision_set_integer", "signals", "(key: string, value: integer)", l_set_integer<true>},
        {"collision_set_string", "signals", "(key: string, value: string)", l_set_string<true>},
        {"collision_set_flag", "signals", "(key: string)", l_set_flag<true>},
        {"collision_clear_flag", "signals", "(key: string)", l_clear_flag<true>},

        {"phase_transition", "phase", "(id: integer, phase: string)", l_phase_transition<false>},
        {"collision_phase_transition", "phase", "(id: integer, phase: string)", l_phase_transition<true>},

        {"entity_despawn", "entity", "(id: integer)", l_entity_despawn<false>},
        {"entity_set_position", "entity", "(id: integer, x: number, y: number)", l_entity_set_position<false>},
        {"entity_set_velocity", "entity", "(id: integer, vx: number, vy: number)", l_entity_set_velocity<false>},
        {"entity_set_rotation", "entity", "(id: integer, degrees: number)", l_entity_set_rotation},
        {"entity_set_scale", "entity", "(id: integer, sx: number, sy: number)", l_entity_set_scale},
        {"entity_set_speed", "entity", "(id: integer, speed: number)", l_entity_set_speed<false>},
        {"entity_set_friction", "entity", "(id: integer, friction: number)", l_entity_set_friction},
        {"entity_set_max_speed", "entity", "(id: integer, speed: number?)", l_entity_set_max_speed},
        {"entity_add_force", "entity", "(id: integer, name: string, x: number, y: number, enabled?: boolean)", l_entity_add_force<false>},
        {"entity_remove_force", "entity", "(id: integer, name: string)", l_entity_remove_force},
        {"entity_set_force_enabled", "entity", "(id: integer, name: string, enabled: boolean)", l_entity_set_force_enabled<false>},
        {"entity_set_force_value", "entity", "(id: integer, name: string, x: number, y: number)", l_entity_set_force_value},
        {"entity_freeze", "entity", "(id: integer)", l_entity_freeze<false>},
        {"entity_unfreeze", "entity", "(id: integer)", l_entity_unfreeze<false>},
        {"entity_insert_stuckto", "entity", "(id: integer, target_id: integer, follow_x: boolean, follow_y: boolean, offset_x?: number, offset_y?: number, stored_vx?: number, stored_vy?: number)", l_entity_insert_stuckto<false>},
        {"release_stuckto", "entity", "(id: integer)", l_release_stuckto<false>},
        {"entity_insert_ttl", "entity", "(id: integer, seconds: number)", l_entity_insert_ttl<false>},
        {"entity_insert_timer", "entity", "(id: integer, duration: number, signal: string)", l_entity_insert_timer<false>},
        {"entity_remove_timer", "entity", "(id: integer)", l_entity_remove_timer},
        {"entity_insert_lua_timer", "entity", "(id: integer, duration: number, callback: string)", l_entity_insert_lua_timer<false>},
        {"entity_remove_lua_timer", "entity", "(id: integer)", l_entity_remove_lua_timer},
        {"entity_insert_tween_position", "entity", "(id: integer, fx: number, fy: number, tx: number, ty: number, duration: number, easing?: string, loop?: string, backwards?: boolean)", l_entity_insert_tween_position},
        {"entity_insert_tween_rotation", "entity", "(id: integer, from: number, to: number, duration: number, easing?: string, loop?: string, backwards?: boolean)", l_entity_insert_tween_rotation},
        {"entity_insert_tween_scale", "entity", "(id: integer, fx: number, fy: number, tx: number, ty: number, duration: number, easing?: string, loop?: string, backwards?: boolean)", l_entity_insert_tween_scale},
        {"entity_remove_tween_position", "entity", "(id: integer)", l_entity_remove_tween_position},
        {"entity_remove_tween_rotation", "entity", "(id: integer)", l_entity_remove_tween_rotation},
        {"entity_remove_tween_scale", "entity", "(id: integer)", l_entity_remove_tween_scale},
        {"entity_restart_animation", "entity", "(id: integer)", l_entity_restart_animation},
        {"entity_set_animation", "entity", "(id: integer, key: string)", l_entity_set_animation},
        {"entity_signal_set_scalar", "entity", "(id: integer, key: string, value: number)", l_entity_signal_set_scalar},
        {"entity_signal_set_integer", "entity", "(id: integer, key: string, value: integer)", l_entity_signal_set_integer<false>},
        {"entity_signal_set_string", "entity", "(id: integer, key: string, value: string)", l_entity_signal_set_string},
        {"entity_signal_set_flag", "entity", "(id: integer, key: string)", l_entity_signal_set_flag<false>},
        {"entity_signal_clear_flag", "entity", "(id: integer, key: string)", l_entity_signal_clear_flag<false>},
        {"entity_signal_clear_scalar", "entity", "(id: integer, key: string)", l_entity_signal_clear_scalar},
        {"entity_signal_clear_integer", "entity", "(id: integer, key: string)", l_entity_signal_clear_integer},
        {"entity_signal_clear_string", "entity", "(id: integer, key: string)", l_entity_signal_clear_string},
        {"entity_set_shader", "entity", "(id: integer, key: string)", l_entity_set_shader},
        {"entity_remove_shader", "entity", "(id: integer)", l_entity_remove_shader},
        {"entity_shader_set_float", "entity", "(id: integer, name: string, value: number)", l_entity_shader_set_float},
        {"entity_shader_set_int", "entity", "(id: integer, name: string, value: integer)", l_entity_shader_set_int},
        {"entity_shader_set_vec2", "entity", "(id: integer, name: string, x: number, y: number)", l_entity_shader_set_vec2},
        {"entity_shader_set_vec4", "entity", "(id: integer, name: string, x: number, y: number, z: number, w: number)", l_entity_shader_set_vec4},
        {"entity_set_parent", "entity", "(id: integer, parent_id: integer)", l_entity_set_parent},

        {"collision_entity_despawn", "collision", "(id: integer)", l_entity_despawn<true>},
        {"collision_entity_set_position", "collision", "(id: integer, x: number, y: number)", l_entity_set_position<true>},
        {"collision_entity_set_velocity", "collision", "(id: integer, vx: number, vy: number)", l_entity_set_velocity<true>},
        {"collision_entity_signal_set_integer", "collision", "(id: integer, key: string, value: integer)", l_entity_signal_set_integer<true>},
        {"collision_entity_signal_set_flag", "collision", "(id: integer, key: string)", l_entity_signal_set_flag<true>},
        {"collision_entity_signal_clear_flag", "collision", "(id: integer, key: string)", l_entity_signal_clear_flag<true>},
        {"collision_entity_insert_timer", "collision", "(id: integer, duration: number, signal: string)", l_entity_insert_timer<true>},
        {"collision_entity_insert_lua_timer", "collision", "(id: integer, duration: number, callback: string)", l_entity_insert_lua_timer<true>},
        {"collision_entity_insert_ttl", "collision", "(id: integer, seconds: number)", l_entity_insert_ttl<true>},
        {"collision_entity_insert_stuckto", "collision", "(id: integer, target_id: integer, follow_x: boolean, follow_y: boolean, offset_x?: number, offset_y?: number, stored_vx?: number, stored_vy?: number)", l_entity_insert_stuckto<true>},
        {"collision_entity_freeze", "collision", "(id: integer)", l_entity_freeze<true>},
        {"collision_entity_unfreeze", "collision", "(id: integer)", l_entity_unfreeze<true>},
        {"collision_entity_add_force", "collision", "(id: integer, name: string, x: number, y: number, enabled?: boolean)", l_entity_add_force<true>},
        {"collision_entity_set_force_enabled", "collision", "(id: integer, name: string, enabled: boolean)", l_entity_set_force_enabled<true>},
        {"collision_entity_set_speed", "collision", "(id: integer, speed: number)", l_entity_set_speed<true>},
        {"collision_release_stuckto", "collision", "(id: integer)", l_release_stuckto<true>},

        {"track_group", "groups", "(name: string)", l_track_group},
        {"untrack_group", "groups", "(name: string)", l_untrack_group},
        {"clear_tracked_groups", "groups", "()", l_clear_tracked_groups},
        {"has_tracked_group", "groups", "(name: string): boolean", l_has_tracked_group},

        {"spawn_tiles", "tilemap", "(id: string)", l_spawn_tiles},

        {"set_camera", "camera", "(tx: number, ty: number, ox: number, oy: number, rotation: number, zoom: number)", l_set_camera<false>},
        {"collision_set_camera", "camera", "(tx: number, ty: number, ox: number, oy: number, rotation: number, zoom: number)", l_set_camera<true>},

        {"register_animation", "animation", "(id: string, tex_key: string, px: number, py: number, displacement: number, frame_count: integer, fps: number, looped: boolean)", l_register_animation},

        {"input_pressed", "input", "(button: string): boolean", l_input_pressed},
        {"input_just_pressed", "input", "(button: string): boolean", l_input_just_pressed},
        {"input_just_released", "input", "(button: string): boolean", l_input_just_released},
        {"input", "input", "(): table", l_input},
    };
    return functions;
}

static void push_meta_entry(lua_State *L, const ApiFunction& fn) {
    lua_createtable(L, 0, 2);
    lua_pushstring(L, fn.category);
    lua_setfield(L, -2, "category");
    lua_pushstring(L, fn.signature);
    lua_setfield(L, -2, "signature");
}

void LuaRuntime::register_engine_api() {
    const auto& functions = api();
    lua_createtable(L, 0, static_cast<int>(functions.size()) + 1);
    for (const auto& fn : functions) {
        push_engine_function(L, fn);
        lua_setfield(L, -2, fn.name);
    }

    // engine.__meta = {functions = {name = {category, signature}}, builder = {...}}
    lua_createtable(L, 0, 2);
    lua_createtable(L, 0, static_cast<int>(functions.size()));
    for (const auto& fn : functions) {
        push_meta_entry(L, fn);
        lua_setfield(L, -2, fn.name);
    }
    lua_setfield(L, -2, "functions");
    const auto& methods = entity_builder_methods();
    lua_createtable(L, 0, static_cast<int>(methods.size()));
    for (const auto& method : methods) {
        push_meta_entry(L, method);
        lua_setfield(L, -2, method.name);
    }
    lua_setfield(L, -2, "builder");
    lua_setfield(L, -2, "__meta");

    lua_setglobal(L, "engine");
}
