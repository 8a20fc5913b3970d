//
//  lua_runtime.cpp
//  aberred
//
//  Created by the aberred authors on 13/10/2025.
//

#include "lua_runtime.hpp"
#include "log.hpp"
#include <algorithm>
#include <climits>
#include <cstdio>
#include <stdexcept>

lua_Integer entity_to_lua(flecs::entity_t id) {
    return static_cast<lua_Integer>(id);
}

static ScriptError arg_error(lua_State *L, int index, const char *expected) {
    return ScriptError(fmt::format("bad argument #{} ({} expected, got {})", index, expected, luaL_typename(L, index)));
}

const char* check_string(lua_State *L, int index) {
    int type = lua_type(L, index);
    if (type != LUA_TSTRING && type != LUA_TNUMBER)
        throw arg_error(L, index, "string");
    return lua_tostring(L, index);
}

lua_Integer check_integer(lua_State *L, int index) {
    int is_integer = 0;
    lua_Integer value = lua_tointegerx(L, index, &is_integer);
    if (!is_integer) {
        if (lua_isnumber(L, index))
            throw ScriptError(fmt::format("bad argument #{} (number has no integer representation)", index));
        throw arg_error(L, index, "integer");
    }
    return value;
}

int check_int(lua_State *L, int index) {
    lua_Integer value = check_integer(L, index);
    if (value < INT_MIN || value > INT_MAX)
        throw ScriptError(fmt::format("bad argument #{} (integer {} out of range)", index, value));
    return static_cast<int>(value);
}

float check_float(lua_State *L, int index) {
    int is_number = 0;
    lua_Number value = lua_tonumberx(L, index, &is_number);
    if (!is_number)
        throw arg_error(L, index, "number");
    return static_cast<float>(value);
}

float opt_float(lua_State *L, int index, float fallback) {
    return lua_isnoneornil(L, index) ? fallback : check_float(L, index);
}

lua_Integer opt_integer(lua_State *L, int index, lua_Integer fallback) {
    return lua_isnoneornil(L, index) ? fallback : check_integer(L, index);
}

glm::vec2 check_vec2(lua_State *L, int index) {
    return glm::vec2(check_float(L, index), check_float(L, index + 1));
}

bool opt_bool(lua_State *L, int index, bool fallback) {
    return lua_isnoneornil(L, index) ? fallback : lua_toboolean(L, index) != 0;
}

void check_table(lua_State *L, int index) {
    if (!lua_istable(L, index))
        throw arg_error(L, index, "table");
}

int raw_field(lua_State *L, int table, const char *name) {
    table = lua_absindex(L, table);
    lua_pushstring(L, name);
    return lua_rawget(L, table);
}

flecs::entity_t entity_from_lua(lua_State *L, int index) {
    lua_Integer value = check_integer(L, index);
    if (value < 0)
        throw ScriptError(fmt::format("bad argument #{} (entity id {} is negative)", index, value));
    return static_cast<flecs::entity_t>(value);
}

// Runs the wrapped function. A ScriptError is copied out and raised only once
// the try block, and every C++ object the call created, is gone.
static int engine_function(lua_State *L) {
    const ApiFunction *fn = static_cast<const ApiFunction*>(lua_touserdata(L, lua_upvalueindex(1)));
    char message[512];
    try {
        return fn->fn(L);
    } catch (const std::exception& e) {
        std::snprintf(message, sizeof(message), "%s(): %s", fn->name, e.what());
    }
    luaL_where(L, 1);
    lua_pushstring(L, message);
    lua_concat(L, 2);
    return lua_error(L);
}

void push_engine_function(lua_State *L, const ApiFunction& fn) {
    lua_pushlightuserdata(L, const_cast<ApiFunction*>(&fn));
    lua_pushcclosure(L, engine_function, 1);
}

static void set_number(lua_State *L, const char *name, lua_Number value) {
    lua_pushnumber(L, value);
    lua_setfield(L, -2, name);
}

static void set_nil(lua_State *L, const char *name) {
    lua_pushnil(L);
    lua_setfield(L, -2, name);
}

// Signal maps have variable keys so they are never pooled
void push_signals_table(lua_State *L, const Signals& signals) {
    lua_createtable(L, 0, 4);

    std::vector<std::string> flags(signals.flags().begin(), signals.flags().end());
    std::sort(flags.begin(), flags.end());
    lua_createtable(L, static_cast<int>(flags.size()), 0);
    for (size_t i = 0; i < flags.size(); i++) {
        lua_pushstring(L, flags[i].c_str());
        lua_rawseti(L, -2, static_cast<lua_Integer>(i + 1));
    }
    lua_setfield(L, -2, "flags");

    lua_createtable(L, 0, static_cast<int>(signals.integers().size()));
    for (const auto& [key, value] : signals.integers()) {
        lua_pushinteger(L, value);
        lua_setfield(L, -2, key.c_str());
    }
    lua_setfield(L, -2, "integers");

    lua_createtable(L, 0, static_cast<int>(signals.scalars().size()));
    for (const auto& [key, value] : signals.scalars()) {
        lua_pushnumber(L, value);
        lua_setfield(L, -2, key.c_str());
    }
    lua_setfield(L, -2, "scalars");

    lua_createtable(L, 0, static_cast<int>(signals.strings().size()));
    for (const auto& [key, value] : signals.strings()) {
        lua_pushstring(L, value.c_str());
        lua_setfield(L, -2, key.c_str());
    }
    lua_setfield(L, -2, "strings");
}

LuaRuntime::LuaRuntime(const std::string& package_path) {
    L = luaL_newstate();
    if (!L)
        throw std::runtime_error("Failed to create Lua state");
    luaL_openlibs(L);

    if (!package_path.empty()) {
        lua_getglobal(L, "package");
        lua_getfield(L, -1, "path");
        std::string current_path = lua_tostring(L, -1);
        std::string new_path = package_path + ";" + current_path;
        lua_pop(L, 1);
        lua_pushstring(L, new_path.c_str());
        lua_setfield(L, -2, "path");
        lua_pop(L, 1);
    }

    lua_pushlightuserdata(L, this);
    lua_setfield(L, LUA_REGISTRYINDEX, RUNTIME_REGISTRY_KEY);

    register_entity_builder(L);
    register_engine_api();

    _entity_pool.ctx = new_pooled_table();
    _entity_pool.pos = new_pooled_table();
    _entity_pool.screen_pos = new_pooled_table();
    _entity_pool.vel = new_pooled_table();
    _entity_pool.scale = new_pooled_table();
    _entity_pool.rect = new_pooled_table();
    _entity_pool.sprite = new_pooled_table();
    _entity_pool.animation = new_pooled_table();
    _entity_pool.timer = new_pooled_table();

    _collision_pool.ctx = new_pooled_table();
    _collision_pool.sides = new_pooled_table();
    for (BodyPool *body : {&_collision_pool.a, &_collision_pool.b}) {
        body->table = new_pooled_table();
        body->pos = new_pooled_table();
        body->vel = new_pooled_table();
        body->rect = new_pooled_table();
    }
}

LuaRuntime::~LuaRuntime() {
    if (L) {
        release_pools();
        lua_close(L);
        L = nullptr;
    }
}

int LuaRuntime::new_pooled_table() {
    lua_newtable(L);
    return luaL_ref(L, LUA_REGISTRYINDEX);
}

void LuaRuntime::push_pooled(int ref) {
    lua_rawgeti(L, LUA_REGISTRYINDEX, ref);
}

void LuaRuntime::release_pools() {
    int refs[] = {
        _entity_pool.ctx, _entity_pool.pos, _entity_pool.screen_pos, _entity_pool.vel, _entity_pool.scale,
        _entity_pool.rect, _entity_pool.sprite, _entity_pool.animation, _entity_pool.timer,
        _collision_pool.ctx, _collision_pool.sides,
        _collision_pool.a.table, _collision_pool.a.pos, _collision_pool.a.vel, _collision_pool.a.rect,
        _collision_pool.b.table, _collision_pool.b.pos, _collision_pool.b.vel, _collision_pool.b.rect
    };
    for (int ref : refs)
        luaL_unref(L, LUA_REGISTRYINDEX, ref);
}

LuaRuntime& LuaRuntime::from(lua_State *L) {
    lua_getfield(L, LUA_REGISTRYINDEX, RUNTIME_REGISTRY_KEY);
    LuaRuntime *runtime = static_cast<LuaRuntime*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    if (!runtime)
        throw ScriptError("engine runtime not found in Lua registry");
    return *runtime;
}

bool LuaRuntime::run_file(const std::string& path) {
    if (luaL_loadfile(L, path.c_str()) != LUA_OK ||
        lua_pcall(L, 0, 0, 0) != LUA_OK) {
        const char *error_msg = lua_tostring(L, -1);
        $Log.error("[Lua] Error in '{}': {}", path, error_msg ? error_msg : "unknown error");
        lua_pop(L, 1);
        return false;
    }
    return true;
}

bool LuaRuntime::run_string(const std::string& code, const std::string& chunk_name) {
    if (luaL_loadbuffer(L, code.data(), code.size(), chunk_name.c_str()) != LUA_OK ||
        lua_pcall(L, 0, 0, 0) != LUA_OK) {
        const char *error_msg = lua_tostring(L, -1);
        $Log.error("[Lua] Error in {}: {}", chunk_name, error_msg ? error_msg : "unknown error");
        lua_pop(L, 1);
        return false;
    }
    return true;
}

bool LuaRuntime::has_function(const std::string& name) const {
    lua_getglobal(L, name.c_str());
    bool found = lua_isfunction(L, -1);
    lua_pop(L, 1);
    return found;
}

CallStatus LuaRuntime::call_function(const std::string& name,
                                     const std::function<int(lua_State*)>& push_args,
                                     std::optional<std::string> *result,
                                     const char *tag) {
    int top = lua_gettop(L);
    lua_getglobal(L, name.c_str());
    if (!lua_isfunction(L, -1)) {
        lua_settop(L, top);
        $Log.warn("{} Function '{}' not found", tag, name);
        return CallStatus::NotFound;
    }
    int nargs = push_args ? push_args(L) : 0;
    if (lua_pcall(L, nargs, 1, 0) != LUA_OK) {
        const char *error_msg = lua_tostring(L, -1);
        $Log.error("{} Error calling '{}': {}", tag, name, error_msg ? error_msg : "unknown error");
        lua_settop(L, top);
        return CallStatus::Error;
    }
    if (result) {
        if (lua_type(L, -1) == LUA_TSTRING)
            *result = std::string(lua_tostring(L, -1));
        else
            result->reset();
    }
    lua_settop(L, top);
    return CallStatus::Ok;
}

void LuaRuntime::clear_all_commands() {
    _queues.clear();
    _collision.clear();
}

void LuaRuntime::push_entity_context(flecs::entity e) {
    push_pooled(_entity_pool.ctx);
    lua_pushinteger(L, entity_to_lua(e.id()));
    lua_setfield(L, -2, "id");

    if (const Group *group = e.get<Group>()) {
        lua_pushstring(L, group->name.c_str());
        lua_setfield(L, -2, "group");
    } else
        set_nil(L, "group");

    if (const MapPosition *pos = e.get<MapPosition>()) {
        push_pooled(_entity_pool.pos);
        set_number(L, "x", pos->pos.x);
        set_number(L, "y", pos->pos.y);
        lua_setfield(L, -2, "pos");
    } else
        set_nil(L, "pos");

    if (const ScreenPosition *pos = e.get<ScreenPosition>()) {
        push_pooled(_entity_pool.screen_pos);
        set_number(L, "x", pos->pos.x);
        set_number(L, "y", pos->pos.y);
        lua_setfield(L, -2, "screen_pos");
    } else
        set_nil(L, "screen_pos");

    if (const RigidBody *body = e.get<RigidBody>()) {
        push_pooled(_entity_pool.vel);
        set_number(L, "x", body->velocity.x);
        set_number(L, "y", body->velocity.y);
        lua_setfield(L, -2, "vel");
        set_number(L, "speed_sq", glm::dot(body->velocity, body->velocity));
        lua_pushboolean(L, body->frozen);
        lua_setfield(L, -2, "frozen");
    } else {
        set_nil(L, "vel");
        set_nil(L, "speed_sq");
        set_nil(L, "frozen");
    }

    if (const Rotation *rotation = e.get<Rotation>())
        set_number(L, "rotation", rotation->degrees);
    else
        set_nil(L, "rotation");

    if (const Scale *scale = e.get<Scale>()) {
        push_pooled(_entity_pool.scale);
        set_number(L, "x", scale->scale.x);
        set_number(L, "y", scale->scale.y);
        lua_setfield(L, -2, "scale");
    } else
        set_nil(L, "scale");

    const BoxCollider *collider = e.get<BoxCollider>();
    const MapPosition *pos = e.get<MapPosition>();
    if (collider && pos) {
        Rect r = collider->rect(pos->pos);
        push_pooled(_entity_pool.rect);
        set_number(L, "x", r.x);
        set_number(L, "y", r.y);
        set_number(L, "w", r.w);
        set_number(L, "h", r.h);
        lua_setfield(L, -2, "rect");
    } else
        set_nil(L, "rect");

    if (const Sprite *sprite = e.get<Sprite>()) {
        push_pooled(_entity_pool.sprite);
        lua_pushstring(L, sprite->tex_key.c_str());
        lua_setfield(L, -2, "tex_key");
        lua_pushboolean(L, sprite->flip_h);
        lua_setfield(L, -2, "flip_h");
        lua_pushboolean(L, sprite->flip_v);
        lua_setfield(L, -2, "flip_v");
        lua_setfield(L, -2, "sprite");
    } else
        set_nil(L, "sprite");

    if (const Animation *animation = e.get<Animation>()) {
        push_pooled(_entity_pool.animation);
        lua_pushstring(L, animation->key.c_str());
        lua_setfield(L, -2, "key");
        lua_pushinteger(L, static_cast<lua_Integer>(animation->frame_index));
        lua_setfield(L, -2, "frame_index");
        set_number(L, "elapsed", animation->elapsed);
        lua_setfield(L, -2, "animation");
    } else
        set_nil(L, "animation");

    if (const Signals *signals = e.get<Signals>()) {
        push_signals_table(L, *signals);
        lua_setfield(L, -2, "signals");
    } else
        set_nil(L, "signals");

    if (const Phase *phase = e.get<Phase>()) {
        lua_pushstring(L, phase->current.c_str());
        lua_setfield(L, -2, "phase");
        set_number(L, "time_in_phase", phase->time_in_phase);
        if (phase->previous)
            lua_pushstring(L, phase->previous->c_str());
        else
            lua_pushnil(L);
        lua_setfield(L, -2, "previous_phase");
    } else {
        set_nil(L, "phase");
        set_nil(L, "time_in_phase");
        set_nil(L, "previous_phase");
    }

    if (const LuaTimer *timer = e.get<LuaTimer>()) {
        push_pooled(_entity_pool.timer);
        set_number(L, "duration", timer->duration);
        set_number(L, "elapsed", timer->elapsed);
        lua_pushstring(L, timer->callback.c_str());
        lua_setfield(L, -2, "callback");
        lua_setfield(L, -2, "timer");
    } else
        set_nil(L, "timer");
}

void LuaRuntime::fill_body(const BodyPool& pool, flecs::entity e) {
    push_pooled(pool.table);
    lua_pushinteger(L, entity_to_lua(e.id()));
    lua_setfield(L, -2, "id");

    if (const Group *group = e.get<Group>()) {
        lua_pushstring(L, group->name.c_str());
        lua_setfield(L, -2, "group");
    } else
        set_nil(L, "group");

    const MapPosition *pos = e.get<MapPosition>();
    if (pos) {
        push_pooled(pool.pos);
        set_number(L, "x", pos->pos.x);
        set_number(L, "y", pos->pos.y);
        lua_setfield(L, -2, "pos");
    } else
        set_nil(L, "pos");

    if (const RigidBody *body = e.get<RigidBody>()) {
        push_pooled(pool.vel);
        set_number(L, "x", body->velocity.x);
        set_number(L, "y", body->velocity.y);
        lua_setfield(L, -2, "vel");
        set_number(L, "speed_sq", glm::dot(body->velocity, body->velocity));
    } else {
        set_nil(L, "vel");
        set_nil(L, "speed_sq");
    }

    const BoxCollider *collider = e.get<BoxCollider>();
    if (collider && pos) {
        Rect r = collider->rect(pos->pos);
        push_pooled(pool.rect);
        set_number(L, "x", r.x);
        set_number(L, "y", r.y);
        set_number(L, "w", r.w);
        set_number(L, "h", r.h);
        lua_setfield(L, -2, "rect");
    } else
        set_nil(L, "rect");

    if (const Signals *signals = e.get<Signals>()) {
        push_signals_table(L, *signals);
        lua_setfield(L, -2, "signals");
    } else
        set_nil(L, "signals");
}

static void push_side_list(lua_State *L, const std::vector<BoxSide>& sides) {
    lua_createtable(L, static_cast<int>(sides.size()), 0);
    for (size_t i = 0; i < sides.size(); i++) {
        lua_pushstring(L, box_side_name(sides[i]));
        lua_rawseti(L, -2, static_cast<lua_Integer>(i + 1));
    }
}

void LuaRuntime::push_collision_context(flecs::entity a, flecs::entity b) {
    push_pooled(_collision_pool.ctx);

    fill_body(_collision_pool.a, a);
    lua_setfield(L, -2, "a");
    fill_body(_collision_pool.b, b);
    lua_setfield(L, -2, "b");

    std::vector<BoxSide> sides_a, sides_b;
    const BoxCollider *ca = a.get<BoxCollider>();
    const BoxCollider *cb = b.get<BoxCollider>();
    const MapPosition *pa = a.get<MapPosition>();
    const MapPosition *pb = b.get<MapPosition>();
    if (ca && cb && pa && pb) {
        if (auto sides = colliding_sides(ca->rect(pa->pos), cb->rect(pb->pos))) {
            sides_a = std::move(sides->first);
            sides_b = std::move(sides->second);
        }
    }
    push_pooled(_collision_pool.sides);
    push_side_list(L, sides_a);
    lua_setfield(L, -2, "a");
    push_side_list(L, sides_b);
    lua_setfield(L, -2, "b");
    lua_setfield(L, -2, "sides");
}

static void push_button(lua_State *L, const ButtonState& state) {
    lua_createtable(L, 0, 3);
    lua_pushboolean(L, state.pressed);
    lua_setfield(L, -2, "pressed");
    lua_pushboolean(L, state.just_pressed);
    lua_setfield(L, -2, "just_pressed");
    lua_pushboolean(L, state.just_released);
    lua_setfield(L, -2, "just_released");
}

void LuaRuntime::push_input_table() {
    lua_createtable(L, 0, 1);
    lua_createtable(L, 0, 8);
#define X(NAME)                   \
    push_button(L, _input.NAME);  \
    lua_setfield(L, -2, #NAME);
    DIGITAL_BUTTONS
#undef X
    lua_setfield(L, -2, "digital");
}
