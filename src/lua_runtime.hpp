//
//  lua_runtime.hpp
//  aberred
//
//  Created by the aberred authors on 13/10/2025.
//

#pragma once

#include "lua.hpp"
#include "flecs.h"
#include "commands.hpp"
#include "signals.hpp"
#include "resources.hpp"
#include "input.hpp"
#include "glm/vec2.hpp"
#include <string>
#include <stdexcept>
#include <vector>
#include <set>
#include <functional>
#include <optional>

#define RUNTIME_REGISTRY_KEY "__runtime__"
#define ENTITY_BUILDER_META "Aberred.EntityBuilder"

struct ApiFunction {
    const char *name;
    const char *category;
    const char *signature;
    lua_CFunction fn;
};

enum class CallStatus {
    Ok,
    NotFound,
    Error
};

// Owns the interpreter, the command queues scripts write into and the
// snapshots scripts read from. Nothing in here touches the world directly
// except the context builders, which only read.
class LuaRuntime {
    lua_State *L = nullptr;
    CommandQueues _queues;
    CollisionQueues _collision;

    WorldSignals _signals;
    std::set<std::string> _tracked_groups;
    InputSnapshot _input;

    struct EntityContextPool {
        int ctx = LUA_NOREF;
        int pos = LUA_NOREF;
        int screen_pos = LUA_NOREF;
        int vel = LUA_NOREF;
        int scale = LUA_NOREF;
        int rect = LUA_NOREF;
        int sprite = LUA_NOREF;
        int animation = LUA_NOREF;
        int timer = LUA_NOREF;
    } _entity_pool;

    struct BodyPool {
        int table = LUA_NOREF;
        int pos = LUA_NOREF;
        int vel = LUA_NOREF;
        int rect = LUA_NOREF;
    };

    struct CollisionContextPool {
        int ctx = LUA_NOREF;
        int sides = LUA_NOREF;
        BodyPool a, b;
    } _collision_pool;

    int new_pooled_table();
    void push_pooled(int ref);
    void release_pools();
    void register_engine_api();
    void fill_body(const BodyPool& pool, flecs::entity e);

public:
    explicit LuaRuntime(const std::string& package_path = "");
    ~LuaRuntime();
    LuaRuntime(const LuaRuntime&) = delete;
    LuaRuntime& operator=(const LuaRuntime&) = delete;

    static LuaRuntime& from(lua_State *L);
    static const std::vector<ApiFunction>& api();

    lua_State* state() const { return L; }

    bool run_file(const std::string& path);
    bool run_string(const std::string& code, const std::string& chunk_name = "=script");

    bool has_function(const std::string& name) const;

    // Calls the global function `name` with whatever `push_args` leaves on
    // the stack. When `result` is given and the function returns a string it
    // is stored there. Errors are logged with `tag`.
    CallStatus call_function(const std::string& name,
                             const std::function<int(lua_State*)>& push_args = nullptr,
                             std::optional<std::string> *result = nullptr,
                             const char *tag = "[Lua]");

    CommandQueues& queues() { return _queues; }
    CollisionQueues& collision_queues() { return _collision; }
    void clear_all_commands();

    // Copies only when the world's signals were written since the last call
    void update_signal_cache(const WorldSignals& signals) {
        if (signals.stamp() != _signals.stamp())
            _signals = signals;
    }
    void update_tracked_groups_cache(const TrackedGroups& groups) { _tracked_groups = groups.groups(); }
    void update_input_snapshot(const InputSnapshot& input) { _input = input; }

    const WorldSignals& signal_cache() const { return _signals; }
    const std::set<std::string>& tracked_groups_cache() const { return _tracked_groups; }
    const InputSnapshot& input_snapshot() const { return _input; }

    // Pushes the pooled context table for `e`. The table and its fixed
    // sub-tables are rewritten by the next push.
    void push_entity_context(flecs::entity e);
    void push_collision_context(flecs::entity a, flecs::entity b);
    void push_input_table();
};

// Raised by engine functions instead of luaL_error. The wrapper pushed by
// push_engine_function turns it into a Lua error after the C++ frames of the
// call are gone, nothing may longjmp past a live destructor.
class ScriptError: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Shared helpers for the API and builder translation units. The readers
// throw ScriptError where the luaL_check* family would jump.
lua_Integer entity_to_lua(flecs::entity_t id);
flecs::entity_t entity_from_lua(lua_State *L, int index);
void push_signals_table(lua_State *L, const Signals& signals);
void push_engine_function(lua_State *L, const ApiFunction& fn);

const char* check_string(lua_State *L, int index);
lua_Integer check_integer(lua_State *L, int index);
int check_int(lua_State *L, int index);
float check_float(lua_State *L, int index);
float opt_float(lua_State *L, int index, float fallback);
lua_Integer opt_integer(lua_State *L, int index, lua_Integer fallback);
glm::vec2 check_vec2(lua_State *L, int index);
bool opt_bool(lua_State *L, int index, bool fallback);
void check_table(lua_State *L, int index);
// Pushes table[name] without invoking metamethods and returns its type
int raw_field(lua_State *L, int table, const char *name);

void register_entity_builder(lua_State *L);
void push_entity_builder(lua_State *L, bool collision_scoped, std::optional<std::string> clone_source = std::nullopt);
const std::vector<ApiFunction>& entity_builder_methods();
