//
//  entity_builder.cpp
//  aberred
//
//  Created by the aberred authors on 14/10/2025.
//

#include "lua_runtime.hpp"
#include "fmt/format.h"
#include <new>
#include <algorithm>
#include <climits>
#include <cmath>

struct EntityBuilder {
    SpawnCmd spawn;
    bool collision_scoped = false;
};

static EntityBuilder& check_builder(lua_State *L) {
    void *builder = luaL_testudata(L, 1, ENTITY_BUILDER_META);
    if (!builder)
        throw ScriptError(fmt::format("bad argument #1 (EntityBuilder expected, got {})", luaL_typename(L, 1)));
    return *static_cast<EntityBuilder*>(builder);
}

// Every with_* method hands the builder back for chaining
static int chain(lua_State *L) {
    lua_pushvalue(L, 1);
    return 1;
}

static uint8_t check_channel(lua_State *L, int index, lua_Integer fallback) {
    lua_Integer value = opt_integer(L, index, fallback);
    return static_cast<uint8_t>(std::clamp<lua_Integer>(value, 0, 255));
}

static Color check_color(lua_State *L, int index) {
    return Color{check_channel(L, index, 255), check_channel(L, index + 1, 255),
                 check_channel(L, index + 2, 255), check_channel(L, index + 3, 255)};
}

static RigidBody& rigidbody(EntityBuilder& builder) {
    if (!builder.spawn.rigidbody)
        builder.spawn.rigidbody = RigidBody{};
    return *builder.spawn.rigidbody;
}

static std::optional<std::string> field_string(lua_State *L, int table, const char *name) {
    std::optional<std::string> out;
    if (raw_field(L, table, name) == LUA_TSTRING)
        out = lua_tostring(L, -1);
    lua_pop(L, 1);
    return out;
}

static std::optional<lua_Number> field_number(lua_State *L, int table, const char *name) {
    std::optional<lua_Number> out;
    raw_field(L, table, name);
    if (lua_isnumber(L, -1))
        out = lua_tonumber(L, -1);
    lua_pop(L, 1);
    return out;
}

static std::optional<int> field_int(lua_State *L, int table, const char *name) {
    auto value = field_number(L, table, name);
    if (!value)
        return std::nullopt;
    if (*value != std::floor(*value) || *value < INT_MIN || *value > INT_MAX)
        throw ScriptError(fmt::format("'{}' must be an integer, got {}", name, *value));
    return static_cast<int>(*value);
}

static std::optional<uint32_t> field_count(lua_State *L, int table, const char *name) {
    auto value = field_number(L, table, name);
    if (!value)
        return std::nullopt;
    if (*value != std::floor(*value) || *value < 0.0 || *value > static_cast<lua_Number>(UINT32_MAX))
        throw ScriptError(fmt::format("'{}' must be a whole number from 0, got {}", name, *value));
    return static_cast<uint32_t>(*value);
}

// Reads {x, y} or {min, max} style pairs, also accepts a plain array
static std::optional<glm::vec2> field_pair(lua_State *L, int table, const char *name, const char *first, const char *second) {
    std::optional<glm::vec2> out;
    if (raw_field(L, table, name) == LUA_TTABLE) {
        int pair = lua_gettop(L);
        auto a = field_number(L, pair, first);
        auto b = field_number(L, pair, second);
        if (!a) {
            lua_rawgeti(L, pair, 1);
            if (lua_isnumber(L, -1))
                a = lua_tonumber(L, -1);
            lua_pop(L, 1);
        }
        if (!b) {
            lua_rawgeti(L, pair, 2);
            if (lua_isnumber(L, -1))
                b = lua_tonumber(L, -1);
            lua_pop(L, 1);
        }
        if (a && b)
            out = glm::vec2(static_cast<float>(*a), static_cast<float>(*b));
    }
    lua_pop(L, 1);
    return out;
}

static int builder_gc(lua_State *L) {
    if (void *builder = luaL_testudata(L, 1, ENTITY_BUILDER_META))
        static_cast<EntityBuilder*>(builder)->~EntityBuilder();
    return 0;
}

// Identity and placement

static int with_group(lua_State *L) {
    check_builder(L).spawn.group = check_string(L, 2);
    return chain(L);
}

static int with_position(lua_State *L) {
    check_builder(L).spawn.position = check_vec2(L, 2);
    return chain(L);
}

static int with_screen_position(lua_State *L) {
    check_builder(L).spawn.screen_position = check_vec2(L, 2);
    return chain(L);
}

static int with_zindex(lua_State *L) {
    check_builder(L).spawn.zindex = check_float(L, 2);
    return chain(L);
}

static int with_rotation(lua_State *L) {
    check_builder(L).spawn.rotation = check_float(L, 2);
    return chain(L);
}

static int with_scale(lua_State *L) {
    check_builder(L).spawn.scale = check_vec2(L, 2);
    return chain(L);
}

static int with_persistent(lua_State *L) {
    check_builder(L).spawn.persistent = true;
    return chain(L);
}

static int with_parent(lua_State *L) {
    check_builder(L).spawn.parent = entity_from_lua(L, 2);
    return chain(L);
}

// Rendering

static int with_sprite(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    Sprite sprite;
    sprite.tex_key = check_string(L, 2);
    sprite.width = check_float(L, 3);
    sprite.height = check_float(L, 4);
    sprite.origin = glm::vec2(opt_float(L, 5, 0.f), opt_float(L, 6, 0.f));
    builder.spawn.sprite = sprite;
    return chain(L);
}

static int with_sprite_offset(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.sprite)
        throw ScriptError("requires with_sprite() first");
    builder.spawn.sprite->offset = check_vec2(L, 2);
    return chain(L);
}

static int with_sprite_flip(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.sprite)
        throw ScriptError("requires with_sprite() first");
    builder.spawn.sprite->flip_h = opt_bool(L, 2, false);
    builder.spawn.sprite->flip_v = opt_bool(L, 3, false);
    return chain(L);
}

static int with_text(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    builder.spawn.text = DynamicText(check_string(L, 2), check_string(L, 3),
                                     check_float(L, 4), check_color(L, 5));
    return chain(L);
}

static int with_tint(lua_State *L) {
    check_builder(L).spawn.tint = Tint{check_color(L, 2)};
    return chain(L);
}

static int with_shader(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    EntityShader shader;
    shader.key = check_string(L, 2);
    if (lua_istable(L, 3)) {
        lua_pushnil(L);
        while (lua_next(L, 3)) {
            if (lua_type(L, -2) != LUA_TSTRING) {
                lua_pop(L, 1);
                continue;
            }
            std::string name = lua_tostring(L, -2);
            lua_Integer integer = lua_isinteger(L, -1) ? lua_tointeger(L, -1) : 0;
            if (lua_isinteger(L, -1) && integer >= INT_MIN && integer <= INT_MAX)
                shader.uniforms[name] = static_cast<int>(integer);
            else if (lua_isnumber(L, -1))
                shader.uniforms[name] = static_cast<float>(lua_tonumber(L, -1));
            else if (lua_istable(L, -1)) {
                int table = lua_gettop(L);
                float v[4] = {0.f, 0.f, 0.f, 0.f};
                lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, table));
                for (lua_Integer i = 0; i < std::min<lua_Integer>(n, 4); i++) {
                    lua_rawgeti(L, table, i + 1);
                    v[i] = static_cast<float>(lua_tonumber(L, -1));
                    lua_pop(L, 1);
                }
                if (n == 2)
                    shader.uniforms[name] = glm::vec2(v[0], v[1]);
                else if (n == 4)
                    shader.uniforms[name] = glm::vec4(v[0], v[1], v[2], v[3]);
                else
                    throw ScriptError(fmt::format("uniform '{}' must have 2 or 4 components", name));
            }
            lua_pop(L, 1);
        }
    }
    builder.spawn.shader = shader;
    return chain(L);
}

// Physics

static int with_velocity(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    rigidbody(builder).velocity = check_vec2(L, 2);
    return chain(L);
}

static int with_friction(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    rigidbody(builder).friction = std::max(0.f, check_float(L, 2));
    return chain(L);
}

static int with_max_speed(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    float speed = check_float(L, 2);
    if (speed > 0.f)
        rigidbody(builder).max_speed = speed;
    else
        rigidbody(builder).max_speed.reset();
    return chain(L);
}

static int with_accel(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    rigidbody(builder).add_force(check_string(L, 2), check_vec2(L, 3), opt_bool(L, 5, true));
    return chain(L);
}

static int with_frozen(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    rigidbody(builder).frozen = true;
    return chain(L);
}

static int with_collider(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    BoxCollider collider;
    collider.size = check_vec2(L, 2);
    collider.origin = glm::vec2(opt_float(L, 4, 0.f), opt_float(L, 5, 0.f));
    builder.spawn.collider = collider;
    return chain(L);
}

static int with_collider_offset(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.collider)
        throw ScriptError("requires with_collider() first");
    builder.spawn.collider->offset = check_vec2(L, 2);
    return chain(L);
}

static int with_mouse_controlled(lua_State *L) {
    check_builder(L).spawn.mouse_controlled = MouseControlled{opt_bool(L, 2, true), opt_bool(L, 3, true)};
    return chain(L);
}

// Signals

static int with_signals(lua_State *L) {
    check_builder(L).spawn.has_signals = true;
    return chain(L);
}

static int with_signal_scalar(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    builder.spawn.has_signals = true;
    builder.spawn.signal_scalars.emplace_back(check_string(L, 2), check_float(L, 3));
    return chain(L);
}

static int with_signal_integer(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    builder.spawn.has_signals = true;
    builder.spawn.signal_integers.emplace_back(check_string(L, 2), check_int(L, 3));
    return chain(L);
}

static int with_signal_string(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    builder.spawn.has_signals = true;
    builder.spawn.signal_strings.emplace_back(check_string(L, 2), check_string(L, 3));
    return chain(L);
}

static int with_signal_flag(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    builder.spawn.has_signals = true;
    builder.spawn.signal_flags.emplace_back(check_string(L, 2));
    return chain(L);
}

static int with_signal_binding(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    SignalBinding binding;
    binding.key = check_string(L, 2);
    if (!lua_isnoneornil(L, 3))
        binding.source = entity_from_lua(L, 3);
    builder.spawn.signal_binding = binding;
    return chain(L);
}

static int with_signal_binding_format(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.signal_binding)
        throw ScriptError("requires with_signal_binding() first");
    builder.spawn.signal_binding->format = std::string(check_string(L, 2));
    return chain(L);
}

// Phase

static std::optional<PhaseCallback> phase_callback(lua_State *L, int table, const char *name) {
    if (auto fn = field_string(L, table, name))
        return PhaseCallback(*fn);
    return std::nullopt;
}

static int with_phase(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    check_table(L, 2);
    auto initial = field_string(L, 2, "initial");
    if (!initial)
        throw ScriptError("requires an 'initial' phase name");
    Phase phase(*initial);

    if (raw_field(L, 2, "phases") == LUA_TTABLE) {
        int phases = lua_gettop(L);
        lua_pushnil(L);
        while (lua_next(L, phases)) {
            if (lua_type(L, -2) == LUA_TSTRING && lua_istable(L, -1)) {
                int entry = lua_gettop(L);
                PhaseCallbacks callbacks;
                callbacks.on_enter = phase_callback(L, entry, "on_enter");
                callbacks.on_update = phase_callback(L, entry, "on_update");
                callbacks.on_exit = phase_callback(L, entry, "on_exit");
                phase.phases[lua_tostring(L, -2)] = callbacks;
            }
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);
    builder.spawn.phase = phase;
    return chain(L);
}

// Attachment and timing

static int with_stuckto(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    StuckTo stuck;
    stuck.target = entity_from_lua(L, 2);
    stuck.follow_x = opt_bool(L, 3, true);
    stuck.follow_y = opt_bool(L, 4, true);
    builder.spawn.stuckto = stuck;
    return chain(L);
}

static int with_stuckto_offset(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.stuckto)
        throw ScriptError("requires with_stuckto() first");
    builder.spawn.stuckto->offset = check_vec2(L, 2);
    return chain(L);
}

static int with_stuckto_stored_velocity(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.stuckto)
        throw ScriptError("requires with_stuckto() first");
    builder.spawn.stuckto->stored_velocity = check_vec2(L, 2);
    return chain(L);
}

static int with_lua_timer(lua_State *L) {
    check_builder(L).spawn.lua_timer = LuaTimer{check_float(L, 2), 0.f, check_string(L, 3)};
    return chain(L);
}

static int with_timer(lua_State *L) {
    check_builder(L).spawn.timer = Timer{check_float(L, 2), 0.f, check_string(L, 3)};
    return chain(L);
}

static int with_ttl(lua_State *L) {
    check_builder(L).spawn.ttl = Ttl{check_float(L, 2)};
    return chain(L);
}

// Tweens

template<typename T>
static std::optional<T>& tween_field(EntityBuilder& builder);

template<>
std::optional<TweenPosition>& tween_field<TweenPosition>(EntityBuilder& builder) {
    return builder.spawn.tween_position;
}

template<>
std::optional<TweenRotation>& tween_field<TweenRotation>(EntityBuilder& builder) {
    return builder.spawn.tween_rotation;
}

template<>
std::optional<TweenScale>& tween_field<TweenScale>(EntityBuilder& builder) {
    return builder.spawn.tween_scale;
}

template<typename T>
static const char* tween_name();
template<> const char* tween_name<TweenPosition>() { return "with_tween_position"; }
template<> const char* tween_name<TweenRotation>() { return "with_tween_rotation"; }
template<> const char* tween_name<TweenScale>() { return "with_tween_scale"; }

static int with_tween_position(lua_State *L) {
    check_builder(L).spawn.tween_position = TweenPosition(check_vec2(L, 2), check_vec2(L, 4), check_float(L, 6));
    return chain(L);
}

static int with_tween_rotation(lua_State *L) {
    check_builder(L).spawn.tween_rotation = TweenRotation(check_float(L, 2), check_float(L, 3), check_float(L, 4));
    return chain(L);
}

static int with_tween_scale(lua_State *L) {
    check_builder(L).spawn.tween_scale = TweenScale(check_vec2(L, 2), check_vec2(L, 4), check_float(L, 6));
    return chain(L);
}

template<typename T>
static int with_tween_easing(lua_State *L) {
    auto& tween = tween_field<T>(check_builder(L));
    if (!tween)
        throw ScriptError(fmt::format("requires {}() first", tween_name<T>()));
    tween->easing = easing_from_name(check_string(L, 2));
    return chain(L);
}

template<typename T>
static int with_tween_loop(lua_State *L) {
    auto& tween = tween_field<T>(check_builder(L));
    if (!tween)
        throw ScriptError(fmt::format("requires {}() first", tween_name<T>()));
    tween->loop_mode = loop_mode_from_name(check_string(L, 2));
    return chain(L);
}

template<typename T>
static int with_tween_backwards(lua_State *L) {
    auto& tween = tween_field<T>(check_builder(L));
    if (!tween)
        throw ScriptError(fmt::format("requires {}() first", tween_name<T>()));
    tween->set_backwards();
    return chain(L);
}

// Layout, collision and animation

static int with_grid_layout(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    GridLayout layout;
    layout.path = check_string(L, 2);
    layout.group = check_string(L, 3);
    layout.z_index = opt_float(L, 4, 0.f);
    builder.spawn.grid_layout = layout;
    return chain(L);
}

static int with_lua_collision_rule(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    CollisionRule rule;
    rule.group_a = check_string(L, 2);
    rule.group_b = check_string(L, 3);
    rule.callback = std::string(check_string(L, 4));
    builder.spawn.collision_rule = rule;
    return chain(L);
}

static int with_animation(lua_State *L) {
    check_builder(L).spawn.animation = Animation{check_string(L, 2), 0, 0.f};
    return chain(L);
}

static int with_animation_controller(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    AnimationController controller;
    controller.fallback_key = check_string(L, 2);
    controller.current_key = controller.fallback_key;
    builder.spawn.animation_controller = controller;
    if (!builder.spawn.animation)
        builder.spawn.animation = Animation{controller.fallback_key, 0, 0.f};
    return chain(L);
}

// {type = "has_flag", key = "jumping"}, {type = "all", conditions = {...}}, ...
static Condition parse_condition(lua_State *L, int index) {
    index = lua_absindex(L, index);
    if (!lua_istable(L, index))
        throw ScriptError("animation condition must be a table");
    auto type = field_string(L, index, "type");
    if (!type)
        throw ScriptError("animation condition is missing 'type'");

    Condition condition;
    condition.key = field_string(L, index, "key").value_or("");

    auto read_op = [&]() {
        auto op = field_string(L, index, "op").value_or("eq");
        if (!cmp_op_from_name(op, condition.op))
            throw ScriptError(fmt::format("unknown comparison '{}'", op));
    };
    auto read_inclusive = [&]() {
        raw_field(L, index, "inclusive");
        condition.inclusive = lua_isnil(L, -1) ? true : lua_toboolean(L, -1) != 0;
        lua_pop(L, 1);
    };
    auto read_children = [&](const char *field) {
        if (raw_field(L, index, field) != LUA_TTABLE)
            throw ScriptError(fmt::format("'{}' condition requires a '{}' table", *type, field));
        int list = lua_gettop(L);
        lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, list));
        for (lua_Integer i = 1; i <= n; i++) {
            lua_rawgeti(L, list, i);
            condition.children.push_back(parse_condition(L, -1));
            lua_pop(L, 1);
        }
        lua_pop(L, 1);
    };

    if (*type == "has_flag")
        condition.kind = Condition::Kind::HasFlag;
    else if (*type == "lacks_flag")
        condition.kind = Condition::Kind::LacksFlag;
    else if (*type == "scalar_cmp") {
        condition.kind = Condition::Kind::ScalarCmp;
        read_op();
        condition.scalar = static_cast<float>(field_number(L, index, "value").value_or(0.0));
    } else if (*type == "scalar_range") {
        condition.kind = Condition::Kind::ScalarRange;
        condition.scalar_min = static_cast<float>(field_number(L, index, "min").value_or(0.0));
        condition.scalar_max = static_cast<float>(field_number(L, index, "max").value_or(0.0));
        read_inclusive();
    } else if (*type == "integer_cmp") {
        condition.kind = Condition::Kind::IntegerCmp;
        read_op();
        condition.integer = field_int(L, index, "value").value_or(0);
    } else if (*type == "integer_range") {
        condition.kind = Condition::Kind::IntegerRange;
        condition.integer_min = field_int(L, index, "min").value_or(0);
        condition.integer_max = field_int(L, index, "max").value_or(0);
        read_inclusive();
    } else if (*type == "all") {
        condition.kind = Condition::Kind::All;
        read_children("conditions");
    } else if (*type == "any") {
        condition.kind = Condition::Kind::Any;
        read_children("conditions");
    } else if (*type == "not") {
        condition.kind = Condition::Kind::Not;
        raw_field(L, index, "condition");
        condition.children.push_back(parse_condition(L, -1));
        lua_pop(L, 1);
    } else
        throw ScriptError(fmt::format("unknown condition type '{}'", *type));
    return condition;
}

static int with_animation_rule(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    if (!builder.spawn.animation_controller)
        throw ScriptError("requires with_animation_controller() first");
    AnimationRule rule;
    rule.when = parse_condition(L, 2);
    rule.key = check_string(L, 3);
    builder.spawn.animation_controller->rules.push_back(std::move(rule));
    return chain(L);
}

// Menu

static MenuSpawn& require_menu(EntityBuilder& builder) {
    if (!builder.spawn.menu)
        throw ScriptError("requires with_menu() first");
    return *builder.spawn.menu;
}

// items = {{id = "start", label = "Start"}, {"quit", "Quit"}}
static int with_menu(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    check_table(L, 2);
    MenuSpawn spawn;
    Menu& menu = spawn.menu;
    menu.origin = glm::vec2(check_float(L, 3), check_float(L, 4));
    menu.font = check_string(L, 5);
    menu.font_size = check_float(L, 6);
    menu.item_spacing = check_float(L, 7);
    menu.use_screen_space = opt_bool(L, 8, true);

    lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, 2));
    for (lua_Integer i = 1; i <= n; i++) {
        lua_rawgeti(L, 2, i);
        int entry = lua_gettop(L);
        if (!lua_istable(L, entry))
            throw ScriptError(fmt::format("item {} must be a table", i));
        MenuItem item;
        auto id = field_string(L, entry, "id");
        auto label = field_string(L, entry, "label");
        if (!id) {
            lua_rawgeti(L, entry, 1);
            if (lua_type(L, -1) == LUA_TSTRING)
                id = lua_tostring(L, -1);
            lua_pop(L, 1);
        }
        if (!label) {
            lua_rawgeti(L, entry, 2);
            if (lua_type(L, -1) == LUA_TSTRING)
                label = lua_tostring(L, -1);
            lua_pop(L, 1);
        }
        if (!id)
            throw ScriptError(fmt::format("item {} has no id", i));
        item.id = *id;
        item.label = label.value_or(*id);
        raw_field(L, entry, "enabled");
        item.enabled = lua_isnil(L, -1) ? true : lua_toboolean(L, -1) != 0;
        lua_pop(L, 1);
        item.position = menu.origin + glm::vec2(0.f, static_cast<float>(i - 1) * menu.item_spacing);
        menu.items.push_back(std::move(item));
        lua_pop(L, 1);
    }
    builder.spawn.menu = std::move(spawn);
    return chain(L);
}

static int with_menu_colors(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.menu.normal_color = check_color(L, 2);
    spawn.menu.selected_color = check_color(L, 6);
    return chain(L);
}

static int with_menu_dynamic_text(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.menu.dynamic_text = opt_bool(L, 2, true);
    return chain(L);
}

static int with_menu_cursor(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.cursor_key = std::string(check_string(L, 2));
    return chain(L);
}

static int with_menu_selection_sound(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.menu.selection_sound = std::string(check_string(L, 2));
    return chain(L);
}

static int with_menu_callback(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.menu.on_select_callback = std::string(check_string(L, 2));
    return chain(L);
}

static int with_menu_action_set_scene(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.actions.map[check_string(L, 2)] = MenuAction{MenuAction::Kind::SetScene, check_string(L, 3)};
    return chain(L);
}

static int with_menu_action_show_submenu(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.actions.map[check_string(L, 2)] = MenuAction{MenuAction::Kind::ShowSubMenu, check_string(L, 3)};
    return chain(L);
}

static int with_menu_action_quit(lua_State *L) {
    MenuSpawn& spawn = require_menu(check_builder(L));
    spawn.actions.map[check_string(L, 2)] = MenuAction{MenuAction::Kind::QuitGame, ""};
    return chain(L);
}

// Particles

// templates = {"spark", 1234}, shape = "rect", width, height, offset = {x, y},
// particles_per_emission, emissions_per_second, emissions_remaining,
// arc = {min, max}, speed = {min, max}, ttl = 1.5 | {min, max}
static int with_particle_emitter(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    check_table(L, 2);
    EmitterSpawn spawn;
    ParticleEmitter& emitter = spawn.emitter;

    if (raw_field(L, 2, "templates") == LUA_TTABLE) {
        int list = lua_gettop(L);
        lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, list));
        for (lua_Integer i = 1; i <= n; i++) {
            lua_rawgeti(L, list, i);
            if (lua_isinteger(L, -1) && lua_tointeger(L, -1) >= 0)
                emitter.templates.push_back(static_cast<flecs::entity_t>(lua_tointeger(L, -1)));
            else if (lua_type(L, -1) == LUA_TSTRING)
                spawn.template_keys.emplace_back(lua_tostring(L, -1));
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);

    if (auto shape = field_string(L, 2, "shape")) {
        if (*shape == "rect")
            emitter.shape.kind = EmitterShapeKind::Rect;
        else if (*shape != "point")
            throw ScriptError(fmt::format("unknown shape '{}'", *shape));
    }
    emitter.shape.width = static_cast<float>(field_number(L, 2, "width").value_or(0.0));
    emitter.shape.height = static_cast<float>(field_number(L, 2, "height").value_or(0.0));
    if (auto offset = field_pair(L, 2, "offset", "x", "y"))
        emitter.offset = *offset;
    if (auto n = field_count(L, 2, "particles_per_emission"))
        emitter.particles_per_emission = *n;
    if (auto n = field_number(L, 2, "emissions_per_second"))
        emitter.emissions_per_second = static_cast<float>(*n);
    if (auto n = field_count(L, 2, "emissions_remaining"))
        emitter.emissions_remaining = *n;
    if (auto arc = field_pair(L, 2, "arc", "min", "max"))
        emitter.arc = *arc;
    if (auto speed = field_pair(L, 2, "speed", "min", "max"))
        emitter.speed = *speed;

    raw_field(L, 2, "ttl");
    if (lua_isnumber(L, -1)) {
        emitter.ttl.kind = TtlSpec::Kind::Fixed;
        emitter.ttl.min = emitter.ttl.max = static_cast<float>(lua_tonumber(L, -1));
    }
    lua_pop(L, 1);
    if (auto range = field_pair(L, 2, "ttl", "min", "max")) {
        emitter.ttl.kind = TtlSpec::Kind::Range;
        emitter.ttl.min = std::min(range->x, range->y);
        emitter.ttl.max = std::max(range->x, range->y);
    }

    builder.spawn.particle_emitter = std::move(spawn);
    return chain(L);
}

// Finishing

static int register_as(lua_State *L) {
    check_builder(L).spawn.register_as = std::string(check_string(L, 2));
    return chain(L);
}

static int build(lua_State *L) {
    EntityBuilder& builder = check_builder(L);
    LuaRuntime& runtime = LuaRuntime::from(L);
    if (builder.collision_scoped)
        runtime.collision_queues().spawn.push(builder.spawn);
    else
        runtime.queues().spawn.push(builder.spawn);
    return 0;
}

const std::vector<ApiFunction>& entity_builder_methods() {
    static const std::vector<ApiFunction> methods = {
        {"with_group", "builder", "(name: string)", with_group},
        {"with_position", "builder", "(x: number, y: number)", with_position},
        {"with_screen_position", "builder", "(x: number, y: number)", with_screen_position},
        {"with_zindex", "builder", "(z: number)", with_zindex},
        {"with_rotation", "builder", "(degrees: number)", with_rotation},
        {"with_scale", "builder", "(sx: number, sy: number)", with_scale},
        {"with_persistent", "builder", "()", with_persistent},
        {"with_parent", "builder", "(parent_id: integer)", with_parent},
        {"with_sprite", "builder", "(tex_key: string, w: number, h: number, origin_x?: number, origin_y?: number)", with_sprite},
        {"with_sprite_offset", "builder", "(x: number, y: number)", with_sprite_offset},
        {"with_sprite_flip", "builder", "(flip_h: boolean, flip_v: boolean)", with_sprite_flip},
        {"with_text", "builder", "(content: string, font: string, size: number, r: integer, g: integer, b: integer, a: integer)", with_text},
        {"with_tint", "builder", "(r: integer, g: integer, b: integer, a: integer)", with_tint},
        {"with_shader", "builder", "(key: string, uniforms?: table)", with_shader},
        {"with_velocity", "builder", "(vx: number, vy: number)", with_velocity},
        {"with_friction", "builder", "(friction: number)", with_friction},
        {"with_max_speed", "builder", "(speed: number)", with_max_speed},
        {"with_accel", "builder", "(name: string, x: number, y: number, enabled?: boolean)", with_accel},
        {"with_frozen", "builder", "()", with_frozen},
        {"with_collider", "builder", "(w: number, h: number, origin_x?: number, origin_y?: number)", with_collider},
        {"with_collider_offset", "builder", "(x: number, y: number)", with_collider_offset},
        {"with_mouse_controlled", "builder", "(follow_x: boolean, follow_y: boolean)", with_mouse_controlled},
        {"with_signals", "builder", "()", with_signals},
        {"with_signal_scalar", "builder", "(key: string, value: number)", with_signal_scalar},
        {"with_signal_integer", "builder", "(key: string, value: integer)", with_signal_integer},
        {"with_signal_string", "builder", "(key: string, value: string)", with_signal_string},
        {"with_signal_flag", "builder", "(key: string)", with_signal_flag},
        {"with_signal_binding", "builder", "(key: string, source_id?: integer)", with_signal_binding},
        {"with_signal_binding_format", "builder", "(format: string)", with_signal_binding_format},
        {"with_phase", "builder", "(def: {initial: string, phases: table})", with_phase},
        {"with_stuckto", "builder", "(target_id: integer, follow_x: boolean, follow_y: boolean)", with_stuckto},
        {"with_stuckto_offset", "builder", "(x: number, y: number)", with_stuckto_offset},
        {"with_stuckto_stored_velocity", "builder", "(vx: number, vy: number)", with_stuckto_stored_velocity},
        {"with_lua_timer", "builder", "(duration: number, callback: string)", with_lua_timer},
        {"with_timer", "builder", "(duration: number, signal: string)", with_timer},
        {"with_ttl", "builder", "(seconds: number)", with_ttl},
        {"with_tween_position", "builder", "(fx: number, fy: number, tx: number, ty: number, duration: number)", with_tween_position},
        {"with_tween_position_easing", "builder", "(easing: string)", with_tween_easing<TweenPosition>},
        {"with_tween_position_loop", "builder", "(mode: string)", with_tween_loop<TweenPosition>},
        {"with_tween_position_backwards", "builder", "()", with_tween_backwards<TweenPosition>},
        {"with_tween_rotation", "builder", "(from: number, to: number, duration: number)", with_tween_rotation},
        {"with_tween_rotation_easing", "builder", "(easing: string)", with_tween_easing<TweenRotation>},
        {"with_tween_rotation_loop", "builder", "(mode: string)", with_tween_loop<TweenRotation>},
        {"with_tween_rotation_backwards", "builder", "()", with_tween_backwards<TweenRotation>},
        {"with_tween_scale", "builder", "(fx: number, fy: number, tx: number, ty: number, duration: number)", with_tween_scale},
        {"with_tween_scale_easing", "builder", "(easing: string)", with_tween_easing<TweenScale>},
        {"with_tween_scale_loop", "builder", "(mode: string)", with_tween_loop<TweenScale>},
        {"with_tween_scale_backwards", "builder", "()", with_tween_backwards<TweenScale>},
        {"with_grid_layout", "builder", "(path: string, group: string, z: number)", with_grid_layout},
        {"with_lua_collision_rule", "builder", "(group_a: string, group_b: string, callback: string)", with_lua_collision_rule},
        {"with_animation", "builder", "(key: string)", with_animation},
        {"with_animation_controller", "builder", "(fallback_key: string)", with_animation_controller},
        {"with_animation_rule", "builder", "(condition: table, key: string)", with_animation_rule},
        {"with_menu", "builder", "(items: table, x: number, y: number, font: string, size: number, spacing: number, use_screen_space?: boolean)", with_menu},
        {"with_menu_colors", "builder", "(nr: integer, ng: integer, nb: integer, na: integer, sr: integer, sg: integer, sb: integer, sa: integer)", with_menu_colors},
        {"with_menu_dynamic_text", "builder", "(enabled: boolean)", with_menu_dynamic_text},
        {"with_menu_cursor", "builder", "(key: string)", with_menu_cursor},
        {"with_menu_selection_sound", "builder", "(sound_id: string)", with_menu_selection_sound},
        {"with_menu_callback", "builder", "(fn_name: string)", with_menu_callback},
        {"with_menu_action_set_scene", "builder", "(item_id: string, scene: string)", with_menu_action_set_scene},
        {"with_menu_action_show_submenu", "builder", "(item_id: string, submenu: string)", with_menu_action_show_submenu},
        {"with_menu_action_quit", "builder", "(item_id: string)", with_menu_action_quit},
        {"with_particle_emitter", "builder", "(def: table)", with_particle_emitter},
        {"register_as", "builder", "(key: string)", register_as},
        {"build", "builder", "()", build},
    };
    return methods;
}

void register_entity_builder(lua_State *L) {
    luaL_newmetatable(L, ENTITY_BUILDER_META);
    lua_newtable(L);
    for (const auto& method : entity_builder_methods()) {
        push_engine_function(L, method);
        lua_setfield(L, -2, method.name);
    }
    lua_setfield(L, -2, "__index");
    lua_pushcfunction(L, builder_gc);
    lua_setfield(L, -2, "__gc");
    lua_pop(L, 1);
}

void push_entity_builder(lua_State *L, bool collision_scoped, std::optional<std::string> clone_source) {
    void *memory = lua_newuserdatauv(L, sizeof(EntityBuilder), 0);
    EntityBuilder *builder = new (memory) EntityBuilder();
    builder->collision_scoped = collision_scoped;
    builder->spawn.clone_source = std::move(clone_source);
    luaL_setmetatable(L, ENTITY_BUILDER_META);
}
