//
//  signals.hpp
//  aberred
//
//  Created by the aberred authors on 06/10/2025.
//

#pragma once

#include "flecs.h"
#include "fmt/format.h"
#include <cstdint>
#include <string>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#define GROUP_COUNT_PREFIX "group_count:"

// Process-wide, so two states with the same stamp always hold the same values
inline std::uint64_t next_signals_stamp() {
    static std::uint64_t counter = 0;
    return ++counter;
}

// Key/value scratchpad. Entities carry one as a component, the world carries
// WorldSignals which adds the named entity registry and group counts.
class Signals {
    std::unordered_map<std::string, float> _scalars;
    std::unordered_map<std::string, int> _integers;
    std::unordered_map<std::string, std::string> _strings;
    std::unordered_set<std::string> _flags;
    std::uint64_t _stamp = 0;

protected:
    void touch() { _stamp = next_signals_stamp(); }

public:
    // Changes on every write, copies keep it
    std::uint64_t stamp() const { return _stamp; }

    void set_scalar(const std::string& key, float value) {
        touch();
        _scalars[key] = value;
    }

    std::optional<float> get_scalar(const std::string& key) const {
        auto it = _scalars.find(key);
        return it == _scalars.end() ? std::nullopt : std::optional<float>(it->second);
    }

    bool clear_scalar(const std::string& key) {
        touch();
        return _scalars.erase(key) > 0;
    }

    void set_integer(const std::string& key, int value) {
        touch();
        _integers[key] = value;
    }

    std::optional<int> get_integer(const std::string& key) const {
        auto it = _integers.find(key);
        return it == _integers.end() ? std::nullopt : std::optional<int>(it->second);
    }

    bool clear_integer(const std::string& key) {
        touch();
        return _integers.erase(key) > 0;
    }

    void set_string(const std::string& key, const std::string& value) {
        touch();
        _strings[key] = value;
    }

    std::optional<std::string> get_string(const std::string& key) const {
        auto it = _strings.find(key);
        return it == _strings.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    bool clear_string(const std::string& key) {
        touch();
        return _strings.erase(key) > 0;
    }

    // Returns false when the flag was already set
    bool set_flag(const std::string& key) {
        touch();
        return _flags.insert(key).second;
    }

    bool clear_flag(const std::string& key) {
        touch();
        return _flags.erase(key) > 0;
    }

    bool has_flag(const std::string& key) const {
        return _flags.find(key) != _flags.end();
    }

    // First match wins: integer, scalar, string, then "true" for a flag
    std::optional<std::string> to_display_string(const std::string& key) const;

    const std::unordered_map<std::string, float>& scalars() const { return _scalars; }
    const std::unordered_map<std::string, int>& integers() const { return _integers; }
    const std::unordered_map<std::string, std::string>& strings() const { return _strings; }
    const std::unordered_set<std::string>& flags() const { return _flags; }

    std::unordered_map<std::string, int>& integers_mut() {
        touch();
        return _integers;
    }

    bool operator==(const Signals& other) const {
        return _scalars == other._scalars &&
               _integers == other._integers &&
               _strings == other._strings &&
               _flags == other._flags;
    }
};

class WorldSignals: public Signals {
    std::unordered_map<std::string, flecs::entity_t> _entities;

public:
    void set_entity(const std::string& key, flecs::entity_t entity) {
        touch();
        _entities[key] = entity;
    }

    std::optional<flecs::entity_t> get_entity(const std::string& key) const {
        auto it = _entities.find(key);
        return it == _entities.end() ? std::nullopt : std::optional<flecs::entity_t>(it->second);
    }

    bool remove_entity(const std::string& key) {
        touch();
        return _entities.erase(key) > 0;
    }

    const std::unordered_map<std::string, flecs::entity_t>& entities() const { return _entities; }

    void set_group_count(const std::string& group, int count) {
        set_integer(GROUP_COUNT_PREFIX + group, count);
    }

    std::optional<int> get_group_count(const std::string& group) const {
        return get_integer(GROUP_COUNT_PREFIX + group);
    }

    void clear_group_counts() {
        auto& integers = integers_mut();
        for (auto it = integers.begin(); it != integers.end();) {
            if (it->first.rfind(GROUP_COUNT_PREFIX, 0) == 0)
                it = integers.erase(it);
            else
                ++it;
        }
    }
};

inline std::optional<std::string> Signals::to_display_string(const std::string& key) const {
    if (auto i = get_integer(key))
        return std::to_string(*i);
    if (auto s = get_scalar(key))
        return fmt::format("{}", *s);
    if (auto str = get_string(key))
        return *str;
    if (has_flag(key))
        return std::string("true");
    return std::nullopt;
}
