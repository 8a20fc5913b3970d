//
//  phase.hpp
//  aberred
//
//  Created by the aberred authors on 09/10/2025.
//

#pragma once

#include "flecs.h"
#include <string>
#include <optional>
#include <variant>
#include <unordered_map>

enum class PhaseHook {
    Enter,
    Update,
    Exit
};

// `other` is the previous phase for Enter and the next phase for Exit
struct PhaseCall {
    PhaseHook hook;
    std::string phase;
    std::optional<std::string> other;
    float time_in_phase = 0.f;
};

using NativePhaseCallback = void (*)(flecs::entity entity, const PhaseCall& call);

// Either a host function or the name of a script function
using PhaseCallback = std::variant<NativePhaseCallback, std::string>;

struct PhaseCallbacks {
    std::optional<PhaseCallback> on_enter;
    std::optional<PhaseCallback> on_update;
    std::optional<PhaseCallback> on_exit;

    const std::optional<PhaseCallback>& get(PhaseHook hook) const {
        switch (hook) {
            case PhaseHook::Enter:
                return on_enter;
            case PhaseHook::Update:
                return on_update;
            case PhaseHook::Exit:
            default:
                return on_exit;
        }
    }
};

struct Phase {
    std::string current;
    std::optional<std::string> previous;
    std::optional<std::string> next;
    float time_in_phase = 0.f;
    bool needs_enter_callback = true;
    std::unordered_map<std::string, PhaseCallbacks> phases;

    Phase() = default;
    explicit Phase(std::string initial): current(std::move(initial)) {}

    void transition_to(const std::string& phase) {
        next = phase;
    }

    const PhaseCallbacks* callbacks(const std::string& phase) const {
        auto it = phases.find(phase);
        return it == phases.end() ? nullptr : &it->second;
    }
};

// Emitted after on_exit and before on_enter of the new phase
struct PhaseChanged {
    std::string previous;
    std::string current;
};
