//
//  tween.hpp
//  aberred
//
//  Created by the aberred authors on 07/10/2025.
//

#pragma once

#include "glm/vec2.hpp"
#include <algorithm>
#include <string>

#define EASINGS                   \
    X(Linear, "linear")           \
    X(QuadIn, "quad_in")          \
    X(QuadOut, "quad_out")        \
    X(QuadInOut, "quad_in_out")   \
    X(CubicIn, "cubic_in")        \
    X(CubicOut, "cubic_out")      \
    X(CubicInOut, "cubic_in_out")

#define LOOP_MODES                \
    X(Once, "once")               \
    X(Loop, "loop")               \
    X(PingPong, "ping_pong")

enum class Easing {
#define X(NAME, STR) NAME,
    EASINGS
#undef X
};

enum class LoopMode {
#define X(NAME, STR) NAME,
    LOOP_MODES
#undef X
};

// Unknown names fall back to linear
inline Easing easing_from_name(const std::string& name) {
#define X(NAME, STR) if (name == STR) return Easing::NAME;
    EASINGS
#undef X
    return Easing::Linear;
}

// Unknown names fall back to once
inline LoopMode loop_mode_from_name(const std::string& name) {
#define X(NAME, STR) if (name == STR) return LoopMode::NAME;
    LOOP_MODES
#undef X
    return LoopMode::Once;
}

inline float ease(Easing easing, float t) {
    t = std::clamp(t, 0.f, 1.f);
    switch (easing) {
        case Easing::Linear:
            return t;
        case Easing::QuadIn:
            return t * t;
        case Easing::QuadOut:
            return t * (2.f - t);
        case Easing::QuadInOut:
            return t < .5f ? 2.f * t * t : -1.f + (4.f - 2.f * t) * t;
        case Easing::CubicIn:
            return t * t * t;
        case Easing::CubicOut: {
            float p = t - 1.f;
            return p * p * p + 1.f;
        }
        case Easing::CubicInOut: {
            if (t < .5f)
                return 4.f * t * t * t;
            float p = 2.f * t - 2.f;
            return .5f * p * p * p + 1.f;
        }
    }
    return t;
}

inline float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

inline glm::vec2 lerp(const glm::vec2& a, const glm::vec2& b, float t) {
    return a + (b - a) * t;
}

template<typename V>
struct Tween {
    V from{};
    V to{};
    float duration = 1.f;
    Easing easing = Easing::Linear;
    LoopMode loop_mode = LoopMode::Once;
    bool playing = true;
    float time = 0.f;
    bool forward = true;

    Tween() = default;
    Tween(V from, V to, float duration): from(from), to(to), duration(duration) {}

    // Start at the end and run towards `from`
    void set_backwards() {
        time = duration;
        forward = false;
    }

    void advance(float dt) {
        time += forward ? dt : -dt;
        bool finished_forward = forward && time >= duration;
        bool finished_backward = !forward && time <= 0.f;
        if (!finished_forward && !finished_backward)
            return;
        switch (loop_mode) {
            case LoopMode::Once:
                playing = false;
                time = std::clamp(time, 0.f, duration);
                break;
            case LoopMode::Loop:
                time = finished_forward ? 0.f : duration;
                break;
            case LoopMode::PingPong:
                forward = !forward;
                time = std::clamp(time, 0.f, duration);
                break;
        }
    }

    V value() const {
        float t = duration > 0.f ? time / duration : 1.f;
        return lerp(from, to, ease(easing, t));
    }

    // Advances and returns the sampled value, dt below zero counts as zero
    V step(float dt) {
        advance(std::max(0.f, dt));
        return value();
    }
};

struct TweenPosition: public Tween<glm::vec2> {
    using Tween<glm::vec2>::Tween;
};

struct TweenRotation: public Tween<float> {
    using Tween<float>::Tween;
};

struct TweenScale: public Tween<glm::vec2> {
    using Tween<glm::vec2>::Tween;
};
