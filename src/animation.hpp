//
//  animation.hpp
//  aberred
//
//  Created by the aberred authors on 08/10/2025.
//

#pragma once

#include "signals.hpp"
#include "glm/vec2.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <unordered_map>

struct Animation {
    std::string key;
    size_t frame_index = 0;
    float elapsed = 0.f;
};

// A strip of frames laid out horizontally in one atlas
struct AnimationResource {
    std::string tex_key;
    glm::vec2 position{0.f};
    float displacement = 0.f;
    size_t frame_count = 1;
    float fps = 1.f;
    bool looped = true;
};

struct AnimationStore {
    std::unordered_map<std::string, AnimationResource> animations;
};

#define CMP_OPS      \
    X(Lt, "lt")      \
    X(Le, "le")      \
    X(Gt, "gt")      \
    X(Ge, "ge")      \
    X(Eq, "eq")      \
    X(Ne, "ne")

enum class CmpOp {
#define X(NAME, STR) NAME,
    CMP_OPS
#undef X
};

inline bool cmp_op_from_name(const std::string& name, CmpOp& out) {
#define X(NAME, STR) if (name == STR) { out = CmpOp::NAME; return true; }
    CMP_OPS
#undef X
    return false;
}

struct Condition {
    enum class Kind {
        HasFlag,
        LacksFlag,
        ScalarCmp,
        ScalarRange,
        IntegerCmp,
        IntegerRange,
        All,
        Any,
        Not
    } kind = Kind::HasFlag;
    std::string key;
    CmpOp op = CmpOp::Eq;
    float scalar = 0.f;
    float scalar_min = 0.f;
    float scalar_max = 0.f;
    int integer = 0;
    int integer_min = 0;
    int integer_max = 0;
    bool inclusive = true;
    // Operands of All, Any and Not (Not uses the first)
    std::vector<Condition> children;

    bool evaluate(const Signals& signals) const {
        switch (kind) {
            case Kind::HasFlag:
                return signals.has_flag(key);
            case Kind::LacksFlag:
                return !signals.has_flag(key);
            case Kind::ScalarCmp: {
                auto value = signals.get_scalar(key);
                if (!value)
                    return false;
                const float eps = std::numeric_limits<float>::epsilon();
                switch (op) {
                    case CmpOp::Lt: return *value < scalar;
                    case CmpOp::Le: return *value <= scalar;
                    case CmpOp::Gt: return *value > scalar;
                    case CmpOp::Ge: return *value >= scalar;
                    case CmpOp::Eq: return std::fabs(*value - scalar) < eps;
                    case CmpOp::Ne: return std::fabs(*value - scalar) >= eps;
                }
                return false;
            }
            case Kind::ScalarRange: {
                auto value = signals.get_scalar(key);
                if (!value)
                    return false;
                return inclusive ? *value >= scalar_min && *value <= scalar_max
                                 : *value > scalar_min && *value < scalar_max;
            }
            case Kind::IntegerCmp: {
                auto value = signals.get_integer(key);
                if (!value)
                    return false;
                switch (op) {
                    case CmpOp::Lt: return *value < integer;
                    case CmpOp::Le: return *value <= integer;
                    case CmpOp::Gt: return *value > integer;
                    case CmpOp::Ge: return *value >= integer;
                    case CmpOp::Eq: return *value == integer;
                    case CmpOp::Ne: return *value != integer;
                }
                return false;
            }
            case Kind::IntegerRange: {
                auto value = signals.get_integer(key);
                if (!value)
                    return false;
                return inclusive ? *value >= integer_min && *value <= integer_max
                                 : *value > integer_min && *value < integer_max;
            }
            case Kind::All:
                for (const auto& child : children)
                    if (!child.evaluate(signals))
                        return false;
                return true;
            case Kind::Any:
                for (const auto& child : children)
                    if (child.evaluate(signals))
                        return true;
                return false;
            case Kind::Not:
                return children.empty() ? true : !children.front().evaluate(signals);
        }
        return false;
    }
};

struct AnimationRule {
    Condition when;
    std::string key;
};

struct AnimationController {
    std::string fallback_key;
    std::string current_key;
    std::vector<AnimationRule> rules;

    const std::string& select(const Signals& signals) const {
        for (const auto& rule : rules)
            if (rule.when.evaluate(signals))
                return rule.key;
        return fallback_key;
    }
};
