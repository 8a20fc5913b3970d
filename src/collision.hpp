//
//  collision.hpp
//  aberred
//
//  Created by the aberred authors on 09/10/2025.
//

#pragma once

#include "components.hpp"
#include <string>
#include <variant>
#include <vector>
#include <optional>
#include <utility>

using NativeCollisionCallback = void (*)(flecs::entity a, flecs::entity b);

// Either a host function or the name of a script function taking ctx
using CollisionCallback = std::variant<NativeCollisionCallback, std::string>;

struct CollisionRule {
    std::string group_a;
    std::string group_b;
    CollisionCallback callback;

    // Orders the pair to match (group_a, group_b), either way round
    std::optional<std::pair<flecs::entity_t, flecs::entity_t>> match_and_order(flecs::entity_t a, flecs::entity_t b,
                                                                               const std::string& ga,
                                                                               const std::string& gb) const {
        if (group_a == ga && group_b == gb)
            return std::make_pair(a, b);
        if (group_a == gb && group_b == ga)
            return std::make_pair(b, a);
        return std::nullopt;
    }

    bool scripted() const {
        return std::holds_alternative<std::string>(callback);
    }
};

enum class BoxSide {
    Left,
    Right,
    Top,
    Bottom
};

inline const char* box_side_name(BoxSide side) {
    switch (side) {
        case BoxSide::Left: return "left";
        case BoxSide::Right: return "right";
        case BoxSide::Top: return "top";
        case BoxSide::Bottom: return "bottom";
    }
    return "left";
}

inline std::optional<Rect> intersect(const Rect& a, const Rect& b) {
    float x0 = std::max(a.x, b.x);
    float y0 = std::max(a.y, b.y);
    float x1 = std::min(a.x + a.w, b.x + b.w);
    float y1 = std::min(a.y + a.h, b.y + b.h);
    if (x1 <= x0 || y1 <= y0)
        return std::nullopt;
    return Rect{x0, y0, x1 - x0, y1 - y0};
}

// Faces of `r` that lie inside the overlap rectangle
inline std::vector<BoxSide> touching_sides(const Rect& r, const Rect& overlap) {
    std::vector<BoxSide> sides;
    if (overlap.x <= r.x)
        sides.push_back(BoxSide::Left);
    if (overlap.x + overlap.w >= r.x + r.w)
        sides.push_back(BoxSide::Right);
    if (overlap.y <= r.y)
        sides.push_back(BoxSide::Top);
    if (overlap.y + overlap.h >= r.y + r.h)
        sides.push_back(BoxSide::Bottom);
    return sides;
}

inline std::optional<std::pair<std::vector<BoxSide>, std::vector<BoxSide>>> colliding_sides(const Rect& a, const Rect& b) {
    auto overlap = intersect(a, b);
    if (!overlap)
        return std::nullopt;
    return std::make_pair(touching_sides(a, *overlap), touching_sides(b, *overlap));
}
