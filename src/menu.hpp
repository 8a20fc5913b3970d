//
//  menu.hpp
//  aberred
//
//  Created by the aberred authors on 10/10/2025.
//

#pragma once

#include "components.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

struct MenuItem {
    std::string id;
    std::string label;
    glm::vec2 position{0.f};
    bool enabled = true;
    // Text or sprite entity spawned for this item
    flecs::entity_t entity = 0;
};

struct Menu {
    bool active = true;
    bool spawned = false;
    std::vector<MenuItem> items;
    size_t selected_index = 0;
    std::string font;
    float font_size = 16.f;
    float item_spacing = 16.f;
    glm::vec2 origin{0.f};
    bool use_screen_space = true;
    bool dynamic_text = true;
    Color normal_color{255, 255, 255, 255};
    Color selected_color{255, 255, 0, 255};
    flecs::entity_t cursor_entity = 0;
    std::optional<std::string> selection_sound;
    std::optional<std::string> on_select_callback;
};

struct MenuAction {
    enum class Kind {
        Noop,
        SetScene,
        ShowSubMenu,
        QuitGame
    } kind = Kind::Noop;
    std::string argument;
};

struct MenuActions {
    std::unordered_map<std::string, MenuAction> map;

    MenuAction get(const std::string& item_id) const {
        auto it = map.find(item_id);
        return it == map.end() ? MenuAction{} : it->second;
    }
};

struct MenuSelected {
    flecs::entity_t menu = 0;
    std::string item_id;
};
