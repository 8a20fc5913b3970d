//
//  layout.hpp
//  aberred
//
//  Created by the aberred authors on 14/10/2025.
//

#pragma once

#include "flecs.h"
#include "nlohmann/json.hpp"
#include "resources.hpp"
#include "components.hpp"
#include "signals.hpp"
#include <string>
#include <optional>
#include <unordered_map>

void from_json(const nlohmann::json& j, TilePosition& position);
void from_json(const nlohmann::json& j, TileLayer& layer);
void from_json(const nlohmann::json& j, Tilemap& tilemap);

// `<dir>/<name>.json`, falling back to the Tilesetter `<dir>/<name>.txt`
std::string tilemap_atlas_path(const std::string& dir);
std::optional<Tilemap> load_tilemap_file(const std::string& dir, std::string& error);

// One sprite per tile per layer, returns how many were spawned
size_t spawn_tiles(flecs::world& world, const Tilemap& tilemap, float atlas_width);

struct GridCell {
    std::string texture_key;
    Signals properties;
};

struct GridLayoutData {
    float offset_x = 0.f;
    float offset_y = 0.f;
    float cell_width = 0.f;
    float cell_height = 0.f;
    std::vector<std::string> grid;
    // A null legend entry leaves the cell empty
    std::unordered_map<char, std::optional<GridCell>> legend;

    static std::optional<GridLayoutData> load(const std::string& path, std::string& error);

    // Calls fn(center, cell) for every non-empty cell, row by row
    template<typename F>
    void each_cell(F&& fn) const {
        for (size_t row = 0; row < grid.size(); row++)
            for (size_t col = 0; col < grid[row].size(); col++) {
                auto it = legend.find(grid[row][col]);
                if (it == legend.end() || !it->second)
                    continue;
                glm::vec2 center(offset_x + col * cell_width + cell_width * .5f,
                                 offset_y + row * cell_height + cell_height * .5f);
                fn(center, *it->second);
            }
    }
};

void from_json(const nlohmann::json& j, GridCell& cell);
void from_json(const nlohmann::json& j, GridLayoutData& data);

// Expands the layout once, `spawned` is set even when the file is bad
size_t expand_grid_layout(flecs::world& world, GridLayout& layout);
