//
//  layout.cpp
//  aberred
//
//  Created by the aberred authors on 14/10/2025.
//

#include "layout.hpp"
#include "log.hpp"
#include <fstream>
#include <algorithm>
#include <cmath>

void from_json(const nlohmann::json& j, TilePosition& position) {
    j.at("x").get_to(position.x);
    j.at("y").get_to(position.y);
    j.at("id").get_to(position.id);
}

void from_json(const nlohmann::json& j, TileLayer& layer) {
    j.at("name").get_to(layer.name);
    j.at("positions").get_to(layer.positions);
}

void from_json(const nlohmann::json& j, Tilemap& tilemap) {
    j.at("tile_size").get_to(tilemap.tile_size);
    j.at("map_width").get_to(tilemap.map_width);
    j.at("map_height").get_to(tilemap.map_height);
    j.at("layers").get_to(tilemap.layers);
}

static std::string directory_name(std::string dir) {
    while (!dir.empty() && (dir.back() == '/' || dir.back() == '\\'))
        dir.pop_back();
    size_t slash = dir.find_last_of("/\\");
    return slash == std::string::npos ? dir : dir.substr(slash + 1);
}

static std::string strip_slashes(std::string dir) {
    while (dir.size() > 1 && (dir.back() == '/' || dir.back() == '\\'))
        dir.pop_back();
    return dir;
}

std::string tilemap_atlas_path(const std::string& dir) {
    return fmt::format("{}/{}.png", strip_slashes(dir), directory_name(dir));
}

std::optional<Tilemap> load_tilemap_file(const std::string& dir, std::string& error) {
    std::string base = fmt::format("{}/{}", strip_slashes(dir), directory_name(dir));
    std::ifstream file(base + ".json");
    if (!file.good())
        file = std::ifstream(base + ".txt");
    if (!file.good()) {
        error = fmt::format("no {}.json or {}.txt", base, base);
        return std::nullopt;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        Tilemap tilemap = j.get<Tilemap>();
        if (tilemap.tile_size == 0) {
            error = "tile_size must be positive";
            return std::nullopt;
        }
        return tilemap;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

size_t spawn_tiles(flecs::world& world, const Tilemap& tilemap, float atlas_width) {
    float tile_size = static_cast<float>(tilemap.tile_size);
    uint32_t tiles_per_row = std::max(1u, static_cast<uint32_t>(std::floor(atlas_width / tile_size)));
    int layer_count = static_cast<int>(tilemap.layers.size());
    size_t spawned = 0;
    for (size_t layer_index = 0; layer_index < tilemap.layers.size(); layer_index++) {
        // First layer is furthest back
        float z = static_cast<float>(-(layer_count - static_cast<int>(layer_index)));
        for (const auto& tile : tilemap.layers[layer_index].positions) {
            Sprite sprite;
            sprite.tex_key = tilemap.tex_key;
            sprite.width = tile_size;
            sprite.height = tile_size;
            sprite.offset = glm::vec2((tile.id % tiles_per_row) * tile_size,
                                      (tile.id / tiles_per_row) * tile_size);
            world.entity()
                .add<Spawned>()
                .set<Group>({"tiles"})
                .set<MapPosition>({glm::vec2(tile.x * tile_size, tile.y * tile_size)})
                .set<ZIndex>({z})
                .set<Sprite>(sprite);
            spawned++;
        }
    }
    return spawned;
}

void from_json(const nlohmann::json& j, GridCell& cell) {
    j.at("texture_key").get_to(cell.texture_key);
    if (!j.contains("properties"))
        return;
    for (const auto& [key, value] : j.at("properties").items()) {
        if (value.is_boolean()) {
            if (value.get<bool>())
                cell.properties.set_flag(key);
        } else if (value.is_number_integer())
            cell.properties.set_integer(key, value.get<int>());
        else if (value.is_number_float())
            cell.properties.set_scalar(key, value.get<float>());
        else if (value.is_string())
            cell.properties.set_string(key, value.get<std::string>());
    }
}

void from_json(const nlohmann::json& j, GridLayoutData& data) {
    j.at("offset_x").get_to(data.offset_x);
    j.at("offset_y").get_to(data.offset_y);
    j.at("cell_width").get_to(data.cell_width);
    j.at("cell_height").get_to(data.cell_height);
    j.at("grid").get_to(data.grid);
    for (const auto& [key, value] : j.at("legend").items()) {
        if (key.empty())
            continue;
        if (value.is_null())
            data.legend[key[0]] = std::nullopt;
        else
            data.legend[key[0]] = value.get<GridCell>();
    }
}

std::optional<GridLayoutData> GridLayoutData::load(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.good()) {
        error = "file not found";
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(file).get<GridLayoutData>();
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

size_t expand_grid_layout(flecs::world& world, GridLayout& layout) {
    if (layout.spawned)
        return 0;
    layout.spawned = true;
    std::string error;
    auto data = GridLayoutData::load(layout.path, error);
    if (!data) {
        $Log.error("Failed to load grid layout from {}: {}", layout.path, error);
        return 0;
    }
    size_t spawned = 0;
    glm::vec2 half(data->cell_width * .5f, data->cell_height * .5f);
    data->each_cell([&](const glm::vec2& center, const GridCell& cell) {
        Sprite sprite;
        sprite.tex_key = cell.texture_key;
        sprite.width = data->cell_width;
        sprite.height = data->cell_height;
        sprite.origin = half;
        BoxCollider collider;
        collider.size = glm::vec2(data->cell_width, data->cell_height);
        collider.origin = half;
        world.entity()
            .add<Spawned>()
            .set<Group>({layout.group})
            .set<MapPosition>({center})
            .set<ZIndex>({layout.z_index})
            .set<Sprite>(sprite)
            .set<BoxCollider>(collider)
            .set<Signals>(cell.properties);
        spawned++;
    });
    $Log.info("Spawned {} entities from grid layout {}", spawned, layout.path);
    return spawned;
}
