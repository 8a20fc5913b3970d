//
//  helpers.hpp
//  aberred
//
//  Created by the aberred authors on 18/10/2025.
//

#pragma once

#include "game.hpp"
#include "assets.hpp"
#include "settings.hpp"
#include <memory>
#include <string>
#include <fstream>
#include <filesystem>

// Headless game with a fixed seed and no audio output
inline std::unique_ptr<Game> make_game(uint32_t seed = 1234) {
    GameConfig config;
    config.audio_enabled = false;
    config.script_path = "";
    return std::make_unique<Game>(std::make_unique<HeadlessAssetLoader>(), nullptr, config, seed);
}

// Runs the script, then Setup, so the game is Playing on return
inline void start_with_script(Game& game, const std::string& script) {
    if (!game.lua().run_string(script))
        throw std::runtime_error("test script failed to load");
    game.start();
}

inline flecs::entity body_at(flecs::world& world, glm::vec2 position, glm::vec2 velocity) {
    RigidBody body;
    body.velocity = velocity;
    return world.entity()
        .set<MapPosition>({position})
        .set<RigidBody>(body);
}

// Scratch directory removed again when the test ends
class TempDir {
    std::filesystem::path _path;

public:
    explicit TempDir(const std::string& name) {
        _path = std::filesystem::temp_directory_path() / ("aberred_" + name);
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    const std::filesystem::path& path() const { return _path; }

    std::string write(const std::string& name, const std::string& contents) const {
        std::filesystem::path file = _path / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file.string();
    }
};
