//
//  renderer.hpp
//  aberred
//
//  Created by the aberred authors on 17/10/2025.
//

#pragma once

#include "flecs.h"
#include "sokol/sokol_gfx.h"
#include "texture.hpp"
#include "glm/vec2.hpp"

// Where the fixed-size render target lands inside the window
struct Letterbox {
    float x = 0.f;
    float y = 0.f;
    float width = 0.f;
    float height = 0.f;
    float scale = 1.f;

    static Letterbox fit(int target_width, int target_height, int window_width, int window_height);

    glm::vec2 window_to_target(const glm::vec2& point) const {
        return (point - glm::vec2(x, y)) / scale;
    }
};

// Draws the world into the render target with sokol_gp, then blits it to
// the window. Only reads components, nothing here writes to the world.
class Renderer {
    int _width, _height;
    sg_image _color{}, _depth{};
    sg_sampler _sampler{};
    sg_attachments _attachments{};
    sg_pass_action _clear{};
    Letterbox _letterbox;

    void draw_sprites(flecs::world& world, const TextureStore& textures);
    void draw_text(flecs::world& world);

public:
    Renderer(int width, int height);
    ~Renderer();
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    const Letterbox& letterbox() const { return _letterbox; }

    void draw(flecs::world& world, const TextureStore& textures, int window_width, int window_height);
};
