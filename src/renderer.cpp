//
//  renderer.cpp
//  aberred
//
//  Created by the aberred authors on 17/10/2025.
//

#include "renderer.hpp"
#include "components.hpp"
#include "resources.hpp"
#include "sokol/sokol_app.h"
#include "sokol/sokol_glue.h"
#include "sokol/util/sokol_debugtext.h"
#include "sokol_gp.h"
#include "glm/trigonometric.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

Letterbox Letterbox::fit(int target_width, int target_height, int window_width, int window_height) {
    Letterbox box;
    if (target_width <= 0 || target_height <= 0 || window_width <= 0 || window_height <= 0)
        return box;
    box.scale = std::min(window_width / (float)target_width, window_height / (float)target_height);
    box.width = target_width * box.scale;
    box.height = target_height * box.scale;
    box.x = (window_width - box.width) * .5f;
    box.y = (window_height - box.height) * .5f;
    return box;
}

static glm::vec2 world_to_target(const Camera2D& camera, const glm::vec2& point) {
    glm::vec2 local = point - camera.target;
    float rad = glm::radians(camera.rotation);
    float s = std::sin(rad), c = std::cos(rad);
    return glm::vec2(local.x * c - local.y * s, local.x * s + local.y * c) * camera.zoom + camera.offset;
}

Renderer::Renderer(int width, int height): _width(width), _height(height) {
    sg_environment env = sglue_environment();
    sg_image_desc img_desc = {
        .usage.render_attachment = true,
        .width = width,
        .height = height,
        .pixel_format = env.defaults.color_format
    };
    _color = sg_make_image(&img_desc);
    img_desc.pixel_format = env.defaults.depth_format;
    _depth = sg_make_image(&img_desc);
    sg_attachments_desc attr_desc = {
        .colors[0].image = _color,
        .depth_stencil.image = _depth
    };
    _attachments = sg_make_attachments(&attr_desc);
    sg_sampler_desc smp_desc = {
        .min_filter = SG_FILTER_NEAREST,
        .mag_filter = SG_FILTER_NEAREST,
        .wrap_u = SG_WRAP_CLAMP_TO_EDGE,
        .wrap_v = SG_WRAP_CLAMP_TO_EDGE,
    };
    _sampler = sg_make_sampler(&smp_desc);
    _clear = (sg_pass_action) {
        .colors[0] = {
            .load_action = SG_LOADACTION_CLEAR,
            .clear_value = { 0.f, 0.f, 0.f, 1.f }
        }
    };
}

Renderer::~Renderer() {
    if (!sg_isvalid())
        return;
    sg_destroy_attachments(_attachments);
    sg_destroy_image(_color);
    sg_destroy_image(_depth);
    sg_destroy_sampler(_sampler);
}

void Renderer::draw(flecs::world& world, const TextureStore& textures, int window_width, int window_height) {
    _letterbox = Letterbox::fit(_width, _height, window_width, window_height);

    sgp_begin(_width, _height);
    sgp_viewport(0, 0, _width, _height);
    sgp_project(0.f, (float)_width, 0.f, (float)_height);
    sgp_set_blend_mode(SGP_BLENDMODE_BLEND);
    draw_sprites(world, textures);
    sg_pass offscreen = {
        .action = _clear,
        .attachments = _attachments
    };
    sg_begin_pass(&offscreen);
    sgp_flush();
    sgp_end();
    sg_end_pass();

    sgp_begin(window_width, window_height);
    sgp_viewport(0, 0, window_width, window_height);
    sgp_project(0.f, (float)window_width, 0.f, (float)window_height);
    sgp_set_image(0, _color);
    sgp_set_sampler(0, _sampler);
    sgp_rect src = { 0.f, 0.f, (float)_width, (float)_height };
    sgp_rect dst = { _letterbox.x, _letterbox.y, _letterbox.width, _letterbox.height };
    sgp_draw_textured_rect(0, dst, src);
    sgp_reset_image(0);
    sgp_reset_sampler(0);
    draw_text(world);
    sg_pass onscreen = {
        .action = _clear,
        .swapchain = sglue_swapchain()
    };
    sg_begin_pass(&onscreen);
    sgp_flush();
    sgp_end();
    sdtx_draw();
    sg_end_pass();
    sg_commit();
}

void Renderer::draw_sprites(flecs::world& world, const TextureStore& textures) {
    struct DrawItem {
        flecs::entity e;
        float z;
        bool screen;
        glm::vec2 position;
        float rotation;
        glm::vec2 scale;
    };
    std::vector<DrawItem> items;
    world.each([&](flecs::entity e, const Sprite&) {
        DrawItem item{e, 0.f, false, glm::vec2(0.f), 0.f, glm::vec2(1.f)};
        if (const ZIndex *z = e.get<ZIndex>())
            item.z = z->z;
        if (const ScreenPosition *screen = e.get<ScreenPosition>()) {
            item.screen = true;
            item.position = screen->pos;
        } else if (const GlobalTransform2D *global = e.get<GlobalTransform2D>()) {
            item.position = global->position;
            item.rotation = global->rotation_degrees;
            item.scale = global->scale;
        } else if (const MapPosition *position = e.get<MapPosition>()) {
            item.position = position->pos;
            if (const Rotation *rotation = e.get<Rotation>())
                item.rotation = rotation->degrees;
            if (const Scale *scale = e.get<Scale>())
                item.scale = scale->scale;
        } else
            return;
        items.push_back(item);
    });
    std::stable_sort(items.begin(), items.end(), [](const DrawItem& a, const DrawItem& b) {
        return a.z < b.z;
    });

    const Camera2D *camera = world.get<Camera2D>();
    for (const auto& item : items) {
        const Sprite *sprite = item.e.get<Sprite>();
        const Texture *texture = textures.get(sprite->tex_key);
        if (!texture)
            continue;
        sgp_push_transform();
        if (!item.screen && camera) {
            sgp_translate(camera->offset.x, camera->offset.y);
            sgp_scale(camera->zoom, camera->zoom);
            sgp_rotate(glm::radians(camera->rotation));
            sgp_translate(-camera->target.x, -camera->target.y);
        }
        sgp_translate(item.position.x, item.position.y);
        sgp_rotate(glm::radians(item.rotation));
        sgp_scale(item.scale.x * (sprite->flip_h ? -1.f : 1.f), item.scale.y * (sprite->flip_v ? -1.f : 1.f));
        if (const Tint *tint = item.e.get<Tint>())
            sgp_set_color(tint->color.r / 255.f, tint->color.g / 255.f, tint->color.b / 255.f, tint->color.a / 255.f);
        sgp_set_image(0, *texture);
        sgp_set_sampler(0, *texture);
        sgp_rect src = { sprite->offset.x, sprite->offset.y, sprite->width, sprite->height };
        sgp_rect dst = { -sprite->origin.x, -sprite->origin.y, sprite->width, sprite->height };
        sgp_draw_textured_rect(0, dst, src);
        sgp_reset_image(0);
        sgp_reset_sampler(0);
        sgp_reset_color();
        sgp_pop_transform();
    }
}

void Renderer::draw_text(flecs::world& world) {
    // One canvas pixel is one render target pixel
    sdtx_canvas(sapp_widthf() / _letterbox.scale, sapp_heightf() / _letterbox.scale);
    sdtx_origin(0.f, 0.f);
    glm::vec2 corner(_letterbox.x / _letterbox.scale, _letterbox.y / _letterbox.scale);
    const Camera2D *camera = world.get<Camera2D>();
    world.each([&](flecs::entity e, const DynamicText& text) {
        glm::vec2 position;
        if (const ScreenPosition *screen = e.get<ScreenPosition>())
            position = screen->pos;
        else if (const MapPosition *map = e.get<MapPosition>())
            position = camera ? world_to_target(*camera, map->pos) : map->pos;
        else
            return;
        position += corner;
        sdtx_pos(position.x / DEBUG_GLYPH_SIZE, position.y / DEBUG_GLYPH_SIZE);
        sdtx_color4b(text.color.r, text.color.g, text.color.b, text.color.a);
        sdtx_puts(text.content().c_str());
    });
}
