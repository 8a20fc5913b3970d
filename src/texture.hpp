//
//  texture.hpp
//  aberred
//
//  Created by George Watson on 03/08/2025.
//

#pragma once

#include "sokol/sokol_gfx.h"
#include "stb_image.h"
#include "assets.hpp"
#include "log.hpp"
#include <string>
#include <memory>
#include <fstream>
#include <unordered_map>

class Texture {
    int _width = 0, _height = 0;
    sg_image _image{};
    sg_sampler _sampler{};

public:
    Texture() = default;
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    ~Texture() {
        unload();
    }

    int width() const {
        return _width;
    }

    int height() const {
        return _height;
    }

    bool load(const std::string& path, std::string& error) {
        int w, h, c;
        unsigned char *pixels = stbi_load(path.c_str(), &w, &h, &c, 4);
        if (!pixels) {
            const char *reason = stbi_failure_reason();
            error = reason ? reason : "unreadable image";
            return false;
        }
        _width = w;
        _height = h;
        sg_image_desc idesc = {
            .width = _width,
            .height = _height,
            .pixel_format = SG_PIXELFORMAT_RGBA8,
            .data.subimage[0][0] = {
                .ptr = pixels,
                .size = (size_t)(_width * _height * 4),
            }
        };
        _image = sg_make_image(&idesc);
        sg_sampler_desc sdesc = {
            .min_filter = SG_FILTER_NEAREST,
            .mag_filter = SG_FILTER_NEAREST,
            .wrap_u = SG_WRAP_CLAMP_TO_EDGE,
            .wrap_v = SG_WRAP_CLAMP_TO_EDGE
        };
        _sampler = sg_make_sampler(&sdesc);
        stbi_image_free(pixels);
        if (!is_valid()) {
            error = "failed to create GPU image";
            return false;
        }
        return true;
    }

    void unload() {
        if (!sg_isvalid())
            return;
        if (sg_query_image_state(_image) == SG_RESOURCESTATE_VALID)
            sg_destroy_image(_image);
        if (sg_query_sampler_state(_sampler) == SG_RESOURCESTATE_VALID)
            sg_destroy_sampler(_sampler);
    }

    bool is_valid() const {
        return sg_query_image_state(_image) == SG_RESOURCESTATE_VALID &&
               sg_query_sampler_state(_sampler) == SG_RESOURCESTATE_VALID;
    }

    operator sg_image() const {
        return _image;
    }

    operator sg_sampler() const {
        return _sampler;
    }
};

// GPU backed loader used by the application shell. Fonts are drawn with the
// debugtext glyphs, so a font load only checks the file is there.
class TextureStore: public AssetLoader {
    std::unordered_map<std::string, std::unique_ptr<Texture>> _textures;
    std::unordered_map<std::string, float> _fonts;

public:
    bool load_texture(const std::string& id, const std::string& path, int& width, int& height, std::string& error) override {
        auto texture = std::make_unique<Texture>();
        if (!texture->load(path, error))
            return false;
        width = texture->width();
        height = texture->height();
        _textures[id] = std::move(texture);
        $Log.debug("Texture '{}' loaded from {} ({}x{})", id, path, width, height);
        return true;
    }

    bool load_font(const std::string& id, const std::string& path, float size, std::string& error) override {
        if (size <= 0.f) {
            error = "font size must be positive";
            return false;
        }
        if (!std::ifstream(path, std::ios::binary).good()) {
            error = "file not found";
            return false;
        }
        _fonts[id] = size;
        return true;
    }

    glm::vec2 measure_text(const std::string& font, float size, const std::string& text) const override {
        (void)size;
        return AssetLoader::measure_text(font, DEBUG_GLYPH_SIZE, text);
    }

    const Texture* get(const std::string& id) const {
        auto it = _textures.find(id);
        return it == _textures.end() ? nullptr : it->second.get();
    }

    void clear() {
        _textures.clear();
        _fonts.clear();
    }
};
