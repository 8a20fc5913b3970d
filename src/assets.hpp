//
//  assets.hpp
//  aberred
//
//  Created by George Watson on 14/10/2025.
//

#pragma once

#include "glm/vec2.hpp"
#include "stb_image.h"
#include <string>
#include <fstream>
#include <algorithm>

// Size of one sokol_debugtext glyph at scale 1
#define DEBUG_GLYPH_SIZE 8.f

// Where textures and fonts actually end up. The core only needs to know a
// load succeeded and how big the result is, the application shell backs this
// with GPU resources and tests use the headless loader.
class AssetLoader {
public:
    virtual ~AssetLoader() = default;

    virtual bool load_texture(const std::string& id, const std::string& path, int& width, int& height, std::string& error) = 0;
    virtual bool load_font(const std::string& id, const std::string& path, float size, std::string& error) = 0;

    // Glyphs are fixed cells of `size` pixels, one row per line
    virtual glm::vec2 measure_text(const std::string& font, float size, const std::string& text) const {
        (void)font;
        size_t columns = 0, current = 0, lines = text.empty() ? 0 : 1;
        for (char c : text) {
            if (c == '\n') {
                lines++;
                current = 0;
            } else
                columns = std::max(columns, ++current);
        }
        float cell = size > 0.f ? size : DEBUG_GLYPH_SIZE;
        return glm::vec2(columns * cell, lines * cell);
    }
};

// Reads image headers only, nothing is uploaded anywhere
class HeadlessAssetLoader: public AssetLoader {
public:
    bool load_texture(const std::string& id, const std::string& path, int& width, int& height, std::string& error) override {
        (void)id;
        int channels = 0;
        if (!stbi_info(path.c_str(), &width, &height, &channels)) {
            const char *reason = stbi_failure_reason();
            error = reason ? reason : "unreadable image";
            return false;
        }
        return true;
    }

    bool load_font(const std::string& id, const std::string& path, float size, std::string& error) override {
        (void)id;
        if (size <= 0.f) {
            error = "font size must be positive";
            return false;
        }
        std::ifstream file(path, std::ios::binary);
        if (!file.good()) {
            error = "file not found";
            return false;
        }
        return true;
    }
};
